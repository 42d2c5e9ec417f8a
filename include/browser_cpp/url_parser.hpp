#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace browser {

constexpr uint16_t DEFAULT_HTTP_PORT = 80;
constexpr const char* HTTP_SCHEME = "http";

struct Url {
    Url(std::string scheme, std::string host, std::string path, uint16_t port = DEFAULT_HTTP_PORT)
        : scheme(std::move(scheme)), host(std::move(host)), path(std::move(path)), port(port) {}

    const std::string scheme;
    const std::string host;
    const std::string path;
    const uint16_t port;

    // scheme://host/path, without the port
    std::string to_string() const;
};

bool operator==(const Url& lhs, const Url& rhs);
bool operator!=(const Url& lhs, const Url& rhs);
std::ostream& operator<<(std::ostream& os, const Url& url);

enum class ParseErrorKind { MissingSchemeDelimiter, UnsupportedScheme, EmptyHost };

struct ParseError {
    ParseErrorKind kind;
    // Only set for UnsupportedScheme.
    std::string scheme;

    std::string message() const;
};

bool operator==(const ParseError& lhs, const ParseError& rhs);

class ParseResult {
   public:
    ParseResult(Url url) : data(std::move(url)) {}
    ParseResult(ParseError error) : data(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<Url>(data); }

    std::optional<Url> getUrl() const {
        if (std::holds_alternative<Url>(data)) return std::get<Url>(data);
        return std::nullopt;
    }

    std::optional<ParseError> getError() const {
        if (std::holds_alternative<ParseError>(data)) return std::get<ParseError>(data);
        return std::nullopt;
    }

    std::variant<Url, ParseError> data;
};

// Splits "http://host/path" into its parts. Port is always DEFAULT_HTTP_PORT,
// a ":port" suffix stays part of the host.
ParseResult parse_url(const std::string& url);

}  // namespace browser
