#include "browser_cpp/url_parser.hpp"

namespace browser {

std::string Url::to_string() const { return scheme + "://" + host + path; }

bool operator==(const Url& lhs, const Url& rhs) {
    return lhs.scheme == rhs.scheme && lhs.host == rhs.host && lhs.path == rhs.path && lhs.port == rhs.port;
}

bool operator!=(const Url& lhs, const Url& rhs) { return !(lhs == rhs); }

std::ostream& operator<<(std::ostream& os, const Url& url) { return os << url.to_string(); }

std::string ParseError::message() const {
    switch (kind) {
        case ParseErrorKind::MissingSchemeDelimiter:
            return "URL missing scheme delimiter ://";
        case ParseErrorKind::UnsupportedScheme:
            return "only http is supported, got: " + scheme;
        case ParseErrorKind::EmptyHost:
            return "host is empty";
    }
    return "unknown parse error";
}

bool operator==(const ParseError& lhs, const ParseError& rhs) {
    return lhs.kind == rhs.kind && lhs.scheme == rhs.scheme;
}

ParseResult parse_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return ParseError{ParseErrorKind::MissingSchemeDelimiter, ""};

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != HTTP_SCHEME) return ParseError{ParseErrorKind::UnsupportedScheme, scheme};

    std::string rest = url.substr(scheme_end + 3);

    std::string host;
    std::string path = "/";

    size_t slash_pos = rest.find('/');
    if (slash_pos != std::string::npos) {
        host = rest.substr(0, slash_pos);
        path = rest.substr(slash_pos);
    } else {
        host = rest;
    }

    if (host.empty()) return ParseError{ParseErrorKind::EmptyHost, ""};

    return Url(scheme, host, path, DEFAULT_HTTP_PORT);
}

}  // namespace browser
