#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <variant>

#include "browser_cpp/transports/transport.hpp"
#include "browser_cpp/url_parser.hpp"

#include <asio.hpp>

namespace browser {

struct ConnectionError {
    std::error_code code;
    std::string host;
    uint16_t port;

    std::string message() const;
};

class ConnectResult {
   public:
    ConnectResult(std::unique_ptr<Transport> transport) : data(std::move(transport)) {}
    ConnectResult(ConnectionError error) : data(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<std::unique_ptr<Transport>>(data); }

    // Moves the handle out, leaves nullptr behind. Returns nullptr on failure.
    std::unique_ptr<Transport> takeTransport() {
        if (!isOk()) return nullptr;
        return std::move(std::get<std::unique_ptr<Transport>>(data));
    }

    std::optional<ConnectionError> getError() const {
        if (std::holds_alternative<ConnectionError>(data)) return std::get<ConnectionError>(data);
        return std::nullopt;
    }

    std::variant<std::unique_ptr<Transport>, ConnectionError> data;
};

// Opens TCP connections on a caller-owned io_context. Every call is a single
// blocking attempt, nothing is retried or cached between calls.
class Connector {
   public:
    explicit Connector(asio::io_context& io) : io_(io) {}

    ConnectResult connect(const Url& url);

   private:
    asio::io_context& io_;
};

// Same as Connector::connect, using a process-wide io_context.
ConnectResult connect(const Url& url);

}  // namespace browser
