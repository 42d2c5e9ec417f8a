#include "browser_cpp/connector.hpp"

#include <memory>
#include <string>
#include <system_error>

#include "browser_cpp/transports/tcp_transport.hpp"
#include "browser_cpp/url_parser.hpp"

namespace browser {

std::string ConnectionError::message() const {
    return "failed to connect to " + host + ":" + std::to_string(port) + ": " + code.message();
}

ConnectResult Connector::connect(const Url& url) {
    std::unique_ptr<Transport> transport = std::make_unique<TcpTransport>(io_);

    try {
        transport->connect(url.host, std::to_string(url.port));
    } catch (const std::system_error& e) {
        return ConnectionError{e.code(), url.host, url.port};
    }

    return ConnectResult(std::move(transport));
}

ConnectResult connect(const Url& url) {
    static asio::io_context io;
    Connector connector(io);
    return connector.connect(url);
}

}  // namespace browser
