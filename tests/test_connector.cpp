#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "browser_cpp/connector.hpp"
#include "browser_cpp/url_parser.hpp"

#include <asio.hpp>

using namespace browser;

void test_connect_to_listener();
void test_connect_refused();
void test_connect_unknown_host();
void test_connections_are_independent();

int main() {
    test_connect_to_listener();
    test_connect_refused();
    test_connect_unknown_host();
    test_connections_are_independent();

    std::cout << "connector tests passed" << std::endl;
    return 0;
}

asio::ip::tcp::endpoint loopback(uint16_t port = 0) {
    return asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port);
}

std::size_t read_exactly(Transport& transport, uint8_t* buffer, std::size_t n) {
    std::size_t total = 0;
    while (total < n) total += transport.read(buffer + total, n - total);
    return total;
}

void test_connect_to_listener() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, loopback());
    uint16_t port = acceptor.local_endpoint().port();

    Connector connector(io);
    ConnectResult result = connector.connect(Url("http", "127.0.0.1", "/", port));
    assert(result.isOk());
    assert(!result.getError());

    auto transport = result.takeTransport();
    assert(transport);
    assert(transport->is_connected());
    assert(!result.takeTransport());

    asio::ip::tcp::socket peer(io);
    acceptor.accept(peer);

    std::string request = "GET / HTTP/1.0\r\n\r\n";
    assert(transport->write(reinterpret_cast<const uint8_t*>(request.data()), request.size()) == request.size());

    std::string received(request.size(), '\0');
    asio::read(peer, asio::buffer(&received[0], received.size()));
    assert(received == request);

    std::vector<uint8_t> reply = {'o', 'k'};
    asio::write(peer, asio::buffer(reply));

    uint8_t buffer[2];
    assert(read_exactly(*transport, buffer, sizeof(buffer)) == 2);
    assert(buffer[0] == 'o' && buffer[1] == 'k');

    std::vector<uint8_t> more = {1, 2, 3};
    assert(transport->write(more) == more.size());

    transport->close();
    assert(!transport->is_connected());
}

void test_connect_refused() {
    asio::io_context io;
    uint16_t port;
    {
        // grab a free port, then stop listening on it
        asio::ip::tcp::acceptor acceptor(io, loopback());
        port = acceptor.local_endpoint().port();
    }

    Connector connector(io);
    ConnectResult result = connector.connect(Url("http", "127.0.0.1", "/", port));
    assert(!result.isOk());
    assert(!result.takeTransport());

    auto error = result.getError();
    assert(error);
    assert(error->code);
    assert(error->host == "127.0.0.1");
    assert(error->port == port);
    assert(error->message().find("failed to connect to 127.0.0.1:" + std::to_string(port)) == 0);
}

void test_connect_unknown_host() {
    auto url = parse_url("http://no-such-host.invalid/").getUrl();
    assert(url);

    ConnectResult result = connect(*url);
    assert(!result.isOk());

    auto error = result.getError();
    assert(error);
    assert(error->code);
    assert(error->host == "no-such-host.invalid");
    assert(error->port == DEFAULT_HTTP_PORT);
}

void test_connections_are_independent() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, loopback());
    Url url("http", "127.0.0.1", "/", acceptor.local_endpoint().port());

    Connector connector(io);
    auto first = connector.connect(url).takeTransport();
    auto second = connector.connect(url).takeTransport();
    assert(first && second);
    assert(first != second);

    first->close();
    assert(!first->is_connected());
    assert(second->is_connected());
    second->close();
}
