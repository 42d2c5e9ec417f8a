#pragma once
#include <cstddef>
#include <cstdint>
#include <system_error>

#include "transport.hpp"

#include <asio.hpp>

namespace browser {

class TcpTransport : public Transport {
   public:
    explicit TcpTransport(asio::io_context& io) : socket_(io) {}

    // Resolves host and tries each endpoint in turn. Throws std::system_error.
    void connect(const std::string& host, const std::string& port) override {
        asio::ip::tcp::resolver resolver(socket_.get_executor());
        auto endpoints = resolver.resolve(host, port);
        asio::connect(socket_, endpoints);
    }

    std::size_t read(uint8_t* buffer, std::size_t length) override {
        std::error_code ec;
        std::size_t n = socket_.read_some(asio::buffer(buffer, length), ec);
        if (ec) throw std::system_error(ec);
        return n;
    }

    std::size_t write(const std::vector<uint8_t>& data) override {
        std::error_code ec;
        std::size_t n = asio::write(socket_, asio::buffer(data), ec);
        if (ec) throw std::system_error(ec);
        return n;
    }

    std::size_t write(const uint8_t* data, std::size_t length) override {
        std::error_code ec;
        std::size_t n = asio::write(socket_, asio::buffer(data, length), ec);
        if (ec) throw std::system_error(ec);
        return n;
    }

    void close() override {
        if (!socket_.is_open()) return;

        std::error_code ec;
        // The peer may already have gone away, not_connected is expected then.
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected) throw std::system_error(ec);

        socket_.close(ec);
        if (ec) throw std::system_error(ec);
    }

    bool is_connected() const override { return socket_.is_open(); }

   private:
    asio::ip::tcp::socket socket_;
};

}  // namespace browser
