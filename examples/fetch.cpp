#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "browser_cpp/connector.hpp"
#include "browser_cpp/url_parser.hpp"

using namespace browser;

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "usage: " << argv[0] << " <http-url>" << std::endl;
        return 2;
    }

    ParseResult parsed = parse_url(argv[1]);
    if (auto error = parsed.getError()) {
        std::cerr << "Parse error: " << error->message() << std::endl;
        return 1;
    }

    Url url = *parsed.getUrl();
    std::cout << "scheme: " << url.scheme << std::endl;
    std::cout << "host:   " << url.host << std::endl;
    std::cout << "path:   " << url.path << std::endl;
    std::cout << "port:   " << url.port << std::endl;

    ConnectResult result = connect(url);
    if (auto error = result.getError()) {
        std::cerr << "Connect error: " << error->message() << std::endl;
        return 1;
    }

    auto transport = result.takeTransport();
    std::cout << "Connected to " << url.host << ":" << url.port << std::endl;

    try {
        transport->close();
    } catch (std::exception& e) {
        std::cerr << "Close error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
