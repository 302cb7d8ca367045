#include "../include/cloud_server.hpp"
#include "../include/config.hpp"
#include "../include/tag_cloud.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

Config loadConfig()
{
    Config cfg;
    if (cfg.load("config/settings.ini")) return cfg;
    if (cfg.load("../config/settings.ini")) return cfg;
    throw std::runtime_error("Cannot load config/settings.ini");
}

int main()
{
    try {
        Config cfg = loadConfig();

        auto address = net::ip::make_address(cfg.get("server.address", "0.0.0.0"));
        int port = cfg.getInt("server.http_port", cfg.getInt("http_port", 8080));
        int maxBody = cfg.getInt("server.max_body_bytes", 8 * 1024 * 1024);
        if (maxBody < 1) maxBody = 1;

        CloudServer server(TagCloud::separatorsFrom(cfg), TagCloud::renderOptionsFrom(cfg));

        net::io_context ioc;
        tcp::acceptor acceptor(ioc, {address, static_cast<unsigned short>(port)});
        std::cout << "[Server] Running: http://" << address.to_string() << ":" << port << "\n";

        while (true) {
            tcp::socket socket(ioc);
            acceptor.accept(socket);

            try {
                beast::flat_buffer buffer;
                http::request_parser<http::string_body> parser;
                parser.body_limit(static_cast<std::uint64_t>(maxBody));
                http::read(socket, buffer, parser);
                http::request<http::string_body> req = parser.release();

                http::response<http::string_body> res{http::status::ok, req.version()};
                server.handle(req, res);

                res.prepare_payload();
                http::write(socket, res);
            } catch (const beast::system_error& e) {
                std::cerr << "[Server] Connection error: " << e.code().message() << "\n";
            }

            beast::error_code ec;
            socket.shutdown(tcp::socket::shutdown_send, ec);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Server] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
