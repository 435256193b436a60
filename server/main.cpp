// server/main.cpp
// Diagnostic HTTP listener: logs every request, answers with a fixed acknowledgement
#include <boost/beast/core.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include "listener.hpp"
#include "server_config.hpp"
#include "logger.hpp"

int main(int argc, char* argv[]) {
    std::string configFile = "server.config";

    // --config has to be known before the file is read
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        }
    }

    ServerConfig config;
    config.loadFromFile(configFile);

    unsigned short port = config.port;
    std::string address = config.address;

    // Parse command line arguments (override config file)
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--port" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!ServerConfig::parsePort(value, port)) {
                Logger::error("Invalid --port value: " + value);
                return 1;
            }
        } else if (arg == "--address" && i + 1 < argc) {
            address = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --config <file>  Configuration file (default: server.config)\n"
                      << "  --port <port>    Port to listen on (default: 8090)\n"
                      << "  --address <addr> Interface to bind (default: 0.0.0.0)\n"
                      << "  --help, -h       Show this help\n";
            return 0;
        } else {
            Logger::error("Unknown argument: " + arg);
            return 1;
        }
    }

    beast::error_code ec;
    auto bindAddress = net::ip::make_address(address, ec);
    if (ec) {
        Logger::error("Invalid bind address " + address + ": " + ec.message());
        return 1;
    }

    try {
        net::io_context ioc{1}; // Single threaded: one request is handled at a time

        auto listener = std::make_shared<Listener>(ioc, tcp::endpoint{bindAddress, port},
                                                   HandlerOptions{}, config.bodyLimit);
        listener->run();

        std::cout << "Starting server on port " << port << "..." << std::endl;
        Logger::server("Listening on http://" + address + ":" + std::to_string(port));
        Logger::server("Press Ctrl+C to stop");

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](beast::error_code const&, int) {
            std::cout << std::endl;
            Logger::server("Shutting down...");
            listener->stop();
            ioc.stop();
        });

        ioc.run();

        Logger::server("Stopped");
    }
    catch (const std::exception& e) {
        Logger::error("Server error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
