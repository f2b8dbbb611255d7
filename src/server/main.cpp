#include "server/server.hpp"
#include "server/game_config.hpp"
#include "common/command_line.hpp"
#include <chrono>
#include <csignal>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>

namespace {

std::function<void()> shutdown_handler;

void signal_handler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;
    if (shutdown_handler) {
        shutdown_handler();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] [port]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -d, --data <dir>     Config directory (default: data, then ../data)" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string data_dir;
    std::string port_arg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            data_dir = argv[++i];
        } else {
            port_arg = arg;
        }
    }

    ghack::server::GameConfig config;
    if (!data_dir.empty()) {
        if (!config.load(data_dir)) {
            std::cerr << "Failed to load game config from " << data_dir << std::endl;
            return 1;
        }
    } else if (!config.load("data") && !config.load("../data")) {
        std::cerr << "Failed to load game config from data/ directory" << std::endl;
        return 1;
    }

    uint16_t port = config.server().default_port;
    if (!port_arg.empty()) {
        auto parsed = ghack::parse_port(port_arg);
        if (!parsed) {
            std::cerr << "Invalid port: " << port_arg << std::endl;
            return 1;
        }
        port = *parsed;
    }

    try {
        asio::io_context io_context;
        ghack::server::Server server(io_context, port, config);

        // Signals arrive on any thread; hand the stop to the io loop
        shutdown_handler = [&]() {
            asio::post(io_context, [&]() { server.shutdown(std::chrono::milliseconds(500)); });
        };
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        server.start();
        std::cout << "ghack server running on port " << server.port() << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        io_context.run();
        shutdown_handler = nullptr;
    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
