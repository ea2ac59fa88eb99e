/**
 * @file main.cpp
 * @brief Entry point for the relvault server
 *
 * Usage:
 *   relvault_server [OPTIONS]
 *
 * See relvault_server --help for the option list.
 */

#include "config.hpp"
#include "server_app.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

/// Global pointer to server app for signal handling
std::atomic<relvault::app::relvault_server_app*> g_server{nullptr};

/// Signal handler for graceful shutdown
void signal_handler(int /*signal*/) {
    auto* server = g_server.load();
    if (server) {
        server->request_shutdown();
    }
}

/// Install signal handlers
void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config = relvault::app::relvault_server_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    install_signal_handlers();

    relvault::app::relvault_server_app server(config.value());
    g_server = &server;

    if (!server.initialize()) {
        std::cerr << "Failed to initialize relvault server\n";
        g_server = nullptr;
        return 1;
    }

    if (!server.start()) {
        std::cerr << "Failed to start relvault server\n";
        g_server = nullptr;
        return 1;
    }

    server.wait_for_shutdown();

    g_server = nullptr;
    std::cout << "relvault server terminated\n";
    return 0;
}
