/**
 * @file config.cpp
 * @brief Command line parsing for the relvault server
 */

#include "config.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace relvault::app {

void relvault_server_config::print_help() {
    std::cout << R"(
relvault - Release signing key store

Usage: relvault_server [OPTIONS]

Options:
  --port <port>           Port to listen on (default: 8080)
  --bind <address>        Address to bind (default: 0.0.0.0)
  --db-path <path>        SQLite database path (default: ./relvault.db)
  --keys-dir <path>       Directory for committee KEYS files (default: ./keys)
  --directory <path>      JSON document seeding principals and committees
  --log-dir <path>        Directory for log and audit files (default: ./logs)
  --log-level <level>     Log level: trace, debug, info, warn, error, fatal
                          (default: info)
  --help, -h              Show this help message

Endpoints:
  POST /api/jwt               Exchange a personal access token for a JWT
  POST /api/keys/add          Store your own signing key
  POST /api/keys/import       Import a committee KEYS listing
  POST /api/keys/regenerate   Rewrite committee KEYS files
  GET  /api/keys/<fpr>        Look up a stored key
  GET  /api/status            Service status

Examples:
  # Start with default settings
  relvault_server

  # Seed the directory and keep state under /srv/relvault
  relvault_server --db-path /srv/relvault/relvault.db \
                  --keys-dir /srv/relvault/keys --directory committees.json

)";
}

auto relvault_server_config::parse_args(int argc, char* argv[])
    -> std::optional<relvault_server_config> {

    relvault_server_config config;
    config.database.path = "./relvault.db";
    config.logging.log_directory = "./logs";

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        const bool known = arg == "--port" || arg == "--bind" ||
                           arg == "--db-path" || arg == "--keys-dir" ||
                           arg == "--directory" || arg == "--log-dir" ||
                           arg == "--log-level";
        if (!known) {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return std::nullopt;
        }
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            return std::nullopt;
        }

        if (arg == "--port") {
            try {
                const int port = std::stoi(argv[++i]);
                if (port <= 0 || port > 65535) {
                    throw std::out_of_range("port");
                }
                config.rest.port = static_cast<std::uint16_t>(port);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid port number\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--bind") {
            config.rest.bind_address = argv[++i];
            continue;
        }

        if (arg == "--db-path") {
            config.database.path = argv[++i];
            continue;
        }

        if (arg == "--keys-dir") {
            config.keys_dir = argv[++i];
            continue;
        }

        if (arg == "--directory") {
            config.directory_file = argv[++i];
            continue;
        }

        if (arg == "--log-dir") {
            config.logging.log_directory = argv[++i];
            continue;
        }

        if (arg == "--log-level") {
            const std::string_view level = argv[++i];
            auto parsed = integration::parse_log_level(level);
            if (!parsed) {
                std::cerr << "Error: Invalid log level: " << level << "\n";
                std::cerr << "Valid levels: trace, debug, info, warn, error, fatal\n";
                return std::nullopt;
            }
            config.logging.min_level = *parsed;
            continue;
        }
    }

    return config;
}

}  // namespace relvault::app
