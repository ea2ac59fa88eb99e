/**
 * @file config.hpp
 * @brief Configuration for the relvault server application
 *
 * Aggregates the REST, database, key store and logging settings and parses
 * them from the command line.
 */

#ifndef RELVAULT_APPS_SERVER_CONFIG_HPP
#define RELVAULT_APPS_SERVER_CONFIG_HPP

#include <relvault/integration/logger_adapter.hpp>
#include <relvault/storage/release_database.hpp>
#include <relvault/web/rest_config.hpp>

#include <filesystem>
#include <optional>

namespace relvault::app {

/**
 * @brief Complete server configuration
 */
struct relvault_server_config {
    /// HTTP listener settings
    web::rest_server_config rest;

    /// Release database settings
    storage::database_config database;

    /// Root directory of the per-committee KEYS files
    std::filesystem::path keys_dir{"./keys"};

    /// Optional JSON document seeding principals and committees
    std::filesystem::path directory_file;

    /// Logging settings
    integration::logger_config logging;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Supported options:
     *   --port <port>           Port to listen on (default: 8080)
     *   --bind <address>        Bind address (default: 0.0.0.0)
     *   --db-path <path>        Database path (default: ./relvault.db)
     *   --keys-dir <path>       KEYS file directory (default: ./keys)
     *   --directory <path>      Directory seed document (JSON)
     *   --log-dir <path>        Log directory (default: ./logs)
     *   --log-level <level>     Log level (default: info)
     *   --help                  Show help message
     *
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[])
        -> std::optional<relvault_server_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

}  // namespace relvault::app

#endif  // RELVAULT_APPS_SERVER_CONFIG_HPP
