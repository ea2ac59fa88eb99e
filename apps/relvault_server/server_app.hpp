/**
 * @file server_app.hpp
 * @brief relvault server application class
 *
 * Wires the logger, signing secret, token service, storage context and REST
 * server together and owns their lifetimes.
 */

#ifndef RELVAULT_APPS_SERVER_SERVER_APP_HPP
#define RELVAULT_APPS_SERVER_SERVER_APP_HPP

#include "config.hpp"

#include <relvault/security/token_service.hpp>
#include <relvault/storage/storage_context.hpp>
#include <relvault/web/rest_server.hpp>

#include <atomic>
#include <memory>

namespace relvault::app {

/**
 * @brief Complete server application
 *
 * @example Usage
 * @code
 * relvault_server_app app{config};
 *
 * if (!app.initialize() || !app.start()) {
 *     return 1;
 * }
 * app.wait_for_shutdown();
 * @endcode
 */
class relvault_server_app {
public:
    explicit relvault_server_app(const relvault_server_config& config);

    /**
     * @brief Destructor - stops server if running
     */
    ~relvault_server_app();

    // Non-copyable, non-movable
    relvault_server_app(const relvault_server_app&) = delete;
    relvault_server_app& operator=(const relvault_server_app&) = delete;
    relvault_server_app(relvault_server_app&&) = delete;
    relvault_server_app& operator=(relvault_server_app&&) = delete;

    /**
     * @brief Initialize logging, the signing secret and the store
     *
     * Fails if the backing store cannot be opened or the directory seed
     * cannot be loaded. Must be called before start().
     */
    [[nodiscard]] bool initialize();

    /// Start serving requests in the background
    [[nodiscard]] bool start();

    void stop();

    /**
     * @brief Block until request_shutdown() is called or the server exits
     */
    void wait_for_shutdown();

    /**
     * @brief Ask the application to stop; async-signal-safe
     */
    void request_shutdown() noexcept;

    [[nodiscard]] bool is_running() const noexcept;

private:
    relvault_server_config config_;
    std::shared_ptr<const security::token_service> tokens_;
    std::shared_ptr<const storage::storage_context> storage_;
    std::unique_ptr<web::rest_server> server_;
    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace relvault::app

#endif  // RELVAULT_APPS_SERVER_SERVER_APP_HPP
