/**
 * @file rest_server.hpp
 * @brief REST API server for the release key store
 *
 * This file provides the rest_server class that exposes token exchange and
 * signing key management over HTTP using the Crow framework.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "rest_config.hpp"

#include <cstdint>
#include <memory>

namespace relvault::storage {
class storage_context;
} // namespace relvault::storage

namespace relvault::web {

/**
 * @class rest_server
 * @brief REST API server
 *
 * Every request runs in its own storage session; the server itself holds
 * no per-request state.
 *
 * @par Example
 * @code
 * rest_server_config config;
 * config.port = 8080;
 *
 * rest_server server(config);
 * server.set_storage_context(context);
 *
 * server.start_async();  // Non-blocking
 * // ... do other work ...
 * server.stop();
 * @endcode
 */
class rest_server {
public:
  rest_server();

  explicit rest_server(const rest_server_config &config);

  /**
   * @brief Destructor - stops server if running
   */
  ~rest_server();

  /// Non-copyable
  rest_server(const rest_server &) = delete;
  rest_server &operator=(const rest_server &) = delete;

  /// Movable
  rest_server(rest_server &&other) noexcept;
  rest_server &operator=(rest_server &&other) noexcept;

  // =========================================================================
  // Configuration
  // =========================================================================

  [[nodiscard]] const rest_server_config &config() const noexcept;

  /**
   * @brief Update configuration (requires restart to apply)
   */
  void set_config(const rest_server_config &config);

  /**
   * @brief Set the storage context used to open request sessions
   */
  void set_storage_context(
      std::shared_ptr<const storage::storage_context> context);

  // =========================================================================
  // Lifecycle
  // =========================================================================

  /**
   * @brief Start the server (blocking)
   *
   * This method blocks until stop() is called from another thread.
   */
  void start();

  /**
   * @brief Start the server (non-blocking)
   */
  void start_async();

  /**
   * @brief Stop the server
   *
   * Safe to call multiple times.
   */
  void stop();

  [[nodiscard]] bool is_running() const noexcept;

  /**
   * @brief Wait for a server started with start_async() to stop
   */
  void wait();

  /**
   * @brief Port the server is listening on, or 0 if not running
   */
  [[nodiscard]] std::uint16_t port() const noexcept;

private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

} // namespace relvault::web
