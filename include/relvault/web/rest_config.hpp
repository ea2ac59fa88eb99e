/**
 * @file rest_config.hpp
 * @brief Configuration for the REST API server
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace relvault::web {

/**
 * @struct rest_server_config
 * @brief Configuration options for the REST server
 */
struct rest_server_config {
  /// Address to bind the server to
  std::string bind_address{"0.0.0.0"};

  /// Port to listen on
  std::uint16_t port{8080};

  /// Number of worker threads for handling requests
  std::size_t concurrency{4};

  /// Enable CORS (Cross-Origin Resource Sharing) headers
  bool enable_cors{true};

  /// CORS allowed origins (empty = allow all)
  std::string cors_allowed_origins{"*"};

  /// Maximum request body size in bytes (default 1MB)
  std::size_t max_body_size{1024 * 1024};
};

} // namespace relvault::web
