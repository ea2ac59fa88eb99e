/**
 * @file system_endpoints.hpp
 * @brief Shared endpoint context and the service status endpoint
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <memory>

namespace relvault::storage {
class storage_context;
} // namespace relvault::storage

namespace relvault::web {

struct rest_server_config;

/**
 * @struct rest_server_context
 * @brief Shared context for REST endpoints
 */
struct rest_server_context {
  /// Current server configuration (read-only)
  const rest_server_config *config{nullptr};

  /// Settings used to open one storage session per request
  std::shared_ptr<const storage::storage_context> storage;
};

} // namespace relvault::web
