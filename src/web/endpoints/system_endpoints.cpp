/**
 * @file system_endpoints.cpp
 * @brief Service status endpoint implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any relvault headers to avoid forward
// declaration conflicts
#include "crow.h"

#include "endpoint_support.hpp"

#include "relvault/web/endpoints/system_endpoints.hpp"

#include <relvault/storage/release_database.hpp>

#include <sstream>

namespace relvault::web::endpoints {

// Internal implementation function called from rest_server.cpp
void register_system_endpoints_impl(crow::SimpleApp &app,
                                    std::shared_ptr<rest_server_context> ctx) {
  // GET /api/status - Liveness and backing store reachability
  CROW_ROUTE(app, "/api/status").methods(crow::HTTPMethod::GET)([ctx]() {
    if (!ctx->storage) {
      return detail::error_response(*ctx, http_status::service_unavailable,
                                    "Unavailable", "Storage not configured");
    }

    auto probed = storage::release_database::probe(ctx->storage->database());
    const bool store_ok = probed.is_ok();
    if (!store_ok) {
      integration::logger_adapter::warn("Status probe failed: {}",
                                        probed.error().message);
    }

    std::ostringstream oss;
    oss << R"({"status":")" << (store_ok ? "ok" : "degraded")
        << R"(","database":")" << (store_ok ? "reachable" : "unavailable")
        << R"(","version":")" << RELVAULT_VERSION << R"("})";
    return detail::json_response(*ctx,
                                 store_ok ? http_status::ok
                                          : http_status::service_unavailable,
                                 oss.str());
  });
}

} // namespace relvault::web::endpoints
