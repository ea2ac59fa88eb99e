/**
 * @file key_endpoints.hpp
 * @brief Signing key endpoints for REST server
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "crow.h"
#include "relvault/web/endpoints/system_endpoints.hpp"

namespace relvault::web::endpoints {

/**
 * @brief Register the /api/keys routes with the Crow app
 * @param app Crow application instance
 * @param ctx Shared server context
 */
void register_key_endpoints_impl(crow::SimpleApp &app,
                                 std::shared_ptr<rest_server_context> ctx);

} // namespace relvault::web::endpoints
