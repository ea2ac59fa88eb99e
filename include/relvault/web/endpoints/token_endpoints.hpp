/**
 * @file token_endpoints.hpp
 * @brief Token exchange endpoint for REST server
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "crow.h"
#include "relvault/web/endpoints/system_endpoints.hpp"

namespace relvault::web::endpoints {

/**
 * @brief Register POST /api/jwt with the Crow app
 */
void register_token_endpoints_impl(crow::SimpleApp &app,
                                   std::shared_ptr<rest_server_context> ctx);

} // namespace relvault::web::endpoints
