/**
 * @file token_endpoints.cpp
 * @brief Token exchange endpoint implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any relvault headers to avoid forward
// declaration conflicts
#include "crow.h"

#include "endpoint_support.hpp"

#include "relvault/web/endpoints/token_endpoints.hpp"

#include <relvault/integration/logger_adapter.hpp>
#include <relvault/storage/write_session.hpp>

#include <sstream>

namespace relvault::web::endpoints {

using integration::logger_adapter;

void register_token_endpoints_impl(crow::SimpleApp &app,
                                   std::shared_ptr<rest_server_context> ctx) {

  // POST /api/jwt - Exchange a personal access token for a session token
  CROW_ROUTE(app, "/api/jwt")
      .methods(crow::HTTPMethod::POST)([ctx](const crow::request &req) {
        if (!ctx->storage) {
          return detail::error_response(*ctx, http_status::service_unavailable,
                                        "Unavailable",
                                        "Storage not configured");
        }
        if (auto too_large = detail::check_body_size(*ctx, req)) {
          return std::move(*too_large);
        }

        auto body = crow::json::load(req.body);
        if (!body) {
          logger_adapter::log_security_event(
              integration::security_event_type::invalid_request,
              "Invalid JSON body on /api/jwt");
          return detail::error_response(*ctx, http_status::bad_request,
                                        "INVALID_JSON", "Invalid JSON body");
        }

        auto asf_uid = detail::string_field(body, "asfuid");
        auto pat = detail::string_field(body, "pat");
        if (!asf_uid || !pat || asf_uid->empty()) {
          return detail::error_response(*ctx, http_status::bad_request,
                                        "MISSING_FIELDS",
                                        "asfuid and pat are required");
        }

        auto token = storage::write_session::run(
            ctx->storage, security::principal(*asf_uid),
            [&](storage::write_session &session) {
              return session.exchange_pat(*pat);
            });
        if (token.is_err()) {
          return detail::error_response(*ctx, token.error());
        }

        std::ostringstream oss;
        oss << R"({"asfuid":")" << json_escape(*asf_uid) << R"(","jwt":")"
            << json_escape(token.value().encoded) << R"("})";
        return detail::json_response(*ctx, http_status::ok, oss.str());
      });
}

} // namespace relvault::web::endpoints
