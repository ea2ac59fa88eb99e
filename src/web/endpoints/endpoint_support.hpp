/**
 * @file endpoint_support.hpp
 * @brief Response, body and bearer helpers shared by the endpoints
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "crow.h"

#include "relvault/web/endpoints/system_endpoints.hpp"
#include "relvault/web/rest_config.hpp"
#include "relvault/web/rest_types.hpp"

#include <relvault/core/result.hpp>
#include <relvault/integration/logger_adapter.hpp>
#include <relvault/security/principal.hpp>
#include <relvault/storage/storage_context.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace relvault::web::endpoints::detail {

/**
 * @brief Add CORS headers to response
 */
inline void add_cors_headers(crow::response &res,
                             const rest_server_context &ctx) {
  if (ctx.config && ctx.config->enable_cors &&
      !ctx.config->cors_allowed_origins.empty()) {
    res.add_header("Access-Control-Allow-Origin",
                   ctx.config->cors_allowed_origins);
  }
}

inline crow::response json_response(const rest_server_context &ctx,
                                     http_status status, std::string body) {
  crow::response res(static_cast<int>(status));
  res.add_header("Content-Type", "application/json");
  add_cors_headers(res, ctx);
  res.body = std::move(body);
  return res;
}

inline crow::response error_response(const rest_server_context &ctx,
                                      http_status status, std::string_view code,
                                      std::string_view message) {
  return json_response(ctx, status, make_error_json(code, message));
}

inline crow::response error_response(const rest_server_context &ctx,
                                      const error_info &err) {
  return error_response(ctx, status_for(err.code), error_code_name(err.code),
                        err.message);
}

/**
 * @brief Reject bodies above the configured limit
 * @return The 413 response to send, or nothing if the body is acceptable
 */
inline std::optional<crow::response>
check_body_size(const rest_server_context &ctx, const crow::request &req) {
  if (ctx.config && req.body.size() > ctx.config->max_body_size) {
    return error_response(ctx, http_status::payload_too_large,
                          "PAYLOAD_TOO_LARGE", "Request body too large");
  }
  return std::nullopt;
}

/**
 * @brief String member of a JSON object, if present and a string
 */
inline std::optional<std::string> string_field(const crow::json::rvalue &body,
                                               const char *name) {
  if (!body.has(name) || body[name].t() != crow::json::type::String) {
    return std::nullopt;
  }
  return std::string(body[name].s());
}

/**
 * @brief Principal named by the request's bearer session token
 *
 * @retval unavailable if no storage is configured
 * @retval unauthenticated if no Authorization header is present
 * @retval malformed_token if the header is not a bearer credential
 * @return Otherwise the result of verifying the token
 */
inline Result<security::principal>
authenticate(const rest_server_context &ctx, const crow::request &req) {
  if (!ctx.storage) {
    return relvault_error<security::principal>(
        error_codes::unavailable, "Storage not configured", "rest");
  }

  const auto &header = req.get_header_value("Authorization");
  if (header.empty()) {
    return relvault_error<security::principal>(
        error_codes::unauthenticated, "Missing bearer token", "rest");
  }
  auto token = extract_bearer_token(header);
  if (!token) {
    return relvault_error<security::principal>(
        error_codes::malformed_token, "Malformed Authorization header",
        "rest");
  }

  auto who = ctx.storage->tokens().verify_jwt(*token);
  if (who.is_err()) {
    integration::logger_adapter::log_security_event(
        integration::security_event_type::authentication_failure,
        "Bearer token rejected: " + who.error().message);
  }
  return who;
}

} // namespace relvault::web::endpoints::detail
