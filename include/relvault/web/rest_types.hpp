/**
 * @file rest_types.hpp
 * @brief Common types and utilities for the REST API
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <relvault/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace relvault::web {

/**
 * @enum http_status
 * @brief HTTP status codes used by the API
 */
enum class http_status : std::uint16_t {
  // Success
  ok = 200,
  created = 201,
  no_content = 204,

  // Client errors
  bad_request = 400,
  unauthorized = 401,
  forbidden = 403,
  not_found = 404,
  payload_too_large = 413,
  unprocessable_entity = 422,

  // Server errors
  internal_server_error = 500,
  service_unavailable = 503
};

/**
 * @brief Escape a string for JSON
 * @param s Input string
 * @return JSON-escaped string
 */
[[nodiscard]] inline std::string json_escape(std::string_view s) {
  std::string result;
  result.reserve(s.size() + 10);
  for (char c : s) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\b':
      result += "\\b";
      break;
    case '\f':
      result += "\\f";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      result += c;
      break;
    }
  }
  return result;
}

/**
 * @brief Create JSON error response body
 * @param code Error code
 * @param message Error message
 * @return JSON string
 */
[[nodiscard]] inline std::string make_error_json(std::string_view code,
                                                 std::string_view message) {
  return std::string(R"({"error":{"code":")") + json_escape(code) +
         R"(","message":")" + json_escape(message) + R"("}})";
}

/**
 * @brief HTTP status for a relvault error code
 *
 * Token faults map to 401, capability faults to 403 and domain faults to
 * 422, so a rejected request never looks like a server failure.
 */
[[nodiscard]] constexpr http_status status_for(int code) noexcept {
  switch (code) {
  case error_codes::unauthenticated:
  case error_codes::invalid_credential:
  case error_codes::token_expired:
  case error_codes::token_revoked:
  case error_codes::invalid_signature:
  case error_codes::malformed_token:
    return http_status::unauthorized;
  case error_codes::insufficient_privilege:
  case error_codes::forbidden:
  case error_codes::key_owner_mismatch:
    return http_status::forbidden;
  case error_codes::not_found:
    return http_status::not_found;
  case error_codes::key_parse_error:
  case error_codes::duplicate_fingerprint:
  case error_codes::key_uid_mismatch:
    return http_status::unprocessable_entity;
  case error_codes::unavailable:
    return http_status::service_unavailable;
  default:
    return http_status::internal_server_error;
  }
}

/**
 * @brief Token carried by an `Authorization: Bearer <token>` header value
 *
 * The scheme is matched case-insensitively; an empty token is rejected.
 */
[[nodiscard]] inline std::optional<std::string_view>
extract_bearer_token(std::string_view header) {
  constexpr std::string_view scheme = "bearer ";
  if (header.size() <= scheme.size()) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < scheme.size(); ++i) {
    char c = header[i];
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
    if (c != scheme[i]) {
      return std::nullopt;
    }
  }
  auto token = header.substr(scheme.size());
  while (!token.empty() && token.front() == ' ') {
    token.remove_prefix(1);
  }
  while (!token.empty() && token.back() == ' ') {
    token.remove_suffix(1);
  }
  if (token.empty() || token.find(' ') != std::string_view::npos) {
    return std::nullopt;
  }
  return token;
}

} // namespace relvault::web
