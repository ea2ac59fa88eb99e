/**
 * @file session_token.hpp
 * @brief Short-lived bearer credential (JWT) and token configuration
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace relvault::security {

/**
 * @brief Lifetimes and sizes used by the token service
 */
struct token_config {
  /// PAT validity from issuance
  std::chrono::seconds pat_lifetime{std::chrono::hours(24 * 180)};

  /// JWT validity from issuance
  std::chrono::seconds jwt_lifetime{std::chrono::minutes(90)};

  /// Random bytes in a PAT plaintext
  std::size_t pat_bytes{32};

  /// Random bytes in a JWT id claim
  std::size_t jti_bytes{16};

  /// Value of the "iss" claim
  std::string issuer{"relvault"};
};

/**
 * @brief Claims carried by a session token
 */
struct session_claims {
  using time_point = std::chrono::system_clock::time_point;

  std::string subject;   ///< sub: foundation uid
  time_point issued_at{}; ///< iat
  time_point expires_at{}; ///< exp
  std::string token_id;  ///< jti
  std::string issuer;    ///< iss

  bool operator==(const session_claims &) const = default;
};

/**
 * @brief A signed JWT and its decoded claims
 */
struct session_token {
  std::string encoded;
  session_claims claims;
};

} // namespace relvault::security
