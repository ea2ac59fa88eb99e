/**
 * @file personal_access_token.hpp
 * @brief Long-lived per-user credential record
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace relvault::security {

/**
 * @brief Stored form of a personal access token (PAT)
 *
 * Only the SHA-256 hash of the token is kept; the plaintext is handed to the
 * user once at issuance and never stored.
 */
struct personal_access_token {
  using time_point = std::chrono::system_clock::time_point;

  std::int64_t id{0};
  std::string asf_uid;
  std::string token_hash; ///< lowercase hex SHA-256 of the plaintext
  std::string label;
  time_point created{};
  time_point expires{};
  bool revoked{false};

  [[nodiscard]] bool is_expired(time_point now) const noexcept {
    return now >= expires;
  }
};

/**
 * @brief Result of PAT issuance: the plaintext exists only here
 */
struct issued_pat {
  std::string plaintext;
  personal_access_token token;
};

} // namespace relvault::security
