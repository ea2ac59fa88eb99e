/**
 * @file signing_secret.hpp
 * @brief Process-wide HMAC key for session tokens
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <relvault/core/result.hpp>
#include <relvault/security/crypto.hpp>

#include <cstddef>

namespace relvault::security {

/**
 * @brief Immutable symmetric key used to sign and verify JWTs
 *
 * Generated once at process start and injected into the token service.
 * There is no way to change the key of an existing instance; a restart
 * creates a new secret, which invalidates every outstanding JWT.
 */
class signing_secret {
public:
  static constexpr std::size_t default_size = 32;

  /**
   * @brief Generate a fresh random secret
   */
  [[nodiscard]] static auto generate(std::size_t bytes = default_size)
      -> Result<signing_secret>;

  explicit signing_secret(crypto::byte_buffer key) : key_(std::move(key)) {}

  [[nodiscard]] const crypto::byte_buffer &bytes() const noexcept {
    return key_;
  }

private:
  crypto::byte_buffer key_;
};

} // namespace relvault::security
