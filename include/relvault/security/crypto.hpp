/**
 * @file crypto.hpp
 * @brief Thin OpenSSL wrappers for hashing, HMAC, randomness and base64
 *
 * The token service and the OpenPGP key parser only need a handful of
 * primitives; they are collected here so that no other translation unit
 * includes OpenSSL headers directly.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <relvault/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relvault::security::crypto {

using byte_buffer = std::vector<std::uint8_t>;

/**
 * @brief Fill a buffer with cryptographically secure random bytes
 */
[[nodiscard]] auto random_bytes(std::size_t count) -> Result<byte_buffer>;

/// SHA-256 digest of @p data
[[nodiscard]] auto sha256(std::string_view data) -> byte_buffer;

/// SHA-1 digest of @p data (OpenPGP v4 fingerprints)
[[nodiscard]] auto sha1(const byte_buffer &data) -> byte_buffer;

/// HMAC-SHA256 of @p data under @p key
[[nodiscard]] auto hmac_sha256(const byte_buffer &key, std::string_view data)
    -> Result<byte_buffer>;

/**
 * @brief Compare two buffers in constant time
 */
[[nodiscard]] bool constant_time_equal(const byte_buffer &a,
                                       const byte_buffer &b) noexcept;

/// Lowercase hexadecimal rendering
[[nodiscard]] auto to_hex(const byte_buffer &data) -> std::string;

// Base64 (RFC 4648 section 4), padded
[[nodiscard]] auto base64_encode(const byte_buffer &data) -> std::string;
[[nodiscard]] auto base64_decode(std::string_view text)
    -> std::optional<byte_buffer>;

// Base64url (RFC 4648 section 5), unpadded
[[nodiscard]] auto base64url_encode(const byte_buffer &data) -> std::string;
[[nodiscard]] auto base64url_encode(std::string_view data) -> std::string;
[[nodiscard]] auto base64url_decode(std::string_view text)
    -> std::optional<byte_buffer>;

} // namespace relvault::security::crypto
