/**
 * @file openpgp.hpp
 * @brief Minimal OpenPGP (RFC 4880) public key parser
 *
 * Only what is needed to store and list public signing keys is decoded:
 * ASCII armor, the primary v4 public-key packet and its User ID packets.
 * Signatures are carried along verbatim and never checked.
 *
 * @see RFC 4880 - OpenPGP Message Format
 */

#pragma once

#include <relvault/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relvault::keys {

using byte_buffer = std::vector<std::uint8_t>;

/**
 * @brief Public-key algorithm identifiers (RFC 4880 9.1, RFC 6637)
 */
enum class public_key_algorithm : int {
    rsa = 1,
    rsa_encrypt_only = 2,
    rsa_sign_only = 3,
    elgamal = 16,
    dsa = 17,
    ecdh = 18,
    ecdsa = 19,
    eddsa = 22
};

/**
 * @brief Short algorithm name as printed by gpg ("rsa", "dsa", "ed25519"...)
 */
[[nodiscard]] auto algorithm_name(int algorithm, int length) -> std::string;

/**
 * @brief Packet tags of interest
 */
namespace packet_tag {
    constexpr int signature = 2;
    constexpr int public_key = 6;
    constexpr int user_id = 13;
    constexpr int public_subkey = 14;
} // namespace packet_tag

/**
 * @brief Decoded primary key of one armored block
 */
struct parsed_key {
    std::string fingerprint;  ///< 40 lowercase hex digits
    std::string key_id;       ///< last 16 hex digits of the fingerprint
    int algorithm{0};
    int length{0};            ///< key size in bits
    std::chrono::system_clock::time_point created{};
    std::optional<std::string> primary_declared_uid;
    std::vector<std::string> secondary_declared_uids;
    std::string ascii_armored_key;  ///< canonical re-armored block
};

/**
 * @brief Parse a single ASCII-armored public key block
 *
 * @retval key_parse_error on any armor, checksum or packet error
 */
[[nodiscard]] auto parse_armored_key(std::string_view armored)
    -> Result<parsed_key>;

/**
 * @brief Split a key-listing file into its armored blocks, in order
 *
 * Text outside of BEGIN/END markers is ignored. A block missing its END
 * marker is still returned so that the caller can report it as malformed.
 */
[[nodiscard]] auto split_key_blocks(std::string_view text)
    -> std::vector<std::string>;

/**
 * @brief CRC-24 used by the armor checksum (RFC 4880 6.1)
 */
[[nodiscard]] auto crc24(const byte_buffer& data) noexcept -> std::uint32_t;

/**
 * @brief Wrap raw packets in a public key armor with checksum
 */
[[nodiscard]] auto armor_public_key(const byte_buffer& packets) -> std::string;

/**
 * @brief Foundation uid declared by one of the key's User IDs
 *
 * Looks for an email address of the form `<uid@apache.org>`.
 */
[[nodiscard]] auto find_apache_uid(const parsed_key& key)
    -> std::optional<std::string>;

/// Whether any declared User ID carries @p email (case-insensitive)
[[nodiscard]] bool declares_email(const parsed_key& key, std::string_view email);

} // namespace relvault::keys
