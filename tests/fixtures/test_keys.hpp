/**
 * @file test_keys.hpp
 * @brief Deterministic OpenPGP public keys for tests
 *
 * Keys are assembled packet by packet (v4 RSA-2048 primary key plus User ID
 * packets) and armored with keys::armor_public_key. The modulus is derived
 * from a seed string, so each seed yields a distinct, stable fingerprint.
 */

#pragma once

#include <relvault/keys/openpgp.hpp>
#include <relvault/security/crypto.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace relvault::test {

struct test_key {
    std::string armored;
    std::string fingerprint;
    keys::byte_buffer packets;
};

/// Key creation time written into every fixture key packet
inline constexpr std::uint32_t test_key_created = 1'600'000'000;

inline auto make_rsa_key_body(std::string_view seed) -> keys::byte_buffer {
    keys::byte_buffer body;
    body.push_back(4);
    body.push_back(static_cast<std::uint8_t>((test_key_created >> 24) & 0xFF));
    body.push_back(static_cast<std::uint8_t>((test_key_created >> 16) & 0xFF));
    body.push_back(static_cast<std::uint8_t>((test_key_created >> 8) & 0xFF));
    body.push_back(static_cast<std::uint8_t>(test_key_created & 0xFF));
    body.push_back(1);  // RSA

    // n: 2048-bit MPI
    body.push_back(0x08);
    body.push_back(0x00);
    keys::byte_buffer modulus;
    for (int i = 0; modulus.size() < 256; ++i) {
        auto block = security::crypto::sha256(std::string(seed) + "/" + std::to_string(i));
        modulus.insert(modulus.end(), block.begin(), block.end());
    }
    modulus.resize(256);
    modulus[0] |= 0x80;
    body.insert(body.end(), modulus.begin(), modulus.end());

    // e = 65537
    for (std::uint8_t b : {0x00, 0x11, 0x01, 0x00, 0x01}) {
        body.push_back(b);
    }
    return body;
}

inline auto expected_fingerprint(const keys::byte_buffer& body) -> std::string {
    keys::byte_buffer hashed;
    hashed.push_back(0x99);
    hashed.push_back(static_cast<std::uint8_t>((body.size() >> 8) & 0xFF));
    hashed.push_back(static_cast<std::uint8_t>(body.size() & 0xFF));
    hashed.insert(hashed.end(), body.begin(), body.end());
    return security::crypto::to_hex(security::crypto::sha1(hashed));
}

/**
 * @brief Build an armored key declaring @p uids (first one is primary)
 */
inline auto make_test_key(std::string_view seed,
                          const std::vector<std::string>& uids) -> test_key {
    auto body = make_rsa_key_body(seed);

    test_key key;
    key.fingerprint = expected_fingerprint(body);

    // Old-format public key packet, two-octet length
    key.packets.push_back(0x99);
    key.packets.push_back(static_cast<std::uint8_t>((body.size() >> 8) & 0xFF));
    key.packets.push_back(static_cast<std::uint8_t>(body.size() & 0xFF));
    key.packets.insert(key.packets.end(), body.begin(), body.end());

    // Old-format User ID packets, one-octet length
    for (const auto& uid : uids) {
        key.packets.push_back(0xB4);
        key.packets.push_back(static_cast<std::uint8_t>(uid.size()));
        key.packets.insert(key.packets.end(), uid.begin(), uid.end());
    }

    key.armored = keys::armor_public_key(key.packets);
    return key;
}

/// Key for a foundation account, declaring `<uid>@apache.org`
inline auto make_apache_key(std::string_view uid, std::string_view seed = {})
    -> test_key {
    std::string name(uid);
    return make_test_key(seed.empty() ? uid : seed,
                         {"Test User " + name + " <" + name + "@apache.org>"});
}

inline constexpr std::string_view malformed_block =
    "-----BEGIN PGP PUBLIC KEY BLOCK-----\n"
    "\n"
    "bm90IGEga2V5IHBhY2tldA==\n"
    "-----END PGP PUBLIC KEY BLOCK-----\n";

}  // namespace relvault::test
