/**
 * @file public_signing_key.hpp
 * @brief Stored public signing key record and key operation results
 */

#pragma once

#include "openpgp.hpp"

#include <relvault/core/outcome.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relvault::keys {

/**
 * @brief Public signing key as persisted in the release database
 */
struct public_signing_key {
    using time_point = std::chrono::system_clock::time_point;

    std::string fingerprint;  ///< 40 lowercase hex digits (primary key)
    int algorithm{0};
    int length{0};
    time_point created{};     ///< key creation time from the packet
    std::optional<std::string> primary_declared_uid;
    std::vector<std::string> secondary_declared_uids;
    std::string apache_uid;   ///< owning foundation account
    std::string ascii_armored_key;
    time_point stored_at{};

    /**
     * @brief Build a record from a parsed key owned by @p owner
     */
    [[nodiscard]] static auto from_parsed(const parsed_key& parsed,
                                          std::string owner)
        -> public_signing_key {
        public_signing_key key;
        key.fingerprint = parsed.fingerprint;
        key.algorithm = parsed.algorithm;
        key.length = parsed.length;
        key.created = parsed.created;
        key.primary_declared_uid = parsed.primary_declared_uid;
        key.secondary_declared_uids = parsed.secondary_declared_uids;
        key.apache_uid = std::move(owner);
        key.ascii_armored_key = parsed.ascii_armored_key;
        return key;
    }

    [[nodiscard]] auto key_id() const -> std::string {
        return fingerprint.size() >= 16
                   ? fingerprint.substr(fingerprint.size() - 16)
                   : fingerprint;
    }
};

/**
 * @brief What a single key import did
 */
enum class key_status {
    parsed,              ///< already stored and already linked
    inserted,            ///< newly stored, no association requested
    linked,              ///< already stored, newly linked
    inserted_and_linked  ///< newly stored and linked
};

constexpr std::string_view to_string(key_status status) {
    switch (status) {
        case key_status::parsed: return "parsed";
        case key_status::inserted: return "inserted";
        case key_status::linked: return "linked";
        case key_status::inserted_and_linked: return "inserted_and_linked";
    }
    return "unknown";
}

/// Whether the key record was created by the import
[[nodiscard]] constexpr bool was_inserted(key_status status) noexcept {
    return status == key_status::inserted ||
           status == key_status::inserted_and_linked;
}

/// Whether a committee association was created by the import
[[nodiscard]] constexpr bool was_linked(key_status status) noexcept {
    return status == key_status::linked ||
           status == key_status::inserted_and_linked;
}

struct key_import {
    public_signing_key key;
    key_status status{key_status::parsed};
};

/**
 * @brief Result of associating a key with a committee
 *
 * The regeneration of the committee's KEYS file is a side effect that may
 * fail on its own, so it is reported as a nested outcome.
 */
struct key_association {
    std::string fingerprint;
    key_status status{key_status::parsed};
    outcome<std::filesystem::path> keys_file;
};

/**
 * @brief Result of a committee bulk import
 */
struct key_import_batch {
    outcomes<key_import> keys;
    outcome<std::filesystem::path> keys_file;
};

/**
 * @brief Result of deleting one of the caller's own keys
 */
struct key_deletion {
    std::string fingerprint;
    outcomes<std::filesystem::path> regenerated;
};

/**
 * @brief Result of clearing all keys of a committee
 */
struct committee_keys_removal {
    std::size_t links_removed{0};
    std::size_t keys_deleted{0};
};

} // namespace relvault::keys
