/**
 * @file key_repository.hpp
 * @brief Repository for public signing keys and their committee links
 */

#pragma once

#include <relvault/core/result.hpp>
#include <relvault/keys/public_signing_key.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace relvault::storage {

/**
 * @brief Data access for the public_signing_keys and key_links tables
 *
 * Operates on the connection of the owning session; it never begins or ends
 * a transaction itself.
 */
class key_repository {
public:
    explicit key_repository(sqlite3* db);
    ~key_repository();

    key_repository(const key_repository&) = delete;
    auto operator=(const key_repository&) -> key_repository& = delete;
    key_repository(key_repository&&) noexcept;
    auto operator=(key_repository&&) noexcept -> key_repository&;

    // ========================================================================
    // Keys
    // ========================================================================

    [[nodiscard]] auto find(std::string_view fingerprint) const
        -> Result<std::optional<keys::public_signing_key>>;

    /**
     * @brief Store a new key
     * @retval duplicate_fingerprint if a key with the fingerprint exists
     */
    [[nodiscard]] auto insert(const keys::public_signing_key& key)
        -> VoidResult;

    /// Delete a key and (by cascade) its links; false if it did not exist
    [[nodiscard]] auto remove(std::string_view fingerprint) -> Result<bool>;

    [[nodiscard]] auto find_by_owner(std::string_view asf_uid) const
        -> Result<std::vector<keys::public_signing_key>>;

    // ========================================================================
    // Committee links
    // ========================================================================

    /// Keys linked to @p committee, ordered by fingerprint
    [[nodiscard]] auto committee_keys(std::string_view committee) const
        -> Result<std::vector<keys::public_signing_key>>;

    /// Link a key to a committee; false if the link already existed
    [[nodiscard]] auto link(std::string_view committee,
                            std::string_view fingerprint) -> Result<bool>;

    /// Remove a link; false if it did not exist
    [[nodiscard]] auto unlink(std::string_view committee,
                              std::string_view fingerprint) -> Result<bool>;

    [[nodiscard]] auto is_linked(std::string_view committee,
                                 std::string_view fingerprint) const
        -> Result<bool>;

    /// Committees a key is linked to, ordered by name
    [[nodiscard]] auto committees_of(std::string_view fingerprint) const
        -> Result<std::vector<std::string>>;

    /**
     * @brief Remove every link of a committee
     * @return Fingerprints that were linked, ordered
     */
    [[nodiscard]] auto unlink_all(std::string_view committee)
        -> Result<std::vector<std::string>>;

    /**
     * @brief Delete those of @p fingerprints no longer linked to any committee
     * @return Number of keys deleted
     */
    [[nodiscard]] auto delete_orphans(const std::vector<std::string>& fingerprints)
        -> Result<std::size_t>;

private:
    sqlite3* db_{nullptr};
};

}  // namespace relvault::storage
