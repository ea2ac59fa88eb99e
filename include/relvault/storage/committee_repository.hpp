/**
 * @file committee_repository.hpp
 * @brief Authoritative principal and committee membership data
 *
 * Capability grants re-derive privilege from this repository on every
 * request; nothing about a caller's privilege is cached across sessions.
 */

#pragma once

#include <relvault/core/result.hpp>
#include <relvault/security/identity_provider.hpp>
#include <relvault/security/privilege.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace relvault::storage {

/**
 * @brief Role of a principal within a committee
 */
enum class committee_role { member, committer };

constexpr std::string_view to_string(committee_role role) {
    switch (role) {
        case committee_role::member: return "member";
        case committee_role::committer: return "committer";
    }
    return "unknown";
}

inline std::optional<committee_role> parse_committee_role(std::string_view str) {
    if (str == "member") return committee_role::member;
    if (str == "committer") return committee_role::committer;
    return std::nullopt;
}

/**
 * @brief Foundation account as known to the release database
 */
struct principal_record {
    std::string asf_uid;
    bool is_committer{true};
    bool is_admin{false};
    bool active{true};
};

struct committee_record {
    std::string name;
    std::string display_name;
};

/**
 * @brief Data access for principals, committees and committee_roles
 */
class committee_repository : public security::identity_provider {
public:
    explicit committee_repository(sqlite3* db);
    ~committee_repository() override;

    committee_repository(const committee_repository&) = delete;
    auto operator=(const committee_repository&) -> committee_repository& = delete;
    committee_repository(committee_repository&&) noexcept;
    auto operator=(committee_repository&&) noexcept -> committee_repository&;

    // identity_provider
    [[nodiscard]] bool is_signed_in(std::string_view asf_uid) const override;
    [[nodiscard]] bool is_administrator(std::string_view asf_uid) const override;

    // ========================================================================
    // Principals
    // ========================================================================

    [[nodiscard]] auto find_principal(std::string_view asf_uid) const
        -> Result<std::optional<principal_record>>;

    [[nodiscard]] auto upsert_principal(const principal_record& record)
        -> VoidResult;

    // ========================================================================
    // Committees
    // ========================================================================

    [[nodiscard]] auto find_committee(std::string_view name) const
        -> Result<std::optional<committee_record>>;

    [[nodiscard]] auto upsert_committee(const committee_record& record)
        -> VoidResult;

    /// All committees, ordered by name
    [[nodiscard]] auto list_committees() const
        -> Result<std::vector<committee_record>>;

    [[nodiscard]] auto add_role(std::string_view committee,
                                std::string_view asf_uid, committee_role role)
        -> VoidResult;

    [[nodiscard]] auto remove_role(std::string_view committee,
                                   std::string_view asf_uid,
                                   committee_role role) -> VoidResult;

    [[nodiscard]] auto has_role(std::string_view committee,
                                std::string_view asf_uid,
                                committee_role role) const -> Result<bool>;

    // ========================================================================
    // Privilege derivation
    // ========================================================================

    /**
     * @brief Highest privilege @p asf_uid holds, optionally within a committee
     *
     * Without a committee the result is at most foundation_committer.
     * Inactive or unknown accounts are general_public.
     */
    [[nodiscard]] auto privilege_for(
        std::string_view asf_uid,
        std::optional<std::string_view> committee = std::nullopt) const
        -> Result<security::privilege_level>;

private:
    sqlite3* db_{nullptr};
};

}  // namespace relvault::storage
