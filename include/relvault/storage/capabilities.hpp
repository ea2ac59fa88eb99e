/**
 * @file capabilities.hpp
 * @brief Privilege-scoped capability objects handed out by a write_session
 *
 * A capability is a proof that the session's caller was found eligible for a
 * privilege level. Levels are ordered
 *
 *   general_public < foundation_committer < committee_participant
 *                  < committee_member
 *
 * and each capability type is composed from the operation sets of its own
 * level and every level below it, so any operation available at a lower
 * level is available at every higher level. The concepts at the end of this
 * file check that property at compile time.
 *
 * Capabilities can only be created by write_session (read_session hands out
 * general_public only). They are cheap handles
 * onto the session; once the session is committed or rolled back, every
 * operation fails with error_codes::session_closed.
 */

#pragma once

#include <relvault/core/outcome.hpp>
#include <relvault/core/result.hpp>
#include <relvault/keys/public_signing_key.hpp>
#include <relvault/security/personal_access_token.hpp>
#include <relvault/security/principal.hpp>
#include <relvault/security/privilege.hpp>

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relvault::storage {

class write_session;
class read_session;

namespace detail {
struct session_state;
}  // namespace detail

// =============================================================================
// Operation sets
// =============================================================================

/**
 * @brief Read operations available to anyone
 */
template <typename Derived>
class public_operations {
public:
    /// Principal the owning session was opened for
    [[nodiscard]] auto caller() const -> const security::principal&;

    /// Stored key by fingerprint (spaces and case are ignored)
    [[nodiscard]] auto find_key(std::string_view fingerprint) const
        -> outcome<std::optional<keys::public_signing_key>>;

    /// Keys linked to a committee, ordered by fingerprint
    [[nodiscard]] auto committee_keys(std::string_view committee) const
        -> outcome<std::vector<keys::public_signing_key>>;

    [[nodiscard]] auto keys_file_path(std::string_view committee) const
        -> std::filesystem::path;

protected:
    public_operations() = default;

    [[nodiscard]] auto session() const -> detail::session_state& {
        return *static_cast<const Derived&>(*this).state_;
    }
};

/**
 * @brief Operations of any active foundation committer
 */
template <typename Derived>
class committer_operations {
public:
    /**
     * @brief Store a key owned by the caller, if not already stored
     *
     * Succeeds with a warning when none of the key's User IDs declares the
     * caller's foundation address.
     */
    [[nodiscard]] auto ensure_user_key(std::string_view armored_key)
        -> outcome<keys::key_import>;

    /**
     * @brief Delete one of the caller's own keys
     *
     * Each committee the key was linked to has its KEYS file regenerated; the
     * regenerations are reported individually.
     */
    [[nodiscard]] auto delete_key(std::string_view fingerprint)
        -> outcome<keys::key_deletion>;

    [[nodiscard]] auto own_keys() const
        -> outcome<std::vector<keys::public_signing_key>>;

    // Personal access tokens of the caller

    [[nodiscard]] auto issue_pat(std::string_view label = {})
        -> Result<security::issued_pat>;

    [[nodiscard]] auto revoke_pat(std::int64_t pat_id)
        -> Result<security::personal_access_token>;

    [[nodiscard]] auto list_pats() const
        -> Result<std::vector<security::personal_access_token>>;

protected:
    committer_operations() = default;

    [[nodiscard]] auto session() const -> detail::session_state& {
        return *static_cast<const Derived&>(*this).state_;
    }
};

/**
 * @brief Operations of a member or committer of one committee
 */
template <typename Derived>
class participant_operations {
public:
    [[nodiscard]] auto committee() const -> const std::string& {
        return static_cast<const Derived&>(*this).committee_;
    }

    /**
     * @brief Link one of the caller's stored keys to the committee
     *
     * The committee's KEYS file is regenerated as a side effect; its outcome
     * is nested in the result because it may fail on its own.
     */
    [[nodiscard]] auto associate_fingerprint(std::string_view fingerprint)
        -> outcome<keys::key_association>;

protected:
    participant_operations() = default;

    [[nodiscard]] auto session() const -> detail::session_state& {
        return *static_cast<const Derived&>(*this).state_;
    }
};

/**
 * @brief Operations of a committee member
 */
template <typename Derived>
class member_operations {
public:
    /**
     * @brief Import every key of a key-listing file and link it
     *
     * Each armored block yields exactly one entry, keyed by fingerprint or,
     * for blocks that fail to parse, by "block-<n>". The call itself never
     * fails as a whole.
     */
    [[nodiscard]] auto ensure_stored(std::string_view keys_text)
        -> keys::key_import_batch;

    /// Regenerate the committee's KEYS file
    [[nodiscard]] auto autogenerate_keys_file()
        -> outcome<std::filesystem::path>;

    /// Unlink a key from the committee and regenerate its KEYS file
    [[nodiscard]] auto remove_association(std::string_view fingerprint)
        -> outcome<std::filesystem::path>;

    /**
     * @brief Unlink every key of the committee
     *
     * Keys no longer linked anywhere are deleted. If deleting fails after
     * the links were removed, the failure carries the partial counts.
     */
    [[nodiscard]] auto delete_committee_keys()
        -> outcome<keys::committee_keys_removal>;

protected:
    member_operations() = default;

    [[nodiscard]] auto session() const -> detail::session_state& {
        return *static_cast<const Derived&>(*this).state_;
    }

    [[nodiscard]] auto committee_name() const -> const std::string& {
        return static_cast<const Derived&>(*this).committee_;
    }
};

// =============================================================================
// Capabilities
// =============================================================================

class general_public final
    : public public_operations<general_public> {
public:
    static constexpr auto level = security::privilege_level::general_public;

private:
    friend class write_session;
    friend class read_session;
    friend class public_operations<general_public>;

    explicit general_public(std::shared_ptr<detail::session_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::session_state> state_;
};

class foundation_committer final
    : public public_operations<foundation_committer>,
      public committer_operations<foundation_committer> {
public:
    static constexpr auto level = security::privilege_level::foundation_committer;

private:
    friend class write_session;
    friend class public_operations<foundation_committer>;
    friend class committer_operations<foundation_committer>;

    explicit foundation_committer(std::shared_ptr<detail::session_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::session_state> state_;
};

class committee_participant final
    : public public_operations<committee_participant>,
      public committer_operations<committee_participant>,
      public participant_operations<committee_participant> {
public:
    static constexpr auto level = security::privilege_level::committee_participant;

private:
    friend class write_session;
    friend class public_operations<committee_participant>;
    friend class committer_operations<committee_participant>;
    friend class participant_operations<committee_participant>;

    committee_participant(std::shared_ptr<detail::session_state> state,
                          std::string committee)
        : state_(std::move(state)), committee_(std::move(committee)) {}

    std::shared_ptr<detail::session_state> state_;
    std::string committee_;
};

class committee_member final
    : public public_operations<committee_member>,
      public committer_operations<committee_member>,
      public participant_operations<committee_member>,
      public member_operations<committee_member> {
public:
    static constexpr auto level = security::privilege_level::committee_member;

private:
    friend class write_session;
    friend class public_operations<committee_member>;
    friend class committer_operations<committee_member>;
    friend class participant_operations<committee_member>;
    friend class member_operations<committee_member>;

    committee_member(std::shared_ptr<detail::session_state> state,
                     std::string committee)
        : state_(std::move(state)), committee_(std::move(committee)) {}

    std::shared_ptr<detail::session_state> state_;
    std::string committee_;
};

// =============================================================================
// Compile-time superset checks
// =============================================================================

template <typename C>
concept public_capability = requires(const C& c, std::string_view s) {
    { c.caller() } -> std::same_as<const security::principal&>;
    { c.find_key(s) } -> std::same_as<outcome<std::optional<keys::public_signing_key>>>;
    { c.committee_keys(s) } -> std::same_as<outcome<std::vector<keys::public_signing_key>>>;
    { c.keys_file_path(s) } -> std::same_as<std::filesystem::path>;
};

template <typename C>
concept committer_capability =
    public_capability<C> &&
    requires(C& c, const C& cc, std::string_view s, std::int64_t id) {
        { c.ensure_user_key(s) } -> std::same_as<outcome<keys::key_import>>;
        { c.delete_key(s) } -> std::same_as<outcome<keys::key_deletion>>;
        { cc.own_keys() } -> std::same_as<outcome<std::vector<keys::public_signing_key>>>;
        { c.issue_pat(s) } -> std::same_as<Result<security::issued_pat>>;
        { c.revoke_pat(id) } -> std::same_as<Result<security::personal_access_token>>;
        { cc.list_pats() } -> std::same_as<Result<std::vector<security::personal_access_token>>>;
    };

template <typename C>
concept participant_capability =
    committer_capability<C> && requires(C& c, const C& cc, std::string_view s) {
        { cc.committee() } -> std::same_as<const std::string&>;
        { c.associate_fingerprint(s) } -> std::same_as<outcome<keys::key_association>>;
    };

template <typename C>
concept member_capability =
    participant_capability<C> && requires(C& c, std::string_view s) {
        { c.ensure_stored(s) } -> std::same_as<keys::key_import_batch>;
        { c.autogenerate_keys_file() } -> std::same_as<outcome<std::filesystem::path>>;
        { c.remove_association(s) } -> std::same_as<outcome<std::filesystem::path>>;
        { c.delete_committee_keys() } -> std::same_as<outcome<keys::committee_keys_removal>>;
    };

static_assert(public_capability<general_public>);
static_assert(public_capability<foundation_committer>);
static_assert(public_capability<committee_participant>);
static_assert(public_capability<committee_member>);

static_assert(committer_capability<foundation_committer>);
static_assert(committer_capability<committee_participant>);
static_assert(committer_capability<committee_member>);

static_assert(participant_capability<committee_participant>);
static_assert(participant_capability<committee_member>);

static_assert(member_capability<committee_member>);

// No capability exposes operations above its own level
static_assert(!committer_capability<general_public>);
static_assert(!participant_capability<foundation_committer>);
static_assert(!member_capability<committee_participant>);

}  // namespace relvault::storage
