/**
 * @file write_session.hpp
 * @brief Unit of work through which every storage mutation flows
 *
 * A write_session binds one caller to one database transaction. Writes are
 * reachable only through capability objects obtained from the session, and
 * each grant re-checks the caller's privilege against the directory tables.
 * A denied grant, or any token fault, aborts the session: commit() then
 * rolls back and reports the fault.
 *
 * KEYS files regenerated during the session are staged beside their targets
 * and published only after the database commit succeeds.
 *
 * @example
 * @code
 * auto result = write_session::run(context, principal{"alice"},
 *     [&](write_session& session) -> Result<keys::key_association> {
 *         auto cap = session.as_committee_participant("tooling");
 *         if (cap.is_err()) return Result<keys::key_association>(cap.error());
 *         return cap.value().associate_fingerprint(fpr).to_result();
 *     });
 * @endcode
 */

#pragma once

#include "capabilities.hpp"
#include "storage_context.hpp"

#include <relvault/core/outcome.hpp>
#include <relvault/core/result.hpp>
#include <relvault/security/principal.hpp>
#include <relvault/security/privilege.hpp>
#include <relvault/security/session_token.hpp>

#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace relvault::storage {

/**
 * @brief RAII storage session
 *
 * Rolls back on destruction unless committed. Not thread-safe; one session
 * serves one request.
 */
class write_session {
public:
    /**
     * @brief Open a session for @p caller
     *
     * @retval unavailable if the backing store cannot be reached or locked
     */
    [[nodiscard]] static auto open(std::shared_ptr<const storage_context> context,
                                   security::principal caller)
        -> Result<write_session>;

    /**
     * @brief Run @p fn inside a session
     *
     * Commits if @p fn returns a success, rolls back if it returns an error
     * or throws (the exception is rethrown). @p fn must return a Result.
     */
    template <typename F>
    static auto run(std::shared_ptr<const storage_context> context,
                    security::principal caller, F&& fn)
        -> std::invoke_result_t<F, write_session&>;

    ~write_session();

    write_session(const write_session&) = delete;
    auto operator=(const write_session&) -> write_session& = delete;
    write_session(write_session&& other) noexcept;
    auto operator=(write_session&& other) noexcept -> write_session&;

    [[nodiscard]] auto caller() const -> const security::principal&;

    /// False after commit or rollback
    [[nodiscard]] bool is_open() const noexcept;

    /// Fault that aborted the session, if any
    [[nodiscard]] auto fault() const -> std::optional<error_info>;

    // ========================================================================
    // Capability grants
    // ========================================================================

    [[nodiscard]] auto as_general_public() -> Result<general_public>;

    /// @retval insufficient_privilege if the caller is not an active committer
    [[nodiscard]] auto as_foundation_committer() -> Result<foundation_committer>;

    /// @retval insufficient_privilege if the caller has no role in @p committee
    [[nodiscard]] auto as_committee_participant(std::string_view committee)
        -> Result<committee_participant>;

    /// @retval insufficient_privilege if the caller is not a member of @p committee
    [[nodiscard]] auto as_committee_member(std::string_view committee)
        -> Result<committee_member>;

    /**
     * @brief Membership probe that leaves the session usable on denial
     */
    [[nodiscard]] auto try_as_committee_member(std::string_view committee)
        -> std::optional<committee_member>;

    /// Privilege the caller currently holds, optionally within a committee
    [[nodiscard]] auto privilege(
        std::optional<std::string_view> committee = std::nullopt) const
        -> Result<security::privilege_level>;

    // ========================================================================
    // Session-level operations
    // ========================================================================

    /**
     * @brief Regenerate the KEYS file of every committee the caller is a
     * member of, keyed by committee name
     */
    [[nodiscard]] auto regenerate_all_keys_files()
        -> outcomes<std::filesystem::path>;

    /**
     * @brief Exchange one of the caller's PATs for a session token
     *
     * A rejected exchange aborts the session.
     */
    [[nodiscard]] auto exchange_pat(std::string_view plaintext_pat)
        -> Result<security::session_token>;

    // ========================================================================
    // Completion
    // ========================================================================

    /// Mark the session failed without ending it
    void abort(error_info cause);

    /**
     * @brief Commit the transaction, publish staged files, emit audit records
     *
     * An aborted session is rolled back instead and its fault returned. A
     * file that cannot be published is reported after the database commit.
     */
    [[nodiscard]] auto commit() -> VoidResult;

    /// Discard all writes of the session; a no-op once closed
    void rollback() noexcept;

private:
    explicit write_session(std::shared_ptr<detail::session_state> state);

    [[nodiscard]] auto grant(security::privilege_level requested,
                             std::optional<std::string_view> committee,
                             bool abort_on_denial) -> VoidResult;

    std::shared_ptr<detail::session_state> state_;
};

template <typename F>
auto write_session::run(std::shared_ptr<const storage_context> context,
                        security::principal caller, F&& fn)
    -> std::invoke_result_t<F, write_session&> {
    using result_type = std::invoke_result_t<F, write_session&>;

    auto opened = open(std::move(context), std::move(caller));
    if (opened.is_err()) {
        return result_type(opened.error());
    }
    auto session = std::move(opened.value());

    try {
        result_type result = std::invoke(std::forward<F>(fn), session);
        if (result.is_err()) {
            session.rollback();
            return result;
        }
        auto committed = session.commit();
        if (committed.is_err()) {
            return result_type(committed.error());
        }
        return result;
    } catch (...) {
        session.rollback();
        throw;
    }
}

}  // namespace relvault::storage
