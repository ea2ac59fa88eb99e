/**
 * @file write_session.cpp
 * @brief Storage session lifecycle and capability grants
 */

#include "relvault/storage/write_session.hpp"

#include "session_state.hpp"

#include <relvault/integration/logger_adapter.hpp>

#include <exception>
#include <string>

namespace relvault::storage {

using integration::logger_adapter;
using integration::security_event_type;

namespace {

constexpr const char* module_name = "write_session";

auto closed_error() -> error_info {
    return error_info{error_codes::session_closed,
                      "Storage session is closed", module_name};
}

}  // namespace

// =============================================================================
// detail::session_state
// =============================================================================

namespace detail {

session_state::session_state(std::shared_ptr<const storage_context> ctx,
                             security::principal who,
                             std::unique_ptr<release_database> database)
    : context(std::move(ctx)),
      caller(std::move(who)),
      db(std::move(database)),
      keys(db->native_handle()),
      directory(db->native_handle()),
      tokens(db->native_handle()),
      keys_files(context->keys_dir()) {}

session_state::~session_state() { close(); }

auto session_state::usable() const -> VoidResult {
    if (!open) {
        return VoidResult(closed_error());
    }
    if (fault) {
        return relvault_void_error(error_codes::session_aborted,
                                   "Storage session aborted: " + fault->message,
                                   module_name);
    }
    return ok();
}

void session_state::fail(const error_info& cause) {
    if (!fault) {
        fault = cause;
    }
}

void session_state::record_write(std::string operation, std::string target,
                                 security::privilege_level level) {
    writes.push_back(storage_write_record{caller.uid(), std::move(operation),
                                          std::move(target), level, now()});
}

auto session_state::now() const -> std::chrono::system_clock::time_point {
    return context->clock().now();
}

auto session_state::regenerate_keys_file(std::string_view committee,
                                         security::privilege_level level)
    -> outcome<std::filesystem::path> {
    if (auto check = usable(); check.is_err()) {
        return outcome<std::filesystem::path>::failure(check.error());
    }

    auto linked = keys.committee_keys(committee);
    if (linked.is_err()) {
        return outcome<std::filesystem::path>::failure(linked.error());
    }

    const auto content =
        keys::keys_file_writer::render(committee, linked.value(), now());
    auto file = keys_files.stage(committee, content);
    if (file.is_err()) {
        return outcome<std::filesystem::path>::failure(file.error());
    }

    auto it = staged.find(committee);
    if (it != staged.end()) {
        keys::keys_file_writer::discard(it->second);
        it->second = file.value();
    } else {
        staged.emplace(std::string(committee), file.value());
    }

    record_write("keys.write_keys_file", std::string(committee), level);
    logger_adapter::debug("Staged KEYS file for {} ({} keys)",
                          std::string(committee), linked.value().size());
    return outcome<std::filesystem::path>::success(file.value().target);
}

auto session_state::publish_staged() -> VoidResult {
    VoidResult first_error = ok();
    for (const auto& [committee, file] : staged) {
        auto published = keys::keys_file_writer::publish(file);
        if (published.is_err()) {
            logger_adapter::error("Failed to publish KEYS file for {}: {}",
                                  committee, published.error().message);
            keys::keys_file_writer::discard(file);
            if (first_error.is_ok()) {
                first_error = published;
            }
        }
    }
    staged.clear();
    return first_error;
}

void session_state::discard_staged() noexcept {
    for (const auto& [committee, file] : staged) {
        keys::keys_file_writer::discard(file);
    }
    staged.clear();
}

void session_state::close() noexcept {
    if (db && db->in_transaction()) {
        auto rolled_back = db->rollback();
        if (rolled_back.is_err()) {
            logger_adapter::error("Rollback failed: {}",
                                  rolled_back.error().message);
        }
    }
    discard_staged();
    open = false;
}

}  // namespace detail

// =============================================================================
// write_session
// =============================================================================

write_session::write_session(std::shared_ptr<detail::session_state> state)
    : state_(std::move(state)) {}

write_session::~write_session() { rollback(); }

write_session::write_session(write_session&& other) noexcept
    : state_(std::move(other.state_)) {}

auto write_session::operator=(write_session&& other) noexcept
    -> write_session& {
    if (this != &other) {
        rollback();
        state_ = std::move(other.state_);
    }
    return *this;
}

auto write_session::open(std::shared_ptr<const storage_context> context,
                         security::principal caller) -> Result<write_session> {
    if (!context) {
        return relvault_error<write_session>(
            error_codes::unavailable, "No storage context", module_name);
    }

    auto db = release_database::open(context->database());
    if (db.is_err()) {
        return relvault_error<write_session>(
            error_codes::unavailable,
            "Backing store unavailable: " + db.error().message, module_name);
    }

    auto connection = std::move(db.value());
    auto begun = connection->begin();
    if (begun.is_err()) {
        return relvault_error<write_session>(
            error_codes::unavailable,
            "Cannot start transaction: " + begun.error().message, module_name);
    }

    logger_adapter::debug("Opened storage session for {}", caller.uid());
    return write_session(std::make_shared<detail::session_state>(
        std::move(context), std::move(caller), std::move(connection)));
}

auto write_session::caller() const -> const security::principal& {
    return state_->caller;
}

bool write_session::is_open() const noexcept {
    return state_ && state_->open;
}

auto write_session::fault() const -> std::optional<error_info> {
    return state_ ? state_->fault : std::nullopt;
}

// =============================================================================
// Capability grants
// =============================================================================

auto write_session::grant(security::privilege_level requested,
                          std::optional<std::string_view> committee,
                          bool abort_on_denial) -> VoidResult {
    if (!state_) {
        return VoidResult(closed_error());
    }
    if (auto check = state_->usable(); check.is_err()) {
        return check;
    }

    auto held = state_->directory.privilege_for(state_->caller.uid(), committee);
    if (held.is_err()) {
        state_->fail(held.error());
        return VoidResult(held.error());
    }
    if (security::satisfies(held.value(), requested)) {
        return ok();
    }

    std::string message = state_->caller.uid() + " lacks " +
                          std::string(security::to_string(requested));
    if (committee) {
        message += " in " + std::string(*committee);
    }
    error_info cause{error_codes::insufficient_privilege, message, module_name};

    if (abort_on_denial) {
        state_->fail(cause);
        logger_adapter::log_security_event(security_event_type::access_denied,
                                           message, state_->caller.uid());
    }
    return VoidResult(cause);
}

auto write_session::as_general_public() -> Result<general_public> {
    auto granted = grant(security::privilege_level::general_public,
                         std::nullopt, true);
    if (granted.is_err()) {
        return Result<general_public>(granted.error());
    }
    return general_public(state_);
}

auto write_session::as_foundation_committer() -> Result<foundation_committer> {
    auto granted = grant(security::privilege_level::foundation_committer,
                         std::nullopt, true);
    if (granted.is_err()) {
        return Result<foundation_committer>(granted.error());
    }
    return foundation_committer(state_);
}

auto write_session::as_committee_participant(std::string_view committee)
    -> Result<committee_participant> {
    auto granted = grant(security::privilege_level::committee_participant,
                         committee, true);
    if (granted.is_err()) {
        return Result<committee_participant>(granted.error());
    }
    return committee_participant(state_, std::string(committee));
}

auto write_session::as_committee_member(std::string_view committee)
    -> Result<committee_member> {
    auto granted = grant(security::privilege_level::committee_member,
                         committee, true);
    if (granted.is_err()) {
        return Result<committee_member>(granted.error());
    }
    return committee_member(state_, std::string(committee));
}

auto write_session::try_as_committee_member(std::string_view committee)
    -> std::optional<committee_member> {
    auto granted = grant(security::privilege_level::committee_member,
                         committee, false);
    if (granted.is_err()) {
        return std::nullopt;
    }
    return committee_member(state_, std::string(committee));
}

auto write_session::privilege(std::optional<std::string_view> committee) const
    -> Result<security::privilege_level> {
    if (!state_) {
        return Result<security::privilege_level>(closed_error());
    }
    if (auto check = state_->usable(); check.is_err()) {
        return Result<security::privilege_level>(check.error());
    }
    return state_->directory.privilege_for(state_->caller.uid(), committee);
}

// =============================================================================
// Session-level operations
// =============================================================================

auto write_session::regenerate_all_keys_files()
    -> outcomes<std::filesystem::path> {
    outcomes<std::filesystem::path> regenerated;
    if (!state_) {
        return regenerated;
    }

    auto committees = state_->directory.list_committees();
    if (committees.is_err()) {
        regenerated.append_exception("committees", committees.error());
        return regenerated;
    }

    for (const auto& committee : committees.value()) {
        auto member = try_as_committee_member(committee.name);
        if (!member) {
            continue;
        }
        regenerated.append(committee.name, member->autogenerate_keys_file());
    }
    return regenerated;
}

auto write_session::exchange_pat(std::string_view plaintext_pat)
    -> Result<security::session_token> {
    if (!state_) {
        return Result<security::session_token>(closed_error());
    }
    if (auto check = state_->usable(); check.is_err()) {
        return Result<security::session_token>(check.error());
    }

    auto token = state_->context->tokens().issue_jwt(
        state_->tokens, state_->caller, plaintext_pat);
    if (token.is_err()) {
        state_->fail(token.error());
        logger_adapter::log_security_event(
            security_event_type::authentication_failure,
            "PAT exchange rejected: " + token.error().message,
            state_->caller.uid());
        return token;
    }

    logger_adapter::log_security_event(
        security_event_type::authentication_success,
        "Session token issued", state_->caller.uid());
    return token;
}

// =============================================================================
// Completion
// =============================================================================

void write_session::abort(error_info cause) {
    if (state_) {
        state_->fail(cause);
    }
}

auto write_session::commit() -> VoidResult {
    if (!state_ || !state_->open) {
        return VoidResult(closed_error());
    }

    if (state_->fault) {
        auto cause = *state_->fault;
        logger_adapter::info("Rolling back aborted session of {}: {}",
                             state_->caller.uid(), cause.message);
        state_->close();
        return VoidResult(cause);
    }

    auto committed = state_->db->commit();
    if (committed.is_err()) {
        state_->close();
        return committed;
    }

    auto published = state_->publish_staged();
    state_->close();

    const auto& audit = state_->context->write_audit();
    if (audit) {
        for (const auto& record : state_->writes) {
            try {
                audit(record);
            } catch (const std::exception& e) {
                logger_adapter::error("Write audit hook failed for {}: {}",
                                      record.operation, e.what());
            }
        }
    }
    state_->writes.clear();

    logger_adapter::debug("Committed storage session of {}",
                          state_->caller.uid());
    return published;
}

void write_session::rollback() noexcept {
    if (!state_ || !state_->open) {
        return;
    }
    state_->writes.clear();
    state_->close();
}

}  // namespace relvault::storage
