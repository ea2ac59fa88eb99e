/**
 * @file capabilities.cpp
 * @brief Operations of the privilege-scoped capabilities
 */

#include "relvault/storage/capabilities.hpp"

#include "session_state.hpp"

#include <relvault/integration/logger_adapter.hpp>
#include <relvault/keys/openpgp.hpp>

#include <cctype>
#include <string>

namespace relvault::storage {

using integration::logger_adapter;
using integration::security_event_type;
using keys::key_status;
using keys::public_signing_key;
using security::privilege_level;

namespace {

constexpr const char* module_name = "capabilities";

using path_outcome = outcome<std::filesystem::path>;

auto make_error_info(int code, std::string message) -> error_info {
    return error_info{code, std::move(message), module_name};
}

/**
 * @brief Canonical fingerprint: 40 lowercase hex digits, spaces removed
 */
auto normalize_fingerprint(std::string_view input) -> Result<std::string> {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        if (c == ' ') {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return relvault_error<std::string>(
                error_codes::not_found,
                "Invalid fingerprint: " + std::string(input), module_name);
        }
        out.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }
    if (out.size() != 40) {
        return relvault_error<std::string>(
            error_codes::not_found,
            "Invalid fingerprint: " + std::string(input), module_name);
    }
    return out;
}

/**
 * @brief Store @p parsed for @p owner unless already stored
 *
 * @return The stored record and whether it was inserted
 * @retval key_owner_mismatch if the key is stored under another account
 */
auto store_key(detail::session_state& s, const keys::parsed_key& parsed,
               const std::string& owner)
    -> Result<std::pair<public_signing_key, bool>> {
    using result_type = Result<std::pair<public_signing_key, bool>>;

    auto existing = s.keys.find(parsed.fingerprint);
    if (existing.is_err()) {
        return result_type(existing.error());
    }
    if (existing.value()) {
        if (existing.value()->apache_uid != owner) {
            return result_type(make_error_info(
                error_codes::key_owner_mismatch,
                "Key " + parsed.fingerprint + " is registered to " +
                    existing.value()->apache_uid));
        }
        return std::make_pair(*existing.value(), false);
    }

    auto record = public_signing_key::from_parsed(parsed, owner);
    record.stored_at = s.now();
    auto inserted = s.keys.insert(record);
    if (inserted.is_err()) {
        return result_type(inserted.error());
    }
    return std::make_pair(std::move(record), true);
}

// -----------------------------------------------------------------------------
// Public
// -----------------------------------------------------------------------------

auto find_key_impl(detail::session_state& s, std::string_view fingerprint)
    -> outcome<std::optional<public_signing_key>> {
    using outcome_type = outcome<std::optional<public_signing_key>>;
    if (auto check = s.usable(); check.is_err()) {
        return outcome_type::failure(check.error());
    }
    auto fpr = normalize_fingerprint(fingerprint);
    if (fpr.is_err()) {
        return outcome_type::failure(fpr.error());
    }
    return outcome_type::from_result(s.keys.find(fpr.value()));
}

auto committee_keys_impl(detail::session_state& s, std::string_view committee)
    -> outcome<std::vector<public_signing_key>> {
    using outcome_type = outcome<std::vector<public_signing_key>>;
    if (auto check = s.usable(); check.is_err()) {
        return outcome_type::failure(check.error());
    }
    return outcome_type::from_result(s.keys.committee_keys(committee));
}

// -----------------------------------------------------------------------------
// Foundation committer
// -----------------------------------------------------------------------------

auto ensure_user_key_impl(detail::session_state& s, std::string_view armored,
                          privilege_level level) -> outcome<keys::key_import> {
    using outcome_type = outcome<keys::key_import>;
    if (auto check = s.usable(); check.is_err()) {
        return outcome_type::failure(check.error());
    }

    auto parsed = keys::parse_armored_key(armored);
    if (parsed.is_err()) {
        return outcome_type::failure(parsed.error());
    }

    detail::savepoint sp(*s.db, "relvault_op");
    if (auto started = sp.start(); started.is_err()) {
        return outcome_type::failure(started.error());
    }
    auto stored = store_key(s, parsed.value(), s.caller.uid());
    if (stored.is_err()) {
        return outcome_type::failure(stored.error());
    }
    if (auto released = sp.release(); released.is_err()) {
        return outcome_type::failure(released.error());
    }

    auto& [record, inserted] = stored.value();
    if (inserted) {
        s.record_write("keys.ensure_user_key", record.fingerprint, level);
        logger_adapter::info("Stored key {} for {}", record.fingerprint,
                             s.caller.uid());
    }

    keys::key_import result{std::move(record),
                            inserted ? key_status::inserted : key_status::parsed};

    if (!keys::declares_email(parsed.value(), s.caller.email())) {
        return outcome_type::warning(
            std::move(result),
            make_error_info(error_codes::key_uid_mismatch,
                            "No User ID of the key declares " +
                                s.caller.email()));
    }
    return outcome_type::success(std::move(result));
}

auto delete_key_impl(detail::session_state& s, std::string_view fingerprint,
                     privilege_level level) -> outcome<keys::key_deletion> {
    using outcome_type = outcome<keys::key_deletion>;
    if (auto check = s.usable(); check.is_err()) {
        return outcome_type::failure(check.error());
    }
    auto fpr = normalize_fingerprint(fingerprint);
    if (fpr.is_err()) {
        return outcome_type::failure(fpr.error());
    }

    auto existing = s.keys.find(fpr.value());
    if (existing.is_err()) {
        return outcome_type::failure(existing.error());
    }
    if (!existing.value()) {
        return outcome_type::failure(make_error_info(
            error_codes::not_found, "Key not found: " + fpr.value()));
    }
    if (existing.value()->apache_uid != s.caller.uid()) {
        return outcome_type::failure(make_error_info(
            error_codes::forbidden,
            "Key " + fpr.value() + " belongs to another account"));
    }

    auto committees = s.keys.committees_of(fpr.value());
    if (committees.is_err()) {
        return outcome_type::failure(committees.error());
    }
    auto removed = s.keys.remove(fpr.value());
    if (removed.is_err()) {
        return outcome_type::failure(removed.error());
    }
    s.record_write("keys.delete_key", fpr.value(), level);

    keys::key_deletion deletion{fpr.value(), {}};
    for (const auto& committee : committees.value()) {
        deletion.regenerated.append(committee,
                                    s.regenerate_keys_file(committee, level));
    }
    return outcome_type::success(std::move(deletion));
}

auto own_keys_impl(detail::session_state& s)
    -> outcome<std::vector<public_signing_key>> {
    using outcome_type = outcome<std::vector<public_signing_key>>;
    if (auto check = s.usable(); check.is_err()) {
        return outcome_type::failure(check.error());
    }
    return outcome_type::from_result(s.keys.find_by_owner(s.caller.uid()));
}

auto issue_pat_impl(detail::session_state& s, std::string_view label,
                    privilege_level level) -> Result<security::issued_pat> {
    if (auto check = s.usable(); check.is_err()) {
        return Result<security::issued_pat>(check.error());
    }
    auto issued =
        s.context->tokens().issue_pat(s.tokens, s.directory, s.caller, label);
    if (issued.is_err()) {
        s.fail(issued.error());
        return issued;
    }

    const auto id = std::to_string(issued.value().token.id);
    s.record_write("tokens.issue_pat", id, level);
    logger_adapter::log_security_event(security_event_type::token_issued,
                                       "Personal access token " + id + " issued",
                                       s.caller.uid());
    return issued;
}

auto revoke_pat_impl(detail::session_state& s, std::int64_t pat_id,
                     privilege_level level)
    -> Result<security::personal_access_token> {
    if (auto check = s.usable(); check.is_err()) {
        return Result<security::personal_access_token>(check.error());
    }
    auto revoked =
        s.context->tokens().revoke_pat(s.tokens, s.directory, s.caller, pat_id);
    if (revoked.is_err()) {
        s.fail(revoked.error());
        return revoked;
    }

    const auto id = std::to_string(pat_id);
    s.record_write("tokens.revoke_pat", id, level);
    logger_adapter::log_security_event(security_event_type::token_revoked,
                                       "Personal access token " + id + " revoked",
                                       s.caller.uid());
    return revoked;
}

auto list_pats_impl(detail::session_state& s)
    -> Result<std::vector<security::personal_access_token>> {
    if (auto check = s.usable(); check.is_err()) {
        return Result<std::vector<security::personal_access_token>>(
            check.error());
    }
    return s.context->tokens().list_pats(s.tokens, s.caller);
}

// -----------------------------------------------------------------------------
// Committee participant
// -----------------------------------------------------------------------------

auto associate_impl(detail::session_state& s, const std::string& committee,
                    std::string_view fingerprint, privilege_level level)
    -> outcome<keys::key_association> {
    using outcome_type = outcome<keys::key_association>;
    if (auto check = s.usable(); check.is_err()) {
        return outcome_type::failure(check.error());
    }
    auto fpr = normalize_fingerprint(fingerprint);
    if (fpr.is_err()) {
        return outcome_type::failure(fpr.error());
    }

    auto existing = s.keys.find(fpr.value());
    if (existing.is_err()) {
        return outcome_type::failure(existing.error());
    }
    if (!existing.value()) {
        return outcome_type::failure(make_error_info(
            error_codes::not_found, "Key not found: " + fpr.value()));
    }
    if (existing.value()->apache_uid != s.caller.uid()) {
        return outcome_type::failure(make_error_info(
            error_codes::forbidden,
            "Key " + fpr.value() + " belongs to another account"));
    }

    auto linked = s.keys.link(committee, fpr.value());
    if (linked.is_err()) {
        return outcome_type::failure(linked.error());
    }
    if (linked.value()) {
        s.record_write("keys.associate_fingerprint",
                       committee + ":" + fpr.value(), level);
    }

    return outcome_type::success(keys::key_association{
        fpr.value(), linked.value() ? key_status::linked : key_status::parsed,
        s.regenerate_keys_file(committee, level)});
}

// -----------------------------------------------------------------------------
// Committee member
// -----------------------------------------------------------------------------

/**
 * @brief Account that owns an imported key
 *
 * The foundation uid declared by the key when that account is known,
 * otherwise the importing member.
 */
auto import_owner(detail::session_state& s, const keys::parsed_key& parsed)
    -> std::string {
    auto declared = keys::find_apache_uid(parsed);
    if (declared) {
        auto known = s.directory.find_principal(*declared);
        if (known.is_ok() && known.value()) {
            return *declared;
        }
    }
    return s.caller.uid();
}

auto import_one(detail::session_state& s, const std::string& committee,
                const keys::parsed_key& parsed, privilege_level level)
    -> outcome<keys::key_import> {
    using outcome_type = outcome<keys::key_import>;

    detail::savepoint sp(*s.db, "relvault_item");
    if (auto started = sp.start(); started.is_err()) {
        return outcome_type::failure(started.error());
    }

    auto existing = s.keys.find(parsed.fingerprint);
    if (existing.is_err()) {
        return outcome_type::failure(existing.error());
    }

    public_signing_key record;
    bool inserted = false;
    if (existing.value()) {
        record = *existing.value();
    } else {
        record = public_signing_key::from_parsed(parsed, import_owner(s, parsed));
        record.stored_at = s.now();
        auto stored = s.keys.insert(record);
        if (stored.is_err()) {
            return outcome_type::failure(stored.error());
        }
        inserted = true;
    }

    auto linked = s.keys.link(committee, parsed.fingerprint);
    if (linked.is_err()) {
        return outcome_type::failure(linked.error());
    }
    if (auto released = sp.release(); released.is_err()) {
        return outcome_type::failure(released.error());
    }

    if (inserted) {
        s.record_write("keys.ensure_stored", parsed.fingerprint, level);
    }
    if (linked.value()) {
        s.record_write("keys.associate_fingerprint",
                       committee + ":" + parsed.fingerprint, level);
    }

    key_status status = key_status::parsed;
    if (inserted) {
        status = key_status::inserted_and_linked;
    } else if (linked.value()) {
        status = key_status::linked;
    }
    return outcome_type::success(keys::key_import{std::move(record), status});
}

auto ensure_stored_impl(detail::session_state& s, const std::string& committee,
                        std::string_view keys_text, privilege_level level)
    -> keys::key_import_batch {
    if (auto check = s.usable(); check.is_err()) {
        return keys::key_import_batch{{}, path_outcome::failure(check.error())};
    }

    outcomes<keys::key_import> imported;
    const auto blocks = keys::split_key_blocks(keys_text);
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        auto parsed = keys::parse_armored_key(blocks[i]);
        if (parsed.is_err()) {
            imported.append_exception("block-" + std::to_string(i + 1),
                                      parsed.error());
            continue;
        }
        imported.append(parsed.value().fingerprint,
                        import_one(s, committee, parsed.value(), level));
    }

    logger_adapter::info("Imported keys into {}: {} stored, {} failed",
                         committee, imported.result_count(),
                         imported.exception_count());

    return keys::key_import_batch{std::move(imported),
                                  s.regenerate_keys_file(committee, level)};
}

auto remove_association_impl(detail::session_state& s,
                             const std::string& committee,
                             std::string_view fingerprint,
                             privilege_level level) -> path_outcome {
    if (auto check = s.usable(); check.is_err()) {
        return path_outcome::failure(check.error());
    }
    auto fpr = normalize_fingerprint(fingerprint);
    if (fpr.is_err()) {
        return path_outcome::failure(fpr.error());
    }

    auto unlinked = s.keys.unlink(committee, fpr.value());
    if (unlinked.is_err()) {
        return path_outcome::failure(unlinked.error());
    }
    if (!unlinked.value()) {
        return path_outcome::failure(make_error_info(
            error_codes::not_found,
            "Key " + fpr.value() + " is not associated with " + committee));
    }
    s.record_write("keys.remove_association", committee + ":" + fpr.value(),
                   level);

    auto regenerated = s.regenerate_keys_file(committee, level);
    if (regenerated.failed()) {
        return path_outcome::warning(s.keys_files.path_for(committee),
                                     *regenerated.cause());
    }
    return regenerated;
}

auto delete_committee_keys_impl(detail::session_state& s,
                                const std::string& committee,
                                privilege_level level)
    -> outcome<keys::committee_keys_removal> {
    using outcome_type = outcome<keys::committee_keys_removal>;
    if (auto check = s.usable(); check.is_err()) {
        return outcome_type::failure(check.error());
    }

    auto unlinked = s.keys.unlink_all(committee);
    if (unlinked.is_err()) {
        return outcome_type::failure(unlinked.error());
    }
    keys::committee_keys_removal removal;
    removal.links_removed = unlinked.value().size();
    if (removal.links_removed > 0) {
        s.record_write("keys.delete_committee_keys", committee, level);
    }

    auto deleted = s.keys.delete_orphans(unlinked.value());
    if (deleted.is_err()) {
        return outcome_type::failure_after(deleted.error(), removal);
    }
    removal.keys_deleted = deleted.value();

    auto regenerated = s.regenerate_keys_file(committee, level);
    if (regenerated.failed()) {
        return outcome_type::warning(removal, *regenerated.cause());
    }
    return outcome_type::success(removal);
}

}  // namespace

// =============================================================================
// public_operations
// =============================================================================

template <typename Derived>
auto public_operations<Derived>::caller() const -> const security::principal& {
    return session().caller;
}

template <typename Derived>
auto public_operations<Derived>::find_key(std::string_view fingerprint) const
    -> outcome<std::optional<public_signing_key>> {
    return find_key_impl(session(), fingerprint);
}

template <typename Derived>
auto public_operations<Derived>::committee_keys(std::string_view committee) const
    -> outcome<std::vector<public_signing_key>> {
    return committee_keys_impl(session(), committee);
}

template <typename Derived>
auto public_operations<Derived>::keys_file_path(std::string_view committee) const
    -> std::filesystem::path {
    return session().keys_files.path_for(committee);
}

// =============================================================================
// committer_operations
// =============================================================================

template <typename Derived>
auto committer_operations<Derived>::ensure_user_key(std::string_view armored_key)
    -> outcome<keys::key_import> {
    return ensure_user_key_impl(session(), armored_key, Derived::level);
}

template <typename Derived>
auto committer_operations<Derived>::delete_key(std::string_view fingerprint)
    -> outcome<keys::key_deletion> {
    return delete_key_impl(session(), fingerprint, Derived::level);
}

template <typename Derived>
auto committer_operations<Derived>::own_keys() const
    -> outcome<std::vector<public_signing_key>> {
    return own_keys_impl(session());
}

template <typename Derived>
auto committer_operations<Derived>::issue_pat(std::string_view label)
    -> Result<security::issued_pat> {
    return issue_pat_impl(session(), label, Derived::level);
}

template <typename Derived>
auto committer_operations<Derived>::revoke_pat(std::int64_t pat_id)
    -> Result<security::personal_access_token> {
    return revoke_pat_impl(session(), pat_id, Derived::level);
}

template <typename Derived>
auto committer_operations<Derived>::list_pats() const
    -> Result<std::vector<security::personal_access_token>> {
    return list_pats_impl(session());
}

// =============================================================================
// participant_operations
// =============================================================================

template <typename Derived>
auto participant_operations<Derived>::associate_fingerprint(
    std::string_view fingerprint) -> outcome<keys::key_association> {
    return associate_impl(session(), committee(), fingerprint, Derived::level);
}

// =============================================================================
// member_operations
// =============================================================================

template <typename Derived>
auto member_operations<Derived>::ensure_stored(std::string_view keys_text)
    -> keys::key_import_batch {
    return ensure_stored_impl(session(), committee_name(), keys_text,
                              Derived::level);
}

template <typename Derived>
auto member_operations<Derived>::autogenerate_keys_file()
    -> outcome<std::filesystem::path> {
    auto& s = session();
    if (auto check = s.usable(); check.is_err()) {
        return path_outcome::failure(check.error());
    }
    return s.regenerate_keys_file(committee_name(), Derived::level);
}

template <typename Derived>
auto member_operations<Derived>::remove_association(std::string_view fingerprint)
    -> outcome<std::filesystem::path> {
    return remove_association_impl(session(), committee_name(), fingerprint,
                                   Derived::level);
}

template <typename Derived>
auto member_operations<Derived>::delete_committee_keys()
    -> outcome<keys::committee_keys_removal> {
    return delete_committee_keys_impl(session(), committee_name(),
                                      Derived::level);
}

// =============================================================================
// Explicit instantiations
// =============================================================================

template class public_operations<general_public>;
template class public_operations<foundation_committer>;
template class public_operations<committee_participant>;
template class public_operations<committee_member>;

template class committer_operations<foundation_committer>;
template class committer_operations<committee_participant>;
template class committer_operations<committee_member>;

template class participant_operations<committee_participant>;
template class participant_operations<committee_member>;

template class member_operations<committee_member>;

}  // namespace relvault::storage
