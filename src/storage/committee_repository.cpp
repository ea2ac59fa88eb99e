/**
 * @file committee_repository.cpp
 * @brief Implementation of the committee and principal directory
 */

#include "relvault/storage/committee_repository.hpp"

#include "sqlite_helpers.hpp"

#include <variant>

namespace relvault::storage {

using security::privilege_level;

namespace {

constexpr const char* module_name = "committee_repository";

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

committee_repository::committee_repository(sqlite3* db) : db_(db) {}

committee_repository::~committee_repository() = default;

committee_repository::committee_repository(committee_repository&&) noexcept = default;

auto committee_repository::operator=(committee_repository&&) noexcept
    -> committee_repository& = default;

// =============================================================================
// identity_provider
// =============================================================================

bool committee_repository::is_signed_in(std::string_view asf_uid) const {
    auto found = find_principal(asf_uid);
    return found.is_ok() && found.value().has_value() && found.value()->active;
}

bool committee_repository::is_administrator(std::string_view asf_uid) const {
    auto found = find_principal(asf_uid);
    return found.is_ok() && found.value().has_value() &&
           found.value()->active && found.value()->is_admin;
}

// =============================================================================
// Principals
// =============================================================================

auto committee_repository::find_principal(std::string_view asf_uid) const
    -> Result<std::optional<principal_record>> {
    detail::statement stmt(db_,
                           "SELECT asf_uid, is_committer, is_admin, active "
                           "FROM principals WHERE asf_uid = ?");
    if (!stmt.prepared()) {
        return detail::prepare_error<std::optional<principal_record>>(
            stmt, module_name);
    }
    stmt.bind(1, asf_uid);

    auto rc = stmt.step();
    if (rc == SQLITE_ROW) {
        principal_record record;
        record.asf_uid = detail::get_text_column(stmt.get(), 0);
        record.is_committer = detail::get_int64_column(stmt.get(), 1) != 0;
        record.is_admin = detail::get_int64_column(stmt.get(), 2) != 0;
        record.active = detail::get_int64_column(stmt.get(), 3) != 0;
        return std::optional<principal_record>(std::move(record));
    }
    if (rc != SQLITE_DONE) {
        return detail::step_error<std::optional<principal_record>>(
            stmt, "Failed to find principal", module_name);
    }
    return std::optional<principal_record>{};
}

auto committee_repository::upsert_principal(const principal_record& record)
    -> VoidResult {
    static constexpr const char* sql = R"(
        INSERT INTO principals (asf_uid, is_committer, is_admin, active)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(asf_uid) DO UPDATE SET
            is_committer = excluded.is_committer,
            is_admin = excluded.is_admin,
            active = excluded.active
    )";
    detail::statement stmt(db_, sql);
    if (!stmt.prepared()) {
        return detail::prepare_error<std::monostate>(stmt, module_name);
    }
    stmt.bind(1, record.asf_uid);
    stmt.bind(2, std::int64_t{record.is_committer ? 1 : 0});
    stmt.bind(3, std::int64_t{record.is_admin ? 1 : 0});
    stmt.bind(4, std::int64_t{record.active ? 1 : 0});
    if (stmt.step() != SQLITE_DONE) {
        return detail::step_error<std::monostate>(
            stmt, "Failed to upsert principal", module_name);
    }
    return ok();
}

// =============================================================================
// Committees
// =============================================================================

auto committee_repository::find_committee(std::string_view name) const
    -> Result<std::optional<committee_record>> {
    detail::statement stmt(
        db_, "SELECT name, display_name FROM committees WHERE name = ?");
    if (!stmt.prepared()) {
        return detail::prepare_error<std::optional<committee_record>>(
            stmt, module_name);
    }
    stmt.bind(1, name);

    auto rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return std::optional<committee_record>(
            committee_record{detail::get_text_column(stmt.get(), 0),
                             detail::get_text_column(stmt.get(), 1)});
    }
    if (rc != SQLITE_DONE) {
        return detail::step_error<std::optional<committee_record>>(
            stmt, "Failed to find committee", module_name);
    }
    return std::optional<committee_record>{};
}

auto committee_repository::upsert_committee(const committee_record& record)
    -> VoidResult {
    detail::statement stmt(db_,
                           "INSERT INTO committees (name, display_name) "
                           "VALUES (?, ?) ON CONFLICT(name) DO UPDATE SET "
                           "display_name = excluded.display_name");
    if (!stmt.prepared()) {
        return detail::prepare_error<std::monostate>(stmt, module_name);
    }
    stmt.bind(1, record.name);
    stmt.bind(2, record.display_name);
    if (stmt.step() != SQLITE_DONE) {
        return detail::step_error<std::monostate>(
            stmt, "Failed to upsert committee", module_name);
    }
    return ok();
}

auto committee_repository::list_committees() const
    -> Result<std::vector<committee_record>> {
    detail::statement stmt(
        db_, "SELECT name, display_name FROM committees ORDER BY name");
    if (!stmt.prepared()) {
        return detail::prepare_error<std::vector<committee_record>>(
            stmt, module_name);
    }

    std::vector<committee_record> committees;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        committees.push_back({detail::get_text_column(stmt.get(), 0),
                              detail::get_text_column(stmt.get(), 1)});
    }
    if (rc != SQLITE_DONE) {
        return detail::step_error<std::vector<committee_record>>(
            stmt, "Failed to list committees", module_name);
    }
    return committees;
}

auto committee_repository::add_role(std::string_view committee,
                                    std::string_view asf_uid,
                                    committee_role role) -> VoidResult {
    detail::statement stmt(db_,
                           "INSERT OR IGNORE INTO committee_roles "
                           "(committee_name, asf_uid, role) VALUES (?, ?, ?)");
    if (!stmt.prepared()) {
        return detail::prepare_error<std::monostate>(stmt, module_name);
    }
    stmt.bind(1, committee);
    stmt.bind(2, asf_uid);
    stmt.bind(3, to_string(role));
    if (stmt.step() != SQLITE_DONE) {
        return detail::step_error<std::monostate>(stmt, "Failed to add role",
                                                  module_name);
    }
    return ok();
}

auto committee_repository::remove_role(std::string_view committee,
                                       std::string_view asf_uid,
                                       committee_role role) -> VoidResult {
    detail::statement stmt(db_,
                           "DELETE FROM committee_roles WHERE committee_name = ? "
                           "AND asf_uid = ? AND role = ?");
    if (!stmt.prepared()) {
        return detail::prepare_error<std::monostate>(stmt, module_name);
    }
    stmt.bind(1, committee);
    stmt.bind(2, asf_uid);
    stmt.bind(3, to_string(role));
    if (stmt.step() != SQLITE_DONE) {
        return detail::step_error<std::monostate>(stmt, "Failed to remove role",
                                                  module_name);
    }
    return ok();
}

auto committee_repository::has_role(std::string_view committee,
                                    std::string_view asf_uid,
                                    committee_role role) const -> Result<bool> {
    detail::statement stmt(db_,
                           "SELECT 1 FROM committee_roles WHERE committee_name = ? "
                           "AND asf_uid = ? AND role = ?");
    if (!stmt.prepared()) {
        return detail::prepare_error<bool>(stmt, module_name);
    }
    stmt.bind(1, committee);
    stmt.bind(2, asf_uid);
    stmt.bind(3, to_string(role));
    auto rc = stmt.step();
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return detail::step_error<bool>(stmt, "Failed to query role", module_name);
    }
    return rc == SQLITE_ROW;
}

// =============================================================================
// Privilege derivation
// =============================================================================

auto committee_repository::privilege_for(
    std::string_view asf_uid, std::optional<std::string_view> committee) const
    -> Result<privilege_level> {
    auto found = find_principal(asf_uid);
    if (found.is_err()) {
        return Result<privilege_level>(found.error());
    }
    const auto& record = found.value();
    if (!record || !record->active) {
        return privilege_level::general_public;
    }

    auto base = record->is_committer ? privilege_level::foundation_committer
                                     : privilege_level::general_public;
    if (!committee) {
        return base;
    }

    auto member = has_role(*committee, asf_uid, committee_role::member);
    if (member.is_err()) {
        return Result<privilege_level>(member.error());
    }
    if (member.value()) {
        return privilege_level::committee_member;
    }

    auto committer = has_role(*committee, asf_uid, committee_role::committer);
    if (committer.is_err()) {
        return Result<privilege_level>(committer.error());
    }
    if (committer.value()) {
        return privilege_level::committee_participant;
    }
    return base;
}

}  // namespace relvault::storage
