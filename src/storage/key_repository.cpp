/**
 * @file key_repository.cpp
 * @brief Implementation of the public signing key repository
 */

#include "relvault/storage/key_repository.hpp"

#include "sqlite_helpers.hpp"

#include <algorithm>
#include <variant>

namespace relvault::storage {

using keys::public_signing_key;

namespace {

constexpr const char* module_name = "key_repository";

constexpr const char* key_columns = R"(
    fingerprint, algorithm, length, created, primary_declared_uid,
    secondary_declared_uids, apache_uid, ascii_armored_key, stored_at
)";

auto join_lines(const std::vector<std::string>& values) -> std::string {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) {
            out.push_back('\n');
        }
        out.append(v);
    }
    return out;
}

auto split_lines(const std::string& joined) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start < joined.size()) {
        auto end = joined.find('\n', start);
        if (end == std::string::npos) {
            end = joined.size();
        }
        out.push_back(joined.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

auto parse_row(sqlite3_stmt* stmt) -> public_signing_key {
    public_signing_key key;
    int col = 0;
    key.fingerprint = detail::get_text_column(stmt, col++);
    key.algorithm = static_cast<int>(detail::get_int64_column(stmt, col++));
    key.length = static_cast<int>(detail::get_int64_column(stmt, col++));
    key.created = detail::from_timestamp_string(detail::get_text_column(stmt, col++));
    if (sqlite3_column_type(stmt, col) != SQLITE_NULL) {
        key.primary_declared_uid = detail::get_text_column(stmt, col);
    }
    ++col;
    key.secondary_declared_uids = split_lines(detail::get_text_column(stmt, col++));
    key.apache_uid = detail::get_text_column(stmt, col++);
    key.ascii_armored_key = detail::get_text_column(stmt, col++);
    key.stored_at = detail::from_timestamp_string(detail::get_text_column(stmt, col++));
    return key;
}

auto collect_keys(detail::statement& stmt)
    -> Result<std::vector<public_signing_key>> {
    std::vector<public_signing_key> keys;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        keys.push_back(parse_row(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        return detail::step_error<std::vector<public_signing_key>>(
            stmt, "Failed to read keys", module_name);
    }
    return keys;
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

key_repository::key_repository(sqlite3* db) : db_(db) {}

key_repository::~key_repository() = default;

key_repository::key_repository(key_repository&&) noexcept = default;

auto key_repository::operator=(key_repository&&) noexcept -> key_repository& = default;

// =============================================================================
// Keys
// =============================================================================

auto key_repository::find(std::string_view fingerprint) const
    -> Result<std::optional<public_signing_key>> {
    auto sql = std::string("SELECT ") + key_columns +
               " FROM public_signing_keys WHERE fingerprint = ?";
    detail::statement stmt(db_, sql.c_str());
    if (!stmt.prepared()) {
        return detail::prepare_error<std::optional<public_signing_key>>(
            stmt, module_name);
    }
    stmt.bind(1, fingerprint);

    auto rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return std::optional<public_signing_key>(parse_row(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        return detail::step_error<std::optional<public_signing_key>>(
            stmt, "Failed to find key", module_name);
    }
    return std::optional<public_signing_key>{};
}

auto key_repository::insert(const public_signing_key& key) -> VoidResult {
    static constexpr const char* sql = R"(
        INSERT INTO public_signing_keys (
            fingerprint, algorithm, length, created, primary_declared_uid,
            secondary_declared_uids, apache_uid, ascii_armored_key, stored_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    detail::statement stmt(db_, sql);
    if (!stmt.prepared()) {
        return detail::prepare_error<std::monostate>(stmt, module_name);
    }

    int idx = 1;
    stmt.bind(idx++, key.fingerprint);
    stmt.bind(idx++, static_cast<std::int64_t>(key.algorithm));
    stmt.bind(idx++, static_cast<std::int64_t>(key.length));
    stmt.bind(idx++, detail::to_timestamp_string(key.created));
    if (key.primary_declared_uid) {
        stmt.bind(idx++, *key.primary_declared_uid);
    } else {
        stmt.bind_null(idx++);
    }
    stmt.bind(idx++, join_lines(key.secondary_declared_uids));
    stmt.bind(idx++, key.apache_uid);
    stmt.bind(idx++, key.ascii_armored_key);
    stmt.bind(idx++, detail::to_timestamp_string(key.stored_at));

    auto rc = stmt.step();
    if (rc == SQLITE_CONSTRAINT) {
        return relvault_void_error(
            error_codes::duplicate_fingerprint,
            "Key already stored: " + key.fingerprint, module_name);
    }
    if (rc != SQLITE_DONE) {
        return detail::step_error<std::monostate>(stmt, "Failed to insert key",
                                                  module_name);
    }
    return ok();
}

auto key_repository::remove(std::string_view fingerprint) -> Result<bool> {
    detail::statement stmt(
        db_, "DELETE FROM public_signing_keys WHERE fingerprint = ?");
    if (!stmt.prepared()) {
        return detail::prepare_error<bool>(stmt, module_name);
    }
    stmt.bind(1, fingerprint);
    if (stmt.step() != SQLITE_DONE) {
        return detail::step_error<bool>(stmt, "Failed to delete key", module_name);
    }
    return sqlite3_changes(db_) > 0;
}

auto key_repository::find_by_owner(std::string_view asf_uid) const
    -> Result<std::vector<public_signing_key>> {
    auto sql = std::string("SELECT ") + key_columns +
               " FROM public_signing_keys WHERE apache_uid = ?"
               " ORDER BY fingerprint";
    detail::statement stmt(db_, sql.c_str());
    if (!stmt.prepared()) {
        return detail::prepare_error<std::vector<public_signing_key>>(
            stmt, module_name);
    }
    stmt.bind(1, asf_uid);
    return collect_keys(stmt);
}

// =============================================================================
// Committee links
// =============================================================================

auto key_repository::committee_keys(std::string_view committee) const
    -> Result<std::vector<public_signing_key>> {
    static constexpr const char* sql = R"(
        SELECT k.fingerprint, k.algorithm, k.length, k.created,
               k.primary_declared_uid, k.secondary_declared_uids,
               k.apache_uid, k.ascii_armored_key, k.stored_at
        FROM public_signing_keys k
        JOIN key_links l ON l.fingerprint = k.fingerprint
        WHERE l.committee_name = ?
        ORDER BY k.fingerprint
    )";
    detail::statement stmt(db_, sql);
    if (!stmt.prepared()) {
        return detail::prepare_error<std::vector<public_signing_key>>(
            stmt, module_name);
    }
    stmt.bind(1, committee);
    return collect_keys(stmt);
}

auto key_repository::link(std::string_view committee,
                          std::string_view fingerprint) -> Result<bool> {
    detail::statement stmt(db_,
                           "INSERT OR IGNORE INTO key_links "
                           "(committee_name, fingerprint) VALUES (?, ?)");
    if (!stmt.prepared()) {
        return detail::prepare_error<bool>(stmt, module_name);
    }
    stmt.bind(1, committee);
    stmt.bind(2, fingerprint);
    if (stmt.step() != SQLITE_DONE) {
        return detail::step_error<bool>(stmt, "Failed to link key", module_name);
    }
    return sqlite3_changes(db_) > 0;
}

auto key_repository::unlink(std::string_view committee,
                            std::string_view fingerprint) -> Result<bool> {
    detail::statement stmt(
        db_,
        "DELETE FROM key_links WHERE committee_name = ? AND fingerprint = ?");
    if (!stmt.prepared()) {
        return detail::prepare_error<bool>(stmt, module_name);
    }
    stmt.bind(1, committee);
    stmt.bind(2, fingerprint);
    if (stmt.step() != SQLITE_DONE) {
        return detail::step_error<bool>(stmt, "Failed to unlink key", module_name);
    }
    return sqlite3_changes(db_) > 0;
}

auto key_repository::is_linked(std::string_view committee,
                               std::string_view fingerprint) const
    -> Result<bool> {
    detail::statement stmt(
        db_,
        "SELECT 1 FROM key_links WHERE committee_name = ? AND fingerprint = ?");
    if (!stmt.prepared()) {
        return detail::prepare_error<bool>(stmt, module_name);
    }
    stmt.bind(1, committee);
    stmt.bind(2, fingerprint);
    auto rc = stmt.step();
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return detail::step_error<bool>(stmt, "Failed to query link", module_name);
    }
    return rc == SQLITE_ROW;
}

auto key_repository::committees_of(std::string_view fingerprint) const
    -> Result<std::vector<std::string>> {
    detail::statement stmt(db_,
                           "SELECT committee_name FROM key_links "
                           "WHERE fingerprint = ? ORDER BY committee_name");
    if (!stmt.prepared()) {
        return detail::prepare_error<std::vector<std::string>>(stmt, module_name);
    }
    stmt.bind(1, fingerprint);

    std::vector<std::string> names;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        names.push_back(detail::get_text_column(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        return detail::step_error<std::vector<std::string>>(
            stmt, "Failed to read links", module_name);
    }
    return names;
}

auto key_repository::unlink_all(std::string_view committee)
    -> Result<std::vector<std::string>> {
    detail::statement stmt(db_,
                           "DELETE FROM key_links WHERE committee_name = ? "
                           "RETURNING fingerprint");
    if (!stmt.prepared()) {
        return detail::prepare_error<std::vector<std::string>>(stmt, module_name);
    }
    stmt.bind(1, committee);

    std::vector<std::string> removed;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        removed.push_back(detail::get_text_column(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        return detail::step_error<std::vector<std::string>>(
            stmt, "Failed to remove links", module_name);
    }
    std::sort(removed.begin(), removed.end());
    return removed;
}

auto key_repository::delete_orphans(const std::vector<std::string>& fingerprints)
    -> Result<std::size_t> {
    static constexpr const char* sql = R"(
        DELETE FROM public_signing_keys
        WHERE fingerprint = ?
          AND NOT EXISTS (SELECT 1 FROM key_links WHERE fingerprint = ?)
    )";

    std::size_t deleted = 0;
    for (const auto& fingerprint : fingerprints) {
        detail::statement stmt(db_, sql);
        if (!stmt.prepared()) {
            return detail::prepare_error<std::size_t>(stmt, module_name);
        }
        stmt.bind(1, fingerprint);
        stmt.bind(2, fingerprint);
        if (stmt.step() != SQLITE_DONE) {
            return detail::step_error<std::size_t>(
                stmt, "Failed to delete key", module_name);
        }
        deleted += static_cast<std::size_t>(sqlite3_changes(db_));
    }
    return deleted;
}

}  // namespace relvault::storage
