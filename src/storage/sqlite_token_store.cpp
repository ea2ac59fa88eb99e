/**
 * @file sqlite_token_store.cpp
 * @brief Implementation of the SQLite personal access token store
 */

#include "relvault/storage/sqlite_token_store.hpp"

#include "sqlite_helpers.hpp"

#include <variant>

namespace relvault::storage {

using security::personal_access_token;

namespace {

constexpr const char* module_name = "sqlite_token_store";

constexpr const char* select_sql =
    "SELECT id, asf_uid, token_hash, label, created, expires, revoked "
    "FROM personal_access_tokens ";

auto parse_row(sqlite3_stmt* stmt) -> personal_access_token {
    personal_access_token token;
    int col = 0;
    token.id = detail::get_int64_column(stmt, col++);
    token.asf_uid = detail::get_text_column(stmt, col++);
    token.token_hash = detail::get_text_column(stmt, col++);
    token.label = detail::get_text_column(stmt, col++);
    token.created = detail::from_timestamp_string(detail::get_text_column(stmt, col++));
    token.expires = detail::from_timestamp_string(detail::get_text_column(stmt, col++));
    token.revoked = detail::get_int64_column(stmt, col++) != 0;
    return token;
}

auto find_one(detail::statement& stmt)
    -> Result<std::optional<personal_access_token>> {
    auto rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return std::optional<personal_access_token>(parse_row(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        return detail::step_error<std::optional<personal_access_token>>(
            stmt, "Failed to find token", module_name);
    }
    return std::optional<personal_access_token>{};
}

}  // namespace

sqlite_token_store::sqlite_token_store(sqlite3* db) : db_(db) {}

sqlite_token_store::~sqlite_token_store() = default;

auto sqlite_token_store::insert(const personal_access_token& token)
    -> Result<personal_access_token> {
    static constexpr const char* sql = R"(
        INSERT INTO personal_access_tokens
            (asf_uid, token_hash, label, created, expires, revoked)
        VALUES (?, ?, ?, ?, ?, ?)
        RETURNING id
    )";
    detail::statement stmt(db_, sql);
    if (!stmt.prepared()) {
        return detail::prepare_error<personal_access_token>(stmt, module_name);
    }

    int idx = 1;
    stmt.bind(idx++, token.asf_uid);
    stmt.bind(idx++, token.token_hash);
    stmt.bind(idx++, token.label);
    stmt.bind(idx++, detail::to_timestamp_string(token.created));
    stmt.bind(idx++, detail::to_timestamp_string(token.expires));
    stmt.bind(idx++, std::int64_t{token.revoked ? 1 : 0});

    if (stmt.step() != SQLITE_ROW) {
        return detail::step_error<personal_access_token>(
            stmt, "Failed to insert token", module_name);
    }

    auto stored = token;
    stored.id = sqlite3_column_int64(stmt.get(), 0);
    return stored;
}

auto sqlite_token_store::find_by_hash(std::string_view token_hash)
    -> Result<std::optional<personal_access_token>> {
    auto sql = std::string(select_sql) + "WHERE token_hash = ?";
    detail::statement stmt(db_, sql.c_str());
    if (!stmt.prepared()) {
        return detail::prepare_error<std::optional<personal_access_token>>(
            stmt, module_name);
    }
    stmt.bind(1, token_hash);
    return find_one(stmt);
}

auto sqlite_token_store::find_by_id(std::int64_t id)
    -> Result<std::optional<personal_access_token>> {
    auto sql = std::string(select_sql) + "WHERE id = ?";
    detail::statement stmt(db_, sql.c_str());
    if (!stmt.prepared()) {
        return detail::prepare_error<std::optional<personal_access_token>>(
            stmt, module_name);
    }
    stmt.bind(1, id);
    return find_one(stmt);
}

auto sqlite_token_store::list_for(std::string_view asf_uid)
    -> Result<std::vector<personal_access_token>> {
    auto sql = std::string(select_sql) + "WHERE asf_uid = ? ORDER BY id";
    detail::statement stmt(db_, sql.c_str());
    if (!stmt.prepared()) {
        return detail::prepare_error<std::vector<personal_access_token>>(
            stmt, module_name);
    }
    stmt.bind(1, asf_uid);

    std::vector<personal_access_token> tokens;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        tokens.push_back(parse_row(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        return detail::step_error<std::vector<personal_access_token>>(
            stmt, "Failed to list tokens", module_name);
    }
    return tokens;
}

auto sqlite_token_store::mark_revoked(std::int64_t id) -> VoidResult {
    detail::statement stmt(
        db_, "UPDATE personal_access_tokens SET revoked = 1 WHERE id = ?");
    if (!stmt.prepared()) {
        return detail::prepare_error<std::monostate>(stmt, module_name);
    }
    stmt.bind(1, id);
    if (stmt.step() != SQLITE_DONE) {
        return detail::step_error<std::monostate>(stmt, "Failed to revoke token",
                                                  module_name);
    }
    if (sqlite3_changes(db_) == 0) {
        return relvault_void_error(error_codes::not_found,
                                   "Personal access token not found",
                                   module_name);
    }
    return ok();
}

}  // namespace relvault::storage
