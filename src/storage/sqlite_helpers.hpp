/**
 * @file sqlite_helpers.hpp
 * @brief Statement wrapper and column helpers shared by the repositories
 */

#pragma once

#include <relvault/core/result.hpp>

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <string_view>

namespace relvault::storage::detail {

/**
 * @brief RAII wrapper for a prepared statement
 */
class statement {
public:
    statement(sqlite3* db, const char* sql) : db_(db) {
        if (db_ == nullptr ||
            sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
        }
    }

    ~statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    [[nodiscard]] bool prepared() const noexcept { return stmt_ != nullptr; }
    [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

    void bind(int idx, std::string_view value) {
        sqlite3_bind_text(stmt_, idx, value.data(),
                          static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }
    void bind(int idx, std::int64_t value) {
        sqlite3_bind_int64(stmt_, idx, value);
    }
    void bind_null(int idx) { sqlite3_bind_null(stmt_, idx); }

    [[nodiscard]] int step() { return sqlite3_step(stmt_); }

    [[nodiscard]] auto error_message() const -> std::string {
        return db_ ? sqlite3_errmsg(db_) : "Database not initialized";
    }

private:
    sqlite3* db_{nullptr};
    sqlite3_stmt* stmt_{nullptr};
};

/// Convert time_point to "YYYY-MM-DD HH:MM:SS" (UTC)
[[nodiscard]] inline std::string to_timestamp_string(
    std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

/// Parse "YYYY-MM-DD HH:MM:SS" (UTC) to time_point
[[nodiscard]] inline std::chrono::system_clock::time_point from_timestamp_string(
    const std::string& str) {
    if (str.empty()) {
        return {};
    }
    std::tm tm{};
    if (std::sscanf(str.c_str(), "%d-%d-%d %d:%d:%d", &tm.tm_year, &tm.tm_mon,
                    &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        return {};
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
#ifdef _WIN32
    auto time = _mkgmtime(&tm);
#else
    auto time = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(time);
}

/// Get text column safely (returns empty string if NULL)
[[nodiscard]] inline std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

/// Get int64 column with default
[[nodiscard]] inline std::int64_t get_int64_column(sqlite3_stmt* stmt, int col,
                                                   std::int64_t default_val = 0) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return default_val;
    }
    return sqlite3_column_int64(stmt, col);
}

template <typename T>
[[nodiscard]] auto prepare_error(const statement& stmt, const char* module)
    -> Result<T> {
    return relvault_error<T>(
        error_codes::database_error,
        "Failed to prepare statement: " + stmt.error_message(), module);
}

template <typename T>
[[nodiscard]] auto step_error(const statement& stmt, std::string_view what,
                              const char* module) -> Result<T> {
    return relvault_error<T>(error_codes::database_error,
                             std::string(what) + ": " + stmt.error_message(),
                             module);
}

}  // namespace relvault::storage::detail
