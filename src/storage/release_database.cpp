/**
 * @file release_database.cpp
 * @brief Implementation of the release database connection
 */

#include "relvault/storage/release_database.hpp"

#include <relvault/compat/format.hpp>

#include <sqlite3.h>

namespace relvault::storage {

namespace {

constexpr const char* module_name = "release_database";

constexpr const char* schema_sql = R"(
    CREATE TABLE IF NOT EXISTS principals (
        asf_uid      TEXT PRIMARY KEY,
        is_committer INTEGER NOT NULL DEFAULT 1,
        is_admin     INTEGER NOT NULL DEFAULT 0,
        active       INTEGER NOT NULL DEFAULT 1
    );

    CREATE TABLE IF NOT EXISTS committees (
        name         TEXT PRIMARY KEY,
        display_name TEXT NOT NULL DEFAULT ''
    );

    CREATE TABLE IF NOT EXISTS committee_roles (
        committee_name TEXT NOT NULL
            REFERENCES committees(name) ON DELETE CASCADE,
        asf_uid        TEXT NOT NULL,
        role           TEXT NOT NULL CHECK (role IN ('member', 'committer')),
        PRIMARY KEY (committee_name, asf_uid, role)
    );

    CREATE TABLE IF NOT EXISTS public_signing_keys (
        fingerprint              TEXT PRIMARY KEY,
        algorithm                INTEGER NOT NULL,
        length                   INTEGER NOT NULL,
        created                  TEXT NOT NULL,
        primary_declared_uid     TEXT,
        secondary_declared_uids  TEXT NOT NULL DEFAULT '',
        apache_uid               TEXT NOT NULL,
        ascii_armored_key        TEXT NOT NULL,
        stored_at                TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
    );

    CREATE INDEX IF NOT EXISTS idx_public_signing_keys_owner
        ON public_signing_keys(apache_uid);

    CREATE TABLE IF NOT EXISTS key_links (
        committee_name TEXT NOT NULL
            REFERENCES committees(name) ON DELETE CASCADE,
        fingerprint    TEXT NOT NULL
            REFERENCES public_signing_keys(fingerprint) ON DELETE CASCADE,
        PRIMARY KEY (committee_name, fingerprint)
    );

    CREATE TABLE IF NOT EXISTS personal_access_tokens (
        id         INTEGER PRIMARY KEY AUTOINCREMENT,
        asf_uid    TEXT NOT NULL,
        token_hash TEXT NOT NULL UNIQUE,
        label      TEXT NOT NULL DEFAULT '',
        created    TEXT NOT NULL,
        expires    TEXT NOT NULL,
        revoked    INTEGER NOT NULL DEFAULT 0
    );

    CREATE INDEX IF NOT EXISTS idx_personal_access_tokens_owner
        ON personal_access_tokens(asf_uid);
)";

}  // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

auto release_database::open(const database_config& config)
    -> Result<std::unique_ptr<release_database>> {
    return connect(config, true);
}

auto release_database::open_existing(const database_config& config)
    -> Result<std::unique_ptr<release_database>> {
    return connect(config, false);
}

auto release_database::probe(const database_config& config) -> VoidResult {
    auto db = open_existing(config);
    if (db.is_err()) {
        return relvault_void_error(error_codes::unavailable, db.error().message,
                                   module_name);
    }
    // sqlite3_open_v2 is lazy; the first read detects a file that is not a database
    auto read = db.value()->execute("SELECT count(*) FROM sqlite_master;");
    if (read.is_err()) {
        return relvault_void_error(
            error_codes::unavailable,
            compat::format("Database {} is not readable: {}",
                           config.path.string(), read.error().message),
            module_name);
    }
    return ok();
}

auto release_database::connect(const database_config& config, bool create)
    -> Result<std::unique_ptr<release_database>> {
    sqlite3* db = nullptr;
    auto path = config.path.string();

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX;
    if (create) {
        flags |= SQLITE_OPEN_CREATE;
    }
    auto rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return relvault_error<std::unique_ptr<release_database>>(
            error_codes::unavailable,
            compat::format("Failed to open database {}: {}", path, error_msg),
            module_name);
    }

    sqlite3_busy_timeout(db, static_cast<int>(config.busy_timeout.count()));

    // Enable foreign keys
    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr,
                      nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return relvault_error<std::unique_ptr<release_database>>(
            error_codes::database_error, "Failed to enable foreign keys",
            module_name);
    }

    // Configure WAL mode for better concurrency (except for in-memory DB).
    // The journal mode is persistent, so connections to an existing store
    // inherit it.
    if (create && config.wal_mode && path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            std::string error_msg = sqlite3_errmsg(db);
            sqlite3_close(db);
            return relvault_error<std::unique_ptr<release_database>>(
                error_codes::unavailable,
                compat::format("Failed to enable WAL mode: {}", error_msg),
                module_name);
        }
    }

    auto instance = std::unique_ptr<release_database>(
        new release_database(db, std::move(path)));

    if (!create) {
        return instance;
    }

    auto schema = instance->create_schema();
    if (schema.is_err()) {
        return Result<std::unique_ptr<release_database>>(schema.error());
    }
    return instance;
}

release_database::release_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

release_database::~release_database() {
    if (db_) {
        if (in_transaction_) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

release_database::release_database(release_database&& other) noexcept
    : db_(other.db_),
      path_(std::move(other.path_)),
      in_transaction_(other.in_transaction_) {
    other.db_ = nullptr;
    other.in_transaction_ = false;
}

auto release_database::operator=(release_database&& other) noexcept
    -> release_database& {
    if (this != &other) {
        if (db_) {
            if (in_transaction_) {
                sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            }
            sqlite3_close(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        in_transaction_ = other.in_transaction_;
        other.db_ = nullptr;
        other.in_transaction_ = false;
    }
    return *this;
}

auto release_database::create_schema() -> VoidResult {
    auto result = execute(schema_sql);
    if (result.is_err()) {
        return relvault_void_error(
            error_codes::database_error,
            compat::format("Failed to create schema: {}", result.error().message),
            module_name);
    }
    return ok();
}

// ============================================================================
// Transactions
// ============================================================================

auto release_database::begin(transaction_mode mode) -> VoidResult {
    if (in_transaction_) {
        return relvault_void_error(error_codes::database_error,
                                   "Transaction already open", module_name);
    }
    auto result = execute(mode == transaction_mode::immediate
                              ? "BEGIN IMMEDIATE;"
                              : "BEGIN DEFERRED;");
    if (result.is_err()) {
        return relvault_void_error(
            error_codes::unavailable,
            compat::format("Failed to begin transaction: {}",
                           result.error().message),
            module_name);
    }
    in_transaction_ = true;
    return ok();
}

auto release_database::commit() -> VoidResult {
    if (!in_transaction_) {
        return relvault_void_error(error_codes::database_error,
                                   "No open transaction", module_name);
    }
    auto result = execute("COMMIT;");
    if (result.is_err()) {
        // A failed COMMIT leaves the transaction open; undo it
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        in_transaction_ = false;
        return result;
    }
    in_transaction_ = false;
    return ok();
}

auto release_database::rollback() -> VoidResult {
    if (!in_transaction_) {
        return ok();
    }
    in_transaction_ = false;
    return execute("ROLLBACK;");
}

auto release_database::execute(std::string_view sql) -> VoidResult {
    if (!db_) {
        return relvault_void_error(error_codes::unavailable,
                                   "Database not open", module_name);
    }
    std::string statement(sql);
    char* err_msg = nullptr;
    if (sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &err_msg) !=
        SQLITE_OK) {
        std::string error = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        return relvault_void_error(error_codes::database_error, error,
                                   module_name);
    }
    return ok();
}

}  // namespace relvault::storage
