/**
 * @file release_database.hpp
 * @brief SQLite connection holding the release-management state
 *
 * Each storage session owns one release_database, so every unit of work has
 * its own connection and its own transaction. Isolation between concurrent
 * sessions is left to SQLite (WAL mode, BEGIN IMMEDIATE for writers and
 * BEGIN DEFERRED for readers, which never wait on a writer).
 */

#pragma once

#include <relvault/core/result.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// Forward declaration of SQLite handle
struct sqlite3;

namespace relvault::storage {

/**
 * @brief Configuration for the release database connection
 */
struct database_config {
    /// Database file path
    std::filesystem::path path{"relvault.db"};

    /// Enable WAL (Write-Ahead Logging) mode for concurrent readers
    bool wal_mode = true;

    /// How long a writer waits for a competing transaction
    std::chrono::milliseconds busy_timeout{5000};
};

/**
 * @brief Locking behaviour of a transaction
 */
enum class transaction_mode {
    deferred,  ///< Read transaction; takes no write lock
    immediate  ///< Write transaction; takes the write lock up front
};

/**
 * @brief Owning wrapper around one SQLite connection
 *
 * Thread Safety: not thread-safe; a connection belongs to one session.
 */
class release_database {
public:
    /**
     * @brief Open (and if needed create) the database
     *
     * @retval unavailable if the file cannot be opened
     * @retval database_error if the connection cannot be configured
     */
    [[nodiscard]] static auto open(const database_config& config)
        -> Result<std::unique_ptr<release_database>>;

    /**
     * @brief Open a database that already exists, without touching its schema
     *
     * @retval unavailable if the file is missing or cannot be opened
     */
    [[nodiscard]] static auto open_existing(const database_config& config)
        -> Result<std::unique_ptr<release_database>>;

    /**
     * @brief Check that the store exists and can be read
     *
     * Never creates the file.
     * @retval unavailable otherwise
     */
    [[nodiscard]] static auto probe(const database_config& config) -> VoidResult;

    ~release_database();

    release_database(const release_database&) = delete;
    auto operator=(const release_database&) -> release_database& = delete;
    release_database(release_database&&) noexcept;
    auto operator=(release_database&&) noexcept -> release_database&;

    // ========================================================================
    // Transactions
    // ========================================================================

    /// Start a transaction; writers use BEGIN IMMEDIATE, readers BEGIN DEFERRED
    [[nodiscard]] auto begin(transaction_mode mode = transaction_mode::immediate)
        -> VoidResult;

    [[nodiscard]] auto commit() -> VoidResult;

    /// Roll back the open transaction; a no-op when none is open
    [[nodiscard]] auto rollback() -> VoidResult;

    [[nodiscard]] bool in_transaction() const noexcept { return in_transaction_; }

    // ========================================================================
    // Raw access
    // ========================================================================

    /// Run one or more statements without parameters
    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;

    [[nodiscard]] auto native_handle() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }

private:
    release_database(sqlite3* db, std::string path);

    [[nodiscard]] static auto connect(const database_config& config, bool create)
        -> Result<std::unique_ptr<release_database>>;

    [[nodiscard]] auto create_schema() -> VoidResult;

    sqlite3* db_{nullptr};
    std::string path_;
    bool in_transaction_{false};
};

}  // namespace relvault::storage
