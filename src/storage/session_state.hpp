/**
 * @file session_state.hpp
 * @brief State shared between a write_session and its capabilities
 */

#pragma once

#include <relvault/core/outcome.hpp>
#include <relvault/core/result.hpp>
#include <relvault/keys/keys_file_writer.hpp>
#include <relvault/security/principal.hpp>
#include <relvault/security/privilege.hpp>
#include <relvault/storage/committee_repository.hpp>
#include <relvault/storage/key_repository.hpp>
#include <relvault/storage/release_database.hpp>
#include <relvault/storage/sqlite_token_store.hpp>
#include <relvault/storage/storage_context.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relvault::storage::detail {

struct session_state {
    session_state(std::shared_ptr<const storage_context> ctx,
                  security::principal who,
                  std::unique_ptr<release_database> database);
    ~session_state();

    session_state(const session_state&) = delete;
    session_state& operator=(const session_state&) = delete;

    /**
     * @brief Whether operations may still run
     * @retval session_closed after commit or rollback
     * @retval session_aborted after a capability or token fault
     */
    [[nodiscard]] auto usable() const -> VoidResult;

    /// Mark the session failed; commit will roll back and report @p cause
    void fail(const error_info& cause);

    void record_write(std::string operation, std::string target,
                      security::privilege_level level);

    [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point;

    /**
     * @brief Render the committee's KEYS file from the current transaction
     *
     * The file is staged next to its target and published on commit. A
     * second regeneration in the same session replaces the staged copy.
     */
    [[nodiscard]] auto regenerate_keys_file(std::string_view committee,
                                            security::privilege_level level)
        -> outcome<std::filesystem::path>;

    [[nodiscard]] auto publish_staged() -> VoidResult;
    void discard_staged() noexcept;

    /// End the session: release the connection and any staged files
    void close() noexcept;

    std::shared_ptr<const storage_context> context;
    security::principal caller;
    std::unique_ptr<release_database> db;
    key_repository keys;
    committee_repository directory;
    sqlite_token_store tokens;
    keys::keys_file_writer keys_files;
    std::map<std::string, keys::staged_file, std::less<>> staged;
    std::vector<storage_write_record> writes;
    bool open{true};
    std::optional<error_info> fault;
};

/**
 * @brief Nested SQLite savepoint scoped to one operation or item
 *
 * Rolled back on destruction unless released.
 */
class savepoint {
public:
    savepoint(release_database& db, std::string name)
        : db_(db), name_(std::move(name)) {}

    ~savepoint() {
        if (active_) {
            (void)db_.execute("ROLLBACK TO " + name_);
            (void)db_.execute("RELEASE " + name_);
        }
    }

    savepoint(const savepoint&) = delete;
    savepoint& operator=(const savepoint&) = delete;

    [[nodiscard]] auto start() -> VoidResult {
        auto result = db_.execute("SAVEPOINT " + name_);
        if (result.is_ok()) {
            active_ = true;
        }
        return result;
    }

    [[nodiscard]] auto release() -> VoidResult {
        auto result = db_.execute("RELEASE " + name_);
        if (result.is_ok()) {
            active_ = false;
        }
        return result;
    }

private:
    release_database& db_;
    std::string name_;
    bool active_{false};
};

}  // namespace relvault::storage::detail
