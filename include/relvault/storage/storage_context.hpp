/**
 * @file storage_context.hpp
 * @brief Process-wide configuration shared by every storage session
 */

#pragma once

#include "release_database.hpp"

#include <relvault/security/clock.hpp>
#include <relvault/security/privilege.hpp>
#include <relvault/security/token_service.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace relvault::storage {

/**
 * @brief One mutation performed through a storage session
 */
struct storage_write_record {
    std::string asf_uid;
    std::string operation;  ///< e.g. "keys.associate_fingerprint"
    std::string target;     ///< fingerprint, committee or token id
    security::privilege_level privilege{security::privilege_level::general_public};
    std::chrono::system_clock::time_point at{};
};

/**
 * @brief Hook invoked for each write after its session commits
 */
using write_audit_callback = std::function<void(const storage_write_record&)>;

/**
 * @brief Immutable settings and collaborators for storage sessions
 *
 * Created once at startup and shared (read-only) by all sessions.
 */
class storage_context {
public:
    storage_context(database_config database, std::filesystem::path keys_dir,
                    std::shared_ptr<const security::token_service> tokens,
                    std::shared_ptr<const security::clock> time_source =
                        std::make_shared<security::system_clock>(),
                    write_audit_callback write_audit = {})
        : database_(std::move(database)),
          keys_dir_(std::move(keys_dir)),
          tokens_(std::move(tokens)),
          clock_(time_source ? std::move(time_source)
                             : std::make_shared<security::system_clock>()),
          write_audit_(std::move(write_audit)) {}

    [[nodiscard]] auto database() const noexcept -> const database_config& {
        return database_;
    }

    /// Root under which `<committee>/KEYS` files are written
    [[nodiscard]] auto keys_dir() const noexcept -> const std::filesystem::path& {
        return keys_dir_;
    }

    [[nodiscard]] auto tokens() const noexcept -> const security::token_service& {
        return *tokens_;
    }

    [[nodiscard]] auto clock() const noexcept -> const security::clock& {
        return *clock_;
    }

    [[nodiscard]] auto write_audit() const noexcept -> const write_audit_callback& {
        return write_audit_;
    }

private:
    database_config database_;
    std::filesystem::path keys_dir_;
    std::shared_ptr<const security::token_service> tokens_;
    std::shared_ptr<const security::clock> clock_;
    write_audit_callback write_audit_;
};

}  // namespace relvault::storage
