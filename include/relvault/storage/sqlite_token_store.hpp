/**
 * @file sqlite_token_store.hpp
 * @brief SQLite implementation of the personal access token store
 */

#pragma once

#include <relvault/security/token_store_interface.hpp>

// Forward declaration for SQLite3
struct sqlite3;

namespace relvault::storage {

/**
 * @brief Stores PAT records in the personal_access_tokens table
 *
 * Uses the connection of the owning session and never manages transactions.
 */
class sqlite_token_store : public security::token_store_interface {
public:
    explicit sqlite_token_store(sqlite3* db);
    ~sqlite_token_store() override;

    [[nodiscard]] auto insert(const security::personal_access_token& token)
        -> Result<security::personal_access_token> override;

    [[nodiscard]] auto find_by_hash(std::string_view token_hash)
        -> Result<std::optional<security::personal_access_token>> override;

    [[nodiscard]] auto find_by_id(std::int64_t id)
        -> Result<std::optional<security::personal_access_token>> override;

    [[nodiscard]] auto list_for(std::string_view asf_uid)
        -> Result<std::vector<security::personal_access_token>> override;

    [[nodiscard]] auto mark_revoked(std::int64_t id) -> VoidResult override;

private:
    sqlite3* db_{nullptr};
};

}  // namespace relvault::storage
