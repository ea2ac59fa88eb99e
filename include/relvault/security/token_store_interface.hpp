/**
 * @file token_store_interface.hpp
 * @brief Storage interface for personal access tokens
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "personal_access_token.hpp"

#include <relvault/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace relvault::security {

/**
 * @brief Abstract interface for persisting PAT records
 */
class token_store_interface {
public:
  virtual ~token_store_interface() = default;

  /**
   * @brief Persist a new token; the returned record carries its id
   */
  [[nodiscard]] virtual auto insert(const personal_access_token &token)
      -> Result<personal_access_token> = 0;

  [[nodiscard]] virtual auto find_by_hash(std::string_view token_hash)
      -> Result<std::optional<personal_access_token>> = 0;

  [[nodiscard]] virtual auto find_by_id(std::int64_t id)
      -> Result<std::optional<personal_access_token>> = 0;

  [[nodiscard]] virtual auto list_for(std::string_view asf_uid)
      -> Result<std::vector<personal_access_token>> = 0;

  [[nodiscard]] virtual auto mark_revoked(std::int64_t id) -> VoidResult = 0;

protected:
  token_store_interface() = default;
  token_store_interface(const token_store_interface &) = delete;
  token_store_interface &operator=(const token_store_interface &) = delete;
  token_store_interface(token_store_interface &&) = default;
  token_store_interface &operator=(token_store_interface &&) = default;
};

} // namespace relvault::security
