/**
 * @file identity_provider.hpp
 * @brief Directory queries needed by the token service
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <string_view>

namespace relvault::security {

/**
 * @brief Answers who is signed in and who administers the foundation
 */
class identity_provider {
public:
  virtual ~identity_provider() = default;

  /// Whether @p asf_uid is a known, active account
  [[nodiscard]] virtual bool is_signed_in(std::string_view asf_uid) const = 0;

  [[nodiscard]] virtual bool is_administrator(std::string_view asf_uid) const = 0;
};

} // namespace relvault::security
