/**
 * @file principal.hpp
 * @brief Authenticated caller identity
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <string>
#include <string_view>

namespace relvault::security {

/**
 * @brief An authenticated foundation identity
 *
 * Created when a credential is verified and dropped with the request; a
 * principal is never persisted.
 */
class principal {
public:
  explicit principal(std::string uid) : uid_(std::move(uid)) {}

  [[nodiscard]] const std::string &uid() const noexcept { return uid_; }

  /// Foundation email address derived from the uid
  [[nodiscard]] std::string email() const { return uid_ + "@apache.org"; }

  bool operator==(const principal &) const = default;

private:
  std::string uid_;
};

} // namespace relvault::security
