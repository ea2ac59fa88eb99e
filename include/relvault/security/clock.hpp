/**
 * @file clock.hpp
 * @brief Wall-clock abstraction for token issuance and expiry checks
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <chrono>

namespace relvault::security {

/**
 * @brief Source of the current time
 */
class clock {
public:
  using time_point = std::chrono::system_clock::time_point;

  virtual ~clock() = default;

  [[nodiscard]] virtual auto now() const -> time_point = 0;
};

/**
 * @brief clock backed by std::chrono::system_clock
 */
class system_clock final : public clock {
public:
  [[nodiscard]] auto now() const -> time_point override {
    return std::chrono::system_clock::now();
  }
};

} // namespace relvault::security
