/**
 * @file privilege.hpp
 * @brief Privilege levels of the capability hierarchy
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <optional>
#include <string_view>

namespace relvault::security {

/**
 * @brief Privilege levels, ordered from least to most privileged
 */
enum class privilege_level {
  general_public = 0,       ///< Anyone, signed in or not
  foundation_committer = 1, ///< Any active committer of the foundation
  committee_participant = 2, ///< Member or committer of a named committee
  committee_member = 3       ///< Member of a named committee
};

/**
 * @brief Convert privilege_level to string
 */
constexpr std::string_view to_string(privilege_level level) {
  switch (level) {
  case privilege_level::general_public:
    return "GeneralPublic";
  case privilege_level::foundation_committer:
    return "FoundationCommitter";
  case privilege_level::committee_participant:
    return "CommitteeParticipant";
  case privilege_level::committee_member:
    return "CommitteeMember";
  }
  return "Unknown";
}

/**
 * @brief Parse privilege_level from string
 */
inline std::optional<privilege_level> parse_privilege_level(std::string_view str) {
  if (str == "GeneralPublic") return privilege_level::general_public;
  if (str == "FoundationCommitter") return privilege_level::foundation_committer;
  if (str == "CommitteeParticipant") return privilege_level::committee_participant;
  if (str == "CommitteeMember") return privilege_level::committee_member;
  return std::nullopt;
}

/**
 * @brief Whether a holder of @p actual may act at @p requested
 */
[[nodiscard]] constexpr bool satisfies(privilege_level actual,
                                       privilege_level requested) noexcept {
  return actual >= requested;
}

} // namespace relvault::security
