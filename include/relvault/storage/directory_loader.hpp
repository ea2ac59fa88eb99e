/**
 * @file directory_loader.hpp
 * @brief Seeds principals and committee roles from a JSON document
 *
 * The directory tables are authoritative input maintained outside the
 * storage session; this loader is how a deployment (or a test) provides
 * them. Expected layout:
 *
 * @code
 * {
 *   "principals": [
 *     {"uid": "alice", "committer": true, "admin": false, "active": true}
 *   ],
 *   "committees": [
 *     {"name": "tooling", "display_name": "Tooling",
 *      "members": ["alice"], "committers": ["bob"]}
 *   ]
 * }
 * @endcode
 */

#pragma once

#include "release_database.hpp"

#include <relvault/core/result.hpp>

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace relvault::storage {

/**
 * @brief Counts of directory rows written by a load
 */
struct directory_load_summary {
    std::size_t principals{0};
    std::size_t committees{0};
    std::size_t roles{0};
};

/**
 * @brief Upsert the directory described by @p json_text in one transaction
 *
 * @retval invalid_document if the text is not valid JSON of the expected shape
 */
[[nodiscard]] auto load_directory(release_database& db,
                                  std::string_view json_text)
    -> Result<directory_load_summary>;

/// As load_directory(), reading the document from @p path
[[nodiscard]] auto load_directory_file(release_database& db,
                                       const std::filesystem::path& path)
    -> Result<directory_load_summary>;

}  // namespace relvault::storage
