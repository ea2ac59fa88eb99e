/**
 * @file keys_file_writer.hpp
 * @brief Renders and writes per-committee KEYS files
 *
 * A KEYS file lists the full armored text of every public signing key linked
 * to a committee. Writes go through a temporary file in the target directory
 * and become visible only on rename, so readers never observe a partial file.
 */

#pragma once

#include "public_signing_key.hpp"

#include <relvault/core/result.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace relvault::keys {

/**
 * @brief A rendered KEYS file waiting to be published
 */
struct staged_file {
    std::filesystem::path temp_path;
    std::filesystem::path target;
};

class keys_file_writer {
public:
    explicit keys_file_writer(std::filesystem::path keys_dir);

    /**
     * @brief Render the KEYS file text for @p committee
     *
     * Keys are listed in fingerprint order regardless of input order.
     */
    [[nodiscard]] static auto render(
        std::string_view committee, std::vector<public_signing_key> keys,
        std::chrono::system_clock::time_point generated_at) -> std::string;

    /// Whether @p committee is usable as a directory name
    [[nodiscard]] static bool is_valid_committee_name(std::string_view committee);

    /// `<keys_dir>/<committee>/KEYS`
    [[nodiscard]] auto path_for(std::string_view committee) const
        -> std::filesystem::path;

    /**
     * @brief Write @p content next to the target without replacing it
     * @retval keys_file_error on an invalid committee name or I/O failure
     */
    [[nodiscard]] auto stage(std::string_view committee,
                             std::string_view content) const
        -> Result<staged_file>;

    /// Atomically move a staged file over its target
    [[nodiscard]] static auto publish(const staged_file& file) -> VoidResult;

    /// Remove a staged file without publishing it
    static void discard(const staged_file& file) noexcept;

    [[nodiscard]] auto keys_dir() const noexcept
        -> const std::filesystem::path& {
        return keys_dir_;
    }

private:
    std::filesystem::path keys_dir_;
};

}  // namespace relvault::keys
