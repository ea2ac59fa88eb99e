/**
 * @file temp_database.hpp
 * @brief Scratch directory holding a release database and KEYS tree
 */

#pragma once

#include <relvault/storage/release_database.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

#include <unistd.h>

namespace relvault::test {

class temp_database {
public:
    temp_database() {
        static std::atomic<int> counter{0};
        root_ = std::filesystem::temp_directory_path() /
                ("relvault_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter++));
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "keys");
        config_.path = root_ / "relvault.db";
    }

    ~temp_database() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    temp_database(const temp_database&) = delete;
    auto operator=(const temp_database&) -> temp_database& = delete;

    [[nodiscard]] auto config() const -> const storage::database_config& {
        return config_;
    }

    [[nodiscard]] auto keys_dir() const -> std::filesystem::path {
        return root_ / "keys";
    }

    /// Fresh connection with the schema in place
    [[nodiscard]] auto open() const -> std::unique_ptr<storage::release_database> {
        auto db = storage::release_database::open(config_);
        REQUIRE(db.is_ok());
        return std::move(db.value());
    }

private:
    std::filesystem::path root_;
    storage::database_config config_;
};

}  // namespace relvault::test
