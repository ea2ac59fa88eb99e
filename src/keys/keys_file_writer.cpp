/**
 * @file keys_file_writer.cpp
 * @brief Implementation of KEYS file rendering and atomic writes
 */

#include "relvault/keys/keys_file_writer.hpp"

#include <relvault/compat/format.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <random>

namespace relvault::keys {

namespace {

constexpr const char* module_name = "keys_file_writer";

/// Generate a unique temporary filename
auto generate_temp_filename(const std::filesystem::path& base)
    -> std::filesystem::path {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;

    auto temp_name = base.filename().string() + ".tmp." +
                     std::to_string(dist(gen));
    return base.parent_path() / temp_name;
}

auto format_date(std::chrono::system_clock::time_point tp) -> std::string {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

/// Fingerprint in groups of four, as gpg prints it
auto group_fingerprint(std::string_view fingerprint) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < fingerprint.size(); ++i) {
        if (i > 0 && i % 4 == 0) {
            out.push_back(' ');
        }
        out.push_back(static_cast<char>(
            std::toupper(static_cast<unsigned char>(fingerprint[i]))));
    }
    return out;
}

template <typename T>
auto file_error(const std::string& message) -> Result<T> {
    return relvault_error<T>(error_codes::keys_file_error, message, module_name);
}

}  // namespace

keys_file_writer::keys_file_writer(std::filesystem::path keys_dir)
    : keys_dir_(std::move(keys_dir)) {}

auto keys_file_writer::render(std::string_view committee,
                              std::vector<public_signing_key> keys,
                              std::chrono::system_clock::time_point generated_at)
    -> std::string {
    std::sort(keys.begin(), keys.end(),
              [](const auto& a, const auto& b) {
                  return a.fingerprint < b.fingerprint;
              });

    std::string out;
    out += compat::format(
        "# This file contains the public signing keys of the {} committee.\n"
        "# Keys: {}\n"
        "# Generated: {}\n"
        "#\n"
        "# Import with:\n"
        "#   gpg --import KEYS\n"
        "\n",
        committee, keys.size(), format_date(generated_at));

    for (const auto& key : keys) {
        out += compat::format("pub   {} {}\n",
                              algorithm_name(key.algorithm, key.length),
                              format_date(key.created));
        out += compat::format("      {}\n", group_fingerprint(key.fingerprint));
        if (key.primary_declared_uid) {
            out += compat::format("uid   {}\n", *key.primary_declared_uid);
        }
        for (const auto& uid : key.secondary_declared_uids) {
            out += compat::format("uid   {}\n", uid);
        }
        out += "\n";
        out += key.ascii_armored_key;
        if (!key.ascii_armored_key.empty() &&
            key.ascii_armored_key.back() != '\n') {
            out += "\n";
        }
        out += "\n";
    }
    return out;
}

bool keys_file_writer::is_valid_committee_name(std::string_view committee) {
    if (committee.empty() || committee.size() > 64) {
        return false;
    }
    return std::all_of(committee.begin(), committee.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
}

auto keys_file_writer::path_for(std::string_view committee) const
    -> std::filesystem::path {
    return keys_dir_ / std::string(committee) / "KEYS";
}

auto keys_file_writer::stage(std::string_view committee,
                             std::string_view content) const
    -> Result<staged_file> {
    if (!is_valid_committee_name(committee)) {
        return file_error<staged_file>(
            compat::format("Invalid committee name: '{}'", committee));
    }

    staged_file file;
    file.target = path_for(committee);

    std::error_code ec;
    std::filesystem::create_directories(file.target.parent_path(), ec);
    if (ec) {
        return file_error<staged_file>("Failed to create directory: " +
                                       ec.message());
    }

    file.temp_path = generate_temp_filename(file.target);
    {
        std::ofstream out(file.temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return file_error<staged_file>("Failed to open " +
                                           file.temp_path.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            discard(file);
            return file_error<staged_file>("Failed to write " +
                                           file.temp_path.string());
        }
    }
    return file;
}

auto keys_file_writer::publish(const staged_file& file) -> VoidResult {
    std::error_code ec;
    std::filesystem::rename(file.temp_path, file.target, ec);
    if (ec) {
        discard(file);
        return relvault_void_error(
            error_codes::file_write_error,
            "Failed to rename temp file: " + ec.message(), module_name);
    }
    return ok();
}

void keys_file_writer::discard(const staged_file& file) noexcept {
    std::error_code ec;
    std::filesystem::remove(file.temp_path, ec);
}

}  // namespace relvault::keys
