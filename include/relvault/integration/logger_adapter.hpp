/**
 * @file logger_adapter.hpp
 * @brief Adapter for application and audit logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with relvault. It supports standard logging, an audit trail of mediated
 * storage writes, and security event logging for the token and capability
 * layers.
 */

#pragma once

#include <relvault/compat/format.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace relvault::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name ("trace" .. "off")
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<log_level>;

/**
 * @enum security_event_type
 * @brief Types of security events for audit logging
 */
enum class security_event_type {
    authentication_success,
    authentication_failure,
    access_denied,
    token_issued,
    token_revoked,
    invalid_request
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable separate JSON audit trail file
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Static logging facade over logger_system
 *
 * Every call is a no-op until initialize() has been called, so library code
 * may log unconditionally.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/relvault";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Server started on port {}", 8080);
 * logger_adapter::log_security_event(security_event_type::token_issued,
 *                                    "PAT issued", "alice");
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the audit trail file. Calling it
     * again while initialized has no effect.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the writers
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(relvault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, relvault::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(relvault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, relvault::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(relvault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, relvault::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(relvault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, relvault::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(relvault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, relvault::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(relvault::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, relvault::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Audit Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record one committed storage write
     *
     * @param asf_uid Principal that performed the write
     * @param operation Writer operation name, e.g. "keys.ensure_user_key"
     * @param target Entity written (fingerprint, committee, token id)
     * @param privilege Capability level the write was made at
     */
    static void log_storage_write(const std::string& asf_uid,
                                  const std::string& operation,
                                  const std::string& target,
                                  const std::string& privilege);

    /**
     * @brief Log a security-related event
     *
     * @param type Type of security event
     * @param description Human-readable description
     * @param user_id Optional foundation uid
     */
    static void log_security_event(security_event_type type,
                                   const std::string& description,
                                   const std::string& user_id = "");

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    [[nodiscard]] static auto security_event_to_string(security_event_type type) -> std::string;

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace relvault::integration
