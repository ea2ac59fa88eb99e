/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logging and audit adapter
 */

#include <relvault/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <ctime>
#include <fstream>
#include <mutex>

namespace relvault::integration {

namespace {

[[nodiscard]] auto convert_log_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace:
            return kcenon::logger::log_level::trace;
        case log_level::debug:
            return kcenon::logger::log_level::debug;
        case log_level::info:
            return kcenon::logger::log_level::info;
        case log_level::warn:
            return kcenon::logger::log_level::warn;
        case log_level::error:
            return kcenon::logger::log_level::error;
        case log_level::fatal:
            return kcenon::logger::log_level::fatal;
        case log_level::off:
        default:
            return kcenon::logger::log_level::off;
    }
}

/// UTC timestamp with millisecond precision, e.g. 2025-03-01T12:00:00.123Z
[[nodiscard]] auto format_iso8601_utc() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_val);
    return relvault::compat::format("{}.{:03}Z", std::string(buf), ms.count());
}

}  // namespace

auto parse_log_level(std::string_view name) -> std::optional<log_level> {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "fatal") return log_level::fatal;
    if (name == "off") return log_level::off;
    return std::nullopt;
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
        }

        logger_ = std::make_unique<kcenon::logger::logger>(
            config.async_mode, config.buffer_size);
        logger_->set_min_level(convert_log_level(config.min_level));

        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config.enable_file) {
            auto log_path = config.log_directory / "relvault.log";
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(), config.max_file_size_mb * 1024 * 1024,
                config.max_files));
        }

        logger_->start();

        audit_log_path_.clear();
        if (config.enable_audit_log) {
            audit_log_path_ = config.log_directory / "audit.json";
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_ || !is_level_enabled(level)) {
            return;
        }
        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        std::lock_guard lock(mutex_);
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_log(const std::string& event_type,
                         const std::string& outcome,
                         const std::map<std::string, std::string>& fields) {
        if (!initialized_ || audit_log_path_.empty()) {
            return;
        }

        nlohmann::json entry = {
            {"timestamp", format_iso8601_utc()},
            {"event_type", event_type},
            {"outcome", outcome},
        };
        for (const auto& [key, value] : fields) {
            entry[key] = value;
        }

        std::lock_guard lock(audit_mutex_);
        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            return;
        }
        file << entry.dump() << '\n';
        file.flush();
    }

private:
    mutable std::mutex mutex_;
    mutable std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Audit Logging
// =============================================================================

void logger_adapter::log_storage_write(const std::string& asf_uid,
                                       const std::string& operation,
                                       const std::string& target,
                                       const std::string& privilege) {
    debug("Storage write: {} {} by {} as {}", operation, target, asf_uid,
          privilege);

    write_audit_log("STORAGE_WRITE", "success",
                    {{"asf_uid", asf_uid},
                     {"operation", operation},
                     {"target", target},
                     {"privilege", privilege}});
}

void logger_adapter::log_security_event(security_event_type type,
                                        const std::string& description,
                                        const std::string& user_id) {
    auto type_str = security_event_to_string(type);

    switch (type) {
        case security_event_type::authentication_success:
        case security_event_type::token_issued:
        case security_event_type::token_revoked:
            info("Security event: {} - {}", type_str, description);
            break;
        case security_event_type::authentication_failure:
        case security_event_type::access_denied:
        case security_event_type::invalid_request:
            warn("Security event: {} - {}", type_str, description);
            break;
    }

    std::map<std::string, std::string> fields = {
        {"security_event", type_str}, {"description", description}};

    if (!user_id.empty()) {
        fields["user_id"] = user_id;
    }

    auto outcome = (type == security_event_type::authentication_failure ||
                    type == security_event_type::access_denied ||
                    type == security_event_type::invalid_request)
                       ? "failure"
                       : "success";
    write_audit_log("SECURITY", outcome, fields);
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

// =============================================================================
// Private Helpers
// =============================================================================

void logger_adapter::write_audit_log(
    const std::string& event_type,
    const std::string& outcome,
    const std::map<std::string, std::string>& fields) {
    pimpl_->write_audit_log(event_type, outcome, fields);
}

auto logger_adapter::security_event_to_string(security_event_type type) -> std::string {
    switch (type) {
        case security_event_type::authentication_success:
            return "authentication_success";
        case security_event_type::authentication_failure:
            return "authentication_failure";
        case security_event_type::access_denied:
            return "access_denied";
        case security_event_type::token_issued:
            return "token_issued";
        case security_event_type::token_revoked:
            return "token_revoked";
        case security_event_type::invalid_request:
            return "invalid_request";
    }
    return "unknown";
}

}  // namespace relvault::integration
