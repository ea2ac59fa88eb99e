/**
 * @file server_app.cpp
 * @brief relvault server application implementation
 */

#include "server_app.hpp"

#include <relvault/integration/logger_adapter.hpp>
#include <relvault/security/signing_secret.hpp>
#include <relvault/storage/directory_loader.hpp>
#include <relvault/storage/release_database.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>

namespace relvault::app {

using integration::logger_adapter;

relvault_server_app::relvault_server_app(const relvault_server_config& config)
    : config_(config) {}

relvault_server_app::~relvault_server_app() {
    stop();
    logger_adapter::shutdown();
}

bool relvault_server_app::initialize() {
    logger_adapter::initialize(config_.logging);
    logger_adapter::info("relvault server initializing");

    // The signing secret lives only in memory; a restart invalidates every
    // outstanding session token.
    auto secret = security::signing_secret::generate();
    if (secret.is_err()) {
        logger_adapter::fatal("Cannot generate signing secret: {}",
                              secret.error().message);
        return false;
    }
    tokens_ = std::make_shared<security::token_service>(std::move(secret.value()));

    // Fail fast if the store is unreachable, and create the schema
    auto db = storage::release_database::open(config_.database);
    if (db.is_err()) {
        logger_adapter::fatal("Cannot open database {}: {}",
                              config_.database.path.string(),
                              db.error().message);
        return false;
    }

    if (!config_.directory_file.empty()) {
        auto loaded = storage::load_directory_file(*db.value(),
                                                   config_.directory_file);
        if (loaded.is_err()) {
            logger_adapter::fatal("Cannot load directory {}: {}",
                                  config_.directory_file.string(),
                                  loaded.error().message);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.keys_dir, ec);
    if (ec) {
        logger_adapter::fatal("Cannot create keys directory {}: {}",
                              config_.keys_dir.string(), ec.message());
        return false;
    }

    storage_ = std::make_shared<storage::storage_context>(
        config_.database, config_.keys_dir, tokens_,
        std::make_shared<security::system_clock>(),
        [](const storage::storage_write_record& record) {
            logger_adapter::log_storage_write(
                record.asf_uid, record.operation, record.target,
                std::string(security::to_string(record.privilege)));
        });

    server_ = std::make_unique<web::rest_server>(config_.rest);
    server_->set_storage_context(storage_);
    return true;
}

bool relvault_server_app::start() {
    if (!server_) {
        logger_adapter::error("start() called before initialize()");
        return false;
    }
    server_->start_async();
    return true;
}

void relvault_server_app::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
}

void relvault_server_app::wait_for_shutdown() {
    while (!shutdown_requested_ && is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    stop();
    logger_adapter::info("relvault server stopped");
    logger_adapter::flush();
}

void relvault_server_app::request_shutdown() noexcept {
    shutdown_requested_ = true;
}

bool relvault_server_app::is_running() const noexcept {
    return server_ && server_->is_running();
}

}  // namespace relvault::app
