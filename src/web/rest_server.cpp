/**
 * @file rest_server.cpp
 * @brief REST API server implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any relvault headers to avoid forward
// declaration conflicts
#include "crow.h"

#include "relvault/web/endpoints/key_endpoints.hpp"
#include "relvault/web/endpoints/system_endpoints.hpp"
#include "relvault/web/endpoints/token_endpoints.hpp"
#include "relvault/web/rest_config.hpp"
#include "relvault/web/rest_server.hpp"
#include "relvault/web/rest_types.hpp"

#include <relvault/integration/logger_adapter.hpp>
#include <relvault/storage/storage_context.hpp>

#include <atomic>
#include <mutex>
#include <thread>

namespace relvault::web {

// Forward declare internal registration functions
namespace endpoints {
void register_system_endpoints_impl(crow::SimpleApp &app,
                                    std::shared_ptr<rest_server_context> ctx);
} // namespace endpoints

/**
 * @brief Implementation details for rest_server
 */
struct rest_server::impl {
  rest_server_config config;
  std::shared_ptr<rest_server_context> context;
  std::unique_ptr<crow::SimpleApp> app;
  std::thread server_thread;
  std::atomic<bool> running{false};
  std::mutex mutex;

  impl() : context(std::make_shared<rest_server_context>()) {
    context->config = &config;
  }

  explicit impl(const rest_server_config &cfg)
      : config(cfg), context(std::make_shared<rest_server_context>()) {
    context->config = &config;
  }

  /**
   * @brief Build the Crow app with every route registered
   */
  void build_app() {
    app = std::make_unique<crow::SimpleApp>();
    auto &crow_app = *app;

    endpoints::register_system_endpoints_impl(crow_app, context);
    endpoints::register_token_endpoints_impl(crow_app, context);
    endpoints::register_key_endpoints_impl(crow_app, context);

    // Add CORS preflight handler
    if (config.enable_cors) {
      CROW_ROUTE(crow_app, "/api/<path>")
          .methods(crow::HTTPMethod::OPTIONS)(
              [this](const crow::request & /*req*/,
                     const std::string & /*path*/) {
                crow::response res(204);
                res.add_header("Access-Control-Allow-Origin",
                               config.cors_allowed_origins);
                res.add_header("Access-Control-Allow-Methods",
                               "GET, POST, OPTIONS");
                res.add_header("Access-Control-Allow-Headers",
                               "Content-Type, Authorization");
                res.add_header("Access-Control-Max-Age", "86400");
                return res;
              });
    }
  }

  void run() {
    integration::logger_adapter::info("REST server listening on {}:{}",
                                      config.bind_address, config.port);
    app->bindaddr(config.bind_address)
        .port(config.port)
        .concurrency(static_cast<std::uint16_t>(config.concurrency))
        .run();
  }
};

rest_server::rest_server() : impl_(std::make_unique<impl>()) {}

rest_server::rest_server(const rest_server_config &config)
    : impl_(std::make_unique<impl>(config)) {}

rest_server::~rest_server() {
  if (impl_) {
    stop();
  }
}

rest_server::rest_server(rest_server &&other) noexcept = default;
rest_server &rest_server::operator=(rest_server &&other) noexcept = default;

const rest_server_config &rest_server::config() const noexcept {
  return impl_->config;
}

void rest_server::set_config(const rest_server_config &config) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  impl_->context->config = &impl_->config;
}

void rest_server::set_storage_context(
    std::shared_ptr<const storage::storage_context> context) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->context->storage = std::move(context);
}

void rest_server::start() {
  if (impl_->running.exchange(true)) {
    return; // Already running
  }

  impl_->build_app();
  impl_->run();
  impl_->running = false;
}

void rest_server::start_async() {
  if (impl_->running.exchange(true)) {
    return; // Already running
  }

  impl_->build_app();
  impl_->server_thread = std::thread([this]() {
    impl_->run();
    impl_->running = false;
  });
}

void rest_server::stop() {
  if (!impl_->running) {
    return;
  }

  if (impl_->app) {
    impl_->app->stop();
  }

  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }

  impl_->running = false;
  integration::logger_adapter::info("REST server stopped");
}

bool rest_server::is_running() const noexcept { return impl_->running; }

void rest_server::wait() {
  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }
}

std::uint16_t rest_server::port() const noexcept {
  return impl_->running ? impl_->config.port : 0;
}

} // namespace relvault::web
