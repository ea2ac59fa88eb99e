/**
 * @file read_session.cpp
 * @brief Read-only storage session lifecycle
 */

#include "relvault/storage/read_session.hpp"

#include "session_state.hpp"

#include <relvault/integration/logger_adapter.hpp>

namespace relvault::storage {

using integration::logger_adapter;

namespace {

constexpr const char* module_name = "read_session";

}  // namespace

read_session::read_session(std::shared_ptr<detail::session_state> state)
    : state_(std::move(state)) {}

read_session::~read_session() { close(); }

read_session::read_session(read_session&& other) noexcept
    : state_(std::move(other.state_)) {}

auto read_session::operator=(read_session&& other) noexcept -> read_session& {
    if (this != &other) {
        close();
        state_ = std::move(other.state_);
    }
    return *this;
}

auto read_session::open(std::shared_ptr<const storage_context> context,
                        security::principal caller) -> Result<read_session> {
    if (!context) {
        return relvault_error<read_session>(
            error_codes::unavailable, "No storage context", module_name);
    }

    auto db = release_database::open_existing(context->database());
    if (db.is_err()) {
        return relvault_error<read_session>(
            error_codes::unavailable,
            "Backing store unavailable: " + db.error().message, module_name);
    }

    auto connection = std::move(db.value());
    auto begun = connection->begin(transaction_mode::deferred);
    if (begun.is_err()) {
        return relvault_error<read_session>(
            error_codes::unavailable,
            "Cannot start read transaction: " + begun.error().message,
            module_name);
    }

    logger_adapter::debug("Opened read session for {}", caller.uid());
    return read_session(std::make_shared<detail::session_state>(
        std::move(context), std::move(caller), std::move(connection)));
}

auto read_session::caller() const -> const security::principal& {
    return state_->caller;
}

bool read_session::is_open() const noexcept {
    return state_ && state_->open;
}

auto read_session::as_general_public() -> Result<general_public> {
    if (!state_) {
        return relvault_error<general_public>(
            error_codes::session_closed, "Storage session is closed",
            module_name);
    }
    if (auto check = state_->usable(); check.is_err()) {
        return Result<general_public>(check.error());
    }
    return general_public(state_);
}

void read_session::close() noexcept {
    if (state_ && state_->open) {
        state_->close();
    }
}

}  // namespace relvault::storage
