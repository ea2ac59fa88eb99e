/**
 * @file read_session.hpp
 * @brief Read-only counterpart of write_session for GET requests
 *
 * A read_session opens the existing store inside a deferred transaction, so
 * it never takes the write lock and does not wait for an open write_session.
 * It can only hand out the general_public capability and has no commit; the
 * transaction is rolled back when the session closes.
 */

#pragma once

#include "capabilities.hpp"
#include "storage_context.hpp"

#include <relvault/core/result.hpp>
#include <relvault/security/principal.hpp>

#include <memory>

namespace relvault::storage {

class read_session {
public:
    /**
     * @brief Open a read transaction for @p caller
     *
     * @retval unavailable if the store does not exist or cannot be read
     */
    [[nodiscard]] static auto open(std::shared_ptr<const storage_context> context,
                                   security::principal caller)
        -> Result<read_session>;

    ~read_session();

    read_session(const read_session&) = delete;
    auto operator=(const read_session&) -> read_session& = delete;
    read_session(read_session&& other) noexcept;
    auto operator=(read_session&& other) noexcept -> read_session&;

    [[nodiscard]] auto caller() const -> const security::principal&;

    [[nodiscard]] bool is_open() const noexcept;

    [[nodiscard]] auto as_general_public() -> Result<general_public>;

    /// End the read transaction; a no-op once closed
    void close() noexcept;

private:
    explicit read_session(std::shared_ptr<detail::session_state> state);

    std::shared_ptr<detail::session_state> state_;
};

}  // namespace relvault::storage
