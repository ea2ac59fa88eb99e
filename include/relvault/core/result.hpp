/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for relvault
 *
 * Integrates with common_system's Result pattern. Every fallible operation
 * in the token, capability and storage layers reports failure through these
 * types.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/error/error_codes.h>
#include <kcenon/common/patterns/result.h>

#include <string>
#include <string_view>

namespace relvault {

/**
 * @brief Result type alias for relvault operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type, also used as the cause of an outcome
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief relvault-specific error codes
 *
 * Error code range: -1000 to -1099
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int relvault_base = -1000;

    // Token layer (-1000 to -1019)
    constexpr int unauthenticated = relvault_base - 0;
    constexpr int invalid_credential = relvault_base - 1;
    constexpr int token_expired = relvault_base - 2;
    constexpr int token_revoked = relvault_base - 3;
    constexpr int invalid_signature = relvault_base - 4;
    constexpr int malformed_token = relvault_base - 5;
    constexpr int crypto_failure = relvault_base - 6;

    // Capability layer (-1020 to -1039)
    constexpr int insufficient_privilege = relvault_base - 20;
    constexpr int forbidden = relvault_base - 21;

    // Lookup (-1040 to -1049)
    constexpr int not_found = relvault_base - 40;

    // Backing store (-1050 to -1069)
    constexpr int unavailable = relvault_base - 50;
    constexpr int database_error = relvault_base - 51;
    constexpr int file_write_error = relvault_base - 52;
    constexpr int session_closed = relvault_base - 53;
    constexpr int session_aborted = relvault_base - 54;

    // Domain faults carried inside outcomes (-1070 to -1089)
    constexpr int key_parse_error = relvault_base - 70;
    constexpr int key_owner_mismatch = relvault_base - 71;
    constexpr int duplicate_fingerprint = relvault_base - 72;
    constexpr int keys_file_error = relvault_base - 73;
    constexpr int key_uid_mismatch = relvault_base - 74;

    // Configuration input (-1090 to -1099)
    constexpr int invalid_document = relvault_base - 90;
} // namespace error_codes

/**
 * @brief Get a short symbolic name for a relvault error code
 */
[[nodiscard]] constexpr std::string_view error_code_name(int code) noexcept {
    switch (code) {
        case error_codes::unauthenticated: return "Unauthenticated";
        case error_codes::invalid_credential: return "InvalidCredential";
        case error_codes::token_expired: return "Expired";
        case error_codes::token_revoked: return "Revoked";
        case error_codes::invalid_signature: return "InvalidSignature";
        case error_codes::malformed_token: return "Malformed";
        case error_codes::crypto_failure: return "CryptoFailure";
        case error_codes::insufficient_privilege: return "InsufficientPrivilege";
        case error_codes::forbidden: return "Forbidden";
        case error_codes::not_found: return "NotFound";
        case error_codes::unavailable: return "Unavailable";
        case error_codes::database_error: return "DatabaseError";
        case error_codes::file_write_error: return "FileWriteError";
        case error_codes::session_closed: return "SessionClosed";
        case error_codes::session_aborted: return "SessionAborted";
        case error_codes::key_parse_error: return "KeyParseError";
        case error_codes::key_owner_mismatch: return "KeyOwnerMismatch";
        case error_codes::duplicate_fingerprint: return "DuplicateFingerprint";
        case error_codes::keys_file_error: return "KeysFileError";
        case error_codes::key_uid_mismatch: return "KeyUidMismatch";
        case error_codes::invalid_document: return "InvalidDocument";
        default: return "Unknown";
    }
}

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a relvault error result with module context
 * @tparam T The result value type
 * @param code Error code from relvault::error_codes
 * @param message Error message
 * @param module Module reporting the error
 */
template <typename T>
inline Result<T> relvault_error(int code, const std::string& message,
                                const std::string& module = "relvault") {
    return kcenon::common::make_error<T>(code, message, module);
}

/**
 * @brief Create a relvault void error result
 */
inline VoidResult relvault_void_error(int code, const std::string& message,
                                      const std::string& module = "relvault") {
    return VoidResult(error_info{code, message, module});
}

} // namespace relvault

/**
 * @brief Return early if expression is an error
 */
#define RELVAULT_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error
 */
#define RELVAULT_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)
