/**
 * @file signing_secret.cpp
 * @brief Generation of the process-wide signing secret
 *
 * @copyright Copyright (c) 2025
 */

#include "relvault/security/signing_secret.hpp"

namespace relvault::security {

auto signing_secret::generate(std::size_t bytes) -> Result<signing_secret> {
  if (bytes < 16) {
    return relvault_error<signing_secret>(
        error_codes::crypto_failure,
        "Signing secret must be at least 16 bytes", "signing_secret");
  }
  auto key = crypto::random_bytes(bytes);
  if (key.is_err()) {
    return Result<signing_secret>(key.error());
  }
  return signing_secret(std::move(key.value()));
}

} // namespace relvault::security
