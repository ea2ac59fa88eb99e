/**
 * @file token_service.hpp
 * @brief Issues and verifies personal access tokens and session tokens
 *
 * A personal access token (PAT) is a long-lived credential whose only use is
 * to be exchanged for a session token (JWT). A JWT is a short-lived, stateless
 * HS256 bearer token; its validity depends only on its signature and expiry,
 * so verification never touches a store.
 *
 * @example
 * @code
 * auto secret = signing_secret::generate().unwrap();
 * token_service tokens(std::move(secret));
 *
 * auto pat = tokens.issue_pat(store, directory, alice, "ci").unwrap();
 * auto jwt = tokens.issue_jwt(store, alice, pat.plaintext).unwrap();
 * auto who = tokens.verify_jwt(jwt.encoded);   // -> principal "alice"
 * @endcode
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "clock.hpp"
#include "identity_provider.hpp"
#include "personal_access_token.hpp"
#include "principal.hpp"
#include "session_token.hpp"
#include "signing_secret.hpp"
#include "token_store_interface.hpp"

#include <relvault/core/result.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace relvault::security {

/**
 * @brief Token issuance and verification
 *
 * Holds no state besides the injected signing secret, configuration and
 * clock. PAT operations take the token store as an argument so that every
 * PAT write runs inside the caller's storage session.
 *
 * Thread Safety: all member functions are const and may be called
 * concurrently; stores passed in are used only by the calling thread.
 */
class token_service {
public:
  explicit token_service(
      signing_secret secret, token_config config = {},
      std::shared_ptr<const clock> time_source = std::make_shared<system_clock>());

  // =========================================================================
  // Personal Access Tokens
  // =========================================================================

  /**
   * @brief Issue a new PAT for @p owner
   *
   * @return The plaintext (returned exactly once) and the stored record
   * @retval unauthenticated if @p owner is not signed in
   */
  [[nodiscard]] auto issue_pat(token_store_interface &store,
                               const identity_provider &identity,
                               const principal &owner,
                               std::string_view label = {}) const
      -> Result<issued_pat>;

  /**
   * @brief Revoke a PAT
   *
   * @retval not_found if no such PAT exists
   * @retval forbidden if @p caller is neither the owner nor an administrator
   */
  [[nodiscard]] auto revoke_pat(token_store_interface &store,
                                const identity_provider &identity,
                                const principal &caller,
                                std::int64_t pat_id) const
      -> Result<personal_access_token>;

  /// PAT records owned by @p owner (hashes only)
  [[nodiscard]] auto list_pats(token_store_interface &store,
                               const principal &owner) const
      -> Result<std::vector<personal_access_token>>;

  // =========================================================================
  // Session Tokens
  // =========================================================================

  /**
   * @brief Exchange a PAT plaintext for a JWT
   *
   * @retval invalid_credential if no PAT of @p owner matches
   * @retval token_expired if the PAT has passed its expiry
   * @retval token_revoked if the PAT was revoked
   */
  [[nodiscard]] auto issue_jwt(token_store_interface &store,
                               const principal &owner,
                               std::string_view plaintext_pat) const
      -> Result<session_token>;

  /**
   * @brief Verify a JWT and return its subject
   *
   * @retval malformed_token on structural, encoding or claim errors
   * @retval invalid_signature if the signature does not match
   * @retval token_expired if the expiry has passed
   */
  [[nodiscard]] auto verify_jwt(std::string_view token) const
      -> Result<principal>;

  /// As verify_jwt(), returning the full claim set
  [[nodiscard]] auto verify_claims(std::string_view token) const
      -> Result<session_claims>;

  /**
   * @brief One-way hash stored in place of a PAT plaintext
   */
  [[nodiscard]] static auto hash_pat(std::string_view plaintext) -> std::string;

  [[nodiscard]] const token_config &config() const noexcept { return config_; }

private:
  [[nodiscard]] auto now() const -> clock::time_point;
  [[nodiscard]] auto sign(const session_claims &claims) const
      -> Result<std::string>;

  signing_secret secret_;
  token_config config_;
  std::shared_ptr<const clock> clock_;
};

} // namespace relvault::security
