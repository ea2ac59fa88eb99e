/**
 * @file token_service.cpp
 * @brief Implementation of PAT and JWT issuance and verification
 *
 * @copyright Copyright (c) 2025
 */

#include "relvault/security/token_service.hpp"

#include <relvault/security/crypto.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace relvault::security {

namespace {

constexpr const char *module_name = "token_service";

using json = nlohmann::json;

auto to_epoch_seconds(clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::seconds>(
             tp.time_since_epoch())
      .count();
}

auto from_epoch_seconds(std::int64_t secs) -> clock::time_point {
  return clock::time_point(std::chrono::seconds(secs));
}

auto header_segment() -> const std::string & {
  static const std::string segment =
      crypto::base64url_encode(std::string_view(R"({"alg":"HS256","typ":"JWT"})"));
  return segment;
}

template <typename T>
auto malformed(const std::string &message) -> Result<T> {
  return relvault_error<T>(error_codes::malformed_token, message, module_name);
}

auto decode_json_segment(std::string_view segment) -> std::optional<json> {
  auto raw = crypto::base64url_decode(segment);
  if (!raw) {
    return std::nullopt;
  }
  auto parsed = json::parse(raw->begin(), raw->end(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace

token_service::token_service(signing_secret secret, token_config config,
                             std::shared_ptr<const clock> time_source)
    : secret_(std::move(secret)), config_(std::move(config)),
      clock_(time_source ? std::move(time_source)
                         : std::make_shared<system_clock>()) {}

auto token_service::now() const -> clock::time_point {
  return std::chrono::time_point_cast<std::chrono::seconds>(clock_->now());
}

auto token_service::hash_pat(std::string_view plaintext) -> std::string {
  return crypto::to_hex(crypto::sha256(plaintext));
}

// =============================================================================
// Personal Access Tokens
// =============================================================================

auto token_service::issue_pat(token_store_interface &store,
                              const identity_provider &identity,
                              const principal &owner,
                              std::string_view label) const
    -> Result<issued_pat> {
  if (!identity.is_signed_in(owner.uid())) {
    return relvault_error<issued_pat>(error_codes::unauthenticated,
                                      "User is not signed in: " + owner.uid(),
                                      module_name);
  }

  auto random = crypto::random_bytes(config_.pat_bytes);
  if (random.is_err()) {
    return Result<issued_pat>(random.error());
  }

  issued_pat issued;
  issued.plaintext = crypto::base64url_encode(random.value());

  auto issued_at = now();
  personal_access_token record;
  record.asf_uid = owner.uid();
  record.token_hash = hash_pat(issued.plaintext);
  record.label = std::string(label);
  record.created = issued_at;
  record.expires = issued_at + config_.pat_lifetime;
  record.revoked = false;

  auto stored = store.insert(record);
  if (stored.is_err()) {
    return Result<issued_pat>(stored.error());
  }
  issued.token = std::move(stored.value());
  return issued;
}

auto token_service::revoke_pat(token_store_interface &store,
                               const identity_provider &identity,
                               const principal &caller,
                               std::int64_t pat_id) const
    -> Result<personal_access_token> {
  auto found = store.find_by_id(pat_id);
  if (found.is_err()) {
    return Result<personal_access_token>(found.error());
  }
  if (!found.value().has_value()) {
    return relvault_error<personal_access_token>(
        error_codes::not_found,
        "Personal access token not found: " + std::to_string(pat_id),
        module_name);
  }

  auto token = std::move(*found.value());
  if (token.asf_uid != caller.uid() &&
      !identity.is_administrator(caller.uid())) {
    return relvault_error<personal_access_token>(
        error_codes::forbidden,
        "Only the owner or an administrator may revoke this token",
        module_name);
  }

  auto marked = store.mark_revoked(pat_id);
  if (marked.is_err()) {
    return Result<personal_access_token>(marked.error());
  }
  token.revoked = true;
  return token;
}

auto token_service::list_pats(token_store_interface &store,
                              const principal &owner) const
    -> Result<std::vector<personal_access_token>> {
  return store.list_for(owner.uid());
}

// =============================================================================
// Session Tokens
// =============================================================================

auto token_service::issue_jwt(token_store_interface &store,
                              const principal &owner,
                              std::string_view plaintext_pat) const
    -> Result<session_token> {
  auto found = store.find_by_hash(hash_pat(plaintext_pat));
  if (found.is_err()) {
    return Result<session_token>(found.error());
  }

  const auto &match = found.value();
  if (!match || match->asf_uid != owner.uid()) {
    return relvault_error<session_token>(error_codes::invalid_credential,
                                         "Invalid personal access token",
                                         module_name);
  }

  auto issued_at = now();
  if (match->is_expired(issued_at)) {
    return relvault_error<session_token>(
        error_codes::token_expired, "Personal access token has expired",
        module_name);
  }
  if (match->revoked) {
    return relvault_error<session_token>(
        error_codes::token_revoked, "Personal access token has been revoked",
        module_name);
  }

  auto jti = crypto::random_bytes(config_.jti_bytes);
  if (jti.is_err()) {
    return Result<session_token>(jti.error());
  }

  session_token token;
  token.claims.subject = owner.uid();
  token.claims.issued_at = issued_at;
  token.claims.expires_at = issued_at + config_.jwt_lifetime;
  token.claims.token_id = crypto::base64url_encode(jti.value());
  token.claims.issuer = config_.issuer;

  auto encoded = sign(token.claims);
  if (encoded.is_err()) {
    return Result<session_token>(encoded.error());
  }
  token.encoded = std::move(encoded.value());
  return token;
}

auto token_service::sign(const session_claims &claims) const
    -> Result<std::string> {
  json payload = {
      {"sub", claims.subject},
      {"iat", to_epoch_seconds(claims.issued_at)},
      {"exp", to_epoch_seconds(claims.expires_at)},
      {"jti", claims.token_id},
      {"iss", claims.issuer},
  };

  auto signing_input =
      header_segment() + "." + crypto::base64url_encode(std::string_view(payload.dump()));
  auto mac = crypto::hmac_sha256(secret_.bytes(), signing_input);
  if (mac.is_err()) {
    return Result<std::string>(mac.error());
  }
  return signing_input + "." + crypto::base64url_encode(mac.value());
}

auto token_service::verify_jwt(std::string_view token) const
    -> Result<principal> {
  auto claims = verify_claims(token);
  if (claims.is_err()) {
    return Result<principal>(claims.error());
  }
  return principal(claims.value().subject);
}

auto token_service::verify_claims(std::string_view token) const
    -> Result<session_claims> {
  auto first = token.find('.');
  if (first == std::string_view::npos) {
    return malformed<session_claims>("Token is not a JWT");
  }
  auto second = token.find('.', first + 1);
  if (second == std::string_view::npos ||
      token.find('.', second + 1) != std::string_view::npos) {
    return malformed<session_claims>("Token is not a JWT");
  }

  auto header_part = token.substr(0, first);
  auto payload_part = token.substr(first + 1, second - first - 1);
  auto signature_part = token.substr(second + 1);

  auto header = decode_json_segment(header_part);
  if (!header) {
    return malformed<session_claims>("Token header is not valid JSON");
  }
  auto alg = header->find("alg");
  if (alg == header->end() || !alg->is_string() || *alg != "HS256") {
    return malformed<session_claims>("Unsupported token algorithm");
  }

  auto signature = crypto::base64url_decode(signature_part);
  if (!signature) {
    return malformed<session_claims>("Token signature is not base64url");
  }

  auto signing_input = token.substr(0, second);
  auto expected = crypto::hmac_sha256(secret_.bytes(), signing_input);
  if (expected.is_err()) {
    return Result<session_claims>(expected.error());
  }
  if (!crypto::constant_time_equal(expected.value(), *signature)) {
    return relvault_error<session_claims>(error_codes::invalid_signature,
                                          "Token signature is invalid",
                                          module_name);
  }

  auto payload = decode_json_segment(payload_part);
  if (!payload) {
    return malformed<session_claims>("Token payload is not valid JSON");
  }

  session_claims claims;
  try {
    claims.subject = payload->at("sub").get<std::string>();
    claims.issued_at = from_epoch_seconds(payload->at("iat").get<std::int64_t>());
    claims.expires_at = from_epoch_seconds(payload->at("exp").get<std::int64_t>());
    claims.token_id = payload->at("jti").get<std::string>();
    claims.issuer = payload->value("iss", std::string{});
  } catch (const json::exception &e) {
    return malformed<session_claims>(std::string("Missing or invalid claim: ") +
                                     e.what());
  }

  if (claims.subject.empty()) {
    return malformed<session_claims>("Token subject is empty");
  }

  if (now() >= claims.expires_at) {
    return relvault_error<session_claims>(error_codes::token_expired,
                                          "Token has expired", module_name);
  }

  return claims;
}

} // namespace relvault::security
