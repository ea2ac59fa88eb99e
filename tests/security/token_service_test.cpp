/**
 * @file token_service_test.cpp
 * @brief Unit tests for PAT issuance and JWT exchange/verification
 *
 * @copyright Copyright (c) 2025
 */

#include <relvault/security/crypto.hpp>
#include <relvault/security/token_service.hpp>

#include "mocks/in_memory_token_store.hpp"
#include "mocks/test_clock.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <string>

using namespace relvault;
using namespace relvault::security;
using namespace std::chrono_literals;

namespace {

struct token_fixture {
  std::shared_ptr<test::test_clock> clock = std::make_shared<test::test_clock>();
  test::in_memory_token_store store;
  test::static_identity_provider identity{{"alice", "bob", "root"}, {"root"}};
  token_service service{make_secret(), token_config{}, clock};

  static auto make_secret() -> signing_secret {
    auto secret = signing_secret::generate();
    REQUIRE(secret.is_ok());
    return std::move(secret.value());
  }

  auto issue(const std::string &uid) -> issued_pat {
    auto issued = service.issue_pat(store, identity, principal(uid), "test");
    REQUIRE(issued.is_ok());
    return issued.value();
  }
};

} // namespace

TEST_CASE("PAT issuance", "[security][token]") {
  token_fixture f;

  SECTION("only the hash is stored") {
    auto pat = f.issue("alice");
    REQUIRE(f.store.all().size() == 1);
    const auto &stored = f.store.all().front();
    CHECK(stored.asf_uid == "alice");
    CHECK(stored.label == "test");
    CHECK(stored.token_hash == token_service::hash_pat(pat.plaintext));
    CHECK(stored.token_hash != pat.plaintext);
    CHECK(stored.expires - stored.created == f.service.config().pat_lifetime);
    CHECK(pat.token.id == stored.id);
  }

  SECTION("plaintexts are unique") {
    auto a = f.issue("alice");
    auto b = f.issue("alice");
    CHECK(a.plaintext != b.plaintext);
  }

  SECTION("unknown accounts cannot obtain a PAT") {
    auto issued = f.service.issue_pat(f.store, f.identity, principal("mallory"));
    REQUIRE(issued.is_err());
    CHECK(issued.error().code == error_codes::unauthenticated);
    CHECK(f.store.all().empty());
  }

  SECTION("listing is per owner") {
    (void)f.issue("alice");
    (void)f.issue("bob");
    auto listed = f.service.list_pats(f.store, principal("alice"));
    REQUIRE(listed.is_ok());
    REQUIRE(listed.value().size() == 1);
    CHECK(listed.value().front().asf_uid == "alice");
  }
}

TEST_CASE("PAT revocation", "[security][token]") {
  token_fixture f;
  auto pat = f.issue("alice");

  SECTION("owner may revoke") {
    auto revoked = f.service.revoke_pat(f.store, f.identity, principal("alice"),
                                        pat.token.id);
    REQUIRE(revoked.is_ok());
    CHECK(revoked.value().revoked);
    CHECK(f.store.all().front().revoked);
  }

  SECTION("administrator may revoke") {
    auto revoked = f.service.revoke_pat(f.store, f.identity, principal("root"),
                                        pat.token.id);
    CHECK(revoked.is_ok());
  }

  SECTION("others may not") {
    auto revoked = f.service.revoke_pat(f.store, f.identity, principal("bob"),
                                        pat.token.id);
    REQUIRE(revoked.is_err());
    CHECK(revoked.error().code == error_codes::forbidden);
    CHECK_FALSE(f.store.all().front().revoked);
  }

  SECTION("unknown id") {
    auto revoked = f.service.revoke_pat(f.store, f.identity, principal("alice"), 999);
    REQUIRE(revoked.is_err());
    CHECK(revoked.error().code == error_codes::not_found);
  }
}

TEST_CASE("PAT to JWT exchange", "[security][token]") {
  token_fixture f;
  auto pat = f.issue("alice");

  SECTION("valid PAT yields a verifiable JWT") {
    auto jwt = f.service.issue_jwt(f.store, principal("alice"), pat.plaintext);
    REQUIRE(jwt.is_ok());
    CHECK(jwt.value().claims.subject == "alice");
    CHECK(jwt.value().claims.expires_at - jwt.value().claims.issued_at ==
          std::chrono::minutes(90));

    auto verified = f.service.verify_jwt(jwt.value().encoded);
    REQUIRE(verified.is_ok());
    CHECK(verified.value().uid() == "alice");
  }

  SECTION("each exchange gets its own token id") {
    auto a = f.service.issue_jwt(f.store, principal("alice"), pat.plaintext);
    auto b = f.service.issue_jwt(f.store, principal("alice"), pat.plaintext);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK(a.value().claims.token_id != b.value().claims.token_id);
    CHECK(a.value().encoded != b.value().encoded);
  }

  SECTION("wrong plaintext") {
    auto jwt = f.service.issue_jwt(f.store, principal("alice"), "not-a-pat");
    REQUIRE(jwt.is_err());
    CHECK(jwt.error().code == error_codes::invalid_credential);
  }

  SECTION("PAT of another account") {
    auto jwt = f.service.issue_jwt(f.store, principal("bob"), pat.plaintext);
    REQUIRE(jwt.is_err());
    CHECK(jwt.error().code == error_codes::invalid_credential);
  }

  SECTION("expired PAT") {
    f.clock->advance(f.service.config().pat_lifetime + 1s);
    auto jwt = f.service.issue_jwt(f.store, principal("alice"), pat.plaintext);
    REQUIRE(jwt.is_err());
    CHECK(jwt.error().code == error_codes::token_expired);
  }

  SECTION("revoked PAT") {
    REQUIRE(f.service
                .revoke_pat(f.store, f.identity, principal("alice"), pat.token.id)
                .is_ok());
    auto jwt = f.service.issue_jwt(f.store, principal("alice"), pat.plaintext);
    REQUIRE(jwt.is_err());
    CHECK(jwt.error().code == error_codes::token_revoked);
  }
}

TEST_CASE("JWT verification", "[security][token]") {
  token_fixture f;
  auto pat = f.issue("alice");
  auto jwt = f.service.issue_jwt(f.store, principal("alice"), pat.plaintext);
  REQUIRE(jwt.is_ok());
  const auto encoded = jwt.value().encoded;

  SECTION("valid until the lifetime elapses") {
    f.clock->advance(89min);
    CHECK(f.service.verify_jwt(encoded).is_ok());

    f.clock->advance(2min);
    auto late = f.service.verify_jwt(encoded);
    REQUIRE(late.is_err());
    CHECK(late.error().code == error_codes::token_expired);
  }

  SECTION("a service with a different secret rejects the signature") {
    token_service other(token_fixture::make_secret(), token_config{}, f.clock);
    auto result = other.verify_jwt(encoded);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::invalid_signature);
  }

  SECTION("tampered payload") {
    auto first = encoded.find('.');
    auto second = encoded.find('.', first + 1);
    auto forged_payload = crypto::base64url_encode(std::string_view(
        R"({"sub":"root","iat":1700000000,"exp":1900000000,"jti":"x"})"));
    auto forged = encoded.substr(0, first + 1) + forged_payload +
                  encoded.substr(second);
    auto result = f.service.verify_jwt(forged);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::invalid_signature);
  }

  SECTION("malformed tokens") {
    for (std::string bad : {"", "abc", "a.b", "a.b.c.d", "!!!.###.$$$"}) {
      auto result = f.service.verify_jwt(bad);
      REQUIRE(result.is_err());
      CHECK(result.error().code == error_codes::malformed_token);
    }
  }
}

TEST_CASE("Signing secrets need enough entropy", "[security][token]") {
  auto weak = signing_secret::generate(8);
  REQUIRE(weak.is_err());
  CHECK(weak.error().code == error_codes::crypto_failure);
}
