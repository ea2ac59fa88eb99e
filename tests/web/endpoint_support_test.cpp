/**
 * @file endpoint_support_test.cpp
 * @brief Unit tests for bearer authentication of protected endpoints
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include "crow.h"

#include "web/endpoints/endpoint_support.hpp"

#include "mocks/in_memory_token_store.hpp"
#include "mocks/test_clock.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

using namespace relvault;
using namespace relvault::web;

namespace {

auto make_context(std::shared_ptr<const security::token_service> tokens)
    -> rest_server_context {
  rest_server_context ctx;
  ctx.storage = std::make_shared<storage::storage_context>(
      storage::database_config{}, std::filesystem::path("keys"),
      std::move(tokens));
  return ctx;
}

auto make_tokens(std::shared_ptr<test::test_clock> clock)
    -> std::shared_ptr<security::token_service> {
  auto secret = security::signing_secret::generate();
  REQUIRE(secret.is_ok());
  return std::make_shared<security::token_service>(
      std::move(secret.value()), security::token_config{}, std::move(clock));
}

auto bearer_request(const std::string &value) -> crow::request {
  crow::request req;
  req.add_header("Authorization", value);
  return req;
}

} // namespace

TEST_CASE("authenticate without configured storage", "[web][auth]") {
  rest_server_context ctx;
  auto req = bearer_request("Bearer abc.def.ghi");

  auto who = endpoints::detail::authenticate(ctx, req);
  REQUIRE(who.is_err());
  CHECK(who.error().code == error_codes::unavailable);
  CHECK(status_for(who.error().code) == http_status::service_unavailable);
}

TEST_CASE("authenticate with configured storage", "[web][auth]") {
  auto clock = std::make_shared<test::test_clock>();
  auto tokens = make_tokens(clock);
  auto ctx = make_context(tokens);

  SECTION("missing header") {
    crow::request req;
    auto who = endpoints::detail::authenticate(ctx, req);
    REQUIRE(who.is_err());
    CHECK(who.error().code == error_codes::unauthenticated);
  }

  SECTION("not a bearer credential") {
    auto who = endpoints::detail::authenticate(ctx, bearer_request("Basic Zm9vOmJhcg=="));
    REQUIRE(who.is_err());
    CHECK(who.error().code == error_codes::malformed_token);
  }

  SECTION("undecodable token") {
    auto who = endpoints::detail::authenticate(ctx, bearer_request("Bearer a.b"));
    REQUIRE(who.is_err());
    CHECK(who.error().code == error_codes::malformed_token);
    CHECK(status_for(who.error().code) == http_status::unauthorized);
  }

  SECTION("valid session token") {
    test::in_memory_token_store store;
    test::static_identity_provider identity{{"alice"}, {}};
    auto pat = tokens->issue_pat(store, identity, security::principal("alice"), "ci");
    REQUIRE(pat.is_ok());
    auto jwt = tokens->issue_jwt(store, security::principal("alice"),
                                 pat.value().plaintext);
    REQUIRE(jwt.is_ok());

    auto who = endpoints::detail::authenticate(
        ctx, bearer_request("Bearer " + jwt.value().encoded));
    REQUIRE(who.is_ok());
    CHECK(who.value().uid() == "alice");
  }

  SECTION("expired session token") {
    test::in_memory_token_store store;
    test::static_identity_provider identity{{"alice"}, {}};
    auto pat = tokens->issue_pat(store, identity, security::principal("alice"), "ci");
    REQUIRE(pat.is_ok());
    auto jwt = tokens->issue_jwt(store, security::principal("alice"),
                                 pat.value().plaintext);
    REQUIRE(jwt.is_ok());

    clock->advance(std::chrono::minutes(91));
    auto who = endpoints::detail::authenticate(
        ctx, bearer_request("Bearer " + jwt.value().encoded));
    REQUIRE(who.is_err());
    CHECK(who.error().code == error_codes::token_expired);
  }
}
