/**
 * @file crypto_test.cpp
 * @brief Unit tests for the OpenSSL-backed crypto helpers
 *
 * @copyright Copyright (c) 2025
 */

#include <relvault/security/crypto.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace relvault::security::crypto;

TEST_CASE("Digests match published vectors", "[security][crypto]") {
  CHECK(to_hex(sha256("abc")) ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  byte_buffer abc = {'a', 'b', 'c'};
  CHECK(to_hex(sha1(abc)) == "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_CASE("HMAC-SHA256 matches RFC 4231", "[security][crypto]") {
  byte_buffer key = {'J', 'e', 'f', 'e'};
  auto mac = hmac_sha256(key, "what do ya want for nothing?");
  REQUIRE(mac.is_ok());
  CHECK(to_hex(mac.value()) ==
        "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("random_bytes", "[security][crypto]") {
  auto a = random_bytes(32);
  auto b = random_bytes(32);
  REQUIRE(a.is_ok());
  REQUIRE(b.is_ok());
  CHECK(a.value().size() == 32);
  CHECK(a.value() != b.value());
}

TEST_CASE("constant_time_equal", "[security][crypto]") {
  byte_buffer x = {1, 2, 3};
  byte_buffer y = {1, 2, 3};
  byte_buffer z = {1, 2, 4};
  byte_buffer shorter = {1, 2};

  CHECK(constant_time_equal(x, y));
  CHECK_FALSE(constant_time_equal(x, z));
  CHECK_FALSE(constant_time_equal(x, shorter));
}

TEST_CASE("Base64", "[security][crypto]") {
  SECTION("padded standard alphabet") {
    CHECK(base64_encode(byte_buffer{'f', 'o', 'o', 'b'}) == "Zm9vYg==");
    auto decoded = base64_decode("Zm9v\nYg==");
    REQUIRE(decoded.has_value());
    CHECK(*decoded == byte_buffer{'f', 'o', 'o', 'b'});
  }

  SECTION("rejects malformed input") {
    CHECK_FALSE(base64_decode("Zm9").has_value());
    CHECK_FALSE(base64_decode("Z=9v").has_value());
    CHECK_FALSE(base64_decode("Zm9*").has_value());
  }

  SECTION("url alphabet is unpadded") {
    byte_buffer data = {0xfb, 0xff};
    CHECK(base64url_encode(data) == "-_8");
    auto decoded = base64url_decode("-_8");
    REQUIRE(decoded.has_value());
    CHECK(*decoded == data);
  }

  SECTION("url decoding rejects the standard alphabet and padding") {
    CHECK_FALSE(base64url_decode("+/8").has_value());
    CHECK_FALSE(base64url_decode("-_8=").has_value());
    CHECK_FALSE(base64url_decode("-_ 8").has_value());
    CHECK_FALSE(base64url_decode("abcde").has_value());
  }
}
