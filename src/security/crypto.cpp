/**
 * @file crypto.cpp
 * @brief OpenSSL-backed implementation of the crypto helpers
 *
 * @copyright Copyright (c) 2025
 */

#include "relvault/security/crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>

namespace relvault::security::crypto {

namespace {

/**
 * @brief Get OpenSSL error string
 */
auto get_openssl_error() -> std::string {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return "Unknown error";
  }
  char buf[256];
  ERR_error_string_n(err, buf, sizeof(buf));
  return std::string(buf);
}

auto digest(const EVP_MD *md, const void *data, std::size_t size)
    -> byte_buffer {
  byte_buffer out(EVP_MAX_MD_SIZE);
  unsigned int out_len = 0;
  if (EVP_Digest(data, size, out.data(), &out_len, md, nullptr) != 1) {
    return {};
  }
  out.resize(out_len);
  return out;
}

bool is_base64_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

} // namespace

auto random_bytes(std::size_t count) -> Result<byte_buffer> {
  byte_buffer out(count);
  if (count > 0 &&
      RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    return relvault_error<byte_buffer>(error_codes::crypto_failure,
                                       "RAND_bytes failed: " +
                                           get_openssl_error(),
                                       "crypto");
  }
  return out;
}

auto sha256(std::string_view data) -> byte_buffer {
  return digest(EVP_sha256(), data.data(), data.size());
}

auto sha1(const byte_buffer &data) -> byte_buffer {
  return digest(EVP_sha1(), data.data(), data.size());
}

auto hmac_sha256(const byte_buffer &key, std::string_view data)
    -> Result<byte_buffer> {
  byte_buffer out(EVP_MAX_MD_SIZE);
  unsigned int out_len = 0;
  auto *res = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                   reinterpret_cast<const unsigned char *>(data.data()),
                   data.size(), out.data(), &out_len);
  if (res == nullptr) {
    return relvault_error<byte_buffer>(error_codes::crypto_failure,
                                       "HMAC failed: " + get_openssl_error(),
                                       "crypto");
  }
  out.resize(out_len);
  return out;
}

bool constant_time_equal(const byte_buffer &a, const byte_buffer &b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

auto to_hex(const byte_buffer &data) -> std::string {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (auto b : data) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0F]);
  }
  return out;
}

auto base64_encode(const byte_buffer &data) -> std::string {
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                          data.data(), static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(std::max(n, 0)));
  return out;
}

auto base64_decode(std::string_view text) -> std::optional<byte_buffer> {
  std::string clean;
  clean.reserve(text.size());
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      continue;
    }
    clean.push_back(c);
  }
  if (clean.size() % 4 != 0) {
    return std::nullopt;
  }

  std::size_t padding = 0;
  for (std::size_t i = 0; i < clean.size(); ++i) {
    char c = clean[i];
    if (c == '=') {
      // Padding may only appear in the last two positions
      if (i + 2 < clean.size()) {
        return std::nullopt;
      }
      ++padding;
    } else if (!is_base64_char(c) || padding > 0) {
      return std::nullopt;
    }
  }

  byte_buffer out(3 * (clean.size() / 4));
  if (clean.empty()) {
    return out;
  }
  int n = EVP_DecodeBlock(out.data(),
                          reinterpret_cast<const unsigned char *>(clean.data()),
                          static_cast<int>(clean.size()));
  if (n < 0) {
    return std::nullopt;
  }
  out.resize(static_cast<std::size_t>(n) - padding);
  return out;
}

auto base64url_encode(const byte_buffer &data) -> std::string {
  auto out = base64_encode(data);
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  std::replace(out.begin(), out.end(), '+', '-');
  std::replace(out.begin(), out.end(), '/', '_');
  return out;
}

auto base64url_encode(std::string_view data) -> std::string {
  return base64url_encode(byte_buffer(data.begin(), data.end()));
}

auto base64url_decode(std::string_view text) -> std::optional<byte_buffer> {
  if (text.size() % 4 == 1) {
    return std::nullopt;
  }
  std::string std_text;
  std_text.reserve(text.size() + 2);
  for (char c : text) {
    if (c == '+' || c == '/' || c == '=' ||
        std::isspace(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    std_text.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
  }
  while (std_text.size() % 4 != 0) {
    std_text.push_back('=');
  }
  return base64_decode(std_text);
}

} // namespace relvault::security::crypto
