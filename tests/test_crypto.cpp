/**
 * @file test_crypto.cpp
 * @brief Tests for the OpenSSL-backed CryptoProvider.
 */

#include "authpool/crypto.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

static const char kSha256Abc[] =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

TEST_CASE("Digest known answers", "[crypto]") {
  authpool::OpenSslProvider p;

  auto hex = p.Digest("sha256", "abc", authpool::DigestEncoding::kHex);
  REQUIRE(hex.has_value());
  REQUIRE(hex.value() == kSha256Abc);

  auto b64 = p.Digest("sha256", "abc", authpool::DigestEncoding::kBase64);
  REQUIRE(b64.has_value());
  REQUIRE(b64.value() == "ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0=");

  auto sha512 = p.Digest("sha512", "abc", authpool::DigestEncoding::kHex);
  REQUIRE(sha512.has_value());
  REQUIRE(sha512.value().size() == 128U);
  REQUIRE(sha512.value().substr(0, 16) == "ddaf35a193617aba");
}

TEST_CASE("Digest rejects unknown algorithms", "[crypto]") {
  authpool::OpenSslProvider p;
  auto r = p.Digest("sha999", "abc", authpool::DigestEncoding::kHex);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error().message == "Digest method not supported");
}

TEST_CASE("ParseDigestEncoding", "[crypto]") {
  REQUIRE(authpool::ParseDigestEncoding("hex").value() ==
          authpool::DigestEncoding::kHex);
  REQUIRE(authpool::ParseDigestEncoding("base64").value() ==
          authpool::DigestEncoding::kBase64);
  REQUIRE_FALSE(authpool::ParseDigestEncoding("latin1").has_value());
}

TEST_CASE("ConstantTimeEqual length mismatch", "[crypto]") {
  authpool::OpenSslProvider p;
  REQUIRE(p.ConstantTimeEqual("abc", "abc"));
  REQUIRE_FALSE(p.ConstantTimeEqual("abc", "abcd"));
  REQUIRE_FALSE(p.ConstantTimeEqual("abc", "abd"));
}

TEST_CASE("DefaultCryptoProvider is shared", "[crypto]") {
  auto a = authpool::DefaultCryptoProvider();
  auto b = authpool::DefaultCryptoProvider();
  REQUIRE(a.get() == b.get());
  REQUIRE(a->NowSeconds() > 1600000000);
}
