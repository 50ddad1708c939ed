/**
 * @file test_jwt.cpp
 * @brief Tests for JwtCodec (HS256/384/512) with a pinned clock.
 */

#include "authpool/jwt.hpp"

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>

namespace {

/// OpenSSL digests with a wall clock the test controls.
class PinnedClockProvider final : public authpool::CryptoProvider {
 public:
  explicit PinnedClockProvider(int64_t now) : now_(now) {}

  authpool::PrimitiveResult<std::string> Digest(
      const std::string& algorithm, const std::string& data,
      authpool::DigestEncoding encoding) const override {
    return inner_.Digest(algorithm, data, encoding);
  }
  bool ConstantTimeEqual(const std::string& a,
                         const std::string& b) const override {
    return inner_.ConstantTimeEqual(a, b);
  }
  int64_t NowSeconds() const override { return now_; }

 private:
  authpool::OpenSslProvider inner_;
  int64_t now_;
};

constexpr int64_t kNow = 1650000000;

// Header {"alg":"HS256","typ":"JWT"}, claims {"exp":1700000000,
// "iat":1600000000,"sub":"user-1"}, secret "top-secret".
const char kSignedFixture[] =
    "eyJhbGciOiJIUzI1NiIsInR5cCI6IkpXVCJ9."
    "eyJleHAiOjE3MDAwMDAwMDAsImlhdCI6MTYwMDAwMDAwMCwic3ViIjoidXNlci0xIn0."
    "MaCN_ohE4Z0ANSrGuDA87d4_XmW2II5B6dqN0dZP9y8";

const char kJwtIoToken[] =
    "eyJhbGciOiJIUzI1NiIsInR5cCI6IkpXVCJ9."
    "eyJzdWIiOiIxMjM0NTY3ODkwIiwibmFtZSI6IkpvaG4gRG9lIiwiaWF0IjoxNTE2MjM5MDIyfQ."
    "SflKxwRJSMeKKF2QT4fwpMeJf36POk6yJV_adQssw5c";

}  // namespace

TEST_CASE("JwtCodec Sign is deterministic", "[jwt][sign]") {
  PinnedClockProvider clock(kNow);
  authpool::JwtCodec jwt(clock);

  auto token = jwt.Sign({{"sub", "user-1"}, {"iat", 1600000000}}, "top-secret",
                        {{"expiresIn", 100000000}});
  REQUIRE(token.has_value());
  REQUIRE(token.value() == kSignedFixture);
}

TEST_CASE("JwtCodec Verify accepts third-party tokens", "[jwt][verify]") {
  PinnedClockProvider clock(kNow);
  authpool::JwtCodec jwt(clock);

  auto claims = jwt.Verify(kJwtIoToken, "your-256-bit-secret", {});
  REQUIRE(claims.has_value());
  REQUIRE(claims.value()["name"] == "John Doe");
  REQUIRE(claims.value()["iat"] == 1516239022);
}

TEST_CASE("JwtCodec sign options", "[jwt][sign]") {
  PinnedClockProvider clock(kNow);
  authpool::JwtCodec jwt(clock);

  SECTION("iat defaults to now") {
    auto token = jwt.Sign({{"role", "admin"}}, "s", {});
    REQUIRE(token.has_value());
    auto claims = jwt.Verify(token.value(), "s", {});
    REQUIRE(claims.has_value());
    REQUIRE(claims.value()["iat"] == kNow);
    REQUIRE(claims.value()["role"] == "admin");
  }

  SECTION("noTimestamp omits iat") {
    auto token = jwt.Sign({{"role", "admin"}}, "s", {{"noTimestamp", true}});
    auto claims = jwt.Verify(token.value(), "s", {});
    REQUIRE(claims.has_value());
    REQUIRE_FALSE(claims.value().contains("iat"));
  }

  SECTION("registered claims from options") {
    auto token = jwt.Sign(nlohmann::json::object(), "s",
                          {{"expiresIn", "2h"},
                           {"notBefore", "1m"},
                           {"audience", "api"},
                           {"issuer", "auth"},
                           {"subject", "u9"},
                           {"jwtid", "j1"}});
    REQUIRE(token.has_value());
    auto claims = jwt.Verify(token.value(), "s", {{"clockTimestamp", kNow + 60}});
    REQUIRE(claims.has_value());
    const auto& c = claims.value();
    REQUIRE(c["exp"] == kNow + 7200);
    REQUIRE(c["nbf"] == kNow + 60);
    REQUIRE(c["aud"] == "api");
    REQUIRE(c["iss"] == "auth");
    REQUIRE(c["sub"] == "u9");
    REQUIRE(c["jti"] == "j1");
  }

  SECTION("HS512 round trip") {
    auto token = jwt.Sign({{"k", 1}}, "s", {{"algorithm", "HS512"}});
    REQUIRE(token.has_value());
    REQUIRE(jwt.Verify(token.value(), "s", {}).has_value());

    auto only256 = jwt.Verify(token.value(), "s", {{"algorithms", {"HS256"}}});
    REQUIRE_FALSE(only256.has_value());
    REQUIRE(only256.get_error().message == "invalid algorithm");
  }

  SECTION("invalid inputs") {
    REQUIRE(jwt.Sign({{"a", 1}}, "", {}).get_error().message ==
            "secretOrPrivateKey must have a value");
    REQUIRE(jwt.Sign("not-an-object", "s", {}).get_error().message ==
            "payload must be a JSON object");
    REQUIRE(jwt.Sign({{"a", 1}}, "s", {{"algorithm", "RS256"}})
                .get_error()
                .message == "invalid algorithm");
    REQUIRE_FALSE(jwt.Sign({{"exp", 1}}, "s", {{"expiresIn", 60}}).has_value());
    REQUIRE_FALSE(jwt.Sign({{"a", 1}}, "s", {{"expiresIn", "soon"}}).has_value());
  }
}

TEST_CASE("JwtCodec verify failures", "[jwt][verify]") {
  PinnedClockProvider clock(kNow);
  authpool::JwtCodec jwt(clock);
  const std::string token = kSignedFixture;

  auto message = [&](const std::string& t, const std::string& secret,
                     const nlohmann::json& options) {
    auto r = jwt.Verify(t, secret, options);
    REQUIRE_FALSE(r.has_value());
    return r.get_error().message;
  };

  SECTION("structure") {
    REQUIRE(message("", "top-secret", {}) == "jwt must be provided");
    REQUIRE(message("abc.def", "top-secret", {}) == "jwt malformed");
    REQUIRE(message("a.b.c.d", "top-secret", {}) == "jwt malformed");
    REQUIRE(message("e30.e30.x$", "top-secret", {}) == "invalid token");
    REQUIRE(message(token.substr(0, token.rfind('.') + 1), "top-secret", {}) ==
            "jwt signature is required");
  }

  SECTION("key and signature") {
    REQUIRE(message(token, "", {}) == "secret or public key must be provided");
    REQUIRE(message(token, "wrong-secret", {}) == "invalid signature");

    std::string tampered = token;
    tampered[tampered.size() - 2] = (tampered[tampered.size() - 2] == 'A') ? 'B' : 'A';
    REQUIRE(message(tampered, "top-secret", {}) == "invalid signature");
  }

  SECTION("time claims") {
    // The exp second itself is still valid.
    REQUIRE(jwt.Verify(token, "top-secret", {{"clockTimestamp", 1700000000}})
                .has_value());
    REQUIRE(message(token, "top-secret", {{"clockTimestamp", 1700000001}}) ==
            "jwt expired");
    REQUIRE(jwt.Verify(token, "top-secret",
                       {{"clockTimestamp", 1700000003}, {"clockTolerance", 5}})
                .has_value());
    REQUIRE(jwt.Verify(token, "top-secret",
                       {{"clockTimestamp", 1800000000}, {"ignoreExpiration", true}})
                .has_value());
    REQUIRE(message(token, "top-secret", {{"maxAge", "1d"}}) == "maxAge exceeded");
  }

  SECTION("not before") {
    auto future = jwt.Sign(nlohmann::json::object(), "s", {{"notBefore", 3600}});
    REQUIRE(message(future.value(), "s", {}) == "jwt not active");
    REQUIRE(jwt.Verify(future.value(), "s", {{"ignoreNotBefore", true}})
                .has_value());
  }

  SECTION("audience, issuer and subject") {
    auto t = jwt.Sign(nlohmann::json::object(), "s",
                      {{"audience", "api"}, {"issuer", "auth"}, {"subject", "u9"}});
    REQUIRE(jwt.Verify(t.value(), "s", {{"audience", {"web", "api"}}}).has_value());
    REQUIRE(message(t.value(), "s", {{"audience", {"web", "cli"}}}) ==
            "jwt audience invalid. expected: web or cli");
    REQUIRE(message(t.value(), "s", {{"issuer", "other"}}) ==
            "jwt issuer invalid. expected: other");
    REQUIRE(message(t.value(), "s", {{"subject", "u1"}}) ==
            "jwt subject invalid. expected: u1");
  }

  SECTION("maxAge needs iat") {
    auto t = jwt.Sign(nlohmann::json::object(), "s", {{"noTimestamp", true}});
    REQUIRE(message(t.value(), "s", {{"maxAge", 60}}) ==
            "iat required when maxAge is specified");
  }
}

TEST_CASE("ParseTimespan units and limits", "[jwt]") {
  using authpool::detail::ParseTimespan;
  REQUIRE(ParseTimespan(90).value() == 90);
  REQUIRE(ParseTimespan(-30).value() == -30);
  REQUIRE(ParseTimespan(2.9).value() == 2);
  REQUIRE(ParseTimespan("90s").value() == 90);
  REQUIRE(ParseTimespan("15m").value() == 900);
  REQUIRE(ParseTimespan("2 hours").value() == 7200);
  REQUIRE(ParseTimespan("7d").value() == 604800);
  REQUIRE(ParseTimespan("1500").value() == 1);

  REQUIRE_FALSE(ParseTimespan("soon").has_value());
  REQUIRE_FALSE(ParseTimespan("10 fortnights").has_value());
  REQUIRE_FALSE(ParseTimespan("99999999999999999999").has_value());
  REQUIRE_FALSE(ParseTimespan("99999999999999999999y").has_value());
  REQUIRE_FALSE(ParseTimespan("1000y").has_value());
  REQUIRE_FALSE(ParseTimespan(1e300).has_value());
  REQUIRE_FALSE(ParseTimespan(std::numeric_limits<int64_t>::min()).has_value());
  REQUIRE_FALSE(ParseTimespan(std::numeric_limits<uint64_t>::max()).has_value());
}

TEST_CASE("JwtCodec extreme time claims", "[jwt][verify]") {
  PinnedClockProvider clock(kNow);
  authpool::JwtCodec jwt(clock);
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();

  SECTION("oversized spans are rejected at signing") {
    auto a = jwt.Sign({{"a", 1}}, "s", {{"expiresIn", "99999999999999999999"}});
    REQUIRE_FALSE(a.has_value());
    REQUIRE(a.get_error().message ==
            "\"expiresIn\" should be a number of seconds or string representing "
            "a timespan");
    REQUIRE_FALSE(jwt.Sign({{"a", 1}}, "s", {{"expiresIn", 1e300}}).has_value());
    REQUIRE_FALSE(jwt.Sign({{"a", 1}}, "s", {{"notBefore", kMax}}).has_value());
    REQUIRE_FALSE(jwt.Sign({{"iat", kMax}}, "s", {{"expiresIn", 60}}).has_value());
  }

  SECTION("far-future exp never expires") {
    auto t = jwt.Sign({{"exp", kMax}}, "s", {});
    REQUIRE(t.has_value());
    auto claims = jwt.Verify(t.value(), "s", {{"clockTolerance", 10}});
    REQUIRE(claims.has_value());
    REQUIRE(claims.value()["exp"] == kMax);
  }

  SECTION("far-future nbf is not active") {
    auto t = jwt.Sign({{"nbf", kMax}}, "s", {});
    REQUIRE(t.has_value());
    auto r = jwt.Verify(t.value(), "s", {{"clockTolerance", 1e300}});
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error().message == "jwt not active");
  }

  SECTION("non-integer or negative times are invalid") {
    auto fexp = jwt.Sign({{"exp", 1e300}}, "s", {});
    REQUIRE(fexp.has_value());
    REQUIRE(jwt.Verify(fexp.value(), "s", {}).get_error().message ==
            "invalid exp value");
    REQUIRE(jwt.Verify(fexp.value(), "s", {{"ignoreExpiration", true}}).has_value());

    auto nnbf = jwt.Sign({{"nbf", -5}}, "s", {});
    REQUIRE(jwt.Verify(nnbf.value(), "s", {}).get_error().message ==
            "invalid nbf value");

    auto fiat = jwt.Sign({{"k", 1}}, "s", {{"noTimestamp", true}});
    REQUIRE(jwt.Verify(fiat.value(), "s", {{"clockTimestamp", kMax}})
                .get_error()
                .message == "clockTimestamp must be a number");
  }

  SECTION("forged token reports the signature first") {
    auto fexp = jwt.Sign({{"exp", 1e300}}, "s", {});
    REQUIRE(jwt.Verify(fexp.value(), "other", {}).get_error().message ==
            "invalid signature");
  }

  SECTION("maxAge with huge values") {
    auto t = jwt.Sign({{"k", 1}}, "s", {});
    REQUIRE(jwt.Verify(t.value(), "s", {{"maxAge", "100y"}, {"clockTolerance", 1e300}})
                .has_value());
    REQUIRE(jwt.Verify(t.value(), "s", {{"maxAge", "99999999999999999999y"}})
                .get_error()
                .message ==
            "\"maxAge\" should be a number of seconds or string representing a "
            "timespan");
  }
}
