/**
 * @file jwt.hpp
 * @brief HMAC JSON Web Token signing and verification on jwt-cpp.
 *
 * Supported algorithms: HS256, HS384, HS512.
 *
 * Sign options : algorithm, expiresIn, notBefore, audience, issuer, subject,
 *                jwtid, keyid, noTimestamp
 * Verify options: algorithms, audience, issuer, subject, ignoreExpiration,
 *                ignoreNotBefore, clockTolerance, maxAge, clockTimestamp
 *
 * Time spans (expiresIn, notBefore, maxAge) are either a number of seconds
 * or a string such as "90s", "15m", "2h", "7d". A bare numeric string is
 * read as milliseconds.
 *
 * Encoding, HMAC and the exp/nbf/iss/sub/aud checks run inside jwt-cpp.
 * This header translates options and maps jwt-cpp errors onto the
 * jsonwebtoken messages. exp, nbf and iat must be integers in
 * [0, kMaxClaimSeconds] before they reach jwt-cpp's system_clock dates.
 */

#ifndef AUTHPOOL_JWT_HPP_
#define AUTHPOOL_JWT_HPP_

#include "authpool/crypto.hpp"
#include "authpool/log.hpp"

#include <jwt-cpp/traits/nlohmann-json/defaults.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <string>
#include <system_error>
#include <vector>

namespace authpool {

/// Latest exp/nbf/iat that fits a nanosecond system_clock with tolerance
/// added (year 2128).
inline constexpr int64_t kMaxClaimSeconds = 5000000000;
inline constexpr int64_t kMaxTimespanSeconds = kMaxClaimSeconds;
inline constexpr int64_t kMaxClockToleranceSeconds = 3000000000;

enum class JwtAlgorithm : uint8_t { kHs256 = 0, kHs384, kHs512 };

namespace detail {

using JwtTraits = jwt::traits::nlohmann_json;
using JwtCheckContext = jwt::verify_ops::verify_context<JwtTraits>;

inline optional<JwtAlgorithm> ParseJwtAlgorithm(const std::string& alg) {
  if (alg == "HS256") return optional<JwtAlgorithm>(JwtAlgorithm::kHs256);
  if (alg == "HS384") return optional<JwtAlgorithm>(JwtAlgorithm::kHs384);
  if (alg == "HS512") return optional<JwtAlgorithm>(JwtAlgorithm::kHs512);
  return optional<JwtAlgorithm>();
}

/**
 * @brief Seconds from a number or a "<n><unit>" string.
 *
 * Values whose magnitude exceeds kMaxTimespanSeconds are rejected.
 */
inline optional<int64_t> ParseTimespan(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    const uint64_t v = value.get<uint64_t>();
    if (v > static_cast<uint64_t>(kMaxTimespanSeconds)) return optional<int64_t>();
    return optional<int64_t>(static_cast<int64_t>(v));
  }
  if (value.is_number_integer()) {
    const int64_t v = value.get<int64_t>();
    if (v > kMaxTimespanSeconds || v < -kMaxTimespanSeconds) {
      return optional<int64_t>();
    }
    return optional<int64_t>(v);
  }
  if (value.is_number_float()) {
    const double v = value.get<double>();
    if (!std::isfinite(v) || std::fabs(v) > static_cast<double>(kMaxTimespanSeconds)) {
      return optional<int64_t>();
    }
    return optional<int64_t>(static_cast<int64_t>(v));
  }
  if (!value.is_string()) return optional<int64_t>();

  const std::string& s = value.get_ref<const std::string&>();
  // Milliseconds is the finest unit, so n never needs to exceed this.
  constexpr int64_t kDigitLimit = kMaxTimespanSeconds * 1000;
  size_t i = 0U;
  int64_t n = 0;
  while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
    n = n * 10 + (s[i] - '0');
    if (n > kDigitLimit) return optional<int64_t>();
    ++i;
  }
  if (i == 0U) return optional<int64_t>();
  while (i < s.size() && s[i] == ' ') ++i;
  const std::string unit = s.substr(i);

  int64_t scale = 0;
  if (unit.empty() || unit == "ms") {
    return optional<int64_t>(n / 1000);
  } else if (unit == "s" || unit == "sec" || unit == "secs" || unit == "seconds") {
    scale = 1;
  } else if (unit == "m" || unit == "min" || unit == "mins" || unit == "minutes") {
    scale = 60;
  } else if (unit == "h" || unit == "hr" || unit == "hrs" || unit == "hours") {
    scale = 3600;
  } else if (unit == "d" || unit == "day" || unit == "days") {
    scale = 86400;
  } else if (unit == "w" || unit == "week" || unit == "weeks") {
    scale = 604800;
  } else if (unit == "y" || unit == "year" || unit == "years") {
    scale = 31557600;
  } else {
    return optional<int64_t>();
  }
  if (n > kMaxTimespanSeconds / scale) return optional<int64_t>();
  return optional<int64_t>(n * scale);
}

enum class ClaimTime : uint8_t {
  kAbsent = 0,
  kValid,
  kBeyondRange,  ///< Integer later than kMaxClaimSeconds.
  kInvalid,      ///< Not an integer, or negative.
};

inline ClaimTime ReadClaimTime(const nlohmann::json& claims, const char* name,
                               int64_t* out) {
  auto it = claims.find(name);
  if (it == claims.end()) return ClaimTime::kAbsent;
  if (it->is_number_unsigned()) {
    const uint64_t v = it->get<uint64_t>();
    if (v > static_cast<uint64_t>(kMaxClaimSeconds)) return ClaimTime::kBeyondRange;
    *out = static_cast<int64_t>(v);
    return ClaimTime::kValid;
  }
  if (it->is_number_integer()) {
    const int64_t v = it->get<int64_t>();
    if (v < 0) return ClaimTime::kInvalid;
    if (v > kMaxClaimSeconds) return ClaimTime::kBeyondRange;
    *out = v;
    return ClaimTime::kValid;
  }
  return ClaimTime::kInvalid;
}

inline std::vector<std::string> StringList(const nlohmann::json& value) {
  std::vector<std::string> out;
  if (value.is_string()) {
    out.push_back(value.get<std::string>());
  } else if (value.is_array()) {
    for (const auto& v : value) {
      if (v.is_string()) out.push_back(v.get<std::string>());
    }
  }
  return out;
}

inline std::string JoinList(const std::vector<std::string>& items) {
  std::string out;
  for (size_t i = 0U; i < items.size(); ++i) {
    if (i != 0U) out += " or ";
    out += items[i];
  }
  return out;
}

inline const nlohmann::json* FindOption(const nlohmann::json& options,
                                        const char* key) {
  if (!options.is_object()) return nullptr;
  auto it = options.find(key);
  if (it == options.end() || it->is_null()) return nullptr;
  return &*it;
}

inline bool OptionFlag(const nlohmann::json& options, const char* key) {
  const nlohmann::json* v = FindOption(options, key);
  return v != nullptr && v->is_boolean() && v->get<bool>();
}

inline jwt::date DateFromSeconds(int64_t seconds) {
  return jwt::date(std::chrono::seconds(seconds));
}

/// Verifier clock pinned to the caller's "now".
struct PinnedJwtClock {
  jwt::date at;
  jwt::date now() const { return at; }
};

inline void SkipClaimCheck(const JwtCheckContext& /*ctx*/, std::error_code& /*ec*/) {}

/**
 * @brief First audience/issuer/subject option the claims fail, in
 *        jsonwebtoken order. Empty when all match.
 */
inline std::string ClaimOptionMismatch(const nlohmann::json& claims,
                                       const nlohmann::json& options) {
  if (const nlohmann::json* aud = FindOption(options, "audience")) {
    const auto wanted = StringList(*aud);
    const auto present = claims.contains("aud") ? StringList(claims.at("aud"))
                                                : std::vector<std::string>{};
    bool match = false;
    for (const auto& w : wanted) {
      for (const auto& p : present) match = match || (w == p);
    }
    if (!match) return "jwt audience invalid. expected: " + JoinList(wanted);
  }

  if (const nlohmann::json* iss = FindOption(options, "issuer")) {
    const auto wanted = StringList(*iss);
    auto claim = claims.find("iss");
    bool match = false;
    if (claim != claims.end() && claim->is_string()) {
      for (const auto& w : wanted) match = match || (w == claim->get<std::string>());
    }
    if (!match) return "jwt issuer invalid. expected: " + JoinList(wanted);
  }

  if (const nlohmann::json* sub = FindOption(options, "subject")) {
    const std::string wanted = sub->is_string() ? sub->get<std::string>() : std::string();
    auto claim = claims.find("sub");
    if (!sub->is_string() || claim == claims.end() || !claim->is_string() ||
        claim->get<std::string>() != wanted) {
      return "jwt subject invalid. expected: " + wanted;
    }
  }
  return std::string();
}

}  // namespace detail

// ============================================================================
// JwtCodec
// ============================================================================

class JwtCodec {
 public:
  /// @p provider supplies the clock.
  explicit JwtCodec(const CryptoProvider& provider) noexcept
      : provider_(provider) {}

  PrimitiveResult<std::string> Sign(const nlohmann::json& claims,
                                    const std::string& secret,
                                    const nlohmann::json& options) const {
    using R = PrimitiveResult<std::string>;
    if (secret.empty()) {
      return R::error(PrimitiveError{"secretOrPrivateKey must have a value"});
    }
    if (!claims.is_object()) {
      return R::error(PrimitiveError{"payload must be a JSON object"});
    }

    JwtAlgorithm alg = JwtAlgorithm::kHs256;
    if (const nlohmann::json* a = detail::FindOption(options, "algorithm")) {
      optional<JwtAlgorithm> parsed = a->is_string()
                                          ? detail::ParseJwtAlgorithm(a->get<std::string>())
                                          : optional<JwtAlgorithm>();
      if (!parsed.has_value()) return R::error(PrimitiveError{"invalid algorithm"});
      alg = parsed.value();
    }

    auto builder = jwt::create();
    builder.set_type("JWT");
    for (auto it = claims.begin(); it != claims.end(); ++it) {
      builder.set_payload_claim(it.key(), jwt::claim(it.value()));
    }

    int64_t timestamp = provider_.NowSeconds();
    switch (detail::ReadClaimTime(claims, "iat", &timestamp)) {
      case detail::ClaimTime::kAbsent:
        if (!detail::OptionFlag(options, "noTimestamp")) {
          builder.set_issued_at(detail::DateFromSeconds(timestamp));
        }
        break;
      case detail::ClaimTime::kValid:
        break;
      case detail::ClaimTime::kBeyondRange:
      case detail::ClaimTime::kInvalid:
        return R::error(PrimitiveError{"\"iat\" should be a number of seconds"});
    }

    if (const nlohmann::json* v = detail::FindOption(options, "expiresIn")) {
      if (claims.contains("exp")) {
        return R::error(PrimitiveError{
            "Bad \"options.expiresIn\" option the payload already has an "
            "\"exp\" property."});
      }
      auto at = ClaimFromSpan(timestamp, *v);
      if (!at.has_value()) {
        return R::error(PrimitiveError{
            "\"expiresIn\" should be a number of seconds or string representing "
            "a timespan"});
      }
      builder.set_expires_at(detail::DateFromSeconds(at.value()));
    }
    if (const nlohmann::json* v = detail::FindOption(options, "notBefore")) {
      auto at = ClaimFromSpan(timestamp, *v);
      if (!at.has_value()) {
        return R::error(PrimitiveError{
            "\"notBefore\" should be a number of seconds or string representing "
            "a timespan"});
      }
      builder.set_not_before(detail::DateFromSeconds(at.value()));
    }

    if (const nlohmann::json* aud = detail::FindOption(options, "audience")) {
      if (aud->is_string()) {
        builder.set_audience(aud->get<std::string>());
      } else if (aud->is_array()) {
        builder.set_audience(aud->get<nlohmann::json::array_t>());
      } else {
        return R::error(PrimitiveError{"\"audience\" must be a string or array"});
      }
    }
    static const struct {
      const char* option;
      const char* claim;
    } kStringClaims[] = {{"issuer", "iss"}, {"subject", "sub"}, {"jwtid", "jti"}};
    for (const auto& m : kStringClaims) {
      if (const nlohmann::json* v = detail::FindOption(options, m.option)) {
        if (!v->is_string()) {
          return R::error(
              PrimitiveError{std::string("\"") + m.option + "\" must be a string"});
        }
        builder.set_payload_claim(m.claim, jwt::claim(v->get<std::string>()));
      }
    }
    if (const nlohmann::json* kid = detail::FindOption(options, "keyid")) {
      if (!kid->is_string()) {
        return R::error(PrimitiveError{"\"keyid\" must be a string"});
      }
      builder.set_key_id(kid->get<std::string>());
    }

    std::error_code ec;
    std::string token;
    switch (alg) {
      case JwtAlgorithm::kHs256:
        token = builder.sign(jwt::algorithm::hs256{secret}, ec);
        break;
      case JwtAlgorithm::kHs384:
        token = builder.sign(jwt::algorithm::hs384{secret}, ec);
        break;
      case JwtAlgorithm::kHs512:
        token = builder.sign(jwt::algorithm::hs512{secret}, ec);
        break;
    }
    if (ec) return R::error(PrimitiveError{ec.message()});
    return R::success(std::move(token));
  }

  PrimitiveResult<nlohmann::json> Verify(const std::string& token,
                                         const std::string& secret,
                                         const nlohmann::json& options) const {
    using R = PrimitiveResult<nlohmann::json>;
    if (token.empty()) return R::error(PrimitiveError{"jwt must be provided"});

    const size_t dot1 = token.find('.');
    const size_t dot2 =
        (dot1 == std::string::npos) ? dot1 : token.find('.', dot1 + 1U);
    if (dot2 == std::string::npos ||
        token.find('.', dot2 + 1U) != std::string::npos) {
      return R::error(PrimitiveError{"jwt malformed"});
    }

    nlohmann::json claims;
    try {
      auto decoded = jwt::decode(token);
      claims = nlohmann::json::parse(decoded.get_payload());
      if (!claims.is_object()) return R::error(PrimitiveError{"invalid token"});
      if (dot2 + 1U == token.size()) {
        return R::error(PrimitiveError{"jwt signature is required"});
      }
      if (secret.empty()) {
        return R::error(PrimitiveError{"secret or public key must be provided"});
      }
      return VerifyDecoded(decoded, claims, secret, options);
    } catch (const std::exception& e) {
      AUTHPOOL_LOG_DEBUG("Jwt", "token rejected: %s", e.what());
      return R::error(PrimitiveError{"invalid token"});
    }
  }

 private:
  using Decoded = decltype(jwt::decode(std::string()));

  static optional<int64_t> ClaimFromSpan(int64_t timestamp,
                                         const nlohmann::json& span) {
    auto seconds = detail::ParseTimespan(span);
    if (!seconds.has_value()) return optional<int64_t>();
    // Both operands are bounded by kMaxClaimSeconds.
    const int64_t at = timestamp + seconds.value();
    if (at < 0 || at > kMaxClaimSeconds) return optional<int64_t>();
    return optional<int64_t>(at);
  }

  PrimitiveResult<nlohmann::json> VerifyDecoded(const Decoded& decoded,
                                                const nlohmann::json& claims,
                                                const std::string& secret,
                                                const nlohmann::json& options) const {
    using R = PrimitiveResult<nlohmann::json>;

    int64_t now = provider_.NowSeconds();
    if (detail::FindOption(options, "clockTimestamp") != nullptr &&
        detail::ReadClaimTime(options, "clockTimestamp", &now) !=
            detail::ClaimTime::kValid) {
      return R::error(PrimitiveError{"clockTimestamp must be a number"});
    }
    int64_t tolerance = 0;
    if (const nlohmann::json* t = detail::FindOption(options, "clockTolerance")) {
      const double v = t->is_number() ? t->get<double>() : 0.0;
      if (std::isfinite(v) && v > 0.0) {
        tolerance = (v >= static_cast<double>(kMaxClockToleranceSeconds))
                        ? kMaxClockToleranceSeconds
                        : static_cast<int64_t>(v);
      }
    }

    std::vector<JwtAlgorithm> allowed{JwtAlgorithm::kHs256, JwtAlgorithm::kHs384,
                                      JwtAlgorithm::kHs512};
    if (const nlohmann::json* a = detail::FindOption(options, "algorithms")) {
      allowed.clear();
      for (const auto& name : detail::StringList(*a)) {
        auto parsed = detail::ParseJwtAlgorithm(name);
        if (parsed.has_value()) allowed.push_back(parsed.value());
      }
    }
    if (allowed.empty()) return R::error(PrimitiveError{"invalid algorithm"});

    const bool check_nbf = !detail::OptionFlag(options, "ignoreNotBefore");
    const bool check_exp = !detail::OptionFlag(options, "ignoreExpiration");
    int64_t nbf = 0;
    int64_t exp = 0;
    const detail::ClaimTime nbf_state = detail::ReadClaimTime(claims, "nbf", &nbf);
    const detail::ClaimTime exp_state = detail::ReadClaimTime(claims, "exp", &exp);

    auto verifier = jwt::verify<detail::PinnedJwtClock, detail::JwtTraits>(
        detail::PinnedJwtClock{detail::DateFromSeconds(now)});
    verifier.leeway(static_cast<size_t>(tolerance));
    for (JwtAlgorithm a : allowed) {
      switch (a) {
        case JwtAlgorithm::kHs256: verifier.allow_algorithm(jwt::algorithm::hs256{secret}); break;
        case JwtAlgorithm::kHs384: verifier.allow_algorithm(jwt::algorithm::hs384{secret}); break;
        case JwtAlgorithm::kHs512: verifier.allow_algorithm(jwt::algorithm::hs512{secret}); break;
      }
    }
    // jsonwebtoken never rejects on iat alone. Out-of-range times are
    // reported below instead of being converted to dates.
    verifier.with_claim("iat", &detail::SkipClaimCheck);
    if (!check_exp || exp_state != detail::ClaimTime::kValid) {
      verifier.with_claim("exp", &detail::SkipClaimCheck);
    }
    if (!check_nbf || nbf_state != detail::ClaimTime::kValid) {
      verifier.with_claim("nbf", &detail::SkipClaimCheck);
    }
    SingleValueOption(options, "issuer", [&verifier](const std::string& v) {
      verifier.with_issuer(v);
    });
    SingleValueOption(options, "audience", [&verifier](const std::string& v) {
      verifier.with_audience(v);
    });
    if (const nlohmann::json* sub = detail::FindOption(options, "subject")) {
      if (sub->is_string()) verifier.with_subject(sub->get<std::string>());
    }

    std::error_code ec;
    verifier.verify(decoded, ec);
    if (ec) {
      if (ec.category() == jwt::error::signature_verification_error_category()) {
        return R::error(PrimitiveError{"invalid signature"});
      }
      if (ec == jwt::error::token_verification_error::wrong_algorithm) {
        return R::error(PrimitiveError{"invalid algorithm"});
      }
    }

    if (check_nbf) {
      if (nbf_state == detail::ClaimTime::kInvalid) {
        return R::error(PrimitiveError{"invalid nbf value"});
      }
      if (nbf_state == detail::ClaimTime::kBeyondRange) {
        return R::error(PrimitiveError{"jwt not active"});
      }
    }
    if (check_exp && exp_state == detail::ClaimTime::kInvalid) {
      return R::error(PrimitiveError{"invalid exp value"});
    }

    if (ec == jwt::error::token_verification_error::token_expired) {
      const bool early = check_nbf && nbf_state == detail::ClaimTime::kValid &&
                         now < nbf - tolerance;
      return R::error(PrimitiveError{early ? "jwt not active" : "jwt expired"});
    }
    // Multi-valued audience/issuer options are "any of" and are matched here.
    std::string mismatch = detail::ClaimOptionMismatch(claims, options);
    if (!mismatch.empty()) return R::error(PrimitiveError{std::move(mismatch)});
    if (ec) return R::error(PrimitiveError{ec.message()});

    if (const nlohmann::json* max_age = detail::FindOption(options, "maxAge")) {
      auto span = detail::ParseTimespan(*max_age);
      if (!span.has_value()) {
        return R::error(PrimitiveError{
            "\"maxAge\" should be a number of seconds or string representing a "
            "timespan"});
      }
      int64_t iat = 0;
      switch (detail::ReadClaimTime(claims, "iat", &iat)) {
        case detail::ClaimTime::kValid:
          break;
        case detail::ClaimTime::kBeyondRange:
          iat = kMaxClaimSeconds;
          break;
        case detail::ClaimTime::kAbsent:
        case detail::ClaimTime::kInvalid:
          return R::error(PrimitiveError{"iat required when maxAge is specified"});
      }
      // |iat|, |span| and tolerance are all bounded well inside int64_t.
      if (now >= iat + span.value() + tolerance) {
        return R::error(PrimitiveError{"maxAge exceeded"});
      }
    }

    return R::success(claims);
  }

  /// Calls @p apply when @p key holds exactly one string.
  template <typename Fn>
  static void SingleValueOption(const nlohmann::json& options, const char* key,
                                Fn apply) {
    const nlohmann::json* v = detail::FindOption(options, key);
    if (v == nullptr) return;
    const auto values = detail::StringList(*v);
    if (values.size() == 1U) apply(values.front());
  }

  const CryptoProvider& provider_;
};

}  // namespace authpool

#endif  // AUTHPOOL_JWT_HPP_
