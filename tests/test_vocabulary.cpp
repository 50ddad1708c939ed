/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types
 */

#include "authpool/vocabulary.hpp"

#include "authpool/envelope.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected holds a value", "[vocabulary][expected]") {
  auto r = authpool::expected<int, authpool::ErrorCode>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
}

TEST_CASE("expected holds an error", "[vocabulary][expected]") {
  auto r = authpool::expected<int, authpool::ErrorCode>::error(
      authpool::ErrorCode::kTaskTimeout);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == authpool::ErrorCode::kTaskTimeout);
  REQUIRE(r.value_or(7) == 7);
}

TEST_CASE("expected void specialization", "[vocabulary][expected]") {
  auto ok = authpool::expected<void, authpool::ErrorCode>::success();
  REQUIRE(ok.has_value());

  auto err = authpool::expected<void, authpool::ErrorCode>::error(
      authpool::ErrorCode::kPoolOverloaded);
  REQUIRE_FALSE(err.has_value());
  REQUIRE(err.get_error() == authpool::ErrorCode::kPoolOverloaded);
}

TEST_CASE("expected with non-trivial members", "[vocabulary][expected]") {
  authpool::TaskError e;
  e.code = authpool::ErrorCode::kPrimitiveFailure;
  e.message = "jwt expired";
  auto r = authpool::TaskOutcome::error(e);

  authpool::TaskOutcome copy = r;
  REQUIRE_FALSE(copy.has_value());
  REQUIRE(copy.get_error().message == "jwt expired");

  auto ok = authpool::TaskOutcome::success(nlohmann::json{{"sub", "u1"}});
  authpool::TaskOutcome moved = std::move(ok);
  REQUIRE(moved.value()["sub"] == "u1");

  copy = moved;
  REQUIRE(copy.has_value());
}

// ============================================================================
// optional<T>
// ============================================================================

TEST_CASE("optional empty and engaged", "[vocabulary][optional]") {
  authpool::optional<std::string> empty;
  REQUIRE_FALSE(empty.has_value());
  REQUIRE(empty.value_or("fallback") == "fallback");

  authpool::optional<std::string> full(std::string("sha256"));
  REQUIRE(full.has_value());
  REQUIRE(full.value() == "sha256");

  full.reset();
  REQUIRE_FALSE(full.has_value());
}

TEST_CASE("optional copy and move", "[vocabulary][optional]") {
  authpool::optional<std::string> o1(std::string("abc"));
  authpool::optional<std::string> o2 = o1;
  REQUIRE(o2.value() == "abc");

  authpool::optional<std::string> o3 = std::move(o1);
  REQUIRE(o3.value() == "abc");
}

// ============================================================================
// FixedString
// ============================================================================

TEST_CASE("FixedString literal and truncation", "[vocabulary][fixed_string]") {
  authpool::FixedString<16> s("authpool");
  REQUIRE(s.size() == 8U);
  REQUIRE(s == "authpool");
  REQUIRE(s.capacity() == 16U);

  authpool::FixedString<4> t(authpool::TruncateToCapacity, "worker-pool");
  REQUIRE(t.size() == 4U);
  REQUIRE(t == "work");
}

TEST_CASE("FixedString assign and clear", "[vocabulary][fixed_string]") {
  authpool::FixedString<32> s;
  REQUIRE(s.empty());
  s.assign(authpool::TruncateToCapacity, "auth");
  REQUIRE(s == "auth");
  s.clear();
  REQUIRE(s.empty());

  authpool::FixedString<8> a("abc");
  authpool::FixedString<32> b("abc");
  REQUIRE(a == b);
}
