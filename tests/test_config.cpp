/**
 * @file test_config.cpp
 * @brief Tests for config.hpp and PoolConfig mapping.
 */

#include "authpool/config.hpp"
#include "authpool/pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>
#include <string>

// ============================================================================
// JSON Backend
// ============================================================================

TEST_CASE("JSON LoadBuffer flattens sections", "[config][json]") {
  const std::string text = R"({
    "pool": {"worker_num": 8, "name": "auth", "respawn": false},
    "log_level": "warn"
  })";

  authpool::JsonConfig cfg;
  auto r = cfg.LoadBuffer(text, authpool::ConfigFormat::kJson);
  REQUIRE(r.has_value());

  REQUIRE(cfg.GetInt("pool", "worker_num", 0) == 8);
  REQUIRE(std::strcmp(cfg.GetString("pool", "name"), "auth") == 0);
  REQUIRE_FALSE(cfg.GetBool("pool", "respawn", true));
  REQUIRE(std::strcmp(cfg.GetString("", "log_level"), "warn") == 0);
  REQUIRE(cfg.HasSection("POOL"));
  REQUIRE(cfg.HasKey("pool", "Worker_Num"));
  REQUIRE(cfg.EntryCount() == 4U);
}

TEST_CASE("JSON LoadBuffer rejects invalid input", "[config][json]") {
  authpool::JsonConfig cfg;
  auto bad = cfg.LoadBuffer("{not json", authpool::ConfigFormat::kJson);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.get_error() == authpool::ConfigError::kParseError);

  auto array = cfg.LoadBuffer("[1, 2]", authpool::ConfigFormat::kJson);
  REQUIRE_FALSE(array.has_value());
  REQUIRE(array.get_error() == authpool::ConfigError::kParseError);
}

TEST_CASE("Config defaults and typed getters", "[config]") {
  authpool::JsonConfig cfg;
  REQUIRE(cfg.GetInt("x", "y", 42) == 42);
  REQUIRE(std::strcmp(cfg.GetString("x", "y", "dflt"), "dflt") == 0);
  REQUIRE_FALSE(cfg.FindInt("x", "y").has_value());

  REQUIRE(cfg.Set("x", "ratio", "0.5"));
  REQUIRE(cfg.GetDouble("x", "ratio", 0.0) == 0.5);
  REQUIRE(cfg.Set("x", "n", "abc"));
  REQUIRE_FALSE(cfg.FindInt("x", "n").has_value());
  REQUIRE(cfg.Set("x", "n", "12"));
  REQUIRE(cfg.FindInt("x", "n").value() == 12);
}

TEST_CASE("Config LoadFile", "[config][json]") {
  authpool::JsonConfig cfg;

  SECTION("missing file") {
    auto r = cfg.LoadFile("/nonexistent/authpool.json");
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == authpool::ConfigError::kFileNotFound);
  }

  SECTION("file on disk") {
    const char* path = "/tmp/authpool_test_config.json";
    FILE* f = std::fopen(path, "w");
    REQUIRE(f != nullptr);
    std::fputs(R"({"pool": {"default_timeout_ms": 250}})", f);
    std::fclose(f);

    auto r = cfg.LoadFile(path);
    REQUIRE(r.has_value());
    REQUIRE(cfg.GetInt("pool", "default_timeout_ms", 0) == 250);
    std::remove(path);
  }
}

#ifndef AUTHPOOL_CONFIG_INI_ENABLED
TEST_CASE("INI format not compiled in", "[config]") {
  authpool::JsonConfig cfg;
  auto r = cfg.LoadBuffer("[pool]\nworker_num = 2\n", authpool::ConfigFormat::kIni);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == authpool::ConfigError::kFormatNotSupported);
}
#endif

// ============================================================================
// INI Backend
// ============================================================================

#ifdef AUTHPOOL_CONFIG_INI_ENABLED

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  const std::string text =
      "[pool]\n"
      "worker_num = 3\n"
      "worker_id_prefix = auth-\n"
      "respawn = off\n";

  authpool::IniConfig cfg;
  auto r = cfg.LoadBuffer(text, authpool::ConfigFormat::kIni);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetInt("pool", "worker_num", 0) == 3);
  REQUIRE(std::strcmp(cfg.GetString("pool", "worker_id_prefix"), "auth-") == 0);
  REQUIRE_FALSE(cfg.GetBool("pool", "respawn", true));
}

TEST_CASE("PoolConfigFile detects format by extension", "[config][ini]") {
  const char* path = "/tmp/authpool_test_config.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fputs("[pool]\nmax_queue_depth = 16\n", f);
  std::fclose(f);

  authpool::PoolConfigFile cfg;
  auto r = cfg.LoadFile(path);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetInt("pool", "max_queue_depth", 0) == 16);
  std::remove(path);
}

#endif

// ============================================================================
// FromConfig
// ============================================================================

TEST_CASE("FromConfig maps the pool section", "[config][pool]") {
  authpool::JsonConfig cfg;

  SECTION("defaults when empty") {
    authpool::PoolConfig pc = authpool::FromConfig(cfg);
    REQUIRE(pc.name == "authpool");
    REQUIRE(pc.worker_num == 4U);
    REQUIRE(pc.default_timeout_ms == 5000U);
    REQUIRE(pc.max_queue_depth == 0U);
    REQUIRE(pc.worker_id_prefix == "worker-");
    REQUIRE(pc.init_timeout_ms == 30000U);
    REQUIRE(pc.respawn);
  }

  SECTION("explicit values") {
    auto r = cfg.LoadBuffer(R"({"auth": {
        "name": "login", "worker_num": 2, "default_timeout_ms": 100,
        "max_queue_depth": 8, "worker_id_prefix": "w", "init_timeout_ms": 50,
        "respawn": false}})",
                            authpool::ConfigFormat::kJson);
    REQUIRE(r.has_value());
    authpool::PoolConfig pc = authpool::FromConfig(cfg, "auth");
    REQUIRE(pc.name == "login");
    REQUIRE(pc.worker_num == 2U);
    REQUIRE(pc.default_timeout_ms == 100U);
    REQUIRE(pc.max_queue_depth == 8U);
    REQUIRE(pc.worker_id_prefix == "w");
    REQUIRE(pc.init_timeout_ms == 50U);
    REQUIRE_FALSE(pc.respawn);
  }

  SECTION("worker_num is clamped") {
    REQUIRE(cfg.Set("pool", "worker_num", "0"));
    REQUIRE(authpool::FromConfig(cfg).worker_num == 1U);
    REQUIRE(cfg.Set("pool", "worker_num", "1000"));
    REQUIRE(authpool::FromConfig(cfg).worker_num == authpool::kMaxWorkers);
  }
}
