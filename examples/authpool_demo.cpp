// Copyright (c) 2024 liudegui. MIT License.
//
// authpool_demo.cpp -- PoolManager / Dispatcher walkthrough.
//
// Demonstrates:
//   1. Loading pool settings from an INI or JSON file
//   2. JWT sign + verify, including a fail-closed rejection
//   3. Password hash + compare across workers
//   4. Hash throughput with many outstanding tasks
//   5. Statistics and per-worker state
//
// Usage: authpool_demo [config.json|config.ini]

#include "authpool/config.hpp"
#include "authpool/dispatch.hpp"
#include "authpool/log.hpp"
#include "authpool/pool.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <future>
#include <string>
#include <vector>

// ============================================================================
// Timing Helpers
// ============================================================================

using Clock = std::chrono::steady_clock;

static inline uint64_t ElapsedUs(Clock::time_point t0, Clock::time_point t1) {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count());
}

// ============================================================================
// Demo 1: Configuration
// ============================================================================

static authpool::PoolConfig LoadPoolConfig(int argc, char* argv[]) {
  printf("\n=== Demo 1: Configuration ===\n");
  if (argc < 2) {
    printf("  no config file given, using defaults\n");
    return authpool::PoolConfig{};
  }

  authpool::PoolConfigFile file;
  auto loaded = file.LoadFile(argv[1]);
  if (!loaded.has_value()) {
    AUTHPOOL_LOG_WARN("Demo", "cannot load %s: %s, using defaults", argv[1],
                      authpool::ConfigErrorName(loaded.get_error()));
    return authpool::PoolConfig{};
  }

  if (file.GetBool("log", "debug", false)) {
    authpool::log::SetLevel(authpool::log::Level::kDebug);
  }
  authpool::PoolConfig cfg = authpool::FromConfig(file);
  printf("  %s: name=%s workers=%u timeout=%ums queue_depth=%u\n", argv[1],
         cfg.name.c_str(), cfg.worker_num, cfg.default_timeout_ms,
         cfg.max_queue_depth);
  return cfg;
}

// ============================================================================
// Demo 2: JWT
// ============================================================================

static void DemoJwt(authpool::Dispatcher& auth) {
  printf("\n=== Demo 2: JWT Sign / Verify ===\n");
  auto token = auth.SignJwt({{"sub", "alice"}, {"scope", "read:all"}},
                            "demo-secret", {{"expiresIn", "15m"}})
                   .get();
  if (!token.has_value()) {
    printf("  sign failed: %s\n", token.get_error().message.c_str());
    return;
  }
  printf("  token: %.40s...\n", token.value().c_str());

  auto claims = auth.VerifyJwt(token.value(), "demo-secret").get();
  if (claims.has_value()) {
    printf("  verified, claims: %s\n", claims.value().dump().c_str());
  } else {
    printf("  verify failed: %s\n", claims.get_error().message.c_str());
  }

  auto forged = auth.VerifyJwt(token.value(), "guessed-secret").get();
  printf("  wrong secret -> %s (%s)\n",
         forged.has_value() ? "ACCEPTED" : "rejected",
         forged.has_value() ? "-" : forged.get_error().message.c_str());
}

// ============================================================================
// Demo 3: Passwords
// ============================================================================

static void DemoPasswords(authpool::Dispatcher& auth) {
  printf("\n=== Demo 3: Password Hash / Compare ===\n");
  std::vector<std::string> hashes;
  for (int i = 0; i < 3; ++i) {
    auto h = auth.HashPassword("correct horse battery staple").get();
    if (!h.has_value()) {
      printf("  hash failed: %s\n", h.get_error().message.c_str());
      return;
    }
    printf("  hash[%d] = %s\n", i, h.value().c_str());
    hashes.push_back(h.value());
  }
  for (const auto& h : hashes) {
    auto ok = auth.ComparePassword("correct horse battery staple", h).get();
    auto bad = auth.ComparePassword("Tr0ub4dor&3", h).get();
    printf("  compare: right=%s wrong=%s\n",
           (ok.has_value() && ok.value()) ? "match" : "no match",
           (bad.has_value() && bad.value()) ? "match" : "no match");
  }
}

// ============================================================================
// Demo 4: Throughput
// ============================================================================

static void DemoThroughput(authpool::Dispatcher& auth) {
  printf("\n=== Demo 4: Hash Throughput ===\n");
  constexpr uint32_t kTasks = 2000U;
  std::vector<authpool::Dispatcher::Future<std::string>> futures;
  futures.reserve(kTasks);

  auto t0 = Clock::now();
  for (uint32_t i = 0U; i < kTasks; ++i) {
    futures.push_back(auth.GenerateHash("payload-" + std::to_string(i)));
  }
  uint32_t ok = 0U;
  for (auto& f : futures) {
    if (f.get().has_value()) ++ok;
  }
  auto t1 = Clock::now();

  uint64_t us = ElapsedUs(t0, t1);
  printf("  %u/%u ok in %lu us (%.0f tasks/s)\n", ok, kTasks,
         static_cast<unsigned long>(us),
         us > 0U ? static_cast<double>(kTasks) * 1e6 / static_cast<double>(us)
                 : 0.0);
}

// ============================================================================
// Demo 5: Statistics
// ============================================================================

static void PrintStats(const authpool::PoolManager& pool) {
  printf("\n=== Demo 5: Statistics ===\n");
  authpool::PoolStats s = pool.GetStats();
  printf("  workers=%u ready=%u busy=%u pending=%u queued=%u\n", s.workers,
         s.ready, s.busy, s.pending, s.queued);
  printf("  submitted=%lu completed=%lu failed=%lu timed_out=%lu\n",
         static_cast<unsigned long>(s.submitted),
         static_cast<unsigned long>(s.completed),
         static_cast<unsigned long>(s.failed),
         static_cast<unsigned long>(s.timed_out));
  printf("  crashed=%lu respawned=%lu overloaded=%lu dropped=%lu\n",
         static_cast<unsigned long>(s.crashed),
         static_cast<unsigned long>(s.respawned),
         static_cast<unsigned long>(s.overloaded),
         static_cast<unsigned long>(s.dropped_results));
  for (const auto& w : pool.GetWorkers()) {
    printf("  %-12s %-8s tasks=%lu errors=%u respawns=%u\n",
           w.worker_id.c_str(), authpool::WorkerStateName(w.state),
           static_cast<unsigned long>(w.tasks_done), w.errors, w.respawns);
  }
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
  authpool::log::Init();
  authpool::PoolConfig cfg = LoadPoolConfig(argc, argv);

  authpool::PoolManager pool(cfg);
  auto started = pool.Start();
  if (!started.has_value()) {
    AUTHPOOL_LOG_ERROR("Demo", "start failed: %s",
                       authpool::PoolErrorName(started.get_error()));
    return 1;
  }
  if (!pool.WaitReady()) {
    AUTHPOOL_LOG_ERROR("Demo", "workers not ready within %u ms",
                       cfg.init_timeout_ms);
    pool.Shutdown();
    return 1;
  }

  authpool::Dispatcher auth(pool);
  DemoJwt(auth);
  DemoPasswords(auth);
  DemoThroughput(auth);
  PrintStats(pool);

  pool.Shutdown();
  authpool::log::Shutdown();
  return 0;
}
