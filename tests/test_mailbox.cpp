/**
 * @file test_mailbox.cpp
 * @brief Tests for Mailbox<T>.
 */

#include "authpool/mailbox.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

TEST_CASE("Mailbox FIFO order", "[mailbox]") {
  authpool::Mailbox<int> mb;
  for (int i = 0; i < 5; ++i) {
    REQUIRE(mb.Push(int{i}));
  }
  REQUIRE(mb.Size() == 5U);
  for (int i = 0; i < 5; ++i) {
    auto v = mb.TryPop();
    REQUIRE(v.has_value());
    REQUIRE(v.value() == i);
  }
  REQUIRE_FALSE(mb.TryPop().has_value());
}

TEST_CASE("Mailbox moves move-only items", "[mailbox]") {
  authpool::Mailbox<std::unique_ptr<std::string>> mb;
  REQUIRE(mb.Push(std::make_unique<std::string>("task-1")));
  auto v = mb.Pop();
  REQUIRE(v.has_value());
  REQUIRE(*v.value() == "task-1");
}

TEST_CASE("Mailbox Close", "[mailbox]") {
  authpool::Mailbox<std::unique_ptr<int>> mb;
  REQUIRE(mb.Push(std::make_unique<int>(1)));
  mb.Close();
  REQUIRE(mb.IsClosed());

  SECTION("rejected push leaves the item with the caller") {
    auto item = std::make_unique<int>(2);
    REQUIRE_FALSE(mb.Push(std::move(item)));
    REQUIRE(item != nullptr);
    REQUIRE(*item == 2);
  }

  SECTION("items queued before close are still drained") {
    auto v = mb.Pop();
    REQUIRE(v.has_value());
    REQUIRE(*v.value() == 1);
    REQUIRE_FALSE(mb.Pop().has_value());
  }
}

TEST_CASE("Mailbox Close wakes a blocked receiver", "[mailbox]") {
  authpool::Mailbox<int> mb;
  std::atomic<bool> woke{false};
  std::thread t([&] {
    auto v = mb.Pop();
    woke.store(!v.has_value());
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  mb.Close();
  t.join();
  REQUIRE(woke.load());
}

TEST_CASE("Mailbox PopUntil times out", "[mailbox]") {
  authpool::Mailbox<int> mb;
  auto start = std::chrono::steady_clock::now();
  auto v = mb.PopUntil(start + std::chrono::milliseconds(30));
  auto elapsed = std::chrono::steady_clock::now() - start;
  REQUIRE_FALSE(v.has_value());
  REQUIRE(elapsed >= std::chrono::milliseconds(25));

  REQUIRE(mb.Push(7));
  auto w = mb.PopUntil(std::chrono::steady_clock::now() +
                       std::chrono::milliseconds(1000));
  REQUIRE(w.has_value());
  REQUIRE(w.value() == 7);
}

TEST_CASE("Mailbox many producers", "[mailbox]") {
  authpool::Mailbox<int> mb;
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 250;
  std::atomic<int> rejected{0};
  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&mb, &rejected] {
      for (int i = 0; i < kPerProducer; ++i) {
        if (!mb.Push(int{1})) rejected.fetch_add(1);
      }
    });
  }

  int sum = 0;
  for (int i = 0; i < kProducers * kPerProducer; ++i) {
    auto v = mb.Pop();
    REQUIRE(v.has_value());
    sum += v.value();
  }
  for (auto& t : producers) t.join();
  REQUIRE(rejected.load() == 0);
  REQUIRE(sum == kProducers * kPerProducer);
  REQUIRE(mb.Size() == 0U);
}
