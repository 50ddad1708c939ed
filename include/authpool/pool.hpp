/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file authpool/pool.hpp
 * @brief PoolManager - fixed set of crypto workers behind one event loop.
 *
 * Architecture:
 *   Submit() --SubmitEvent--> events_ Mailbox <--WorkerEvent-- Worker[0..N-1]
 *                                  |
 *                            ManagerThread (single writer)
 *                              | pending_ map, queue_, slots_, deadlines_
 *                              +--Post(TaskEnvelope)--> Worker inbox
 *
 * Assignment is round-robin over ready slots. A slot runs one task at a
 * time; when none is ready the task waits in a FIFO queue (optionally
 * bounded by max_queue_depth, beyond which it is rejected PoolOverloaded).
 *
 * Timeouts are armed at Submit(). An expired task is rejected TaskTimeout
 * and forgotten; its worker is left running and the late result is dropped
 * with a warning when it arrives.
 *
 * A worker whose thread exits outside Shutdown() has its assigned task
 * rejected WorkerCrashed and is respawned under the same worker id.
 *
 * Usage:
 *   authpool::PoolConfig cfg;
 *   cfg.worker_num = 4;
 *   authpool::PoolManager pool(cfg);
 *   pool.Start();
 *   pool.WaitReady();
 *   auto fut = pool.Submit(authpool::Action::kGenerateHash, {{"data", "abc"}});
 *   authpool::TaskOutcome r = fut.get();
 *   pool.Shutdown();
 */

#ifndef AUTHPOOL_POOL_HPP_
#define AUTHPOOL_POOL_HPP_

#include "authpool/config.hpp"
#include "authpool/crypto.hpp"
#include "authpool/envelope.hpp"
#include "authpool/log.hpp"
#include "authpool/mailbox.hpp"
#include "authpool/platform.hpp"
#include "authpool/vocabulary.hpp"
#include "authpool/worker.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace authpool {

inline constexpr uint32_t kMaxWorkers = 64U;
inline constexpr uint32_t kDefaultTaskTimeoutMs = 5000U;
inline constexpr uint32_t kDefaultInitTimeoutMs = 30000U;

// ============================================================================
// Configuration
// ============================================================================

struct PoolConfig {
  FixedString<32> name{"authpool"};
  uint32_t worker_num{4U};
  uint32_t default_timeout_ms{kDefaultTaskTimeoutMs};
  uint32_t max_queue_depth{0U};  ///< 0 = unbounded
  std::string worker_id_prefix{"worker-"};
  uint32_t init_timeout_ms{kDefaultInitTimeoutMs};
  bool respawn{true};

  std::shared_ptr<const CryptoProvider> provider;  ///< nullptr = OpenSSL
  TaskObserver observer{nullptr};
  void* observer_ctx{nullptr};
};

/**
 * @brief Read a PoolConfig from one section of a config store.
 *
 * Missing keys keep their defaults. worker_num is clamped to [1, kMaxWorkers].
 */
inline PoolConfig FromConfig(const ConfigStore& store,
                             const char* section = "pool") {
  PoolConfig cfg;
  if (store.HasKey(section, "name")) {
    cfg.name.assign(TruncateToCapacity, store.GetString(section, "name"));
  }
  const int32_t workers = store.GetInt(section, "worker_num", 4);
  cfg.worker_num = static_cast<uint32_t>(
      std::min<int32_t>(std::max<int32_t>(workers, 1),
                        static_cast<int32_t>(kMaxWorkers)));
  const int32_t timeout = store.GetInt(
      section, "default_timeout_ms", static_cast<int32_t>(kDefaultTaskTimeoutMs));
  cfg.default_timeout_ms =
      (timeout > 0) ? static_cast<uint32_t>(timeout) : kDefaultTaskTimeoutMs;
  const int32_t depth = store.GetInt(section, "max_queue_depth", 0);
  cfg.max_queue_depth = (depth > 0) ? static_cast<uint32_t>(depth) : 0U;
  cfg.worker_id_prefix = store.GetString(section, "worker_id_prefix", "worker-");
  const int32_t init = store.GetInt(
      section, "init_timeout_ms", static_cast<int32_t>(kDefaultInitTimeoutMs));
  cfg.init_timeout_ms =
      (init > 0) ? static_cast<uint32_t>(init) : kDefaultInitTimeoutMs;
  cfg.respawn = store.GetBool(section, "respawn", true);
  return cfg;
}

// ============================================================================
// Pool errors / state / statistics
// ============================================================================

enum class PoolError : uint8_t {
  kAlreadyRunning = 0,
  kAlreadyStopped,
};

inline const char* PoolErrorName(PoolError e) noexcept {
  switch (e) {
    case PoolError::kAlreadyRunning: return "AlreadyRunning";
    case PoolError::kAlreadyStopped: return "AlreadyStopped";
  }
  return "Unknown";
}

enum class WorkerState : uint8_t {
  kStarting = 0,  ///< Spawned, "init" not yet received.
  kReady,
  kBusy,
  kFaulted,       ///< Sent "error"; exit expected.
  kStopped,
};

inline const char* WorkerStateName(WorkerState s) noexcept {
  switch (s) {
    case WorkerState::kStarting: return "starting";
    case WorkerState::kReady:    return "ready";
    case WorkerState::kBusy:     return "busy";
    case WorkerState::kFaulted:  return "faulted";
    case WorkerState::kStopped:  return "stopped";
  }
  return "unknown";
}

/**
 * @brief Snapshot returned by PoolManager::GetStats().
 *
 * failed counts tasks rejected by a worker or by a worker crash. crashed
 * counts worker exits outside Shutdown().
 */
struct PoolStats {
  uint32_t workers{0U};
  uint32_t ready{0U};
  uint32_t busy{0U};
  uint32_t pending{0U};
  uint32_t queued{0U};
  uint64_t submitted{0U};
  uint64_t completed{0U};
  uint64_t failed{0U};
  uint64_t timed_out{0U};
  uint64_t crashed{0U};
  uint64_t respawned{0U};
  uint64_t overloaded{0U};
  uint64_t dropped_results{0U};
};

struct WorkerSnapshot {
  std::string worker_id;
  WorkerState state{WorkerState::kStarting};
  uint64_t tasks_done{0U};
  uint32_t errors{0U};
  uint32_t respawns{0U};
};

// ============================================================================
// TaskCompletion - caller-side continuation
// ============================================================================

/**
 * @brief Receives the outcome of one task. Called exactly once, on the
 *        manager thread (or on the submitting thread for an immediate
 *        rejection). The pool's state lock is never held during the call,
 *        so Complete() may query GetStats() or GetWorkers().
 */
class TaskCompletion {
 public:
  virtual ~TaskCompletion() = default;
  virtual void Complete(TaskOutcome&& outcome) = 0;
};

/**
 * @brief Completion that fulfils a std::promise with a converted outcome.
 */
template <typename T>
class PromiseCompletion final : public TaskCompletion {
 public:
  using Result = expected<T, TaskError>;
  using ConvertFn = Result (*)(TaskOutcome&&);

  explicit PromiseCompletion(ConvertFn convert) noexcept : convert_(convert) {}

  std::future<Result> GetFuture() { return promise_.get_future(); }

  void Complete(TaskOutcome&& outcome) override {
    promise_.set_value(convert_(std::move(outcome)));
  }

 private:
  ConvertFn convert_;
  std::promise<Result> promise_;
};

inline TaskOutcome PassThrough(TaskOutcome&& outcome) {
  return std::move(outcome);
}

// ============================================================================
// PoolManager
// ============================================================================

class PoolManager {
 public:
  using Clock = std::chrono::steady_clock;

  explicit PoolManager(const PoolConfig& cfg)
      : name_(cfg.name),
        worker_num_(std::min(std::max(cfg.worker_num, 1U), kMaxWorkers)),
        default_timeout_ms_(cfg.default_timeout_ms > 0U
                                ? cfg.default_timeout_ms
                                : kDefaultTaskTimeoutMs),
        max_queue_depth_(cfg.max_queue_depth),
        init_timeout_ms_(cfg.init_timeout_ms),
        respawn_(cfg.respawn),
        worker_id_prefix_(cfg.worker_id_prefix),
        provider_(cfg.provider ? cfg.provider : DefaultCryptoProvider()),
        observer_(cfg.observer),
        observer_ctx_(cfg.observer_ctx) {}

  ~PoolManager() { Shutdown(); }

  PoolManager(const PoolManager&) = delete;
  PoolManager& operator=(const PoolManager&) = delete;
  PoolManager(PoolManager&&) = delete;
  PoolManager& operator=(PoolManager&&) = delete;

  // ======================== Lifecycle ========================

  /**
   * @brief Spawn the workers and the manager thread.
   *
   * A pool runs once: Start() after Shutdown() fails with kAlreadyStopped.
   */
  expected<void, PoolError> Start() {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, PoolError>::error(PoolError::kAlreadyRunning);
    }
    if (stopped_.load(std::memory_order_acquire)) {
      return expected<void, PoolError>::error(PoolError::kAlreadyStopped);
    }

    {
      std::lock_guard<std::mutex> lk(state_mtx_);
      slots_.clear();
      slots_.reserve(worker_num_);
      for (uint32_t i = 0U; i < worker_num_; ++i) {
        slots_.emplace_back();
        slots_.back().worker_id = worker_id_prefix_ + std::to_string(i);
        SpawnWorker(i);
      }
    }

    running_.store(true, std::memory_order_release);
    manager_thread_ = std::thread(&PoolManager::ManagerLoop, this);
    AUTHPOOL_LOG_INFO("Pool", "%s started with %u workers", name_.c_str(),
                      worker_num_);
    return expected<void, PoolError>::success();
  }

  /**
   * @brief Block until every worker reported "init".
   * @param timeout_ms 0 uses the configured init_timeout_ms.
   */
  bool WaitReady(uint32_t timeout_ms = 0U) {
    if (!running_.load(std::memory_order_acquire)) {
      return false;
    }
    const uint32_t ms = (timeout_ms > 0U) ? timeout_ms : init_timeout_ms_;
    std::unique_lock<std::mutex> lk(state_mtx_);
    return ready_cv_.wait_for(lk, std::chrono::milliseconds(ms), [this] {
      return CountLocked(WorkerState::kReady) + CountLocked(WorkerState::kBusy) ==
             static_cast<uint32_t>(slots_.size());
    });
  }

  /**
   * @brief Reject everything pending, stop the workers and join all threads.
   *
   * Idempotent; Submit() calls made once shutdown begins are rejected
   * immediately with PoolShuttingDown.
   */
  void Shutdown() {
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    bool expected_flag = false;
    if (!shutting_down_.compare_exchange_strong(expected_flag, true,
                                                std::memory_order_acq_rel)) {
      return;
    }
    AUTHPOOL_LOG_INFO("Pool", "%s shutting down", name_.c_str());

    PoolEvent ev(ShutdownEvent{});
    static_cast<void>(events_.Push(std::move(ev)));
    if (manager_thread_.joinable()) {
      manager_thread_.join();
    }

    stopped_.store(true, std::memory_order_release);
    running_.store(false, std::memory_order_release);
    AUTHPOOL_LOG_INFO("Pool", "%s stopped", name_.c_str());
  }

  // ======================== Submit API ========================

  /**
   * @brief Queue one task and return a future for its outcome.
   * @param timeout_ms 0 uses the configured default.
   */
  std::future<TaskOutcome> Submit(Action action, nlohmann::json payload,
                                  uint32_t timeout_ms = 0U) {
    return SubmitAs<nlohmann::json>(action, std::move(payload), timeout_ms,
                                    &PassThrough);
  }

  /**
   * @brief Submit with a typed conversion of the outcome.
   *
   * @p convert runs on the manager thread and must not block.
   */
  template <typename T>
  std::future<expected<T, TaskError>> SubmitAs(
      Action action, nlohmann::json payload, uint32_t timeout_ms,
      typename PromiseCompletion<T>::ConvertFn convert) {
    auto completion = std::make_unique<PromiseCompletion<T>>(convert);
    std::future<expected<T, TaskError>> fut = completion->GetFuture();
    SubmitWith(action, std::move(payload), timeout_ms, std::move(completion));
    return fut;
  }

  /**
   * @brief Lowest-level submission: the outcome goes to @p completion.
   */
  void SubmitWith(Action action, nlohmann::json payload, uint32_t timeout_ms,
                  std::unique_ptr<TaskCompletion> completion) {
    AUTHPOOL_ASSERT(completion != nullptr);
    if (!running_.load(std::memory_order_acquire) ||
        shutting_down_.load(std::memory_order_acquire)) {
      completion->Complete(ShuttingDownFailure());
      return;
    }

    const uint32_t ms = (timeout_ms > 0U) ? timeout_ms : default_timeout_ms_;
    SubmitEvent submit;
    submit.task.id = NextTaskId();
    submit.task.action = ActionName(action);
    submit.task.payload = std::move(payload);
    submit.timeout_ms = ms;
    submit.deadline = Clock::now() + std::chrono::milliseconds(ms);
    submit.completion = std::move(completion);
    submitted_.fetch_add(1U, std::memory_order_relaxed);

    PoolEvent ev(std::move(submit));
    if (!events_.Push(std::move(ev))) {
      std::get<SubmitEvent>(ev).completion->Complete(ShuttingDownFailure());
    }
  }

  // ======================== Query ========================

  PoolStats GetStats() const {
    PoolStats s;
    {
      std::lock_guard<std::mutex> lk(state_mtx_);
      s.workers = static_cast<uint32_t>(slots_.size());
      s.ready = CountLocked(WorkerState::kReady);
      s.busy = CountLocked(WorkerState::kBusy);
      s.pending = static_cast<uint32_t>(pending_.size());
      s.queued = static_cast<uint32_t>(queue_.size());
    }
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.completed = completed_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.timed_out = timed_out_.load(std::memory_order_relaxed);
    s.crashed = crashed_.load(std::memory_order_relaxed);
    s.respawned = respawned_.load(std::memory_order_relaxed);
    s.overloaded = overloaded_.load(std::memory_order_relaxed);
    s.dropped_results = dropped_results_.load(std::memory_order_relaxed);
    return s;
  }

  std::vector<WorkerSnapshot> GetWorkers() const {
    std::lock_guard<std::mutex> lk(state_mtx_);
    std::vector<WorkerSnapshot> out;
    out.reserve(slots_.size());
    for (const Slot& s : slots_) {
      WorkerSnapshot w;
      w.worker_id = s.worker_id;
      w.state = s.state;
      w.tasks_done = s.tasks_done;
      w.errors = s.errors;
      w.respawns = s.respawns;
      out.push_back(std::move(w));
    }
    return out;
  }

  const char* Name() const noexcept { return name_.c_str(); }
  uint32_t WorkerNum() const noexcept { return worker_num_; }
  uint32_t DefaultTimeoutMs() const noexcept { return default_timeout_ms_; }
  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire) &&
           !shutting_down_.load(std::memory_order_acquire);
  }

 private:
  static constexpr uint32_t kNoSlot = UINT32_MAX;

  // ======================== Events ========================

  struct SubmitEvent {
    TaskEnvelope task;
    uint32_t timeout_ms{0U};
    Clock::time_point deadline;
    std::unique_ptr<TaskCompletion> completion;
  };

  struct ShutdownEvent {};

  using PoolEvent = std::variant<SubmitEvent, WorkerEvent, ShutdownEvent>;
  using DeadlineMap = std::multimap<Clock::time_point, std::string>;

  struct PendingTask {
    std::unique_ptr<TaskCompletion> completion;
    std::string action;
    uint32_t timeout_ms{0U};
    uint32_t slot{kNoSlot};  ///< kNoSlot while queued.
    DeadlineMap::iterator deadline;
  };

  struct Finished {
    std::unique_ptr<TaskCompletion> completion;
    TaskOutcome outcome;
  };

  struct Slot {
    std::string worker_id;
    std::unique_ptr<Worker> worker;
    WorkerState state{WorkerState::kStarting};
    uint64_t generation{0U};
    std::string current_task;  ///< Empty when idle.
    uint64_t tasks_done{0U};
    uint32_t errors{0U};
    uint32_t respawns{0U};
  };

  static TaskOutcome ShuttingDownFailure() {
    return MakeFailure(ErrorCode::kPoolShuttingDown, "Pool is shutting down");
  }

  std::string NextTaskId() {
    const uint64_t seq = next_task_seq_.fetch_add(1U, std::memory_order_relaxed);
    return std::string(name_.c_str()) + "-" + std::to_string(seq);
  }

  static void OnWorkerEvent(WorkerEvent&& event, void* ctx) {
    auto* self = static_cast<PoolManager*>(ctx);
    PoolEvent ev(std::move(event));
    // Closed only during shutdown; the event is no longer needed.
    static_cast<void>(self->events_.Push(std::move(ev)));
  }

  // ======================== Manager thread ========================

  void ManagerLoop() {
    bool stop = false;
    while (!stop) {
      optional<PoolEvent> ev = deadlines_.empty()
                                   ? events_.Pop()
                                   : events_.PopUntil(deadlines_.begin()->first);
      {
        std::lock_guard<std::mutex> lk(state_mtx_);
        if (ev.has_value()) {
          stop = HandleEvent(ev.value());
        } else if (events_.IsClosed()) {
          stop = true;
        }
        if (!stop) {
          ExpireDeadlines(Clock::now());
        }
      }
      RunFinished();
    }
    JoinRetired();
  }

  /// Runs the completions collected while state_mtx_ was held.
  void RunFinished() {
    std::vector<Finished> batch;
    batch.swap(finished_);
    for (Finished& f : batch) {
      f.completion->Complete(std::move(f.outcome));
    }
  }

  /// Joins the workers stopped by HandleShutdown() without holding
  /// state_mtx_, then marks their slots stopped.
  void JoinRetired() {
    for (auto& w : retired_) {
      w->Join();
    }
    retired_.clear();
    std::lock_guard<std::mutex> lk(state_mtx_);
    for (Slot& s : slots_) {
      s.state = WorkerState::kStopped;
      s.current_task.clear();
    }
    ready_cv_.notify_all();
  }

  void Finish(std::unique_ptr<TaskCompletion> completion, TaskOutcome&& outcome) {
    finished_.push_back(Finished{std::move(completion), std::move(outcome)});
  }

  /** @return true when the loop must exit. */
  bool HandleEvent(PoolEvent& ev) {
    if (auto* submit = std::get_if<SubmitEvent>(&ev)) {
      HandleSubmit(*submit);
      return false;
    }
    if (auto* worker_ev = std::get_if<WorkerEvent>(&ev)) {
      HandleWorkerEvent(*worker_ev);
      return false;
    }
    HandleShutdown();
    return true;
  }

  void HandleSubmit(SubmitEvent& ev) {
    const uint32_t idx = PickReadySlot();
    if (idx == kNoSlot && max_queue_depth_ > 0U &&
        queue_.size() >= max_queue_depth_) {
      overloaded_.fetch_add(1U, std::memory_order_relaxed);
      AUTHPOOL_LOG_WARN("Pool", "%s overloaded, rejecting %s (%s)",
                        name_.c_str(), ev.task.id.c_str(),
                        ev.task.action.c_str());
      Finish(std::move(ev.completion),
             MakeFailure(ErrorCode::kPoolOverloaded,
                         "Pool overloaded: queue depth " +
                             std::to_string(max_queue_depth_) + " reached"));
      return;
    }

    PendingTask pt;
    pt.completion = std::move(ev.completion);
    pt.action = ev.task.action;
    pt.timeout_ms = ev.timeout_ms;
    pt.deadline = deadlines_.emplace(ev.deadline, ev.task.id);
    pending_.emplace(ev.task.id, std::move(pt));

    if (idx != kNoSlot) {
      Assign(idx, std::move(ev.task));
    } else {
      queue_.push_back(std::move(ev.task));
    }
  }

  void HandleWorkerEvent(WorkerEvent& ev) {
    Slot& s = slots_[ev.slot];
    if (ev.generation != s.generation) {
      AUTHPOOL_LOG_DEBUG("Pool", "stale event from %s generation %lu",
                         s.worker_id.c_str(),
                         static_cast<unsigned long>(ev.generation));
      return;
    }
    if (ev.kind == WorkerEvent::Kind::kExited) {
      HandleWorkerExit(ev);
      return;
    }

    ResultEnvelope& r = ev.result;
    if (r.id == kInitId) {
      if (s.state == WorkerState::kStarting) {
        s.state = WorkerState::kReady;
      }
      AUTHPOOL_LOG_INFO("Pool", "%s ready", s.worker_id.c_str());
      ready_cv_.notify_all();
      DispatchQueued();
      return;
    }

    if (r.id == kErrorId && r.error.code == ErrorCode::kWorkerCrashed) {
      s.state = WorkerState::kFaulted;
      AUTHPOOL_LOG_ERROR("Pool", "%s reported fatal error: %s",
                         s.worker_id.c_str(), r.error.message.c_str());
      return;
    }

    // A malformed-task reply carries "error" as its id; it still answers
    // the slot's current task.
    std::string id = (r.id == kErrorId) ? s.current_task : r.id;
    if (s.current_task == id) {
      s.current_task.clear();
      ++s.tasks_done;
      if (s.state == WorkerState::kBusy) {
        s.state = WorkerState::kReady;
      }
    } else {
      AUTHPOOL_LOG_WARN("Pool", "%s answered %s while assigned %s",
                        s.worker_id.c_str(), id.c_str(),
                        s.current_task.c_str());
    }

    auto it = pending_.find(id);
    if (it == pending_.end()) {
      dropped_results_.fetch_add(1U, std::memory_order_relaxed);
      AUTHPOOL_LOG_WARN("Pool", "dropping late result for %s from %s",
                        id.c_str(), s.worker_id.c_str());
    } else {
      if (r.success) {
        completed_.fetch_add(1U, std::memory_order_relaxed);
      } else {
        failed_.fetch_add(1U, std::memory_order_relaxed);
        AUTHPOOL_LOG_DEBUG("Pool", "%s (%s) failed: %s", id.c_str(),
                           it->second.action.c_str(), r.error.message.c_str());
      }
      Resolve(it, ToOutcome(std::move(r)));
    }
    DispatchQueued();
  }

  void HandleWorkerExit(const WorkerEvent& ev) {
    const uint32_t idx = ev.slot;
    Slot& s = slots_[idx];
    AUTHPOOL_ASSERT(s.worker != nullptr && s.worker->Generation() == ev.generation);
    s.worker->Join();
    crashed_.fetch_add(1U, std::memory_order_relaxed);
    ++s.errors;
    if (ev.fatal) {
      AUTHPOOL_LOG_ERROR("Pool", "%s (generation %lu) died in its last-resort handler",
                         s.worker->WorkerId().c_str(),
                         static_cast<unsigned long>(ev.generation));
    } else {
      AUTHPOOL_LOG_ERROR("Pool", "%s (generation %lu) exited unexpectedly",
                         s.worker->WorkerId().c_str(),
                         static_cast<unsigned long>(ev.generation));
    }

    if (!s.current_task.empty()) {
      auto it = pending_.find(s.current_task);
      if (it != pending_.end()) {
        failed_.fetch_add(1U, std::memory_order_relaxed);
        Resolve(it, MakeFailure(ErrorCode::kWorkerCrashed,
                                "Worker " + s.worker_id +
                                    " crashed while running task " +
                                    s.current_task));
      }
      s.current_task.clear();
    }

    if (respawn_) {
      ++s.respawns;
      respawned_.fetch_add(1U, std::memory_order_relaxed);
      SpawnWorker(idx);
      AUTHPOOL_LOG_INFO("Pool", "%s respawned", s.worker_id.c_str());
    } else {
      s.worker.reset();
      s.state = WorkerState::kStopped;
    }
  }

  void HandleShutdown() {
    events_.Close();

    // Submissions that raced with Shutdown().
    while (true) {
      optional<PoolEvent> late = events_.TryPop();
      if (!late.has_value()) {
        break;
      }
      if (auto* submit = std::get_if<SubmitEvent>(&late.value())) {
        Finish(std::move(submit->completion), ShuttingDownFailure());
      }
    }

    for (auto& kv : pending_) {
      Finish(std::move(kv.second.completion), ShuttingDownFailure());
    }
    pending_.clear();
    deadlines_.clear();
    queue_.clear();

    // Joined by JoinRetired() once state_mtx_ is released.
    for (Slot& s : slots_) {
      if (s.worker) {
        s.worker->Stop();
        retired_.push_back(std::move(s.worker));
      }
    }
  }

  void ExpireDeadlines(Clock::time_point now) {
    while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
      auto it = pending_.find(deadlines_.begin()->second);
      AUTHPOOL_ASSERT(it != pending_.end());
      const std::string& id = it->first;
      if (it->second.slot == kNoSlot) {
        auto queued = std::find_if(
            queue_.begin(), queue_.end(),
            [&id](const TaskEnvelope& t) { return t.id == id; });
        if (queued != queue_.end()) {
          queue_.erase(queued);
        }
      }
      timed_out_.fetch_add(1U, std::memory_order_relaxed);
      AUTHPOOL_LOG_WARN("Pool", "%s (%s) timed out after %u ms", id.c_str(),
                        it->second.action.c_str(), it->second.timeout_ms);
      std::string message = "Task " + id + " timed out after " +
                            std::to_string(it->second.timeout_ms) + "ms";
      Resolve(it, MakeFailure(ErrorCode::kTaskTimeout, std::move(message)));
    }
  }

  // ======================== Assignment ========================

  uint32_t PickReadySlot() {
    const uint32_t n = static_cast<uint32_t>(slots_.size());
    for (uint32_t i = 0U; i < n; ++i) {
      const uint32_t idx = (next_slot_ + i) % n;
      if (slots_[idx].state == WorkerState::kReady) {
        next_slot_ = (idx + 1U) % n;
        return idx;
      }
    }
    return kNoSlot;
  }

  void Assign(uint32_t idx, TaskEnvelope&& task) {
    Slot& s = slots_[idx];
    pending_[task.id].slot = idx;
    s.state = WorkerState::kBusy;
    s.current_task = task.id;
    if (!s.worker->Post(std::move(task))) {
      // The worker is exiting; its exit event rejects current_task.
      AUTHPOOL_LOG_WARN("Pool", "%s refused %s", s.worker_id.c_str(),
                        s.current_task.c_str());
    }
  }

  void DispatchQueued() {
    while (!queue_.empty()) {
      const uint32_t idx = PickReadySlot();
      if (idx == kNoSlot) {
        return;
      }
      TaskEnvelope task = std::move(queue_.front());
      queue_.pop_front();
      Assign(idx, std::move(task));
    }
  }

  void Resolve(std::unordered_map<std::string, PendingTask>::iterator it,
               TaskOutcome&& outcome) {
    std::unique_ptr<TaskCompletion> completion = std::move(it->second.completion);
    deadlines_.erase(it->second.deadline);
    pending_.erase(it);
    Finish(std::move(completion), std::move(outcome));
  }

  void SpawnWorker(uint32_t idx) {
    Slot& s = slots_[idx];
    s.worker.reset();
    ++s.generation;

    WorkerConfig wc;
    wc.slot = idx;
    wc.generation = s.generation;
    wc.worker_id = s.worker_id;
    wc.provider = provider_;
    wc.sink = &PoolManager::OnWorkerEvent;
    wc.sink_ctx = this;
    wc.observer = observer_;
    wc.observer_ctx = observer_ctx_;

    s.worker = std::make_unique<Worker>(std::move(wc));
    s.state = WorkerState::kStarting;
    s.worker->Start();
  }

  uint32_t CountLocked(WorkerState state) const {
    uint32_t n = 0U;
    for (const Slot& s : slots_) {
      if (s.state == state) ++n;
    }
    return n;
  }

  // ======================== Data members ========================

  const FixedString<32> name_;
  const uint32_t worker_num_;
  const uint32_t default_timeout_ms_;
  const uint32_t max_queue_depth_;
  const uint32_t init_timeout_ms_;
  const bool respawn_;
  const std::string worker_id_prefix_;
  const std::shared_ptr<const CryptoProvider> provider_;
  const TaskObserver observer_;
  void* const observer_ctx_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutting_down_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<uint64_t> next_task_seq_{1U};

  alignas(kCacheLineSize) std::atomic<uint64_t> submitted_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> completed_{0U};
  std::atomic<uint64_t> failed_{0U};
  std::atomic<uint64_t> timed_out_{0U};
  std::atomic<uint64_t> crashed_{0U};
  std::atomic<uint64_t> respawned_{0U};
  std::atomic<uint64_t> overloaded_{0U};
  std::atomic<uint64_t> dropped_results_{0U};

  Mailbox<PoolEvent> events_;

  // Owned by the manager thread; state_mtx_ lets GetStats() read them.
  mutable std::mutex state_mtx_;
  std::condition_variable ready_cv_;
  std::vector<Slot> slots_;
  std::unordered_map<std::string, PendingTask> pending_;
  std::deque<TaskEnvelope> queue_;
  DeadlineMap deadlines_;
  uint32_t next_slot_{0U};

  // Manager thread only.
  std::vector<Finished> finished_;
  std::vector<std::unique_ptr<Worker>> retired_;

  std::thread manager_thread_;
};

}  // namespace authpool

#endif  // AUTHPOOL_POOL_HPP_
