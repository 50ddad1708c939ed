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
 * @file authpool/worker.hpp
 * @brief Worker - one execution context running crypto primitives.
 *
 * Architecture:
 *   PoolManager --Post()--> inbox Mailbox --> WorkerThread
 *                                                | Execute() (dispatch table)
 *   PoolManager <--WorkerSinkFn(WorkerEvent)-----+
 *
 * Lifecycle:
 *   Start() spawns the thread, which first emits {id:"init", success:true}.
 *   Each inbound TaskEnvelope produces exactly one ResultEnvelope.
 *   Stop() closes the inbox; the thread exits and emits kExited.
 *
 * Failure boundaries:
 *   - Execute() converts every primitive or payload error into a failed
 *     ResultEnvelope. It never throws.
 *   - Anything thrown outside Execute() (the TaskObserver hook) reaches the
 *     thread's last-resort handler, which emits {id:"error"} and exits the
 *     thread. The pool sees kExited with fatal=true.
 *
 * The worker identity (worker_id) is folded into the password salt:
 *   hash = worker_id + "$" + hex(SHA256(password + "worker-salt-" + worker_id))
 */

#ifndef AUTHPOOL_WORKER_HPP_
#define AUTHPOOL_WORKER_HPP_

#include "authpool/crypto.hpp"
#include "authpool/envelope.hpp"
#include "authpool/jwt.hpp"
#include "authpool/log.hpp"
#include "authpool/mailbox.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace authpool {

// ============================================================================
// Worker -> pool events
// ============================================================================

struct WorkerEvent {
  enum class Kind : uint8_t { kResult = 0, kExited };

  Kind kind{Kind::kResult};
  uint32_t slot{0U};
  uint64_t generation{0U};
  ResultEnvelope result;  ///< Valid for kResult.
  bool fatal{false};      ///< Valid for kExited.
};

/// @brief Delivery function for worker events. Called on the worker thread.
using WorkerSinkFn = void (*)(WorkerEvent&& event, void* ctx);

struct WorkerInfo {
  uint32_t slot;
  const std::string& worker_id;
};

/**
 * @brief Hook run on the worker thread before each dispatch.
 *
 * Runs outside the dispatch error boundary: an exception escaping the hook
 * is fatal for the worker.
 */
using TaskObserver = void (*)(const WorkerInfo& info, const TaskEnvelope& task,
                              void* ctx);

inline constexpr const char* kPasswordSaltTag = "worker-salt-";

struct WorkerConfig {
  uint32_t slot{0U};
  uint64_t generation{0U};
  std::string worker_id;
  std::shared_ptr<const CryptoProvider> provider;
  WorkerSinkFn sink{nullptr};
  void* sink_ctx{nullptr};
  TaskObserver observer{nullptr};
  void* observer_ctx{nullptr};
};

// ============================================================================
// Worker
// ============================================================================

class Worker {
 public:
  explicit Worker(WorkerConfig cfg)
      : cfg_(std::move(cfg)),
        provider_(cfg_.provider ? cfg_.provider : DefaultCryptoProvider()),
        jwt_(*provider_) {}

  ~Worker() {
    Stop();
    Join();
  }

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

  // ======================== Lifecycle ========================

  void Start() {
    if (thread_.joinable()) {
      return;
    }
    thread_ = std::thread(&Worker::Run, this);
  }

  /** @brief Ask the thread to exit. Tasks still in the inbox are skipped. */
  void Stop() noexcept {
    stopping_.store(true, std::memory_order_release);
    inbox_.Close();
  }

  void Join() noexcept {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
      thread_.join();
    }
  }

  /**
   * @brief Hand a task to the worker.
   * @return false if the worker is exiting; the task was not accepted.
   */
  bool Post(TaskEnvelope&& task) { return inbox_.Push(std::move(task)); }

  const std::string& WorkerId() const noexcept { return cfg_.worker_id; }
  uint64_t Generation() const noexcept { return cfg_.generation; }

  // ======================== Dispatch table ========================

  /**
   * @brief Run one task synchronously and build its result.
   *
   * Missing id or action -> MalformedTask (id falls back to "error").
   * Unrecognised action  -> UnknownAction.
   * Primitive failure    -> PrimitiveFailure.
   */
  ResultEnvelope Execute(const TaskEnvelope& task) const {
    if (task.id.empty() || task.action.empty()) {
      return ResultEnvelope::Fail(task.id.empty() ? kErrorId : task.id,
                                  ErrorCode::kMalformedTask,
                                  "Invalid message format: missing id or action");
    }

    optional<Action> action = ParseAction(task.action);
    if (!action.has_value()) {
      return ResultEnvelope::Fail(task.id, ErrorCode::kUnknownAction,
                                  "Unknown action: " + task.action);
    }

    try {
      PrimitiveResult<nlohmann::json> r = Dispatch(action.value(), task.payload);
      if (!r.has_value()) {
        return ResultEnvelope::Fail(task.id, ErrorCode::kPrimitiveFailure,
                                    r.get_error().message);
      }
      return ResultEnvelope::Ok(task.id, std::move(r).value());
    } catch (const std::exception& e) {
      return ResultEnvelope::Fail(task.id, ErrorCode::kPrimitiveFailure,
                                  e.what());
    }
  }

 private:
  using JsonResult = PrimitiveResult<nlohmann::json>;

  // ======================== Thread body ========================

  void Run() noexcept {
    Emit(ResultEnvelope::Ok(kInitId, nullptr));
    AUTHPOOL_LOG_DEBUG("Worker", "%s ready (slot %u)", cfg_.worker_id.c_str(),
                       cfg_.slot);

    bool fatal = false;
    try {
      Loop();
    } catch (const std::exception& e) {
      fatal = true;
      ReportFatal(e.what());
    } catch (...) {
      fatal = true;
      ReportFatal("unknown exception");
    }

    inbox_.Close();
    WorkerEvent exited;
    exited.kind = WorkerEvent::Kind::kExited;
    exited.slot = cfg_.slot;
    exited.generation = cfg_.generation;
    exited.fatal = fatal;
    cfg_.sink(std::move(exited), cfg_.sink_ctx);
  }

  void Loop() {
    while (true) {
      optional<TaskEnvelope> task = inbox_.Pop();
      if (!task.has_value() || stopping_.load(std::memory_order_acquire)) {
        return;
      }
      if (cfg_.observer != nullptr) {
        cfg_.observer(WorkerInfo{cfg_.slot, cfg_.worker_id}, task.value(),
                      cfg_.observer_ctx);
      }
      Emit(Execute(task.value()));
    }
  }

  void ReportFatal(const char* what) noexcept {
    AUTHPOOL_LOG_ERROR("Worker", "%s uncaught exception: %s",
                       cfg_.worker_id.c_str(), what);
    try {
      Emit(ResultEnvelope::Fail(kErrorId, ErrorCode::kWorkerCrashed, what));
    } catch (const std::exception& e) {
      AUTHPOOL_LOG_ERROR("Worker", "%s could not report fatal error: %s",
                         cfg_.worker_id.c_str(), e.what());
    }
  }

  void Emit(ResultEnvelope&& result) {
    WorkerEvent ev;
    ev.kind = WorkerEvent::Kind::kResult;
    ev.slot = cfg_.slot;
    ev.generation = cfg_.generation;
    ev.result = std::move(result);
    cfg_.sink(std::move(ev), cfg_.sink_ctx);
  }

  // ======================== Primitives ========================

  JsonResult Dispatch(Action action, const nlohmann::json& payload) const {
    if (!payload.is_object()) {
      return JsonResult::error(PrimitiveError{"payload must be an object"});
    }
    switch (action) {
      case Action::kVerifyJwt:       return VerifyJwt(payload);
      case Action::kSignJwt:         return SignJwt(payload);
      case Action::kGenerateHash:    return GenerateHash(payload);
      case Action::kHashPassword:    return HashPassword(payload);
      case Action::kComparePassword: return ComparePassword(payload);
    }
    return JsonResult::error(PrimitiveError{"Unknown action"});
  }

  static optional<std::string> StringField(const nlohmann::json& payload,
                                           const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) return optional<std::string>();
    return optional<std::string>(it->get<std::string>());
  }

  static nlohmann::json OptionsField(const nlohmann::json& payload) {
    auto it = payload.find("options");
    return (it == payload.end()) ? nlohmann::json() : *it;
  }

  static JsonResult MissingField(const char* key) {
    return JsonResult::error(
        PrimitiveError{std::string("payload.") + key + " must be a string"});
  }

  JsonResult VerifyJwt(const nlohmann::json& payload) const {
    auto token = StringField(payload, "token");
    if (!token.has_value()) return MissingField("token");
    auto secret = StringField(payload, "secret");
    if (!secret.has_value()) return MissingField("secret");
    return jwt_.Verify(token.value(), secret.value(), OptionsField(payload));
  }

  JsonResult SignJwt(const nlohmann::json& payload) const {
    auto secret = StringField(payload, "secret");
    if (!secret.has_value()) return MissingField("secret");
    auto claims = payload.find("payload");
    if (claims == payload.end()) {
      return JsonResult::error(PrimitiveError{"payload.payload is required"});
    }
    auto token = jwt_.Sign(*claims, secret.value(), OptionsField(payload));
    if (!token.has_value()) return JsonResult::error(token.get_error());
    return JsonResult::success(std::move(token).value());
  }

  JsonResult GenerateHash(const nlohmann::json& payload) const {
    auto data = StringField(payload, "data");
    if (!data.has_value()) return MissingField("data");
    const std::string algorithm =
        StringField(payload, "algorithm").value_or("sha256");
    const std::string encoding_name =
        StringField(payload, "encoding").value_or("hex");
    optional<DigestEncoding> encoding = ParseDigestEncoding(encoding_name);
    if (!encoding.has_value()) {
      return JsonResult::error(
          PrimitiveError{"Unsupported encoding: " + encoding_name});
    }
    auto digest = provider_->Digest(algorithm, data.value(), encoding.value());
    if (!digest.has_value()) return JsonResult::error(digest.get_error());
    return JsonResult::success(std::move(digest).value());
  }

  JsonResult HashPassword(const nlohmann::json& payload) const {
    auto password = StringField(payload, "password");
    if (!password.has_value()) return MissingField("password");
    auto hex = SaltedDigest(password.value(), cfg_.worker_id);
    if (!hex.has_value()) return JsonResult::error(hex.get_error());
    return JsonResult::success(cfg_.worker_id + "$" + hex.value());
  }

  JsonResult ComparePassword(const nlohmann::json& payload) const {
    auto password = StringField(payload, "password");
    if (!password.has_value()) return MissingField("password");
    auto hash = StringField(payload, "hash");
    if (!hash.has_value()) return MissingField("hash");

    // "<salt identity>$<hex>"; a bare digest was salted by this worker.
    std::string identity = cfg_.worker_id;
    std::string stored = hash.value();
    const size_t sep = stored.rfind('$');
    if (sep != std::string::npos) {
      identity = stored.substr(0U, sep);
      stored = stored.substr(sep + 1U);
    }

    auto hex = SaltedDigest(password.value(), identity);
    if (!hex.has_value()) return JsonResult::error(hex.get_error());
    return JsonResult::success(provider_->ConstantTimeEqual(hex.value(), stored));
  }

  PrimitiveResult<std::string> SaltedDigest(const std::string& password,
                                            const std::string& identity) const {
    return provider_->Digest("sha256", password + kPasswordSaltTag + identity,
                             DigestEncoding::kHex);
  }

  // ======================== Data members ========================

  const WorkerConfig cfg_;
  const std::shared_ptr<const CryptoProvider> provider_;
  const JwtCodec jwt_;

  Mailbox<TaskEnvelope> inbox_;
  std::atomic<bool> stopping_{false};
  std::thread thread_;
};

}  // namespace authpool

#endif  // AUTHPOOL_WORKER_HPP_
