/**
 * @file envelope.hpp
 * @brief Task / Result envelopes exchanged between the pool and its workers.
 *
 * Wire shape (both variants travel on the same channel):
 *   Task   { id, action, payload }
 *   Result { id, success, result?, error?: { message, stack?, code? } }
 *
 * The protocol is stateless at the message level: a Result is tied to its
 * Task only through the id. Two ids are reserved for worker-originated
 * messages: "init" (readiness) and "error" (fatal, no task id known).
 */

#ifndef AUTHPOOL_ENVELOPE_HPP_
#define AUTHPOOL_ENVELOPE_HPP_

#include "authpool/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>

namespace authpool {

// ============================================================================
// Reserved correlation ids
// ============================================================================

inline constexpr const char* kInitId = "init";
inline constexpr const char* kErrorId = "error";

// ============================================================================
// Action
// ============================================================================

enum class Action : uint8_t {
  kVerifyJwt = 0,
  kSignJwt,
  kGenerateHash,
  kHashPassword,
  kComparePassword,
};

inline constexpr uint32_t kActionCount = 5U;

inline const char* ActionName(Action action) noexcept {
  switch (action) {
    case Action::kVerifyJwt:       return "VERIFY_JWT";
    case Action::kSignJwt:         return "SIGN_JWT";
    case Action::kGenerateHash:    return "GENERATE_HASH";
    case Action::kHashPassword:    return "HASH_PASSWORD";
    case Action::kComparePassword: return "COMPARE_PASSWORD";
  }
  return "UNKNOWN";
}

/** @brief Map a wire action string to its tag. Case sensitive. */
inline optional<Action> ParseAction(const std::string& name) noexcept {
  for (uint32_t i = 0U; i < kActionCount; ++i) {
    const Action a = static_cast<Action>(i);
    if (name == ActionName(a)) return optional<Action>(a);
  }
  return optional<Action>();
}

// ============================================================================
// Error taxonomy
// ============================================================================

enum class ErrorCode : uint8_t {
  kNone = 0,
  // Raised inside a worker, delivered in a Result Envelope.
  kMalformedTask,
  kUnknownAction,
  kPrimitiveFailure,
  // Raised by the pool, never reach a worker.
  kTaskTimeout,
  kWorkerCrashed,
  kPoolShuttingDown,
  kPoolOverloaded,
};

inline const char* ErrorCodeName(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kNone:             return "None";
    case ErrorCode::kMalformedTask:    return "MalformedTask";
    case ErrorCode::kUnknownAction:    return "UnknownAction";
    case ErrorCode::kPrimitiveFailure: return "PrimitiveFailure";
    case ErrorCode::kTaskTimeout:      return "TaskTimeout";
    case ErrorCode::kWorkerCrashed:    return "WorkerCrashed";
    case ErrorCode::kPoolShuttingDown: return "PoolShuttingDown";
    case ErrorCode::kPoolOverloaded:   return "PoolOverloaded";
  }
  return "Unknown";
}

inline ErrorCode ParseErrorCode(const std::string& name) noexcept {
  for (uint8_t i = 0U; i <= static_cast<uint8_t>(ErrorCode::kPoolOverloaded);
       ++i) {
    const ErrorCode c = static_cast<ErrorCode>(i);
    if (name == ErrorCodeName(c)) return c;
  }
  return ErrorCode::kPrimitiveFailure;
}

/**
 * @brief Typed rejection handed to a caller.
 */
struct TaskError {
  ErrorCode code{ErrorCode::kNone};
  std::string message;
  std::string stack;
};

using TaskOutcome = expected<nlohmann::json, TaskError>;

// ============================================================================
// Envelopes
// ============================================================================

/**
 * @brief One unit of work. Copied by value across the worker boundary.
 *
 * action stays a string so that unknown or missing tags reach the worker
 * and are answered there.
 */
struct TaskEnvelope {
  std::string id;
  std::string action;
  nlohmann::json payload;
};

struct ErrorInfo {
  std::string message;
  std::string stack;
  ErrorCode code{ErrorCode::kPrimitiveFailure};
};

/**
 * @brief Answer to a TaskEnvelope. result is set iff success, error iff not.
 */
struct ResultEnvelope {
  std::string id;
  bool success{false};
  nlohmann::json result;
  ErrorInfo error;

  static ResultEnvelope Ok(std::string id, nlohmann::json value) {
    ResultEnvelope r;
    r.id = std::move(id);
    r.success = true;
    r.result = std::move(value);
    return r;
  }

  static ResultEnvelope Fail(std::string id, ErrorCode code,
                             std::string message, std::string stack = {}) {
    ResultEnvelope r;
    r.id = std::move(id);
    r.success = false;
    r.error.code = code;
    r.error.message = std::move(message);
    r.error.stack = std::move(stack);
    return r;
  }
};

/** @brief Convert a Result Envelope into the caller-facing outcome. */
inline TaskOutcome ToOutcome(ResultEnvelope&& r) {
  if (r.success) return TaskOutcome::success(std::move(r.result));
  TaskError err;
  err.code = r.error.code;
  err.message = std::move(r.error.message);
  err.stack = std::move(r.error.stack);
  return TaskOutcome::error(std::move(err));
}

inline TaskOutcome MakeFailure(ErrorCode code, std::string message) {
  TaskError err;
  err.code = code;
  err.message = std::move(message);
  return TaskOutcome::error(std::move(err));
}

// ============================================================================
// Wire codec
// ============================================================================

inline nlohmann::json TaskToWire(const TaskEnvelope& task) {
  return nlohmann::json{
      {"id", task.id}, {"action", task.action}, {"payload", task.payload}};
}

/**
 * @brief Decode a wire task. Missing or non-string id/action decode as
 *        empty strings; the worker rejects them as MalformedTask.
 */
inline TaskEnvelope TaskFromWire(const nlohmann::json& wire) {
  TaskEnvelope task;
  if (!wire.is_object()) return task;
  auto id = wire.find("id");
  if (id != wire.end() && id->is_string()) task.id = id->get<std::string>();
  auto action = wire.find("action");
  if (action != wire.end() && action->is_string()) {
    task.action = action->get<std::string>();
  }
  auto payload = wire.find("payload");
  if (payload != wire.end()) task.payload = *payload;
  return task;
}

inline nlohmann::json ResultToWire(const ResultEnvelope& r) {
  nlohmann::json wire{{"id", r.id}, {"success", r.success}};
  if (r.success) {
    wire["result"] = r.result;
  } else {
    nlohmann::json err{{"message", r.error.message},
                       {"code", ErrorCodeName(r.error.code)}};
    if (!r.error.stack.empty()) err["stack"] = r.error.stack;
    wire["error"] = std::move(err);
  }
  return wire;
}

namespace detail {

inline std::string WireString(const nlohmann::json& obj, const char* key,
                              const char* fallback) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}

}  // namespace detail

/**
 * @brief Decode a wire result. Fields of the wrong type take their defaults:
 *        a non-string id reads as "error", a non-boolean success as false.
 */
inline ResultEnvelope ResultFromWire(const nlohmann::json& wire) {
  ResultEnvelope r;
  if (!wire.is_object()) {
    r.id = kErrorId;
    r.error.code = ErrorCode::kMalformedTask;
    r.error.message = "Invalid result format";
    return r;
  }
  r.id = detail::WireString(wire, "id", kErrorId);
  auto success = wire.find("success");
  r.success = success != wire.end() && success->is_boolean() &&
              success->get<bool>();
  if (r.success) {
    auto it = wire.find("result");
    if (it != wire.end()) r.result = *it;
    return r;
  }
  auto err = wire.find("error");
  if (err != wire.end() && err->is_object()) {
    r.error.message = detail::WireString(*err, "message", "Unknown error");
    r.error.stack = detail::WireString(*err, "stack", "");
    r.error.code = ParseErrorCode(detail::WireString(*err, "code", ""));
  } else {
    r.error.message = "Unknown error";
  }
  return r;
}

}  // namespace authpool

#endif  // AUTHPOOL_ENVELOPE_HPP_
