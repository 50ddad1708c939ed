/**
 * @file dispatch.hpp
 * @brief Dispatcher - typed entry point for authentication work.
 *
 * One method per action. Each builds the task payload, submits it to the
 * pool and returns a future of the typed result. Any error, pool-local or
 * worker-local, arrives as a TaskError; callers must treat it as a failed
 * check (an unverifiable token is invalid, never valid).
 */

#ifndef AUTHPOOL_DISPATCH_HPP_
#define AUTHPOOL_DISPATCH_HPP_

#include "authpool/envelope.hpp"
#include "authpool/pool.hpp"
#include "authpool/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <future>
#include <string>
#include <utility>

namespace authpool {

namespace detail {

template <typename T>
struct ResultType;

template <>
struct ResultType<nlohmann::json> {
  static bool Matches(const nlohmann::json& v) { return v.is_object(); }
};

template <>
struct ResultType<std::string> {
  static bool Matches(const nlohmann::json& v) { return v.is_string(); }
};

template <>
struct ResultType<bool> {
  static bool Matches(const nlohmann::json& v) { return v.is_boolean(); }
};

/// Narrow a raw outcome to T; a value of the wrong JSON type is a failure.
template <typename T>
expected<T, TaskError> ConvertOutcome(TaskOutcome&& outcome) {
  if (!outcome.has_value()) {
    return expected<T, TaskError>::error(outcome.get_error());
  }
  const nlohmann::json& v = outcome.value();
  if (!ResultType<T>::Matches(v)) {
    TaskError err;
    err.code = ErrorCode::kPrimitiveFailure;
    err.message = std::string("unexpected result type: ") + v.type_name();
    return expected<T, TaskError>::error(std::move(err));
  }
  return expected<T, TaskError>::success(v.get<T>());
}

}  // namespace detail

class Dispatcher {
 public:
  template <typename T>
  using Future = std::future<expected<T, TaskError>>;

  explicit Dispatcher(PoolManager& pool) noexcept : pool_(pool) {}

  /** @brief Decoded claims of a valid token. */
  Future<nlohmann::json> VerifyJwt(const std::string& token,
                                   const std::string& secret,
                                   nlohmann::json options = nlohmann::json::object(),
                                   uint32_t timeout_ms = 0U) {
    nlohmann::json payload{{"token", token},
                           {"secret", secret},
                           {"options", std::move(options)}};
    return Submit<nlohmann::json>(Action::kVerifyJwt, std::move(payload),
                                  timeout_ms);
  }

  /** @brief Compact HS256/384/512 token for @p claims. */
  Future<std::string> SignJwt(nlohmann::json claims, const std::string& secret,
                              nlohmann::json options = nlohmann::json::object(),
                              uint32_t timeout_ms = 0U) {
    nlohmann::json payload{{"payload", std::move(claims)},
                           {"secret", secret},
                           {"options", std::move(options)}};
    return Submit<std::string>(Action::kSignJwt, std::move(payload), timeout_ms);
  }

  Future<std::string> GenerateHash(const std::string& data,
                                   const std::string& algorithm = "sha256",
                                   const std::string& encoding = "hex",
                                   uint32_t timeout_ms = 0U) {
    nlohmann::json payload{
        {"data", data}, {"algorithm", algorithm}, {"encoding", encoding}};
    return Submit<std::string>(Action::kGenerateHash, std::move(payload),
                               timeout_ms);
  }

  Future<std::string> HashPassword(const std::string& password,
                                   uint32_t timeout_ms = 0U) {
    nlohmann::json payload{{"password", password}};
    return Submit<std::string>(Action::kHashPassword, std::move(payload),
                               timeout_ms);
  }

  Future<bool> ComparePassword(const std::string& password,
                               const std::string& hash,
                               uint32_t timeout_ms = 0U) {
    nlohmann::json payload{{"password", password}, {"hash", hash}};
    return Submit<bool>(Action::kComparePassword, std::move(payload),
                        timeout_ms);
  }

  PoolManager& Pool() noexcept { return pool_; }

 private:
  template <typename T>
  Future<T> Submit(Action action, nlohmann::json payload, uint32_t timeout_ms) {
    return pool_.SubmitAs<T>(action, std::move(payload), timeout_ms,
                             &detail::ConvertOutcome<T>);
  }

  PoolManager& pool_;
};

}  // namespace authpool

#endif  // AUTHPOOL_DISPATCH_HPP_
