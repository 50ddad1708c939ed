/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional, FixedString.
 *
 * Error handling is value based: fallible calls return expected<V, E>
 * instead of throwing. Types are header-only, C++17.
 *
 * Usage:
 * @code
 *   authpool::expected<int, authpool::ConfigError> r = Parse();
 *   if (!r.has_value()) { Report(r.get_error()); }
 * @endcode
 */

#ifndef AUTHPOOL_VOCABULARY_HPP_
#define AUTHPOOL_VOCABULARY_HPP_

#include "authpool/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace authpool {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the named factories success() / error().
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) { return expected(kValueTag, val); }
  static expected success(V&& val) {
    return expected(kValueTag, std::move(val));
  }
  static expected error(const E& err) { return expected(kErrorTag, err); }
  static expected error(E&& err) { return expected(kErrorTag, std::move(err)); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&value_) V(other.value_);
    } else {
      ::new (&error_) E(other.error_);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&value_) V(std::move(other.value_));
    } else {
      ::new (&error_) E(std::move(other.error_));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&value_) V(other.value_);
      } else {
        ::new (&error_) E(other.error_);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&value_) V(std::move(other.value_));
      } else {
        ::new (&error_) E(std::move(other.error_));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    AUTHPOOL_ASSERT(has_value_);
    return value_;
  }
  const V& value() const& noexcept {
    AUTHPOOL_ASSERT(has_value_);
    return value_;
  }
  V&& value() && noexcept {
    AUTHPOOL_ASSERT(has_value_);
    return std::move(value_);
  }

  const E& get_error() const noexcept {
    AUTHPOOL_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? value_ : fallback;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};
  static constexpr ValueTag kValueTag{};
  static constexpr ErrorTag kErrorTag{};

  template <typename U>
  expected(ValueTag, U&& val) : has_value_(true) {
    ::new (&value_) V(std::forward<U>(val));
  }

  template <typename U>
  expected(ErrorTag, U&& err) : has_value_(false) {
    ::new (&error_) E(std::forward<U>(err));
  }

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
    } else {
      error_.~E();
    }
  }

  bool has_value_;
  union {
    V value_;
    E error_;
  };
};

/** @brief void specialization: success carries no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(); }
  static expected error(const E& err) { return expected(err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const noexcept {
    AUTHPOOL_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected() noexcept : has_value_(true), error_() {}
  explicit expected(const E& err) : has_value_(false), error_(err) {}

  bool has_value_;
  E error_;
};

// ============================================================================
// optional<T>
// ============================================================================

/**
 * @brief Minimal optional value with in-place storage.
 */
template <typename T>
class optional final {
 public:
  optional() noexcept : engaged_(false) {}

  optional(const T& val) : engaged_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_) T(val);
  }

  optional(T&& val) : engaged_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_) T(std::move(val));
  }

  optional(const optional& other) : engaged_(other.engaged_) {
    if (engaged_) ::new (&storage_) T(other.storage_);
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : engaged_(other.engaged_) {
    if (engaged_) ::new (&storage_) T(std::move(other.storage_));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      engaged_ = other.engaged_;
      if (engaged_) ::new (&storage_) T(other.storage_);
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      engaged_ = other.engaged_;
      if (engaged_) ::new (&storage_) T(std::move(other.storage_));
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return engaged_; }
  explicit operator bool() const noexcept { return engaged_; }

  T& value() & noexcept {
    AUTHPOOL_ASSERT(engaged_);
    return storage_;
  }
  const T& value() const& noexcept {
    AUTHPOOL_ASSERT(engaged_);
    return storage_;
  }
  T&& value() && noexcept {
    AUTHPOOL_ASSERT(engaged_);
    return std::move(storage_);
  }

  T value_or(const T& fallback) const {
    return engaged_ ? storage_ : fallback;
  }

  void reset() noexcept {
    if (engaged_) {
      storage_.~T();
      engaged_ = false;
    }
  }

 private:
  bool engaged_;
  union {
    T storage_;
  };
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/// @brief Tag selecting the truncating constructor / assign overload.
struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Stack-allocated string with a compile-time capacity.
 *
 * Literal construction checks the length at compile time; runtime strings
 * go through the TruncateToCapacity overloads.
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept  // NOLINT(runtime/explicit)
      : size_(N - 1U) {
    static_assert(N - 1U <= Capacity, "literal exceeds FixedString capacity");
    std::memcpy(buf_, str, N);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0U) {
    assign(TruncateToCapacity, str);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    size_ = 0U;
    if (str != nullptr) {
      while (size_ < Capacity && str[size_] != '\0') {
        buf_[size_] = str[size_];
        ++size_;
      }
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  template <uint32_t Other>
  bool operator==(const FixedString<Other>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }

  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_;
};

}  // namespace authpool

#endif  // AUTHPOOL_VOCABULARY_HPP_
