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
 * @file authpool/mailbox.hpp
 * @brief Mailbox - closable FIFO channel between execution contexts.
 *
 * Many producers, one consumer. Items are moved in and moved out; nothing
 * is shared between sender and receiver after Push() returns.
 *
 * Close() is the end-of-stream signal: further Push() calls fail, blocked
 * receivers wake up, and items queued before the close are still drained.
 */

#ifndef AUTHPOOL_MAILBOX_HPP_
#define AUTHPOOL_MAILBOX_HPP_

#include "authpool/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

namespace authpool {

template <typename T>
class Mailbox {
 public:
  Mailbox() = default;

  Mailbox(const Mailbox&) = delete;
  Mailbox& operator=(const Mailbox&) = delete;
  Mailbox(Mailbox&&) = delete;
  Mailbox& operator=(Mailbox&&) = delete;

  /**
   * @brief Enqueue an item.
   * @return false if the mailbox is closed; item is left untouched.
   */
  bool Push(T&& item) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  /**
   * @brief Block until an item is available or the mailbox is closed and
   *        drained.
   */
  optional<T> Pop() {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return !items_.empty() || closed_; });
    return TakeFront();
  }

  /**
   * @brief Like Pop(), but gives up at @p deadline.
   */
  template <typename Clock, typename Duration>
  optional<T> PopUntil(const std::chrono::time_point<Clock, Duration>& deadline) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_until(lk, deadline, [this] { return !items_.empty() || closed_; });
    return TakeFront();
  }

  optional<T> TryPop() {
    std::lock_guard<std::mutex> lk(mtx_);
    return TakeFront();
  }

  void Close() noexcept {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool IsClosed() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
  }

  uint32_t Size() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<uint32_t>(items_.size());
  }

 private:
  // Caller holds mtx_.
  optional<T> TakeFront() {
    if (items_.empty()) {
      return optional<T>();
    }
    optional<T> out(std::move(items_.front()));
    items_.pop_front();
    return out;
  }

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_{false};
};

}  // namespace authpool

#endif  // AUTHPOOL_MAILBOX_HPP_
