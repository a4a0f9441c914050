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
 * @file notify.hpp
 * @brief One-shot event and wait group (completion barrier).
 *
 * Both are mutex + condition_variable based, no heap allocation,
 * -fno-exceptions -fno-rtti compatible.
 */

#ifndef AUTOPOOL_NOTIFY_HPP_
#define AUTOPOOL_NOTIFY_HPP_

#include "autopool/platform.hpp"

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace autopool {

// ============================================================================
// OneShotEvent
// ============================================================================

/**
 * @brief Event that is set exactly once and then stays set.
 *
 * Any number of threads may wait; all are released by the first Set().
 * Later Set() calls are no-ops.
 *
 * Usage:
 * @code
 *   autopool::OneShotEvent closed;
 *   // Owner:
 *   closed.Set();
 *   // Observers:
 *   closed.Wait();
 * @endcode
 */
class OneShotEvent final {
 public:
  OneShotEvent() noexcept = default;
  ~OneShotEvent() = default;

  // Non-copyable, non-movable
  OneShotEvent(const OneShotEvent&) = delete;
  OneShotEvent& operator=(const OneShotEvent&) = delete;
  OneShotEvent(OneShotEvent&&) = delete;
  OneShotEvent& operator=(OneShotEvent&&) = delete;

  /**
   * @brief Set the event and wake every waiter.
   * @return true on the first call, false if it was already set.
   */
  bool Set() noexcept {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (set_) {
        return false;
      }
      set_ = true;
    }
    cv_.notify_all();
    return true;
  }

  /** @brief Block until the event is set. */
  void Wait() const noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return set_; });
  }

  /**
   * @brief Timed wait with microsecond timeout.
   * @return true if the event was set before the timeout.
   */
  bool WaitFor(uint64_t timeout_us) const noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, std::chrono::microseconds(timeout_us), [this] { return set_; });
  }

  bool IsSet() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return set_;
  }

 private:
  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
  bool set_{false};
};

// ============================================================================
// WaitGroup
// ============================================================================

/**
 * @brief Counter that blocks Wait() until it drops back to zero.
 *
 * Usage:
 * @code
 *   autopool::WaitGroup wg;
 *   wg.Add(1);
 *   std::thread([&wg] { Work(); wg.Done(); }).detach();
 *   wg.Wait();
 * @endcode
 */
class WaitGroup final {
 public:
  WaitGroup() noexcept = default;
  ~WaitGroup() = default;

  // Non-copyable, non-movable
  WaitGroup(const WaitGroup&) = delete;
  WaitGroup& operator=(const WaitGroup&) = delete;
  WaitGroup(WaitGroup&&) = delete;
  WaitGroup& operator=(WaitGroup&&) = delete;

  void Add(uint32_t n = 1U) noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    count_ += n;
  }

  /** @brief Decrement; the waiters are released when the count reaches zero. */
  void Done() noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    AUTOPOOL_ASSERT(count_ > 0U);
    if (count_ > 0U) {
      --count_;
    }
    if (count_ == 0U) {
      cv_.notify_all();
    }
  }

  void Wait() noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return count_ == 0U; });
  }

  /**
   * @brief Timed wait with microsecond timeout.
   * @return true if the count reached zero before the timeout.
   */
  bool WaitFor(uint64_t timeout_us) noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, std::chrono::microseconds(timeout_us), [this] { return count_ == 0U; });
  }

  uint32_t Count() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return count_;
  }

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  uint32_t count_{0U};
};

}  // namespace autopool

#endif  // AUTOPOOL_NOTIFY_HPP_
