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
 * @file channel.hpp
 * @brief Unbuffered (rendezvous) channel with close and signal tokens.
 *
 * Send() does not return until a receiver has taken the item, so a channel
 * with no idle receivers makes producers wait instead of buffering.
 *
 * Architecture:
 *   Sender[0..N] --Offer--> FIFO of waiting offers --Take--> Receiver[0..M]
 *                                    ^
 *   PostSignals(n) --> signal tokens +  (ReceiveOrSignal only)
 *
 * Semantics:
 * - Offers are taken in FIFO order.
 * - Close() rejects new sends; offers already waiting are still handed to
 *   receivers, after which receivers see kClosed.
 * - Signal tokens are out-of-band wakeups consumed by ReceiveOrSignal(), one
 *   token per call, ahead of waiting offers. Close() discards them.
 *
 * Usage:
 * @code
 *   autopool::Channel<int> ch;
 *   std::thread rx([&] {
 *     int v;
 *     while (ch.Receive(v) == autopool::RecvStatus::kOk) Use(v);
 *   });
 *   ch.Send(1);   // blocks until rx takes it
 *   ch.Close();
 *   rx.join();
 * @endcode
 */

#ifndef AUTOPOOL_CHANNEL_HPP_
#define AUTOPOOL_CHANNEL_HPP_

#include "autopool/platform.hpp"

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace autopool {

enum class RecvStatus : uint8_t {
  kOk = 0,   ///< An item was received.
  kSignal,   ///< A signal token was consumed (ReceiveOrSignal only).
  kClosed,   ///< Channel closed and drained.
  kTimeout,  ///< ReceiveFor deadline passed.
};

template <typename T>
class Channel final {
 public:
  Channel() noexcept = default;

  ~Channel() { Close(); }

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;
  Channel(Channel&&) = delete;
  Channel& operator=(Channel&&) = delete;

  // ======================== Send ========================

  /**
   * @brief Hand @p item to a receiver, blocking until one takes it.
   * @return true if taken, false if the channel was already closed.
   */
  bool Send(T item) {
    std::unique_lock<std::mutex> lk(mtx_);
    if (closed_) {
      return false;
    }
    Offer offer{&item, false};
    offers_.push_back(&offer);
    recv_cv_.notify_one();
    send_cv_.wait(lk, [&offer] { return offer.taken; });
    return true;
  }

  // ======================== Receive ========================

  /** @brief Block until an item arrives or the channel is closed and drained. */
  RecvStatus Receive(T& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    recv_cv_.wait(lk, [this] { return !offers_.empty() || closed_; });
    return TakeLocked(out);
  }

  /**
   * @brief Receive with a deadline.
   * @return kOk, kClosed, or kTimeout.
   */
  template <typename Rep, typename Period>
  RecvStatus ReceiveFor(T& out, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    if (!recv_cv_.wait_for(lk, timeout, [this] { return !offers_.empty() || closed_; })) {
      return RecvStatus::kTimeout;
    }
    return TakeLocked(out);
  }

  /**
   * @brief Receive an item or consume one signal token, whichever is ready.
   *
   * A pending signal wins over a waiting offer.
   */
  RecvStatus ReceiveOrSignal(T& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    recv_cv_.wait(lk, [this] { return signals_ > 0U || !offers_.empty() || closed_; });
    if (signals_ > 0U) {
      --signals_;
      return RecvStatus::kSignal;
    }
    return TakeLocked(out);
  }

  // ======================== Control ========================

  /** @brief Post @p n signal tokens. Ignored once closed. */
  void PostSignals(uint32_t n) noexcept {
    if (n == 0U) {
      return;
    }
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_) {
        return;
      }
      signals_ += n;
    }
    recv_cv_.notify_all();
  }

  /** @brief Reject further sends and wake every receiver. Idempotent. */
  void Close() noexcept {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_) {
        return;
      }
      closed_ = true;
      signals_ = 0U;
    }
    recv_cv_.notify_all();
  }

  // ======================== Query ========================

  bool IsClosed() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
  }

  uint32_t PendingSignals() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return signals_;
  }

  /** @brief Number of senders currently blocked waiting for a receiver. */
  uint32_t PendingSenders() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<uint32_t>(offers_.size());
  }

 private:
  struct Offer {
    T* item;
    bool taken;
  };

  RecvStatus TakeLocked(T& out) {
    if (offers_.empty()) {
      return RecvStatus::kClosed;
    }
    Offer* offer = offers_.front();
    offers_.pop_front();
    out = std::move(*offer->item);
    offer->taken = true;
    send_cv_.notify_all();
    return RecvStatus::kOk;
  }

  mutable std::mutex mtx_;
  std::condition_variable recv_cv_;
  std::condition_variable send_cv_;
  std::deque<Offer*> offers_;
  uint32_t signals_{0U};
  bool closed_{false};
};

}  // namespace autopool

#endif  // AUTOPOOL_CHANNEL_HPP_
