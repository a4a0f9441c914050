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
 * @file context.hpp
 * @brief Request-scoped, cancelable context handed through a pipeline.
 *
 * A Context is a cheap copyable handle onto shared, immutable state plus an
 * atomic cancellation flag. Derived contexts (WithCancel, WithTimeout,
 * WithValue) keep a reference to their parent: cancelling a parent is
 * visible from every child, a value lookup walks up the chain, and the
 * effective deadline is the earliest one on the chain.
 *
 * Pools never inspect a context; they only carry it from the caller to the
 * handler and on to downstream stages.
 *
 * Usage:
 * @code
 *   autopool::Context root;
 *   auto ctx = root.WithTimeout(std::chrono::milliseconds(50)).WithValue("req", "42");
 *   pool->Data(ctx, item);
 *   // in a handler:
 *   if (ctx.IsExpired()) return Error(kErrorExpired, "deadline");
 * @endcode
 */

#ifndef AUTOPOOL_CONTEXT_HPP_
#define AUTOPOOL_CONTEXT_HPP_

#include "autopool/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace autopool {

class Context final {
 public:
  using Clock = std::chrono::steady_clock;

  /** @brief Background context: never cancelled, no deadline, no values. */
  Context() : node_(std::make_shared<Node>()) {}

  /** @brief Child context that can be cancelled independently of its parent. */
  Context WithCancel() const {
    auto child = std::make_shared<Node>();
    child->parent = node_;
    return Context(std::move(child));
  }

  /** @brief Child context that expires after @p life. */
  template <typename Rep, typename Period>
  Context WithTimeout(std::chrono::duration<Rep, Period> life) const {
    auto child = std::make_shared<Node>();
    child->parent = node_;
    child->has_deadline = true;
    child->deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(life);
    return Context(std::move(child));
  }

  /** @brief Child context carrying @p key -> @p value. */
  Context WithValue(std::string key, std::string value) const {
    auto child = std::make_shared<Node>();
    child->parent = node_;
    child->has_value = true;
    child->key = std::move(key);
    child->value = std::move(value);
    return Context(std::move(child));
  }

  /** @brief Look up @p key, nearest binding first. */
  optional<std::string> Value(const std::string& key) const {
    for (const Node* n = node_.get(); n != nullptr; n = n->parent.get()) {
      if (n->has_value && n->key == key) {
        return n->value;
      }
    }
    return {};
  }

  /** @brief Cancel this context and, transitively, every context derived from it. */
  void Cancel() noexcept { node_->cancelled.store(true, std::memory_order_release); }

  bool IsCancelled() const noexcept {
    for (const Node* n = node_.get(); n != nullptr; n = n->parent.get()) {
      if (n->cancelled.load(std::memory_order_acquire)) {
        return true;
      }
    }
    return false;
  }

  /** @brief Time left before the earliest deadline on the chain, if any. */
  optional<Clock::duration> TimeRemaining() const noexcept {
    bool found = false;
    Clock::time_point earliest{};
    for (const Node* n = node_.get(); n != nullptr; n = n->parent.get()) {
      if (n->has_deadline && (!found || n->deadline < earliest)) {
        earliest = n->deadline;
        found = true;
      }
    }
    if (!found) {
      return {};
    }
    const auto now = Clock::now();
    return (earliest > now) ? (earliest - now) : Clock::duration::zero();
  }

  /** @brief True once cancelled or once the deadline has passed. */
  bool IsExpired() const noexcept {
    if (IsCancelled()) {
      return true;
    }
    auto rem = TimeRemaining();
    return rem.has_value() && *rem == Clock::duration::zero();
  }

  bool operator==(const Context& other) const noexcept { return node_ == other.node_; }
  bool operator!=(const Context& other) const noexcept { return node_ != other.node_; }

 private:
  struct Node {
    std::shared_ptr<const Node> parent;
    std::atomic<bool> cancelled{false};
    bool has_deadline{false};
    Clock::time_point deadline{};
    bool has_value{false};
    std::string key;
    std::string value;
  };

  explicit Context(std::shared_ptr<Node> node) : node_(std::move(node)) {}

  std::shared_ptr<Node> node_;
};

}  // namespace autopool

#endif  // AUTOPOOL_CONTEXT_HPP_
