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
 * @file stage.hpp
 * @brief Payload, Handler, and the Stage contract between pipeline neighbors.
 *
 * A Stage<In> is anything that accepts values of type In (or errors) from an
 * upstream pool. Pool<In, Out> is a Stage<In> whose handler turns In into
 * Out and forwards the result to its own Stage<Out> subscribers.
 *
 *   Pool<A, B> --Next--> Stage<B> (Pool<B, C>) --Next--> Stage<C> ...
 */

#ifndef AUTOPOOL_STAGE_HPP_
#define AUTOPOOL_STAGE_HPP_

#include "autopool/context.hpp"
#include "autopool/error.hpp"
#include "autopool/notify.hpp"
#include "autopool/stat.hpp"
#include "autopool/vocabulary.hpp"

#include <memory>
#include <utility>

namespace autopool {

// ============================================================================
// Payload
// ============================================================================

/** @brief Unit of transfer: context plus either an error or a value. */
template <typename T>
struct Payload {
  Context ctx;
  optional<Error> err;
  optional<T> data;
};

// ============================================================================
// Handler
// ============================================================================

/**
 * @brief Processing logic plugged into a pool.
 *
 * Do() receives the payload's context, its error (set when the payload was
 * injected with Stage::Error) and its value (set when injected with
 * Stage::Data). Returning an error routes it to every subscriber's Error();
 * returning a value routes it to every subscriber's Data(). An exception
 * escaping Do() drops the payload and is reported to the pool's event log.
 */
template <typename In, typename Out>
class Handler {
 public:
  virtual ~Handler() = default;

  virtual expected<Out, Error> Do(const Context& ctx, const optional<Error>& err,
                                  const optional<In>& data) = 0;
};

/** @brief Handler backed by a callable with the same signature as Do(). */
template <typename In, typename Out, typename Fn>
class FunctionHandler final : public Handler<In, Out> {
 public:
  explicit FunctionHandler(Fn fn) : fn_(std::move(fn)) {}

  expected<Out, Error> Do(const Context& ctx, const optional<Error>& err,
                          const optional<In>& data) override {
    return fn_(ctx, err, data);
  }

 private:
  Fn fn_;
};

template <typename In, typename Out, typename Fn>
std::unique_ptr<Handler<In, Out>> MakeHandler(Fn fn) {
  return std::unique_ptr<Handler<In, Out>>(new FunctionHandler<In, Out, Fn>(std::move(fn)));
}

// ============================================================================
// Stage
// ============================================================================

template <typename In>
class Stage {
 public:
  virtual ~Stage() = default;

  /** @brief Hand @p value to the stage; blocks until accepted. No-op once closed. */
  virtual void Data(const Context& ctx, In value) = 0;

  /** @brief Hand @p err to the stage; blocks until accepted. No-op once closed. */
  virtual void Error(const Context& ctx, const autopool::Error& err) = 0;

  /** @brief Stop accepting work and wait for in-flight work to finish. Idempotent. */
  virtual void Shutdown() = 0;

  virtual Stat Stats() = 0;

  /** @brief Set once Shutdown() has fully drained the stage. */
  virtual std::shared_ptr<const OneShotEvent> CloseNotify() const = 0;

  virtual const char* Id() const noexcept = 0;

  virtual bool IsClosed() const noexcept = 0;
};

}  // namespace autopool

#endif  // AUTOPOOL_STAGE_HPP_
