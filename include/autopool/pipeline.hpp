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
 * @file pipeline.hpp
 * @brief Helpers for assembling pools into a pipeline and draining it.
 *
 *   auto parse = autopool::Do<std::string, int>(cfg, ParseFn).value();
 *   auto twice = autopool::Do<int, int>(parse, cfg, DoubleFn).value();
 *   auto out   = autopool::Receive(twice);
 *   auto errs  = autopool::ReceiveError(twice);
 *
 *   parse->Data("21");
 *   int v;
 *   out.channel->Receive(v);   // 42
 *
 * Receive/ReceiveError attach a one-worker terminal pool that pushes onto a
 * rendezvous channel. A watcher thread shuts the terminal down and closes the
 * channel after the upstream pool's CloseNotify() fires. The consumer must
 * keep reading until then: a result that nobody takes holds the terminal
 * executor and therefore the upstream Shutdown().
 */

#ifndef AUTOPOOL_PIPELINE_HPP_
#define AUTOPOOL_PIPELINE_HPP_

#include "autopool/channel.hpp"
#include "autopool/error.hpp"
#include "autopool/pool.hpp"
#include "autopool/pool_config.hpp"
#include "autopool/stage.hpp"

#include <memory>
#include <thread>
#include <utility>

namespace autopool {

// ============================================================================
// Do / Identity
// ============================================================================

/** @brief Pool whose handler is @p fn. */
template <typename In, typename Out, typename Fn>
expected<std::shared_ptr<Pool<In, Out>>, PoolError> Do(const PoolConfig& cfg, Fn fn) {
  return Pool<In, Out>::Create(cfg, MakeHandler<In, Out>(std::move(fn)));
}

/** @brief Pool whose handler is @p fn, subscribed to @p upstream if non-null. */
template <typename In, typename Out, typename Upstream, typename Fn>
expected<std::shared_ptr<Pool<In, Out>>, PoolError> Do(const std::shared_ptr<Upstream>& upstream,
                                                       const PoolConfig& cfg, Fn fn) {
  auto created = Do<In, Out>(cfg, std::move(fn));
  if (created.has_value() && upstream != nullptr) {
    upstream->Next(created.value());
  }
  return created;
}

/** @brief Pool that passes values and errors through unchanged. */
template <typename T>
std::shared_ptr<Pool<T, T>> Identity(const PoolConfig& cfg) {
  auto fn = [](const Context&, const optional<Error>& err, const optional<T>& data) -> expected<T, Error> {
    if (err.has_value()) {
      return expected<T, Error>::error(*err);
    }
    return expected<T, Error>::success(*data);
  };
  return Do<T, T>(cfg, fn).value();
}

// ============================================================================
// Receive / ReceiveError
// ============================================================================

/** @brief Channel fed by a terminal pool subscribed to some upstream. */
template <typename T, typename Terminal>
struct Tap {
  std::shared_ptr<Channel<T>> channel;
  std::shared_ptr<Terminal> terminal;
};

namespace detail {

inline PoolConfig TerminalConfig(const PoolConfig& upstream, const char* name) {
  PoolConfig cfg;
  cfg.name.assign(TruncateToCapacity, name);
  cfg.min_workers = 1;
  cfg.max_workers = 1;
  cfg.check_interval = upstream.check_interval;
  cfg.max_check_interval = upstream.max_check_interval;
  cfg.event_log = upstream.event_log;
  return cfg;
}

/** Shut @p terminal down and close @p ch once @p upstream_closed is set. */
template <typename T, typename Terminal>
void WatchUpstream(std::shared_ptr<const OneShotEvent> upstream_closed, std::shared_ptr<Terminal> terminal,
                   std::shared_ptr<Channel<T>> ch) {
  std::thread([upstream_closed, terminal, ch] {
    upstream_closed->Wait();
    terminal->Shutdown();
    ch->Close();
  }).detach();
}

}  // namespace detail

/**
 * @brief Deliver every value @p upstream produces onto a channel.
 *
 * Errors reaching the terminal are dropped; use ReceiveError() for those.
 */
template <typename Upstream>
auto Receive(const std::shared_ptr<Upstream>& upstream)
    -> Tap<typename Upstream::OutType, Pool<typename Upstream::OutType, typename Upstream::OutType>> {
  using T = typename Upstream::OutType;
  auto ch = std::make_shared<Channel<T>>();
  auto fn = [ch](const Context&, const optional<Error>& err, const optional<T>& data) -> expected<T, Error> {
    if (err.has_value()) {
      return expected<T, Error>::error(*err);
    }
    (void)ch->Send(*data);
    return expected<T, Error>::success(*data);
  };
  auto terminal = Do<T, T>(upstream, detail::TerminalConfig(upstream->Config(), "receive"), fn).value();
  detail::WatchUpstream<T>(upstream->CloseNotify(), terminal, ch);
  return {ch, terminal};
}

/** @brief Deliver every error @p upstream forwards onto a channel. */
template <typename Upstream>
auto ReceiveError(const std::shared_ptr<Upstream>& upstream)
    -> Tap<Error, Pool<typename Upstream::OutType, typename Upstream::OutType>> {
  using T = typename Upstream::OutType;
  auto ch = std::make_shared<Channel<Error>>();
  auto fn = [ch](const Context&, const optional<Error>& err, const optional<T>& data) -> expected<T, Error> {
    if (err.has_value()) {
      (void)ch->Send(*err);
      return expected<T, Error>::error(*err);
    }
    return expected<T, Error>::success(*data);
  };
  auto terminal = Do<T, T>(upstream, detail::TerminalConfig(upstream->Config(), "receive_error"), fn).value();
  detail::WatchUpstream<Error>(upstream->CloseNotify(), terminal, ch);
  return {ch, terminal};
}

}  // namespace autopool

#endif  // AUTOPOOL_PIPELINE_HPP_
