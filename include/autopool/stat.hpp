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
 * @file stat.hpp
 * @brief Point-in-time pool statistics.
 *
 * A Stat is assembled from independent relaxed atomic loads, so it is a
 * best-effort snapshot rather than a transaction: under a concurrent
 * scale-down, active_executors may briefly exceed live_executors.
 */

#ifndef AUTOPOOL_STAT_HPP_
#define AUTOPOOL_STAT_HPP_

#include "autopool/platform.hpp"
#include "autopool/pool_config.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <ctime>

#include <chrono>

namespace autopool {

struct Stat {
  int64_t live_executors{0};    ///< Executors currently running their loop.
  int64_t active_executors{0};  ///< Executors inside a handler call.
  int64_t pending{0};           ///< Callers blocked handing off a payload.
  int64_t completed{0};         ///< Handler invocations that returned.
  int64_t closed_executors{0};  ///< Executors that have exited.
  bool closed{false};           ///< Shutdown has been requested.
  std::chrono::system_clock::time_point sampled_at{};
  Duration elapsed{Duration::zero()};  ///< Time since the previous sample on the same cursor.
};

/**
 * @brief Per-sampler baseline for Stat::elapsed.
 *
 * Each independent sampler keeps its own cursor so that deltas observed by
 * one sampler are not shortened by another sampler's reads.
 */
class StatCursor final {
 public:
  using Clock = std::chrono::steady_clock;

  StatCursor() noexcept : last_(Clock::now()) {}

  /** @brief Time since the previous Advance() (or construction); moves the baseline. */
  Duration Advance() noexcept {
    const auto now = Clock::now();
    const auto elapsed = std::chrono::duration_cast<Duration>(now - last_);
    last_ = now;
    return elapsed;
  }

 private:
  Clock::time_point last_;
};

/**
 * @brief One-line human-readable rendering of @p s.
 * @return Number of characters that would have been written (snprintf semantics).
 */
inline int FormatStat(const Stat& s, char* buf, size_t size) noexcept {
  const std::time_t t = std::chrono::system_clock::to_time_t(s.sampled_at);
  struct std::tm tm_utc {};
#if defined(AUTOPOOL_PLATFORM_LINUX) || defined(AUTOPOOL_PLATFORM_MACOS)
  gmtime_r(&t, &tm_utc);
#else
  const std::tm* p = std::gmtime(&t);
  if (p != nullptr) tm_utc = *p;
#endif
  return std::snprintf(buf, size,
                       "Current Time: %04d-%02d-%02d %02d:%02d:%02d UTC, "
                       "Elapsed Since Last Stat: %" PRId64 "us, "
                       "Live Executors: %" PRId64 ", Active Executors: %" PRId64 ", "
                       "Pending: %" PRId64 ", Completed: %" PRId64 ", "
                       "Closed Executors: %" PRId64 "%s",
                       tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday, tm_utc.tm_hour,
                       tm_utc.tm_min, tm_utc.tm_sec, static_cast<int64_t>(s.elapsed.count()),
                       s.live_executors, s.active_executors, s.pending, s.completed, s.closed_executors,
                       s.closed ? ", Closed" : "");
}

}  // namespace autopool

#endif  // AUTOPOOL_STAT_HPP_
