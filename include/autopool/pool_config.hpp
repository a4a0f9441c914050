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
 * @file pool_config.hpp
 * @brief PoolConfig and the manager's poll-interval schedules.
 *
 * Usage:
 * @code
 *   autopool::PoolConfig cfg;
 *   cfg.name = "decode";
 *   cfg.min_workers = 2;
 *   cfg.max_workers = 16;
 *   cfg.check_interval = std::chrono::milliseconds(5);
 *   cfg.max_check_interval = std::chrono::milliseconds(200);
 *   cfg.choke_schedule = &autopool::DoubleSchedule;
 * @endcode
 */

#ifndef AUTOPOOL_POOL_CONFIG_HPP_
#define AUTOPOOL_POOL_CONFIG_HPP_

#include "autopool/event_log.hpp"
#include "autopool/vocabulary.hpp"

#include <cstdint>

#include <chrono>

namespace autopool {

using Duration = std::chrono::microseconds;

/// @brief Maps the current manager poll interval to the next one.
using Schedule = Duration (*)(Duration);

static constexpr Duration kDefaultCheckInterval = std::chrono::milliseconds(1);
static constexpr Duration kBasicScheduleFallback = std::chrono::milliseconds(1000);
static constexpr Duration kMinScheduleInterval = std::chrono::milliseconds(1);

// ============================================================================
// Schedules
// ============================================================================

/** @brief Keeps @p dt unchanged; non-positive input becomes 1s. */
inline Duration BasicSchedule(Duration dt) noexcept {
  return (dt <= Duration::zero()) ? kBasicScheduleFallback : dt;
}

/** @brief Doubles @p dt (1ms floor). Widens the interval under pressure. */
inline Duration DoubleSchedule(Duration dt) noexcept {
  return (dt < kMinScheduleInterval) ? kMinScheduleInterval * 2 : dt * 2;
}

/** @brief Halves @p dt down to a 1ms floor. Tightens the interval when idle. */
inline Duration HalveSchedule(Duration dt) noexcept {
  const Duration half = dt / 2;
  return (half < kMinScheduleInterval) ? kMinScheduleInterval : half;
}

// ============================================================================
// PoolConfig
// ============================================================================

struct PoolConfig {
  FixedString<32> name{"pool"};
  int32_t min_workers{1};
  int32_t max_workers{2};
  /// Forward injected errors downstream without invoking the handler.
  bool skip_errors_to_handler{false};
  /// Next interval after a tick that did not grow the pool.
  Schedule relax_schedule{nullptr};
  /// Next interval after a tick that grew the pool.
  Schedule choke_schedule{nullptr};
  Duration check_interval{kDefaultCheckInterval};
  /// Growing past this resets the interval to check_interval.
  Duration max_check_interval{Duration::zero()};
  /// Not owned. nullptr = NullEventLog.
  EventLog* event_log{nullptr};

  /**
   * @brief Fill in defaults for unset or out-of-range fields.
   *
   * min_workers <= 0 -> 1, max_workers <= 0 -> 2, max < min -> max = min,
   * check_interval <= 0 -> 1ms, max_check_interval < check_interval ->
   * check_interval, null schedules -> BasicSchedule, null event_log ->
   * NullEventLog.
   */
  void Normalize() noexcept {
    if (min_workers <= 0) {
      min_workers = 1;
    }
    if (max_workers <= 0) {
      max_workers = 2;
    }
    if (max_workers < min_workers) {
      max_workers = min_workers;
    }
    if (check_interval <= Duration::zero()) {
      check_interval = kDefaultCheckInterval;
    }
    if (max_check_interval < check_interval) {
      max_check_interval = check_interval;
    }
    if (relax_schedule == nullptr) {
      relax_schedule = &BasicSchedule;
    }
    if (choke_schedule == nullptr) {
      choke_schedule = &BasicSchedule;
    }
    if (event_log == nullptr) {
      event_log = &NullEventLog::Instance();
    }
  }
};

}  // namespace autopool

#endif  // AUTOPOOL_POOL_CONFIG_HPP_
