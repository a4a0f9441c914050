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
 * @file autoscale.hpp
 * @brief Executor-count decisions taken by the pool manager on each tick.
 *
 * Pure functions of two stat samples and the pool configuration, kept apart
 * from the manager thread so they can be exercised deterministically.
 *
 * Tick outline:
 *   A = sample
 *   live > A.pending  -> shrink by PlanShrink(), keep the interval
 *   otherwise         -> B = sample, grow by PlanGrowth(A, B),
 *                        interval = NextInterval(grew)
 */

#ifndef AUTOPOOL_AUTOSCALE_HPP_
#define AUTOPOOL_AUTOSCALE_HPP_

#include "autopool/pool_config.hpp"
#include "autopool/stat.hpp"

#include <cstdint>

namespace autopool {

/**
 * @brief Number of executors to retire when @p live exceeds @p pending.
 *
 * - nothing pending and the surplus exceeds the floor: drop the surplus
 *   above the floor
 * - more pending than the floor: drop down to the pending load
 * - otherwise: return to the floor
 *
 * The result never takes the pool below @p min_workers. Returns 0 when
 * @p live <= @p pending.
 */
inline int64_t PlanShrink(int64_t live, int64_t pending, int64_t min_workers) noexcept {
  if (live <= pending) {
    return 0;
  }
  const int64_t excess = live - pending;
  int64_t remove = 0;
  if (pending < 1 && excess > min_workers) {
    remove = excess - min_workers;
  } else if (pending > min_workers) {
    remove = excess;
  } else {
    remove = live - min_workers;
  }
  if (live - remove < min_workers) {
    remove = live - min_workers;
  }
  return (remove > 0) ? remove : 0;
}

struct GrowthPlan {
  bool grew{false};       ///< Load persisted or worsened between samples.
  int64_t additions{0};   ///< Executors to start now.
};

/**
 * @brief Growth decision from two consecutive samples.
 *
 * Growth triggers when pending did not fall between @p a and @p b, or when
 * @p b shows more pending callers than live executors. The load estimate
 * |live - pending| is capped at @p max_workers and doubled while the doubled
 * value stays under it. Additions are further capped so that
 * @p live + additions <= @p max_workers.
 *
 * @param live Live executors net of retirements already requested.
 */
inline GrowthPlan PlanGrowth(const Stat& a, const Stat& b, int64_t live, int64_t max_workers) noexcept {
  GrowthPlan plan;
  if (!(b.pending >= a.pending || b.live_executors < b.pending)) {
    return plan;
  }
  plan.grew = true;

  int64_t load = b.live_executors - b.pending;
  if (load < 0) {
    load = -load;
  }
  if (load > max_workers) {
    load = max_workers;
  } else if (load * 2 < max_workers) {
    load *= 2;
  }

  const int64_t room = max_workers - live;
  if (room <= 0) {
    return plan;
  }
  plan.additions = (load < room) ? load : room;
  return plan;
}

/**
 * @brief Manager poll interval after a growth-branch tick.
 *
 * Applies the choke schedule after growth and the relax schedule otherwise.
 * A result beyond cfg.max_check_interval resets to @p initial.
 */
inline Duration NextInterval(Duration current, bool grew, const PoolConfig& cfg, Duration initial) noexcept {
  const Schedule schedule = grew ? cfg.choke_schedule : cfg.relax_schedule;
  Duration next = (schedule != nullptr) ? schedule(current) : BasicSchedule(current);
  if (next > cfg.max_check_interval || next <= Duration::zero()) {
    next = initial;
  }
  return next;
}

}  // namespace autopool

#endif  // AUTOPOOL_AUTOSCALE_HPP_
