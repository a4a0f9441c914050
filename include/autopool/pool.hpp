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
 * @file pool.hpp
 * @brief Pool - self-scaling worker pool acting as one pipeline stage.
 *
 * Architecture:
 *   Data()/Error() --Send--> Channel<Payload> (rendezvous intake)
 *                                 |
 *                      Executor[0..N-1] threads --> Handler::Do
 *                                 |  (exceptions caught, payload dropped)
 *                      fan-out: one short-lived thread per subscriber
 *                                 v
 *                      Stage<Out>::Data() / Stage<Out>::Error()
 *
 *   Manager thread: samples Stats() every check interval, retires idle
 *   executors through channel signal tokens, starts new executors under
 *   sustained load (see autoscale.hpp).
 *
 * Concurrency:
 * - Counters are independent relaxed atomics; Stats() is best effort.
 * - The subscriber list is guarded by a shared_mutex (Next() writes,
 *   fan-out reads).
 * - A retirement token is only consumed by an idle executor, never one that
 *   is inside the handler.
 * - Shutdown(): stop the manager, close the intake, join every executor
 *   (payloads already handed off still run), wait for issued fan-out sends,
 *   then set CloseNotify(). It must not be called from this pool's own
 *   handler.
 *
 * Usage:
 * @code
 *   autopool::PoolConfig cfg;
 *   cfg.name = "parse";
 *   cfg.max_workers = 8;
 *   auto parse = autopool::Pool<std::string, int>::Create(
 *       cfg, autopool::MakeHandler<std::string, int>(
 *                [](const autopool::Context&, const autopool::optional<autopool::Error>& err,
 *                   const autopool::optional<std::string>& s) -> autopool::expected<int, autopool::Error> {
 *                  if (err) return autopool::expected<int, autopool::Error>::error(*err);
 *                  return autopool::expected<int, autopool::Error>::success(std::stoi(*s));
 *                }));
 *   parse.value()->Next(sink);
 *   parse.value()->Data(autopool::Context(), "42");
 *   parse.value()->Shutdown();
 * @endcode
 */

#ifndef AUTOPOOL_POOL_HPP_
#define AUTOPOOL_POOL_HPP_

#include "autopool/autoscale.hpp"
#include "autopool/channel.hpp"
#include "autopool/event_log.hpp"
#include "autopool/notify.hpp"
#include "autopool/pool_config.hpp"
#include "autopool/stage.hpp"
#include "autopool/stat.hpp"
#include "autopool/uuid.hpp"
#include "autopool/vocabulary.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <system_error>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace autopool {

template <typename In, typename Out = In>
class Pool final : public Stage<In> {
 public:
  using InType = In;
  using OutType = Out;
  using HandlerType = Handler<In, Out>;
  using PayloadType = Payload<In>;
  using SubscriberPtr = std::shared_ptr<Stage<Out>>;
  using CreateResult = expected<std::shared_ptr<Pool>, PoolError>;

  /**
   * @brief Build a pool and start min_workers executors plus the manager.
   *
   * @p cfg is normalized (see PoolConfig::Normalize). A null @p handler
   * aborts construction with PoolError::kNullHandler.
   */
  static CreateResult Create(PoolConfig cfg, std::unique_ptr<HandlerType> handler) {
    if (handler == nullptr) {
      return CreateResult::error(PoolError::kNullHandler);
    }
    cfg.Normalize();
    std::shared_ptr<Pool> pool(new Pool(cfg, std::move(handler)));
    pool->Start();
    return CreateResult::success(std::move(pool));
  }

  ~Pool() override { Shutdown(); }

  Pool(const Pool&) = delete;
  Pool& operator=(const Pool&) = delete;
  Pool(Pool&&) = delete;
  Pool& operator=(Pool&&) = delete;

  // ======================== Intake ========================

  void Data(const Context& ctx, In value) override {
    if (AUTOPOOL_UNLIKELY(closed_.load(std::memory_order_acquire))) {
      return;
    }
    Trace("Data", "Started : Data Received");
    pending_.fetch_add(1, std::memory_order_relaxed);
    const bool accepted = intake_.Send(PayloadType{ctx, optional<autopool::Error>{}, optional<In>(std::move(value))});
    pending_.fetch_sub(1, std::memory_order_relaxed);
    Trace("Data", "%s", accepted ? "Completed" : "Dropped : Pool Closed");
  }

  /** @brief Data() with the pool's own background context. */
  void Data(In value) { Data(default_ctx_, std::move(value)); }

  void Error(const Context& ctx, const autopool::Error& err) override {
    if (AUTOPOOL_UNLIKELY(closed_.load(std::memory_order_acquire))) {
      return;
    }
    Trace("Error", "Started : Error Received : Error[%d] %s", static_cast<int>(err.code()), err.message());
    pending_.fetch_add(1, std::memory_order_relaxed);
    const bool accepted = intake_.Send(PayloadType{ctx, optional<autopool::Error>(err), optional<In>{}});
    pending_.fetch_sub(1, std::memory_order_relaxed);
    Trace("Error", "%s", accepted ? "Completed" : "Dropped : Pool Closed");
  }

  /** @brief Error() with the pool's own background context. */
  void Error(const autopool::Error& err) { Error(default_ctx_, err); }

  // ======================== Topology ========================

  /**
   * @brief Subscribe @p next to this pool's results and errors.
   * @return @p next, so calls can be chained.
   */
  template <typename S>
  std::shared_ptr<S> Next(std::shared_ptr<S> next) {
    static_assert(std::is_base_of<Stage<Out>, S>::value, "subscriber must be a Stage<Out>");
    if (next != nullptr) {
      std::unique_lock<std::shared_mutex> lk(subs_mtx_);
      subscribers_.push_back(next);
    }
    return next;
  }

  size_t SubscriberCount() const {
    std::shared_lock<std::shared_mutex> lk(subs_mtx_);
    return subscribers_.size();
  }

  // ======================== Lifecycle ========================

  void Shutdown() override {
    Trace("Shutdown", "Started : Shutdown Requested");
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
      Trace("Shutdown", "Completed : Shutdown Request : Previously Done");
      return;
    }

    StopManager();
    intake_.Close();
    JoinExecutors();
    forwards_->Wait();
    close_event_->Set();

    Trace("Shutdown", "Completed : Shutdown Requested");
  }

  std::shared_ptr<const OneShotEvent> CloseNotify() const override { return close_event_; }

  bool IsClosed() const noexcept override { return closed_.load(std::memory_order_acquire); }

  // ======================== Query ========================

  /**
   * @brief Snapshot with elapsed measured from the previous Stats() call.
   *
   * All callers of this overload share one baseline; a sampler that needs
   * its own deltas should use Stats(StatCursor&).
   */
  Stat Stats() override {
    const int64_t now = SteadyNowUs();
    const int64_t prev = last_stat_us_.exchange(now, std::memory_order_acq_rel);
    return Snapshot(Duration(now - prev));
  }

  /** @brief Snapshot with elapsed measured on @p cursor. */
  Stat Stats(StatCursor& cursor) const { return Snapshot(cursor.Advance()); }

  const char* Id() const noexcept override { return id_.c_str(); }
  const char* Name() const noexcept { return config_.name.c_str(); }
  const PoolConfig& Config() const noexcept { return config_; }
  EventLog& EventLogger() const noexcept { return *log_; }

  /** @brief Manager poll interval currently in effect. */
  Duration CheckInterval() const noexcept {
    return Duration(check_interval_us_.load(std::memory_order_relaxed));
  }

 private:
  Pool(const PoolConfig& cfg, std::unique_ptr<HandlerType> handler)
      : config_(cfg),
        id_(NewUuid()),
        handler_(std::move(handler)),
        log_(cfg.event_log),
        last_stat_us_(SteadyNowUs()),
        check_interval_us_(cfg.check_interval.count()),
        forwards_(std::make_shared<WaitGroup>()),
        close_event_(std::make_shared<OneShotEvent>()) {}

  void Start() {
    for (int32_t i = 0; i < config_.min_workers; ++i) {
      (void)SpawnExecutor();
    }
    manager_thread_ = std::thread(&Pool::ManagerLoop, this);
    Trace("Start", "Info : %d Executors Started, Max[%d]", config_.min_workers, config_.max_workers);
  }

  // ======================== Executors ========================

  bool SpawnExecutor() {
    std::lock_guard<std::mutex> lk(exec_mtx_);
    if (closed_.load(std::memory_order_acquire)) {
      return false;
    }
    const uint64_t id = next_executor_id_++;
    live_.fetch_add(1, std::memory_order_relaxed);
    try {
      executors_.emplace(id, std::thread(&Pool::ExecutorLoop, this, id));
    } catch (const std::system_error& e) {
      live_.fetch_sub(1, std::memory_order_relaxed);
      log_->Error(id_.c_str(), "executor", autopool::Error::Make(e.code().value(), "%s", e.what()),
                  "Failed : Executor Start");
      return false;
    }
    return true;
  }

  void ExecutorLoop(uint64_t executor_id) {
    PayloadType payload;
    RecvStatus st = RecvStatus::kOk;
    for (;;) {
      st = intake_.ReceiveOrSignal(payload);
      if (st != RecvStatus::kOk) {
        // kSignal: retired by the manager. kClosed: intake closed and drained.
        break;
      }
      active_.fetch_add(1, std::memory_order_relaxed);
      Process(payload);
      active_.fetch_sub(1, std::memory_order_relaxed);
    }

    // live_ drops before retiring_ so the manager never sees a retiring
    // executor as both gone from retiring_ and still live.
    live_.fetch_sub(1, std::memory_order_seq_cst);
    if (st == RecvStatus::kSignal) {
      retiring_.fetch_sub(1, std::memory_order_release);
    }
    retired_.fetch_add(1, std::memory_order_relaxed);
    Trace("executor", "Info : Executor[%llu] : Shutdown", static_cast<unsigned long long>(executor_id));

    std::lock_guard<std::mutex> lk(exec_mtx_);
    exited_.push_back(executor_id);
  }

  void Process(const PayloadType& payload) {
    if (config_.skip_errors_to_handler && payload.err.has_value()) {
      FanOutError(payload.ctx, *payload.err);
      return;
    }

    optional<expected<Out, autopool::Error>> outcome;
    try {
      outcome.emplace(handler_->Do(payload.ctx, payload.err, payload.data));
    } catch (const std::exception& e) {
      ReportPanic(e.what());
      return;
    } catch (...) {
      ReportPanic("non-standard exception");
      return;
    }

    completed_.fetch_add(1, std::memory_order_relaxed);

    if (!outcome->has_value()) {
      Trace("executor", "Info : Res : Error[%d] %s", static_cast<int>(outcome->get_error().code()),
            outcome->get_error().message());
      FanOutError(payload.ctx, outcome->get_error());
      return;
    }
    Trace("executor", "Info : Res : Value");
    FanOutData(payload.ctx, outcome->value());
  }

  void ReportPanic(const char* what) {
    log_->Error(id_.c_str(), "executor", autopool::Error(kErrorPanic, what), "Panic : Handler Raised, Payload Dropped");
  }

  // ======================== Fan-out ========================

  void FanOutData(const Context& ctx, const Out& value) {
    for (const SubscriberPtr& sub : Subscribers()) {
      Dispatch(sub, [sub, ctx, value] { sub->Data(ctx, value); });
    }
  }

  void FanOutError(const Context& ctx, const autopool::Error& err) {
    for (const SubscriberPtr& sub : Subscribers()) {
      Dispatch(sub, [sub, ctx, err] { sub->Error(ctx, err); });
    }
  }

  /** Copy of the subscriber list, so no send runs under subs_mtx_. */
  std::vector<SubscriberPtr> Subscribers() const {
    std::shared_lock<std::shared_mutex> lk(subs_mtx_);
    return subscribers_;
  }

  /** Run @p send on its own thread; inline if no thread can be started. */
  template <typename Send>
  void Dispatch(const SubscriberPtr& sub, Send send) {
    std::shared_ptr<WaitGroup> wg = forwards_;
    wg->Add(1U);
    try {
      std::thread([send, wg]() mutable {
        send();
        wg->Done();
      }).detach();
    } catch (const std::system_error&) {
      Trace("fanout", "Warn : Inline Forward To %s", sub->Id());
      send();
      wg->Done();
    }
  }

  // ======================== Manager ========================

  void ManagerLoop() {
    StatCursor cursor;
    Duration interval = config_.check_interval;

    std::unique_lock<std::mutex> lk(mgr_mtx_);
    while (!mgr_stop_) {
      if (mgr_cv_.wait_for(lk, interval, [this] { return mgr_stop_; })) {
        break;
      }
      lk.unlock();
      interval = Tick(cursor, interval);
      lk.lock();
    }
    lk.unlock();

    Trace("manager", "Info : Worker Manager Shutdown");
  }

  /** One manager cycle. @return the interval to wait before the next one. */
  Duration Tick(StatCursor& cursor, Duration interval) {
    ReapExecutors();

    // Read retiring_ before sampling live_: an executor that has already
    // left retiring_ is then guaranteed to be gone from live_ too.
    const int64_t retiring = retiring_.load(std::memory_order_acquire);
    const Stat a = Stats(cursor);
    TraceStat("Info : Stat", a);

    const int64_t min_workers = config_.min_workers;
    const int64_t max_workers = config_.max_workers;
    const int64_t effective = a.live_executors - retiring;

    if (effective > a.pending) {
      const int64_t remove = PlanShrink(effective, a.pending, min_workers);
      if (remove > 0) {
        Trace("manager", "Info : Removing Total Workers[%lld]", static_cast<long long>(remove));
        retiring_.fetch_add(remove, std::memory_order_relaxed);
        intake_.PostSignals(static_cast<uint32_t>(remove));
      }
      return interval;
    }

    const Stat b = Stats(cursor);
    TraceStat("Info : New Stat", b);

    const GrowthPlan plan = PlanGrowth(a, b, b.live_executors, max_workers);
    if (plan.additions > 0) {
      Trace("manager", "Info : Add Total Workers[%lld]", static_cast<long long>(plan.additions));
      for (int64_t i = 0; i < plan.additions; ++i) {
        if (!SpawnExecutor()) {
          break;
        }
      }
    }

    const Duration next = NextInterval(interval, plan.grew, config_, config_.check_interval);
    check_interval_us_.store(next.count(), std::memory_order_relaxed);
    Trace("manager", "Info : Using New Check Duration[%lldus]", static_cast<long long>(next.count()));
    return next;
  }

  void StopManager() {
    {
      std::lock_guard<std::mutex> lk(mgr_mtx_);
      mgr_stop_ = true;
    }
    mgr_cv_.notify_all();
    if (manager_thread_.joinable()) {
      manager_thread_.join();
    }
  }

  /** Join executors that retired since the last call. */
  void ReapExecutors() {
    std::vector<std::thread> done;
    {
      std::lock_guard<std::mutex> lk(exec_mtx_);
      for (uint64_t id : exited_) {
        auto it = executors_.find(id);
        if (it != executors_.end()) {
          done.push_back(std::move(it->second));
          executors_.erase(it);
        }
      }
      exited_.clear();
    }
    for (auto& t : done) {
      t.join();
    }
  }

  void JoinExecutors() {
    std::vector<std::thread> all;
    {
      std::lock_guard<std::mutex> lk(exec_mtx_);
      all.reserve(executors_.size());
      for (auto& entry : executors_) {
        all.push_back(std::move(entry.second));
      }
      executors_.clear();
      exited_.clear();
    }
    for (auto& t : all) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  // ======================== Helpers ========================

  Stat Snapshot(Duration elapsed) const {
    Stat s;
    s.live_executors = live_.load(std::memory_order_relaxed);
    s.active_executors = active_.load(std::memory_order_relaxed);
    s.pending = pending_.load(std::memory_order_relaxed);
    s.completed = completed_.load(std::memory_order_relaxed);
    s.closed_executors = retired_.load(std::memory_order_relaxed);
    s.closed = closed_.load(std::memory_order_acquire);
    s.sampled_at = std::chrono::system_clock::now();
    s.elapsed = elapsed;
    return s;
  }

  static int64_t SteadyNowUs() noexcept {
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now().time_since_epoch()).count();
  }

  AUTOPOOL_PRINTF_FORMAT(3, 4)
  void Trace(const char* name, const char* fmt, ...) const {
    if (AUTOPOOL_LIKELY(!log_->IsEnabled())) {
      return;
    }
    char msg[256];
    va_list args;
    va_start(args, fmt);
    (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    log_->Log(id_.c_str(), name, msg);
  }

  void TraceStat(const char* label, const Stat& s) const {
    if (!log_->IsEnabled()) {
      return;
    }
    char buf[320];
    (void)FormatStat(s, buf, sizeof(buf));
    Trace("manager", "%s : {%s}", label, buf);
  }

  // ======================== Data members ========================

  const PoolConfig config_;
  const Uuid id_;
  const std::unique_ptr<HandlerType> handler_;
  EventLog* const log_;
  const Context default_ctx_;

  Channel<PayloadType> intake_;

  mutable std::shared_mutex subs_mtx_;
  std::vector<SubscriberPtr> subscribers_;

  std::atomic<bool> closed_{false};
  alignas(kCacheLineSize) std::atomic<int64_t> live_{0};
  alignas(kCacheLineSize) std::atomic<int64_t> active_{0};
  alignas(kCacheLineSize) std::atomic<int64_t> pending_{0};
  alignas(kCacheLineSize) std::atomic<int64_t> completed_{0};
  alignas(kCacheLineSize) std::atomic<int64_t> retired_{0};
  std::atomic<int64_t> retiring_{0};  ///< Signals posted but not yet consumed.
  std::atomic<int64_t> last_stat_us_;
  std::atomic<int64_t> check_interval_us_;

  std::mutex exec_mtx_;
  std::unordered_map<uint64_t, std::thread> executors_;
  std::vector<uint64_t> exited_;
  uint64_t next_executor_id_{0U};

  std::thread manager_thread_;
  std::mutex mgr_mtx_;
  std::condition_variable mgr_cv_;
  bool mgr_stop_{false};

  const std::shared_ptr<WaitGroup> forwards_;
  const std::shared_ptr<OneShotEvent> close_event_;
};

}  // namespace autopool

#endif  // AUTOPOOL_POOL_HPP_
