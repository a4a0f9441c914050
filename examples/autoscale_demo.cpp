// Copyright (c) 2024 liudegui. MIT License.
//
// autoscale_demo.cpp -- watch a pool grow under a burst and shrink back.
//
// Usage: autoscale_demo [config-file]
//
// The optional config file supplies a [burst] section (see LoadPoolConfig),
// read with the first compiled-in backend: INI, then JSON, then YAML.

#include "autopool/config.hpp"
#include "autopool/event_log.hpp"
#include "autopool/log.hpp"
#include "autopool/pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <thread>
#include <vector>

using autopool::Context;
using autopool::expected;
using autopool::optional;

using IntResult = expected<int, autopool::Error>;

// ============================================================================
// Config
// ============================================================================

#if defined(AUTOPOOL_CONFIG_INI_ENABLED)
#define AUTOPOOL_DEMO_HAS_CONFIG 1
using DemoConfig = autopool::Config<autopool::IniBackend>;
#elif defined(AUTOPOOL_CONFIG_JSON_ENABLED)
#define AUTOPOOL_DEMO_HAS_CONFIG 1
using DemoConfig = autopool::Config<autopool::JsonBackend>;
#elif defined(AUTOPOOL_CONFIG_YAML_ENABLED)
#define AUTOPOOL_DEMO_HAS_CONFIG 1
using DemoConfig = autopool::Config<autopool::YamlBackend>;
#endif

static bool LoadConfig(const char* path, autopool::PoolConfig& cfg) {
#ifdef AUTOPOOL_DEMO_HAS_CONFIG
  DemoConfig store;
  auto loaded = store.LoadFile(path);
  if (!loaded.has_value()) {
    AUTOPOOL_LOG_ERROR("demo", "cannot load %s (error %d)", path, static_cast<int>(loaded.get_error()));
    return false;
  }
  auto applied = autopool::LoadPoolConfig(store, "burst", cfg);
  if (!applied.has_value()) {
    AUTOPOOL_LOG_ERROR("demo", "invalid [burst] section in %s", path);
    return false;
  }
  return true;
#else
  AUTOPOOL_LOG_WARN("demo", "no config backend compiled in, ignoring %s", path);
  (void)cfg;
  return true;
#endif
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  autopool::log::SetLevel(autopool::log::Level::kInfo);

  autopool::PoolConfig cfg;
  cfg.name = "burst";
  cfg.min_workers = 1;
  cfg.max_workers = 8;
  cfg.check_interval = std::chrono::milliseconds(2);
  cfg.max_check_interval = std::chrono::milliseconds(32);
  cfg.choke_schedule = &autopool::DoubleSchedule;
  cfg.relax_schedule = &autopool::HalveSchedule;
  if (argc > 1 && !LoadConfig(argv[1], cfg)) {
    return 1;
  }

  // Per-payload records stay below the kInfo process level.
  autopool::ConsoleEventLog events(autopool::log::Level::kDebug);
  cfg.event_log = &events;

  std::atomic<int> done{0};
  auto created = autopool::Pool<int, int>::Create(
      cfg, autopool::MakeHandler<int, int>([&done](const Context&, const optional<autopool::Error>& err,
                                                   const optional<int>& v) -> IntResult {
        if (err.has_value()) return IntResult::error(*err);
        std::this_thread::sleep_for(std::chrono::milliseconds(4));
        done.fetch_add(1, std::memory_order_relaxed);
        return IntResult::success(*v);
      }));
  if (!created.has_value()) {
    AUTOPOOL_LOG_ERROR("demo", "pool creation failed: %s", autopool::PoolErrorToString(created.get_error()));
    return 1;
  }
  auto pool = created.value();

  std::atomic<bool> sampling{true};
  std::thread monitor([&] {
    autopool::StatCursor cursor;
    char buf[320];
    while (sampling.load()) {
      autopool::FormatStat(pool->Stats(cursor), buf, sizeof(buf));
      std::printf("[monitor] %s, Check Interval: %lldus\n", buf,
                  static_cast<long long>(pool->CheckInterval().count()));
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  });

  std::vector<std::thread> burst;
  for (int i = 0; i < 64; ++i) {
    burst.emplace_back([&pool, i] { pool->Data(i); });
  }
  for (auto& t : burst) {
    t.join();
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  sampling.store(false);
  monitor.join();

  pool->Shutdown();
  std::printf("processed %d payloads\n", done.load());
  return 0;
}
