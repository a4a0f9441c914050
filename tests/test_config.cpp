/**
 * @file test_config.cpp
 * @brief Tests for config.hpp and pool_config.hpp.
 */

#include "autopool/config.hpp"
#include "autopool/pool_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdio>
#include <cstring>

using std::chrono::milliseconds;

// ============================================================================
// Schedules and PoolConfig::Normalize
// ============================================================================

TEST_CASE("BasicSchedule keeps positive intervals", "[config][schedule]") {
  REQUIRE(autopool::BasicSchedule(milliseconds(5)) == milliseconds(5));
  REQUIRE(autopool::BasicSchedule(autopool::Duration::zero()) == autopool::kBasicScheduleFallback);
}

TEST_CASE("DoubleSchedule and HalveSchedule", "[config][schedule]") {
  REQUIRE(autopool::DoubleSchedule(milliseconds(4)) == milliseconds(8));
  REQUIRE(autopool::DoubleSchedule(autopool::Duration::zero()) == milliseconds(2));
  REQUIRE(autopool::HalveSchedule(milliseconds(8)) == milliseconds(4));
  REQUIRE(autopool::HalveSchedule(milliseconds(1)) == autopool::kMinScheduleInterval);
}

TEST_CASE("PoolConfig defaults", "[config][pool]") {
  autopool::PoolConfig cfg;
  REQUIRE(cfg.name == "pool");
  REQUIRE(cfg.min_workers == 1);
  REQUIRE(cfg.max_workers == 2);
  REQUIRE_FALSE(cfg.skip_errors_to_handler);
  REQUIRE(cfg.check_interval == autopool::kDefaultCheckInterval);
}

TEST_CASE("PoolConfig Normalize repairs out-of-range fields", "[config][pool]") {
  autopool::PoolConfig cfg;
  cfg.min_workers = 0;
  cfg.max_workers = -3;
  cfg.check_interval = autopool::Duration::zero();
  cfg.Normalize();

  REQUIRE(cfg.min_workers == 1);
  REQUIRE(cfg.max_workers == 2);
  REQUIRE(cfg.check_interval == autopool::kDefaultCheckInterval);
  REQUIRE(cfg.max_check_interval == cfg.check_interval);
  REQUIRE(cfg.relax_schedule == &autopool::BasicSchedule);
  REQUIRE(cfg.choke_schedule == &autopool::BasicSchedule);
  REQUIRE(cfg.event_log == &autopool::NullEventLog::Instance());
}

TEST_CASE("PoolConfig Normalize raises max to min", "[config][pool]") {
  autopool::PoolConfig cfg;
  cfg.min_workers = 6;
  cfg.max_workers = 3;
  cfg.check_interval = milliseconds(10);
  cfg.max_check_interval = milliseconds(100);
  cfg.relax_schedule = &autopool::HalveSchedule;
  cfg.Normalize();

  REQUIRE(cfg.max_workers == 6);
  REQUIRE(cfg.max_check_interval == milliseconds(100));
  REQUIRE(cfg.relax_schedule == &autopool::HalveSchedule);
}

// ============================================================================
// ConfigStore / LoadPoolConfig (backend independent)
// ============================================================================

namespace {

class TestStore final : public autopool::ConfigStore {};

}  // namespace

TEST_CASE("ConfigStore Set, Find and typed lookups", "[config][store]") {
  TestStore store;
  REQUIRE(store.Set("pool", "max_workers", "8"));
  REQUIRE(store.Set("pool", "skip_errors", "yes"));
  REQUIRE(store.Set("pool", "bad_int", "8x"));

  REQUIRE(store.EntryCount() == 3U);
  REQUIRE(store.HasSection("POOL"));
  REQUIRE_FALSE(store.HasSection("other"));
  REQUIRE(std::strcmp(store.Find("Pool", "MAX_WORKERS"), "8") == 0);
  REQUIRE(store.FindInt("pool", "max_workers").value() == 8);
  REQUIRE_FALSE(store.FindInt("pool", "bad_int").has_value());
  REQUIRE(store.FindBool("pool", "skip_errors").value());
  REQUIRE(std::strcmp(store.GetString("pool", "missing", "dflt"), "dflt") == 0);

  REQUIRE(store.Set("pool", "max_workers", "9"));
  REQUIRE(store.EntryCount() == 3U);
  REQUIRE(store.FindInt("pool", "max_workers").value() == 9);
}

TEST_CASE("LoadPoolConfig applies every key", "[config][pool]") {
  TestStore store;
  store.Set("parse", "name", "parser");
  store.Set("parse", "min_workers", "2");
  store.Set("parse", "max_workers", "16");
  store.Set("parse", "skip_errors", "true");
  store.Set("parse", "check_interval_ms", "5");
  store.Set("parse", "max_check_interval_ms", "200");
  store.Set("parse", "relax_schedule", "halve");
  store.Set("parse", "choke_schedule", "double");

  autopool::PoolConfig cfg;
  auto r = autopool::LoadPoolConfig(store, "parse", cfg);
  REQUIRE(r.has_value());
  REQUIRE(cfg.name == "parser");
  REQUIRE(cfg.min_workers == 2);
  REQUIRE(cfg.max_workers == 16);
  REQUIRE(cfg.skip_errors_to_handler);
  REQUIRE(cfg.check_interval == milliseconds(5));
  REQUIRE(cfg.max_check_interval == milliseconds(200));
  REQUIRE(cfg.relax_schedule == &autopool::HalveSchedule);
  REQUIRE(cfg.choke_schedule == &autopool::DoubleSchedule);
}

TEST_CASE("LoadPoolConfig leaves absent keys untouched", "[config][pool]") {
  TestStore store;
  store.Set("p", "max_workers", "4");

  autopool::PoolConfig cfg;
  cfg.min_workers = 3;
  REQUIRE(autopool::LoadPoolConfig(store, "p", cfg).has_value());
  REQUIRE(cfg.min_workers == 3);
  REQUIRE(cfg.max_workers == 4);
  REQUIRE(cfg.name == "pool");
}

TEST_CASE("LoadPoolConfig rejects invalid values without modifying cfg", "[config][pool]") {
  autopool::PoolConfig cfg;
  cfg.max_workers = 7;

  SECTION("non-numeric worker count") {
    TestStore store;
    store.Set("p", "max_workers", "many");
    auto r = autopool::LoadPoolConfig(store, "p", cfg);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == autopool::ConfigError::kInvalidValue);
  }

  SECTION("max below min") {
    TestStore store;
    store.Set("p", "min_workers", "5");
    store.Set("p", "max_workers", "2");
    REQUIRE_FALSE(autopool::LoadPoolConfig(store, "p", cfg).has_value());
  }

  SECTION("unknown schedule") {
    TestStore store;
    store.Set("p", "max_workers", "3");
    store.Set("p", "relax_schedule", "fibonacci");
    REQUIRE_FALSE(autopool::LoadPoolConfig(store, "p", cfg).has_value());
  }

  SECTION("bad boolean") {
    TestStore store;
    store.Set("p", "skip_errors", "maybe");
    REQUIRE_FALSE(autopool::LoadPoolConfig(store, "p", cfg).has_value());
  }

  REQUIRE(cfg.max_workers == 7);
  REQUIRE(cfg.min_workers == 1);
}

TEST_CASE("ScheduleByName", "[config][schedule]") {
  REQUIRE(autopool::ScheduleByName("basic") == &autopool::BasicSchedule);
  REQUIRE(autopool::ScheduleByName("Double") == &autopool::DoubleSchedule);
  REQUIRE(autopool::ScheduleByName("HALVE") == &autopool::HalveSchedule);
  REQUIRE(autopool::ScheduleByName("linear") == nullptr);
}

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef AUTOPOOL_CONFIG_INI_ENABLED

using IniCfg = autopool::Config<autopool::IniBackend>;

TEST_CASE("INI LoadString pool section", "[config][ini]") {
  const char* ini_data =
      "[ingest]\n"
      "name = ingest\n"
      "min_workers = 2\n"
      "max_workers = 6\n"
      "check_interval_ms = 3\n";

  IniCfg store;
  REQUIRE(store.LoadString(ini_data, autopool::ConfigFormat::kIni).has_value());

  autopool::PoolConfig cfg;
  REQUIRE(autopool::LoadPoolConfig(store, "ingest", cfg).has_value());
  REQUIRE(cfg.name == "ingest");
  REQUIRE(cfg.min_workers == 2);
  REQUIRE(cfg.max_workers == 6);
  REQUIRE(cfg.check_interval == milliseconds(3));
}

TEST_CASE("INI LoadFile nonexistent", "[config][ini]") {
  IniCfg store;
  auto r = store.LoadFile("/tmp/autopool_no_such_file.ini");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == autopool::ConfigError::kFileNotFound);
}

TEST_CASE("INI format not supported returns error", "[config][ini]") {
  IniCfg store;
  auto r = store.LoadString("{}", autopool::ConfigFormat::kJson);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == autopool::ConfigError::kFormatNotSupported);
}

TEST_CASE("INI LoadFile from disk with auto-detect", "[config][ini]") {
  const char* path = "/tmp/autopool_test_config.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fputs("[pool]\nmax_workers = 12\nskip_errors = on\n", f);
  std::fclose(f);

  IniCfg store;
  REQUIRE(store.LoadFile(path).has_value());
  REQUIRE(store.FindInt("pool", "max_workers").value() == 12);
  REQUIRE(store.FindBool("pool", "skip_errors").value());
  std::remove(path);
}

#endif  // AUTOPOOL_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef AUTOPOOL_CONFIG_JSON_ENABLED

using JsonCfg = autopool::Config<autopool::JsonBackend>;

TEST_CASE("JSON LoadString pool section", "[config][json]") {
  const char* json_data = R"({
    "render": {
      "max_workers": 8,
      "skip_errors": true,
      "relax_schedule": "halve"
    },
    "version": 3
  })";

  JsonCfg store;
  REQUIRE(store.LoadString(json_data, autopool::ConfigFormat::kJson).has_value());
  REQUIRE(store.FindInt("", "version").value() == 3);

  autopool::PoolConfig cfg;
  REQUIRE(autopool::LoadPoolConfig(store, "render", cfg).has_value());
  REQUIRE(cfg.max_workers == 8);
  REQUIRE(cfg.skip_errors_to_handler);
  REQUIRE(cfg.relax_schedule == &autopool::HalveSchedule);
}

TEST_CASE("JSON parse error", "[config][json]") {
  JsonCfg store;
  auto r = store.LoadString("{ not json", autopool::ConfigFormat::kJson);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == autopool::ConfigError::kParseError);
}

#endif  // AUTOPOOL_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend Tests
// ============================================================================

#ifdef AUTOPOOL_CONFIG_YAML_ENABLED

using YamlCfg = autopool::Config<autopool::YamlBackend>;

TEST_CASE("YAML LoadString pool section", "[config][yaml]") {
  const char* yaml_data =
      "encode:\n"
      "  min_workers: 2\n"
      "  max_workers: 5\n"
      "  choke_schedule: double\n";

  YamlCfg store;
  REQUIRE(store.LoadString(yaml_data, autopool::ConfigFormat::kYaml).has_value());

  autopool::PoolConfig cfg;
  REQUIRE(autopool::LoadPoolConfig(store, "encode", cfg).has_value());
  REQUIRE(cfg.min_workers == 2);
  REQUIRE(cfg.max_workers == 5);
  REQUIRE(cfg.choke_schedule == &autopool::DoubleSchedule);
}

#endif  // AUTOPOOL_CONFIG_YAML_ENABLED

// ============================================================================
// Backend tags
// ============================================================================

TEST_CASE("Backend MatchesExtension", "[config][tag]") {
  REQUIRE(autopool::IniBackend::MatchesExtension("ini"));
  REQUIRE(autopool::IniBackend::MatchesExtension("CONF"));
  REQUIRE_FALSE(autopool::IniBackend::MatchesExtension("json"));
  REQUIRE(autopool::JsonBackend::MatchesExtension("json"));
  REQUIRE(autopool::YamlBackend::MatchesExtension("yml"));
  REQUIRE(autopool::YamlBackend::MatchesExtension("yaml"));
  REQUIRE_FALSE(autopool::YamlBackend::MatchesExtension("ini"));
}

#if defined(AUTOPOOL_CONFIG_INI_ENABLED) && defined(AUTOPOOL_CONFIG_JSON_ENABLED)

TEST_CASE("MultiConfig dispatches INI and JSON", "[config][multi]") {
  autopool::Config<autopool::IniBackend, autopool::JsonBackend> store;
  REQUIRE(store.LoadString("[a]\nmax_workers = 3\n", autopool::ConfigFormat::kIni).has_value());
  REQUIRE(store.LoadString(R"({"b": {"max_workers": 4}})", autopool::ConfigFormat::kJson).has_value());
  REQUIRE(store.FindInt("a", "max_workers").value() == 3);
  REQUIRE(store.FindInt("b", "max_workers").value() == 4);
}

#endif
