/**
 * @file config.hpp
 * @brief Pool configuration from INI / JSON / YAML files.
 *
 * Every format is flattened into "section + key = value" entries held in a
 * fixed-capacity ConfigStore. LoadPoolConfig() then reads one section into a
 * PoolConfig.
 *
 * Backends (CMake opt-in):
 *   - IniBackend  : inih          (AUTOPOOL_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (AUTOPOOL_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (AUTOPOOL_CONFIG_YAML_ENABLED)
 *
 * Recognised pool keys:
 *   name, min_workers, max_workers, skip_errors, check_interval_ms,
 *   max_check_interval_ms, relax_schedule, choke_schedule
 *   (schedules: basic | double | halve)
 *
 * Usage:
 * @code
 *   autopool::Config<autopool::IniBackend> file;
 *   if (!file.LoadFile("pipeline.ini").has_value()) return;
 *   autopool::PoolConfig cfg;
 *   auto r = autopool::LoadPoolConfig(file, "decode", cfg);
 * @endcode
 */

#ifndef AUTOPOOL_CONFIG_HPP_
#define AUTOPOOL_CONFIG_HPP_

#include "autopool/error.hpp"
#include "autopool/platform.hpp"
#include "autopool/pool_config.hpp"
#include "autopool/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>

#ifdef AUTOPOOL_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef AUTOPOOL_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef AUTOPOOL_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef AUTOPOOL_CONFIG_MAX_FILE_SIZE
#define AUTOPOOL_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace autopool {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

inline const char* FileExtension(const char* path) noexcept {
  const char* dot = std::strrchr(path, '.');
  return (dot != nullptr) ? dot + 1 : nullptr;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept { return detail::CaseEqual(ext, "json"); }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 128;
  static constexpr uint32_t kMaxKeyLen = 63;
  static constexpr uint32_t kMaxValueLen = 255;

  /** @brief Raw value of section.key, or nullptr. Case-insensitive. */
  const char* Find(const char* section, const char* key) const noexcept {
    AUTOPOOL_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section.c_str(), section) &&
          detail::CaseEqual(entries_[i].key.c_str(), key)) {
        return entries_[i].value.c_str();
      }
    }
    return nullptr;
  }

  const char* GetString(const char* section, const char* key, const char* default_val = "") const noexcept {
    const char* v = Find(section, key);
    return (v != nullptr) ? v : default_val;
  }

  optional<int64_t> FindInt(const char* section, const char* key) const noexcept {
    const char* v = Find(section, key);
    if (v == nullptr) return {};
    char* end = nullptr;
    long long val = std::strtoll(v, &end, 10);
    if (end == v || *end != '\0') return {};
    return static_cast<int64_t>(val);
  }

  optional<bool> FindBool(const char* section, const char* key) const noexcept {
    const char* v = Find(section, key);
    if (v == nullptr) return {};
    if (detail::CaseEqual(v, "true") || detail::CaseEqual(v, "1") || detail::CaseEqual(v, "yes") ||
        detail::CaseEqual(v, "on")) {
      return true;
    }
    if (detail::CaseEqual(v, "false") || detail::CaseEqual(v, "0") || detail::CaseEqual(v, "no") ||
        detail::CaseEqual(v, "off")) {
      return false;
    }
    return {};
  }

  bool HasSection(const char* section) const noexcept {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section.c_str(), section)) return true;
    }
    return false;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /** @brief Insert or overwrite section.key. False when the store is full. */
  bool Set(const char* section, const char* key, const char* value) noexcept {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section.c_str(), section) &&
          detail::CaseEqual(entries_[i].key.c_str(), key)) {
        entries_[i].value.assign(TruncateToCapacity, value);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_++];
    e.section.assign(TruncateToCapacity, section);
    e.key.assign(TruncateToCapacity, key);
    e.value.assign(TruncateToCapacity, value);
    return true;
  }

 protected:
  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
    std::string text(AUTOPOOL_CONFIG_MAX_FILE_SIZE, '\0');
    size_t n = std::fread(&text[0], 1, text.size(), f);
    std::fclose(f);
    if (n == text.size()) return expected<std::string, ConfigError>::error(ConfigError::kBufferFull);
    text.resize(n);
    return expected<std::string, ConfigError>::success(std::move(text));
  }

 private:
  struct Entry {
    FixedString<kMaxKeyLen> section;
    FixedString<kMaxKeyLen> key;
    FixedString<kMaxValueLen> value;
  };

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;
};

// ============================================================================
// FormatParser<Backend>
// ============================================================================

/** Backend compiled out: every parse reports kFormatNotSupported. */
template <typename Backend>
struct FormatParser {
  static expected<void, ConfigError> Parse(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef AUTOPOOL_CONFIG_INI_ENABLED
template <>
struct FormatParser<IniBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    if (ini_parse_string(text.c_str(), &OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    return static_cast<ConfigStore*>(user)->Set(section ? section : "", name ? name : "",
                                                value ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef AUTOPOOL_CONFIG_JSON_ENABLED
template <>
struct FormatParser<JsonBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    auto root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      if (sec->is_object()) {
        for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
          if (!store.Set(sec.key().c_str(), kv.key().c_str(), Scalar(*kv).c_str()))
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      } else if (!store.Set("", sec.key().c_str(), Scalar(*sec).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    return n.dump();
  }
};
#endif

#ifdef AUTOPOOL_CONFIG_YAML_ENABLED
template <>
struct FormatParser<YamlBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    fkyaml::node root = fkyaml::node::deserialize(text);
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      const std::string section = sec.key().get_value<std::string>();
      auto& node = *sec;
      if (node.is_mapping()) {
        for (auto kv = node.begin(); kv != node.end(); ++kv) {
          const std::string key = kv.key().get_value<std::string>();
          if (!store.Set(section.c_str(), key.c_str(), Scalar(*kv).c_str()))
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      } else if (!store.Set("", section.c_str(), Scalar(node).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    AUTOPOOL_ASSERT(path != nullptr);
    auto text = ReadFile(path);
    if (!text.has_value()) return expected<void, ConfigError>::error(text.get_error());
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return Dispatch<Backends...>(text.value(), format);
  }

  expected<void, ConfigError> LoadString(const std::string& text, ConfigFormat format) {
    return Dispatch<Backends...>(text, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> Dispatch(const std::string& text, ConfigFormat format) {
    if (First::kFormat == format) return FormatParser<First>::Parse(*this, text);
    if constexpr (sizeof...(Rest) > 0) return Dispatch<Rest...>(text, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = detail::FileExtension(path);
    return (ext == nullptr) ? Head::kFormat : DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

// ============================================================================
// LoadPoolConfig
// ============================================================================

/** @brief Schedule by name: "basic", "double" or "halve". nullptr if unknown. */
inline Schedule ScheduleByName(const char* name) noexcept {
  if (detail::CaseEqual(name, "basic")) return &BasicSchedule;
  if (detail::CaseEqual(name, "double")) return &DoubleSchedule;
  if (detail::CaseEqual(name, "halve")) return &HalveSchedule;
  return nullptr;
}

/**
 * @brief Overlay the keys present in @p section onto @p cfg.
 *
 * Absent keys leave @p cfg untouched. Malformed numbers, non-positive worker
 * counts, max_workers < min_workers and unknown schedule names are rejected
 * with kInvalidValue, in which case @p cfg is not modified.
 */
inline expected<void, ConfigError> LoadPoolConfig(const ConfigStore& store, const char* section,
                                                  PoolConfig& cfg) {
  PoolConfig out = cfg;
  auto invalid = [] { return expected<void, ConfigError>::error(ConfigError::kInvalidValue); };

  if (const char* name = store.Find(section, "name")) {
    out.name.assign(TruncateToCapacity, name);
  }

  if (store.Find(section, "min_workers") != nullptr) {
    auto v = store.FindInt(section, "min_workers");
    if (!v.has_value() || *v <= 0 || *v > INT32_MAX) return invalid();
    out.min_workers = static_cast<int32_t>(*v);
  }
  if (store.Find(section, "max_workers") != nullptr) {
    auto v = store.FindInt(section, "max_workers");
    if (!v.has_value() || *v <= 0 || *v > INT32_MAX) return invalid();
    out.max_workers = static_cast<int32_t>(*v);
  }
  if (out.max_workers < out.min_workers) return invalid();

  if (store.Find(section, "skip_errors") != nullptr) {
    auto v = store.FindBool(section, "skip_errors");
    if (!v.has_value()) return invalid();
    out.skip_errors_to_handler = *v;
  }

  if (store.Find(section, "check_interval_ms") != nullptr) {
    auto v = store.FindInt(section, "check_interval_ms");
    if (!v.has_value() || *v <= 0) return invalid();
    out.check_interval = std::chrono::milliseconds(*v);
  }
  if (store.Find(section, "max_check_interval_ms") != nullptr) {
    auto v = store.FindInt(section, "max_check_interval_ms");
    if (!v.has_value() || *v < 0) return invalid();
    out.max_check_interval = std::chrono::milliseconds(*v);
  }

  if (const char* relax = store.Find(section, "relax_schedule")) {
    out.relax_schedule = ScheduleByName(relax);
    if (out.relax_schedule == nullptr) return invalid();
  }
  if (const char* choke = store.Find(section, "choke_schedule")) {
    out.choke_schedule = ScheduleByName(choke);
    if (out.choke_schedule == nullptr) return invalid();
  }

  cfg = out;
  return expected<void, ConfigError>::success();
}

}  // namespace autopool

#endif  // AUTOPOOL_CONFIG_HPP_
