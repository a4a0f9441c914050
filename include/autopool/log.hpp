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
 * @file log.hpp
 * @brief Lightweight printf-style logging to stderr.
 *
 * Levels: DEBUG < INFO < WARN < ERROR < FATAL < OFF. The runtime threshold
 * defaults to kDebug in debug builds and kInfo when NDEBUG is defined.
 *
 * Output format:
 *   [2024-01-01 12:00:00.123] [INFO] [pool] message (file.cpp:42)
 *
 * The file:line suffix is omitted in NDEBUG builds and for records written
 * with a null file. A single fprintf call is issued per record so concurrent
 * writers do not interleave within a line.
 *
 * Usage:
 * @code
 *   autopool::log::Init();
 *   AUTOPOOL_LOG_INFO("pool", "started %u executors", n);
 *   autopool::log::Shutdown();
 * @endcode
 */

#ifndef AUTOPOOL_LOG_HPP_
#define AUTOPOOL_LOG_HPP_

#include "autopool/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>

#if defined(AUTOPOOL_PLATFORM_LINUX) || defined(AUTOPOOL_PLATFORM_MACOS)
#include <time.h>
#endif

namespace autopool {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
  kFatal,
  kOff,
};

namespace detail {

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "OFF";
  }
}

inline std::atomic<uint8_t>& LevelStorage() noexcept {
#ifdef NDEBUG
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  return level;
}

inline std::atomic<bool>& InitFlag() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format wall-clock time as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(AUTOPOOL_PLATFORM_LINUX) || defined(AUTOPOOL_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1, tm_local.tm_mday,
                      tm_local.tm_hour, tm_local.tm_min, tm_local.tm_sec,
                      static_cast<long>(ts.tv_nsec / 1000000L));
#else
  std::time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local != nullptr) {
    (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                        tm_local->tm_year + 1900, tm_local->tm_mon + 1, tm_local->tm_mday,
                        tm_local->tm_hour, tm_local->tm_min, tm_local->tm_sec);
  } else {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
  }
#endif
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LevelStorage().store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(detail::LevelStorage().load(std::memory_order_relaxed));
}

inline bool IsEnabled(Level level) noexcept {
  return level != Level::kOff && static_cast<uint8_t>(level) >=
                                     detail::LevelStorage().load(std::memory_order_relaxed);
}

/** @brief Mark the facility initialized. Logging works without it. */
inline void Init() noexcept { detail::InitFlag().store(true, std::memory_order_release); }

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitFlag().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept { return detail::InitFlag().load(std::memory_order_acquire); }

// ============================================================================
// LogWrite
// ============================================================================

inline void LogWriteV(Level level, const char* category, const char* file, int line,
                      const char* fmt, va_list args) noexcept {
  if (!IsEnabled(level)) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), (fmt != nullptr) ? fmt : "", args);

  char ts_buf[64];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf, detail::LevelTag(level),
                     (category != nullptr) ? category : "", msg);
#else
  if (file == nullptr) {
    (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf, detail::LevelTag(level),
                       (category != nullptr) ? category : "", msg);
  } else {
    (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf, detail::LevelTag(level),
                       (category != nullptr) ? category : "", msg, detail::Basename(file), line);
  }
#endif

  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
  }
}

AUTOPOOL_PRINTF_FORMAT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file, int line,
                     const char* fmt, ...) noexcept;

inline void LogWrite(Level level, const char* category, const char* file, int line,
                     const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteV(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace autopool

// ============================================================================
// Macros
// ============================================================================

#define AUTOPOOL_LOG_DEBUG(cat, fmt, ...) \
  ::autopool::log::LogWrite(::autopool::log::Level::kDebug, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define AUTOPOOL_LOG_INFO(cat, fmt, ...) \
  ::autopool::log::LogWrite(::autopool::log::Level::kInfo, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define AUTOPOOL_LOG_WARN(cat, fmt, ...) \
  ::autopool::log::LogWrite(::autopool::log::Level::kWarn, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define AUTOPOOL_LOG_ERROR(cat, fmt, ...) \
  ::autopool::log::LogWrite(::autopool::log::Level::kError, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define AUTOPOOL_LOG_FATAL(cat, fmt, ...) \
  ::autopool::log::LogWrite(::autopool::log::Level::kFatal, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#endif  // AUTOPOOL_LOG_HPP_
