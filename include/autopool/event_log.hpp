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
 * @file event_log.hpp
 * @brief Event sink a pool reports its lifecycle and trace events to.
 *
 * Every pool holds one EventLog pointer from its PoolConfig. A null pointer
 * selects NullEventLog, so a pool built without a logger emits nothing and
 * pays only a virtual IsEnabled() check per event.
 *
 * Event fields:
 *   id      - UUID of the emitting pool
 *   name    - event source within the pool ("Data", "Shutdown", "manager", ...)
 *   message - preformatted text
 */

#ifndef AUTOPOOL_EVENT_LOG_HPP_
#define AUTOPOOL_EVENT_LOG_HPP_

#include "autopool/error.hpp"
#include "autopool/log.hpp"

namespace autopool {

class EventLog {
 public:
  virtual ~EventLog() = default;

  /** @brief Informational event. */
  virtual void Log(const char* id, const char* name, const char* message) noexcept = 0;

  /** @brief Failure event carrying the associated error. */
  virtual void Error(const char* id, const char* name, const autopool::Error& err,
                     const char* message) noexcept = 0;

  /** @brief False lets the pool skip formatting entirely. */
  virtual bool IsEnabled() const noexcept { return true; }
};

// ============================================================================
// NullEventLog
// ============================================================================

/** @brief Discards every event. Default sink for PoolConfig::event_log. */
class NullEventLog final : public EventLog {
 public:
  static NullEventLog& Instance() noexcept {
    static NullEventLog instance;
    return instance;
  }

  void Log(const char*, const char*, const char*) noexcept override {}
  void Error(const char*, const char*, const autopool::Error&, const char*) noexcept override {}
  bool IsEnabled() const noexcept override { return false; }
};

// ============================================================================
// ConsoleEventLog
// ============================================================================

/**
 * @brief Routes pool events to log::LogWrite, without a source location.
 *
 * Log() events are written at @p level (kDebug by default, since per-payload
 * traces are chatty), Error() events always at kError.
 */
class ConsoleEventLog final : public EventLog {
 public:
  explicit ConsoleEventLog(log::Level level = log::Level::kDebug) noexcept : level_(level) {}

  void Log(const char* id, const char* name, const char* message) noexcept override {
    log::LogWrite(level_, "autopool", nullptr, 0, "%s : %s : %s", id, name, message);
  }

  void Error(const char* id, const char* name, const autopool::Error& err,
             const char* message) noexcept override {
    log::LogWrite(log::Level::kError, "autopool", nullptr, 0, "%s : %s : %s : Error[%d] %s", id, name,
                  message, static_cast<int>(err.code()), err.message());
  }

  bool IsEnabled() const noexcept override { return log::IsEnabled(level_) || log::IsEnabled(log::Level::kError); }

 private:
  log::Level level_;
};

}  // namespace autopool

#endif  // AUTOPOOL_EVENT_LOG_HPP_
