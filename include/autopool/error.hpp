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
 * @file error.hpp
 * @brief Error values carried through a pipeline, and pool error codes.
 *
 * Error is the value that travels in the error slot of a payload: a
 * handler-returned failure, or an error injected with Stage::Error(). It is
 * a plain copyable value (no heap), so it can be fanned out to any number of
 * downstream stages.
 */

#ifndef AUTOPOOL_ERROR_HPP_
#define AUTOPOOL_ERROR_HPP_

#include "autopool/platform.hpp"
#include "autopool/vocabulary.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>

#ifndef AUTOPOOL_ERROR_MESSAGE_SIZE
#define AUTOPOOL_ERROR_MESSAGE_SIZE 127U
#endif

namespace autopool {

// ============================================================================
// Reserved error codes
// ============================================================================

static constexpr int32_t kErrorGeneric = 1;
/// Reported to the event log when a handler throws.
static constexpr int32_t kErrorPanic = -1;
/// Context was cancelled or its deadline passed.
static constexpr int32_t kErrorExpired = -2;

// ============================================================================
// Error
// ============================================================================

class Error final {
 public:
  using Message = FixedString<AUTOPOOL_ERROR_MESSAGE_SIZE>;

  Error() noexcept = default;

  Error(int32_t code, const char* message) noexcept : code_(code), message_(TruncateToCapacity, message) {}

  /** @brief Build an error with a printf-style message. */
  AUTOPOOL_PRINTF_FORMAT(2, 3)
  static Error Make(int32_t code, const char* fmt, ...) noexcept {
    char buf[AUTOPOOL_ERROR_MESSAGE_SIZE + 1U];
    va_list args;
    va_start(args, fmt);
    (void)std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    return Error(code, buf);
  }

  int32_t code() const noexcept { return code_; }
  const char* message() const noexcept { return message_.c_str(); }

  bool operator==(const Error& other) const noexcept {
    return code_ == other.code_ && message_ == other.message_;
  }
  bool operator!=(const Error& other) const noexcept { return !(*this == other); }

 private:
  int32_t code_{kErrorGeneric};
  Message message_;
};

// ============================================================================
// PoolError
// ============================================================================

enum class PoolError : uint8_t {
  kNullHandler = 0,
};

inline const char* PoolErrorToString(PoolError e) noexcept {
  switch (e) {
    case PoolError::kNullHandler:   return "null handler";
    default:                        return "unknown";
  }
}

// ============================================================================
// ConfigError
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

}  // namespace autopool

#endif  // AUTOPOOL_ERROR_HPP_
