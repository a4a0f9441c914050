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
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional, FixedString.
 *
 * - expected<V, E>: value-or-error return type for the non-throwing API
 * - optional<T>: alias of std::optional
 * - FixedString<N>: fixed-capacity, stack-only, null-terminated string
 */

#ifndef AUTOPOOL_VOCABULARY_HPP_
#define AUTOPOOL_VOCABULARY_HPP_

#include "autopool/platform.hpp"

#include <cstdint>
#include <cstring>

#include <optional>
#include <type_traits>
#include <utility>

namespace autopool {

template <typename T>
using optional = std::optional<T>;

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Usage:
 * @code
 *   expected<uint32_t, ConfigError> r = Parse();
 *   if (!r.has_value()) return r.get_error();
 *   Use(r.value());
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(V value) { return expected(std::move(value)); }

  static expected error(E err) {
    expected r;
    r.error_ = err;
    return r;
  }

  bool has_value() const noexcept { return value_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  V& value() noexcept {
    AUTOPOOL_ASSERT(has_value());
    return *value_;
  }

  const V& value() const noexcept {
    AUTOPOOL_ASSERT(has_value());
    return *value_;
  }

  const E& get_error() const noexcept {
    AUTOPOOL_ASSERT(!has_value());
    return error_;
  }

  template <typename U>
  V value_or(U&& fallback) const {
    return has_value() ? *value_ : static_cast<V>(std::forward<U>(fallback));
  }

 private:
  expected() = default;
  explicit expected(V value) : value_(std::move(value)) {}

  optional<V> value_;
  E error_{};
};

/** @brief expected<void, E>: success flag or error. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return ok_; }
  explicit operator bool() const noexcept { return ok_; }

  const E& get_error() const noexcept {
    AUTOPOOL_ASSERT(!ok_);
    return error_;
  }

 private:
  expected(bool ok, E err) noexcept : ok_(ok), error_(err) {}

  bool ok_;
  E error_;
};

// ============================================================================
// FixedString<N>
// ============================================================================

/** @brief Tag: assign() silently truncates input longer than the capacity. */
struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Fixed-capacity string with inline storage (N chars + terminator).
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  /** @brief Construct from a string literal that fits in the capacity. */
  template <uint32_t M, typename = typename std::enable_if<(M <= Capacity + 1U)>::type>
  FixedString(const char (&str)[M]) noexcept {  // NOLINT(google-explicit-constructor)
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept { assign(TruncateToCapacity, str); }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    assign(TruncateToCapacity, str, len);
  }

  template <uint32_t M, typename = typename std::enable_if<(M <= Capacity + 1U)>::type>
  FixedString& operator=(const char (&str)[M]) noexcept {
    assign(TruncateToCapacity, str);
    return *this;
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    assign(TruncateToCapacity, str, (str != nullptr) ? static_cast<uint32_t>(std::strlen(str)) : 0U);
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    if (str == nullptr) {
      len = 0U;
    }
    if (len > Capacity) {
      len = Capacity;
    }
    if (len > 0U) {
      std::memcpy(buf_, str, len);
    }
    buf_[len] = '\0';
    size_ = len;
  }

  void clear() noexcept {
    buf_[0] = '\0';
    size_ = 0U;
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  bool operator==(const FixedString& other) const noexcept {
    return size_ == other.size_ && std::memcmp(buf_, other.buf_, size_) == 0;
  }
  bool operator!=(const FixedString& other) const noexcept { return !(*this == other); }

  bool operator==(const char* str) const noexcept {
    return str != nullptr && std::strcmp(buf_, str) == 0;
  }
  bool operator!=(const char* str) const noexcept { return !(*this == str); }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_{0U};
};

}  // namespace autopool

#endif  // AUTOPOOL_VOCABULARY_HPP_
