/**
 * @file uuid.hpp
 * @brief Random (version 4) UUID strings for pool identity.
 */

#ifndef AUTOPOOL_UUID_HPP_
#define AUTOPOOL_UUID_HPP_

#include "autopool/vocabulary.hpp"

#include <cstdint>
#include <cstdio>

#include <mutex>
#include <random>

namespace autopool {

using Uuid = FixedString<36>;

namespace detail {

inline std::mt19937_64& UuidEngine() noexcept {
  static std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

inline std::mutex& UuidMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

}  // namespace detail

/** @brief "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx", y in {8, 9, a, b}. */
inline Uuid NewUuid() noexcept {
  uint64_t hi = 0;
  uint64_t lo = 0;
  {
    std::lock_guard<std::mutex> lk(detail::UuidMutex());
    hi = detail::UuidEngine()();
    lo = detail::UuidEngine()();
  }
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  char buf[37];
  (void)std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                      static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xFFFFU),
                      static_cast<unsigned>(hi & 0xFFFFU), static_cast<unsigned>(lo >> 48),
                      static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return Uuid(TruncateToCapacity, buf);
}

}  // namespace autopool

#endif  // AUTOPOOL_UUID_HPP_
