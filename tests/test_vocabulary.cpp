/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types and error.hpp
 */

#include "autopool/error.hpp"
#include "autopool/uuid.hpp"
#include "autopool/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <set>
#include <string>

// ============================================================================
// expected<V, E> tests
// ============================================================================

TEST_CASE("expected success path", "[vocabulary][expected]") {
  auto r = autopool::expected<int, autopool::ConfigError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
}

TEST_CASE("expected error path", "[vocabulary][expected]") {
  auto r = autopool::expected<int, autopool::ConfigError>::error(autopool::ConfigError::kFileNotFound);
  REQUIRE(!r.has_value());
  REQUIRE(!static_cast<bool>(r));
  REQUIRE(r.get_error() == autopool::ConfigError::kFileNotFound);
}

TEST_CASE("expected void specialization", "[vocabulary][expected]") {
  auto ok = autopool::expected<void, autopool::PoolError>::success();
  REQUIRE(ok.has_value());

  auto err = autopool::expected<void, autopool::PoolError>::error(autopool::PoolError::kNullHandler);
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == autopool::PoolError::kNullHandler);
}

TEST_CASE("expected value_or", "[vocabulary][expected]") {
  auto ok = autopool::expected<int, autopool::ConfigError>::success(10);
  REQUIRE(ok.value_or(99) == 10);

  auto err = autopool::expected<int, autopool::ConfigError>::error(autopool::ConfigError::kParseError);
  REQUIRE(err.value_or(99) == 99);
}

TEST_CASE("expected carries a rich error type", "[vocabulary][expected]") {
  using Result = autopool::expected<std::string, autopool::Error>;
  auto ok = Result::success("value");
  REQUIRE(ok.value() == "value");

  auto bad = Result::error(autopool::Error(7, "no good"));
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.get_error().code() == 7);
  REQUIRE(std::strcmp(bad.get_error().message(), "no good") == 0);
}

// ============================================================================
// FixedString<N> tests
// ============================================================================

TEST_CASE("FixedString from literal", "[vocabulary][FixedString]") {
  autopool::FixedString<16> s("hello");
  REQUIRE(s.size() == 5U);
  REQUIRE(std::strcmp(s.c_str(), "hello") == 0);
  REQUIRE(s == "hello");
  REQUIRE(s != "world");
  REQUIRE(autopool::FixedString<16>::capacity() == 16U);
}

TEST_CASE("FixedString truncates long input", "[vocabulary][FixedString]") {
  autopool::FixedString<4> s(autopool::TruncateToCapacity, "abcdefgh");
  REQUIRE(s.size() == 4U);
  REQUIRE(s == "abcd");

  s.assign(autopool::TruncateToCapacity, "xyz123", 2U);
  REQUIRE(s == "xy");

  s.assign(autopool::TruncateToCapacity, nullptr);
  REQUIRE(s.empty());
}

TEST_CASE("FixedString clear and compare", "[vocabulary][FixedString]") {
  autopool::FixedString<8> a("abc");
  autopool::FixedString<8> b("abc");
  REQUIRE(a == b);
  b = "abd";
  REQUIRE(a != b);
  a.clear();
  REQUIRE(a.empty());
  REQUIRE(a.c_str()[0] == '\0');
}

// ============================================================================
// Error tests
// ============================================================================

TEST_CASE("Error Make formats the message", "[error]") {
  auto e = autopool::Error::Make(autopool::kErrorGeneric, "bad value %d of %s", 3, "x");
  REQUIRE(e.code() == autopool::kErrorGeneric);
  REQUIRE(std::strcmp(e.message(), "bad value 3 of x") == 0);
}

TEST_CASE("Error equality compares code and message", "[error]") {
  autopool::Error a(1, "x");
  autopool::Error b(1, "x");
  autopool::Error c(2, "x");
  autopool::Error d(1, "y");
  REQUIRE(a == b);
  REQUIRE(a != c);
  REQUIRE(a != d);
}

TEST_CASE("Error message is truncated to capacity", "[error]") {
  std::string longmsg(500, 'z');
  autopool::Error e(autopool::kErrorGeneric, longmsg.c_str());
  REQUIRE(std::strlen(e.message()) == AUTOPOOL_ERROR_MESSAGE_SIZE);
}

TEST_CASE("PoolErrorToString names every code", "[error]") {
  REQUIRE(std::strcmp(autopool::PoolErrorToString(autopool::PoolError::kNullHandler), "null handler") == 0);
  REQUIRE(std::strcmp(autopool::PoolErrorToString(static_cast<autopool::PoolError>(1)), "unknown") == 0);
}

// ============================================================================
// Uuid tests
// ============================================================================

TEST_CASE("NewUuid produces distinct version 4 identifiers", "[uuid]") {
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i) {
    autopool::Uuid id = autopool::NewUuid();
    REQUIRE(id.size() == 36U);
    const char* s = id.c_str();
    REQUIRE(s[8] == '-');
    REQUIRE(s[13] == '-');
    REQUIRE(s[14] == '4');
    REQUIRE(s[18] == '-');
    REQUIRE(s[23] == '-');
    const char variant = s[19];
    REQUIRE((variant == '8' || variant == '9' || variant == 'a' || variant == 'b'));
    seen.insert(s);
  }
  REQUIRE(seen.size() == 64U);
}
