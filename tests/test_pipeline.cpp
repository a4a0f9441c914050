/**
 * @file test_pipeline.cpp
 * @brief Catch2 tests for pipeline.hpp helpers.
 */

#include "autopool/pipeline.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using autopool::Context;
using autopool::expected;
using autopool::optional;
using std::chrono::milliseconds;

namespace {

autopool::PoolConfig SmallConfig() {
  autopool::PoolConfig cfg;
  cfg.min_workers = 1;
  cfg.max_workers = 3;
  return cfg;
}

using IntResult = expected<int, autopool::Error>;

IntResult Double(const Context&, const optional<autopool::Error>& err, const optional<int>& v) {
  if (err.has_value()) {
    return IntResult::error(*err);
  }
  if (*v < 0) {
    return IntResult::error(autopool::Error::Make(autopool::kErrorGeneric, "negative %d", *v));
  }
  return IntResult::success(*v * 2);
}

}  // namespace

TEST_CASE("pipeline - Do without upstream builds a standalone pool", "[pipeline]") {
  auto created = autopool::Do<int, int>(SmallConfig(), &Double);
  REQUIRE(created.has_value());
  auto pool = created.value();
  REQUIRE(pool->SubscriberCount() == 0U);
  pool->Shutdown();
}

TEST_CASE("pipeline - Do subscribes to its upstream", "[pipeline]") {
  auto head = autopool::Identity<int>(SmallConfig());
  auto created = autopool::Do<int, int>(head, SmallConfig(), &Double);
  REQUIRE(created.has_value());
  REQUIRE(head->SubscriberCount() == 1U);

  std::shared_ptr<autopool::Pool<int, int>> none;
  auto detached = autopool::Do<int, int>(none, SmallConfig(), &Double);
  REQUIRE(detached.has_value());

  head->Shutdown();
  created.value()->Shutdown();
  detached.value()->Shutdown();
}

TEST_CASE("pipeline - Receive delivers every result then closes", "[pipeline]") {
  auto head = autopool::Identity<int>(SmallConfig());
  auto twice = autopool::Do<int, int>(head, SmallConfig(), &Double).value();
  auto out = autopool::Receive(twice);
  REQUIRE(out.channel != nullptr);
  REQUIRE(out.terminal != nullptr);
  REQUIRE(twice->SubscriberCount() == 1U);

  std::thread producer([&] {
    for (int i = 1; i <= 10; ++i) {
      head->Data(i);
    }
    head->Shutdown();
    twice->Shutdown();
  });

  std::vector<int> got;
  int v = 0;
  while (out.channel->Receive(v) == autopool::RecvStatus::kOk) {
    got.push_back(v);
  }
  producer.join();

  std::sort(got.begin(), got.end());
  REQUIRE(got.size() == 10U);
  for (int i = 0; i < 10; ++i) {
    REQUIRE(got[static_cast<size_t>(i)] == (i + 1) * 2);
  }
  REQUIRE(out.channel->IsClosed());
  REQUIRE(out.terminal->IsClosed());
}

TEST_CASE("pipeline - ReceiveError delivers handler errors", "[pipeline]") {
  auto twice = autopool::Do<int, int>(SmallConfig(), &Double).value();
  auto errs = autopool::ReceiveError(twice);
  auto out = autopool::Receive(twice);

  std::thread producer([&] {
    twice->Data(4);
    twice->Data(-3);
    twice->Error(autopool::Error(77, "injected"));
  });

  // Both channels are rendezvous: read them concurrently.
  std::vector<int> values;
  std::thread value_reader([&] {
    int v = 0;
    while (out.channel->Receive(v) == autopool::RecvStatus::kOk) {
      values.push_back(v);
    }
  });

  std::vector<autopool::Error> got;
  autopool::Error e;
  while (got.size() < 2U && errs.channel->ReceiveFor(e, milliseconds(3000)) == autopool::RecvStatus::kOk) {
    got.push_back(e);
  }
  producer.join();
  twice->Shutdown();
  value_reader.join();

  REQUIRE(got.size() == 2U);
  std::vector<int32_t> codes{got[0].code(), got[1].code()};
  std::sort(codes.begin(), codes.end());
  REQUIRE(codes[0] == autopool::kErrorGeneric);
  REQUIRE(codes[1] == 77);

  REQUIRE(values.size() == 1U);
  REQUIRE(values[0] == 8);

  REQUIRE(errs.channel->ReceiveFor(e, milliseconds(3000)) == autopool::RecvStatus::kClosed);
}

TEST_CASE("pipeline - Identity forwards values and errors unchanged", "[pipeline]") {
  auto id = autopool::Identity<std::string>(SmallConfig());
  auto out = autopool::Receive(id);
  auto errs = autopool::ReceiveError(id);

  std::thread producer([&] { id->Data("same"); });
  std::string s;
  REQUIRE(out.channel->ReceiveFor(s, milliseconds(3000)) == autopool::RecvStatus::kOk);
  REQUIRE(s == "same");
  producer.join();

  std::thread err_producer([&] { id->Error(autopool::Error(5, "kept")); });
  autopool::Error e;
  REQUIRE(errs.channel->ReceiveFor(e, milliseconds(3000)) == autopool::RecvStatus::kOk);
  REQUIRE(e == autopool::Error(5, "kept"));
  err_producer.join();

  id->Shutdown();
  REQUIRE(out.channel->ReceiveFor(s, milliseconds(3000)) == autopool::RecvStatus::kClosed);
}
