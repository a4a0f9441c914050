// Copyright (c) 2024 liudegui. MIT License.
//
// pipeline_demo.cpp -- three-stage autopool pipeline.
//
// Demonstrates:
//   1. Chaining pools with Do() / Next()
//   2. Routing handler errors downstream and draining them with ReceiveError()
//   3. Draining results with Receive()
//   4. Context values travelling with each payload

#include "autopool/log.hpp"
#include "autopool/pipeline.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using autopool::Context;
using autopool::expected;
using autopool::optional;

using IntResult = expected<int, autopool::Error>;
using StrResult = expected<std::string, autopool::Error>;

static IntResult Parse(const Context&, const optional<autopool::Error>& err,
                       const optional<std::string>& text) {
  if (err.has_value()) return IntResult::error(*err);
  char* end = nullptr;
  long v = std::strtol(text->c_str(), &end, 10);
  if (end == text->c_str() || *end != '\0') {
    return IntResult::error(autopool::Error::Make(autopool::kErrorGeneric, "not a number: '%s'", text->c_str()));
  }
  return IntResult::success(static_cast<int>(v));
}

static IntResult Square(const Context&, const optional<autopool::Error>& err, const optional<int>& v) {
  if (err.has_value()) return IntResult::error(*err);
  return IntResult::success(*v * *v);
}

static StrResult Render(const Context& ctx, const optional<autopool::Error>& err, const optional<int>& v) {
  if (err.has_value()) return StrResult::error(*err);
  auto req = ctx.Value("request");
  return StrResult::success((req ? *req : std::string("?")) + " => " + std::to_string(*v));
}

int main() {
  autopool::log::SetLevel(autopool::log::Level::kInfo);

  autopool::PoolConfig cfg;
  cfg.max_workers = 4;

  cfg.name = "parse";
  auto parse = autopool::Do<std::string, int>(cfg, &Parse).value();
  cfg.name = "square";
  auto square = autopool::Do<int, int>(parse, cfg, &Square).value();
  cfg.name = "render";
  auto render = autopool::Do<int, std::string>(square, cfg, &Render).value();

  auto results = autopool::Receive(render);
  auto errors = autopool::ReceiveError(render);

  std::thread producer([&] {
    const std::vector<std::string> inputs{"3", "12", "oops", "7", "-5", "x1"};
    int n = 0;
    for (const auto& in : inputs) {
      parse->Data(Context().WithValue("request", "req-" + std::to_string(n++)), in);
    }
    parse->Shutdown();
    square->Shutdown();
    render->Shutdown();
  });

  std::thread error_reader([&] {
    autopool::Error e;
    while (errors.channel->Receive(e) == autopool::RecvStatus::kOk) {
      std::printf("  error  [%d] %s\n", static_cast<int>(e.code()), e.message());
    }
  });

  std::string line;
  while (results.channel->Receive(line) == autopool::RecvStatus::kOk) {
    std::printf("  result %s\n", line.c_str());
  }

  producer.join();
  error_reader.join();

  char buf[320];
  autopool::FormatStat(render->Stats(), buf, sizeof(buf));
  std::printf("render: %s\n", buf);
  return 0;
}
