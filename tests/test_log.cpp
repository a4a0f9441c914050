/**
 * @file test_log.cpp
 * @brief Tests for log.hpp and event_log.hpp
 */

#include "autopool/event_log.hpp"
#include "autopool/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <unistd.h>

#include <cstdio>
#include <string>
#include <vector>

namespace {

/** Redirects stderr into a temporary file for the lifetime of the object. */
class StderrCapture {
 public:
  StderrCapture() : file_(std::tmpfile()), saved_fd_(-1) {
    if (file_ != nullptr) {
      (void)std::fflush(stderr);
      saved_fd_ = ::dup(::fileno(stderr));
      (void)::dup2(::fileno(file_), ::fileno(stderr));
    }
  }

  ~StderrCapture() {
    Restore();
    if (file_ != nullptr) {
      (void)std::fclose(file_);
    }
  }

  std::string Text() {
    Restore();
    std::string out;
    if (file_ == nullptr) {
      return out;
    }
    std::rewind(file_);
    char buf[512];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), file_)) > 0) {
      out.append(buf, n);
    }
    return out;
  }

 private:
  void Restore() {
    if (saved_fd_ >= 0) {
      (void)std::fflush(stderr);
      (void)::dup2(saved_fd_, ::fileno(stderr));
      (void)::close(saved_fd_);
      saved_fd_ = -1;
    }
  }

  std::FILE* file_;
  int saved_fd_;
};

}  // namespace

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(autopool::log::GetLevel() == autopool::log::Level::kInfo);
#else
  REQUIRE(autopool::log::GetLevel() == autopool::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel and IsEnabled", "[log]") {
  auto prev = autopool::log::GetLevel();
  autopool::log::SetLevel(autopool::log::Level::kWarn);
  REQUIRE(autopool::log::GetLevel() == autopool::log::Level::kWarn);
  REQUIRE_FALSE(autopool::log::IsEnabled(autopool::log::Level::kInfo));
  REQUIRE(autopool::log::IsEnabled(autopool::log::Level::kWarn));
  REQUIRE(autopool::log::IsEnabled(autopool::log::Level::kError));
  REQUIRE_FALSE(autopool::log::IsEnabled(autopool::log::Level::kOff));
  autopool::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!autopool::log::IsInitialized());
  autopool::log::Init();
  REQUIRE(autopool::log::IsInitialized());
  autopool::log::Shutdown();
  REQUIRE(!autopool::log::IsInitialized());
}

TEST_CASE("Log macros run at every level", "[log]") {
  autopool::log::SetLevel(autopool::log::Level::kDebug);
  AUTOPOOL_LOG_DEBUG("Test", "debug %d", 1);
  AUTOPOOL_LOG_INFO("Test", "info %s", "msg");
  AUTOPOOL_LOG_WARN("Test", "warn");
  AUTOPOOL_LOG_ERROR("Test", "error %d %d", 1, 2);
  // FATAL aborts, not exercised here.
  REQUIRE(true);
}

TEST_CASE("Log level Off suppresses output", "[log]") {
  autopool::log::SetLevel(autopool::log::Level::kOff);
  AUTOPOOL_LOG_INFO("Test", "should not appear");
  AUTOPOOL_LOG_ERROR("Test", "should not appear");
  autopool::log::SetLevel(autopool::log::Level::kDebug);
  REQUIRE(true);
}

TEST_CASE("Log record without a file has no location suffix", "[log]") {
  auto prev = autopool::log::GetLevel();
  autopool::log::SetLevel(autopool::log::Level::kDebug);
  StderrCapture cap;
  autopool::log::LogWrite(autopool::log::Level::kInfo, "Test", nullptr, 0, "no location %d", 7);
  std::string text = cap.Text();
  autopool::log::SetLevel(prev);

  REQUIRE(text.find("no location 7") != std::string::npos);
  REQUIRE(text.find("(") == std::string::npos);
  REQUIRE(text.find(":0)") == std::string::npos);
}

// ============================================================================
// EventLog
// ============================================================================

namespace {

class RecordingLog final : public autopool::EventLog {
 public:
  void Log(const char* id, const char* name, const char* message) noexcept override {
    lines.push_back(std::string(id) + "|" + name + "|" + message);
  }
  void Error(const char* id, const char* name, const autopool::Error& err,
             const char* message) noexcept override {
    errors.push_back(err.code());
    lines.push_back(std::string(id) + "|" + name + "|" + message);
  }

  std::vector<std::string> lines;
  std::vector<int32_t> errors;
};

}  // namespace

TEST_CASE("NullEventLog is disabled and silent", "[event_log]") {
  autopool::EventLog& log = autopool::NullEventLog::Instance();
  REQUIRE_FALSE(log.IsEnabled());
  log.Log("id", "name", "message");
  log.Error("id", "name", autopool::Error(autopool::kErrorGeneric, "boom"), "message");
  REQUIRE(&autopool::NullEventLog::Instance() == &log);
}

TEST_CASE("ConsoleEventLog follows the process log level", "[event_log]") {
  auto prev = autopool::log::GetLevel();
  autopool::ConsoleEventLog console(autopool::log::Level::kInfo);

  autopool::log::SetLevel(autopool::log::Level::kDebug);
  REQUIRE(console.IsEnabled());
  console.Log("0000", "Data", "Started : Data Received");
  console.Error("0000", "executor", autopool::Error(autopool::kErrorPanic, "boom"), "Panic");

  autopool::log::SetLevel(autopool::log::Level::kOff);
  REQUIRE_FALSE(console.IsEnabled());
  autopool::log::SetLevel(prev);
}

TEST_CASE("ConsoleEventLog records carry no header location", "[event_log]") {
  auto prev = autopool::log::GetLevel();
  autopool::log::SetLevel(autopool::log::Level::kDebug);
  autopool::ConsoleEventLog console(autopool::log::Level::kInfo);
  StderrCapture cap;
  console.Log("0001", "Data", "Started");
  console.Error("0001", "executor", autopool::Error(autopool::kErrorPanic, "boom"), "Panic");
  std::string text = cap.Text();
  autopool::log::SetLevel(prev);

  REQUIRE(text.find("0001 : Data : Started") != std::string::npos);
  REQUIRE(text.find("boom") != std::string::npos);
  REQUIRE(text.find("event_log.hpp") == std::string::npos);
}

TEST_CASE("Custom EventLog receives calls", "[event_log]") {
  RecordingLog rec;
  autopool::EventLog& log = rec;
  REQUIRE(log.IsEnabled());
  log.Log("a", "Data", "hello");
  log.Error("a", "executor", autopool::Error(autopool::kErrorExpired, "late"), "dropped");
  REQUIRE(rec.lines.size() == 2U);
  REQUIRE(rec.lines[0] == "a|Data|hello");
  REQUIRE(rec.errors.size() == 1U);
  REQUIRE(rec.errors[0] == autopool::kErrorExpired);
}
