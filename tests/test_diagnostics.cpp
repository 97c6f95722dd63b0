#include "logging/diagnostics_log.hpp"
#include "logging/log_writer.hpp"
#include <algorithm>
#include <catch2/catch.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using logging::ConnectionStatus;
using logging::DiagnosticsLog;

namespace {

const ProfileId kAlpha{"alpha"};

std::string TempPath() {
  char tmpl[] = "/tmp/controlroom_log_XXXXXX";
  int fd = ::mkstemp(tmpl);
  REQUIRE(fd != -1);
  ::close(fd);
  return tmpl;
}

std::string ReadAll(const std::string &path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace

TEST_CASE("history is capped per profile", "[diagnostics]") {
  DiagnosticsLog log;
  for (int i = 0; i < 150; ++i) {
    log.Emit(kAlpha, LogLevel::Info, "TEST", "entry " + std::to_string(i));
  }
  log.Emit(ProfileId{"beta"}, LogLevel::Info, "TEST", "other");
  auto entries = log.Entries(kAlpha);
  REQUIRE(entries.size() == DiagnosticsLog::kMaxEntriesPerProfile);
  CHECK(entries.front().message == "entry 50");
  CHECK(entries.back().message == "entry 149");
  CHECK(log.Entries(ProfileId{"beta"}).size() == 1);

  log.Clear(kAlpha);
  CHECK(log.Entries(kAlpha).empty());
}

TEST_CASE("latest error and summary", "[diagnostics]") {
  DiagnosticsLog log;
  CHECK(log.Summary(kAlpha).status == ConnectionStatus::Unknown);
  CHECK_FALSE(log.LatestError(kAlpha));

  log.Emit(kAlpha, LogLevel::Info, "CONNECT", "connecting to host");
  CHECK(log.Summary(kAlpha).status == ConnectionStatus::Connected);

  log.Emit(kAlpha, LogLevel::Error, "TUNNEL", "first failure");
  log.Emit(kAlpha, LogLevel::Warning, "HEALTH", "flaky");
  auto s = log.Summary(kAlpha);
  CHECK(s.status == ConnectionStatus::Unstable);
  CHECK(s.errorCount == 1);
  CHECK(s.warningCount == 1);
  CHECK(s.recentErrorCount == 1);
  CHECK(s.totalEntries == 3);

  log.Emit(kAlpha, LogLevel::Error, "CLIENT", "second failure");
  auto latest = log.LatestError(kAlpha);
  REQUIRE(latest);
  CHECK(latest->message == "second failure");
  CHECK(log.Summary(kAlpha).status == ConnectionStatus::Failed);

  log.Emit(kAlpha, LogLevel::Success, "CONNECT", "connected");
  CHECK(log.Summary(kAlpha).status == ConnectionStatus::Connected);
}

TEST_CASE("old problems fall out of the recent window", "[diagnostics]") {
  DiagnosticsLog log;
  log.Emit(kAlpha, LogLevel::Error, "TUNNEL", "failure");
  auto later = timeutil::WallClock::now() + std::chrono::minutes(10);
  auto s = log.Summary(kAlpha, later);
  CHECK(s.status == ConnectionStatus::Unknown);
  CHECK(s.errorCount == 1);
  CHECK(s.recentErrorCount == 0);
}

TEST_CASE("trace ids are four hex digits", "[diagnostics]") {
  DiagnosticsLog log;
  CHECK(log.TraceId(kAlpha) == "----");
  const auto id = log.GenerateTraceId(kAlpha);
  REQUIRE(id.size() == 4);
  for (char c : id) {
    CHECK(((c >= '0' && c <= '9') || (c >= 'A' && c <= 'F')));
  }
  CHECK(log.TraceId(kAlpha) == id);
}

TEST_CASE("lines at or above the minimum level reach the writer",
          "[diagnostics]") {
  const auto path = TempPath();
  {
    auto writer = logging::LogWriter::ToFile(path);
    REQUIRE(writer);
    writer->Start();
    DiagnosticsLog log(LogLevel::Info, writer.get());
    log.BeginAttempt(kAlpha);
    const auto trace = log.TraceId(kAlpha);
    log.Emit(kAlpha, LogLevel::Debug, "PORT", "hidden detail");
    log.Emit(kAlpha, LogLevel::Warning, "HEALTH", "health check failed");
    log.Emit(kAlpha, LogLevel::Success, "CONNECT", "connected");
    writer->Join();

    const auto text = ReadAll(path);
    CHECK(text.find("hidden detail") == std::string::npos);
    CHECK(text.find("WARN [" + trace + "] alpha HEALTH: health check failed\n") !=
          std::string::npos);
    CHECK(text.find("OK [" + trace + "] alpha CONNECT: connected\n") !=
          std::string::npos);
    CHECK(writer->Dropped() == 0);
  }
  std::remove(path.c_str());
}

TEST_CASE("a full queue drops lines and writes the rest", "[diagnostics]") {
  const auto path = TempPath();
  const std::size_t total = logging::kLogQueueCapacity + 50;
  std::size_t accepted = 0;
  {
    auto writer = logging::LogWriter::ToFile(path);
    REQUIRE(writer);
    // Not started: nothing drains until the writer is destroyed.
    for (std::size_t i = 0; i < total; ++i) {
      if (writer->Submit("line " + std::to_string(i) + "\n")) {
        ++accepted;
      }
    }
    CHECK(accepted < total);
    CHECK(writer->Dropped() == total - accepted);
  }
  const auto text = ReadAll(path);
  const auto lines =
      static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
  CHECK(lines == accepted);
  CHECK(text.find("line 0\n") != std::string::npos);
  std::remove(path.c_str());
}
