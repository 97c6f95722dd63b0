#pragma once

#include "core/config.hpp"
#include "core/idiagnostics.hpp"
#include "core/types.hpp"
#include "logging/log_writer.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace logging {

inline std::string_view ToString(LogLevel l) {
  switch (l) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Success:
    return "OK";
  }
  return "UNKNOWN";
}

// Success is a positive outcome, filtered like Info.
inline int Severity(LogLevel l) {
  switch (l) {
  case LogLevel::Debug:
    return 0;
  case LogLevel::Info:
  case LogLevel::Success:
    return 1;
  case LogLevel::Warning:
    return 2;
  case LogLevel::Error:
    return 3;
  }
  return 1;
}

struct DiagnosticEntry {
  timeutil::WallClock::time_point timestamp;
  LogLevel level = LogLevel::Info;
  std::string phase;
  std::string message;
};

enum class ConnectionStatus { Unknown, Connecting, Connected, Unstable, Failed };

struct StatusSummary {
  ConnectionStatus status = ConnectionStatus::Unknown;
  std::optional<timeutil::WallClock::time_point> lastActivity;
  std::optional<DiagnosticEntry> lastError;
  std::size_t errorCount = 0;
  std::size_t warningCount = 0;
  std::size_t totalEntries = 0;
  std::size_t recentErrorCount = 0;
  std::size_t recentWarningCount = 0;
};

// DiagnosticsLog
// - Keeps the last kMaxEntriesPerProfile entries per profile for UI queries
// - Correlates each connection attempt by a short trace id
// - Forwards formatted lines at or above the minimum level to a LogWriter
// Emit() takes one short-lived lock and never waits on I/O.
class DiagnosticsLog : public IDiagnosticsSink {
public:
  static constexpr std::size_t kMaxEntriesPerProfile = 100;
  static constexpr std::chrono::minutes kRecentWindow{5};

  explicit DiagnosticsLog(LogLevel minLevel = LogLevel::Info,
                          LogWriter *writer = nullptr)
      : min_level_(minLevel), writer_(writer), rng_(std::random_device{}()) {}

  void Emit(const ProfileId &profile, LogLevel level, std::string_view phase,
            std::string_view message) override {
    DiagnosticEntry entry{timeutil::WallClock::now(), level, std::string(phase),
                          std::string(message)};
    std::string line;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (writer_ != nullptr && Severity(level) >= Severity(min_level_)) {
        line = FormatLine(profile, entry, TraceIdLocked(profile));
      }
      auto &entries = entries_[profile];
      entries.push_back(std::move(entry));
      while (entries.size() > kMaxEntriesPerProfile) {
        entries.pop_front();
      }
    }
    if (!line.empty()) {
      (void)writer_->Submit(std::move(line));
    }
  }

  void BeginAttempt(const ProfileId &profile) override {
    (void)GenerateTraceId(profile);
  }

  // New correlation id for the next connection attempt of a profile.
  std::string GenerateTraceId(const ProfileId &profile) {
    std::lock_guard<std::mutex> lk(mu_);
    std::uniform_int_distribution<int> byte(0, 255);
    char buf[5];
    std::snprintf(buf, sizeof(buf), "%02X%02X", byte(rng_), byte(rng_));
    trace_ids_[profile] = buf;
    return buf;
  }

  std::string TraceId(const ProfileId &profile) const {
    std::lock_guard<std::mutex> lk(mu_);
    return TraceIdLocked(profile);
  }

  std::vector<DiagnosticEntry> Entries(const ProfileId &profile) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(profile);
    if (it == entries_.end()) {
      return {};
    }
    return {it->second.begin(), it->second.end()};
  }

  std::optional<DiagnosticEntry> LatestError(const ProfileId &profile) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(profile);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    auto e = std::find_if(it->second.rbegin(), it->second.rend(),
                          [](const DiagnosticEntry &d) {
                            return d.level == LogLevel::Error;
                          });
    if (e == it->second.rend()) {
      return std::nullopt;
    }
    return *e;
  }

  StatusSummary
  Summary(const ProfileId &profile,
          timeutil::WallClock::time_point now = timeutil::WallClock::now()) const {
    const auto entries = Entries(profile);
    const auto recentThreshold = now - kRecentWindow;
    StatusSummary s;
    s.totalEntries = entries.size();
    for (const auto &e : entries) {
      const bool recent = e.timestamp > recentThreshold;
      if (e.level == LogLevel::Error) {
        ++s.errorCount;
        s.lastError = e;
        if (recent) {
          ++s.recentErrorCount;
        }
      } else if (e.level == LogLevel::Warning) {
        ++s.warningCount;
        if (recent) {
          ++s.recentWarningCount;
        }
      }
    }
    if (entries.empty()) {
      return s;
    }
    const auto &latest = entries.back();
    s.lastActivity = latest.timestamp;
    const bool recent = latest.timestamp > recentThreshold;
    switch (latest.level) {
    case LogLevel::Error:
      s.status = recent ? ConnectionStatus::Failed : ConnectionStatus::Unknown;
      break;
    case LogLevel::Warning:
      s.status = recent ? ConnectionStatus::Unstable : ConnectionStatus::Unknown;
      break;
    case LogLevel::Success:
      s.status = ConnectionStatus::Connected;
      break;
    case LogLevel::Info: {
      std::string lowered = latest.message;
      std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      s.status = lowered.find("connect") != std::string::npos
                     ? ConnectionStatus::Connected
                     : ConnectionStatus::Unknown;
      break;
    }
    case LogLevel::Debug:
      break;
    }
    return s;
  }

  void Clear(const ProfileId &profile) {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.erase(profile);
  }

  void SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    min_level_ = level;
  }

private:
  std::string TraceIdLocked(const ProfileId &profile) const {
    auto it = trace_ids_.find(profile);
    return it == trace_ids_.end() ? std::string("----") : it->second;
  }

  static std::string FormatLine(const ProfileId &profile,
                                const DiagnosticEntry &e,
                                const std::string &traceId) {
    std::string line = timeutil::ClockTime(e.timestamp);
    line += ' ';
    line += ToString(e.level);
    line += " [";
    line += traceId;
    line += "] ";
    line += profile.empty() ? std::string("-") : profile.value;
    line += ' ';
    line += e.phase;
    line += ": ";
    line += e.message;
    line += '\n';
    return line;
  }

  mutable std::mutex mu_;
  LogLevel min_level_;
  LogWriter *writer_;
  std::mt19937 rng_;
  std::unordered_map<ProfileId, std::deque<DiagnosticEntry>> entries_;
  std::unordered_map<ProfileId, std::string> trace_ids_;
};

} // namespace logging
