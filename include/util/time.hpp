#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timeutil {

using Clock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

// Returns std::tm for local time corresponding to the given time_t in a
// thread-safe way across platforms.
inline std::tm LocalTime(const std::time_t &tt) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  return tm;
}

inline std::string FormatWallTime(WallClock::time_point tp, const char *fmt) {
  std::time_t tt = WallClock::to_time_t(tp);
  std::tm tm = LocalTime(tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

// Human-friendly time for log lines: HH:MM:SS
inline std::string ClockTime(WallClock::time_point tp = WallClock::now()) {
  return FormatWallTime(tp, "%H:%M:%S");
}

} // namespace timeutil
