#pragma once

#include "core/types.hpp"
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

inline constexpr const char *kMinPortEnv = "CONTROLROOM_MIN_PORT";
inline constexpr const char *kMaxPortEnv = "CONTROLROOM_MAX_PORT";

// Half-open range [first, last) of local ports handed out for tunnels.
struct PortRange {
  std::uint16_t first = 20000;
  std::uint16_t last = 30000;

  std::size_t size() const { return first < last ? last - first : 0; }
  bool contains(std::uint16_t p) const { return p >= first && p < last; }
};

struct PortConfig {
  PortRange range;
  int maxProbeAttempts = 1000;
};

struct ResilienceConfig {
  Millis healthCheckInterval{15000};
  int maxReconnectionAttempts = 2;
  Millis reconnectionDelay{3000};
};

struct GroupConfig {
  Millis memberTimeout{30000};
  Millis memberStagger{500};
};

struct ConnectConfig {
  // Grace period after a tunnel comes up before the protocol client dials it.
  Millis tunnelSettleDelay{0};
  Millis groupTunnelSettleDelay{3000};
  // How often a request polls a session another request is still connecting.
  Millis connectingPollInterval{100};
};

enum class LogLevel : std::uint8_t { Debug, Info, Warning, Error, Success };

struct LogConfig {
  LogLevel minLevel = LogLevel::Info;
  std::optional<std::string> file; // stderr when unset
};

struct OrchestratorConfig {
  PortConfig ports;
  ResilienceConfig resilience;
  GroupConfig group;
  ConnectConfig connect;
  LogConfig log;
  int reactorThreads = 1;
};

namespace config {

inline std::optional<unsigned> ParseUnsigned(std::string_view s) {
  unsigned v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return v;
}

// Reads an override range from the environment. Both bounds must parse, lie in
// the unprivileged range and describe a non-empty interval; the max bound is
// inclusive. Anything else leaves the configured range untouched.
inline bool ApplyPortRangeEnvironment(PortRange &range) {
  const char *minEnv = std::getenv(kMinPortEnv);
  const char *maxEnv = std::getenv(kMaxPortEnv);
  if (minEnv == nullptr || maxEnv == nullptr) {
    return false;
  }
  auto lo = ParseUnsigned(minEnv);
  auto hi = ParseUnsigned(maxEnv);
  if (!lo || !hi || *lo < 1024 || *hi > 65534 || *lo > *hi) {
    return false;
  }
  range.first = static_cast<std::uint16_t>(*lo);
  range.last = static_cast<std::uint16_t>(*hi + 1);
  return true;
}

inline void ApplyEnvironment(OrchestratorConfig &cfg) {
  (void)ApplyPortRangeEnvironment(cfg.ports.range);
}

} // namespace config
