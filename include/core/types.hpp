#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

// ProfileId names one configured remote-desktop target. The core never mints
// ids; they come from the profile store.
struct ProfileId {
  std::string value;

  ProfileId() = default;
  explicit ProfileId(std::string v) : value(std::move(v)) {}

  bool empty() const { return value.empty(); }
  const std::string &str() const { return value; }

  friend bool operator==(const ProfileId &, const ProfileId &) = default;
  friend auto operator<=>(const ProfileId &, const ProfileId &) = default;
};

inline std::ostream &operator<<(std::ostream &os, const ProfileId &id) {
  return os << id.value;
}

template <> struct std::hash<ProfileId> {
  std::size_t operator()(const ProfileId &id) const noexcept {
    return std::hash<std::string>{}(id.value);
  }
};

enum class LifecycleState : std::uint8_t {
  Idle,
  Connecting,
  Connected,
  Active, // window is the user's foreground focus
  Disconnecting,
  ClosedPendingCleanup,
};

inline std::string_view ToString(LifecycleState s) {
  switch (s) {
  case LifecycleState::Idle:
    return "Idle";
  case LifecycleState::Connecting:
    return "Connecting";
  case LifecycleState::Connected:
    return "Connected";
  case LifecycleState::Active:
    return "Active";
  case LifecycleState::Disconnecting:
    return "Disconnecting";
  case LifecycleState::ClosedPendingCleanup:
    return "ClosedPendingCleanup";
  }
  return "Unknown";
}

// Ready set membership: what the UI may display.
inline bool IsReady(LifecycleState s) {
  return s == LifecycleState::Connected || s == LifecycleState::Active;
}

enum class HealthStatus : std::uint8_t {
  Connecting,
  Connected,
  Disconnected,
  Failed,
};

inline std::string_view ToString(HealthStatus s) {
  switch (s) {
  case HealthStatus::Connecting:
    return "Connecting";
  case HealthStatus::Connected:
    return "Connected";
  case HealthStatus::Disconnected:
    return "Disconnected";
  case HealthStatus::Failed:
    return "Failed";
  }
  return "Unknown";
}

struct Endpoint {
  std::string host;
  std::uint16_t port = 0;

  std::string ToString() const { return host + ":" + std::to_string(port); }
};

struct Credentials {
  std::string username;
  std::string password;
};

using Millis = std::chrono::milliseconds;
