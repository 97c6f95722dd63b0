#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace lifecycle {

enum class Event : std::uint8_t {
  ConnectRequested,
  Connected,    // external
  Failed,       // external
  WindowOpened,
  WindowClosed,
  DisconnectRequested,
  Disconnected, // external
};

inline std::string_view ToString(Event e) {
  switch (e) {
  case Event::ConnectRequested:
    return "connect requested";
  case Event::Connected:
    return "connected";
  case Event::Failed:
    return "failed";
  case Event::WindowOpened:
    return "window opened";
  case Event::WindowClosed:
    return "window closed";
  case Event::DisconnectRequested:
    return "disconnect requested";
  case Event::Disconnected:
    return "disconnected";
  }
  return "unknown";
}

// Side effects the registry executes after committing a transition.
enum class Effect : std::uint8_t {
  StartMonitoring, // register a health record
  MarkHealthy,     // report Connected to the health monitor
  Teardown,        // close tunnel and disconnect the protocol client
  Cleanup,         // release port, discard handle, drop health record
};

struct Transition {
  LifecycleState to = LifecycleState::Idle;
  std::vector<Effect> effects;
};

// Pure transition function. nullopt means the edge is not allowed from
// `from`; the caller drops the event.
//
//   Idle                 --connect requested-->    Connecting
//   Connecting           --connected-->            Connected
//   Connected            --window opened-->        Active
//   Connected|Active     --disconnect|window closed--> Disconnecting
//   Disconnecting        --window closed-->        ClosedPendingCleanup
//   Disconnecting|ClosedPendingCleanup --disconnected--> Idle (cleanup)
//   any non-Idle         --failed-->               Idle (cleanup)
inline std::optional<Transition> Apply(LifecycleState from, Event event) {
  using S = LifecycleState;
  switch (event) {
  case Event::ConnectRequested:
    if (from == S::Idle) {
      return Transition{S::Connecting, {Effect::StartMonitoring}};
    }
    break;
  case Event::Connected:
    if (from == S::Connecting) {
      return Transition{S::Connected, {Effect::MarkHealthy}};
    }
    break;
  case Event::WindowOpened:
    if (from == S::Connected) {
      return Transition{S::Active, {}};
    }
    break;
  case Event::WindowClosed:
    if (from == S::Connected || from == S::Active) {
      return Transition{S::Disconnecting, {Effect::Teardown}};
    }
    if (from == S::Disconnecting) {
      return Transition{S::ClosedPendingCleanup, {}};
    }
    break;
  case Event::DisconnectRequested:
    if (from == S::Connected || from == S::Active) {
      return Transition{S::Disconnecting, {Effect::Teardown}};
    }
    break;
  case Event::Disconnected:
    if (from == S::Disconnecting || from == S::ClosedPendingCleanup) {
      return Transition{S::Idle, {Effect::Cleanup}};
    }
    break;
  case Event::Failed:
    if (from != S::Idle) {
      return Transition{S::Idle, {Effect::Teardown, Effect::Cleanup}};
    }
    break;
  }
  return std::nullopt;
}

} // namespace lifecycle
