#pragma once

#include "core/iremote_client.hpp"
#include "core/itunnel.hpp"
#include "core/types.hpp"
#include "ports/port_allocator.hpp"
#include "util/time.hpp"
#include <cstdint>
#include <memory>
#include <optional>

// One logical remote-desktop connection. Owned by SessionRegistry; everything
// outside the registry only ever sees copies.
struct RemoteSession {
  ProfileId profile;
  LifecycleState state = LifecycleState::Idle;
  // Bumped on every Idle -> Connecting. Events tagged with an older value are
  // dropped.
  std::uint64_t generation = 0;
  std::optional<ports::PortLease> portLease;
  std::optional<TunnelHandle> tunnel;
  std::shared_ptr<IRemoteClient> client; // protocol handle for this generation
  timeutil::Clock::time_point createdAt;
  timeutil::Clock::time_point lastTransitionAt;
};

struct AcquireResult {
  RemoteSession session;
  bool created = false; // false: an already-live session was returned
};
