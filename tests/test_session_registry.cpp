#include "fakes.hpp"
#include "ports/port_allocator.hpp"
#include "sessions/session_registry.hpp"
#include <atomic>
#include <catch2/catch.hpp>
#include <thread>
#include <vector>

namespace {

struct Fixture {
  explicit Fixture(PortRange range = PortRange{30000, 30010})
      : ports(PortConfig{range, 1000}, fakes::AlwaysFree),
        registry(ports, clients, &tunnel, diag) {
    registry.SetHealthMonitor(&monitor);
  }

  // Acquire + Connected event, the way the connector finishes a connect.
  RemoteSession Connect(const ProfileId &p) {
    auto r = registry.Acquire(p);
    REQUIRE(r);
    clients.Last(p)->alive = true;
    registry.OnClientEvent(p, r->session.generation,
                           ClientEvent{HealthStatus::Connected, std::nullopt});
    auto s = registry.Find(p);
    REQUIRE(s);
    return *s;
  }

  NullDiagnostics diag;
  fakes::FakeClientFactory clients;
  fakes::FakeTunnel tunnel;
  fakes::RecordingMonitor monitor;
  ports::PortAllocator ports;
  SessionRegistry registry;
};

const ProfileId kAlpha{"alpha"};

} // namespace

TEST_CASE("acquire creates one Connecting session and reuses it", "[registry]") {
  Fixture f;
  CHECK(f.registry.State(kAlpha) == LifecycleState::Idle);

  auto first = f.registry.Acquire(kAlpha);
  REQUIRE(first);
  CHECK(first->created);
  CHECK(first->session.state == LifecycleState::Connecting);
  CHECK(first->session.generation > 0);

  auto second = f.registry.Acquire(kAlpha);
  REQUIRE(second);
  CHECK_FALSE(second->created);
  CHECK(second->session.generation == first->session.generation);
  CHECK(f.clients.CreatedCount() == 1);
  CHECK(f.monitor.Count("register") == 1);
}

TEST_CASE("concurrent acquire yields a single session", "[registry]") {
  Fixture f;
  std::atomic<int> created{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      for (int j = 0; j < 50; ++j) {
        auto r = f.registry.Acquire(kAlpha);
        if (r && r->created) {
          ++created;
        }
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  CHECK(created.load() == 1);
  CHECK(f.clients.CreatedCount() == 1);
  CHECK(f.registry.SessionCount() == 1);
}

TEST_CASE("connected event moves to Connected and marks healthy",
          "[registry]") {
  Fixture f;
  auto s = f.Connect(kAlpha);
  CHECK(s.state == LifecycleState::Connected);
  CHECK(f.registry.ActiveProfileIds() == std::set<ProfileId>{kAlpha});

  auto calls = f.monitor.Calls();
  REQUIRE(calls.size() == 2);
  CHECK(calls[0].what == "register");
  CHECK(calls[1].what == "status");
  CHECK(calls[1].status == HealthStatus::Connected);
}

TEST_CASE("disconnect twice is the same as once", "[registry]") {
  Fixture f;
  f.Connect(kAlpha);
  auto client = f.clients.Last(kAlpha);
  REQUIRE(client);

  f.registry.Disconnect(kAlpha);
  CHECK(f.registry.State(kAlpha) == LifecycleState::Idle);
  f.registry.Disconnect(kAlpha);
  CHECK(f.registry.State(kAlpha) == LifecycleState::Idle);
  CHECK(client->disconnectCalls == 1);
  CHECK(f.monitor.Count("unregister") == 1);
  CHECK(f.registry.ActiveProfileIds().empty());
}

TEST_CASE("round trip returns the same port to the pool", "[registry]") {
  Fixture f(PortRange{31000, 31001});
  auto acquired = f.registry.Acquire(kAlpha);
  REQUIRE(acquired);
  auto lease = f.registry.LeasePort(kAlpha, acquired->session.generation);
  REQUIRE(lease);
  CHECK(lease->port == 31000);
  REQUIRE(f.registry.AttachTunnel(kAlpha, acquired->session.generation, 7));
  f.registry.OnClientEvent(kAlpha, acquired->session.generation,
                           ClientEvent{HealthStatus::Connected, std::nullopt});
  REQUIRE(f.registry.State(kAlpha) == LifecycleState::Connected);

  f.registry.Disconnect(kAlpha);
  CHECK(f.registry.State(kAlpha) == LifecycleState::Idle);
  CHECK_FALSE(f.ports.IsLeased(31000));
  CHECK(f.tunnel.closed == std::vector<TunnelHandle>{7});

  auto again = f.ports.Lease(ProfileId{"other"});
  REQUIRE(again);
  CHECK(again->port == 31000);
}

TEST_CASE("stale Disconnecting session is replaced on acquire",
          "[registry]") {
  Fixture f;
  f.clients.Behave(kAlpha, fakes::ClientBehavior{{}, {}, false});
  auto old = f.Connect(kAlpha);
  auto oldClient = f.clients.Last(kAlpha);

  f.registry.Disconnect(kAlpha);
  REQUIRE(f.registry.State(kAlpha) == LifecycleState::Disconnecting);
  CHECK_FALSE(oldClient->IsAlive());

  auto fresh = f.registry.Acquire(kAlpha);
  REQUIRE(fresh);
  CHECK(fresh->created);
  CHECK(fresh->session.state == LifecycleState::Connecting);
  CHECK(fresh->session.generation > old.generation);
  CHECK(f.clients.CreatedCount() == 2);
  CHECK(f.registry.SessionCount() == 1);

  // The old handle's late confirmation must not touch the new generation.
  oldClient->Publish({HealthStatus::Disconnected, std::nullopt});
  CHECK(f.registry.State(kAlpha) == LifecycleState::Connecting);
  CHECK(f.registry.Find(kAlpha)->generation == fresh->session.generation);
}

TEST_CASE("window close waits in ClosedPendingCleanup", "[registry]") {
  Fixture f;
  f.clients.Behave(kAlpha, fakes::ClientBehavior{{}, {}, false});
  f.Connect(kAlpha);
  f.registry.MarkWindowOpened(kAlpha);
  CHECK(f.registry.State(kAlpha) == LifecycleState::Active);

  f.registry.MarkWindowClosed(kAlpha);
  CHECK(f.registry.State(kAlpha) == LifecycleState::ClosedPendingCleanup);
  CHECK(f.registry.ActiveProfileIds().empty());

  f.clients.Last(kAlpha)->Publish({HealthStatus::Disconnected, std::nullopt});
  CHECK(f.registry.State(kAlpha) == LifecycleState::Idle);
}

TEST_CASE("window close outside Connected/Active is a no-op", "[registry]") {
  Fixture f;
  f.registry.MarkWindowClosed(kAlpha);
  CHECK(f.registry.State(kAlpha) == LifecycleState::Idle);

  REQUIRE(f.registry.Acquire(kAlpha));
  f.registry.MarkWindowClosed(kAlpha);
  CHECK(f.registry.State(kAlpha) == LifecycleState::Connecting);
}

TEST_CASE("invalid transitions are dropped", "[registry]") {
  Fixture f;
  REQUIRE(f.registry.Acquire(kAlpha));
  CHECK_FALSE(f.registry.Transition(kAlpha, lifecycle::Event::WindowOpened));
  CHECK_FALSE(f.registry.Transition(kAlpha, lifecycle::Event::Disconnected));
  CHECK(f.registry.State(kAlpha) == LifecycleState::Connecting);
  CHECK_FALSE(f.registry.Transition(ProfileId{"nobody"},
                                    lifecycle::Event::Connected));
}

TEST_CASE("failure cleans up port and tunnel and keeps a message",
          "[registry]") {
  Fixture f;
  auto acquired = f.registry.Acquire(kAlpha);
  REQUIRE(acquired);
  const auto gen = acquired->session.generation;
  auto lease = f.registry.LeasePort(kAlpha, gen);
  REQUIRE(lease);
  REQUIRE(f.registry.AttachTunnel(kAlpha, gen, 3));

  f.registry.Fail(kAlpha, Error{ErrorKind::Timeout, "dial timed out"});
  CHECK(f.registry.State(kAlpha) == LifecycleState::Idle);
  CHECK_FALSE(f.ports.IsLeased(lease->port));
  CHECK(f.tunnel.closed == std::vector<TunnelHandle>{3});
  REQUIRE(f.registry.LastFailure(kAlpha));
  CHECK(*f.registry.LastFailure(kAlpha) ==
        "Connection timed out. The remote server may be busy or unreachable.");

  // Cleanup already ran; a second failure is ignored.
  f.registry.Fail(kAlpha, Error{ErrorKind::Timeout, "again"});
  CHECK(f.tunnel.closed.size() == 1);
  CHECK(f.monitor.Count("unregister") == 1);
}

TEST_CASE("resources for a superseded generation are refused", "[registry]") {
  Fixture f;
  auto acquired = f.registry.Acquire(kAlpha);
  REQUIRE(acquired);
  const auto gen = acquired->session.generation;
  f.registry.Disconnect(kAlpha);
  REQUIRE(f.registry.State(kAlpha) == LifecycleState::Idle);

  auto lease = f.registry.LeasePort(kAlpha, gen);
  REQUIRE_FALSE(lease);
  CHECK(lease.error().kind == ErrorKind::Cancelled);
  CHECK(f.ports.LeasedCount() == 0);

  auto st = f.registry.AttachTunnel(kAlpha, gen, 9);
  REQUIRE_FALSE(st);
  CHECK(f.tunnel.closed == std::vector<TunnelHandle>{9});
}

TEST_CASE("unexpected loss is reported to the monitor", "[registry]") {
  Fixture f;
  f.Connect(kAlpha);
  f.clients.Last(kAlpha)->Drop(Error{ErrorKind::NetworkUnreachable, "reset"});
  CHECK(f.registry.State(kAlpha) == LifecycleState::Connected);
  CHECK_FALSE(f.registry.IsHealthy(kAlpha));
  auto calls = f.monitor.Calls();
  REQUIRE_FALSE(calls.empty());
  CHECK(calls.back().status == HealthStatus::Disconnected);
}

TEST_CASE("loss while connecting fails the session", "[registry]") {
  Fixture f;
  REQUIRE(f.registry.Acquire(kAlpha));
  f.clients.Last(kAlpha)->Publish({HealthStatus::Disconnected, std::nullopt});
  CHECK(f.registry.State(kAlpha) == LifecycleState::Idle);
  CHECK(f.registry.LastFailure(kAlpha).has_value());
}

TEST_CASE("tunnel liveness follows the collaborator", "[registry]") {
  Fixture f;
  auto acquired = f.registry.Acquire(kAlpha);
  REQUIRE(acquired);
  CHECK(f.registry.TunnelAlive(kAlpha));
  CHECK_FALSE(f.registry.TunnelAlive(ProfileId{"none"}));

  const TunnelHandle h = f.tunnel.Add();
  REQUIRE(f.registry.AttachTunnel(kAlpha, acquired->session.generation, h));
  CHECK(f.registry.TunnelAlive(kAlpha));
  f.tunnel.Kill(h);
  CHECK_FALSE(f.registry.TunnelAlive(kAlpha));
}

TEST_CASE("shutdown drops every session and lease", "[registry]") {
  Fixture f;
  f.Connect(kAlpha);
  auto beta = f.registry.Acquire(ProfileId{"beta"});
  REQUIRE(beta);
  REQUIRE(f.registry.LeasePort(ProfileId{"beta"}, beta->session.generation));

  f.registry.Shutdown();
  CHECK(f.registry.SessionCount() == 0);
  CHECK(f.ports.LeasedCount() == 0);
  CHECK(f.registry.State(kAlpha) == LifecycleState::Idle);
  CHECK(f.registry.State(ProfileId{"beta"}) == LifecycleState::Idle);
}
