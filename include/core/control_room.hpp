#pragma once

#include "core/config.hpp"
#include "core/iwindow_presenter.hpp"
#include "core/reactor.hpp"
#include "group/group_launch_coordinator.hpp"
#include "logging/diagnostics_log.hpp"
#include "logging/log_writer.hpp"
#include "net/forward_tunnel.hpp"
#include "net/tcp_probe_client.hpp"
#include "ports/port_allocator.hpp"
#include "profiles/profile_store.hpp"
#include "resilience/resilience_monitor.hpp"
#include "sessions/session_connector.hpp"
#include "sessions/session_registry.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Prints where a group's windows would go; the driver has no window system.
class ConsolePresenter : public IWindowPresenter {
public:
  void PresentGroup(const std::string &groupId,
                    const std::vector<ProfileId> &connected,
                    const GridLayout &layout) override {
    std::lock_guard<std::mutex> lk(mu_);
    std::cout << "group '" << groupId << "' layout " << layout.name << " ("
              << layout.rows << " rows x " << layout.columns << " cols):";
    for (const auto &p : connected) {
      std::cout << ' ' << p;
    }
    std::cout << "\n";
  }

private:
  std::mutex mu_;
};

// ControlRoom composition/threading overview:
// - LogWriter: dedicated jthread; drains formatted diagnostics with writev
// - Reactor: io_context on N threads; hosts connect, group and health
//   coroutines plus the bundled TCP tunnel/client
// - SessionRegistry and PortAllocator: mutex-serialized, callable anywhere
// - ResilienceMonitor: per-profile strands; talks back to the registry and
//   connector only through its hooks
// - Main thread: drives launches, then waits for the deadline and shuts down
// Members are declared in dependency order so destruction runs in reverse.
class ControlRoom {
public:
  ControlRoom(OrchestratorConfig cfg, const profiles::IProfileStore &store,
              std::unique_ptr<logging::LogWriter> writer)
      : cfg_(cfg), writer_(std::move(writer)),
        diag_(cfg_.log.minLevel, writer_.get()), store_(store),
        ports_(cfg_.ports),
        clients_(reactor_.GetIoContext(), diag_),
        tunnel_(reactor_.GetIoContext(), diag_),
        registry_(ports_, clients_, &tunnel_, diag_),
        connector_(reactor_.GetIoContext(), registry_, store_, &tunnel_, diag_,
                   cfg_.connect),
        monitor_(reactor_.GetIoContext(), cfg_.resilience, diag_, MakeHooks()),
        groups_(reactor_.GetIoContext(), connector_, registry_, store_,
                &presenter_, diag_, cfg_.group,
                cfg_.connect.groupTunnelSettleDelay) {
    registry_.SetHealthMonitor(&monitor_);
  }

  ControlRoom(const ControlRoom &) = delete;
  ControlRoom &operator=(const ControlRoom &) = delete;

  ~ControlRoom() { Shutdown(); }

  void Start() {
    if (writer_) {
      writer_->Start();
    }
    reactor_.Start(cfg_.reactorThreads);
  }

  // Idempotent.
  void Shutdown() {
    if (stopped_) {
      return;
    }
    stopped_ = true;
    groups_.Cancel();
    registry_.Shutdown();
    reactor_.Stop();
    reactor_.Join();
    registry_.SetHealthMonitor(nullptr);
  }

  const OrchestratorConfig &Config() const { return cfg_; }
  logging::DiagnosticsLog &Diagnostics() { return diag_; }
  SessionRegistry &Registry() { return registry_; }
  SessionConnector &Connector() { return connector_; }
  resilience::ResilienceMonitor &Monitor() { return monitor_; }
  group::GroupLaunchCoordinator &Groups() { return groups_; }
  ports::PortAllocator &Ports() { return ports_; }

private:
  resilience::Hooks MakeHooks() {
    resilience::Hooks h;
    h.isHealthy = [this](const ProfileId &p) { return registry_.IsHealthy(p); };
    h.tunnelAlive = [this](const ProfileId &p) {
      return registry_.TunnelAlive(p);
    };
    h.reconnect = [this](const ProfileId &p, net::yield_context yield) {
      return connector_.Reconnect(p, yield);
    };
    h.onTerminalFailure = [this](const ProfileId &p, const Error &e) {
      registry_.Fail(p, e);
    };
    return h;
  }

  OrchestratorConfig cfg_;
  std::unique_ptr<logging::LogWriter> writer_;
  logging::DiagnosticsLog diag_;
  const profiles::IProfileStore &store_;
  Reactor reactor_;
  ports::PortAllocator ports_;
  TcpProbeClientFactory clients_;
  ForwardTunnel tunnel_;
  SessionRegistry registry_;
  SessionConnector connector_;
  resilience::ResilienceMonitor monitor_;
  ConsolePresenter presenter_;
  group::GroupLaunchCoordinator groups_;
  bool stopped_ = false;
};
