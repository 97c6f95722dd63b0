#pragma once

#include "core/errors.hpp"
#include "core/idiagnostics.hpp"
#include "core/ihealth_monitor.hpp"
#include "core/iremote_client.hpp"
#include "core/itunnel.hpp"
#include "core/types.hpp"
#include "ports/port_allocator.hpp"
#include "sessions/lifecycle.hpp"
#include "sessions/remote_session.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

// SessionRegistry
// Threading model:
// - mu_ is the single serialization point for every lifecycle transition;
//   all public methods may be called from any thread
// - Port releases and health-monitor bookkeeping run under mu_ so they are
//   ordered with the transition that caused them (the monitor never calls
//   back synchronously)
// - Calls into the tunnel and protocol collaborators run after mu_ is
//   released, because a client may publish an event from inside Disconnect()
class SessionRegistry {
public:
  SessionRegistry(ports::PortAllocator &ports, IRemoteClientFactory &clients,
                  ITunnel *tunnel, IDiagnosticsSink &diag)
      : ports_(ports), clients_(clients), tunnel_(tunnel), diag_(diag) {}

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  void SetHealthMonitor(IHealthMonitor *monitor) {
    std::lock_guard<std::mutex> lk(mu_);
    monitor_ = monitor;
  }

  // Returns the live session for the profile, or tears down a stale one and
  // starts a new generation in Connecting.
  Result<AcquireResult> Acquire(const ProfileId &profile) {
    for (;;) {
      External stale;
      {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(profile);
        if (it == sessions_.end()) {
          return CreateLocked(profile);
        }
        const LifecycleState s = it->second.state;
        if (s == LifecycleState::Connecting ||
            s == LifecycleState::Connected || s == LifecycleState::Active) {
          return AcquireResult{it->second, false};
        }
        diag_.Emit(profile, LogLevel::Info, "REGISTRY",
                   "removing stale session in state " +
                       std::string(ToString(s)));
        stale = TakeForTeardownLocked(it);
      }
      RunExternal(stale);
    }
  }

  // Applies one lifecycle edge to the current generation. Invalid edges are
  // logged and dropped; returns whether the edge was applied.
  bool Transition(const ProfileId &profile, lifecycle::Event event,
                  std::optional<Error> error = std::nullopt) {
    if (event == lifecycle::Event::ConnectRequested) {
      auto r = Acquire(profile);
      return r.has_value() && r->created;
    }
    External ext;
    bool applied = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = sessions_.find(profile);
      if (it == sessions_.end()) {
        diag_.Emit(profile, LogLevel::Debug, "REGISTRY",
                   "ignoring " + std::string(lifecycle::ToString(event)) +
                       " for idle profile");
        return false;
      }
      applied = ApplyLocked(it, event, error ? &*error : nullptr, ext);
    }
    RunExternal(ext);
    return applied;
  }

  void MarkWindowOpened(const ProfileId &profile) {
    (void)Transition(profile, lifecycle::Event::WindowOpened);
  }

  // Only a ready session is torn down; closing the window of an idle or
  // already-disconnecting session is a no-op.
  void MarkWindowClosed(const ProfileId &profile) {
    External ext;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = sessions_.find(profile);
      if (it == sessions_.end() || !IsReady(it->second.state)) {
        diag_.Emit(profile, LogLevel::Debug, "REGISTRY",
                   "ignoring window close, state " +
                       std::string(ToString(StateLocked(profile))));
        return;
      }
      if (ApplyLocked(it, lifecycle::Event::WindowClosed, nullptr, ext)) {
        (void)ApplyLocked(it, lifecycle::Event::WindowClosed, nullptr, ext);
      }
    }
    RunExternal(ext);
  }

  // User-initiated disconnect. A session still connecting is abandoned as
  // Cancelled; Idle and Disconnecting sessions are left alone.
  void Disconnect(const ProfileId &profile) {
    External ext;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = sessions_.find(profile);
      if (it == sessions_.end()) {
        return;
      }
      switch (it->second.state) {
      case LifecycleState::Connected:
      case LifecycleState::Active:
        diag_.Emit(profile, LogLevel::Info, "REGISTRY",
                   "manual disconnect requested");
        (void)ApplyLocked(it, lifecycle::Event::DisconnectRequested, nullptr,
                          ext);
        break;
      case LifecycleState::Connecting: {
        Error cancelled{ErrorKind::Cancelled, "disconnect requested"};
        (void)ApplyLocked(it, lifecycle::Event::Failed, &cancelled, ext);
        break;
      }
      default:
        diag_.Emit(profile, LogLevel::Debug, "REGISTRY",
                   "already disconnecting or idle");
        break;
      }
    }
    RunExternal(ext);
  }

  // Terminal failure of the current generation.
  void Fail(const ProfileId &profile, const Error &error) {
    (void)Transition(profile, lifecycle::Event::Failed, error);
  }

  void Fail(const ProfileId &profile, std::uint64_t generation,
            const Error &error) {
    External ext;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = sessions_.find(profile);
      if (it == sessions_.end() || it->second.generation != generation) {
        return;
      }
      (void)ApplyLocked(it, lifecycle::Event::Failed, &error, ext);
    }
    RunExternal(ext);
  }

  // Event channel from the protocol client of one generation.
  void OnClientEvent(const ProfileId &profile, std::uint64_t generation,
                     ClientEvent event) {
    External ext;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = sessions_.find(profile);
      if (it == sessions_.end() || it->second.generation != generation) {
        diag_.Emit(profile, LogLevel::Debug, "REGISTRY",
                   "dropping " + std::string(ToString(event.status)) +
                       " from stale generation " + std::to_string(generation));
        return;
      }
      const LifecycleState s = it->second.state;
      const Error *err = event.error ? &*event.error : nullptr;
      switch (event.status) {
      case HealthStatus::Connecting:
        break;
      case HealthStatus::Connected:
        if (s == LifecycleState::Connecting) {
          (void)ApplyLocked(it, lifecycle::Event::Connected, nullptr, ext);
        } else if (IsReady(s) && monitor_ != nullptr) {
          monitor_->ReportStatus(profile, HealthStatus::Connected);
        }
        break;
      case HealthStatus::Disconnected:
        if (s == LifecycleState::Disconnecting ||
            s == LifecycleState::ClosedPendingCleanup) {
          (void)ApplyLocked(it, lifecycle::Event::Disconnected, nullptr, ext);
        } else if (IsReady(s)) {
          diag_.Emit(profile, LogLevel::Warning, "REGISTRY",
                     "unexpected disconnect" +
                         (err ? ": " + err->ToString() : std::string()));
          if (monitor_ != nullptr) {
            monitor_->ReportStatus(profile, HealthStatus::Disconnected,
                                   event.error);
          }
        } else if (s == LifecycleState::Connecting) {
          Error lost = err ? *err
                           : Error{ErrorKind::NetworkUnreachable,
                                   "disconnected while connecting"};
          (void)ApplyLocked(it, lifecycle::Event::Failed, &lost, ext);
        }
        break;
      case HealthStatus::Failed: {
        Error failed =
            err ? *err : Error{ErrorKind::ProtocolError, "client failed"};
        (void)ApplyLocked(it, lifecycle::Event::Failed, &failed, ext);
        break;
      }
      }
    }
    RunExternal(ext);
  }

  // Leases a tunnel port for the given generation. The bind probes run
  // outside mu_; a lease that arrives after the generation moved on is
  // handed straight back.
  Result<ports::PortLease> LeasePort(const ProfileId &profile,
                                     std::uint64_t generation) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = FindGenerationLocked(profile, generation);
      if (it == sessions_.end()) {
        return MakeError(ErrorKind::Cancelled, "session no longer connecting");
      }
      if (it->second.portLease) {
        return *it->second.portLease;
      }
    }
    auto lease = ports_.Lease(profile);
    if (!lease) {
      diag_.Emit(profile, LogLevel::Error, "PORT", lease.error().ToString());
      return lease;
    }
    std::lock_guard<std::mutex> lk(mu_);
    auto it = FindGenerationLocked(profile, generation);
    if (it == sessions_.end() ||
        it->second.state != LifecycleState::Connecting) {
      ports_.Release(lease->port);
      return MakeError(ErrorKind::Cancelled, "session no longer connecting");
    }
    it->second.portLease = *lease;
    diag_.Emit(profile, LogLevel::Debug, "PORT",
               "leased local port " + std::to_string(lease->port));
    return lease;
  }

  Status AttachTunnel(const ProfileId &profile, std::uint64_t generation,
                      TunnelHandle handle) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = FindGenerationLocked(profile, generation);
      if (it != sessions_.end() &&
          it->second.state == LifecycleState::Connecting) {
        it->second.tunnel = handle;
        return {};
      }
    }
    if (tunnel_ != nullptr) {
      tunnel_->Close(handle);
    }
    return MakeError(ErrorKind::Cancelled, "session no longer connecting");
  }

  LifecycleState State(const ProfileId &profile) const {
    std::lock_guard<std::mutex> lk(mu_);
    return StateLocked(profile);
  }

  std::optional<RemoteSession> Find(const ProfileId &profile) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(profile);
    if (it == sessions_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::set<ProfileId> ActiveProfileIds() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::set<ProfileId> out;
    for (const auto &[id, s] : sessions_) {
      if (IsReady(s.state)) {
        out.insert(id);
      }
    }
    return out;
  }

  std::size_t SessionCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
  }

  // Classified error of the last terminal failure, cleared when the profile
  // starts a new attempt or reaches Connected.
  std::optional<Error> LastError(const ProfileId &profile) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = last_error_.find(profile);
    if (it == last_error_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  // User-facing message for LastError().
  std::optional<std::string> LastFailure(const ProfileId &profile) const {
    auto e = LastError(profile);
    if (!e) {
      return std::nullopt;
    }
    return errors::UserMessage(*e);
  }

  // Health probe: ready and the protocol client still reports itself alive.
  bool IsHealthy(const ProfileId &profile) const {
    std::shared_ptr<IRemoteClient> client;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = sessions_.find(profile);
      if (it == sessions_.end() || !IsReady(it->second.state)) {
        return false;
      }
      client = it->second.client;
    }
    return client && client->IsAlive();
  }

  // True for direct sessions, or when the tunnel collaborator still has the
  // session's tunnel up.
  bool TunnelAlive(const ProfileId &profile) const {
    std::optional<TunnelHandle> handle;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = sessions_.find(profile);
      if (it == sessions_.end()) {
        return false;
      }
      handle = it->second.tunnel;
    }
    if (!handle) {
      return true;
    }
    return tunnel_ != nullptr && tunnel_->IsAlive(*handle);
  }

  void DisconnectAll() {
    for (const auto &profile : Profiles()) {
      Disconnect(profile);
    }
  }

  // Full teardown: every remaining session is dropped without waiting for
  // its client to confirm, then the port table is cleared.
  void Shutdown() {
    DisconnectAll();
    std::vector<External> pending;
    {
      std::lock_guard<std::mutex> lk(mu_);
      while (!sessions_.empty()) {
        pending.push_back(TakeForTeardownLocked(sessions_.begin()));
      }
    }
    for (auto &ext : pending) {
      RunExternal(ext);
    }
    ports_.ResetAll();
  }

private:
  using Map = std::unordered_map<ProfileId, RemoteSession>;

  // Collaborator calls collected under mu_ and made after it is released.
  struct External {
    std::optional<TunnelHandle> tunnel;
    std::shared_ptr<IRemoteClient> client;
  };

  Result<AcquireResult> CreateLocked(const ProfileId &profile) {
    auto client = clients_.Create(profile);
    if (!client) {
      diag_.Emit(profile, LogLevel::Error, "REGISTRY",
                 "protocol client factory returned no client");
      return MakeError(ErrorKind::ProtocolError, "no protocol client");
    }
    const auto now = timeutil::Clock::now();
    RemoteSession s;
    s.profile = profile;
    s.state = LifecycleState::Idle;
    s.generation = ++next_generation_;
    s.client = client;
    s.createdAt = now;
    s.lastTransitionAt = now;
    const std::uint64_t gen = s.generation;
    client->SetEventHandler([this, profile, gen](ClientEvent ev) {
      OnClientEvent(profile, gen, std::move(ev));
    });
    auto it = sessions_.emplace(profile, std::move(s)).first;
    External none;
    (void)ApplyLocked(it, lifecycle::Event::ConnectRequested, nullptr, none);
    diag_.Emit(profile, LogLevel::Info, "REGISTRY",
               "created session generation " + std::to_string(gen));
    return AcquireResult{it->second, true};
  }

  // Commits one edge. `it` is invalid afterwards if the edge ran Cleanup.
  bool ApplyLocked(Map::iterator it, lifecycle::Event event, const Error *error,
                   External &ext) {
    RemoteSession &s = it->second;
    const ProfileId profile = s.profile;
    auto t = lifecycle::Apply(s.state, event);
    if (!t) {
      diag_.Emit(profile, LogLevel::Warning, "REGISTRY",
                 "invalid transition: " +
                     std::string(lifecycle::ToString(event)) + " in state " +
                     std::string(ToString(s.state)));
      return false;
    }
    const LifecycleState from = s.state;
    s.state = t->to;
    s.lastTransitionAt = timeutil::Clock::now();
    LogLevel level = LogLevel::Info;
    if (event == lifecycle::Event::Failed) {
      level = LogLevel::Error;
    } else if (event == lifecycle::Event::Connected) {
      level = LogLevel::Success;
    }
    diag_.Emit(profile, level, "LIFECYCLE",
               std::string(ToString(from)) + " -> " +
                   std::string(ToString(t->to)) +
                   (error ? " (" + error->ToString() + ")" : std::string()));
    if (event == lifecycle::Event::Failed && error != nullptr) {
      last_error_[profile] = *error;
    } else if (event == lifecycle::Event::Connected ||
               event == lifecycle::Event::ConnectRequested) {
      last_error_.erase(profile);
    }
    for (auto effect : t->effects) {
      switch (effect) {
      case lifecycle::Effect::StartMonitoring:
        if (monitor_ != nullptr) {
          monitor_->Register(profile);
        }
        break;
      case lifecycle::Effect::MarkHealthy:
        if (monitor_ != nullptr) {
          monitor_->ReportStatus(profile, HealthStatus::Connected);
        }
        break;
      case lifecycle::Effect::Teardown:
        if (s.tunnel) {
          ext.tunnel = s.tunnel;
          s.tunnel.reset();
        }
        ext.client = s.client;
        break;
      case lifecycle::Effect::Cleanup:
        CleanupLocked(it, ext);
        return true;
      }
    }
    return true;
  }

  // Idle cleanup: port back to the allocator, health record dropped, handle
  // generation discarded. Runs once per generation because the entry is
  // erased here.
  void CleanupLocked(Map::iterator it, External &ext) {
    RemoteSession &s = it->second;
    if (s.portLease) {
      ports_.Release(s.portLease->port);
      diag_.Emit(s.profile, LogLevel::Debug, "PORT",
                 "released local port " + std::to_string(s.portLease->port));
    }
    if (s.tunnel) {
      ext.tunnel = s.tunnel;
    }
    if (monitor_ != nullptr) {
      monitor_->Unregister(s.profile);
    }
    sessions_.erase(it);
  }

  External TakeForTeardownLocked(Map::iterator it) {
    External ext;
    ext.client = it->second.client;
    CleanupLocked(it, ext);
    return ext;
  }

  void RunExternal(External &ext) {
    if (ext.tunnel && tunnel_ != nullptr) {
      tunnel_->Close(*ext.tunnel);
    }
    if (ext.client) {
      ext.client->Disconnect();
    }
  }

  Map::iterator FindGenerationLocked(const ProfileId &profile,
                                     std::uint64_t generation) {
    auto it = sessions_.find(profile);
    if (it == sessions_.end() || it->second.generation != generation) {
      return sessions_.end();
    }
    return it;
  }

  LifecycleState StateLocked(const ProfileId &profile) const {
    auto it = sessions_.find(profile);
    return it == sessions_.end() ? LifecycleState::Idle : it->second.state;
  }

  std::vector<ProfileId> Profiles() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<ProfileId> out;
    out.reserve(sessions_.size());
    for (const auto &[id, _] : sessions_) {
      out.push_back(id);
    }
    return out;
  }

  ports::PortAllocator &ports_;
  IRemoteClientFactory &clients_;
  ITunnel *tunnel_;
  IDiagnosticsSink &diag_;
  IHealthMonitor *monitor_ = nullptr;
  mutable std::mutex mu_;
  Map sessions_;
  std::unordered_map<ProfileId, Error> last_error_;
  std::uint64_t next_generation_ = 0;
};
