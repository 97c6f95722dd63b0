#pragma once

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/idiagnostics.hpp"
#include "core/itunnel.hpp"
#include "core/types.hpp"
#include "net/retry.hpp"
#include "profiles/profile_store.hpp"
#include "sessions/session_registry.hpp"
#include "util/branch.hpp"
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <functional>
#include <optional>
#include <string>

namespace net = boost::asio;

// SessionConnector
// Drives one profile from acquire to Connected:
//   lookup -> acquire -> [lease port -> open tunnel -> attach -> settle]
//   -> protocol connect -> Connected
// Every stage failure fails the session (cleanup returns the port and closes
// the tunnel) and is handed back to the caller. Runs inside the caller's
// coroutine; nothing here blocks a thread.
class SessionConnector {
public:
  SessionConnector(net::io_context &ioc, SessionRegistry &registry,
                   const profiles::IProfileStore &store, ITunnel *tunnel,
                   IDiagnosticsSink &diag, ConnectConfig cfg = {})
      : ioc_(ioc), registry_(registry), store_(store), tunnel_(tunnel),
        diag_(diag), cfg_(cfg) {}

  Status Connect(const ProfileId &profile, std::optional<std::string> otp,
                 net::yield_context yield) {
    return Connect(profile, std::move(otp), cfg_.tunnelSettleDelay, yield);
  }

  Status Connect(const ProfileId &profile, std::optional<std::string> otp,
                 Millis settleDelay, net::yield_context yield) {
    auto record = store_.Lookup(profile);
    if (!record || record->host.empty()) {
      diag_.Emit(profile, LogLevel::Error, "CONNECT", "unknown profile");
      return MakeError(ErrorKind::InvalidProfile,
                       "unknown profile " + profile.str());
    }
    auto acquired = registry_.Acquire(profile);
    if (!acquired) {
      return std::unexpected(acquired.error());
    }
    if (!acquired->created) {
      return AwaitSettled(profile, yield);
    }
    const std::uint64_t gen = acquired->session.generation;
    auto client = acquired->session.client;
    diag_.BeginAttempt(profile);
    diag_.Emit(profile, LogLevel::Info, "CONNECT",
               "connecting to " + record->Target().ToString() +
                   (record->UsesTunnel()
                        ? " via " + record->SshServer().ToString()
                        : std::string()));

    Endpoint target = record->Target();
    if (record->UsesTunnel()) {
      auto local = OpenTunnel(*record, gen, otp, yield);
      if (!local) {
        return std::unexpected(local.error());
      }
      if (settleDelay > Millis::zero()) {
        retry::WaitAsync(ioc_, yield, settleDelay);
      }
      target = Endpoint{"127.0.0.1", *local};
    }
    if (!IsCurrent(profile, gen, LifecycleState::Connecting)) {
      return MakeError(ErrorKind::Cancelled, "session no longer connecting");
    }

    auto st = client->Connect(target,
                              Credentials{record->username, record->password},
                              yield);
    if (CONTROLROOM_UNLIKELY(!st)) {
      return FailWith(profile, gen, st.error());
    }
    registry_.OnClientEvent(profile, gen,
                            ClientEvent{HealthStatus::Connected, std::nullopt});
    auto now = registry_.Find(profile);
    if (!now || now->generation != gen || !IsReady(now->state)) {
      return MakeError(ErrorKind::Cancelled, "session closed while connecting");
    }
    diag_.Emit(profile, LogLevel::Success, "CONNECT", "connected");
    return {};
  }

  // Protocol-level reconnect on the existing generation; used by the
  // resilience monitor. The tunnel, if any, is reused as is.
  Status Reconnect(const ProfileId &profile, net::yield_context yield) {
    auto session = registry_.Find(profile);
    if (!session || !IsReady(session->state) || !session->client) {
      return MakeError(ErrorKind::Cancelled, "no ready session");
    }
    auto record = store_.Lookup(profile);
    if (!record) {
      return MakeError(ErrorKind::InvalidProfile,
                       "unknown profile " + profile.str());
    }
    Endpoint target = record->Target();
    if (session->tunnel && session->portLease) {
      target = Endpoint{"127.0.0.1", session->portLease->port};
    }
    auto st = session->client->Connect(
        target, Credentials{record->username, record->password}, yield);
    if (st) {
      registry_.OnClientEvent(
          profile, session->generation,
          ClientEvent{HealthStatus::Connected, std::nullopt});
    }
    return st;
  }

  // Fire-and-forget launch on the reactor; `done` runs on a reactor thread.
  void Spawn(const ProfileId &profile, std::optional<std::string> otp,
             std::function<void(const ProfileId &, Status)> done) {
    net::spawn(ioc_, [this, profile, otp = std::move(otp),
                      done = std::move(done)](net::yield_context yield) {
      auto st = Connect(profile, otp, yield);
      if (done) {
        done(profile, st);
      }
    });
  }

  const ConnectConfig &Config() const { return cfg_; }

private:
  Result<std::uint16_t> OpenTunnel(const profiles::ProfileRecord &record,
                                   std::uint64_t gen,
                                   const std::optional<std::string> &otp,
                                   net::yield_context yield) {
    const ProfileId &profile = record.id;
    if (tunnel_ == nullptr) {
      return FailWith(profile, gen,
                      Error{ErrorKind::TunnelFailed, "no tunnel available"});
    }
    auto lease = registry_.LeasePort(profile, gen);
    if (!lease) {
      if (lease.error().kind == ErrorKind::Cancelled) {
        return std::unexpected(lease.error());
      }
      return FailWith(profile, gen, lease.error());
    }
    TunnelRequest request;
    request.owner = profile;
    request.localPort = lease->port;
    request.remote = record.Target();
    request.sshServer = record.SshServer();
    request.credentials.username = record.sshUsername;
    request.credentials.password = record.sshPassword + otp.value_or("");
    diag_.Emit(profile, LogLevel::Info, "TUNNEL",
               "opening tunnel on local port " + std::to_string(lease->port));
    auto handle = tunnel_->Open(request, yield);
    if (!handle) {
      Error e = handle.error();
      if (e.kind != ErrorKind::AuthFailed && e.kind != ErrorKind::Cancelled) {
        e.kind = ErrorKind::TunnelFailed;
      }
      return FailWith(profile, gen, e);
    }
    if (auto st = registry_.AttachTunnel(profile, gen, *handle); !st) {
      return std::unexpected(st.error());
    }
    return lease->port;
  }

  // Another request owns the connect; follow it until it settles.
  Status AwaitSettled(const ProfileId &profile, net::yield_context yield) {
    net::steady_timer poll(ioc_);
    for (;;) {
      const LifecycleState s = registry_.State(profile);
      if (IsReady(s)) {
        return {};
      }
      if (s != LifecycleState::Connecting) {
        if (auto why = registry_.LastError(profile)) {
          return std::unexpected(*why);
        }
        return MakeError(ErrorKind::Cancelled,
                         "concurrent connect did not complete");
      }
      (void)retry::WaitAsync(poll, yield, cfg_.connectingPollInterval);
    }
  }

  bool IsCurrent(const ProfileId &profile, std::uint64_t gen,
                 LifecycleState expected) const {
    auto s = registry_.Find(profile);
    return s && s->generation == gen && s->state == expected;
  }

  std::unexpected<Error> FailWith(const ProfileId &profile, std::uint64_t gen,
                                  const Error &error) {
    registry_.Fail(profile, gen, error);
    return std::unexpected(error);
  }

  net::io_context &ioc_;
  SessionRegistry &registry_;
  const profiles::IProfileStore &store_;
  ITunnel *tunnel_;
  IDiagnosticsSink &diag_;
  ConnectConfig cfg_;
};
