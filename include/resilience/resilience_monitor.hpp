#pragma once

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/idiagnostics.hpp"
#include "core/ihealth_monitor.hpp"
#include "core/types.hpp"
#include "net/retry.hpp"
#include "util/time.hpp"
#include <atomic>
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace resilience {

namespace net = boost::asio;

struct HealthRecord {
  ProfileId profile;
  HealthStatus status = HealthStatus::Connecting;
  timeutil::Clock::time_point lastCheck{};
  int reconnectionAttempts = 0;
  std::optional<Error> lastError;
  bool reconnecting = false;
};

// What the monitor needs from the rest of the core. Every hook is invoked
// from a profile strand with no monitor lock held.
struct Hooks {
  std::function<bool(const ProfileId &)> isHealthy;
  std::function<bool(const ProfileId &)> tunnelAlive;
  std::function<Status(const ProfileId &, net::yield_context)> reconnect;
  std::function<void(const ProfileId &, const Error &)> onTerminalFailure;
};

// ResilienceMonitor
// Threading model:
// - Each registered profile gets an Entry with its own strand; its health
//   loop, status handling and reconnection loop all run there, so for one
//   profile they never overlap
// - Register/Unregister/ReportStatus only touch the map under mu_ and post
//   to the strand; they never call a hook synchronously
// - Records are read and written under mu_ so Record() is safe anywhere
class ResilienceMonitor : public IHealthMonitor {
public:
  ResilienceMonitor(net::io_context &ioc, ResilienceConfig cfg,
                    IDiagnosticsSink &diag, Hooks hooks)
      : ioc_(ioc), cfg_(cfg), diag_(diag), hooks_(std::move(hooks)) {}

  ResilienceMonitor(const ResilienceMonitor &) = delete;
  ResilienceMonitor &operator=(const ResilienceMonitor &) = delete;

  ~ResilienceMonitor() override {
    std::unordered_map<ProfileId, std::shared_ptr<Entry>> all;
    {
      std::lock_guard<std::mutex> lk(mu_);
      all.swap(entries_);
    }
    for (auto &[_, e] : all) {
      Stop(e);
    }
  }

  void Register(const ProfileId &profile) override {
    auto entry = std::make_shared<Entry>(ioc_, profile);
    std::shared_ptr<Entry> previous;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto &slot = entries_[profile];
      previous = std::move(slot);
      slot = entry;
    }
    if (previous) {
      Stop(previous);
    }
    diag_.Emit(profile, LogLevel::Debug, "HEALTH", "monitoring started");
    net::spawn(entry->strand, [this, entry](net::yield_context yield) {
      HealthLoop(entry, yield);
    });
  }

  void Unregister(const ProfileId &profile) override {
    std::shared_ptr<Entry> entry;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = entries_.find(profile);
      if (it == entries_.end()) {
        return;
      }
      entry = std::move(it->second);
      entries_.erase(it);
    }
    Stop(entry);
    diag_.Emit(profile, LogLevel::Debug, "HEALTH", "monitoring stopped");
  }

  void ReportStatus(const ProfileId &profile, HealthStatus status,
                    std::optional<Error> error = std::nullopt) override {
    auto entry = Lookup(profile);
    if (!entry) {
      return;
    }
    net::post(entry->strand, [this, entry, status, error = std::move(error)] {
      HandleStatus(entry, status, error);
    });
  }

  std::optional<HealthRecord> Record(const ProfileId &profile) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(profile);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second->record;
  }

  std::size_t MonitoredCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
  }

  const ResilienceConfig &Config() const { return cfg_; }

private:
  struct Entry {
    Entry(net::io_context &ioc, const ProfileId &profile)
        : strand(net::make_strand(ioc)), healthTimer(strand),
          reconnectTimer(strand) {
      record.profile = profile;
    }

    net::strand<net::io_context::executor_type> strand;
    net::steady_timer healthTimer;
    net::steady_timer reconnectTimer;
    HealthRecord record;          // guarded by mu_
    std::atomic<bool> stopped{false};
    std::uint64_t reconnectEpoch = 0; // strand only
  };

  std::shared_ptr<Entry> Lookup(const ProfileId &profile) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(profile);
    return it == entries_.end() ? nullptr : it->second;
  }

  void Stop(const std::shared_ptr<Entry> &entry) {
    entry->stopped.store(true);
    net::post(entry->strand, [entry] {
      entry->healthTimer.cancel();
      entry->reconnectTimer.cancel();
    });
  }

  void HealthLoop(const std::shared_ptr<Entry> &entry,
                  net::yield_context yield) {
    const ProfileId profile = entry->record.profile;
    // First check only after one full interval of grace.
    while (!entry->stopped.load()) {
      if (!retry::WaitAsync(entry->healthTimer, yield,
                            cfg_.healthCheckInterval) ||
          entry->stopped.load()) {
        return;
      }
      bool due = false;
      {
        std::lock_guard<std::mutex> lk(mu_);
        if (entry->record.status == HealthStatus::Failed) {
          return;
        }
        entry->record.lastCheck = timeutil::Clock::now();
        due = entry->record.status == HealthStatus::Connected &&
              !entry->record.reconnecting;
      }
      if (!due || !hooks_.isHealthy) {
        continue;
      }
      if (!hooks_.isHealthy(profile)) {
        if (entry->stopped.load()) {
          return;
        }
        diag_.Emit(profile, LogLevel::Warning, "HEALTH",
                   "health check failed");
        HandleStatus(entry, HealthStatus::Disconnected,
                     Error{ErrorKind::NetworkUnreachable,
                           "health check failed"});
      }
    }
  }

  void HandleStatus(const std::shared_ptr<Entry> &entry, HealthStatus status,
                    const std::optional<Error> &error) {
    if (entry->stopped.load()) {
      return;
    }
    const ProfileId profile = entry->record.profile;
    HealthStatus previous;
    {
      std::lock_guard<std::mutex> lk(mu_);
      previous = entry->record.status;
      if (previous == HealthStatus::Failed) {
        return;
      }
      entry->record.status = status;
      if (error) {
        entry->record.lastError = error;
      }
      if (status == HealthStatus::Connected) {
        entry->record.reconnectionAttempts = 0;
      }
    }
    if (previous != status) {
      diag_.Emit(profile, LogLevel::Debug, "HEALTH",
                 std::string(ToString(previous)) + " -> " +
                     std::string(ToString(status)));
    }
    switch (status) {
    case HealthStatus::Connecting:
    case HealthStatus::Connected:
      return;
    case HealthStatus::Disconnected:
      if (previous != HealthStatus::Connected) {
        return;
      }
      if (error && error->kind == ErrorKind::AuthFailed) {
        Terminal(entry, *error);
        return;
      }
      if (hooks_.tunnelAlive && !hooks_.tunnelAlive(profile)) {
        Terminal(entry, Error{ErrorKind::TunnelFailed, "tunnel is down"});
        return;
      }
      StartReconnection(entry);
      return;
    case HealthStatus::Failed:
      Terminal(entry, error ? *error
                            : Error{ErrorKind::ProtocolError,
                                    "reported failed"});
      return;
    }
  }

  // Cancels any reconnection already running for this entry.
  void StartReconnection(const std::shared_ptr<Entry> &entry) {
    const std::uint64_t epoch = ++entry->reconnectEpoch;
    entry->reconnectTimer.cancel();
    {
      std::lock_guard<std::mutex> lk(mu_);
      entry->record.reconnecting = true;
      entry->record.reconnectionAttempts = 0;
    }
    net::spawn(entry->strand, [this, entry, epoch](net::yield_context yield) {
      ReconnectLoop(entry, epoch, yield);
    });
  }

  void ReconnectLoop(const std::shared_ptr<Entry> &entry, std::uint64_t epoch,
                     net::yield_context yield) {
    auto superseded = [&] {
      return entry->stopped.load() || entry->reconnectEpoch != epoch;
    };
    const ProfileId profile = entry->record.profile;
    Error last{ErrorKind::NetworkUnreachable, "connection lost"};
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (entry->record.lastError) {
        last = *entry->record.lastError;
      }
    }
    for (int attempt = 1; attempt <= cfg_.maxReconnectionAttempts;
         ++attempt) {
      {
        std::lock_guard<std::mutex> lk(mu_);
        entry->record.reconnectionAttempts = attempt;
      }
      diag_.Emit(profile, LogLevel::Info, "RECONNECT",
                 "attempt " + std::to_string(attempt) + "/" +
                     std::to_string(cfg_.maxReconnectionAttempts));
      if (!retry::WaitAsync(entry->reconnectTimer, yield,
                            cfg_.reconnectionDelay) ||
          superseded()) {
        return;
      }
      Status st = MakeError(ErrorKind::Cancelled, "no reconnect hook");
      if (hooks_.reconnect) {
        st = hooks_.reconnect(profile, yield);
      }
      if (superseded()) {
        return;
      }
      if (st) {
        {
          std::lock_guard<std::mutex> lk(mu_);
          entry->record.status = HealthStatus::Connected;
          entry->record.reconnecting = false;
          entry->record.reconnectionAttempts = 0;
        }
        diag_.Emit(profile, LogLevel::Success, "RECONNECT", "reconnected");
        return;
      }
      last = st.error();
      diag_.Emit(profile, LogLevel::Warning, "RECONNECT",
                 "attempt failed: " + last.ToString());
      if (last.kind == ErrorKind::Cancelled) {
        std::lock_guard<std::mutex> lk(mu_);
        entry->record.reconnecting = false;
        return;
      }
      if (last.kind == ErrorKind::AuthFailed) {
        break;
      }
    }
    {
      std::lock_guard<std::mutex> lk(mu_);
      entry->record.reconnecting = false;
    }
    Terminal(entry, last);
  }

  void Terminal(const std::shared_ptr<Entry> &entry, const Error &error) {
    const ProfileId profile = entry->record.profile;
    {
      std::lock_guard<std::mutex> lk(mu_);
      entry->record.status = HealthStatus::Failed;
      entry->record.lastError = error;
      entry->record.reconnecting = false;
    }
    entry->healthTimer.cancel();
    entry->reconnectTimer.cancel();
    diag_.Emit(profile, LogLevel::Error, "HEALTH",
               errors::UserMessage(error) + " (" + error.ToString() + ")");
    if (hooks_.onTerminalFailure) {
      hooks_.onTerminalFailure(profile, error);
    }
  }

  net::io_context &ioc_;
  ResilienceConfig cfg_;
  IDiagnosticsSink &diag_;
  Hooks hooks_;
  mutable std::mutex mu_;
  std::unordered_map<ProfileId, std::shared_ptr<Entry>> entries_;
};

} // namespace resilience
