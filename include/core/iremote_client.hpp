#pragma once

#include "core/errors.hpp"
#include "core/types.hpp"
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/spawn.hpp>
#include <functional>
#include <memory>
#include <optional>

namespace net = boost::asio;

// Status change published by a protocol client. Owned by value: the client
// must not keep references into it after the handler returns.
struct ClientEvent {
  HealthStatus status = HealthStatus::Disconnected;
  std::optional<Error> error;
};

using ClientEventHandler = std::function<void(ClientEvent)>;

// IRemoteClient: one remote-desktop protocol connection. The handler may be
// invoked from any thread, including synchronously from Disconnect().
class IRemoteClient {
public:
  virtual ~IRemoteClient() = default;
  virtual void SetEventHandler(ClientEventHandler handler) = 0;
  virtual Status Connect(const Endpoint &target, const Credentials &credentials,
                         net::yield_context yield) = 0;
  virtual void Disconnect() = 0;
  virtual bool IsAlive() const = 0;
};

// Creates one client per session generation.
class IRemoteClientFactory {
public:
  virtual ~IRemoteClientFactory() = default;
  virtual std::shared_ptr<IRemoteClient> Create(const ProfileId &profile) = 0;
};
