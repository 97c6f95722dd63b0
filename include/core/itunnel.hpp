#pragma once

#include "core/errors.hpp"
#include "core/types.hpp"
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/spawn.hpp>
#include <cstdint>

namespace net = boost::asio;

using TunnelHandle = std::uint64_t;

struct TunnelRequest {
  ProfileId owner;
  std::uint16_t localPort = 0;
  Endpoint remote;    // remote-desktop server as seen from the SSH host
  Endpoint sshServer; // jump host
  Credentials credentials;
};

// ITunnel: the secure transport that exposes a remote endpoint on a local
// port. Open suspends the calling coroutine until the tunnel is usable.
class ITunnel {
public:
  virtual ~ITunnel() = default;
  virtual Result<TunnelHandle> Open(const TunnelRequest &request,
                                    net::yield_context yield) = 0;
  virtual void Close(TunnelHandle handle) = 0;
  virtual bool IsAlive(TunnelHandle handle) const = 0;
};
