#pragma once

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "util/branch.hpp"
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <unordered_map>

namespace ports {

namespace net = boost::asio;
using tcp = net::ip::tcp;

struct PortLease {
  std::uint16_t port = 0;
  ProfileId owner;
  std::chrono::system_clock::time_point leasedAt;
};

// Returns true when the OS lets us bind the port right now.
using ProbeFn = std::function<bool(std::uint16_t)>;

// Binds a throwaway acceptor to INADDR_ANY:port and closes it again. No
// SO_REUSEADDR, so ports held by any other socket (listening or in
// TIME_WAIT) are reported busy.
inline bool IsPortBindable(std::uint16_t port) {
  net::io_context ioc;
  tcp::acceptor acceptor(ioc);
  boost::system::error_code ec;
  acceptor.open(tcp::v4(), ec);
  if (ec) {
    return false;
  }
  acceptor.bind(tcp::endpoint(tcp::v4(), port), ec);
  boost::system::error_code ignored;
  acceptor.close(ignored);
  return !ec;
}

// PortAllocator
// Threading model:
// - All lease-table reads and writes happen under mu_; Lease() also runs its
//   bind probes under the lock so two callers can't both win the same port
// - Candidates are drawn at random so a block of ports left busy by a
//   previous run doesn't turn into a long linear scan
class PortAllocator {
public:
  explicit PortAllocator(PortConfig cfg = {}, ProbeFn probe = IsPortBindable)
      : cfg_(cfg), probe_(std::move(probe)), rng_(std::random_device{}()) {}

  Result<PortLease> Lease(const ProfileId &owner) {
    std::lock_guard<std::mutex> lk(mu_);
    const PortRange range = cfg_.range;
    if (CONTROLROOM_UNLIKELY(range.size() == 0)) {
      return MakeError(ErrorKind::PortExhausted, "empty port range");
    }
    std::uniform_int_distribution<unsigned> pick(range.first, range.last - 1);
    for (int attempt = 0; attempt < cfg_.maxProbeAttempts; ++attempt) {
      const auto port = static_cast<std::uint16_t>(pick(rng_));
      if (leases_.contains(port)) {
        continue;
      }
      if (!probe_(port)) {
        continue;
      }
      PortLease lease{port, owner, std::chrono::system_clock::now()};
      leases_.emplace(port, lease);
      return lease;
    }
    return MakeError(ErrorKind::PortExhausted,
                     "No available ports found in range " +
                         std::to_string(range.first) + "-" +
                         std::to_string(range.last));
  }

  // Unknown or already released ports are ignored.
  void Release(std::uint16_t port) {
    std::lock_guard<std::mutex> lk(mu_);
    leases_.erase(port);
  }

  // Full-system teardown only.
  void ResetAll() {
    std::lock_guard<std::mutex> lk(mu_);
    leases_.clear();
  }

  bool IsLeased(std::uint16_t port) const {
    std::lock_guard<std::mutex> lk(mu_);
    return leases_.contains(port);
  }

  std::size_t LeasedCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return leases_.size();
  }

  const PortConfig &Config() const { return cfg_; }

private:
  PortConfig cfg_;
  ProbeFn probe_;
  mutable std::mutex mu_;
  std::mt19937 rng_;
  std::unordered_map<std::uint16_t, PortLease> leases_;
};

} // namespace ports
