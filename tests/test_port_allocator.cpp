#include "fakes.hpp"
#include "ports/port_allocator.hpp"
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <catch2/catch.hpp>
#include <memory>
#include <set>
#include <vector>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

PortConfig RangeOf(std::uint16_t first, std::uint16_t last) {
  PortConfig cfg;
  cfg.range = PortRange{first, last};
  return cfg;
}

// Two adjacent ports held by listening sockets for the test's lifetime.
struct BoundPair {
  net::io_context ioc;
  std::vector<std::unique_ptr<tcp::acceptor>> held;
  std::uint16_t first = 0;

  BoundPair() {
    for (std::uint16_t p = 46000; p < 47000 && held.empty(); p += 2) {
      auto a = Bind(p);
      auto b = a ? Bind(p + 1) : nullptr;
      if (a && b) {
        held.push_back(std::move(a));
        held.push_back(std::move(b));
        first = p;
      }
    }
  }

  std::unique_ptr<tcp::acceptor> Bind(std::uint16_t port) {
    auto acc = std::make_unique<tcp::acceptor>(ioc);
    boost::system::error_code ec;
    acc->open(tcp::v4(), ec);
    if (!ec) {
      acc->bind(tcp::endpoint(tcp::v4(), port), ec);
    }
    if (!ec) {
      acc->listen(1, ec);
    }
    if (ec) {
      return nullptr;
    }
    return acc;
  }
};

} // namespace

TEST_CASE("leases are distinct and exhaust the range", "[ports]") {
  ports::PortAllocator alloc(RangeOf(40000, 40010), fakes::AlwaysFree);
  std::set<std::uint16_t> seen;
  for (int i = 0; i < 10; ++i) {
    auto lease = alloc.Lease(ProfileId{"p" + std::to_string(i)});
    REQUIRE(lease);
    CHECK(lease->port >= 40000);
    CHECK(lease->port < 40010);
    CHECK(seen.insert(lease->port).second);
  }
  CHECK(alloc.LeasedCount() == 10);

  auto none = alloc.Lease(ProfileId{"extra"});
  REQUIRE_FALSE(none);
  CHECK(none.error().kind == ErrorKind::PortExhausted);
}

TEST_CASE("released ports become leasable again", "[ports]") {
  ports::PortAllocator alloc(RangeOf(40100, 40101), fakes::AlwaysFree);
  auto a = alloc.Lease(ProfileId{"a"});
  REQUIRE(a);
  CHECK(a->port == 40100);
  CHECK(a->owner == ProfileId{"a"});
  CHECK(alloc.IsLeased(40100));
  CHECK_FALSE(alloc.Lease(ProfileId{"b"}));

  alloc.Release(40100);
  alloc.Release(40100);
  alloc.Release(12345);
  CHECK_FALSE(alloc.IsLeased(40100));

  auto b = alloc.Lease(ProfileId{"b"});
  REQUIRE(b);
  CHECK(b->port == 40100);
}

TEST_CASE("probe failures are bounded by the attempt limit", "[ports]") {
  int probes = 0;
  ports::PortAllocator alloc(RangeOf(41000, 41100), [&probes](std::uint16_t) {
    ++probes;
    return false;
  });
  auto r = alloc.Lease(ProfileId{"p"});
  REQUIRE_FALSE(r);
  CHECK(r.error().kind == ErrorKind::PortExhausted);
  CHECK(probes == 1000);
  CHECK(alloc.LeasedCount() == 0);
}

TEST_CASE("empty range is exhausted immediately", "[ports]") {
  int probes = 0;
  ports::PortAllocator alloc(RangeOf(42000, 42000), [&probes](std::uint16_t) {
    ++probes;
    return true;
  });
  auto r = alloc.Lease(ProfileId{"p"});
  REQUIRE_FALSE(r);
  CHECK(r.error().kind == ErrorKind::PortExhausted);
  CHECK(probes == 0);
}

TEST_CASE("ports bound by another socket are never leased", "[ports][net]") {
  BoundPair bound;
  REQUIRE(bound.held.size() == 2);
  CHECK_FALSE(ports::IsPortBindable(bound.first));
  CHECK_FALSE(ports::IsPortBindable(bound.first + 1));

  ports::PortAllocator alloc(RangeOf(bound.first, bound.first + 2));
  int exhausted = 0;
  for (int i = 0; i < 1000; ++i) {
    auto r = alloc.Lease(ProfileId{"p"});
    REQUIRE_FALSE(r);
    if (r.error().kind == ErrorKind::PortExhausted) {
      ++exhausted;
    }
  }
  CHECK(exhausted == 1000);
  CHECK(alloc.LeasedCount() == 0);
}

TEST_CASE("real probe round trip on a single-port range", "[ports][net]") {
  std::uint16_t port = 0;
  for (std::uint16_t p = 47000; p < 48000; ++p) {
    if (ports::IsPortBindable(p)) {
      port = p;
      break;
    }
  }
  REQUIRE(port != 0);
  ports::PortAllocator alloc(RangeOf(port, port + 1));
  auto first = alloc.Lease(ProfileId{"p"});
  REQUIRE(first);
  CHECK(first->port == port);
  alloc.Release(port);
  auto second = alloc.Lease(ProfileId{"p"});
  REQUIRE(second);
  CHECK(second->port == port);
}

TEST_CASE("reset clears every lease", "[ports]") {
  ports::PortAllocator alloc(RangeOf(43000, 43005), fakes::AlwaysFree);
  for (int i = 0; i < 5; ++i) {
    REQUIRE(alloc.Lease(ProfileId{"p"}));
  }
  alloc.ResetAll();
  CHECK(alloc.LeasedCount() == 0);
  CHECK(alloc.Lease(ProfileId{"p"}));
}
