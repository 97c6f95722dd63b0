#pragma once

#include "core/errors.hpp"
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <expected>
#include <string>

namespace net = boost::asio;
using tcp = net::ip::tcp;

// namespace tcpops: thin std::expected wrappers over the Asio calls the
// bundled collaborators make, mapped onto the orchestrator's error taxonomy.
namespace tcpops {

inline Status MakeStatus(const boost::system::error_code &ec,
                         ErrorKind fallback = ErrorKind::NetworkUnreachable) {
  if (ec) {
    return std::unexpected(errors::FromErrorCode(ec, fallback));
  }
  return {};
}

inline Result<tcp::resolver::results_type>
AsyncResolve(tcp::resolver &resolver, const std::string &host,
             const std::string &port, net::yield_context yield) {
  boost::system::error_code ec;
  auto r = resolver.async_resolve(host, port, yield[ec]);
  if (ec) {
    return std::unexpected(
        errors::FromErrorCode(ec, ErrorKind::NetworkUnreachable));
  }
  return r;
}

inline Status AsyncConnect(tcp::socket &sock,
                           const tcp::resolver::results_type &endpoints,
                           net::yield_context yield) {
  boost::system::error_code ec;
  auto it = net::async_connect(sock, endpoints, yield[ec]);
  (void)it;
  return MakeStatus(ec);
}

inline Status AsyncConnect(tcp::socket &sock, const std::string &host,
                           std::uint16_t port, net::yield_context yield) {
  tcp::resolver resolver(sock.get_executor());
  auto endpoints = AsyncResolve(resolver, host, std::to_string(port), yield);
  if (!endpoints) {
    return std::unexpected(endpoints.error());
  }
  return AsyncConnect(sock, *endpoints, yield);
}

inline void SetTcpNoDelay(tcp::socket &sock) {
  boost::system::error_code ec;
  sock.set_option(net::ip::tcp::no_delay(true), ec);
  (void)ec;
}

inline void CloseQuietly(tcp::socket &sock) {
  boost::system::error_code ec;
  sock.shutdown(tcp::socket::shutdown_both, ec);
  sock.close(ec);
}

} // namespace tcpops
