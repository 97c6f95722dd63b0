#pragma once

#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>

// namespace retry: cancellable coroutine waits used by the connect, group and
// resilience paths.
namespace retry {

namespace net = boost::asio;

// Waits on a caller-owned timer so another party can cut the wait short with
// timer.cancel(). Returns false when the wait was cancelled.
template <typename Rep, typename Period>
inline bool WaitAsync(net::steady_timer &timer, net::yield_context yield,
                      std::chrono::duration<Rep, Period> d) {
  boost::system::error_code ec;
  timer.expires_after(d);
  timer.async_wait(yield[ec]);
  return !ec;
}

// One-shot wait with a private timer; nothing can cancel it.
template <typename Rep, typename Period>
inline void WaitAsync(net::io_context &ioc, net::yield_context yield,
                      std::chrono::duration<Rep, Period> d) {
  net::steady_timer t(ioc);
  (void)WaitAsync(t, yield, d);
}

} // namespace retry
