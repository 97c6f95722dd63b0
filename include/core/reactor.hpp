#pragma once

#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <optional>
#include <thread>
#include <vector>

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns the single io_context shared by connect sequences, group launches,
//   health loops and the bundled TCP collaborators
// - Runs io_context::run() on N std::jthread workers (1 by default); all of
//   the above execute as coroutines on these threads, serialized per profile
//   or per launch by strands
class Reactor {
public:
  Reactor() = default;
  Reactor(const Reactor &) = delete;
  Reactor &operator=(const Reactor &) = delete;

  net::io_context &GetIoContext() { return ioc_; }

  void Start(int numThreads = 1) {
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    threads_.reserve(static_cast<std::size_t>(numThreads));
    for (int i = 0; i < numThreads; ++i) {
      threads_.emplace_back([this] { ioc_.run(); });
    }
  }

  void Stop() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    ioc_.stop();
  }

  // Waits for every worker to leave run().
  void Join() { threads_.clear(); }

  ~Reactor() {
    Stop();
    Join();
  }

private:
  net::io_context ioc_;
  std::vector<std::jthread> threads_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};
