#pragma once

#include "io/file_writer.hpp"
#include "util/branch.hpp"
#include <atomic>
#include <boost/lockfree/queue.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

namespace logging {

// WriterBase
// Threading model:
// - Owns one background std::jthread worker (started via Start)
// - Derived class implements RunLoop() and controls draining strategy
// - Join() stops the worker and waits for clean shutdown
template <typename Derived> class WriterBase {
public:
  WriterBase() = default;
  ~WriterBase() { Join(); }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ = std::jthread([this] { static_cast<Derived *>(this)->RunLoop(); });
  }

  void Join() {
    running_.store(false, std::memory_order_relaxed);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool Running() const { return running_.load(std::memory_order_relaxed); }

protected:
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

inline constexpr std::size_t kLogQueueCapacity = 4096;
inline constexpr int kWriteBatch = 64;

// LogWriter
// Threading model:
// - Any thread may Submit(); lines travel through a bounded MPSC lock-free
//   queue as heap-allocated strings (the queue itself only holds pointers)
// - One background thread drains the queue and writes batches via writev
// - A full queue drops the line instead of blocking the producer
class LogWriter : public WriterBase<LogWriter> {
public:
  explicit LogWriter(int fd = STDERR_FILENO, bool ownsFd = false)
      : fd_(fd), owns_fd_(ownsFd) {}

  ~LogWriter() {
    Join();
    DrainAll();
    if (owns_fd_ && fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  LogWriter(const LogWriter &) = delete;
  LogWriter &operator=(const LogWriter &) = delete;

  // Returns nullptr when the file can't be opened.
  static std::unique_ptr<LogWriter> ToFile(const std::string &path) {
    int fd = io::OpenAppend(path);
    if (fd == -1) {
      return nullptr;
    }
    return std::make_unique<LogWriter>(fd, true);
  }

  bool Submit(std::string line) {
    auto item = std::make_unique<std::string>(std::move(line));
    if (CONTROLROOM_UNLIKELY(!queue_.push(item.get()))) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    // The queue owns it now; DrainBatch takes it back.
    (void)item.release();
    return true;
  }

  std::size_t Dropped() const {
    return dropped_.load(std::memory_order_relaxed);
  }

  void RunLoop() {
    for (;;) {
      if (CONTROLROOM_UNLIKELY(!this->running_.load(std::memory_order_relaxed))) {
        break;
      }
      if (DrainBatch() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
      }
    }
    DrainAll();
  }

private:
  void DrainAll() {
    while (DrainBatch() > 0) {
    }
  }

  // batch consume to reduce syscalls
  int DrainBatch() {
    std::unique_ptr<std::string> lines[kWriteBatch];
    struct iovec iov[kWriteBatch];
    int cnt = 0;
    std::string *raw = nullptr;
    while (cnt < kWriteBatch && queue_.pop(raw)) {
      lines[cnt].reset(raw);
      iov[cnt] = {lines[cnt]->data(), lines[cnt]->size()};
      ++cnt;
    }
    if (cnt > 0 && fd_ != -1) {
      if (!io::WritevAll(fd_, iov, cnt)) {
        dropped_.fetch_add(static_cast<std::size_t>(cnt),
                           std::memory_order_relaxed);
      }
    }
    return cnt;
  }

  boost::lockfree::queue<std::string *,
                         boost::lockfree::capacity<kLogQueueCapacity>>
      queue_;
  int fd_;
  bool owns_fd_;
  std::atomic<std::size_t> dropped_{0};
};

} // namespace logging
