#pragma once

#include "core/idiagnostics.hpp"
#include "core/iremote_client.hpp"
#include "net/tcp_ops.hpp"
#include "util/branch.hpp"
#include <array>
#include <atomic>
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <memory>
#include <mutex>
#include <string>

namespace net = boost::asio;
using tcp = net::ip::tcp;

// TcpProbeClient
// Stand-in remote-desktop client: an established TCP connection counts as
// connected, the peer closing it counts as a disconnect. It reads and
// discards whatever the server sends and never speaks the desktop protocol.
// Threading model:
// - Connect() runs in the caller's coroutine and owns the socket until the
//   connection is up; from then on the socket is only touched on strand_
// - A Disconnect() that races an in-flight Connect() is honoured when
//   Connect() resumes, which then reports Cancelled
class TcpProbeClient : public IRemoteClient,
                       public std::enable_shared_from_this<TcpProbeClient> {
public:
  TcpProbeClient(net::io_context &ioc, ProfileId profile,
                 IDiagnosticsSink &diag)
      : strand_(net::make_strand(ioc)), socket_(strand_),
        profile_(std::move(profile)), diag_(diag) {}

  void SetEventHandler(ClientEventHandler handler) override {
    std::lock_guard<std::mutex> lk(mu_);
    handler_ = std::move(handler);
  }

  Status Connect(const Endpoint &target, const Credentials &credentials,
                 net::yield_context yield) override {
    (void)credentials;
    if (connected_.load()) {
      return {};
    }
    abandoned_.store(false);
    Publish({HealthStatus::Connecting, std::nullopt});
    diag_.Emit(profile_, LogLevel::Debug, "CLIENT",
               "connecting to " + target.ToString());
    auto st = tcpops::AsyncConnect(socket_, target.host, target.port, yield);
    if (CONTROLROOM_UNLIKELY(!st)) {
      tcpops::CloseQuietly(socket_);
      return st;
    }
    if (abandoned_.load()) {
      tcpops::CloseQuietly(socket_);
      return MakeError(ErrorKind::Cancelled, "disconnect during connect");
    }
    tcpops::SetTcpNoDelay(socket_);
    connected_.store(true);
    auto self = shared_from_this();
    net::spawn(strand_,
               [self](net::yield_context y) { self->ReadLoop(y); });
    return {};
  }

  void Disconnect() override {
    abandoned_.store(true);
    if (!connected_.exchange(false)) {
      return;
    }
    auto self = shared_from_this();
    net::post(strand_, [self] { tcpops::CloseQuietly(self->socket_); });
    Publish({HealthStatus::Disconnected, std::nullopt});
  }

  bool IsAlive() const override { return connected_.load(); }

private:
  void ReadLoop(net::yield_context yield) {
    std::array<char, 4096> buf;
    boost::system::error_code ec;
    for (;;) {
      socket_.async_read_some(net::buffer(buf), yield[ec]);
      if (ec) {
        break;
      }
    }
    tcpops::CloseQuietly(socket_);
    // Disconnect() already reported a local close.
    if (connected_.exchange(false)) {
      diag_.Emit(profile_, LogLevel::Warning, "CLIENT",
                 "connection lost: " + ec.message());
      Publish({HealthStatus::Disconnected,
               errors::FromErrorCode(ec, ErrorKind::NetworkUnreachable)});
    }
  }

  void Publish(ClientEvent event) {
    ClientEventHandler handler;
    {
      std::lock_guard<std::mutex> lk(mu_);
      handler = handler_;
    }
    if (handler) {
      handler(std::move(event));
    }
  }

  net::strand<net::io_context::executor_type> strand_;
  tcp::socket socket_;
  ProfileId profile_;
  IDiagnosticsSink &diag_;
  std::mutex mu_;
  ClientEventHandler handler_;
  std::atomic<bool> connected_{false};
  std::atomic<bool> abandoned_{false};
};

class TcpProbeClientFactory : public IRemoteClientFactory {
public:
  TcpProbeClientFactory(net::io_context &ioc, IDiagnosticsSink &diag)
      : ioc_(ioc), diag_(diag) {}

  std::shared_ptr<IRemoteClient> Create(const ProfileId &profile) override {
    return std::make_shared<TcpProbeClient>(ioc_, profile, diag_);
  }

private:
  net::io_context &ioc_;
  IDiagnosticsSink &diag_;
};
