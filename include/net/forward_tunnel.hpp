#pragma once

#include "core/idiagnostics.hpp"
#include "core/itunnel.hpp"
#include "net/tcp_ops.hpp"
#include <array>
#include <atomic>
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace net = boost::asio;
using tcp = net::ip::tcp;

// ForwardTunnel
// Plain TCP port forward: listens on 127.0.0.1:<leased port> and relays each
// accepted connection to the request's remote endpoint. No SSH is spoken;
// the SSH server and credentials are only checked for presence.
// Threading model:
// - Each open forward owns a strand; its acceptor and relay sockets are only
//   touched there once Open() returns
// - Open/Close/IsAlive may be called from any thread
class ForwardTunnel : public ITunnel {
public:
  ForwardTunnel(net::io_context &ioc, IDiagnosticsSink &diag)
      : ioc_(ioc), diag_(diag) {}

  ~ForwardTunnel() override {
    std::unordered_map<TunnelHandle, std::shared_ptr<Forward>> all;
    {
      std::lock_guard<std::mutex> lk(mu_);
      all.swap(forwards_);
    }
    for (auto &[_, f] : all) {
      f->Shutdown();
    }
  }

  Result<TunnelHandle> Open(const TunnelRequest &request,
                            net::yield_context yield) override {
    const ProfileId &tag = request.owner;
    if (request.sshServer.host.empty()) {
      return MakeError(ErrorKind::TunnelFailed, "no SSH server configured");
    }
    if (request.credentials.username.empty()) {
      return MakeError(ErrorKind::AuthFailed, "no SSH username");
    }
    // Reachability check first so a dead target fails the tunnel stage.
    {
      tcp::socket probe(ioc_);
      auto st = tcpops::AsyncConnect(probe, request.remote.host,
                                     request.remote.port, yield);
      tcpops::CloseQuietly(probe);
      if (!st) {
        return MakeError(ErrorKind::TunnelFailed,
                         "forward target " + request.remote.ToString() +
                             ": " + st.error().detail);
      }
    }
    auto fwd = std::make_shared<Forward>(ioc_, request.remote, diag_, tag);
    if (auto st = fwd->Listen(request.localPort); !st) {
      return std::unexpected(st.error());
    }
    TunnelHandle handle = 0;
    {
      std::lock_guard<std::mutex> lk(mu_);
      handle = ++next_handle_;
      forwards_.emplace(handle, fwd);
    }
    fwd->Start();
    diag_.Emit(tag, LogLevel::Info, "TUNNEL",
               "forwarding 127.0.0.1:" + std::to_string(request.localPort) +
                   " -> " + request.remote.ToString());
    return handle;
  }

  void Close(TunnelHandle handle) override {
    std::shared_ptr<Forward> fwd;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = forwards_.find(handle);
      if (it == forwards_.end()) {
        return;
      }
      fwd = std::move(it->second);
      forwards_.erase(it);
    }
    fwd->Shutdown();
  }

  bool IsAlive(TunnelHandle handle) const override {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = forwards_.find(handle);
    return it != forwards_.end() && it->second->Alive();
  }

private:
  class Forward : public std::enable_shared_from_this<Forward> {
  public:
    Forward(net::io_context &ioc, Endpoint remote, IDiagnosticsSink &diag,
            ProfileId tag)
        : strand_(net::make_strand(ioc)), acceptor_(strand_),
          remote_(std::move(remote)), diag_(diag), tag_(std::move(tag)) {}

    Status Listen(std::uint16_t port) {
      boost::system::error_code ec;
      const tcp::endpoint ep(net::ip::address_v4::loopback(), port);
      acceptor_.open(ep.protocol(), ec);
      if (!ec) {
        acceptor_.bind(ep, ec);
      }
      if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
      }
      if (ec) {
        acceptor_.close(ec);
        return MakeError(ErrorKind::TunnelFailed,
                         "listen on " + std::to_string(port) + ": " +
                             ec.message());
      }
      alive_.store(true);
      return {};
    }

    void Start() {
      auto self = shared_from_this();
      net::spawn(strand_,
                 [self](net::yield_context y) { self->AcceptLoop(y); });
    }

    void Shutdown() {
      alive_.store(false);
      auto self = shared_from_this();
      net::post(strand_, [self] {
        boost::system::error_code ec;
        self->acceptor_.close(ec);
        for (auto &weak : self->relays_) {
          if (auto s = weak.lock()) {
            tcpops::CloseQuietly(*s);
          }
        }
        self->relays_.clear();
      });
    }

    bool Alive() const { return alive_.load(); }

  private:
    void AcceptLoop(net::yield_context yield) {
      boost::system::error_code ec;
      for (;;) {
        auto downstream = std::make_shared<tcp::socket>(strand_);
        acceptor_.async_accept(*downstream, yield[ec]);
        if (ec) {
          break;
        }
        auto upstream = std::make_shared<tcp::socket>(strand_);
        auto st = tcpops::AsyncConnect(*upstream, remote_.host, remote_.port,
                                       yield);
        if (!st) {
          diag_.Emit(tag_, LogLevel::Warning, "TUNNEL",
                     "upstream connect failed: " + st.error().detail);
          tcpops::CloseQuietly(*downstream);
          continue;
        }
        Prune();
        relays_.push_back(downstream);
        relays_.push_back(upstream);
        auto self = shared_from_this();
        net::spawn(strand_, [self, downstream, upstream](net::yield_context y) {
          Pump(downstream, upstream, y);
        });
        net::spawn(strand_, [self, downstream, upstream](net::yield_context y) {
          Pump(upstream, downstream, y);
        });
      }
      if (alive_.exchange(false)) {
        diag_.Emit(tag_, LogLevel::Warning, "TUNNEL",
                   "listener stopped: " + ec.message());
      }
    }

    static void Pump(const std::shared_ptr<tcp::socket> &from,
                     const std::shared_ptr<tcp::socket> &to,
                     net::yield_context yield) {
      std::array<char, 8192> buf;
      boost::system::error_code ec;
      for (;;) {
        std::size_t n = from->async_read_some(net::buffer(buf), yield[ec]);
        if (ec) {
          break;
        }
        net::async_write(*to, net::buffer(buf.data(), n), yield[ec]);
        if (ec) {
          break;
        }
      }
      tcpops::CloseQuietly(*from);
      tcpops::CloseQuietly(*to);
    }

    void Prune() {
      std::erase_if(relays_, [](const std::weak_ptr<tcp::socket> &w) {
        auto s = w.lock();
        return !s || !s->is_open();
      });
    }

    net::strand<net::io_context::executor_type> strand_;
    tcp::acceptor acceptor_;
    Endpoint remote_;
    IDiagnosticsSink &diag_;
    ProfileId tag_;
    std::atomic<bool> alive_{false};
    std::vector<std::weak_ptr<tcp::socket>> relays_;
  };

  net::io_context &ioc_;
  IDiagnosticsSink &diag_;
  mutable std::mutex mu_;
  std::unordered_map<TunnelHandle, std::shared_ptr<Forward>> forwards_;
  TunnelHandle next_handle_ = 0;
};
