#pragma once

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/idiagnostics.hpp"
#include "core/iwindow_presenter.hpp"
#include "group/group_launch.hpp"
#include "net/retry.hpp"
#include "profiles/profile_store.hpp"
#include "sessions/session_connector.hpp"
#include "sessions/session_registry.hpp"
#include <atomic>
#include <boost/algorithm/string/trim.hpp>
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace group {

namespace net = boost::asio;

// GroupLaunchCoordinator
// Threading model:
// - One launch ("job") at a time; a second request gets Busy
// - Each job owns a strand. The launch coroutine, every member coroutine and
//   every member timeout run there, so member results resolve in order
//   without locks
// - SubmitOtp/Cancel may be called from any thread; they post to the strand
// - Cancellation before fan-out is clean (no session is created); during
//   fan-out it stops members not yet started, lets in-flight ones resolve
//   and silences progress and presentation
class GroupLaunchCoordinator {
public:
  using ProgressFn = std::function<void(const ProfileId &, MemberState)>;
  using CompletionFn = std::function<void(const LaunchReport &)>;

  GroupLaunchCoordinator(net::io_context &ioc, SessionConnector &connector,
                         SessionRegistry &registry,
                         const profiles::IProfileStore &store,
                         IWindowPresenter *presenter, IDiagnosticsSink &diag,
                         GroupConfig cfg = {},
                         Millis tunnelSettleDelay = Millis{3000})
      : ioc_(ioc), connector_(connector), registry_(registry), store_(store),
        presenter_(presenter), diag_(diag), cfg_(cfg),
        settle_delay_(tunnelSettleDelay) {}

  GroupLaunchCoordinator(const GroupLaunchCoordinator &) = delete;
  GroupLaunchCoordinator &operator=(const GroupLaunchCoordinator &) = delete;

  ~GroupLaunchCoordinator() { Cancel(); }

  void SetProgressObserver(ProgressFn fn) {
    std::lock_guard<std::mutex> lk(mu_);
    progress_ = std::move(fn);
  }

  Status LaunchGroup(const Group &g, CompletionFn done) {
    return LaunchGroup(g, RequiresSharedOtp(g.members, store_),
                       std::move(done));
  }

  // Starts the launch and returns at once; `done` fires exactly once when
  // the job ends, on the job strand.
  Status LaunchGroup(const Group &g, bool requiresSharedOtp,
                     CompletionFn done) {
    if (auto st = ValidateGroup(g, store_); !st) {
      diag_.Emit(ProfileId{g.id}, LogLevel::Error, "GROUP",
                 "invalid group: " + st.error().detail);
      return st;
    }
    auto job = std::make_shared<Job>(ioc_, g, requiresSharedOtp,
                                     std::move(done));
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (job_) {
        return MakeError(ErrorKind::Busy, "a group launch is in progress");
      }
      job_ = job;
      phase_ = LaunchPhase::Preparing;
    }
    diag_.Emit(ProfileId{g.id}, LogLevel::Info, "GROUP",
               "launching '" + g.name + "' with " +
                   std::to_string(g.members.size()) + " members");
    net::spawn(job->strand,
               [this, job](net::yield_context yield) { Run(job, yield); });
    return {};
  }

  // Feeds the shared OTP to a job that needs one. The code may arrive as
  // soon as LaunchGroup returns; the job then skips its wait. The code is
  // trimmed; an empty code is refused and the job keeps waiting. Only the
  // first accepted code is used.
  Status SubmitOtp(std::string code) {
    boost::algorithm::trim(code);
    if (code.empty()) {
      return MakeError(ErrorKind::AuthFailed, "empty OTP");
    }
    std::shared_ptr<Job> job;
    {
      std::lock_guard<std::mutex> lk(mu_);
      const bool waiting = phase_ == LaunchPhase::Preparing ||
                           phase_ == LaunchPhase::AwaitingOtp;
      if (!job_ || !job_->requiresOtp || job_->otpSubmitted || !waiting) {
        return MakeError(ErrorKind::Cancelled, "no launch is waiting for an OTP");
      }
      job_->otpSubmitted = true;
      job = job_;
    }
    net::post(job->strand, [job, code = std::move(code)] {
      if (!job->otp && !job->cancelled) {
        job->otp = code;
        job->otpGate.cancel();
      }
    });
    return {};
  }

  void Cancel() {
    std::shared_ptr<Job> job;
    {
      std::lock_guard<std::mutex> lk(mu_);
      job = job_;
    }
    if (!job) {
      return;
    }
    job->silenced.store(true);
    net::post(job->strand, [job] {
      job->cancelled = true;
      job->otpGate.cancel();
      job->staggerTimer.cancel();
    });
  }

  void CloseGroup(const Group &g) {
    for (const auto &m : g.members) {
      registry_.Disconnect(m);
    }
    diag_.Emit(ProfileId{g.id}, LogLevel::Info, "GROUP",
               "closed '" + g.name + "'");
  }

  LaunchPhase Phase() const {
    std::lock_guard<std::mutex> lk(mu_);
    return phase_;
  }

  bool Busy() const {
    std::lock_guard<std::mutex> lk(mu_);
    return job_ != nullptr;
  }

private:
  struct Job {
    Job(net::io_context &ioc, Group g, bool needsOtp, CompletionFn cb)
        : strand(net::make_strand(ioc)), otpGate(strand), staggerTimer(strand),
          doneTimer(strand), group(std::move(g)), requiresOtp(needsOtp),
          done(std::move(cb)) {}

    net::strand<net::io_context::executor_type> strand;
    net::steady_timer otpGate;
    net::steady_timer staggerTimer;
    net::steady_timer doneTimer;
    std::vector<std::unique_ptr<net::steady_timer>> memberTimers;
    Group group;
    bool requiresOtp;
    CompletionFn done;
    std::optional<std::string> otp;
    // Guarded by the coordinator mutex.
    bool otpSubmitted = false;
    bool cancelled = false;
    std::atomic<bool> silenced{false};
    std::vector<MemberResult> results;
    std::size_t pending = 0;
  };

  void Run(const std::shared_ptr<Job> &job, net::yield_context yield) {
    const ProfileId tag{job->group.id};
    if (job->requiresOtp) {
      SetPhase(LaunchPhase::AwaitingOtp);
      diag_.Emit(tag, LogLevel::Info, "GROUP", "waiting for shared OTP");
      boost::system::error_code ec;
      job->otpGate.expires_at(net::steady_timer::time_point::max());
      if (!job->cancelled && !job->otp) {
        job->otpGate.async_wait(yield[ec]);
      }
      if (job->cancelled || !job->otp) {
        diag_.Emit(tag, LogLevel::Warning, "GROUP",
                   "cancelled before OTP entry");
        LaunchReport report;
        report.groupId = job->group.id;
        report.cancelled = true;
        report.error = Error{ErrorKind::Cancelled, "cancelled before OTP"};
        Finish(job, report);
        return;
      }
    }

    SetPhase(LaunchPhase::Connecting);
    const std::size_t n = job->group.members.size();
    job->results.reserve(n);
    for (const auto &m : job->group.members) {
      job->results.push_back(MemberResult{m, MemberState::Pending, {}});
      job->memberTimers.push_back(
          std::make_unique<net::steady_timer>(job->strand));
    }
    job->pending = n;
    job->doneTimer.expires_at(net::steady_timer::time_point::max());

    for (std::size_t i = 0; i < n; ++i) {
      if (i > 0 && cfg_.memberStagger > Millis::zero() && !job->cancelled) {
        (void)retry::WaitAsync(job->staggerTimer, yield, cfg_.memberStagger);
      }
      if (job->cancelled) {
        Resolve(job, i, MemberState::Failed,
                Error{ErrorKind::Cancelled, "launch cancelled"});
        continue;
      }
      StartMember(job, i);
    }

    if (job->pending > 0) {
      boost::system::error_code ec;
      job->doneTimer.async_wait(yield[ec]);
    }

    LaunchReport report;
    report.groupId = job->group.id;
    report.members = job->results;
    report.aggregate = Classify(job->results);
    report.cancelled = job->cancelled;
    diag_.Emit(tag, report.aggregate->connected > 0 ? LogLevel::Success
                                                    : LogLevel::Error,
               "GROUP", "launch finished: " + report.aggregate->ToString());
    const auto connected = report.Connected();
    if (!job->cancelled && !connected.empty() && presenter_ != nullptr) {
      presenter_->PresentGroup(job->group.id, connected,
                               RecommendedLayout(connected.size()));
    }
    Finish(job, report);
  }

  void StartMember(const std::shared_ptr<Job> &job, std::size_t i) {
    const ProfileId member = job->results[i].profile;
    job->results[i].state = MemberState::Connecting;
    Progress(job, member, MemberState::Connecting);
    net::spawn(job->strand, [this, job, i, member](net::yield_context yield) {
      auto st = connector_.Connect(member, job->otp, settle_delay_, yield);
      if (st) {
        Resolve(job, i, MemberState::Connected, std::nullopt);
      } else {
        Resolve(job, i, MemberState::Failed, st.error());
      }
    });
    net::spawn(job->strand, [this, job, i, member](net::yield_context yield) {
      if (job->results[i].state != MemberState::Connecting) {
        return;
      }
      // The connect coroutine above acquired the session before its first
      // suspension; a timeout only ever fails that generation.
      const auto session = registry_.Find(member);
      if (!retry::WaitAsync(*job->memberTimers[i], yield, cfg_.memberTimeout)) {
        return;
      }
      if (job->results[i].state == MemberState::Connecting) {
        diag_.Emit(member, LogLevel::Error, "GROUP", "member timed out");
        Resolve(job, i, MemberState::Failed,
                Error{ErrorKind::Timeout, "member did not connect in time"});
        if (session) {
          registry_.Fail(member, session->generation,
                         Error{ErrorKind::Timeout, "group member timeout"});
        }
      }
    });
  }

  // First resolution wins; later ones (a connect finishing after its
  // timeout) are ignored.
  void Resolve(const std::shared_ptr<Job> &job, std::size_t i,
               MemberState state, std::optional<Error> error) {
    auto &r = job->results[i];
    if (r.state == MemberState::Connected || r.state == MemberState::Failed) {
      return;
    }
    r.state = state;
    r.error = std::move(error);
    job->memberTimers[i]->cancel();
    Progress(job, r.profile, state);
    if (--job->pending == 0) {
      job->doneTimer.cancel();
    }
  }

  void Progress(const std::shared_ptr<Job> &job, const ProfileId &member,
                MemberState state) {
    if (job->silenced.load()) {
      return;
    }
    ProgressFn fn;
    {
      std::lock_guard<std::mutex> lk(mu_);
      fn = progress_;
    }
    if (fn) {
      fn(member, state);
    }
  }

  void Finish(const std::shared_ptr<Job> &job, const LaunchReport &report) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      phase_ = LaunchPhase::Completed;
      if (job_ == job) {
        job_.reset();
      }
    }
    if (job->done) {
      job->done(report);
    }
  }

  void SetPhase(LaunchPhase p) {
    std::lock_guard<std::mutex> lk(mu_);
    phase_ = p;
  }

  net::io_context &ioc_;
  SessionConnector &connector_;
  SessionRegistry &registry_;
  const profiles::IProfileStore &store_;
  IWindowPresenter *presenter_;
  IDiagnosticsSink &diag_;
  GroupConfig cfg_;
  Millis settle_delay_;
  mutable std::mutex mu_;
  std::shared_ptr<Job> job_;
  LaunchPhase phase_ = LaunchPhase::Idle;
  ProgressFn progress_;
};

} // namespace group
