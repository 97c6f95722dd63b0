#include "core/config.hpp"
#include "core/control_room.hpp"
#include "group/group_launch.hpp"
#include "logging/log_writer.hpp"
#include "profiles/profile_store.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct Options {
  std::vector<std::string> profiles;
  std::string group;
  std::optional<std::string> otp;
  int seconds = 0; // 0 = until stdin closes
  int threads = 1;
  std::string log_file;
  bool verbose = false;
  std::optional<unsigned> min_port;
  std::optional<unsigned> max_port;
  std::optional<unsigned> health_interval_ms;
};

static Options ParseArgs(int argc, char **argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-p" || a == "--profile") && i + 1 < argc)
      opt.profiles.emplace_back(argv[++i]);
    else if ((a == "-g" || a == "--group") && i + 1 < argc)
      opt.group = argv[++i];
    else if (a == "--otp" && i + 1 < argc)
      opt.otp = argv[++i];
    else if ((a == "-t" || a == "--seconds") && i + 1 < argc)
      opt.seconds = std::max(0, std::atoi(argv[++i]));
    else if ((a == "-n" || a == "--threads") && i + 1 < argc)
      opt.threads = std::max(1, std::atoi(argv[++i]));
    else if ((a == "-o" || a == "--log-file") && i + 1 < argc)
      opt.log_file = argv[++i];
    else if (a == "-v" || a == "--verbose")
      opt.verbose = true;
    else if (a == "--min-port" && i + 1 < argc)
      opt.min_port = config::ParseUnsigned(argv[++i]);
    else if (a == "--max-port" && i + 1 < argc)
      opt.max_port = config::ParseUnsigned(argv[++i]);
    else if (a == "--health-interval-ms" && i + 1 < argc)
      opt.health_interval_ms = config::ParseUnsigned(argv[++i]);
    else
      std::cerr << "ignoring argument: " << a << "\n";
  }
  return opt;
}

static OrchestratorConfig BuildConfig(const Options &opt) {
  OrchestratorConfig cfg;
  config::ApplyEnvironment(cfg);
  if (opt.min_port && opt.max_port && *opt.min_port >= 1024 &&
      *opt.max_port <= 65534 && *opt.min_port <= *opt.max_port) {
    cfg.ports.range.first = static_cast<std::uint16_t>(*opt.min_port);
    cfg.ports.range.last = static_cast<std::uint16_t>(*opt.max_port + 1);
  }
  if (opt.health_interval_ms && *opt.health_interval_ms > 0) {
    cfg.resilience.healthCheckInterval = Millis{*opt.health_interval_ms};
  }
  cfg.reactorThreads = opt.threads;
  cfg.log.minLevel = opt.verbose ? LogLevel::Debug : LogLevel::Info;
  if (!opt.log_file.empty()) {
    cfg.log.file = opt.log_file;
  }
  return cfg;
}

static void PrintReady(ControlRoom &room) {
  std::cout << "ready:";
  for (const auto &p : room.Registry().ActiveProfileIds()) {
    std::cout << ' ' << p;
  }
  std::cout << "\n";
}

static int RunGroup(ControlRoom &room, const profiles::MemoryProfileStore &store,
                    const Options &opt, const std::vector<ProfileId> &ids) {
  group::Group g{opt.group, opt.group, ids};
  std::promise<group::LaunchReport> finished;
  auto report = finished.get_future();
  auto &groups = room.Groups();
  groups.SetProgressObserver([](const ProfileId &p, group::MemberState s) {
    std::cout << "  " << p << ": " << group::ToString(s) << "\n";
  });
  const bool needsOtp = group::RequiresSharedOtp(ids, store);
  auto st = groups.LaunchGroup(g, needsOtp, [&finished](const auto &r) {
    finished.set_value(r);
  });
  if (!st) {
    std::cerr << "group launch refused: " << st.error().ToString() << "\n";
    return 1;
  }
  if (needsOtp) {
    std::string code;
    if (opt.otp) {
      code = *opt.otp;
    } else {
      std::cout << "OTP for group '" << g.name << "': " << std::flush;
      if (!std::getline(std::cin, code)) {
        code.clear();
      }
    }
    if (auto sub = groups.SubmitOtp(code); !sub) {
      std::cerr << "OTP rejected: " << sub.error().ToString() << "\n";
      groups.Cancel();
    }
  }
  const auto r = report.get();
  if (!r.aggregate) {
    std::cout << "group '" << g.name << "' cancelled before connecting\n";
    return 1;
  }
  std::cout << "group '" << g.name << "': " << r.aggregate->ToString()
            << "\n";
  for (const auto &m : r.members) {
    if (m.error) {
      std::cout << "  " << m.profile << ": " << errors::UserMessage(*m.error)
                << " (" << m.error->ToString() << ")\n";
    }
  }
  return r.aggregate->connected > 0 ? 0 : 1;
}

static int RunEach(ControlRoom &room, const Options &opt,
                   const std::vector<ProfileId> &ids) {
  std::mutex mu;
  std::size_t failed = 0;
  std::vector<std::future<void>> waits;
  for (const auto &id : ids) {
    auto p = std::make_shared<std::promise<void>>();
    waits.push_back(p->get_future());
    room.Connector().Spawn(id, opt.otp,
                           [p, &mu, &failed](const ProfileId &who, Status st) {
                             std::lock_guard<std::mutex> lk(mu);
                             if (st) {
                               std::cout << who << ": connected\n";
                             } else {
                               ++failed;
                               std::cout << who << ": "
                                         << errors::UserMessage(st.error())
                                         << " (" << st.error().ToString()
                                         << ")\n";
                             }
                             p->set_value();
                           });
  }
  for (auto &w : waits) {
    w.wait();
  }
  return failed == ids.size() ? 1 : 0;
}

int main(int argc, char **argv) {
  auto opt = ParseArgs(argc, argv);
  profiles::MemoryProfileStore store;
  std::vector<ProfileId> ids;
  for (const auto &spec : opt.profiles) {
    auto record = profiles::ParseProfileSpec(spec);
    if (!record) {
      std::cerr << "Invalid profile (expected id,host,port[,sshHost,sshPort,"
                   "sshUser]): "
                << spec << "\n";
      return 1;
    }
    ids.push_back(record->id);
    store.Put(std::move(*record));
  }
  if (ids.empty()) {
    std::cerr << "usage: controlroom --profile id,host,port[,sshHost,sshPort,"
                 "sshUser] ... [--group NAME] [--otp CODE] [--seconds N]\n";
    return 1;
  }

  auto cfg = BuildConfig(opt);
  std::unique_ptr<logging::LogWriter> writer;
  if (cfg.log.file) {
    writer = logging::LogWriter::ToFile(*cfg.log.file);
    if (!writer) {
      std::cerr << "cannot open log file " << *cfg.log.file << "\n";
      return 1;
    }
  } else {
    writer = std::make_unique<logging::LogWriter>();
  }

  std::cout << "Launching " << ids.size() << " profile(s)"
            << (opt.group.empty() ? std::string()
                                  : " as group '" + opt.group + "'")
            << ", local ports [" << cfg.ports.range.first << ","
            << cfg.ports.range.last << ")\n";

  ControlRoom room(cfg, store, std::move(writer));
  room.Start();
  const int rc = opt.group.empty() ? RunEach(room, opt, ids)
                                   : RunGroup(room, store, opt, ids);
  PrintReady(room);

  if (opt.seconds > 0) {
    std::this_thread::sleep_for(std::chrono::seconds(opt.seconds));
  } else {
    std::string line;
    while (std::getline(std::cin, line)) {
      PrintReady(room);
    }
  }
  room.Shutdown();
  return rc;
}
