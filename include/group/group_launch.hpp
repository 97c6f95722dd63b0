#pragma once

#include "core/errors.hpp"
#include "core/iwindow_presenter.hpp"
#include "core/types.hpp"
#include "profiles/profile_store.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace group {

struct Group {
  std::string id;
  std::string name;
  std::vector<ProfileId> members;
};

enum class LaunchPhase : std::uint8_t {
  Idle,
  Preparing,
  AwaitingOtp,
  Connecting,
  Completed,
};

inline std::string_view ToString(LaunchPhase p) {
  switch (p) {
  case LaunchPhase::Idle:
    return "Idle";
  case LaunchPhase::Preparing:
    return "Preparing";
  case LaunchPhase::AwaitingOtp:
    return "AwaitingOtp";
  case LaunchPhase::Connecting:
    return "Connecting";
  case LaunchPhase::Completed:
    return "Completed";
  }
  return "Unknown";
}

enum class MemberState : std::uint8_t { Pending, Connecting, Connected, Failed };

inline std::string_view ToString(MemberState s) {
  switch (s) {
  case MemberState::Pending:
    return "Pending";
  case MemberState::Connecting:
    return "Connecting";
  case MemberState::Connected:
    return "Connected";
  case MemberState::Failed:
    return "Failed";
  }
  return "Unknown";
}

struct MemberResult {
  ProfileId profile;
  MemberState state = MemberState::Pending;
  std::optional<Error> error;
};

struct Aggregate {
  enum class Kind : std::uint8_t { AllSucceeded, PartialSuccess, AllFailed };
  Kind kind = Kind::AllFailed;
  std::size_t connected = 0;
  std::size_t failed = 0;

  std::string ToString() const {
    switch (kind) {
    case Kind::AllSucceeded:
      return "AllSucceeded";
    case Kind::PartialSuccess:
      return "PartialSuccess(" + std::to_string(connected) + "," +
             std::to_string(failed) + ")";
    case Kind::AllFailed:
      return "AllFailed";
    }
    return "Unknown";
  }
};

struct LaunchReport {
  std::string groupId;
  std::vector<MemberResult> members;
  std::optional<Aggregate> aggregate; // absent when aborted before fan-out
  bool cancelled = false;
  std::optional<Error> error;

  std::vector<ProfileId> Connected() const {
    std::vector<ProfileId> out;
    for (const auto &m : members) {
      if (m.state == MemberState::Connected) {
        out.push_back(m.profile);
      }
    }
    return out;
  }
};

// Members still Pending or Connecting count as failed.
inline Aggregate Classify(const std::vector<MemberResult> &members) {
  Aggregate a;
  for (const auto &m : members) {
    if (m.state == MemberState::Connected) {
      ++a.connected;
    } else {
      ++a.failed;
    }
  }
  if (a.connected > 0 && a.failed == 0) {
    a.kind = Aggregate::Kind::AllSucceeded;
  } else if (a.connected > 0) {
    a.kind = Aggregate::Kind::PartialSuccess;
  } else {
    a.kind = Aggregate::Kind::AllFailed;
  }
  return a;
}

inline GridLayout RecommendedLayout(std::size_t count) {
  switch (count) {
  case 0:
  case 1:
    return {"1x1", 1, 1};
  case 2:
    return {"2x1", 1, 2};
  case 3:
    return {"3x1", 1, 3};
  case 4:
    return {"2x2", 2, 2};
  case 5:
  case 6:
    return {"3x2", 2, 3};
  case 7:
  case 8:
  case 9:
    return {"3x3", 3, 3};
  default:
    break;
  }
  const auto cols = static_cast<int>(
      std::ceil(std::sqrt(static_cast<double>(count))));
  const auto rows = static_cast<int>((count + cols - 1) / cols);
  return {"grid", rows, cols};
}

// True when any member tunnels through an SSH host; one OTP then serves
// the whole group.
inline bool RequiresSharedOtp(const std::vector<ProfileId> &members,
                              const profiles::IProfileStore &store) {
  for (const auto &m : members) {
    auto r = store.Lookup(m);
    if (r && r->UsesTunnel()) {
      return true;
    }
  }
  return false;
}

inline Status ValidateGroup(const Group &g,
                            const profiles::IProfileStore &store) {
  if (boost::algorithm::trim_copy(g.name).empty()) {
    return MakeError(ErrorKind::InvalidProfile, "group name is required");
  }
  if (g.members.empty()) {
    return MakeError(ErrorKind::InvalidProfile,
                     "group must have at least one member");
  }
  for (const auto &m : g.members) {
    auto r = store.Lookup(m);
    if (!r) {
      return MakeError(ErrorKind::InvalidProfile,
                       "unknown member profile " + m.str());
    }
    if (boost::algorithm::trim_copy(r->host).empty()) {
      return MakeError(ErrorKind::InvalidProfile,
                       "member " + m.str() + " has no host");
    }
  }
  return {};
}

} // namespace group
