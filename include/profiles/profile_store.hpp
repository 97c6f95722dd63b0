#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace profiles {

struct ProfileRecord {
  ProfileId id;
  std::string displayName;
  std::string host;
  std::uint16_t port = 5900;
  std::string username;
  std::string password;
  std::string sshHost;
  std::uint16_t sshPort = 22;
  std::string sshUsername;
  std::string sshPassword;
  bool otpRequired = false;

  bool UsesTunnel() const {
    return !boost::algorithm::trim_copy(sshHost).empty();
  }
  Endpoint Target() const { return Endpoint{host, port}; }
  Endpoint SshServer() const { return Endpoint{sshHost, sshPort}; }
};

// Read-only lookup used by the connect sequence and group validation.
class IProfileStore {
public:
  virtual ~IProfileStore() = default;
  virtual std::optional<ProfileRecord> Lookup(const ProfileId &id) const = 0;
};

class MemoryProfileStore : public IProfileStore {
public:
  void Put(ProfileRecord record) {
    std::lock_guard<std::mutex> lk(mu_);
    records_[record.id] = std::move(record);
  }

  std::optional<ProfileRecord> Lookup(const ProfileId &id) const override {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(id);
    if (it == records_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<ProfileId> Ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<ProfileId> out;
    out.reserve(records_.size());
    for (const auto &[id, _] : records_) {
      out.push_back(id);
    }
    return out;
  }

private:
  mutable std::mutex mu_;
  std::unordered_map<ProfileId, ProfileRecord> records_;
};

// Parses "id,host,port[,sshHost,sshPort,sshUser]" as given on the command
// line.
inline std::optional<ProfileRecord> ParseProfileSpec(const std::string &spec) {
  std::vector<std::string> parts;
  boost::algorithm::split(parts, spec, [](char c) { return c == ','; });
  for (auto &p : parts) {
    boost::algorithm::trim(p);
  }
  if (parts.size() < 3 || parts[0].empty() || parts[1].empty()) {
    return std::nullopt;
  }
  auto port = config::ParseUnsigned(parts[2]);
  if (!port || *port == 0 || *port > 65535) {
    return std::nullopt;
  }
  ProfileRecord r;
  r.id = ProfileId{parts[0]};
  r.displayName = parts[0];
  r.host = parts[1];
  r.port = static_cast<std::uint16_t>(*port);
  if (parts.size() >= 4 && !parts[3].empty()) {
    r.sshHost = parts[3];
    r.otpRequired = true;
    if (parts.size() >= 5) {
      auto sshPort = config::ParseUnsigned(parts[4]);
      if (!sshPort || *sshPort == 0 || *sshPort > 65535) {
        return std::nullopt;
      }
      r.sshPort = static_cast<std::uint16_t>(*sshPort);
    }
    if (parts.size() >= 6) {
      r.sshUsername = parts[5];
    }
  }
  return r;
}

} // namespace profiles
