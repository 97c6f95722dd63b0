#pragma once

#include "core/errors.hpp"
#include "core/types.hpp"
#include <optional>

// IHealthMonitor: the slice of the resilience monitor the session registry
// drives from its lifecycle effects.
class IHealthMonitor {
public:
  virtual ~IHealthMonitor() = default;
  virtual void Register(const ProfileId &profile) = 0;
  virtual void Unregister(const ProfileId &profile) = 0;
  virtual void ReportStatus(const ProfileId &profile, HealthStatus status,
                            std::optional<Error> error = std::nullopt) = 0;
};
