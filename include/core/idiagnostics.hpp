#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include <string_view>

// IDiagnosticsSink: leveled, correlated trace events. Fire-and-forget:
// implementations must not block the caller or report failure to it.
class IDiagnosticsSink {
public:
  virtual ~IDiagnosticsSink() = default;
  virtual void Emit(const ProfileId &profile, LogLevel level,
                    std::string_view phase, std::string_view message) = 0;
  // Starts a new correlation scope for one connection attempt.
  virtual void BeginAttempt(const ProfileId &profile) { (void)profile; }
};

// Discards everything; used where a component is built without diagnostics.
class NullDiagnostics : public IDiagnosticsSink {
public:
  void Emit(const ProfileId &, LogLevel, std::string_view,
            std::string_view) override {}
};
