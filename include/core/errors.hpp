#pragma once

#include <algorithm>
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// Error taxonomy shared by every component. Operations return
// std::expected<T, Error>; nothing on these paths throws.
enum class ErrorKind : std::uint8_t {
  PortExhausted,
  TunnelFailed,
  AuthFailed,
  NetworkUnreachable,
  ProtocolError,
  Timeout,
  Cancelled,
  InvalidProfile,
  Busy,
};

inline std::string_view ToString(ErrorKind k) {
  switch (k) {
  case ErrorKind::PortExhausted:
    return "PortExhausted";
  case ErrorKind::TunnelFailed:
    return "TunnelFailed";
  case ErrorKind::AuthFailed:
    return "AuthFailed";
  case ErrorKind::NetworkUnreachable:
    return "NetworkUnreachable";
  case ErrorKind::ProtocolError:
    return "ProtocolError";
  case ErrorKind::Timeout:
    return "Timeout";
  case ErrorKind::Cancelled:
    return "Cancelled";
  case ErrorKind::InvalidProfile:
    return "InvalidProfile";
  case ErrorKind::Busy:
    return "Busy";
  }
  return "Unknown";
}

struct Error {
  ErrorKind kind = ErrorKind::ProtocolError;
  // Raw text from the collaborator that produced the error, kept for
  // diagnostics only.
  std::string detail;

  std::string ToString() const {
    std::string s{::ToString(kind)};
    if (!detail.empty()) {
      s += ": ";
      s += detail;
    }
    return s;
  }
};

template <typename T> using Result = std::expected<T, Error>;
using Status = std::expected<void, Error>;

inline std::unexpected<Error> MakeError(ErrorKind kind, std::string detail = {}) {
  return std::unexpected(Error{kind, std::move(detail)});
}

// Transient conditions the resilience monitor may retry.
inline bool IsTransient(ErrorKind k) {
  return k == ErrorKind::NetworkUnreachable || k == ErrorKind::Timeout;
}

namespace errors {

namespace detail {
inline std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

inline bool Contains(const std::string &haystack, std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}
} // namespace detail

// Free-text classification for collaborators that only hand back a message.
// Order matters: "timeout" wins over "network timeout".
inline ErrorKind ClassifyText(std::string_view text,
                              ErrorKind fallback = ErrorKind::ProtocolError) {
  const std::string t = detail::Lower(text);
  if (detail::Contains(t, "timeout") || detail::Contains(t, "timed out")) {
    return ErrorKind::Timeout;
  }
  if (detail::Contains(t, "refused")) {
    return ErrorKind::NetworkUnreachable;
  }
  if (detail::Contains(t, "authentication") ||
      detail::Contains(t, "password") || detail::Contains(t, "otp")) {
    return ErrorKind::AuthFailed;
  }
  if (detail::Contains(t, "network") || detail::Contains(t, "unreachable") ||
      detail::Contains(t, "no route")) {
    return ErrorKind::NetworkUnreachable;
  }
  if (detail::Contains(t, "protocol")) {
    return ErrorKind::ProtocolError;
  }
  if (detail::Contains(t, "cancel") || detail::Contains(t, "aborted")) {
    return ErrorKind::Cancelled;
  }
  return fallback;
}

inline Error FromErrorCode(const boost::system::error_code &ec,
                           ErrorKind fallback = ErrorKind::ProtocolError) {
  namespace aerr = boost::asio::error;
  ErrorKind kind = fallback;
  if (ec == aerr::timed_out) {
    kind = ErrorKind::Timeout;
  } else if (ec == aerr::operation_aborted) {
    kind = ErrorKind::Cancelled;
  } else if (ec == aerr::connection_refused || ec == aerr::host_unreachable ||
             ec == aerr::network_unreachable || ec == aerr::network_down ||
             ec == aerr::host_not_found || ec == aerr::host_not_found_try_again ||
             ec == aerr::connection_reset || ec == aerr::connection_aborted ||
             ec == aerr::eof) {
    kind = ErrorKind::NetworkUnreachable;
  } else {
    kind = ClassifyText(ec.message(), fallback);
  }
  return Error{kind, ec.message()};
}

// User-facing message attached to a terminal failure. Refusals are reported
// as NetworkUnreachable but keep their own wording.
inline std::string UserMessage(const Error *err) {
  if (err == nullptr) {
    return "Connection lost. Please check your network connection and try "
           "again.";
  }
  switch (err->kind) {
  case ErrorKind::Timeout:
    return "Connection timed out. The remote server may be busy or "
           "unreachable.";
  case ErrorKind::NetworkUnreachable:
    if (detail::Contains(detail::Lower(err->detail), "refused")) {
      return "Connection refused. The remote server may not be running or "
             "may be blocking connections.";
    }
    return "Network error. No route to host; please check your network "
           "connection.";
  case ErrorKind::AuthFailed:
    return "Authentication failed. Please check your password and OTP and "
           "try again.";
  case ErrorKind::ProtocolError:
    return "Protocol error. The remote server may be using an incompatible "
           "version.";
  case ErrorKind::TunnelFailed:
    return "Secure tunnel failed. Please check the SSH host settings.";
  case ErrorKind::PortExhausted:
    return "No available local ports found for the tunnel.";
  case ErrorKind::Cancelled:
    return "Connection cancelled.";
  case ErrorKind::InvalidProfile:
  case ErrorKind::Busy:
    break;
  }
  return "Connection lost. Please check your network connection and try "
         "again.";
}

inline std::string UserMessage(const Error &err) { return UserMessage(&err); }

} // namespace errors
