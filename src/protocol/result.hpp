#pragma once

#include <optional>
#include <string>
#include <utility>

namespace ard8088 {

enum class ErrorCode {
  Ok,
  ProtocolUsage,    // Payload or argument rejected locally; nothing was sent
  TransportTimeout, // Fewer reply bytes than expected before the read timeout
  DeviceRejected,   // Board answered with the failure status byte
  OutOfSync,        // Trailing byte was neither status marker; resync has run
  TransportError    // Write failed or the transport is closed
};

inline const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "ok";
  case ErrorCode::ProtocolUsage:
    return "protocol_usage";
  case ErrorCode::TransportTimeout:
    return "transport_timeout";
  case ErrorCode::DeviceRejected:
    return "device_rejected";
  case ErrorCode::OutOfSync:
    return "out_of_sync";
  case ErrorCode::TransportError:
    return "transport_error";
  }
  return "unknown";
}

// -----------------------------
// Status type
// -----------------------------

struct Status {
  ErrorCode code = ErrorCode::Ok;
  std::string message = "ok";

  bool ok() const { return code == ErrorCode::Ok; }
};

static inline Status ok() { return {ErrorCode::Ok, "ok"}; }
static inline Status usage(const std::string &m) {
  return {ErrorCode::ProtocolUsage, m};
}
static inline Status timed_out(const std::string &m) {
  return {ErrorCode::TransportTimeout, m};
}
static inline Status rejected(const std::string &m) {
  return {ErrorCode::DeviceRejected, m};
}
static inline Status out_of_sync(const std::string &m) {
  return {ErrorCode::OutOfSync, m};
}
static inline Status io_error(const std::string &m) {
  return {ErrorCode::TransportError, m};
}

// Parsed value of a typed operation, present only when status is ok.
template <typename T> struct Result {
  Status status;
  std::optional<T> value;

  bool ok() const { return status.ok() && value.has_value(); }

  const T &operator*() const { return *value; }
  const T *operator->() const { return &*value; }

  static Result success(T v) { return Result{ard8088::ok(), std::move(v)}; }
  static Result failure(Status s) { return Result{std::move(s), std::nullopt}; }
};

} // namespace ard8088
