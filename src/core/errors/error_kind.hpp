#pragma once

#include <string>
#include <string_view>

namespace scopecam::core::errors {

// Service-wide failure classification.
//
// Device adapters, acquisition, the streaming engine and the exclusive
// coordinator all report through this one taxonomy so callers can branch on
// a stable code instead of parsing vendor text.
enum class ErrorKind {
  kNone = 0,
  kDeviceUnavailable,
  kTransient,
  kFatal,
  kUnsupported,
  kBusy,
  kTimeout,
  kClientSendFailure,
  kInvalidArgument,
  kIo,
};

// Grep-friendly code, e.g. "DEVICE_UNAVAILABLE".
std::string_view ToStableCode(ErrorKind kind);

// Human guidance for one failure kind. `operation` is a short label such as
// "snapshot" or "auto_exposure".
std::string BuildActionableMessage(ErrorKind kind, std::string_view operation);

// Single-line contract text:
//   "<STABLE_CODE>: <actionable_message> detail: <raw_detail>"
// The detail suffix is omitted when `detail` is empty.
std::string FormatError(ErrorKind kind, std::string_view operation, std::string_view detail);

} // namespace scopecam::core::errors
