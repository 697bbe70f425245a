#include "core/errors/error_kind.hpp"

#include <cctype>
#include <string>

namespace scopecam::core::errors {

namespace {

std::string CollapseWhitespace(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool previous_was_space = true;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!previous_was_space) {
        normalized.push_back(' ');
      }
      previous_was_space = true;
      continue;
    }
    normalized.push_back(c);
    previous_was_space = false;
  }
  while (!normalized.empty() && normalized.back() == ' ') {
    normalized.pop_back();
  }
  return normalized;
}

} // namespace

std::string_view ToStableCode(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "OK";
  case ErrorKind::kDeviceUnavailable:
    return "DEVICE_UNAVAILABLE";
  case ErrorKind::kTransient:
    return "TRANSIENT";
  case ErrorKind::kFatal:
    return "FATAL";
  case ErrorKind::kUnsupported:
    return "UNSUPPORTED";
  case ErrorKind::kBusy:
    return "BUSY";
  case ErrorKind::kTimeout:
    return "TIMEOUT";
  case ErrorKind::kClientSendFailure:
    return "CLIENT_SEND_FAILURE";
  case ErrorKind::kInvalidArgument:
    return "INVALID_ARGUMENT";
  case ErrorKind::kIo:
    return "IO_ERROR";
  }
  return "UNKNOWN";
}

std::string BuildActionableMessage(const ErrorKind kind, std::string_view operation) {
  const std::string label = operation.empty() ? "requested operation" : std::string(operation);

  switch (kind) {
  case ErrorKind::kNone:
    return label + " succeeded";
  case ErrorKind::kDeviceUnavailable:
    return "Camera is unavailable for " + label +
           "; verify power/cable and serial selector, the simulated source is used meanwhile.";
  case ErrorKind::kTransient:
    return "Camera returned a transient error during " + label + "; retry the request.";
  case ErrorKind::kFatal:
    return "Camera failed during " + label + "; check the device connection and vendor logs.";
  case ErrorKind::kUnsupported:
    return "This camera does not support the feature needed for " + label + ".";
  case ErrorKind::kBusy:
    return "Another exclusive camera operation is running; retry " + label +
           " after it completes.";
  case ErrorKind::kTimeout:
    return "Camera did not complete " + label + " in time; check exposure and frame rate.";
  case ErrorKind::kClientSendFailure:
    return "A stream client could not receive data and was disconnected.";
  case ErrorKind::kInvalidArgument:
    return "Invalid arguments for " + label + "; review the requested values.";
  case ErrorKind::kIo:
    return "Filesystem error during " + label + "; verify the capture directory is writable.";
  }
  return "Unexpected failure during " + label + ".";
}

std::string FormatError(const ErrorKind kind, std::string_view operation,
                        std::string_view detail) {
  std::string formatted =
      std::string(ToStableCode(kind)) + ": " + BuildActionableMessage(kind, operation);
  const std::string collapsed = CollapseWhitespace(detail);
  if (!collapsed.empty()) {
    formatted += " detail: " + collapsed;
  }
  return formatted;
}

} // namespace scopecam::core::errors
