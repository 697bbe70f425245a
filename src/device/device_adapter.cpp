#include "device/device_adapter.hpp"

namespace scopecam::device {

const char* ToString(const DeviceStatus status) {
  switch (status) {
  case DeviceStatus::kOk:
    return "ok";
  case DeviceStatus::kAlreadyInState:
    return "already_in_state";
  case DeviceStatus::kTransient:
    return "transient";
  case DeviceStatus::kFatal:
    return "fatal";
  case DeviceStatus::kNotFound:
    return "not_found";
  case DeviceStatus::kUnsupported:
    return "unsupported";
  }
  return "fatal";
}

core::errors::ErrorKind ToErrorKind(const DeviceStatus status) {
  using core::errors::ErrorKind;
  switch (status) {
  case DeviceStatus::kOk:
  case DeviceStatus::kAlreadyInState:
    return ErrorKind::kNone;
  case DeviceStatus::kTransient:
    return ErrorKind::kTransient;
  case DeviceStatus::kNotFound:
    return ErrorKind::kDeviceUnavailable;
  case DeviceStatus::kUnsupported:
    return ErrorKind::kUnsupported;
  case DeviceStatus::kFatal:
  default:
    return ErrorKind::kFatal;
  }
}

const char* ToString(const Feature feature) {
  switch (feature) {
  case Feature::kExposure:
    return "exposure";
  case Feature::kGain:
    return "gain";
  case Feature::kGamma:
    return "gamma";
  case Feature::kFrameRate:
    return "frame_rate";
  }
  return "unknown";
}

const char* ToString(const FeatureMode mode) {
  switch (mode) {
  case FeatureMode::kManual:
    return "manual";
  case FeatureMode::kAuto:
    return "auto";
  case FeatureMode::kOnePush:
    return "one_push";
  }
  return "manual";
}

} // namespace scopecam::device
