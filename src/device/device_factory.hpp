#pragma once

#include "core/config/service_config.hpp"
#include "core/logging/logger.hpp"
#include "device/device_session.hpp"

#include <string>
#include <string_view>

namespace scopecam::device {

// Returns whether the hardware adapter is compiled into this build.
bool IsHardwareAdapterEnabledAtBuild();

// Human-readable status text for `health` and `version`.
std::string_view HardwareAdapterAvailabilityStatusText();

struct OpenedDevice {
  DeviceSession session;
  bool simulated = false;
  // Populated when the hardware path was tried and failed.
  std::string fallback_reason;
};

// Opens the one device for this process.
// - `force_simulated` or a build without the vendor SDK: simulated device
// - otherwise the hardware adapter; on DeviceUnavailable the simulated
//   device is opened instead and the reason is logged
// Fails only when no source at all could be opened.
bool OpenConfiguredDevice(const core::config::ServiceConfig& config,
                          core::logging::Logger& logger, OpenedDevice& opened,
                          std::string& error);

} // namespace scopecam::device
