#include "device/device_factory.hpp"

#include "core/errors/error_kind.hpp"
#include "device/hardware/pixelink_device.hpp"
#include "device/sim/simulated_device.hpp"

#include <memory>
#include <utility>

namespace scopecam::device {

namespace {

sim::SimulatedDeviceOptions BuildSimulatedOptions(const core::config::ServiceConfig& config) {
  sim::SimulatedDeviceOptions options;
  options.width = config.simulated_width;
  options.height = config.simulated_height;
  options.frame_rate_fps = config.simulated_frame_rate_fps;
  return options;
}

bool OpenSimulated(const core::config::ServiceConfig& config, core::logging::Logger& logger,
                   OpenedDevice& opened, std::string& error) {
  DeviceSession session(std::make_unique<sim::SimulatedDevice>(BuildSimulatedOptions(config)));
  const DeviceStatus status = session.Open(config.camera_serial, error);
  if (!IsSuccess(status)) {
    logger.Error("simulated device failed to open", {{"status", ToString(status)},
                                                     {"error", error}});
    return false;
  }

  opened.session = std::move(session);
  opened.simulated = true;
  logger.Info("simulated device opened",
              {{"width", std::to_string(config.simulated_width)},
               {"height", std::to_string(config.simulated_height)}});
  return true;
}

} // namespace

bool IsHardwareAdapterEnabledAtBuild() {
  return hardware::IsPixelinkSupportCompiled();
}

std::string_view HardwareAdapterAvailabilityStatusText() {
  return IsHardwareAdapterEnabledAtBuild() ? "enabled" : "disabled (built without vendor SDK)";
}

bool OpenConfiguredDevice(const core::config::ServiceConfig& config,
                          core::logging::Logger& logger, OpenedDevice& opened,
                          std::string& error) {
  opened = OpenedDevice{};
  error.clear();

  if (config.force_simulated || !IsHardwareAdapterEnabledAtBuild()) {
    if (!config.force_simulated) {
      opened.fallback_reason = std::string(HardwareAdapterAvailabilityStatusText());
    }
    return OpenSimulated(config, logger, opened, error);
  }

  DeviceSession session(std::make_unique<hardware::PixelinkDevice>());
  std::string hardware_error;
  const DeviceStatus status = session.Open(config.camera_serial, hardware_error);
  if (IsSuccess(status)) {
    opened.session = std::move(session);
    opened.simulated = false;
    logger.Info("camera opened",
                {{"serial", config.camera_serial.empty() ? "first" : config.camera_serial}});
    return true;
  }

  opened.fallback_reason = hardware_error;
  logger.Warn("camera unavailable; falling back to simulated device",
              {{"code", core::errors::ToStableCode(ToErrorKind(status))},
               {"serial", config.camera_serial.empty() ? "first" : config.camera_serial},
               {"error", hardware_error}});
  return OpenSimulated(config, logger, opened, error);
}

} // namespace scopecam::device
