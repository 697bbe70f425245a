#pragma once

#include "core/errors/error_kind.hpp"
#include "core/logging/logger.hpp"
#include "device/device_adapter.hpp"
#include "device/device_executor.hpp"
#include "settings/capture_settings.hpp"

#include <mutex>
#include <string>

namespace scopecam::settings {

// Authoritative copy of the sensor settings.
//
// Reads are lock-protected snapshots. Writes clamp to the bounds queried in
// `LoadFromDevice`, go to the device through the executor and are stored
// only once the device accepted them. A rejected write keeps the previous
// value and is reported to the caller.
//
// Callers that write must hold exclusive device access (the coordinator).
class SettingsStore {
public:
  SettingsStore(device::IDeviceAdapter& adapter, device::DeviceExecutor& executor,
                core::logging::Logger& logger);

  SettingsStore(const SettingsStore&) = delete;
  SettingsStore& operator=(const SettingsStore&) = delete;

  // Queries bounds, current values, auto-exposure support and geometry.
  // Unsupported features are recorded as such rather than failing the load.
  bool LoadFromDevice(std::string& error);

  CaptureSettings Get() const;

  // Applies every present field. Fields are independent: one rejected field
  // does not roll back the others. Returns false (with `failure_kind`) when
  // any field failed; `applied` always holds the resulting settings.
  bool Update(const SettingsUpdate& update, CaptureSettings& applied,
              core::errors::ErrorKind& failure_kind, std::string& error);

  double Clamp(device::Feature feature, double value) const;

  // Records values the device chose itself (OnePush / Auto results).
  void RecordExposure(double exposure_ms);
  void RecordAutoExposure(bool enabled);

private:
  bool ApplyFeature(device::Feature feature, double requested, double& stored,
                    core::errors::ErrorKind& failure_kind, std::string& error);

  device::IDeviceAdapter& adapter_;
  device::DeviceExecutor& executor_;
  core::logging::Logger& logger_;

  mutable std::mutex mu_;
  CaptureSettings settings_;
};

} // namespace scopecam::settings
