#pragma once

#include "core/config/service_config.hpp"
#include "core/logging/logger.hpp"
#include "device/device_executor.hpp"
#include "device/device_factory.hpp"
#include "exclusive/exclusive_coordinator.hpp"
#include "exclusive/operation_result.hpp"
#include "settings/capture_settings.hpp"
#include "settings/settings_store.hpp"
#include "streaming/client_registry.hpp"
#include "streaming/streaming_engine.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace scopecam::service {

enum class AutoExposureRequest {
  kOnce = 0,
  kEnable,
  kDisable,
};

// Accepts "once", "enable"/"on", "disable"/"off".
bool ParseAutoExposureRequest(std::string_view raw, AutoExposureRequest& request,
                              std::string& error);

// Inbound surface of one camera service instance.
//
// Owns the device session, the executor, the settings store, the streaming
// engine and the exclusive coordinator, and tears them down in that reverse
// order. `main` owns exactly one instance; nothing here is global.
class CameraService {
public:
  CameraService(core::config::ServiceConfig config, core::logging::Logger& logger);
  ~CameraService();

  CameraService(const CameraService&) = delete;
  CameraService& operator=(const CameraService&) = delete;

  // Opens the device (simulated fallback included), loads settings and
  // applies the configured default exposure and gain.
  bool Start(std::string& error);

  // Stops streaming, releases the device and joins every worker. Idempotent.
  // Start and Shutdown belong to the owning thread; `started()` may be read
  // from any thread.
  void Shutdown();

  // Sends the connected message and the cached frame (when present), then
  // registers the sink. Returns false when the greeting could not be sent;
  // the sink is not registered in that case.
  bool AddClient(const streaming::ClientRegistry::SinkPtr& sink, std::string& error);
  void RemoveClient(const streaming::ClientRegistry::SinkPtr& sink);

  exclusive::OperationResult RequestCapture(const settings::SettingsUpdate& overrides);
  exclusive::OperationResult RequestVideo(double duration_s, double playback_fps,
                                          std::uint32_t decimation);
  bool CancelVideo();
  exclusive::OperationResult RequestAutoExposure(AutoExposureRequest request);

  settings::CaptureSettings GetSettings() const;
  std::string GetSettingsJson() const;
  exclusive::OperationResult UpdateSettings(const settings::SettingsUpdate& update);

  // {"files":[{"filename","size","modified"}],"count":N,"path":"..."}
  bool ListCaptures(std::string& json, std::string& error) const;

  // {"status","camera_connected","simulated","stream_state","clients","timestamp"}
  std::string Health() const;

  bool started() const {
    return started_.load();
  }
  bool simulated() const {
    return device_.simulated;
  }

  // Test and CLI hooks.
  streaming::StreamingEngine* engine() const {
    return engine_.get();
  }
  device::IDeviceAdapter* adapter() const {
    return device_.session.adapter();
  }

private:
  exclusive::OperationResult NotStarted(std::string_view operation) const;

  core::config::ServiceConfig config_;
  core::logging::Logger& logger_;

  device::OpenedDevice device_;
  std::unique_ptr<device::DeviceExecutor> executor_;
  std::unique_ptr<settings::SettingsStore> settings_;
  std::unique_ptr<streaming::StreamingEngine> engine_;
  std::unique_ptr<exclusive::ExclusiveCoordinator> coordinator_;
  // Read from request threads while Start/Shutdown run on the owner.
  std::atomic<bool> started_{false};
};

} // namespace scopecam::service
