#pragma once

#include "core/config/service_config.hpp"
#include "core/logging/logger.hpp"
#include "device/device_adapter.hpp"
#include "device/device_executor.hpp"
#include "exclusive/exclusive_operation.hpp"
#include "exclusive/operation_result.hpp"
#include "settings/settings_store.hpp"
#include "streaming/streaming_engine.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace scopecam::exclusive {

struct CoordinatorOptions {
  core::config::ExclusiveTimings timings;
  std::filesystem::path capture_dir = "captures";
  int snapshot_jpeg_quality = 95;
  // Frame size if the device reports no geometry.
  std::uint32_t fallback_width = 1280;
  std::uint32_t fallback_height = 1024;
};

// Serializes operations that need sole control of the device.
//
// Every operation runs the same bracket:
// - fail with BUSY when another one is in flight (that one is unaffected)
// - pause the streaming engine (held until the operation ends)
// - make sure the hardware stream runs
// - execute, then resume the engine
//
// `CancelVideo` is the only call allowed to overlap a running operation.
class ExclusiveCoordinator {
public:
  ExclusiveCoordinator(device::IDeviceAdapter& adapter, device::DeviceExecutor& executor,
                       streaming::StreamingEngine& engine, settings::SettingsStore& settings,
                       core::logging::Logger& logger, CoordinatorOptions options);
  ~ExclusiveCoordinator();

  ExclusiveCoordinator(const ExclusiveCoordinator&) = delete;
  ExclusiveCoordinator& operator=(const ExclusiveCoordinator&) = delete;

  OperationResult RunExclusive(const ExclusiveOperation& operation);

  // Stops the hardware stream to end an in-flight recording early; the
  // recording still waits for the clip callback and delivers what was
  // captured. Returns false when no recording is running.
  bool CancelVideo();

  bool busy() const {
    return busy_.load(std::memory_order_acquire);
  }

  // Interrupts polling waits so a pending operation fails fast.
  void Shutdown();

private:
  OperationResult RunSnapshot(const Snapshot& snapshot);
  OperationResult RunVideo(const VideoRecording& video);
  OperationResult RunAutoExposureOnce();
  OperationResult RunAutoExposureContinuous(const AutoExposureContinuous& request);
  OperationResult RunSettingsChange(const SettingsChange& change);

  bool EnsureHardwareStream(device::DeviceStatus& status, std::string& error);

  // Sleeps up to `duration`; false when shutdown interrupted the wait.
  bool WaitForPoll(std::chrono::milliseconds duration);

  device::IDeviceAdapter& adapter_;
  device::DeviceExecutor& executor_;
  streaming::StreamingEngine& engine_;
  settings::SettingsStore& settings_;
  core::logging::Logger& logger_;
  CoordinatorOptions options_;

  std::mutex exclusive_mu_;
  std::atomic<bool> busy_{false};

  std::mutex video_mu_;
  std::condition_variable video_cv_;
  bool video_active_ = false;
  bool clip_done_ = false;
  bool video_cancel_requested_ = false;
  device::ClipCompletion clip_completion_;
  // Intermediate of a recording that timed out; the late callback removes it.
  std::filesystem::path abandoned_intermediate_;

  std::mutex stop_mu_;
  std::condition_variable stop_cv_;
  bool stopping_ = false;
};

} // namespace scopecam::exclusive
