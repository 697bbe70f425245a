#pragma once

#include "capture/frame.hpp"
#include "core/config/service_config.hpp"
#include "core/logging/logger.hpp"
#include "device/device_adapter.hpp"
#include "device/device_executor.hpp"
#include "streaming/client_registry.hpp"
#include "streaming/task_supervisor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace scopecam::streaming {

enum class StreamState {
  kIdle = 0,
  kStarting,
  kActive,
  kPaused,
  kStopping,
};

const char* ToString(StreamState state);

struct StreamingEngineOptions {
  core::config::EngineTimings timings;
  int jpeg_quality = 85;
  // Frame size used when no adapter is present.
  std::uint32_t synthetic_width = 1280;
  std::uint32_t synthetic_height = 1024;
  std::uint64_t status_log_every_frames = 300;
  std::size_t supervisor_threads = 2;
};

// Continuous broadcast of the latest frame to every registered client.
//
// State machine:
//   Idle -> Starting -> Active <-> Paused
//   Starting/Active/Paused -> Stopping -> Idle
//
// Registry membership alone starts and stops streaming. `AddClient` and
// `RemoveClient` never touch the device: the start is a job submitted to the
// engine's TaskSupervisor, and teardown runs on that job when the run loop
// observes an empty registry. `StopStream` is issued exactly once per
// successful start, from a scope guard on the loop job.
class StreamingEngine {
public:
  // `adapter` may be null; frames are then synthetic.
  StreamingEngine(device::IDeviceAdapter* adapter, device::DeviceExecutor& executor,
                  core::logging::Logger& logger, StreamingEngineOptions options = {});
  ~StreamingEngine();

  StreamingEngine(const StreamingEngine&) = delete;
  StreamingEngine& operator=(const StreamingEngine&) = delete;

  void AddClient(const ClientRegistry::SinkPtr& sink);
  void RemoveClient(const ClientRegistry::SinkPtr& sink);

  // Active -> Paused (an in-progress start is allowed to settle first).
  // Returns once no acquisition is in flight, bounded by the pause grace.
  // Returns false when the engine is neither Active nor Paused.
  //
  // Also places a hold until `Resume`: a start that completes while held
  // goes straight from Active to Paused, a start requested while held waits
  // before calling StartStream, and an emptied registry does not stop the
  // stream until the hold is released. The run loop never issues device
  // calls inside an exclusive window.
  bool Pause();

  // Releases the hold; Paused -> Active. Returns false when the engine was
  // not Paused.
  bool Resume();

  // Most recent encoded frame, or null before the first one.
  std::shared_ptr<const capture::EncodedFrame> GetCurrentFrame() const;

  StreamState state() const;
  std::size_t client_count() const;

  bool WaitForState(StreamState target, std::chrono::milliseconds timeout) const;

  // Cancels the loop, runs teardown and joins the supervisor. Idempotent.
  void Shutdown();

  struct Stats {
    std::uint64_t starts = 0;
    std::uint64_t stops = 0;
    std::uint64_t frames_broadcast = 0;
    std::uint64_t acquisition_failures = 0;
    std::uint64_t clients_pruned = 0;
  };

  Stats stats() const;

private:
  enum class LoopExit {
    kRegistryEmpty,
    kFatal,
    kCancelled,
  };

  class TeardownGuard;

  void SubmitStart();
  void Start();
  LoopExit RunLoop();
  void Broadcast(const capture::EncodedFrame& encoded);

  // Sleeps up to `duration`; returns false when the loop must exit.
  bool WaitInterruptible(std::chrono::steady_clock::duration duration);
  bool ShouldExitLocked() const;

  void SetStateLocked(StreamState next);

  device::IDeviceAdapter* adapter_;
  device::DeviceExecutor& executor_;
  core::logging::Logger& logger_;
  StreamingEngineOptions options_;

  ClientRegistry registry_;

  mutable std::mutex state_mu_;
  mutable std::condition_variable state_cv_;
  StreamState state_ = StreamState::kIdle;
  bool acquire_in_flight_ = false;
  bool hold_ = false;
  bool shutdown_ = false;
  Stats stats_;

  // Checked by frame acquisition between device calls.
  std::atomic<bool> acquire_cancel_{false};

  mutable std::mutex frame_mu_;
  std::shared_ptr<const capture::EncodedFrame> latest_frame_;

  // Declared last: its jobs use every member above.
  TaskSupervisor supervisor_;
};

} // namespace scopecam::streaming
