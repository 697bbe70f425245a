#include "streaming/streaming_engine.hpp"

#include "capture/frame_acquisition.hpp"
#include "capture/frame_codec.hpp"
#include "core/errors/error_kind.hpp"
#include "core/time_utils.hpp"
#include "streaming/stream_messages.hpp"

#include <string>
#include <utility>

namespace scopecam::streaming {

const char* ToString(const StreamState state) {
  switch (state) {
  case StreamState::kIdle:
    return "idle";
  case StreamState::kStarting:
    return "starting";
  case StreamState::kActive:
    return "active";
  case StreamState::kPaused:
    return "paused";
  case StreamState::kStopping:
    return "stopping";
  }
  return "idle";
}

// Runs on every exit path of the loop job: Stopping, one StopStream for a
// successful start, then Idle. Re-arms a start when clients joined while
// the engine was going down.
class StreamingEngine::TeardownGuard {
public:
  TeardownGuard(StreamingEngine& engine, bool hardware_started)
      : engine_(engine), hardware_started_(hardware_started) {}

  TeardownGuard(const TeardownGuard&) = delete;
  TeardownGuard& operator=(const TeardownGuard&) = delete;

  ~TeardownGuard() {
    {
      std::unique_lock<std::mutex> lock(engine_.state_mu_);
      if (hardware_started_) {
        // The device belongs to the exclusive operation until it resumes us.
        engine_.state_cv_.wait(lock, [this]() { return !engine_.hold_ || engine_.shutdown_; });
      }
      engine_.SetStateLocked(StreamState::kStopping);
      engine_.acquire_cancel_.store(true, std::memory_order_release);
    }

    if (hardware_started_ && engine_.adapter_ != nullptr) {
      std::string error;
      device::IDeviceAdapter* adapter = engine_.adapter_;
      const device::DeviceStatus status =
          engine_.executor_.Run([adapter, &error]() { return adapter->StopStream(error); });
      if (!device::IsSuccess(status)) {
        engine_.logger_.Warn("stream stop reported failure",
                             {{"status", device::ToString(status)}, {"error", error}});
      }
    }

    bool restart = false;
    {
      std::lock_guard<std::mutex> lock(engine_.state_mu_);
      ++engine_.stats_.stops;
      engine_.SetStateLocked(StreamState::kIdle);
      restart = restart_when_clients_remain && !engine_.shutdown_ && !engine_.registry_.Empty();
    }
    engine_.logger_.Info("stream stopped", {{"clients", std::to_string(engine_.client_count())}});

    if (restart) {
      engine_.logger_.Info("clients joined during teardown; restarting stream");
      engine_.SubmitStart();
    }
  }

  bool restart_when_clients_remain = false;

private:
  StreamingEngine& engine_;
  bool hardware_started_ = false;
};

StreamingEngine::StreamingEngine(device::IDeviceAdapter* adapter,
                                 device::DeviceExecutor& executor,
                                 core::logging::Logger& logger, StreamingEngineOptions options)
    : adapter_(adapter),
      executor_(executor),
      logger_(logger),
      options_(options),
      supervisor_(options.supervisor_threads, logger) {}

StreamingEngine::~StreamingEngine() {
  Shutdown();
}

void StreamingEngine::AddClient(const ClientRegistry::SinkPtr& sink) {
  if (sink == nullptr) {
    return;
  }

  const std::size_t size = registry_.Add(sink);
  bool submit = false;
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    submit = size == 1U && state_ == StreamState::kIdle && !shutdown_;
  }
  logger_.Debug("client added", {{"clients", std::to_string(size)}});
  if (submit) {
    SubmitStart();
  }
}

void StreamingEngine::RemoveClient(const ClientRegistry::SinkPtr& sink) {
  const std::size_t size = registry_.Remove(sink);
  logger_.Debug("client removed", {{"clients", std::to_string(size)}});
  if (size == 0U) {
    // Wakes the loop out of any pacing, pause or failure wait.
    std::lock_guard<std::mutex> lock(state_mu_);
    state_cv_.notify_all();
  }
}

void StreamingEngine::SubmitStart() {
  if (!supervisor_.Submit("stream_start", [this]() { Start(); })) {
    logger_.Warn("stream start not submitted; engine is shutting down");
  }
}

void StreamingEngine::Start() {
  {
    std::unique_lock<std::mutex> lock(state_mu_);
    // No StartStream while an exclusive operation holds the device.
    state_cv_.wait(lock, [this]() { return !hold_ || shutdown_ || registry_.Empty(); });
    if (state_ != StreamState::kIdle || shutdown_ || registry_.Empty()) {
      return;
    }
    ++stats_.starts;
    acquire_cancel_.store(false, std::memory_order_release);
    SetStateLocked(StreamState::kStarting);
  }
  logger_.Info("stream starting", {{"clients", std::to_string(registry_.Size())}});

  device::DeviceStatus status = device::DeviceStatus::kOk;
  std::string error;
  if (adapter_ != nullptr) {
    device::IDeviceAdapter* adapter = adapter_;
    status = executor_.Run([adapter, &error]() { return adapter->StartStream(error); });
  }
  const bool started = device::IsSuccess(status);

  TeardownGuard guard(*this, started);
  if (!started) {
    logger_.Error("stream start failed",
                  {{"code", core::errors::ToStableCode(device::ToErrorKind(status))},
                   {"status", device::ToString(status)},
                   {"error", error}});
    return;
  }

  {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (state_ != StreamState::kStarting || shutdown_) {
      return;
    }
    SetStateLocked(StreamState::kActive);
    if (hold_) {
      // An exclusive operation asked for the device while we were starting.
      acquire_cancel_.store(true, std::memory_order_release);
      SetStateLocked(StreamState::kPaused);
    }
  }
  logger_.Info("stream active",
               {{"already_streaming", status == device::DeviceStatus::kAlreadyInState ? "true"
                                                                                      : "false"},
                {"simulated", adapter_ == nullptr || adapter_->IsSimulated() ? "true" : "false"}});

  const LoopExit exit = RunLoop();
  guard.restart_when_clients_remain = exit == LoopExit::kRegistryEmpty;
}

StreamingEngine::LoopExit StreamingEngine::RunLoop() {
  const auto& timings = options_.timings;
  std::uint64_t frames = 0;

  while (true) {
    {
      std::unique_lock<std::mutex> lock(state_mu_);
      if (shutdown_) {
        return LoopExit::kCancelled;
      }
      if (state_ == StreamState::kPaused) {
        // Paused means held: even an empty registry waits for Resume, so
        // teardown never stops the stream under an exclusive operation.
        state_cv_.wait_for(lock, timings.paused_idle_wait,
                           [this]() { return state_ != StreamState::kPaused || shutdown_; });
        continue;
      }
      if (registry_.Empty()) {
        return LoopExit::kRegistryEmpty;
      }
      if (state_ != StreamState::kActive) {
        return LoopExit::kCancelled;
      }
      acquire_in_flight_ = true;
    }

    const auto iteration_start = std::chrono::steady_clock::now();
    capture::Frame frame;
    const capture::AcquisitionResult acquired =
        capture::AcquireFrame(adapter_, executor_, capture::kStreamingRetryBound,
                              options_.synthetic_width, options_.synthetic_height, frame,
                              &acquire_cancel_);
    const bool cancelled = acquire_cancel_.load(std::memory_order_acquire);
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      acquire_in_flight_ = false;
      if (!acquired.ok() && !cancelled) {
        ++stats_.acquisition_failures;
      }
    }
    state_cv_.notify_all();

    if (!acquired.ok()) {
      if (cancelled) {
        continue;
      }
      if (acquired.status != device::DeviceStatus::kTransient) {
        logger_.Error("frame acquisition failed; ending stream",
                      {{"code", core::errors::ToStableCode(device::ToErrorKind(acquired.status))},
                       {"attempts", std::to_string(acquired.attempts)},
                       {"error", acquired.error}});
        return LoopExit::kFatal;
      }
      logger_.Debug("frame skipped after transient failures",
                    {{"attempts", std::to_string(acquired.attempts)}, {"error", acquired.error}});
      (void)WaitInterruptible(timings.failure_delay);
      continue;
    }

    capture::EncodedFrame encoded;
    std::string encode_error;
    if (!capture::EncodeFrame(frame, options_.jpeg_quality, encoded, encode_error)) {
      logger_.Warn("frame encode failed", {{"error", encode_error}});
      (void)WaitInterruptible(timings.failure_delay);
      continue;
    }

    auto shared = std::make_shared<const capture::EncodedFrame>(std::move(encoded));
    {
      std::lock_guard<std::mutex> lock(frame_mu_);
      latest_frame_ = shared;
    }
    Broadcast(*shared);
    if (registry_.Empty()) {
      return LoopExit::kRegistryEmpty;
    }

    ++frames;
    if (options_.status_log_every_frames > 0U && frames % options_.status_log_every_frames == 0U) {
      logger_.Info("stream status", {{"frames", std::to_string(frames)},
                                     {"clients", std::to_string(registry_.Size())},
                                     {"jpeg_bytes", std::to_string(shared->jpeg.size())}});
    }

    const auto elapsed = std::chrono::steady_clock::now() - iteration_start;
    if (elapsed < timings.frame_interval) {
      (void)WaitInterruptible(timings.frame_interval - elapsed);
    }
  }
}

void StreamingEngine::Broadcast(const capture::EncodedFrame& encoded) {
  const std::string message =
      BuildFrameMessage(encoded.base64, core::SteadySeconds(encoded.timestamp));

  std::uint64_t delivered = 0;
  std::uint64_t pruned = 0;
  for (const ClientRegistry::SinkPtr& sink : registry_.Members()) {
    std::string error;
    if (sink->Send(message, error)) {
      ++delivered;
      continue;
    }
    registry_.Remove(sink);
    ++pruned;
    logger_.Debug("client send failed; removed from registry",
                  {{"code", core::errors::ToStableCode(core::errors::ErrorKind::kClientSendFailure)},
                   {"error", error}});
  }

  std::lock_guard<std::mutex> lock(state_mu_);
  if (delivered > 0U) {
    ++stats_.frames_broadcast;
  }
  stats_.clients_pruned += pruned;
}

bool StreamingEngine::Pause() {
  std::unique_lock<std::mutex> lock(state_mu_);
  hold_ = true;
  if (state_ == StreamState::kStarting) {
    state_cv_.wait_for(lock, options_.timings.start_settle_timeout,
                       [this]() { return state_ != StreamState::kStarting; });
  }
  if (state_ == StreamState::kPaused) {
    // The start settled under the hold; the loop has not acquired yet.
    return true;
  }
  if (state_ != StreamState::kActive) {
    return false;
  }

  acquire_cancel_.store(true, std::memory_order_release);
  SetStateLocked(StreamState::kPaused);
  const bool drained = state_cv_.wait_for(lock, options_.timings.pause_grace,
                                          [this]() { return !acquire_in_flight_; });
  lock.unlock();

  if (!drained) {
    logger_.Warn("pause grace elapsed with acquisition still in flight",
                 {{"pause_grace_ms", std::to_string(options_.timings.pause_grace.count())}});
  }
  logger_.Info("stream paused");
  return true;
}

bool StreamingEngine::Resume() {
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    hold_ = false;
    // Wakes a start or teardown parked on the hold.
    state_cv_.notify_all();
    if (state_ != StreamState::kPaused) {
      return false;
    }
    acquire_cancel_.store(false, std::memory_order_release);
    SetStateLocked(StreamState::kActive);
  }
  logger_.Info("stream resumed");
  return true;
}

std::shared_ptr<const capture::EncodedFrame> StreamingEngine::GetCurrentFrame() const {
  std::lock_guard<std::mutex> lock(frame_mu_);
  return latest_frame_;
}

StreamState StreamingEngine::state() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return state_;
}

std::size_t StreamingEngine::client_count() const {
  return registry_.Size();
}

bool StreamingEngine::WaitForState(const StreamState target,
                                   const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_mu_);
  return state_cv_.wait_for(lock, timeout, [this, target]() { return state_ == target; });
}

void StreamingEngine::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;
    acquire_cancel_.store(true, std::memory_order_release);
    state_cv_.notify_all();
  }
  supervisor_.Shutdown();
  logger_.Debug("streaming engine shut down", {{"state", ToString(state())}});
}

StreamingEngine::Stats StreamingEngine::stats() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return stats_;
}

bool StreamingEngine::WaitInterruptible(const std::chrono::steady_clock::duration duration) {
  std::unique_lock<std::mutex> lock(state_mu_);
  return !state_cv_.wait_for(lock, duration, [this]() { return ShouldExitLocked(); });
}

bool StreamingEngine::ShouldExitLocked() const {
  return shutdown_ || registry_.Empty();
}

void StreamingEngine::SetStateLocked(const StreamState next) {
  if (state_ == next) {
    return;
  }
  logger_.Debug("stream state transition", {{"from", ToString(state_)}, {"to", ToString(next)}});
  state_ = next;
  state_cv_.notify_all();
}

} // namespace scopecam::streaming
