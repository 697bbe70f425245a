#include "exclusive/exclusive_coordinator.hpp"

#include "capture/frame_acquisition.hpp"
#include "capture/frame_codec.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <chrono>
#include <cmath>
#include <system_error>
#include <utility>
#include <variant>

namespace scopecam::exclusive {

namespace {

using core::errors::ErrorKind;

// Holds the streaming engine paused for the lifetime of one operation.
class StreamPauseGuard {
public:
  StreamPauseGuard(streaming::StreamingEngine& engine, core::logging::Logger& logger)
      : engine_(engine), logger_(logger) {
    was_active_ = engine_.Pause();
  }

  StreamPauseGuard(const StreamPauseGuard&) = delete;
  StreamPauseGuard& operator=(const StreamPauseGuard&) = delete;

  ~StreamPauseGuard() {
    // Always release the hold; only a stream that was Active comes back.
    const bool resumed = engine_.Resume();
    if (was_active_ && !resumed) {
      logger_.Info("stream not resumed; engine left the paused state",
                   {{"state", streaming::ToString(engine_.state())}});
    }
  }

  bool was_active() const {
    return was_active_;
  }

private:
  streaming::StreamingEngine& engine_;
  core::logging::Logger& logger_;
  bool was_active_ = false;
};

std::uint64_t FileSizeOrZero(const std::filesystem::path& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0U : static_cast<std::uint64_t>(size);
}

} // namespace

ExclusiveCoordinator::ExclusiveCoordinator(device::IDeviceAdapter& adapter,
                                           device::DeviceExecutor& executor,
                                           streaming::StreamingEngine& engine,
                                           settings::SettingsStore& settings,
                                           core::logging::Logger& logger,
                                           CoordinatorOptions options)
    : adapter_(adapter),
      executor_(executor),
      engine_(engine),
      settings_(settings),
      logger_(logger),
      options_(std::move(options)) {}

ExclusiveCoordinator::~ExclusiveCoordinator() {
  Shutdown();
}

void ExclusiveCoordinator::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    stopping_ = true;
  }
  stop_cv_.notify_all();

  // A clip callback must not outlive this object.
  std::unique_lock<std::mutex> lock(video_mu_);
  if (!video_active_ || clip_done_) {
    return;
  }
  lock.unlock();

  std::string error;
  (void)executor_.Run([this, &error]() { return adapter_.StopStream(error); });

  lock.lock();
  if (!video_cv_.wait_for(lock, options_.timings.clip_completion_margin,
                          [this]() { return clip_done_; })) {
    logger_.Error("clip callback still pending at shutdown");
  }
}

OperationResult ExclusiveCoordinator::RunExclusive(const ExclusiveOperation& operation) {
  const char* name = OperationName(operation);

  std::unique_lock<std::mutex> exclusive(exclusive_mu_, std::try_to_lock);
  if (!exclusive.owns_lock()) {
    logger_.Warn("exclusive operation rejected",
                 {{"operation", name}, {"code", core::errors::ToStableCode(ErrorKind::kBusy)}});
    return Failure(ErrorKind::kBusy, name, "another exclusive operation is in progress");
  }
  busy_.store(true, std::memory_order_release);

  const auto started_at = std::chrono::steady_clock::now();
  logger_.Info("exclusive operation started", {{"operation", name}});

  OperationResult result;
  {
    StreamPauseGuard pause(engine_, logger_);

    device::DeviceStatus stream_status = device::DeviceStatus::kOk;
    std::string stream_error;
    const bool needs_stream = !std::holds_alternative<SettingsChange>(operation);
    if (needs_stream && !EnsureHardwareStream(stream_status, stream_error)) {
      result = Failure(device::ToErrorKind(stream_status), name, stream_error);
    } else if (const auto* snapshot = std::get_if<Snapshot>(&operation)) {
      result = RunSnapshot(*snapshot);
    } else if (const auto* video = std::get_if<VideoRecording>(&operation)) {
      result = RunVideo(*video);
    } else if (std::holds_alternative<AutoExposureOnce>(operation)) {
      result = RunAutoExposureOnce();
    } else if (const auto* continuous = std::get_if<AutoExposureContinuous>(&operation)) {
      result = RunAutoExposureContinuous(*continuous);
    } else if (const auto* change = std::get_if<SettingsChange>(&operation)) {
      result = RunSettingsChange(*change);
    }
  }

  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - started_at)
                              .count();
  if (result.ok) {
    logger_.Info("exclusive operation finished",
                 {{"operation", name}, {"duration_ms", std::to_string(elapsed_ms)}});
  } else {
    logger_.Error("exclusive operation failed",
                  {{"operation", name},
                   {"code", core::errors::ToStableCode(result.kind)},
                   {"duration_ms", std::to_string(elapsed_ms)},
                   {"error", result.message}});
  }

  busy_.store(false, std::memory_order_release);
  return result;
}

bool ExclusiveCoordinator::EnsureHardwareStream(device::DeviceStatus& status,
                                                std::string& error) {
  status = executor_.Run([this, &error]() { return adapter_.StartStream(error); });
  if (device::IsSuccess(status)) {
    return true;
  }
  error = "hardware stream could not be started: " + error;
  return false;
}

OperationResult ExclusiveCoordinator::RunSnapshot(const Snapshot& snapshot) {
  constexpr const char* kOperation = "snapshot";

  if (!snapshot.overrides.empty()) {
    settings::CaptureSettings applied;
    ErrorKind kind = ErrorKind::kNone;
    std::string error;
    if (!settings_.Update(snapshot.overrides, applied, kind, error)) {
      return Failure(kind, kOperation, error);
    }
  }

  capture::Frame frame;
  const capture::AcquisitionResult acquired =
      capture::AcquireFrame(&adapter_, executor_, capture::kOneShotRetryBound,
                            options_.fallback_width, options_.fallback_height, frame);
  if (!acquired.ok()) {
    return Failure(device::ToErrorKind(acquired.status), kOperation, acquired.error);
  }

  capture::EncodedFrame encoded;
  std::string error;
  if (!capture::EncodeFrame(frame, options_.snapshot_jpeg_quality, encoded, error)) {
    return Failure(ErrorKind::kFatal, kOperation, error);
  }

  const auto now = std::chrono::system_clock::now();
  SnapshotDescriptor descriptor;
  descriptor.filename = "capture_" + core::FormatFilenameStamp(now) + ".jpg";
  descriptor.path = options_.capture_dir / descriptor.filename;
  if (!core::WriteBinaryFileAtomic(descriptor.path, encoded.jpeg, error)) {
    return Failure(ErrorKind::kIo, kOperation, error);
  }

  const settings::CaptureSettings current = settings_.Get();
  descriptor.captured_at_utc = core::FormatUtcTimestamp(now);
  descriptor.exposure_ms = current.exposure_ms;
  descriptor.gain = current.gain;
  descriptor.gamma = current.gamma;
  descriptor.size_bytes = encoded.jpeg.size();
  descriptor.width = frame.width;
  descriptor.height = frame.height;

  logger_.Info("snapshot saved", {{"path", descriptor.path.string()},
                                  {"bytes", std::to_string(descriptor.size_bytes)},
                                  {"width", std::to_string(descriptor.width)},
                                  {"height", std::to_string(descriptor.height)}});

  OperationResult result;
  result.ok = true;
  result.descriptor = std::move(descriptor);
  return result;
}

OperationResult ExclusiveCoordinator::RunVideo(const VideoRecording& video) {
  constexpr const char* kOperation = "video";

  if (!std::isfinite(video.duration_s) || video.duration_s <= 0.0) {
    return Failure(ErrorKind::kInvalidArgument, kOperation, "duration must be > 0 seconds");
  }
  if (!std::isfinite(video.playback_fps) || video.playback_fps <= 0.0) {
    return Failure(ErrorKind::kInvalidArgument, kOperation, "playback fps must be > 0");
  }
  if (video.decimation == 0U) {
    return Failure(ErrorKind::kInvalidArgument, kOperation, "decimation must be >= 1");
  }

  device::FeatureReading frame_rate;
  std::string error;
  device::DeviceStatus status = executor_.Run([this, &frame_rate, &error]() {
    return adapter_.GetFeature(device::Feature::kFrameRate, frame_rate, error);
  });
  if (!device::IsSuccess(status)) {
    return Failure(device::ToErrorKind(status), kOperation,
                   "could not read device frame rate: " + error);
  }

  const std::uint32_t budget =
      ComputeClipFrameBudget(video.duration_s, frame_rate.value, video.decimation);
  if (budget == 0U) {
    return Failure(ErrorKind::kFatal, kOperation,
                   "device reported an unusable frame rate " +
                       core::FormatJsonNumber(frame_rate.value));
  }

  if (!core::EnsureDirectory(options_.capture_dir, error)) {
    return Failure(ErrorKind::kIo, kOperation, error);
  }

  const auto now = std::chrono::system_clock::now();
  const std::string stem = "recording_" + core::FormatFilenameStamp(now);
  const std::filesystem::path intermediate =
      options_.capture_dir / (stem + adapter_.IntermediateClipExtension());

  VideoDescriptor descriptor;
  descriptor.filename = stem + ".avi";
  descriptor.path = options_.capture_dir / descriptor.filename;
  descriptor.captured_at_utc = core::FormatUtcTimestamp(now);
  descriptor.duration_s = video.duration_s;
  descriptor.playback_fps = video.playback_fps;
  descriptor.decimation = video.decimation;
  descriptor.frame_budget = budget;

  logger_.Info("video recording started",
               {{"frame_budget", std::to_string(budget)},
                {"device_fps", core::FormatJsonNumber(frame_rate.value)},
                {"decimation", std::to_string(video.decimation)},
                {"intermediate", intermediate.string()}});

  {
    std::lock_guard<std::mutex> lock(video_mu_);
    video_active_ = true;
    clip_done_ = false;
    video_cancel_requested_ = false;
    clip_completion_ = device::ClipCompletion{};
  }

  device::ClipRequest request;
  request.frame_budget = budget;
  request.decimation = video.decimation;
  request.playback_fps = video.playback_fps;
  request.intermediate_path = intermediate;

  status = executor_.Run([this, &request, &error]() {
    return adapter_.StartEncodedClip(
        request,
        [this](const device::ClipCompletion& completion) {
          std::lock_guard<std::mutex> lock(video_mu_);
          clip_completion_ = completion;
          clip_done_ = true;
          if (!abandoned_intermediate_.empty()) {
            core::RemoveFileBestEffort(abandoned_intermediate_);
            abandoned_intermediate_.clear();
            video_active_ = false;
          }
          video_cv_.notify_all();
        },
        error);
  });
  if (!device::IsSuccess(status)) {
    std::lock_guard<std::mutex> lock(video_mu_);
    video_active_ = false;
    return Failure(device::ToErrorKind(status), kOperation, "clip capture failed to start: " + error);
  }

  const auto nominal = std::chrono::milliseconds(
      static_cast<std::int64_t>(std::ceil(video.duration_s * 1000.0)));
  device::ClipCompletion completion;
  bool completed = false;
  {
    std::unique_lock<std::mutex> lock(video_mu_);
    completed = video_cv_.wait_for(lock, nominal + options_.timings.clip_completion_margin,
                                   [this]() { return clip_done_; });
  }

  if (!completed) {
    // Stop the stream to abort the capture, then give the callback one more
    // margin to arrive.
    std::string stop_error;
    (void)executor_.Run([this, &stop_error]() { return adapter_.StopStream(stop_error); });
    std::unique_lock<std::mutex> lock(video_mu_);
    completed = video_cv_.wait_for(lock, options_.timings.clip_completion_margin,
                                   [this]() { return clip_done_; });
  }

  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(video_mu_);
    completion = clip_completion_;
    cancelled = video_cancel_requested_;
    // While the callback is still pending, video_active_ stays set so
    // Shutdown waits for it.
    if (completed) {
      video_active_ = false;
    } else {
      abandoned_intermediate_ = intermediate;
    }
  }

  const auto restart_stream = [this]() {
    device::DeviceStatus restart_status = device::DeviceStatus::kOk;
    std::string restart_error;
    if (!EnsureHardwareStream(restart_status, restart_error)) {
      logger_.Error("hardware stream restart after recording failed",
                    {{"code", core::errors::ToStableCode(device::ToErrorKind(restart_status))},
                     {"error", restart_error}});
    }
  };

  if (!completed) {
    core::RemoveFileBestEffort(intermediate);
    restart_stream();
    return Failure(ErrorKind::kTimeout, kOperation,
                   "clip completion callback did not arrive within " +
                       std::to_string((nominal + 2 * options_.timings.clip_completion_margin)
                                          .count()) +
                       " ms");
  }

  if (!device::IsSuccess(completion.status)) {
    core::RemoveFileBestEffort(intermediate);
    restart_stream();
    return Failure(device::ToErrorKind(completion.status), kOperation,
                   "clip capture failed: " + completion.detail);
  }
  if (completion.frames_captured == 0U) {
    core::RemoveFileBestEffort(intermediate);
    restart_stream();
    return Failure(ErrorKind::kFatal, kOperation,
                   cancelled ? "recording cancelled before any image was captured"
                             : "clip capture produced no images");
  }

  status = executor_.Run([this, &intermediate, &descriptor, &video, &error]() {
    return adapter_.TranscodeClip(intermediate, descriptor.path, video.playback_fps, error);
  });
  core::RemoveFileBestEffort(intermediate);
  restart_stream();
  if (!device::IsSuccess(status)) {
    core::RemoveFileBestEffort(descriptor.path);
    return Failure(device::ToErrorKind(status), kOperation, "clip transcode failed: " + error);
  }

  descriptor.num_images = completion.frames_captured;
  descriptor.cancelled = cancelled || completion.aborted;
  descriptor.size_bytes = FileSizeOrZero(descriptor.path);

  logger_.Info("video saved", {{"path", descriptor.path.string()},
                               {"num_images", std::to_string(descriptor.num_images)},
                               {"frame_budget", std::to_string(budget)},
                               {"cancelled", core::JsonBool(descriptor.cancelled)},
                               {"bytes", std::to_string(descriptor.size_bytes)}});

  OperationResult result;
  result.ok = true;
  result.descriptor = std::move(descriptor);
  return result;
}

bool ExclusiveCoordinator::CancelVideo() {
  {
    std::lock_guard<std::mutex> lock(video_mu_);
    if (!video_active_ || clip_done_ || video_cancel_requested_) {
      return false;
    }
    video_cancel_requested_ = true;
  }

  logger_.Info("video cancel requested; stopping hardware stream");
  std::string error;
  const device::DeviceStatus status =
      executor_.Run([this, &error]() { return adapter_.StopStream(error); });
  if (!device::IsSuccess(status)) {
    logger_.Warn("stream stop for video cancel failed",
                 {{"status", device::ToString(status)}, {"error", error}});
  }
  return true;
}

OperationResult ExclusiveCoordinator::RunAutoExposureOnce() {
  constexpr const char* kOperation = "auto_exposure";

  const settings::CaptureSettings current = settings_.Get();
  if (!current.auto_exposure_supported) {
    return Failure(ErrorKind::kUnsupported, kOperation,
                   "camera has no automatic exposure control");
  }

  std::string error;
  const double seed = settings_.Clamp(device::Feature::kExposure, current.exposure_ms);
  device::DeviceStatus status = executor_.Run([this, seed, &error]() {
    return adapter_.SetFeature(device::Feature::kExposure, device::FeatureMode::kOnePush, seed,
                               error);
  });
  if (!device::IsSuccess(status)) {
    return Failure(device::ToErrorKind(status), kOperation, "one-push request failed: " + error);
  }

  const auto deadline = std::chrono::steady_clock::now() + options_.timings.auto_exposure_timeout;
  std::uint32_t polls = 0;
  while (true) {
    if (!WaitForPoll(options_.timings.auto_exposure_poll_interval)) {
      return Failure(ErrorKind::kFatal, kOperation, "service is shutting down");
    }

    device::FeatureReading reading;
    status = executor_.Run([this, &reading, &error]() {
      return adapter_.GetFeature(device::Feature::kExposure, reading, error);
    });
    ++polls;
    if (!device::IsSuccess(status)) {
      return Failure(device::ToErrorKind(status), kOperation,
                     "exposure read-back failed: " + error);
    }

    if (!reading.one_push_active) {
      settings_.RecordExposure(reading.value);
      settings_.RecordAutoExposure(false);
      logger_.Info("one-push auto exposure settled",
                   {{"exposure_ms", core::FormatJsonNumber(reading.value)},
                    {"polls", std::to_string(polls)}});

      OperationResult result;
      result.ok = true;
      result.descriptor = AutoExposureDescriptor{
          .mode = "once", .auto_exposure_enabled = false, .exposure_ms = reading.value};
      return result;
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      return Failure(ErrorKind::kTimeout, kOperation,
                     "one-push adjustment still active after " +
                         std::to_string(options_.timings.auto_exposure_timeout.count()) + " ms");
    }
  }
}

OperationResult ExclusiveCoordinator::RunAutoExposureContinuous(
    const AutoExposureContinuous& request) {
  constexpr const char* kOperation = "auto_exposure";

  const settings::CaptureSettings current = settings_.Get();
  if (!current.auto_exposure_supported) {
    return Failure(ErrorKind::kUnsupported, kOperation,
                   "camera has no automatic exposure control");
  }

  std::string error;
  device::FeatureReading reading;
  device::DeviceStatus status = device::DeviceStatus::kOk;

  if (request.enable) {
    const double seed = settings_.Clamp(device::Feature::kExposure, current.exposure_ms);
    status = executor_.Run([this, seed, &error]() {
      return adapter_.SetFeature(device::Feature::kExposure, device::FeatureMode::kAuto, seed,
                                 error);
    });
    if (!device::IsSuccess(status)) {
      return Failure(device::ToErrorKind(status), kOperation,
                     "enabling auto exposure failed: " + error);
    }
    status = executor_.Run([this, &reading, &error]() {
      return adapter_.GetFeature(device::Feature::kExposure, reading, error);
    });
    if (device::IsSuccess(status)) {
      settings_.RecordExposure(reading.value);
    } else {
      reading.value = current.exposure_ms;
      logger_.Warn("exposure read-back after enabling auto exposure failed",
                   {{"error", error}});
    }
    settings_.RecordAutoExposure(true);
  } else {
    // Read the camera-chosen value first so the manual value matches it.
    status = executor_.Run([this, &reading, &error]() {
      return adapter_.GetFeature(device::Feature::kExposure, reading, error);
    });
    if (!device::IsSuccess(status)) {
      return Failure(device::ToErrorKind(status), kOperation,
                     "exposure read-back failed: " + error);
    }
    const double manual_value = settings_.Clamp(device::Feature::kExposure, reading.value);
    status = executor_.Run([this, manual_value, &error]() {
      return adapter_.SetFeature(device::Feature::kExposure, device::FeatureMode::kManual,
                                 manual_value, error);
    });
    if (!device::IsSuccess(status)) {
      return Failure(device::ToErrorKind(status), kOperation,
                     "disabling auto exposure failed: " + error);
    }
    reading.value = manual_value;
    settings_.RecordExposure(manual_value);
    settings_.RecordAutoExposure(false);
  }

  logger_.Info("continuous auto exposure updated",
               {{"enabled", core::JsonBool(request.enable)},
                {"exposure_ms", core::FormatJsonNumber(reading.value)}});

  OperationResult result;
  result.ok = true;
  result.descriptor = AutoExposureDescriptor{.mode = "continuous",
                                             .auto_exposure_enabled = request.enable,
                                             .exposure_ms = reading.value};
  return result;
}

OperationResult ExclusiveCoordinator::RunSettingsChange(const SettingsChange& change) {
  settings::CaptureSettings applied;
  ErrorKind kind = ErrorKind::kNone;
  std::string error;
  OperationResult result;
  if (settings_.Update(change.update, applied, kind, error)) {
    result.ok = true;
  } else {
    result = Failure(kind, "settings", error);
  }
  result.descriptor = SettingsDescriptor{.applied = applied};
  return result;
}

bool ExclusiveCoordinator::WaitForPoll(const std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(stop_mu_);
  return !stop_cv_.wait_for(lock, duration, [this]() { return stopping_; });
}

} // namespace scopecam::exclusive
