#include "service/camera_service.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "streaming/stream_messages.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace scopecam::service {

namespace {

using core::errors::ErrorKind;

struct CaptureFileEntry {
  std::string filename;
  std::uint64_t size = 0;
  std::string modified_utc;
};

bool IsListedCaptureExtension(const fs::path& path) {
  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension == ".jpg" || extension == ".avi" || extension == ".mp4";
}

std::chrono::system_clock::time_point ToSystemTime(const fs::file_time_type file_time) {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      file_time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

} // namespace

bool ParseAutoExposureRequest(std::string_view raw, AutoExposureRequest& request,
                              std::string& error) {
  if (raw == "once") {
    request = AutoExposureRequest::kOnce;
    return true;
  }
  if (raw == "enable" || raw == "on") {
    request = AutoExposureRequest::kEnable;
    return true;
  }
  if (raw == "disable" || raw == "off") {
    request = AutoExposureRequest::kDisable;
    return true;
  }
  error = "invalid auto exposure mode '" + std::string(raw) + "' (expected once|enable|disable)";
  return false;
}

CameraService::CameraService(core::config::ServiceConfig config, core::logging::Logger& logger)
    : config_(std::move(config)), logger_(logger) {}

CameraService::~CameraService() {
  Shutdown();
}

bool CameraService::Start(std::string& error) {
  if (started_) {
    return true;
  }

  if (!device::OpenConfiguredDevice(config_, logger_, device_, error)) {
    return false;
  }
  device::IDeviceAdapter* adapter = device_.session.adapter();

  executor_ = std::make_unique<device::DeviceExecutor>(config_.device_worker_threads);
  settings_ = std::make_unique<settings::SettingsStore>(*adapter, *executor_, logger_);
  if (!settings_->LoadFromDevice(error)) {
    logger_.Error("device settings could not be loaded", {{"error", error}});
    executor_->Shutdown();
    settings_.reset();
    executor_.reset();
    device_.session.Close();
    return false;
  }

  // Defaults are clamped like any other write; a rejected field only warns.
  settings::SettingsUpdate defaults;
  defaults.exposure_ms = config_.default_exposure_ms;
  defaults.gain = config_.default_gain;
  settings::CaptureSettings applied;
  ErrorKind kind = ErrorKind::kNone;
  std::string defaults_error;
  if (!settings_->Update(defaults, applied, kind, defaults_error)) {
    logger_.Warn("default settings not fully applied",
                 {{"code", core::errors::ToStableCode(kind)}, {"error", defaults_error}});
  }

  streaming::StreamingEngineOptions engine_options;
  engine_options.timings = config_.engine;
  engine_options.jpeg_quality = config_.stream_jpeg_quality;
  engine_options.synthetic_width = applied.width > 0U ? applied.width : config_.simulated_width;
  engine_options.synthetic_height =
      applied.height > 0U ? applied.height : config_.simulated_height;
  engine_ = std::make_unique<streaming::StreamingEngine>(adapter, *executor_, logger_,
                                                         engine_options);

  exclusive::CoordinatorOptions coordinator_options;
  coordinator_options.timings = config_.exclusive;
  coordinator_options.capture_dir = config_.capture_dir;
  coordinator_options.snapshot_jpeg_quality = config_.snapshot_jpeg_quality;
  coordinator_options.fallback_width = engine_options.synthetic_width;
  coordinator_options.fallback_height = engine_options.synthetic_height;
  coordinator_ = std::make_unique<exclusive::ExclusiveCoordinator>(
      *adapter, *executor_, *engine_, *settings_, logger_, coordinator_options);

  started_ = true;
  logger_.Info("camera service started",
               {{"simulated", core::JsonBool(device_.simulated)},
                {"capture_dir", config_.capture_dir.string()},
                {"width", std::to_string(applied.width)},
                {"height", std::to_string(applied.height)},
                {"exposure_ms", core::FormatJsonNumber(applied.exposure_ms)},
                {"gain", core::FormatJsonNumber(applied.gain)}});
  return true;
}

void CameraService::Shutdown() {
  if (!started_.exchange(false)) {
    return;
  }

  // Coordinator first so polling waits and pending clip callbacks finish
  // while the engine and device are still alive.
  coordinator_->Shutdown();
  engine_->Shutdown();
  coordinator_.reset();
  engine_.reset();
  settings_.reset();
  executor_->Shutdown();
  device_.session.Close();
  executor_.reset();

  logger_.Info("camera service stopped");
}

exclusive::OperationResult CameraService::NotStarted(std::string_view operation) const {
  return exclusive::Failure(ErrorKind::kDeviceUnavailable, operation,
                            "camera service is not started");
}

bool CameraService::AddClient(const streaming::ClientRegistry::SinkPtr& sink,
                              std::string& error) {
  if (!started_) {
    error = "camera service is not started";
    return false;
  }

  const settings::CaptureSettings current = settings_->Get();
  if (!sink->Send(streaming::BuildConnectedMessage(current.width, current.height), error)) {
    logger_.Warn("client greeting failed",
                 {{"code", core::errors::ToStableCode(ErrorKind::kClientSendFailure)},
                  {"error", error}});
    return false;
  }

  // A newcomer sees an image right away instead of waiting for the next
  // broadcast.
  if (const auto cached = engine_->GetCurrentFrame()) {
    std::string send_error;
    if (!sink->Send(streaming::BuildFrameMessage(cached->base64,
                                                 core::SteadySeconds(cached->timestamp)),
                    send_error)) {
      logger_.Warn("cached frame send failed", {{"error", send_error}});
    }
  }

  engine_->AddClient(sink);
  return true;
}

void CameraService::RemoveClient(const streaming::ClientRegistry::SinkPtr& sink) {
  if (!started_) {
    return;
  }
  engine_->RemoveClient(sink);
}

exclusive::OperationResult CameraService::RequestCapture(
    const settings::SettingsUpdate& overrides) {
  if (!started_) {
    return NotStarted("snapshot");
  }
  return coordinator_->RunExclusive(exclusive::Snapshot{overrides});
}

exclusive::OperationResult CameraService::RequestVideo(const double duration_s,
                                                       const double playback_fps,
                                                       const std::uint32_t decimation) {
  if (!started_) {
    return NotStarted("video");
  }
  return coordinator_->RunExclusive(exclusive::VideoRecording{
      .duration_s = duration_s, .playback_fps = playback_fps, .decimation = decimation});
}

bool CameraService::CancelVideo() {
  return started_ && coordinator_->CancelVideo();
}

exclusive::OperationResult CameraService::RequestAutoExposure(const AutoExposureRequest request) {
  if (!started_) {
    return NotStarted("auto_exposure");
  }
  switch (request) {
  case AutoExposureRequest::kOnce:
    return coordinator_->RunExclusive(exclusive::AutoExposureOnce{});
  case AutoExposureRequest::kEnable:
    return coordinator_->RunExclusive(exclusive::AutoExposureContinuous{true});
  case AutoExposureRequest::kDisable:
    return coordinator_->RunExclusive(exclusive::AutoExposureContinuous{false});
  }
  return exclusive::Failure(ErrorKind::kInvalidArgument, "auto_exposure", "unknown request");
}

settings::CaptureSettings CameraService::GetSettings() const {
  return started_ ? settings_->Get() : settings::CaptureSettings{};
}

std::string CameraService::GetSettingsJson() const {
  const bool streaming =
      started_ && (engine_->state() == streaming::StreamState::kActive ||
                   engine_->state() == streaming::StreamState::kPaused);
  return settings::ToJson(GetSettings(), device_.session.is_open(), streaming);
}

exclusive::OperationResult CameraService::UpdateSettings(const settings::SettingsUpdate& update) {
  if (!started_) {
    return NotStarted("settings");
  }
  if (update.empty()) {
    return exclusive::Failure(ErrorKind::kInvalidArgument, "settings",
                              "update names no field (exposure, gain, gamma)");
  }
  return coordinator_->RunExclusive(exclusive::SettingsChange{update});
}

bool CameraService::ListCaptures(std::string& json, std::string& error) const {
  std::vector<CaptureFileEntry> entries;

  std::error_code ec;
  if (fs::exists(config_.capture_dir, ec)) {
    fs::directory_iterator it(config_.capture_dir, ec);
    if (ec) {
      error = "failed to list capture directory '" + config_.capture_dir.string() +
              "': " + ec.message();
      return false;
    }
    for (const fs::directory_entry& entry : it) {
      std::error_code entry_ec;
      if (!entry.is_regular_file(entry_ec) || entry_ec ||
          !IsListedCaptureExtension(entry.path())) {
        continue;
      }
      CaptureFileEntry file;
      file.filename = entry.path().filename().string();
      const auto size = entry.file_size(entry_ec);
      file.size = entry_ec ? 0U : static_cast<std::uint64_t>(size);
      const auto modified = entry.last_write_time(entry_ec);
      if (!entry_ec) {
        file.modified_utc = core::FormatUtcTimestamp(ToSystemTime(modified));
      }
      entries.push_back(std::move(file));
    }
  }

  std::sort(entries.begin(), entries.end(),
            [](const CaptureFileEntry& lhs, const CaptureFileEntry& rhs) {
              return lhs.filename < rhs.filename;
            });

  std::ostringstream out;
  out << "{\"files\":[";
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << "{\"filename\":" << core::JsonString(entries[i].filename)
        << ",\"size\":" << entries[i].size
        << ",\"modified\":" << core::JsonString(entries[i].modified_utc) << '}';
  }
  out << "],\"count\":" << entries.size()
      << ",\"path\":" << core::JsonString(config_.capture_dir.string()) << '}';
  json = out.str();
  return true;
}

std::string CameraService::Health() const {
  const bool connected = device_.session.is_open();
  const std::string_view state =
      started_ ? streaming::ToString(engine_->state()) : std::string_view("stopped");

  std::ostringstream out;
  out << "{\"status\":" << core::JsonString(started_ ? "healthy" : "stopped")
      << ",\"camera_connected\":" << core::JsonBool(connected)
      << ",\"simulated\":" << core::JsonBool(device_.simulated)
      << ",\"stream_state\":" << core::JsonString(state)
      << ",\"clients\":" << (started_ ? engine_->client_count() : 0U)
      << ",\"timestamp\":"
      << core::JsonString(core::FormatUtcTimestamp(std::chrono::system_clock::now())) << '}';
  return out.str();
}

} // namespace scopecam::service
