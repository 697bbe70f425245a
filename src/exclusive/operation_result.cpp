#include "exclusive/operation_result.hpp"

#include "core/json_utils.hpp"

#include <sstream>

namespace scopecam::exclusive {

namespace {

void AppendDescriptor(std::ostringstream& out, const SnapshotDescriptor& snapshot) {
  out << ",\"filename\":" << core::JsonString(snapshot.filename)
      << ",\"filepath\":" << core::JsonString(snapshot.path.string())
      << ",\"capturedAt\":" << core::JsonString(snapshot.captured_at_utc)
      << ",\"exposureTime\":" << core::FormatJsonNumber(snapshot.exposure_ms)
      << ",\"gain\":" << core::FormatJsonNumber(snapshot.gain)
      << ",\"gamma\":" << core::FormatJsonNumber(snapshot.gamma)
      << ",\"fileSize\":" << snapshot.size_bytes << ",\"width\":" << snapshot.width
      << ",\"height\":" << snapshot.height;
}

void AppendDescriptor(std::ostringstream& out, const VideoDescriptor& video) {
  out << ",\"filename\":" << core::JsonString(video.filename)
      << ",\"filepath\":" << core::JsonString(video.path.string())
      << ",\"capturedAt\":" << core::JsonString(video.captured_at_utc)
      << ",\"duration\":" << core::FormatJsonNumber(video.duration_s)
      << ",\"playbackFps\":" << core::FormatJsonNumber(video.playback_fps)
      << ",\"decimation\":" << video.decimation << ",\"frameBudget\":" << video.frame_budget
      << ",\"numImages\":" << video.num_images << ",\"fileSize\":" << video.size_bytes
      << ",\"cancelled\":" << core::JsonBool(video.cancelled);
}

void AppendDescriptor(std::ostringstream& out, const AutoExposureDescriptor& auto_exposure) {
  out << ",\"mode\":" << core::JsonString(auto_exposure.mode)
      << ",\"autoExposure\":" << core::JsonBool(auto_exposure.auto_exposure_enabled)
      << ",\"exposure\":" << core::FormatJsonNumber(auto_exposure.exposure_ms);
}

void AppendDescriptor(std::ostringstream& out, const SettingsDescriptor& change) {
  const settings::CaptureSettings& applied = change.applied;
  out << ",\"settings\":{\"exposure\":" << core::FormatJsonNumber(applied.exposure_ms)
      << ",\"gain\":" << core::FormatJsonNumber(applied.gain)
      << ",\"gamma\":" << core::FormatJsonNumber(applied.gamma)
      << ",\"autoExposure\":" << core::JsonBool(applied.auto_exposure_enabled) << "}";
}

void AppendDescriptor(std::ostringstream& /*out*/, const std::monostate& /*none*/) {}

} // namespace

OperationResult Failure(const core::errors::ErrorKind kind, std::string_view operation,
                        std::string_view detail) {
  OperationResult result;
  result.ok = false;
  result.kind = kind;
  result.message = core::errors::FormatError(kind, operation, detail);
  return result;
}

std::string ToJson(const OperationResult& result) {
  std::ostringstream out;
  if (!result.ok) {
    out << "{\"success\":false,\"error\":{\"code\":"
        << core::JsonString(core::errors::ToStableCode(result.kind))
        << ",\"message\":" << core::JsonString(result.message) << "}";
    if (const auto* change = std::get_if<SettingsDescriptor>(&result.descriptor)) {
      AppendDescriptor(out, *change);
    }
    out << "}";
    return out.str();
  }

  out << "{\"success\":true";
  std::visit([&out](const auto& descriptor) { AppendDescriptor(out, descriptor); },
             result.descriptor);
  out << "}";
  return out.str();
}

} // namespace scopecam::exclusive
