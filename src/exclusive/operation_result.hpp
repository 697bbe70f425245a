#pragma once

#include "core/errors/error_kind.hpp"
#include "settings/capture_settings.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

namespace scopecam::exclusive {

struct SnapshotDescriptor {
  std::string filename;
  std::filesystem::path path;
  std::string captured_at_utc;
  double exposure_ms = 0.0;
  double gain = 0.0;
  double gamma = 0.0;
  std::uint64_t size_bytes = 0;
  std::uint32_t width = 0;
  std::uint32_t height = 0;
};

struct VideoDescriptor {
  std::string filename;
  std::filesystem::path path;
  std::string captured_at_utc;
  double duration_s = 0.0;
  double playback_fps = 0.0;
  std::uint32_t decimation = 1;
  std::uint32_t frame_budget = 0;
  std::uint32_t num_images = 0;
  std::uint64_t size_bytes = 0;
  // Ended early by CancelVideo.
  bool cancelled = false;
};

struct AutoExposureDescriptor {
  std::string mode; // "once" | "continuous"
  bool auto_exposure_enabled = false;
  double exposure_ms = 0.0;
};

// Stored settings after a change; reported on partial failure too, so the
// caller sees which fields took effect.
struct SettingsDescriptor {
  settings::CaptureSettings applied;
};

// Explicit outcome of one exclusive operation. `message` is the
// FormatError contract text on failure.
struct OperationResult {
  bool ok = false;
  core::errors::ErrorKind kind = core::errors::ErrorKind::kNone;
  std::string message;
  std::variant<std::monostate, SnapshotDescriptor, VideoDescriptor, AutoExposureDescriptor,
               SettingsDescriptor>
      descriptor;
};

OperationResult Failure(core::errors::ErrorKind kind, std::string_view operation,
                        std::string_view detail);

// Success: {"success":true, ...descriptor fields}
// Failure: {"success":false,"error":{"code":"BUSY","message":"..."}}, plus
// "settings" when a settings change carries its applied values.
std::string ToJson(const OperationResult& result);

} // namespace scopecam::exclusive
