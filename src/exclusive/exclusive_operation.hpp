#pragma once

#include "settings/capture_settings.hpp"

#include <cstdint>
#include <variant>

namespace scopecam::exclusive {

// Still image with optional setting overrides applied first (they persist).
struct Snapshot {
  settings::SettingsUpdate overrides;
};

struct VideoRecording {
  double duration_s = 0.0;
  double playback_fps = 25.0;
  std::uint32_t decimation = 1;
};

struct AutoExposureOnce {};

struct AutoExposureContinuous {
  bool enable = false;
};

// Manual settings write; arbitrated like the other operations because it
// issues device calls.
struct SettingsChange {
  settings::SettingsUpdate update;
};

using ExclusiveOperation =
    std::variant<Snapshot, VideoRecording, AutoExposureOnce, AutoExposureContinuous,
                 SettingsChange>;

// Short label used in logs and error messages, e.g. "snapshot".
const char* OperationName(const ExclusiveOperation& operation);

// Encoded-image budget for a clip: floor(duration * device_fps / decimation),
// at least 1. Returns 0 for non-positive or non-finite inputs.
std::uint32_t ComputeClipFrameBudget(double duration_s, double device_fps,
                                     std::uint32_t decimation);

} // namespace scopecam::exclusive
