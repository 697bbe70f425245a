#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace scopecam::core::config {

// Timing knobs for the streaming engine's polling and pacing.
struct EngineTimings {
  std::chrono::milliseconds frame_interval{33};
  std::chrono::milliseconds pause_grace{100};
  std::chrono::milliseconds paused_idle_wait{50};
  std::chrono::milliseconds failure_delay{100};
  std::chrono::milliseconds start_settle_timeout{3'000};
};

// Timing knobs for exclusive-operation completion polls.
struct ExclusiveTimings {
  std::chrono::milliseconds auto_exposure_poll_interval{100};
  std::chrono::milliseconds auto_exposure_timeout{5'000};
  // Added on top of the nominal clip duration before a clip wait times out.
  std::chrono::milliseconds clip_completion_margin{10'000};
};

// Process-level configuration for one camera service instance.
//
// Defaults are usable as-is; environment variables (`SCOPECAM_*`) override
// the defaults and CLI flags override the environment.
struct ServiceConfig {
  std::string camera_serial; // empty => first available camera
  bool force_simulated = false;
  std::filesystem::path capture_dir = "captures";

  int stream_jpeg_quality = 85;
  int snapshot_jpeg_quality = 95;

  double default_exposure_ms = 100.0;
  double default_gain = 1.0;

  std::uint32_t simulated_width = 1280;
  std::uint32_t simulated_height = 1024;
  double simulated_frame_rate_fps = 30.0;

  std::uint32_t device_worker_threads = 2;

  EngineTimings engine;
  ExclusiveTimings exclusive;

  logging::LogLevel log_level = logging::LogLevel::kInfo;
};

// Reads `SCOPECAM_*` variables through `lookup` (defaults to std::getenv).
// Unset variables keep the existing value; malformed ones fail with an
// actionable error naming the variable.
using EnvLookup = std::function<const char*(const char*)>;
bool ApplyEnvironment(ServiceConfig& config, std::string& error, const EnvLookup& lookup = {});

// Applies one `key=value` style override (keys match CLI flag names without
// the leading dashes, e.g. "capture-dir").
bool ApplyOverride(ServiceConfig& config, std::string_view key, std::string_view value,
                   std::string& error);

// Range checks shared by every loading path.
bool ValidateServiceConfig(const ServiceConfig& config, std::string& error);

} // namespace scopecam::core::config
