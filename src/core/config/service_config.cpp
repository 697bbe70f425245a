#include "core/config/service_config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>

namespace scopecam::core::config {

namespace {

constexpr std::array<std::string_view, 20> kOverrideKeys = {
    "serial",           "simulate",        "capture-dir",     "stream-quality",
    "snapshot-quality", "exposure-ms",     "gain",            "sim-width",
    "sim-height",       "sim-fps",         "device-workers",  "frame-interval-ms",
    "pause-grace-ms",   "paused-wait-ms",  "failure-delay-ms", "start-settle-ms",
    "ae-poll-ms",       "ae-timeout-ms",   "clip-margin-ms",  "log-level",
};

std::string ToEnvName(std::string_view key) {
  std::string name = "SCOPECAM_";
  for (const char c : key) {
    name.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return name;
}

bool ParseUInt32(std::string_view raw, std::uint32_t& parsed) {
  if (raw.empty()) {
    return false;
  }
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  return ec == std::errc() && ptr == end;
}

bool ParseInt(std::string_view raw, int& parsed) {
  if (raw.empty()) {
    return false;
  }
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  return ec == std::errc() && ptr == end;
}

bool ParseFiniteDouble(std::string_view raw, double& parsed) {
  if (raw.empty()) {
    return false;
  }
  const std::string value(raw);
  char* parse_end = nullptr;
  parsed = std::strtod(value.c_str(), &parse_end);
  return parse_end != nullptr && *parse_end == '\0' && std::isfinite(parsed);
}

bool ParseBool(std::string_view raw, bool& parsed) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
    parsed = true;
    return true;
  }
  if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
    parsed = false;
    return true;
  }
  return false;
}

bool ParseMillis(std::string_view key, std::string_view raw, std::chrono::milliseconds& out,
                 std::string& error) {
  std::uint32_t parsed = 0;
  if (!ParseUInt32(raw, parsed)) {
    error = "invalid value for " + std::string(key) + ": '" + std::string(raw) +
            "' (expected non-negative integer milliseconds)";
    return false;
  }
  out = std::chrono::milliseconds(parsed);
  return true;
}

std::string InvalidValue(std::string_view key, std::string_view raw, std::string_view expected) {
  return "invalid value for " + std::string(key) + ": '" + std::string(raw) + "' (expected " +
         std::string(expected) + ")";
}

} // namespace

bool ApplyOverride(ServiceConfig& config, std::string_view key, std::string_view value,
                   std::string& error) {
  error.clear();

  if (key == "serial") {
    config.camera_serial = std::string(value);
    return true;
  }
  if (key == "simulate") {
    if (!ParseBool(value, config.force_simulated)) {
      error = InvalidValue(key, value, "true|false");
      return false;
    }
    return true;
  }
  if (key == "capture-dir") {
    if (value.empty()) {
      error = "capture-dir cannot be empty";
      return false;
    }
    config.capture_dir = std::filesystem::path(std::string(value));
    return true;
  }
  if (key == "stream-quality" || key == "snapshot-quality") {
    int parsed = 0;
    if (!ParseInt(value, parsed)) {
      error = InvalidValue(key, value, "integer 1..100");
      return false;
    }
    (key == "stream-quality" ? config.stream_jpeg_quality : config.snapshot_jpeg_quality) = parsed;
    return true;
  }
  if (key == "exposure-ms" || key == "gain" || key == "sim-fps") {
    double parsed = 0.0;
    if (!ParseFiniteDouble(value, parsed)) {
      error = InvalidValue(key, value, "finite number");
      return false;
    }
    if (key == "exposure-ms") {
      config.default_exposure_ms = parsed;
    } else if (key == "gain") {
      config.default_gain = parsed;
    } else {
      config.simulated_frame_rate_fps = parsed;
    }
    return true;
  }
  if (key == "sim-width" || key == "sim-height" || key == "device-workers") {
    std::uint32_t parsed = 0;
    if (!ParseUInt32(value, parsed)) {
      error = InvalidValue(key, value, "non-negative integer");
      return false;
    }
    if (key == "sim-width") {
      config.simulated_width = parsed;
    } else if (key == "sim-height") {
      config.simulated_height = parsed;
    } else {
      config.device_worker_threads = parsed;
    }
    return true;
  }
  if (key == "frame-interval-ms") {
    return ParseMillis(key, value, config.engine.frame_interval, error);
  }
  if (key == "pause-grace-ms") {
    return ParseMillis(key, value, config.engine.pause_grace, error);
  }
  if (key == "paused-wait-ms") {
    return ParseMillis(key, value, config.engine.paused_idle_wait, error);
  }
  if (key == "failure-delay-ms") {
    return ParseMillis(key, value, config.engine.failure_delay, error);
  }
  if (key == "start-settle-ms") {
    return ParseMillis(key, value, config.engine.start_settle_timeout, error);
  }
  if (key == "ae-poll-ms") {
    return ParseMillis(key, value, config.exclusive.auto_exposure_poll_interval, error);
  }
  if (key == "ae-timeout-ms") {
    return ParseMillis(key, value, config.exclusive.auto_exposure_timeout, error);
  }
  if (key == "clip-margin-ms") {
    return ParseMillis(key, value, config.exclusive.clip_completion_margin, error);
  }
  if (key == "log-level") {
    return logging::ParseLogLevel(value, config.log_level, error);
  }

  error = "unknown config key: " + std::string(key);
  return false;
}

bool ApplyEnvironment(ServiceConfig& config, std::string& error, const EnvLookup& lookup) {
  error.clear();
  for (const std::string_view key : kOverrideKeys) {
    const std::string env_name = ToEnvName(key);
    const char* raw = lookup ? lookup(env_name.c_str()) : std::getenv(env_name.c_str());
    if (raw == nullptr || *raw == '\0') {
      continue;
    }
    std::string override_error;
    if (!ApplyOverride(config, key, raw, override_error)) {
      error = env_name + ": " + override_error;
      return false;
    }
  }
  return true;
}

bool ValidateServiceConfig(const ServiceConfig& config, std::string& error) {
  const auto quality_ok = [](const int quality) { return quality >= 1 && quality <= 100; };
  if (!quality_ok(config.stream_jpeg_quality)) {
    error = "stream-quality must be in 1..100";
    return false;
  }
  if (!quality_ok(config.snapshot_jpeg_quality)) {
    error = "snapshot-quality must be in 1..100";
    return false;
  }
  if (config.default_exposure_ms <= 0.0) {
    error = "exposure-ms must be > 0";
    return false;
  }
  if (config.default_gain < 0.0) {
    error = "gain must be >= 0";
    return false;
  }
  if (config.simulated_width == 0U || config.simulated_height == 0U) {
    error = "sim-width and sim-height must be > 0";
    return false;
  }
  if (config.simulated_frame_rate_fps <= 0.0) {
    error = "sim-fps must be > 0";
    return false;
  }
  if (config.device_worker_threads == 0U) {
    error = "device-workers must be >= 1";
    return false;
  }
  if (config.engine.frame_interval.count() == 0) {
    error = "frame-interval-ms must be > 0";
    return false;
  }
  if (config.exclusive.auto_exposure_poll_interval.count() == 0) {
    error = "ae-poll-ms must be > 0";
    return false;
  }
  if (config.exclusive.auto_exposure_timeout < config.exclusive.auto_exposure_poll_interval) {
    error = "ae-timeout-ms must be >= ae-poll-ms";
    return false;
  }
  error.clear();
  return true;
}

} // namespace scopecam::core::config
