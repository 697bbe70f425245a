#include "core/config/service_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

using scopecam::core::config::ApplyEnvironment;
using scopecam::core::config::ApplyOverride;
using scopecam::core::config::ServiceConfig;
using scopecam::core::config::ValidateServiceConfig;

TEST_CASE("Default service config is valid", "[core][config]") {
  const ServiceConfig config;
  std::string error;
  REQUIRE(ValidateServiceConfig(config, error));
  REQUIRE(config.stream_jpeg_quality == 85);
  REQUIRE(config.snapshot_jpeg_quality == 95);
  REQUIRE(config.capture_dir == std::filesystem::path("captures"));
}

TEST_CASE("Overrides update the matching field", "[core][config]") {
  ServiceConfig config;
  std::string error;

  REQUIRE(ApplyOverride(config, "capture-dir", "/tmp/shots", error));
  REQUIRE(config.capture_dir == std::filesystem::path("/tmp/shots"));

  REQUIRE(ApplyOverride(config, "simulate", "yes", error));
  REQUIRE(config.force_simulated);

  REQUIRE(ApplyOverride(config, "exposure-ms", "12.5", error));
  REQUIRE(config.default_exposure_ms == 12.5);

  REQUIRE(ApplyOverride(config, "ae-timeout-ms", "250", error));
  REQUIRE(config.exclusive.auto_exposure_timeout == std::chrono::milliseconds(250));

  REQUIRE(ApplyOverride(config, "log-level", "debug", error));
  REQUIRE(config.log_level == scopecam::core::logging::LogLevel::kDebug);
}

TEST_CASE("Overrides reject malformed values and unknown keys", "[core][config]") {
  ServiceConfig config;
  std::string error;

  REQUIRE_FALSE(ApplyOverride(config, "stream-quality", "high", error));
  REQUIRE(error.find("stream-quality") != std::string::npos);

  REQUIRE_FALSE(ApplyOverride(config, "frame-interval-ms", "-5", error));
  REQUIRE_FALSE(ApplyOverride(config, "gain", "nan", error));

  REQUIRE_FALSE(ApplyOverride(config, "colour", "blue", error));
  REQUIRE(error.rfind("unknown config key", 0) == 0);
}

TEST_CASE("Environment lookup maps keys to SCOPECAM_ variables", "[core][config]") {
  const std::map<std::string, std::string> env = {
      {"SCOPECAM_SERIAL", "PX-0042"},
      {"SCOPECAM_SIM_WIDTH", "320"},
      {"SCOPECAM_CLIP_MARGIN_MS", "1500"},
      {"SCOPECAM_GAIN", ""},
  };
  const auto lookup = [&env](const char* name) -> const char* {
    const auto it = env.find(name);
    return it == env.end() ? nullptr : it->second.c_str();
  };

  ServiceConfig config;
  std::string error;
  REQUIRE(ApplyEnvironment(config, error, lookup));
  REQUIRE(config.camera_serial == "PX-0042");
  REQUIRE(config.simulated_width == 320U);
  REQUIRE(config.exclusive.clip_completion_margin == std::chrono::milliseconds(1'500));
  // Empty variables are treated as unset.
  REQUIRE(config.default_gain == 1.0);
}

TEST_CASE("Malformed environment values name the variable", "[core][config]") {
  const auto lookup = [](const char* name) -> const char* {
    return std::string(name) == "SCOPECAM_SNAPSHOT_QUALITY" ? "best" : nullptr;
  };
  ServiceConfig config;
  std::string error;
  REQUIRE_FALSE(ApplyEnvironment(config, error, lookup));
  REQUIRE(error.rfind("SCOPECAM_SNAPSHOT_QUALITY: ", 0) == 0);
}

TEST_CASE("Validation enforces ranges", "[core][config]") {
  std::string error;

  ServiceConfig quality;
  quality.snapshot_jpeg_quality = 101;
  REQUIRE_FALSE(ValidateServiceConfig(quality, error));
  REQUIRE(error.find("snapshot-quality") != std::string::npos);

  ServiceConfig exposure;
  exposure.default_exposure_ms = 0.0;
  REQUIRE_FALSE(ValidateServiceConfig(exposure, error));

  ServiceConfig size;
  size.simulated_height = 0U;
  REQUIRE_FALSE(ValidateServiceConfig(size, error));
}
