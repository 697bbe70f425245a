#include "settings/capture_settings.hpp"

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>

using scopecam::settings::CaptureSettings;
using scopecam::settings::ClampToBounds;
using scopecam::settings::FeatureBounds;

TEST_CASE("ClampToBounds keeps values inside supported bounds", "[settings]") {
  const FeatureBounds gain{.min = 0.0, .max = 24.0, .supported = true};
  REQUIRE(ClampToBounds(gain, -3.0) == 0.0);
  REQUIRE(ClampToBounds(gain, 30.0) == 24.0);
  REQUIRE(ClampToBounds(gain, 6.0) == 6.0);
}

TEST_CASE("ClampToBounds passes values through unusable bounds", "[settings]") {
  const FeatureBounds unsupported{.min = 0.0, .max = 1.0, .supported = false};
  REQUIRE(ClampToBounds(unsupported, 5.0) == 5.0);

  const FeatureBounds inverted{.min = 4.0, .max = 1.0, .supported = true};
  REQUIRE(ClampToBounds(inverted, 5.0) == 5.0);

  const FeatureBounds unbounded{
      .min = 0.0, .max = std::numeric_limits<double>::infinity(), .supported = true};
  REQUIRE(ClampToBounds(unbounded, 5.0) == 5.0);
}

TEST_CASE("SettingsUpdate is empty only without fields", "[settings]") {
  scopecam::settings::SettingsUpdate update;
  REQUIRE(update.empty());
  update.gamma = 1.2;
  REQUIRE_FALSE(update.empty());
}

TEST_CASE("Settings JSON uses client field names", "[settings][json]") {
  CaptureSettings settings;
  settings.exposure_ms = 25.0;
  settings.exposure_bounds = {.min = 0.1, .max = 2000.0, .supported = true};
  settings.gain = 2.0;
  settings.gain_bounds = {.min = 0.0, .max = 24.0, .supported = true};
  settings.gamma = 1.0;
  settings.gamma_bounds = {.min = 0.1, .max = 4.0, .supported = true};
  settings.auto_exposure_supported = true;
  settings.width = 640U;
  settings.height = 480U;

  const std::string json = scopecam::settings::ToJson(settings, true, false);
  REQUIRE(json ==
          R"({"exposure":25,"exposureMin":0.1,"exposureMax":2000,"gain":2,"gainMin":0,)"
          R"("gainMax":24,"gamma":1,"gammaMin":0.1,"gammaMax":4,"gammaSupported":true,)"
          R"("autoExposure":false,"autoExposureSupported":true,)"
          R"("resolution":{"width":640,"height":480},"connected":true,"streaming":false})");
}
