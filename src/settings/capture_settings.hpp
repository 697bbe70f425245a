#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace scopecam::settings {

struct FeatureBounds {
  double min = 0.0;
  double max = 0.0;
  bool supported = false;
};

// Current sensor settings plus the device-reported bounds they are clamped
// to. Exposure is milliseconds.
struct CaptureSettings {
  double exposure_ms = 100.0;
  double gain = 1.0;
  double gamma = 1.0;
  bool auto_exposure_enabled = false;

  FeatureBounds exposure_bounds;
  FeatureBounds gain_bounds;
  FeatureBounds gamma_bounds;
  bool auto_exposure_supported = false;

  std::uint32_t width = 0;
  std::uint32_t height = 0;
};

// Partial update; absent fields are left untouched.
struct SettingsUpdate {
  std::optional<double> exposure_ms;
  std::optional<double> gain;
  std::optional<double> gamma;

  bool empty() const {
    return !exposure_ms.has_value() && !gain.has_value() && !gamma.has_value();
  }
};

// Clamps `value` into `bounds` when the bounds are usable; otherwise returns
// `value` unchanged.
double ClampToBounds(const FeatureBounds& bounds, double value);

// Settings object as served to clients:
// {"exposure":..,"exposureMin":..,"exposureMax":..,"gain":..,...,
//  "resolution":{"width":W,"height":H},"connected":..,"streaming":..}
std::string ToJson(const CaptureSettings& settings, bool connected, bool streaming);

} // namespace scopecam::settings
