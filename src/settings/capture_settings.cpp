#include "settings/capture_settings.hpp"

#include "core/json_utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace scopecam::settings {

double ClampToBounds(const FeatureBounds& bounds, const double value) {
  if (!bounds.supported || !std::isfinite(bounds.min) || !std::isfinite(bounds.max) ||
      bounds.min > bounds.max) {
    return value;
  }
  return std::clamp(value, bounds.min, bounds.max);
}

std::string ToJson(const CaptureSettings& settings, const bool connected, const bool streaming) {
  std::ostringstream out;
  out << "{"
      << "\"exposure\":" << core::FormatJsonNumber(settings.exposure_ms) << ","
      << "\"exposureMin\":" << core::FormatJsonNumber(settings.exposure_bounds.min) << ","
      << "\"exposureMax\":" << core::FormatJsonNumber(settings.exposure_bounds.max) << ","
      << "\"gain\":" << core::FormatJsonNumber(settings.gain) << ","
      << "\"gainMin\":" << core::FormatJsonNumber(settings.gain_bounds.min) << ","
      << "\"gainMax\":" << core::FormatJsonNumber(settings.gain_bounds.max) << ","
      << "\"gamma\":" << core::FormatJsonNumber(settings.gamma) << ","
      << "\"gammaMin\":" << core::FormatJsonNumber(settings.gamma_bounds.min) << ","
      << "\"gammaMax\":" << core::FormatJsonNumber(settings.gamma_bounds.max) << ","
      << "\"gammaSupported\":" << core::JsonBool(settings.gamma_bounds.supported) << ","
      << "\"autoExposure\":" << core::JsonBool(settings.auto_exposure_enabled) << ","
      << "\"autoExposureSupported\":" << core::JsonBool(settings.auto_exposure_supported) << ","
      << "\"resolution\":{\"width\":" << settings.width << ",\"height\":" << settings.height
      << "},"
      << "\"connected\":" << core::JsonBool(connected) << ","
      << "\"streaming\":" << core::JsonBool(streaming) << "}";
  return out.str();
}

} // namespace scopecam::settings
