#include "settings/settings_store.hpp"

#include "core/json_utils.hpp"

#include <cmath>

namespace scopecam::settings {

namespace {

FeatureBounds ToBounds(const device::FeatureRange& range) {
  return FeatureBounds{.min = range.min, .max = range.max, .supported = range.supported};
}

} // namespace

SettingsStore::SettingsStore(device::IDeviceAdapter& adapter, device::DeviceExecutor& executor,
                             core::logging::Logger& logger)
    : adapter_(adapter), executor_(executor), logger_(logger) {}

bool SettingsStore::LoadFromDevice(std::string& error) {
  CaptureSettings loaded;

  const auto load_feature = [&](const device::Feature feature, FeatureBounds& bounds,
                                double& value, bool* supports_auto,
                                bool* auto_enabled) -> bool {
    device::FeatureRange range;
    std::string call_error;
    device::DeviceStatus status = executor_.Run(
        [&]() { return adapter_.GetFeatureRange(feature, range, call_error); });
    if (status == device::DeviceStatus::kUnsupported) {
      bounds = FeatureBounds{};
      return true;
    }
    if (!device::IsSuccess(status)) {
      error = std::string("failed to query range for ") + device::ToString(feature) + ": " +
              call_error;
      return false;
    }
    bounds = ToBounds(range);
    if (supports_auto != nullptr) {
      *supports_auto = range.supports_auto;
    }
    if (!range.supported) {
      return true;
    }

    device::FeatureReading reading;
    status = executor_.Run([&]() { return adapter_.GetFeature(feature, reading, call_error); });
    if (!device::IsSuccess(status)) {
      error = std::string("failed to read ") + device::ToString(feature) + ": " + call_error;
      return false;
    }
    value = reading.value;
    if (auto_enabled != nullptr) {
      *auto_enabled = reading.mode == device::FeatureMode::kAuto;
    }
    return true;
  };

  if (!load_feature(device::Feature::kExposure, loaded.exposure_bounds, loaded.exposure_ms,
                    &loaded.auto_exposure_supported, &loaded.auto_exposure_enabled) ||
      !load_feature(device::Feature::kGain, loaded.gain_bounds, loaded.gain, nullptr, nullptr) ||
      !load_feature(device::Feature::kGamma, loaded.gamma_bounds, loaded.gamma, nullptr,
                    nullptr)) {
    return false;
  }

  device::FrameGeometry geometry;
  std::string geometry_error;
  const device::DeviceStatus geometry_status = executor_.Run(
      [&]() { return adapter_.ComputeGeometry(geometry, geometry_error); });
  if (device::IsSuccess(geometry_status)) {
    loaded.width = geometry.width;
    loaded.height = geometry.height;
  } else {
    logger_.Warn("settings load could not read frame geometry", {{"error", geometry_error}});
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    settings_ = loaded;
  }

  logger_.Info("settings loaded from device",
               {{"exposure_ms", core::FormatJsonNumber(loaded.exposure_ms)},
                {"gain", core::FormatJsonNumber(loaded.gain)},
                {"gamma_supported", core::JsonBool(loaded.gamma_bounds.supported)},
                {"auto_exposure_supported", core::JsonBool(loaded.auto_exposure_supported)}});
  error.clear();
  return true;
}

CaptureSettings SettingsStore::Get() const {
  std::lock_guard<std::mutex> lock(mu_);
  return settings_;
}

double SettingsStore::Clamp(const device::Feature feature, const double value) const {
  std::lock_guard<std::mutex> lock(mu_);
  switch (feature) {
  case device::Feature::kExposure:
    return ClampToBounds(settings_.exposure_bounds, value);
  case device::Feature::kGain:
    return ClampToBounds(settings_.gain_bounds, value);
  case device::Feature::kGamma:
    return ClampToBounds(settings_.gamma_bounds, value);
  case device::Feature::kFrameRate:
    break;
  }
  return value;
}

bool SettingsStore::Update(const SettingsUpdate& update, CaptureSettings& applied,
                           core::errors::ErrorKind& failure_kind, std::string& error) {
  failure_kind = core::errors::ErrorKind::kNone;
  error.clear();

  bool ok = true;
  std::string field_error;
  core::errors::ErrorKind field_kind = core::errors::ErrorKind::kNone;
  const auto apply = [&](const device::Feature feature, const std::optional<double>& requested,
                         double CaptureSettings::*member) {
    if (!requested.has_value()) {
      return;
    }
    double stored = 0.0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      stored = settings_.*member;
    }
    if (ApplyFeature(feature, requested.value(), stored, field_kind, field_error)) {
      std::lock_guard<std::mutex> lock(mu_);
      settings_.*member = stored;
      return;
    }
    if (ok) {
      failure_kind = field_kind;
      error = field_error;
    } else {
      error += "; " + field_error;
    }
    ok = false;
  };

  apply(device::Feature::kExposure, update.exposure_ms, &CaptureSettings::exposure_ms);
  apply(device::Feature::kGain, update.gain, &CaptureSettings::gain);
  apply(device::Feature::kGamma, update.gamma, &CaptureSettings::gamma);

  if (update.exposure_ms.has_value() && ok) {
    // A manual exposure write leaves continuous auto-exposure.
    std::lock_guard<std::mutex> lock(mu_);
    settings_.auto_exposure_enabled = false;
  }

  applied = Get();
  return ok;
}

bool SettingsStore::ApplyFeature(const device::Feature feature, const double requested,
                                 double& stored, core::errors::ErrorKind& failure_kind,
                                 std::string& error) {
  if (!std::isfinite(requested)) {
    failure_kind = core::errors::ErrorKind::kInvalidArgument;
    error = std::string(device::ToString(feature)) + " must be a finite number";
    return false;
  }

  FeatureBounds bounds;
  {
    std::lock_guard<std::mutex> lock(mu_);
    switch (feature) {
    case device::Feature::kExposure:
      bounds = settings_.exposure_bounds;
      break;
    case device::Feature::kGain:
      bounds = settings_.gain_bounds;
      break;
    case device::Feature::kGamma:
      bounds = settings_.gamma_bounds;
      break;
    case device::Feature::kFrameRate:
      bounds.supported = true;
      break;
    }
  }
  if (!bounds.supported) {
    failure_kind = core::errors::ErrorKind::kUnsupported;
    error = std::string(device::ToString(feature)) + " is not supported by this camera";
    return false;
  }

  const double clamped = ClampToBounds(bounds, requested);
  std::string call_error;
  const device::DeviceStatus status = executor_.Run([&]() {
    return adapter_.SetFeature(feature, device::FeatureMode::kManual, clamped, call_error);
  });
  if (!device::IsSuccess(status)) {
    failure_kind = device::ToErrorKind(status);
    error = std::string("failed to set ") + device::ToString(feature) + ": " + call_error;
    logger_.Warn("settings write rejected; keeping previous value",
                 {{"feature", device::ToString(feature)},
                  {"requested", core::FormatJsonNumber(requested)},
                  {"kept", core::FormatJsonNumber(stored)},
                  {"status", device::ToString(status)},
                  {"error", call_error}});
    return false;
  }

  if (clamped != requested) {
    logger_.Info("settings write clamped to device bounds",
                 {{"feature", device::ToString(feature)},
                  {"requested", core::FormatJsonNumber(requested)},
                  {"applied", core::FormatJsonNumber(clamped)}});
  }
  stored = clamped;
  return true;
}

void SettingsStore::RecordExposure(const double exposure_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  settings_.exposure_ms = exposure_ms;
}

void SettingsStore::RecordAutoExposure(const bool enabled) {
  std::lock_guard<std::mutex> lock(mu_);
  settings_.auto_exposure_enabled = enabled;
}

} // namespace scopecam::settings
