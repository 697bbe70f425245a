#pragma once

#include "core/errors/error_kind.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace scopecam::device {

// Outcome classification for every adapter call.
//
// `kAlreadyInState` covers "already streaming"/"already stopped" replies and
// counts as success. `kTransient` means the same call may be retried.
enum class DeviceStatus {
  kOk = 0,
  kAlreadyInState,
  kTransient,
  kFatal,
  kNotFound,
  kUnsupported,
};

const char* ToString(DeviceStatus status);

inline bool IsSuccess(DeviceStatus status) {
  return status == DeviceStatus::kOk || status == DeviceStatus::kAlreadyInState;
}

// Maps a device status onto the service-wide error taxonomy.
core::errors::ErrorKind ToErrorKind(DeviceStatus status);

enum class Feature {
  kExposure = 0,
  kGain,
  kGamma,
  kFrameRate,
};

const char* ToString(Feature feature);

enum class FeatureMode {
  kManual = 0,
  kAuto,
  kOnePush,
};

const char* ToString(FeatureMode mode);

// Device-reported bounds. Exposure values are milliseconds at this boundary.
struct FeatureRange {
  double min = 0.0;
  double max = 0.0;
  bool supported = false;
  // Device accepts Auto and OnePush modes for this feature.
  bool supports_auto = false;
};

struct FeatureReading {
  double value = 0.0;
  FeatureMode mode = FeatureMode::kManual;
  // Set while a OnePush adjustment is still running on the device.
  bool one_push_active = false;
};

struct FrameGeometry {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::uint32_t bytes_per_pixel = 0;

  std::size_t BufferSize() const {
    return static_cast<std::size_t>(width) * height * bytes_per_pixel;
  }

  bool Valid() const {
    return width > 0U && height > 0U && bytes_per_pixel > 0U;
  }
};

// One raw frame as delivered by the device. `descriptor` is an opaque vendor
// blob the same adapter needs again in `FormatImage`.
struct RawFrame {
  FrameGeometry geometry;
  std::vector<std::uint8_t> buffer;
  std::vector<std::uint8_t> descriptor;
};

struct ClipRequest {
  // Number of encoded images requested from the device.
  std::uint32_t frame_budget = 0;
  std::uint32_t decimation = 1;
  double playback_fps = 25.0;
  std::filesystem::path intermediate_path;
};

struct ClipCompletion {
  DeviceStatus status = DeviceStatus::kOk;
  std::uint32_t frames_captured = 0;
  // True when the capture ended before the budget (stream stopped).
  bool aborted = false;
  std::string detail;
};

using ClipCallback = std::function<void(const ClipCompletion&)>;

// Opaque capability surface of the image sensor.
//
// Contract goals:
// - every call may block, callers dispatch through `DeviceExecutor`
// - failures are classified, never thrown
// - `StartStream`/`StopStream` are idempotent (kAlreadyInState)
// - one logical actor issues calls at a time; implementations need no
//   internal serialization beyond what clip callbacks require
class IDeviceAdapter {
public:
  virtual ~IDeviceAdapter() = default;

  // True for the synthetic implementation.
  virtual bool IsSimulated() const = 0;

  virtual DeviceStatus Initialize(std::string_view serial, std::string& error) = 0;
  virtual void Uninitialize() = 0;

  virtual DeviceStatus GetFeatureRange(Feature feature, FeatureRange& range,
                                       std::string& error) = 0;
  virtual DeviceStatus GetFeature(Feature feature, FeatureReading& reading,
                                  std::string& error) = 0;
  virtual DeviceStatus SetFeature(Feature feature, FeatureMode mode, double value,
                                  std::string& error) = 0;

  virtual DeviceStatus StartStream(std::string& error) = 0;
  virtual DeviceStatus StopStream(std::string& error) = 0;

  // Derived from ROI and pixel-addressing features.
  virtual DeviceStatus ComputeGeometry(FrameGeometry& geometry, std::string& error) = 0;

  // `frame.buffer` arrives sized to `frame.geometry.BufferSize()`.
  virtual DeviceStatus GetNextFrame(RawFrame& frame, std::string& error) = 0;

  // Converts a raw frame into packed RGB24 (width*height*3 bytes).
  virtual DeviceStatus FormatImage(const RawFrame& frame, std::vector<std::uint8_t>& rgb24,
                                   std::string& error) = 0;

  // Starts an asynchronous encoded-clip capture. `on_complete` is invoked
  // exactly once from a device-owned thread when the returned status is a
  // success; otherwise it is never invoked.
  virtual DeviceStatus StartEncodedClip(const ClipRequest& request, ClipCallback on_complete,
                                        std::string& error) = 0;

  // Converts the intermediate clip into the delivery container.
  virtual DeviceStatus TranscodeClip(const std::filesystem::path& intermediate,
                                     const std::filesystem::path& delivery, double playback_fps,
                                     std::string& error) = 0;

  // File extension (with dot) of the intermediate clip written by
  // `StartEncodedClip`.
  virtual std::string IntermediateClipExtension() const = 0;
};

} // namespace scopecam::device
