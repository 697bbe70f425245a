#pragma once

#include "device/device_adapter.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace scopecam::device::sim {

struct SimulatedDeviceOptions {
  std::uint32_t width = 1280;
  std::uint32_t height = 1024;
  double frame_rate_fps = 30.0;
  // Sleep one frame period per delivered frame, like a real sensor.
  bool pace_frames = true;
  bool supports_gamma = true;
  bool supports_auto_exposure = true;
  // Exposure polls a OnePush adjustment stays active before it settles.
  std::uint32_t one_push_polls = 3;
  double one_push_result_ms = 25.0;
  double auto_exposure_value_ms = 40.0;
};

struct SetFeatureCall {
  Feature feature = Feature::kExposure;
  FeatureMode mode = FeatureMode::kManual;
  double value = 0.0;
};

// Hardware-free device with the same contract as the vendor adapter.
//
// Frames are the synthetic gradient; setters are recorded and reflected by
// getters so settings flows behave like a real camera. Clip capture runs on
// an internal thread and writes length-prefixed JPEG images as the
// intermediate clip, transcoded to MJPEG AVI with OpenCV.
class SimulatedDevice final : public IDeviceAdapter {
public:
  explicit SimulatedDevice(SimulatedDeviceOptions options = {});
  ~SimulatedDevice() override;

  SimulatedDevice(const SimulatedDevice&) = delete;
  SimulatedDevice& operator=(const SimulatedDevice&) = delete;

  bool IsSimulated() const override {
    return true;
  }

  DeviceStatus Initialize(std::string_view serial, std::string& error) override;
  void Uninitialize() override;

  DeviceStatus GetFeatureRange(Feature feature, FeatureRange& range, std::string& error) override;
  DeviceStatus GetFeature(Feature feature, FeatureReading& reading, std::string& error) override;
  DeviceStatus SetFeature(Feature feature, FeatureMode mode, double value,
                          std::string& error) override;

  DeviceStatus StartStream(std::string& error) override;
  DeviceStatus StopStream(std::string& error) override;

  DeviceStatus ComputeGeometry(FrameGeometry& geometry, std::string& error) override;
  DeviceStatus GetNextFrame(RawFrame& frame, std::string& error) override;
  DeviceStatus FormatImage(const RawFrame& frame, std::vector<std::uint8_t>& rgb24,
                           std::string& error) override;

  DeviceStatus StartEncodedClip(const ClipRequest& request, ClipCallback on_complete,
                                std::string& error) override;
  DeviceStatus TranscodeClip(const std::filesystem::path& intermediate,
                             const std::filesystem::path& delivery, double playback_fps,
                             std::string& error) override;
  std::string IntermediateClipExtension() const override {
    return ".mjpg";
  }

  // Call accounting for tests.
  struct Snapshot {
    bool initialized = false;
    bool streaming = false;
    std::uint64_t start_stream_calls = 0;
    std::uint64_t stop_stream_calls = 0;
    std::uint64_t next_frame_calls = 0;
    std::vector<SetFeatureCall> set_feature_calls;
  };

  Snapshot DebugSnapshot() const;

private:
  struct FeatureState {
    double value = 0.0;
    FeatureMode mode = FeatureMode::kManual;
    FeatureRange range;
  };

  bool IsStreaming() const;
  void RunClipCapture(ClipRequest request, ClipCallback on_complete);
  void JoinClipThread();

  SimulatedDeviceOptions options_;

  mutable std::mutex mu_;
  bool initialized_ = false;
  bool streaming_ = false;
  bool clip_running_ = false;
  std::uint32_t one_push_remaining_ = 0;
  std::map<Feature, FeatureState> features_;
  std::uint64_t start_stream_calls_ = 0;
  std::uint64_t stop_stream_calls_ = 0;
  std::uint64_t next_frame_calls_ = 0;
  std::vector<SetFeatureCall> set_feature_calls_;

  std::thread clip_thread_;
};

} // namespace scopecam::device::sim
