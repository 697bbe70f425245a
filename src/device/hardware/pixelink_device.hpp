#pragma once

#include "device/device_adapter.hpp"

#include <mutex>
#include <string>

namespace scopecam::device::hardware {

// True when the vendor SDK was found and compiled in
// (SCOPECAM_ENABLE_PIXELINK=ON).
bool IsPixelinkSupportCompiled();

// Vendor-SDK backed device adapter.
//
// Why this exists:
// - isolates every vendor call and return-code quirk behind IDeviceAdapter
// - converts exposure between the SDK's seconds and the service's
//   milliseconds in exactly one place
// - in builds without the SDK every call reports kNotFound, so the factory
//   falls back to the simulated source
class PixelinkDevice final : public IDeviceAdapter {
public:
  PixelinkDevice() = default;
  ~PixelinkDevice() override;

  PixelinkDevice(const PixelinkDevice&) = delete;
  PixelinkDevice& operator=(const PixelinkDevice&) = delete;

  bool IsSimulated() const override {
    return false;
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
    return ".h264";
  }

  // Invoked by the SDK's clip termination hook.
  void OnClipTerminated(std::uint32_t frames_captured, bool success, bool stream_stopped,
                        long return_code);

private:
  void* handle_ = nullptr;

  std::mutex clip_mu_;
  ClipCallback clip_callback_;
  std::uint32_t clip_frame_budget_ = 0;
};

} // namespace scopecam::device::hardware
