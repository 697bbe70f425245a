#include "device/hardware/pixelink_device.hpp"

#ifndef SCOPECAM_ENABLE_PIXELINK
#define SCOPECAM_ENABLE_PIXELINK 0
#endif

#if SCOPECAM_ENABLE_PIXELINK
#include <PixeLINKApi.h>
#endif

#include <charconv>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace scopecam::device::hardware {

bool IsPixelinkSupportCompiled() {
#if SCOPECAM_ENABLE_PIXELINK
  return true;
#else
  return false;
#endif
}

#if SCOPECAM_ENABLE_PIXELINK

namespace {

// Return codes the service treats specially.
constexpr PXL_RETURN_CODE kAlreadyStreaming = static_cast<PXL_RETURN_CODE>(0x80000004U);
constexpr PXL_RETURN_CODE kStreamStopped = static_cast<PXL_RETURN_CODE>(0x80000012U);

constexpr float kMillisPerSecond = 1000.0F;
constexpr U32 kClipPlaybackBitRate = 2'000'000U;

// Only one physical camera per process; the termination hook routes here.
std::mutex g_active_clip_mu;
PixelinkDevice* g_active_clip_device = nullptr;

std::string DescribeReturnCode(std::string_view call, PXL_RETURN_CODE rc) {
  return std::string(call) + " failed with return code " +
         std::to_string(static_cast<long long>(rc));
}

U32 ToFeatureId(Feature feature) {
  switch (feature) {
  case Feature::kExposure:
    return FEATURE_EXPOSURE;
  case Feature::kGain:
    return FEATURE_GAIN;
  case Feature::kGamma:
    return FEATURE_GAMMA;
  case Feature::kFrameRate:
    return FEATURE_FRAME_RATE;
  }
  return FEATURE_EXPOSURE;
}

U32 ToFeatureFlags(FeatureMode mode) {
  switch (mode) {
  case FeatureMode::kAuto:
    return FEATURE_FLAG_AUTO;
  case FeatureMode::kOnePush:
    return FEATURE_FLAG_ONEPUSH;
  case FeatureMode::kManual:
  default:
    return FEATURE_FLAG_MANUAL;
  }
}

// SDK exposure unit is seconds; everything above this adapter uses ms.
float ToSdkValue(Feature feature, double value) {
  return feature == Feature::kExposure ? static_cast<float>(value) / kMillisPerSecond
                                       : static_cast<float>(value);
}

double FromSdkValue(Feature feature, float value) {
  return feature == Feature::kExposure ? static_cast<double>(value) * kMillisPerSecond
                                       : static_cast<double>(value);
}

bool BytesPerPixel(U32 pixel_format, std::uint32_t& bytes_per_pixel) {
  switch (pixel_format) {
  case PIXEL_FORMAT_MONO8:
  case PIXEL_FORMAT_BAYER8_GRBG:
  case PIXEL_FORMAT_BAYER8_RGGB:
  case PIXEL_FORMAT_BAYER8_GBRG:
  case PIXEL_FORMAT_BAYER8_BGGR:
    bytes_per_pixel = 1U;
    return true;
  case PIXEL_FORMAT_MONO16:
  case PIXEL_FORMAT_YUV422:
  case PIXEL_FORMAT_BAYER16_GRBG:
  case PIXEL_FORMAT_BAYER16_RGGB:
  case PIXEL_FORMAT_BAYER16_GBRG:
  case PIXEL_FORMAT_BAYER16_BGGR:
    bytes_per_pixel = 2U;
    return true;
  case PIXEL_FORMAT_RGB24:
    bytes_per_pixel = 3U;
    return true;
  case PIXEL_FORMAT_RGB48:
    bytes_per_pixel = 6U;
    return true;
  default:
    return false;
  }
}

U32 PXL_APICALL ClipTerminationHook(HANDLE /*camera*/, U32 frames_captured,
                                    PXL_RETURN_CODE rc) {
  std::lock_guard<std::mutex> lock(g_active_clip_mu);
  if (g_active_clip_device != nullptr) {
    g_active_clip_device->OnClipTerminated(frames_captured, API_SUCCESS(rc), rc == kStreamStopped,
                                           static_cast<long>(rc));
    g_active_clip_device = nullptr;
  }
  return ApiSuccess;
}

} // namespace

PixelinkDevice::~PixelinkDevice() {
  Uninitialize();
}

DeviceStatus PixelinkDevice::Initialize(std::string_view serial, std::string& error) {
  if (handle_ != nullptr) {
    error.clear();
    return DeviceStatus::kAlreadyInState;
  }

  U32 serial_number = 0;
  if (!serial.empty()) {
    const auto [ptr, ec] = std::from_chars(serial.data(), serial.data() + serial.size(),
                                           serial_number);
    if (ec != std::errc() || ptr != serial.data() + serial.size()) {
      error = "camera serial must be numeric: " + std::string(serial);
      return DeviceStatus::kNotFound;
    }
  }

  HANDLE camera = nullptr;
  const PXL_RETURN_CODE rc = PxLInitialize(serial_number, &camera);
  if (!API_SUCCESS(rc)) {
    error = DescribeReturnCode("PxLInitialize", rc);
    return DeviceStatus::kNotFound;
  }
  handle_ = camera;
  error.clear();
  return DeviceStatus::kOk;
}

void PixelinkDevice::Uninitialize() {
  if (handle_ == nullptr) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(g_active_clip_mu);
    if (g_active_clip_device == this) {
      g_active_clip_device = nullptr;
    }
  }
  (void)PxLSetStreamState(handle_, STOP_STREAM);
  (void)PxLUninitialize(handle_);
  handle_ = nullptr;
}

DeviceStatus PixelinkDevice::GetFeatureRange(const Feature feature, FeatureRange& range,
                                             std::string& error) {
  if (handle_ == nullptr) {
    error = "camera is not initialized";
    return DeviceStatus::kNotFound;
  }

  const U32 feature_id = ToFeatureId(feature);
  U32 buffer_size = 0;
  PXL_RETURN_CODE rc = PxLGetCameraFeatures(handle_, feature_id, nullptr, &buffer_size);
  if (!API_SUCCESS(rc) || buffer_size == 0U) {
    error = DescribeReturnCode("PxLGetCameraFeatures(size)", rc);
    return DeviceStatus::kFatal;
  }

  std::vector<std::uint8_t> storage(buffer_size);
  auto* features = reinterpret_cast<CAMERA_FEATURES*>(storage.data());
  rc = PxLGetCameraFeatures(handle_, feature_id, features, &buffer_size);
  if (!API_SUCCESS(rc)) {
    error = DescribeReturnCode("PxLGetCameraFeatures", rc);
    return DeviceStatus::kFatal;
  }

  range = FeatureRange{};
  if (features->uNumberOfFeatures == 0U || features->pFeatures == nullptr) {
    error.clear();
    return DeviceStatus::kOk;
  }
  const FEATURE_DESC& desc = features->pFeatures[0];
  range.supported = (desc.uFlags & FEATURE_FLAG_PRESENCE) != 0U;
  range.supports_auto =
      range.supported && (desc.uFlags & (FEATURE_FLAG_AUTO | FEATURE_FLAG_ONEPUSH)) != 0U;
  if (range.supported && desc.uNumberOfParameters > 0U && desc.pParams != nullptr) {
    range.min = FromSdkValue(feature, desc.pParams[0].fMinValue);
    range.max = FromSdkValue(feature, desc.pParams[0].fMaxValue);
  }
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus PixelinkDevice::GetFeature(const Feature feature, FeatureReading& reading,
                                        std::string& error) {
  if (handle_ == nullptr) {
    error = "camera is not initialized";
    return DeviceStatus::kNotFound;
  }

  U32 flags = 0;
  U32 num_params = 1;
  float value = 0.0F;
  const PXL_RETURN_CODE rc = PxLGetFeature(handle_, ToFeatureId(feature), &flags, &num_params,
                                           &value);
  if (!API_SUCCESS(rc)) {
    error = DescribeReturnCode("PxLGetFeature", rc);
    return DeviceStatus::kFatal;
  }

  reading.value = FromSdkValue(feature, value);
  reading.one_push_active = (flags & FEATURE_FLAG_ONEPUSH) != 0U;
  if (reading.one_push_active) {
    reading.mode = FeatureMode::kOnePush;
  } else if ((flags & FEATURE_FLAG_AUTO) != 0U) {
    reading.mode = FeatureMode::kAuto;
  } else {
    reading.mode = FeatureMode::kManual;
  }
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus PixelinkDevice::SetFeature(const Feature feature, const FeatureMode mode,
                                        const double value, std::string& error) {
  if (handle_ == nullptr) {
    error = "camera is not initialized";
    return DeviceStatus::kNotFound;
  }

  const float sdk_value = ToSdkValue(feature, value);
  const PXL_RETURN_CODE rc =
      PxLSetFeature(handle_, ToFeatureId(feature), ToFeatureFlags(mode), 1U, &sdk_value);
  if (!API_SUCCESS(rc)) {
    error = DescribeReturnCode("PxLSetFeature", rc);
    return DeviceStatus::kFatal;
  }
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus PixelinkDevice::StartStream(std::string& error) {
  if (handle_ == nullptr) {
    error = "camera is not initialized";
    return DeviceStatus::kNotFound;
  }
  const PXL_RETURN_CODE rc = PxLSetStreamState(handle_, START_STREAM);
  if (rc == kAlreadyStreaming) {
    error.clear();
    return DeviceStatus::kAlreadyInState;
  }
  if (!API_SUCCESS(rc)) {
    error = DescribeReturnCode("PxLSetStreamState(START)", rc);
    return DeviceStatus::kFatal;
  }
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus PixelinkDevice::StopStream(std::string& error) {
  if (handle_ == nullptr) {
    error.clear();
    return DeviceStatus::kAlreadyInState;
  }
  const PXL_RETURN_CODE rc = PxLSetStreamState(handle_, STOP_STREAM);
  if (rc == kStreamStopped) {
    error.clear();
    return DeviceStatus::kAlreadyInState;
  }
  if (!API_SUCCESS(rc)) {
    error = DescribeReturnCode("PxLSetStreamState(STOP)", rc);
    return DeviceStatus::kFatal;
  }
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus PixelinkDevice::ComputeGeometry(FrameGeometry& geometry, std::string& error) {
  if (handle_ == nullptr) {
    error = "camera is not initialized";
    return DeviceStatus::kNotFound;
  }

  U32 flags = 0;
  U32 num_params = 4;
  float roi[4] = {};
  PXL_RETURN_CODE rc = PxLGetFeature(handle_, FEATURE_ROI, &flags, &num_params, roi);
  if (!API_SUCCESS(rc)) {
    error = DescribeReturnCode("PxLGetFeature(ROI)", rc);
    return DeviceStatus::kFatal;
  }
  const auto roi_width = static_cast<std::uint32_t>(roi[FEATURE_ROI_PARAM_WIDTH]);
  const auto roi_height = static_cast<std::uint32_t>(roi[FEATURE_ROI_PARAM_HEIGHT]);

  // Older cameras report one addressing value for both axes.
  std::uint32_t addressing_x = 1U;
  std::uint32_t addressing_y = 1U;
  float addressing[4] = {};
  num_params = 4;
  rc = PxLGetFeature(handle_, FEATURE_PIXEL_ADDRESSING, &flags, &num_params, addressing);
  if (API_SUCCESS(rc)) {
    if (num_params >= 4U) {
      addressing_x = static_cast<std::uint32_t>(addressing[FEATURE_PIXEL_ADDRESSING_PARAM_X_VALUE]);
      addressing_y = static_cast<std::uint32_t>(addressing[FEATURE_PIXEL_ADDRESSING_PARAM_Y_VALUE]);
    } else {
      addressing_x = static_cast<std::uint32_t>(addressing[FEATURE_PIXEL_ADDRESSING_PARAM_VALUE]);
      addressing_y = addressing_x;
    }
    addressing_x = addressing_x == 0U ? 1U : addressing_x;
    addressing_y = addressing_y == 0U ? 1U : addressing_y;
  }

  float pixel_format = 0.0F;
  num_params = 1;
  rc = PxLGetFeature(handle_, FEATURE_PIXEL_FORMAT, &flags, &num_params, &pixel_format);
  if (!API_SUCCESS(rc)) {
    error = DescribeReturnCode("PxLGetFeature(PIXEL_FORMAT)", rc);
    return DeviceStatus::kFatal;
  }

  std::uint32_t bytes_per_pixel = 0;
  if (!BytesPerPixel(static_cast<U32>(pixel_format), bytes_per_pixel)) {
    error = "unsupported pixel format " + std::to_string(static_cast<U32>(pixel_format));
    return DeviceStatus::kUnsupported;
  }

  geometry.width = roi_width / addressing_x;
  geometry.height = roi_height / addressing_y;
  geometry.bytes_per_pixel = bytes_per_pixel;
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus PixelinkDevice::GetNextFrame(RawFrame& frame, std::string& error) {
  if (handle_ == nullptr) {
    error = "camera is not initialized";
    return DeviceStatus::kNotFound;
  }

  FRAME_DESC descriptor{};
  descriptor.uSize = sizeof(FRAME_DESC);
  const PXL_RETURN_CODE rc = PxLGetNextFrame(handle_, static_cast<U32>(frame.buffer.size()),
                                             frame.buffer.data(), &descriptor);
  if (rc == kStreamStopped) {
    error = "camera stream stopped";
    return DeviceStatus::kFatal;
  }
  if (rc == ApiNoCameraAvailableError) {
    error = DescribeReturnCode("PxLGetNextFrame", rc);
    return DeviceStatus::kFatal;
  }
  if (!API_SUCCESS(rc)) {
    error = DescribeReturnCode("PxLGetNextFrame", rc);
    return DeviceStatus::kTransient;
  }

  frame.descriptor.resize(sizeof(FRAME_DESC));
  std::memcpy(frame.descriptor.data(), &descriptor, sizeof(FRAME_DESC));
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus PixelinkDevice::FormatImage(const RawFrame& frame, std::vector<std::uint8_t>& rgb24,
                                         std::string& error) {
  if (frame.descriptor.size() != sizeof(FRAME_DESC)) {
    error = "raw frame is missing its vendor descriptor";
    return DeviceStatus::kFatal;
  }

  FRAME_DESC descriptor{};
  std::memcpy(&descriptor, frame.descriptor.data(), sizeof(FRAME_DESC));
  U32 dest_size =
      static_cast<U32>(static_cast<std::size_t>(frame.geometry.width) * frame.geometry.height * 3U);
  rgb24.resize(dest_size);
  const PXL_RETURN_CODE rc =
      PxLFormatImage(const_cast<std::uint8_t*>(frame.buffer.data()), &descriptor,
                     IMAGE_FORMAT_RAW_RGB24, rgb24.data(), &dest_size);
  if (!API_SUCCESS(rc)) {
    error = DescribeReturnCode("PxLFormatImage", rc);
    return DeviceStatus::kFatal;
  }
  rgb24.resize(dest_size);
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus PixelinkDevice::StartEncodedClip(const ClipRequest& request,
                                              ClipCallback on_complete, std::string& error) {
  if (handle_ == nullptr) {
    error = "camera is not initialized";
    return DeviceStatus::kNotFound;
  }

  {
    std::lock_guard<std::mutex> lock(g_active_clip_mu);
    if (g_active_clip_device != nullptr) {
      error = "a clip capture is already in progress";
      return DeviceStatus::kFatal;
    }
    g_active_clip_device = this;
  }
  {
    std::lock_guard<std::mutex> lock(clip_mu_);
    clip_callback_ = std::move(on_complete);
    clip_frame_budget_ = request.frame_budget;
  }

  CLIP_ENCODING_INFO info{};
  info.uStreamEncoding = CLIP_ENCODING_H264;
  info.uDecimationFactor = request.decimation;
  info.playbackFrameRate = static_cast<float>(request.playback_fps);
  info.playbackBitRate = kClipPlaybackBitRate;

  const std::string file_name = request.intermediate_path.string();
  const PXL_RETURN_CODE rc = PxLGetEncodedClip(handle_, request.frame_budget, file_name.c_str(),
                                               &info, ClipTerminationHook);
  if (!API_SUCCESS(rc)) {
    {
      std::lock_guard<std::mutex> lock(g_active_clip_mu);
      g_active_clip_device = nullptr;
    }
    std::lock_guard<std::mutex> lock(clip_mu_);
    clip_callback_ = nullptr;
    error = DescribeReturnCode("PxLGetEncodedClip", rc);
    return DeviceStatus::kFatal;
  }
  error.clear();
  return DeviceStatus::kOk;
}

void PixelinkDevice::OnClipTerminated(const std::uint32_t frames_captured, const bool success,
                                      const bool stream_stopped, const long return_code) {
  ClipCallback callback;
  ClipCompletion completion;
  {
    std::lock_guard<std::mutex> lock(clip_mu_);
    callback = std::move(clip_callback_);
    clip_callback_ = nullptr;
    completion.frames_captured = frames_captured;
    completion.aborted = stream_stopped || frames_captured < clip_frame_budget_;
  }
  if (!success && !stream_stopped) {
    completion.status = DeviceStatus::kFatal;
    completion.detail = "clip capture ended with return code " + std::to_string(return_code);
  }
  if (callback) {
    callback(completion);
  }
}

DeviceStatus PixelinkDevice::TranscodeClip(const std::filesystem::path& intermediate,
                                           const std::filesystem::path& delivery,
                                           const double /*playback_fps*/, std::string& error) {
  // Playback rate is already embedded by PxLGetEncodedClip.
  const std::string input = intermediate.string();
  const std::string output = delivery.string();
  const PXL_RETURN_CODE rc =
      PxLFormatClipEx(input.c_str(), output.c_str(), CLIP_ENCODING_H264, CLIP_FORMAT_AVI);
  if (!API_SUCCESS(rc)) {
    error = DescribeReturnCode("PxLFormatClipEx", rc);
    return DeviceStatus::kFatal;
  }
  error.clear();
  return DeviceStatus::kOk;
}

#else // !SCOPECAM_ENABLE_PIXELINK

namespace {

constexpr const char* kDisabledDetail =
    "PixeLINK SDK support disabled at build time (configure with SCOPECAM_ENABLE_PIXELINK=ON)";

DeviceStatus Disabled(std::string& error) {
  error = kDisabledDetail;
  return DeviceStatus::kNotFound;
}

} // namespace

PixelinkDevice::~PixelinkDevice() = default;

DeviceStatus PixelinkDevice::Initialize(std::string_view /*serial*/, std::string& error) {
  return Disabled(error);
}

void PixelinkDevice::Uninitialize() {}

DeviceStatus PixelinkDevice::GetFeatureRange(Feature /*feature*/, FeatureRange& range,
                                             std::string& error) {
  range = FeatureRange{};
  return Disabled(error);
}

DeviceStatus PixelinkDevice::GetFeature(Feature /*feature*/, FeatureReading& /*reading*/,
                                        std::string& error) {
  return Disabled(error);
}

DeviceStatus PixelinkDevice::SetFeature(Feature /*feature*/, FeatureMode /*mode*/,
                                        double /*value*/, std::string& error) {
  return Disabled(error);
}

DeviceStatus PixelinkDevice::StartStream(std::string& error) {
  return Disabled(error);
}

DeviceStatus PixelinkDevice::StopStream(std::string& error) {
  return Disabled(error);
}

DeviceStatus PixelinkDevice::ComputeGeometry(FrameGeometry& /*geometry*/, std::string& error) {
  return Disabled(error);
}

DeviceStatus PixelinkDevice::GetNextFrame(RawFrame& /*frame*/, std::string& error) {
  return Disabled(error);
}

DeviceStatus PixelinkDevice::FormatImage(const RawFrame& /*frame*/,
                                         std::vector<std::uint8_t>& /*rgb24*/,
                                         std::string& error) {
  return Disabled(error);
}

DeviceStatus PixelinkDevice::StartEncodedClip(const ClipRequest& /*request*/,
                                              ClipCallback /*on_complete*/, std::string& error) {
  return Disabled(error);
}

void PixelinkDevice::OnClipTerminated(std::uint32_t /*frames_captured*/, bool /*success*/,
                                      bool /*stream_stopped*/, long /*return_code*/) {}

DeviceStatus PixelinkDevice::TranscodeClip(const std::filesystem::path& /*intermediate*/,
                                           const std::filesystem::path& /*delivery*/,
                                           double /*playback_fps*/, std::string& error) {
  return Disabled(error);
}

#endif // SCOPECAM_ENABLE_PIXELINK

} // namespace scopecam::device::hardware
