#include "device/sim/simulated_device.hpp"

#include "capture/frame_codec.hpp"
#include "capture/synthetic_frame.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>

#include <chrono>
#include <cmath>
#include <cstring>
#include <fstream>
#include <utility>

namespace scopecam::device::sim {

namespace {

constexpr int kClipJpegQuality = 90;
constexpr std::uint32_t kMaxClipImageBytes = 64U * 1024U * 1024U;

std::chrono::nanoseconds FramePeriod(double fps) {
  if (!std::isfinite(fps) || fps <= 0.0) {
    return std::chrono::nanoseconds(0);
  }
  return std::chrono::nanoseconds(static_cast<std::int64_t>(std::llround(1'000'000'000.0 / fps)));
}

void WriteLengthPrefixed(std::ofstream& out, const std::vector<std::uint8_t>& bytes) {
  const auto size = static_cast<std::uint32_t>(bytes.size());
  const unsigned char prefix[4] = {
      static_cast<unsigned char>(size & 0xFFU),
      static_cast<unsigned char>((size >> 8U) & 0xFFU),
      static_cast<unsigned char>((size >> 16U) & 0xFFU),
      static_cast<unsigned char>((size >> 24U) & 0xFFU),
  };
  out.write(reinterpret_cast<const char*>(prefix), sizeof(prefix));
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(size));
}

bool ReadLengthPrefixed(std::ifstream& in, std::vector<std::uint8_t>& bytes) {
  unsigned char prefix[4] = {};
  if (!in.read(reinterpret_cast<char*>(prefix), sizeof(prefix))) {
    return false;
  }
  const std::uint32_t size = static_cast<std::uint32_t>(prefix[0]) |
                             (static_cast<std::uint32_t>(prefix[1]) << 8U) |
                             (static_cast<std::uint32_t>(prefix[2]) << 16U) |
                             (static_cast<std::uint32_t>(prefix[3]) << 24U);
  if (size == 0U || size > kMaxClipImageBytes) {
    return false;
  }
  bytes.resize(size);
  return static_cast<bool>(in.read(reinterpret_cast<char*>(bytes.data()), size));
}

} // namespace

SimulatedDevice::SimulatedDevice(SimulatedDeviceOptions options) : options_(options) {
  features_[Feature::kExposure] = FeatureState{
      .value = 100.0,
      .mode = FeatureMode::kManual,
      .range = {0.1, 2'000.0, true, options_.supports_auto_exposure}};
  features_[Feature::kGain] =
      FeatureState{.value = 1.0, .mode = FeatureMode::kManual, .range = {0.0, 24.0, true}};
  features_[Feature::kGamma] = FeatureState{
      .value = 1.0, .mode = FeatureMode::kManual, .range = {0.1, 4.0, options_.supports_gamma}};
  features_[Feature::kFrameRate] = FeatureState{.value = options_.frame_rate_fps,
                                                .mode = FeatureMode::kManual,
                                                .range = {1.0, 120.0, true}};
}

SimulatedDevice::~SimulatedDevice() {
  Uninitialize();
}

DeviceStatus SimulatedDevice::Initialize(std::string_view /*serial*/, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  initialized_ = true;
  error.clear();
  return DeviceStatus::kOk;
}

void SimulatedDevice::Uninitialize() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    streaming_ = false;
    initialized_ = false;
  }
  JoinClipThread();
}

DeviceStatus SimulatedDevice::GetFeatureRange(const Feature feature, FeatureRange& range,
                                              std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  range = features_.at(feature).range;
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus SimulatedDevice::GetFeature(const Feature feature, FeatureReading& reading,
                                         std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  FeatureState& state = features_.at(feature);
  if (!state.range.supported) {
    error = std::string("feature not supported by simulated camera: ") + ToString(feature);
    return DeviceStatus::kUnsupported;
  }

  if (feature == Feature::kExposure && state.mode == FeatureMode::kOnePush) {
    if (one_push_remaining_ > 0U) {
      --one_push_remaining_;
    }
    if (one_push_remaining_ == 0U) {
      state.mode = FeatureMode::kManual;
      state.value = options_.one_push_result_ms;
    }
  }

  reading.value = state.value;
  reading.mode = state.mode;
  reading.one_push_active = state.mode == FeatureMode::kOnePush;
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus SimulatedDevice::SetFeature(const Feature feature, const FeatureMode mode,
                                         const double value, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  set_feature_calls_.push_back(SetFeatureCall{.feature = feature, .mode = mode, .value = value});

  FeatureState& state = features_.at(feature);
  if (!state.range.supported) {
    error = std::string("feature not supported by simulated camera: ") + ToString(feature);
    return DeviceStatus::kUnsupported;
  }

  if (mode != FeatureMode::kManual) {
    if (feature != Feature::kExposure || !options_.supports_auto_exposure) {
      error = std::string("automatic mode not supported for ") + ToString(feature);
      return DeviceStatus::kUnsupported;
    }
    state.mode = mode;
    if (mode == FeatureMode::kAuto) {
      state.value = options_.auto_exposure_value_ms;
    } else {
      one_push_remaining_ = options_.one_push_polls;
    }
    error.clear();
    return DeviceStatus::kOk;
  }

  if (!std::isfinite(value) || value < state.range.min || value > state.range.max) {
    error = std::string("value out of range for ") + ToString(feature) + ": " +
            std::to_string(value);
    return DeviceStatus::kFatal;
  }

  state.mode = FeatureMode::kManual;
  state.value = value;
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus SimulatedDevice::StartStream(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  ++start_stream_calls_;
  error.clear();
  if (streaming_) {
    return DeviceStatus::kAlreadyInState;
  }
  streaming_ = true;
  return DeviceStatus::kOk;
}

DeviceStatus SimulatedDevice::StopStream(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stop_stream_calls_;
  error.clear();
  if (!streaming_) {
    return DeviceStatus::kAlreadyInState;
  }
  streaming_ = false;
  return DeviceStatus::kOk;
}

DeviceStatus SimulatedDevice::ComputeGeometry(FrameGeometry& geometry, std::string& error) {
  geometry.width = options_.width;
  geometry.height = options_.height;
  geometry.bytes_per_pixel = 3U;
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus SimulatedDevice::GetNextFrame(RawFrame& frame, std::string& error) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++next_frame_calls_;
    if (!streaming_) {
      error = "simulated camera stream is stopped";
      return DeviceStatus::kFatal;
    }
  }

  if (options_.pace_frames) {
    std::this_thread::sleep_for(FramePeriod(options_.frame_rate_fps));
  }

  capture::Frame synthetic = capture::GenerateSyntheticFrame(options_.width, options_.height);
  frame.geometry = FrameGeometry{options_.width, options_.height, 3U};
  frame.buffer = std::move(synthetic.rgb24);
  frame.descriptor.clear();
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus SimulatedDevice::FormatImage(const RawFrame& frame, std::vector<std::uint8_t>& rgb24,
                                          std::string& error) {
  const std::size_t expected =
      static_cast<std::size_t>(frame.geometry.width) * frame.geometry.height * 3U;
  if (frame.geometry.bytes_per_pixel != 3U || frame.buffer.size() != expected) {
    error = "simulated raw frame does not hold RGB24 data";
    return DeviceStatus::kFatal;
  }
  rgb24 = frame.buffer;
  error.clear();
  return DeviceStatus::kOk;
}

DeviceStatus SimulatedDevice::StartEncodedClip(const ClipRequest& request,
                                               ClipCallback on_complete, std::string& error) {
  if (request.frame_budget == 0U || request.decimation == 0U) {
    error = "clip request needs frame_budget > 0 and decimation > 0";
    return DeviceStatus::kFatal;
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!streaming_) {
      error = "simulated camera stream must be started before clip capture";
      return DeviceStatus::kFatal;
    }
    if (clip_running_) {
      error = "simulated camera clip capture already in progress";
      return DeviceStatus::kFatal;
    }
    clip_running_ = true;
  }

  // A previous capture thread has already delivered its callback.
  JoinClipThread();
  clip_thread_ = std::thread(&SimulatedDevice::RunClipCapture, this, request,
                             std::move(on_complete));
  error.clear();
  return DeviceStatus::kOk;
}

void SimulatedDevice::RunClipCapture(ClipRequest request, ClipCallback on_complete) {
  ClipCompletion completion;

  std::ofstream out(request.intermediate_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    completion.status = DeviceStatus::kFatal;
    completion.detail = "failed to open intermediate clip '" + request.intermediate_path.string() +
                        "'";
  } else {
    const std::uint64_t device_frames =
        static_cast<std::uint64_t>(request.frame_budget) * request.decimation;
    for (std::uint64_t index = 0; index < device_frames; ++index) {
      if (!IsStreaming()) {
        completion.aborted = true;
        break;
      }
      if (options_.pace_frames) {
        std::this_thread::sleep_for(FramePeriod(options_.frame_rate_fps));
      }
      if (index % request.decimation != 0U) {
        continue;
      }

      const capture::Frame frame =
          capture::GenerateSyntheticFrame(options_.width, options_.height);
      capture::EncodedFrame encoded;
      std::string encode_error;
      if (!capture::EncodeFrame(frame, kClipJpegQuality, encoded, encode_error)) {
        completion.status = DeviceStatus::kFatal;
        completion.detail = encode_error;
        break;
      }
      WriteLengthPrefixed(out, encoded.jpeg);
      ++completion.frames_captured;
    }
    out.flush();
    if (!out && completion.status == DeviceStatus::kOk) {
      completion.status = DeviceStatus::kFatal;
      completion.detail = "failed while writing intermediate clip";
    }
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    clip_running_ = false;
  }
  if (on_complete) {
    on_complete(completion);
  }
}

DeviceStatus SimulatedDevice::TranscodeClip(const std::filesystem::path& intermediate,
                                            const std::filesystem::path& delivery,
                                            const double playback_fps, std::string& error) {
  std::ifstream in(intermediate, std::ios::binary);
  if (!in) {
    error = "failed to open intermediate clip '" + intermediate.string() + "'";
    return DeviceStatus::kFatal;
  }

  cv::VideoWriter writer;
  std::vector<std::uint8_t> jpeg;
  std::uint32_t written = 0;
  try {
    while (ReadLengthPrefixed(in, jpeg)) {
      const cv::Mat bgr =
          cv::imdecode(cv::Mat(1, static_cast<int>(jpeg.size()), CV_8UC1, jpeg.data()),
                       cv::IMREAD_COLOR);
      if (bgr.empty()) {
        error = "intermediate clip holds an undecodable image";
        return DeviceStatus::kFatal;
      }
      if (!writer.isOpened()) {
        writer.open(delivery.string(), cv::CAP_OPENCV_MJPEG,
                    cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), playback_fps, bgr.size());
        if (!writer.isOpened()) {
          error = "OpenCV could not open delivery clip '" + delivery.string() + "'";
          return DeviceStatus::kFatal;
        }
      }
      writer.write(bgr);
      ++written;
    }
  } catch (const cv::Exception& ex) {
    error = std::string("OpenCV transcode failed: ") + ex.what();
    return DeviceStatus::kFatal;
  }

  if (written == 0U) {
    error = "intermediate clip contains no images";
    return DeviceStatus::kFatal;
  }
  writer.release();
  error.clear();
  return DeviceStatus::kOk;
}

SimulatedDevice::Snapshot SimulatedDevice::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return Snapshot{
      .initialized = initialized_,
      .streaming = streaming_,
      .start_stream_calls = start_stream_calls_,
      .stop_stream_calls = stop_stream_calls_,
      .next_frame_calls = next_frame_calls_,
      .set_feature_calls = set_feature_calls_,
  };
}

bool SimulatedDevice::IsStreaming() const {
  std::lock_guard<std::mutex> lock(mu_);
  return streaming_;
}

void SimulatedDevice::JoinClipThread() {
  if (clip_thread_.joinable() && clip_thread_.get_id() != std::this_thread::get_id()) {
    clip_thread_.join();
  }
}

} // namespace scopecam::device::sim
