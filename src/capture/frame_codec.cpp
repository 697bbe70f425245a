#include "capture/frame_codec.hpp"

#include "core/base64.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <cstring>

namespace scopecam::capture {

bool EncodeFrame(const Frame& frame, const int quality, EncodedFrame& encoded,
                 std::string& error) {
  if (!frame.Valid()) {
    error = "cannot encode frame: buffer size does not match " + std::to_string(frame.width) +
            "x" + std::to_string(frame.height) + " RGB24";
    return false;
  }

  // cv::Mat does not take ownership; the frame outlives this call.
  const cv::Mat rgb(static_cast<int>(frame.height), static_cast<int>(frame.width), CV_8UC3,
                    const_cast<std::uint8_t*>(frame.rgb24.data()));
  cv::Mat bgr;
  cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);

  const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 1, 100)};
  std::vector<uchar> jpeg;
  try {
    if (!cv::imencode(".jpg", bgr, jpeg, params)) {
      error = "OpenCV JPEG encoder rejected the frame";
      return false;
    }
  } catch (const cv::Exception& ex) {
    error = std::string("OpenCV JPEG encode failed: ") + ex.what();
    return false;
  }

  encoded.width = frame.width;
  encoded.height = frame.height;
  encoded.timestamp = frame.timestamp;
  encoded.jpeg.assign(jpeg.begin(), jpeg.end());
  encoded.base64 = core::EncodeBase64(encoded.jpeg);
  error.clear();
  return true;
}

bool DecodeJpeg(const std::vector<std::uint8_t>& jpeg, Frame& frame, std::string& error) {
  if (jpeg.empty()) {
    error = "cannot decode empty JPEG buffer";
    return false;
  }

  cv::Mat bgr;
  try {
    bgr = cv::imdecode(cv::Mat(1, static_cast<int>(jpeg.size()), CV_8UC1,
                               const_cast<std::uint8_t*>(jpeg.data())),
                       cv::IMREAD_COLOR);
  } catch (const cv::Exception& ex) {
    error = std::string("OpenCV JPEG decode failed: ") + ex.what();
    return false;
  }
  if (bgr.empty()) {
    error = "OpenCV could not decode JPEG buffer";
    return false;
  }

  cv::Mat rgb;
  cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
  if (!rgb.isContinuous()) {
    rgb = rgb.clone();
  }

  frame.width = static_cast<std::uint32_t>(rgb.cols);
  frame.height = static_cast<std::uint32_t>(rgb.rows);
  frame.timestamp = std::chrono::steady_clock::now();
  frame.rgb24.resize(frame.ExpectedSize());
  std::memcpy(frame.rgb24.data(), rgb.data, frame.rgb24.size());
  error.clear();
  return true;
}

} // namespace scopecam::capture
