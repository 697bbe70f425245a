#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace scopecam::capture {

// One decoded image, packed RGB24, row-major. Recreated every loop iteration.
struct Frame {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::vector<std::uint8_t> rgb24;
  std::chrono::steady_clock::time_point timestamp{};

  std::size_t ExpectedSize() const {
    return static_cast<std::size_t>(width) * height * 3U;
  }

  bool Valid() const {
    return width > 0U && height > 0U && rgb24.size() == ExpectedSize();
  }
};

// JPEG bytes plus the base64 text carried in frame messages. Never persisted
// by the streaming path.
struct EncodedFrame {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::vector<std::uint8_t> jpeg;
  std::string base64;
  std::chrono::steady_clock::time_point timestamp{};
};

} // namespace scopecam::capture
