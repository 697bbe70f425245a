#include "capture/synthetic_frame.hpp"

#include <cstddef>

namespace scopecam::capture {

std::uint32_t SyntheticPhase(const std::chrono::system_clock::time_point wall_clock) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(wall_clock.time_since_epoch()).count();
  // seconds * 50 == millis / 20
  const auto ticks = millis / 20;
  return static_cast<std::uint32_t>(((ticks % 256) + 256) % 256);
}

Frame GenerateSyntheticFrame(const std::uint32_t width, const std::uint32_t height,
                             const std::chrono::system_clock::time_point wall_clock) {
  Frame frame;
  frame.width = width;
  frame.height = height;
  frame.timestamp = std::chrono::steady_clock::now();
  frame.rgb24.resize(frame.ExpectedSize());

  const std::uint32_t phase = SyntheticPhase(wall_clock);
  std::size_t offset = 0;
  for (std::uint32_t row = 0; row < height; ++row) {
    for (std::uint32_t col = 0; col < width; ++col) {
      frame.rgb24[offset++] = static_cast<std::uint8_t>((row + phase) % 256U);
      frame.rgb24[offset++] = static_cast<std::uint8_t>((col + phase) % 256U);
      frame.rgb24[offset++] = static_cast<std::uint8_t>(((row + col + phase) / 2U) % 256U);
    }
  }
  return frame;
}

} // namespace scopecam::capture
