#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace scopecam::streaming {

// {"type":"connected","resolution":{"width":W,"height":H}}
std::string BuildConnectedMessage(std::uint32_t width, std::uint32_t height);

// {"type":"frame","data":"<base64 JPEG>","timestamp":T}
// `timestamp_seconds` is the frame's steady-clock time in seconds.
std::string BuildFrameMessage(std::string_view base64_jpeg, double timestamp_seconds);

} // namespace scopecam::streaming
