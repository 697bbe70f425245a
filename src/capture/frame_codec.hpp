#pragma once

#include "capture/frame.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace scopecam::capture {

constexpr int kStreamJpegQuality = 85;
constexpr int kSnapshotJpegQuality = 95;

// Pure compression step (no device access): RGB24 -> JPEG, plus the base64
// wrapper used on the wire. `quality` is clamped to 1..100.
bool EncodeFrame(const Frame& frame, int quality, EncodedFrame& encoded, std::string& error);

// Decodes JPEG bytes back to an RGB24 frame.
bool DecodeJpeg(const std::vector<std::uint8_t>& jpeg, Frame& frame, std::string& error);

} // namespace scopecam::capture
