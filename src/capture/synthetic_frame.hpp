#pragma once

#include "capture/frame.hpp"

#include <chrono>
#include <cstdint>

namespace scopecam::capture {

// Animation phase for the synthetic gradient: floor(seconds * 50) mod 256.
std::uint32_t SyntheticPhase(std::chrono::system_clock::time_point wall_clock);

// Deterministic animated gradient used whenever no hardware frame source is
// available. Pixel (row i, column j) is
//   R = (i + phase) % 256
//   G = (j + phase) % 256
//   B = ((i + j + phase) / 2) % 256
Frame GenerateSyntheticFrame(std::uint32_t width, std::uint32_t height,
                             std::chrono::system_clock::time_point wall_clock =
                                 std::chrono::system_clock::now());

} // namespace scopecam::capture
