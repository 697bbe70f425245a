#include "capture/frame_codec.hpp"
#include "capture/synthetic_frame.hpp"
#include "common/assertions.hpp"
#include "core/base64.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace {

using scopecam::capture::DecodeJpeg;
using scopecam::capture::EncodedFrame;
using scopecam::capture::EncodeFrame;
using scopecam::capture::Frame;
using scopecam::capture::GenerateSyntheticFrame;
using scopecam::capture::SyntheticPhase;
using scopecam::tests::common::AssertEq;
using scopecam::tests::common::Fail;

double MeanAbsoluteError(const Frame& a, const Frame& b) {
  if (a.rgb24.size() != b.rgb24.size() || a.rgb24.empty()) {
    Fail("frames differ in size");
  }
  std::uint64_t total = 0;
  for (std::size_t i = 0; i < a.rgb24.size(); ++i) {
    total += static_cast<std::uint64_t>(std::abs(static_cast<int>(a.rgb24[i]) -
                                                 static_cast<int>(b.rgb24[i])));
  }
  return static_cast<double>(total) / static_cast<double>(a.rgb24.size());
}

} // namespace

int main() {
  // Phase follows floor(t * 50) mod 256.
  const std::chrono::system_clock::time_point epoch{};
  AssertEq<std::uint32_t>(SyntheticPhase(epoch), 0U, "phase at epoch");
  AssertEq<std::uint32_t>(SyntheticPhase(epoch + std::chrono::milliseconds(1'000)), 50U,
                          "phase after 1 s");
  AssertEq<std::uint32_t>(SyntheticPhase(epoch + std::chrono::milliseconds(5'200)), 4U,
                          "phase wraps at 256");

  // A flat-ish frame keeps JPEG error well bounded.
  Frame source;
  source.width = 160U;
  source.height = 120U;
  source.rgb24.resize(source.ExpectedSize());
  for (std::size_t i = 0; i < source.rgb24.size(); ++i) {
    source.rgb24[i] = static_cast<std::uint8_t>(64U + (i / 3U) % 64U);
  }

  EncodedFrame encoded;
  std::string error;
  if (!EncodeFrame(source, 95, encoded, error)) {
    Fail("encode failed: " + error);
  }
  if (encoded.jpeg.size() < 4U || encoded.jpeg[0] != 0xFF || encoded.jpeg[1] != 0xD8) {
    Fail("encoded bytes do not start with a JPEG SOI marker");
  }
  AssertEq(encoded.base64, scopecam::core::EncodeBase64(encoded.jpeg), "base64 payload");

  Frame decoded;
  if (!DecodeJpeg(encoded.jpeg, decoded, error)) {
    Fail("decode failed: " + error);
  }
  AssertEq<std::uint32_t>(decoded.width, source.width, "decoded width");
  AssertEq<std::uint32_t>(decoded.height, source.height, "decoded height");
  const double mae = MeanAbsoluteError(source, decoded);
  if (mae > 6.0) {
    Fail("mean absolute error too large at quality 95: " + std::to_string(mae));
  }

  const Frame synthetic = GenerateSyntheticFrame(320U, 240U);
  if (!synthetic.Valid()) {
    Fail("synthetic frame should be valid");
  }
  EncodedFrame synthetic_jpeg;
  if (!EncodeFrame(synthetic, 85, synthetic_jpeg, error)) {
    Fail("synthetic encode failed: " + error);
  }

  Frame broken;
  broken.width = 10U;
  broken.height = 10U;
  broken.rgb24.resize(12U);
  EncodedFrame unused;
  if (EncodeFrame(broken, 85, unused, error)) {
    Fail("encoding a frame with a short buffer must fail");
  }

  Frame not_decoded;
  if (DecodeJpeg(std::vector<std::uint8_t>{0x00, 0x01, 0x02}, not_decoded, error)) {
    Fail("decoding garbage must fail");
  }

  return 0;
}
