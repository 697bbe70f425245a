#include "streaming/stream_messages.hpp"

#include "core/json_utils.hpp"

namespace scopecam::streaming {

std::string BuildConnectedMessage(const std::uint32_t width, const std::uint32_t height) {
  return std::string("{\"type\":\"connected\",\"resolution\":{\"width\":") +
         std::to_string(width) + ",\"height\":" + std::to_string(height) + "}}";
}

std::string BuildFrameMessage(std::string_view base64_jpeg, const double timestamp_seconds) {
  // The base64 alphabet needs no JSON escaping.
  std::string message;
  message.reserve(base64_jpeg.size() + 64U);
  message += "{\"type\":\"frame\",\"data\":\"";
  message.append(base64_jpeg.data(), base64_jpeg.size());
  message += "\",\"timestamp\":";
  message += core::FormatJsonNumber(timestamp_seconds);
  message += "}";
  return message;
}

} // namespace scopecam::streaming
