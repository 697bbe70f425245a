#include "service/jsonl_file_sink.hpp"

#include "core/fs_utils.hpp"

#include <utility>

namespace scopecam::service {

namespace {

constexpr std::string_view kFrameTypePrefix = "{\"type\":\"frame\",\"data\":\"";

// {"type":"frame","data":"...","timestamp":T} -> {"type":"frame","data_len":N,"timestamp":T}
std::string StripFramePayload(std::string_view message) {
  const std::size_t data_begin = kFrameTypePrefix.size();
  const std::size_t data_end = message.find('"', data_begin);
  if (data_end == std::string_view::npos) {
    return std::string(message);
  }
  std::string stripped = "{\"type\":\"frame\",\"data_len\":";
  stripped += std::to_string(data_end - data_begin);
  stripped += message.substr(data_end + 1U);
  return stripped;
}

} // namespace

JsonlFileSink::JsonlFileSink(std::filesystem::path path, const bool keep_frame_payload)
    : path_(std::move(path)), keep_frame_payload_(keep_frame_payload) {}

bool JsonlFileSink::Open(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!core::EnsureParentDirectory(path_, error)) {
    return false;
  }
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    error = "failed to open stream log '" + path_.string() + "' for writing";
    return false;
  }
  return true;
}

bool JsonlFileSink::Send(std::string_view message, std::string& error) {
  const bool is_frame = message.substr(0, kFrameTypePrefix.size()) == kFrameTypePrefix;

  std::lock_guard<std::mutex> lock(mu_);
  if (!out_.is_open()) {
    error = "stream log '" + path_.string() + "' is not open";
    return false;
  }

  if (is_frame && !keep_frame_payload_) {
    out_ << StripFramePayload(message) << '\n';
  } else {
    out_ << message << '\n';
  }
  out_.flush();
  if (!out_) {
    error = "failed while writing stream log '" + path_.string() + "'";
    return false;
  }

  ++lines_written_;
  if (is_frame) {
    ++frames_written_;
  }
  return true;
}

std::uint64_t JsonlFileSink::lines_written() const {
  std::lock_guard<std::mutex> lock(mu_);
  return lines_written_;
}

std::uint64_t JsonlFileSink::frames_written() const {
  std::lock_guard<std::mutex> lock(mu_);
  return frames_written_;
}

} // namespace scopecam::service
