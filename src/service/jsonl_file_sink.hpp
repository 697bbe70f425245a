#pragma once

#include "streaming/client_sink.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace scopecam::service {

// Client that appends every message it receives as one line of a JSONL file.
//
// Frame messages are large; `keep_frame_payload = false` replaces the base64
// data with its length so a long session stays inspectable.
class JsonlFileSink final : public streaming::IClientSink {
public:
  JsonlFileSink(std::filesystem::path path, bool keep_frame_payload);

  // Creates parent directories and truncates the file.
  bool Open(std::string& error);

  bool Send(std::string_view message, std::string& error) override;

  std::uint64_t lines_written() const;
  std::uint64_t frames_written() const;

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
  bool keep_frame_payload_ = false;

  mutable std::mutex mu_;
  std::ofstream out_;
  std::uint64_t lines_written_ = 0;
  std::uint64_t frames_written_ = 0;
};

} // namespace scopecam::service
