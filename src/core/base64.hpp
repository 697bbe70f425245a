#ifndef SCOPECAM_CORE_BASE64_HPP_
#define SCOPECAM_CORE_BASE64_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace scopecam::core {

namespace detail {

inline constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline int Base64Value(char c) {
  if (c >= 'A' && c <= 'Z') {
    return c - 'A';
  }
  if (c >= 'a' && c <= 'z') {
    return c - 'a' + 26;
  }
  if (c >= '0' && c <= '9') {
    return c - '0' + 52;
  }
  if (c == '+') {
    return 62;
  }
  if (c == '/') {
    return 63;
  }
  return -1;
}

} // namespace detail

// Standard (RFC 4648) base64 with `=` padding; the text-safe wrapper used for
// JPEG payloads in frame messages.
inline std::string EncodeBase64(const std::uint8_t* data, std::size_t size) {
  std::string out;
  out.reserve(((size + 2U) / 3U) * 4U);

  std::size_t index = 0;
  while (index + 3U <= size) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(data[index]) << 16U) |
                                 (static_cast<std::uint32_t>(data[index + 1U]) << 8U) |
                                 static_cast<std::uint32_t>(data[index + 2U]);
    out.push_back(detail::kBase64Alphabet[(triple >> 18U) & 0x3FU]);
    out.push_back(detail::kBase64Alphabet[(triple >> 12U) & 0x3FU]);
    out.push_back(detail::kBase64Alphabet[(triple >> 6U) & 0x3FU]);
    out.push_back(detail::kBase64Alphabet[triple & 0x3FU]);
    index += 3U;
  }

  const std::size_t remaining = size - index;
  if (remaining == 1U) {
    const std::uint32_t triple = static_cast<std::uint32_t>(data[index]) << 16U;
    out.push_back(detail::kBase64Alphabet[(triple >> 18U) & 0x3FU]);
    out.push_back(detail::kBase64Alphabet[(triple >> 12U) & 0x3FU]);
    out += "==";
  } else if (remaining == 2U) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(data[index]) << 16U) |
                                 (static_cast<std::uint32_t>(data[index + 1U]) << 8U);
    out.push_back(detail::kBase64Alphabet[(triple >> 18U) & 0x3FU]);
    out.push_back(detail::kBase64Alphabet[(triple >> 12U) & 0x3FU]);
    out.push_back(detail::kBase64Alphabet[(triple >> 6U) & 0x3FU]);
    out.push_back('=');
  }

  return out;
}

inline std::string EncodeBase64(const std::vector<std::uint8_t>& data) {
  return EncodeBase64(data.data(), data.size());
}

inline bool DecodeBase64(std::string_view text, std::vector<std::uint8_t>& out,
                         std::string& error) {
  out.clear();
  if (text.size() % 4U != 0U) {
    error = "base64 text length must be a multiple of 4";
    return false;
  }
  out.reserve((text.size() / 4U) * 3U);

  for (std::size_t index = 0; index < text.size(); index += 4U) {
    std::array<int, 4> values{};
    std::size_t padding = 0;
    for (std::size_t offset = 0; offset < 4U; ++offset) {
      const char c = text[index + offset];
      if (c == '=') {
        const bool in_last_group = index + 4U == text.size();
        if (!in_last_group || offset < 2U) {
          error = "unexpected base64 padding";
          return false;
        }
        ++padding;
        values[offset] = 0;
        continue;
      }
      if (padding > 0U) {
        error = "base64 data after padding";
        return false;
      }
      values[offset] = detail::Base64Value(c);
      if (values[offset] < 0) {
        error = "invalid base64 character";
        return false;
      }
    }

    const std::uint32_t triple = (static_cast<std::uint32_t>(values[0]) << 18U) |
                                 (static_cast<std::uint32_t>(values[1]) << 12U) |
                                 (static_cast<std::uint32_t>(values[2]) << 6U) |
                                 static_cast<std::uint32_t>(values[3]);
    out.push_back(static_cast<std::uint8_t>((triple >> 16U) & 0xFFU));
    if (padding < 2U) {
      out.push_back(static_cast<std::uint8_t>((triple >> 8U) & 0xFFU));
    }
    if (padding < 1U) {
      out.push_back(static_cast<std::uint8_t>(triple & 0xFFU));
    }
  }

  error.clear();
  return true;
}

} // namespace scopecam::core

#endif // SCOPECAM_CORE_BASE64_HPP_
