#ifndef SCOPECAM_CORE_TIME_UTILS_HPP_
#define SCOPECAM_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace scopecam::core {

namespace detail {

inline bool ToUtcTm(std::chrono::system_clock::time_point timestamp, std::tm& utc_time) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
#if defined(_WIN32)
  return gmtime_s(&utc_time, &epoch_seconds) == 0;
#else
  return gmtime_r(&epoch_seconds, &utc_time) != nullptr;
#endif
}

inline int MillisComponent(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  return static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);
}

} // namespace detail

// Canonical UTC timestamp used by log lines and descriptors.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << detail::MillisComponent(timestamp) << 'Z';
  return out.str();
}

// Compact stamp for artifact filenames: YYYYMMDD_HHMMSS_mmm (UTC).
inline std::string FormatFilenameStamp(std::chrono::system_clock::time_point timestamp) {
  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return "00000000_000000_000";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y%m%d_%H%M%S") << '_' << std::setw(3) << std::setfill('0')
      << detail::MillisComponent(timestamp);
  return out.str();
}

// Seconds on the steady clock, used as the `timestamp` of frame messages.
inline double SteadySeconds(std::chrono::steady_clock::time_point timestamp) {
  return std::chrono::duration<double>(timestamp.time_since_epoch()).count();
}

} // namespace scopecam::core

#endif // SCOPECAM_CORE_TIME_UTILS_HPP_
