#pragma once

namespace scopecam::core::errors {

// Stable process-exit contract for the CLI.
//
// 0/1/2 keep their conventional meanings; the rest classify the failure
// modes scripts most often branch on.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kDeviceFailed = 20,
  kBusy = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace scopecam::core::errors
