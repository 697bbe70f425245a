#pragma once

#include "capture/frame.hpp"
#include "device/device_adapter.hpp"
#include "device/device_executor.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace scopecam::capture {

// Retry bounds for one frame: continuous streaming tolerates a skipped
// iteration, one-shot captures try once more.
constexpr std::uint32_t kStreamingRetryBound = 3U;
constexpr std::uint32_t kOneShotRetryBound = 4U;

struct AcquisitionResult {
  device::DeviceStatus status = device::DeviceStatus::kOk;
  // Number of `GetNextFrame` calls issued.
  std::uint32_t attempts = 0;
  bool synthetic = false;
  std::string error;

  bool ok() const {
    return device::IsSuccess(status);
  }
};

// Produces one RGB24 frame.
//
// With an adapter: geometry is queried, a width*height*bytesPerPixel buffer
// is allocated and `GetNextFrame` is called up to `max_retries` times.
// Transient failures retry immediately; any other failure ends the attempt
// after that single call. Every device call runs on `executor`.
//
// Without an adapter (`adapter == nullptr`) the synthetic gradient of
// `fallback_width` x `fallback_height` is returned.
//
// `cancelled`, when given, is checked between device calls.
AcquisitionResult AcquireFrame(device::IDeviceAdapter* adapter, device::DeviceExecutor& executor,
                               std::uint32_t max_retries, std::uint32_t fallback_width,
                               std::uint32_t fallback_height, Frame& frame,
                               const std::atomic<bool>* cancelled = nullptr);

} // namespace scopecam::capture
