#include "capture/frame_acquisition.hpp"

#include "capture/synthetic_frame.hpp"

#include <chrono>
#include <utility>

namespace scopecam::capture {

namespace {

bool IsCancelled(const std::atomic<bool>* cancelled) {
  return cancelled != nullptr && cancelled->load(std::memory_order_acquire);
}

} // namespace

AcquisitionResult AcquireFrame(device::IDeviceAdapter* adapter, device::DeviceExecutor& executor,
                               const std::uint32_t max_retries, const std::uint32_t fallback_width,
                               const std::uint32_t fallback_height, Frame& frame,
                               const std::atomic<bool>* cancelled) {
  AcquisitionResult result;

  if (adapter == nullptr) {
    frame = GenerateSyntheticFrame(fallback_width, fallback_height);
    result.synthetic = true;
    return result;
  }

  device::FrameGeometry geometry;
  std::string error;
  const device::DeviceStatus geometry_status = executor.Run(
      [adapter, &geometry, &error]() { return adapter->ComputeGeometry(geometry, error); });
  if (!device::IsSuccess(geometry_status)) {
    result.status = geometry_status;
    result.error = "compute geometry failed: " + error;
    return result;
  }
  if (!geometry.Valid()) {
    result.status = device::DeviceStatus::kFatal;
    result.error = "device reported an empty frame geometry";
    return result;
  }

  device::RawFrame raw;
  raw.geometry = geometry;
  raw.buffer.resize(geometry.BufferSize());

  const std::uint32_t bound = max_retries == 0U ? 1U : max_retries;
  for (std::uint32_t attempt = 1; attempt <= bound; ++attempt) {
    if (IsCancelled(cancelled)) {
      result.status = device::DeviceStatus::kTransient;
      result.error = "frame acquisition cancelled";
      return result;
    }

    ++result.attempts;
    const device::DeviceStatus status =
        executor.Run([adapter, &raw, &error]() { return adapter->GetNextFrame(raw, error); });
    if (status == device::DeviceStatus::kTransient) {
      result.status = status;
      result.error = "get next frame attempt " + std::to_string(attempt) + "/" +
                     std::to_string(bound) + " failed: " + error;
      continue;
    }
    if (!device::IsSuccess(status)) {
      result.status = status;
      result.error = "get next frame failed: " + error;
      return result;
    }

    std::vector<std::uint8_t> rgb24;
    const device::DeviceStatus format_status = executor.Run(
        [adapter, &raw, &rgb24, &error]() { return adapter->FormatImage(raw, rgb24, error); });
    if (!device::IsSuccess(format_status)) {
      result.status = format_status;
      result.error = "format image failed: " + error;
      return result;
    }

    frame.width = geometry.width;
    frame.height = geometry.height;
    frame.rgb24 = std::move(rgb24);
    frame.timestamp = std::chrono::steady_clock::now();
    if (!frame.Valid()) {
      result.status = device::DeviceStatus::kFatal;
      result.error = "formatted image size does not match frame geometry";
      return result;
    }

    result.status = device::DeviceStatus::kOk;
    result.error.clear();
    return result;
  }

  return result;
}

} // namespace scopecam::capture
