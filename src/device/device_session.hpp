#pragma once

#include "device/device_adapter.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace scopecam::device {

// Process-wide ownership of the one image sensor.
//
// Why this exists:
// - the vendor SDK needs one balanced Initialize/Uninitialize pair
// - teardown must stop the stream before releasing, on every exit path
// - only one session may hold the device at a time
class DeviceSession {
public:
  DeviceSession() = default;
  explicit DeviceSession(std::unique_ptr<IDeviceAdapter> adapter);
  ~DeviceSession();

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;
  DeviceSession(DeviceSession&& other) noexcept;
  DeviceSession& operator=(DeviceSession&& other) noexcept;

  // Initializes the adapter. Idempotent per instance. Fails when another
  // session already holds the device.
  DeviceStatus Open(std::string_view serial, std::string& error);

  // Stops the stream (best effort) and uninitializes. Safe to call repeatedly.
  void Close();

  bool is_open() const {
    return open_;
  }

  IDeviceAdapter* adapter() const {
    return adapter_.get();
  }

  // Used by tests to verify balanced open/close accounting.
  struct Snapshot {
    std::uint32_t open_sessions = 0;
    std::uint64_t open_calls = 0;
    std::uint64_t close_calls = 0;
  };

  static Snapshot DebugSnapshot();
  static void DebugResetForTests();

private:
  std::unique_ptr<IDeviceAdapter> adapter_;
  bool open_ = false;

  static std::mutex global_mu_;
  static std::uint32_t open_sessions_;
  static std::uint64_t open_calls_;
  static std::uint64_t close_calls_;
};

} // namespace scopecam::device
