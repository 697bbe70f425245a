#include "device/device_session.hpp"

#include <utility>

namespace scopecam::device {

std::mutex DeviceSession::global_mu_{};
std::uint32_t DeviceSession::open_sessions_ = 0;
std::uint64_t DeviceSession::open_calls_ = 0;
std::uint64_t DeviceSession::close_calls_ = 0;

DeviceSession::DeviceSession(std::unique_ptr<IDeviceAdapter> adapter)
    : adapter_(std::move(adapter)) {}

DeviceSession::~DeviceSession() {
  Close();
}

DeviceSession::DeviceSession(DeviceSession&& other) noexcept
    : adapter_(std::move(other.adapter_)), open_(std::exchange(other.open_, false)) {}

DeviceSession& DeviceSession::operator=(DeviceSession&& other) noexcept {
  if (this == &other) {
    return *this;
  }

  Close();
  adapter_ = std::move(other.adapter_);
  open_ = std::exchange(other.open_, false);
  return *this;
}

DeviceStatus DeviceSession::Open(std::string_view serial, std::string& error) {
  if (open_) {
    error.clear();
    return DeviceStatus::kAlreadyInState;
  }
  if (adapter_ == nullptr) {
    error = "device session has no adapter";
    return DeviceStatus::kNotFound;
  }

  std::lock_guard<std::mutex> lock(global_mu_);
  if (open_sessions_ > 0U) {
    error = "the camera is already owned by another session";
    return DeviceStatus::kFatal;
  }

  const DeviceStatus status = adapter_->Initialize(serial, error);
  if (!IsSuccess(status)) {
    return status;
  }

  ++open_sessions_;
  ++open_calls_;
  open_ = true;
  return DeviceStatus::kOk;
}

void DeviceSession::Close() {
  if (!open_) {
    return;
  }

  std::string ignored;
  (void)adapter_->StopStream(ignored);
  adapter_->Uninitialize();

  std::lock_guard<std::mutex> lock(global_mu_);
  if (open_sessions_ > 0U) {
    --open_sessions_;
  }
  ++close_calls_;
  open_ = false;
}

DeviceSession::Snapshot DeviceSession::DebugSnapshot() {
  std::lock_guard<std::mutex> lock(global_mu_);
  return Snapshot{
      .open_sessions = open_sessions_,
      .open_calls = open_calls_,
      .close_calls = close_calls_,
  };
}

void DeviceSession::DebugResetForTests() {
  std::lock_guard<std::mutex> lock(global_mu_);
  open_sessions_ = 0;
  open_calls_ = 0;
  close_calls_ = 0;
}

} // namespace scopecam::device
