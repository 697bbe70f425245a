#include "device/device_executor.hpp"

#include <algorithm>

namespace scopecam::device {

DeviceExecutor::DeviceExecutor(const std::size_t worker_threads)
    : worker_threads_(std::max<std::size_t>(1U, worker_threads)), pool_(worker_threads_) {}

DeviceExecutor::~DeviceExecutor() {
  Shutdown();
}

void DeviceExecutor::Shutdown() {
  if (stopped_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  pool_.join();
}

} // namespace scopecam::device
