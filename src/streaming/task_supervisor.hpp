#pragma once

#include "core/logging/logger.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace scopecam::streaming {

// Owns fire-and-forget orchestration jobs (stream start, run loop,
// teardown). Submitters keep no handle; the supervisor owns the job's
// lifetime and joins it on shutdown.
class TaskSupervisor {
public:
  TaskSupervisor(std::size_t threads, core::logging::Logger& logger);
  ~TaskSupervisor();

  TaskSupervisor(const TaskSupervisor&) = delete;
  TaskSupervisor& operator=(const TaskSupervisor&) = delete;

  // Returns false once shutdown has begun; the job is dropped.
  bool Submit(std::string_view name, std::function<void()> job);

  // Stops accepting jobs and joins the running ones. Idempotent.
  void Shutdown();

  std::size_t active_jobs() const {
    return active_jobs_.load(std::memory_order_acquire);
  }

  std::uint64_t submitted_jobs() const {
    return submitted_jobs_.load(std::memory_order_relaxed);
  }

private:
  core::logging::Logger& logger_;
  boost::asio::thread_pool pool_;
  std::atomic<bool> stopped_{false};
  std::atomic<std::size_t> active_jobs_{0};
  std::atomic<std::uint64_t> submitted_jobs_{0};
};

} // namespace scopecam::streaming
