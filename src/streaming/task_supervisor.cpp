#include "streaming/task_supervisor.hpp"

#include <boost/asio/post.hpp>

#include <exception>
#include <utility>

namespace scopecam::streaming {

TaskSupervisor::TaskSupervisor(const std::size_t threads, core::logging::Logger& logger)
    : logger_(logger), pool_(threads == 0U ? 1U : threads) {}

TaskSupervisor::~TaskSupervisor() {
  Shutdown();
}

bool TaskSupervisor::Submit(std::string_view name, std::function<void()> job) {
  if (stopped_.load(std::memory_order_acquire)) {
    logger_.Debug("supervisor dropped job after shutdown", {{"job", name}});
    return false;
  }

  submitted_jobs_.fetch_add(1U, std::memory_order_relaxed);
  active_jobs_.fetch_add(1U, std::memory_order_acq_rel);
  boost::asio::post(pool_, [this, job_name = std::string(name), job = std::move(job)]() {
    try {
      job();
    } catch (const std::exception& ex) {
      logger_.Error("supervised job failed", {{"job", job_name}, {"error", ex.what()}});
    }
    active_jobs_.fetch_sub(1U, std::memory_order_acq_rel);
  });
  return true;
}

void TaskSupervisor::Shutdown() {
  if (stopped_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  pool_.join();
}

} // namespace scopecam::streaming
