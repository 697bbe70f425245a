#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace scopecam::device {

// Bounded worker pool for blocking device calls.
//
// Every adapter call (init, feature get/set, frame retrieval, transcode) is
// dispatched here so the orchestration threads only ever wait on a future,
// never inside vendor code. Callers observe cancellation between calls.
class DeviceExecutor {
public:
  explicit DeviceExecutor(std::size_t worker_threads);
  ~DeviceExecutor();

  DeviceExecutor(const DeviceExecutor&) = delete;
  DeviceExecutor& operator=(const DeviceExecutor&) = delete;

  // Runs `fn` on a worker thread and returns its result. After `Shutdown`,
  // calls run inline on the caller so teardown paths can still release the
  // device.
  template <typename Fn>
  auto Run(Fn&& fn) -> std::invoke_result_t<std::decay_t<Fn>&> {
    using Result = std::invoke_result_t<std::decay_t<Fn>&>;
    if (stopped_.load(std::memory_order_acquire)) {
      return fn();
    }

    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> result = task->get_future();
    calls_dispatched_.fetch_add(1U, std::memory_order_relaxed);
    boost::asio::post(pool_, [task]() { (*task)(); });
    return result.get();
  }

  // Waits for queued calls to drain and joins the workers. Idempotent.
  void Shutdown();

  std::size_t worker_threads() const {
    return worker_threads_;
  }

  std::uint64_t calls_dispatched() const {
    return calls_dispatched_.load(std::memory_order_relaxed);
  }

private:
  std::size_t worker_threads_ = 1;
  boost::asio::thread_pool pool_;
  std::atomic<bool> stopped_{false};
  std::atomic<std::uint64_t> calls_dispatched_{0};
};

} // namespace scopecam::device
