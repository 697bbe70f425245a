#include "common/assertions.hpp"
#include "common/mock_device.hpp"
#include "common/recording_sink.hpp"
#include "core/logging/logger.hpp"
#include "device/device_executor.hpp"
#include "streaming/streaming_engine.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

namespace {

using scopecam::device::DeviceExecutor;
using scopecam::device::DeviceStatus;
using scopecam::streaming::StreamingEngine;
using scopecam::streaming::StreamingEngineOptions;
using scopecam::streaming::StreamState;
using scopecam::tests::common::AssertContains;
using scopecam::tests::common::AssertEq;
using scopecam::tests::common::Fail;
using scopecam::tests::common::MockDevice;
using scopecam::tests::common::RecordingSink;
using scopecam::tests::common::WaitUntil;

constexpr std::chrono::seconds kSettle{5};

StreamingEngineOptions FastOptions() {
  StreamingEngineOptions options;
  options.timings.frame_interval = std::chrono::milliseconds(5);
  options.timings.failure_delay = std::chrono::milliseconds(5);
  options.timings.paused_idle_wait = std::chrono::milliseconds(5);
  options.synthetic_width = 64U;
  options.synthetic_height = 48U;
  options.status_log_every_frames = 2U;
  return options;
}

void ExpectState(const StreamingEngine& engine, StreamState target, const std::string& what) {
  if (!engine.WaitForState(target, kSettle)) {
    Fail(what + ": expected " + scopecam::streaming::ToString(target) + ", still " +
         scopecam::streaming::ToString(engine.state()));
  }
}

// Two clients share one stream; only the last removal stops the hardware.
void TwoClientLifecycle(scopecam::core::logging::Logger& logger, DeviceExecutor& executor) {
  MockDevice device;
  StreamingEngine engine(&device, executor, logger, FastOptions());
  auto a = std::make_shared<RecordingSink>();
  auto b = std::make_shared<RecordingSink>();

  // AddClient never waits on the device.
  device.HoldStartStream();
  engine.AddClient(a);
  ExpectState(engine, StreamState::kStarting, "start held by device");
  AssertEq<std::size_t>(engine.client_count(), 1U, "clients while starting");
  device.ReleaseStartStream();
  ExpectState(engine, StreamState::kActive, "after start");

  if (!WaitUntil([&]() { return a->frames() >= 3U; })) {
    Fail("client A should receive frames");
  }
  engine.AddClient(b);
  if (!WaitUntil([&]() { return b->frames() >= 3U; })) {
    Fail("client B should receive frames");
  }

  engine.RemoveClient(a);
  const std::size_t b_frames = b->frames();
  if (!WaitUntil([&]() { return b->frames() > b_frames + 2U; })) {
    Fail("client B should keep receiving after A leaves");
  }
  AssertEq(engine.state() == StreamState::kActive, true, "active while B remains");
  AssertEq<std::uint64_t>(device.stop_stream_calls(), 0U, "no stop while B remains");

  engine.RemoveClient(b);
  ExpectState(engine, StreamState::kIdle, "after last client");
  AssertEq<std::uint64_t>(device.start_stream_calls(), 1U, "one start for A and B");
  AssertEq<std::uint64_t>(device.stop_stream_calls(), 1U, "exactly one stop");
  if (engine.GetCurrentFrame() == nullptr) {
    Fail("latest frame should be cached after streaming");
  }
  const auto stats = engine.stats();
  AssertEq<std::uint64_t>(stats.starts, 1U, "stats starts");
  AssertEq<std::uint64_t>(stats.stops, 1U, "stats stops");

  AssertContains(a->messages().front(), "\"type\":\"frame\"");
  engine.Shutdown();
}

// A sink that fails to send is pruned without disturbing the others.
void FailedSinkIsPruned(scopecam::core::logging::Logger& logger, DeviceExecutor& executor) {
  MockDevice device;
  StreamingEngine engine(&device, executor, logger, FastOptions());
  auto healthy = std::make_shared<RecordingSink>();
  auto broken = std::make_shared<RecordingSink>();
  broken->FailSends(true);

  engine.AddClient(healthy);
  engine.AddClient(broken);
  if (!WaitUntil([&]() { return engine.client_count() == 1U; })) {
    Fail("failed sink should be pruned");
  }
  if (!WaitUntil([&]() { return healthy->frames() >= 3U; })) {
    Fail("healthy sink should keep receiving");
  }
  if (engine.stats().clients_pruned != 1U) {
    Fail("exactly one client should be pruned");
  }

  engine.RemoveClient(healthy);
  ExpectState(engine, StreamState::kIdle, "after healthy client leaves");
  AssertEq<std::uint64_t>(device.stop_stream_calls(), 1U, "single stop after pruning");
  engine.Shutdown();
}

// Fatal acquisition ends the loop and releases the stream; clients stay
// registered until a remove and re-add starts a new stream.
void FatalAcquisitionStopsStream(scopecam::core::logging::Logger& logger,
                                 DeviceExecutor& executor) {
  MockDevice device;
  StreamingEngine engine(&device, executor, logger, FastOptions());
  auto client = std::make_shared<RecordingSink>();

  engine.AddClient(client);
  if (!WaitUntil([&]() { return client->frames() >= 2U; })) {
    Fail("client should receive frames before the fault");
  }
  device.ScriptFrames({DeviceStatus::kFatal});
  ExpectState(engine, StreamState::kIdle, "after fatal frame");
  AssertEq<std::uint64_t>(device.stop_stream_calls(), 1U, "stop after fatal");
  AssertEq<std::size_t>(engine.client_count(), 1U, "client kept after fatal");

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  AssertEq(engine.state() == StreamState::kIdle, true, "no automatic restart after fatal");

  engine.RemoveClient(client);
  engine.AddClient(client);
  ExpectState(engine, StreamState::kActive, "re-add restarts");
  AssertEq<std::uint64_t>(device.start_stream_calls(), 2U, "second start");

  engine.RemoveClient(client);
  ExpectState(engine, StreamState::kIdle, "final removal");
  AssertEq<std::uint64_t>(device.stop_stream_calls(), 2U, "one stop per start");
  engine.Shutdown();
}

// Transient frames are skipped, not fatal.
void TransientFramesAreSkipped(scopecam::core::logging::Logger& logger,
                               DeviceExecutor& executor) {
  MockDevice device;
  device.ScriptFrames({DeviceStatus::kTransient, DeviceStatus::kTransient,
                       DeviceStatus::kTransient, DeviceStatus::kTransient});
  StreamingEngine engine(&device, executor, logger, FastOptions());
  auto client = std::make_shared<RecordingSink>();

  engine.AddClient(client);
  if (!WaitUntil([&]() { return client->frames() >= 2U; })) {
    Fail("frames should flow after transient failures");
  }
  if (engine.stats().acquisition_failures < 1U) {
    Fail("exhausted transient retries should be counted");
  }
  AssertEq(engine.state() == StreamState::kActive, true, "transient keeps the stream active");
  engine.RemoveClient(client);
  ExpectState(engine, StreamState::kIdle, "after transient scenario");
  engine.Shutdown();
}

void StartFailureReturnsToIdle(scopecam::core::logging::Logger& logger,
                               DeviceExecutor& executor) {
  MockDevice::Options options;
  options.start_stream_status = DeviceStatus::kFatal;
  MockDevice device(options);
  StreamingEngine engine(&device, executor, logger, FastOptions());
  auto client = std::make_shared<RecordingSink>();

  engine.AddClient(client);
  if (!WaitUntil([&]() { return engine.stats().stops == 1U; })) {
    Fail("failed start should run teardown");
  }
  ExpectState(engine, StreamState::kIdle, "after failed start");
  AssertEq<std::uint64_t>(device.stop_stream_calls(), 0U, "no stop without a started stream");
  AssertEq<std::uint64_t>(device.next_frame_calls(), 0U, "no frames without a stream");
  AssertEq<std::size_t>(engine.client_count(), 1U, "client stays registered");
  engine.Shutdown();
}

void SyntheticEngineWithoutDevice(scopecam::core::logging::Logger& logger,
                                  DeviceExecutor& executor) {
  StreamingEngine engine(nullptr, executor, logger, FastOptions());
  auto client = std::make_shared<RecordingSink>();
  engine.AddClient(client);
  if (!WaitUntil([&]() { return client->frames() >= 2U; })) {
    Fail("synthetic frames should flow without a device");
  }
  const auto latest = engine.GetCurrentFrame();
  if (latest == nullptr || latest->width != 64U || latest->height != 48U) {
    Fail("synthetic frames should use the configured size");
  }
  engine.RemoveClient(client);
  ExpectState(engine, StreamState::kIdle, "synthetic teardown");
  engine.Shutdown();
}

} // namespace

int main() {
  std::ostringstream log_sink;
  scopecam::core::logging::Logger logger(scopecam::core::logging::LogLevel::kDebug, log_sink);
  DeviceExecutor executor(2U);

  TwoClientLifecycle(logger, executor);
  FailedSinkIsPruned(logger, executor);
  FatalAcquisitionStopsStream(logger, executor);
  TransientFramesAreSkipped(logger, executor);
  StartFailureReturnsToIdle(logger, executor);
  SyntheticEngineWithoutDevice(logger, executor);

  executor.Shutdown();
  AssertContains(log_sink.str(), "stream status");
  return 0;
}
