#include "common/assertions.hpp"
#include "common/coordinator_fixture.hpp"
#include "common/recording_sink.hpp"
#include "common/temp_dir.hpp"
#include "device/sim/simulated_device.hpp"
#include "exclusive/exclusive_operation.hpp"
#include "streaming/streaming_engine.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <variant>

namespace {

using scopecam::core::errors::ErrorKind;
using scopecam::device::sim::SimulatedDevice;
using scopecam::device::sim::SimulatedDeviceOptions;
using scopecam::exclusive::AutoExposureOnce;
using scopecam::exclusive::OperationResult;
using scopecam::exclusive::Snapshot;
using scopecam::exclusive::VideoDescriptor;
using scopecam::exclusive::VideoRecording;
using scopecam::streaming::StreamState;
using scopecam::tests::common::AssertContains;
using scopecam::tests::common::AssertKind;
using scopecam::tests::common::AssertOk;
using scopecam::tests::common::CoordinatorFixture;
using scopecam::tests::common::Fail;
using scopecam::tests::common::RecordingSink;
using scopecam::tests::common::ScopedTempDir;
using scopecam::tests::common::WaitUntil;

} // namespace

int main() {
  ScopedTempDir captures("scopecam-busy");
  SimulatedDeviceOptions device_options;
  device_options.width = 96U;
  device_options.height = 64U;
  device_options.frame_rate_fps = 50.0;
  SimulatedDevice device(device_options);
  CoordinatorFixture fixture(device, captures.path());

  // A live stream is paused for the recording and comes back afterwards.
  auto client = std::make_shared<RecordingSink>();
  fixture.engine().AddClient(client);
  if (!WaitUntil([&]() { return client->frames() >= 2U; })) {
    Fail("stream should deliver frames before the recording");
  }

  std::future<OperationResult> video = std::async(std::launch::async, [&fixture]() {
    return fixture.coordinator().RunExclusive(
        VideoRecording{.duration_s = 1.0, .playback_fps = 25.0, .decimation = 1U});
  });
  if (!WaitUntil([&]() { return fixture.coordinator().busy(); })) {
    Fail("coordinator should report busy while recording");
  }
  if (!WaitUntil([&]() { return fixture.engine().state() == StreamState::kPaused; })) {
    Fail("stream should be paused during the recording");
  }

  const OperationResult snapshot = fixture.coordinator().RunExclusive(Snapshot{});
  AssertKind(snapshot, ErrorKind::kBusy, "snapshot during video");
  AssertContains(snapshot.message, "BUSY");

  const OperationResult auto_exposure = fixture.coordinator().RunExclusive(AutoExposureOnce{});
  AssertKind(auto_exposure, ErrorKind::kBusy, "auto exposure during video");

  // The rejected callers must not disturb the recording in flight.
  const OperationResult recorded = video.get();
  AssertOk(recorded, "video");
  const auto* descriptor = std::get_if<VideoDescriptor>(&recorded.descriptor);
  if (descriptor == nullptr || descriptor->num_images == 0U || descriptor->cancelled) {
    Fail("video should complete with images and without cancellation");
  }
  if (fixture.coordinator().busy()) {
    Fail("coordinator should be free after the recording");
  }

  if (!fixture.engine().WaitForState(StreamState::kActive, std::chrono::seconds(5))) {
    Fail("stream should resume after the recording");
  }
  const std::size_t before = client->frames();
  if (!WaitUntil([&]() { return client->frames() > before; })) {
    Fail("frames should flow again after the recording");
  }

  // Once free, the next operation runs normally.
  AssertOk(fixture.coordinator().RunExclusive(Snapshot{}), "snapshot after video");

  fixture.engine().RemoveClient(client);
  AssertContains(fixture.log_text(), "exclusive operation rejected");
  return 0;
}
