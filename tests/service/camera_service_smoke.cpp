#include "common/assertions.hpp"
#include "common/recording_sink.hpp"
#include "common/temp_dir.hpp"
#include "core/config/service_config.hpp"
#include "core/errors/error_kind.hpp"
#include "core/logging/logger.hpp"
#include "service/camera_service.hpp"
#include "service/jsonl_file_sink.hpp"
#include "streaming/streaming_engine.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <variant>

namespace {

using scopecam::core::config::ServiceConfig;
using scopecam::core::errors::ErrorKind;
using scopecam::exclusive::OperationResult;
using scopecam::exclusive::SnapshotDescriptor;
using scopecam::service::AutoExposureRequest;
using scopecam::service::CameraService;
using scopecam::service::JsonlFileSink;
using scopecam::settings::SettingsUpdate;
using scopecam::streaming::StreamState;
using scopecam::tests::common::AssertContains;
using scopecam::tests::common::AssertEq;
using scopecam::tests::common::AssertNotContains;
using scopecam::tests::common::Fail;
using scopecam::tests::common::ReadFileToString;
using scopecam::tests::common::RecordingSink;
using scopecam::tests::common::ScopedTempDir;
using scopecam::tests::common::WaitUntil;

ServiceConfig SimulatedConfig(const std::filesystem::path& capture_dir) {
  ServiceConfig config;
  config.force_simulated = true;
  config.capture_dir = capture_dir;
  config.simulated_width = 96U;
  config.simulated_height = 64U;
  config.simulated_frame_rate_fps = 60.0;
  config.default_exposure_ms = 20.0;
  config.default_gain = 2.0;
  config.engine.frame_interval = std::chrono::milliseconds(5);
  config.engine.paused_idle_wait = std::chrono::milliseconds(5);
  config.exclusive.auto_exposure_poll_interval = std::chrono::milliseconds(5);
  config.exclusive.clip_completion_margin = std::chrono::milliseconds(3'000);
  return config;
}

void ExpectKind(const OperationResult& result, ErrorKind expected, const std::string& what) {
  if (result.kind != expected) {
    Fail(what + ": expected " + std::string(scopecam::core::errors::ToStableCode(expected)) +
         ", got " + std::string(scopecam::core::errors::ToStableCode(result.kind)) + " (" +
         result.message + ")");
  }
}

void NotStartedServiceRefusesWork(scopecam::core::logging::Logger& logger) {
  ScopedTempDir captures("scopecam-service-idle");
  CameraService service(SimulatedConfig(captures.path()), logger);

  ExpectKind(service.RequestCapture(SettingsUpdate{}), ErrorKind::kDeviceUnavailable,
             "capture before start");
  std::string error;
  if (service.AddClient(std::make_shared<RecordingSink>(), error)) {
    Fail("clients cannot join a stopped service");
  }
  AssertContains(service.Health(), "\"status\":\"stopped\"");
  if (service.CancelVideo()) {
    Fail("cancel on a stopped service should be refused");
  }
}

void FullServiceFlow(scopecam::core::logging::Logger& logger) {
  ScopedTempDir captures("scopecam-service");
  CameraService service(SimulatedConfig(captures.path()), logger);

  std::string error;
  if (!service.Start(error)) {
    Fail("service start failed: " + error);
  }
  if (!service.simulated()) {
    Fail("forced simulation should open the simulated device");
  }

  const auto defaults = service.GetSettings();
  if (defaults.exposure_ms != 20.0 || defaults.gain != 2.0) {
    Fail("configured default exposure and gain should be applied at start");
  }

  // First client: connected message first, then live frames.
  auto first = std::make_shared<RecordingSink>();
  if (!service.AddClient(first, error)) {
    Fail("first client rejected: " + error);
  }
  if (!WaitUntil([&]() { return first->frames() >= 2U; })) {
    Fail("first client should receive frames");
  }
  const auto first_messages = first->messages();
  AssertContains(first_messages.front(), "\"type\":\"connected\"");
  AssertContains(first_messages.front(), "\"width\":96");

  // Late joiner: greeted, then handed the cached frame right away.
  auto second = std::make_shared<RecordingSink>();
  if (!service.AddClient(second, error)) {
    Fail("second client rejected: " + error);
  }
  const auto second_messages = second->messages();
  if (second_messages.size() < 2U) {
    Fail("late joiner should get the cached frame with its greeting");
  }
  AssertContains(second_messages[0], "\"type\":\"connected\"");
  AssertContains(second_messages[1], "\"type\":\"frame\"");

  // A client whose greeting fails is never registered.
  auto broken = std::make_shared<RecordingSink>();
  broken->FailSends(true);
  if (service.AddClient(broken, error)) {
    Fail("client with a failing greeting should be rejected");
  }
  AssertEq<std::size_t>(service.engine()->client_count(), 2U, "registered clients");

  const std::string settings_json = service.GetSettingsJson();
  AssertContains(settings_json, "\"connected\":true");
  AssertContains(settings_json, "\"streaming\":true");
  AssertContains(settings_json, "\"resolution\":{\"width\":96,\"height\":64}");

  const OperationResult capture = service.RequestCapture(SettingsUpdate{});
  if (!capture.ok) {
    Fail("capture failed: " + capture.message);
  }
  const auto* snapshot = std::get_if<SnapshotDescriptor>(&capture.descriptor);
  if (snapshot == nullptr || !std::filesystem::exists(snapshot->path)) {
    Fail("capture should produce a JPEG in the capture directory");
  }

  // Streaming resumes after the exclusive operation.
  const std::size_t before = first->frames();
  if (!WaitUntil([&]() { return first->frames() > before + 1U; })) {
    Fail("stream should resume after the capture");
  }

  SettingsUpdate update;
  update.gamma = 2.0;
  const OperationResult updated = service.UpdateSettings(update);
  if (!updated.ok) {
    Fail("settings update failed: " + updated.message);
  }
  const auto* applied =
      std::get_if<scopecam::exclusive::SettingsDescriptor>(&updated.descriptor);
  if (applied == nullptr || applied->applied.gamma != 2.0) {
    Fail("settings update should return the applied gamma");
  }
  AssertContains(service.GetSettingsJson(), "\"gamma\":2");
  ExpectKind(service.UpdateSettings(SettingsUpdate{}), ErrorKind::kInvalidArgument,
             "empty settings update");

  const OperationResult once = service.RequestAutoExposure(AutoExposureRequest::kOnce);
  if (!once.ok) {
    Fail("one-push auto exposure failed: " + once.message);
  }

  std::string listing;
  if (!service.ListCaptures(listing, error)) {
    Fail("list captures failed: " + error);
  }
  AssertContains(listing, "\"count\":1");
  AssertContains(listing, "\"filename\":\"" + snapshot->filename + "\"");
  AssertContains(listing, "\"modified\":");

  const std::string health = service.Health();
  AssertContains(health, "\"status\":\"healthy\"");
  AssertContains(health, "\"camera_connected\":true");
  AssertContains(health, "\"simulated\":true");
  AssertContains(health, "\"clients\":2");

  service.RemoveClient(first);
  service.RemoveClient(second);
  if (!service.engine()->WaitForState(StreamState::kIdle, std::chrono::seconds(5))) {
    Fail("stream should stop once every client left");
  }

  service.Shutdown();
  service.Shutdown();
  if (service.started()) {
    Fail("service should report stopped after shutdown");
  }
  AssertContains(service.Health(), "\"camera_connected\":false");
}

void JsonlSinkRecordsStream(scopecam::core::logging::Logger& logger) {
  ScopedTempDir captures("scopecam-service-jsonl");
  CameraService service(SimulatedConfig(captures.path()), logger);
  std::string error;
  if (!service.Start(error)) {
    Fail("service start failed: " + error);
  }

  const auto out_path = captures.path() / "logs" / "stream.jsonl";
  auto sink = std::make_shared<JsonlFileSink>(out_path, false);
  if (!sink->Open(error)) {
    Fail("jsonl sink open failed: " + error);
  }
  if (!service.AddClient(sink, error)) {
    Fail("jsonl client rejected: " + error);
  }
  if (!WaitUntil([&]() { return sink->frames_written() >= 3U; })) {
    Fail("jsonl sink should record frames");
  }
  service.RemoveClient(sink);
  service.Shutdown();

  const std::string text = ReadFileToString(out_path);
  AssertContains(text, "\"type\":\"connected\"");
  AssertContains(text, "\"data_len\":");
  AssertNotContains(text, "\"data\":\"");
}

void ParseAutoExposureModes() {
  AutoExposureRequest request = AutoExposureRequest::kOnce;
  std::string error;
  if (!scopecam::service::ParseAutoExposureRequest("on", request, error) ||
      request != AutoExposureRequest::kEnable) {
    Fail("'on' should enable continuous auto exposure");
  }
  if (!scopecam::service::ParseAutoExposureRequest("disable", request, error) ||
      request != AutoExposureRequest::kDisable) {
    Fail("'disable' should disable continuous auto exposure");
  }
  if (scopecam::service::ParseAutoExposureRequest("sometimes", request, error)) {
    Fail("unknown auto exposure mode should be rejected");
  }
  AssertContains(error, "once|enable|disable");
}

// Another thread watching the service sees both transitions.
void StartedIsVisibleAcrossThreads(scopecam::core::logging::Logger& logger) {
  ScopedTempDir captures("scopecam-service-watch");
  CameraService service(SimulatedConfig(captures.path()), logger);

  std::atomic<bool> saw_started{false};
  std::atomic<bool> saw_stopped{false};
  std::thread watcher([&]() {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
      if (service.started()) {
        saw_started = true;
      } else if (saw_started) {
        saw_stopped = true;
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });

  std::string error;
  if (!service.Start(error)) {
    Fail("service start failed: " + error);
  }
  if (!WaitUntil([&]() { return saw_started.load(); })) {
    Fail("watcher should observe the started service");
  }
  service.Shutdown();
  watcher.join();
  AssertEq(saw_stopped.load(), true, "watcher observed shutdown");
}

} // namespace

int main() {
  std::ostringstream log_sink;
  scopecam::core::logging::Logger logger(scopecam::core::logging::LogLevel::kDebug, log_sink);

  NotStartedServiceRefusesWork(logger);
  FullServiceFlow(logger);
  JsonlSinkRecordsStream(logger);
  StartedIsVisibleAcrossThreads(logger);
  ParseAutoExposureModes();

  AssertContains(log_sink.str(), "camera service started");
  AssertContains(log_sink.str(), "camera service stopped");
  return 0;
}
