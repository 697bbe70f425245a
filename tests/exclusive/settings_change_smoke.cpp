#include "common/assertions.hpp"
#include "common/coordinator_fixture.hpp"
#include "common/mock_device.hpp"
#include "common/temp_dir.hpp"
#include "exclusive/exclusive_operation.hpp"
#include "exclusive/operation_result.hpp"

#include <cmath>
#include <string>
#include <variant>

namespace {

using scopecam::core::errors::ErrorKind;
using scopecam::device::DeviceStatus;
using scopecam::device::Feature;
using scopecam::exclusive::OperationResult;
using scopecam::exclusive::SettingsChange;
using scopecam::exclusive::SettingsDescriptor;
using scopecam::settings::SettingsUpdate;
using scopecam::tests::common::AssertContains;
using scopecam::tests::common::AssertKind;
using scopecam::tests::common::AssertOk;
using scopecam::tests::common::CoordinatorFixture;
using scopecam::tests::common::Fail;
using scopecam::tests::common::MockDevice;
using scopecam::tests::common::ScopedTempDir;

void ExpectNear(double actual, double expected, const std::string& what) {
  if (std::fabs(actual - expected) > 1e-9) {
    Fail(what + ": expected " + std::to_string(expected) + ", got " + std::to_string(actual));
  }
}

const SettingsDescriptor& RequireDescriptor(const OperationResult& result) {
  const auto* descriptor = std::get_if<SettingsDescriptor>(&result.descriptor);
  if (descriptor == nullptr) {
    Fail("settings result should carry the applied settings");
  }
  return *descriptor;
}

void ChangeReportsAppliedValues() {
  ScopedTempDir captures("scopecam-settings-change");
  MockDevice device;
  CoordinatorFixture fixture(device, captures.path());

  SettingsUpdate update;
  update.exposure_ms = 20.0;
  update.gamma = 2.0;
  const OperationResult result = fixture.coordinator().RunExclusive(SettingsChange{update});
  AssertOk(result, "settings change");

  const SettingsDescriptor& descriptor = RequireDescriptor(result);
  ExpectNear(descriptor.applied.exposure_ms, 20.0, "applied exposure");
  ExpectNear(descriptor.applied.gamma, 2.0, "applied gamma");
  ExpectNear(descriptor.applied.gain, 0.0, "untouched gain");

  const std::string json = scopecam::exclusive::ToJson(result);
  AssertContains(json, R"({"success":true,"settings":{"exposure":20,"gain":0,"gamma":2,)");
}

// A rejected field leaves the other fields applied, and the result says so.
void PartialFailureReportsAppliedValues() {
  ScopedTempDir captures("scopecam-settings-partial");
  MockDevice::Options device_options;
  device_options.set_feature_status[Feature::kGain] = DeviceStatus::kFatal;
  MockDevice device(device_options);
  CoordinatorFixture fixture(device, captures.path());

  SettingsUpdate update;
  update.exposure_ms = 20.0;
  update.gain = 5.0;
  const OperationResult result = fixture.coordinator().RunExclusive(SettingsChange{update});
  AssertKind(result, ErrorKind::kFatal, "rejected gain");

  const SettingsDescriptor& descriptor = RequireDescriptor(result);
  ExpectNear(descriptor.applied.exposure_ms, 20.0, "exposure applied despite gain failure");
  ExpectNear(descriptor.applied.gain, 0.0, "gain keeps its previous value");
  ExpectNear(fixture.settings().Get().exposure_ms, 20.0, "stored exposure");

  const std::string json = scopecam::exclusive::ToJson(result);
  AssertContains(json, R"({"success":false,"error":{"code":"FATAL",)");
  AssertContains(json, R"("settings":{"exposure":20,"gain":0,)");
}

} // namespace

int main() {
  ChangeReportsAppliedValues();
  PartialFailureReportsAppliedValues();
  return 0;
}
