#include "core/errors/error_kind.hpp"
#include "core/errors/exit_codes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using scopecam::core::errors::ErrorKind;

TEST_CASE("Stable codes are fixed strings", "[core][errors]") {
  using scopecam::core::errors::ToStableCode;
  REQUIRE(ToStableCode(ErrorKind::kNone) == "OK");
  REQUIRE(ToStableCode(ErrorKind::kDeviceUnavailable) == "DEVICE_UNAVAILABLE");
  REQUIRE(ToStableCode(ErrorKind::kTransient) == "TRANSIENT");
  REQUIRE(ToStableCode(ErrorKind::kFatal) == "FATAL");
  REQUIRE(ToStableCode(ErrorKind::kUnsupported) == "UNSUPPORTED");
  REQUIRE(ToStableCode(ErrorKind::kBusy) == "BUSY");
  REQUIRE(ToStableCode(ErrorKind::kTimeout) == "TIMEOUT");
  REQUIRE(ToStableCode(ErrorKind::kClientSendFailure) == "CLIENT_SEND_FAILURE");
  REQUIRE(ToStableCode(ErrorKind::kInvalidArgument) == "INVALID_ARGUMENT");
  REQUIRE(ToStableCode(ErrorKind::kIo) == "IO_ERROR");
}

TEST_CASE("FormatError prefixes the code and collapses detail whitespace", "[core][errors]") {
  const std::string formatted = scopecam::core::errors::FormatError(
      ErrorKind::kBusy, "snapshot", "  another\n operation\t is running  ");
  REQUIRE(formatted.rfind("BUSY: ", 0) == 0);
  REQUIRE(formatted.find("retry snapshot") != std::string::npos);
  REQUIRE(formatted.find(" detail: another operation is running") != std::string::npos);
  REQUIRE(formatted.back() == 'g');
}

TEST_CASE("FormatError omits an empty detail", "[core][errors]") {
  const std::string formatted =
      scopecam::core::errors::FormatError(ErrorKind::kTimeout, "auto_exposure", " \n ");
  REQUIRE(formatted.rfind("TIMEOUT: ", 0) == 0);
  REQUIRE(formatted.find("detail:") == std::string::npos);
}

TEST_CASE("Actionable message falls back to a generic label", "[core][errors]") {
  const std::string message =
      scopecam::core::errors::BuildActionableMessage(ErrorKind::kFatal, "");
  REQUIRE(message.find("requested operation") != std::string::npos);
}

TEST_CASE("Exit codes keep their numeric contract", "[core][errors]") {
  using scopecam::core::errors::ExitCode;
  using scopecam::core::errors::ToInt;
  REQUIRE(ToInt(ExitCode::kSuccess) == 0);
  REQUIRE(ToInt(ExitCode::kFailure) == 1);
  REQUIRE(ToInt(ExitCode::kUsage) == 2);
  REQUIRE(ToInt(ExitCode::kDeviceFailed) == 20);
  REQUIRE(ToInt(ExitCode::kBusy) == 30);
}
