#include "scopecam/cli/router.hpp"

#include "core/config/service_config.hpp"
#include "core/errors/error_kind.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "device/device_factory.hpp"
#include "exclusive/operation_result.hpp"
#include "service/camera_service.hpp"
#include "service/jsonl_file_sink.hpp"
#include "settings/capture_settings.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace scopecam::cli {

namespace {

using core::config::ServiceConfig;
using core::errors::ErrorKind;

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitDeviceFailed = core::errors::ToInt(core::errors::ExitCode::kDeviceFailed);
constexpr int kExitBusy = core::errors::ToInt(core::errors::ExitCode::kBusy);

constexpr std::string_view kVersion = "0.1.0";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  scopecam stream [--seconds <s>] [--out <file.jsonl>] [--keep-frames]\n"
      << "  scopecam snapshot [--set-exposure <ms>] [--set-gain <g>] [--set-gamma <g>]\n"
      << "  scopecam video --duration <s> [--fps <playback_fps>] [--decimation <n>]\n"
      << "  scopecam auto-exposure <once|enable|disable>\n"
      << "  scopecam settings [--set-exposure <ms>] [--set-gain <g>] [--set-gamma <g>]\n"
      << "  scopecam list-captures\n"
      << "  scopecam health\n"
      << "  scopecam version\n"
      << "\n"
      << "service options (every command; SCOPECAM_<KEY> sets the same value):\n"
      << "  --serial <sn> --simulate --capture-dir <dir> --log-level "
      << core::logging::ExpectedLogLevelList() << "\n"
      << "  --stream-quality <1-100> --snapshot-quality <1-100> --exposure-ms <ms> --gain <g>\n"
      << "  --sim-width <px> --sim-height <px> --sim-fps <fps> --device-workers <n>\n"
      << "  --frame-interval-ms --pause-grace-ms --paused-wait-ms --failure-delay-ms\n"
      << "  --start-settle-ms --ae-poll-ms --ae-timeout-ms --clip-margin-ms <ms>\n";
}

// Flags that take no value.
bool IsSwitch(std::string_view key) {
  return key == "simulate" || key == "keep-frames";
}

struct ParsedArgs {
  // Command-specific `--key value` pairs ("true" for switches).
  std::map<std::string, std::string, std::less<>> flags;
  std::vector<std::string> positionals;
};

// Splits argv into command flags (named in `command_flags`), positionals and
// service overrides. Overrides layer on top of the environment, then the
// merged config is validated.
bool ParseArgs(const std::vector<std::string_view>& args,
               const std::vector<std::string_view>& command_flags, ServiceConfig& config,
               ParsedArgs& parsed, std::string& error) {
  if (!core::config::ApplyEnvironment(config, error)) {
    return false;
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token.size() < 3U || token.substr(0, 2) != "--") {
      if (!token.empty() && token.front() == '-') {
        error = "unknown option: " + std::string(token);
        return false;
      }
      parsed.positionals.emplace_back(token);
      continue;
    }

    const std::string_view key = token.substr(2);
    std::string_view value = "true";
    if (!IsSwitch(key)) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      value = args[++i];
    }

    bool is_command_flag = false;
    for (const std::string_view flag : command_flags) {
      if (flag == key) {
        is_command_flag = true;
        break;
      }
    }
    if (is_command_flag) {
      parsed.flags[std::string(key)] = std::string(value);
      continue;
    }

    std::string override_error;
    if (!core::config::ApplyOverride(config, key, value, override_error)) {
      error = override_error.rfind("unknown config key", 0) == 0
                  ? "unknown option: " + std::string(token)
                  : std::string(token) + ": " + override_error;
      return false;
    }
  }

  return core::config::ValidateServiceConfig(config, error);
}

bool ParseDouble(std::string_view raw, double& parsed) {
  if (raw.empty()) {
    return false;
  }
  const std::string value(raw);
  char* parse_end = nullptr;
  parsed = std::strtod(value.c_str(), &parse_end);
  return parse_end != nullptr && *parse_end == '\0' && std::isfinite(parsed);
}

bool ParseUInt32(std::string_view raw, std::uint32_t& parsed) {
  if (raw.empty()) {
    return false;
  }
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(raw.data(), end, parsed);
  return ec == std::errc() && ptr == end;
}

bool ReadDoubleFlag(const ParsedArgs& parsed, std::string_view key, std::optional<double>& out,
                    std::string& error) {
  const auto it = parsed.flags.find(key);
  if (it == parsed.flags.end()) {
    return true;
  }
  double value = 0.0;
  if (!ParseDouble(it->second, value)) {
    error = "invalid value for --" + std::string(key) + ": '" + it->second + "'";
    return false;
  }
  out = value;
  return true;
}

bool ReadSettingsUpdate(const ParsedArgs& parsed, settings::SettingsUpdate& update,
                        std::string& error) {
  return ReadDoubleFlag(parsed, "set-exposure", update.exposure_ms, error) &&
         ReadDoubleFlag(parsed, "set-gain", update.gain, error) &&
         ReadDoubleFlag(parsed, "set-gamma", update.gamma, error);
}

int ExitCodeFor(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return kExitSuccess;
  case ErrorKind::kBusy:
    return kExitBusy;
  case ErrorKind::kDeviceUnavailable:
  case ErrorKind::kTransient:
  case ErrorKind::kFatal:
    return kExitDeviceFailed;
  case ErrorKind::kInvalidArgument:
    return kExitUsage;
  case ErrorKind::kUnsupported:
  case ErrorKind::kTimeout:
  case ErrorKind::kClientSendFailure:
  case ErrorKind::kIo:
    return kExitFailure;
  }
  return kExitFailure;
}

int ReportResult(const exclusive::OperationResult& result) {
  std::cout << exclusive::ToJson(result) << '\n';
  if (!result.ok) {
    std::cerr << "error: " << result.message << '\n';
    return ExitCodeFor(result.kind);
  }
  return kExitSuccess;
}

// Builds the logger and service for one command, runs `body` and always
// shuts the service down before returning.
int WithService(const ServiceConfig& config, std::string_view command,
                const std::function<int(service::CameraService&)>& body) {
  core::logging::Logger logger(config.log_level);
  logger.SetSessionId(std::string(command) + "-" +
                      core::FormatFilenameStamp(std::chrono::system_clock::now()));

  service::CameraService camera(config, logger);
  std::string error;
  if (!camera.Start(error)) {
    std::cerr << "error: "
              << core::errors::FormatError(ErrorKind::kDeviceUnavailable, command, error)
              << '\n';
    return kExitDeviceFailed;
  }

  const int exit_code = body(camera);
  camera.Shutdown();
  return exit_code;
}

int UsageError(const std::string& error) {
  std::cerr << "error: " << error << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "scopecam " << kVersion << '\n'
            << "hardware adapter: " << device::HardwareAdapterAvailabilityStatusText() << '\n';
  return kExitSuccess;
}

int CommandStream(const std::vector<std::string_view>& args) {
  ServiceConfig config;
  ParsedArgs parsed;
  std::string error;
  if (!ParseArgs(args, {"seconds", "out", "keep-frames"}, config, parsed, error)) {
    return UsageError(error);
  }
  if (!parsed.positionals.empty()) {
    return UsageError("stream does not accept positional arguments");
  }

  double seconds = 5.0;
  if (const auto it = parsed.flags.find("seconds"); it != parsed.flags.end()) {
    if (!ParseDouble(it->second, seconds) || seconds <= 0.0) {
      return UsageError("--seconds must be a number > 0");
    }
  }
  const fs::path out_path = parsed.flags.count("out") != 0U
                                ? fs::path(parsed.flags.at("out"))
                                : config.capture_dir / "stream.jsonl";
  const bool keep_frames = parsed.flags.count("keep-frames") != 0U;

  return WithService(config, "stream", [&](service::CameraService& camera) {
    auto sink = std::make_shared<service::JsonlFileSink>(out_path, keep_frames);
    std::string stream_error;
    if (!sink->Open(stream_error)) {
      std::cerr << "error: " << stream_error << '\n';
      return kExitFailure;
    }
    if (!camera.AddClient(sink, stream_error)) {
      std::cerr << "error: "
                << core::errors::FormatError(ErrorKind::kClientSendFailure, "stream",
                                             stream_error)
                << '\n';
      return kExitFailure;
    }

    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    camera.RemoveClient(sink);
    const bool settled = camera.engine()->WaitForState(streaming::StreamState::kIdle,
                                                       std::chrono::seconds(5));

    std::cout << "{\"path\":" << core::JsonString(out_path.generic_string()) << ",\"lines\":"
              << sink->lines_written() << ",\"frames\":" << sink->frames_written()
              << ",\"settled\":" << core::JsonBool(settled) << "}\n";
    if (sink->frames_written() == 0U) {
      std::cerr << "error: no frames were broadcast within " << seconds << " s\n";
      return kExitFailure;
    }
    return kExitSuccess;
  });
}

int CommandSnapshot(const std::vector<std::string_view>& args) {
  ServiceConfig config;
  ParsedArgs parsed;
  std::string error;
  if (!ParseArgs(args, {"set-exposure", "set-gain", "set-gamma"}, config, parsed, error)) {
    return UsageError(error);
  }
  if (!parsed.positionals.empty()) {
    return UsageError("snapshot does not accept positional arguments");
  }
  settings::SettingsUpdate overrides;
  if (!ReadSettingsUpdate(parsed, overrides, error)) {
    return UsageError(error);
  }

  return WithService(config, "snapshot", [&overrides](service::CameraService& camera) {
    return ReportResult(camera.RequestCapture(overrides));
  });
}

int CommandVideo(const std::vector<std::string_view>& args) {
  ServiceConfig config;
  ParsedArgs parsed;
  std::string error;
  if (!ParseArgs(args, {"duration", "fps", "decimation"}, config, parsed, error)) {
    return UsageError(error);
  }
  if (!parsed.positionals.empty()) {
    return UsageError("video does not accept positional arguments");
  }

  double duration_s = 0.0;
  const auto duration_it = parsed.flags.find("duration");
  if (duration_it == parsed.flags.end()) {
    return UsageError("video requires --duration <seconds>");
  }
  if (!ParseDouble(duration_it->second, duration_s)) {
    return UsageError("invalid value for --duration: '" + duration_it->second + "'");
  }
  double playback_fps = 25.0;
  if (const auto it = parsed.flags.find("fps"); it != parsed.flags.end()) {
    if (!ParseDouble(it->second, playback_fps)) {
      return UsageError("invalid value for --fps: '" + it->second + "'");
    }
  }
  std::uint32_t decimation = 1;
  if (const auto it = parsed.flags.find("decimation"); it != parsed.flags.end()) {
    if (!ParseUInt32(it->second, decimation)) {
      return UsageError("invalid value for --decimation: '" + it->second + "'");
    }
  }

  return WithService(config, "video", [&](service::CameraService& camera) {
    return ReportResult(camera.RequestVideo(duration_s, playback_fps, decimation));
  });
}

int CommandAutoExposure(const std::vector<std::string_view>& args) {
  ServiceConfig config;
  ParsedArgs parsed;
  std::string error;
  if (!ParseArgs(args, {}, config, parsed, error)) {
    return UsageError(error);
  }
  if (parsed.positionals.size() != 1U) {
    return UsageError("auto-exposure requires exactly 1 argument: <once|enable|disable>");
  }
  service::AutoExposureRequest request = service::AutoExposureRequest::kOnce;
  if (!service::ParseAutoExposureRequest(parsed.positionals.front(), request, error)) {
    return UsageError(error);
  }

  return WithService(config, "auto-exposure", [request](service::CameraService& camera) {
    return ReportResult(camera.RequestAutoExposure(request));
  });
}

int CommandSettings(const std::vector<std::string_view>& args) {
  ServiceConfig config;
  ParsedArgs parsed;
  std::string error;
  if (!ParseArgs(args, {"set-exposure", "set-gain", "set-gamma"}, config, parsed, error)) {
    return UsageError(error);
  }
  if (!parsed.positionals.empty()) {
    return UsageError("settings does not accept positional arguments");
  }
  settings::SettingsUpdate update;
  if (!ReadSettingsUpdate(parsed, update, error)) {
    return UsageError(error);
  }

  return WithService(config, "settings", [&update](service::CameraService& camera) {
    int exit_code = kExitSuccess;
    if (!update.empty()) {
      const exclusive::OperationResult result = camera.UpdateSettings(update);
      if (!result.ok) {
        std::cerr << "error: " << result.message << '\n';
        exit_code = ExitCodeFor(result.kind);
      }
    }
    std::cout << camera.GetSettingsJson() << '\n';
    return exit_code;
  });
}

int CommandListCaptures(const std::vector<std::string_view>& args) {
  ServiceConfig config;
  ParsedArgs parsed;
  std::string error;
  if (!ParseArgs(args, {}, config, parsed, error)) {
    return UsageError(error);
  }
  if (!parsed.positionals.empty()) {
    return UsageError("list-captures does not accept positional arguments");
  }

  // Listing needs no device.
  core::logging::Logger logger(config.log_level);
  const service::CameraService camera(config, logger);
  std::string json;
  if (!camera.ListCaptures(json, error)) {
    std::cerr << "error: " << core::errors::FormatError(ErrorKind::kIo, "list-captures", error)
              << '\n';
    return kExitFailure;
  }
  std::cout << json << '\n';
  return kExitSuccess;
}

int CommandHealth(const std::vector<std::string_view>& args) {
  ServiceConfig config;
  ParsedArgs parsed;
  std::string error;
  if (!ParseArgs(args, {}, config, parsed, error)) {
    return UsageError(error);
  }
  if (!parsed.positionals.empty()) {
    return UsageError("health does not accept positional arguments");
  }

  core::logging::Logger logger(config.log_level);
  service::CameraService camera(config, logger);
  if (!camera.Start(error)) {
    std::cout << camera.Health() << '\n';
    std::cerr << "error: "
              << core::errors::FormatError(ErrorKind::kDeviceUnavailable, "health", error)
              << '\n';
    return kExitDeviceFailed;
  }
  std::cout << camera.Health() << '\n';
  camera.Shutdown();
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "stream") {
    return CommandStream(args);
  }
  if (command == "snapshot") {
    return CommandSnapshot(args);
  }
  if (command == "video") {
    return CommandVideo(args);
  }
  if (command == "auto-exposure") {
    return CommandAutoExposure(args);
  }
  if (command == "settings") {
    return CommandSettings(args);
  }
  if (command == "list-captures") {
    return CommandListCaptures(args);
  }
  if (command == "health") {
    return CommandHealth(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace scopecam::cli
