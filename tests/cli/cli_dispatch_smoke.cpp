#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using scopecam::tests::common::AssertContains;
using scopecam::tests::common::AssertEq;
using scopecam::tests::common::DispatchArgs;
using scopecam::tests::common::Fail;
using scopecam::tests::common::ScopedTempDir;

struct CliRun {
  int exit_code = -1;
  std::string out;
  std::string err;
};

CliRun Run(const std::vector<std::string>& args) {
  std::vector<std::string> argv = {"scopecam"};
  argv.insert(argv.end(), args.begin(), args.end());

  std::ostringstream captured_stdout;
  std::ostringstream captured_stderr;
  std::streambuf* original_stdout = std::cout.rdbuf(captured_stdout.rdbuf());
  std::streambuf* original_stderr = std::cerr.rdbuf(captured_stderr.rdbuf());
  const int exit_code = DispatchArgs(argv);
  std::cout.rdbuf(original_stdout);
  std::cerr.rdbuf(original_stderr);

  return CliRun{exit_code, captured_stdout.str(), captured_stderr.str()};
}

void Touch(const std::filesystem::path& path) {
  std::ofstream out(path, std::ios::binary);
  out << "x";
  if (!out) {
    Fail("failed to create fixture file: " + path.string());
  }
}

std::vector<std::string> SimulatedFlags(const std::filesystem::path& capture_dir) {
  return {"--simulate",        "--capture-dir", capture_dir.string(),
          "--sim-width",       "64",            "--sim-height",
          "48",                "--sim-fps",     "60",
          "--frame-interval-ms", "5",           "--ae-poll-ms",
          "5"};
}

std::vector<std::string> Concat(std::vector<std::string> head,
                                const std::vector<std::string>& tail) {
  head.insert(head.end(), tail.begin(), tail.end());
  return head;
}

} // namespace

int main() {
  const CliRun version = Run({"version"});
  AssertEq(version.exit_code, 0, "version exit code");
  AssertContains(version.out, "scopecam ");

  const CliRun missing = Run({});
  AssertEq(missing.exit_code, 2, "missing subcommand exit code");

  const CliRun unknown = Run({"frobnicate"});
  AssertEq(unknown.exit_code, 2, "unknown subcommand exit code");
  AssertContains(unknown.err, "unknown subcommand: frobnicate");

  const CliRun bad_option = Run({"health", "--no-such-option", "1"});
  AssertEq(bad_option.exit_code, 2, "unknown option exit code");
  AssertContains(bad_option.err, "unknown option: --no-such-option");

  const CliRun bad_quality = Run({"health", "--stream-quality", "0"});
  AssertEq(bad_quality.exit_code, 2, "invalid config exit code");

  ScopedTempDir listing_dir("scopecam-cli-list");
  Touch(listing_dir.path() / "b_capture.JPG");
  Touch(listing_dir.path() / "a_recording.avi");
  Touch(listing_dir.path() / "notes.txt");
  const CliRun listed = Run({"list-captures", "--capture-dir", listing_dir.path().string()});
  AssertEq(listed.exit_code, 0, "list-captures exit code");
  AssertContains(listed.out, "\"count\":2");
  AssertContains(listed.out, "{\"filename\":\"a_recording.avi\"");
  if (listed.out.find("a_recording.avi") > listed.out.find("b_capture.JPG")) {
    Fail("captures should be listed in name order");
  }
  if (listed.out.find("notes.txt") != std::string::npos) {
    Fail("non-capture files must not be listed");
  }

  ScopedTempDir captures("scopecam-cli");
  const CliRun health = Run(Concat({"health"}, SimulatedFlags(captures.path())));
  AssertEq(health.exit_code, 0, "health exit code");
  AssertContains(health.out, "\"status\":\"healthy\"");
  AssertContains(health.out, "\"simulated\":true");

  const CliRun snapshot =
      Run(Concat({"snapshot", "--set-gain", "3"}, SimulatedFlags(captures.path())));
  AssertEq(snapshot.exit_code, 0, "snapshot exit code");
  AssertContains(snapshot.out, "\"success\":true");
  AssertContains(snapshot.out, "\"gain\":3");

  const CliRun settings =
      Run(Concat({"settings", "--set-gamma", "1.5"}, SimulatedFlags(captures.path())));
  AssertEq(settings.exit_code, 0, "settings exit code");
  AssertContains(settings.out, "\"gamma\":1.5");

  const CliRun no_duration = Run(Concat({"video"}, SimulatedFlags(captures.path())));
  AssertEq(no_duration.exit_code, 2, "video without duration");
  AssertContains(no_duration.err, "--duration");

  const CliRun ae_mode = Run(Concat({"auto-exposure", "sideways"}, SimulatedFlags(captures.path())));
  AssertEq(ae_mode.exit_code, 2, "invalid auto exposure mode");

  const CliRun ae_once = Run(Concat({"auto-exposure", "once"}, SimulatedFlags(captures.path())));
  AssertEq(ae_once.exit_code, 0, "auto-exposure once exit code");
  AssertContains(ae_once.out, "\"mode\":\"once\"");

  const auto stream_out = captures.path() / "stream.jsonl";
  const CliRun stream = Run(Concat({"stream", "--seconds", "0.5", "--out", stream_out.string()},
                                   SimulatedFlags(captures.path())));
  AssertEq(stream.exit_code, 0, "stream exit code");
  AssertContains(stream.out, "\"frames\":");
  if (!std::filesystem::exists(stream_out)) {
    Fail("stream command should write its jsonl log");
  }

  return 0;
}
