#pragma once

namespace scopecam::cli {

// Routes `scopecam` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args / invalid config)
//   20 => device could not be opened or reported a device failure
//   30 => another exclusive operation was running (BUSY)
int Dispatch(int argc, char** argv);

} // namespace scopecam::cli
