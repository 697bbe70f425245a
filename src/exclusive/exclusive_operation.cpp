#include "exclusive/exclusive_operation.hpp"

#include <cmath>
#include <limits>

namespace scopecam::exclusive {

namespace {

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

const char* OperationName(const ExclusiveOperation& operation) {
  return std::visit(Overloaded{
                        [](const Snapshot&) { return "snapshot"; },
                        [](const VideoRecording&) { return "video"; },
                        [](const AutoExposureOnce&) { return "auto_exposure_once"; },
                        [](const AutoExposureContinuous&) { return "auto_exposure_continuous"; },
                        [](const SettingsChange&) { return "settings"; },
                    },
                    operation);
}

std::uint32_t ComputeClipFrameBudget(const double duration_s, const double device_fps,
                                     const std::uint32_t decimation) {
  if (!std::isfinite(duration_s) || !std::isfinite(device_fps) || duration_s <= 0.0 ||
      device_fps <= 0.0 || decimation == 0U) {
    return 0U;
  }

  // The epsilon keeps exact products like 2.0 * 30.0 from flooring down.
  const double budget = std::floor(duration_s * device_fps / decimation + 1e-9);
  if (budget < 1.0) {
    return 1U;
  }
  if (budget > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    return std::numeric_limits<std::uint32_t>::max();
  }
  return static_cast<std::uint32_t>(budget);
}

} // namespace scopecam::exclusive
