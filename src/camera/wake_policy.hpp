#pragma once

#include "camera/camera_adapter.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace camlink::core::logging {
class Logger;
}

namespace camlink::camera {

// Default number of Wake() calls for one wake incident. A GoPro coming out
// of sleep often misses the first BLE advertisement window.
constexpr std::uint32_t kDefaultWakeAttemptLimit = 3U;

// True for failures worth another attempt. Cancellation and explicit
// rejection are final.
bool IsRetryableWakeFailure(AdapterErrorCode code);

// Result contract for one wake incident. The caller decides what a failed
// wake means for the command that needed it.
struct WakeAttemptResult {
  bool awake = false;
  std::uint32_t attempts_used = 0;
  AdapterError last_error;
  // Formatted for logs and Ack diagnostics; empty on success.
  std::string error;
};

// Calls Wake() up to `max_attempts` times, each bounded by
// `budget_per_attempt`. Stops early on success or a non-retryable failure.
WakeAttemptResult ExecuteWakeAttempts(ICameraAdapter& adapter, link::DeviceId device_id,
                                      std::uint32_t max_attempts,
                                      std::chrono::milliseconds budget_per_attempt,
                                      core::logging::Logger& logger);

} // namespace camlink::camera
