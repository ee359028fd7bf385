#include "camera/wake_policy.hpp"

#include "core/logging/logger.hpp"

namespace camlink::camera {

bool IsRetryableWakeFailure(const AdapterErrorCode code) {
  switch (code) {
  case AdapterErrorCode::kNotConnected:
  case AdapterErrorCode::kNoResponse:
  case AdapterErrorCode::kTimeout:
    return true;
  case AdapterErrorCode::kNone:
  case AdapterErrorCode::kCancelled:
  case AdapterErrorCode::kRejected:
    return false;
  }
  return false;
}

WakeAttemptResult ExecuteWakeAttempts(ICameraAdapter& adapter, const link::DeviceId device_id,
                                      const std::uint32_t max_attempts,
                                      const std::chrono::milliseconds budget_per_attempt,
                                      core::logging::Logger& logger) {
  WakeAttemptResult result;

  if (max_attempts == 0U) {
    result.last_error.Set(AdapterErrorCode::kNoResponse, "wake attempts exhausted");
    result.error = FormatAdapterError("wake", result.last_error);
    return result;
  }

  for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    ++result.attempts_used;
    AdapterError wake_error;
    if (adapter.Wake(device_id, budget_per_attempt, wake_error)) {
      if (attempt > 1U) {
        logger.Info("camera wake succeeded after retry",
                    {{"device_id", std::to_string(device_id)},
                     {"attempt", std::to_string(attempt)}});
      }
      result.awake = true;
      result.last_error.Clear();
      result.error.clear();
      return result;
    }

    result.last_error = wake_error;
    result.error = FormatAdapterError("wake", wake_error);
    logger.Warn("camera wake attempt failed",
                {{"device_id", std::to_string(device_id)},
                 {"attempt", std::to_string(attempt)},
                 {"max_attempts", std::to_string(max_attempts)},
                 {"error_code", ToStableErrorCode(wake_error.code)},
                 {"error_action", BuildActionableMessage(wake_error.code, "wake")},
                 {"error", wake_error.message}});

    if (!IsRetryableWakeFailure(wake_error.code)) {
      break;
    }
  }

  return result;
}

} // namespace camlink::camera
