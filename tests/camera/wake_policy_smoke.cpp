#include "../common/assertions.hpp"
#include "camera/camera_adapter.hpp"
#include "camera/wake_policy.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <cstdint>
#include <sstream>
#include <vector>

namespace {

using camlink::camera::AdapterError;
using camlink::camera::AdapterErrorCode;

class ScriptedCamera final : public camlink::camera::ICameraAdapter {
public:
  std::vector<AdapterErrorCode> wake_script;
  std::uint32_t wake_calls = 0;

  bool Wake(camlink::link::DeviceId, std::chrono::milliseconds, AdapterError& error) override {
    ++wake_calls;
    if (wake_calls > wake_script.size()) {
      error.Set(AdapterErrorCode::kRejected, "unexpected scripted call");
      return false;
    }
    const AdapterErrorCode code = wake_script[wake_calls - 1U];
    if (code == AdapterErrorCode::kNone) {
      error.Clear();
      return true;
    }
    error.Set(code, "scripted wake failure");
    return false;
  }

  bool SetRecording(bool, std::chrono::milliseconds, AdapterError& error) override {
    error.Set(AdapterErrorCode::kRejected, "not used in test");
    return false;
  }

  bool QueryStatus(camlink::link::CameraStatus&, std::chrono::milliseconds,
                   AdapterError& error) override {
    error.Set(AdapterErrorCode::kRejected, "not used in test");
    return false;
  }

  bool PowerDown(std::chrono::milliseconds, AdapterError& error) override {
    error.Set(AdapterErrorCode::kRejected, "not used in test");
    return false;
  }

  void Cancel() override {}
};

} // namespace

int main() {
  using camlink::camera::ExecuteWakeAttempts;
  using camlink::camera::IsRetryableWakeFailure;
  using camlink::core::logging::Logger;
  using camlink::core::logging::LogLevel;
  using camlink::tests::common::AssertContains;
  using camlink::tests::common::Fail;
  using namespace std::chrono_literals;

  if (!IsRetryableWakeFailure(AdapterErrorCode::kNoResponse) ||
      !IsRetryableWakeFailure(AdapterErrorCode::kTimeout) ||
      !IsRetryableWakeFailure(AdapterErrorCode::kNotConnected)) {
    Fail("link-level wake failures should be retryable");
  }
  if (IsRetryableWakeFailure(AdapterErrorCode::kCancelled) ||
      IsRetryableWakeFailure(AdapterErrorCode::kRejected)) {
    Fail("cancel and reject must end the wake incident");
  }

  {
    ScriptedCamera camera;
    camera.wake_script = {AdapterErrorCode::kNoResponse, AdapterErrorCode::kNone};
    std::ostringstream log_output;
    Logger logger(LogLevel::kInfo, log_output);
    const auto result = ExecuteWakeAttempts(camera, 2, 3U, 500ms, logger);
    if (!result.awake || result.attempts_used != 2U || !result.error.empty()) {
      Fail("expected wake to succeed on the second attempt");
    }
    if (camera.wake_calls != 2U) {
      Fail("expected exactly two wake calls");
    }
    AssertContains(log_output.str(), "camera wake attempt failed");
    AssertContains(log_output.str(), "CAMERA_NO_RESPONSE");
  }

  {
    ScriptedCamera camera;
    camera.wake_script = {AdapterErrorCode::kTimeout, AdapterErrorCode::kTimeout,
                          AdapterErrorCode::kTimeout};
    std::ostringstream log_output;
    Logger logger(LogLevel::kError, log_output);
    const auto result = ExecuteWakeAttempts(camera, 2, 2U, 500ms, logger);
    if (result.awake || result.attempts_used != 2U) {
      Fail("expected the wake budget to be exhausted after two attempts");
    }
    if (result.last_error.code != AdapterErrorCode::kTimeout) {
      Fail("expected the last error to be kept");
    }
    AssertContains(result.error, "CAMERA_TIMEOUT");
  }

  {
    ScriptedCamera camera;
    camera.wake_script = {AdapterErrorCode::kRejected, AdapterErrorCode::kNone};
    std::ostringstream log_output;
    Logger logger(LogLevel::kError, log_output);
    const auto result = ExecuteWakeAttempts(camera, 2, 3U, 500ms, logger);
    if (result.awake || camera.wake_calls != 1U) {
      Fail("a rejected wake must not be retried");
    }
  }

  {
    ScriptedCamera camera;
    std::ostringstream log_output;
    Logger logger(LogLevel::kError, log_output);
    const auto result = ExecuteWakeAttempts(camera, 2, 0U, 500ms, logger);
    if (result.awake || camera.wake_calls != 0U) {
      Fail("zero attempts must not call the camera");
    }
    AssertContains(result.error, "wake attempts exhausted");
  }

  return 0;
}
