#include "../common/assertions.hpp"
#include "camera/sim/sim_camera_adapter.hpp"

#include <chrono>
#include <string>

int main() {
  using camlink::camera::AdapterError;
  using camlink::camera::AdapterErrorCode;
  using camlink::camera::sim::SimCameraAdapter;
  using camlink::tests::common::AssertContains;
  using camlink::tests::common::Fail;
  using namespace std::chrono_literals;

  {
    SimCameraAdapter adapter;
    AdapterError error;
    if (!adapter.SetRecording(true, 1000ms, error)) {
      Fail("expected awake camera to start recording: " + error.message);
    }
    if (!adapter.SetRecording(true, 1000ms, error)) {
      Fail("expected repeated start to succeed");
    }
    if (adapter.ActuationCount() != 1U) {
      Fail("repeated start must not actuate the shutter twice");
    }

    camlink::link::CameraStatus status;
    if (!adapter.QueryStatus(status, 1000ms, error)) {
      Fail("expected status query to succeed");
    }
    if (status.recording_state != camlink::link::RecordingState::kRecording ||
        !status.camera_connected || status.camera_asleep) {
      Fail("status should report an awake recording camera");
    }
    if (status.battery_percent != 90U || status.signal_quality != 80U) {
      Fail("unexpected default battery or signal quality");
    }

    if (adapter.PowerDown(1000ms, error)) {
      Fail("power down must be refused while recording");
    }
    if (error.code != AdapterErrorCode::kRejected) {
      Fail("expected CAMERA_REJECTED for power down while recording");
    }
  }

  {
    SimCameraAdapter adapter;
    std::string param_error;
    if (!adapter.SetParam("asleep", "true", param_error)) {
      Fail("asleep parameter rejected: " + param_error);
    }
    AdapterError error;
    if (adapter.SetRecording(true, 1000ms, error)) {
      Fail("sleeping camera must not start recording");
    }
    if (error.code != AdapterErrorCode::kNotConnected) {
      Fail("expected CAMERA_NOT_CONNECTED while asleep");
    }
    if (!adapter.Wake(3, 1000ms, error) || adapter.IsAsleep()) {
      Fail("expected wake to bring the camera up");
    }
    if (adapter.DumpConfig().at("asleep") != "false") {
      Fail("dumped config should follow the wake");
    }
  }

  {
    SimCameraAdapter adapter;
    std::string param_error;
    if (!adapter.SetParam("asleep", "true", param_error) ||
        !adapter.SetParam("wake_responds", "false", param_error)) {
      Fail("failed to script an unresponsive camera: " + param_error);
    }
    AdapterError error;
    if (adapter.Wake(4, 1000ms, error)) {
      Fail("unresponsive camera must not wake");
    }
    if (error.code != AdapterErrorCode::kNoResponse) {
      Fail("expected CAMERA_NO_RESPONSE");
    }
    AssertContains(error.message, "camera 4");
  }

  {
    SimCameraAdapter adapter;
    std::string param_error;
    if (!adapter.SetParam("fail_commands", "1", param_error)) {
      Fail("fail_commands rejected: " + param_error);
    }
    AdapterError error;
    if (adapter.SetRecording(true, 1000ms, error) || error.code != AdapterErrorCode::kRejected) {
      Fail("expected the scripted rejection");
    }
    if (!adapter.SetRecording(true, 1000ms, error)) {
      Fail("expected the second shutter call to succeed");
    }
    if (adapter.SetRecordingCalls() != 2U || adapter.ActuationCount() != 1U) {
      Fail("unexpected call or actuation count after scripted rejection");
    }
  }

  {
    SimCameraAdapter adapter;
    std::string param_error;
    if (!adapter.SetParam("response_delay_ms", "500", param_error)) {
      Fail("response_delay_ms rejected: " + param_error);
    }
    AdapterError error;
    camlink::link::CameraStatus status;
    if (adapter.QueryStatus(status, 200ms, error) || error.code != AdapterErrorCode::kTimeout) {
      Fail("expected CAMERA_TIMEOUT when latency exceeds the budget");
    }
    if (!adapter.QueryStatus(status, 600ms, error)) {
      Fail("expected query to fit a larger budget");
    }

    adapter.Cancel();
    if (adapter.QueryStatus(status, 600ms, error) || error.code != AdapterErrorCode::kCancelled) {
      Fail("expected cancelled call");
    }
    if (!adapter.QueryStatus(status, 600ms, error)) {
      Fail("cancellation must only affect one call");
    }
  }

  {
    SimCameraAdapter adapter;
    std::string param_error;
    if (!adapter.SetParam("battery_percent", "10", param_error) ||
        !adapter.SetParam("overheating", "true", param_error)) {
      Fail("health parameters rejected: " + param_error);
    }
    AdapterError error;
    camlink::link::CameraStatus status;
    if (!adapter.QueryStatus(status, 1000ms, error)) {
      Fail("expected status query to succeed");
    }
    if (!status.HasFlag(camlink::link::HealthFlag::kLowBattery) ||
        !status.HasFlag(camlink::link::HealthFlag::kOverheating) ||
        status.HasFlag(camlink::link::HealthFlag::kLowTemperature)) {
      Fail("unexpected health flags");
    }

    if (adapter.SetParam("battery_percent", "101", param_error)) {
      Fail("battery above 100 must be rejected");
    }
    AssertContains(param_error, "0..100");
    if (adapter.SetParam("overheating", "maybe", param_error)) {
      Fail("non-boolean flag must be rejected");
    }
    if (adapter.SetParam("exposure", "1", param_error)) {
      Fail("unknown parameter must be rejected");
    }
    AssertContains(param_error, "unknown sim camera parameter");
    if (adapter.SetParam("adapter", "real", param_error)) {
      Fail("adapter identity must not be writable");
    }
  }

  return 0;
}
