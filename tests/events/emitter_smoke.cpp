#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "events/emitter.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

int main() {
  using camlink::tests::common::AssertContains;
  using camlink::tests::common::AssertNotContains;
  using camlink::tests::common::Fail;

  const fs::path out_dir = camlink::tests::common::CreateUniqueTempDir("camlink-emitter");
  fs::path events_path;
  std::string error;
  if (!camlink::events::StartEventLog(out_dir, events_path, error)) {
    Fail("StartEventLog failed: " + error);
  }
  const camlink::events::Emitter emitter(events_path);
  const auto ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'000));

  if (!emitter.EmitSimStarted(
          {
              .ts = ts,
              .plan_name = "basic_trigger",
              .seed = 7,
              .duration_ms = 5000,
              .controller_count = 2,
          },
          error)) {
    Fail("EmitSimStarted failed: " + error);
  }

  camlink::session::SubmitResult submit;
  submit.status = camlink::session::SubmitStatus::kCommandInFlight;
  submit.device_id = 2;
  submit.command = camlink::link::CommandKind::kTriggerStop;
  submit.message = "trigger_start seq=0 still pending";
  if (!emitter.EmitCommandSubmitted({.ts = ts, .t_ms = 100, .node = "remote", .submit = submit},
                                    error)) {
    Fail("EmitCommandSubmitted failed: " + error);
  }

  camlink::link::DeliveryResolution acked;
  acked.destination = 2;
  acked.sequence = 4;
  acked.command = camlink::link::CommandKind::kTriggerStart;
  acked.outcome = camlink::link::DeliveryOutcome::kAcked;
  acked.ack_result = camlink::link::AckResult::kCameraFailed;
  acked.transmissions = 2;
  acked.elapsed = std::chrono::milliseconds(850);
  if (!emitter.EmitCommandResolved({.ts = ts, .t_ms = 950, .node = "remote", .resolution = acked},
                                   error)) {
    Fail("EmitCommandResolved failed: " + error);
  }

  camlink::link::DeliveryResolution timed_out = acked;
  timed_out.outcome = camlink::link::DeliveryOutcome::kTimedOut;
  if (!emitter.EmitCommandResolved(
          {.ts = ts, .t_ms = 12000, .node = "remote", .resolution = timed_out}, error)) {
    Fail("EmitCommandResolved failed: " + error);
  }

  camlink::session::ConnectivityTransition transition;
  transition.device_id = 2;
  transition.from = camlink::session::Connectivity::kOnline;
  transition.to = camlink::session::Connectivity::kStale;
  if (!emitter.EmitConnectivityChanged(
          {.ts = ts, .t_ms = 20000, .node = "remote", .transition = transition}, error)) {
    Fail("EmitConnectivityChanged failed: " + error);
  }

  camlink::node::DroppedFrame drop;
  drop.code = camlink::core::errors::LinkErrorCode::kUnknownDevice;
  drop.reason = "frame for unconfigured device 9";
  drop.device_id = 9;
  if (!emitter.EmitFrameDropped({.ts = ts, .t_ms = 50, .node = "ctrl-a", .drop = drop}, error)) {
    Fail("EmitFrameDropped failed: " + error);
  }

  camlink::node::CommandExecution execution;
  execution.device_id = 2;
  execution.requester = 1;
  execution.sequence = 4;
  execution.actuated = true;
  execution.acked = true;
  if (!emitter.EmitCameraActuated(
          {.ts = ts, .t_ms = 60, .node = "ctrl-a", .execution = execution}, error)) {
    Fail("EmitCameraActuated failed: " + error);
  }

  if (!emitter.EmitSimFinished({.ts = ts,
                                .t_ms = 30000,
                                .expectations_met = false,
                                .expectation_failures = 1,
                                .radio_transmissions = 40,
                                .radio_dropped = 3},
                               error)) {
    Fail("EmitSimFinished failed: " + error);
  }

  const auto lines = camlink::tests::common::ReadJsonlRecords(emitter.LogPath());
  if (lines.size() != 8U) {
    Fail("expected eight emitted events");
  }

  AssertContains(lines[0], R"("type":"SIM_STARTED")");
  AssertContains(lines[0], R"("plan":"basic_trigger")");
  AssertContains(lines[0], R"("controllers":"2")");

  AssertContains(lines[1], R"("type":"COMMAND_SUBMITTED")");
  AssertContains(lines[1], R"("status":"command_in_flight")");
  AssertContains(lines[1], R"("command":"trigger_stop")");

  AssertContains(lines[2], R"("type":"COMMAND_ACKED")");
  AssertContains(lines[2], R"("result":"camera_failed")");
  AssertContains(lines[2], R"("transmissions":"2")");
  AssertNotContains(lines[2], "error_code");

  AssertContains(lines[3], R"("type":"COMMAND_TIMED_OUT")");
  AssertContains(lines[3], R"("error_code":"TIMED_OUT")");
  AssertNotContains(lines[3], R"("result")");

  AssertContains(lines[4], R"("type":"CONNECTIVITY_CHANGED")");
  AssertContains(lines[4], R"("from":"online")");
  AssertContains(lines[4], R"("to":"stale")");

  AssertContains(lines[5], R"("type":"FRAME_DROPPED")");
  AssertContains(lines[5], R"("error_code":"UNKNOWN_DEVICE")");
  AssertContains(lines[5], R"("node":"ctrl-a")");

  AssertContains(lines[6], R"("type":"CAMERA_ACTUATED")");
  AssertContains(lines[6], R"("actuated":"true")");
  AssertContains(lines[6], R"("requester":"1")");

  AssertContains(lines[7], R"("type":"SIM_FINISHED")");
  AssertContains(lines[7], R"("expectations_met":"false")");

  camlink::tests::common::RemovePathBestEffort(out_dir);
  return 0;
}
