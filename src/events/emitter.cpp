#include "events/emitter.hpp"

#include "core/errors/link_error.hpp"
#include "events/jsonl_writer.hpp"

#include <utility>

namespace camlink::events {

namespace {

std::string BoolText(const bool value) {
  return value ? "true" : "false";
}

} // namespace

Emitter::Emitter(std::filesystem::path log_path) : log_path_(std::move(log_path)) {}

bool Emitter::EmitRaw(const EventType type, const std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) const {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);
  return AppendEventJsonl(event, log_path_, error);
}

bool Emitter::EmitSimStarted(const SimStartedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kSimStarted, event.ts,
                 {
                     {"t_ms", "0"},
                     {"plan", event.plan_name},
                     {"seed", std::to_string(event.seed)},
                     {"duration_ms", std::to_string(event.duration_ms)},
                     {"controllers", std::to_string(event.controller_count)},
                 },
                 error);
}

bool Emitter::EmitCommandSubmitted(const CommandSubmittedEvent& event, std::string& error) const {
  std::map<std::string, std::string> payload = {
      {"t_ms", std::to_string(event.t_ms)},
      {"node", event.node},
      {"device_id", std::to_string(event.submit.device_id)},
      {"command", std::string(link::ToString(event.submit.command))},
      {"status", std::string(session::ToString(event.submit.status))},
  };
  if (event.submit.Accepted()) {
    payload["seq"] = std::to_string(event.submit.sequence);
  } else {
    payload["reason"] = event.submit.message;
  }
  return EmitRaw(EventType::kCommandSubmitted, event.ts, std::move(payload), error);
}

bool Emitter::EmitCommandResolved(const CommandResolvedEvent& event, std::string& error) const {
  const link::DeliveryResolution& resolution = event.resolution;
  std::map<std::string, std::string> payload = {
      {"t_ms", std::to_string(event.t_ms)},
      {"node", event.node},
      {"device_id", std::to_string(resolution.destination)},
      {"command", std::string(link::ToString(resolution.command))},
      {"seq", std::to_string(resolution.sequence)},
      {"transmissions", std::to_string(resolution.transmissions)},
      {"elapsed_ms", std::to_string(resolution.elapsed.count())},
  };

  if (resolution.outcome == link::DeliveryOutcome::kAcked) {
    payload["result"] = std::string(link::ToString(resolution.ack_result));
    return EmitRaw(EventType::kCommandAcked, event.ts, std::move(payload), error);
  }
  payload["error_code"] =
      std::string(core::errors::ToStableErrorCode(core::errors::LinkErrorCode::kTimedOut));
  return EmitRaw(EventType::kCommandTimedOut, event.ts, std::move(payload), error);
}

bool Emitter::EmitConnectivityChanged(const ConnectivityChangedEvent& event,
                                      std::string& error) const {
  return EmitRaw(EventType::kConnectivityChanged, event.ts,
                 {
                     {"t_ms", std::to_string(event.t_ms)},
                     {"node", event.node},
                     {"device_id", std::to_string(event.transition.device_id)},
                     {"from", std::string(session::ToString(event.transition.from))},
                     {"to", std::string(session::ToString(event.transition.to))},
                 },
                 error);
}

bool Emitter::EmitFrameDropped(const FrameDroppedEvent& event, std::string& error) const {
  std::map<std::string, std::string> payload = {
      {"t_ms", std::to_string(event.t_ms)},
      {"node", event.node},
      {"error_code", std::string(core::errors::ToStableErrorCode(event.drop.code))},
      {"reason", event.drop.reason},
  };
  if (event.drop.device_id.has_value()) {
    payload["device_id"] = std::to_string(*event.drop.device_id);
  }
  return EmitRaw(EventType::kFrameDropped, event.ts, std::move(payload), error);
}

bool Emitter::EmitCameraActuated(const CameraActuatedEvent& event, std::string& error) const {
  const node::CommandExecution& execution = event.execution;
  return EmitRaw(EventType::kCameraActuated, event.ts,
                 {
                     {"t_ms", std::to_string(event.t_ms)},
                     {"node", event.node},
                     {"device_id", std::to_string(execution.device_id)},
                     {"requester", std::to_string(execution.requester)},
                     {"command", std::string(link::ToString(execution.command))},
                     {"seq", std::to_string(execution.sequence)},
                     {"result", std::string(link::ToString(execution.result))},
                     {"actuated", BoolText(execution.actuated)},
                     {"replayed", BoolText(execution.replayed)},
                     {"acked", BoolText(execution.acked)},
                 },
                 error);
}

bool Emitter::EmitSimFinished(const SimFinishedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kSimFinished, event.ts,
                 {
                     {"t_ms", std::to_string(event.t_ms)},
                     {"expectations_met", BoolText(event.expectations_met)},
                     {"expectation_failures", std::to_string(event.expectation_failures)},
                     {"radio_transmissions", std::to_string(event.radio_transmissions)},
                     {"radio_dropped", std::to_string(event.radio_dropped)},
                 },
                 error);
}

} // namespace camlink::events
