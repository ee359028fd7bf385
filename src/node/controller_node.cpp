#include "node/controller_node.hpp"

#include "core/logging/logger.hpp"

#include <algorithm>

namespace camlink::node {

ControllerNode::ControllerNode(const config::NodeConfig& config, link::ILinkTransport& transport,
                               core::logging::Logger& logger, const core::TimePoint now)
    : config_(config), transport_(transport), logger_(logger), origin_(now),
      codec_(config.max_frame_bytes),
      engine_(transport, codec_, logger, static_cast<std::uint64_t>(config.local_id) + 1U),
      registry_(config::ToRegistrySettings(config), engine_, logger, now),
      sleep_gate_(config.min_sleep_window), next_heartbeat_at_(now) {
  engine_.SetInitialSequence(config.initial_sequence);
}

bool ControllerNode::AttachCamera(const link::DeviceId id, camera::ICameraAdapter& adapter,
                                  std::string& error) {
  if (!registry_.IsConfigured(id)) {
    error = "camera " + std::to_string(id) + " is not listed in devices";
    return false;
  }
  if (cameras_.count(id) != 0U) {
    error = "camera " + std::to_string(id) + " already has an adapter";
    return false;
  }

  AttachedCamera attached;
  attached.executor = std::make_unique<session::CommandExecutor>(
      adapter, config::ToExecutorSettings(config_, origin_), logger_);
  attached.last_command_at = origin_;
  attached.next_poll_at = origin_;
  cameras_.emplace(id, std::move(attached));
  return true;
}

LoopReport ControllerNode::PollOnce(const core::TimePoint now) {
  LoopReport report;

  while (auto packet = transport_.PollReceived()) {
    link::Frame frame;
    if (!DecodeInbound(codec_, *packet, frame, report, logger_)) {
      continue;
    }

    session::RouteResult routed;
    core::errors::LinkError error;
    if (!registry_.Route(frame, packet->signal, now, routed, error)) {
      if (error.HasError()) {
        RecordRouteDrop(frame, error, report);
      } else {
        ++report.frames_ignored;
      }
      continue;
    }
    report.transitions.insert(report.transitions.end(), routed.transitions.begin(),
                              routed.transitions.end());
    HandleCommand(frame, routed, now, report);
  }

  PollCameras(now);
  PowerDownIdleCameras(now);
  SendHeartbeats(now, report);

  session::TickReport ticked = registry_.Tick(now);
  report.transitions.insert(report.transitions.end(), ticked.transitions.begin(),
                            ticked.transitions.end());
  return report;
}

void ControllerNode::HandleCommand(const link::Frame& frame, const session::RouteResult& routed,
                                   const core::TimePoint now, LoopReport& report) {
  const bool broadcast = frame.destination == link::kBroadcastId;

  for (const link::DeviceId camera_id : routed.sessions) {
    session::DeviceSession* session = registry_.Find(camera_id);
    const auto camera = cameras_.find(camera_id);

    CommandExecution execution;
    execution.device_id = camera_id;
    execution.requester = frame.source;
    execution.command = frame.command;
    execution.sequence = frame.sequence;

    link::CameraStatus status;
    if (session == nullptr || camera == cameras_.end()) {
      logger_.Error("no camera adapter attached",
                    {{"device_id", std::to_string(camera_id)},
                     {"command", link::ToString(frame.command)}});
      execution.result = link::AckResult::kRejected;
    } else {
      const session::ExecutionResult result = camera->second.executor->Execute(*session, frame, now);
      camera->second.last_command_at = now;
      execution.result = result.result;
      execution.actuated = result.actuated;
      execution.replayed = result.replayed;
      status = result.status;
    }

    // Broadcasts are fire-and-forget: several Controllers answering at once
    // would only collide on air.
    if (!broadcast) {
      SendAck(frame, camera_id, execution.result);
      execution.acked = true;
    }
    if (session != nullptr && camera != cameras_.end()) {
      SendStatus(link::CommandKind::kStatusReply, camera_id, frame.source, status);
    }
    report.executions.push_back(execution);
  }
}

void ControllerNode::SendAck(const link::Frame& command, const link::DeviceId camera_id,
                             const link::AckResult result) {
  link::Frame ack;
  ack.destination = command.source;
  ack.source = camera_id;
  ack.source_role = link::SourceRole::kController;
  ack.command = link::CommandKind::kAck;
  ack.sequence = command.sequence;
  ack.payload =
      link::EncodeAckPayload(link::AckPayload{.acked_command = command.command, .result = result});

  core::errors::LinkError error;
  if (!engine_.SendUnreliable(ack, error)) {
    logger_.Warn("ack transmit failed", {{"device_id", std::to_string(camera_id)},
                                         {"seq", std::to_string(command.sequence)},
                                         {"error", core::errors::FormatLinkError(error)}});
  }
}

void ControllerNode::SendStatus(const link::CommandKind kind, const link::DeviceId camera_id,
                                const link::DeviceId destination,
                                const link::CameraStatus& status) {
  link::Frame frame;
  frame.destination = destination;
  frame.source = camera_id;
  frame.source_role = link::SourceRole::kController;
  frame.command = kind;
  frame.sequence = engine_.NextSequence(destination);
  frame.payload = link::EncodeCameraStatus(status);

  core::errors::LinkError error;
  if (!engine_.SendUnreliable(frame, error)) {
    logger_.Warn("status transmit failed", {{"device_id", std::to_string(camera_id)},
                                            {"command", link::ToString(kind)},
                                            {"error", core::errors::FormatLinkError(error)}});
  }
}

void ControllerNode::SendHeartbeats(const core::TimePoint now, LoopReport& report) {
  if (now < next_heartbeat_at_) {
    return;
  }
  for (const auto& [id, camera] : cameras_) {
    const session::DeviceSession* session = registry_.Find(id);
    link::CameraStatus status;
    if (session != nullptr && session->LastStatus().has_value()) {
      status = *session->LastStatus();
    }
    SendStatus(link::CommandKind::kHeartbeat, id, config_.remote_id, status);
    ++report.heartbeats_sent;
  }
  next_heartbeat_at_ = now + config_.heartbeat_interval;
}

void ControllerNode::PollCameras(const core::TimePoint now) {
  for (auto& [id, camera] : cameras_) {
    if (now < camera.next_poll_at) {
      continue;
    }
    camera.next_poll_at = now + config_.status_poll_interval;
    session::DeviceSession* session = registry_.Find(id);
    if (session == nullptr) {
      continue;
    }
    if (session->LastStatus().has_value() && session->LastStatus()->camera_asleep) {
      continue;
    }
    camera.executor->RefreshStatus(*session, now);
  }
}

void ControllerNode::PowerDownIdleCameras(const core::TimePoint now) {
  if (config_.always_on) {
    return;
  }
  for (auto& [id, camera] : cameras_) {
    if (!CameraAwake(id) ||
        core::ElapsedSince(camera.last_command_at, now) < config_.camera_inactivity_timeout) {
      continue;
    }
    session::DeviceSession* session = registry_.Find(id);
    if (session == nullptr) {
      continue;
    }
    camera.executor->PowerDown(*session, now);
    // Recording or a failed power-down: look again after another full period.
    camera.last_command_at = now;
  }
}

bool ControllerNode::CameraAwake(const link::DeviceId id) const {
  const session::DeviceSession* session = registry_.Find(id);
  return session != nullptr && session->LastStatus().has_value() &&
         !session->LastStatus()->camera_asleep;
}

std::optional<core::TimePoint> ControllerNode::NextDue() const {
  std::optional<core::TimePoint> earliest = next_heartbeat_at_;
  const auto consider = [&earliest](const core::TimePoint candidate) {
    if (!earliest.has_value() || candidate < *earliest) {
      earliest = candidate;
    }
  };

  for (const auto& [id, camera] : cameras_) {
    if (!CameraAwake(id)) {
      continue;
    }
    consider(camera.next_poll_at);
    if (!config_.always_on) {
      consider(camera.last_command_at + config_.camera_inactivity_timeout);
    }
  }
  if (const auto registry_due = registry_.NextDeadline()) {
    consider(*registry_due);
  }
  return earliest;
}

SleepOutcome ControllerNode::SleepUntilDue(const core::TimePoint now) {
  return sleep_gate_.Sleep(transport_, registry_.HasPendingCommand(), NextDue(), now,
                           config_.heartbeat_interval);
}

void ControllerNode::CancelCameraCalls() {
  for (auto& [id, camera] : cameras_) {
    camera.executor->CancelInFlight();
  }
}

const session::CommandExecutor* ControllerNode::Executor(const link::DeviceId id) const {
  const auto it = cameras_.find(id);
  return it == cameras_.end() ? nullptr : it->second.executor.get();
}

} // namespace camlink::node
