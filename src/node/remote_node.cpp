#include "node/remote_node.hpp"

#include "core/logging/logger.hpp"

namespace camlink::node {

RemoteNode::RemoteNode(const config::NodeConfig& config, link::ILinkTransport& transport,
                       core::logging::Logger& logger, const core::TimePoint now)
    : config_(config), transport_(transport), logger_(logger), codec_(config.max_frame_bytes),
      engine_(transport, codec_, logger, static_cast<std::uint64_t>(config.local_id) + 1U),
      registry_(config::ToRegistrySettings(config), engine_, logger, now),
      sleep_gate_(config.min_sleep_window), last_interaction_(now) {
  engine_.SetInitialSequence(config.initial_sequence);
}

LoopReport RemoteNode::PollOnce(const core::TimePoint now) {
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
    if (routed.resolution.has_value()) {
      report.resolutions.push_back(*routed.resolution);
    }
  }

  session::TickReport ticked = registry_.Tick(now);
  report.resolutions.insert(report.resolutions.end(), ticked.resolutions.begin(),
                            ticked.resolutions.end());
  report.transitions.insert(report.transitions.end(), ticked.transitions.begin(),
                            ticked.transitions.end());
  return report;
}

session::SubmitResult RemoteNode::Submit(const link::DeviceId id, const link::CommandKind kind,
                                         const core::TimePoint now) {
  NoteUserInteraction(now);
  return registry_.Submit(id, kind, now);
}

session::SubmitResult RemoteNode::PressButton(const link::DeviceId id, const core::TimePoint now) {
  NoteUserInteraction(now);
  return registry_.SubmitToggle(id, now);
}

std::vector<session::SubmitResult> RemoteNode::WakeAll(const core::TimePoint now) {
  NoteUserInteraction(now);
  return registry_.BroadcastWakeUp(now);
}

bool RemoteNode::ShouldEnterDeepSleep(const core::TimePoint now) const {
  if (registry_.HasPendingCommand()) {
    return false;
  }
  return core::ElapsedSince(last_interaction_, now) >= config_.auto_sleep_timeout;
}

SleepOutcome RemoteNode::SleepUntilDue(const core::TimePoint now) {
  return sleep_gate_.Sleep(transport_, registry_.HasPendingCommand(), NextDue(), now,
                           config_.heartbeat_interval);
}

} // namespace camlink::node
