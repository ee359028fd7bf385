#pragma once

#include "config/node_config.hpp"
#include "core/time_utils.hpp"
#include "link/link_transport.hpp"
#include "link/packet_codec.hpp"
#include "link/retransmission_engine.hpp"
#include "node/loop_report.hpp"
#include "node/sleep_gate.hpp"
#include "session/session_registry.hpp"

#include <optional>
#include <vector>

namespace camlink::core::logging {
class Logger;
}

namespace camlink::node {

// Handheld side: turns button presses into reliable commands and keeps one
// session per camera up to date from heartbeats, status replies and Acks.
//
// Single-threaded. The radio driver only pushes into the transport's
// receive queue; everything else runs from PollOnce().
class RemoteNode {
public:
  RemoteNode(const config::NodeConfig& config, link::ILinkTransport& transport,
             core::logging::Logger& logger, core::TimePoint now);

  RemoteNode(const RemoteNode&) = delete;
  RemoteNode& operator=(const RemoteNode&) = delete;

  // Drains received frames, then advances retries and liveness.
  LoopReport PollOnce(core::TimePoint now);

  session::SubmitResult Submit(link::DeviceId id, link::CommandKind kind, core::TimePoint now);

  // The record button: starts or stops depending on the last known state.
  session::SubmitResult PressButton(link::DeviceId id, core::TimePoint now);

  std::vector<session::SubmitResult> WakeAll(core::TimePoint now);

  // Any user input (button, menu navigation) keeps the remote awake.
  void NoteUserInteraction(core::TimePoint now) {
    last_interaction_ = now;
  }

  // True after auto_sleep_timeout without interaction and with nothing
  // in flight.
  bool ShouldEnterDeepSleep(core::TimePoint now) const;

  bool HasPendingCommand() const {
    return registry_.HasPendingCommand();
  }

  std::optional<core::TimePoint> NextDue() const {
    return registry_.NextDeadline();
  }

  // Light sleep between loop iterations, cut short by radio activity.
  SleepOutcome SleepUntilDue(core::TimePoint now);

  session::SessionRegistry& Registry() {
    return registry_;
  }
  const session::SessionRegistry& Registry() const {
    return registry_;
  }
  const link::RetransmissionEngine& Engine() const {
    return engine_;
  }

private:
  config::NodeConfig config_;
  link::ILinkTransport& transport_;
  core::logging::Logger& logger_;
  link::PacketCodec codec_;
  link::RetransmissionEngine engine_;
  session::SessionRegistry registry_;
  SleepGate sleep_gate_;
  core::TimePoint last_interaction_;
};

} // namespace camlink::node
