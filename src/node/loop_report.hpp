#pragma once

#include "core/errors/link_error.hpp"
#include "link/camera_status.hpp"
#include "link/frame.hpp"
#include "link/link_transport.hpp"
#include "link/packet_codec.hpp"
#include "link/retransmission_engine.hpp"
#include "session/device_session.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace camlink::core::logging {
class Logger;
}

namespace camlink::node {

struct DroppedFrame {
  core::errors::LinkErrorCode code = core::errors::LinkErrorCode::kMalformedFrame;
  std::string reason;
  // Set when the frame decoded far enough to name a device.
  std::optional<link::DeviceId> device_id;
};

// One inbound command run against a camera on a Controller.
struct CommandExecution {
  link::DeviceId device_id = 0;
  link::DeviceId requester = 0;
  link::CommandKind command = link::CommandKind::kTriggerStart;
  std::uint16_t sequence = 0;
  link::AckResult result = link::AckResult::kOk;
  bool actuated = false;
  bool replayed = false;
  bool acked = false;
};

// Everything one PollOnce() iteration did. The loop owner turns this into
// logs, events and display updates.
struct LoopReport {
  std::size_t frames_received = 0;
  // Valid frames addressed to somebody else.
  std::size_t frames_ignored = 0;
  std::size_t heartbeats_sent = 0;
  std::vector<link::DeliveryResolution> resolutions;
  std::vector<session::ConnectivityTransition> transitions;
  std::vector<DroppedFrame> drops;
  std::vector<CommandExecution> executions;
};

// Decodes one received packet. Failures are logged and appended to
// `report.drops`; the caller just moves on to the next packet.
bool DecodeInbound(const link::PacketCodec& codec, const link::ReceivedPacket& packet,
                   link::Frame& frame, LoopReport& report, core::logging::Logger& logger);

// Records a frame the registry refused (unknown device, wrong direction, bad
// payload) as a drop.
void RecordRouteDrop(const link::Frame& frame, const core::errors::LinkError& error,
                     LoopReport& report);

} // namespace camlink::node
