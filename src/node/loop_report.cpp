#include "node/loop_report.hpp"

#include "core/logging/logger.hpp"

namespace camlink::node {

bool DecodeInbound(const link::PacketCodec& codec, const link::ReceivedPacket& packet,
                   link::Frame& frame, LoopReport& report, core::logging::Logger& logger) {
  ++report.frames_received;
  core::errors::LinkError error;
  if (codec.Decode(packet.bytes, frame, error)) {
    return true;
  }

  logger.Warn("dropping undecodable frame",
              {{"bytes", std::to_string(packet.bytes.size())},
               {"rssi_dbm", std::to_string(packet.signal.rssi_dbm)},
               {"error_code", core::errors::ToStableErrorCode(error.code)},
               {"error", error.message}});
  report.drops.push_back(DroppedFrame{.code = error.code, .reason = error.message});
  return false;
}

void RecordRouteDrop(const link::Frame& frame, const core::errors::LinkError& error,
                     LoopReport& report) {
  const link::DeviceId device = frame.source_role == link::SourceRole::kRemote
                                    ? frame.destination
                                    : frame.source;
  report.drops.push_back(
      DroppedFrame{.code = error.code, .reason = error.message, .device_id = device});
}

} // namespace camlink::node
