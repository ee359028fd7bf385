#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace camlink::link {

// Signal metadata attached by the radio to every received packet.
struct SignalQuality {
  std::int16_t rssi_dbm = 0;
  float snr_db = 0.0F;
};

struct ReceivedPacket {
  std::vector<std::uint8_t> bytes;
  SignalQuality signal;
};

// Best-effort, shared-medium packet transport (LoRa on hardware, the
// in-memory channel in tests). No ordering or delivery guarantee;
// duplicates are possible.
class ILinkTransport {
public:
  virtual ~ILinkTransport() = default;

  // Hands one encoded frame to the radio. False means the radio refused or
  // failed the transmission; `error` carries the driver's reason.
  virtual bool Send(const std::vector<std::uint8_t>& bytes, std::string& error) = 0;

  // Returns the next buffered packet, or nullopt when nothing is waiting.
  // Never blocks.
  virtual std::optional<ReceivedPacket> PollReceived() = 0;

  // Power-saving wait. Returns true as soon as a packet is available, false
  // when `timeout` elapsed first.
  virtual bool WaitForActivity(std::chrono::milliseconds timeout) = 0;
};

} // namespace camlink::link
