#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace camlink::link {

// Camera / node address on the radio link. 0xFF is reserved for broadcast.
using DeviceId = std::uint8_t;

constexpr DeviceId kBroadcastId = 0xFF;

enum class SourceRole : std::uint8_t {
  kRemote = 0,
  kController = 1,
};

// Closed set of frame kinds. Values are the on-air command byte.
enum class CommandKind : std::uint8_t {
  kTriggerStart = 0x01,
  kTriggerStop = 0x02,
  kWakeUp = 0x03,
  kStatusRequest = 0x04,
  kHeartbeat = 0x10,
  kStatusReply = 0x11,
  kAck = 0x20,
};

// One radio frame. The integrity check is owned by the codec and never
// stored here, so two frames compare equal iff their encodings do.
struct Frame {
  DeviceId destination = kBroadcastId;
  DeviceId source = 0;
  SourceRole source_role = SourceRole::kRemote;
  CommandKind command = CommandKind::kHeartbeat;
  std::uint16_t sequence = 0;
  std::vector<std::uint8_t> payload;

  bool operator==(const Frame& other) const = default;
};

// Kinds that are delivered at-least-once and answered with an Ack.
bool RequiresAck(CommandKind kind);

// Kinds a user intent may produce (a subset of RequiresAck today).
bool IsUserCommand(CommandKind kind);

std::optional<CommandKind> CommandKindFromByte(std::uint8_t raw);

std::string_view ToString(CommandKind kind);
std::string_view ToString(SourceRole role);

// Parses the snake_case names used in config/simulation files
// ("trigger_start", "wake_up", ...).
std::optional<CommandKind> ParseCommandKind(std::string_view text);

} // namespace camlink::link
