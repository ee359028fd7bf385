#include "link/frame.hpp"

#include <array>
#include <utility>

namespace camlink::link {

namespace {

constexpr std::array<std::pair<CommandKind, std::string_view>, 7> kCommandNames = {{
    {CommandKind::kTriggerStart, "trigger_start"},
    {CommandKind::kTriggerStop, "trigger_stop"},
    {CommandKind::kWakeUp, "wake_up"},
    {CommandKind::kStatusRequest, "status_request"},
    {CommandKind::kHeartbeat, "heartbeat"},
    {CommandKind::kStatusReply, "status_reply"},
    {CommandKind::kAck, "ack"},
}};

} // namespace

bool RequiresAck(const CommandKind kind) {
  switch (kind) {
  case CommandKind::kTriggerStart:
  case CommandKind::kTriggerStop:
  case CommandKind::kWakeUp:
  case CommandKind::kStatusRequest:
    return true;
  case CommandKind::kHeartbeat:
  case CommandKind::kStatusReply:
  case CommandKind::kAck:
    return false;
  }
  return false;
}

bool IsUserCommand(const CommandKind kind) {
  return RequiresAck(kind);
}

std::optional<CommandKind> CommandKindFromByte(const std::uint8_t raw) {
  for (const auto& [kind, name] : kCommandNames) {
    if (static_cast<std::uint8_t>(kind) == raw) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string_view ToString(const CommandKind kind) {
  for (const auto& [candidate, name] : kCommandNames) {
    if (candidate == kind) {
      return name;
    }
  }
  return "unknown";
}

std::string_view ToString(const SourceRole role) {
  return role == SourceRole::kController ? "controller" : "remote";
}

std::optional<CommandKind> ParseCommandKind(std::string_view text) {
  for (const auto& [kind, name] : kCommandNames) {
    if (name == text) {
      return kind;
    }
  }
  return std::nullopt;
}

} // namespace camlink::link
