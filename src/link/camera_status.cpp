#include "link/camera_status.hpp"

namespace camlink::link {

namespace {

using core::errors::LinkError;
using core::errors::LinkErrorCode;

constexpr std::uint8_t kConnectedBit = 0x01;
constexpr std::uint8_t kAsleepBit = 0x02;
constexpr std::uint8_t kPercentCeiling = 100;

} // namespace

std::vector<std::uint8_t> EncodeCameraStatus(const CameraStatus& status) {
  const auto updated = static_cast<std::uint32_t>(status.last_updated.count() & 0xFFFFFFFFLL);
  std::uint8_t camera_bits = 0;
  if (status.camera_connected) {
    camera_bits |= kConnectedBit;
  }
  if (status.camera_asleep) {
    camera_bits |= kAsleepBit;
  }

  return {
      static_cast<std::uint8_t>(status.recording_state),
      status.signal_quality,
      status.health_flags,
      status.battery_percent,
      camera_bits,
      static_cast<std::uint8_t>(updated >> 24),
      static_cast<std::uint8_t>(updated >> 16),
      static_cast<std::uint8_t>(updated >> 8),
      static_cast<std::uint8_t>(updated),
  };
}

bool DecodeCameraStatus(const std::vector<std::uint8_t>& payload, CameraStatus& status,
                        LinkError& error) {
  if (payload.size() != kCameraStatusPayloadBytes) {
    error.Set(LinkErrorCode::kMalformedFrame,
              "camera status payload must be " + std::to_string(kCameraStatusPayloadBytes) +
                  " bytes, got " + std::to_string(payload.size()));
    return false;
  }
  if (payload[0] > static_cast<std::uint8_t>(RecordingState::kUnknown)) {
    error.Set(LinkErrorCode::kMalformedFrame,
              "recording state " + std::to_string(payload[0]) + " out of range");
    return false;
  }
  if (payload[1] > kPercentCeiling || payload[3] > kPercentCeiling) {
    error.Set(LinkErrorCode::kMalformedFrame, "signal quality or battery exceeds 100");
    return false;
  }
  if ((payload[2] & ~kKnownHealthFlagMask) != 0U) {
    error.Set(LinkErrorCode::kMalformedFrame, "unknown health flag bits");
    return false;
  }

  CameraStatus decoded;
  decoded.recording_state = static_cast<RecordingState>(payload[0]);
  decoded.signal_quality = payload[1];
  decoded.health_flags = payload[2];
  decoded.battery_percent = payload[3];
  decoded.camera_connected = (payload[4] & kConnectedBit) != 0U;
  decoded.camera_asleep = (payload[4] & kAsleepBit) != 0U;
  const std::uint32_t updated = (static_cast<std::uint32_t>(payload[5]) << 24) |
                                (static_cast<std::uint32_t>(payload[6]) << 16) |
                                (static_cast<std::uint32_t>(payload[7]) << 8) |
                                static_cast<std::uint32_t>(payload[8]);
  decoded.last_updated = std::chrono::milliseconds(updated);

  status = decoded;
  error.Clear();
  return true;
}

std::vector<std::uint8_t> EncodeAckPayload(const AckPayload& ack) {
  return {static_cast<std::uint8_t>(ack.acked_command), static_cast<std::uint8_t>(ack.result)};
}

bool DecodeAckPayload(const std::vector<std::uint8_t>& payload, AckPayload& ack,
                      LinkError& error) {
  if (payload.size() != kAckPayloadBytes) {
    error.Set(LinkErrorCode::kMalformedFrame,
              "ack payload must be 2 bytes, got " + std::to_string(payload.size()));
    return false;
  }
  const auto acked = CommandKindFromByte(payload[0]);
  if (!acked.has_value()) {
    error.Set(LinkErrorCode::kUnknownCommandKind,
              "ack references command byte " + std::to_string(payload[0]));
    return false;
  }
  if (payload[1] > static_cast<std::uint8_t>(AckResult::kRejected)) {
    error.Set(LinkErrorCode::kMalformedFrame,
              "ack result " + std::to_string(payload[1]) + " out of range");
    return false;
  }

  ack.acked_command = acked.value();
  ack.result = static_cast<AckResult>(payload[1]);
  error.Clear();
  return true;
}

std::string_view ToString(const RecordingState state) {
  switch (state) {
  case RecordingState::kIdle:
    return "idle";
  case RecordingState::kRecording:
    return "recording";
  case RecordingState::kError:
    return "error";
  case RecordingState::kUnknown:
    return "unknown";
  }
  return "unknown";
}

std::string_view ToString(const AckResult result) {
  switch (result) {
  case AckResult::kOk:
    return "ok";
  case AckResult::kCameraFailed:
    return "camera_failed";
  case AckResult::kRejected:
    return "rejected";
  }
  return "rejected";
}

std::string DescribeHealthFlags(const std::uint8_t flags) {
  std::string text;
  const auto append = [&text](std::string_view name) {
    if (!text.empty()) {
      text.push_back(',');
    }
    text.append(name);
  };

  if ((flags & static_cast<std::uint8_t>(HealthFlag::kOverheating)) != 0U) {
    append("overheating");
  }
  if ((flags & static_cast<std::uint8_t>(HealthFlag::kLowTemperature)) != 0U) {
    append("low_temperature");
  }
  if ((flags & static_cast<std::uint8_t>(HealthFlag::kLowBattery)) != 0U) {
    append("low_battery");
  }
  if ((flags & static_cast<std::uint8_t>(HealthFlag::kCameraUnreachable)) != 0U) {
    append("camera_unreachable");
  }
  return text.empty() ? "none" : text;
}

} // namespace camlink::link
