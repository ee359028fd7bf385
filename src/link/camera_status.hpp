#pragma once

#include "core/errors/link_error.hpp"
#include "link/frame.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace camlink::link {

enum class RecordingState : std::uint8_t {
  kIdle = 0,
  kRecording = 1,
  kError = 2,
  kUnknown = 3,
};

// Bit values of CameraStatus::health_flags.
enum class HealthFlag : std::uint8_t {
  kOverheating = 0x01,
  kLowTemperature = 0x02,
  kLowBattery = 0x04,
  // Set together with RecordingState::kUnknown when the short-range link to
  // the camera failed.
  kCameraUnreachable = 0x08,
};

constexpr std::uint8_t kKnownHealthFlagMask = 0x0F;

// Camera snapshot produced by the Controller's camera adapter and carried
// verbatim in StatusReply and Heartbeat payloads.
struct CameraStatus {
  RecordingState recording_state = RecordingState::kUnknown;
  std::uint8_t signal_quality = 0; // 0..100
  std::uint8_t health_flags = 0;
  std::uint8_t battery_percent = 0; // 0..100
  bool camera_connected = false;
  bool camera_asleep = false;
  // Milliseconds on the producing node's monotonic clock.
  std::chrono::milliseconds last_updated{0};

  bool HasFlag(HealthFlag flag) const {
    return (health_flags & static_cast<std::uint8_t>(flag)) != 0U;
  }

  void SetFlag(HealthFlag flag, bool enabled) {
    if (enabled) {
      health_flags = static_cast<std::uint8_t>(health_flags | static_cast<std::uint8_t>(flag));
    } else {
      health_flags = static_cast<std::uint8_t>(health_flags & ~static_cast<std::uint8_t>(flag));
    }
  }

  bool operator==(const CameraStatus& other) const = default;
};

// Result byte carried by Ack frames.
enum class AckResult : std::uint8_t {
  kOk = 0,
  kCameraFailed = 1,
  kRejected = 2,
};

struct AckPayload {
  CommandKind acked_command = CommandKind::kTriggerStart;
  AckResult result = AckResult::kOk;

  bool operator==(const AckPayload& other) const = default;
};

constexpr std::size_t kCameraStatusPayloadBytes = 9;
constexpr std::size_t kAckPayloadBytes = 2;

std::vector<std::uint8_t> EncodeCameraStatus(const CameraStatus& status);
bool DecodeCameraStatus(const std::vector<std::uint8_t>& payload, CameraStatus& status,
                        core::errors::LinkError& error);

std::vector<std::uint8_t> EncodeAckPayload(const AckPayload& ack);
bool DecodeAckPayload(const std::vector<std::uint8_t>& payload, AckPayload& ack,
                      core::errors::LinkError& error);

std::string_view ToString(RecordingState state);
std::string_view ToString(AckResult result);

// Comma-separated flag names ("overheating,low_battery"), or "none".
std::string DescribeHealthFlags(std::uint8_t flags);

} // namespace camlink::link
