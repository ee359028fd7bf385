#pragma once

#include <chrono>
#include <map>
#include <string>

namespace camlink::events {

// Timeline categories written to events.jsonl. Simulation expectations and
// tests key off these names, so keep them stable.
enum class EventType {
  kSimStarted,
  kCommandSubmitted,
  kCommandAcked,
  kCommandTimedOut,
  kConnectivityChanged,
  kFrameDropped,
  kCameraActuated,
  kSimFinished,
  kInfo,
  kWarning,
  kError,
};

// One timeline record.
//
// - `ts`: UTC wall time the record was produced for.
// - `payload`: flat string attributes; std::map keeps key order stable so
//   two runs of the same plan diff cleanly.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kInfo;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace camlink::events
