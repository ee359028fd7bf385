#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

namespace camlink::events {

std::string ToJson(const EventType event_type) {
  switch (event_type) {
  case EventType::kSimStarted:
    return "SIM_STARTED";
  case EventType::kCommandSubmitted:
    return "COMMAND_SUBMITTED";
  case EventType::kCommandAcked:
    return "COMMAND_ACKED";
  case EventType::kCommandTimedOut:
    return "COMMAND_TIMED_OUT";
  case EventType::kConnectivityChanged:
    return "CONNECTIVITY_CHANGED";
  case EventType::kFrameDropped:
    return "FRAME_DROPPED";
  case EventType::kCameraActuated:
    return "CAMERA_ACTUATED";
  case EventType::kSimFinished:
    return "SIM_FINISHED";
  case EventType::kInfo:
    return "info";
  case EventType::kWarning:
    return "warning";
  case EventType::kError:
    return "error";
  }
  return "unknown";
}

std::string ToJson(const Event& event) {
  std::string out = "{\"ts_utc\":";
  out += core::QuoteJson(core::FormatUtcTimestamp(event.ts));
  out += ",\"type\":";
  out += core::QuoteJson(ToJson(event.type));
  out += ",\"payload\":{";

  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out.push_back(',');
    }
    out += core::QuoteJson(key);
    out.push_back(':');
    out += core::QuoteJson(value);
    first = false;
  }

  out += "}}";
  return out;
}

} // namespace camlink::events
