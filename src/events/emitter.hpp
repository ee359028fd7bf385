#pragma once

#include "events/event_model.hpp"
#include "link/retransmission_engine.hpp"
#include "node/loop_report.hpp"
#include "session/device_session.hpp"
#include "session/session_registry.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace camlink::events {

// Typed front door for events.jsonl so every producer writes the same
// payload keys for the same event type.
//
// Every payload carries `t_ms` (virtual or monotonic milliseconds since the
// run started) and, where a node is involved, `node`.
class Emitter {
public:
  struct SimStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string plan_name;
    std::uint64_t seed = 0;
    std::uint64_t duration_ms = 0;
    std::uint64_t controller_count = 0;
  };

  struct CommandSubmittedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t t_ms = 0;
    std::string node;
    session::SubmitResult submit;
  };

  struct CommandResolvedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t t_ms = 0;
    std::string node;
    link::DeliveryResolution resolution;
  };

  struct ConnectivityChangedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t t_ms = 0;
    std::string node;
    session::ConnectivityTransition transition;
  };

  struct FrameDroppedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t t_ms = 0;
    std::string node;
    node::DroppedFrame drop;
  };

  struct CameraActuatedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t t_ms = 0;
    std::string node;
    node::CommandExecution execution;
  };

  struct SimFinishedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t t_ms = 0;
    bool expectations_met = true;
    std::uint64_t expectation_failures = 0;
    std::uint64_t radio_transmissions = 0;
    std::uint64_t radio_dropped = 0;
  };

  explicit Emitter(std::filesystem::path log_path);

  const std::filesystem::path& LogPath() const {
    return log_path_;
  }

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error) const;

  bool EmitSimStarted(const SimStartedEvent& event, std::string& error) const;
  bool EmitCommandSubmitted(const CommandSubmittedEvent& event, std::string& error) const;
  // COMMAND_ACKED or COMMAND_TIMED_OUT depending on the outcome.
  bool EmitCommandResolved(const CommandResolvedEvent& event, std::string& error) const;
  bool EmitConnectivityChanged(const ConnectivityChangedEvent& event, std::string& error) const;
  bool EmitFrameDropped(const FrameDroppedEvent& event, std::string& error) const;
  bool EmitCameraActuated(const CameraActuatedEvent& event, std::string& error) const;
  bool EmitSimFinished(const SimFinishedEvent& event, std::string& error) const;

private:
  std::filesystem::path log_path_;
};

} // namespace camlink::events
