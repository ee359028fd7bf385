#pragma once

#include "core/errors/link_error.hpp"
#include "core/time_utils.hpp"
#include "link/camera_status.hpp"
#include "link/frame.hpp"
#include "link/link_transport.hpp"
#include "link/retransmission_engine.hpp"
#include "session/device_session.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camlink::core::logging {
class Logger;
}

namespace camlink::session {

struct RegistrySettings {
  link::SourceRole role = link::SourceRole::kRemote;
  link::DeviceId local_id = 0;
  // Camera ids this node knows about. Frames for anything else are dropped.
  std::vector<link::DeviceId> devices;
  SessionSettings session;
  link::RetryPolicy retry;
};

enum class SubmitStatus {
  kAccepted,
  kCommandInFlight,
  kUnknownDevice,
  kInvalidCommand,
};

std::string_view ToString(SubmitStatus status);

struct SubmitResult {
  SubmitStatus status = SubmitStatus::kAccepted;
  link::DeviceId device_id = 0;
  link::CommandKind command = link::CommandKind::kTriggerStart;
  // Valid when accepted.
  std::uint16_t sequence = 0;
  std::string message;

  bool Accepted() const {
    return status == SubmitStatus::kAccepted;
  }
};

// What the registry did with one inbound frame.
struct RouteResult {
  // Sessions the frame was attributed to (several for a broadcast on the
  // Controller side).
  std::vector<link::DeviceId> sessions;
  std::vector<ConnectivityTransition> transitions;
  std::optional<link::DeliveryResolution> resolution;
  // A Heartbeat/StatusReply status was applied.
  bool status_applied = false;
};

struct TickReport {
  std::vector<link::DeliveryResolution> resolutions;
  std::vector<ConnectivityTransition> transitions;
};

// Read-only projection of one session for displays and reports.
struct SessionView {
  link::DeviceId device_id = 0;
  Connectivity connectivity = Connectivity::kUnknown;
  std::optional<link::CameraStatus> status;
  std::optional<PendingCommand> pending;
  std::optional<CommandOutcome> last_outcome;
  std::optional<Alert> alert;
  link::SignalQuality signal;
  std::string status_label;
  std::string health_label;
};

// Owns every DeviceSession of one node and routes frames and user intents
// to them.
//
// On a Remote, sessions are keyed by the frame's source (the camera that
// answered). On a Controller, they are keyed by the frame's destination
// (the camera being commanded) and a broadcast fans out to every local
// camera. Ids outside the configured set never create state.
class SessionRegistry {
public:
  SessionRegistry(const RegistrySettings& settings, link::RetransmissionEngine& engine,
                  core::logging::Logger& logger, core::TimePoint now);

  bool IsConfigured(link::DeviceId id) const;

  // Idempotent; returns nullptr for unconfigured ids.
  DeviceSession* FindOrCreate(link::DeviceId id, core::TimePoint now);

  DeviceSession* Find(link::DeviceId id);
  const DeviceSession* Find(link::DeviceId id) const;

  // Attributes a decoded frame to its session(s) and applies it: liveness,
  // status payloads and Ack resolution. Fails with kUnknownDevice,
  // kInvalidCommand (wrong direction) or kMalformedFrame (bad payload).
  // Frames addressed to another node fail with kNone and an empty result.
  bool Route(const link::Frame& frame, const link::SignalQuality& signal, core::TimePoint now,
             RouteResult& result, core::errors::LinkError& error);

  // Remote role: issues a reliable command to one camera.
  SubmitResult Submit(link::DeviceId id, link::CommandKind kind, core::TimePoint now);

  // Single-button remote: stop when the camera reports Recording, else start.
  SubmitResult SubmitToggle(link::DeviceId id, core::TimePoint now);

  // Unicast WakeUp to every configured camera. One result per device.
  std::vector<SubmitResult> BroadcastWakeUp(core::TimePoint now);

  // Remote role: gives up on the pending command for `id` without an
  // outcome. The engine stops retransmitting it and the device accepts a new
  // submit right away. False when nothing was pending.
  bool CancelCommand(link::DeviceId id);

  // The user dismissed the alert shown for `id`. False when none was raised.
  bool AcknowledgeAlert(link::DeviceId id);

  // Advances retries and liveness.
  TickReport Tick(core::TimePoint now);

  std::vector<SessionView> Snapshot() const;

  bool HasPendingCommand() const;

  // Earliest retry deadline or liveness edge.
  std::optional<core::TimePoint> NextDeadline() const;

  const std::vector<link::DeviceId>& ConfiguredIds() const {
    return settings_.devices;
  }

  const RegistrySettings& Settings() const {
    return settings_;
  }

private:
  bool RouteAtRemote(const link::Frame& frame, const link::SignalQuality& signal,
                     core::TimePoint now, RouteResult& result, core::errors::LinkError& error);
  bool RouteAtController(const link::Frame& frame, const link::SignalQuality& signal,
                         core::TimePoint now, RouteResult& result,
                         core::errors::LinkError& error);
  void ApplyResolution(const link::DeliveryResolution& resolution, core::TimePoint now);
  void LogTransition(const ConnectivityTransition& transition);

  RegistrySettings settings_;
  link::RetransmissionEngine& engine_;
  core::logging::Logger& logger_;
  std::map<link::DeviceId, DeviceSession> sessions_;
};

} // namespace camlink::session
