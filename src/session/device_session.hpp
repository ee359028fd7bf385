#pragma once

#include "core/errors/link_error.hpp"
#include "core/time_utils.hpp"
#include "link/camera_status.hpp"
#include "link/dedup_window.hpp"
#include "link/frame.hpp"
#include "link/link_transport.hpp"
#include "link/retransmission_engine.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace camlink::session {

// Liveness of the peer behind one session, ordered from "know nothing" to
// "heard recently".
enum class Connectivity {
  kUnknown,
  kOffline,
  kStale,
  kOnline,
};

std::string_view ToString(Connectivity connectivity);

struct SessionSettings {
  std::chrono::milliseconds stale_threshold{10'000};
  std::chrono::milliseconds offline_threshold{16'000};
  std::size_t dedup_capacity = 32;
  std::chrono::milliseconds dedup_ttl{60'000};
};

struct PendingCommand {
  link::CommandKind kind = link::CommandKind::kTriggerStart;
  std::uint16_t sequence = 0;
  core::TimePoint issued_at{};
};

struct CommandOutcome {
  link::CommandKind kind = link::CommandKind::kTriggerStart;
  std::uint16_t sequence = 0;
  link::DeliveryOutcome outcome = link::DeliveryOutcome::kTimedOut;
  link::AckResult result = link::AckResult::kOk;
  core::TimePoint resolved_at{};
};

enum class AlertKind {
  kCommandTimedOut,
  kCameraFailed,
};

std::string_view ToString(AlertKind kind);

// User-visible problem on one device. It stays raised until the next
// successful command or until the user acknowledges it
// (SessionRegistry::AcknowledgeAlert).
struct Alert {
  AlertKind kind = AlertKind::kCommandTimedOut;
  link::CommandKind command = link::CommandKind::kTriggerStart;
  core::TimePoint raised_at{};
};

struct ConnectivityTransition {
  link::DeviceId device_id = 0;
  Connectivity from = Connectivity::kUnknown;
  Connectivity to = Connectivity::kUnknown;
  core::TimePoint at{};
};

// Per-device state on either side of the radio link.
//
// The session is a passive state machine: it never touches the radio or the
// camera and is driven entirely by the registry with explicit timestamps.
class DeviceSession {
public:
  struct Counters {
    std::uint64_t frames_heard = 0;
    std::uint64_t commands_started = 0;
    std::uint64_t commands_acked = 0;
    std::uint64_t commands_timed_out = 0;
    std::uint64_t status_updates = 0;
  };

  DeviceSession(link::DeviceId id, const SessionSettings& settings, core::TimePoint created_at);

  link::DeviceId Id() const {
    return id_;
  }

  Connectivity GetConnectivity() const {
    return connectivity_;
  }

  // Any valid inbound frame attributed to this device. Refreshes liveness
  // and signal metadata; returns the transition when the session was not
  // already Online.
  std::optional<ConnectivityTransition> OnFrameHeard(const link::SignalQuality& signal,
                                                     core::TimePoint now);

  // Demotes the session on silence. Never promotes.
  std::optional<ConnectivityTransition> Tick(core::TimePoint now);

  // Earliest time Tick() could change connectivity; nullopt once Offline.
  std::optional<core::TimePoint> NextTransitionAt() const;

  // Records a reliable command handed to the retransmission engine.
  // Fails with kInvalidCommand for fire-and-forget kinds and with
  // kCommandInFlight while another command is pending.
  bool BeginCommand(link::CommandKind kind, std::uint16_t sequence, core::TimePoint now,
                    core::errors::LinkError& error);

  // Clears the pending command when `sequence` matches it. Returns false
  // (and changes nothing) otherwise.
  bool ResolveCommand(std::uint16_t sequence, link::DeliveryOutcome outcome,
                      link::AckResult result, core::TimePoint now);

  // Drops the pending command without recording an outcome.
  void AbandonCommand() {
    pending_.reset();
  }

  bool HasPendingCommand() const {
    return pending_.has_value();
  }
  const std::optional<PendingCommand>& Pending() const {
    return pending_;
  }
  const std::optional<CommandOutcome>& LastOutcome() const {
    return last_outcome_;
  }

  const std::optional<Alert>& ActiveAlert() const {
    return alert_;
  }
  void ClearAlert() {
    alert_.reset();
  }

  // Stores `status` verbatim.
  void ApplyStatus(const link::CameraStatus& status, core::TimePoint now);

  const std::optional<link::CameraStatus>& LastStatus() const {
    return last_status_;
  }
  const std::optional<core::TimePoint>& StatusReceivedAt() const {
    return status_received_at_;
  }
  // True when a status exists and is younger than `max_age`.
  bool IsStatusFresh(std::chrono::milliseconds max_age, core::TimePoint now) const;

  const std::optional<core::TimePoint>& LastHeardAt() const {
    return last_heard_at_;
  }
  const link::SignalQuality& LastSignal() const {
    return last_signal_;
  }

  // Short labels for a 128x64 status display.
  // WAIT, LOST, SLEEP, REC, STBY, ERR or "?".
  std::string StatusLabel() const;
  // HOT, COLD, LOWBAT, NOCAM or empty.
  std::string HealthLabel() const;

  link::DedupWindow& Dedup() {
    return dedup_;
  }

  const Counters& GetCounters() const {
    return counters_;
  }

private:
  std::optional<ConnectivityTransition> MoveTo(Connectivity next, core::TimePoint now);

  link::DeviceId id_;
  SessionSettings settings_;
  core::TimePoint created_at_;
  Connectivity connectivity_ = Connectivity::kUnknown;
  std::optional<core::TimePoint> last_heard_at_;
  link::SignalQuality last_signal_;
  std::optional<link::CameraStatus> last_status_;
  std::optional<core::TimePoint> status_received_at_;
  std::optional<PendingCommand> pending_;
  std::optional<CommandOutcome> last_outcome_;
  std::optional<Alert> alert_;
  link::DedupWindow dedup_;
  Counters counters_;
};

} // namespace camlink::session
