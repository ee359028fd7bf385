#include "session/device_session.hpp"

namespace camlink::session {

std::string_view ToString(const Connectivity connectivity) {
  switch (connectivity) {
  case Connectivity::kUnknown:
    return "unknown";
  case Connectivity::kOffline:
    return "offline";
  case Connectivity::kStale:
    return "stale";
  case Connectivity::kOnline:
    return "online";
  }
  return "unknown";
}

std::string_view ToString(const AlertKind kind) {
  switch (kind) {
  case AlertKind::kCommandTimedOut:
    return "command_timed_out";
  case AlertKind::kCameraFailed:
    return "camera_failed";
  }
  return "command_timed_out";
}

DeviceSession::DeviceSession(const link::DeviceId id, const SessionSettings& settings,
                             const core::TimePoint created_at)
    : id_(id), settings_(settings), created_at_(created_at),
      dedup_(settings.dedup_capacity, settings.dedup_ttl) {}

std::optional<ConnectivityTransition> DeviceSession::OnFrameHeard(const link::SignalQuality& signal,
                                                                  const core::TimePoint now) {
  ++counters_.frames_heard;
  last_heard_at_ = now;
  last_signal_ = signal;
  return MoveTo(Connectivity::kOnline, now);
}

std::optional<ConnectivityTransition> DeviceSession::Tick(const core::TimePoint now) {
  if (!last_heard_at_.has_value()) {
    if (connectivity_ == Connectivity::kUnknown &&
        core::ElapsedSince(created_at_, now) > settings_.offline_threshold) {
      return MoveTo(Connectivity::kOffline, now);
    }
    return std::nullopt;
  }

  const auto silence = core::ElapsedSince(*last_heard_at_, now);
  if (silence > settings_.offline_threshold) {
    return MoveTo(Connectivity::kOffline, now);
  }
  if (silence > settings_.stale_threshold && connectivity_ == Connectivity::kOnline) {
    return MoveTo(Connectivity::kStale, now);
  }
  return std::nullopt;
}

std::optional<core::TimePoint> DeviceSession::NextTransitionAt() const {
  // Thresholds are strict, so the change happens one tick after the edge.
  constexpr std::chrono::milliseconds kPastEdge{1};
  switch (connectivity_) {
  case Connectivity::kUnknown:
    return created_at_ + settings_.offline_threshold + kPastEdge;
  case Connectivity::kOnline:
    return *last_heard_at_ + settings_.stale_threshold + kPastEdge;
  case Connectivity::kStale:
    return *last_heard_at_ + settings_.offline_threshold + kPastEdge;
  case Connectivity::kOffline:
    return std::nullopt;
  }
  return std::nullopt;
}

bool DeviceSession::BeginCommand(const link::CommandKind kind, const std::uint16_t sequence,
                                 const core::TimePoint now, core::errors::LinkError& error) {
  if (!link::RequiresAck(kind)) {
    error.Set(core::errors::LinkErrorCode::kInvalidCommand,
              std::string(link::ToString(kind)) + " is not a reliable command");
    return false;
  }
  if (pending_.has_value()) {
    error.Set(core::errors::LinkErrorCode::kCommandInFlight,
              "device " + std::to_string(id_) + " already has " +
                  std::string(link::ToString(pending_->kind)) + " seq=" +
                  std::to_string(pending_->sequence) + " pending");
    return false;
  }

  pending_ = PendingCommand{.kind = kind, .sequence = sequence, .issued_at = now};
  ++counters_.commands_started;
  error.Clear();
  return true;
}

bool DeviceSession::ResolveCommand(const std::uint16_t sequence,
                                   const link::DeliveryOutcome outcome,
                                   const link::AckResult result, const core::TimePoint now) {
  if (!pending_.has_value() || pending_->sequence != sequence) {
    return false;
  }

  last_outcome_ = CommandOutcome{.kind = pending_->kind,
                                 .sequence = sequence,
                                 .outcome = outcome,
                                 .result = result,
                                 .resolved_at = now};

  if (outcome == link::DeliveryOutcome::kTimedOut) {
    ++counters_.commands_timed_out;
    alert_ = Alert{.kind = AlertKind::kCommandTimedOut, .command = pending_->kind, .raised_at = now};
  } else {
    ++counters_.commands_acked;
    if (result == link::AckResult::kCameraFailed) {
      alert_ = Alert{.kind = AlertKind::kCameraFailed, .command = pending_->kind, .raised_at = now};
    } else {
      alert_.reset();
    }
  }

  pending_.reset();
  return true;
}

void DeviceSession::ApplyStatus(const link::CameraStatus& status, const core::TimePoint now) {
  ++counters_.status_updates;
  last_status_ = status;
  status_received_at_ = now;
}

bool DeviceSession::IsStatusFresh(const std::chrono::milliseconds max_age,
                                  const core::TimePoint now) const {
  if (!last_status_.has_value() || !status_received_at_.has_value()) {
    return false;
  }
  return core::ElapsedSince(*status_received_at_, now) < max_age;
}

std::string DeviceSession::StatusLabel() const {
  if (connectivity_ == Connectivity::kUnknown) {
    return "WAIT";
  }
  if (connectivity_ == Connectivity::kOffline) {
    return "LOST";
  }
  if (!last_status_.has_value()) {
    return "?";
  }
  if (last_status_->camera_asleep) {
    return "SLEEP";
  }

  switch (last_status_->recording_state) {
  case link::RecordingState::kRecording:
    return "REC";
  case link::RecordingState::kIdle:
    return "STBY";
  case link::RecordingState::kError:
    return "ERR";
  case link::RecordingState::kUnknown:
    return "?";
  }
  return "?";
}

std::string DeviceSession::HealthLabel() const {
  if (!last_status_.has_value()) {
    return "";
  }
  if (last_status_->HasFlag(link::HealthFlag::kOverheating)) {
    return "HOT";
  }
  if (last_status_->HasFlag(link::HealthFlag::kLowTemperature)) {
    return "COLD";
  }
  if (last_status_->HasFlag(link::HealthFlag::kLowBattery)) {
    return "LOWBAT";
  }
  if (last_status_->HasFlag(link::HealthFlag::kCameraUnreachable)) {
    return "NOCAM";
  }
  return "";
}

std::optional<ConnectivityTransition> DeviceSession::MoveTo(const Connectivity next,
                                                            const core::TimePoint now) {
  if (connectivity_ == next) {
    return std::nullopt;
  }
  const ConnectivityTransition transition{
      .device_id = id_, .from = connectivity_, .to = next, .at = now};
  connectivity_ = next;
  return transition;
}

} // namespace camlink::session
