#include "session/session_registry.hpp"

#include "core/logging/logger.hpp"

#include <algorithm>

namespace camlink::session {

namespace {

using core::errors::LinkError;
using core::errors::LinkErrorCode;

SubmitResult Rejected(const SubmitStatus status, const link::DeviceId id,
                      const link::CommandKind kind, std::string message) {
  SubmitResult result;
  result.status = status;
  result.device_id = id;
  result.command = kind;
  result.message = std::move(message);
  return result;
}

} // namespace

std::string_view ToString(const SubmitStatus status) {
  switch (status) {
  case SubmitStatus::kAccepted:
    return "accepted";
  case SubmitStatus::kCommandInFlight:
    return "command_in_flight";
  case SubmitStatus::kUnknownDevice:
    return "unknown_device";
  case SubmitStatus::kInvalidCommand:
    return "invalid_command";
  }
  return "invalid_command";
}

SessionRegistry::SessionRegistry(const RegistrySettings& settings,
                                 link::RetransmissionEngine& engine,
                                 core::logging::Logger& logger, const core::TimePoint now)
    : settings_(settings), engine_(engine), logger_(logger) {
  std::sort(settings_.devices.begin(), settings_.devices.end());
  settings_.devices.erase(std::unique(settings_.devices.begin(), settings_.devices.end()),
                          settings_.devices.end());
  for (const link::DeviceId id : settings_.devices) {
    FindOrCreate(id, now);
  }
}

bool SessionRegistry::IsConfigured(const link::DeviceId id) const {
  return id != link::kBroadcastId &&
         std::binary_search(settings_.devices.begin(), settings_.devices.end(), id);
}

DeviceSession* SessionRegistry::FindOrCreate(const link::DeviceId id, const core::TimePoint now) {
  if (!IsConfigured(id)) {
    return nullptr;
  }
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    it = sessions_.emplace(id, DeviceSession(id, settings_.session, now)).first;
  }
  return &it->second;
}

DeviceSession* SessionRegistry::Find(const link::DeviceId id) {
  const auto it = sessions_.find(id);
  return it == sessions_.end() ? nullptr : &it->second;
}

const DeviceSession* SessionRegistry::Find(const link::DeviceId id) const {
  const auto it = sessions_.find(id);
  return it == sessions_.end() ? nullptr : &it->second;
}

bool SessionRegistry::Route(const link::Frame& frame, const link::SignalQuality& signal,
                            const core::TimePoint now, RouteResult& result, LinkError& error) {
  result = RouteResult{};
  error.Clear();
  if (settings_.role == link::SourceRole::kRemote) {
    return RouteAtRemote(frame, signal, now, result, error);
  }
  return RouteAtController(frame, signal, now, result, error);
}

bool SessionRegistry::RouteAtRemote(const link::Frame& frame, const link::SignalQuality& signal,
                                    const core::TimePoint now, RouteResult& result,
                                    LinkError& error) {
  if (frame.source_role != link::SourceRole::kController) {
    // Another Remote's command; not for us.
    return false;
  }
  if (frame.destination != settings_.local_id && frame.destination != link::kBroadcastId) {
    return false;
  }

  DeviceSession* session = FindOrCreate(frame.source, now);
  if (session == nullptr) {
    error.Set(LinkErrorCode::kUnknownDevice,
              "frame from unconfigured device " + std::to_string(frame.source));
    logger_.Warn("dropping frame from unknown device",
                 {{"device_id", std::to_string(frame.source)},
                  {"command", link::ToString(frame.command)},
                  {"seq", std::to_string(frame.sequence)},
                  {"error_code", core::errors::ToStableErrorCode(error.code)}});
    return false;
  }

  result.sessions.push_back(session->Id());
  if (const auto transition = session->OnFrameHeard(signal, now)) {
    LogTransition(*transition);
    result.transitions.push_back(*transition);
  }

  switch (frame.command) {
  case link::CommandKind::kAck:
    result.resolution = engine_.OnAck(frame, now);
    if (result.resolution.has_value()) {
      ApplyResolution(*result.resolution, now);
    }
    return true;
  case link::CommandKind::kHeartbeat:
  case link::CommandKind::kStatusReply: {
    link::CameraStatus status;
    if (!link::DecodeCameraStatus(frame.payload, status, error)) {
      logger_.Warn("dropping status payload",
                   {{"device_id", std::to_string(frame.source)},
                    {"command", link::ToString(frame.command)},
                    {"error", core::errors::FormatLinkError(error)}});
      return false;
    }
    session->ApplyStatus(status, now);
    result.status_applied = true;
    return true;
  }
  case link::CommandKind::kTriggerStart:
  case link::CommandKind::kTriggerStop:
  case link::CommandKind::kWakeUp:
  case link::CommandKind::kStatusRequest:
    break;
  }

  error.Set(LinkErrorCode::kInvalidCommand,
            std::string(link::ToString(frame.command)) + " is not accepted by a remote");
  logger_.Warn("dropping frame with unexpected command",
               {{"device_id", std::to_string(frame.source)},
                {"command", link::ToString(frame.command)},
                {"error_code", core::errors::ToStableErrorCode(error.code)}});
  return false;
}

bool SessionRegistry::RouteAtController(const link::Frame& frame,
                                        const link::SignalQuality& signal,
                                        const core::TimePoint now, RouteResult& result,
                                        LinkError& error) {
  if (frame.source_role != link::SourceRole::kRemote) {
    // Traffic from a neighbouring Controller.
    return false;
  }

  if (frame.destination == link::kBroadcastId) {
    for (auto& [id, session] : sessions_) {
      result.sessions.push_back(id);
      if (const auto transition = session.OnFrameHeard(signal, now)) {
        LogTransition(*transition);
        result.transitions.push_back(*transition);
      }
    }
  } else {
    DeviceSession* session = FindOrCreate(frame.destination, now);
    if (session == nullptr) {
      error.Set(LinkErrorCode::kUnknownDevice,
                "frame for unconfigured device " + std::to_string(frame.destination));
      logger_.Warn("dropping frame for unknown device",
                   {{"device_id", std::to_string(frame.destination)},
                    {"source", std::to_string(frame.source)},
                    {"command", link::ToString(frame.command)},
                    {"seq", std::to_string(frame.sequence)},
                    {"error_code", core::errors::ToStableErrorCode(error.code)}});
      return false;
    }
    result.sessions.push_back(session->Id());
    if (const auto transition = session->OnFrameHeard(signal, now)) {
      LogTransition(*transition);
      result.transitions.push_back(*transition);
    }
  }

  if (!link::RequiresAck(frame.command)) {
    error.Set(LinkErrorCode::kInvalidCommand,
              std::string(link::ToString(frame.command)) + " is not accepted by a controller");
    logger_.Warn("dropping frame with unexpected command",
                 {{"source", std::to_string(frame.source)},
                  {"command", link::ToString(frame.command)},
                  {"error_code", core::errors::ToStableErrorCode(error.code)}});
    return false;
  }
  return true;
}

bool SessionRegistry::CancelCommand(const link::DeviceId id) {
  DeviceSession* session = Find(id);
  if (session == nullptr || !session->HasPendingCommand()) {
    return false;
  }
  const PendingCommand pending = *session->Pending();
  if (!engine_.Cancel(id, pending.sequence)) {
    logger_.Warn("cancelled command had no live exchange",
                 {{"device_id", std::to_string(id)}, {"seq", std::to_string(pending.sequence)}});
  }
  session->AbandonCommand();
  logger_.Info("command cancelled", {{"device_id", std::to_string(id)},
                                     {"command", link::ToString(pending.kind)},
                                     {"seq", std::to_string(pending.sequence)}});
  return true;
}

bool SessionRegistry::AcknowledgeAlert(const link::DeviceId id) {
  DeviceSession* session = Find(id);
  if (session == nullptr || !session->ActiveAlert().has_value()) {
    return false;
  }
  session->ClearAlert();
  return true;
}

SubmitResult SessionRegistry::Submit(const link::DeviceId id, const link::CommandKind kind,
                                     const core::TimePoint now) {
  if (settings_.role != link::SourceRole::kRemote) {
    return Rejected(SubmitStatus::kInvalidCommand, id, kind,
                    "only a remote issues commands");
  }
  if (!link::IsUserCommand(kind)) {
    return Rejected(SubmitStatus::kInvalidCommand, id, kind,
                    std::string(link::ToString(kind)) + " cannot be submitted");
  }
  if (id == link::kBroadcastId) {
    return Rejected(SubmitStatus::kInvalidCommand, id, kind,
                    "broadcast is not acknowledged; use a per-device wake");
  }

  DeviceSession* session = FindOrCreate(id, now);
  if (session == nullptr) {
    logger_.Warn("submit for unknown device",
                 {{"device_id", std::to_string(id)}, {"command", link::ToString(kind)}});
    return Rejected(SubmitStatus::kUnknownDevice, id, kind,
                    "device " + std::to_string(id) + " is not configured");
  }
  if (session->HasPendingCommand()) {
    const PendingCommand& pending = *session->Pending();
    return Rejected(SubmitStatus::kCommandInFlight, id, kind,
                    std::string(link::ToString(pending.kind)) + " seq=" +
                        std::to_string(pending.sequence) + " still pending");
  }

  link::Frame frame;
  frame.destination = id;
  frame.source = settings_.local_id;
  frame.source_role = link::SourceRole::kRemote;
  frame.command = kind;
  frame.sequence = engine_.NextSequence(id);

  LinkError error;
  if (!engine_.SendReliable(frame, settings_.retry, now, error)) {
    const SubmitStatus status = error.code == LinkErrorCode::kCommandInFlight
                                    ? SubmitStatus::kCommandInFlight
                                    : SubmitStatus::kInvalidCommand;
    logger_.Warn("reliable send refused",
                 {{"device_id", std::to_string(id)},
                  {"command", link::ToString(kind)},
                  {"error", core::errors::FormatLinkError(error)}});
    return Rejected(status, id, kind, error.message);
  }
  if (!session->BeginCommand(kind, frame.sequence, now, error)) {
    engine_.Cancel(id, frame.sequence);
    return Rejected(SubmitStatus::kInvalidCommand, id, kind, error.message);
  }

  logger_.Info("command submitted", {{"device_id", std::to_string(id)},
                                     {"command", link::ToString(kind)},
                                     {"seq", std::to_string(frame.sequence)}});

  SubmitResult result;
  result.status = SubmitStatus::kAccepted;
  result.device_id = id;
  result.command = kind;
  result.sequence = frame.sequence;
  return result;
}

SubmitResult SessionRegistry::SubmitToggle(const link::DeviceId id, const core::TimePoint now) {
  link::CommandKind kind = link::CommandKind::kTriggerStart;
  const DeviceSession* session = Find(id);
  if (session != nullptr && session->LastStatus().has_value() &&
      session->LastStatus()->recording_state == link::RecordingState::kRecording) {
    kind = link::CommandKind::kTriggerStop;
  }
  return Submit(id, kind, now);
}

std::vector<SubmitResult> SessionRegistry::BroadcastWakeUp(const core::TimePoint now) {
  std::vector<SubmitResult> results;
  results.reserve(settings_.devices.size());
  for (const link::DeviceId id : settings_.devices) {
    results.push_back(Submit(id, link::CommandKind::kWakeUp, now));
    if (!results.back().Accepted()) {
      logger_.Warn("wake not sent", {{"device_id", std::to_string(id)},
                                     {"status", ToString(results.back().status)},
                                     {"reason", results.back().message}});
    }
  }
  return results;
}

TickReport SessionRegistry::Tick(const core::TimePoint now) {
  TickReport report;
  report.resolutions = engine_.Tick(now);
  for (const auto& resolution : report.resolutions) {
    ApplyResolution(resolution, now);
  }

  for (auto& [id, session] : sessions_) {
    if (const auto transition = session.Tick(now)) {
      LogTransition(*transition);
      report.transitions.push_back(*transition);
    }
  }
  return report;
}

std::vector<SessionView> SessionRegistry::Snapshot() const {
  std::vector<SessionView> views;
  views.reserve(sessions_.size());
  for (const auto& [id, session] : sessions_) {
    SessionView view;
    view.device_id = id;
    view.connectivity = session.GetConnectivity();
    view.status = session.LastStatus();
    view.pending = session.Pending();
    view.last_outcome = session.LastOutcome();
    view.alert = session.ActiveAlert();
    view.signal = session.LastSignal();
    view.status_label = session.StatusLabel();
    view.health_label = session.HealthLabel();
    views.push_back(std::move(view));
  }
  return views;
}

bool SessionRegistry::HasPendingCommand() const {
  return std::any_of(sessions_.begin(), sessions_.end(),
                     [](const auto& entry) { return entry.second.HasPendingCommand(); });
}

std::optional<core::TimePoint> SessionRegistry::NextDeadline() const {
  std::optional<core::TimePoint> earliest = engine_.NextDeadline();
  for (const auto& [id, session] : sessions_) {
    const auto edge = session.NextTransitionAt();
    if (edge.has_value() && (!earliest.has_value() || *edge < *earliest)) {
      earliest = edge;
    }
  }
  return earliest;
}

void SessionRegistry::ApplyResolution(const link::DeliveryResolution& resolution,
                                      const core::TimePoint now) {
  DeviceSession* session = Find(resolution.destination);
  if (session == nullptr) {
    return;
  }
  if (!session->ResolveCommand(resolution.sequence, resolution.outcome, resolution.ack_result,
                               now)) {
    return;
  }

  if (resolution.outcome == link::DeliveryOutcome::kTimedOut) {
    logger_.Warn("command timed out",
                 {{"device_id", std::to_string(resolution.destination)},
                  {"command", link::ToString(resolution.command)},
                  {"seq", std::to_string(resolution.sequence)},
                  {"transmissions", std::to_string(resolution.transmissions)},
                  {"connectivity", ToString(session->GetConnectivity())}});
  } else if (resolution.ack_result != link::AckResult::kOk) {
    logger_.Warn("command acknowledged with failure",
                 {{"device_id", std::to_string(resolution.destination)},
                  {"command", link::ToString(resolution.command)},
                  {"result", link::ToString(resolution.ack_result)}});
  } else {
    logger_.Info("command acknowledged",
                 {{"device_id", std::to_string(resolution.destination)},
                  {"command", link::ToString(resolution.command)},
                  {"seq", std::to_string(resolution.sequence)},
                  {"elapsed_ms", std::to_string(resolution.elapsed.count())}});
  }
}

void SessionRegistry::LogTransition(const ConnectivityTransition& transition) {
  logger_.Info("connectivity changed", {{"device_id", std::to_string(transition.device_id)},
                                        {"from", ToString(transition.from)},
                                        {"to", ToString(transition.to)}});
}

} // namespace camlink::session
