#include "session/command_executor.hpp"

#include "camera/wake_policy.hpp"
#include "core/logging/logger.hpp"

namespace camlink::session {

CommandExecutor::CommandExecutor(camera::ICameraAdapter& adapter, const ExecutorSettings& settings,
                                 core::logging::Logger& logger)
    : adapter_(adapter), settings_(settings), logger_(logger) {}

ExecutionResult CommandExecutor::Execute(DeviceSession& session, const link::Frame& command,
                                         const core::TimePoint now) {
  ExecutionResult execution;

  const auto remembered =
      session.Dedup().Lookup(command.source, command.sequence, command.command, now);
  if (remembered.has_value()) {
    ++counters_.replays;
    execution.result = remembered->result;
    execution.replayed = true;
    execution.status = CurrentStatus(session);
    logger_.Debug("replayed command answered from dedup window",
                  {{"device_id", std::to_string(session.Id())},
                   {"source", std::to_string(command.source)},
                   {"seq", std::to_string(command.sequence)},
                   {"command", link::ToString(command.command)}});
    return execution;
  }

  ++counters_.executed;
  std::string error;
  bool ok = true;

  switch (command.command) {
  case link::CommandKind::kTriggerStart:
  case link::CommandKind::kTriggerStop: {
    const bool want_recording = command.command == link::CommandKind::kTriggerStart;
    ok = EnsureAwake(session, error);
    if (ok) {
      camera::AdapterError adapter_error;
      ok = adapter_.SetRecording(want_recording, settings_.adapter_timeout, adapter_error);
      if (ok) {
        ++counters_.actuations;
        execution.actuated = true;
      } else {
        error = camera::FormatAdapterError("set_recording", adapter_error);
      }
    }
    if (ok) {
      std::string query_error;
      if (!QueryInto(session, now, query_error)) {
        // The shutter call succeeded; report what we asked for.
        link::CameraStatus status = CurrentStatus(session);
        status.recording_state =
            want_recording ? link::RecordingState::kRecording : link::RecordingState::kIdle;
        status.camera_asleep = false;
        status.camera_connected = true;
        status.last_updated =
            std::chrono::milliseconds(core::ToWireMillis(settings_.clock_origin, now));
        session.ApplyStatus(status, now);
        logger_.Warn("status query after trigger failed",
                     {{"device_id", std::to_string(session.Id())}, {"error", query_error}});
      }
    }
    break;
  }
  case link::CommandKind::kWakeUp:
    ok = EnsureAwake(session, error);
    if (ok) {
      ok = QueryInto(session, now, error);
    }
    break;
  case link::CommandKind::kStatusRequest:
    if (!session.IsStatusFresh(settings_.status_freshness, now)) {
      ok = QueryInto(session, now, error);
    }
    break;
  case link::CommandKind::kHeartbeat:
  case link::CommandKind::kStatusReply:
  case link::CommandKind::kAck:
    execution.result = link::AckResult::kRejected;
    execution.status = CurrentStatus(session);
    execution.error = std::string(link::ToString(command.command)) + " is not executable";
    return execution;
  }

  if (ok) {
    execution.result = link::AckResult::kOk;
    execution.status = CurrentStatus(session);
  } else {
    ++counters_.adapter_failures;
    execution.result = link::AckResult::kCameraFailed;
    execution.status = MarkUnreachable(session, now);
    execution.error = error;
    logger_.Warn("camera command failed",
                 {{"device_id", std::to_string(session.Id())},
                  {"command", link::ToString(command.command)},
                  {"seq", std::to_string(command.sequence)},
                  {"error", error}});
  }

  session.Dedup().Remember(command.source, command.sequence, command.command, execution.result,
                           now);
  return execution;
}

bool CommandExecutor::RefreshStatus(DeviceSession& session, const core::TimePoint now) {
  std::string error;
  if (QueryInto(session, now, error)) {
    return true;
  }
  ++counters_.adapter_failures;
  MarkUnreachable(session, now);
  logger_.Warn("camera status poll failed",
               {{"device_id", std::to_string(session.Id())}, {"error", error}});
  return false;
}

bool CommandExecutor::PowerDown(DeviceSession& session, const core::TimePoint now) {
  const auto& status = session.LastStatus();
  if (status.has_value() && status->recording_state == link::RecordingState::kRecording) {
    return false;
  }

  camera::AdapterError adapter_error;
  if (!adapter_.PowerDown(settings_.adapter_timeout, adapter_error)) {
    logger_.Warn("camera power down failed",
                 {{"device_id", std::to_string(session.Id())},
                  {"error_code", camera::ToStableErrorCode(adapter_error.code)},
                  {"error", camera::FormatAdapterError("power_down", adapter_error)}});
    return false;
  }

  link::CameraStatus asleep = CurrentStatus(session);
  asleep.camera_asleep = true;
  asleep.camera_connected = false;
  asleep.recording_state = link::RecordingState::kIdle;
  asleep.signal_quality = 0;
  asleep.last_updated = std::chrono::milliseconds(core::ToWireMillis(settings_.clock_origin, now));
  session.ApplyStatus(asleep, now);
  logger_.Info("camera powered down for inactivity", {{"device_id", std::to_string(session.Id())}});
  return true;
}

bool CommandExecutor::EnsureAwake(DeviceSession& session, std::string& error) {
  const auto& status = session.LastStatus();
  if (status.has_value() && !status->camera_asleep && status->camera_connected) {
    return true;
  }

  const camera::WakeAttemptResult wake = camera::ExecuteWakeAttempts(
      adapter_, session.Id(), settings_.wake_attempts, settings_.adapter_timeout, logger_);
  if (!wake.awake) {
    error = wake.error;
    return false;
  }
  return true;
}

bool CommandExecutor::QueryInto(DeviceSession& session, const core::TimePoint now,
                                std::string& error) {
  ++counters_.status_queries;
  link::CameraStatus status;
  camera::AdapterError adapter_error;
  if (!adapter_.QueryStatus(status, settings_.adapter_timeout, adapter_error)) {
    error = camera::FormatAdapterError("query_status", adapter_error);
    return false;
  }
  status.last_updated = std::chrono::milliseconds(core::ToWireMillis(settings_.clock_origin, now));
  session.ApplyStatus(status, now);
  return true;
}

link::CameraStatus CommandExecutor::MarkUnreachable(DeviceSession& session,
                                                    const core::TimePoint now) {
  link::CameraStatus status = CurrentStatus(session);
  status.recording_state = link::RecordingState::kUnknown;
  status.camera_connected = false;
  status.SetFlag(link::HealthFlag::kCameraUnreachable, true);
  status.last_updated = std::chrono::milliseconds(core::ToWireMillis(settings_.clock_origin, now));
  session.ApplyStatus(status, now);
  return status;
}

link::CameraStatus CommandExecutor::CurrentStatus(const DeviceSession& session) const {
  if (session.LastStatus().has_value()) {
    return *session.LastStatus();
  }
  return link::CameraStatus{};
}

} // namespace camlink::session
