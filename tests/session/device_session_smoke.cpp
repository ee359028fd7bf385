#include "../common/assertions.hpp"
#include "session/device_session.hpp"

#include <chrono>

int main() {
  using camlink::core::TimePoint;
  using camlink::core::errors::LinkError;
  using camlink::core::errors::LinkErrorCode;
  using camlink::link::AckResult;
  using camlink::link::CommandKind;
  using camlink::link::DeliveryOutcome;
  using camlink::session::AlertKind;
  using camlink::session::Connectivity;
  using camlink::session::DeviceSession;
  using camlink::session::SessionSettings;
  using camlink::tests::common::Fail;
  using namespace std::chrono_literals;

  const TimePoint start = TimePoint{} + 1h;
  const SessionSettings settings;

  {
    DeviceSession session(3, settings, start);
    if (session.GetConnectivity() != Connectivity::kUnknown || session.StatusLabel() != "WAIT") {
      Fail("new session should be Unknown and show WAIT");
    }
    if (session.Tick(start + 16s).has_value()) {
      Fail("Unknown must hold through the offline threshold");
    }
    const auto never_heard = session.Tick(start + 16s + 1ms);
    if (!never_heard.has_value() || never_heard->to != Connectivity::kOffline ||
        session.StatusLabel() != "LOST") {
      Fail("a never-heard device should go Offline after the offline threshold");
    }
  }

  {
    DeviceSession session(3, settings, start);
    const auto online = session.OnFrameHeard({.rssi_dbm = -88, .snr_db = 7.0F}, start + 1s);
    if (!online.has_value() || online->from != Connectivity::kUnknown ||
        online->to != Connectivity::kOnline) {
      Fail("first frame should move Unknown to Online");
    }
    if (session.OnFrameHeard({}, start + 2s).has_value()) {
      Fail("already Online must not report a transition");
    }
    if (session.StatusLabel() != "?") {
      Fail("online without status should show ?");
    }

    const TimePoint heard = start + 2s;
    if (session.NextTransitionAt() != heard + 10s + 1ms) {
      Fail("next transition should sit just past the stale threshold");
    }
    if (session.Tick(heard + 10s).has_value()) {
      Fail("silence equal to the stale threshold is still Online");
    }
    const auto stale = session.Tick(heard + 10s + 1ms);
    if (!stale.has_value() || stale->to != Connectivity::kStale) {
      Fail("silence beyond the stale threshold should go Stale");
    }
    const auto offline = session.Tick(heard + 16s + 1ms);
    if (!offline.has_value() || offline->from != Connectivity::kStale ||
        offline->to != Connectivity::kOffline) {
      Fail("silence beyond the offline threshold should go Offline");
    }
    if (session.NextTransitionAt().has_value()) {
      Fail("Offline has no further demotion");
    }
    const auto back = session.OnFrameHeard({}, heard + 20s);
    if (!back.has_value() || back->to != Connectivity::kOnline) {
      Fail("any frame should bring an Offline session back Online");
    }
  }

  {
    DeviceSession session(4, settings, start);
    LinkError error;
    if (!session.BeginCommand(CommandKind::kTriggerStart, 7, start, error)) {
      Fail("first command should start");
    }
    if (session.BeginCommand(CommandKind::kTriggerStop, 8, start, error) ||
        error.code != LinkErrorCode::kCommandInFlight) {
      Fail("second command must be refused while one is pending");
    }
    if (session.Pending()->sequence != 7U) {
      Fail("refused command must not replace the pending one");
    }
    if (session.BeginCommand(CommandKind::kHeartbeat, 9, start, error) ||
        error.code != LinkErrorCode::kInvalidCommand) {
      Fail("heartbeat is not a reliable command");
    }

    if (session.ResolveCommand(8, DeliveryOutcome::kAcked, AckResult::kOk, start + 1s)) {
      Fail("resolution for another sequence must be ignored");
    }
    if (!session.ResolveCommand(7, DeliveryOutcome::kTimedOut, AckResult::kOk, start + 3s)) {
      Fail("matching resolution should clear the pending command");
    }
    if (session.HasPendingCommand() || !session.ActiveAlert().has_value() ||
        session.ActiveAlert()->kind != AlertKind::kCommandTimedOut) {
      Fail("timeout should raise an alert and free the session");
    }

    if (!session.BeginCommand(CommandKind::kTriggerStart, 8, start + 4s, error) ||
        !session.ResolveCommand(8, DeliveryOutcome::kAcked, AckResult::kCameraFailed,
                                start + 5s)) {
      Fail("follow-up command should run");
    }
    if (session.ActiveAlert()->kind != AlertKind::kCameraFailed) {
      Fail("camera failure should replace the alert");
    }

    if (!session.BeginCommand(CommandKind::kTriggerStart, 9, start + 6s, error) ||
        !session.ResolveCommand(9, DeliveryOutcome::kAcked, AckResult::kOk, start + 7s)) {
      Fail("successful command should run");
    }
    if (session.ActiveAlert().has_value()) {
      Fail("a successful command should clear the alert");
    }
    if (session.LastOutcome()->sequence != 9U || session.GetCounters().commands_acked != 2U ||
        session.GetCounters().commands_timed_out != 1U) {
      Fail("unexpected outcome bookkeeping");
    }
  }

  {
    DeviceSession session(5, settings, start);
    static_cast<void>(session.OnFrameHeard({}, start));

    camlink::link::CameraStatus status;
    status.recording_state = camlink::link::RecordingState::kRecording;
    status.camera_connected = true;
    status.SetFlag(camlink::link::HealthFlag::kLowBattery, true);
    session.ApplyStatus(status, start);
    if (session.StatusLabel() != "REC" || session.HealthLabel() != "LOWBAT") {
      Fail("recording camera with low battery should show REC LOWBAT");
    }
    if (!session.IsStatusFresh(2s, start + 1s) || session.IsStatusFresh(2s, start + 2s)) {
      Fail("status freshness boundary mismatch");
    }

    status.SetFlag(camlink::link::HealthFlag::kOverheating, true);
    status.camera_asleep = true;
    session.ApplyStatus(status, start + 3s);
    if (session.StatusLabel() != "SLEEP" || session.HealthLabel() != "HOT") {
      Fail("overheating wins over low battery and asleep shows SLEEP");
    }

    camlink::link::CameraStatus unreachable;
    unreachable.SetFlag(camlink::link::HealthFlag::kCameraUnreachable, true);
    session.ApplyStatus(unreachable, start + 4s);
    if (session.StatusLabel() != "?" || session.HealthLabel() != "NOCAM") {
      Fail("unreachable camera should show ? NOCAM");
    }
  }

  return 0;
}
