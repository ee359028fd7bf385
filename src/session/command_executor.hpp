#pragma once

#include "camera/camera_adapter.hpp"
#include "core/time_utils.hpp"
#include "link/camera_status.hpp"
#include "link/frame.hpp"
#include "session/device_session.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace camlink::core::logging {
class Logger;
}

namespace camlink::session {

struct ExecutorSettings {
  // Upper bound for every blocking adapter call.
  std::chrono::milliseconds adapter_timeout{3'000};
  // StatusRequest answers from cache while the cached status is younger.
  std::chrono::milliseconds status_freshness{2'000};
  std::uint32_t wake_attempts = 2;
  // Node clock origin; CameraStatus::last_updated is measured from here.
  core::TimePoint clock_origin{};
};

struct ExecutionResult {
  link::AckResult result = link::AckResult::kOk;
  // Status to report back after the command (also stored in the session).
  link::CameraStatus status;
  // The adapter changed the shutter state (SetRecording succeeded).
  bool actuated = false;
  // Answered from the dedup window; no adapter call was made.
  bool replayed = false;
  // Formatted adapter failure; empty on success.
  std::string error;
};

// Controller-side execution of inbound reliable commands against one
// camera.
//
// Every command produces an Ack result. Adapter failures are never dropped:
// they surface as AckResult::kCameraFailed with the session's status forced
// to recording_state=Unknown and the CameraUnreachable health flag.
class CommandExecutor {
public:
  struct Counters {
    std::uint64_t executed = 0;
    std::uint64_t replays = 0;
    std::uint64_t actuations = 0;
    std::uint64_t adapter_failures = 0;
    std::uint64_t status_queries = 0;
  };

  CommandExecutor(camera::ICameraAdapter& adapter, const ExecutorSettings& settings,
                  core::logging::Logger& logger);

  // Runs `command` (TriggerStart/TriggerStop/WakeUp/StatusRequest) for the
  // camera behind `session`. Replays of an already executed
  // (source, sequence) return the remembered result without touching the
  // adapter.
  ExecutionResult Execute(DeviceSession& session, const link::Frame& command,
                          core::TimePoint now);

  // Periodic status poll. Returns false on adapter failure, after marking
  // the session's status unreachable.
  bool RefreshStatus(DeviceSession& session, core::TimePoint now);

  // Inactivity power-down. Skips (returns false) while recording.
  bool PowerDown(DeviceSession& session, core::TimePoint now);

  // Aborts a blocking adapter call from another thread.
  void CancelInFlight() {
    adapter_.Cancel();
  }

  const Counters& GetCounters() const {
    return counters_;
  }

private:
  bool EnsureAwake(DeviceSession& session, std::string& error);
  bool QueryInto(DeviceSession& session, core::TimePoint now, std::string& error);
  link::CameraStatus MarkUnreachable(DeviceSession& session, core::TimePoint now);
  link::CameraStatus CurrentStatus(const DeviceSession& session) const;

  camera::ICameraAdapter& adapter_;
  ExecutorSettings settings_;
  core::logging::Logger& logger_;
  Counters counters_;
};

} // namespace camlink::session
