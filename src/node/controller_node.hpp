#pragma once

#include "camera/camera_adapter.hpp"
#include "config/node_config.hpp"
#include "core/time_utils.hpp"
#include "link/link_transport.hpp"
#include "link/packet_codec.hpp"
#include "link/retransmission_engine.hpp"
#include "node/loop_report.hpp"
#include "node/sleep_gate.hpp"
#include "session/command_executor.hpp"
#include "session/session_registry.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace camlink::core::logging {
class Logger;
}

namespace camlink::node {

// Camera-side node: executes Remote commands against its cameras, answers
// with Ack + StatusReply, and keeps the Remote informed with periodic
// heartbeats.
//
// Single-threaded apart from the adapter: a camera call may block up to
// adapter_timeout and CancelCameraCalls() may be used from another thread
// to cut it short.
class ControllerNode {
public:
  ControllerNode(const config::NodeConfig& config, link::ILinkTransport& transport,
                 core::logging::Logger& logger, core::TimePoint now);

  ControllerNode(const ControllerNode&) = delete;
  ControllerNode& operator=(const ControllerNode&) = delete;

  // Binds the adapter for one configured camera. The adapter must outlive
  // the node.
  bool AttachCamera(link::DeviceId id, camera::ICameraAdapter& adapter, std::string& error);

  // Drains received commands, executes them, then runs heartbeats, status
  // polls, inactivity power-down and liveness.
  LoopReport PollOnce(core::TimePoint now);

  std::optional<core::TimePoint> NextDue() const;

  SleepOutcome SleepUntilDue(core::TimePoint now);

  void CancelCameraCalls();

  const session::CommandExecutor* Executor(link::DeviceId id) const;

  session::SessionRegistry& Registry() {
    return registry_;
  }
  const session::SessionRegistry& Registry() const {
    return registry_;
  }
  const link::RetransmissionEngine& Engine() const {
    return engine_;
  }

private:
  struct AttachedCamera {
    std::unique_ptr<session::CommandExecutor> executor;
    core::TimePoint last_command_at{};
    core::TimePoint next_poll_at{};
  };

  void HandleCommand(const link::Frame& frame, const session::RouteResult& routed,
                     core::TimePoint now, LoopReport& report);
  void SendAck(const link::Frame& command, link::DeviceId camera_id, link::AckResult result);
  void SendStatus(link::CommandKind kind, link::DeviceId camera_id, link::DeviceId destination,
                  const link::CameraStatus& status);
  void SendHeartbeats(core::TimePoint now, LoopReport& report);
  void PollCameras(core::TimePoint now);
  void PowerDownIdleCameras(core::TimePoint now);
  bool CameraAwake(link::DeviceId id) const;

  config::NodeConfig config_;
  link::ILinkTransport& transport_;
  core::logging::Logger& logger_;
  core::TimePoint origin_;
  link::PacketCodec codec_;
  link::RetransmissionEngine engine_;
  session::SessionRegistry registry_;
  SleepGate sleep_gate_;
  std::map<link::DeviceId, AttachedCamera> cameras_;
  core::TimePoint next_heartbeat_at_;
};

} // namespace camlink::node
