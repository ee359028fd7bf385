#pragma once

#include "config/config_loader.hpp"
#include "config/node_config.hpp"
#include "link/frame.hpp"
#include "link/link_transport.hpp"
#include "link/sim/radio_channel.hpp"
#include "session/device_session.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camlink::sim {

// One timed action in a simulation script. Which fields matter depends on
// `action`.
struct ScriptStep {
  enum class Action {
    // Remote submits `command` for `device_id`.
    kSubmit,
    // Remote record button for `device_id` (toggle).
    kPress,
    // Remote wakes every configured camera.
    kWakeAll,
    // Sets a sim camera parameter on controller `controller`.
    kCameraParam,
    // Moves controller `controller` in or out of radio range.
    kRadioRange,
    // Replaces the channel fault profile.
    kRadioFaults,
  };

  std::uint64_t at_ms = 0;
  Action action = Action::kSubmit;
  link::DeviceId device_id = 0;
  link::CommandKind command = link::CommandKind::kTriggerStart;
  std::size_t controller = 0;
  std::string key;
  std::string value;
  bool in_range = true;
  link::sim::ChannelFaults faults;
};

std::string_view ToString(ScriptStep::Action action);

// Final-state assertions against the Remote's view of one camera. Unset
// fields are not checked.
struct Expectation {
  link::DeviceId device_id = 0;
  std::optional<session::Connectivity> connectivity;
  // "acked", "timed_out" or "none".
  std::optional<std::string> last_outcome;
  std::optional<link::AckResult> ack_result;
  std::optional<std::string> status_label;
  // "none", "command_timed_out" or "camera_failed".
  std::optional<std::string> alert;
  // Shutter changes summed over every controller serving the camera.
  std::optional<std::uint64_t> camera_actuations;
};

struct ControllerPlan {
  std::string name;
  config::NodeConfig node;
  link::SignalQuality signal{.rssi_dbm = -90, .snr_db = 7.5F};
  // Per-camera sim adapter parameters, already validated.
  std::map<link::DeviceId, std::map<std::string, std::string>> camera_params;
};

struct SimulationPlan {
  std::string name;
  std::uint64_t seed = 1;
  std::uint64_t duration_ms = 30'000;
  std::uint64_t tick_ms = 50;
  link::sim::ChannelFaults radio;
  config::NodeConfig remote;
  link::SignalQuality remote_signal{.rssi_dbm = -85, .snr_db = 8.0F};
  std::vector<ControllerPlan> controllers;
  // Sorted by at_ms; steps with equal times keep file order.
  std::vector<ScriptStep> script;
  std::vector<Expectation> expectations;
};

// Parses and validates a plan. Same contract as config::LoadNodeConfigText:
// returns true once validation ran; `report.valid` tells whether `plan` is
// usable.
bool LoadSimulationPlanText(std::string_view json_text, SimulationPlan& plan,
                            config::ValidationReport& report, std::string& error);

bool LoadSimulationPlanFile(const std::string& path, SimulationPlan& plan,
                            config::ValidationReport& report, std::string& error);

} // namespace camlink::sim
