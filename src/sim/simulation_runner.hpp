#pragma once

#include "core/logging/logger.hpp"
#include "link/frame.hpp"
#include "session/session_registry.hpp"
#include "sim/simulation_plan.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace camlink::sim {

struct RunOptions {
  // events.jsonl goes here; empty disables the timeline.
  std::filesystem::path output_dir;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  std::ostream* log_stream = nullptr;
};

struct SimulationSummary {
  bool expectations_met = true;
  std::vector<std::string> failures;
  // Remote's final view, sorted by device id.
  std::vector<session::SessionView> remote_sessions;
  std::map<link::DeviceId, std::uint64_t> camera_actuations;
  std::uint64_t submits_rejected = 0;
  std::uint64_t radio_transmissions = 0;
  std::uint64_t radio_dropped = 0;
  std::uint64_t radio_duplicated = 0;
  std::uint64_t radio_corrupted = 0;
  std::uint64_t events_written = 0;
  std::filesystem::path events_path;
};

// Runs one Remote and every planned Controller over the simulated radio in
// virtual time, replays the script, and checks the plan's expectations.
//
// Returns false only when the run itself could not proceed (I/O, a script
// step the rig cannot apply). Failed expectations are reported through
// `summary.expectations_met` and `summary.failures`.
bool RunSimulation(const SimulationPlan& plan, const RunOptions& options,
                   SimulationSummary& summary, std::string& error);

// Fixed-width table of the Remote's sessions, one line per device.
std::string FormatSessionTable(const std::vector<session::SessionView>& views);

} // namespace camlink::sim
