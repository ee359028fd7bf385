#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "sim/simulation_runner.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using camlink::sim::RunOptions;
using camlink::sim::SimulationPlan;
using camlink::sim::SimulationSummary;
using camlink::tests::common::AnyRecordContains;
using camlink::tests::common::AssertContains;
using camlink::tests::common::Fail;

std::string BasePlan(std::string_view radio, std::string_view status_label) {
  std::string text = R"({
    "name": "trigger_and_missing_camera",
    "seed": 11,
    "duration_ms": 20000,
    "tick_ms": 50,
    "radio": )";
  text += radio;
  text += R"(,
    "remote": {"role": "remote", "local_id": 1, "devices": [2, 5]},
    "controllers": [
      {"name": "ctrl-a",
       "node": {"role": "controller", "local_id": 200, "remote_id": 1, "devices": [2]}}
    ],
    "script": [
      {"at_ms": 100, "action": "submit", "device_id": 2, "command": "trigger_start"},
      {"at_ms": 200, "action": "submit", "device_id": 5, "command": "wake_up"}
    ],
    "expect": [
      {"device_id": 2, "connectivity": "online", "last_outcome": "acked", "ack_result": "ok",
       "status_label": ")";
  text += status_label;
  text += R"(", "alert": "none", "camera_actuations": 1},
      {"device_id": 5, "connectivity": "offline", "last_outcome": "timed_out",
       "alert": "command_timed_out", "camera_actuations": 0}
    ]
  })";
  return text;
}

SimulationPlan LoadOrFail(const std::string& text) {
  SimulationPlan plan;
  camlink::config::ValidationReport report;
  std::string error;
  if (!camlink::sim::LoadSimulationPlanText(text, plan, report, error) || !report.valid) {
    Fail("plan should load:\n" + error + camlink::config::FormatValidationIssues(report));
  }
  return plan;
}

} // namespace

int main() {
  const auto out_root = camlink::tests::common::CreateUniqueTempDir("camlink-sim-runner");
  std::ostringstream logs;

  {
    const SimulationPlan plan = LoadOrFail(BasePlan("{}", "REC"));
    SimulationSummary summary;
    std::string error;
    const RunOptions options{.output_dir = out_root / "clean",
                             .log_level = camlink::core::logging::LogLevel::kWarn,
                             .log_stream = &logs};
    if (!camlink::sim::RunSimulation(plan, options, summary, error)) {
      Fail("simulation should run: " + error);
    }
    if (!summary.expectations_met) {
      std::string joined;
      for (const auto& failure : summary.failures) {
        joined += failure + "\n";
      }
      Fail("expectations should hold on a clean channel:\n" + joined);
    }
    if (summary.remote_sessions.size() != 2U || summary.remote_sessions[0].device_id != 2U ||
        summary.remote_sessions[1].device_id != 5U) {
      Fail("summary should list the remote's sessions by id");
    }
    if (summary.radio_dropped != 0U || summary.radio_transmissions == 0U ||
        summary.submits_rejected != 0U) {
      Fail("clean channel should transmit without loss");
    }

    if (summary.events_path != out_root / "clean" / "events.jsonl") {
      Fail("events should be written under the output directory");
    }
    const auto lines = camlink::tests::common::ReadJsonlRecords(summary.events_path);
    if (lines.size() != summary.events_written) {
      Fail("events_written should match the timeline length");
    }
    AssertContains(lines.front(), R"("type":"SIM_STARTED")");
    AssertContains(lines.front(), R"("plan":"trigger_and_missing_camera")");
    AssertContains(lines.back(), R"("type":"SIM_FINISHED")");
    AssertContains(lines.back(), R"("expectations_met":"true")");
    if (!AnyRecordContains(lines, R"("type":"COMMAND_ACKED")") ||
        !AnyRecordContains(lines, R"("type":"COMMAND_TIMED_OUT")") ||
        !AnyRecordContains(lines, R"("type":"CAMERA_ACTUATED")") ||
        !AnyRecordContains(lines, R"("to":"offline")")) {
      Fail("timeline should record the ack, the timeout, the actuation and the offline device");
    }

    const std::string table = camlink::sim::FormatSessionTable(summary.remote_sessions);
    AssertContains(table, "device");
    AssertContains(table, "connectivity");
    AssertContains(table, "online");
    AssertContains(table, "REC");
    AssertContains(table, "command_timed_out");
  }

  {
    // Wrong label: the run completes but reports the mismatch.
    const SimulationPlan plan = LoadOrFail(BasePlan("{}", "STBY"));
    SimulationSummary summary;
    std::string error;
    const RunOptions options{.output_dir = {},
                             .log_level = camlink::core::logging::LogLevel::kError,
                             .log_stream = &logs};
    if (!camlink::sim::RunSimulation(plan, options, summary, error)) {
      Fail("simulation should run: " + error);
    }
    if (summary.expectations_met || summary.failures.size() != 1U) {
      Fail("exactly one expectation should fail");
    }
    AssertContains(summary.failures.front(), "device 2: expected status_label=STBY, got REC");
    if (summary.events_written != 0U || !summary.events_path.empty()) {
      Fail("no output directory means no timeline");
    }
  }

  {
    // Same seed, same faults: identical runs.
    const SimulationPlan plan =
        LoadOrFail(BasePlan(R"({"drop_percent": 20, "duplicate_percent": 10})", "REC"));
    const RunOptions options{.output_dir = {},
                             .log_level = camlink::core::logging::LogLevel::kError,
                             .log_stream = &logs};
    SimulationSummary first;
    SimulationSummary second;
    std::string error;
    if (!camlink::sim::RunSimulation(plan, options, first, error) ||
        !camlink::sim::RunSimulation(plan, options, second, error)) {
      Fail("lossy simulation should run: " + error);
    }
    if (first.radio_transmissions != second.radio_transmissions ||
        first.radio_dropped != second.radio_dropped ||
        first.radio_duplicated != second.radio_duplicated ||
        first.failures != second.failures) {
      Fail("seeded runs must be reproducible");
    }
    if (first.radio_dropped == 0U) {
      Fail("a 20% drop rate should drop something over 20 s");
    }
    const auto actuations = first.camera_actuations.find(2);
    if (actuations == first.camera_actuations.end() || actuations->second > 1U) {
      Fail("retransmissions must never actuate a camera twice");
    }
  }

  camlink::tests::common::RemovePathBestEffort(out_root);
  return 0;
}
