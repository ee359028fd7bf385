#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "sim/simulation_plan.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace {

using camlink::config::ValidationReport;
using camlink::sim::ScriptStep;
using camlink::sim::SimulationPlan;
using camlink::tests::common::AssertContains;
using camlink::tests::common::Fail;

constexpr std::string_view kValidPlan = R"({
  "name": "two_cameras",
  "seed": 42,
  "duration_ms": 20000,
  "tick_ms": 25,
  "radio": {"drop_percent": 10, "duplicate_percent": 5},
  "remote": {"role": "remote", "local_id": 1, "devices": [2, 5]},
  "controllers": [
    {
      "name": "ctrl-a",
      "rssi_dbm": -101,
      "snr_db": -4.5,
      "node": {"role": "controller", "local_id": 200, "remote_id": 1, "devices": [2]},
      "cameras": {"2": {"battery_percent": 80, "asleep": true}}
    }
  ],
  "script": [
    {"at_ms": 3000, "action": "press", "device_id": 2},
    {"at_ms": 100, "action": "submit", "device_id": 2, "command": "trigger_start"},
    {"at_ms": 3000, "action": "radio_range", "controller": 0, "in_range": false},
    {"at_ms": 500, "action": "radio_faults", "corrupt_percent": 50},
    {"at_ms": 900, "action": "camera_param", "controller": 0, "device_id": 2,
     "key": "overheating", "value": true}
  ],
  "expect": [
    {"device_id": 2, "connectivity": "online", "last_outcome": "acked", "ack_result": "ok",
     "status_label": "REC", "alert": "none", "camera_actuations": 1}
  ]
})";

ValidationReport LoadOrFail(std::string_view text, SimulationPlan& plan) {
  ValidationReport report;
  std::string error;
  if (!camlink::sim::LoadSimulationPlanText(text, plan, report, error)) {
    Fail("LoadSimulationPlanText failed: " + error);
  }
  return report;
}

void ExpectInvalid(std::string_view text, std::string_view path, std::string_view message) {
  SimulationPlan plan;
  const ValidationReport report = LoadOrFail(text, plan);
  if (report.valid) {
    Fail("expected invalid plan: " + std::string(text));
  }
  const std::string formatted = camlink::config::FormatValidationIssues(report);
  AssertContains(formatted, std::string(path) + ": ");
  AssertContains(formatted, message);
}

// Wraps one controller entry and optional extra top-level members in an
// otherwise valid plan.
std::string PlanWith(std::string_view controller, std::string_view extra = "") {
  std::string text = R"({"duration_ms": 5000,
    "remote": {"role": "remote", "local_id": 1, "devices": [2]},
    "controllers": [)";
  text += controller;
  text += "]";
  if (!extra.empty()) {
    text += ", ";
    text += extra;
  }
  text += "}";
  return text;
}

constexpr std::string_view kController =
    R"({"node": {"role": "controller", "local_id": 200, "remote_id": 1, "devices": [2]}})";

} // namespace

int main() {
  {
    SimulationPlan plan;
    const ValidationReport report = LoadOrFail(kValidPlan, plan);
    if (!report.valid) {
      Fail("expected valid plan:\n" + camlink::config::FormatValidationIssues(report));
    }
    if (plan.name != "two_cameras" || plan.seed != 42U || plan.duration_ms != 20000U ||
        plan.tick_ms != 25U) {
      Fail("top-level plan fields not applied");
    }
    if (plan.radio.seed != 42U || plan.radio.drop_percent != 10U ||
        plan.radio.duplicate_percent != 5U || plan.radio.corrupt_percent != 0U) {
      Fail("radio faults should inherit the plan seed");
    }
    if (plan.remote.devices.size() != 2U || plan.controllers.size() != 1U) {
      Fail("remote and controllers not parsed");
    }

    const auto& controller = plan.controllers.front();
    if (controller.name != "ctrl-a" || controller.signal.rssi_dbm != -101 ||
        controller.signal.snr_db != -4.5F) {
      Fail("controller name or signal not applied");
    }
    const auto params = controller.camera_params.find(2);
    if (params == controller.camera_params.end() || params->second.at("battery_percent") != "80" ||
        params->second.at("asleep") != "true") {
      Fail("camera params should be stored as text");
    }

    if (plan.script.size() != 5U) {
      Fail("every script step should be kept");
    }
    if (plan.script[0].at_ms != 100U || plan.script[0].action != ScriptStep::Action::kSubmit ||
        plan.script[0].command != camlink::link::CommandKind::kTriggerStart) {
      Fail("script should be sorted by time");
    }
    if (plan.script[3].action != ScriptStep::Action::kPress ||
        plan.script[4].action != ScriptStep::Action::kRadioRange || plan.script[4].in_range) {
      Fail("steps at the same time should keep file order");
    }
    if (plan.script[1].faults.corrupt_percent != 50U || plan.script[1].faults.drop_percent != 10U) {
      Fail("radio_faults should start from the plan's radio profile");
    }
    if (plan.script[2].key != "overheating" || plan.script[2].value != "true") {
      Fail("camera_param value should be normalized to text");
    }

    if (plan.expectations.size() != 1U) {
      Fail("expectation not parsed");
    }
    const auto& expectation = plan.expectations.front();
    if (expectation.connectivity != camlink::session::Connectivity::kOnline ||
        expectation.last_outcome != "acked" ||
        expectation.ack_result != camlink::link::AckResult::kOk ||
        expectation.status_label != "REC" || expectation.alert != "none" ||
        expectation.camera_actuations != 1U) {
      Fail("expectation fields not applied");
    }
  }

  {
    SimulationPlan plan;
    const ValidationReport report = LoadOrFail(PlanWith(kController), plan);
    if (!report.valid || plan.name != "unnamed" || plan.seed != 1U || plan.tick_ms != 50U ||
        plan.controllers.front().name != "controller-0") {
      Fail("defaults should fill omitted plan fields");
    }
  }

  ExpectInvalid(R"({"duration_ms": 5000,
                    "remote": {"role": "remote", "local_id": 1, "devices": [2]}})",
                "controllers", "non-empty array");
  ExpectInvalid(PlanWith(R"({"node": {"role": "remote", "local_id": 3, "devices": [2]}})"),
                "controllers[0].node.role", "must be \"controller\"");
  ExpectInvalid(PlanWith(R"({"node": {"role": "controller", "local_id": 200, "remote_id": 1,
                                      "devices": [2], "retries": 4}})"),
                "controllers[0].node.retries", "is not a recognized field");
  ExpectInvalid(PlanWith(R"({"node": {"role": "controller", "local_id": 200, "remote_id": 1,
                                      "devices": [2]}, "cameras": {"7": {}}})"),
                "controllers[0].cameras.7", "is not one of this controller's devices");
  ExpectInvalid(PlanWith(R"({"node": {"role": "controller", "local_id": 200, "remote_id": 1,
                                      "devices": [2]}, "cameras": {"2": {"zoom": 3}}})"),
                "controllers[0].cameras.2.zoom", "unknown sim camera parameter 'zoom'");
  ExpectInvalid(PlanWith(R"({"node": {"role": "controller", "local_id": 200, "remote_id": 1,
                                      "devices": [2]}, "cameras": {"2": {"battery_percent": 140}}})"),
                "controllers[0].cameras.2.battery_percent", "must be within 0..100");
  ExpectInvalid(PlanWith(kController, R"("script": [{"at_ms": 10, "action": "explode"}])"),
                "script[0].action", "must be one of: submit, press");
  ExpectInvalid(PlanWith(kController, R"("script": [{"at_ms": 9000, "action": "wake_all"}])"),
                "script[0].at_ms", "is after duration_ms");
  ExpectInvalid(PlanWith(kController, R"("script": [{"action": "wake_all"}])"),
                "script[0].at_ms", "is required");
  ExpectInvalid(PlanWith(kController,
                         R"("script": [{"at_ms": 10, "action": "submit", "device_id": 2,
                                        "command": "heartbeat"}])"),
                "script[0].command", "trigger_start, trigger_stop, wake_up, status_request");
  ExpectInvalid(PlanWith(kController, R"("script": [{"at_ms": 10, "action": "press"}])"),
                "script[0].device_id", "is required for press");
  ExpectInvalid(PlanWith(kController,
                         R"("script": [{"at_ms": 10, "action": "radio_range", "controller": 3,
                                        "in_range": true}])"),
                "script[0].controller", "does not name a controller");
  ExpectInvalid(PlanWith(kController,
                         R"("script": [{"at_ms": 10, "action": "radio_range"}])"),
                "script[0].in_range", "must be true or false");
  ExpectInvalid(PlanWith(kController, R"("expect": [{"device_id": 2, "connectivity": "gone"}])"),
                "expect[0].connectivity", "unknown, offline, stale, online");
  ExpectInvalid(PlanWith(kController, R"("expect": [{"device_id": 2, "ack_result": "maybe"}])"),
                "expect[0].ack_result", "ok, camera_failed, rejected");
  ExpectInvalid(PlanWith(kController, R"("tick_ms": 0)"), "tick_ms", "must be greater than 0");
  ExpectInvalid(R"({"name": )", "$", "invalid JSON");

  {
    const auto root = camlink::tests::common::CreateUniqueTempDir("camlink-plan-loader");
    const auto path = root / "plan.json";
    camlink::tests::common::WriteFixtureFile(path, kValidPlan);
    SimulationPlan plan;
    ValidationReport report;
    std::string error;
    if (!camlink::sim::LoadSimulationPlanFile(path.string(), plan, report, error) ||
        !report.valid || plan.name != "two_cameras") {
      Fail("expected plan file to load");
    }
    if (camlink::sim::LoadSimulationPlanFile((root / "missing.json").string(), plan, report,
                                             error)) {
      Fail("missing plan file must fail");
    }
    AssertContains(error, "unable to open simulation plan");
    camlink::tests::common::RemovePathBestEffort(root);
  }

  return 0;
}
