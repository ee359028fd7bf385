#include "sim/simulation_plan.hpp"

#include "camera/sim/sim_camera_adapter.hpp"
#include "core/json_dom.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>

namespace camlink::sim {

namespace {

using JsonValue = core::json::Value;
using config::ValidationReport;

constexpr std::uint64_t kMaxDurationMs = 24ULL * 60ULL * 60ULL * 1000ULL;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string JoinPath(std::string_view prefix, std::string_view key) {
  if (prefix.empty()) {
    return std::string(key);
  }
  return std::string(prefix) + "." + std::string(key);
}

std::string Indexed(std::string_view base, std::size_t index) {
  return std::string(base) + "[" + std::to_string(index) + "]";
}

std::optional<std::uint64_t> ReadUInt(const JsonValue& object, std::string_view key,
                                      const std::string& path, std::uint64_t max_value,
                                      ValidationReport& report) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return std::nullopt;
  }
  const auto parsed = field->AsUInt();
  if (!parsed.has_value() || *parsed > max_value) {
    AddIssue(report, JoinPath(path, key),
             "must be an integer in [0, " + std::to_string(max_value) + "]");
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::string> ReadString(const JsonValue& object, std::string_view key,
                                      const std::string& path, ValidationReport& report) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return std::nullopt;
  }
  auto parsed = field->AsString();
  if (!parsed.has_value() || parsed->empty()) {
    AddIssue(report, JoinPath(path, key), "must be a non-empty string");
    return std::nullopt;
  }
  return parsed;
}

// Sim camera parameters are strings internally; plans may write them as
// JSON numbers or booleans.
std::optional<std::string> ScalarText(const JsonValue& value) {
  if (const auto text = value.AsString()) {
    return text;
  }
  if (const auto flag = value.AsBool()) {
    return *flag ? std::string("true") : std::string("false");
  }
  if (const auto number = value.AsUInt()) {
    return std::to_string(*number);
  }
  return std::nullopt;
}

void ReadFaults(const JsonValue& object, const std::string& path, link::sim::ChannelFaults& faults,
                ValidationReport& report) {
  if (const auto v = ReadUInt(object, "drop_percent", path, 100, report)) {
    faults.drop_percent = static_cast<std::uint32_t>(*v);
  }
  if (const auto v = ReadUInt(object, "duplicate_percent", path, 100, report)) {
    faults.duplicate_percent = static_cast<std::uint32_t>(*v);
  }
  if (const auto v = ReadUInt(object, "corrupt_percent", path, 100, report)) {
    faults.corrupt_percent = static_cast<std::uint32_t>(*v);
  }
  if (const auto v = ReadUInt(object, "transmit_fail_percent", path, 100, report)) {
    faults.transmit_fail_percent = static_cast<std::uint32_t>(*v);
  }
}

void ReadSignal(const JsonValue& object, const std::string& path, link::SignalQuality& signal,
                ValidationReport& report) {
  const JsonValue* rssi = object.Find("rssi_dbm");
  if (rssi != nullptr) {
    const auto value = rssi->AsNumber();
    if (!value.has_value() || *value < -160.0 || *value > 0.0) {
      AddIssue(report, path + ".rssi_dbm", "must be a number in [-160, 0]");
    } else {
      signal.rssi_dbm = static_cast<std::int16_t>(*value);
    }
  }
  const JsonValue* snr = object.Find("snr_db");
  if (snr != nullptr) {
    const auto value = snr->AsNumber();
    if (!value.has_value() || *value < -30.0 || *value > 30.0) {
      AddIssue(report, path + ".snr_db", "must be a number in [-30, 30]");
    } else {
      signal.snr_db = static_cast<float>(*value);
    }
  }
}

bool ParseAckResult(std::string_view text, link::AckResult& result) {
  if (text == "ok") {
    result = link::AckResult::kOk;
  } else if (text == "camera_failed") {
    result = link::AckResult::kCameraFailed;
  } else if (text == "rejected") {
    result = link::AckResult::kRejected;
  } else {
    return false;
  }
  return true;
}

bool ParseConnectivity(std::string_view text, session::Connectivity& connectivity) {
  for (const auto candidate : {session::Connectivity::kUnknown, session::Connectivity::kOffline,
                               session::Connectivity::kStale, session::Connectivity::kOnline}) {
    if (session::ToString(candidate) == text) {
      connectivity = candidate;
      return true;
    }
  }
  return false;
}

bool ParseAction(std::string_view text, ScriptStep::Action& action) {
  for (const auto candidate :
       {ScriptStep::Action::kSubmit, ScriptStep::Action::kPress, ScriptStep::Action::kWakeAll,
        ScriptStep::Action::kCameraParam, ScriptStep::Action::kRadioRange,
        ScriptStep::Action::kRadioFaults}) {
    if (ToString(candidate) == text) {
      action = candidate;
      return true;
    }
  }
  return false;
}

void ReadControllers(const JsonValue& root, SimulationPlan& plan, ValidationReport& report) {
  const JsonValue* controllers = root.Find("controllers");
  if (controllers == nullptr || !controllers->IsArray() || controllers->array_value.empty()) {
    AddIssue(report, "controllers", "is required and must be a non-empty array");
    return;
  }

  for (std::size_t i = 0; i < controllers->array_value.size(); ++i) {
    const JsonValue& entry = controllers->array_value[i];
    const std::string path = Indexed("controllers", i);
    if (!entry.IsObject()) {
      AddIssue(report, path, "must be an object");
      continue;
    }

    ControllerPlan controller;
    controller.name = ReadString(entry, "name", path, report).value_or("controller-" +
                                                                        std::to_string(i));
    const JsonValue* node = entry.Find("node");
    if (node == nullptr) {
      AddIssue(report, path + ".node", "is required");
      continue;
    }
    config::ReadNodeConfig(*node, path + ".node", controller.node, report);
    if (controller.node.role != link::SourceRole::kController) {
      AddIssue(report, path + ".node.role", "must be \"controller\"");
    }
    ReadSignal(entry, path, controller.signal, report);

    if (const JsonValue* cameras = entry.Find("cameras"); cameras != nullptr) {
      if (!cameras->IsObject()) {
        AddIssue(report, path + ".cameras", "must be an object keyed by camera id");
      } else {
        for (const auto& camera_entry : cameras->object_value) {
          const std::string& id_text = camera_entry.first;
          const JsonValue& params = camera_entry.second;
          const std::string camera_path = path + ".cameras." + id_text;
          const auto& devices = controller.node.devices;
          const auto match =
              std::find_if(devices.begin(), devices.end(), [&id_text](link::DeviceId id) {
                return std::to_string(id) == id_text;
              });
          if (match == devices.end()) {
            AddIssue(report, camera_path, "is not one of this controller's devices");
            continue;
          }
          if (!params.IsObject()) {
            AddIssue(report, camera_path, "must be an object of sim camera parameters");
            continue;
          }

          camera::sim::SimCameraAdapter scratch_camera;
          for (const auto& [key, value] : params.object_value) {
            const auto text = ScalarText(value);
            std::string param_error;
            if (!text.has_value()) {
              AddIssue(report, camera_path + "." + key, "must be a string, integer or boolean");
            } else if (!scratch_camera.SetParam(key, *text, param_error)) {
              AddIssue(report, camera_path + "." + key, param_error);
            } else {
              controller.camera_params[*match][key] = *text;
            }
          }
        }
      }
    }
    plan.controllers.push_back(std::move(controller));
  }
}

void ReadScript(const JsonValue& root, SimulationPlan& plan, ValidationReport& report) {
  const JsonValue* script = root.Find("script");
  if (script == nullptr) {
    return;
  }
  if (!script->IsArray()) {
    AddIssue(report, "script", "must be an array");
    return;
  }

  for (std::size_t i = 0; i < script->array_value.size(); ++i) {
    const JsonValue& entry = script->array_value[i];
    const std::string path = Indexed("script", i);
    if (!entry.IsObject()) {
      AddIssue(report, path, "must be an object");
      continue;
    }

    ScriptStep step;
    const auto at_ms = ReadUInt(entry, "at_ms", path, kMaxDurationMs, report);
    if (!at_ms.has_value()) {
      AddIssue(report, path + ".at_ms", "is required");
      continue;
    }
    step.at_ms = *at_ms;

    const auto action = ReadString(entry, "action", path, report);
    if (!action.has_value() || !ParseAction(*action, step.action)) {
      AddIssue(report, path + ".action",
               "must be one of: submit, press, wake_all, camera_param, radio_range, "
               "radio_faults");
      continue;
    }

    const bool needs_device = step.action == ScriptStep::Action::kSubmit ||
                              step.action == ScriptStep::Action::kPress ||
                              step.action == ScriptStep::Action::kCameraParam;
    if (needs_device) {
      const auto device = ReadUInt(entry, "device_id", path, 255, report);
      if (!device.has_value()) {
        AddIssue(report, path + ".device_id", "is required for " + *action);
        continue;
      }
      step.device_id = static_cast<link::DeviceId>(*device);
    }

    const bool needs_controller = step.action == ScriptStep::Action::kCameraParam ||
                                  step.action == ScriptStep::Action::kRadioRange;
    if (needs_controller) {
      const auto index = ReadUInt(entry, "controller", path, 255, report).value_or(0);
      if (index >= plan.controllers.size()) {
        AddIssue(report, path + ".controller", "does not name a controller in this plan");
        continue;
      }
      step.controller = static_cast<std::size_t>(index);
    }

    switch (step.action) {
    case ScriptStep::Action::kSubmit: {
      const auto command = ReadString(entry, "command", path, report);
      const auto kind = command.has_value() ? link::ParseCommandKind(*command) : std::nullopt;
      if (!kind.has_value() || !link::IsUserCommand(*kind)) {
        AddIssue(report, path + ".command",
                 "must be one of: trigger_start, trigger_stop, wake_up, status_request");
        continue;
      }
      step.command = *kind;
      break;
    }
    case ScriptStep::Action::kCameraParam: {
      const auto key = ReadString(entry, "key", path, report);
      const JsonValue* value = entry.Find("value");
      const auto text = value != nullptr ? ScalarText(*value) : std::nullopt;
      if (!key.has_value() || !text.has_value()) {
        AddIssue(report, path, "camera_param needs key and value");
        continue;
      }
      camera::sim::SimCameraAdapter scratch_camera;
      std::string param_error;
      if (!scratch_camera.SetParam(*key, *text, param_error)) {
        AddIssue(report, path + ".key", param_error);
        continue;
      }
      step.key = *key;
      step.value = *text;
      break;
    }
    case ScriptStep::Action::kRadioRange: {
      const JsonValue* in_range = entry.Find("in_range");
      const auto flag = in_range != nullptr ? in_range->AsBool() : std::nullopt;
      if (!flag.has_value()) {
        AddIssue(report, path + ".in_range", "is required and must be true or false");
        continue;
      }
      step.in_range = *flag;
      break;
    }
    case ScriptStep::Action::kRadioFaults:
      step.faults = plan.radio;
      ReadFaults(entry, path, step.faults, report);
      break;
    case ScriptStep::Action::kPress:
    case ScriptStep::Action::kWakeAll:
      break;
    }

    if (step.at_ms > plan.duration_ms) {
      AddIssue(report, path + ".at_ms", "is after duration_ms");
      continue;
    }
    plan.script.push_back(step);
  }

  std::stable_sort(plan.script.begin(), plan.script.end(),
                   [](const ScriptStep& lhs, const ScriptStep& rhs) { return lhs.at_ms < rhs.at_ms; });
}

void ReadExpectations(const JsonValue& root, SimulationPlan& plan, ValidationReport& report) {
  const JsonValue* expect = root.Find("expect");
  if (expect == nullptr) {
    return;
  }
  if (!expect->IsArray()) {
    AddIssue(report, "expect", "must be an array");
    return;
  }

  for (std::size_t i = 0; i < expect->array_value.size(); ++i) {
    const JsonValue& entry = expect->array_value[i];
    const std::string path = Indexed("expect", i);
    if (!entry.IsObject()) {
      AddIssue(report, path, "must be an object");
      continue;
    }

    Expectation expectation;
    const auto device = ReadUInt(entry, "device_id", path, 254, report);
    if (!device.has_value()) {
      AddIssue(report, path + ".device_id", "is required");
      continue;
    }
    expectation.device_id = static_cast<link::DeviceId>(*device);

    if (const auto text = ReadString(entry, "connectivity", path, report)) {
      session::Connectivity connectivity = session::Connectivity::kUnknown;
      if (ParseConnectivity(*text, connectivity)) {
        expectation.connectivity = connectivity;
      } else {
        AddIssue(report, path + ".connectivity",
                 "must be one of: unknown, offline, stale, online");
      }
    }
    if (const auto text = ReadString(entry, "last_outcome", path, report)) {
      if (*text == "acked" || *text == "timed_out" || *text == "none") {
        expectation.last_outcome = *text;
      } else {
        AddIssue(report, path + ".last_outcome", "must be one of: acked, timed_out, none");
      }
    }
    if (const auto text = ReadString(entry, "ack_result", path, report)) {
      link::AckResult result = link::AckResult::kOk;
      if (ParseAckResult(*text, result)) {
        expectation.ack_result = result;
      } else {
        AddIssue(report, path + ".ack_result", "must be one of: ok, camera_failed, rejected");
      }
    }
    expectation.status_label = ReadString(entry, "status_label", path, report);
    if (const auto text = ReadString(entry, "alert", path, report)) {
      if (*text == "none" || *text == "command_timed_out" || *text == "camera_failed") {
        expectation.alert = *text;
      } else {
        AddIssue(report, path + ".alert",
                 "must be one of: none, command_timed_out, camera_failed");
      }
    }
    expectation.camera_actuations =
        ReadUInt(entry, "camera_actuations", path, 1'000'000, report);
    plan.expectations.push_back(expectation);
  }
}

} // namespace

std::string_view ToString(const ScriptStep::Action action) {
  switch (action) {
  case ScriptStep::Action::kSubmit:
    return "submit";
  case ScriptStep::Action::kPress:
    return "press";
  case ScriptStep::Action::kWakeAll:
    return "wake_all";
  case ScriptStep::Action::kCameraParam:
    return "camera_param";
  case ScriptStep::Action::kRadioRange:
    return "radio_range";
  case ScriptStep::Action::kRadioFaults:
    return "radio_faults";
  }
  return "submit";
}

bool LoadSimulationPlanText(std::string_view json_text, SimulationPlan& plan,
                            ValidationReport& report, std::string& error) {
  error.clear();
  report = ValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", "invalid JSON: " + parse_error);
    return true;
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "simulation plan must be a JSON object");
    return true;
  }

  SimulationPlan parsed;
  parsed.name = ReadString(root, "name", "", report).value_or("unnamed");
  parsed.seed = ReadUInt(root, "seed", "", std::numeric_limits<std::uint64_t>::max(), report)
                    .value_or(parsed.seed);
  parsed.duration_ms =
      ReadUInt(root, "duration_ms", "", kMaxDurationMs, report).value_or(parsed.duration_ms);
  parsed.tick_ms = ReadUInt(root, "tick_ms", "", 10'000, report).value_or(parsed.tick_ms);
  if (parsed.tick_ms == 0U) {
    AddIssue(report, "tick_ms", "must be greater than 0");
  }

  parsed.radio.seed = parsed.seed;
  if (const JsonValue* radio = root.Find("radio"); radio != nullptr) {
    if (radio->IsObject()) {
      ReadFaults(*radio, "radio", parsed.radio, report);
    } else {
      AddIssue(report, "radio", "must be an object");
    }
  }

  const JsonValue* remote = root.Find("remote");
  if (remote == nullptr) {
    AddIssue(report, "remote", "is required");
  } else {
    config::ReadNodeConfig(*remote, "remote", parsed.remote, report);
    if (parsed.remote.role != link::SourceRole::kRemote) {
      AddIssue(report, "remote.role", "must be \"remote\"");
    }
  }

  ReadControllers(root, parsed, report);
  ReadScript(root, parsed, report);
  ReadExpectations(root, parsed, report);

  report.valid = report.issues.empty();
  if (report.valid) {
    plan = std::move(parsed);
  }
  return true;
}

bool LoadSimulationPlanFile(const std::string& path, SimulationPlan& plan,
                            ValidationReport& report, std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open simulation plan: " + path;
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());
  return LoadSimulationPlanText(text, plan, report, error);
}

} // namespace camlink::sim
