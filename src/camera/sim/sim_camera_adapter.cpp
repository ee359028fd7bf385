#include "camera/sim/sim_camera_adapter.hpp"

#include <charconv>

namespace camlink::camera::sim {

namespace {

constexpr std::uint32_t kDefaultBatteryPercent = 90;
constexpr std::uint32_t kDefaultSignalQuality = 80;
constexpr std::uint32_t kDefaultLowBatteryBelow = 15;
constexpr std::uint32_t kPercentCeiling = 100;

bool ParseUInt32(const std::string& text, std::uint32_t& value) {
  if (text.empty()) {
    return false;
  }

  std::uint32_t parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }

  value = parsed;
  return true;
}

bool IsFlagKey(const std::string& key) {
  return key == "asleep" || key == "wake_responds" || key == "overheating" ||
         key == "low_temperature";
}

bool IsPercentKey(const std::string& key) {
  return key == "battery_percent" || key == "signal_quality" || key == "low_battery_below";
}

} // namespace

SimCameraAdapter::SimCameraAdapter() {
  params_ = {
      {"adapter", "sim"},
      {"asleep", "false"},
      {"wake_responds", "true"},
      {"response_delay_ms", "0"},
      {"fail_commands", "0"},
      {"battery_percent", std::to_string(kDefaultBatteryPercent)},
      {"signal_quality", std::to_string(kDefaultSignalQuality)},
      {"overheating", "false"},
      {"low_temperature", "false"},
      {"low_battery_below", std::to_string(kDefaultLowBatteryBelow)},
  };
}

bool SimCameraAdapter::Wake(const link::DeviceId device_id, const std::chrono::milliseconds budget,
                            AdapterError& error) {
  ++wake_calls_;
  if (!BeginCall("wake", budget, error)) {
    return false;
  }
  if (!asleep_) {
    error.Clear();
    return true;
  }
  if (!ParamFlag("wake_responds")) {
    error.Set(AdapterErrorCode::kNoResponse,
              "camera " + std::to_string(device_id) + " ignored the wake request");
    return false;
  }

  asleep_ = false;
  params_["asleep"] = "false";
  error.Clear();
  return true;
}

bool SimCameraAdapter::SetRecording(const bool recording, const std::chrono::milliseconds budget,
                                    AdapterError& error) {
  ++set_recording_calls_;
  if (!BeginCall("set_recording", budget, error)) {
    return false;
  }
  if (asleep_) {
    error.Set(AdapterErrorCode::kNotConnected, "camera is asleep");
    return false;
  }
  if (pending_command_failures_ > 0U) {
    --pending_command_failures_;
    params_["fail_commands"] = std::to_string(pending_command_failures_);
    error.Set(AdapterErrorCode::kRejected, "scripted shutter rejection");
    return false;
  }

  if (recording_ != recording) {
    recording_ = recording;
    ++actuation_count_;
  }
  error.Clear();
  return true;
}

bool SimCameraAdapter::QueryStatus(link::CameraStatus& status,
                                   const std::chrono::milliseconds budget, AdapterError& error) {
  ++query_calls_;
  if (!BeginCall("query_status", budget, error)) {
    return false;
  }

  link::CameraStatus snapshot;
  snapshot.camera_connected = !asleep_;
  snapshot.camera_asleep = asleep_;
  snapshot.battery_percent = static_cast<std::uint8_t>(ParamUInt("battery_percent"));
  snapshot.signal_quality = asleep_ ? 0 : static_cast<std::uint8_t>(ParamUInt("signal_quality"));
  if (asleep_) {
    snapshot.recording_state = link::RecordingState::kIdle;
  } else {
    snapshot.recording_state =
        recording_ ? link::RecordingState::kRecording : link::RecordingState::kIdle;
  }
  snapshot.SetFlag(link::HealthFlag::kOverheating, ParamFlag("overheating"));
  snapshot.SetFlag(link::HealthFlag::kLowTemperature, ParamFlag("low_temperature"));
  snapshot.SetFlag(link::HealthFlag::kLowBattery,
                   ParamUInt("battery_percent") < ParamUInt("low_battery_below"));

  status = snapshot;
  error.Clear();
  return true;
}

bool SimCameraAdapter::PowerDown(const std::chrono::milliseconds budget, AdapterError& error) {
  ++power_down_calls_;
  if (!BeginCall("power_down", budget, error)) {
    return false;
  }
  if (recording_) {
    error.Set(AdapterErrorCode::kRejected, "camera is recording");
    return false;
  }
  asleep_ = true;
  params_["asleep"] = "true";
  error.Clear();
  return true;
}

void SimCameraAdapter::Cancel() {
  cancel_requested_.store(true);
}

bool SimCameraAdapter::SetParam(const std::string& key, const std::string& value,
                                std::string& error) {
  if (key.empty()) {
    error = "parameter key cannot be empty";
    return false;
  }
  if (params_.count(key) == 0U || key == "adapter") {
    error = "unknown sim camera parameter '" + key + "'";
    return false;
  }

  if (IsFlagKey(key)) {
    if (value != "true" && value != "false") {
      error = "parameter '" + key + "' expects true|false";
      return false;
    }
  } else {
    std::uint32_t parsed = 0;
    if (!ParseUInt32(value, parsed)) {
      error = "parameter '" + key + "' expects a non-negative integer";
      return false;
    }
    if (IsPercentKey(key) && parsed > kPercentCeiling) {
      error = "parameter '" + key + "' must be within 0..100";
      return false;
    }
    if (key == "fail_commands") {
      pending_command_failures_ = parsed;
    }
  }

  if (key == "asleep") {
    asleep_ = value == "true";
    if (asleep_) {
      recording_ = false;
    }
  }

  params_[key] = value;
  return true;
}

AdapterConfig SimCameraAdapter::DumpConfig() const {
  AdapterConfig config = params_;
  config["recording"] = recording_ ? "true" : "false";
  config["actuations"] = std::to_string(actuation_count_);
  return config;
}

bool SimCameraAdapter::BeginCall(std::string_view operation,
                                 const std::chrono::milliseconds budget, AdapterError& error) {
  if (cancel_requested_.exchange(false)) {
    error.Set(AdapterErrorCode::kCancelled, std::string(operation) + " cancelled");
    return false;
  }

  const std::chrono::milliseconds latency(ParamUInt("response_delay_ms"));
  if (latency > budget) {
    error.Set(AdapterErrorCode::kTimeout,
              std::string(operation) + " needs " + std::to_string(latency.count()) +
                  " ms, budget is " + std::to_string(budget.count()) + " ms");
    return false;
  }
  return true;
}

bool SimCameraAdapter::ParamFlag(const std::string& key) const {
  const auto it = params_.find(key);
  return it != params_.end() && it->second == "true";
}

std::uint32_t SimCameraAdapter::ParamUInt(const std::string& key) const {
  const auto it = params_.find(key);
  std::uint32_t value = 0;
  if (it == params_.end() || !ParseUInt32(it->second, value)) {
    return 0;
  }
  return value;
}

} // namespace camlink::camera::sim
