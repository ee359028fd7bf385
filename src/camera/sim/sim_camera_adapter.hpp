#pragma once

#include "camera/camera_adapter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace camlink::camera::sim {

using AdapterConfig = std::map<std::string, std::string>;

// Deterministic, hardware-free stand-in for a GoPro behind a BLE link.
//
// Behaviour is driven by string parameters so simulation plans and tests
// can script it without recompiling:
//   asleep            "true"|"false"   camera starts asleep
//   wake_responds     "true"|"false"   false: Wake() gets no answer
//   response_delay_ms <n>              simulated latency of every call
//   fail_commands     <n>              next n SetRecording() calls are rejected
//   battery_percent   <0-100>
//   signal_quality    <0-100>
//   overheating       "true"|"false"
//   low_temperature   "true"|"false"
//   low_battery_below <0-100>          LowBattery threshold (default 15)
class SimCameraAdapter final : public ICameraAdapter {
public:
  SimCameraAdapter();

  bool Wake(link::DeviceId device_id, std::chrono::milliseconds budget,
            AdapterError& error) override;
  bool SetRecording(bool recording, std::chrono::milliseconds budget,
                    AdapterError& error) override;
  bool QueryStatus(link::CameraStatus& status, std::chrono::milliseconds budget,
                   AdapterError& error) override;
  bool PowerDown(std::chrono::milliseconds budget, AdapterError& error) override;
  void Cancel() override;

  bool SetParam(const std::string& key, const std::string& value, std::string& error);
  AdapterConfig DumpConfig() const;

  bool IsRecording() const {
    return recording_;
  }
  bool IsAsleep() const {
    return asleep_;
  }

  // Number of calls that changed the camera's recording state.
  std::uint32_t ActuationCount() const {
    return actuation_count_;
  }
  std::uint32_t WakeCalls() const {
    return wake_calls_;
  }
  std::uint32_t SetRecordingCalls() const {
    return set_recording_calls_;
  }
  std::uint32_t QueryCalls() const {
    return query_calls_;
  }
  std::uint32_t PowerDownCalls() const {
    return power_down_calls_;
  }

private:
  // Shared preamble: honours Cancel() and the simulated latency.
  bool BeginCall(std::string_view operation, std::chrono::milliseconds budget,
                 AdapterError& error);

  bool ParamFlag(const std::string& key) const;
  std::uint32_t ParamUInt(const std::string& key) const;

  AdapterConfig params_;
  std::atomic<bool> cancel_requested_{false};
  bool asleep_ = false;
  bool recording_ = false;
  std::uint32_t pending_command_failures_ = 0;
  std::uint32_t actuation_count_ = 0;
  std::uint32_t wake_calls_ = 0;
  std::uint32_t set_recording_calls_ = 0;
  std::uint32_t query_calls_ = 0;
  std::uint32_t power_down_calls_ = 0;
};

} // namespace camlink::camera::sim
