#pragma once

#include "camera/adapter_error.hpp"
#include "link/camera_status.hpp"
#include "link/frame.hpp"

#include <chrono>

namespace camlink::camera {

// Capability the Controller uses to reach one physical camera over its
// short-range link (BLE on the real device, scripted in tests).
//
// Contract:
// - every call blocks for at most `budget`, then fails with kTimeout
// - Cancel() may be called from any thread and makes the in-progress (or
//   next) call fail with kCancelled
// - QueryStatus() fills everything except `last_updated`; the caller stamps
//   the time on its own clock
class ICameraAdapter {
public:
  virtual ~ICameraAdapter() = default;

  // Brings a sleeping camera up and (re)establishes the short-range link.
  virtual bool Wake(link::DeviceId device_id, std::chrono::milliseconds budget,
                    AdapterError& error) = 0;

  // Starts or stops recording (shutter on/off).
  virtual bool SetRecording(bool recording, std::chrono::milliseconds budget,
                            AdapterError& error) = 0;

  virtual bool QueryStatus(link::CameraStatus& status, std::chrono::milliseconds budget,
                           AdapterError& error) = 0;

  // Puts the camera to sleep to save its battery.
  virtual bool PowerDown(std::chrono::milliseconds budget, AdapterError& error) = 0;

  virtual void Cancel() = 0;
};

} // namespace camlink::camera
