#pragma once

#include "core/time_utils.hpp"
#include "link/link_transport.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace camlink::node {

enum class SleepOutcome {
  // Sleep was not allowed; the loop should poll again right away.
  kSkipped,
  // Slept until the planned wake time.
  kTimerExpired,
  // Radio activity ended the sleep early.
  kRadioActivity,
};

std::string_view ToString(SleepOutcome outcome);

// Decides whether a node may drop into low-power wait between loop
// iterations. Sleeping is refused while a reliable command is pending or
// when the next due event is closer than `min_sleep_window`.
class SleepGate {
public:
  explicit SleepGate(std::chrono::milliseconds min_sleep_window)
      : min_sleep_window_(min_sleep_window) {}

  // How long the node may sleep, or nullopt when it must stay awake.
  // With nothing due at all the node may sleep for `idle_cap`.
  std::optional<std::chrono::milliseconds> Budget(bool command_pending,
                                                  std::optional<core::TimePoint> next_due,
                                                  core::TimePoint now,
                                                  std::chrono::milliseconds idle_cap) const;

  // Waits on the transport for at most the budget. Any received packet
  // cancels the wait.
  SleepOutcome Sleep(link::ILinkTransport& transport, bool command_pending,
                     std::optional<core::TimePoint> next_due, core::TimePoint now,
                     std::chrono::milliseconds idle_cap);

  std::uint64_t SleepCount() const {
    return sleep_count_;
  }

private:
  std::chrono::milliseconds min_sleep_window_;
  std::uint64_t sleep_count_ = 0;
};

} // namespace camlink::node
