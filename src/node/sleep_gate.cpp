#include "node/sleep_gate.hpp"

#include <algorithm>

namespace camlink::node {

std::string_view ToString(const SleepOutcome outcome) {
  switch (outcome) {
  case SleepOutcome::kSkipped:
    return "skipped";
  case SleepOutcome::kTimerExpired:
    return "timer_expired";
  case SleepOutcome::kRadioActivity:
    return "radio_activity";
  }
  return "skipped";
}

std::optional<std::chrono::milliseconds>
SleepGate::Budget(const bool command_pending, const std::optional<core::TimePoint> next_due,
                  const core::TimePoint now, const std::chrono::milliseconds idle_cap) const {
  if (command_pending) {
    return std::nullopt;
  }

  std::chrono::milliseconds budget = idle_cap;
  if (next_due.has_value()) {
    budget = std::min(budget, core::ElapsedSince(now, *next_due));
  }
  if (budget < min_sleep_window_ || budget <= std::chrono::milliseconds::zero()) {
    return std::nullopt;
  }
  return budget;
}

SleepOutcome SleepGate::Sleep(link::ILinkTransport& transport, const bool command_pending,
                              const std::optional<core::TimePoint> next_due,
                              const core::TimePoint now,
                              const std::chrono::milliseconds idle_cap) {
  const auto budget = Budget(command_pending, next_due, now, idle_cap);
  if (!budget.has_value()) {
    return SleepOutcome::kSkipped;
  }
  ++sleep_count_;
  return transport.WaitForActivity(*budget) ? SleepOutcome::kRadioActivity
                                            : SleepOutcome::kTimerExpired;
}

} // namespace camlink::node
