#include "../common/assertions.hpp"
#include "node/sleep_gate.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace {

class ScriptedTransport final : public camlink::link::ILinkTransport {
public:
  bool activity = false;
  std::vector<std::chrono::milliseconds> waits;

  bool Send(const std::vector<std::uint8_t>&, std::string&) override {
    return true;
  }

  std::optional<camlink::link::ReceivedPacket> PollReceived() override {
    return std::nullopt;
  }

  bool WaitForActivity(std::chrono::milliseconds timeout) override {
    waits.push_back(timeout);
    return activity;
  }
};

} // namespace

int main() {
  using camlink::core::TimePoint;
  using camlink::node::SleepGate;
  using camlink::node::SleepOutcome;
  using camlink::tests::common::Fail;
  using namespace std::chrono_literals;

  const TimePoint now = TimePoint{} + 1h;
  const SleepGate gate(200ms);

  if (gate.Budget(true, now + 10s, now, 5s).has_value()) {
    Fail("no sleep while a command is pending");
  }
  if (gate.Budget(false, now + 150ms, now, 5s).has_value()) {
    Fail("no sleep when the next event is inside the minimum window");
  }
  if (gate.Budget(false, now - 1s, now, 5s).has_value()) {
    Fail("no sleep when something is already overdue");
  }
  if (gate.Budget(false, now + 1200ms, now, 5s) != 1200ms) {
    Fail("sleep budget should end at the next due event");
  }
  if (gate.Budget(false, std::nullopt, now, 5s) != 5s) {
    Fail("with nothing due the idle cap applies");
  }

  {
    SleepGate counting(200ms);
    ScriptedTransport transport;
    if (counting.Sleep(transport, true, std::nullopt, now, 5s) != SleepOutcome::kSkipped ||
        !transport.waits.empty()) {
      Fail("skipped sleep must not wait on the radio");
    }
    if (counting.Sleep(transport, false, now + 1s, now, 5s) != SleepOutcome::kTimerExpired ||
        transport.waits.size() != 1U || transport.waits.front() != 1s) {
      Fail("quiet radio should sleep the whole budget");
    }
    transport.activity = true;
    if (counting.Sleep(transport, false, now + 1s, now, 5s) != SleepOutcome::kRadioActivity) {
      Fail("radio activity should end the sleep");
    }
    if (counting.SleepCount() != 2U || camlink::node::ToString(SleepOutcome::kRadioActivity) !=
                                           "radio_activity") {
      Fail("unexpected sleep bookkeeping");
    }
  }

  return 0;
}
