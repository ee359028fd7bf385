#include "../common/assertions.hpp"
#include "link/sim/radio_channel.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace {

using camlink::link::sim::ChannelFaults;
using camlink::link::sim::RadioChannel;

struct Tally {
  std::uint64_t received = 0;
  std::uint64_t dropped = 0;
  std::uint64_t corrupted = 0;
};

Tally RunBurst(const ChannelFaults& faults) {
  RadioChannel channel(faults);
  auto& sender = channel.AddEndpoint("remote", {}, 256);
  auto& receiver = channel.AddEndpoint("controller", {.rssi_dbm = -70, .snr_db = 9.0F}, 256);

  const std::vector<std::uint8_t> payload = {0x01, 0x02, 0x03, 0x04};
  std::string error;
  for (int i = 0; i < 100; ++i) {
    static_cast<void>(sender.Send(payload, error));
  }

  Tally tally;
  tally.dropped = channel.DroppedCount();
  tally.corrupted = channel.CorruptedCount();
  while (const auto packet = receiver.PollReceived()) {
    ++tally.received;
  }
  return tally;
}

} // namespace

int main() {
  using camlink::tests::common::Fail;

  {
    RadioChannel channel;
    auto& remote = channel.AddEndpoint("remote");
    auto& controller = channel.AddEndpoint("controller", {.rssi_dbm = -91, .snr_db = 6.5F});
    auto& other = channel.AddEndpoint("controller-2");

    std::string error;
    if (!remote.Send({0xAA, 0xBB}, error)) {
      Fail("clean channel send failed: " + error);
    }
    const auto packet = controller.PollReceived();
    if (!packet.has_value() || packet->bytes != std::vector<std::uint8_t>{0xAA, 0xBB}) {
      Fail("every other endpoint should hear the transmission");
    }
    if (packet->signal.rssi_dbm != -91) {
      Fail("receiver signal metadata should be stamped on the packet");
    }
    if (!other.PollReceived().has_value() || remote.PollReceived().has_value()) {
      Fail("sender must not hear itself");
    }

    other.SetInRange(false);
    if (!remote.Send({0x01}, error)) {
      Fail("send failed");
    }
    if (other.PollReceived().has_value()) {
      Fail("out-of-range endpoint must not receive");
    }
    if (other.Send({0x02}, error)) {
      Fail("out-of-range endpoint must not transmit");
    }
    if (controller.PollReceived().has_value() == false) {
      Fail("in-range endpoint should still receive");
    }
  }

  {
    const ChannelFaults faults{.seed = 42, .drop_percent = 30, .corrupt_percent = 20};
    const Tally first = RunBurst(faults);
    const Tally second = RunBurst(faults);
    if (first.received != second.received || first.dropped != second.dropped ||
        first.corrupted != second.corrupted) {
      Fail("same seed must replay the same faults");
    }
    if (first.dropped == 0U || first.dropped == 100U) {
      Fail("30 percent drop rate should drop some but not all frames");
    }
    if (first.received + first.dropped != 100U) {
      Fail("every non-dropped frame should be delivered once");
    }
  }

  {
    const Tally tally = RunBurst(ChannelFaults{.seed = 3, .duplicate_percent = 100});
    if (tally.received != 200U) {
      Fail("100 percent duplication should deliver every frame twice");
    }
  }

  {
    RadioChannel channel(ChannelFaults{.seed = 1, .transmit_fail_percent = 100});
    auto& remote = channel.AddEndpoint("remote");
    channel.AddEndpoint("controller");
    std::string error;
    if (remote.Send({0x01}, error) || error.empty()) {
      Fail("transmit failure should be reported to the sender");
    }
  }

  {
    RadioChannel channel;
    auto& remote = channel.AddEndpoint("remote");
    auto& controller = channel.AddEndpoint("controller", {}, 2);
    std::string error;
    for (int i = 0; i < 3; ++i) {
      static_cast<void>(remote.Send({static_cast<std::uint8_t>(i)}, error));
    }
    if (controller.Queue().OverflowCount() != 1U) {
      Fail("a full receive queue should drop and count the overflow");
    }
  }

  return 0;
}
