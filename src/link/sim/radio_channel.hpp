#pragma once

#include "link/link_transport.hpp"
#include "link/rx_queue.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace camlink::link::sim {

// Fault knobs for the simulated medium. Every decision is a pure function of
// (seed, transmission index, receiver index), so a run replays exactly.
struct ChannelFaults {
  std::uint64_t seed = 1;
  std::uint32_t drop_percent = 0;
  std::uint32_t duplicate_percent = 0;
  std::uint32_t corrupt_percent = 0;
  std::uint32_t transmit_fail_percent = 0;
};

class RadioChannel;

// One radio attached to the shared medium. Received packets land in a
// bounded RxQueue exactly as a hardware receive callback would push them.
class RadioEndpoint final : public ILinkTransport {
public:
  RadioEndpoint(RadioChannel& channel, std::string name, SignalQuality signal,
                std::size_t rx_capacity);

  bool Send(const std::vector<std::uint8_t>& bytes, std::string& error) override;
  std::optional<ReceivedPacket> PollReceived() override;
  bool WaitForActivity(std::chrono::milliseconds timeout) override;

  const std::string& Name() const {
    return name_;
  }

  // A powered-down or out-of-range radio neither hears nor transmits.
  void SetInRange(bool in_range) {
    in_range_ = in_range;
  }
  bool InRange() const {
    return in_range_;
  }

  // Signal metadata stamped on packets this endpoint receives.
  void SetSignal(SignalQuality signal) {
    signal_ = signal;
  }

  std::uint64_t SentCount() const {
    return sent_count_;
  }
  std::uint64_t ReceivedCount() const {
    return received_count_;
  }
  const RxQueue& Queue() const {
    return rx_queue_;
  }

private:
  friend class RadioChannel;

  void Deliver(std::vector<std::uint8_t> bytes);

  RadioChannel& channel_;
  std::string name_;
  SignalQuality signal_;
  RxQueue rx_queue_;
  bool in_range_ = true;
  std::uint64_t sent_count_ = 0;
  std::uint64_t received_count_ = 0;
};

// Shared half-duplex medium: a transmission reaches every other in-range
// endpoint, subject to the configured faults.
class RadioChannel {
public:
  explicit RadioChannel(ChannelFaults faults = {});

  RadioEndpoint& AddEndpoint(std::string name, SignalQuality signal = {},
                             std::size_t rx_capacity = 16);

  void SetFaults(const ChannelFaults& faults) {
    faults_ = faults;
  }
  const ChannelFaults& Faults() const {
    return faults_;
  }

  std::uint64_t TransmissionCount() const {
    return transmission_index_;
  }
  std::uint64_t DroppedCount() const {
    return dropped_count_;
  }
  std::uint64_t DuplicatedCount() const {
    return duplicated_count_;
  }
  std::uint64_t CorruptedCount() const {
    return corrupted_count_;
  }

private:
  friend class RadioEndpoint;

  bool Transmit(const RadioEndpoint& sender, const std::vector<std::uint8_t>& bytes,
                std::string& error);

  ChannelFaults faults_;
  std::vector<std::unique_ptr<RadioEndpoint>> endpoints_;
  std::uint64_t transmission_index_ = 0;
  std::uint64_t dropped_count_ = 0;
  std::uint64_t duplicated_count_ = 0;
  std::uint64_t corrupted_count_ = 0;
};

} // namespace camlink::link::sim
