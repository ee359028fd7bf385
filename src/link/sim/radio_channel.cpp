#include "link/sim/radio_channel.hpp"

#include "core/deterministic_random.hpp"

#include <utility>

namespace camlink::link::sim {

namespace {

constexpr std::uint64_t kDropSalt = 0xa0761d6478bd642fULL;
constexpr std::uint64_t kDuplicateSalt = 0xe7037ed1a0b428dbULL;
constexpr std::uint64_t kCorruptSalt = 0x8ebc6af09c88c6e3ULL;
constexpr std::uint64_t kCorruptPositionSalt = 0x589965cc75374cc3ULL;
constexpr std::uint64_t kTransmitFailSalt = 0x1d8e4e27c47d124fULL;

} // namespace

RadioEndpoint::RadioEndpoint(RadioChannel& channel, std::string name, SignalQuality signal,
                             std::size_t rx_capacity)
    : channel_(channel), name_(std::move(name)), signal_(signal), rx_queue_(rx_capacity) {}

bool RadioEndpoint::Send(const std::vector<std::uint8_t>& bytes, std::string& error) {
  if (!in_range_) {
    error = "radio '" + name_ + "' is powered down";
    return false;
  }
  if (bytes.empty()) {
    error = "refusing to transmit an empty packet";
    return false;
  }
  ++sent_count_;
  return channel_.Transmit(*this, bytes, error);
}

std::optional<ReceivedPacket> RadioEndpoint::PollReceived() {
  return rx_queue_.Pop();
}

bool RadioEndpoint::WaitForActivity(const std::chrono::milliseconds timeout) {
  return rx_queue_.WaitForData(timeout);
}

void RadioEndpoint::Deliver(std::vector<std::uint8_t> bytes) {
  if (!in_range_) {
    return;
  }
  if (rx_queue_.Push({.bytes = std::move(bytes), .signal = signal_})) {
    ++received_count_;
  }
}

RadioChannel::RadioChannel(ChannelFaults faults) : faults_(faults) {}

RadioEndpoint& RadioChannel::AddEndpoint(std::string name, SignalQuality signal,
                                         std::size_t rx_capacity) {
  endpoints_.push_back(
      std::make_unique<RadioEndpoint>(*this, std::move(name), signal, rx_capacity));
  return *endpoints_.back();
}

bool RadioChannel::Transmit(const RadioEndpoint& sender, const std::vector<std::uint8_t>& bytes,
                            std::string& error) {
  const std::uint64_t tx_index = transmission_index_++;
  const std::uint64_t seed = faults_.seed;

  if (core::DeterministicPercentHit(seed, kTransmitFailSalt, tx_index,
                                    faults_.transmit_fail_percent)) {
    error = "simulated transmit failure on '" + sender.Name() + "'";
    return false;
  }

  for (std::size_t i = 0; i < endpoints_.size(); ++i) {
    RadioEndpoint& receiver = *endpoints_[i];
    if (&receiver == &sender || !receiver.InRange()) {
      continue;
    }

    // Each (transmission, receiver) pair draws its own fate.
    const std::uint64_t draw = tx_index * 64U + i;
    if (core::DeterministicPercentHit(seed, kDropSalt, draw, faults_.drop_percent)) {
      ++dropped_count_;
      continue;
    }

    std::vector<std::uint8_t> delivered = bytes;
    if (core::DeterministicPercentHit(seed, kCorruptSalt, draw, faults_.corrupt_percent)) {
      const auto position = static_cast<std::size_t>(
          core::DeterministicBelow(seed, kCorruptPositionSalt, draw, delivered.size()));
      delivered[position] = static_cast<std::uint8_t>(delivered[position] ^ 0x5A);
      ++corrupted_count_;
    }

    const bool duplicate =
        core::DeterministicPercentHit(seed, kDuplicateSalt, draw, faults_.duplicate_percent);
    if (duplicate) {
      ++duplicated_count_;
      receiver.Deliver(delivered);
    }
    receiver.Deliver(std::move(delivered));
  }

  error.clear();
  return true;
}

} // namespace camlink::link::sim
