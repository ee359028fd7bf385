#pragma once

#include "core/errors/link_error.hpp"
#include "core/time_utils.hpp"
#include "link/camera_status.hpp"
#include "link/frame.hpp"
#include "link/link_transport.hpp"
#include "link/packet_codec.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace camlink::core::logging {
class Logger;
}

namespace camlink::link {

enum class BackoffMode {
  kHold,
  kExponential,
};

// Retry budget for one reliable exchange. `max_retries` counts
// retransmissions, so an exchange is transmitted at most max_retries + 1
// times. `timeout` is a hard ceiling measured from the first transmission.
struct RetryPolicy {
  std::uint32_t max_retries = 3;
  std::chrono::milliseconds retry_interval{800};
  BackoffMode backoff = BackoffMode::kExponential;
  std::chrono::milliseconds max_retry_interval{6'400};
  std::chrono::milliseconds timeout{15'000};
  // Extra random delay of up to this percentage of each interval, so two
  // Remotes that collided once do not collide again on every retry.
  std::uint32_t jitter_percent = 0;
};

enum class DeliveryOutcome {
  kAcked,
  kTimedOut,
};

std::string_view ToString(DeliveryOutcome outcome);
std::string_view ToString(BackoffMode mode);

struct DeliveryResolution {
  DeviceId destination = 0;
  std::uint16_t sequence = 0;
  CommandKind command = CommandKind::kTriggerStart;
  DeliveryOutcome outcome = DeliveryOutcome::kTimedOut;
  // Meaningful only for kAcked.
  AckResult ack_result = AckResult::kOk;
  std::uint32_t transmissions = 0;
  std::chrono::milliseconds elapsed{0};
};

// At-least-once delivery on top of a best-effort transport.
//
// Reliable exchanges are keyed by (destination, sequence). The engine never
// blocks and never fails an exchange by raising: retries happen from Tick()
// and every exchange ends in exactly one DeliveryResolution, either from
// OnAck() or from Tick(). Deciding what a timeout means is the session's
// job.
class RetransmissionEngine {
public:
  struct Counters {
    std::uint64_t transmissions = 0;
    std::uint64_t retransmissions = 0;
    std::uint64_t transmit_failures = 0;
    std::uint64_t acked = 0;
    std::uint64_t timed_out = 0;
    std::uint64_t stray_acks = 0;
  };

  RetransmissionEngine(ILinkTransport& transport, const PacketCodec& codec,
                       core::logging::Logger& logger, std::uint64_t jitter_seed = 1);

  // First sequence number handed out for every destination.
  void SetInitialSequence(std::uint16_t sequence) {
    initial_sequence_ = sequence;
  }

  // Allocates the next sequence number for frames to `destination`.
  // Monotonic per destination, wrapping at 16 bits.
  std::uint16_t NextSequence(DeviceId destination);

  // Transmits `frame` now and tracks it until acknowledged or timed out.
  // Fails (without transmitting) for non-reliable kinds, broadcast
  // destinations, an already tracked (destination, sequence), or an encode
  // error. A transmit failure is not an error here: it counts as an
  // attempt and the retry timer still runs.
  bool SendReliable(const Frame& frame, const RetryPolicy& policy, core::TimePoint now,
                    core::errors::LinkError& error);

  // Single transmission with no tracking (Heartbeat, StatusReply, Ack).
  bool SendUnreliable(const Frame& frame, core::errors::LinkError& error);

  // Resolves the exchange an inbound Ack refers to. Returns nullopt for
  // duplicate, late or mismatched Acks, which are counted and ignored.
  std::optional<DeliveryResolution> OnAck(const Frame& ack, core::TimePoint now);

  // Retransmits due exchanges and returns the ones that ran out of budget.
  std::vector<DeliveryResolution> Tick(core::TimePoint now);

  // Abandons an exchange without resolving it (session reset).
  bool Cancel(DeviceId destination, std::uint16_t sequence);

  std::optional<core::TimePoint> NextDeadline() const;
  std::size_t PendingCount() const {
    return exchanges_.size();
  }
  bool IsPending(DeviceId destination, std::uint16_t sequence) const;

  const Counters& GetCounters() const {
    return counters_;
  }

private:
  struct Exchange {
    Frame frame;
    std::vector<std::uint8_t> encoded;
    RetryPolicy policy;
    core::TimePoint first_sent{};
    core::TimePoint next_deadline{};
    std::chrono::milliseconds current_interval{0};
    std::uint32_t transmissions = 0;
  };

  using ExchangeKey = std::pair<DeviceId, std::uint16_t>;

  void Transmit(Exchange& exchange);
  std::chrono::milliseconds Jittered(std::chrono::milliseconds interval,
                                     std::uint32_t jitter_percent);
  static std::chrono::milliseconds NextInterval(const Exchange& exchange);
  DeliveryResolution Resolve(const Exchange& exchange, DeliveryOutcome outcome,
                             AckResult ack_result, core::TimePoint now) const;

  ILinkTransport& transport_;
  const PacketCodec& codec_;
  core::logging::Logger& logger_;
  std::uint64_t jitter_seed_;
  std::uint64_t jitter_draws_ = 0;
  std::uint16_t initial_sequence_ = 0;
  std::map<DeviceId, std::uint16_t> next_sequence_;
  std::map<ExchangeKey, Exchange> exchanges_;
  Counters counters_;
};

} // namespace camlink::link
