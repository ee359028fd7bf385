#include "link/retransmission_engine.hpp"

#include "core/deterministic_random.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <string>

namespace camlink::link {

namespace {

using core::errors::LinkError;
using core::errors::LinkErrorCode;

constexpr std::uint64_t kJitterSalt = 0x2d358dccaa6c78a5ULL;

std::string ToText(const std::chrono::milliseconds value) {
  return std::to_string(value.count());
}

} // namespace

std::string_view ToString(const DeliveryOutcome outcome) {
  return outcome == DeliveryOutcome::kAcked ? "acked" : "timed_out";
}

std::string_view ToString(const BackoffMode mode) {
  return mode == BackoffMode::kHold ? "hold" : "exponential";
}

RetransmissionEngine::RetransmissionEngine(ILinkTransport& transport, const PacketCodec& codec,
                                           core::logging::Logger& logger,
                                           const std::uint64_t jitter_seed)
    : transport_(transport), codec_(codec), logger_(logger), jitter_seed_(jitter_seed) {}

std::uint16_t RetransmissionEngine::NextSequence(const DeviceId destination) {
  auto it = next_sequence_.find(destination);
  if (it == next_sequence_.end()) {
    it = next_sequence_.emplace(destination, initial_sequence_).first;
  }
  const std::uint16_t sequence = it->second;
  it->second = static_cast<std::uint16_t>(sequence + 1U);
  return sequence;
}

bool RetransmissionEngine::SendReliable(const Frame& frame, const RetryPolicy& policy,
                                        const core::TimePoint now, LinkError& error) {
  if (!RequiresAck(frame.command)) {
    error.Set(LinkErrorCode::kInvalidCommand,
              std::string(ToString(frame.command)) + " is fire-and-forget");
    return false;
  }
  if (frame.destination == kBroadcastId) {
    error.Set(LinkErrorCode::kInvalidCommand, "broadcast frames cannot be acknowledged");
    return false;
  }

  const ExchangeKey key{frame.destination, frame.sequence};
  if (exchanges_.count(key) != 0U) {
    error.Set(LinkErrorCode::kCommandInFlight,
              "sequence " + std::to_string(frame.sequence) + " already in flight to device " +
                  std::to_string(frame.destination));
    return false;
  }

  Exchange exchange;
  if (!codec_.Encode(frame, exchange.encoded, error)) {
    return false;
  }
  exchange.frame = frame;
  exchange.policy = policy;
  exchange.first_sent = now;
  exchange.current_interval = std::max(policy.retry_interval, std::chrono::milliseconds(1));

  Transmit(exchange);
  exchange.next_deadline = now + Jittered(exchange.current_interval, policy.jitter_percent);

  logger_.Debug("reliable exchange started",
                {{"device", std::to_string(frame.destination)},
                 {"command", ToString(frame.command)},
                 {"sequence", std::to_string(frame.sequence)},
                 {"max_retries", std::to_string(policy.max_retries)},
                 {"retry_interval_ms", ToText(policy.retry_interval)},
                 {"backoff", ToString(policy.backoff)}});

  exchanges_.emplace(key, std::move(exchange));
  error.Clear();
  return true;
}

bool RetransmissionEngine::SendUnreliable(const Frame& frame, LinkError& error) {
  std::vector<std::uint8_t> encoded;
  if (!codec_.Encode(frame, encoded, error)) {
    return false;
  }

  ++counters_.transmissions;
  std::string transmit_error;
  if (!transport_.Send(encoded, transmit_error)) {
    ++counters_.transmit_failures;
    error.Set(LinkErrorCode::kTransmitError, transmit_error);
    return false;
  }
  error.Clear();
  return true;
}

std::optional<DeliveryResolution> RetransmissionEngine::OnAck(const Frame& ack,
                                                              const core::TimePoint now) {
  if (ack.command != CommandKind::kAck) {
    return std::nullopt;
  }

  LinkError payload_error;
  AckPayload payload;
  if (!DecodeAckPayload(ack.payload, payload, payload_error)) {
    logger_.Warn("ack payload rejected",
                 {{"device", std::to_string(ack.source)},
                  {"sequence", std::to_string(ack.sequence)},
                  {"reason", core::errors::FormatLinkError(payload_error)}});
    ++counters_.stray_acks;
    return std::nullopt;
  }

  const auto it = exchanges_.find(ExchangeKey{ack.source, ack.sequence});
  if (it == exchanges_.end() || it->second.frame.command != payload.acked_command) {
    ++counters_.stray_acks;
    logger_.Debug("ignoring ack with no matching exchange",
                  {{"device", std::to_string(ack.source)},
                   {"sequence", std::to_string(ack.sequence)},
                   {"acked_command", ToString(payload.acked_command)}});
    return std::nullopt;
  }

  const DeliveryResolution resolution =
      Resolve(it->second, DeliveryOutcome::kAcked, payload.result, now);
  exchanges_.erase(it);
  ++counters_.acked;
  return resolution;
}

std::vector<DeliveryResolution> RetransmissionEngine::Tick(const core::TimePoint now) {
  std::vector<DeliveryResolution> expired;

  for (auto it = exchanges_.begin(); it != exchanges_.end();) {
    Exchange& exchange = it->second;
    const bool past_hard_timeout = now - exchange.first_sent >= exchange.policy.timeout;
    const bool interval_elapsed = now >= exchange.next_deadline;
    const std::uint32_t retransmissions_done = exchange.transmissions - 1U;

    if (!past_hard_timeout && !interval_elapsed) {
      ++it;
      continue;
    }

    if (!past_hard_timeout && retransmissions_done < exchange.policy.max_retries) {
      exchange.current_interval = NextInterval(exchange);
      Transmit(exchange);
      ++counters_.retransmissions;
      exchange.next_deadline =
          now + Jittered(exchange.current_interval, exchange.policy.jitter_percent);
      logger_.Debug("retransmitted reliable frame",
                    {{"device", std::to_string(exchange.frame.destination)},
                     {"command", ToString(exchange.frame.command)},
                     {"sequence", std::to_string(exchange.frame.sequence)},
                     {"attempt", std::to_string(exchange.transmissions)},
                     {"next_interval_ms", ToText(exchange.current_interval)}});
      ++it;
      continue;
    }

    DeliveryResolution resolution = Resolve(exchange, DeliveryOutcome::kTimedOut, AckResult::kOk, now);
    logger_.Warn("reliable exchange timed out",
                 {{"device", std::to_string(resolution.destination)},
                  {"command", ToString(resolution.command)},
                  {"sequence", std::to_string(resolution.sequence)},
                  {"transmissions", std::to_string(resolution.transmissions)},
                  {"elapsed_ms", ToText(resolution.elapsed)},
                  {"error_code", core::errors::ToStableErrorCode(
                                     core::errors::LinkErrorCode::kTimedOut)}});
    expired.push_back(resolution);
    ++counters_.timed_out;
    it = exchanges_.erase(it);
  }

  return expired;
}

bool RetransmissionEngine::Cancel(const DeviceId destination, const std::uint16_t sequence) {
  return exchanges_.erase(ExchangeKey{destination, sequence}) != 0U;
}

std::optional<core::TimePoint> RetransmissionEngine::NextDeadline() const {
  std::optional<core::TimePoint> earliest;
  for (const auto& [key, exchange] : exchanges_) {
    const core::TimePoint hard_deadline = exchange.first_sent + exchange.policy.timeout;
    const core::TimePoint due = std::min(exchange.next_deadline, hard_deadline);
    if (!earliest.has_value() || due < earliest.value()) {
      earliest = due;
    }
  }
  return earliest;
}

bool RetransmissionEngine::IsPending(const DeviceId destination,
                                     const std::uint16_t sequence) const {
  return exchanges_.count(ExchangeKey{destination, sequence}) != 0U;
}

void RetransmissionEngine::Transmit(Exchange& exchange) {
  ++exchange.transmissions;
  ++counters_.transmissions;

  std::string transmit_error;
  if (!transport_.Send(exchange.encoded, transmit_error)) {
    ++counters_.transmit_failures;
    logger_.Warn("radio transmit failed",
                 {{"device", std::to_string(exchange.frame.destination)},
                  {"command", ToString(exchange.frame.command)},
                  {"sequence", std::to_string(exchange.frame.sequence)},
                  {"attempt", std::to_string(exchange.transmissions)},
                  {"error_code", core::errors::ToStableErrorCode(LinkErrorCode::kTransmitError)},
                  {"error", transmit_error}});
  }
}

std::chrono::milliseconds RetransmissionEngine::Jittered(const std::chrono::milliseconds interval,
                                                         const std::uint32_t jitter_percent) {
  if (jitter_percent == 0U) {
    return interval;
  }
  const auto span = static_cast<std::uint64_t>(interval.count()) * jitter_percent / 100U;
  const std::uint64_t extra =
      core::DeterministicBelow(jitter_seed_, kJitterSalt, jitter_draws_++, span + 1U);
  return interval + std::chrono::milliseconds(static_cast<std::int64_t>(extra));
}

std::chrono::milliseconds RetransmissionEngine::NextInterval(const Exchange& exchange) {
  if (exchange.policy.backoff == BackoffMode::kHold) {
    return exchange.current_interval;
  }
  const auto ceiling = std::max(exchange.policy.max_retry_interval, exchange.policy.retry_interval);
  return std::min(exchange.current_interval * 2, ceiling);
}

DeliveryResolution RetransmissionEngine::Resolve(const Exchange& exchange,
                                                 const DeliveryOutcome outcome,
                                                 const AckResult ack_result,
                                                 const core::TimePoint now) const {
  DeliveryResolution resolution;
  resolution.destination = exchange.frame.destination;
  resolution.sequence = exchange.frame.sequence;
  resolution.command = exchange.frame.command;
  resolution.outcome = outcome;
  resolution.ack_result = ack_result;
  resolution.transmissions = exchange.transmissions;
  resolution.elapsed = core::ElapsedSince(exchange.first_sent, now);
  return resolution;
}

} // namespace camlink::link
