#pragma once

#include "core/time_utils.hpp"
#include "link/camera_status.hpp"
#include "link/frame.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>

namespace camlink::link {

// Receiver-side memory of reliable commands already executed.
//
// A repeated (source, sequence) must be answered with the same Ack and must
// not run its side effect again. Entries are bounded per source and expire
// after `ttl`, so a peer that rebooted and restarted its sequence numbers is
// only shadowed for a short while.
class DedupWindow {
public:
  struct Entry {
    std::uint16_t sequence = 0;
    CommandKind command = CommandKind::kTriggerStart;
    AckResult result = AckResult::kOk;
    core::TimePoint recorded_at{};
  };

  DedupWindow(std::size_t capacity_per_source, std::chrono::milliseconds ttl);

  // Returns the remembered entry for (source, sequence, command), dropping
  // expired entries first.
  std::optional<Entry> Lookup(DeviceId source, std::uint16_t sequence, CommandKind command,
                              core::TimePoint now);

  void Remember(DeviceId source, std::uint16_t sequence, CommandKind command, AckResult result,
                core::TimePoint now);

  std::size_t Size() const;

private:
  void Expire(std::deque<Entry>& entries, core::TimePoint now) const;

  std::size_t capacity_per_source_;
  std::chrono::milliseconds ttl_;
  std::map<DeviceId, std::deque<Entry>> entries_;
};

} // namespace camlink::link
