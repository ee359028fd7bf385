#include "link/dedup_window.hpp"

#include <algorithm>

namespace camlink::link {

DedupWindow::DedupWindow(const std::size_t capacity_per_source,
                         const std::chrono::milliseconds ttl)
    : capacity_per_source_(std::max<std::size_t>(capacity_per_source, 1U)), ttl_(ttl) {}

std::optional<DedupWindow::Entry> DedupWindow::Lookup(const DeviceId source,
                                                      const std::uint16_t sequence,
                                                      const CommandKind command,
                                                      const core::TimePoint now) {
  const auto it = entries_.find(source);
  if (it == entries_.end()) {
    return std::nullopt;
  }

  Expire(it->second, now);
  for (const Entry& entry : it->second) {
    if (entry.sequence == sequence && entry.command == command) {
      return entry;
    }
  }
  return std::nullopt;
}

void DedupWindow::Remember(const DeviceId source, const std::uint16_t sequence,
                           const CommandKind command, const AckResult result,
                           const core::TimePoint now) {
  std::deque<Entry>& entries = entries_[source];
  Expire(entries, now);
  entries.push_back({.sequence = sequence, .command = command, .result = result, .recorded_at = now});
  while (entries.size() > capacity_per_source_) {
    entries.pop_front();
  }
}

std::size_t DedupWindow::Size() const {
  std::size_t total = 0;
  for (const auto& [source, entries] : entries_) {
    total += entries.size();
  }
  return total;
}

void DedupWindow::Expire(std::deque<Entry>& entries, const core::TimePoint now) const {
  while (!entries.empty() && core::ElapsedSince(entries.front().recorded_at, now) > ttl_) {
    entries.pop_front();
  }
}

} // namespace camlink::link
