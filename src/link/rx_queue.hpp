#pragma once

#include "link/link_transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace camlink::link {

// Bounded hand-off between the radio receive callback (interrupt or driver
// thread) and the single-threaded event loop.
//
// Push() is the only member the producer side may call. It copies the raw
// bytes in, never blocks on a full queue and never decodes; all frame
// handling happens after Pop() on the loop.
class RxQueue {
public:
  explicit RxQueue(std::size_t capacity);

  // False when the queue is full; the packet is dropped and counted.
  bool Push(ReceivedPacket packet);

  std::optional<ReceivedPacket> Pop();

  // Blocks up to `timeout` for a packet to become available.
  bool WaitForData(std::chrono::milliseconds timeout);

  std::size_t Size() const;
  std::size_t Capacity() const {
    return capacity_;
  }
  std::uint64_t OverflowCount() const;

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable data_ready_;
  std::deque<ReceivedPacket> packets_;
  std::uint64_t overflow_count_ = 0;
};

} // namespace camlink::link
