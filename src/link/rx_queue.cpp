#include "link/rx_queue.hpp"

#include <algorithm>
#include <utility>

namespace camlink::link {

RxQueue::RxQueue(const std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1U)) {}

bool RxQueue::Push(ReceivedPacket packet) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (packets_.size() >= capacity_) {
      ++overflow_count_;
      return false;
    }
    packets_.push_back(std::move(packet));
  }
  data_ready_.notify_one();
  return true;
}

std::optional<ReceivedPacket> RxQueue::Pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (packets_.empty()) {
    return std::nullopt;
  }
  ReceivedPacket packet = std::move(packets_.front());
  packets_.pop_front();
  return packet;
}

bool RxQueue::WaitForData(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return data_ready_.wait_for(lock, timeout, [this] { return !packets_.empty(); });
}

std::size_t RxQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return packets_.size();
}

std::uint64_t RxQueue::OverflowCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return overflow_count_;
}

} // namespace camlink::link
