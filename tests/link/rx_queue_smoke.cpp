#include "../common/assertions.hpp"
#include "link/rx_queue.hpp"

#include <chrono>
#include <thread>

int main() {
  using camlink::link::ReceivedPacket;
  using camlink::link::RxQueue;
  using camlink::tests::common::Fail;
  using namespace std::chrono_literals;

  {
    RxQueue queue(2);
    if (!queue.Push(ReceivedPacket{.bytes = {1}, .signal = {}}) ||
        !queue.Push(ReceivedPacket{.bytes = {2}, .signal = {}})) {
      Fail("pushes within capacity must succeed");
    }
    if (queue.Push(ReceivedPacket{.bytes = {3}, .signal = {}})) {
      Fail("push beyond capacity must be refused");
    }
    if (queue.OverflowCount() != 1U || queue.Size() != 2U) {
      Fail("overflow must be counted without growing the queue");
    }

    const auto first = queue.Pop();
    if (!first.has_value() || first->bytes.front() != 1U) {
      Fail("queue must be FIFO");
    }
    static_cast<void>(queue.Pop());
    if (queue.Pop().has_value()) {
      Fail("drained queue must be empty");
    }
    if (queue.WaitForData(1ms)) {
      Fail("wait on an empty queue must time out");
    }
  }

  {
    RxQueue queue(4);
    std::thread producer([&queue]() {
      std::this_thread::sleep_for(20ms);
      static_cast<void>(queue.Push(ReceivedPacket{.bytes = {9}, .signal = {.rssi_dbm = -80,
                                                                           .snr_db = 5.0F}}));
    });
    const bool woke = queue.WaitForData(2s);
    producer.join();
    if (!woke) {
      Fail("wait must return once the receive side pushes");
    }
    const auto packet = queue.Pop();
    if (!packet.has_value() || packet->signal.rssi_dbm != -80) {
      Fail("signal metadata must travel with the packet");
    }
  }

  return 0;
}
