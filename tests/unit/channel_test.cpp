#include "internal/queue/channel.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace {

using cacheq::queue::Channel;

void TestFifoOrder() {
  Channel<int> channel;
  for (int i = 0; i < 5; ++i) assert(channel.Post(i));

  for (int i = 0; i < 5; ++i) {
    auto item = channel.Receive();
    assert(item && *item == i);
  }
}

void TestPostNeverBlocksWhenFull() {
  Channel<int> channel(2);
  assert(channel.Capacity() == 2);
  for (int i = 0; i < 10; ++i) assert(channel.Post(i));

  assert(channel.Size() == 10);
  assert(!channel.WaitForSpace(std::chrono::milliseconds(10)));

  // parked items follow the buffered ones in post order
  for (int i = 0; i < 10; ++i) {
    auto item = channel.Receive();
    assert(item && *item == i);
  }
  assert(channel.WaitForSpace(std::chrono::milliseconds(10)));
}

void TestCloseDrainsThenEnds() {
  Channel<int> channel(1);
  channel.Post(1);
  channel.Post(2);
  channel.Close();

  assert(channel.Closed());
  assert(!channel.Post(3));

  assert(*channel.Receive() == 1);
  assert(*channel.Receive() == 2);
  assert(!channel.Receive());
}

void TestReceiveForTimesOut() {
  Channel<int> channel;
  const auto   start = std::chrono::steady_clock::now();
  assert(!channel.ReceiveFor(std::chrono::milliseconds(20)));
  assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(20));
}

void TestCloseWakesBlockedReceivers() {
  Channel<int>             channel;
  std::atomic<int>         ended{0};
  std::vector<std::thread> receivers;
  for (int i = 0; i < 4; ++i) {
    receivers.emplace_back([&] {
      if (!channel.Receive()) ++ended;
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  channel.Close();
  for (auto& receiver : receivers) receiver.join();

  assert(ended == 4);
}

void TestCompetingReceiversSplitWork() {
  Channel<int>             channel(8);
  std::mutex               mutex;
  std::multiset<int>       seen;
  std::vector<std::thread> receivers;
  for (int i = 0; i < 3; ++i) {
    receivers.emplace_back([&] {
      while (auto item = channel.Receive()) {
        std::lock_guard lock(mutex);
        seen.insert(*item);
      }
    });
  }

  for (int i = 0; i < 300; ++i) channel.Post(i);
  while (channel.Size() > 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  channel.Close();
  for (auto& receiver : receivers) receiver.join();

  // every item exactly once
  assert(seen.size() == 300);
  for (int i = 0; i < 300; ++i) assert(seen.count(i) == 1);
}

} // namespace

int main() {
  TestFifoOrder();
  TestPostNeverBlocksWhenFull();
  TestCloseDrainsThenEnds();
  TestReceiveForTimesOut();
  TestCloseWakesBlockedReceivers();
  TestCompetingReceiversSplitWork();

  std::cout << "cacheq_unit_channel: pass\n";
  return 0;
}
