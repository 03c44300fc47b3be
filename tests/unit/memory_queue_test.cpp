#include "internal/cache/memory/memory_cache.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/queue/dispatcher.hpp"
#include "internal/queue/producer.hpp"
#include "internal/queue/queue_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using cacheq::cache::memory::MemoryCache;
using cacheq::cache::memory::MemoryCacheOptions;
using cacheq::model::Message;

bool WaitUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!done()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}

Message MakeMessage(const std::string& stream, int64_t n) {
  Message message;
  message.stream      = stream;
  message.id          = "caller-id";
  message.values["n"] = n;
  return message;
}

void TestFailOnceIsDeliveredExactlyTwice() {
  MemoryCache cache;

  std::mutex               mutex;
  std::vector<std::string> ids;
  cache.Register("jobs", [&](const Message& message) {
    std::lock_guard lock(mutex);
    ids.push_back(message.id);
    if (ids.size() == 1) throw std::runtime_error("first attempt fails");
  });

  cache.Append(MakeMessage("jobs", 1));
  assert(WaitUntil([&] {
    std::lock_guard lock(mutex);
    return ids.size() >= 2;
  }));

  // no third delivery
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  cache.Shutdown();

  assert(ids.size() == 2);
  assert(ids[0] == ids[1]);
  assert(ids[0] != "caller-id");
}

void TestCompetingConsumersNeverShareAMessage() {
  MemoryCache cache;

  std::mutex                 mutex;
  std::map<std::string, int> deliveries;
  std::atomic<int>           first{0};
  std::atomic<int>           second{0};

  auto record = [&](std::atomic<int>& counter) {
    return [&](const Message& message) {
      std::lock_guard lock(mutex);
      deliveries[message.id]++;
      counter++;
    };
  };
  cache.Register("shared", record(first));
  cache.Register("shared", record(second));

  constexpr int kMessages = 200;
  for (int i = 0; i < kMessages; ++i) cache.Append(MakeMessage("shared", i));

  assert(WaitUntil([&] { return first + second == kMessages; }));
  cache.Shutdown();

  assert(deliveries.size() == static_cast<std::size_t>(kMessages));
  for (const auto& [id, count] : deliveries) assert(count == 1);
}

void TestOrderIsPreservedForSingleConsumer() {
  MemoryCacheOptions options;
  options.pool_num = 4;
  MemoryCache cache(options);

  std::mutex           mutex;
  std::vector<int64_t> seen;
  cache.Register("ordered", [&](const Message& message) {
    std::lock_guard lock(mutex);
    seen.push_back(std::get<int64_t>(message.values.at("n")));
  });

  // more than pool_num so some appends are parked
  for (int64_t i = 0; i < 50; ++i) cache.Append(MakeMessage("ordered", i));

  assert(WaitUntil([&] {
    std::lock_guard lock(mutex);
    return seen.size() == 50;
  }));
  cache.Shutdown();

  for (int64_t i = 0; i < 50; ++i) assert(seen[i] == i);
}

void TestMaxRedeliveriesDropsMessage() {
  MemoryCacheOptions options;
  options.max_redeliveries = 3;
  MemoryCache cache(options);

  std::atomic<int> attempts{0};
  std::atomic<int> other{0};
  cache.Register("poison", [&](const Message& message) {
    if (std::get<int64_t>(message.values.at("n")) == 0) {
      attempts++;
      throw std::runtime_error("always fails");
    }
    other++;
  });

  cache.Append(MakeMessage("poison", 0));
  cache.Append(MakeMessage("poison", 1));

  assert(WaitUntil([&] { return other == 1 && attempts == 4; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  cache.Shutdown();

  // first delivery plus three redeliveries
  assert(attempts == 4);
}

void TestShutdownTerminatesWithFailingHandler() {
  MemoryCache cache;

  std::atomic<int> attempts{0};
  cache.Register("stuck", [&](const Message&) {
    attempts++;
    throw std::runtime_error("never succeeds");
  });
  cache.Append(MakeMessage("stuck", 1));

  assert(WaitUntil([&] { return attempts > 10; }));
  cache.Shutdown();
}

void TestAppendAndRegisterAfterShutdownThrow() {
  MemoryCache cache;
  cache.Append(MakeMessage("before", 1));
  cache.Shutdown();

  bool threw = false;
  try {
    cache.Append(MakeMessage("before", 2));
  } catch (const cacheq::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    cache.Append(MakeMessage("after", 1));
  } catch (const cacheq::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    cache.Register("after", [](const Message&) {});
  } catch (const cacheq::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestAppendWithoutStreamThrows() {
  MemoryCache cache;

  bool threw = false;
  try {
    cache.Append(MakeMessage("", 1));
  } catch (const cacheq::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestRunReturnsAfterShutdown() {
  MemoryCache cache;

  std::atomic<bool> returned{false};
  std::thread       runner([&] {
    cache.Run();
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(!returned);

  cache.Shutdown();
  runner.join();
  assert(returned);

  // idempotent
  cache.Shutdown();
}

void TestShutdownFromHandler() {
  std::atomic<bool> run_returned{false};
  std::atomic<int>  handled{0};
  {
    MemoryCache cache;
    std::thread runner([&] {
      cache.Run();
      run_returned = true;
    });

    cache.Register("stop", [&](const Message&) {
      handled++;
      cache.Shutdown();
    });
    cache.Register("other", [](const Message&) {});
    cache.Append(MakeMessage("stop", 1));

    assert(WaitUntil([&] { return run_returned.load(); }));
    runner.join();
    assert(handled == 1);

    bool threw = false;
    try {
      cache.Append(MakeMessage("stop", 2));
    } catch (const cacheq::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
  }
  // the cache was destroyed with the handler's dispatcher still pending a join
  assert(handled == 1);
}

void TestStreamLifecycle() {
  auto registry = std::make_shared<cacheq::queue::QueueRegistry>(0);
  auto stream   = registry->GetOrCreate("lifecycle");
  assert(stream->State() == cacheq::model::StreamState::kActive);
  assert(registry->GetOrCreate("lifecycle") == stream);
  assert(registry->Find("missing") == nullptr);

  cacheq::queue::Producer producer(registry);
  const auto              id = producer.Append(MakeMessage("lifecycle", 1));
  assert(!id.empty());

  std::atomic<int>          handled{0};
  cacheq::queue::Dispatcher dispatcher(stream, [&](const Message& message) {
    assert(message.id == id);
    handled++;
  });
  dispatcher.Start();
  assert(WaitUntil([&] { return handled == 1; }));

  registry->CloseAll();
  assert(stream->State() == cacheq::model::StreamState::kDraining);
  dispatcher.Join();
  registry->MarkStopped();
  assert(stream->State() == cacheq::model::StreamState::kStopped);
  assert(std::string(cacheq::model::ToString(stream->State())) == "stopped");
  assert(!stream->Advance(cacheq::model::StreamState::kActive));
  assert(registry->Names().size() == 1);
  assert(dispatcher.Succeeded() == 1);
  assert(dispatcher.Failed() == 0 && dispatcher.Dropped() == 0);
}

} // namespace

int main() {
  TestFailOnceIsDeliveredExactlyTwice();
  TestCompetingConsumersNeverShareAMessage();
  TestOrderIsPreservedForSingleConsumer();
  TestMaxRedeliveriesDropsMessage();
  TestShutdownTerminatesWithFailingHandler();
  TestAppendAndRegisterAfterShutdownThrow();
  TestAppendWithoutStreamThrows();
  TestRunReturnsAfterShutdown();
  TestShutdownFromHandler();
  TestStreamLifecycle();

  std::cout << "cacheq_unit_memory_queue: pass\n";
  return 0;
}
