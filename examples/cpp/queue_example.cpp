#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "cacheq/v1.hpp"

namespace {

cacheq::v1::CachePtr MakeCache(int argc, char** argv) {
  // Optional "host:port" argument switches to the networked backend.
  if (argc > 1) {
    cacheq::v1::RedisCacheOptions options;
    options.connection = cacheq::cache::redis::ParseAddress(argv[1]);
    // failed messages come back once idle this long
    options.consumer.visibility_timeout = std::chrono::seconds(1);
    return std::make_shared<cacheq::v1::RedisCache>(options);
  }
  return std::make_shared<cacheq::v1::MemoryCache>();
}

} // namespace

int main(int argc, char** argv) {
  try {
    auto cache = MakeCache(argc, argv);
    cache->Connect();
    cache->SetPrefix("example:");

    // ------------------------------------------------------------
    // Key-value
    // ------------------------------------------------------------
    cache->Set("visits", int64_t{41}, 60);
    cache->Increase("visits");
    std::cout << "visits = " << cache->Get("visits") << '\n';

    cache->Set("ratio", 0.5, 60);
    std::cout << "ratio = " << cache->Get("ratio") << '\n';

    try {
      cache->Get("missing");
    } catch (const cacheq::v1::NotFound& e) {
      std::cout << "missing: " << e.what() << '\n';
    }

    // ------------------------------------------------------------
    // Queue
    // ------------------------------------------------------------
    std::atomic<int> received{0};
    std::atomic<bool> failed_once{false};

    cache->Register("orders", [&](const cacheq::v1::Message& message) {
      // first delivery fails to show redelivery
      if (!failed_once.exchange(true)) {
        throw std::runtime_error("transient failure");
      }
      std::cout << "order " << message.id << " tenant=" << message.GetPrefix() << '\n';
      received++;
    });

    std::thread runner([&cache] { cache->Run(); });

    cacheq::v1::Message order;
    order.stream = "orders";
    order.values["sku"] = std::string("A-100");
    order.values["qty"] = int64_t{3};
    order.SetPrefix("tenant-a");
    cache->Append(order);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (received == 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    cache->Shutdown();
    runner.join();

    std::cout << "received " << received << " message(s)\n";
    return received == 1 ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "queue example failed: " << e.what() << '\n';
    return 1;
  }
}
