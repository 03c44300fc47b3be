#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/cache/cache.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/shutdown_signal.hpp"

using cacheq::observability::IntField;
using cacheq::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: cacheq-worker <config.yaml> OR cacheq-worker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = cacheq::config::ConfigLoader::LoadFromYaml(config_path);

    cacheq::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build and connect the backend
    // ------------------------------------------------------------
    auto signal = std::make_shared<cacheq::runtime::ShutdownSignal>();
    auto cache  = cacheq::factory::BuildCache(config, signal);
    cache->Connect();

    for (const auto& stream : config.worker().streams()) {
      cache->Register(stream, [](const cacheq::model::Message& message) {
        CACHEQ_LOG_INFO("message received", {StringField("stream", message.stream), StringField("id", message.id),
                                             IntField("values", static_cast<int64_t>(message.values.size()))});
      });
    }

    // Register signal handlers before running to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::exception_ptr run_error;
    std::thread        runner([&cache, &signal, &run_error] {
      try {
        cache->Run();
      } catch (const std::exception&) {
        run_error = std::current_exception();
        signal->Trigger();
      }
    });
    CACHEQ_LOG_INFO("cacheq worker started", {StringField("backend", cache->String()), IntField("streams", config.worker().streams_size())});

    while (g_running && !signal->Triggered()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    CACHEQ_LOG_INFO("Shutting down cacheq worker");

    cache->Shutdown();
    runner.join();
    if (run_error) std::rethrow_exception(run_error);

    // backends log while stopping
    cache.reset();
    cacheq::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CACHEQ_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    cacheq::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
