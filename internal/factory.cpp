#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/memory/memory_cache.hpp"
#include "internal/cache/redis/redis_cache.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cacheq::factory {

namespace {

cache::memory::MemoryCacheOptions MemoryOptions(const cacheq::runtime::config::MemoryCacheConfig& config) {
  cache::memory::MemoryCacheOptions options;
  options.pool_num         = config.pool_num();
  options.max_redeliveries = config.max_redeliveries();
  return options;
}

cache::redis::RedisCacheOptions RedisOptions(const cacheq::runtime::config::RedisCacheConfig& config) {
  cache::redis::RedisCacheOptions options;

  try {
    options.connection = cache::redis::ParseAddress(config.address());
  } catch (const std::invalid_argument& e) {
    throw util::InvalidState(std::string("redis address: ") + e.what());
  }
  options.connection.password        = config.password();
  options.connection.db              = config.db();
  options.connection.connect_timeout = util::FromProtoOr(config.connect_timeout(), options.connection.connect_timeout);
  options.connection.read_timeout    = util::FromProtoOr(config.read_timeout(), options.connection.read_timeout);

  if (config.pool_size() > 0) {
    options.pool_size = config.pool_size();
  }

  // ------------------------------------------------------------------
  // Consumer
  // ------------------------------------------------------------------
  const auto& consumer            = config.consumer();
  options.consumer.name           = consumer.name();
  options.consumer.block_timeout  = util::FromProtoOr(consumer.block_timeout(), options.consumer.block_timeout);
  options.consumer.visibility_timeout = util::FromProtoOr(consumer.visibility_timeout(), options.consumer.visibility_timeout);
  options.consumer.reclaim_interval   = util::FromProtoOr(consumer.reclaim_interval(), options.consumer.reclaim_interval);
  if (consumer.buffer_size() > 0) {
    options.consumer.buffer_size = consumer.buffer_size();
  }
  if (consumer.concurrency() > 0) {
    options.consumer.concurrency = consumer.concurrency();
  }

  // blocking reads would otherwise hit the socket timeout first
  if (options.connection.read_timeout.count() > 0 && options.connection.read_timeout <= options.consumer.block_timeout) {
    options.connection.read_timeout = options.consumer.block_timeout + std::chrono::seconds(5);
  }

  // ------------------------------------------------------------------
  // Producer
  // ------------------------------------------------------------------
  options.producer.stream_max_length      = config.producer().stream_max_length();
  options.producer.approximate_max_length = config.producer().approximate_max_length();

  return options;
}

} // namespace

cache::CachePtr BuildCache(const cacheq::runtime::config::RuntimeConfig& config, runtime::ShutdownSignalPtr signal) {
  const auto& cache_config = config.cache();

  cache::CachePtr cache;
  if (cache_config.has_redis()) {
    cache = std::make_shared<cache::redis::RedisCache>(RedisOptions(cache_config.redis()), std::move(signal));
  } else {
    cache = std::make_shared<cache::memory::MemoryCache>(MemoryOptions(cache_config.memory()), std::move(signal));
  }

  if (!cache_config.prefix().empty()) {
    cache->SetPrefix(cache_config.prefix());
  }
  return cache;
}

} // namespace cacheq::factory
