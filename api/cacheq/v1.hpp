#pragma once

#include "internal/cache/cache.hpp"
#include "internal/cache/memory/memory_cache.hpp"
#include "internal/cache/redis/redis_cache.hpp"
#include "internal/factory.hpp"
#include "internal/model/message.hpp"
#include "internal/model/value.hpp"
#include "internal/runtime/shutdown_signal.hpp"
#include "internal/util/errors.hpp"

namespace cacheq::v1 {
using namespace ::cacheq::cache;
using namespace ::cacheq::model;
using namespace ::cacheq::util;

using ::cacheq::cache::memory::MemoryCache;
using ::cacheq::cache::memory::MemoryCacheOptions;
using ::cacheq::cache::redis::RedisCache;
using ::cacheq::cache::redis::RedisCacheOptions;
using ::cacheq::factory::BuildCache;
using ::cacheq::runtime::ShutdownSignal;
using ::cacheq::runtime::ShutdownSignalPtr;
}
