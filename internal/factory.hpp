#pragma once

#include "config/config.pb.h"
#include "internal/cache/cache.hpp"
#include "internal/runtime/shutdown_signal.hpp"

namespace cacheq::factory {

/*
  BuildCache

  Constructs the configured backend (memory when no backend section is
  present) and applies the key prefix. The cache is not connected yet.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete backend types.
*/
cache::CachePtr BuildCache(const cacheq::runtime::config::RuntimeConfig& config, runtime::ShutdownSignalPtr signal = nullptr);

} // namespace cacheq::factory
