// Copyright 2025 The Boundcache Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BOUNDCACHE_BOUNDED_CACHE_OPTIONS_H_
#define BOUNDCACHE_BOUNDED_CACHE_OPTIONS_H_

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <limits>

#include "boundcache/removal_cause.h"
#include "boundcache/util/executor.h"

namespace boundcache {

/// Largest supported maximum weight.  Leaves headroom for one entry of the
/// largest weight above it, so the running weighted size does not overflow
/// before eviction brings it back down.
constexpr int64_t kMaximumCapacity =
    std::numeric_limits<int64_t>::max() - std::numeric_limits<int32_t>::max();

/// Largest weight a weigher may return.
constexpr uint32_t kMaximumEntryWeight = std::numeric_limits<int32_t>::max();

/// Configuration of a `BoundedCache`.
template <typename K, typename V>
struct BoundedCacheOptions {
  /// Returns the weight of an entry.  Called once per insertion.  If empty,
  /// every entry weighs 1.
  using Weigher = std::function<uint32_t(const K& key, const V& value)>;

  /// Called exactly once per entry that leaves the cache, never while the
  /// eviction lock is held.
  using RemovalListener =
      std::function<void(const K& key, const V& value, RemovalCause cause)>;

  /// Maximum total weight.  Values above `kMaximumCapacity` are clamped;
  /// negative values are rejected.
  int64_t maximum_weight = kMaximumCapacity;

  Weigher weigher;

  RemovalListener removal_listener;

  /// Runs drains deferred from threads that found the eviction lock
  /// contended.  With the default `InlineExecutor` nothing is deferred.
  ///
  /// The executor must eventually run every task it accepts: destroying the
  /// cache blocks until all deferred drains have run.  An executor that may
  /// discard tasks, such as one that has been shut down, must not be used.
  Executor executor = InlineExecutor{};

  /// Number of read buffer stripes, rounded up to a power of two and clamped
  /// to `internal_cache::kMaxReadBufferStripes`.  Zero selects a value based
  /// on the hardware concurrency.
  size_t read_buffer_stripes = 0;
};

}  // namespace boundcache

#endif  // BOUNDCACHE_BOUNDED_CACHE_OPTIONS_H_
