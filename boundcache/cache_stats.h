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

#ifndef BOUNDCACHE_CACHE_STATS_H_
#define BOUNDCACHE_CACHE_STATS_H_

#include <stdint.h>

#include <atomic>
#include <iosfwd>

namespace boundcache {

/// Immutable snapshot of a cache's statistics.
class CacheStats {
 public:
  CacheStats() = default;
  CacheStats(int64_t hit_count, int64_t miss_count, int64_t eviction_count,
             int64_t eviction_weight)
      : hit_count_(hit_count),
        miss_count_(miss_count),
        eviction_count_(eviction_count),
        eviction_weight_(eviction_weight) {}

  /// Lookups that found a live entry.
  int64_t hit_count() const { return hit_count_; }
  /// Lookups that found no live entry.
  int64_t miss_count() const { return miss_count_; }
  /// Entries removed because the weighted size exceeded the maximum.
  int64_t eviction_count() const { return eviction_count_; }
  /// Sum of the weights of the evicted entries.
  int64_t eviction_weight() const { return eviction_weight_; }

  int64_t request_count() const { return hit_count_ + miss_count_; }

  /// Returns `hit_count / request_count`, or 1.0 if there were no requests.
  double hit_rate() const;

  friend bool operator==(const CacheStats& a, const CacheStats& b) {
    return a.hit_count_ == b.hit_count_ && a.miss_count_ == b.miss_count_ &&
           a.eviction_count_ == b.eviction_count_ &&
           a.eviction_weight_ == b.eviction_weight_;
  }
  friend bool operator!=(const CacheStats& a, const CacheStats& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const CacheStats& stats);

 private:
  int64_t hit_count_ = 0;
  int64_t miss_count_ = 0;
  int64_t eviction_count_ = 0;
  int64_t eviction_weight_ = 0;
};

namespace internal_cache {

/// Concurrently updated counters backing `CacheStats`.
class StatsCounter {
 public:
  void RecordHit() { hits_.fetch_add(1, std::memory_order_relaxed); }
  void RecordMiss() { misses_.fetch_add(1, std::memory_order_relaxed); }
  void RecordEviction(uint32_t weight) {
    evictions_.fetch_add(1, std::memory_order_relaxed);
    eviction_weight_.fetch_add(weight, std::memory_order_relaxed);
  }

  CacheStats Snapshot() const;

 private:
  std::atomic<int64_t> hits_{0};
  std::atomic<int64_t> misses_{0};
  std::atomic<int64_t> evictions_{0};
  std::atomic<int64_t> eviction_weight_{0};
};

}  // namespace internal_cache
}  // namespace boundcache

#endif  // BOUNDCACHE_CACHE_STATS_H_
