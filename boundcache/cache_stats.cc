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

#include "boundcache/cache_stats.h"

#include <atomic>
#include <ostream>

namespace boundcache {

double CacheStats::hit_rate() const {
  int64_t requests = request_count();
  return requests == 0 ? 1.0 : static_cast<double>(hit_count_) / requests;
}

std::ostream& operator<<(std::ostream& os, const CacheStats& stats) {
  return os << "{hit_count=" << stats.hit_count_
            << ", miss_count=" << stats.miss_count_
            << ", eviction_count=" << stats.eviction_count_
            << ", eviction_weight=" << stats.eviction_weight_ << "}";
}

namespace internal_cache {

CacheStats StatsCounter::Snapshot() const {
  return CacheStats(hits_.load(std::memory_order_relaxed),
                    misses_.load(std::memory_order_relaxed),
                    evictions_.load(std::memory_order_relaxed),
                    eviction_weight_.load(std::memory_order_relaxed));
}

}  // namespace internal_cache
}  // namespace boundcache
