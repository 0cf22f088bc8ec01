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

#ifndef BOUNDCACHE_BOUNDED_CACHE_H_
#define BOUNDCACHE_BOUNDED_CACHE_H_

/// \file
/// Concurrent in-process cache bounded by a maximum total weight.
///
/// Example:
///
///     boundcache::BoundedCacheOptions<std::string, std::string> options;
///     options.maximum_weight = 1 << 20;
///     options.weigher = [](const std::string& key, const std::string& value) {
///       return static_cast<uint32_t>(key.size() + value.size());
///     };
///     auto cache = boundcache::BoundedCache<std::string, std::string>::Make(
///         std::move(options)).value();
///     cache.Put("a", "alpha");
///     std::optional<std::string> value = cache.Get("a");
///
/// Lookups never block on the eviction lock.  Writes update the map
/// immediately; the eviction order and the weighted size catch up at the next
/// drain, which the writing thread normally performs before returning.

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "boundcache/bounded_cache_options.h"
#include "boundcache/cache_stats.h"
#include "boundcache/internal/cache/bounded_cache_impl.h"
#include "boundcache/internal/cache/eviction_policy.h"
#include "boundcache/removal_cause.h"
#include "boundcache/util/stop_token.h"

namespace boundcache {

using LruPolicy = internal_cache::LruPolicy;
using FifoPolicy = internal_cache::FifoPolicy;

/// Bounded concurrent key-value cache.
///
/// \tparam K Key type; hashable with `absl::Hash` and equality comparable.
/// \tparam V Value type; copied out on lookup.
/// \tparam Policy Eviction ordering, `LruPolicy` or `FifoPolicy`.
template <typename K, typename V, typename Policy = LruPolicy>
class BoundedCache {
 public:
  using Options = BoundedCacheOptions<K, V>;
  using Entry = std::pair<K, V>;

  /// Creates a cache.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if
  ///     `options.maximum_weight` is negative.
  static absl::StatusOr<BoundedCache> Make(Options options = {}) {
    if (options.maximum_weight < 0) {
      return absl::InvalidArgumentError(
          absl::StrCat("Maximum weight must be non-negative, but got ",
                       options.maximum_weight));
    }
    return BoundedCache(std::make_unique<Impl>(std::move(options)));
  }

  BoundedCache(BoundedCache&&) noexcept = default;
  BoundedCache& operator=(BoundedCache&&) noexcept = default;

  /// Returns the value mapped to `key`, recording the access.
  std::optional<V> Get(const K& key) { return impl_->Get(key); }

  /// Returns the value mapped to `key` without recording the access or
  /// updating statistics.
  std::optional<V> GetQuietly(const K& key) const {
    return impl_->GetQuietly(key);
  }

  bool ContainsKey(const K& key) const { return impl_->ContainsKey(key); }

  /// Maps `key` to `value`.  Returns the replaced value, if any.
  std::optional<V> Put(const K& key, const V& value) {
    return impl_->Put(key, value);
  }

  /// Maps `key` to `value` unless `key` is present.  Returns the current
  /// value if present, recording the access, or `std::nullopt` after
  /// inserting.
  std::optional<V> PutIfAbsent(const K& key, const V& value) {
    return impl_->PutIfAbsent(key, value);
  }

  /// Replaces the value of a present `key`.  Returns the replaced value, or
  /// `std::nullopt` if `key` was absent.
  std::optional<V> Replace(const K& key, const V& value) {
    return impl_->Replace(key, value);
  }

  /// Replaces the value of `key` only if it currently equals `expected`.
  bool Replace(const K& key, const V& expected, const V& value) {
    return impl_->Replace(key, expected, value);
  }

  /// Removes `key`.  Returns the removed value, if any.
  std::optional<V> Remove(const K& key) { return impl_->Remove(key); }

  /// Removes every entry, notifying the removal listener with
  /// `RemovalCause::kExplicit`.  Waits for the eviction lock.
  ///
  /// \error `absl::StatusCode::kCancelled` if a stop is requested on
  ///     `stop_token` while waiting; no entry is removed in that case.
  absl::Status Clear(const StopToken& stop_token = {}) {
    return impl_->Clear(stop_token);
  }

  /// Sets the maximum weight and evicts down to it.  Values above
  /// `kMaximumCapacity` are clamped.  Waits for the eviction lock.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `maximum` is negative.
  /// \error `absl::StatusCode::kCancelled` if a stop is requested on
  ///     `stop_token` while waiting.
  absl::Status SetMaximumWeight(int64_t maximum,
                                const StopToken& stop_token = {}) {
    return impl_->SetMaximumWeight(maximum, stop_token);
  }

  int64_t MaximumWeight() const { return impl_->MaximumWeight(); }

  /// Returns up to `limit` entries in eviction order, the next victim first.
  /// Drains pending events first.  Waits for the eviction lock.
  absl::StatusOr<std::vector<Entry>> Coldest(
      size_t limit, const StopToken& stop_token = {}) {
    return impl_->OrderedSnapshot(limit, /*coldest=*/true, stop_token);
  }

  /// Returns up to `limit` entries in reverse eviction order.
  absl::StatusOr<std::vector<Entry>> Hottest(
      size_t limit, const StopToken& stop_token = {}) {
    return impl_->OrderedSnapshot(limit, /*coldest=*/false, stop_token);
  }

  /// Drains all pending read and write events.  Waits for the eviction lock.
  absl::Status CleanUp(const StopToken& stop_token = {}) {
    return impl_->CleanUp(stop_token);
  }

  /// Number of mapped keys.
  size_t Size() const { return impl_->Size(); }

  /// Total weight of the linked entries as of the last drain.
  int64_t WeightedSize() const { return impl_->WeightedSize(); }

  /// Snapshot of the mapped keys, in no particular order.
  std::vector<K> Keys() const { return impl_->Keys(); }

  CacheStats Stats() const { return impl_->Stats(); }

 private:
  using Impl = internal_cache::BoundedCacheImpl<K, V, Policy>;
  friend class internal_cache::Access;

  explicit BoundedCache(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

  std::unique_ptr<Impl> impl_;
};

}  // namespace boundcache

#endif  // BOUNDCACHE_BOUNDED_CACHE_H_
