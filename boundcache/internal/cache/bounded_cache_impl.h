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

#ifndef BOUNDCACHE_INTERNAL_CACHE_BOUNDED_CACHE_IMPL_H_
#define BOUNDCACHE_INTERNAL_CACHE_BOUNDED_CACHE_IMPL_H_

/// \file
/// Engine behind `BoundedCache`.
///
/// Reads go to the backing store and record a buffered read event.  Writes
/// mutate the backing store, retire any displaced node, and queue a write
/// task.  Only a drain, run by one thread at a time while holding the
/// eviction lock, touches the eviction order:
///
///   1. apply the queued write tasks (link, unlink) in FIFO order;
///   2. replay the buffered reads through the eviction policy;
///   3. evict from the policy's victim end while over the maximum weight.
///
/// Removal notifications collected by a drain are delivered after the
/// eviction lock is released.

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <atomic>
#include <optional>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/log/absl_check.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "boundcache/bounded_cache_options.h"
#include "boundcache/cache_stats.h"
#include "boundcache/internal/cache/access_order_deque.h"
#include "boundcache/internal/cache/drain_status.h"
#include "boundcache/internal/cache/eviction_lock.h"
#include "boundcache/internal/cache/node.h"
#include "boundcache/internal/cache/node_map.h"
#include "boundcache/internal/cache/read_buffer.h"
#include "boundcache/internal/cache/write_buffer.h"
#include "boundcache/internal/integer_overflow.h"
#include "boundcache/internal/intrusive_ptr.h"
#include "boundcache/internal/log/verbose_flag.h"
#include "boundcache/removal_cause.h"
#include "boundcache/util/executor.h"
#include "boundcache/util/stop_token.h"

namespace boundcache {
namespace internal_cache {

/// Verbose logging for drains, evictions and exclusive operations.
extern internal_log::VerboseFlag bounded_cache_logging;

class Access;

template <typename K, typename V, typename Policy>
class BoundedCacheImpl {
 public:
  using Key = K;
  using Node = internal_cache::Node<K, V>;
  using NodeRef = NodePtr<K, V>;
  using Options = BoundedCacheOptions<K, V>;
  using Order = AccessOrderDeque<Node>;
  using Task = WriteTask<Node>;
  using Entry = std::pair<K, V>;

  /// Drain passes a thread makes while writes keep arriving before it leaves
  /// the status `kRequired` for the next operation.
  constexpr static int kMaxDrainAttempts = 3;

  explicit BoundedCacheImpl(Options options)
      : weigher_(std::move(options.weigher)),
        removal_listener_(std::move(options.removal_listener)),
        executor_(std::move(options.executor)),
        defer_drains_(executor_ && !executor_.target<InlineExecutor>()),
        maximum_weight_(std::min(options.maximum_weight, kMaximumCapacity)),
        read_buffer_(options.read_buffer_stripes == 0
                         ? DefaultReadBufferStripes()
                         : options.read_buffer_stripes) {
    ABSL_CHECK_GE(options.maximum_weight, 0);
  }

  BoundedCacheImpl(const BoundedCacheImpl&) = delete;
  BoundedCacheImpl& operator=(const BoundedCacheImpl&) = delete;

  /// Blocks until every drain handed to the executor has run.
  ~BoundedCacheImpl() {
    absl::MutexLock lock(&deferred_mutex_);
    deferred_mutex_.Await(absl::Condition(
        +[](size_t* outstanding) { return *outstanding == 0; },
        &deferred_drains_));
  }

  std::optional<V> Get(const K& key) {
    return Get(key, read_buffer_.CurrentStripe());
  }

  /// Looks up `key`, recording the read on `stripe`.
  std::optional<V> Get(const K& key, size_t stripe) {
    NodeRef node = store_.Find(key);
    if (!node || !node->IsAlive()) {
      stats_.RecordMiss();
      return std::nullopt;
    }
    stats_.RecordHit();
    std::optional<V> value(node->value());
    AfterRead(node.get(), stripe);
    return value;
  }

  std::optional<V> GetQuietly(const K& key) const {
    NodeRef node = store_.Find(key);
    if (!node || !node->IsAlive()) return std::nullopt;
    return node->value();
  }

  bool ContainsKey(const K& key) const {
    NodeRef node = store_.Find(key);
    return node && node->IsAlive();
  }

  std::optional<V> Put(const K& key, const V& value) {
    NodeRef node = NewNode(key, value);
    NodeRef old = store_.Put(node);
    return ReplacedBy(std::move(old), std::move(node));
  }

  std::optional<V> PutIfAbsent(const K& key, const V& value) {
    const size_t stripe = read_buffer_.CurrentStripe();
    if (NodeRef existing = store_.Find(key); existing && existing->IsAlive()) {
      std::optional<V> current(existing->value());
      AfterRead(existing.get(), stripe);
      return current;
    }
    NodeRef node = NewNode(key, value);
    if (NodeRef existing = store_.PutIfAbsent(node)) {
      std::optional<V> current(existing->value());
      AfterRead(existing.get(), stripe);
      return current;
    }
    AfterWrite({WriteTaskKind::kLink, std::move(node)});
    return std::nullopt;
  }

  std::optional<V> Replace(const K& key, const V& value) {
    if (!ContainsKey(key)) return std::nullopt;
    NodeRef node = NewNode(key, value);
    NodeRef old = store_.ReplaceIf(node, [](const Node&) { return true; });
    if (!old) return std::nullopt;
    return ReplacedBy(std::move(old), std::move(node));
  }

  bool Replace(const K& key, const V& expected, const V& value) {
    if (!ContainsKey(key)) return false;
    NodeRef node = NewNode(key, value);
    NodeRef old = store_.ReplaceIf(
        node, [&](const Node& current) { return current.value() == expected; });
    if (!old) return false;
    ReplacedBy(std::move(old), std::move(node));
    return true;
  }

  std::optional<V> Remove(const K& key) {
    NodeRef old = store_.Remove(key, RemovalCause::kExplicit);
    if (!old) return std::nullopt;
    std::optional<V> value(old->value());
    AfterWrite({WriteTaskKind::kUnlink, std::move(old)});
    return value;
  }

  absl::Status Clear(const StopToken& stop_token) {
    if (absl::Status status = LockExclusive(stop_token, "Clear"); !status.ok()) {
      return status;
    }
    size_t cleared = 0;
    for (NodeRef& node : store_.RemoveAll(RemovalCause::kExplicit)) {
      write_buffer_.Push({WriteTaskKind::kUnlink, std::move(node)});
      ++cleared;
    }
    ABSL_LOG_IF(INFO, bounded_cache_logging)
        << "Cleared " << cleared << " entries";
    DrainBuffersAndUnlock();
    return absl::OkStatus();
  }

  absl::Status SetMaximumWeight(int64_t maximum, const StopToken& stop_token) {
    if (maximum < 0) {
      return absl::InvalidArgumentError(
          absl::StrCat("Maximum weight must be non-negative, but got ",
                       maximum));
    }
    if (absl::Status status = LockExclusive(stop_token, "SetMaximumWeight");
        !status.ok()) {
      return status;
    }
    maximum = std::min(maximum, kMaximumCapacity);
    ABSL_LOG_IF(INFO, bounded_cache_logging)
        << "Maximum weight " << maximum_weight_.load(std::memory_order_relaxed)
        << " -> " << maximum;
    maximum_weight_.store(maximum, std::memory_order_relaxed);
    DrainBuffersAndUnlock();
    return absl::OkStatus();
  }

  /// Returns up to `limit` live entries, least-recently-used first when
  /// `coldest` is true and most-recently-used first otherwise.
  absl::StatusOr<std::vector<Entry>> OrderedSnapshot(
      size_t limit, bool coldest, const StopToken& stop_token) {
    if (absl::Status status =
            LockExclusive(stop_token, coldest ? "Coldest" : "Hottest");
        !status.ok()) {
      return status;
    }
    std::vector<NodeRef> removed;
    const bool pending = DrainBuffersLocked(&removed);
    std::vector<Entry> entries;
    auto collect = [&](const Node& node) {
      if (entries.size() >= limit) return false;
      if (node.IsAlive()) entries.emplace_back(node.key(), node.value());
      return true;
    };
    if (coldest) {
      order_.ForEach(collect);
    } else {
      order_.ForEachReverse(collect);
    }
    UnlockAndNotify(pending, removed);
    return entries;
  }

  absl::Status CleanUp(const StopToken& stop_token) {
    if (absl::Status status = LockExclusive(stop_token, "CleanUp");
        !status.ok()) {
      return status;
    }
    DrainBuffersAndUnlock();
    return absl::OkStatus();
  }

  size_t Size() const { return store_.size(); }

  int64_t WeightedSize() const {
    return weighted_size_.load(std::memory_order_acquire);
  }

  int64_t MaximumWeight() const {
    return maximum_weight_.load(std::memory_order_relaxed);
  }

  std::vector<K> Keys() const {
    std::vector<K> keys;
    keys.reserve(store_.size());
    store_.ForEach([&](const Node& node) { keys.push_back(node.key()); });
    return keys;
  }

  CacheStats Stats() const { return stats_.Snapshot(); }

 private:
  friend class Access;

  NodeRef NewNode(const K& key, const V& value) {
    uint32_t weight = weigher_ ? weigher_(key, value) : 1;
    ABSL_CHECK_LE(weight, kMaximumEntryWeight)
        << "Weigher returned an out of range weight";
    return internal::MakeIntrusivePtr<Node>(key, value, weight);
  }

  /// Queues the unlink of `old`, if any, ahead of the link of `node`, so a
  /// replacement never transiently counts both weights.
  std::optional<V> ReplacedBy(NodeRef old, NodeRef node) {
    std::optional<V> previous;
    if (old) {
      previous.emplace(old->value());
      write_buffer_.Push({WriteTaskKind::kUnlink, std::move(old)});
    }
    AfterWrite({WriteTaskKind::kLink, std::move(node)});
    return previous;
  }

  void AfterRead(Node* node, size_t stripe) {
    const int64_t pending = read_buffer_.stripe(stripe).Record(node);
    const bool delayable = pending < kReadBufferThreshold;
    if (ShouldDrainBuffers(drain_status_.load(std::memory_order_acquire),
                           delayable)) {
      TryToDrainBuffers();
    }
  }

  void AfterWrite(Task task) {
    write_buffer_.Push(std::move(task));
    drain_status_.store(DrainStatus::kRequired, std::memory_order_release);
    TryToDrainBuffers();
  }

  /// Drains if no other thread is draining and the eviction lock is free.
  /// Never blocks.
  void TryToDrainBuffers() {
    if (drain_status_.load(std::memory_order_acquire) ==
        DrainStatus::kProcessing) {
      return;
    }
    if (defer_drains_ && eviction_lock_.contended()) {
      ScheduleDrainBuffers();
      return;
    }
    if (!eviction_lock_.TryLock()) return;
    DrainBuffersAndUnlock();
  }

  /// Hands a blocking drain to the executor, at most one at a time.
  void ScheduleDrainBuffers() {
    if (drain_scheduled_.exchange(true, std::memory_order_acq_rel)) return;
    {
      absl::MutexLock lock(&deferred_mutex_);
      ++deferred_drains_;
    }
    executor_([this] {
      drain_scheduled_.store(false, std::memory_order_release);
      eviction_lock_.Lock();
      DrainBuffersAndUnlock();
      absl::MutexLock lock(&deferred_mutex_);
      --deferred_drains_;
    });
  }

  absl::Status LockExclusive(const StopToken& stop_token,
                             const char* operation) {
    absl::Status status = eviction_lock_.Lock(stop_token);
    ABSL_LOG_IF(INFO, bounded_cache_logging && !status.ok())
        << operation << " abandoned: " << status;
    return status;
  }

  /// Requires the eviction lock; releases it.
  void DrainBuffersAndUnlock() {
    std::vector<NodeRef> removed;
    const bool pending = DrainBuffersLocked(&removed);
    UnlockAndNotify(pending, removed);
  }

  void UnlockAndNotify(bool pending, std::vector<NodeRef>& removed) {
    eviction_lock_.Unlock();
    NotifyRemovals(removed);
    if (pending && defer_drains_) ScheduleDrainBuffers();
  }

  /// Runs drain passes until no write arrives during a pass, or
  /// `kMaxDrainAttempts` is reached.  Appends dead nodes to `removed`.
  /// Returns `true` if work is still pending.  Requires the eviction lock.
  bool DrainBuffersLocked(std::vector<NodeRef>* removed) {
    for (int attempt = 0; attempt < kMaxDrainAttempts; ++attempt) {
      drain_status_.store(DrainStatus::kProcessing, std::memory_order_release);
      Maintenance(removed);
      DrainStatus expected = DrainStatus::kProcessing;
      if (drain_status_.compare_exchange_strong(expected, DrainStatus::kIdle,
                                                std::memory_order_acq_rel)) {
        return false;
      }
    }
    return true;
  }

  void Maintenance(std::vector<NodeRef>* removed) {
    const size_t writes =
        write_buffer_.Drain([&](Task& task) { ApplyWrite(task, removed); });
    const size_t reads =
        read_buffer_.DrainAll([&](Node& node) { ApplyRead(node); });
    const size_t evictions = EvictEntries(removed);
    ABSL_LOG_IF(INFO, bounded_cache_logging &&
                          (writes != 0 || reads != 0 || evictions != 0))
        << Policy::kName << " drain: writes=" << writes << " reads=" << reads
        << " evictions=" << evictions
        << " weighted_size=" << weighted_size_.load(std::memory_order_relaxed);
  }

  void ApplyWrite(Task& task, std::vector<NodeRef>* removed) {
    Node* node = task.node.get();
    switch (task.kind) {
      case WriteTaskKind::kLink:
        // A node retired before its link is never counted; its unlink task
        // reports it.
        if (!node->IsAlive() || order_.Contains(node)) return;
        AddWeight(node->weight());
        order_.PushBack(std::move(task.node));
        return;
      case WriteTaskKind::kUnlink:
        if (order_.Contains(node)) {
          order_.Remove(node);
          SubtractWeight(node->weight());
        }
        if (node->MakeDead()) removed->push_back(std::move(task.node));
        return;
    }
  }

  void ApplyRead(Node& node) {
    if (node.IsAlive() && order_.Contains(&node)) {
      Policy::OnAccess(order_, &node);
    }
  }

  size_t EvictEntries(std::vector<NodeRef>* removed) {
    size_t evicted = 0;
    const int64_t maximum = maximum_weight_.load(std::memory_order_relaxed);
    while (weighted_size_.load(std::memory_order_relaxed) > maximum) {
      Node* victim = Policy::SelectVictim(order_);
      if (!victim) break;
      // A victim that lost a race with a concurrent removal keeps the cause
      // recorded by that removal.
      if (victim->IsAlive()) store_.RemoveIfSame(victim, RemovalCause::kSize);
      NodeRef node = order_.Remove(victim);
      SubtractWeight(node->weight());
      if (!node->MakeDead()) continue;
      if (node->removal_cause() == RemovalCause::kSize) {
        stats_.RecordEviction(node->weight());
        ++evicted;
        ABSL_LOG_IF(INFO, bounded_cache_logging.Level(1))
            << "Evicted entry of weight " << node->weight();
      }
      removed->push_back(std::move(node));
    }
    return evicted;
  }

  void AddWeight(uint32_t weight) {
    weighted_size_.store(
        internal::SaturateAdd<int64_t>(
            weighted_size_.load(std::memory_order_relaxed), weight),
        std::memory_order_release);
  }

  void SubtractWeight(uint32_t weight) {
    weighted_size_.store(
        internal::SaturateSub<int64_t>(
            weighted_size_.load(std::memory_order_relaxed), weight),
        std::memory_order_release);
  }

  /// Must not be called while holding the eviction lock.
  void NotifyRemovals(const std::vector<NodeRef>& removed) {
    if (!removal_listener_) return;
    for (const NodeRef& node : removed) {
      removal_listener_(node->key(), node->value(), node->removal_cause());
    }
  }

  const typename Options::Weigher weigher_;
  const typename Options::RemovalListener removal_listener_;
  const Executor executor_;
  const bool defer_drains_;

  NodeMap<K, V> store_;
  EvictionLock eviction_lock_;

  // Guarded by `eviction_lock_`.
  Order order_;

  // Written only while holding `eviction_lock_`.
  std::atomic<int64_t> weighted_size_{0};
  std::atomic<int64_t> maximum_weight_;

  std::atomic<DrainStatus> drain_status_{DrainStatus::kIdle};
  StripedReadBuffer<Node> read_buffer_;
  WriteBuffer<Node> write_buffer_;

  StatsCounter stats_;

  std::atomic<bool> drain_scheduled_{false};
  absl::Mutex deferred_mutex_;
  size_t deferred_drains_ ABSL_GUARDED_BY(deferred_mutex_) = 0;
};

/// White-box access to engine internals, for tests.
class Access {
 public:
  template <typename Cache>
  static auto& Impl(Cache& cache) {
    return *cache.impl_;
  }

  template <typename Impl>
  static EvictionLock& eviction_lock(Impl& impl) {
    return impl.eviction_lock_;
  }

  template <typename Impl>
  static typename Impl::Order& order(Impl& impl) {
    return impl.order_;
  }

  template <typename Impl>
  static auto& read_buffer(Impl& impl) {
    return impl.read_buffer_;
  }

  template <typename Impl>
  static auto& write_buffer(Impl& impl) {
    return impl.write_buffer_;
  }

  template <typename Impl>
  static std::atomic<DrainStatus>& drain_status(Impl& impl) {
    return impl.drain_status_;
  }

  template <typename Impl>
  static typename Impl::NodeRef FindNode(Impl& impl,
                                         const typename Impl::Key& key) {
    return impl.store_.Find(key);
  }

  /// Requires the eviction lock.
  template <typename Impl>
  static void set_weighted_size(Impl& impl, int64_t weighted_size) {
    impl.weighted_size_.store(weighted_size, std::memory_order_release);
  }

  template <typename Impl>
  static void AfterRead(Impl& impl, typename Impl::Node* node, size_t stripe) {
    impl.AfterRead(node, stripe);
  }

  template <typename Impl>
  static void AfterWrite(Impl& impl, typename Impl::Task task) {
    impl.AfterWrite(std::move(task));
  }

  template <typename Impl>
  static void TryToDrainBuffers(Impl& impl) {
    impl.TryToDrainBuffers();
  }

  /// Runs a drain while the caller holds the eviction lock.  The returned
  /// nodes are dead; pass them to `NotifyRemovals` after unlocking.
  template <typename Impl>
  static std::vector<typename Impl::NodeRef> DrainBuffersLocked(Impl& impl) {
    std::vector<typename Impl::NodeRef> removed;
    impl.DrainBuffersLocked(&removed);
    return removed;
  }

  template <typename Impl>
  static void NotifyRemovals(Impl& impl,
                             const std::vector<typename Impl::NodeRef>& removed) {
    impl.NotifyRemovals(removed);
  }
};

}  // namespace internal_cache
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_CACHE_BOUNDED_CACHE_IMPL_H_
