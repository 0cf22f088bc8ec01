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

#ifndef BOUNDCACHE_INTERNAL_CACHE_NODE_MAP_H_
#define BOUNDCACHE_INTERNAL_CACHE_NODE_MAP_H_

#include <stddef.h>

#include <atomic>
#include <utility>
#include <vector>

#include "absl/base/optimization.h"
#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/hash/hash.h"
#include "absl/synchronization/mutex.h"
#include "boundcache/internal/cache/node.h"
#include "boundcache/removal_cause.h"

namespace boundcache {
namespace internal_cache {

/// Backing store: a sharded concurrent map from key to its current node.
///
/// A node is mapped if and only if it is alive.  Every operation that unmaps
/// a node retires it while still holding the shard mutex, so `ContainsKey`
/// turns false at the same instant the node stops being alive, and a key is
/// retired at most once per node.
template <typename K, typename V>
class NodeMap {
 public:
  using Node = internal_cache::Node<K, V>;
  using NodeRef = NodePtr<K, V>;

  constexpr static size_t kNumShards = 16;

  NodeMap() = default;
  NodeMap(const NodeMap&) = delete;
  NodeMap& operator=(const NodeMap&) = delete;

  /// Returns the node mapped to `key`, or null.
  NodeRef Find(const K& key) const {
    const Shard& shard = ShardForKey(key);
    absl::ReaderMutexLock lock(&shard.mutex);
    auto it = shard.nodes.find(key);
    if (it == shard.nodes.end()) return NodeRef();
    return it->second;
  }

  /// Maps `node` unless the key is present.  Returns the existing node, or
  /// null if `node` was inserted.
  NodeRef PutIfAbsent(NodeRef node) {
    Shard& shard = ShardForKey(node->key());
    absl::MutexLock lock(&shard.mutex);
    auto [it, inserted] = shard.nodes.try_emplace(node->key(), node);
    if (!inserted) return it->second;
    size_.fetch_add(1, std::memory_order_relaxed);
    return NodeRef();
  }

  /// Maps `node`, retiring and returning any node it replaces.
  NodeRef Put(NodeRef node) {
    Shard& shard = ShardForKey(node->key());
    absl::MutexLock lock(&shard.mutex);
    auto [it, inserted] = shard.nodes.try_emplace(node->key(), node);
    if (inserted) {
      size_.fetch_add(1, std::memory_order_relaxed);
      return NodeRef();
    }
    NodeRef old = std::exchange(it->second, std::move(node));
    old->MakeRetired(RemovalCause::kReplaced);
    return old;
  }

  /// Replaces the node mapped to the key of `node` if `pred(current)` holds.
  /// Returns the retired node, or null if nothing was replaced.
  template <typename Pred>
  NodeRef ReplaceIf(NodeRef node, Pred&& pred) {
    Shard& shard = ShardForKey(node->key());
    absl::MutexLock lock(&shard.mutex);
    auto it = shard.nodes.find(node->key());
    if (it == shard.nodes.end() || !pred(*it->second)) return NodeRef();
    NodeRef old = std::exchange(it->second, std::move(node));
    old->MakeRetired(RemovalCause::kReplaced);
    return old;
  }

  /// Unmaps and retires the node mapped to `key` with `cause`.  Returns it,
  /// or null if the key was absent.
  NodeRef Remove(const K& key, RemovalCause cause) {
    Shard& shard = ShardForKey(key);
    absl::MutexLock lock(&shard.mutex);
    auto it = shard.nodes.find(key);
    if (it == shard.nodes.end()) return NodeRef();
    NodeRef old = std::move(it->second);
    shard.nodes.erase(it);
    size_.fetch_sub(1, std::memory_order_relaxed);
    old->MakeRetired(cause);
    return old;
  }

  /// Unmaps and retires `node` only if it is still the node mapped to its
  /// key.  Returns `false` if another thread already unmapped it.
  bool RemoveIfSame(Node* node, RemovalCause cause) {
    Shard& shard = ShardForKey(node->key());
    absl::MutexLock lock(&shard.mutex);
    auto it = shard.nodes.find(node->key());
    if (it == shard.nodes.end() || it->second.get() != node) return false;
    shard.nodes.erase(it);
    size_.fetch_sub(1, std::memory_order_relaxed);
    node->MakeRetired(cause);
    return true;
  }

  /// Unmaps and retires every node with `cause`, returning them.
  std::vector<NodeRef> RemoveAll(RemovalCause cause) {
    std::vector<NodeRef> removed;
    for (Shard& shard : shards_) {
      absl::MutexLock lock(&shard.mutex);
      removed.reserve(removed.size() + shard.nodes.size());
      for (auto& [key, node] : shard.nodes) {
        node->MakeRetired(cause);
        removed.push_back(std::move(node));
      }
      size_.fetch_sub(shard.nodes.size(), std::memory_order_relaxed);
      shard.nodes.clear();
    }
    return removed;
  }

  /// Invokes `fn(const Node&)` for each mapped node.  Each shard is visited
  /// under its reader lock; `fn` must not call back into the map.
  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (const Shard& shard : shards_) {
      absl::ReaderMutexLock lock(&shard.mutex);
      for (const auto& entry : shard.nodes) fn(*entry.second);
    }
  }

  size_t size() const { return size_.load(std::memory_order_relaxed); }

 private:
  struct ABSL_CACHELINE_ALIGNED Shard {
    mutable absl::Mutex mutex;
    absl::flat_hash_map<K, NodeRef> nodes ABSL_GUARDED_BY(mutex);
  };

  Shard& ShardForKey(const K& key) {
    return shards_[absl::Hash<K>{}(key) & (kNumShards - 1)];
  }
  const Shard& ShardForKey(const K& key) const {
    return shards_[absl::Hash<K>{}(key) & (kNumShards - 1)];
  }

  Shard shards_[kNumShards];
  std::atomic<size_t> size_{0};
};

}  // namespace internal_cache
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_CACHE_NODE_MAP_H_
