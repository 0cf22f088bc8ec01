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

#ifndef BOUNDCACHE_INTERNAL_CACHE_NODE_H_
#define BOUNDCACHE_INTERNAL_CACHE_NODE_H_

#include <stdint.h>

#include <atomic>
#include <iosfwd>
#include <utility>

#include "boundcache/internal/intrusive_ptr.h"
#include "boundcache/removal_cause.h"

namespace boundcache {
namespace internal_cache {

/// Lifecycle of a cache node.  Transitions are monotonic:
/// `kAlive -> kRetired -> kDead`.
enum class NodeState : uint8_t {
  /// Mapped by the backing store; eligible for ordering and eviction.
  kAlive,
  /// Removed from the backing store, but possibly still linked in the
  /// eviction order until the next drain.
  kRetired,
  /// Unlinked and accounted for; the removal notification has been produced.
  kDead,
};

std::ostream& operator<<(std::ostream& os, NodeState state);

/// Sentinel slot index meaning "not linked in the eviction order".
constexpr uint32_t kUnlinkedSlot = 0;

/// Storage unit of the cache.
///
/// The key, value and weight are fixed at construction; a new value for an
/// existing key is a new `Node` that replaces the old one.  Because of this,
/// readers may access `key()` and `value()` without synchronization as long as
/// they hold a reference.
///
/// References are held by the backing store while the node is mapped, by the
/// eviction order arena while the node is linked, and by any read buffer slot
/// that currently names the node.
template <typename K, typename V>
class Node : public internal::AtomicReferenceCount<Node<K, V>> {
 public:
  template <typename KArg, typename VArg>
  Node(KArg&& key, VArg&& value, uint32_t weight)
      : key_(std::forward<KArg>(key)),
        value_(std::forward<VArg>(value)),
        weight_(weight) {}

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  const K& key() const { return key_; }
  const V& value() const { return value_; }
  uint32_t weight() const { return weight_; }

  NodeState state() const { return state_.load(std::memory_order_acquire); }
  bool IsAlive() const { return state() == NodeState::kAlive; }
  bool IsRetired() const { return state() == NodeState::kRetired; }
  bool IsDead() const { return state() == NodeState::kDead; }

  /// Transitions `kAlive -> kRetired`, recording `cause` as the reason that
  /// will be reported when the node dies.
  ///
  /// Returns `false`, and has no effect, if the node is not alive.
  bool MakeRetired(RemovalCause cause) {
    if (state_.load(std::memory_order_acquire) != NodeState::kAlive) {
      return false;
    }
    // Retirement is serialized by the backing store shard that maps the key,
    // so the cause cannot be overwritten by a competing retirement.
    cause_.store(cause, std::memory_order_relaxed);
    NodeState expected = NodeState::kAlive;
    return state_.compare_exchange_strong(expected, NodeState::kRetired,
                                          std::memory_order_acq_rel);
  }

  /// Transitions to `kDead` from either earlier state.
  ///
  /// Returns `false` if the node was already dead.  Must only be called while
  /// holding the eviction lock.
  bool MakeDead() {
    NodeState current = state_.load(std::memory_order_relaxed);
    while (current != NodeState::kDead) {
      if (state_.compare_exchange_weak(current, NodeState::kDead,
                                       std::memory_order_acq_rel)) {
        return true;
      }
    }
    return false;
  }

  /// Cause recorded by the successful `MakeRetired` call.
  ///
  /// Only meaningful once the node is no longer alive.
  RemovalCause removal_cause() const {
    return cause_.load(std::memory_order_relaxed);
  }

  /// Arena slot of this node in the eviction order, or `kUnlinkedSlot`.
  ///
  /// Only accessed while holding the eviction lock.
  uint32_t order_slot() const { return order_slot_; }
  void set_order_slot(uint32_t slot) { order_slot_ = slot; }
  bool IsLinked() const { return order_slot_ != kUnlinkedSlot; }

 private:
  const K key_;
  const V value_;
  const uint32_t weight_;
  std::atomic<NodeState> state_{NodeState::kAlive};
  std::atomic<RemovalCause> cause_{RemovalCause::kExplicit};
  uint32_t order_slot_ = kUnlinkedSlot;
};

template <typename K, typename V>
using NodePtr = internal::IntrusivePtr<Node<K, V>>;

}  // namespace internal_cache
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_CACHE_NODE_H_
