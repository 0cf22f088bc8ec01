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

#ifndef BOUNDCACHE_INTERNAL_CACHE_EVICTION_POLICY_H_
#define BOUNDCACHE_INTERNAL_CACHE_EVICTION_POLICY_H_

/// \file
/// Orderings applied to the eviction order by the drain.
///
/// A policy is a stateless type with two static members, invoked while
/// holding the eviction lock:
///
///     // Repositions `node`, which is linked in `order`, after a read.
///     template <typename Order>
///     static void OnAccess(Order& order, typename Order::Node* node);
///
///     // Returns the node to evict next, or `nullptr` if `order` is empty.
///     template <typename Order>
///     static typename Order::Node* SelectVictim(const Order& order);
///
/// New nodes are always linked at the back.  Replacing the policy does not
/// affect the buffering or drain protocol.

namespace boundcache {
namespace internal_cache {

/// Least-recently-used: reads move a node to the back, eviction takes the
/// front.
struct LruPolicy {
  static constexpr const char kName[] = "lru";

  template <typename Order>
  static void OnAccess(Order& order, typename Order::Node* node) {
    order.MoveToBack(node);
  }

  template <typename Order>
  static typename Order::Node* SelectVictim(const Order& order) {
    return order.front();
  }
};

/// First-in-first-out: reads do not reorder, eviction takes the oldest
/// insertion.
struct FifoPolicy {
  static constexpr const char kName[] = "fifo";

  template <typename Order>
  static void OnAccess(Order& order, typename Order::Node* node) {}

  template <typename Order>
  static typename Order::Node* SelectVictim(const Order& order) {
    return order.front();
  }
};

}  // namespace internal_cache
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_CACHE_EVICTION_POLICY_H_
