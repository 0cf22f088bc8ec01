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

#ifndef BOUNDCACHE_INTERNAL_CACHE_ACCESS_ORDER_DEQUE_H_
#define BOUNDCACHE_INTERNAL_CACHE_ACCESS_ORDER_DEQUE_H_

#include <stddef.h>
#include <stdint.h>

#include <limits>
#include <utility>
#include <vector>

#include "absl/log/absl_check.h"
#include "boundcache/internal/cache/node.h"
#include "boundcache/internal/intrusive_linked_list.h"
#include "boundcache/internal/intrusive_ptr.h"

namespace boundcache {
namespace internal_cache {

/// Eviction order of a cache: a circular doubly-linked list threaded through
/// an arena of slots addressed by 32-bit index.
///
/// Slot 0 is the dummy head; `head.next` is the least-recently-ordered node
/// (the front) and `head.prev` is the most-recently-ordered node (the back).
/// Each linked node stores its slot index via `set_order_slot`, which gives
/// O(1) unlink and reposition without the nodes pointing at each other.
///
/// The arena holds one reference to every linked node.  Released slots are
/// recycled through a free list.
///
/// Not thread safe; the owning cache only touches it while holding the
/// eviction lock.
template <typename NodeType>
class AccessOrderDeque {
 public:
  using Node = NodeType;
  using NodeRef = internal::IntrusivePtr<Node>;
  using SlotIndex = uint32_t;

  AccessOrderDeque() : slots_(1) {
    internal::intrusive_linked_list::Initialize(Accessor{this}, kHead);
  }

  AccessOrderDeque(const AccessOrderDeque&) = delete;
  AccessOrderDeque& operator=(const AccessOrderDeque&) = delete;

  ~AccessOrderDeque() {
    while (!empty()) PopFront();
  }

  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  /// Returns the least-recently-ordered node, or `nullptr` if empty.
  Node* front() const { return slots_[slots_[kHead].next].node.get(); }

  /// Returns the most-recently-ordered node, or `nullptr` if empty.
  Node* back() const { return slots_[slots_[kHead].prev].node.get(); }

  /// Returns `true` if `node` is linked in this deque.
  bool Contains(const Node* node) const {
    SlotIndex slot = node->order_slot();
    return slot != kHead && slot < slots_.size() &&
           slots_[slot].node.get() == node;
  }

  /// Links `node` at the back.
  void PushBack(NodeRef node) {
    ABSL_CHECK(!node->IsLinked()) << "node already linked";
    SlotIndex slot = AllocateSlot();
    node->set_order_slot(slot);
    slots_[slot].node = std::move(node);
    internal::intrusive_linked_list::InsertBefore(Accessor{this}, kHead, slot);
    ++size_;
  }

  /// Moves a linked `node` to the back.
  void MoveToBack(Node* node) {
    ABSL_CHECK(Contains(node));
    internal::intrusive_linked_list::MoveBefore(Accessor{this}, kHead,
                                                node->order_slot());
  }

  /// Unlinks `node` and returns the reference the deque held.
  NodeRef Remove(Node* node) {
    ABSL_CHECK(Contains(node));
    SlotIndex slot = node->order_slot();
    internal::intrusive_linked_list::Remove(Accessor{this}, slot);
    node->set_order_slot(kUnlinkedSlot);
    NodeRef ref = std::move(slots_[slot].node);
    slots_[slot].node.reset();
    free_slots_.push_back(slot);
    --size_;
    return ref;
  }

  /// Unlinks and returns the front node, or null if empty.
  NodeRef PopFront() {
    Node* node = front();
    if (!node) return NodeRef();
    return Remove(node);
  }

  /// Invokes `fn(Node&)` from the front to the back.  `fn` returns `false` to
  /// stop early.
  template <typename Fn>
  void ForEach(Fn fn) const {
    for (SlotIndex i = slots_[kHead].next; i != kHead; i = slots_[i].next) {
      if (!fn(*slots_[i].node)) return;
    }
  }

  /// Invokes `fn(Node&)` from the back to the front.  `fn` returns `false` to
  /// stop early.
  template <typename Fn>
  void ForEachReverse(Fn fn) const {
    for (SlotIndex i = slots_[kHead].prev; i != kHead; i = slots_[i].prev) {
      if (!fn(*slots_[i].node)) return;
    }
  }

 private:
  static constexpr SlotIndex kHead = kUnlinkedSlot;

  struct Slot {
    SlotIndex prev = kHead;
    SlotIndex next = kHead;
    NodeRef node;
  };

  struct Accessor {
    using Node = SlotIndex;
    AccessOrderDeque* self;
    SlotIndex GetPrev(SlotIndex i) const { return self->slots_[i].prev; }
    SlotIndex GetNext(SlotIndex i) const { return self->slots_[i].next; }
    void SetPrev(SlotIndex i, SlotIndex prev) const {
      self->slots_[i].prev = prev;
    }
    void SetNext(SlotIndex i, SlotIndex next) const {
      self->slots_[i].next = next;
    }
  };

  SlotIndex AllocateSlot() {
    if (!free_slots_.empty()) {
      SlotIndex slot = free_slots_.back();
      free_slots_.pop_back();
      return slot;
    }
    ABSL_CHECK_LT(slots_.size(), std::numeric_limits<SlotIndex>::max());
    slots_.emplace_back();
    return static_cast<SlotIndex>(slots_.size() - 1);
  }

  std::vector<Slot> slots_;
  std::vector<SlotIndex> free_slots_;
  size_t size_ = 0;
};

}  // namespace internal_cache
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_CACHE_ACCESS_ORDER_DEQUE_H_
