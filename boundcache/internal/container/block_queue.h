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

#ifndef BOUNDCACHE_INTERNAL_CONTAINER_BLOCK_QUEUE_H_
#define BOUNDCACHE_INTERNAL_CONTAINER_BLOCK_QUEUE_H_

#include <stddef.h>

#include <memory>
#include <new>
#include <utility>

#include "absl/log/absl_check.h"

namespace boundcache {
namespace internal_container {

/// BlockQueue implements a simple fifo queue similar in concept to
/// std::deque, however there is no indexed access, only access to either end
/// of the queue.  Storage is a singly linked chain of blocks; the first block
/// holds `kMin` elements and each subsequent block doubles in size up to
/// `kMax` elements.  A drained queue keeps its head block so that a steady
/// trickle of push/pop pairs does not allocate.
///
/// Methods:
///   size_t size() const
///   bool empty() const
///   T& front()
///   T& back()
///   void push_back(T)
///   T& emplace_back(Args...)
///   void pop_front()
///   void clear()
template <typename T, size_t kMin = 64, size_t kMax = 1024>
class BlockQueue {
  static_assert(kMin > 0);
  static_assert(kMin <= kMax);

  struct Block {
    explicit Block(size_t capacity)
        : storage(new (std::align_val_t(alignof(T)))
                      unsigned char[capacity * sizeof(T)]),
          capacity(capacity) {}

    void* raw(size_t i) { return storage.get() + i * sizeof(T); }
    T* item(size_t i) { return std::launder(static_cast<T*>(raw(i))); }

    struct AlignedDelete {
      void operator()(unsigned char* p) const {
        ::operator delete[](p, std::align_val_t(alignof(T)));
      }
    };

    std::unique_ptr<unsigned char[], AlignedDelete> storage;
    size_t capacity;
    std::unique_ptr<Block> next;
  };

 public:
  BlockQueue() = default;
  ~BlockQueue() { clear(); }

  BlockQueue(const BlockQueue&) = delete;
  BlockQueue& operator=(const BlockQueue&) = delete;

  /// Returns the count of items in the BlockQueue.
  size_t size() const { return size_; }

  /// Returns whether the BlockQueue is empty.
  bool empty() const { return size_ == 0; }

  /// Returns the first element.
  T& front() {
    ABSL_CHECK(!empty());
    return *head_->item(head_pos_);
  }

  /// Returns the last element.
  T& back() {
    ABSL_CHECK(!empty());
    return *tail_->item(tail_pos_ - 1);
  }

  /// Add an element to the back.
  void push_back(const T& val) { emplace_back(val); }
  void push_back(T&& val) { emplace_back(std::move(val)); }

  template <typename... A>
  T& emplace_back(A&&... args) {
    if (!tail_ || tail_pos_ == tail_->capacity) AppendBlock();
    T* item = new (tail_->raw(tail_pos_)) T(std::forward<A>(args)...);
    ++tail_pos_;
    ++size_;
    return *item;
  }

  /// Remove the front element.
  void pop_front() {
    ABSL_CHECK(!empty());
    head_->item(head_pos_)->~T();
    ++head_pos_;
    --size_;
    if (size_ == 0) {
      // Keep only the head block, rewound to its start.
      head_->next.reset();
      tail_ = head_.get();
      head_pos_ = tail_pos_ = 0;
      return;
    }
    if (head_pos_ == head_->capacity) {
      head_ = std::move(head_->next);
      head_pos_ = 0;
    }
  }

  /// Destroys all elements.
  void clear() {
    while (!empty()) pop_front();
  }

 private:
  void AppendBlock() {
    if (!tail_) {
      head_ = std::make_unique<Block>(kMin);
      tail_ = head_.get();
    } else {
      size_t capacity = tail_->capacity * 2;
      if (capacity > kMax) capacity = kMax;
      tail_->next = std::make_unique<Block>(capacity);
      tail_ = tail_->next.get();
    }
    tail_pos_ = 0;
  }

  std::unique_ptr<Block> head_;
  Block* tail_ = nullptr;
  size_t head_pos_ = 0;
  size_t tail_pos_ = 0;
  size_t size_ = 0;
};

}  // namespace internal_container
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_CONTAINER_BLOCK_QUEUE_H_
