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

#ifndef BOUNDCACHE_INTERNAL_CACHE_READ_BUFFER_H_
#define BOUNDCACHE_INTERNAL_CACHE_READ_BUFFER_H_

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <atomic>
#include <memory>

#include "absl/base/optimization.h"
#include "absl/log/absl_check.h"
#include "boundcache/internal/intrusive_ptr.h"

namespace boundcache {
namespace internal_cache {

/// Pending events on a stripe at which a read requests a drain.
constexpr int64_t kReadBufferThreshold = 32;

/// Maximum number of slots visited per stripe by one drain.
constexpr int64_t kReadBufferDrainThreshold = 2 * kReadBufferThreshold;

/// Slots per stripe.
constexpr int64_t kReadBufferSize = 2 * kReadBufferDrainThreshold;
constexpr int64_t kReadBufferIndexMask = kReadBufferSize - 1;

static_assert((kReadBufferSize & kReadBufferIndexMask) == 0,
              "read buffer size must be a power of two");

/// Upper bound on the number of stripes; larger requests are clamped.
constexpr size_t kMaxReadBufferStripes = 1024;

/// Returns the number of stripes used when none is configured: the smallest
/// power of two not less than the hardware concurrency.
size_t DefaultReadBufferStripes();

/// Rounds `n` up to a power of two, with a minimum of 1.  `n` must not exceed
/// the largest power of two representable in `size_t`.
size_t RoundUpToPowerOfTwo(size_t n);

/// Returns a value fixed for the lifetime of the calling thread, assigned
/// round-robin on first use.  Used to pick a stripe.
size_t CurrentThreadStripeHint();

/// One stripe of the read buffer: a ring of slots recording "this node was
/// read" events.
///
/// Producers publish with a compare-and-swap into the slot selected by the
/// write count, and drop the event if the slot is still occupied.  Every
/// occupied slot owns one reference to its node.
///
/// The consumer side (`Drain`, `read_count`) must only be used while holding
/// the eviction lock.
template <typename NodeType>
class ABSL_CACHELINE_ALIGNED ReadBufferStripe {
 public:
  ReadBufferStripe() {
    for (auto& slot : slots_) slot.store(nullptr, std::memory_order_relaxed);
  }

  ReadBufferStripe(const ReadBufferStripe&) = delete;
  ReadBufferStripe& operator=(const ReadBufferStripe&) = delete;

  ~ReadBufferStripe() {
    for (auto& slot : slots_) {
      if (NodeType* node = slot.exchange(nullptr, std::memory_order_acquire)) {
        intrusive_ptr_decrement(node);
      }
    }
  }

  /// Records a read of `node`.
  ///
  /// Returns the number of events that were pending before this one, which
  /// the caller compares against `kReadBufferThreshold`.
  int64_t Record(NodeType* node) {
    int64_t write_count = write_count_.load(std::memory_order_acquire);
    auto& slot = slots_[write_count & kReadBufferIndexMask];
    intrusive_ptr_increment(node);
    NodeType* expected = nullptr;
    if (ABSL_PREDICT_TRUE(slot.compare_exchange_strong(
            expected, node, std::memory_order_acq_rel))) {
      write_count_.fetch_add(1, std::memory_order_release);
    } else {
      // Full; recency buffering is best-effort.
      intrusive_ptr_decrement(node);
    }
    return write_count -
           drain_at_write_count_.load(std::memory_order_acquire);
  }

  /// Applies `apply(NodeType&)` to the recorded events in order, visiting at
  /// most `kReadBufferDrainThreshold` slots.  Returns the number of events
  /// applied.
  template <typename Fn>
  size_t Drain(Fn&& apply) {
    const int64_t write_count = write_count_.load(std::memory_order_acquire);
    size_t applied = 0;
    for (int64_t i = 0;
         i < kReadBufferDrainThreshold && read_count_ < write_count; ++i) {
      auto& slot = slots_[read_count_ & kReadBufferIndexMask];
      ++read_count_;
      NodeType* node = slot.exchange(nullptr, std::memory_order_acq_rel);
      if (!node) continue;
      internal::IntrusivePtr<NodeType> ref(node, internal::adopt_object_ref);
      apply(*node);
      ++applied;
    }
    drain_at_write_count_.store(write_count, std::memory_order_release);
    return applied;
  }

  int64_t write_count() const {
    return write_count_.load(std::memory_order_acquire);
  }
  int64_t drain_at_write_count() const {
    return drain_at_write_count_.load(std::memory_order_acquire);
  }
  int64_t read_count() const { return read_count_; }

  /// Returns the node in slot `i`, or `nullptr`.
  NodeType* PeekSlot(int64_t i) const {
    ABSL_CHECK(i >= 0 && i < kReadBufferSize);
    return slots_[i].load(std::memory_order_acquire);
  }

  /// Overrides the write count; only meaningful on an empty stripe.
  void set_write_count(int64_t count) {
    write_count_.store(count, std::memory_order_release);
  }

 private:
  std::atomic<NodeType*> slots_[kReadBufferSize];
  std::atomic<int64_t> write_count_{0};
  std::atomic<int64_t> drain_at_write_count_{0};
  int64_t read_count_ = 0;
};

/// Fixed set of read buffer stripes.  The stripe count is a power of two no
/// larger than `kMaxReadBufferStripes`.
template <typename NodeType>
class StripedReadBuffer {
 public:
  using Stripe = ReadBufferStripe<NodeType>;

  explicit StripedReadBuffer(size_t num_stripes)
      : num_stripes_(RoundUpToPowerOfTwo(
            std::min(num_stripes, kMaxReadBufferStripes))),
        stripes_(std::make_unique<Stripe[]>(num_stripes_)) {}

  size_t num_stripes() const { return num_stripes_; }

  /// Stripe used by the calling thread.
  size_t CurrentStripe() const {
    return CurrentThreadStripeHint() & (num_stripes_ - 1);
  }

  Stripe& stripe(size_t i) {
    ABSL_CHECK_LT(i, num_stripes_);
    return stripes_[i];
  }

  /// Drains every stripe.  Requires the eviction lock.
  template <typename Fn>
  size_t DrainAll(Fn&& apply) {
    size_t applied = 0;
    for (size_t i = 0; i < num_stripes_; ++i) {
      applied += stripes_[i].Drain(apply);
    }
    return applied;
  }

 private:
  const size_t num_stripes_;
  std::unique_ptr<Stripe[]> stripes_;
};

}  // namespace internal_cache
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_CACHE_READ_BUFFER_H_
