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

#ifndef BOUNDCACHE_INTERNAL_CACHE_WRITE_BUFFER_H_
#define BOUNDCACHE_INTERNAL_CACHE_WRITE_BUFFER_H_

#include <stddef.h>
#include <stdint.h>

#include <iosfwd>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "boundcache/internal/container/block_queue.h"
#include "boundcache/internal/intrusive_ptr.h"

namespace boundcache {
namespace internal_cache {

/// Structural mutation deferred to the next drain.
enum class WriteTaskKind : uint8_t {
  /// Link a newly mapped node at the back of the eviction order and add its
  /// weight.  Skipped if the node was retired before the drain.
  kLink,
  /// Unlink a retired node, subtract its weight if it was linked, and mark it
  /// dead.
  kUnlink,
};

std::ostream& operator<<(std::ostream& os, WriteTaskKind kind);

template <typename NodeType>
struct WriteTask {
  WriteTaskKind kind = WriteTaskKind::kLink;
  internal::IntrusivePtr<NodeType> node;
};

/// Unbounded FIFO of pending write tasks.
///
/// Any thread may `Push`; only the drainer, holding the eviction lock, calls
/// `Drain`.  Each pushed task is applied exactly once.
template <typename NodeType>
class WriteBuffer {
 public:
  using Task = WriteTask<NodeType>;

  void Push(Task task) ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    queue_.push_back(std::move(task));
  }

  size_t size() const ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    return queue_.size();
  }

  bool empty() const { return size() == 0; }

  /// Applies `apply(Task&)` in FIFO order to the tasks queued when the call
  /// begins.  Tasks pushed meanwhile are left for the next drain.  `apply`
  /// runs without `mutex_` held.  Returns the number of tasks applied.
  template <typename Fn>
  size_t Drain(Fn&& apply) ABSL_LOCKS_EXCLUDED(mutex_) {
    const size_t limit = size();
    size_t applied = 0;
    for (; applied < limit; ++applied) {
      Task task;
      {
        absl::MutexLock lock(&mutex_);
        task = std::move(queue_.front());
        queue_.pop_front();
      }
      apply(task);
    }
    return applied;
  }

 private:
  mutable absl::Mutex mutex_;
  internal_container::BlockQueue<Task> queue_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace internal_cache
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_CACHE_WRITE_BUFFER_H_
