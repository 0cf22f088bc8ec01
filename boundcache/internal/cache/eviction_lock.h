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

#ifndef BOUNDCACHE_INTERNAL_CACHE_EVICTION_LOCK_H_
#define BOUNDCACHE_INTERNAL_CACHE_EVICTION_LOCK_H_

#include <atomic>
#include <thread>  // NOLINT

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "boundcache/util/stop_token.h"

namespace boundcache {
namespace internal_cache {

/// Non-reentrant lock guarding the eviction order and the drain procedure.
///
/// Differs from `absl::Mutex` in two ways the drain protocol needs:
///
/// - `contended()` reports whether any thread is blocked in `Lock`, which the
///   hot path uses to hand a drain to an executor instead of running it
///   inline.  It is a scheduling hint only.
///
/// - `Lock(stop_token)` may be abandoned by requesting a stop, in which case
///   it returns `absl::CancelledError` and the lock state is unchanged.
///
/// Acquiring the lock again from the thread that holds it is a programming
/// error and fails a check instead of deadlocking.
class ABSL_LOCKABLE EvictionLock {
 public:
  EvictionLock() = default;
  EvictionLock(const EvictionLock&) = delete;
  EvictionLock& operator=(const EvictionLock&) = delete;

  /// Acquires the lock without blocking.  Returns `true` on success.
  bool TryLock() ABSL_EXCLUSIVE_TRYLOCK_FUNCTION(true);

  /// Blocks until the lock is acquired.
  void Lock() ABSL_EXCLUSIVE_LOCK_FUNCTION();

  /// Blocks until the lock is acquired or a stop is requested on
  /// `stop_token`.  Only an `absl::OkStatus()` result leaves the lock held.
  absl::Status Lock(const StopToken& stop_token);

  void Unlock() ABSL_UNLOCK_FUNCTION();

  /// Returns `true` if at least one thread is waiting in `Lock`.
  bool contended() const {
    return waiters_.load(std::memory_order_relaxed) > 0;
  }

  /// Returns `true` if some thread holds the lock.
  bool is_locked() const ABSL_LOCKS_EXCLUDED(mutex_);

  /// Returns `true` if the calling thread holds the lock.
  bool IsHeldByCurrentThread() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  mutable absl::Mutex mutex_;
  bool held_ ABSL_GUARDED_BY(mutex_) = false;
  std::thread::id owner_ ABSL_GUARDED_BY(mutex_);
  std::atomic<int> waiters_{0};
};

/// Scoped holder of an `EvictionLock`.
class ABSL_SCOPED_LOCKABLE EvictionLockHolder {
 public:
  explicit EvictionLockHolder(EvictionLock* lock)
      ABSL_EXCLUSIVE_LOCK_FUNCTION(lock)
      : lock_(lock) {
    lock_->Lock();
  }
  ~EvictionLockHolder() ABSL_UNLOCK_FUNCTION() { lock_->Unlock(); }

  EvictionLockHolder(const EvictionLockHolder&) = delete;
  EvictionLockHolder& operator=(const EvictionLockHolder&) = delete;

 private:
  EvictionLock* lock_;
};

}  // namespace internal_cache
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_CACHE_EVICTION_LOCK_H_
