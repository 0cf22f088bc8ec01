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

#include "boundcache/internal/cache/eviction_lock.h"

#include <atomic>
#include <thread>  // NOLINT

#include "absl/base/attributes.h"
#include "absl/log/absl_check.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "boundcache/internal/log/verbose_flag.h"
#include "boundcache/util/stop_token.h"

namespace boundcache {
namespace internal_cache {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag eviction_lock_logging(
    "eviction_lock");

}  // namespace

bool EvictionLock::TryLock() {
  absl::MutexLock lock(&mutex_);
  if (held_) return false;
  held_ = true;
  owner_ = std::this_thread::get_id();
  return true;
}

void EvictionLock::Lock() {
  // A default token is never stopped, so the wait cannot be abandoned.
  absl::Status status = Lock(StopToken());
  ABSL_CHECK(status.ok()) << status;
}

absl::Status EvictionLock::Lock(const StopToken& stop_token) {
  const auto self = std::this_thread::get_id();
  {
    absl::MutexLock lock(&mutex_);
    ABSL_CHECK(!held_ || owner_ != self)
        << "EvictionLock is not reentrant";
    if (!held_) {
      held_ = true;
      owner_ = self;
      return absl::OkStatus();
    }
  }

  ABSL_LOG_IF(INFO, eviction_lock_logging)
      << "Waiting for contended eviction lock";

  waiters_.fetch_add(1, std::memory_order_relaxed);

  // Touching the mutex makes waiters re-evaluate their condition, which now
  // observes the stop request.
  StopCallback wake(stop_token, [this] { absl::MutexLock lock(&mutex_); });

  struct WaitState {
    const EvictionLock* self;
    const StopToken* stop_token;
  } wait_state{this, &stop_token};

  absl::Status status;
  mutex_.LockWhen(absl::Condition(
      +[](WaitState* w) {
        return !w->self->held_ || w->stop_token->stop_requested();
      },
      &wait_state));
  if (!held_) {
    held_ = true;
    owner_ = self;
  } else {
    status = absl::CancelledError("Interrupted waiting for the eviction lock");
  }
  mutex_.Unlock();

  waiters_.fetch_sub(1, std::memory_order_relaxed);
  return status;
}

void EvictionLock::Unlock() {
  absl::MutexLock lock(&mutex_);
  ABSL_CHECK(held_) << "EvictionLock unlocked while not held";
  held_ = false;
  owner_ = std::thread::id();
}

bool EvictionLock::is_locked() const {
  absl::MutexLock lock(&mutex_);
  return held_;
}

bool EvictionLock::IsHeldByCurrentThread() const {
  absl::MutexLock lock(&mutex_);
  return held_ && owner_ == std::this_thread::get_id();
}

}  // namespace internal_cache
}  // namespace boundcache
