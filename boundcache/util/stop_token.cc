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

#include "boundcache/util/stop_token.h"

#include <atomic>
#include <thread>  // NOLINT
#include <utility>

#include "absl/synchronization/mutex.h"
#include "boundcache/internal/intrusive_linked_list.h"

namespace boundcache {
namespace internal_stop_token {
namespace {

using CallbackListAccessor =
    internal::intrusive_linked_list::MemberAccessor<StopCallbackBase>;

void Unlink(StopCallbackBase& callback) {
  internal::intrusive_linked_list::Remove(CallbackListAccessor{}, &callback);
  callback.prev = callback.next = nullptr;
}

}  // namespace

bool StopState::RequestStop() {
  absl::MutexLock lock(&mutex_);
  if (stop_requested_.exchange(true, std::memory_order_acq_rel)) return false;
  if (!head_initialized_) return true;

  while (head_.next != &head_) {
    StopCallbackBase* callback = head_.next;
    Unlink(*callback);
    running_ = callback;
    running_thread_ = std::this_thread::get_id();

    // `callback` may be destroyed by its own invocation; it is not touched
    // afterwards.
    mutex_.Unlock();
    callback->invoker(*callback);
    mutex_.Lock();

    running_ = nullptr;
  }
  return true;
}

void StopState::Register(StopCallbackBase& callback) {
  {
    absl::MutexLock lock(&mutex_);
    if (!stop_requested_.load(std::memory_order_relaxed)) {
      if (!head_initialized_) {
        internal::intrusive_linked_list::Initialize(CallbackListAccessor{},
                                                    &head_);
        head_initialized_ = true;
      }
      internal::intrusive_linked_list::InsertBefore(CallbackListAccessor{},
                                                    &head_, &callback);
      return;
    }
  }
  callback.invoker(callback);
}

void StopState::Unregister(StopCallbackBase& callback) {
  absl::MutexLock lock(&mutex_);
  if (IsRegistered(callback)) {
    Unlink(callback);
    return;
  }
  if (running_ == &callback &&
      running_thread_ != std::this_thread::get_id()) {
    std::pair<StopState*, StopCallbackBase*> waiting(this, &callback);
    mutex_.Await(absl::Condition(
        +[](std::pair<StopState*, StopCallbackBase*>* w) {
          return w->first->running_ != w->second;
        },
        &waiting));
  }
}

}  // namespace internal_stop_token
}  // namespace boundcache
