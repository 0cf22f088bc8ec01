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

#ifndef BOUNDCACHE_UTIL_STOP_TOKEN_H_
#define BOUNDCACHE_UTIL_STOP_TOKEN_H_

/// \file
///
/// Cooperative cancellation modeled on the C++20 `stop_token` library.
///
/// Blocking cache operations accept a `StopToken`; a waiting caller is woken
/// when a stop is requested and the operation fails with
/// `absl::CancelledError`.
///
///     boundcache::StopSource source;
///     bool called = false;
///     boundcache::StopCallback callback(source.get_token(),
///                                       [&] { called = true; });
///     EXPECT_FALSE(called);
///     EXPECT_TRUE(source.request_stop());
///     EXPECT_TRUE(called);

#include <atomic>
#include <thread>  // NOLINT
#include <type_traits>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "boundcache/internal/intrusive_ptr.h"

namespace boundcache {
namespace internal_stop_token {

struct StopCallbackBase {
  using Invoker = void (*)(StopCallbackBase&);

  StopCallbackBase* prev = nullptr;
  StopCallbackBase* next = nullptr;
  Invoker invoker = nullptr;
};

class StopState : public internal::AtomicReferenceCount<StopState> {
 public:
  bool stop_requested() const {
    return stop_requested_.load(std::memory_order_acquire);
  }

  /// Marks the state stopped and runs every registered callback, each with
  /// the mutex released.  Returns `false` if a stop was already requested.
  bool RequestStop() ABSL_LOCKS_EXCLUDED(mutex_);

  /// Registers `callback`, or invokes it in the current thread if a stop has
  /// already been requested.
  void Register(StopCallbackBase& callback) ABSL_LOCKS_EXCLUDED(mutex_);

  /// Unregisters `callback`.  Blocks while another thread is running it.
  void Unregister(StopCallbackBase& callback) ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  bool IsRegistered(StopCallbackBase& callback) const
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return callback.next != nullptr;
  }

  absl::Mutex mutex_;
  std::atomic<bool> stop_requested_{false};
  // Dummy head of the circular list of registered callbacks.
  StopCallbackBase head_ ABSL_GUARDED_BY(mutex_);
  bool head_initialized_ ABSL_GUARDED_BY(mutex_) = false;
  StopCallbackBase* running_ ABSL_GUARDED_BY(mutex_) = nullptr;
  std::thread::id running_thread_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace internal_stop_token

/// Observes whether a stop has been requested on the associated `StopSource`.
///
/// A default-constructed token can never be stopped.
class StopToken {
 public:
  StopToken() noexcept = default;

  [[nodiscard]] bool stop_possible() const noexcept {
    return state_ != nullptr;
  }

  [[nodiscard]] bool stop_requested() const noexcept {
    return state_ != nullptr && state_->stop_requested();
  }

  friend bool operator==(const StopToken& a, const StopToken& b) {
    return a.state_ == b.state_;
  }
  friend bool operator!=(const StopToken& a, const StopToken& b) {
    return !(a == b);
  }

 private:
  friend class StopSource;
  template <typename Callback>
  friend class StopCallback;

  explicit StopToken(internal::IntrusivePtr<internal_stop_token::StopState> s)
      : state_(std::move(s)) {}

  internal::IntrusivePtr<internal_stop_token::StopState> state_;
};

/// Requests a stop.  Once requested, a stop cannot be withdrawn.
class StopSource {
 public:
  StopSource()
      : state_(internal::MakeIntrusivePtr<internal_stop_token::StopState>()) {}

  /// Creates a source that can never be stopped.
  explicit StopSource(std::nullptr_t) noexcept {}

  [[nodiscard]] bool stop_possible() const noexcept {
    return state_ != nullptr;
  }

  [[nodiscard]] bool stop_requested() const noexcept {
    return state_ != nullptr && state_->stop_requested();
  }

  /// Requests a stop, invoking the registered callbacks.  Returns `true` only
  /// for the first request.
  bool request_stop() const {
    return state_ != nullptr && state_->RequestStop();
  }

  [[nodiscard]] StopToken get_token() const noexcept {
    return StopToken(state_);
  }

 private:
  internal::IntrusivePtr<internal_stop_token::StopState> state_;
};

/// Runs `Callback` when a stop is requested on the token's source.
///
/// If a stop was already requested, the callback runs in the constructor.
/// Otherwise it runs in the thread that calls `request_stop`, unless the
/// `StopCallback` is destroyed first.  Destruction waits for an invocation in
/// progress on another thread.
template <typename Callback>
class StopCallback : private internal_stop_token::StopCallbackBase {
  static_assert(std::is_invocable_v<Callback&>);

 public:
  template <typename C>
  StopCallback(const StopToken& token, C&& callback)
      : callback_(std::forward<C>(callback)), state_(token.state_) {
    if (!state_) return;
    invoker = &StopCallback::Invoke;
    state_->Register(*this);
  }

  StopCallback(const StopCallback&) = delete;
  StopCallback& operator=(const StopCallback&) = delete;

  ~StopCallback() {
    if (state_) state_->Unregister(*this);
  }

 private:
  static void Invoke(internal_stop_token::StopCallbackBase& self) {
    static_cast<StopCallback&>(self).callback_();
  }

  Callback callback_;
  internal::IntrusivePtr<internal_stop_token::StopState> state_;
};

template <typename Callback>
StopCallback(StopToken, Callback) -> StopCallback<Callback>;

}  // namespace boundcache

#endif  // BOUNDCACHE_UTIL_STOP_TOKEN_H_
