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

#ifndef BOUNDCACHE_INTERNAL_THREAD_H_
#define BOUNDCACHE_INTERNAL_THREAD_H_

#include <functional>
#include <thread>  // NOLINT
#include <utility>

#include "absl/log/absl_check.h"

namespace boundcache {
namespace internal {

/// Sets the name of the calling thread where the platform supports it.
void TrySetCurrentThreadName(const char* name);

/// Named thread used in place of `std::thread`.  A joinable `Thread` must be
/// joined before it is destroyed.
class Thread {
 public:
  using Id = std::thread::id;

  struct Options {
    const char* name = nullptr;
  };

  Thread() = default;

  template <class Function, class... Args>
  explicit Thread(Options options, Function&& f, Args&&... args)
      : thread_(Start(options, std::forward<Function>(f),
                      std::forward<Args>(args)...)) {}

  Thread(Thread&& other) noexcept = default;
  Thread& operator=(Thread&& other) = default;
  Thread(const Thread&) = delete;
  Thread& operator=(const Thread&) = delete;

  ~Thread() { ABSL_CHECK(!thread_.joinable()); }

  /// Starts a thread that releases its resources when `f` returns.
  template <class Function, class... Args>
  static void StartDetached(Options options, Function&& f, Args&&... args) {
    Start(options, std::forward<Function>(f), std::forward<Args>(args)...)
        .detach();
  }

  void Join() {
    ABSL_CHECK_NE(this_thread_id(), get_id());
    thread_.join();
  }

  Id get_id() const { return thread_.get_id(); }

  static Id this_thread_id() { return std::this_thread::get_id(); }

 private:
  template <class Function, class... Args>
  static std::thread Start(Options options, Function&& f, Args&&... args) {
    return std::thread([name = options.name,
                        fn = std::bind(std::forward<Function>(f),
                                       std::forward<Args>(args)...)]() mutable {
      TrySetCurrentThreadName(name);
      std::move(fn)();
    });
  }

  std::thread thread_;
};

}  // namespace internal
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_THREAD_H_
