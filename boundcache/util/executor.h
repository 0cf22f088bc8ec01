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

#ifndef BOUNDCACHE_UTIL_EXECUTOR_H_
#define BOUNDCACHE_UTIL_EXECUTOR_H_

/// \file
/// Minimal task executor support.
///
/// An executor is a function object callable with a nullary task.  The task
/// must either be invoked immediately (inline) or in another thread.

#include <functional>
#include <utility>

#include "absl/functional/any_invocable.h"

namespace boundcache {

/// Type-erased, move-only nullary task.
using ExecutorTask = absl::AnyInvocable<void() &&>;

/// Type-erased executor.
using Executor = std::function<void(ExecutorTask)>;

/// Executor that runs each task immediately in the calling thread.
class InlineExecutor {
 public:
  template <typename Func>
  void operator()(Func&& func) const {
    std::forward<Func>(func)();
  }
};

/// Returns an executor that runs each task on its own detached thread.
Executor DetachedThreadExecutor();

}  // namespace boundcache

#endif  // BOUNDCACHE_UTIL_EXECUTOR_H_
