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

#include "boundcache/internal/cache/read_buffer.h"

#include <stddef.h>

#include <atomic>
#include <thread>  // NOLINT

#include "absl/log/absl_check.h"

namespace boundcache {
namespace internal_cache {

size_t RoundUpToPowerOfTwo(size_t n) {
  ABSL_CHECK_LE(n, ~(~size_t{0} >> 1));
  size_t result = 1;
  while (result < n) result <<= 1;
  return result;
}

size_t DefaultReadBufferStripes() {
  size_t concurrency = std::thread::hardware_concurrency();
  return RoundUpToPowerOfTwo(concurrency == 0 ? 1 : concurrency);
}

size_t CurrentThreadStripeHint() {
  static std::atomic<size_t> next_hint{0};
  thread_local const size_t hint =
      next_hint.fetch_add(1, std::memory_order_relaxed);
  return hint;
}

}  // namespace internal_cache
}  // namespace boundcache
