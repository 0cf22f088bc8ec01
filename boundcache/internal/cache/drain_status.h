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

#ifndef BOUNDCACHE_INTERNAL_CACHE_DRAIN_STATUS_H_
#define BOUNDCACHE_INTERNAL_CACHE_DRAIN_STATUS_H_

#include <stdint.h>

#include <iosfwd>

namespace boundcache {
namespace internal_cache {

/// Coordinates which thread is responsible for draining the buffers of one
/// cache.
///
///   kIdle ---(write published)---> kRequired
///   kIdle/kRequired ---(eviction lock acquired)---> kProcessing
///   kProcessing ---(CAS, nothing new arrived)---> kIdle
///   kProcessing ---(write published during drain)---> kRequired
enum class DrainStatus : uint8_t {
  /// No drain is needed.
  kIdle,
  /// A drain is needed; any thread may perform it.
  kRequired,
  /// A drain is in progress.
  kProcessing,
};

std::ostream& operator<<(std::ostream& os, DrainStatus status);

/// Returns whether a read should attempt to drain.
///
/// \param status Current drain status.
/// \param delayable `true` if the read's stripe has fewer pending events than
///     the read buffer threshold.
constexpr bool ShouldDrainBuffers(DrainStatus status, bool delayable) {
  switch (status) {
    case DrainStatus::kIdle:
      return !delayable;
    case DrainStatus::kRequired:
      return true;
    case DrainStatus::kProcessing:
      return false;
  }
  return false;
}

}  // namespace internal_cache
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_CACHE_DRAIN_STATUS_H_
