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

#ifndef BOUNDCACHE_REMOVAL_CAUSE_H_
#define BOUNDCACHE_REMOVAL_CAUSE_H_

#include <stdint.h>

#include <iosfwd>
#include <string_view>

namespace boundcache {

/// Reason reported to the removal listener when an entry leaves the cache.
enum class RemovalCause : uint8_t {
  /// Removed by `Remove`, a successful conditional removal, or `Clear`.
  kExplicit,
  /// The value was superseded by `Put` or `Replace`.
  kReplaced,
  /// The key or value was reclaimed by a collector.
  kCollected,
  /// Evicted because the weighted size exceeded the maximum.
  kSize,
  /// The entry's expiration time elapsed.
  kExpired,
};

std::string_view RemovalCauseName(RemovalCause cause);

std::ostream& operator<<(std::ostream& os, RemovalCause cause);

}  // namespace boundcache

#endif  // BOUNDCACHE_REMOVAL_CAUSE_H_
