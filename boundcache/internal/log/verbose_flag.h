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

#ifndef BOUNDCACHE_INTERNAL_LOG_VERBOSE_FLAG_H_
#define BOUNDCACHE_INTERNAL_LOG_VERBOSE_FLAG_H_

#include <atomic>
#include <limits>
#include <string_view>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"

namespace boundcache {
namespace internal_log {

/// Applies a verbose logging configuration.
///
/// `input` is a comma separated list of `name` or `name=level` items.  A bare
/// name enables level 0.  The special name `all` sets the level used by flags
/// not named explicitly.  Levels are clamped to `[-1, 1000]`; -1 disables.
///
/// When `overwrite` is false, names not mentioned in `input` keep their
/// previous levels.
void UpdateVerboseLogging(std::string_view input, bool overwrite);

/// Named switch for verbose log sites.
///
/// The level for a name comes from the `--boundcache_verbose_logging` flag,
/// the `BOUNDCACHE_VERBOSE_LOGGING` environment variable (read on first use),
/// or `UpdateVerboseLogging`.  Flags must have static storage duration:
///
///   namespace {
///   ABSL_CONST_INIT internal_log::VerboseFlag bounded_cache_logging(
///       "bounded_cache");
///   }
///   ABSL_LOG_IF(INFO, bounded_cache_logging) << "drained " << n;
///   ABSL_LOG_IF(INFO, bounded_cache_logging.Level(1)) << "evicted " << key;
class VerboseFlag {
 public:
  static constexpr int kValueUninitialized = std::numeric_limits<int>::max();

  explicit constexpr VerboseFlag(const char* name)
      : value_(kValueUninitialized), name_(name), next_(nullptr) {}

  VerboseFlag(const VerboseFlag&) = delete;
  VerboseFlag& operator=(const VerboseFlag&) = delete;

  const char* name() const { return name_; }

  /// Returns whether logging at `level` (>= 0) is enabled.
  ABSL_ATTRIBUTE_ALWAYS_INLINE
  bool Level(int level) {
    int v = value_.load(std::memory_order_relaxed);
    if (ABSL_PREDICT_TRUE(level > v)) return false;
    return SlowPath(v, level);
  }

  /// Equivalent to `Level(0)`.
  ABSL_ATTRIBUTE_ALWAYS_INLINE
  operator bool() { return Level(0); }

 private:
  bool SlowPath(int observed, int level);

  friend class FlagRegistry;

  std::atomic<int> value_;
  const char* const name_;
  VerboseFlag* next_;  // Guarded by the registry mutex.
};

}  // namespace internal_log
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_LOG_VERBOSE_FLAG_H_
