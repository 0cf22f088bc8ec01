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

#include "boundcache/internal/log/verbose_flag.h"

#include <stdlib.h>

#include <atomic>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/flags/flag.h"
#include "absl/log/absl_log.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"

ABSL_FLAG(std::string, boundcache_verbose_logging, {},
          "comma-separated list of boundcache verbose logging flags")
    .OnUpdate([]() {
      std::string value = absl::GetFlag(FLAGS_boundcache_verbose_logging);
      if (!value.empty()) {
        boundcache::internal_log::UpdateVerboseLogging(value, true);
      }
    });

namespace boundcache {
namespace internal_log {

constexpr int kMinLevel = -1;
constexpr int kMaxLevel = 1000;

struct LevelConfig {
  int default_level = kMinLevel;
  absl::flat_hash_map<std::string, int> levels;

  int LevelFor(std::string_view name) const {
    auto it = levels.find(name);
    return it == levels.end() ? default_level : it->second;
  }

  void Parse(std::string_view input) {
    for (std::string_view item :
         absl::StrSplit(input, ',', absl::SkipEmpty())) {
      size_t eq = item.rfind('=');
      if (eq == std::string_view::npos) {
        levels.insert_or_assign(std::string(item), 0);
        continue;
      }
      int level;
      if (eq == 0 || !absl::SimpleAtoi(item.substr(eq + 1), &level)) continue;
      if (level < kMinLevel) level = kMinLevel;
      if (level > kMaxLevel) level = kMaxLevel;
      levels.insert_or_assign(std::string(item.substr(0, eq)), level);
    }
    if (auto it = levels.find("all"); it != levels.end()) {
      default_level = it->second;
    }
  }
};

/// Process-wide set of registered flags and the active configuration.
class FlagRegistry {
 public:
  static FlagRegistry& Get() {
    // Never destroyed; flags may be consulted during static destruction.
    static FlagRegistry* registry = new FlagRegistry;
    return *registry;
  }

  int Register(VerboseFlag* flag) ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    int v = flag->value_.load(std::memory_order_relaxed);
    if (v != VerboseFlag::kValueUninitialized) return v;
    v = config_.LevelFor(flag->name_);
    flag->value_.store(v, std::memory_order_relaxed);
    flag->next_ = std::exchange(head_, flag);
    return v;
  }

  void Update(std::string_view input, bool overwrite)
      ABSL_LOCKS_EXCLUDED(mutex_) {
    LevelConfig parsed;
    parsed.Parse(input);

    absl::MutexLock lock(&mutex_);
    if (overwrite) {
      config_ = std::move(parsed);
    } else {
      for (auto& [name, level] : parsed.levels) {
        config_.levels.insert_or_assign(name, level);
      }
      if (parsed.levels.count("all")) {
        config_.default_level = parsed.default_level;
      }
    }
    for (VerboseFlag* flag = head_; flag != nullptr; flag = flag->next_) {
      flag->value_.store(config_.LevelFor(flag->name_),
                         std::memory_order_seq_cst);
    }
  }

 private:
  FlagRegistry() {
    if (const char* env = ::getenv("BOUNDCACHE_VERBOSE_LOGGING")) {
      config_.Parse(env);
    }
  }

  absl::Mutex mutex_;
  LevelConfig config_ ABSL_GUARDED_BY(mutex_);
  VerboseFlag* head_ ABSL_GUARDED_BY(mutex_) = nullptr;
};

void UpdateVerboseLogging(std::string_view input, bool overwrite) {
  ABSL_LOG(INFO) << "--boundcache_verbose_logging=" << input;
  FlagRegistry::Get().Update(input, overwrite);
}

bool VerboseFlag::SlowPath(int observed, int level) {
  if (ABSL_PREDICT_TRUE(observed != kValueUninitialized)) {
    return level <= observed;
  }
  return level <= FlagRegistry::Get().Register(this);
}

static_assert(std::is_trivially_destructible_v<VerboseFlag>);

}  // namespace internal_log
}  // namespace boundcache
