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

#include "boundcache/bounded_cache.h"

#include <stddef.h>
#include <stdint.h>

#include <atomic>
#include <functional>
#include <limits>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "boundcache/bounded_cache_options.h"
#include "boundcache/cache_stats.h"
#include "boundcache/internal/cache/bounded_cache_impl.h"
#include "boundcache/internal/cache/drain_status.h"
#include "boundcache/internal/cache/eviction_lock.h"
#include "boundcache/internal/cache/node.h"
#include "boundcache/internal/cache/read_buffer.h"
#include "boundcache/internal/cache/write_buffer.h"
#include "boundcache/internal/intrusive_ptr.h"
#include "boundcache/internal/testing/concurrent.h"
#include "boundcache/internal/thread.h"
#include "boundcache/removal_cause.h"
#include "boundcache/util/executor.h"
#include "boundcache/util/status_testutil.h"
#include "boundcache/util/stop_token.h"

namespace {

using ::boundcache::BoundedCache;
using ::boundcache::BoundedCacheOptions;
using ::boundcache::CacheStats;
using ::boundcache::DetachedThreadExecutor;
using ::boundcache::ExecutorTask;
using ::boundcache::FifoPolicy;
using ::boundcache::kMaximumCapacity;
using ::boundcache::kMaximumEntryWeight;
using ::boundcache::RemovalCause;
using ::boundcache::StatusIs;
using ::boundcache::StopSource;
using ::boundcache::internal::MakeIntrusivePtr;
using ::boundcache::internal::Thread;
using ::boundcache::internal_cache::Access;
using ::boundcache::internal_cache::BoundedCacheImpl;
using ::boundcache::internal_cache::DrainStatus;
using ::boundcache::internal_cache::EvictionLockHolder;
using ::boundcache::internal_cache::kMaxReadBufferStripes;
using ::boundcache::internal_cache::kReadBufferSize;
using ::boundcache::internal_cache::kReadBufferThreshold;
using ::boundcache::internal_cache::WriteTaskKind;
using ::boundcache::internal_testing::Await;
using ::boundcache::internal_testing::TestConcurrent;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;

using Cache = BoundedCache<int, int>;
using Options = BoundedCacheOptions<int, int>;
using Notification = std::tuple<int, int, RemovalCause>;

/// Removal listener that records every notification.
class RecordingListener {
 public:
  Options::RemovalListener listener() {
    return [this](const int& key, const int& value, RemovalCause cause) {
      absl::MutexLock lock(&mutex_);
      notifications_.emplace_back(key, value, cause);
    };
  }

  std::vector<Notification> notifications() {
    absl::MutexLock lock(&mutex_);
    return notifications_;
  }

 private:
  absl::Mutex mutex_;
  std::vector<Notification> notifications_;
};

Options MakeOptions(int64_t maximum_weight) {
  Options options;
  options.maximum_weight = maximum_weight;
  return options;
}

/// Returns the keys in eviction order, victim first.
template <typename CacheType>
std::vector<int> ColdestKeys(CacheType& cache) {
  std::vector<int> keys;
  auto entries = cache.Coldest(std::numeric_limits<size_t>::max());
  EXPECT_THAT(entries, ::boundcache::IsOk());
  if (!entries.ok()) return keys;
  for (const auto& entry : *entries) keys.push_back(entry.first);
  return keys;
}

/// Returns the keys linked in the eviction order without draining.
template <typename Impl>
std::vector<int> LinkedKeys(Impl& impl) {
  std::vector<int> keys;
  EvictionLockHolder lock(&Access::eviction_lock(impl));
  Access::order(impl).ForEach([&](const auto& node) {
    keys.push_back(node.key());
    return true;
  });
  return keys;
}

TEST(BoundedCacheTest, MakeRejectsNegativeMaximum) {
  EXPECT_THAT(Cache::Make(MakeOptions(-1)),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(BoundedCacheTest, MaximumIsClamped) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(
      auto cache, Cache::Make(MakeOptions(std::numeric_limits<int64_t>::max())));
  EXPECT_EQ(kMaximumCapacity, cache.MaximumWeight());

  BOUNDCACHE_EXPECT_OK(cache.SetMaximumWeight(10));
  EXPECT_EQ(10, cache.MaximumWeight());
  EXPECT_THAT(cache.SetMaximumWeight(-1),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_EQ(10, cache.MaximumWeight());
  BOUNDCACHE_EXPECT_OK(
      cache.SetMaximumWeight(std::numeric_limits<int64_t>::max()));
  EXPECT_EQ(kMaximumCapacity, cache.MaximumWeight());
}

TEST(BoundedCacheTest, BasicOperations) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  EXPECT_EQ(std::nullopt, cache.Put(1, 10));
  EXPECT_EQ(10, cache.Put(1, 11));
  EXPECT_EQ(std::nullopt, cache.Put(2, 20));
  EXPECT_EQ(11, cache.Get(1));
  EXPECT_EQ(std::nullopt, cache.Get(3));
  EXPECT_EQ(20, cache.GetQuietly(2));
  EXPECT_TRUE(cache.ContainsKey(2));
  EXPECT_FALSE(cache.ContainsKey(3));
  EXPECT_EQ(2u, cache.Size());
  EXPECT_EQ(2, cache.WeightedSize());
  EXPECT_THAT(cache.Keys(), UnorderedElementsAre(1, 2));

  EXPECT_EQ(20, cache.Remove(2));
  EXPECT_EQ(std::nullopt, cache.Remove(2));
  EXPECT_FALSE(cache.ContainsKey(2));
  EXPECT_EQ(1u, cache.Size());
  EXPECT_EQ(1, cache.WeightedSize());

  EXPECT_EQ(11, cache.PutIfAbsent(1, 12));
  EXPECT_EQ(std::nullopt, cache.PutIfAbsent(3, 30));
  EXPECT_EQ(30, cache.GetQuietly(3));

  EXPECT_EQ(std::nullopt, cache.Replace(4, 40));
  EXPECT_FALSE(cache.ContainsKey(4));
  EXPECT_EQ(30, cache.Replace(3, 31));
  EXPECT_FALSE(cache.Replace(3, 30, 32));
  EXPECT_TRUE(cache.Replace(3, 31, 32));
  EXPECT_EQ(32, cache.GetQuietly(3));
  EXPECT_FALSE(cache.Replace(4, 40, 41));
  EXPECT_EQ(2, cache.WeightedSize());
}

TEST(BoundedCacheTest, Move) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  cache.Put(1, 10);
  Cache moved = std::move(cache);
  EXPECT_EQ(10, moved.Get(1));
  EXPECT_EQ(1u, moved.Size());
}

TEST(BoundedCacheTest, Weigher) {
  RecordingListener listener;
  Options options = MakeOptions(10);
  options.weigher = [](const int&, const int& value) {
    return static_cast<uint32_t>(value);
  };
  options.removal_listener = listener.listener();
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(std::move(options)));
  cache.Put(1, 4);
  cache.Put(2, 5);
  EXPECT_EQ(9, cache.WeightedSize());
  cache.Put(1, 1);
  EXPECT_EQ(6, cache.WeightedSize());

  // Heavier than the maximum: linked and then evicted along with the rest.
  cache.Put(3, 11);
  EXPECT_EQ(0u, cache.Size());
  EXPECT_EQ(0, cache.WeightedSize());
  EXPECT_THAT(listener.notifications(),
              ElementsAre(Notification{1, 4, RemovalCause::kReplaced},
                          Notification{2, 5, RemovalCause::kSize},
                          Notification{1, 1, RemovalCause::kSize},
                          Notification{3, 11, RemovalCause::kSize}));
  EXPECT_EQ(CacheStats(0, 0, 3, 17), cache.Stats());
}

TEST(BoundedCacheDeathTest, WeigherOutOfRange) {
  Options options;
  options.weigher = [](const int&, const int&) {
    return kMaximumEntryWeight + 1;
  };
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(std::move(options)));
  EXPECT_DEATH(cache.Put(1, 1), "out of range weight");
}

TEST(BoundedCacheTest, PutWeightedNoOverflow) {
  Options options = MakeOptions(std::numeric_limits<int64_t>::max());
  options.weigher = [](const int&, const int&) { return kMaximumEntryWeight; };
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(std::move(options)));
  auto& impl = Access::Impl(cache);

  cache.Put(1, 1);
  {
    EvictionLockHolder lock(&Access::eviction_lock(impl));
    Access::set_weighted_size(impl, kMaximumCapacity);
  }
  cache.Put(2, 2);

  EXPECT_EQ(1u, cache.Size());
  EXPECT_TRUE(cache.ContainsKey(2));
  EXPECT_EQ(kMaximumCapacity, cache.WeightedSize());
}

TEST(BoundedCacheTest, EvictAlreadyRemoved) {
  RecordingListener listener;
  Options options = MakeOptions(1);
  options.removal_listener = listener.listener();
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(std::move(options)));
  auto& impl = Access::Impl(cache);

  cache.Put(1, 10);
  auto node = Access::FindNode(impl, 1);
  ASSERT_TRUE(node);

  auto& lock = Access::eviction_lock(impl);
  lock.Lock();
  Thread writer({"writer"}, [&] {
    cache.Put(2, 20);
    cache.Remove(1);
  });
  EXPECT_TRUE(Await([&] { return !cache.ContainsKey(1); }));
  writer.Join();
  EXPECT_TRUE(node->IsRetired());
  EXPECT_EQ(DrainStatus::kRequired, Access::drain_status(impl).load());

  auto removed = Access::DrainBuffersLocked(impl);
  EXPECT_TRUE(node->IsDead());
  lock.Unlock();
  Access::NotifyRemovals(impl, removed);

  EXPECT_THAT(listener.notifications(),
              ElementsAre(Notification{1, 10, RemovalCause::kExplicit}));
  EXPECT_FALSE(node->MakeRetired(RemovalCause::kSize));
  EXPECT_EQ(RemovalCause::kExplicit, node->removal_cause());
  EXPECT_EQ(0, cache.Stats().eviction_count());
  EXPECT_EQ(1u, cache.Size());
  EXPECT_EQ(1, cache.WeightedSize());
}

TEST(BoundedCacheTest, EvictLru) {
  RecordingListener listener;
  Options options = MakeOptions(10);
  options.removal_listener = listener.listener();
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(std::move(options)));

  for (int i = 0; i < 10; ++i) cache.Put(i, -i);
  for (int i = 0; i < 4; ++i) EXPECT_EQ(-i, cache.Get(i));
  for (int i = 10; i < 16; ++i) cache.Put(i, -i);

  EXPECT_THAT(ColdestKeys(cache),
              ElementsAre(10, 0, 1, 2, 3, 11, 12, 13, 14, 15));
  EXPECT_EQ(6, cache.Stats().eviction_count());
  EXPECT_EQ(6, cache.Stats().eviction_weight());
  EXPECT_THAT(listener.notifications(),
              ElementsAre(Notification{4, -4, RemovalCause::kSize},
                          Notification{5, -5, RemovalCause::kSize},
                          Notification{6, -6, RemovalCause::kSize},
                          Notification{7, -7, RemovalCause::kSize},
                          Notification{8, -8, RemovalCause::kSize},
                          Notification{9, -9, RemovalCause::kSize}));
}

TEST(BoundedCacheTest, EvictFifoIgnoresReads) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(
      auto cache, (BoundedCache<int, int, FifoPolicy>::Make(MakeOptions(3))));
  cache.Put(1, 1);
  cache.Put(2, 2);
  cache.Put(3, 3);
  cache.Get(1);
  cache.Put(4, 4);
  EXPECT_FALSE(cache.ContainsKey(1));
  EXPECT_THAT(ColdestKeys(cache), ElementsAre(2, 3, 4));
}

TEST(BoundedCacheTest, EvictLruHonorsReads) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(MakeOptions(3)));
  cache.Put(1, 1);
  cache.Put(2, 2);
  cache.Put(3, 3);
  cache.Get(1);
  cache.Put(4, 4);
  EXPECT_FALSE(cache.ContainsKey(2));
  EXPECT_THAT(ColdestKeys(cache), ElementsAre(3, 1, 4));
}

TEST(BoundedCacheTest, ColdestAndHottestHonorLimit) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  for (int i = 0; i < 5; ++i) cache.Put(i, i * 10);
  EXPECT_THAT(cache.Coldest(2),
              ::boundcache::IsOkAndHolds(ElementsAre(Pair(0, 0), Pair(1, 10))));
  EXPECT_THAT(cache.Hottest(3), ::boundcache::IsOkAndHolds(ElementsAre(
                                    Pair(4, 40), Pair(3, 30), Pair(2, 20))));
  EXPECT_THAT(cache.Coldest(0), ::boundcache::IsOkAndHolds(IsEmpty()));
}

class UpdateRecencyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto cache = Cache::Make();
    ASSERT_TRUE(cache.ok());
    cache_.emplace(*std::move(cache));
    for (int i = 0; i < 3; ++i) cache_->Put(i, i);
  }

  std::optional<Cache> cache_;
};

TEST_F(UpdateRecencyTest, OnGet) {
  EXPECT_EQ(0, cache_->Get(0));
  EXPECT_THAT(ColdestKeys(*cache_), ElementsAre(1, 2, 0));
}

TEST_F(UpdateRecencyTest, OnGetQuietly) {
  auto& impl = Access::Impl(*cache_);
  auto& read_buffer = Access::read_buffer(impl);
  auto& stripe = read_buffer.stripe(read_buffer.CurrentStripe());
  const int64_t write_count = stripe.write_count();
  const int64_t drain_at = stripe.drain_at_write_count();

  EXPECT_EQ(0, cache_->GetQuietly(0));
  EXPECT_EQ(write_count, stripe.write_count());
  EXPECT_EQ(drain_at, stripe.drain_at_write_count());
  EXPECT_THAT(ColdestKeys(*cache_), ElementsAre(0, 1, 2));
  EXPECT_EQ(0, cache_->Stats().request_count());
}

TEST_F(UpdateRecencyTest, OnPutIfAbsent) {
  EXPECT_EQ(0, cache_->PutIfAbsent(0, 100));
  EXPECT_EQ(0, cache_->GetQuietly(0));
  EXPECT_THAT(ColdestKeys(*cache_), ElementsAre(1, 2, 0));
}

TEST_F(UpdateRecencyTest, OnPut) {
  EXPECT_EQ(0, cache_->Put(0, 100));
  EXPECT_THAT(ColdestKeys(*cache_), ElementsAre(1, 2, 0));
  EXPECT_EQ(3, cache_->WeightedSize());
}

TEST_F(UpdateRecencyTest, OnReplace) {
  EXPECT_EQ(0, cache_->Replace(0, 100));
  EXPECT_THAT(ColdestKeys(*cache_), ElementsAre(1, 2, 0));
}

TEST_F(UpdateRecencyTest, OnReplaceConditionally) {
  EXPECT_FALSE(cache_->Replace(0, 5, 100));
  EXPECT_THAT(ColdestKeys(*cache_), ElementsAre(0, 1, 2));
  EXPECT_TRUE(cache_->Replace(0, 0, 100));
  EXPECT_THAT(ColdestKeys(*cache_), ElementsAre(1, 2, 0));
}

TEST(BoundedCacheTest, ExceedsMaximumBufferSizeOnRead) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  auto& impl = Access::Impl(cache);
  cache.Put(1, 1);
  auto node = Access::FindNode(impl, 1);
  auto& stripe = Access::read_buffer(impl).stripe(0);

  stripe.set_write_count(kReadBufferThreshold - 1);
  Access::AfterRead(impl, node.get(), 0);
  EXPECT_EQ(0, stripe.drain_at_write_count());
  EXPECT_EQ(kReadBufferThreshold, stripe.write_count());

  Access::AfterRead(impl, node.get(), 0);
  EXPECT_EQ(kReadBufferThreshold + 1, stripe.drain_at_write_count());
  EXPECT_EQ(kReadBufferThreshold + 1, stripe.read_count());
}

TEST(BoundedCacheTest, ExceedsMaximumBufferSizeOnWrite) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  auto& impl = Access::Impl(cache);
  auto node = MakeIntrusivePtr<boundcache::internal_cache::Node<int, int>>(
      1, 1, 1);

  Access::AfterWrite(impl, {WriteTaskKind::kLink, node});
  EXPECT_TRUE(Access::write_buffer(impl).empty());
  EXPECT_THAT(LinkedKeys(impl), ElementsAre(1));
  EXPECT_TRUE(node->IsLinked());
}

TEST(BoundedCacheTest, DrainOnRead) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  auto& impl = Access::Impl(cache);
  cache.Put(1, 1);
  auto node = Access::FindNode(impl, 1);
  auto& stripe = Access::read_buffer(impl).stripe(0);

  for (int64_t i = 0; i < kReadBufferThreshold; ++i) {
    Access::AfterRead(impl, node.get(), 0);
  }
  EXPECT_EQ(kReadBufferThreshold, stripe.write_count());
  for (int64_t i = 0; i < kReadBufferThreshold; ++i) {
    EXPECT_NE(nullptr, stripe.PeekSlot(i)) << i;
  }

  Access::AfterRead(impl, node.get(), 0);
  EXPECT_EQ(kReadBufferThreshold + 1, stripe.write_count());
  EXPECT_EQ(stripe.write_count(), stripe.read_count());
  for (int64_t i = 0; i < kReadBufferSize; ++i) {
    EXPECT_EQ(nullptr, stripe.PeekSlot(i)) << i;
  }
}

TEST(BoundedCacheTest, DrainOnWrite) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  auto& impl = Access::Impl(cache);
  cache.Put(1, 1);
  cache.Put(2, 2);
  EXPECT_TRUE(Access::write_buffer(impl).empty());
  EXPECT_EQ(DrainStatus::kIdle, Access::drain_status(impl).load());
  EXPECT_THAT(LinkedKeys(impl), ElementsAre(1, 2));
}

TEST(BoundedCacheTest, DrainNonBlocking) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  auto& impl = Access::Impl(cache);
  auto& lock = Access::eviction_lock(impl);

  lock.Lock();
  // Returns without the eviction lock; the write stays buffered.
  cache.Put(1, 1);
  EXPECT_TRUE(cache.ContainsKey(1));
  EXPECT_EQ(DrainStatus::kRequired, Access::drain_status(impl).load());
  EXPECT_FALSE(Access::write_buffer(impl).empty());
  EXPECT_EQ(0, cache.WeightedSize());
  lock.Unlock();

  BOUNDCACHE_EXPECT_OK(cache.CleanUp());
  EXPECT_EQ(DrainStatus::kIdle, Access::drain_status(impl).load());
  EXPECT_EQ(1, cache.WeightedSize());
}

TEST(BoundedCacheTest, DrainSkipsReadOfRemovedEntry) {
  RecordingListener listener;
  Options options;
  options.removal_listener = listener.listener();
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(std::move(options)));
  auto& impl = Access::Impl(cache);
  cache.Put(1, 10);
  cache.Put(2, 20);

  auto& lock = Access::eviction_lock(impl);
  lock.Lock();
  EXPECT_EQ(10, cache.Get(1));
  EXPECT_EQ(10, cache.Remove(1));
  // The unlink is applied before the buffered read of the same node.
  auto removed = Access::DrainBuffersLocked(impl);
  lock.Unlock();
  Access::NotifyRemovals(impl, removed);

  EXPECT_THAT(LinkedKeys(impl), ElementsAre(2));
  EXPECT_EQ(1, cache.WeightedSize());
  EXPECT_THAT(listener.notifications(),
              ElementsAre(Notification{1, 10, RemovalCause::kExplicit}));
}

TEST(BoundedCacheTest, DrainSkipsReadOfReplacedEntry) {
  RecordingListener listener;
  Options options;
  options.removal_listener = listener.listener();
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(std::move(options)));
  auto& impl = Access::Impl(cache);
  cache.Put(1, 10);
  cache.Put(2, 20);
  auto old_node = Access::FindNode(impl, 1);

  auto& lock = Access::eviction_lock(impl);
  lock.Lock();
  EXPECT_EQ(10, cache.Get(1));
  EXPECT_EQ(10, cache.Put(1, 11));
  auto removed = Access::DrainBuffersLocked(impl);
  lock.Unlock();
  Access::NotifyRemovals(impl, removed);

  EXPECT_TRUE(old_node->IsDead());
  EXPECT_FALSE(old_node->IsLinked());
  EXPECT_THAT(LinkedKeys(impl), ElementsAre(2, 1));
  EXPECT_EQ(11, cache.GetQuietly(1));
  EXPECT_EQ(2, cache.WeightedSize());
  EXPECT_THAT(listener.notifications(),
              ElementsAre(Notification{1, 10, RemovalCause::kReplaced}));
}

TEST(BoundedCacheTest, ReadBufferStripesClamped) {
  Options options;
  options.read_buffer_stripes = std::numeric_limits<size_t>::max();
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(std::move(options)));
  EXPECT_EQ(kMaxReadBufferStripes,
            Access::read_buffer(Access::Impl(cache)).num_stripes());
  cache.Put(1, 1);
  EXPECT_EQ(1, cache.Get(1));
}

/// LRU ordering that runs `on_access` for every replayed read, so that work
/// can arrive while a drain is in progress.
struct HookedLruPolicy {
  static constexpr const char kName[] = "hooked_lru";
  static inline std::function<void()> on_access;

  template <typename Order>
  static void OnAccess(Order& order, typename Order::Node* node) {
    order.MoveToBack(node);
    if (on_access) on_access();
  }

  template <typename Order>
  static typename Order::Node* SelectVictim(const Order& order) {
    return order.front();
  }
};

using HookedCache = BoundedCache<int, int, HookedLruPolicy>;
constexpr int kMaxDrainAttempts =
    BoundedCacheImpl<int, int, HookedLruPolicy>::kMaxDrainAttempts;

class DrainRetryTest : public ::testing::Test {
 protected:
  void TearDown() override { HookedLruPolicy::on_access = nullptr; }

  /// Makes every drain pass end with the status `kRequired` and a new read of
  /// key 1 buffered, so the drain never catches up.
  static void RequireDrainOnEveryPass(HookedCache& cache, int* passes) {
    auto& impl = Access::Impl(cache);
    HookedLruPolicy::on_access = [&impl, &cache, passes] {
      ++*passes;
      Access::drain_status(impl).store(DrainStatus::kRequired);
      cache.Get(1);
    };
  }
};

TEST_F(DrainRetryTest, WriteDuringDrainAppliedByNextPass) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, HookedCache::Make());
  auto& impl = Access::Impl(cache);
  cache.Put(1, 1);
  cache.Put(2, 2);

  int calls = 0;
  HookedLruPolicy::on_access = [&] {
    if (calls++ == 0) cache.Put(3, 3);
  };
  EXPECT_EQ(1, cache.Get(1));
  BOUNDCACHE_EXPECT_OK(cache.CleanUp());

  EXPECT_EQ(1, calls);
  EXPECT_EQ(DrainStatus::kIdle, Access::drain_status(impl).load());
  EXPECT_TRUE(Access::write_buffer(impl).empty());
  EXPECT_THAT(LinkedKeys(impl), ElementsAre(2, 1, 3));
  EXPECT_EQ(3, cache.WeightedSize());
}

TEST_F(DrainRetryTest, LeavesRequiredAfterMaxAttempts) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, HookedCache::Make());
  auto& impl = Access::Impl(cache);
  cache.Put(1, 1);

  int passes = 0;
  RequireDrainOnEveryPass(cache, &passes);
  cache.Get(1);
  BOUNDCACHE_EXPECT_OK(cache.CleanUp());
  EXPECT_EQ(kMaxDrainAttempts, passes);
  EXPECT_EQ(DrainStatus::kRequired, Access::drain_status(impl).load());

  HookedLruPolicy::on_access = nullptr;
  BOUNDCACHE_EXPECT_OK(cache.CleanUp());
  EXPECT_EQ(kMaxDrainAttempts, passes);
  EXPECT_EQ(DrainStatus::kIdle, Access::drain_status(impl).load());
}

TEST_F(DrainRetryTest, PendingWorkScheduledOnExecutor) {
  std::vector<ExecutorTask> tasks;
  Options options;
  options.executor = [&tasks](ExecutorTask task) {
    tasks.push_back(std::move(task));
  };
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache,
                                  HookedCache::Make(std::move(options)));
  auto& impl = Access::Impl(cache);
  cache.Put(1, 1);

  int passes = 0;
  RequireDrainOnEveryPass(cache, &passes);
  cache.Get(1);
  BOUNDCACHE_EXPECT_OK(cache.CleanUp());
  EXPECT_EQ(kMaxDrainAttempts, passes);
  EXPECT_EQ(DrainStatus::kRequired, Access::drain_status(impl).load());
  EXPECT_EQ(1u, tasks.size());

  HookedLruPolicy::on_access = nullptr;
  // Each run may schedule a follow-up; run until none is left.
  for (size_t i = 0; i < tasks.size(); ++i) {
    ExecutorTask task = std::move(tasks[i]);
    std::move(task)();
  }
  EXPECT_EQ(1u, tasks.size());
  EXPECT_EQ(DrainStatus::kIdle, Access::drain_status(impl).load());
  EXPECT_EQ(kMaxDrainAttempts, passes);
}

TEST_F(DrainRetryTest, DestructionWaitsForScheduledDrain) {
  std::vector<ExecutorTask> tasks;
  Options options;
  options.executor = [&tasks](ExecutorTask task) {
    tasks.push_back(std::move(task));
  };
  auto cache_or = HookedCache::Make(std::move(options));
  ASSERT_TRUE(cache_or.ok());
  std::optional<HookedCache> cache(*std::move(cache_or));
  cache->Put(1, 1);

  int passes = 0;
  RequireDrainOnEveryPass(*cache, &passes);
  cache->Get(1);
  BOUNDCACHE_EXPECT_OK(cache->CleanUp());
  HookedLruPolicy::on_access = nullptr;
  ASSERT_EQ(1u, tasks.size());

  std::atomic<bool> destroyed{false};
  Thread destroyer({"destroyer"}, [&] {
    cache.reset();
    destroyed = true;
  });
  absl::SleepFor(absl::Milliseconds(50));
  EXPECT_FALSE(destroyed);
  for (size_t i = 0; i < tasks.size(); ++i) {
    ExecutorTask task = std::move(tasks[i]);
    std::move(task)();
  }
  destroyer.Join();
  EXPECT_TRUE(destroyed);
}

TEST(BoundedCacheTest, DrainDeferredToExecutorWhenContended) {
  Options options;
  options.executor = DetachedThreadExecutor();
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(std::move(options)));
  auto& impl = Access::Impl(cache);
  auto& lock = Access::eviction_lock(impl);

  lock.Lock();
  absl::Status cleanup_status;
  Thread waiter({"waiter"}, [&] { cleanup_status = cache.CleanUp(); });
  ASSERT_TRUE(Await([&] { return lock.contended(); }));
  cache.Put(1, 1);
  lock.Unlock();
  waiter.Join();
  BOUNDCACHE_EXPECT_OK(cleanup_status);
  EXPECT_TRUE(Await([&] {
    return cache.WeightedSize() == 1 &&
           Access::drain_status(impl).load() == DrainStatus::kIdle;
  }));
}

/// Runs `op` on another thread while this thread holds the eviction lock, and
/// checks that it completes only after the lock is released.
template <typename Op>
void ExpectBlocksOnEvictionLock(Cache& cache, Op op) {
  auto& impl = Access::Impl(cache);
  auto& lock = Access::eviction_lock(impl);
  std::atomic<bool> done{false};

  lock.Lock();
  Thread thread({"blocked"}, [&] {
    op();
    done = true;
  });
  EXPECT_TRUE(Await([&] { return lock.contended(); }));
  EXPECT_FALSE(done);

  // A non-blocking drain attempt returns while the lock is held.
  Thread drainer({"drainer"}, [&] { Access::TryToDrainBuffers(impl); });
  drainer.Join();
  EXPECT_FALSE(done);
  EXPECT_TRUE(lock.IsHeldByCurrentThread());

  lock.Unlock();
  EXPECT_TRUE(Await([&] { return done.load(); }));
  thread.Join();
  EXPECT_FALSE(lock.is_locked());
}

TEST(BoundedCacheTest, DrainBlocksClear) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  cache.Put(1, 1);
  ExpectBlocksOnEvictionLock(cache,
                             [&] { BOUNDCACHE_EXPECT_OK(cache.Clear()); });
  EXPECT_EQ(0u, cache.Size());
}

TEST(BoundedCacheTest, DrainBlocksOrderedSnapshot) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  cache.Put(1, 1);
  ExpectBlocksOnEvictionLock(cache, [&] {
    EXPECT_THAT(cache.Coldest(10),
                ::boundcache::IsOkAndHolds(ElementsAre(Pair(1, 1))));
  });
}

TEST(BoundedCacheTest, DrainBlocksCapacity) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  cache.Put(1, 1);
  ExpectBlocksOnEvictionLock(
      cache, [&] { BOUNDCACHE_EXPECT_OK(cache.SetMaximumWeight(0)); });
  EXPECT_EQ(0, cache.MaximumWeight());
  EXPECT_EQ(0u, cache.Size());
}

TEST(BoundedCacheTest, ClearCancelled) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  auto& impl = Access::Impl(cache);
  auto& lock = Access::eviction_lock(impl);
  cache.Put(1, 1);

  StopSource stop_source;
  absl::Status status;
  lock.Lock();
  Thread thread({"clear"},
                [&] { status = cache.Clear(stop_source.get_token()); });
  ASSERT_TRUE(Await([&] { return lock.contended(); }));
  stop_source.request_stop();
  thread.Join();
  lock.Unlock();

  EXPECT_THAT(status, StatusIs(absl::StatusCode::kCancelled));
  EXPECT_TRUE(cache.ContainsKey(1));
  EXPECT_EQ(1u, cache.Size());
}

TEST(BoundedCacheTest, ClearNotifiesExplicit) {
  RecordingListener listener;
  Options options;
  options.removal_listener = listener.listener();
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(std::move(options)));
  cache.Put(1, 10);
  cache.Put(2, 20);
  BOUNDCACHE_EXPECT_OK(cache.Clear());
  EXPECT_EQ(0u, cache.Size());
  EXPECT_EQ(0, cache.WeightedSize());
  EXPECT_THAT(cache.Keys(), IsEmpty());
  EXPECT_THAT(listener.notifications(),
              UnorderedElementsAre(Notification{1, 10, RemovalCause::kExplicit},
                                   Notification{2, 20, RemovalCause::kExplicit}));
}

TEST(BoundedCacheTest, SetMaximumWeightEvicts) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  cache.Put(1, 1);
  cache.Put(2, 2);
  cache.Put(3, 3);
  BOUNDCACHE_EXPECT_OK(cache.SetMaximumWeight(1));
  EXPECT_THAT(cache.Keys(), ElementsAre(3));
  EXPECT_EQ(1, cache.WeightedSize());
  EXPECT_EQ(2, cache.Stats().eviction_count());
}

TEST(BoundedCacheTest, ListenerCauses) {
  RecordingListener listener;
  Options options = MakeOptions(2);
  options.removal_listener = listener.listener();
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make(std::move(options)));
  cache.Put(1, 10);
  cache.Put(1, 11);
  cache.Replace(1, 12);
  cache.Put(2, 20);
  cache.Put(3, 30);
  cache.Remove(3);
  EXPECT_THAT(listener.notifications(),
              ElementsAre(Notification{1, 10, RemovalCause::kReplaced},
                          Notification{1, 11, RemovalCause::kReplaced},
                          Notification{1, 12, RemovalCause::kSize},
                          Notification{3, 30, RemovalCause::kExplicit}));
}

TEST(BoundedCacheTest, Stats) {
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto cache, Cache::Make());
  cache.Put(1, 1);
  cache.Get(1);
  cache.Get(1);
  cache.Get(2);
  cache.GetQuietly(2);
  CacheStats stats = cache.Stats();
  EXPECT_EQ(2, stats.hit_count());
  EXPECT_EQ(1, stats.miss_count());
  EXPECT_DOUBLE_EQ(2.0 / 3.0, stats.hit_rate());
}

void RunConcurrentWorkload(Options options) {
  constexpr int64_t kMaximum = 50;
  constexpr int kKeys = 200;
  // Nodes that were mapped at some point; each is notified exactly once.
  std::atomic<int64_t> inserted{0};
  std::atomic<int64_t> notifications{0};
  options.maximum_weight = kMaximum;
  options.removal_listener = [&](const int&, const int&, RemovalCause) {
    ++notifications;
  };
  auto cache_or = Cache::Make(std::move(options));
  ASSERT_TRUE(cache_or.ok());
  Cache cache = *std::move(cache_or);

  auto writer = [&](int offset) {
    for (int i = 0; i < 500; ++i) {
      cache.Put((i * 7 + offset) % kKeys, i);
      ++inserted;
      if (i % 5 == 0) cache.Remove((i + offset) % kKeys);
    }
  };
  TestConcurrent(
      /*num_iterations=*/20,
      /*initialize=*/[] {},
      /*finalize=*/
      [&] {
        BOUNDCACHE_EXPECT_OK(cache.CleanUp());
        EXPECT_LE(cache.WeightedSize(), kMaximum);
        EXPECT_EQ(static_cast<int64_t>(cache.Size()), cache.WeightedSize());
      },
      [&] { writer(0); }, [&] { writer(13); },
      [&] {
        for (int i = 0; i < 1000; ++i) cache.Get(i % kKeys);
      },
      [&] {
        for (int i = 0; i < 1000; ++i) {
          if (!cache.PutIfAbsent(i % kKeys, -i)) ++inserted;
        }
      });

  BOUNDCACHE_EXPECT_OK(cache.Clear());
  EXPECT_EQ(0u, cache.Size());
  EXPECT_EQ(0, cache.WeightedSize());
  // Drains deferred to the executor may still be delivering notifications.
  EXPECT_TRUE(Await([&] { return notifications.load() == inserted.load(); }))
      << notifications.load() << " != " << inserted.load();
}

TEST(BoundedCacheTest, ConcurrentInline) { RunConcurrentWorkload(Options{}); }

TEST(BoundedCacheTest, ConcurrentDetachedExecutor) {
  Options options;
  options.executor = DetachedThreadExecutor();
  RunConcurrentWorkload(std::move(options));
}

}  // namespace
