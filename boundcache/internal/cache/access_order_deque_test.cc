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

#include "boundcache/internal/cache/access_order_deque.h"

#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "boundcache/internal/cache/eviction_policy.h"
#include "boundcache/internal/cache/node.h"
#include "boundcache/internal/intrusive_ptr.h"

namespace {

using ::boundcache::internal::MakeIntrusivePtr;
using ::boundcache::internal_cache::AccessOrderDeque;
using ::boundcache::internal_cache::FifoPolicy;
using ::boundcache::internal_cache::LruPolicy;
using ::boundcache::internal_cache::Node;
using ::boundcache::internal_cache::NodePtr;
using ::testing::ElementsAre;

using TestNode = Node<int, int>;
using Deque = AccessOrderDeque<TestNode>;

std::vector<int> Keys(const Deque& deque) {
  std::vector<int> keys;
  deque.ForEach([&](const TestNode& node) {
    keys.push_back(node.key());
    return true;
  });
  return keys;
}

std::vector<int> ReverseKeys(const Deque& deque) {
  std::vector<int> keys;
  deque.ForEachReverse([&](const TestNode& node) {
    keys.push_back(node.key());
    return true;
  });
  return keys;
}

std::vector<NodePtr<int, int>> MakeNodes(int n) {
  std::vector<NodePtr<int, int>> nodes;
  for (int i = 0; i < n; ++i) {
    nodes.push_back(MakeIntrusivePtr<TestNode>(i, -i, 1));
  }
  return nodes;
}

TEST(AccessOrderDequeTest, Empty) {
  Deque deque;
  EXPECT_TRUE(deque.empty());
  EXPECT_EQ(nullptr, deque.front());
  EXPECT_EQ(nullptr, deque.back());
  EXPECT_FALSE(deque.PopFront());
}

TEST(AccessOrderDequeTest, PushBackKeepsInsertionOrder) {
  Deque deque;
  auto nodes = MakeNodes(5);
  for (auto& node : nodes) deque.PushBack(node);
  EXPECT_EQ(5u, deque.size());
  EXPECT_THAT(Keys(deque), ElementsAre(0, 1, 2, 3, 4));
  EXPECT_THAT(ReverseKeys(deque), ElementsAre(4, 3, 2, 1, 0));
  EXPECT_EQ(nodes[0].get(), deque.front());
  EXPECT_EQ(nodes[4].get(), deque.back());
  // The deque holds its own reference.
  EXPECT_EQ(2u, nodes[0]->use_count());
}

TEST(AccessOrderDequeTest, MoveAndRemove) {
  Deque deque;
  auto nodes = MakeNodes(4);
  for (auto& node : nodes) deque.PushBack(node);

  deque.MoveToBack(nodes[1].get());
  EXPECT_THAT(Keys(deque), ElementsAre(0, 2, 3, 1));

  // Already at the back: no change.
  deque.MoveToBack(nodes[1].get());
  EXPECT_THAT(Keys(deque), ElementsAre(0, 2, 3, 1));

  auto removed = deque.Remove(nodes[2].get());
  EXPECT_EQ(nodes[2], removed);
  EXPECT_FALSE(nodes[2]->IsLinked());
  EXPECT_FALSE(deque.Contains(nodes[2].get()));
  EXPECT_THAT(Keys(deque), ElementsAre(0, 3, 1));

  auto front = deque.PopFront();
  EXPECT_EQ(0, front->key());
  EXPECT_THAT(Keys(deque), ElementsAre(3, 1));
}

TEST(AccessOrderDequeTest, ReusesReleasedSlots) {
  Deque deque;
  auto nodes = MakeNodes(3);
  deque.PushBack(nodes[0]);
  deque.PushBack(nodes[1]);
  const uint32_t slot = nodes[0]->order_slot();
  deque.Remove(nodes[0].get());
  deque.PushBack(nodes[2]);
  EXPECT_EQ(slot, nodes[2]->order_slot());
  EXPECT_THAT(Keys(deque), ElementsAre(1, 2));
}

TEST(AccessOrderDequeTest, ForEachStopsEarly) {
  Deque deque;
  auto nodes = MakeNodes(5);
  for (auto& node : nodes) deque.PushBack(node);
  std::vector<int> keys;
  deque.ForEach([&](const TestNode& node) {
    if (keys.size() == 2) return false;
    keys.push_back(node.key());
    return true;
  });
  EXPECT_THAT(keys, ElementsAre(0, 1));
}

TEST(AccessOrderDequeTest, ReleasesReferencesOnDestruction) {
  auto nodes = MakeNodes(2);
  {
    Deque deque;
    for (auto& node : nodes) deque.PushBack(node);
    EXPECT_EQ(2u, nodes[1]->use_count());
  }
  EXPECT_EQ(1u, nodes[1]->use_count());
  EXPECT_FALSE(nodes[1]->IsLinked());
}

TEST(EvictionPolicyTest, Lru) {
  Deque deque;
  auto nodes = MakeNodes(3);
  for (auto& node : nodes) deque.PushBack(node);
  LruPolicy::OnAccess(deque, nodes[0].get());
  EXPECT_THAT(Keys(deque), ElementsAre(1, 2, 0));
  EXPECT_EQ(nodes[1].get(), LruPolicy::SelectVictim(deque));
}

TEST(EvictionPolicyTest, Fifo) {
  Deque deque;
  auto nodes = MakeNodes(3);
  for (auto& node : nodes) deque.PushBack(node);
  FifoPolicy::OnAccess(deque, nodes[0].get());
  EXPECT_THAT(Keys(deque), ElementsAre(0, 1, 2));
  EXPECT_EQ(nodes[0].get(), FifoPolicy::SelectVictim(deque));
}

}  // namespace
