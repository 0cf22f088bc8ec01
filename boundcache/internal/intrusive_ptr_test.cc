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

#include "boundcache/internal/intrusive_ptr.h"

#include <utility>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using ::boundcache::internal::adopt_object_ref;
using ::boundcache::internal::AtomicReferenceCount;
using ::boundcache::internal::IntrusivePtr;
using ::boundcache::internal::MakeIntrusivePtr;

struct X : public AtomicReferenceCount<X> {
  explicit X(int* destroyed) : destroyed(destroyed) {}
  ~X() { ++*destroyed; }
  int* destroyed;
};

TEST(IntrusivePtrTest, CopyAndMove) {
  int destroyed = 0;
  {
    IntrusivePtr<X> a = MakeIntrusivePtr<X>(&destroyed);
    EXPECT_EQ(1u, a->use_count());
    IntrusivePtr<X> b = a;
    EXPECT_EQ(2u, a->use_count());
    EXPECT_TRUE(a == b);
    IntrusivePtr<X> c = std::move(b);
    EXPECT_FALSE(b);
    EXPECT_EQ(2u, c->use_count());
    c.reset();
    EXPECT_EQ(1u, a->use_count());
  }
  EXPECT_EQ(1, destroyed);
}

TEST(IntrusivePtrTest, ReleaseAndAdopt) {
  int destroyed = 0;
  IntrusivePtr<X> a = MakeIntrusivePtr<X>(&destroyed);
  X* raw = a.get();
  intrusive_ptr_increment(raw);
  EXPECT_EQ(2u, raw->use_count());
  a.reset();
  EXPECT_EQ(0, destroyed);
  {
    IntrusivePtr<X> adopted(raw, adopt_object_ref);
    EXPECT_EQ(1u, adopted->use_count());
  }
  EXPECT_EQ(1, destroyed);
}

}  // namespace
