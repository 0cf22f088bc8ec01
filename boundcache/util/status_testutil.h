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

#ifndef BOUNDCACHE_UTIL_STATUS_TESTUTIL_H_
#define BOUNDCACHE_UTIL_STATUS_TESTUTIL_H_

/// \file
/// GMock matchers for `absl::Status` and `absl::StatusOr`.
///
///   EXPECT_THAT(DoSomething(), ::boundcache::IsOk());
///   EXPECT_THAT(DoSomething(), ::boundcache::IsOkAndHolds(7));
///   EXPECT_THAT(DoSomething(),
///               ::boundcache::StatusIs(absl::StatusCode::kCancelled));
///
///   BOUNDCACHE_EXPECT_OK(DoSomething());
///   BOUNDCACHE_ASSERT_OK_AND_ASSIGN(auto value, DoSomethingElse());

#include <ostream>
#include <utility>

#include <gmock/gmock.h>
#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace boundcache {
namespace internal_status {

inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}

template <typename T>
const absl::Status& GetStatus(const absl::StatusOr<T>& status_or) {
  return status_or.status();
}

}  // namespace internal_status

MATCHER(IsOk, negation ? "is not OK" : "is OK") {
  const absl::Status& status = internal_status::GetStatus(arg);
  if (!status.ok()) *result_listener << "whose status is " << status;
  return status.ok();
}

MATCHER_P(IsOkAndHolds, value_matcher,
          negation ? "isn't OK or has a non-matching value"
                   : "is OK and has a matching value") {
  if (!arg.ok()) {
    *result_listener << "whose status is " << arg.status();
    return false;
  }
  return ::testing::ExplainMatchResult(value_matcher, *arg, result_listener);
}

MATCHER_P(StatusIs, code,
          negation ? "has a different status code" : "has the status code") {
  const absl::Status& status = internal_status::GetStatus(arg);
  *result_listener << "whose status is " << status;
  return status.code() == code;
}

}  // namespace boundcache

#define BOUNDCACHE_EXPECT_OK(expr) EXPECT_THAT(expr, ::boundcache::IsOk())
#define BOUNDCACHE_ASSERT_OK(expr) ASSERT_THAT(expr, ::boundcache::IsOk())

#define BOUNDCACHE_STATUS_CONCAT_INNER_(a, b) a##b
#define BOUNDCACHE_STATUS_CONCAT_(a, b) BOUNDCACHE_STATUS_CONCAT_INNER_(a, b)

/// Asserts that `expr` is OK and assigns its value to `decl`.
#define BOUNDCACHE_ASSERT_OK_AND_ASSIGN(decl, expr)                         \
  BOUNDCACHE_ASSERT_OK_AND_ASSIGN_IMPL_(                                    \
      BOUNDCACHE_STATUS_CONCAT_(_boundcache_status_or_, __LINE__), decl, \
      expr)

#define BOUNDCACHE_ASSERT_OK_AND_ASSIGN_IMPL_(tmp, decl, expr) \
  auto tmp = (expr);                                           \
  ASSERT_THAT(tmp, ::boundcache::IsOk());                      \
  decl = std::move(tmp).value()

#endif  // BOUNDCACHE_UTIL_STATUS_TESTUTIL_H_
