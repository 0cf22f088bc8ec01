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

#ifndef BOUNDCACHE_INTERNAL_INTEGER_OVERFLOW_H_
#define BOUNDCACHE_INTERNAL_INTEGER_OVERFLOW_H_

#include <limits>
#include <type_traits>

namespace boundcache {
namespace internal {

/// Sets `*result` to the result of adding `a` and `b` with infinite precision,
/// and returns `true` if the stored value does not equal the infinite precision
/// result.
template <typename T>
constexpr bool AddOverflow(T a, T b, T* result) {
#if defined(__clang__) || !defined(_MSC_VER)
  return __builtin_add_overflow(a, b, result);
#else
  using UnsignedT = std::make_unsigned_t<T>;
  *result = static_cast<T>(static_cast<UnsignedT>(a) +
                           static_cast<UnsignedT>(b));
  return (a > 0 && (b > std::numeric_limits<T>::max() - a)) ||
         (a < 0 && (b < std::numeric_limits<T>::min() - a));
#endif
}

/// Sets `*result` to the result of subtracting `b` from `a` with infinite
/// precision, and returns `true` if the stored value does not equal the
/// infinite precision result.
template <typename T>
constexpr bool SubOverflow(T a, T b, T* result) {
#if defined(__clang__) || !defined(_MSC_VER)
  return __builtin_sub_overflow(a, b, result);
#else
  using UnsignedT = std::make_unsigned_t<T>;
  *result = static_cast<T>(static_cast<UnsignedT>(a) -
                           static_cast<UnsignedT>(b));
  return (b < 0 && (a > std::numeric_limits<T>::max() + b)) ||
         (b > 0 && (a < std::numeric_limits<T>::min() + b));
#endif
}

/// Returns `a + b`, clamped to the range of `T`.
template <typename T>
constexpr T SaturateAdd(T a, T b) {
  static_assert(std::is_integral_v<T>);
  T result;
  if (AddOverflow(a, b, &result)) {
    return b < 0 ? std::numeric_limits<T>::min()
                 : std::numeric_limits<T>::max();
  }
  return result;
}

/// Returns `a - b`, clamped to the range of `T`.
template <typename T>
constexpr T SaturateSub(T a, T b) {
  static_assert(std::is_integral_v<T>);
  T result;
  if (SubOverflow(a, b, &result)) {
    return b < 0 ? std::numeric_limits<T>::max()
                 : std::numeric_limits<T>::min();
  }
  return result;
}

}  // namespace internal
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_INTEGER_OVERFLOW_H_
