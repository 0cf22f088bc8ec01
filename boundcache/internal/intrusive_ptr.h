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

#ifndef BOUNDCACHE_INTERNAL_INTRUSIVE_PTR_H_
#define BOUNDCACHE_INTERNAL_INTRUSIVE_PTR_H_

/// \file
/// Intrusive reference-counted pointer.
///
/// Cache nodes are shared by the backing store, the eviction order arena and
/// any read-buffer slot that currently names them.  The read buffers publish
/// nodes through `std::atomic<Node*>` slots, which is why the count lives in
/// the node itself rather than in a separate control block:
///
///     class X : public AtomicReferenceCount<X> { ... };
///
///     IntrusivePtr<X> x1(new X);
///     EXPECT_EQ(1, x1->use_count());
///
///     X* raw = x1.get();
///     intrusive_ptr_increment(raw);               // reference owned by a slot
///     IntrusivePtr<X> x2(raw, adopt_object_ref);  // adopted back later

#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace boundcache {
namespace internal {

/// CRTP base class that can be used with `IntrusivePtr` to enable reference
/// counting for objects allocated using `operator new`.
///
/// \tparam Derived The derived class.  When the last reference is released,
///     `intrusive_ptr_decrement` calls `operator delete` using a `Derived*`.
template <typename Derived>
class AtomicReferenceCount {
 public:
  AtomicReferenceCount() noexcept = default;
  AtomicReferenceCount(const AtomicReferenceCount&) noexcept {}
  AtomicReferenceCount& operator=(const AtomicReferenceCount&) noexcept {
    return *this;
  }

  std::uint32_t use_count() const noexcept {
    return ref_count_.load(std::memory_order_acquire);
  }

  friend void intrusive_ptr_increment(const AtomicReferenceCount* p) noexcept {
    p->ref_count_.fetch_add(1, std::memory_order_relaxed);
  }

  friend void intrusive_ptr_decrement(const AtomicReferenceCount* p) noexcept {
    if (p->ref_count_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      delete static_cast<const Derived*>(p);
    }
  }

 private:
  mutable std::atomic<std::uint32_t> ref_count_{0};
};

/// Tag type to indicate that an existing reference to a given object should be
/// adopted.
struct adopt_object_ref_t {
  explicit constexpr adopt_object_ref_t() = default;
};

constexpr adopt_object_ref_t adopt_object_ref{};

/// Intrusive reference-counting smart pointer.
///
/// Requires `intrusive_ptr_increment(T*)` and `intrusive_ptr_decrement(T*)` to
/// be found via argument-dependent lookup, which `AtomicReferenceCount`
/// provides.
template <typename T>
class IntrusivePtr {
 public:
  using element_type = T;
  using pointer = T*;

  ~IntrusivePtr() {
    if (ptr_) intrusive_ptr_decrement(ptr_);
  }

  constexpr IntrusivePtr() noexcept : ptr_(nullptr) {}
  constexpr IntrusivePtr(std::nullptr_t) noexcept : ptr_(nullptr) {}

  /// Acquires a new reference to `p` if it is non-null.
  explicit IntrusivePtr(pointer p) noexcept : ptr_(p) {
    if (ptr_) intrusive_ptr_increment(ptr_);
  }

  /// Takes over an existing reference to `p`.
  constexpr explicit IntrusivePtr(pointer p, adopt_object_ref_t) noexcept
      : ptr_(p) {}

  IntrusivePtr(const IntrusivePtr& rhs) noexcept : IntrusivePtr(rhs.ptr_) {}

  IntrusivePtr& operator=(const IntrusivePtr& rhs) noexcept {
    IntrusivePtr(rhs).swap(*this);
    return *this;
  }

  constexpr IntrusivePtr(IntrusivePtr&& rhs) noexcept
      : ptr_(rhs.release()) {}

  IntrusivePtr& operator=(IntrusivePtr&& rhs) noexcept {
    IntrusivePtr(std::move(rhs)).swap(*this);
    return *this;
  }

  void reset() noexcept { IntrusivePtr().swap(*this); }

  constexpr explicit operator bool() const { return ptr_ != nullptr; }

  constexpr pointer get() const noexcept { return ptr_; }

  constexpr pointer operator->() const {
    assert(ptr_ != nullptr);
    return ptr_;
  }

  constexpr element_type& operator*() const {
    assert(ptr_ != nullptr);
    return *ptr_;
  }

  /// Assigns the stored pointer to null, and returns the prior value without
  /// releasing its reference.
  constexpr pointer release() noexcept {
    pointer ptr = ptr_;
    ptr_ = nullptr;
    return ptr;
  }

  void swap(IntrusivePtr& rhs) noexcept { std::swap(ptr_, rhs.ptr_); }

  template <typename H>
  friend H AbslHashValue(H h, const IntrusivePtr& x) {
    return H::combine(std::move(h), x.get());
  }

  friend bool operator==(const IntrusivePtr& a, const IntrusivePtr& b) {
    return a.ptr_ == b.ptr_;
  }
  friend bool operator!=(const IntrusivePtr& a, const IntrusivePtr& b) {
    return a.ptr_ != b.ptr_;
  }
  friend bool operator==(const IntrusivePtr& p, std::nullptr_t) { return !p; }
  friend bool operator!=(const IntrusivePtr& p, std::nullptr_t) {
    return static_cast<bool>(p);
  }

 private:
  pointer ptr_;
};

/// Allocates `T` and returns the first reference to it.
template <typename T, typename... Args>
inline IntrusivePtr<T> MakeIntrusivePtr(Args&&... args) {
  return IntrusivePtr<T>(new T(std::forward<Args>(args)...));
}

}  // namespace internal
}  // namespace boundcache

#endif  // BOUNDCACHE_INTERNAL_INTRUSIVE_PTR_H_
