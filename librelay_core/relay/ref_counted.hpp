// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <atomic>
#include <cstddef>

#include "relay/detail/core_export.hpp"

namespace relay {

/// Base class for reference counted objects with an atomic reference count.
/// Serves the requirements of @ref intrusive_ptr.
/// @note *All* instances of `ref_counted` start with a reference count of 1.
/// @relates intrusive_ptr
class RELAY_CORE_EXPORT ref_counted {
public:
  virtual ~ref_counted();

  ref_counted() noexcept : rc_(1) {
    // nop
  }

  ref_counted(const ref_counted&) noexcept : rc_(1) {
    // nop
  }

  ref_counted& operator=(const ref_counted&) noexcept {
    return *this;
  }

  /// Increases reference count by one.
  void ref() const noexcept {
    rc_.fetch_add(1, std::memory_order_relaxed);
  }

  /// Decreases reference count by one and calls `delete this` when it drops
  /// to zero.
  void deref() const noexcept;

  /// Queries whether there is exactly one reference.
  bool unique() const noexcept {
    return rc_ == 1;
  }

  size_t get_reference_count() const noexcept {
    return rc_;
  }

  friend void intrusive_ptr_add_ref(const ref_counted* p) noexcept {
    p->ref();
  }

  friend void intrusive_ptr_release(const ref_counted* p) noexcept {
    p->deref();
  }

protected:
  mutable std::atomic<size_t> rc_;
};

} // namespace relay
