// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "relay/detail/bag.hpp"
#include "relay/detail/core_export.hpp"
#include "relay/fwd.hpp"
#include "relay/intrusive_ptr.hpp"
#include "relay/make_counted.hpp"
#include "relay/ref_counted.hpp"

namespace relay {

/// Represents a disposable resource.
class RELAY_CORE_EXPORT disposable {
public:
  // -- member types -----------------------------------------------------------

  /// Internal implementation class of a `disposable`.
  class RELAY_CORE_EXPORT impl : public virtual ref_counted {
  public:
    ~impl() override;

    /// Disposes the resource.
    /// @note Calling `dispose()` on a disposed resource is a no-op.
    virtual void dispose() = 0;

    /// Checks whether the resource has been disposed.
    virtual bool disposed() const noexcept = 0;

    disposable as_disposable() noexcept;
  };

  // -- constructors, destructors, and assignment operators --------------------

  explicit disposable(intrusive_ptr<impl> pimpl) noexcept
    : pimpl_(std::move(pimpl)) {
    // nop
  }

  disposable() noexcept = default;

  disposable(disposable&&) noexcept = default;

  disposable(const disposable&) noexcept = default;

  disposable& operator=(disposable&&) noexcept = default;

  disposable& operator=(const disposable&) noexcept = default;

  disposable& operator=(std::nullptr_t) noexcept {
    pimpl_ = nullptr;
    return *this;
  }

  // -- factories --------------------------------------------------------------

  /// Combines multiple disposables into a single disposable. The new disposable
  /// is disposed if all of its elements are disposed. Disposing the composite
  /// disposes all elements individually.
  static disposable make_composite(std::vector<disposable> entries);

  // -- mutators ---------------------------------------------------------------

  /// Disposes the resource. Calling `dispose()` on a disposed resource is a
  /// no-op.
  void dispose() const {
    if (pimpl_)
      pimpl_->dispose();
  }

  /// Exchanges the content of this handle with `other`.
  void swap(disposable& other) noexcept {
    pimpl_.swap(other.pimpl_);
  }

  // -- properties -------------------------------------------------------------

  /// Returns whether the resource has been disposed. An invalid handle
  /// reports `true`.
  [[nodiscard]] bool disposed() const noexcept {
    return pimpl_ ? pimpl_->disposed() : true;
  }

  /// Returns whether this handle still points to a resource.
  [[nodiscard]] bool valid() const noexcept {
    return pimpl_ != nullptr;
  }

  /// Returns `valid()`;
  explicit operator bool() const noexcept {
    return valid();
  }

  /// Returns `!valid()`;
  bool operator!() const noexcept {
    return !valid();
  }

  /// Returns a pointer to the implementation.
  [[nodiscard]] impl* ptr() const noexcept {
    return pimpl_.get();
  }

  // -- conversions ------------------------------------------------------------

  /// Returns a smart pointer to the implementation.
  [[nodiscard]] intrusive_ptr<impl>&& as_intrusive_ptr() && noexcept {
    return std::move(pimpl_);
  }

  /// Returns a smart pointer to the implementation.
  [[nodiscard]] intrusive_ptr<impl> as_intrusive_ptr() const& noexcept {
    return pimpl_;
  }

private:
  intrusive_ptr<impl> pimpl_;
};

/// @relates disposable
using disposable_impl = disposable::impl;

/// @relates disposable
inline bool operator==(const disposable& x, const disposable& y) noexcept {
  return x.ptr() == y.ptr();
}

/// @relates disposable
inline bool operator!=(const disposable& x, const disposable& y) noexcept {
  return x.ptr() != y.ptr();
}

} // namespace relay

namespace relay::detail {

/// Runs a function object once on the first call to `dispose()`.
template <class F>
class anonymous_disposable : public disposable::impl {
public:
  explicit anonymous_disposable(F fn) : fn_(std::move(fn)) {
    // nop
  }

  void dispose() override {
    if (!disposed_.exchange(true)) {
      auto fn = std::move(*fn_);
      fn_.reset();
      fn();
    }
  }

  bool disposed() const noexcept override {
    return disposed_.load();
  }

private:
  std::atomic<bool> disposed_{false};
  std::optional<F> fn_;
};

/// A disposable without any action attached. Only tracks its state.
class RELAY_CORE_EXPORT flag_disposable : public disposable::impl {
public:
  void dispose() override;

  bool disposed() const noexcept override;

private:
  std::atomic<bool> disposed_{false};
};

} // namespace relay::detail

namespace relay {

/// Creates a disposable that calls `f` on the first call to `dispose()`.
/// @relates disposable
template <class F>
disposable make_disposable(F f) {
  using impl_t = detail::anonymous_disposable<F>;
  return disposable{make_counted<impl_t>(std::move(f))};
}

/// Creates a disposable that only tracks whether it has been disposed.
/// @relates disposable
RELAY_CORE_EXPORT disposable make_flag_disposable();

// -- composite disposable -----------------------------------------------------

/// A disposable that owns any number of child disposables. Disposing the
/// composite disposes each child that is still registered exactly once.
/// Adding a child to a disposed composite disposes the child immediately.
class RELAY_CORE_EXPORT composite_disposable {
public:
  // -- member types -----------------------------------------------------------

  class RELAY_CORE_EXPORT impl : public disposable::impl {
  public:
    using token = detail::bag<disposable>::token;

    impl();

    ~impl() override;

    void dispose() override;

    bool disposed() const noexcept override;

    /// Registers `what` as child. Returns `std::nullopt` if this composite
    /// was already disposed, in which case `what` is disposed immediately.
    std::optional<token> add(disposable what);

    /// Removes the child for `key` without disposing it.
    void remove(token key);

    /// Returns the number of registered children.
    size_t size() const;

  private:
    mutable std::mutex mtx_;
    bool disposed_ = false;
    detail::bag<disposable> children_;
  };

  using impl_ptr = intrusive_ptr<impl>;

  /// Removes a single child from its composite again.
  class RELAY_CORE_EXPORT handle {
  public:
    handle() noexcept = default;

    handle(impl_ptr parent, impl::token key) noexcept;

    /// Removes the child from its composite without disposing it. Calling
    /// `remove()` twice or after disposing the composite is a no-op.
    void remove() const;

    /// Returns whether this handle refers to a child.
    bool valid() const noexcept {
      return parent_ != nullptr;
    }

  private:
    impl_ptr parent_;
    impl::token key_ = 0;
  };

  // -- constructors, destructors, and assignment operators --------------------

  explicit composite_disposable(impl_ptr pimpl) noexcept
    : pimpl_(std::move(pimpl)) {
    // nop
  }

  composite_disposable() noexcept = default;

  composite_disposable(composite_disposable&&) noexcept = default;

  composite_disposable(const composite_disposable&) noexcept = default;

  composite_disposable& operator=(composite_disposable&&) noexcept = default;

  composite_disposable& operator=(const composite_disposable&) noexcept
    = default;

  // -- factories --------------------------------------------------------------

  static composite_disposable make();

  // -- mutators ---------------------------------------------------------------

  /// Registers `what` as child. Ignores invalid handles.
  handle add(disposable what) const;

  /// Disposes all children.
  void dispose() const;

  // -- properties -------------------------------------------------------------

  [[nodiscard]] bool disposed() const noexcept;

  [[nodiscard]] bool valid() const noexcept {
    return pimpl_ != nullptr;
  }

  /// Returns the number of registered children.
  [[nodiscard]] size_t size() const;

  // -- conversions ------------------------------------------------------------

  [[nodiscard]] disposable as_disposable() const noexcept {
    return disposable{pimpl_};
  }

private:
  impl_ptr pimpl_;
};

// -- serial disposable --------------------------------------------------------

/// A disposable that holds a single, replaceable child. Replacing the child
/// disposes the previous one.
class RELAY_CORE_EXPORT serial_disposable {
public:
  // -- member types -----------------------------------------------------------

  class RELAY_CORE_EXPORT impl : public disposable::impl {
  public:
    impl();

    ~impl() override;

    void dispose() override;

    bool disposed() const noexcept override;

    void set(disposable what);

    disposable get() const;

  private:
    mutable std::mutex mtx_;
    bool disposed_ = false;
    disposable inner_;
  };

  using impl_ptr = intrusive_ptr<impl>;

  // -- constructors, destructors, and assignment operators --------------------

  explicit serial_disposable(impl_ptr pimpl) noexcept
    : pimpl_(std::move(pimpl)) {
    // nop
  }

  serial_disposable() noexcept = default;

  serial_disposable(serial_disposable&&) noexcept = default;

  serial_disposable(const serial_disposable&) noexcept = default;

  serial_disposable& operator=(serial_disposable&&) noexcept = default;

  serial_disposable& operator=(const serial_disposable&) noexcept = default;

  // -- factories --------------------------------------------------------------

  static serial_disposable make();

  // -- mutators ---------------------------------------------------------------

  /// Replaces the current child with `what` and disposes the previous child.
  /// Disposes `what` immediately if this disposable was already disposed.
  void set(disposable what) const;

  void dispose() const;

  // -- properties -------------------------------------------------------------

  /// Returns the current child.
  [[nodiscard]] disposable get() const;

  [[nodiscard]] bool disposed() const noexcept;

  // -- conversions ------------------------------------------------------------

  [[nodiscard]] disposable as_disposable() const noexcept {
    return disposable{pimpl_};
  }

private:
  impl_ptr pimpl_;
};

} // namespace relay
