// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/disposable.hpp"

#include <algorithm>

namespace relay {

// -- disposable ---------------------------------------------------------------

disposable::impl::~impl() {
  // nop
}

disposable disposable::impl::as_disposable() noexcept {
  return disposable{intrusive_ptr<disposable::impl>{this}};
}

namespace {

class composite_impl : public disposable::impl {
public:
  explicit composite_impl(std::vector<disposable> entries)
    : entries_(std::move(entries)) {
    // nop
  }

  void dispose() override {
    for (auto& entry : entries_)
      entry.dispose();
  }

  bool disposed() const noexcept override {
    auto is_disposed = [](const disposable& entry) {
      return entry.disposed();
    };
    return std::all_of(entries_.begin(), entries_.end(), is_disposed);
  }

private:
  std::vector<disposable> entries_;
};

} // namespace

disposable disposable::make_composite(std::vector<disposable> entries) {
  if (entries.empty())
    return {};
  if (entries.size() == 1)
    return std::move(entries.front());
  return disposable{make_counted<composite_impl>(std::move(entries))};
}

// -- flag disposable ----------------------------------------------------------

namespace detail {

void flag_disposable::dispose() {
  disposed_ = true;
}

bool flag_disposable::disposed() const noexcept {
  return disposed_.load();
}

} // namespace detail

disposable make_flag_disposable() {
  return disposable{make_counted<detail::flag_disposable>()};
}

// -- composite disposable -----------------------------------------------------

composite_disposable::impl::impl() {
  // nop
}

composite_disposable::impl::~impl() {
  // nop
}

void composite_disposable::impl::dispose() {
  std::vector<disposable> children;
  {
    std::unique_lock guard{mtx_};
    if (disposed_)
      return;
    disposed_ = true;
    children = children_.take_values();
  }
  for (auto& child : children)
    child.dispose();
}

bool composite_disposable::impl::disposed() const noexcept {
  std::unique_lock guard{mtx_};
  return disposed_;
}

std::optional<composite_disposable::impl::token>
composite_disposable::impl::add(disposable what) {
  {
    std::unique_lock guard{mtx_};
    if (!disposed_)
      return children_.insert(std::move(what));
  }
  what.dispose();
  return std::nullopt;
}

void composite_disposable::impl::remove(token key) {
  // Release the child outside of the critical section.
  std::optional<disposable> removed;
  std::unique_lock guard{mtx_};
  removed = children_.extract(key);
  guard.unlock();
}

size_t composite_disposable::impl::size() const {
  std::unique_lock guard{mtx_};
  return children_.size();
}

composite_disposable::handle::handle(impl_ptr parent, impl::token key) noexcept
  : parent_(std::move(parent)), key_(key) {
  // nop
}

void composite_disposable::handle::remove() const {
  if (parent_)
    parent_->remove(key_);
}

composite_disposable composite_disposable::make() {
  return composite_disposable{make_counted<impl>()};
}

composite_disposable::handle composite_disposable::add(disposable what) const {
  if (!what)
    return {};
  if (auto key = pimpl_->add(std::move(what)))
    return handle{pimpl_, *key};
  return {};
}

void composite_disposable::dispose() const {
  if (pimpl_)
    pimpl_->dispose();
}

bool composite_disposable::disposed() const noexcept {
  return pimpl_ ? pimpl_->disposed() : true;
}

size_t composite_disposable::size() const {
  return pimpl_ ? pimpl_->size() : 0;
}

// -- serial disposable --------------------------------------------------------

serial_disposable::impl::impl() {
  // nop
}

serial_disposable::impl::~impl() {
  // nop
}

void serial_disposable::impl::dispose() {
  disposable inner;
  {
    std::unique_lock guard{mtx_};
    if (disposed_)
      return;
    disposed_ = true;
    inner.swap(inner_);
  }
  inner.dispose();
}

bool serial_disposable::impl::disposed() const noexcept {
  std::unique_lock guard{mtx_};
  return disposed_;
}

void serial_disposable::impl::set(disposable what) {
  {
    std::unique_lock guard{mtx_};
    if (!disposed_)
      inner_.swap(what);
  }
  // Either the previous child or `what` itself if already disposed.
  what.dispose();
}

disposable serial_disposable::impl::get() const {
  std::unique_lock guard{mtx_};
  return inner_;
}

serial_disposable serial_disposable::make() {
  return serial_disposable{make_counted<impl>()};
}

void serial_disposable::set(disposable what) const {
  pimpl_->set(std::move(what));
}

void serial_disposable::dispose() const {
  if (pimpl_)
    pimpl_->dispose();
}

disposable serial_disposable::get() const {
  return pimpl_ ? pimpl_->get() : disposable{};
}

bool serial_disposable::disposed() const noexcept {
  return pimpl_ ? pimpl_->disposed() : true;
}

} // namespace relay
