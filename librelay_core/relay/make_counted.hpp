// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <utility>

#include "relay/intrusive_ptr.hpp"

namespace relay {

/// Constructs an object of type `T` in an `intrusive_ptr`.
/// @relates ref_counted
template <class T, class... Ts>
intrusive_ptr<T> make_counted(Ts&&... xs) {
  return intrusive_ptr<T>(new T(std::forward<Ts>(xs)...), false);
}

} // namespace relay
