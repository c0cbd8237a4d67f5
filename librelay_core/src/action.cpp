// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/action.hpp"

namespace relay {

action::action(impl_ptr ptr) noexcept : pimpl_(std::move(ptr)) {
  // nop
}

} // namespace relay
