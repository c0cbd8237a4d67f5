// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/ref_counted.hpp"

namespace relay {

ref_counted::~ref_counted() {
  // nop
}

void ref_counted::deref() const noexcept {
  if (unique()) {
    delete this;
    return;
  }
  if (rc_.fetch_sub(1, std::memory_order_acq_rel) == 1)
    delete this;
}

} // namespace relay
