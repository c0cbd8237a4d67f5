// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/detail/assert.hpp"

#include <cstdio>
#include <cstdlib>

namespace relay::detail {

void assertion_failed(const char* file, int line, const char* stmt) {
  fprintf(stderr, "%s:%d: requirement failed '%s'\n", file, line, stmt);
  fflush(stderr);
  abort();
}

} // namespace relay::detail
