// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#define CATCH_CONFIG_MAIN

#include "core-test.hpp"
