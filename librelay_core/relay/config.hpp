// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "relay/detail/build_config.hpp"

#if defined(__clang__)
#  define RELAY_CLANG
#  define RELAY_PRETTY_FUN __PRETTY_FUNCTION__
#elif defined(__GNUC__)
#  define RELAY_GCC
#  define RELAY_PRETTY_FUN __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
#  define RELAY_MSVC
#  define RELAY_PRETTY_FUN __FUNCSIG__
#else
#  define RELAY_PRETTY_FUN __func__
#endif

/// Expands to a no-op.
#define RELAY_VOID_STMT static_cast<void>(0)
