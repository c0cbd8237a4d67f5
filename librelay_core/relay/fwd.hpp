// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <cstddef>

namespace relay {

// -- classes ------------------------------------------------------------------

class action;
class composite_disposable;
class date_scheduler;
class disposable;
class immediate_scheduler;
class logger;
class queue_scheduler;
class ref_counted;
class scheduler;
class serial_disposable;
class test_scheduler;

struct no_error;
struct unit_t;

// -- templates ----------------------------------------------------------------

template <class>
class intrusive_ptr;

template <class T, class E>
class event;

template <class T, class E>
class observer;

template <class T, class E>
class producer;

template <class T, class E>
class result;

template <class T, class E>
class signal;

// -- smart pointer aliases ----------------------------------------------------

using date_scheduler_ptr = intrusive_ptr<date_scheduler>;
using scheduler_ptr = intrusive_ptr<scheduler>;

// -- enums --------------------------------------------------------------------

enum class event_kind;
enum class flatten_strategy;

namespace detail {

template <class>
class atomic_cell;

template <class>
class bag;

class beacon;

} // namespace detail

} // namespace relay
