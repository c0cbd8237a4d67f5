// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <iosfwd>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "relay/config.hpp"
#include "relay/detail/core_export.hpp"
#include "relay/intrusive_ptr.hpp"
#include "relay/ref_counted.hpp"

namespace relay::detail {

/// Pairs a name with a value for printing `name = value` in log output.
template <class T>
struct arg_wrapper {
  const char* name;
  const T& value;
};

template <class T>
arg_wrapper<T> make_arg_wrapper(const char* name, const T& value) {
  return {name, value};
}

template <class T, class = void>
struct has_to_string : std::false_type {};

template <class T>
struct has_to_string<T,
                     std::void_t<decltype(to_string(std::declval<const T&>()))>>
  : std::true_type {};

template <class T>
std::string stringify(const T& x) {
  if constexpr (std::is_convertible_v<const T&, std::string_view>) {
    return std::string{std::string_view{x}};
  } else if constexpr (std::is_same_v<T, bool>) {
    return x ? "true" : "false";
  } else if constexpr (std::is_arithmetic_v<T>) {
    return std::to_string(x);
  } else if constexpr (has_to_string<T>::value) {
    return to_string(x);
  } else {
    std::ostringstream out;
    out << x;
    return out.str();
  }
}

template <class T>
std::string stringify(const arg_wrapper<T>& x) {
  std::string result = x.name;
  result += " = ";
  result += stringify(x.value);
  return result;
}

} // namespace relay::detail

namespace relay {

/// Centrally logs events from all components of relay. Log statements below
/// `RELAY_LOG_LEVEL` compile to no-ops. At runtime, a log statement reaches
/// the process-wide logger only if `accepts` returns `true` for its level
/// and component.
class RELAY_CORE_EXPORT logger : public ref_counted {
public:
  // -- member types -----------------------------------------------------------

  /// Utility class for building user-defined log messages with `RELAY_ARG`.
  class RELAY_CORE_EXPORT line_builder {
  public:
    line_builder();

    template <class T>
    line_builder&& operator<<(const T& x) && {
      if (!str_.empty())
        str_ += " ";
      str_ += detail::stringify(x);
      return std::move(*this);
    }

    std::string get() && {
      return std::move(str_);
    }

  private:
    std::string str_;
  };

  /// Prints an `EXIT` message for a `RELAY_LOG_TRACE` on scope exit.
  class RELAY_CORE_EXPORT trace_exit_guard {
  public:
    trace_exit_guard() = default;

    trace_exit_guard(intrusive_ptr<logger> instance, std::string_view component,
                     const char* file, int line);

    trace_exit_guard(const trace_exit_guard&) = delete;

    trace_exit_guard& operator=(const trace_exit_guard&) = delete;

    ~trace_exit_guard();

  private:
    intrusive_ptr<logger> instance_;
    std::string_view component_;
    const char* file_ = nullptr;
    int line_ = 0;
  };

  // -- constructors, destructors, and assignment operators --------------------

  ~logger() override;

  // -- logging ----------------------------------------------------------------

  /// Returns whether the logger is configured to accept input for given
  /// component and log level.
  virtual bool accepts(unsigned level, std::string_view component) = 0;

  /// Writes a single log line.
  virtual void log(unsigned level, std::string_view component,
                   const char* file, int line, std::string_view msg)
    = 0;

  // -- process-wide instance --------------------------------------------------

  /// Returns the current logger or `nullptr` if none is registered.
  static intrusive_ptr<logger> current_logger();

  /// Sets the current logger and returns the previous instance.
  static intrusive_ptr<logger> current_logger(intrusive_ptr<logger> ptr);

  // -- factories --------------------------------------------------------------

  /// Creates a logger that writes lines of the form
  /// `LEVEL component file:line message` to `std::clog`.
  /// @param verbosity Highest accepted log level.
  /// @param components Accepted component names. An empty list accepts all
  ///                   components, a name also accepts its sub-components,
  ///                   e.g., "relay" accepts "relay.flow".
  static intrusive_ptr<logger>
  make_console_logger(unsigned verbosity,
                      std::vector<std::string> components = {});

  /// Like `make_console_logger`, but writes to `out`.
  /// @warning `out` must outlive the logger.
  static intrusive_ptr<logger>
  make_stream_logger(std::ostream& out, unsigned verbosity,
                     std::vector<std::string> components = {});

  // -- utility functions ------------------------------------------------------

  /// Returns the name of `level`, e.g., "ERROR".
  static const char* level_name(unsigned level) noexcept;
};

} // namespace relay

// -- macro constants ----------------------------------------------------------

#ifndef RELAY_LOG_COMPONENT
/// Name of the current component when logging.
#  define RELAY_LOG_COMPONENT "relay"
#endif // RELAY_LOG_COMPONENT

// -- utility macros -----------------------------------------------------------

/// Concatenates `a` and `b` to a single preprocessor token.
#define RELAY_CAT(a, b) a##b

/// Expands to `argument = <argument>` in log output.
#define RELAY_ARG(argument)                                                    \
  relay::detail::make_arg_wrapper(#argument, argument)

/// Expands to `argname = <argval>` in log output.
#define RELAY_ARG2(argname, argval)                                            \
  relay::detail::make_arg_wrapper(argname, argval)

// -- logging macros -----------------------------------------------------------

#define RELAY_LOG_IMPL(component, loglvl, message)                             \
  do {                                                                         \
    if (auto relay_logger_instance = relay::logger::current_logger();          \
        relay_logger_instance                                                  \
        && relay_logger_instance->accepts(loglvl, component)) {                \
      relay_logger_instance->log(                                              \
        loglvl, component, __FILE__, __LINE__,                                 \
        (relay::logger::line_builder{} << message).get());                     \
    }                                                                          \
  } while (false)

#if RELAY_LOG_LEVEL < RELAY_LOG_LEVEL_TRACE

#  define RELAY_LOG_TRACE(unused) RELAY_VOID_STMT

#else // RELAY_LOG_LEVEL < RELAY_LOG_LEVEL_TRACE

#  define RELAY_LOG_TRACE(entry_message)                                       \
    relay::logger::trace_exit_guard relay_trace_log_auto_guard{                \
      relay::logger::current_logger(), RELAY_LOG_COMPONENT, __FILE__,          \
      __LINE__};                                                               \
    RELAY_LOG_IMPL(RELAY_LOG_COMPONENT, RELAY_LOG_LEVEL_TRACE,                 \
                   "ENTRY" << entry_message)

#endif // RELAY_LOG_LEVEL < RELAY_LOG_LEVEL_TRACE

#if RELAY_LOG_LEVEL >= RELAY_LOG_LEVEL_DEBUG
#  define RELAY_LOG_DEBUG(output)                                              \
    RELAY_LOG_IMPL(RELAY_LOG_COMPONENT, RELAY_LOG_LEVEL_DEBUG, output)
#endif

#if RELAY_LOG_LEVEL >= RELAY_LOG_LEVEL_INFO
#  define RELAY_LOG_INFO(output)                                               \
    RELAY_LOG_IMPL(RELAY_LOG_COMPONENT, RELAY_LOG_LEVEL_INFO, output)
#endif

#if RELAY_LOG_LEVEL >= RELAY_LOG_LEVEL_WARNING
#  define RELAY_LOG_WARNING(output)                                            \
    RELAY_LOG_IMPL(RELAY_LOG_COMPONENT, RELAY_LOG_LEVEL_WARNING, output)
#endif

#if RELAY_LOG_LEVEL >= RELAY_LOG_LEVEL_ERROR
#  define RELAY_LOG_ERROR(output)                                              \
    RELAY_LOG_IMPL(RELAY_LOG_COMPONENT, RELAY_LOG_LEVEL_ERROR, output)
#endif

#ifndef RELAY_LOG_INFO
#  define RELAY_LOG_INFO(output) RELAY_VOID_STMT
#  define RELAY_LOG_INFO_IF(cond, output) RELAY_VOID_STMT
#else // RELAY_LOG_INFO
#  define RELAY_LOG_INFO_IF(cond, output)                                      \
    if (cond)                                                                  \
      RELAY_LOG_IMPL(RELAY_LOG_COMPONENT, RELAY_LOG_LEVEL_INFO, output);       \
    RELAY_VOID_STMT
#endif // RELAY_LOG_INFO

#ifndef RELAY_LOG_DEBUG
#  define RELAY_LOG_DEBUG(output) RELAY_VOID_STMT
#  define RELAY_LOG_DEBUG_IF(cond, output) RELAY_VOID_STMT
#else // RELAY_LOG_DEBUG
#  define RELAY_LOG_DEBUG_IF(cond, output)                                     \
    if (cond)                                                                  \
      RELAY_LOG_IMPL(RELAY_LOG_COMPONENT, RELAY_LOG_LEVEL_DEBUG, output);      \
    RELAY_VOID_STMT
#endif // RELAY_LOG_DEBUG

#ifndef RELAY_LOG_WARNING
#  define RELAY_LOG_WARNING(output) RELAY_VOID_STMT
#  define RELAY_LOG_WARNING_IF(cond, output) RELAY_VOID_STMT
#else // RELAY_LOG_WARNING
#  define RELAY_LOG_WARNING_IF(cond, output)                                   \
    if (cond)                                                                  \
      RELAY_LOG_IMPL(RELAY_LOG_COMPONENT, RELAY_LOG_LEVEL_WARNING, output);    \
    RELAY_VOID_STMT
#endif // RELAY_LOG_WARNING

#ifndef RELAY_LOG_ERROR
#  define RELAY_LOG_ERROR(output) RELAY_VOID_STMT
#  define RELAY_LOG_ERROR_IF(cond, output) RELAY_VOID_STMT
#else // RELAY_LOG_ERROR
#  define RELAY_LOG_ERROR_IF(cond, output)                                     \
    if (cond)                                                                  \
      RELAY_LOG_IMPL(RELAY_LOG_COMPONENT, RELAY_LOG_LEVEL_ERROR, output);      \
    RELAY_VOID_STMT
#endif // RELAY_LOG_ERROR

/// Log component for the flatten engines and sequencing combinators.
#define RELAY_LOG_FLOW_COMPONENT "relay.flow"

#if RELAY_LOG_LEVEL >= RELAY_LOG_LEVEL_DEBUG
#  define RELAY_LOG_FLOW_DEBUG(output)                                         \
    RELAY_LOG_IMPL(RELAY_LOG_FLOW_COMPONENT, RELAY_LOG_LEVEL_DEBUG, output)
#else
#  define RELAY_LOG_FLOW_DEBUG(output) RELAY_VOID_STMT
#endif
