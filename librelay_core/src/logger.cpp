// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/logger.hpp"

#include <cstring>
#include <iostream>
#include <mutex>

#include "relay/make_counted.hpp"

namespace relay {

namespace {

std::mutex current_logger_mtx;

intrusive_ptr<logger> current_logger_instance;

// Returns the file name without its leading path.
const char* strip_path(const char* file) {
  if (file == nullptr)
    return "";
  auto result = file;
  for (auto i = file; *i != '\0'; ++i)
    if (*i == '/' || *i == '\\')
      result = i + 1;
  return result;
}

class stream_logger : public logger {
public:
  stream_logger(std::ostream& out, unsigned verbosity,
                std::vector<std::string> components)
    : out_(out), verbosity_(verbosity), components_(std::move(components)) {
    // nop
  }

  bool accepts(unsigned level, std::string_view component) override {
    if (level == RELAY_LOG_LEVEL_QUIET || level > verbosity_)
      return false;
    if (components_.empty())
      return true;
    for (auto& name : components_) {
      // Accept exact matches and sub-components separated by a dot.
      if (component.compare(0, name.size(), name) == 0
          && (component.size() == name.size() || component[name.size()] == '.'))
        return true;
    }
    return false;
  }

  void log(unsigned level, std::string_view component, const char* file,
           int line, std::string_view msg) override {
    std::unique_lock guard{mtx_};
    out_ << level_name(level) << ' ' << component << ' ' << strip_path(file)
         << ':' << line << ' ' << msg << std::endl;
  }

private:
  std::mutex mtx_;
  std::ostream& out_;
  unsigned verbosity_;
  std::vector<std::string> components_;
};

} // namespace

// -- line_builder -------------------------------------------------------------

logger::line_builder::line_builder() {
  // nop
}

// -- trace_exit_guard ---------------------------------------------------------

logger::trace_exit_guard::trace_exit_guard(intrusive_ptr<logger> instance,
                                           std::string_view component,
                                           const char* file, int line)
  : instance_(std::move(instance)),
    component_(component),
    file_(file),
    line_(line) {
  // nop
}

logger::trace_exit_guard::~trace_exit_guard() {
  if (instance_ && instance_->accepts(RELAY_LOG_LEVEL_TRACE, component_))
    instance_->log(RELAY_LOG_LEVEL_TRACE, component_, file_, line_, "EXIT");
}

// -- logger -------------------------------------------------------------------

logger::~logger() {
  // nop
}

intrusive_ptr<logger> logger::current_logger() {
  std::unique_lock guard{current_logger_mtx};
  return current_logger_instance;
}

intrusive_ptr<logger> logger::current_logger(intrusive_ptr<logger> ptr) {
  std::unique_lock guard{current_logger_mtx};
  current_logger_instance.swap(ptr);
  return ptr;
}

intrusive_ptr<logger>
logger::make_console_logger(unsigned verbosity,
                            std::vector<std::string> components) {
  return make_stream_logger(std::clog, verbosity, std::move(components));
}

intrusive_ptr<logger>
logger::make_stream_logger(std::ostream& out, unsigned verbosity,
                           std::vector<std::string> components) {
  return make_counted<stream_logger>(out, verbosity, std::move(components));
}

const char* logger::level_name(unsigned level) noexcept {
  switch (level) {
    default:
      return "QUIET";
    case RELAY_LOG_LEVEL_ERROR:
      return "ERROR";
    case RELAY_LOG_LEVEL_WARNING:
      return "WARNING";
    case RELAY_LOG_LEVEL_INFO:
      return "INFO";
    case RELAY_LOG_LEVEL_DEBUG:
      return "DEBUG";
    case RELAY_LOG_LEVEL_TRACE:
      return "TRACE";
  }
}

} // namespace relay
