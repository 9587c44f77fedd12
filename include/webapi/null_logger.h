#pragma once

// This component provides a class, `NullLogger`, that implements the `Logger`
// interface from `logger.h`.
// `NullLogger` is a no-op logger, meaning it doesn't log anything.
//
// `NullLogger` is the default logger used by `HttpCorrelation` unless
// otherwise configured in `CorrelationConfig`.

#include "logger.h"

namespace webapi {
namespace correlation {

class NullLogger : public Logger {
 public:
  void log_error(const LogFunc&) override {}
  void log_warning(const LogFunc&) override {}
  void log_trace(const LogFunc&) override {}
  void log_startup(const LogFunc&) override {}

  void log_error(const Error&) override {}
  void log_error(std::string_view) override {}
};

}  // namespace correlation
}  // namespace webapi
