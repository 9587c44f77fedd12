#pragma once

// This component provides an interface, `Logger`, that allows for the
// diagnostics of the correlation process to be reported somewhere.
//
// Messages are passed as a `LogFunc`, which is a function that writes the
// message to a `std::ostream`.  This way, a logger that is not interested in a
// particular level (as is typical for trace-level messages) never pays for
// formatting the message.
//
// Log levels:
//
// - `log_trace`: every extraction and generation decision made while
//   correlating a request.
// - `log_warning`: something that a host integration should probably fix, but
//   that does not stop the correlation, e.g. a response header that could not
//   be written because its value is blank.
// - `log_error`: a request that could not be correlated.
// - `log_startup`: the effective configuration, once, when it is finalized.

#include <functional>
#include <iosfwd>
#include <string_view>

namespace webapi {
namespace correlation {

struct Error;

class Logger {
 public:
  using LogFunc = std::function<void(std::ostream&)>;

  virtual ~Logger() {}

  virtual void log_error(const LogFunc&) = 0;
  virtual void log_warning(const LogFunc&) = 0;
  virtual void log_trace(const LogFunc&) = 0;
  virtual void log_startup(const LogFunc&) = 0;

  virtual void log_error(const Error&);
  virtual void log_error(std::string_view);
};

}  // namespace correlation
}  // namespace webapi
