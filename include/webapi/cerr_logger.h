#pragma once

// This component provides a class, `CerrLogger`, that implements the `Logger`
// interface by writing one line per message to `std::cerr`.
//
// Trace-level messages are discarded unless `CerrLogger` is constructed with
// `trace_enabled` set to `true`.

#include <mutex>
#include <sstream>

#include "logger.h"

namespace webapi {
namespace correlation {

class CerrLogger : public Logger {
  std::mutex mutex_;
  std::ostringstream stream_;
  const bool trace_enabled_;

 public:
  explicit CerrLogger(bool trace_enabled = false);

  void log_error(const LogFunc&) override;
  void log_warning(const LogFunc&) override;
  void log_trace(const LogFunc&) override;
  void log_startup(const LogFunc&) override;
  using Logger::log_error;

 private:
  void log(const char* level, const LogFunc&);
};

}  // namespace correlation
}  // namespace webapi
