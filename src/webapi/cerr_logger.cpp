#include <webapi/cerr_logger.h>

#include <iostream>

namespace webapi {
namespace correlation {

CerrLogger::CerrLogger(bool trace_enabled) : trace_enabled_(trace_enabled) {}

void CerrLogger::log_error(const LogFunc& write) { log("error", write); }

void CerrLogger::log_warning(const LogFunc& write) { log("warning", write); }

void CerrLogger::log_trace(const LogFunc& write) {
  if (!trace_enabled_) {
    return;
  }
  log("trace", write);
}

void CerrLogger::log_startup(const LogFunc& write) { log("startup", write); }

void CerrLogger::log(const char* level, const LogFunc& write) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_.str("");
  stream_ << "[webapi-correlation " << level << "] ";
  write(stream_);
  std::cerr << stream_.str() << '\n';
}

}  // namespace correlation
}  // namespace webapi
