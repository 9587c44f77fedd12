#include <webapi/error.h>
#include <webapi/logger.h>

#include <ostream>

namespace webapi {
namespace correlation {

void Logger::log_error(const Error& error) {
  log_error([&](std::ostream& log) { log << error; });
}

void Logger::log_error(std::string_view message) {
  log_error([&](std::ostream& log) { log << message; });
}

}  // namespace correlation
}  // namespace webapi
