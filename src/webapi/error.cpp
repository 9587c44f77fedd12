#include <webapi/error.h>

#include <ostream>
#include <sstream>

namespace webapi {
namespace correlation {

std::ostream& operator<<(std::ostream& stream, const Error& error) {
  return stream << "[error code " << int(error.code) << "] " << error.message;
}

std::string Error::to_string() const {
  std::ostringstream stream;
  stream << *this;
  return stream.str();
}

Error Error::with_prefix(std::string_view prefix) const {
  Error result = *this;
  result.message.insert(result.message.begin(), prefix.begin(), prefix.end());
  return result;
}

}  // namespace correlation
}  // namespace webapi
