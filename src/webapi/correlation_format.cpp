#include <webapi/correlation_format.h>

#include <string>

#include "string_util.h"

namespace webapi {
namespace correlation {

std::string_view to_string_view(CorrelationFormat format) {
  switch (format) {
    case CorrelationFormat::W3C:
      return "W3C";
    case CorrelationFormat::HIERARCHICAL:
      return "Hierarchical";
  }
  return "unknown";
}

std::optional<CorrelationFormat> parse_correlation_format(
    std::string_view text) {
  std::string lower{trim(text)};
  to_lower(lower);
  if (lower == "w3c") {
    return CorrelationFormat::W3C;
  }
  if (lower == "hierarchical") {
    return CorrelationFormat::HIERARCHICAL;
  }
  return std::nullopt;
}

}  // namespace correlation
}  // namespace webapi
