#pragma once

// This component provides an `enum class`, `CorrelationFormat`, that selects
// which of the two mutually exclusive correlation systems `HttpCorrelation`
// uses.

#include <optional>
#include <string_view>

namespace webapi {
namespace correlation {

enum class CorrelationFormat {
  // W3C trace context, read from and written to the "traceparent" header.
  W3C,
  // The deprecated hierarchical system of "Request-Id" and transaction ID
  // headers.
  HIERARCHICAL,
};

// Return the name of the specified `format`: "W3C" or "Hierarchical", or
// "unknown" for any other value.
std::string_view to_string_view(CorrelationFormat format);

// Return the `CorrelationFormat` named by the specified `text`, compared
// without regard to case, or return `std::nullopt` if `text` names no format.
std::optional<CorrelationFormat> parse_correlation_format(
    std::string_view text);

}  // namespace correlation
}  // namespace webapi
