#pragma once

// This component provides functions for reading the W3C "traceparent" header.
//
// A "traceparent" value has the fixed-width layout
//
//     VV-TTTTTTTTTTTTTTTTTTTTTTTTTTTTTTTT-PPPPPPPPPPPPPPPP-FF
//     0  3                                36               53
//
// where `VV` is the version, `T...` is the 32 hex character trace ID, `P...` is
// the 16 hex character parent span ID, and `FF` are the trace flags.
//
// See https://www.w3.org/TR/trace-context/#traceparent-header

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "expected.h"
#include "trace_id.h"

namespace webapi {
namespace correlation {

constexpr std::string_view traceparent_header = "traceparent";
constexpr std::string_view tracestate_header = "tracestate";
constexpr std::string_view correlation_context_header = "Correlation-Context";

constexpr std::size_t traceparent_size = 55;

// Return whether the specified `traceparent` header value may be continued
// rather than replaced by a new trace.  A value qualifies if it's exactly
// `traceparent_size` characters long and its version is two lower-case
// hexadecimal characters other than the reserved "ff".  An absent value does
// not qualify.
bool is_w3c_compliant(std::optional<std::string_view> traceparent);

struct Traceparent {
  std::uint8_t version;
  TraceID trace_id;
  SpanID parent_span_id;
  std::uint8_t flags;
};

// Return the fields of the specified `traceparent` header value, or return an
// `Error` if any field does not have the layout described above.  The trace ID
// and the parent span ID must not be all zeroes.
Expected<Traceparent> parse_traceparent(std::string_view traceparent);

}  // namespace correlation
}  // namespace webapi
