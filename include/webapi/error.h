#pragma once

// This component provides a `struct`, `Error`, that contains a code and a
// message describing a failure to configure or to parse correlation data.
//
// `Error` is the error alternative of `Expected`.  Failures that happen while
// correlating a request are not `Error`s: they are reported either as an
// `HttpCorrelationResult` failure or, for misuse and misconfiguration, as an
// exception.

#include <iosfwd>
#include <string>
#include <string_view>

namespace webapi {
namespace correlation {

struct Error;

std::ostream& operator<<(std::ostream&, const Error&);

struct Error {
  int code;
  std::string message;

  std::string to_string() const;
  Error with_prefix(std::string_view) const;

  enum {
    BLANK_HEADER_NAME = 1,
    NULL_ID_GENERATOR = 2,
    UNKNOWN_CORRELATION_FORMAT = 3,
    INVALID_BOOLEAN = 4,
    INVALID_TRACE_ID = 5,
    INVALID_SPAN_ID = 6,
    MALFORMED_TRACEPARENT = 7,
    INVALID_INTEGER = 8,
    OUT_OF_RANGE_INTEGER = 9,
    NULL_CLOCK = 10,
  };
};

}  // namespace correlation
}  // namespace webapi
