#pragma once

// This component provides the identifiers of the W3C trace context:
//
// - `TraceID` is a 128-bit trace identifier, the transaction ID of a W3C
//   correlation.  It's written as 32 lower-case hexadecimal characters.
// - `SpanID` is a 64-bit span identifier, the operation ID (or operation
//   parent ID) of a W3C correlation.  It's written as 16 lower-case
//   hexadecimal characters.
//
// An all-zero `TraceID` or `SpanID` is invalid, per the W3C trace context
// recommendation, and so `parse_hex` rejects it.

#include <cstdint>
#include <string>
#include <string_view>

#include "expected.h"

namespace webapi {
namespace correlation {

struct TraceID {
  std::uint64_t low;
  std::uint64_t high;

  TraceID();
  TraceID(std::uint64_t low, std::uint64_t high);

  // Return the 32 character lower-case hexadecimal form of this trace ID.
  std::string hex_padded() const;

  bool is_valid() const;

  // Return a `TraceID` parsed from exactly 32 hexadecimal characters, or an
  // `Error` if `input` has a different length, is not hexadecimal, or is all
  // zeroes.
  static Expected<TraceID> parse_hex(std::string_view input);
};

bool operator==(TraceID, TraceID);
bool operator!=(TraceID, TraceID);

struct SpanID {
  std::uint64_t value;

  SpanID();
  explicit SpanID(std::uint64_t value);

  // Return the 16 character lower-case hexadecimal form of this span ID.
  std::string hex_padded() const;

  bool is_valid() const;

  // Return a `SpanID` parsed from exactly 16 hexadecimal characters, or an
  // `Error` if `input` has a different length, is not hexadecimal, or is all
  // zeroes.
  static Expected<SpanID> parse_hex(std::string_view input);
};

bool operator==(SpanID, SpanID);
bool operator!=(SpanID, SpanID);

}  // namespace correlation
}  // namespace webapi
