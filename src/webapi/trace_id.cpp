#include <webapi/trace_id.h>

#include "hex.h"
#include "parse_util.h"

namespace webapi {
namespace correlation {
namespace {

Expected<std::uint64_t> parse_hex_piece(std::string_view piece,
                                        std::string_view input,
                                        const char* kind, int code) {
  // `parse_uint64` would accept upper-case digits, but the W3C trace context
  // requires lower-case.
  if (!is_lower_hex(piece)) {
    std::string message;
    message += "Unable to parse ";
    message += kind;
    message += " from \"";
    message += input;
    message += "\": expected only lower-case hexadecimal characters.";
    return Error{code, std::move(message)};
  }

  auto result = parse_uint64(piece, 16);
  if (auto* error = result.if_error()) {
    std::string prefix;
    prefix += "Unable to parse ";
    prefix += kind;
    prefix += " from \"";
    prefix += input;
    prefix += "\": ";
    return error->with_prefix(prefix);
  }
  return result;
}

Error wrong_length(std::string_view input, const char* kind,
                   std::size_t expected, int code) {
  std::string message;
  message += "Unable to parse ";
  message += kind;
  message += " from \"";
  message += input;
  message += "\": expected ";
  message += std::to_string(expected);
  message += " characters but got ";
  message += std::to_string(input.size());
  message += '.';
  return Error{code, std::move(message)};
}

Error all_zeroes(std::string_view input, const char* kind, int code) {
  std::string message;
  message += "Invalid ";
  message += kind;
  message += " \"";
  message += input;
  message += "\": all zeroes is not a valid identifier.";
  return Error{code, std::move(message)};
}

}  // namespace

TraceID::TraceID() : low(0), high(0) {}

TraceID::TraceID(std::uint64_t low, std::uint64_t high)
    : low(low), high(high) {}

std::string TraceID::hex_padded() const {
  std::string result = ::webapi::correlation::hex_padded(high);
  result += ::webapi::correlation::hex_padded(low);
  return result;
}

bool TraceID::is_valid() const { return low != 0 || high != 0; }

Expected<TraceID> TraceID::parse_hex(std::string_view input) {
  const int code = Error::INVALID_TRACE_ID;
  if (input.size() != 32) {
    return wrong_length(input, "trace ID", 32, code);
  }

  auto high = parse_hex_piece(input.substr(0, 16), input, "trace ID", code);
  if (auto* error = high.if_error()) {
    return std::move(*error);
  }
  auto low = parse_hex_piece(input.substr(16), input, "trace ID", code);
  if (auto* error = low.if_error()) {
    return std::move(*error);
  }

  TraceID trace_id{*low, *high};
  if (!trace_id.is_valid()) {
    return all_zeroes(input, "trace ID", code);
  }
  return trace_id;
}

bool operator==(TraceID left, TraceID right) {
  return left.low == right.low && left.high == right.high;
}

bool operator!=(TraceID left, TraceID right) { return !(left == right); }

SpanID::SpanID() : value(0) {}

SpanID::SpanID(std::uint64_t value) : value(value) {}

std::string SpanID::hex_padded() const {
  return ::webapi::correlation::hex_padded(value);
}

bool SpanID::is_valid() const { return value != 0; }

Expected<SpanID> SpanID::parse_hex(std::string_view input) {
  const int code = Error::INVALID_SPAN_ID;
  if (input.size() != 16) {
    return wrong_length(input, "span ID", 16, code);
  }

  auto value = parse_hex_piece(input, input, "span ID", code);
  if (auto* error = value.if_error()) {
    return std::move(*error);
  }

  SpanID span_id{*value};
  if (!span_id.is_valid()) {
    return all_zeroes(input, "span ID", code);
  }
  return span_id;
}

bool operator==(SpanID left, SpanID right) { return left.value == right.value; }

bool operator!=(SpanID left, SpanID right) { return !(left == right); }

}  // namespace correlation
}  // namespace webapi
