#include <webapi/w3c_propagation.h>

#include "parse_util.h"

namespace webapi {
namespace correlation {
namespace {

constexpr std::size_t version_begin = 0;
constexpr std::size_t trace_id_begin = 3;
constexpr std::size_t trace_id_size = 32;
constexpr std::size_t parent_id_begin = 36;
constexpr std::size_t parent_id_size = 16;
constexpr std::size_t flags_begin = 53;

bool is_hex_digit(char ch) {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
}

Error malformed(std::string_view traceparent, std::string_view reason) {
  std::string message;
  message += "Malformed traceparent \"";
  message += traceparent;
  message += "\": ";
  message += reason;
  return Error{Error::MALFORMED_TRACEPARENT, std::move(message)};
}

}  // namespace

bool is_w3c_compliant(std::optional<std::string_view> traceparent) {
  if (!traceparent || traceparent->size() != traceparent_size) {
    return false;
  }

  const auto& id = *traceparent;
  if (!is_hex_digit(id[version_begin]) || !is_hex_digit(id[version_begin + 1])) {
    return false;
  }

  return id[version_begin] != 'f' || id[version_begin + 1] != 'f';
}

Expected<Traceparent> parse_traceparent(std::string_view traceparent) {
  if (traceparent.size() != traceparent_size) {
    return malformed(traceparent, "expected 55 characters.");
  }
  if (traceparent[trace_id_begin - 1] != '-' ||
      traceparent[parent_id_begin - 1] != '-' ||
      traceparent[flags_begin - 1] != '-') {
    return malformed(traceparent,
                     "expected \"-\" between version, trace ID, parent ID, "
                     "and flags.");
  }

  Traceparent result;

  const auto version = traceparent.substr(version_begin, 2);
  if (!is_lower_hex(version) || version == "ff") {
    return malformed(traceparent, "invalid version.");
  }
  result.version = std::uint8_t(*parse_uint64(version, 16));

  auto trace_id =
      TraceID::parse_hex(traceparent.substr(trace_id_begin, trace_id_size));
  if (auto* error = trace_id.if_error()) {
    return std::move(*error);
  }
  result.trace_id = *trace_id;

  auto parent_id =
      SpanID::parse_hex(traceparent.substr(parent_id_begin, parent_id_size));
  if (auto* error = parent_id.if_error()) {
    return std::move(*error);
  }
  result.parent_span_id = *parent_id;

  const auto flags = traceparent.substr(flags_begin, 2);
  if (!is_lower_hex(flags)) {
    return malformed(traceparent, "invalid trace flags.");
  }
  result.flags = std::uint8_t(*parse_uint64(flags, 16));

  return result;
}

}  // namespace correlation
}  // namespace webapi
