#pragma once

// This component provides a class, `HttpCorrelation`, that correlates inbound
// HTTP requests and sets the correlation headers of their responses.
//
// Correlating a request means determining the `CorrelationInfo` of the
// request, i.e. its operation ID, transaction ID, and operation parent ID,
// and storing it in a `CorrelationInfoAccessor` for the remainder of the
// request.  How this is done depends on the configured `CorrelationFormat`:
//
// - `CorrelationFormat::W3C`: If the request has a "traceparent" header that
//   is W3C compliant (see `is_w3c_compliant`), then the request continues the
//   trace of its upstream service.  The transaction ID is the trace ID of the
//   "traceparent", the operation parent ID is its parent ID, and the operation
//   ID is a newly generated span ID.  Otherwise, the request starts a new
//   trace with a newly generated trace ID (the transaction ID) and span ID
//   (the operation ID).
//
// - `CorrelationFormat::HIERARCHICAL`: The operation ID is the trace
//   identifier that the host assigned to the request, or is generated.  The
//   transaction ID is read from the configured transaction header, or is
//   generated.  The operation parent ID is read from the upstream service's
//   "Request-Id" header, or is generated, depending on configuration.
//
// A request's trace context is pushed onto the `TraceContextStack` given to
// `HttpCorrelation`, if any, so that trace state, tags, and baggage flow from
// an enclosing trace context into the new one.
//
// An `HttpCorrelation` is cheap to construct, and is meant to be constructed
// once per request along with the request's `CorrelationInfoAccessor`.
//
// `HttpCorrelation` works with headers through the `DictReader` and
// `DictWriter` interfaces.  Hosts that would rather work with their own
// request and response types can derive from `HttpCorrelationTemplate`,
// defined in `http_correlation_template.h`.

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "correlation_config.h"
#include "correlation_info_accessor.h"
#include "dict_reader.h"
#include "dict_writer.h"
#include "http_correlation_result.h"
#include "request_id.h"
#include "trace_context.h"

namespace webapi {
namespace correlation {

class Logger;

class HttpCorrelation {
  // The two ways of correlating a request in the W3C format.
  struct W3CNewParent {};
  struct W3CExistingParent {
    std::string traceparent;
  };
  using W3CParent = std::variant<W3CNewParent, W3CExistingParent>;

  FinalizedCorrelationConfig config_;
  std::shared_ptr<CorrelationInfoAccessor> accessor_;
  TraceContextStack* trace_contexts_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<const RequestIdMatcher> request_id_matcher_;

 public:
  // Create an `HttpCorrelation` that stores the correlation of a request in
  // the specified `accessor` and, for the W3C format, pushes the request's
  // trace context onto the optionally specified `trace_contexts`.  Throw
  // `std::invalid_argument` if `accessor` is null.
  HttpCorrelation(const FinalizedCorrelationConfig& config,
                  std::shared_ptr<CorrelationInfoAccessor> accessor,
                  TraceContextStack* trace_contexts = nullptr);

  // Correlate the request having the specified `headers` and store the
  // resulting `CorrelationInfo` in the accessor.  The optionally specified
  // `trace_identifier` is the ID that the host assigned to the request; if
  // it's not blank, it's used as the operation ID of the hierarchical format.
  // Return whether the request could be correlated, and what to echo back to
  // the upstream service.  Nothing is stored if the result is a failure.
  // Throw `std::logic_error` if the configured format is not known, or if a
  // configured `IDGenerator` returns a blank ID.
  HttpCorrelationResult try_setting_correlation_from_request(
      const DictReader& headers,
      std::optional<std::string_view> trace_identifier = std::nullopt);

  // Set in the specified `response` the correlation headers configured for
  // inclusion in the response, using the `CorrelationInfo` in the accessor
  // and the specified `result` of `try_setting_correlation_from_request`.
  // Headers whose value would be blank are skipped with a warning.
  void set_correlation_headers_in_response(DictWriter& response,
                                           const HttpCorrelationResult& result);

  const FinalizedCorrelationConfig& config() const;

 private:
  W3CParent determine_w3c_parent(const DictReader& headers) const;

  HttpCorrelationResult correlate_w3c(const DictReader& headers,
                                      const W3CNewParent&);
  HttpCorrelationResult correlate_w3c(const DictReader& headers,
                                      const W3CExistingParent&);
  // Return a new trace context for the request having the specified
  // `headers`, carrying over trace state, tags, and baggage.  The IDs of the
  // result are not set.
  TraceContext start_trace_context(const DictReader& headers) const;
  void store(const CorrelationInfo& info, TraceContext context);

  HttpCorrelationResult correlate_hierarchical(
      const DictReader& headers,
      std::optional<std::string_view> trace_identifier);
  std::string determine_operation_id(
      std::optional<std::string_view> trace_identifier);
  std::optional<std::string> determine_transaction_id(
      const std::optional<std::string>& transaction_id_in_request);
  std::optional<std::string> find_request_id(const DictReader& headers);
  std::optional<std::string> extract_parent_id(std::string_view request_id);

  std::string_view upstream_service_header_name() const;
};

}  // namespace correlation
}  // namespace webapi
