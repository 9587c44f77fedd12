#pragma once

// This component provides a `struct`, `CorrelationConfig`, used to configure
// `HttpCorrelation`, and a function, `finalize_config`, that validates a
// `CorrelationConfig` and applies any overrides from the environment.
//
// `CorrelationConfig` has one options `struct` for each category of
// correlation identifier:
//
// - `operation`: the ID of the request itself.
// - `transaction`: the ID of the end-to-end transaction.
// - `upstream_service`: the ID of the upstream operation that sent the
//   request.  Its header is used by the hierarchical format only; the W3C
//   format always uses "traceparent".
//
// The following environment variables, when set, take precedence over the
// corresponding fields of `CorrelationConfig`:
//
//     WEBAPI_CORRELATION_FORMAT                           "w3c" or "hierarchical"
//     WEBAPI_CORRELATION_OPERATION_HEADER                 header name
//     WEBAPI_CORRELATION_OPERATION_INCLUDE_IN_RESPONSE    boolean
//     WEBAPI_CORRELATION_TRANSACTION_HEADER               header name
//     WEBAPI_CORRELATION_TRANSACTION_ALLOW_IN_REQUEST     boolean
//     WEBAPI_CORRELATION_TRANSACTION_GENERATE_WHEN_NOT_SPECIFIED  boolean
//     WEBAPI_CORRELATION_TRANSACTION_INCLUDE_IN_RESPONSE  boolean
//     WEBAPI_CORRELATION_UPSTREAM_HEADER                  header name
//     WEBAPI_CORRELATION_UPSTREAM_EXTRACT_FROM_REQUEST    boolean
//     WEBAPI_CORRELATION_UPSTREAM_INCLUDE_IN_RESPONSE     boolean
//     WEBAPI_CORRELATION_STARTUP_LOGS                     boolean
//
// where a boolean is one of "1", "true", "yes", "0", "false", or "no".

#include <memory>
#include <string>

#include "clock.h"
#include "correlation_format.h"
#include "expected.h"
#include "id_generator.h"
#include "request_id.h"

namespace webapi {
namespace correlation {

class Logger;

struct OperationOptions {
  // Name of the response header that carries the operation ID.
  std::string header_name = "RequestId";
  bool include_in_response = true;
  // Used by the hierarchical format when the host does not supply a trace
  // identifier for the request.
  IDGenerator generate_id = uuid_generator();
};

struct TransactionOptions {
  // Name of the request and response header that carries the transaction ID.
  // Used by the hierarchical format for the request, and by both formats for
  // the response.
  std::string header_name = "X-Transaction-ID";
  // Whether a request may carry its own transaction ID.  If `false`, a
  // request that does fails to correlate.
  bool allow_in_request = true;
  bool generate_when_not_specified = true;
  bool include_in_response = true;
  IDGenerator generate_id = uuid_generator();
};

struct UpstreamServiceOptions {
  // Name of the hierarchical "Request-Id" header of the upstream service.
  std::string header_name = "Request-Id";
  // Whether the operation parent ID is read from `header_name`.  If `false`,
  // a new operation parent ID is generated instead.
  bool extract_from_request = true;
  bool include_in_response = true;
  IDGenerator generate_id = uuid_generator();
};

struct CorrelationConfig {
  CorrelationFormat format = CorrelationFormat::W3C;

  OperationOptions operation;
  TransactionOptions transaction;
  UpstreamServiceOptions upstream_service;

  // If null, a `NullLogger` is used.
  std::shared_ptr<Logger> logger = nullptr;
  // Whether `finalize_config` logs the resulting configuration.
  bool log_on_startup = true;

  // Source of W3C trace and span IDs.  If null, the
  // `default_trace_id_generator()` is used.
  std::shared_ptr<const TraceIDGenerator> trace_id_generator = nullptr;

  // Budget for validating a hierarchical request ID, measured by `clock`.
  Duration request_id_timeout = RequestIdMatcher::default_timeout;
  Clock clock = default_clock;
};

class FinalizedCorrelationConfig {
  friend Expected<FinalizedCorrelationConfig> finalize_config(
      const CorrelationConfig& config);
  FinalizedCorrelationConfig() = default;

 public:
  CorrelationFormat format;

  OperationOptions operation;
  TransactionOptions transaction;
  UpstreamServiceOptions upstream_service;

  std::shared_ptr<Logger> logger;
  bool log_on_startup;

  std::shared_ptr<const TraceIDGenerator> trace_id_generator;

  Duration request_id_timeout;
  Clock clock;
  // Built from `clock` and `request_id_timeout`, and shared by every
  // `HttpCorrelation` created from this configuration.
  std::shared_ptr<const RequestIdMatcher> request_id_matcher;
};

// Return a validated version of the specified `config`, with environment
// overrides applied, or return an `Error` if the result is not valid.  It is
// an error for any header name to be blank, for any `IDGenerator` or the
// `clock` to be null, for `format` to be a value other than those enumerated,
// or for an environment variable to have a value that cannot be parsed.
// If `log_on_startup` is `true`, the resulting configuration is logged using
// `Logger::log_startup`.
Expected<FinalizedCorrelationConfig> finalize_config(
    const CorrelationConfig& config);

// Return a JSON object describing the specified `config`, e.g. for logging.
std::string to_json_string(const FinalizedCorrelationConfig& config);

}  // namespace correlation
}  // namespace webapi
