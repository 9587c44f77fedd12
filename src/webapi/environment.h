#pragma once

// This component provides a registry of the environment variables that can be
// used to override a `CorrelationConfig`, and a function, `lookup`, for
// retrieving their values.

#include <optional>
#include <string_view>

namespace webapi {
namespace correlation {
namespace environment {

// Keep this sorted.  The values must correspond to offsets within
// `variable_names`.
// To ensure that the sorted `enum` names correspond to the sorted
// `variable_names`, each `enum` name must be equal to the corresponding
// environment variable name, but without the leading "WEBAPI_CORRELATION_".
enum Variable {
  FORMAT,
  OPERATION_HEADER,
  OPERATION_INCLUDE_IN_RESPONSE,
  STARTUP_LOGS,
  TRANSACTION_ALLOW_IN_REQUEST,
  TRANSACTION_GENERATE_WHEN_NOT_SPECIFIED,
  TRANSACTION_HEADER,
  TRANSACTION_INCLUDE_IN_RESPONSE,
  UPSTREAM_EXTRACT_FROM_REQUEST,
  UPSTREAM_HEADER,
  UPSTREAM_INCLUDE_IN_RESPONSE,
};

// Keep this sorted.  Offsets into this array are indicated by `Variable`
// values.
inline const char *const variable_names[] = {
    "WEBAPI_CORRELATION_FORMAT",
    "WEBAPI_CORRELATION_OPERATION_HEADER",
    "WEBAPI_CORRELATION_OPERATION_INCLUDE_IN_RESPONSE",
    "WEBAPI_CORRELATION_STARTUP_LOGS",
    "WEBAPI_CORRELATION_TRANSACTION_ALLOW_IN_REQUEST",
    "WEBAPI_CORRELATION_TRANSACTION_GENERATE_WHEN_NOT_SPECIFIED",
    "WEBAPI_CORRELATION_TRANSACTION_HEADER",
    "WEBAPI_CORRELATION_TRANSACTION_INCLUDE_IN_RESPONSE",
    "WEBAPI_CORRELATION_UPSTREAM_EXTRACT_FROM_REQUEST",
    "WEBAPI_CORRELATION_UPSTREAM_HEADER",
    "WEBAPI_CORRELATION_UPSTREAM_INCLUDE_IN_RESPONSE",
};

// Return the name of the specified environment `variable`.
std::string_view name(Variable variable);

// Return the value of the specified environment `variable`, or return
// `std::nullopt` if that variable is not set in the environment.
std::optional<std::string_view> lookup(Variable variable);

}  // namespace environment
}  // namespace correlation
}  // namespace webapi
