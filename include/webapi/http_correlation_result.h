#pragma once

// This component provides a class, `HttpCorrelationResult`, that is the
// outcome of correlating an inbound HTTP request.
//
// A successful result may carry a request ID: the value of the upstream
// service's header (the hierarchical "Request-Id", or the W3C "traceparent")
// that will be echoed back in the response.  A failed result carries a
// human-readable reason.  It's up to the host to decide how to respond to a
// request whose correlation failed; typically, the request is rejected.

#include <optional>
#include <string>

namespace webapi {
namespace correlation {

class HttpCorrelationResult {
  bool is_success_;
  std::optional<std::string> request_id_;
  std::optional<std::string> error_message_;

  HttpCorrelationResult(bool is_success,
                        std::optional<std::string> request_id,
                        std::optional<std::string> error_message);

 public:
  static HttpCorrelationResult success(
      std::optional<std::string> request_id = std::nullopt);
  // Throw `std::invalid_argument` if the specified `error_message` is blank.
  static HttpCorrelationResult failure(std::string error_message);

  bool is_success() const;
  explicit operator bool() const;

  // Present only for a successful result, and then only if the correlation
  // produced an ID to echo to the upstream service.
  const std::optional<std::string>& request_id() const;
  // Present if and only if the result is not successful.
  const std::optional<std::string>& error_message() const;
};

}  // namespace correlation
}  // namespace webapi
