#pragma once

// This component provides a class template, `HttpCorrelationTemplate`, that
// adapts `HttpCorrelation` to the request and response types of a particular
// HTTP server.
//
// A host derives from `HttpCorrelationTemplate<Request, Response>` and
// implements two hooks:
//
// - `request_headers`, which returns a `DictReader` over the headers of a
//   request, and
// - `set_http_response_header`, which sets one header of a response.
//
// For example:
//
//     class MyServerCorrelation
//         : public HttpCorrelationTemplate<my::Request, my::Response> {
//      public:
//       using HttpCorrelationTemplate::HttpCorrelationTemplate;
//
//      protected:
//       std::unique_ptr<DictReader> request_headers(
//           const my::Request& request) override {
//         auto headers = std::make_unique<HeaderMap>();
//         for (const auto& [name, value] : request.headers()) {
//           headers->add(name, value);
//         }
//         return headers;
//       }
//
//       void set_http_response_header(my::Response& response,
//                                     std::string_view name,
//                                     std::string_view value) override {
//         response.set_header(std::string(name), std::string(value));
//       }
//     };
//
// The request and response are taken by pointer, as hosts often have them
// only as pointers.  Null arguments are rejected with `std::invalid_argument`.

#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "correlation_config.h"
#include "correlation_info_accessor.h"
#include "dict_reader.h"
#include "dict_writer.h"
#include "header_map.h"
#include "http_correlation.h"
#include "http_correlation_result.h"
#include "logger.h"
#include "trace_context.h"

namespace webapi {
namespace correlation {

template <typename Request, typename Response>
class HttpCorrelationTemplate {
  // `ResponseWriter` sets headers in a `Response` by way of
  // `set_http_response_header`.
  class ResponseWriter : public DictWriter {
    HttpCorrelationTemplate* correlation_;
    Response* response_;

   public:
    ResponseWriter(HttpCorrelationTemplate* correlation, Response* response)
        : correlation_(correlation), response_(response) {}

    void set(std::string_view key, std::string_view value) override {
      correlation_->set_http_response_header(*response_, key, value);
    }
  };

  HttpCorrelation correlation_;

 public:
  HttpCorrelationTemplate(const FinalizedCorrelationConfig& config,
                          std::shared_ptr<CorrelationInfoAccessor> accessor,
                          TraceContextStack* trace_contexts = nullptr)
      : correlation_(config, std::move(accessor), trace_contexts) {}

  virtual ~HttpCorrelationTemplate() {}

  // Correlate the specified `request`.  See
  // `HttpCorrelation::try_setting_correlation_from_request`.  Throw
  // `std::invalid_argument` if `request` is null.
  HttpCorrelationResult try_setting_correlation_from_request(
      const Request* request,
      std::optional<std::string_view> trace_identifier = std::nullopt) {
    if (request == nullptr) {
      throw std::invalid_argument(
          "Requires a HTTP request to determine the HTTP correlation");
    }

    std::unique_ptr<DictReader> headers = request_headers(*request);
    if (!headers) {
      correlation_.config().logger->log_warning([](std::ostream& log) {
        log << "No request headers were available to determine the HTTP "
               "correlation; treating the request as if it had none";
      });
      return correlation_.try_setting_correlation_from_request(HeaderMap{},
                                                               trace_identifier);
    }
    return correlation_.try_setting_correlation_from_request(*headers,
                                                             trace_identifier);
  }

  // Set the correlation headers of the specified `response`.  See
  // `HttpCorrelation::set_correlation_headers_in_response`.  Throw
  // `std::invalid_argument` if `response` or `result` is null.
  void set_correlation_headers_in_response(
      Response* response, const HttpCorrelationResult* result) {
    if (response == nullptr) {
      throw std::invalid_argument(
          "Requires a HTTP response to set the HTTP correlation headers");
    }
    if (result == nullptr) {
      throw std::invalid_argument(
          "Requires a HTTP correlation result to determine if the "
          "correlation headers should be set");
    }

    ResponseWriter writer{this, response};
    correlation_.set_correlation_headers_in_response(writer, *result);
  }

  const FinalizedCorrelationConfig& config() const {
    return correlation_.config();
  }

 protected:
  // Return the headers of the specified `request`, or return null if the
  // request has no headers.
  virtual std::unique_ptr<DictReader> request_headers(
      const Request& request) = 0;

  virtual void set_http_response_header(Response& response,
                                        std::string_view name,
                                        std::string_view value) = 0;
};

}  // namespace correlation
}  // namespace webapi
