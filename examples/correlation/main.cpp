#include <webapi/cerr_logger.h>
#include <webapi/correlation_config.h>
#include <webapi/correlation_format.h>
#include <webapi/error.h>
#include <webapi/header_map.h>
#include <webapi/http_correlation_template.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace wc = webapi::correlation;

// A request as read from standard input: "Name: value" lines, ended by an
// empty line.
struct TextRequest {
  wc::HeaderMap headers;
};

struct TextResponse {
  wc::HeaderMap headers;
};

class TextCorrelation
    : public wc::HttpCorrelationTemplate<TextRequest, TextResponse> {
 public:
  using HttpCorrelationTemplate::HttpCorrelationTemplate;

 protected:
  std::unique_ptr<wc::DictReader> request_headers(
      const TextRequest& request) override {
    return std::make_unique<wc::HeaderMap>(request.headers);
  }

  void set_http_response_header(TextResponse& response, std::string_view name,
                                std::string_view value) override {
    response.headers.set(name, value);
  }
};

std::optional<TextRequest> read_request(std::istream& in) {
  TextRequest request;
  std::string line;
  bool any = false;
  while (std::getline(in, line)) {
    any = true;
    if (line.empty()) {
      return request;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      std::cout << "Ignoring line without a colon: " << line << '\n';
      continue;
    }
    std::string_view value{line};
    value.remove_prefix(colon + 1);
    while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
    request.headers.add(std::string_view{line}.substr(0, colon), value);
  }
  if (!any) {
    return std::nullopt;
  }
  return request;
}

int main(int argc, char* argv[]) {
  wc::CorrelationConfig config;
  config.logger = std::make_shared<wc::CerrLogger>(/*trace_enabled=*/true);
  if (argc > 1) {
    const auto format = wc::parse_correlation_format(argv[1]);
    if (!format) {
      std::cerr << "Unknown correlation format: " << argv[1]
                << ".  Expected W3C or Hierarchical.\n";
      return 1;
    }
    config.format = *format;
  }

  const auto finalized = wc::finalize_config(config);
  if (auto* error = finalized.if_error()) {
    std::cerr << "Invalid correlation configuration: " << *error << '\n';
    return error->code;
  }

  std::cout << "Enter request headers as \"Name: value\" lines, followed by an "
               "empty line.  For example:\n"
               "traceparent: "
               "00-4b1c0c8d608f57db7bd0b13c88ef865e-4c6893cc6c6cad10-00\n"
               "Request-Id: |abc.def\n\n";

  while (const auto request = read_request(std::cin)) {
    auto accessor = std::make_shared<wc::DefaultCorrelationInfoAccessor>();
    TextCorrelation correlation{*finalized, accessor};

    const auto result =
        correlation.try_setting_correlation_from_request(&*request);
    if (!result) {
      std::cout << "Correlation failed: " << *result.error_message() << "\n\n";
      continue;
    }

    TextResponse response;
    correlation.set_correlation_headers_in_response(&response, &result);
    std::cout << "Response headers:\n";
    response.headers.visit([](std::string_view name, std::string_view value) {
      std::cout << name << ": " << value << '\n';
    });
    std::cout << '\n';
  }

  return 0;
}
