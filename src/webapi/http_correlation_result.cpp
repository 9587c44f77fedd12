#include <webapi/http_correlation_result.h>

#include <stdexcept>

#include "string_util.h"

namespace webapi {
namespace correlation {

HttpCorrelationResult::HttpCorrelationResult(
    bool is_success, std::optional<std::string> request_id,
    std::optional<std::string> error_message)
    : is_success_(is_success),
      request_id_(std::move(request_id)),
      error_message_(std::move(error_message)) {}

HttpCorrelationResult HttpCorrelationResult::success(
    std::optional<std::string> request_id) {
  return HttpCorrelationResult{true, std::move(request_id), std::nullopt};
}

HttpCorrelationResult HttpCorrelationResult::failure(
    std::string error_message) {
  if (is_blank(error_message)) {
    throw std::invalid_argument(
        "Requires an error message describing why the HTTP correlation failed");
  }
  return HttpCorrelationResult{false, std::nullopt, std::move(error_message)};
}

bool HttpCorrelationResult::is_success() const { return is_success_; }

HttpCorrelationResult::operator bool() const { return is_success_; }

const std::optional<std::string>& HttpCorrelationResult::request_id() const {
  return request_id_;
}

const std::optional<std::string>& HttpCorrelationResult::error_message()
    const {
  return error_message_;
}

}  // namespace correlation
}  // namespace webapi
