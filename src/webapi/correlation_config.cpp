#include <webapi/correlation_config.h>
#include <webapi/logger.h>
#include <webapi/null_logger.h>

#include <chrono>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

#include "environment.h"
#include "parse_util.h"
#include "string_util.h"

namespace webapi {
namespace correlation {
namespace {

// Return an error describing the environment variable `var` whose value could
// not be parsed.
Error env_error(environment::Variable var, const Error& error) {
  std::string prefix;
  prefix += "Unable to parse ";
  prefix += environment::name(var);
  prefix += " environment variable: ";
  return error.with_prefix(prefix);
}

// Overwrite the specified `field` with the boolean value of the specified
// environment `var`, if `var` is set.
Expected<void> bool_from_env(bool& field, environment::Variable var) {
  const auto value = environment::lookup(var);
  if (!value) {
    return {};
  }

  auto parsed = parse_bool(*value);
  if (auto* error = parsed.if_error()) {
    return env_error(var, *error);
  }
  field = *parsed;
  return {};
}

// Overwrite the specified `field` with the value of the specified environment
// `var`, if `var` is set.
void string_from_env(std::string& field, environment::Variable var) {
  if (const auto value = environment::lookup(var)) {
    field = std::string{*value};
  }
}

Expected<void> load_env_overrides(FinalizedCorrelationConfig& config) {
  using namespace environment;

  if (const auto format_env = lookup(FORMAT)) {
    const auto format = parse_correlation_format(*format_env);
    if (!format) {
      std::string message;
      message += "Unsupported correlation format \"";
      message += *format_env;
      message +=
          "\".  The following formats are supported: W3C, Hierarchical.";
      return env_error(FORMAT,
                       Error{Error::UNKNOWN_CORRELATION_FORMAT, message});
    }
    config.format = *format;
  }

  string_from_env(config.operation.header_name, OPERATION_HEADER);
  string_from_env(config.transaction.header_name, TRANSACTION_HEADER);
  string_from_env(config.upstream_service.header_name, UPSTREAM_HEADER);

  const std::pair<bool*, Variable> flags[] = {
      {&config.operation.include_in_response, OPERATION_INCLUDE_IN_RESPONSE},
      {&config.transaction.allow_in_request, TRANSACTION_ALLOW_IN_REQUEST},
      {&config.transaction.generate_when_not_specified,
       TRANSACTION_GENERATE_WHEN_NOT_SPECIFIED},
      {&config.transaction.include_in_response,
       TRANSACTION_INCLUDE_IN_RESPONSE},
      {&config.upstream_service.extract_from_request,
       UPSTREAM_EXTRACT_FROM_REQUEST},
      {&config.upstream_service.include_in_response,
       UPSTREAM_INCLUDE_IN_RESPONSE},
      {&config.log_on_startup, STARTUP_LOGS},
  };
  for (const auto& [field, var] : flags) {
    auto result = bool_from_env(*field, var);
    if (auto* error = result.if_error()) {
      return std::move(*error);
    }
  }

  return {};
}

Expected<void> validate_header_name(const std::string& header_name,
                                    const char* option) {
  if (!is_blank(header_name)) {
    return {};
  }
  std::string message;
  message += "The ";
  message += option;
  message += " header name must not be blank.";
  return Error{Error::BLANK_HEADER_NAME, std::move(message)};
}

Expected<void> validate_generator(const IDGenerator& generator,
                                  const char* option) {
  if (generator) {
    return {};
  }
  std::string message;
  message += "The ";
  message += option;
  message += " ID generator must not be null.";
  return Error{Error::NULL_ID_GENERATOR, std::move(message)};
}

}  // namespace

Expected<FinalizedCorrelationConfig> finalize_config(
    const CorrelationConfig& config) {
  FinalizedCorrelationConfig result;

  result.format = config.format;
  result.operation = config.operation;
  result.transaction = config.transaction;
  result.upstream_service = config.upstream_service;
  result.log_on_startup = config.log_on_startup;
  result.request_id_timeout = config.request_id_timeout;
  result.clock = config.clock;

  result.logger = config.logger;
  if (!result.logger) {
    result.logger = std::make_shared<NullLogger>();
  }

  result.trace_id_generator = config.trace_id_generator;
  if (!result.trace_id_generator) {
    result.trace_id_generator = default_trace_id_generator();
  }

  auto env = load_env_overrides(result);
  if (auto* error = env.if_error()) {
    return std::move(*error);
  }

  if (result.format != CorrelationFormat::W3C &&
      result.format != CorrelationFormat::HIERARCHICAL) {
    std::string message;
    message += "Unknown correlation format with value ";
    message += std::to_string(static_cast<int>(result.format));
    message += ".  The following formats are supported: W3C, Hierarchical.";
    return Error{Error::UNKNOWN_CORRELATION_FORMAT, std::move(message)};
  }

  const Expected<void> checks[] = {
      validate_header_name(result.operation.header_name, "operation"),
      validate_header_name(result.transaction.header_name, "transaction"),
      validate_header_name(result.upstream_service.header_name,
                           "upstream service"),
      validate_generator(result.operation.generate_id, "operation"),
      validate_generator(result.transaction.generate_id, "transaction"),
      validate_generator(result.upstream_service.generate_id,
                         "upstream service"),
  };
  for (const auto& check : checks) {
    if (const auto* error = check.if_error()) {
      return *error;
    }
  }

  if (!result.clock) {
    return Error{Error::NULL_CLOCK,
                 "The clock used to time request ID validation must not be "
                 "null."};
  }

  result.request_id_matcher = std::make_shared<const RequestIdMatcher>(
      result.clock, result.request_id_timeout);

  if (result.log_on_startup) {
    result.logger->log_startup([&](std::ostream& log) {
      log << "HTTP correlation configuration: " << to_json_string(result);
    });
  }

  return result;
}

std::string to_json_string(const FinalizedCorrelationConfig& config) {
  const auto timeout_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config.request_id_timeout)
          .count();

  // clang-format off
  const nlohmann::json json = {
    {"format", std::string(to_string_view(config.format))},
    {"operation", {
      {"header_name", config.operation.header_name},
      {"include_in_response", config.operation.include_in_response},
    }},
    {"transaction", {
      {"header_name", config.transaction.header_name},
      {"allow_in_request", config.transaction.allow_in_request},
      {"generate_when_not_specified", config.transaction.generate_when_not_specified},
      {"include_in_response", config.transaction.include_in_response},
    }},
    {"upstream_service", {
      {"header_name", config.upstream_service.header_name},
      {"extract_from_request", config.upstream_service.extract_from_request},
      {"include_in_response", config.upstream_service.include_in_response},
    }},
    {"request_id_timeout_ms", timeout_ms},
  };
  // clang-format on

  return json.dump();
}

}  // namespace correlation
}  // namespace webapi
