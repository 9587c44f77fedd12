#include <webapi/header_map.h>
#include <webapi/http_correlation.h>
#include <webapi/logger.h>
#include <webapi/w3c_propagation.h>

#include <ostream>
#include <stdexcept>
#include <utility>

#include "string_util.h"

namespace webapi {
namespace correlation {
namespace {

// Return the first value of the specified `header_name` in the specified
// `headers`, or `std::nullopt` if there is none or it's blank.
std::optional<std::string> header_value(const DictReader& headers,
                                        std::string_view header_name) {
  const auto value = headers.lookup(header_name);
  if (!value || is_blank(*value)) {
    return std::nullopt;
  }
  return std::string(*value);
}

// Return an ID generated by the specified `generate_id`.  Throw
// `std::logic_error` if the ID is blank, since that's a misconfiguration of
// the generator named by the specified `option`.
std::string generate_non_blank(const IDGenerator& generate_id,
                               const char* option) {
  std::string id = generate_id();
  if (is_blank(id)) {
    std::string message;
    message += "Correlation cannot use the configured ";
    message += option;
    message +=
        " ID generator to generate an ID because the resulting ID value is "
        "blank";
    throw std::logic_error(message);
  }
  return id;
}

}  // namespace

HttpCorrelation::HttpCorrelation(
    const FinalizedCorrelationConfig& config,
    std::shared_ptr<CorrelationInfoAccessor> accessor,
    TraceContextStack* trace_contexts)
    : config_(config),
      accessor_(std::move(accessor)),
      trace_contexts_(trace_contexts),
      logger_(config.logger),
      request_id_matcher_(config.request_id_matcher) {
  if (!accessor_) {
    throw std::invalid_argument(
        "Requires a correlation info accessor to set and retrieve the "
        "correlation information");
  }
}

HttpCorrelationResult HttpCorrelation::try_setting_correlation_from_request(
    const DictReader& headers,
    std::optional<std::string_view> trace_identifier) {
  switch (config_.format) {
    case CorrelationFormat::HIERARCHICAL:
      return correlate_hierarchical(headers, trace_identifier);
    case CorrelationFormat::W3C:
      return std::visit(
          [&](const auto& parent) { return correlate_w3c(headers, parent); },
          determine_w3c_parent(headers));
  }

  throw std::logic_error(
      "Could not determine which type of HTTP correlation system to use "
      "(Hierarchical or W3C); we recommend to use W3C instead of the "
      "deprecated Hierarchical correlation system");
}

HttpCorrelation::W3CParent HttpCorrelation::determine_w3c_parent(
    const DictReader& headers) const {
  const auto traceparent = headers.lookup(traceparent_header);
  if (is_w3c_compliant(traceparent)) {
    return W3CExistingParent{std::string(*traceparent)};
  }

  if (traceparent) {
    logger_->log_trace([&](std::ostream& log) {
      log << "Request header 'traceparent' with value '" << *traceparent
          << "' is not W3C compliant, starting a new trace";
    });
  }
  return W3CNewParent{};
}

HttpCorrelationResult HttpCorrelation::correlate_w3c(const DictReader& headers,
                                                     const W3CNewParent&) {
  TraceContext context = start_trace_context(headers);
  context.trace_id = config_.trace_id_generator->trace_id();
  context.span_id = config_.trace_id_generator->span_id();

  const std::string transaction_id = context.trace_id.hex_padded();
  logger_->log_trace([&](std::ostream& log) {
    log << "Correlation transaction ID '" << transaction_id
        << "' generated for incoming HTTP request";
  });

  const std::string operation_id = context.span_id.hex_padded();
  logger_->log_trace([&](std::ostream& log) {
    log << "Correlation operation ID '" << operation_id
        << "' generated for incoming HTTP request";
  });

  store(CorrelationInfo{operation_id, transaction_id}, std::move(context));
  return HttpCorrelationResult::success();
}

HttpCorrelationResult HttpCorrelation::correlate_w3c(
    const DictReader& headers, const W3CExistingParent& parent) {
  // Format example:   00-4b1c0c8d608f57db7bd0b13c88ef865e-4c6893cc6c6cad10-00
  // Format structure: 00-<-----trace/transaction-id----->-<span/parent-id>-00
  auto traceparent = parse_traceparent(parent.traceparent);
  if (auto* error = traceparent.if_error()) {
    logger_->log_error(*error);
    std::string message;
    message +=
        "No correlation transaction ID and operation parent ID could be "
        "extracted from the upstream service's 'traceparent' request header: ";
    message += error->message;
    return HttpCorrelationResult::failure(std::move(message));
  }

  TraceContext context = start_trace_context(headers);
  context.trace_id = traceparent->trace_id;
  context.parent_span_id = traceparent->parent_span_id;

  const std::string transaction_id = context.trace_id.hex_padded();
  logger_->log_trace([&](std::ostream& log) {
    log << "Correlation transaction ID '" << transaction_id
        << "' found in 'traceparent' HTTP request header";
  });

  const std::string operation_parent_id =
      context.parent_span_id->hex_padded();
  logger_->log_trace([&](std::ostream& log) {
    log << "Correlation operation parent ID '" << operation_parent_id
        << "' found in 'traceparent' HTTP request header";
  });

  do {
    context.span_id = config_.trace_id_generator->span_id();
  } while (context.span_id == *context.parent_span_id);

  const std::string operation_id = context.span_id.hex_padded();
  logger_->log_trace([&](std::ostream& log) {
    log << "Correlation operation ID '" << operation_id
        << "' generated for incoming HTTP request";
  });

  store(CorrelationInfo{operation_id, transaction_id, operation_parent_id},
        std::move(context));
  return HttpCorrelationResult::success(parent.traceparent);
}

TraceContext HttpCorrelation::start_trace_context(
    const DictReader& headers) const {
  TraceContext context;
  const TraceContext* current =
      trace_contexts_ ? trace_contexts_->current() : nullptr;

  if (const auto trace_state = headers.lookup(tracestate_header)) {
    context.trace_state = std::string(*trace_state);
  } else if (current) {
    context.trace_state = current->trace_state;
  }

  if (current) {
    context.tags = current->tags;
    context.baggage = current->baggage;
  }

  if (current && !current->baggage.empty()) {
    return context;
  }

  // "Correlation-Context" may occur more than once in a request.  Its values
  // are comma-separated lists, so all of them are joined into one.
  std::string correlation_context;
  headers.visit([&](std::string_view key, std::string_view value) {
    if (!equals_ignore_case(key, correlation_context_header)) {
      return;
    }
    if (!correlation_context.empty()) {
      correlation_context += ',';
    }
    correlation_context += value;
  });

  if (!correlation_context.empty()) {
    context.baggage = Baggage::parse_correlation_context(correlation_context);
    logger_->log_trace([&](std::ostream& log) {
      log << "Added " << context.baggage.size()
          << " baggage item(s) from request header 'Correlation-Context'";
    });
  }

  return context;
}

void HttpCorrelation::store(const CorrelationInfo& info, TraceContext context) {
  accessor_->set_correlation_info(info);
  if (trace_contexts_) {
    trace_contexts_->push(std::move(context));
  }
}

HttpCorrelationResult HttpCorrelation::correlate_hierarchical(
    const DictReader& headers,
    std::optional<std::string_view> trace_identifier) {
  const auto& transaction = config_.transaction;
  const auto transaction_id_in_request =
      header_value(headers, transaction.header_name);
  if (transaction_id_in_request) {
    if (!transaction.allow_in_request) {
      logger_->log_error([&](std::ostream& log) {
        log << "No correlation request header '" << transaction.header_name
            << "' for transaction ID was allowed in request";
      });
      return HttpCorrelationResult::failure(
          "No correlation transaction ID request header '" +
          transaction.header_name + "' was allowed in the request");
    }

    logger_->log_trace([&](std::ostream& log) {
      log << "Correlation request header '" << transaction.header_name
          << "' found with transaction ID '" << *transaction_id_in_request
          << "'";
    });
  }

  std::string operation_id = determine_operation_id(trace_identifier);
  std::optional<std::string> transaction_id =
      determine_transaction_id(transaction_id_in_request);
  std::optional<std::string> operation_parent_id;
  std::optional<std::string> request_id;

  if (config_.upstream_service.extract_from_request) {
    request_id = find_request_id(headers);
    if (request_id) {
      operation_parent_id = extract_parent_id(*request_id);
      if (!operation_parent_id) {
        request_id.reset();
      }
    }
  } else {
    operation_parent_id = generate_non_blank(
        config_.upstream_service.generate_id, "upstream service");
    logger_->log_trace([&](std::ostream& log) {
      log << "Generated '" << *operation_parent_id
          << "' as operation parent ID of the upstream service";
    });
    request_id = operation_parent_id;
  }

  accessor_->set_correlation_info(CorrelationInfo{std::move(operation_id),
                                                  std::move(transaction_id),
                                                  std::move(operation_parent_id)});
  return HttpCorrelationResult::success(std::move(request_id));
}

std::string HttpCorrelation::determine_operation_id(
    std::optional<std::string_view> trace_identifier) {
  if (trace_identifier && !is_blank(*trace_identifier)) {
    logger_->log_trace([&](std::ostream& log) {
      log << "Found unique trace identifier ID '" << *trace_identifier
          << "' for operation correlation ID";
    });
    return std::string(*trace_identifier);
  }

  logger_->log_trace([&](std::ostream& log) {
    log << "No unique trace identifier ID was found in the request, "
           "generating one...";
  });
  std::string operation_id =
      generate_non_blank(config_.operation.generate_id, "operation");
  logger_->log_trace([&](std::ostream& log) {
    log << "Generated '" << operation_id
        << "' as unique operation correlation ID";
  });
  return operation_id;
}

std::optional<std::string> HttpCorrelation::determine_transaction_id(
    const std::optional<std::string>& transaction_id_in_request) {
  const auto& transaction = config_.transaction;
  if (transaction_id_in_request) {
    return transaction_id_in_request;
  }

  if (!transaction.generate_when_not_specified) {
    logger_->log_trace([&](std::ostream& log) {
      log << "No transactional correlation ID found in request header '"
          << transaction.header_name
          << "' and none will be generated, so there will be no ID present";
    });
    return std::nullopt;
  }

  logger_->log_trace([&](std::ostream& log) {
    log << "No transactional ID was found in the request, generating one...";
  });
  std::string transaction_id =
      generate_non_blank(transaction.generate_id, "transaction");
  logger_->log_trace([&](std::ostream& log) {
    log << "Generated '" << transaction_id
        << "' as transactional correlation ID";
  });
  return transaction_id;
}

std::optional<std::string> HttpCorrelation::find_request_id(
    const DictReader& headers) {
  const auto& header_name = config_.upstream_service.header_name;
  auto request_id = header_value(headers, header_name);
  if (request_id) {
    switch (request_id_matcher_->match(*request_id)) {
      case RequestIdMatcher::MatchResult::MATCH:
        logger_->log_trace([&](std::ostream& log) {
          log << "Found operation parent ID '" << *request_id
              << "' from upstream service in request's header '"
              << header_name << "'";
        });
        return request_id;
      case RequestIdMatcher::MatchResult::TIMED_OUT:
        logger_->log_trace([&](std::ostream& log) {
          log << "Upstream service's '" << header_name
              << "' was timed-out during regular expression validation";
        });
        return std::nullopt;
      case RequestIdMatcher::MatchResult::NO_MATCH:
        break;
    }
  }

  logger_->log_trace([&](std::ostream& log) {
    log << "No operation parent ID found from upstream service in the "
           "request's header '"
        << header_name << "' that matches the expected format: |Guid.";
  });
  return std::nullopt;
}

std::optional<std::string> HttpCorrelation::extract_parent_id(
    std::string_view request_id) {
  logger_->log_trace([&](std::ostream& log) {
    log << "Extracting operation parent ID from request ID '" << request_id
        << "' from the upstream service";
  });

  auto operation_parent_id = extract_operation_parent_id(request_id);
  if (operation_parent_id) {
    logger_->log_trace([&](std::ostream& log) {
      log << "Extracted operation parent ID '" << *operation_parent_id
          << "' from request ID '" << request_id
          << "' from the upstream service";
    });
  }
  return operation_parent_id;
}

void HttpCorrelation::set_correlation_headers_in_response(
    DictWriter& response, const HttpCorrelationResult& result) {
  const std::optional<CorrelationInfo> info = accessor_->correlation_info();

  if (config_.operation.include_in_response) {
    logger_->log_trace([](std::ostream& log) {
      log << "Prepare for the operation ID to be included in the response...";
    });
    if (!info || is_blank(info->operation_id())) {
      logger_->log_warning([](std::ostream& log) {
        log << "No response header was added given no operation ID was found";
      });
    } else {
      response.set(config_.operation.header_name, info->operation_id());
    }
  }

  if (config_.upstream_service.include_in_response) {
    logger_->log_trace([](std::ostream& log) {
      log << "Prepare for the operation parent ID to be included in the "
             "response...";
    });
    const auto& request_id = result.request_id();
    if (!request_id || is_blank(*request_id)) {
      logger_->log_warning([](std::ostream& log) {
        log << "No response header was added given no operation parent ID "
               "was found";
      });
    } else {
      response.set(upstream_service_header_name(), *request_id);
    }
  }

  if (config_.transaction.include_in_response) {
    logger_->log_trace([](std::ostream& log) {
      log << "Prepare for the transactional correlation ID to be included in "
             "the response...";
    });
    if (!info || !info->transaction_id() ||
        is_blank(*info->transaction_id())) {
      logger_->log_warning([](std::ostream& log) {
        log << "No response header was added given no transactional "
               "correlation ID was found";
      });
    } else {
      response.set(config_.transaction.header_name, *info->transaction_id());
    }
  }
}

std::string_view HttpCorrelation::upstream_service_header_name() const {
  switch (config_.format) {
    case CorrelationFormat::HIERARCHICAL:
      return config_.upstream_service.header_name;
    case CorrelationFormat::W3C:
      return traceparent_header;
  }
  throw std::logic_error("Unknown HTTP correlation format");
}

const FinalizedCorrelationConfig& HttpCorrelation::config() const {
  return config_;
}

}  // namespace correlation
}  // namespace webapi
