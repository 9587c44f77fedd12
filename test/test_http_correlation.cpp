// These are tests for `HttpCorrelation::try_setting_correlation_from_request`
// in both the W3C and the hierarchical correlation formats.

#include <webapi/correlation_config.h>
#include <webapi/correlation_info.h>
#include <webapi/header_map.h>
#include <webapi/http_correlation.h>
#include <webapi/http_correlation_result.h>
#include <webapi/trace_context.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mocks/accessors.h"
#include "mocks/dict_readers.h"
#include "mocks/id_generators.h"
#include "mocks/loggers.h"
#include "test.h"

using namespace webapi::correlation;

#define W3C_TEST(x) TEST_CASE(x, "[w3c]")
#define HIERARCHICAL_TEST(x) TEST_CASE(x, "[hierarchical]")

using Items = std::vector<std::pair<std::string, std::string>>;

namespace {

const std::string incoming_traceparent =
    "00-4b1c0c8d608f57db7bd0b13c88ef865e-4c6893cc6c6cad10-00";
const std::string incoming_trace_id = "4b1c0c8d608f57db7bd0b13c88ef865e";
const std::string incoming_parent_id = "4c6893cc6c6cad10";

FinalizedCorrelationConfig finalized(const CorrelationConfig& config) {
  auto result = finalize_config(config);
  REQUIRE(result);
  return std::move(*result);
}

bool is_hex_of_size(const std::string& text, std::size_t size) {
  return text.size() == size &&
         text.find_first_not_of("0123456789abcdef") == std::string::npos;
}

}  // namespace

W3C_TEST("request without traceparent starts a new trace") {
  auto logger = std::make_shared<MockLogger>();
  CorrelationConfig config;
  config.logger = logger;
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();
  HttpCorrelation correlation{finalized(config), accessor};

  const HeaderMap headers;
  const auto result = correlation.try_setting_correlation_from_request(headers);

  REQUIRE(result.is_success());
  CHECK_FALSE(result.request_id());
  CHECK_FALSE(result.error_message());
  REQUIRE(accessor->info);
  CHECK(is_hex_of_size(accessor->info->operation_id(), 16));
  REQUIRE(accessor->info->transaction_id());
  CHECK(is_hex_of_size(*accessor->info->transaction_id(), 32));
  CHECK_FALSE(accessor->info->operation_parent_id());
  CHECK(logger->error_count() == 0);
}

W3C_TEST("request with a non-compliant traceparent starts a new trace") {
  auto traceparent = GENERATE(
      as<std::string>{}, "", "garbage", incoming_traceparent.substr(1),
      "ff-4b1c0c8d608f57db7bd0b13c88ef865e-4c6893cc6c6cad10-00");
  CAPTURE(traceparent);

  CorrelationConfig config;
  config.trace_id_generator = std::make_shared<MockTraceIDGenerator>(
      TraceID{0x2, 0x1}, std::vector<std::uint64_t>{0xabc});
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();
  HttpCorrelation correlation{finalized(config), accessor};

  const HeaderMap headers{{"traceparent", traceparent}};
  const auto result = correlation.try_setting_correlation_from_request(headers);

  REQUIRE(result);
  CHECK_FALSE(result.request_id());
  REQUIRE(accessor->info);
  CHECK(accessor->info->operation_id() == "0000000000000abc");
  CHECK(accessor->info->transaction_id() ==
        "00000000000000010000000000000002");
  CHECK_FALSE(accessor->info->operation_parent_id());
}

W3C_TEST("request with a compliant traceparent continues the trace") {
  CorrelationConfig config;
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();
  HttpCorrelation correlation{finalized(config), accessor};

  // Header names are case-insensitive.
  const HeaderMap headers{{"TraceParent", incoming_traceparent}};
  const auto result = correlation.try_setting_correlation_from_request(headers);

  REQUIRE(result);
  CHECK(result.request_id() == incoming_traceparent);
  REQUIRE(accessor->info);
  CHECK(accessor->info->transaction_id() == incoming_trace_id);
  CHECK(accessor->info->operation_parent_id() == incoming_parent_id);
  CHECK(is_hex_of_size(accessor->info->operation_id(), 16));
  CHECK(accessor->info->operation_id() != incoming_parent_id);
}

W3C_TEST("new span ID never equals the parent ID") {
  CorrelationConfig config;
  auto generator = std::make_shared<MockTraceIDGenerator>(
      TraceID{1, 1},
      std::vector<std::uint64_t>{0x4c6893cc6c6cad10ULL, 0x4c6893cc6c6cad10ULL,
                                 0x123});
  config.trace_id_generator = generator;
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();
  HttpCorrelation correlation{finalized(config), accessor};

  const HeaderMap headers{{"traceparent", incoming_traceparent}};
  REQUIRE(correlation.try_setting_correlation_from_request(headers));

  REQUIRE(accessor->info);
  CHECK(accessor->info->operation_id() == "0000000000000123");
  CHECK(generator->spans_generated == 3);
}

W3C_TEST("compliant traceparent with invalid IDs fails") {
  auto traceparent = GENERATE(
      as<std::string>{},
      "00-00000000000000000000000000000000-4c6893cc6c6cad10-00",
      "00-4b1c0c8d608f57db7bd0b13c88ef865e-0000000000000000-00",
      "00-4b1c0c8d608f57db7bd0b13c88efXXXX-4c6893cc6c6cad10-00",
      "00_4b1c0c8d608f57db7bd0b13c88ef865e_4c6893cc6c6cad10_00");
  CAPTURE(traceparent);

  auto logger = std::make_shared<MockLogger>();
  CorrelationConfig config;
  config.logger = logger;
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();
  HttpCorrelation correlation{finalized(config), accessor};

  const HeaderMap headers{{"traceparent", traceparent}};
  const auto result = correlation.try_setting_correlation_from_request(headers);

  REQUIRE_FALSE(result);
  REQUIRE(result.error_message());
  CHECK_FALSE(result.request_id());
  CHECK(accessor->set_count == 0);
  CHECK(logger->error_count() == 1);
}

W3C_TEST("trace context stack") {
  CorrelationConfig config;
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();
  TraceContextStack stack;
  const TraceContextStack::Scope scope{stack};
  HttpCorrelation correlation{finalized(config), accessor, &stack};

  SECTION("receives the context of the request") {
    const HeaderMap headers{{"traceparent", incoming_traceparent},
                            {"tracestate", "congo=t61rcWkgMzE"}};
    REQUIRE(correlation.try_setting_correlation_from_request(headers));

    REQUIRE(stack.depth() == 1);
    const TraceContext* context = stack.current();
    REQUIRE(context);
    CHECK(context->trace_id.hex_padded() == incoming_trace_id);
    REQUIRE(context->parent_span_id);
    CHECK(context->parent_span_id->hex_padded() == incoming_parent_id);
    CHECK(context->span_id.hex_padded() == accessor->info->operation_id());
    CHECK(context->trace_state == "congo=t61rcWkgMzE");
    CHECK(encode_traceparent(*context) ==
          "00-" + incoming_trace_id + "-" + accessor->info->operation_id() +
              "-00");
  }

  SECTION("reads baggage from Correlation-Context without a current context") {
    const HeaderMap headers{{"Correlation-Context", "k1=v1, k2 = v2,bogus"}};
    REQUIRE(correlation.try_setting_correlation_from_request(headers));

    const TraceContext* context = stack.current();
    REQUIRE(context);
    CHECK(context->baggage == Baggage(Items{{"k1", "v1"}, {"k2", "v2"}}));
  }

  SECTION("reads every item of Correlation-Context") {
    std::string correlation_context;
    for (int i = 0; i < 100; ++i) {
      if (i) correlation_context += ',';
      correlation_context += "k" + std::to_string(i) + "=v";
    }
    const HeaderMap headers{{"Correlation-Context", correlation_context}};
    REQUIRE(correlation.try_setting_correlation_from_request(headers));

    const TraceContext* context = stack.current();
    REQUIRE(context);
    CHECK(context->baggage.size() == 100);
    CHECK(context->baggage.get("k99") == "v");
  }

  SECTION("reads every Correlation-Context header") {
    const HeaderMap headers{{"Correlation-Context", "a=1"},
                            {"traceparent", incoming_traceparent},
                            {"correlation-context", "b=2, c=3"}};
    REQUIRE(correlation.try_setting_correlation_from_request(headers));

    const TraceContext* context = stack.current();
    REQUIRE(context);
    CHECK(context->baggage ==
          Baggage(Items{{"a", "1"}, {"b", "2"}, {"c", "3"}}));
  }

  SECTION("inherits trace state from the current context") {
    TraceContext outer;
    outer.trace_id = TraceID{1, 1};
    outer.span_id = SpanID{1};
    outer.trace_state = "rojo=00f067aa0ba902b7";
    stack.push(outer);

    SECTION("without a tracestate header") {
      REQUIRE(correlation.try_setting_correlation_from_request(HeaderMap{}));
      REQUIRE(stack.current());
      CHECK(stack.current()->trace_state == "rojo=00f067aa0ba902b7");
    }

    SECTION("unless the request has a tracestate header") {
      const HeaderMap headers{{"tracestate", "congo=t61rcWkgMzE"}};
      REQUIRE(correlation.try_setting_correlation_from_request(headers));
      REQUIRE(stack.current());
      CHECK(stack.current()->trace_state == "congo=t61rcWkgMzE");
    }
  }

  SECTION("inherits tags and baggage from the current context") {
    TraceContext outer;
    outer.trace_id = TraceID{1, 1};
    outer.span_id = SpanID{1};
    outer.tags.emplace_back("component", "checkout");
    outer.baggage.set("tenant", "contoso");
    stack.push(outer);

    const HeaderMap headers{{"Correlation-Context", "tenant=fabrikam,k=v"}};
    REQUIRE(correlation.try_setting_correlation_from_request(headers));

    REQUIRE(stack.depth() == 2);
    const TraceContext* context = stack.current();
    REQUIRE(context);
    CHECK(context->tags == outer.tags);
    CHECK(context->baggage == outer.baggage);
  }

  SECTION("reads Correlation-Context when the current context has no baggage") {
    TraceContext outer;
    outer.trace_id = TraceID{1, 1};
    outer.span_id = SpanID{1};
    stack.push(outer);

    const HeaderMap headers{{"Correlation-Context", "k=v"}};
    REQUIRE(correlation.try_setting_correlation_from_request(headers));

    const TraceContext* context = stack.current();
    REQUIRE(context);
    CHECK(context->baggage.get("k") == "v");
  }

  SECTION("is unchanged when correlation fails") {
    const HeaderMap headers{
        {"traceparent",
         "00-00000000000000000000000000000000-4c6893cc6c6cad10-00"}};
    REQUIRE_FALSE(correlation.try_setting_correlation_from_request(headers));
    CHECK(stack.empty());
  }
}

W3C_TEST("scope restores the trace context stack") {
  TraceContextStack stack;
  {
    const TraceContextStack::Scope scope{stack};
    stack.push(TraceContext{});
    stack.push(TraceContext{});
    CHECK(stack.depth() == 2);
  }
  CHECK(stack.empty());
  CHECK(stack.current() == nullptr);
}

HIERARCHICAL_TEST("operation ID") {
  CorrelationConfig config;
  config.format = CorrelationFormat::HIERARCHICAL;
  config.operation.generate_id = constant_id("generated-operation");
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();
  HttpCorrelation correlation{finalized(config), accessor};
  const HeaderMap headers;

  SECTION("is the trace identifier of the request") {
    REQUIRE(correlation.try_setting_correlation_from_request(headers,
                                                             "trace-id-1"));
    CHECK(accessor->info->operation_id() == "trace-id-1");
  }

  SECTION("is generated without a trace identifier") {
    REQUIRE(correlation.try_setting_correlation_from_request(headers));
    CHECK(accessor->info->operation_id() == "generated-operation");
  }

  SECTION("is generated for a blank trace identifier") {
    REQUIRE(correlation.try_setting_correlation_from_request(headers, "  "));
    CHECK(accessor->info->operation_id() == "generated-operation");
  }
}

HIERARCHICAL_TEST("transaction ID") {
  auto logger = std::make_shared<MockLogger>();
  CorrelationConfig config;
  config.format = CorrelationFormat::HIERARCHICAL;
  config.logger = logger;
  config.transaction.generate_id = constant_id("generated-transaction");
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();

  SECTION("is read from the request") {
    HttpCorrelation correlation{finalized(config), accessor};
    const std::unordered_map<std::string, std::string> map{
        {"x-transaction-id", "from-request"}};
    const MockDictReader headers{map};
    REQUIRE(correlation.try_setting_correlation_from_request(headers));
    CHECK(accessor->info->transaction_id() == "from-request");
  }

  SECTION("is generated when absent from the request") {
    HttpCorrelation correlation{finalized(config), accessor};
    REQUIRE(correlation.try_setting_correlation_from_request(HeaderMap{}));
    CHECK(accessor->info->transaction_id() == "generated-transaction");
  }

  SECTION("is absent when absent from the request and not generated") {
    config.transaction.generate_when_not_specified = false;
    HttpCorrelation correlation{finalized(config), accessor};
    REQUIRE(correlation.try_setting_correlation_from_request(HeaderMap{}));
    REQUIRE(accessor->info);
    CHECK_FALSE(accessor->info->transaction_id());
  }

  SECTION("in the request fails when not allowed") {
    config.transaction.allow_in_request = false;
    HttpCorrelation correlation{finalized(config), accessor};
    const HeaderMap headers{{"X-Transaction-ID", "from-request"}};
    const auto result = correlation.try_setting_correlation_from_request(headers);

    REQUIRE_FALSE(result);
    CHECK(result.error_message() ==
          "No correlation transaction ID request header 'X-Transaction-ID' "
          "was allowed in the request");
    CHECK(accessor->set_count == 0);
    CHECK_FALSE(accessor->info);
    CHECK(logger->error_count() == 1);
  }

  SECTION("blank in the request is treated as absent") {
    config.transaction.allow_in_request = false;
    HttpCorrelation correlation{finalized(config), accessor};
    const HeaderMap headers{{"X-Transaction-ID", "   "}};
    REQUIRE(correlation.try_setting_correlation_from_request(headers));
    CHECK(accessor->info->transaction_id() == "generated-transaction");
  }
}

HIERARCHICAL_TEST("operation parent ID from Request-Id") {
  CorrelationConfig config;
  config.format = CorrelationFormat::HIERARCHICAL;
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();

  SECTION("valid request IDs") {
    struct TestCase {
      int line;
      std::string request_id;
      std::string expected_parent_id;
    };

    // clang-format off
    auto test_case = GENERATE(values<TestCase>({
      {__LINE__, "|abc.def", "def"},
      {__LINE__, "|abc.def.", "def"},
      {__LINE__, "|abc123", "abc123"},
      {__LINE__, "abc123", "abc123"},
    }));
    // clang-format on

    CAPTURE(test_case.line);
    HttpCorrelation correlation{finalized(config), accessor};
    const HeaderMap headers{{"Request-Id", test_case.request_id}};
    const auto result = correlation.try_setting_correlation_from_request(headers);

    REQUIRE(result);
    CHECK(result.request_id() == test_case.request_id);
    CHECK(accessor->info->operation_parent_id() ==
          test_case.expected_parent_id);
  }

  SECTION("invalid request IDs are ignored") {
    auto request_id =
        GENERATE(as<std::string>{}, "abc def", "abc..def", "|", "  ");
    CAPTURE(request_id);
    HttpCorrelation correlation{finalized(config), accessor};
    const HeaderMap headers{{"Request-Id", request_id}};
    const auto result = correlation.try_setting_correlation_from_request(headers);

    REQUIRE(result);
    CHECK_FALSE(result.request_id());
    REQUIRE(accessor->info);
    CHECK_FALSE(accessor->info->operation_parent_id());
  }

  SECTION("request ID validation that times out is a non-match") {
    TimePoint now;
    config.clock = [&]() {
      now += std::chrono::seconds(2);
      return now;
    };
    HttpCorrelation correlation{finalized(config), accessor};
    const HeaderMap headers{{"Request-Id", "|abc.def"}};
    const auto result = correlation.try_setting_correlation_from_request(headers);

    REQUIRE(result);
    CHECK_FALSE(result.request_id());
    CHECK_FALSE(accessor->info->operation_parent_id());
  }

  SECTION("configured header name") {
    config.upstream_service.header_name = "X-Parent";
    HttpCorrelation correlation{finalized(config), accessor};
    const HeaderMap headers{{"Request-Id", "|ignored"}, {"x-parent", "|abc"}};
    const auto result = correlation.try_setting_correlation_from_request(headers);

    REQUIRE(result);
    CHECK(result.request_id() == "|abc");
    CHECK(accessor->info->operation_parent_id() == "abc");
  }
}

HIERARCHICAL_TEST("operation parent ID is generated when not extracted") {
  CorrelationConfig config;
  config.format = CorrelationFormat::HIERARCHICAL;
  config.upstream_service.extract_from_request = false;
  config.upstream_service.generate_id = constant_id("generated-parent");
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();
  HttpCorrelation correlation{finalized(config), accessor};

  const HeaderMap headers{{"Request-Id", "|abc.def"}};
  const auto result = correlation.try_setting_correlation_from_request(headers);

  REQUIRE(result);
  CHECK(result.request_id() == "generated-parent");
  CHECK(accessor->info->operation_parent_id() == "generated-parent");
}

HIERARCHICAL_TEST("generator that produces a blank ID is a logic error") {
  CorrelationConfig config;
  config.format = CorrelationFormat::HIERARCHICAL;
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();

  SECTION("operation") {
    config.operation.generate_id = constant_id("");
    HttpCorrelation correlation{finalized(config), accessor};
    CHECK_THROWS_AS(correlation.try_setting_correlation_from_request(HeaderMap{}),
                    std::logic_error);
  }

  SECTION("transaction") {
    config.transaction.generate_id = constant_id(" ");
    HttpCorrelation correlation{finalized(config), accessor};
    CHECK_THROWS_AS(correlation.try_setting_correlation_from_request(HeaderMap{}),
                    std::logic_error);
  }

  SECTION("upstream service") {
    config.upstream_service.extract_from_request = false;
    config.upstream_service.generate_id = constant_id("");
    HttpCorrelation correlation{finalized(config), accessor};
    CHECK_THROWS_AS(correlation.try_setting_correlation_from_request(HeaderMap{}),
                    std::logic_error);
  }

  CHECK(accessor->set_count == 0);
}

TEST_CASE("unknown correlation format is a logic error") {
  auto config = finalized(CorrelationConfig{});
  config.format = static_cast<CorrelationFormat>(42);
  auto accessor = std::make_shared<MockCorrelationInfoAccessor>();
  HttpCorrelation correlation{config, accessor};

  CHECK_THROWS_AS(correlation.try_setting_correlation_from_request(HeaderMap{}),
                  std::logic_error);
  CHECK(accessor->set_count == 0);
}

TEST_CASE("HttpCorrelation requires an accessor") {
  const auto config = finalized(CorrelationConfig{});
  CHECK_THROWS_AS(HttpCorrelation(config, nullptr), std::invalid_argument);
}

TEST_CASE("DefaultCorrelationInfoAccessor") {
  DefaultCorrelationInfoAccessor accessor;
  CHECK_FALSE(accessor.correlation_info());

  const CorrelationInfo info{"op", "tx", "parent"};
  accessor.set_correlation_info(info);
  CHECK(accessor.correlation_info() == info);
}

TEST_CASE("CorrelationInfo requires an operation ID") {
  CHECK_THROWS_AS(CorrelationInfo("", "tx"), std::invalid_argument);
  CHECK_THROWS_AS(CorrelationInfo("   ", std::nullopt), std::invalid_argument);
  CHECK_NOTHROW(CorrelationInfo("op", std::nullopt));
}

TEST_CASE("HttpCorrelationResult") {
  const auto success = HttpCorrelationResult::success("|abc.def");
  CHECK(success.is_success());
  CHECK(success.request_id() == "|abc.def");
  CHECK_FALSE(success.error_message());

  const auto failure = HttpCorrelationResult::failure("it broke");
  CHECK_FALSE(failure.is_success());
  CHECK_FALSE(failure.request_id());
  CHECK(failure.error_message() == "it broke");

  CHECK_THROWS_AS(HttpCorrelationResult::failure(" "), std::invalid_argument);
}
