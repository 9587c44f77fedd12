#pragma once

// This component provides a `struct`, `TraceContext`, and a class,
// `TraceContextStack`.
//
// `TraceContext` is the in-process state of one hop of a W3C trace: the trace
// (transaction) ID, this hop's span (operation) ID, the span ID of the
// upstream caller if any, and the ambient data that travels with the trace
// within the process (trace state, tags, and baggage).
//
// `TraceContextStack` is the stack of `TraceContext`s that are active on one
// logical thread of execution, innermost last.  It's owned by the caller of
// `HttpCorrelation`, which pushes the context that it starts for each W3C
// correlated request.  The current (innermost) context, if any, is the source
// of the trace state, tags, and baggage that a new context inherits.
//
// A `TraceContextStack` is not thread-safe.  Use one per request, or one per
// thread when requests are processed one at a time per thread.
//
// Typical usage:
//
//     TraceContextStack contexts;
//     HttpCorrelation correlation{config, accessor, &contexts};
//     TraceContextStack::Scope scope{contexts};  // pops when request is done
//     auto result = correlation.try_setting_correlation_from_request(
//         headers, trace_identifier);
//     ...

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "baggage.h"
#include "trace_id.h"

namespace webapi {
namespace correlation {

struct TraceContext {
  TraceID trace_id;
  SpanID span_id;
  std::optional<SpanID> parent_span_id;
  // The "tracestate" of the request that started this context, verbatim.
  std::string trace_state;
  std::vector<std::pair<std::string, std::string>> tags;
  Baggage baggage;
};

// Return the "traceparent" header value, version "00" with no trace flags set,
// that identifies the specified `context` as the parent of a downstream
// request.
std::string encode_traceparent(const TraceContext& context);

class TraceContextStack {
  std::vector<TraceContext> contexts_;

 public:
  // `Scope` restores a `TraceContextStack` to the depth that it had when the
  // `Scope` was created, popping every context pushed in the meantime.
  class Scope {
    TraceContextStack* stack_;
    std::size_t depth_;

   public:
    explicit Scope(TraceContextStack& stack);
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;
    ~Scope();
  };

  // Return the innermost context, or null if the stack is empty.
  const TraceContext* current() const;

  void push(TraceContext context);
  void pop();

  std::size_t depth() const;
  bool empty() const;
};

}  // namespace correlation
}  // namespace webapi
