#pragma once

// This component provides facilities for generating correlation identifiers.
//
// `IDGenerator` is an alias for `std::function<std::string()>`.  One
// `IDGenerator` is configured for each identifier category (operation,
// transaction, and upstream service) in `CorrelationConfig`.  A generator must
// return a non-blank string; a blank result is treated as a configuration
// error by `HttpCorrelation`.
//
// `uuid_generator` returns an `IDGenerator` that produces random RFC 4122
// version 4 UUIDs, e.g. "2f1c7c1e-8a5b-4d1a-9c3e-5e0c1b7f9a42".
//
// `TraceIDGenerator` produces the identifiers of the W3C trace context.
// `default_trace_id_generator` returns a `TraceIDGenerator` that draws from a
// thread-local `std::mt19937_64`, seeded from `std::random_device` once per
// thread and again in a child process after `fork`.  Its IDs are uniformly
// distributed over all nonzero 128-bit (trace) and 64-bit (span) values, so
// that IDs generated independently by different processes are unique with
// overwhelming probability.  The generator is not cryptographically secure:
// correlation identifiers are not secrets.

#include <functional>
#include <memory>
#include <string>

#include "trace_id.h"

namespace webapi {
namespace correlation {

using IDGenerator = std::function<std::string()>;

IDGenerator uuid_generator();

class TraceIDGenerator {
 public:
  virtual ~TraceIDGenerator() {}

  virtual TraceID trace_id() const = 0;
  virtual SpanID span_id() const = 0;
};

std::shared_ptr<const TraceIDGenerator> default_trace_id_generator();

}  // namespace correlation
}  // namespace webapi
