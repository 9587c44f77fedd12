#include <webapi/id_generator.h>

#include "hex.h"
#include "random.h"

namespace webapi {
namespace correlation {
namespace {

class DefaultTraceIDGenerator : public TraceIDGenerator {
 public:
  TraceID trace_id() const override {
    TraceID result;
    do {
      result.low = random_uint64();
      result.high = random_uint64();
    } while (!result.is_valid());
    return result;
  }

  SpanID span_id() const override {
    SpanID result;
    do {
      result.value = random_uint64();
    } while (!result.is_valid());
    return result;
  }
};

// Return a random version 4, variant 1 UUID in its canonical textual form,
// i.e. "xxxxxxxx-xxxx-4xxx-Nxxx-xxxxxxxxxxxx" where N is one of 8, 9, a, b.
std::string random_uuid() {
  std::uint64_t high = random_uint64();
  std::uint64_t low = random_uint64();
  // version 4
  high = (high & ~std::uint64_t(0xF000)) | std::uint64_t(0x4000);
  // variant 1 (RFC 4122)
  low = (low & ~(std::uint64_t(0xC) << 60)) | (std::uint64_t(0x8) << 60);

  const std::string digits = hex_padded(high) + hex_padded(low);
  std::string result;
  result.reserve(36);
  result.append(digits, 0, 8);
  result += '-';
  result.append(digits, 8, 4);
  result += '-';
  result.append(digits, 12, 4);
  result += '-';
  result.append(digits, 16, 4);
  result += '-';
  result.append(digits, 20, 12);
  return result;
}

}  // namespace

IDGenerator uuid_generator() { return &random_uuid; }

std::shared_ptr<const TraceIDGenerator> default_trace_id_generator() {
  return std::make_shared<DefaultTraceIDGenerator>();
}

}  // namespace correlation
}  // namespace webapi
