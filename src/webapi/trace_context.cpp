#include <webapi/trace_context.h>

namespace webapi {
namespace correlation {

std::string encode_traceparent(const TraceContext& context) {
  std::string result;
  // version
  result += "00-";

  // trace ID
  result += context.trace_id.hex_padded();
  result += '-';

  // span ID
  result += context.span_id.hex_padded();
  result += '-';

  // flags
  result += "00";

  return result;
}

TraceContextStack::Scope::Scope(TraceContextStack& stack)
    : stack_(&stack), depth_(stack.depth()) {}

TraceContextStack::Scope::~Scope() {
  while (stack_->depth() > depth_) {
    stack_->pop();
  }
}

const TraceContext* TraceContextStack::current() const {
  if (contexts_.empty()) {
    return nullptr;
  }
  return &contexts_.back();
}

void TraceContextStack::push(TraceContext context) {
  contexts_.push_back(std::move(context));
}

void TraceContextStack::pop() {
  if (!contexts_.empty()) {
    contexts_.pop_back();
  }
}

std::size_t TraceContextStack::depth() const { return contexts_.size(); }

bool TraceContextStack::empty() const { return contexts_.empty(); }

}  // namespace correlation
}  // namespace webapi
