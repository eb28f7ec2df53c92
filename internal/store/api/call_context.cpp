#include "internal/store/api/call_context.hpp"

#include <algorithm>

namespace workbundle::store {

CallContext::CallContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {
}

CallContext CallContext::WithTimeout(std::chrono::milliseconds timeout) {
  return WithDeadline(Clock::now() + timeout);
}

CallContext CallContext::WithDeadline(TimePoint deadline) {
  CallContext ctx;
  ctx.deadline_ = deadline;
  return ctx;
}

void CallContext::Cancel() {
  cancelled_->store(true, std::memory_order_release);
}

bool CallContext::IsCancelled() const {
  return cancelled_->load(std::memory_order_acquire);
}

bool CallContext::Expired() const {
  return deadline_ && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> CallContext::Remaining() const {
  if (!deadline_) {
    return std::nullopt;
  }
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

Result CallContext::Check() const {
  if (IsCancelled()) {
    return Result::Err(ErrorCode::Cancelled, "operation cancelled by caller");
  }
  if (Expired()) {
    return Result::Err(ErrorCode::DeadlineExceeded, "operation deadline exceeded");
  }
  return Result::Ok();
}

} // namespace workbundle::store
