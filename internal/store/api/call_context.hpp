#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "internal/store/api/result.hpp"

namespace workbundle::store {

/*
  Caller-supplied deadline and cancellation token.

  Passed unchanged through every remote call of an operation. Copies share
  the cancellation token, so cancelling any copy aborts the whole sequence.
*/
class CallContext {
 public:
  using Clock     = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  CallContext();

  static CallContext WithTimeout(std::chrono::milliseconds timeout);
  static CallContext WithDeadline(TimePoint deadline);

  void Cancel();
  bool IsCancelled() const;

  const std::optional<TimePoint>& Deadline() const {
    return deadline_;
  }

  bool Expired() const;

  // Time left before the deadline; nullopt when there is no deadline.
  std::optional<std::chrono::milliseconds> Remaining() const;

  // Cancelled / DeadlineExceeded when the next remote call must not start.
  Result Check() const;

 private:
  std::optional<TimePoint>           deadline_;
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace workbundle::store
