#pragma once

#include "tmc/detail/tiny_lock.hpp"
#include "tmc/task.hpp"

#include <chrono>

namespace stagecraft {

using steady_clock = std::chrono::steady_clock;

/// Suspends the calling task on a timer of tmc::asio_executor(). The task is
/// resumed on its original executor. Throws std::system_error if the timer
/// reports an error.
tmc::task<void> sleep_for(steady_clock::duration Duration);
tmc::task<void> sleep_until(steady_clock::time_point Deadline);

/// Spaces the start of successive operations at least 1 / PerSecond seconds
/// apart. Callers reserve a slot and sleep until it; slots are handed out in
/// the order wait() is called. Shared by every invocation of the stage that
/// owns it.
class rate_gate {
  tmc::tiny_lock lock_;
  steady_clock::duration interval_;
  steady_clock::time_point next_;
  double perSecond_;

  steady_clock::time_point reserve();

public:
  /// Throws std::invalid_argument unless PerSecond is positive and finite.
  explicit rate_gate(double PerSecond);

  rate_gate(rate_gate const&) = delete;
  rate_gate& operator=(rate_gate const&) = delete;

  tmc::task<void> wait();

  double per_second() const noexcept { return perSecond_; }
  steady_clock::duration interval() const noexcept { return interval_; }
};

} // namespace stagecraft
