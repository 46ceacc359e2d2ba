// A FIFO-fair counting semaphore for coroutines.
//
// `co_await lim.acquire()` suspends until a permit is free and produces a
// move-only permit. Destroying the permit returns it. If a task is waiting,
// the permit is handed straight to the oldest waiter and that waiter is posted
// back to the executor (and priority) it was suspended on, so a late arrival
// can never overtake a task that is already queued.

#pragma once

#include "tmc/current.hpp"
#include "tmc/detail/tiny_lock.hpp"

#include <coroutine>
#include <cstddef>
#include <deque>

namespace stagecraft {

class limiter;

class [[nodiscard]] permit {
  limiter* owner_;

public:
  permit() noexcept : owner_{nullptr} {}
  explicit permit(limiter& Owner) noexcept : owner_{&Owner} {}

  permit(permit const&) = delete;
  permit& operator=(permit const&) = delete;

  permit(permit&& Other) noexcept : owner_{Other.owner_} {
    Other.owner_ = nullptr;
  }
  permit& operator=(permit&& Other) noexcept {
    if (this != &Other) {
      release();
      owner_ = Other.owner_;
      Other.owner_ = nullptr;
    }
    return *this;
  }

  ~permit() { release(); }

  /// Returns the permit early. Safe to call more than once.
  void release() noexcept;

  bool held() const noexcept { return owner_ != nullptr; }
};

class limiter {
  using executor_ptr = decltype(tmc::current_executor());

  struct waiter {
    std::coroutine_handle<> handle;
    executor_ptr executor;
    size_t priority;
  };

  mutable tmc::tiny_lock lock_;
  size_t available_;
  std::deque<waiter> waiters_;

  friend class permit;
  void release_one() noexcept;
  bool try_take() noexcept;

public:
  class [[nodiscard]] aw_acquire {
    limiter& lim_;

  public:
    explicit aw_acquire(limiter& Lim) noexcept : lim_{Lim} {}

    bool await_ready() noexcept { return lim_.try_take(); }
    bool await_suspend(std::coroutine_handle<> Outer) noexcept;
    permit await_resume() noexcept { return permit{lim_}; }
  };

  /// Throws std::invalid_argument if Permits is 0.
  explicit limiter(size_t Permits);

  limiter(limiter const&) = delete;
  limiter& operator=(limiter const&) = delete;

  aw_acquire acquire() noexcept { return aw_acquire{*this}; }

  size_t available() const noexcept;
  size_t waiting() const noexcept;
};

} // namespace stagecraft
