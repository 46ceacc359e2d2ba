#include "stagecraft/limiter.hpp"

#include "tmc/detail/thread_locals.hpp"

#include <stdexcept>
#include <utility>

namespace stagecraft {

void permit::release() noexcept {
  if (owner_ != nullptr) {
    limiter* l = owner_;
    owner_ = nullptr;
    l->release_one();
  }
}

limiter::limiter(size_t Permits) : available_{Permits} {
  if (Permits == 0) {
    throw std::invalid_argument("limiter: permit count must be at least 1");
  }
}

bool limiter::try_take() noexcept {
  tmc::tiny_lock_guard lg{lock_};
  if (available_ != 0 && waiters_.empty()) {
    --available_;
    return true;
  }
  return false;
}

bool limiter::aw_acquire::await_suspend(std::coroutine_handle<> Outer
) noexcept {
  tmc::tiny_lock_guard lg{lim_.lock_};
  // A permit may have been returned between await_ready and here.
  if (lim_.available_ != 0 && lim_.waiters_.empty()) {
    --lim_.available_;
    return false;
  }
  lim_.waiters_.push_back(
    waiter{Outer, tmc::current_executor(), tmc::current_priority()}
  );
  return true;
}

void limiter::release_one() noexcept {
  waiter next;
  {
    tmc::tiny_lock_guard lg{lock_};
    if (waiters_.empty()) {
      ++available_;
      return;
    }
    next = waiters_.front();
    waiters_.pop_front();
  }
  // The permit is transferred without passing through available_.
  tmc::detail::post_checked(next.executor, std::move(next.handle), next.priority);
}

size_t limiter::available() const noexcept {
  tmc::tiny_lock_guard lg{lock_};
  return available_;
}

size_t limiter::waiting() const noexcept {
  tmc::tiny_lock_guard lg{lock_};
  return waiters_.size();
}

} // namespace stagecraft
