#include "stagecraft/timing.hpp"

#include "tmc/asio/aw_asio.hpp"
#include "tmc/asio/ex_asio.hpp"

#include <asio/steady_timer.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <system_error>

namespace stagecraft {

tmc::task<void> sleep_until(steady_clock::time_point Deadline) {
  asio::steady_timer tim{tmc::asio_executor(), Deadline};
  auto [error] = co_await tim.async_wait(tmc::aw_asio);
  if (error) {
    throw std::system_error(error, "stagecraft timer");
  }
}

tmc::task<void> sleep_for(steady_clock::duration Duration) {
  if (Duration <= steady_clock::duration::zero()) {
    co_return;
  }
  co_await sleep_until(steady_clock::now() + Duration);
}

rate_gate::rate_gate(double PerSecond) : perSecond_{PerSecond} {
  if (!(PerSecond > 0.0) || !std::isfinite(PerSecond)) {
    throw std::invalid_argument(
      "rate_gate: rate must be positive and finite, got " +
      std::to_string(PerSecond)
    );
  }
  interval_ = std::chrono::duration_cast<steady_clock::duration>(
    std::chrono::duration<double>(1.0 / PerSecond)
  );
  next_ = steady_clock::time_point::min();
}

steady_clock::time_point rate_gate::reserve() {
  tmc::tiny_lock_guard lg{lock_};
  auto slot = std::max(steady_clock::now(), next_);
  next_ = slot + interval_;
  return slot;
}

tmc::task<void> rate_gate::wait() {
  auto slot = reserve();
  if (slot > steady_clock::now()) {
    co_await sleep_until(slot);
  }
}

} // namespace stagecraft
