// Brings up the executors that stages run on.
//
// Stages are tmc::task coroutines scheduled on tmc::cpu_executor(). Retry
// backoff and rate limiting wait on asio timers owned by tmc::asio_executor().
// Applications that already manage these executors themselves do not need to
// call init_runtime(); they only have to make sure both are initialized before
// a decorated stage sleeps.

#pragma once

#include "stagecraft/config.hpp"

#include "tmc/ex_cpu.hpp"
#include "tmc/sync.hpp"
#include "tmc/task.hpp"

#include <utility>

namespace stagecraft {

/// Initializes logging, tmc::cpu_executor() and (optionally) the asio timer
/// executor. Calling it again before teardown_runtime() has no effect.
void init_runtime(runtime_config const& Config = runtime_config{});

void teardown_runtime();

bool runtime_initialized() noexcept;

/// Runs Task on tmc::cpu_executor() and blocks the calling (non-executor)
/// thread until it completes. Exceptions thrown by Task are rethrown here.
template <typename Result> Result block_on(tmc::task<Result>&& Task) {
  return tmc::post_waitable(tmc::cpu_executor(), std::move(Task), 0).get();
}

} // namespace stagecraft
