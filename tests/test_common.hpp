#pragma once

#include "stagecraft/config.hpp"
#include "stagecraft/runtime.hpp"
#include "stagecraft/timing.hpp"

#include "tmc/ex_cpu.hpp"
#include "tmc/task.hpp"

#include <atomic>
#include <chrono>
#include <climits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#if defined(__has_feature)
#if __has_feature(thread_sanitizer)
#define TSAN_ENABLED
#endif
#endif

// test_async_main doesn't return a value
template <typename Executor>
static inline tmc::task<void> test_async_main_task_(
  Executor& Exec, tmc::task<void> ClientMainTask, std::atomic<int>* ExitCode_out
) {
  co_await std::move(ClientMainTask.resume_on(Exec));
  ExitCode_out->store(0);
  ExitCode_out->notify_all();
}

template <typename Executor>
static inline void
test_async_main(Executor& Exec, tmc::task<void>&& ClientMainTask) {
  // test setup should call init_runtime() beforehand
  std::atomic<int> exitCode(INT_MIN);
  post(
    Exec, test_async_main_task_(Exec, std::move(ClientMainTask), &exitCode), 0
  );
  exitCode.wait(INT_MIN);
}

static inline stagecraft::runtime_config test_runtime_config() {
  stagecraft::runtime_config cfg;
  cfg.thread_count = 4;
  cfg.log_level = spdlog::level::warn;
  return cfg;
}

// Awaits Task and returns the exception it threw, if it was an Ex.
// Exceptions of other types propagate.
template <typename Ex, typename Result>
static inline tmc::task<std::optional<Ex>> catch_as(tmc::task<Result> Task) {
  try {
    co_await std::move(Task);
  } catch (Ex const& e) {
    co_return e;
  }
  co_return std::nullopt;
}

static inline tmc::task<void> delay_ms(int Ms) {
  co_await stagecraft::sleep_for(std::chrono::milliseconds(Ms));
}

// Tracks how many callers are inside a region at once.
struct concurrency_gauge {
  std::atomic<int> current{0};
  std::atomic<int> peak{0};
  std::atomic<int> calls{0};

  void enter() {
    ++calls;
    int now = ++current;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
  }
  void leave() { --current; }
};

struct test_failure : std::runtime_error {
  explicit test_failure(std::string const& What) : std::runtime_error(What) {}
};

static inline long long
elapsed_ms(std::chrono::steady_clock::time_point Start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
           std::chrono::steady_clock::now() - Start
  )
    .count();
}
