#include "stagecraft/runtime.hpp"
#include "stagecraft/log.hpp"

#include "tmc/asio/ex_asio.hpp"
#include "tmc/ex_cpu.hpp"

#include <spdlog/cfg/env.h>

#include <atomic>
#include <mutex>

namespace stagecraft {

static std::mutex runtimeLock;
static std::atomic<bool> runtimeUp{false};
static bool timersUp = false;

void init_runtime(runtime_config const& Config) {
  std::scoped_lock lg{runtimeLock};
  if (runtimeUp.load()) {
    return;
  }
  set_log_level(Config.log_level);
  // SPDLOG_LEVEL in the environment takes precedence over the config file
  spdlog::cfg::load_env_levels();

  auto& ex = tmc::cpu_executor();
  if (Config.thread_count != 0) {
    ex.set_thread_count(Config.thread_count);
  }
  ex.set_priority_count(Config.priority_count).init();

  if (Config.start_timer_executor) {
    tmc::asio_executor().init();
    timersUp = true;
  }
  runtimeUp.store(true);
  logger()->info(
    "runtime started: {} worker threads, {} priorities, timers {}",
    ex.thread_count(), Config.priority_count, timersUp ? "on" : "off"
  );
}

void teardown_runtime() {
  std::scoped_lock lg{runtimeLock};
  if (!runtimeUp.load()) {
    return;
  }
  if (timersUp) {
    tmc::asio_executor().teardown();
    timersUp = false;
  }
  tmc::cpu_executor().teardown();
  runtimeUp.store(false);
  logger()->info("runtime stopped");
}

bool runtime_initialized() noexcept { return runtimeUp.load(); }

} // namespace stagecraft
