// Caller-side deadline for a long-running mapper.
//
// tmc::spawn_tuple().each() awaits the mapper and a timeout task together.
// When the timeout completes first, the root task requests stop through the
// std::stop_source whose token travels in the run_config. The mapper observes
// the request at its next chunk boundary and fails with
// stagecraft::cancelled; chunks that already started run to completion.
//
// The timeout nominally occurs after 100ms and the timestamps of the various
// events are logged.

#include "stagecraft/stagecraft.hpp"

#include "tmc/ex_cpu.hpp"
#include "tmc/spawn_tuple.hpp"
#include "tmc/task.hpp"

#include <atomic>
#include <chrono>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

static void log_event_timestamp(
  std::string const& Event,
  std::chrono::high_resolution_clock::time_point StartTime,
  std::chrono::high_resolution_clock::time_point Now =
    std::chrono::high_resolution_clock::now()
) {
  std::printf(
    "%s at %" PRIu64 " us\n", Event.c_str(),
    static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(Now - StartTime)
        .count()
    )
  );
}

using slow_mapper = std::shared_ptr<stagecraft::mapper<int, int> const>;

// Reports how the run ended.
static tmc::task<std::string> run_until_stopped(
  slow_mapper Mapper, std::vector<int> Items, stagecraft::run_config Config
) {
  try {
    auto out = co_await Mapper->invoke(std::move(Items), std::move(Config));
    co_return "completed " + std::to_string(out.size()) + " items";
  } catch (stagecraft::cancelled const& e) {
    co_return std::string(e.what());
  }
}

static tmc::task<std::chrono::high_resolution_clock::time_point>
timeout_after(std::chrono::milliseconds Delay) {
  co_await stagecraft::sleep_for(Delay);
  co_return std::chrono::high_resolution_clock::now();
}

int main() {
  stagecraft::init_runtime(
    stagecraft::runtime_config{}.apply_environment()
  );
  return tmc::async_main([]() -> tmc::task<int> {
    auto processed = std::make_shared<std::atomic<int>>(0);
    auto slow = stagecraft::make_lambda<int>(
      "slow",
      [processed](int X) -> tmc::task<int> {
        return [](std::atomic<int>& Processed, int V) -> tmc::task<int> {
          co_await stagecraft::sleep_for(std::chrono::milliseconds(10));
          ++Processed;
          co_return V * 2;
        }(*processed, X);
      }
    );
    stagecraft::concurrency_options opts;
    opts.concurrency_limit = 4;
    opts.batch_size = 8;
    // 64 items in chunks of 8, each chunk takes ~20ms
    slow_mapper mapper = stagecraft::make_mapper("slow_mapper", slow, opts);
    std::vector<int> items(64);
    for (int i = 0; i < 64; ++i) {
      items[static_cast<size_t>(i)] = i;
    }

    for (auto deadline : {std::chrono::milliseconds(100),
                          std::chrono::milliseconds(1000)}) {
      processed->store(0);
      auto startTime = std::chrono::high_resolution_clock::now();
      std::stop_source stop;
      stagecraft::run_config cfg;
      cfg.set_stop_token(stop.get_token()).add_tag("deadline");

      auto eachResult =
        tmc::spawn_tuple(
          run_until_stopped(mapper, items, cfg), timeout_after(deadline)
        )
          .each();

      bool finished = false;
      for (auto readyIdx = co_await eachResult; readyIdx != eachResult.end();
           readyIdx = co_await eachResult) {
        switch (readyIdx) {
        case 0: {
          auto outcome = eachResult.get<0>();
          log_event_timestamp(outcome, startTime);
          finished = true;
          break;
        }
        case 1: {
          auto timeoutAt = eachResult.get<1>();
          if (finished) {
            log_event_timestamp("deadline passed after completion", startTime, timeoutAt);
            break;
          }
          log_event_timestamp("deadline reached", startTime, timeoutAt);
          stop.request_stop();
          log_event_timestamp("stop requested", startTime);
          break;
        }
        default:
          // Should never happen
          std::exit(1);
        }
      }
      std::printf("items processed: %d of 64\n\n", processed->load());
    }
    co_return 0;
  }());
}
