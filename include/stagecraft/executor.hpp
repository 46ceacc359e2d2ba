// Bounded-concurrency execution of one unit of work per item.
//
// A unit is `(In const& Item, size_t Index) -> tmc::task<Out>`. Items are
// owned by the executor for the whole call, so units may hold on to the
// reference until their task completes.
//
// concurrency_limit bounds how many units are in flight at any instant.
// batch_size only controls chunking: with preserve_order set, collections
// larger than batch_size are run as consecutive chunks, and stop is checked
// between chunks. Results are always index aligned with the input.

#pragma once

#include "stagecraft/config.hpp"
#include "stagecraft/errors.hpp"
#include "stagecraft/limiter.hpp"
#include "stagecraft/log.hpp"
#include "stagecraft/stream.hpp"
#include "stagecraft/timing.hpp"

#include "tmc/spawn_many.hpp"
#include "tmc/task.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace stagecraft {

template <typename In, typename Out>
using unit_fn = std::function<tmc::task<Out>(In const&, size_t)>;

/// The settled result of one unit: exactly one of value / error is set.
template <typename T> struct outcome {
  std::optional<T> value;
  std::exception_ptr error;

  bool ok() const noexcept { return error == nullptr; }

  /// The value, or rethrows the error.
  T get() && {
    if (error != nullptr) {
      std::rethrow_exception(error);
    }
    return std::move(*value);
  }
};

namespace detail {
template <typename In, typename Out>
tmc::task<void> run_unit(
  unit_fn<In, Out> const& Unit, In const& Item, size_t Index, limiter& Lim,
  outcome<Out>& Slot
) {
  auto p = co_await Lim.acquire();
  try {
    Slot.value.emplace(co_await Unit(Item, Index));
  } catch (...) {
    Slot.error = std::current_exception();
  }
}

// Runs Items[Begin, End) with at most Limit units in flight. Never throws on
// unit failure; failures land in Results.
template <typename In, typename Out>
tmc::task<void> run_window(
  std::vector<In> const& Items, size_t Begin, size_t End,
  unit_fn<In, Out> const& Unit, size_t Limit,
  std::vector<outcome<Out>>& Results
) {
  if (Begin >= End) {
    co_return;
  }
  limiter lim(Limit);
  std::vector<tmc::task<void>> tasks;
  tasks.reserve(End - Begin);
  for (size_t i = Begin; i < End; ++i) {
    tasks.push_back(run_unit<In, Out>(Unit, Items[i], i, lim, Results[i]));
  }
  co_await tmc::spawn_many(tasks.data(), tasks.size());
}

template <typename Out>
std::vector<aggregate_failure::failure> collect_failures(
  std::vector<outcome<Out>> const& Results, size_t Begin, size_t End
) {
  std::vector<aggregate_failure::failure> failures;
  for (size_t i = Begin; i < End; ++i) {
    if (!Results[i].ok()) {
      failures.push_back({"item " + std::to_string(i), Results[i].error});
    }
  }
  return failures;
}
} // namespace detail

/// Runs Unit over every item and reports each result or error separately.
/// Throws cancelled if Stop is requested between chunks, and
/// std::invalid_argument for a zero limit or batch size.
template <typename In, typename Out>
tmc::task<std::vector<outcome<Out>>> execute_settled(
  std::vector<In> Items, unit_fn<In, Out> Unit,
  concurrency_options Options = concurrency_options{},
  std::stop_token Stop = std::stop_token{}
) {
  Options.validate();
  std::vector<outcome<Out>> results(Items.size());
  if (Items.empty()) {
    co_return results;
  }

  if (!Options.preserve_order || Items.size() <= Options.batch_size) {
    co_await detail::run_window<In, Out>(
      Items, 0, Items.size(), Unit, Options.concurrency_limit, results
    );
    co_return results;
  }

  for (size_t begin = 0; begin < Items.size(); begin += Options.batch_size) {
    if (Stop.stop_requested()) {
      throw cancelled("executor");
    }
    size_t end = std::min(begin + Options.batch_size, Items.size());
    logger()->debug("executor: chunk [{}, {}) of {}", begin, end, Items.size());
    co_await detail::run_window<In, Out>(
      Items, begin, end, Unit, Options.concurrency_limit, results
    );
  }
  co_return results;
}

/// All-or-nothing form of execute_settled(). If any unit failed, throws an
/// aggregate_failure that lists every failed index.
template <typename In, typename Out>
tmc::task<std::vector<Out>> execute_concurrent(
  std::vector<In> Items, unit_fn<In, Out> Unit,
  concurrency_options Options = concurrency_options{},
  std::stop_token Stop = std::stop_token{}, std::string Name = "executor"
) {
  size_t total = Items.size();
  auto settled = co_await execute_settled<In, Out>(
    std::move(Items), std::move(Unit), Options, std::move(Stop)
  );
  auto failures = detail::collect_failures(settled, 0, settled.size());
  if (!failures.empty()) {
    aggregate_failure::rethrow_cancellation(failures);
    throw aggregate_failure(std::move(Name), std::move(failures), total);
  }
  std::vector<Out> out;
  out.reserve(settled.size());
  for (auto& o : settled) {
    out.push_back(std::move(*o.value));
  }
  co_return out;
}

/// Yields the results of one chunk of ChunkSize items at a time. The next
/// chunk is computed while the consumer handles the current one, but no
/// further. The stream fails with an aggregate_failure at the first chunk
/// that contains a failure.
template <typename In, typename Out>
output_stream<std::vector<Out>> process_stream(
  std::vector<In> Items, unit_fn<In, Out> Unit,
  concurrency_options Options = concurrency_options{},
  std::stop_token Stop = std::stop_token{},
  size_t ChunkSize = DEFAULT_STREAM_BATCH_SIZE, std::string Name = "executor"
) {
  Options.validate();
  if (ChunkSize == 0) {
    throw std::invalid_argument("process_stream: chunk size must be positive");
  }
  return produce<std::vector<Out>>(
    [Items = std::move(Items), Unit = std::move(Unit), Options,
     Stop = std::move(Stop), ChunkSize, Name = std::move(Name)](
      stream_writer<std::vector<Out>>& Writer
    ) -> tmc::task<void> {
      std::vector<outcome<Out>> results(Items.size());
      for (size_t begin = 0; begin < Items.size(); begin += ChunkSize) {
        if (Stop.stop_requested()) {
          throw cancelled(Name);
        }
        size_t end = std::min(begin + ChunkSize, Items.size());
        co_await detail::run_window<In, Out>(
          Items, begin, end, Unit, Options.concurrency_limit, results
        );
        auto failures = detail::collect_failures(results, begin, end);
        if (!failures.empty()) {
          aggregate_failure::rethrow_cancellation(failures);
          throw aggregate_failure(Name, std::move(failures), end - begin);
        }
        std::vector<Out> chunk;
        chunk.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
          chunk.push_back(std::move(*results[i].value));
        }
        if (!co_await Writer.emit(std::move(chunk))) {
          co_return;
        }
      }
    }
  );
}

struct retry_policy {
  size_t max_retries = 3;
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{30000};
  double backoff_factor = 2.0;
  /// Called before each retry with the 1-based retry number, the error that
  /// caused it and the delay about to be slept.
  std::function<void(size_t, std::exception_ptr const&, std::chrono::milliseconds)>
    on_retry;

  /// min(base_delay * backoff_factor^(Attempt - 1), max_delay)
  std::chrono::milliseconds delay_for(size_t Attempt) const {
    double scaled = static_cast<double>(base_delay.count()) *
                    std::pow(backoff_factor, static_cast<double>(Attempt - 1));
    double capped = std::min(scaled, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
  }
};

namespace detail {
template <typename In, typename Out>
using retry_state = std::pair<unit_fn<In, Out>, retry_policy>;

template <typename In, typename Out>
tmc::task<Out> retry_loop(
  std::shared_ptr<retry_state<In, Out> const> State, std::stop_token Stop,
  In const& Item, size_t Index
) {
  auto const& [Unit, Policy] = *State;
  for (size_t attempt = 0;; ++attempt) {
    std::exception_ptr err;
    try {
      co_return co_await Unit(Item, Index);
    } catch (...) {
      err = std::current_exception();
    }
    if (attempt >= Policy.max_retries) {
      std::rethrow_exception(err);
    }
    if (Stop.stop_requested()) {
      throw cancelled("retry");
    }
    auto delay = Policy.delay_for(attempt + 1);
    logger()->warn(
      "retry {}/{} for item {} in {}ms: {}", attempt + 1, Policy.max_retries,
      Index, delay.count(), describe(err)
    );
    if (Policy.on_retry) {
      Policy.on_retry(attempt + 1, err, delay);
    }
    co_await sleep_for(delay);
  }
}

template <typename In, typename Out>
tmc::task<Out> gated_call(
  std::shared_ptr<unit_fn<In, Out> const> Unit, std::shared_ptr<rate_gate> Gate,
  In const& Item, size_t Index
) {
  co_await Gate->wait();
  co_return co_await (*Unit)(Item, Index);
}
} // namespace detail

/// Wraps Unit so that each item is retried independently according to
/// Policy. After the last attempt the final error is rethrown unchanged. A
/// stop request observed between attempts throws cancelled.
template <typename In, typename Out>
unit_fn<In, Out> with_retry(
  unit_fn<In, Out> Unit, retry_policy Policy,
  std::stop_token Stop = std::stop_token{}
) {
  auto state = std::make_shared<detail::retry_state<In, Out> const>(
    std::move(Unit), std::move(Policy)
  );
  return [state, Stop = std::move(Stop)](
           In const& Item, size_t Index
         ) -> tmc::task<Out> {
    return detail::retry_loop<In, Out>(state, Stop, Item, Index);
  };
}

/// Wraps Unit so that unit starts are spaced through Gate. The gate may be
/// shared between several wrapped units.
template <typename In, typename Out>
unit_fn<In, Out>
rate_limited(unit_fn<In, Out> Unit, std::shared_ptr<rate_gate> Gate) {
  auto unit = std::make_shared<unit_fn<In, Out> const>(std::move(Unit));
  return [unit, Gate = std::move(Gate)](
           In const& Item, size_t Index
         ) -> tmc::task<Out> {
    return detail::gated_call<In, Out>(unit, Gate, Item, Index);
  };
}

template <typename In, typename Out>
unit_fn<In, Out> rate_limited(unit_fn<In, Out> Unit, double PerSecond) {
  return rate_limited<In, Out>(
    std::move(Unit), std::make_shared<rate_gate>(PerSecond)
  );
}

} // namespace stagecraft
