// Fan-out: every named step receives the same input, and the outputs are
// collected into one JSON record keyed by step name.
//
// Steps run concurrently, at most concurrency_limit at a time. By default any
// failure fails the call with an aggregate_failure naming every failed key.
// With run_config::throw_on_error unset, failed keys are left out of the
// record instead and the failures are logged.

#pragma once

#include "stagecraft/config.hpp"
#include "stagecraft/errors.hpp"
#include "stagecraft/executor.hpp"
#include "stagecraft/limiter.hpp"
#include "stagecraft/log.hpp"
#include "stagecraft/stage.hpp"
#include "stagecraft/stream.hpp"
#include "stagecraft/value.hpp"

#include "tmc/channel.hpp"
#include "tmc/spawn_many.hpp"
#include "tmc/task.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace stagecraft {

/// Presents a stage<In, T> as a stage<In, value> by converting its output.
template <typename In, typename T> class json_adapter : public stage<In, value> {
  stage_ptr<In, T> inner_;

public:
  explicit json_adapter(stage_ptr<In, T> Inner)
      : stage<In, value>(Inner->name()), inner_{std::move(Inner)} {}

  tmc::task<value> invoke(In Input, run_config Config) const override {
    co_return to_value(co_await inner_->invoke(std::move(Input), std::move(Config)));
  }
};

template <typename In> class parallel : public stage<In, value> {
public:
  struct step {
    std::string key;
    stage_ptr<In, value> target;
  };
  using step_list = std::shared_ptr<std::vector<step> const>;

private:
  step_list steps_;
  size_t concurrencyLimit_;

  struct completion {
    size_t index;
    outcome<value> result;
  };

  size_t width(run_config const& Config) const {
    concurrency_options defaults;
    defaults.concurrency_limit = concurrencyLimit_;
    return Config.resolve(defaults).concurrency_limit;
  }

  static tmc::task<void> run_step(
    stage_ptr<In, value> const& Target, In const& Input,
    run_config const& Config, limiter& Lim, outcome<value>& Slot
  ) {
    auto p = co_await Lim.acquire();
    try {
      Slot.value.emplace(co_await Target->invoke(Input, Config));
    } catch (...) {
      Slot.error = std::current_exception();
    }
  }

  static tmc::task<void> run_step_notify(
    stage_ptr<In, value> const& Target, In const& Input,
    run_config const& Config, limiter& Lim, size_t Index,
    tmc::chan_tok<completion> Done
  ) {
    completion c{Index, {}};
    co_await run_step(Target, Input, Config, Lim, c.result);
    Done.post(std::move(c));
  }

  static tmc::task<void> stream_steps(
    std::shared_ptr<parallel const> Self, In Input, run_config Config,
    stream_writer<value>& Writer
  ) {
    auto const& steps = *Self->steps_;
    if (steps.empty()) {
      co_await Writer.emit(value::object());
      co_return;
    }
    limiter lim(Self->width(Config));
    auto done = tmc::make_channel<completion>();
    std::vector<tmc::task<void>> tasks;
    tasks.reserve(steps.size());
    for (size_t i = 0; i < steps.size(); ++i) {
      tasks.push_back(
        run_step_notify(steps[i].target, Input, Config, lim, i, done)
      );
    }
    auto all = tmc::spawn_many(tasks.data(), tasks.size()).fork();

    value record = value::object();
    std::vector<aggregate_failure::failure> failures;
    bool emitting = true;
    for (size_t received = 0; received < steps.size(); ++received) {
      auto c = co_await done.pull();
      if (!c.has_value()) {
        break;
      }
      auto const& key = steps[c->index].key;
      if (!c->result.ok()) {
        if (Config.throw_on_error) {
          failures.push_back({key, c->result.error});
          break;
        }
        logger()->warn(
          "{}: step '{}' failed and was skipped: {}", Self->name(), key,
          describe(c->result.error)
        );
        continue;
      }
      record[key] = std::move(*c->result.value);
      if (emitting) {
        emitting = co_await Writer.emit(record);
      }
    }
    // Every child runs to completion before the stream ends.
    co_await std::move(all);
    done.close();
    if (!failures.empty()) {
      aggregate_failure::rethrow_cancellation(failures);
      throw aggregate_failure(Self->name(), std::move(failures), steps.size());
    }
  }

public:
  parallel(
    std::string Name, step_list Steps,
    size_t ConcurrencyLimit = DEFAULT_CONCURRENCY_LIMIT
  )
      : stage<In, value>(std::move(Name)), steps_{std::move(Steps)},
        concurrencyLimit_{ConcurrencyLimit} {
    if (steps_ == nullptr) {
      steps_ = std::make_shared<std::vector<step> const>();
    }
    if (concurrencyLimit_ == 0) {
      throw std::invalid_argument(
        "parallel '" + this->name() + "': concurrency limit must be positive"
      );
    }
  }

  std::vector<std::string> keys() const {
    std::vector<std::string> out;
    for (auto const& s : *steps_) {
      out.push_back(s.key);
    }
    return out;
  }

  size_t concurrency_limit() const noexcept { return concurrencyLimit_; }

  tmc::task<value> invoke(In Input, run_config Config) const override {
    auto const& steps = *steps_;
    std::vector<outcome<value>> results(steps.size());
    if (!steps.empty()) {
      limiter lim(width(Config));
      std::vector<tmc::task<void>> tasks;
      tasks.reserve(steps.size());
      for (size_t i = 0; i < steps.size(); ++i) {
        tasks.push_back(run_step(steps[i].target, Input, Config, lim, results[i]));
      }
      co_await tmc::spawn_many(tasks.data(), tasks.size());
    }

    value record = value::object();
    std::vector<aggregate_failure::failure> failures;
    for (size_t i = 0; i < steps.size(); ++i) {
      if (results[i].ok()) {
        record[steps[i].key] = std::move(*results[i].value);
      } else {
        failures.push_back({steps[i].key, results[i].error});
      }
    }
    if (!failures.empty()) {
      aggregate_failure::rethrow_cancellation(failures);
      if (Config.throw_on_error) {
        throw aggregate_failure(this->name(), std::move(failures), steps.size());
      }
      for (auto const& f : failures) {
        logger()->warn(
          "{}: step '{}' failed and was skipped: {}", this->name(), f.key,
          describe(f.cause)
        );
      }
    }
    co_return record;
  }

  /// Runs invoke() per input, at most max_batch_concurrency (default 5)
  /// records at a time. Each record still fans out up to concurrency_limit.
  tmc::task<std::vector<value>>
  batch(std::vector<In> Inputs, run_config Config) const override {
    concurrency_options opts;
    opts.concurrency_limit =
      Config.max_batch_concurrency.value_or(DEFAULT_PARALLEL_BATCH_CONCURRENCY);
    opts.batch_size = std::max<size_t>(Inputs.size(), 1);
    auto stop = Config.stop_token;
    co_return co_await execute_concurrent<In, value>(
      std::move(Inputs),
      [this, Config](In const& Item, size_t) -> tmc::task<value> {
        return invoke(Item, Config);
      },
      opts, std::move(stop), this->name()
    );
  }

  /// Yields the record built so far each time one more step succeeds.
  output_stream<value> stream(In Input, run_config Config) const override {
    auto self = std::static_pointer_cast<parallel const>(this->keep_alive());
    return produce<value>(
      [self = std::move(self), Input = std::move(Input),
       Config = std::move(Config)](
        stream_writer<value>& Writer
      ) mutable -> tmc::task<void> {
        return stream_steps(self, std::move(Input), std::move(Config), Writer);
      }
    );
  }

  /// A new fan-out with Target under Key. An existing Key is replaced in
  /// place. Targets whose output is not a value are converted with
  /// nlohmann::json.
  template <typename Ptr>
  std::shared_ptr<parallel const> add_step(std::string Key, Ptr Target) const {
    using T = detail::output_of<Ptr>;
    static_assert(
      std::is_same_v<detail::input_of<Ptr>, In>,
      "a fan-out step must accept the fan-out's input type"
    );
    stage_ptr<In, value> target;
    if constexpr (std::is_same_v<T, value>) {
      target = std::move(Target);
    } else {
      target = std::make_shared<json_adapter<In, T> const>(
        stage_ptr<In, T>(std::move(Target))
      );
    }
    auto steps = std::make_shared<std::vector<step>>(*steps_);
    auto it = std::find_if(steps->begin(), steps->end(), [&](step const& s) {
      return s.key == Key;
    });
    if (it != steps->end()) {
      it->target = std::move(target);
    } else {
      steps->push_back(step{std::move(Key), std::move(target)});
    }
    return std::make_shared<parallel const>(
      this->name(), std::move(steps), concurrencyLimit_
    );
  }

  /// A new fan-out without Key. Unknown keys are ignored.
  std::shared_ptr<parallel const> remove_step(std::string const& Key) const {
    auto steps = std::make_shared<std::vector<step>>();
    for (auto const& s : *steps_) {
      if (s.key != Key) {
        steps->push_back(s);
      }
    }
    return std::make_shared<parallel const>(
      this->name(), std::move(steps), concurrencyLimit_
    );
  }

  std::shared_ptr<parallel const>
  with_concurrency_limit(size_t ConcurrencyLimit) const {
    return std::make_shared<parallel const>(
      this->name(), steps_, ConcurrencyLimit
    );
  }
};

/// An empty fan-out; add steps with add_step().
template <typename In>
std::shared_ptr<parallel<In> const> make_parallel(
  std::string Name, size_t ConcurrencyLimit = DEFAULT_CONCURRENCY_LIMIT
) {
  return std::make_shared<parallel<In> const>(
    std::move(Name), nullptr, ConcurrencyLimit
  );
}

} // namespace stagecraft
