// Collection-level stage: applies one element stage to every item of a
// vector through the bounded executor.
//
// The mapper's own concurrency_options are defaults; concurrency_limit,
// batch_size and preserve_order in a run_config override them per call.
// Derived mappers (with_*) are new objects; the original is unchanged.

#pragma once

#include "stagecraft/config.hpp"
#include "stagecraft/executor.hpp"
#include "stagecraft/stage.hpp"
#include "stagecraft/stream.hpp"
#include "stagecraft/timing.hpp"

#include "tmc/task.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stagecraft {

inline constexpr size_t MAX_MAPPER_STREAM_CHUNK = 20;

template <typename In, typename Out, typename R> class reduce_stage;

template <typename In, typename Out>
class mapper : public stage<std::vector<In>, std::vector<Out>> {
public:
  struct settings {
    concurrency_options options;
    std::optional<retry_policy> retry;
    std::shared_ptr<rate_gate> gate;
    std::function<bool(In const&)> filter;
  };

private:
  stage_ptr<In, Out> element_;
  settings settings_;

  std::shared_ptr<mapper const> derive(settings Settings) const {
    return std::make_shared<mapper const>(
      this->name(), element_, std::move(Settings)
    );
  }

  std::vector<In> admitted(std::vector<In> Inputs) const {
    if (!settings_.filter) {
      return Inputs;
    }
    std::vector<In> out;
    out.reserve(Inputs.size());
    for (auto& item : Inputs) {
      if (settings_.filter(item)) {
        out.push_back(std::move(item));
      }
    }
    return out;
  }

public:
  mapper(std::string Name, stage_ptr<In, Out> Element, settings Settings)
      : stage<std::vector<In>, std::vector<Out>>(std::move(Name)),
        element_{std::move(Element)}, settings_{std::move(Settings)} {
    settings_.options.validate();
  }

  concurrency_options const& options() const noexcept {
    return settings_.options;
  }
  stage_ptr<In, Out> const& element() const noexcept { return element_; }

  /// The per-item unit for one call: the element stage, behind the rate gate
  /// (if any), behind retry (if any), so that every attempt is rate limited.
  unit_fn<In, Out> make_unit(run_config const& Config) const {
    unit_fn<In, Out> unit =
      [element = element_, Config](In const& Item, size_t) -> tmc::task<Out> {
      return element->invoke(Item, Config);
    };
    if (settings_.gate != nullptr) {
      unit = rate_limited<In, Out>(std::move(unit), settings_.gate);
    }
    if (settings_.retry.has_value()) {
      unit = stagecraft::with_retry<In, Out>(
        std::move(unit), *settings_.retry, Config.stop_token
      );
    }
    return unit;
  }

  tmc::task<std::vector<Out>>
  invoke(std::vector<In> Inputs, run_config Config) const override {
    auto opts = Config.resolve(settings_.options);
    co_return co_await execute_concurrent<In, Out>(
      admitted(std::move(Inputs)), make_unit(Config), opts, Config.stop_token,
      this->name()
    );
  }

  /// Like invoke(), but reports every item's result or error instead of
  /// failing as a whole.
  tmc::task<std::vector<outcome<Out>>>
  settle(std::vector<In> Inputs, run_config Config = run_config{}) const {
    auto opts = Config.resolve(settings_.options);
    co_return co_await execute_settled<In, Out>(
      admitted(std::move(Inputs)), make_unit(Config), opts, Config.stop_token
    );
  }

  /// Yields results in chunks of min(batch_size, 20) items.
  output_stream<std::vector<Out>>
  stream(std::vector<In> Inputs, run_config Config) const override {
    auto opts = Config.resolve(settings_.options);
    size_t chunk = std::min(opts.batch_size, MAX_MAPPER_STREAM_CHUNK);
    return process_stream<In, Out>(
      admitted(std::move(Inputs)), make_unit(Config), opts, Config.stop_token,
      chunk, this->name()
    );
  }

  std::shared_ptr<mapper const> with_concurrency(size_t Limit) const {
    auto s = settings_;
    s.options.concurrency_limit = Limit;
    return derive(std::move(s));
  }

  std::shared_ptr<mapper const> with_batch_size(size_t Size) const {
    auto s = settings_;
    s.options.batch_size = Size;
    return derive(std::move(s));
  }

  std::shared_ptr<mapper const> with_order_preservation(bool Preserve) const {
    auto s = settings_;
    s.options.preserve_order = Preserve;
    return derive(std::move(s));
  }

  std::shared_ptr<mapper const> with_retry(retry_policy Policy) const {
    auto s = settings_;
    s.retry = std::move(Policy);
    return derive(std::move(s));
  }

  /// Spaces item starts at 1 / PerSecond seconds and caps concurrency at
  /// PerSecond (at least 1).
  std::shared_ptr<mapper const> with_rate_limit(double PerSecond) const {
    auto s = settings_;
    s.gate = std::make_shared<rate_gate>(PerSecond);
    if (PerSecond < static_cast<double>(s.options.concurrency_limit)) {
      s.options.concurrency_limit =
        std::max<size_t>(1, static_cast<size_t>(std::floor(PerSecond)));
    }
    return derive(std::move(s));
  }

  /// Only items for which Keep returns true are mapped; the others are
  /// dropped from the output.
  std::shared_ptr<mapper const>
  with_filter(std::function<bool(In const&)> Keep) const {
    auto s = settings_;
    if (s.filter) {
      s.filter = [first = std::move(s.filter),
                  second = std::move(Keep)](In const& Item) {
        return first(Item) && second(Item);
      };
    } else {
      s.filter = std::move(Keep);
    }
    return derive(std::move(s));
  }

  /// Folds the mapped outputs, in input order, into one value.
  template <typename R>
  stage_ptr<std::vector<In>, R>
  with_reduce(std::function<R(R, Out const&)> Reducer, R Initial) const {
    return std::make_shared<reduce_stage<In, Out, R> const>(
      std::static_pointer_cast<mapper const>(this->keep_alive()),
      std::move(Reducer), std::move(Initial)
    );
  }
};

template <typename In, typename Out, typename R>
class reduce_stage : public stage<std::vector<In>, R> {
  std::shared_ptr<mapper<In, Out> const> mapper_;
  std::function<R(R, Out const&)> reducer_;
  R initial_;

public:
  reduce_stage(
    std::shared_ptr<mapper<In, Out> const> Mapper,
    std::function<R(R, Out const&)> Reducer, R Initial
  )
      : stage<std::vector<In>, R>(Mapper->name() + ".reduce"),
        mapper_{std::move(Mapper)}, reducer_{std::move(Reducer)},
        initial_{std::move(Initial)} {}

  tmc::task<R> invoke(std::vector<In> Inputs, run_config Config) const override {
    auto mapped = co_await mapper_->invoke(std::move(Inputs), std::move(Config));
    R acc = initial_;
    for (auto const& item : mapped) {
      acc = reducer_(std::move(acc), item);
    }
    co_return acc;
  }
};

/// A mapper over Element with the given default options.
template <typename Ptr>
auto make_mapper(
  std::string Name, Ptr Element,
  concurrency_options Options = concurrency_options{}
) {
  using In = detail::input_of<Ptr>;
  using Out = detail::output_of<Ptr>;
  typename mapper<In, Out>::settings s;
  s.options = Options;
  return std::make_shared<mapper<In, Out> const>(
    std::move(Name), stage_ptr<In, Out>(std::move(Element)), std::move(s)
  );
}

} // namespace stagecraft
