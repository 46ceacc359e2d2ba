// The unit of composition.
//
// A stage turns an In into an Out asynchronously. Every composite in this
// library is itself a stage, so they nest freely. Stages are immutable after
// construction and are shared through stage_ptr; invoking the same stage from
// many tasks at once is always allowed.
//
// Leaf stages can be written by subclassing stage<In, Out>, or from any
// callable with make_lambda(). The callable may be a regular function or a
// coroutine, and may optionally take the run_config as a second argument.

#pragma once

#include "stagecraft/config.hpp"
#include "stagecraft/executor.hpp"
#include "stagecraft/stream.hpp"

#include "tmc/task.hpp"
#include "tmc/traits.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace stagecraft {

template <typename In, typename Out>
class stage : public std::enable_shared_from_this<stage<In, Out>> {
  std::string name_;

protected:
  /// A shared_ptr to this stage, for work that outlives the current call
  /// (stream producers). Throws std::logic_error if the stage is not owned by
  /// a std::shared_ptr.
  std::shared_ptr<stage const> keep_alive() const {
    auto self = this->weak_from_this().lock();
    if (self == nullptr) {
      throw std::logic_error(
        "stage '" + name_ + "' must be owned by a std::shared_ptr"
      );
    }
    return self;
  }

public:
  using input_type = In;
  using output_type = Out;

  explicit stage(std::string Name) : name_{std::move(Name)} {}
  virtual ~stage() = default;

  stage(stage const&) = delete;
  stage& operator=(stage const&) = delete;

  std::string const& name() const noexcept { return name_; }

  virtual tmc::task<Out> invoke(In Input, run_config Config) const = 0;

  /// Invokes this stage once per input, at most max_batch_concurrency at a
  /// time. All-or-nothing: if any input fails, throws an aggregate_failure.
  virtual tmc::task<std::vector<Out>>
  batch(std::vector<In> Inputs, run_config Config) const {
    concurrency_options opts;
    opts.concurrency_limit =
      Config.max_batch_concurrency.value_or(DEFAULT_BATCH_CONCURRENCY);
    opts.batch_size = Inputs.empty() ? 1 : Inputs.size();
    auto stop = Config.stop_token;
    co_return co_await execute_concurrent<In, Out>(
      std::move(Inputs),
      [this, Config](In const& Item, size_t) -> tmc::task<Out> {
        return invoke(Item, Config);
      },
      opts, std::move(stop), name_
    );
  }

  /// Default: a stream with exactly one item, the result of invoke().
  virtual output_stream<Out> stream(In Input, run_config Config) const {
    return produce<Out>(
      [self = keep_alive(), Input = std::move(Input),
       Config = std::move(Config)](
        stream_writer<Out>& Writer
      ) mutable -> tmc::task<void> {
        co_await Writer.emit(co_await self->invoke(std::move(Input), Config));
      }
    );
  }
};

template <typename In, typename Out>
using stage_ptr = std::shared_ptr<stage<In, Out> const>;

namespace detail {
// Input / output types of a shared_ptr to any stage.
template <typename Ptr>
using input_of = typename std::remove_cvref_t<Ptr>::element_type::input_type;
template <typename Ptr>
using output_of = typename std::remove_cvref_t<Ptr>::element_type::output_type;

template <typename Fn, typename In>
decltype(auto) call_stage_fn(Fn const& F, In&& Input, run_config const& Config) {
  if constexpr (std::is_invocable_v<Fn const&, In&&, run_config const&>) {
    return F(std::forward<In>(Input), Config);
  } else {
    return F(std::forward<In>(Input));
  }
}

template <typename Fn, typename In>
using call_result_t = std::remove_cvref_t<decltype(call_stage_fn(
  std::declval<Fn const&>(), std::declval<In>(),
  std::declval<run_config const&>()
))>;

/// Out of a function that returns either Out or an awaitable of Out.
template <typename Fn, typename In>
using fn_output_t = std::conditional_t<
  tmc::traits::is_awaitable<call_result_t<Fn, In>>,
  tmc::traits::awaitable_result_t<call_result_t<Fn, In>>,
  call_result_t<Fn, In>>;
} // namespace detail

template <typename In, typename Out, typename Fn>
class lambda_stage : public stage<In, Out> {
  Fn fn_;

public:
  lambda_stage(std::string Name, Fn F)
      : stage<In, Out>(std::move(Name)), fn_{std::move(F)} {}

  tmc::task<Out> invoke(In Input, run_config Config) const override {
    if constexpr (tmc::traits::is_awaitable<detail::call_result_t<Fn, In>>) {
      // Fn is a coroutine
      co_return co_await detail::call_stage_fn(fn_, std::move(Input), Config);
    } else {
      // Fn is a regular function
      co_return detail::call_stage_fn(fn_, std::move(Input), Config);
    }
  }
};

/// Wraps a callable as a stage. The output type is deduced from the
/// callable's return type (unwrapped if it is awaitable).
template <typename In, typename Fn>
stage_ptr<In, detail::fn_output_t<std::decay_t<Fn>, In>>
make_lambda(std::string Name, Fn&& F) {
  using Out = detail::fn_output_t<std::decay_t<Fn>, In>;
  return std::make_shared<lambda_stage<In, Out, std::decay_t<Fn>>>(
    std::move(Name), std::forward<Fn>(F)
  );
}

} // namespace stagecraft
