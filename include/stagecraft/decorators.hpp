// Stage decorators: retry with backoff, start-rate limiting and fallback.
// Each wraps a stage and is itself a stage of the same type.

#pragma once

#include "stagecraft/config.hpp"
#include "stagecraft/errors.hpp"
#include "stagecraft/executor.hpp"
#include "stagecraft/log.hpp"
#include "stagecraft/stage.hpp"
#include "stagecraft/timing.hpp"

#include "tmc/task.hpp"

#include <exception>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace stagecraft {

template <typename In, typename Out> class retry_stage : public stage<In, Out> {
  stage_ptr<In, Out> inner_;
  retry_policy policy_;

public:
  retry_stage(stage_ptr<In, Out> Inner, retry_policy Policy)
      : stage<In, Out>(Inner->name() + ".retry"), inner_{std::move(Inner)},
        policy_{std::move(Policy)} {}

  retry_policy const& policy() const noexcept { return policy_; }

  tmc::task<Out> invoke(In Input, run_config Config) const override {
    unit_fn<In, Out> unit =
      [inner = inner_, Config](In const& Item, size_t) -> tmc::task<Out> {
      return inner->invoke(Item, Config);
    };
    auto retried = stagecraft::with_retry<In, Out>(
      std::move(unit), policy_, Config.stop_token
    );
    co_return co_await retried(Input, 0);
  }
};

/// Starts of the wrapped stage are spaced through a gate that is shared by
/// every invocation of this decorator.
template <typename In, typename Out>
class rate_limited_stage : public stage<In, Out> {
  stage_ptr<In, Out> inner_;
  std::shared_ptr<rate_gate> gate_;

public:
  rate_limited_stage(stage_ptr<In, Out> Inner, double PerSecond)
      : stage<In, Out>(Inner->name() + ".rate_limited"),
        inner_{std::move(Inner)}, gate_{std::make_shared<rate_gate>(PerSecond)} {
  }

  double per_second() const noexcept { return gate_->per_second(); }

  tmc::task<Out> invoke(In Input, run_config Config) const override {
    co_await gate_->wait();
    co_return co_await inner_->invoke(std::move(Input), std::move(Config));
  }
};

/// Invokes the fallback when the primary fails. Cancellation is not a
/// failure and is rethrown.
template <typename In, typename Out>
class fallback_stage : public stage<In, Out> {
  stage_ptr<In, Out> primary_;
  stage_ptr<In, Out> fallback_;

public:
  fallback_stage(stage_ptr<In, Out> Primary, stage_ptr<In, Out> Fallback)
      : stage<In, Out>(Primary->name() + ".fallback"),
        primary_{std::move(Primary)}, fallback_{std::move(Fallback)} {}

  tmc::task<Out> invoke(In Input, run_config Config) const override {
    std::exception_ptr err;
    try {
      co_return co_await primary_->invoke(Input, Config);
    } catch (cancelled const&) {
      throw;
    } catch (...) {
      err = std::current_exception();
    }
    logger()->warn(
      "{}: '{}' failed, using '{}': {}", this->name(), primary_->name(),
      fallback_->name(), describe(err)
    );
    co_return co_await fallback_->invoke(std::move(Input), std::move(Config));
  }
};

/// The returned pointer converts to stage_ptr<In, Out>.
template <typename Ptr>
std::shared_ptr<
  retry_stage<detail::input_of<Ptr>, detail::output_of<Ptr>> const>
with_retry(Ptr Inner, retry_policy Policy = retry_policy{}) {
  using In = detail::input_of<Ptr>;
  using Out = detail::output_of<Ptr>;
  return std::make_shared<retry_stage<In, Out> const>(
    stage_ptr<In, Out>(std::move(Inner)), std::move(Policy)
  );
}

template <typename Ptr>
std::shared_ptr<
  rate_limited_stage<detail::input_of<Ptr>, detail::output_of<Ptr>> const>
with_rate_limit(Ptr Inner, double PerSecond) {
  using In = detail::input_of<Ptr>;
  using Out = detail::output_of<Ptr>;
  return std::make_shared<rate_limited_stage<In, Out> const>(
    stage_ptr<In, Out>(std::move(Inner)), PerSecond
  );
}

template <typename Ptr, typename FallbackPtr>
stage_ptr<detail::input_of<Ptr>, detail::output_of<Ptr>>
with_fallback(Ptr Primary, FallbackPtr Fallback) {
  using In = detail::input_of<Ptr>;
  using Out = detail::output_of<Ptr>;
  static_assert(
    std::is_same_v<detail::input_of<FallbackPtr>, In> &&
      std::is_same_v<detail::output_of<FallbackPtr>, Out>,
    "the fallback must have the same input and output types as the primary"
  );
  return std::make_shared<fallback_stage<In, Out> const>(
    stage_ptr<In, Out>(std::move(Primary)),
    stage_ptr<In, Out>(std::move(Fallback))
  );
}

} // namespace stagecraft
