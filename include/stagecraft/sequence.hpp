// Sequential composition: the output of each step is the input of the next.
//
// Steps are stored type-erased so that a sequence of any length is a single
// stage<In, Out>. Adjacent step types are checked at compile time by pipe()
// and then(). The first failing step aborts the run; the error names its
// 0-based index and keeps the step's exception as the cause.

#pragma once

#include "stagecraft/config.hpp"
#include "stagecraft/errors.hpp"
#include "stagecraft/log.hpp"
#include "stagecraft/stage.hpp"
#include "stagecraft/stream.hpp"
#include "stagecraft/timing.hpp"

#include "tmc/task.hpp"

#include <any>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace stagecraft {

namespace detail {
template <typename A> constexpr bool chains() { return true; }
template <typename A, typename B, typename... Rest> constexpr bool chains() {
  return std::is_same_v<output_of<A>, input_of<B>> && chains<B, Rest...>();
}

struct erased_step {
  std::string name;
  std::function<tmc::task<std::any>(std::any, run_config const&)> invoke;
};

template <typename In, typename Out>
tmc::task<std::any>
invoke_erased(stage_ptr<In, Out> Stage, std::any Input, run_config Config) {
  co_return std::any(
    co_await Stage->invoke(std::any_cast<In>(std::move(Input)), std::move(Config))
  );
}

template <typename In, typename Out>
erased_step erase_step(stage_ptr<In, Out> Stage) {
  std::string name = Stage->name();
  return erased_step{
    std::move(name),
    [Stage = std::move(Stage)](
      std::any Input, run_config const& Config
    ) -> tmc::task<std::any> {
      return invoke_erased<In, Out>(Stage, std::move(Input), Config);
    }
  };
}

template <typename Out>
using erased_tail = std::function<output_stream<Out>(std::any, run_config)>;

template <typename In, typename Out>
erased_tail<Out> erase_tail(stage_ptr<In, Out> Stage) {
  return [Stage = std::move(Stage)](std::any Input, run_config Config) {
    return Stage->stream(std::any_cast<In>(std::move(Input)), std::move(Config));
  };
}
} // namespace detail

template <typename In, typename Out> class sequence : public stage<In, Out> {
public:
  using step_list = std::shared_ptr<std::vector<detail::erased_step> const>;

private:
  step_list steps_;
  detail::erased_tail<Out> tail_;

  // Runs the first Count steps, checking for a stop request before each.
  tmc::task<std::any>
  run_steps(size_t Count, std::any Value, run_config const& Config) const {
    auto const& steps = *steps_;
    for (size_t i = 0; i < Count; ++i) {
      if (Config.stop_requested()) {
        throw cancelled(this->name());
      }
      auto start = steady_clock::now();
      std::exception_ptr err;
      try {
        Value = co_await steps[i].invoke(std::move(Value), Config);
      } catch (cancelled const&) {
        throw;
      } catch (...) {
        err = std::current_exception();
      }
      auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  steady_clock::now() - start
      )
                  .count();
      if (err != nullptr) {
        logger()->debug(
          "{}: step {} '{}' failed after {}us [{}]", this->name(), i,
          steps[i].name, us, Config.tag_string()
        );
        throw execution_error(this->name(), i, err);
      }
      logger()->debug(
        "{}: step {} '{}' done in {}us [{}]", this->name(), i, steps[i].name,
        us, Config.tag_string()
      );
    }
    co_return Value;
  }

  static tmc::task<void> forward_stream(
    std::shared_ptr<sequence const> Self, In Input, run_config Config,
    stream_writer<Out>& Writer
  ) {
    size_t last = Self->steps_->size() - 1;
    auto mid = co_await Self->run_steps(last, std::any(std::move(Input)), Config);
    if (Config.stop_requested()) {
      throw cancelled(Self->name());
    }
    std::exception_ptr err;
    try {
      auto inner = Self->tail_(std::move(mid), Config);
      while (auto item = co_await inner.next()) {
        if (!co_await Writer.emit(std::move(*item))) {
          break;
        }
      }
    } catch (cancelled const&) {
      throw;
    } catch (...) {
      err = std::current_exception();
    }
    if (err != nullptr) {
      throw execution_error(Self->name(), last, err);
    }
  }

public:
  /// Use pipe() or then() to build sequences. Throws std::invalid_argument if
  /// Steps is empty.
  sequence(std::string Name, step_list Steps, detail::erased_tail<Out> Tail)
      : stage<In, Out>(std::move(Name)), steps_{std::move(Steps)},
        tail_{std::move(Tail)} {
    if (steps_ == nullptr || steps_->empty()) {
      throw std::invalid_argument(
        "sequence '" + this->name() + "' needs at least one step"
      );
    }
  }

  size_t size() const noexcept { return steps_->size(); }

  std::vector<std::string> step_names() const {
    std::vector<std::string> out;
    for (auto const& s : *steps_) {
      out.push_back(s.name);
    }
    return out;
  }

  tmc::task<Out> invoke(In Input, run_config Config) const override {
    logger()->debug(
      "{}: start ({} steps) [{}]", this->name(), steps_->size(),
      Config.tag_string()
    );
    auto result =
      co_await run_steps(steps_->size(), std::any(std::move(Input)), Config);
    co_return std::any_cast<Out>(std::move(result));
  }

  /// Runs every step but the last, then forwards the last step's stream.
  output_stream<Out> stream(In Input, run_config Config) const override {
    auto self = std::static_pointer_cast<sequence const>(this->keep_alive());
    return produce<Out>(
      [self = std::move(self), Input = std::move(Input),
       Config = std::move(Config)](
        stream_writer<Out>& Writer
      ) mutable -> tmc::task<void> {
        return forward_stream(self, std::move(Input), std::move(Config), Writer);
      }
    );
  }

  /// A new sequence with Next appended. This sequence is unchanged.
  template <typename NextPtr>
  std::shared_ptr<sequence<In, detail::output_of<NextPtr>> const>
  then(NextPtr Next) const {
    static_assert(
      std::is_same_v<detail::input_of<NextPtr>, Out>,
      "the next step must accept this sequence's output type"
    );
    using Next_out = detail::output_of<NextPtr>;
    stage_ptr<Out, Next_out> next = std::move(Next);
    auto steps = std::make_shared<std::vector<detail::erased_step>>(*steps_);
    steps->push_back(detail::erase_step(next));
    return std::make_shared<sequence<In, Next_out> const>(
      this->name(), std::move(steps), detail::erase_tail(next)
    );
  }
};

/// Builds a sequence from two or more stage pointers whose types chain.
template <typename First, typename... Rest>
auto pipe(std::string Name, First Head, Rest... Tail) {
  static_assert(
    detail::chains<First, Rest...>(),
    "each step's input type must match the previous step's output type"
  );
  using In = detail::input_of<First>;
  using Last = std::tuple_element_t<sizeof...(Rest), std::tuple<First, Rest...>>;
  using Out = detail::output_of<Last>;

  auto steps = std::make_shared<std::vector<detail::erased_step>>();
  steps->push_back(detail::erase_step(
    stage_ptr<detail::input_of<First>, detail::output_of<First>>(Head)
  ));
  (steps->push_back(detail::erase_step(
     stage_ptr<detail::input_of<Rest>, detail::output_of<Rest>>(Tail)
   )),
   ...);

  stage_ptr<detail::input_of<Last>, Out> last =
    std::get<sizeof...(Rest)>(std::tuple<First, Rest...>(Head, Tail...));
  return std::make_shared<sequence<In, Out> const>(
    std::move(Name), std::move(steps), detail::erase_tail(last)
  );
}

} // namespace stagecraft
