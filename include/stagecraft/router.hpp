// First-match conditional dispatch.
//
// Conditions are evaluated in the order the branches were added; the input
// goes to the first branch whose condition holds, else to the default target.
// Without a match and without a default, the call fails with
// no_matching_branch. Errors from the chosen target propagate unchanged.

#pragma once

#include "stagecraft/condition.hpp"
#include "stagecraft/config.hpp"
#include "stagecraft/errors.hpp"
#include "stagecraft/log.hpp"
#include "stagecraft/stage.hpp"
#include "stagecraft/stream.hpp"
#include "stagecraft/value.hpp"

#include "tmc/task.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace stagecraft {

template <typename In, typename Out> struct branch_definition {
  condition<In> when;
  stage_ptr<In, Out> target;
  std::string name;
};

template <typename In, typename Out> class router : public stage<In, Out> {
public:
  using branch_list =
    std::shared_ptr<std::vector<branch_definition<In, Out>> const>;

private:
  branch_list branches_;
  stage_ptr<In, Out> default_;

  // The target for Input, or nullptr when nothing matches and there is no
  // default.
  tmc::task<stage_ptr<In, Out>>
  select(In const& Input, run_config const& Config) const {
    for (auto const& b : *branches_) {
      if (co_await b.when.evaluate(Input)) {
        logger()->debug(
          "{}: routed to '{}' [{}]", this->name(), b.name, Config.tag_string()
        );
        co_return b.target;
      }
    }
    if (default_ != nullptr) {
      logger()->debug(
        "{}: routed to default '{}' [{}]", this->name(), default_->name(),
        Config.tag_string()
      );
    }
    co_return default_;
  }

  static tmc::task<void> forward_stream(
    std::shared_ptr<router const> Self, In Input, run_config Config,
    stream_writer<Out>& Writer
  ) {
    auto target = co_await Self->select(Input, Config);
    if (target == nullptr) {
      throw no_matching_branch(Self->name());
    }
    auto inner = target->stream(std::move(Input), std::move(Config));
    while (auto item = co_await inner.next()) {
      if (!co_await Writer.emit(std::move(*item))) {
        co_return;
      }
    }
  }

public:
  router(
    std::string Name, branch_list Branches,
    stage_ptr<In, Out> Default = nullptr
  )
      : stage<In, Out>(std::move(Name)), branches_{std::move(Branches)},
        default_{std::move(Default)} {
    if (branches_ == nullptr) {
      branches_ =
        std::make_shared<std::vector<branch_definition<In, Out>> const>();
    }
  }

  size_t branch_count() const noexcept { return branches_->size(); }
  bool has_default() const noexcept { return default_ != nullptr; }

  tmc::task<Out> invoke(In Input, run_config Config) const override {
    auto target = co_await select(Input, Config);
    if (target == nullptr) {
      throw no_matching_branch(this->name());
    }
    co_return co_await target->invoke(std::move(Input), std::move(Config));
  }

  output_stream<Out> stream(In Input, run_config Config) const override {
    auto self = std::static_pointer_cast<router const>(this->keep_alive());
    return produce<Out>(
      [self = std::move(self), Input = std::move(Input),
       Config = std::move(Config)](
        stream_writer<Out>& Writer
      ) mutable -> tmc::task<void> {
        return forward_stream(self, std::move(Input), std::move(Config), Writer);
      }
    );
  }

  /// A new router with one more branch, evaluated after the existing ones.
  /// An empty Name becomes "branch_<index>".
  std::shared_ptr<router const> add_branch(
    condition<In> When, stage_ptr<In, Out> Target, std::string Name = ""
  ) const {
    auto branches =
      std::make_shared<std::vector<branch_definition<In, Out>>>(*branches_);
    if (Name.empty()) {
      Name = "branch_" + std::to_string(branches->size());
    }
    branches->push_back({std::move(When), std::move(Target), std::move(Name)});
    return std::make_shared<router const>(
      this->name(), std::move(branches), default_
    );
  }

  std::shared_ptr<router const> set_default(stage_ptr<In, Out> Target) const {
    return std::make_shared<router const>(
      this->name(), branches_, std::move(Target)
    );
  }
};

template <typename In, typename Out>
std::shared_ptr<router<In, Out> const> make_router(std::string Name) {
  return std::make_shared<router<In, Out> const>(std::move(Name), nullptr);
}

/// A router that compares the value at Path against each case key, in
/// order, and dispatches to the first equal one.
template <json_convertible In, typename Out>
std::shared_ptr<router<In, Out> const> switch_on(
  std::string Name, std::string_view Path,
  std::vector<std::pair<value, stage_ptr<In, Out>>> Cases,
  stage_ptr<In, Out> Default = nullptr
) {
  auto branches = std::make_shared<std::vector<branch_definition<In, Out>>>();
  for (auto& [key, target] : Cases) {
    std::string branchName = std::string(Path) + " == " + stringify(&key);
    branches->push_back(
      {equals<In>(Path, key), std::move(target), std::move(branchName)}
    );
  }
  return std::make_shared<router<In, Out> const>(
    std::move(Name), std::move(branches), std::move(Default)
  );
}

} // namespace stagecraft
