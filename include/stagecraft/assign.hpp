// Enrichment: compute named fields from a record and merge them onto a copy
// of it.
//
// Each assignment is a stage, a function (regular or coroutine) or a
// constant. All assignments see the original input and run concurrently; the
// results are written onto the copy in declaration order, so a computed key
// replaces an input key of the same name. If any assignment fails, nothing is
// returned and every failed key is reported in one aggregate_failure.

#pragma once

#include "stagecraft/config.hpp"
#include "stagecraft/parallel.hpp"
#include "stagecraft/stage.hpp"
#include "stagecraft/value.hpp"

#include "tmc/task.hpp"
#include "tmc/traits.hpp"

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace stagecraft {

class assign : public stage<value, value> {
public:
  using sync_fn = std::function<value(value const&)>;
  using async_fn = std::function<tmc::task<value>(value const&)>;
  using assignment = std::variant<stage_ptr<value, value>, async_fn, sync_fn, value>;

  struct entry {
    std::string key;
    assignment what;
  };
  using entry_list = std::shared_ptr<std::vector<entry> const>;

private:
  entry_list entries_;

  std::shared_ptr<assign const> replaced(std::string Key, assignment What) const;

public:
  assign(std::string Name, entry_list Entries);

  std::vector<std::string> keys() const;

  tmc::task<value> invoke(value Input, run_config Config) const override;

  /// A new enricher that also computes Key with a stage. Stages with a
  /// non-value output are converted with nlohmann::json.
  template <typename Ptr>
    requires std::is_same_v<detail::input_of<Ptr>, value>
  std::shared_ptr<assign const> with(std::string Key, Ptr Target) const {
    using T = detail::output_of<Ptr>;
    if constexpr (std::is_same_v<T, value>) {
      return replaced(std::move(Key), stage_ptr<value, value>(std::move(Target)));
    } else {
      return replaced(
        std::move(Key), stage_ptr<value, value>(
                          std::make_shared<json_adapter<value, T> const>(
                            stage_ptr<value, T>(std::move(Target))
                          )
                        )
      );
    }
  }

  /// A new enricher that also computes Key with Fn(input). Fn may be a
  /// regular function or a coroutine.
  template <typename Fn>
    requires std::is_invocable_v<Fn const&, value const&>
  std::shared_ptr<assign const> with(std::string Key, Fn F) const {
    using R = std::invoke_result_t<Fn const&, value const&>;
    if constexpr (tmc::traits::is_awaitable<R>) {
      return replaced(std::move(Key), async_fn(std::move(F)));
    } else {
      return replaced(std::move(Key), sync_fn(std::move(F)));
    }
  }

  /// A new enricher that also sets Key to Constant.
  std::shared_ptr<assign const> with_value(std::string Key, value Constant) const;

  /// A new enricher with Other's assignments added after this one's. Keys
  /// present in both take Other's assignment.
  std::shared_ptr<assign const> merge(assign const& Other) const;
};

/// An enricher with no assignments; it returns a copy of its input.
std::shared_ptr<assign const> make_assign(std::string Name);

} // namespace stagecraft
