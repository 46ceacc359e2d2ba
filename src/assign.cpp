#include "stagecraft/assign.hpp"
#include "stagecraft/errors.hpp"
#include "stagecraft/executor.hpp"
#include "stagecraft/log.hpp"

#include "tmc/spawn_many.hpp"

#include <algorithm>
#include <exception>

namespace stagecraft {

namespace {
tmc::task<void> compute(
  assign::assignment const& What, value const& Input, run_config const& Config,
  outcome<value>& Slot
) {
  try {
    if (auto s = std::get_if<stage_ptr<value, value>>(&What)) {
      Slot.value.emplace(co_await (*s)->invoke(Input, Config));
    } else if (auto af = std::get_if<assign::async_fn>(&What)) {
      Slot.value.emplace(co_await (*af)(Input));
    } else if (auto sf = std::get_if<assign::sync_fn>(&What)) {
      Slot.value.emplace((*sf)(Input));
    } else {
      Slot.value.emplace(std::get<value>(What));
    }
  } catch (...) {
    Slot.error = std::current_exception();
  }
}
} // namespace

assign::assign(std::string Name, entry_list Entries)
    : stage<value, value>(std::move(Name)), entries_{std::move(Entries)} {
  if (entries_ == nullptr) {
    entries_ = std::make_shared<std::vector<entry> const>();
  }
}

std::vector<std::string> assign::keys() const {
  std::vector<std::string> out;
  for (auto const& e : *entries_) {
    out.push_back(e.key);
  }
  return out;
}

tmc::task<value> assign::invoke(value Input, run_config Config) const {
  if (Input.is_null()) {
    Input = value::object();
  }
  if (!Input.is_object()) {
    throw execution_error(
      name(), std::string("input must be a JSON object, got ") +
                Input.type_name()
    );
  }

  auto const& entries = *entries_;
  std::vector<outcome<value>> results(entries.size());
  if (!entries.empty()) {
    std::vector<tmc::task<void>> tasks;
    tasks.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
      tasks.push_back(compute(entries[i].what, Input, Config, results[i]));
    }
    co_await tmc::spawn_many(tasks.data(), tasks.size());
  }

  std::vector<aggregate_failure::failure> failures;
  for (size_t i = 0; i < entries.size(); ++i) {
    if (!results[i].ok()) {
      failures.push_back({entries[i].key, results[i].error});
    }
  }
  if (!failures.empty()) {
    aggregate_failure::rethrow_cancellation(failures);
    throw aggregate_failure(name(), std::move(failures), entries.size());
  }

  value out = Input;
  for (size_t i = 0; i < entries.size(); ++i) {
    out[entries[i].key] = std::move(*results[i].value);
  }
  logger()->debug(
    "{}: assigned {} keys [{}]", name(), entries.size(), Config.tag_string()
  );
  co_return out;
}

std::shared_ptr<assign const>
assign::replaced(std::string Key, assignment What) const {
  auto entries = std::make_shared<std::vector<entry>>(*entries_);
  auto it = std::find_if(entries->begin(), entries->end(), [&](entry const& e) {
    return e.key == Key;
  });
  if (it != entries->end()) {
    it->what = std::move(What);
  } else {
    entries->push_back(entry{std::move(Key), std::move(What)});
  }
  return std::make_shared<assign const>(name(), std::move(entries));
}

std::shared_ptr<assign const>
assign::with_value(std::string Key, value Constant) const {
  return replaced(
    std::move(Key), assignment(std::in_place_type<value>, std::move(Constant))
  );
}

std::shared_ptr<assign const> assign::merge(assign const& Other) const {
  auto entries = std::make_shared<std::vector<entry>>(*entries_);
  for (auto const& o : *Other.entries_) {
    auto it = std::find_if(entries->begin(), entries->end(), [&](entry const& e) {
      return e.key == o.key;
    });
    if (it != entries->end()) {
      it->what = o.what;
    } else {
      entries->push_back(o);
    }
  }
  return std::make_shared<assign const>(name(), std::move(entries));
}

std::shared_ptr<assign const> make_assign(std::string Name) {
  return std::make_shared<assign const>(std::move(Name), nullptr);
}

} // namespace stagecraft
