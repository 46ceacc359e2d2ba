// Branch conditions.
//
// A condition is resolved once, at construction, into one of:
// - a predicate `bool(In const&)`
// - an async predicate `tmc::task<bool>(In const&)`
// - a path expression such as "user.active" (truthiness of the nested value)
//   or "user.role = admin" (the nested value, stringified, equals the
//   literal on the right of the first '=')
// - a regex pattern, searched for in the stringified input
//
// Path expressions and patterns look into the input as JSON, so they are only
// available when In converts to nlohmann::json. Evaluating a condition never
// throws: a failure while evaluating is logged and counts as false.

#pragma once

#include "stagecraft/errors.hpp"
#include "stagecraft/log.hpp"
#include "stagecraft/value.hpp"

#include "tmc/task.hpp"
#include "tmc/traits.hpp"

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace stagecraft {

class path_expression {
  std::string source_;
  std::vector<std::string> segments_;
  std::optional<std::string> literal_;

public:
  /// Throws std::invalid_argument if the path part is empty.
  explicit path_expression(std::string_view Expression);

  bool matches(value const& Input) const;

  std::string const& source() const noexcept { return source_; }
  std::vector<std::string> const& segments() const noexcept {
    return segments_;
  }
  std::optional<std::string> const& literal() const noexcept {
    return literal_;
  }
};

class pattern {
  std::string source_;
  std::regex re_;

public:
  /// Throws std::invalid_argument if Regex does not compile.
  explicit pattern(std::string Regex);

  bool matches(value const& Input) const;

  std::string const& source() const noexcept { return source_; }
};

template <typename In>
concept json_convertible = std::is_constructible_v<value, In const&>;

template <typename In> using predicate = std::function<bool(In const&)>;
template <typename In>
using async_predicate = std::function<tmc::task<bool>(In const&)>;

template <typename In> class condition {
  std::variant<predicate<In>, async_predicate<In>, path_expression, pattern>
    impl_;

public:
  template <typename Fn>
    requires(std::is_invocable_v<Fn const&, In const&> &&
             !std::is_convertible_v<Fn, std::string_view>)
  condition(Fn F) {
    using R = std::invoke_result_t<Fn const&, In const&>;
    if constexpr (tmc::traits::is_awaitable<R>) {
      impl_ = async_predicate<In>(std::move(F));
    } else {
      impl_ = predicate<In>(std::move(F));
    }
  }

  condition(char const* Path)
    requires json_convertible<In>
      : impl_{path_expression(Path)} {}

  condition(std::string const& Path)
    requires json_convertible<In>
      : impl_{path_expression(Path)} {}

  condition(path_expression Path)
    requires json_convertible<In>
      : impl_{std::move(Path)} {}

  condition(pattern Pattern)
    requires json_convertible<In>
      : impl_{std::move(Pattern)} {}

  /// Human readable description, for log output.
  std::string describe() const {
    switch (impl_.index()) {
    case 0:
      return "predicate";
    case 1:
      return "async predicate";
    case 2:
      return "path '" + std::get<2>(impl_).source() + "'";
    default:
      return "pattern /" + std::get<3>(impl_).source() + "/";
    }
  }

  tmc::task<bool> evaluate(In const& Input) const {
    std::exception_ptr err;
    bool result = false;
    try {
      if (auto pred = std::get_if<predicate<In>>(&impl_)) {
        result = (*pred)(Input);
      } else if (auto apred = std::get_if<async_predicate<In>>(&impl_)) {
        result = co_await (*apred)(Input);
      } else if constexpr (json_convertible<In>) {
        value json(Input);
        if (auto path = std::get_if<path_expression>(&impl_)) {
          result = path->matches(json);
        } else {
          result = std::get<pattern>(impl_).matches(json);
        }
      }
    } catch (...) {
      err = std::current_exception();
    }
    if (err != nullptr) {
      logger()->error(
        "condition {} failed, treating as false: {}", describe(),
        stagecraft::describe(err)
      );
      co_return false;
    }
    co_return result;
  }
};

/// Free-function form of condition::evaluate().
template <typename In>
tmc::task<bool> evaluate(In const& Input, condition<In> const& Condition) {
  return Condition.evaluate(Input);
}

namespace detail {
template <typename In>
using condition_list = std::shared_ptr<std::vector<condition<In>> const>;

template <typename In>
tmc::task<bool> all_of_impl(condition_list<In> Conditions, In const& Input) {
  for (auto const& c : *Conditions) {
    if (!co_await c.evaluate(Input)) {
      co_return false;
    }
  }
  co_return true;
}

template <typename In>
tmc::task<bool> any_of_impl(condition_list<In> Conditions, In const& Input) {
  for (auto const& c : *Conditions) {
    if (co_await c.evaluate(Input)) {
      co_return true;
    }
  }
  co_return false;
}

template <typename In>
tmc::task<bool>
negate_impl(std::shared_ptr<condition<In> const> Inner, In const& Input) {
  co_return !co_await Inner->evaluate(Input);
}

bool path_equals(
  value const& Input, std::vector<std::string> const& Segments,
  value const& Expected
);
bool path_contains(
  value const& Input, std::vector<std::string> const& Segments,
  value const& Needle
);
bool path_in_range(
  value const& Input, std::vector<std::string> const& Segments, double Low,
  double High
);
} // namespace detail

/// True when every condition is true. Stops at the first false one.
template <typename In>
condition<In> all_of(std::vector<condition<In>> Conditions) {
  auto list =
    std::make_shared<std::vector<condition<In>> const>(std::move(Conditions));
  return condition<In>([list](In const& Input) -> tmc::task<bool> {
    return detail::all_of_impl<In>(list, Input);
  });
}

/// True when any condition is true. Stops at the first true one.
template <typename In>
condition<In> any_of(std::vector<condition<In>> Conditions) {
  auto list =
    std::make_shared<std::vector<condition<In>> const>(std::move(Conditions));
  return condition<In>([list](In const& Input) -> tmc::task<bool> {
    return detail::any_of_impl<In>(list, Input);
  });
}

template <typename In> condition<In> negate(condition<In> Inner) {
  auto inner = std::make_shared<condition<In> const>(std::move(Inner));
  return condition<In>([inner](In const& Input) -> tmc::task<bool> {
    return detail::negate_impl<In>(inner, Input);
  });
}

/// The value at Path is present and equal to Expected.
template <json_convertible In>
condition<In> equals(std::string_view Path, value Expected) {
  return condition<In>([segments = split_path(Path),
                        Expected = std::move(Expected)](In const& Input) {
    return detail::path_equals(value(Input), segments, Expected);
  });
}

/// The value at Path is an array holding Needle, or a string containing
/// Needle's string form.
template <json_convertible In>
condition<In> contains(std::string_view Path, value Needle) {
  return condition<In>([segments = split_path(Path),
                        Needle = std::move(Needle)](In const& Input) {
    return detail::path_contains(value(Input), segments, Needle);
  });
}

/// The value at Path is numeric (or a numeric string) within [Low, High].
template <json_convertible In>
condition<In> in_range(std::string_view Path, double Low, double High) {
  return condition<In>([segments = split_path(Path), Low, High](
                         In const& Input
                       ) {
    return detail::path_in_range(value(Input), segments, Low, High);
  });
}

} // namespace stagecraft
