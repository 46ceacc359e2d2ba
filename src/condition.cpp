#include "stagecraft/condition.hpp"

#include <algorithm>
#include <stdexcept>

namespace stagecraft {

path_expression::path_expression(std::string_view Expression)
    : source_{Expression} {
  auto eq = Expression.find('=');
  std::string_view path = Expression.substr(0, eq);
  if (eq != std::string_view::npos) {
    literal_ = trim(Expression.substr(eq + 1));
  }
  segments_ = split_path(path);
  if (segments_.empty()) {
    throw std::invalid_argument(
      "path condition '" + source_ + "' does not name a path"
    );
  }
}

bool path_expression::matches(value const& Input) const {
  value const* found = resolve_path(Input, segments_);
  if (literal_.has_value()) {
    return stringify(found) == *literal_;
  }
  return truthy(found);
}

static std::regex compile(std::string const& Source) {
  try {
    return std::regex(Source, std::regex::ECMAScript);
  } catch (std::regex_error const& e) {
    throw std::invalid_argument(
      "pattern condition /" + Source + "/ is invalid: " + e.what()
    );
  }
}

pattern::pattern(std::string Regex)
    : source_{std::move(Regex)}, re_{compile(source_)} {}

bool pattern::matches(value const& Input) const {
  return std::regex_search(stringify(&Input), re_);
}

namespace detail {
bool path_equals(
  value const& Input, std::vector<std::string> const& Segments,
  value const& Expected
) {
  value const* found = resolve_path(Input, Segments);
  return found != nullptr && *found == Expected;
}

bool path_contains(
  value const& Input, std::vector<std::string> const& Segments,
  value const& Needle
) {
  value const* found = resolve_path(Input, Segments);
  if (found == nullptr) {
    return false;
  }
  if (found->is_array()) {
    return std::find(found->begin(), found->end(), Needle) != found->end();
  }
  if (found->is_string()) {
    return found->get_ref<std::string const&>().find(stringify(&Needle)) !=
           std::string::npos;
  }
  return false;
}

bool path_in_range(
  value const& Input, std::vector<std::string> const& Segments, double Low,
  double High
) {
  auto n = as_number(resolve_path(Input, Segments));
  return n.has_value() && *n >= Low && *n <= High;
}
} // namespace detail

} // namespace stagecraft
