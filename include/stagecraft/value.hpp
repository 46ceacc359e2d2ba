// Dynamic records.
//
// Fan-out results, enrichment input/output and the data that path and
// pattern conditions look into are all nlohmann::json values.

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stagecraft {

using value = nlohmann::json;

/// Splits "a.b.0.c" into its segments. Empty segments are dropped.
std::vector<std::string> split_path(std::string_view Path);

/// Walks Segments from Root. Object members are selected by key and array
/// elements by decimal index. Returns nullptr if any segment is missing.
value const* resolve_path(value const& Root, std::vector<std::string> const& Segments);

/// Missing, null, false, 0, "", [] and {} are false; everything else is true.
bool truthy(value const* Value);

/// Strings verbatim, missing as "undefined", integral doubles without a
/// fraction ("1", not "1.0"), everything else as compact JSON.
std::string stringify(value const* Value);

/// A number, or a string that parses completely as a number.
std::optional<double> as_number(value const* Value);

std::string trim(std::string_view Text);

/// Converts anything nlohmann::json can represent into a value.
template <typename T> value to_value(T const& Input) { return value(Input); }

} // namespace stagecraft
