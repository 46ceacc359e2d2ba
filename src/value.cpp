#include "stagecraft/value.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

namespace stagecraft {

std::vector<std::string> split_path(std::string_view Path) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= Path.size()) {
    size_t dot = Path.find('.', start);
    if (dot == std::string_view::npos) {
      dot = Path.size();
    }
    auto seg = trim(Path.substr(start, dot - start));
    if (!seg.empty()) {
      out.push_back(std::move(seg));
    }
    start = dot + 1;
  }
  return out;
}

static bool parse_index(std::string const& Segment, size_t& Index_out) {
  if (Segment.empty()) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(
    Segment.data(), Segment.data() + Segment.size(), Index_out
  );
  return ec == std::errc{} && ptr == Segment.data() + Segment.size();
}

value const*
resolve_path(value const& Root, std::vector<std::string> const& Segments) {
  value const* cur = &Root;
  for (auto const& seg : Segments) {
    if (cur->is_object()) {
      auto it = cur->find(seg);
      if (it == cur->end()) {
        return nullptr;
      }
      cur = &*it;
    } else if (cur->is_array()) {
      size_t idx;
      if (!parse_index(seg, idx) || idx >= cur->size()) {
        return nullptr;
      }
      cur = &(*cur)[idx];
    } else {
      return nullptr;
    }
  }
  return cur;
}

bool truthy(value const* Value) {
  if (Value == nullptr) {
    return false;
  }
  switch (Value->type()) {
  case value::value_t::null:
  case value::value_t::discarded:
    return false;
  case value::value_t::boolean:
    return Value->get<bool>();
  case value::value_t::number_integer:
    return Value->get<std::int64_t>() != 0;
  case value::value_t::number_unsigned:
    return Value->get<std::uint64_t>() != 0;
  case value::value_t::number_float:
    return Value->get<double>() != 0.0;
  case value::value_t::string:
    return !Value->get_ref<std::string const&>().empty();
  case value::value_t::array:
  case value::value_t::object:
    return !Value->empty();
  default:
    return true;
  }
}

std::string stringify(value const* Value) {
  if (Value == nullptr) {
    return "undefined";
  }
  if (Value->is_string()) {
    return Value->get<std::string>();
  }
  if (Value->is_number_float()) {
    // Integral doubles print without a fraction, so 1.0 matches "1".
    double d = Value->get<double>();
    if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 9.0e15) {
      return std::to_string(static_cast<long long>(d));
    }
  }
  return Value->dump();
}

std::optional<double> as_number(value const* Value) {
  if (Value == nullptr) {
    return std::nullopt;
  }
  if (Value->is_number()) {
    return Value->get<double>();
  }
  if (Value->is_string()) {
    auto text = trim(Value->get_ref<std::string const&>());
    if (text.empty()) {
      return std::nullopt;
    }
    char* end = nullptr;
    double d = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
      return std::nullopt;
    }
    return d;
  }
  return std::nullopt;
}

std::string trim(std::string_view Text) {
  size_t b = 0;
  size_t e = Text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(Text[b]))) {
    ++b;
  }
  while (e > b && std::isspace(static_cast<unsigned char>(Text[e - 1]))) {
    --e;
  }
  return std::string(Text.substr(b, e - b));
}

} // namespace stagecraft
