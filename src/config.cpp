#include "stagecraft/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace stagecraft {

void concurrency_options::validate() const {
  if (concurrency_limit == 0) {
    throw std::invalid_argument("concurrency_limit must be at least 1");
  }
  if (batch_size == 0) {
    throw std::invalid_argument("batch_size must be at least 1");
  }
}

run_config& run_config::set_concurrency_limit(size_t Limit) {
  concurrency_limit = Limit;
  return *this;
}

run_config& run_config::set_batch_size(size_t Size) {
  batch_size = Size;
  return *this;
}

run_config& run_config::set_preserve_order(bool Preserve) {
  preserve_order = Preserve;
  return *this;
}

run_config& run_config::set_max_batch_concurrency(size_t Limit) {
  max_batch_concurrency = Limit;
  return *this;
}

run_config& run_config::set_throw_on_error(bool Throw) {
  throw_on_error = Throw;
  return *this;
}

run_config& run_config::set_stop_token(std::stop_token Token) {
  stop_token = std::move(Token);
  return *this;
}

run_config& run_config::add_tag(std::string Tag) {
  tags.push_back(std::move(Tag));
  return *this;
}

run_config run_config::tagged(std::string Tag) const {
  run_config copy = *this;
  copy.tags.push_back(std::move(Tag));
  return copy;
}

concurrency_options run_config::resolve(concurrency_options Defaults) const {
  if (concurrency_limit.has_value()) {
    Defaults.concurrency_limit = *concurrency_limit;
  }
  if (batch_size.has_value()) {
    Defaults.batch_size = *batch_size;
  }
  if (preserve_order.has_value()) {
    Defaults.preserve_order = *preserve_order;
  }
  Defaults.validate();
  return Defaults;
}

std::string run_config::tag_string() const {
  std::string out;
  for (auto const& tag : tags) {
    if (!out.empty()) {
      out += ',';
    }
    out += tag;
  }
  return out;
}

// spdlog maps any name it doesn't know to "off".
static spdlog::level::level_enum parse_log_level(std::string const& Name) {
  auto level = spdlog::level::from_str(Name);
  if (level == spdlog::level::off && Name != "off") {
    throw std::invalid_argument("unknown log level: " + Name);
  }
  return level;
}

static size_t
read_count(nlohmann::json const& Json, char const* Key, size_t Default) {
  auto it = Json.find(Key);
  if (it == Json.end()) {
    return Default;
  }
  if (!it->is_number_integer() ||
      (!it->is_number_unsigned() && it->get<long long>() < 0)) {
    throw std::invalid_argument(
      std::string(Key) + " must be a non-negative integer, got " + it->dump()
    );
  }
  return it->get<size_t>();
}

runtime_config runtime_config::from_json(nlohmann::json const& Json) {
  if (!Json.is_object()) {
    throw std::invalid_argument("runtime config must be a JSON object");
  }
  runtime_config cfg;
  cfg.thread_count = read_count(Json, "thread_count", cfg.thread_count);
  cfg.priority_count = read_count(Json, "priority_count", cfg.priority_count);
  try {
    cfg.start_timer_executor =
      Json.value("start_timer_executor", cfg.start_timer_executor);
    if (auto it = Json.find("log_level"); it != Json.end()) {
      cfg.log_level = parse_log_level(it->get<std::string>());
    }
  } catch (nlohmann::json::type_error const& e) {
    throw std::invalid_argument(
      std::string("invalid runtime config: ") + e.what()
    );
  }
  if (cfg.priority_count == 0) {
    throw std::invalid_argument("priority_count must be at least 1");
  }
  return cfg;
}

runtime_config runtime_config::from_file(std::string const& Path) {
  std::ifstream file(Path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open runtime config: " + Path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(buffer.str());
  } catch (nlohmann::json::parse_error const& e) {
    throw std::runtime_error(
      "cannot parse runtime config " + Path + ": " + e.what()
    );
  }
  return from_json(json);
}

runtime_config& runtime_config::apply_environment() {
  if (char const* threads = std::getenv("STAGECRAFT_THREADS")) {
    char* end = nullptr;
    auto parsed = std::strtoull(threads, &end, 10);
    if (end == threads || *end != '\0') {
      throw std::invalid_argument(
        std::string("STAGECRAFT_THREADS is not a number: ") + threads
      );
    }
    thread_count = static_cast<size_t>(parsed);
  }
  if (char const* level = std::getenv("STAGECRAFT_LOG_LEVEL")) {
    log_level = parse_log_level(level);
  }
  return *this;
}

} // namespace stagecraft
