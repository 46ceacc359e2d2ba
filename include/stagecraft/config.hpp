// Per-call and per-process configuration.
//
// run_config travels down the stage graph with every invoke / batch / stream
// call. Its optional fields override the defaults that each stage was built
// with; unset fields fall back to those defaults.
//
// runtime_config controls the executors that host the engine. See runtime.hpp.

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace stagecraft {

inline constexpr size_t DEFAULT_CONCURRENCY_LIMIT = 10;
inline constexpr size_t DEFAULT_BATCH_SIZE = 100;
inline constexpr size_t DEFAULT_STREAM_BATCH_SIZE = 50;
inline constexpr size_t DEFAULT_BATCH_CONCURRENCY = 10;
inline constexpr size_t DEFAULT_PARALLEL_BATCH_CONCURRENCY = 5;

struct concurrency_options {
  size_t concurrency_limit = DEFAULT_CONCURRENCY_LIMIT;
  size_t batch_size = DEFAULT_BATCH_SIZE;
  bool preserve_order = true;

  /// Throws std::invalid_argument if the limit or batch size is zero.
  void validate() const;
};

class run_config {
public:
  std::optional<size_t> concurrency_limit;
  std::optional<size_t> batch_size;
  std::optional<bool> preserve_order;

  /// Bound on independent invocations when a stage's batch() is called.
  /// Separate from concurrency_limit, which applies inside one invocation.
  std::optional<size_t> max_batch_concurrency;

  /// When false, parallel steps that fail are dropped from the result record
  /// instead of failing the whole call.
  bool throw_on_error = true;

  std::vector<std::string> tags;
  std::stop_token stop_token;

  run_config& set_concurrency_limit(size_t Limit);
  run_config& set_batch_size(size_t Size);
  run_config& set_preserve_order(bool Preserve);
  run_config& set_max_batch_concurrency(size_t Limit);
  run_config& set_throw_on_error(bool Throw);
  run_config& set_stop_token(std::stop_token Token);
  run_config& add_tag(std::string Tag);

  /// A copy of this config with one more tag appended.
  run_config tagged(std::string Tag) const;

  bool stop_requested() const noexcept { return stop_token.stop_requested(); }

  /// Applies the overrides held by this config on top of Defaults.
  concurrency_options resolve(concurrency_options Defaults) const;

  /// Tags joined with ',' for log output.
  std::string tag_string() const;
};

struct runtime_config {
  /// 0 selects the hardware concurrency.
  size_t thread_count = 0;
  size_t priority_count = 1;
  /// The asio executor drives retry backoff and rate limiting timers.
  bool start_timer_executor = true;
  spdlog::level::level_enum log_level = spdlog::level::info;

  /// Reads the keys "thread_count", "priority_count", "start_timer_executor"
  /// and "log_level". Missing keys keep their defaults. A value of the wrong
  /// type or an unknown level name throws std::invalid_argument.
  static runtime_config from_json(nlohmann::json const& Json);

  /// Loads a JSON file with from_json(). Throws std::runtime_error if the file
  /// cannot be opened or parsed.
  static runtime_config from_file(std::string const& Path);

  /// Applies STAGECRAFT_THREADS and STAGECRAFT_LOG_LEVEL if they are set.
  /// Throws std::invalid_argument for a malformed value.
  runtime_config& apply_environment();
};

} // namespace stagecraft
