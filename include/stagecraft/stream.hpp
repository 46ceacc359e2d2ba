// Incremental results, produced by a background task and consumed with
// `co_await stream.next()`.
//
// An output_stream is backed by a tmc channel. The producer runs detached and
// may only run a bounded number of items ahead of the consumer: each emit()
// takes a credit from a semaphore, and each item the consumer pulls gives one
// back. A producer failure is delivered in-band and rethrown by next() after
// the items that were produced before it.
//
// Streams are single-consumer and cannot be restarted. Destroying the stream
// early closes the channel; the producer observes this at its next emit() and
// stops.

#pragma once

#include "tmc/channel.hpp"
#include "tmc/current.hpp"
#include "tmc/ex_cpu.hpp"
#include "tmc/semaphore.hpp"
#include "tmc/spawn.hpp"
#include "tmc/sync.hpp"
#include "tmc/task.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace stagecraft {

template <typename T> struct stream_item {
  std::optional<T> value;
  std::exception_ptr error;
};

namespace detail {
template <typename T> struct stream_state {
  // Each end owns a token; a single token must not be used from two threads.
  tmc::chan_tok<stream_item<T>> producer;
  tmc::chan_tok<stream_item<T>> consumer;
  tmc::semaphore credits;
  std::atomic<bool> closed{false};

  explicit stream_state(size_t Ahead)
      : producer(tmc::make_channel<stream_item<T>>()),
        consumer(producer.new_token()), credits(Ahead) {}

  /// Closes the channel through Tok, the caller's own token.
  void close(tmc::chan_tok<stream_item<T>>& Tok) {
    if (!closed.exchange(true)) {
      Tok.close();
    }
  }
};

/// Starts a detached task. Outside of any executor (e.g. when called from
/// main()), the task is posted to tmc::cpu_executor().
inline void launch(tmc::task<void>&& Task) {
  if (tmc::current_executor() == nullptr) {
    tmc::post(tmc::cpu_executor(), std::move(Task), 0);
  } else {
    tmc::spawn(std::move(Task)).detach();
  }
}
} // namespace detail

/// The producing end of an output_stream. Closes the stream when destroyed.
template <typename T> class stream_writer {
  std::shared_ptr<detail::stream_state<T>> state_;

public:
  explicit stream_writer(std::shared_ptr<detail::stream_state<T>> State)
      : state_{std::move(State)} {}

  stream_writer(stream_writer const&) = delete;
  stream_writer& operator=(stream_writer const&) = delete;
  stream_writer(stream_writer&&) = default;
  stream_writer& operator=(stream_writer&&) = default;

  ~stream_writer() {
    if (state_ != nullptr) {
      state_->close(state_->producer);
    }
  }

  /// True once the consumer has gone away (or the stream was finished).
  bool abandoned() const noexcept { return state_->closed.load(); }

  /// Waits for a credit, then publishes Value. Returns false if the consumer
  /// no longer wants items; the producer should stop.
  tmc::task<bool> emit(T Value) {
    if (abandoned()) {
      co_return false;
    }
    co_await state_->credits;
    if (abandoned()) {
      co_return false;
    }
    co_return state_->producer.post(stream_item<T>{std::move(Value), nullptr});
  }

  /// Delivers Error to the consumer after any items already emitted, then
  /// closes the stream.
  void fail(std::exception_ptr Error) {
    if (!abandoned()) {
      [[maybe_unused]] bool posted =
        state_->producer.post(stream_item<T>{std::nullopt, std::move(Error)});
    }
    state_->close(state_->producer);
  }

  void finish() { state_->close(state_->producer); }
};

template <typename T> class [[nodiscard]] output_stream {
  std::shared_ptr<detail::stream_state<T>> state_;
  bool done_ = false;

public:
  using value_type = T;

  explicit output_stream(std::shared_ptr<detail::stream_state<T>> State)
      : state_{std::move(State)} {}

  output_stream(output_stream const&) = delete;
  output_stream& operator=(output_stream const&) = delete;
  output_stream(output_stream&&) = default;
  output_stream& operator=(output_stream&&) = default;

  ~output_stream() {
    if (state_ != nullptr) {
      state_->close(state_->consumer);
      // Wake a producer that is parked waiting for a credit.
      state_->credits.release();
    }
  }

  /// The next item, or an empty optional once the stream has ended. Rethrows
  /// the producer's exception, if it failed.
  tmc::task<std::optional<T>> next() {
    if (done_) {
      co_return std::nullopt;
    }
    auto item = co_await state_->consumer.pull();
    if (!item.has_value()) {
      done_ = true;
      co_return std::nullopt;
    }
    if (item->error != nullptr) {
      done_ = true;
      std::rethrow_exception(item->error);
    }
    state_->credits.release();
    co_return std::move(item->value);
  }

  /// Drains the remaining items.
  tmc::task<std::vector<T>> collect() {
    std::vector<T> out;
    while (auto v = co_await next()) {
      out.push_back(std::move(*v));
    }
    co_return out;
  }

  bool done() const noexcept { return done_; }
};

namespace detail {
template <typename T, typename Body>
tmc::task<void> run_producer(stream_writer<T> Writer, Body Fn) {
  std::exception_ptr err;
  try {
    co_await Fn(Writer);
  } catch (...) {
    err = std::current_exception();
  }
  if (err != nullptr) {
    Writer.fail(err);
  } else {
    Writer.finish();
  }
}
} // namespace detail

/// Starts Fn(stream_writer<T>&) -> tmc::task<void> in the background and
/// returns the consuming end. Fn is kept alive until it completes. Ahead is
/// the number of items the producer may publish before the consumer pulls.
template <typename T, typename Body>
output_stream<T> produce(Body&& Fn, size_t Ahead = 1) {
  auto state = std::make_shared<detail::stream_state<T>>(Ahead);
  detail::launch(detail::run_producer<T, std::decay_t<Body>>(
    stream_writer<T>{state}, std::forward<Body>(Fn)
  ));
  return output_stream<T>{std::move(state)};
}

} // namespace stagecraft
