#include "test_common.hpp"

#include "stagecraft/errors.hpp"
#include "stagecraft/sequence.hpp"
#include "stagecraft/stage.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#define CATEGORY test_sequence

using stagecraft::run_config;

class CATEGORY : public testing::Test {
protected:
  static void SetUpTestSuite() {
    stagecraft::init_runtime(test_runtime_config());
  }

  static void TearDownTestSuite() { stagecraft::teardown_runtime(); }

  static tmc::ex_cpu& ex() { return tmc::cpu_executor(); }
};

static auto add_one() {
  return stagecraft::make_lambda<int>("add_one", [](int X) { return X + 1; });
}

static auto doubled() {
  return stagecraft::make_lambda<int>(
    "double", [](int X) -> tmc::task<int> { co_return X * 2; }
  );
}

static auto to_text() {
  return stagecraft::make_lambda<int>("to_text", [](int X) {
    return std::to_string(X);
  });
}

TEST_F(CATEGORY, runs_steps_in_order) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto seq = stagecraft::pipe("calc", add_one(), doubled(), to_text());
    EXPECT_EQ(seq->size(), 3);
    EXPECT_EQ(
      seq->step_names(),
      (std::vector<std::string>{"add_one", "double", "to_text"})
    );
    auto out = co_await seq->invoke(4, run_config{});
    EXPECT_EQ(out, "10");
  }());
}

TEST_F(CATEGORY, first_failure_short_circuits) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto third_ran = std::make_shared<std::atomic<bool>>(false);
    auto boom = stagecraft::make_lambda<int>("boom", [](int) -> int {
      throw test_failure("boom");
    });
    auto third = stagecraft::make_lambda<int>("third", [third_ran](int X) {
      *third_ran = true;
      return X;
    });
    auto seq = stagecraft::pipe("calc", add_one(), boom, third);
    auto err = co_await catch_as<stagecraft::execution_error>(
      seq->invoke(1, run_config{})
    );
    EXPECT_TRUE(err.has_value());
    if (!err.has_value()) {
      co_return;
    }
    EXPECT_EQ(err->stage(), "calc");
    EXPECT_EQ(err->step_index(), 1);
    EXPECT_STREQ(err->what(), "calc: execution failed at step 1: boom");
    EXPECT_EQ(stagecraft::describe(stagecraft::root_cause(err->cause())), "boom");
    EXPECT_FALSE(third_ran->load());
  }());
}

TEST_F(CATEGORY, nested_failure_keeps_cause_chain) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto boom = stagecraft::make_lambda<int>("boom", [](int) -> int {
      throw test_failure("deep");
    });
    auto inner = stagecraft::pipe("inner", add_one(), boom);
    auto outer = stagecraft::pipe("outer", doubled(), inner);
    auto err = co_await catch_as<stagecraft::execution_error>(
      outer->invoke(1, run_config{})
    );
    EXPECT_TRUE(err.has_value());
    if (!err.has_value()) {
      co_return;
    }
    EXPECT_EQ(err->stage(), "outer");
    EXPECT_EQ(err->step_index(), 1);
    auto root = stagecraft::root_cause(std::make_exception_ptr(*err));
    EXPECT_EQ(stagecraft::describe(root), "deep");
  }());
}

TEST_F(CATEGORY, then_appends_without_mutating) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto seq = stagecraft::pipe("calc", add_one(), doubled());
    auto longer = seq->then(to_text());
    EXPECT_EQ(seq->size(), 2);
    EXPECT_EQ(longer->size(), 3);
    EXPECT_EQ(longer->name(), "calc");
    EXPECT_EQ(co_await seq->invoke(1, run_config{}), 4);
    EXPECT_EQ(co_await longer->invoke(1, run_config{}), "4");
  }());
}

TEST_F(CATEGORY, empty_sequence_rejected) {
  using seq_t = stagecraft::sequence<int, int>;
  EXPECT_THROW(
    seq_t("empty", std::make_shared<std::vector<stagecraft::detail::erased_step>>(), {}),
    std::invalid_argument
  );
}

TEST_F(CATEGORY, stop_before_next_step) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto source = std::make_shared<std::stop_source>();
    auto second_ran = std::make_shared<std::atomic<bool>>(false);
    auto stopper = stagecraft::make_lambda<int>("stopper", [source](int X) {
      source->request_stop();
      return X;
    });
    auto second = stagecraft::make_lambda<int>("second", [second_ran](int X) {
      *second_ran = true;
      return X;
    });
    auto seq = stagecraft::pipe("calc", stopper, second);
    run_config cfg;
    cfg.set_stop_token(source->get_token());
    auto err = co_await catch_as<stagecraft::cancelled>(seq->invoke(1, cfg));
    EXPECT_TRUE(err.has_value());
    EXPECT_FALSE(second_ran->load());
  }());
}

TEST_F(CATEGORY, stream_forwards_last_step) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto seq = stagecraft::pipe("calc", add_one(), doubled());
    auto s = seq->stream(2, run_config{});
    auto all = co_await s.collect();
    EXPECT_EQ(all, (std::vector<int>{6}));
  }());
}

TEST_F(CATEGORY, batch_is_all_or_nothing) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto picky = stagecraft::make_lambda<int>("picky", [](int X) -> int {
      if (X < 0) {
        throw test_failure("negative");
      }
      return X;
    });
    auto seq = stagecraft::pipe("calc", picky, add_one());
    auto ok = co_await seq->batch({1, 2, 3}, run_config{});
    EXPECT_EQ(ok, (std::vector<int>{2, 3, 4}));

    auto err = co_await catch_as<stagecraft::aggregate_failure>(
      seq->batch({1, -2, 3}, run_config{})
    );
    EXPECT_TRUE(err.has_value());
    if (!err.has_value()) {
      co_return;
    }
    EXPECT_EQ(err->failed_count(), 1);
    EXPECT_EQ(err->total_count(), 3);
    EXPECT_NE(std::string(err->what()).find("1/3 items failed"), std::string::npos);
  }());
}

TEST_F(CATEGORY, batch_respects_max_batch_concurrency) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto gauge = std::make_shared<concurrency_gauge>();
    auto slow = stagecraft::make_lambda<int>(
      "slow",
      [gauge](int X) -> tmc::task<int> {
        return [](concurrency_gauge& Gauge, int V) -> tmc::task<int> {
          Gauge.enter();
          co_await delay_ms(10);
          Gauge.leave();
          co_return V;
        }(*gauge, X);
      }
    );
    auto seq = stagecraft::pipe("calc", slow, add_one());
    run_config cfg;
    cfg.set_max_batch_concurrency(2);
    auto out = co_await seq->batch({0, 1, 2, 3, 4, 5}, cfg);
    EXPECT_EQ(out, (std::vector<int>{1, 2, 3, 4, 5, 6}));
    EXPECT_LE(gauge->peak.load(), 2);
  }());
}
