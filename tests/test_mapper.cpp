#include "test_common.hpp"

#include "stagecraft/errors.hpp"
#include "stagecraft/mapper.hpp"
#include "stagecraft/stage.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <limits>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

#define CATEGORY test_mapper

using stagecraft::run_config;

class CATEGORY : public testing::Test {
protected:
  static void SetUpTestSuite() {
    stagecraft::init_runtime(test_runtime_config());
  }

  static void TearDownTestSuite() { stagecraft::teardown_runtime(); }

  static tmc::ex_cpu& ex() { return tmc::cpu_executor(); }
};

static std::vector<int> iota_vec(int N) {
  std::vector<int> v(static_cast<size_t>(N));
  std::iota(v.begin(), v.end(), 0);
  return v;
}

static stagecraft::stage_ptr<int, int>
gauged_square(std::shared_ptr<concurrency_gauge> Gauge) {
  return stagecraft::make_lambda<int>(
    "square",
    [Gauge](int X) -> tmc::task<int> {
      return [](concurrency_gauge& P, int V) -> tmc::task<int> {
        P.enter();
        co_await delay_ms(5 + (V % 4) * 3);
        P.leave();
        co_return V * V;
      }(*Gauge, X);
    }
  );
}

TEST_F(CATEGORY, maps_in_order_within_limit) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto gauge = std::make_shared<concurrency_gauge>();
    auto m = stagecraft::make_mapper("squares", gauged_square(gauge))
               ->with_concurrency(3);
    EXPECT_EQ(m->options().concurrency_limit, 3);
    auto out = co_await m->invoke(iota_vec(12), run_config{});
    EXPECT_EQ(out.size(), 12);
    if (out.size() != 12) {
      co_return;
    }
    for (int i = 0; i < 12; ++i) {
      EXPECT_EQ(out[static_cast<size_t>(i)], i * i);
    }
    EXPECT_LE(gauge->peak.load(), 3);
  }());
}

TEST_F(CATEGORY, run_config_overrides_options) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto gauge = std::make_shared<concurrency_gauge>();
    auto m = stagecraft::make_mapper("squares", gauged_square(gauge));
    run_config cfg;
    cfg.set_concurrency_limit(1);
    auto out = co_await m->invoke(iota_vec(4), cfg);
    EXPECT_EQ(out, (std::vector<int>{0, 1, 4, 9}));
    EXPECT_EQ(gauge->peak.load(), 1);

    cfg.set_concurrency_limit(0);
    auto err = co_await catch_as<std::invalid_argument>(m->invoke(iota_vec(4), cfg));
    EXPECT_TRUE(err.has_value());
  }());
}

TEST_F(CATEGORY, zero_limit_rejected_at_construction) {
  auto element = stagecraft::make_lambda<int>("id", [](int X) { return X; });
  stagecraft::concurrency_options opts;
  opts.batch_size = 0;
  EXPECT_THROW(stagecraft::make_mapper("m", element, opts), std::invalid_argument);
  auto m = stagecraft::make_mapper("m", element);
  EXPECT_THROW(m->with_concurrency(0), std::invalid_argument);
}

TEST_F(CATEGORY, derivations_leave_original_alone) {
  auto element = stagecraft::make_lambda<int>("id", [](int X) { return X; });
  auto m = stagecraft::make_mapper("m", element);
  auto tuned =
    m->with_batch_size(7)->with_order_preservation(false)->with_concurrency(2);
  EXPECT_EQ(tuned->options().batch_size, 7);
  EXPECT_FALSE(tuned->options().preserve_order);
  EXPECT_EQ(tuned->options().concurrency_limit, 2);
  EXPECT_EQ(m->options().batch_size, stagecraft::DEFAULT_BATCH_SIZE);
  EXPECT_TRUE(m->options().preserve_order);
  EXPECT_EQ(m->options().concurrency_limit, stagecraft::DEFAULT_CONCURRENCY_LIMIT);
  EXPECT_EQ(tuned->element(), m->element());
}

TEST_F(CATEGORY, failure_is_aggregated) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto element = stagecraft::make_lambda<int>("picky", [](int X) -> int {
      if (X == 2 || X == 5) {
        throw test_failure("no " + std::to_string(X));
      }
      return X;
    });
    auto m = stagecraft::make_mapper("m", element);
    auto err = co_await catch_as<stagecraft::aggregate_failure>(
      m->invoke(iota_vec(6), run_config{})
    );
    EXPECT_TRUE(err.has_value());
    if (!err.has_value()) {
      co_return;
    }
    EXPECT_EQ(err->stage(), "m");
    EXPECT_EQ(err->keys(), (std::vector<std::string>{"item 2", "item 5"}));

    auto settled = co_await m->settle(iota_vec(6));
    EXPECT_EQ(settled.size(), 6);
    if (settled.size() != 6) {
      co_return;
    }
    EXPECT_TRUE(settled[0].ok());
    EXPECT_FALSE(settled[2].ok());
    EXPECT_EQ(stagecraft::describe(settled[5].error), "no 5");
    EXPECT_EQ(std::move(settled[4]).get(), 4);
  }());
}

TEST_F(CATEGORY, filter_drops_items) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto element = stagecraft::make_lambda<int>("neg", [](int X) { return -X; });
    auto m = stagecraft::make_mapper("m", element)
               ->with_filter([](int const& X) { return X % 2 == 0; })
               ->with_filter([](int const& X) { return X > 0; });
    auto out = co_await m->invoke(iota_vec(9), run_config{});
    EXPECT_EQ(out, (std::vector<int>{-2, -4, -6, -8}));
  }());
}

TEST_F(CATEGORY, retry_recovers_flaky_items) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto failedOnce = std::make_shared<std::vector<std::atomic<bool>>>(4);
    auto element = stagecraft::make_lambda<int>("flaky", [failedOnce](int X) {
      auto& flag = (*failedOnce)[static_cast<size_t>(X)];
      if (!flag.exchange(true)) {
        throw test_failure("first try");
      }
      return X * 10;
    });
    stagecraft::retry_policy policy;
    policy.base_delay = std::chrono::milliseconds(1);
    auto m = stagecraft::make_mapper("m", element)->with_retry(policy);
    auto out = co_await m->invoke(iota_vec(4), run_config{});
    EXPECT_EQ(out, (std::vector<int>{0, 10, 20, 30}));
  }());
}

TEST_F(CATEGORY, rate_limit_caps_concurrency_and_spaces_starts) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto gauge = std::make_shared<concurrency_gauge>();
    auto m = stagecraft::make_mapper("m", gauged_square(gauge))
               ->with_rate_limit(40.0);
    auto capped = stagecraft::make_mapper("m", gauged_square(gauge))
                    ->with_rate_limit(2.5);
    EXPECT_EQ(capped->options().concurrency_limit, 2);
    auto start = std::chrono::steady_clock::now();
    auto out = co_await m->invoke(iota_vec(5), run_config{});
    EXPECT_EQ(out, (std::vector<int>{0, 1, 4, 9, 16}));
    // five starts at 25ms spacing
    EXPECT_GE(elapsed_ms(start), 95);
  }());
}

TEST_F(CATEGORY, rate_limit_beyond_concurrency_keeps_limit) {
  auto element = stagecraft::make_lambda<int>("id", [](int X) { return X; });
  auto m = stagecraft::make_mapper("m", element)->with_concurrency(8);
  EXPECT_EQ(m->with_rate_limit(1e300)->options().concurrency_limit, 8);
  EXPECT_EQ(m->with_rate_limit(0.5)->options().concurrency_limit, 1);
  EXPECT_THROW(
    m->with_rate_limit(std::numeric_limits<double>::infinity()),
    std::invalid_argument
  );
  EXPECT_THROW(
    m->with_rate_limit(std::numeric_limits<double>::quiet_NaN()),
    std::invalid_argument
  );
}

TEST_F(CATEGORY, stream_chunks_are_capped) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto element = stagecraft::make_lambda<int>("id", [](int X) { return X; });
    auto m = stagecraft::make_mapper("m", element);
    auto s = m->stream(iota_vec(45), run_config{});
    std::vector<size_t> sizes;
    while (auto chunk = co_await s.next()) {
      sizes.push_back(chunk->size());
    }
    EXPECT_EQ(sizes, (std::vector<size_t>{20, 20, 5}));

    auto small = m->with_batch_size(4)->stream(iota_vec(9), run_config{});
    auto chunks = co_await small.collect();
    EXPECT_EQ(chunks.size(), 3);
    if (chunks.size() != 3) {
      co_return;
    }
    EXPECT_EQ(chunks[2], (std::vector<int>{8}));
  }());
}

TEST_F(CATEGORY, reduce_folds_in_order) {
  test_async_main(ex(), []() -> tmc::task<void> {
    auto element = stagecraft::make_lambda<int>("text", [](int X) {
      return std::to_string(X);
    });
    auto joined = stagecraft::make_mapper("m", element)->with_reduce<std::string>(
      [](std::string Acc, std::string const& S) { return Acc + S; },
      std::string(">")
    );
    EXPECT_EQ(joined->name(), "m.reduce");
    EXPECT_EQ(co_await joined->invoke(iota_vec(5), run_config{}), ">01234");
  }());
}
