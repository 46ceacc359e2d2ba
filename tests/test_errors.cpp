#include "stagecraft/errors.hpp"

#include <gtest/gtest.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#define CATEGORY test_errors

using stagecraft::aggregate_failure;
using stagecraft::execution_error;

TEST(CATEGORY, describe) {
  EXPECT_EQ(stagecraft::describe(nullptr), "no error");
  EXPECT_EQ(
    stagecraft::describe(std::make_exception_ptr(std::runtime_error("oops"))),
    "oops"
  );
  EXPECT_EQ(stagecraft::describe(std::make_exception_ptr(42)), "unknown error");
}

TEST(CATEGORY, execution_error_messages) {
  execution_error plain("loader", "bad input");
  EXPECT_STREQ(plain.what(), "loader: bad input");
  EXPECT_EQ(plain.stage(), "loader");
  EXPECT_FALSE(plain.step_index().has_value());
  EXPECT_EQ(plain.cause(), nullptr);

  auto cause = std::make_exception_ptr(std::runtime_error("disk full"));
  execution_error step("pipeline", 2, cause);
  EXPECT_STREQ(step.what(), "pipeline: execution failed at step 2: disk full");
  EXPECT_EQ(step.step_index(), 2);
  EXPECT_EQ(step.cause(), cause);
}

TEST(CATEGORY, root_cause_walks_chain) {
  auto leaf = std::make_exception_ptr(std::logic_error("leaf"));
  auto mid = std::make_exception_ptr(execution_error("inner", 0, leaf));
  auto top = std::make_exception_ptr(execution_error("outer", 3, mid));
  EXPECT_EQ(stagecraft::root_cause(top), leaf);
  EXPECT_EQ(stagecraft::root_cause(leaf), leaf);
  EXPECT_EQ(stagecraft::root_cause(nullptr), nullptr);

  auto childless = std::make_exception_ptr(execution_error("x", "y"));
  EXPECT_EQ(stagecraft::root_cause(childless), childless);
}

TEST(CATEGORY, aggregate_failure_lists_all) {
  std::vector<aggregate_failure::failure> failures{
    {"a", std::make_exception_ptr(std::runtime_error("first"))},
    {"c", std::make_exception_ptr(std::runtime_error("second"))}
  };
  aggregate_failure agg("fan", failures, 3);
  EXPECT_EQ(agg.failed_count(), 2);
  EXPECT_EQ(agg.total_count(), 3);
  EXPECT_EQ(agg.keys(), (std::vector<std::string>{"a", "c"}));
  EXPECT_STREQ(agg.what(), "fan: 2/3 items failed (a: first; c: second)");
  EXPECT_EQ(agg.cause(), failures[0].cause);
  // is an execution_error
  execution_error const& base = agg;
  EXPECT_EQ(base.stage(), "fan");
}

TEST(CATEGORY, cancellation) {
  stagecraft::cancelled c("batch");
  EXPECT_STREQ(c.what(), "batch: execution was cancelled");
  EXPECT_TRUE(stagecraft::is_cancellation(std::make_exception_ptr(c)));
  EXPECT_FALSE(stagecraft::is_cancellation(
    std::make_exception_ptr(std::runtime_error("no"))
  ));
  EXPECT_FALSE(stagecraft::is_cancellation(nullptr));

  std::vector<aggregate_failure::failure> mixed{
    {"a", std::make_exception_ptr(std::runtime_error("plain"))},
    {"b", std::make_exception_ptr(c)}
  };
  EXPECT_THROW(
    aggregate_failure::rethrow_cancellation(mixed), stagecraft::cancelled
  );
  std::vector<aggregate_failure::failure> plain{mixed[0]};
  EXPECT_NO_THROW(aggregate_failure::rethrow_cancellation(plain));
}

TEST(CATEGORY, no_matching_branch) {
  stagecraft::no_matching_branch e("router");
  EXPECT_STREQ(
    e.what(), "router: no matching branch found and no default branch set"
  );
  EXPECT_EQ(e.stage(), "router");
}
