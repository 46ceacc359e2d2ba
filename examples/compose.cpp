// Composes an order-processing flow out of every kind of stage:
// - a sequence that validates, enriches and prices an order
// - a fan-out that runs independent lookups concurrently
// - a router that picks a shipping method from the order's fields
// - a mapper that processes many orders, with retry on a flaky step
// - a stream of partial fan-out results
//
// Set SPDLOG_LEVEL=debug to see each stage's timing.

#include "stagecraft/stagecraft.hpp"

#include "tmc/ex_cpu.hpp"
#include "tmc/task.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using stagecraft::run_config;
using stagecraft::value;

// Pretend remote lookups. Each sleeps on an asio timer.
static tmc::task<value> lookup_customer(value const& Order) {
  co_await stagecraft::sleep_for(std::chrono::milliseconds(30));
  auto id = Order.value("customer", std::string("anonymous"));
  co_return value{{"id", id}, {"tier", id == "c-1" ? "gold" : "basic"}};
}

static tmc::task<value> lookup_stock(value const& Order) {
  co_await stagecraft::sleep_for(std::chrono::milliseconds(20));
  co_return value{{"available", Order.value("quantity", 0) <= 5}};
}

static double price_of(value const& Order) {
  return Order.value("unit_price", 0.0) * Order.value("quantity", 0);
}

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  stagecraft::init_runtime(
    stagecraft::runtime_config{}.apply_environment()
  );
  return tmc::async_main([]() -> tmc::task<int> {
    auto validate = stagecraft::make_lambda<value>("validate", [](value Order) {
      if (!Order.contains("quantity") || Order["quantity"].get<int>() <= 0) {
        throw std::invalid_argument("order has no quantity");
      }
      return Order;
    });

    auto lookups = stagecraft::make_parallel<value>("lookups", 4)
                     ->add_step("customer", stagecraft::make_lambda<value>(
                                              "customer", lookup_customer
                                            ))
                     ->add_step("stock", stagecraft::make_lambda<value>(
                                           "stock", lookup_stock
                                         ));

    auto enrich = stagecraft::make_assign("enrich")
                    ->with("details", lookups)
                    ->with("total", price_of)
                    ->with_value("currency", "EUR");

    auto express = stagecraft::make_lambda<value>("express", [](value Order) {
      Order["shipping"] = "express";
      return Order;
    });
    auto standard = stagecraft::make_lambda<value>("standard", [](value Order) {
      Order["shipping"] = "standard";
      return Order;
    });
    auto backorder = stagecraft::make_lambda<value>("backorder", [](value Order) {
      Order["shipping"] = "backorder";
      return Order;
    });
    auto shipping =
      stagecraft::make_router<value, value>("shipping")
        ->add_branch(
          stagecraft::negate<value>("details.stock.available"), backorder,
          "out of stock"
        )
        ->add_branch(
          stagecraft::any_of<value>(
            {"details.customer.tier=gold",
             stagecraft::in_range<value>("total", 500, 1e9)}
          ),
          express, "priority"
        )
        ->set_default(standard);

    auto process = stagecraft::pipe("process", validate, enrich, shipping);

    // One order
    auto one = co_await process->invoke(
      value{
        {"customer", "c-1"}, {"quantity", 2}, {"unit_price", 19.5}
      },
      run_config{}.tagged("single")
    );
    std::printf("single order: %s\n", one.dump().c_str());

    // Many orders, one of which is invalid
    std::vector<value> orders;
    for (int i = 0; i < 12; ++i) {
      orders.push_back(value{
        {"customer", "c-" + std::to_string(i % 4)},
        {"quantity", i == 7 ? 0 : i % 8 + 1},
        {"unit_price", 75.0}
      });
    }
    auto everyOrder =
      stagecraft::make_mapper("orders", process)->with_concurrency(4);
    auto settled = co_await everyOrder->settle(orders);
    for (size_t i = 0; i < settled.size(); ++i) {
      if (settled[i].ok()) {
        std::printf(
          "order %zu: %s\n", i,
          (*settled[i].value)["shipping"].get<std::string>().c_str()
        );
      } else {
        std::printf(
          "order %zu failed: %s\n", i,
          stagecraft::describe(stagecraft::root_cause(settled[i].error)).c_str()
        );
      }
    }

    // A flaky step recovered by retry
    auto attempts = std::make_shared<std::atomic<int>>(0);
    auto flaky =
      stagecraft::make_lambda<value>("flaky", [attempts](value Order) {
        if (++*attempts % 3 != 0) {
          throw std::runtime_error("temporarily unavailable");
        }
        return Order;
      });
    stagecraft::retry_policy policy;
    policy.base_delay = std::chrono::milliseconds(10);
    auto recovered = co_await stagecraft::with_retry(flaky, policy)->invoke(
      value{{"id", 1}}, run_config{}
    );
    std::printf(
      "recovered after %d attempts: %s\n", attempts->load(),
      recovered.dump().c_str()
    );

    // Partial results as each lookup completes
    auto partial = lookups->stream(value{{"customer", "c-2"}, {"quantity", 9}}, run_config{});
    while (auto record = co_await partial.next()) {
      std::printf("partial: %s\n", record->dump().c_str());
    }
    co_return 0;
  }());
}
