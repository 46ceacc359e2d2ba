// Throughput of a mapper over a 4-step sequence.
// - Steps can be regular functions or coroutines
// - The mapper bounds concurrency and keeps input order within each chunk
// - The same mapper is then consumed as a stream of chunks, and folded with
//   with_reduce()

#include "stagecraft/stagecraft.hpp"

#include "tmc/ex_cpu.hpp"
#include "tmc/task.hpp"

#include <chrono>
#include <cstdio>
#include <functional>
#include <string>
#include <vector>

static inline constexpr int NELEMS = 200'000;

static std::string formatElementsPerSec(size_t durMs) {
  if (durMs == 0) {
    durMs = 1;
  }
  size_t elementsPerSec = static_cast<size_t>(
    static_cast<double>(NELEMS) * 1'000.0 / (static_cast<double>(durMs))
  );
  auto s = std::to_string(elementsPerSec);
  int i = static_cast<int>(s.length()) - 3;
  while (i > 0) {
    s.insert(static_cast<size_t>(i), ",");
    i -= 3;
  }
  return s;
}

// Example processing steps - these can be coroutines or regular functions
static float plus_half(int i) { return static_cast<float>(i) + 0.5f; }
static tmc::task<double> times_two(float i) {
  co_return static_cast<double>(2.0f * i);
}
static int minus_one(double i) { return static_cast<int>(i) - 1; }
static bool as_bool(int i) { return i > 2; }

static size_t ms_since(std::chrono::high_resolution_clock::time_point Start) {
  return static_cast<size_t>(
    std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::high_resolution_clock::now() - Start
    )
      .count()
  );
}

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  stagecraft::init_runtime(
    stagecraft::runtime_config{}.apply_environment()
  );
  return tmc::async_main([]() -> tmc::task<int> {
    std::printf("testing %d items through a 4-step mapper...\n", NELEMS);
    auto constructStart = std::chrono::high_resolution_clock::now();

    auto element = stagecraft::pipe(
      "element", stagecraft::make_lambda<int>("plus_half", plus_half),
      stagecraft::make_lambda<float>("times_two", times_two),
      stagecraft::make_lambda<double>("minus_one", minus_one),
      stagecraft::make_lambda<int>("as_bool", as_bool)
    );
    stagecraft::concurrency_options opts;
    opts.concurrency_limit = 64;
    opts.batch_size = 10'000;
    auto mapper = stagecraft::make_mapper("batch_map", element, opts);

    std::vector<int> inputs(NELEMS);
    for (int i = 0; i < NELEMS; ++i) {
      inputs[static_cast<size_t>(i)] = i;
    }

    auto processStart = std::chrono::high_resolution_clock::now();
    auto out = co_await mapper->invoke(inputs, stagecraft::run_config{});
    size_t processTime = ms_since(processStart);

    size_t sum = 0;
    for (bool b : out) {
      sum += static_cast<size_t>(b);
    }
    std::printf("element sum: %zu\n", sum);          // should be 199998
    std::printf("element count: %zu\n", out.size()); // should be 200000
    std::printf(
      "construct time: %f ms\n",
      static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
          processStart - constructStart
        )
          .count()
      )
    );
    std::printf("process time: %f ms\n", static_cast<double>(processTime));
    std::printf("%s elements/sec\n", formatElementsPerSec(processTime).c_str());

    // The same work, consumed incrementally
    auto streamStart = std::chrono::high_resolution_clock::now();
    auto chunks = mapper->stream(inputs, stagecraft::run_config{});
    size_t chunkCount = 0;
    size_t streamed = 0;
    while (auto chunk = co_await chunks.next()) {
      ++chunkCount;
      streamed += chunk->size();
    }
    size_t streamTime = ms_since(streamStart);
    std::printf(
      "streamed %zu elements in %zu chunks: %s elements/sec\n", streamed,
      chunkCount, formatElementsPerSec(streamTime).c_str()
    );

    // And folded into a single count
    auto counter = mapper->with_reduce<size_t>(
      [](size_t Acc, bool const& B) { return Acc + static_cast<size_t>(B); },
      size_t{0}
    );
    auto reduced = co_await counter->invoke(inputs, stagecraft::run_config{});
    std::printf("reduced sum: %zu\n", reduced);
    co_return reduced == sum ? 0 : 1;
  }());
}
