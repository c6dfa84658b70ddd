#include <catch2/catch_test_macros.hpp>
#include "ParallelFor.h"
#include "ParallelExecutors.h"
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace trialsynth::concurrency;

TEST_CASE("parallel_for basic operations", "[parallel_for]")
{
  SECTION("Basic execution with SingleThreadExecutor")
  {
    SingleThreadExecutor executor;
    std::vector<int> results(10, 0);

    parallel_for(10, executor, [&results](uint32_t i) {
      results[i] = static_cast<int>(i * 2);
    });

    for (uint32_t i = 0; i < 10; ++i) {
      REQUIRE(results[i] == static_cast<int>(i * 2));
    }
  }

  SECTION("Zero iterations")
  {
    SingleThreadExecutor executor;
    std::atomic<int> counter{0};

    parallel_for(0, executor, [&counter](uint32_t) {
      counter.fetch_add(1);
    });

    REQUIRE(counter.load() == 0);
  }

  SECTION("All indices are visited exactly once on a pool")
  {
    ThreadPoolExecutor<4> executor;
    std::vector<std::atomic<int>> visited(1000);
    for (auto& v : visited) v.store(0);

    parallel_for(1000, executor, [&visited](uint32_t i) {
      visited[i].fetch_add(1, std::memory_order_relaxed);
    });

    for (uint32_t i = 0; i < 1000; ++i) {
      REQUIRE(visited[i].load() == 1);
    }
  }
}

TEST_CASE("parallel_for writes per slot give identical results on any executor", "[parallel_for]")
{
  auto work = [](IParallelExecutor& exec) {
    std::vector<double> out(257, 0.0);
    parallel_for(static_cast<uint32_t>(out.size()), exec, [&out](uint32_t i) {
      double acc = 0.0;
      for (uint32_t k = 0; k <= i; ++k)
        acc += 1.0 / (1.0 + k);
      out[i] = acc;
    });
    return out;
  };

  SingleThreadExecutor single;
  ThreadPoolExecutor<> pool(3);

  REQUIRE(work(single) == work(pool));
}

TEST_CASE("parallel_for propagates exceptions from the body", "[parallel_for]")
{
  ThreadPoolExecutor<2> executor;

  REQUIRE_THROWS_AS(parallel_for(50, executor, [](uint32_t i) {
    if (i == 17)
      throw std::runtime_error("boom");
  }), std::runtime_error);
}
