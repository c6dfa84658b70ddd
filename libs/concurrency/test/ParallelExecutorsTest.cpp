#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace trialsynth::concurrency;

TEST_CASE("SingleThreadExecutor runs tasks inline", "[executor]")
{
  SingleThreadExecutor executor;
  const auto caller = std::this_thread::get_id();
  std::thread::id ranOn;

  auto fut = executor.submit([&ranOn]() { ranOn = std::this_thread::get_id(); });
  fut.get();

  REQUIRE(ranOn == caller);
}

TEST_CASE("SingleThreadExecutor captures exceptions in the future", "[executor]")
{
  SingleThreadExecutor executor;
  auto fut = executor.submit([]() { throw std::logic_error("bad"); });
  REQUIRE_THROWS_AS(fut.get(), std::logic_error);
}

TEST_CASE("ThreadPoolExecutor sizes itself from the constructor or template", "[executor]")
{
  ThreadPoolExecutor<3> fixed;
  REQUIRE(fixed.size() == 3);

  ThreadPoolExecutor<> runtime(5);
  REQUIRE(runtime.size() == 5);

  ThreadPoolExecutor<> automatic;
  REQUIRE(automatic.size() >= 1);
}

TEST_CASE("ThreadPoolExecutor completes every submitted task", "[executor]")
{
  ThreadPoolExecutor<4> executor;
  std::atomic<int> counter{0};
  std::vector<std::future<void>> futures;

  for (int i = 0; i < 200; ++i)
    futures.push_back(executor.submit([&counter]() { counter.fetch_add(1); }));

  executor.waitAll(futures);
  REQUIRE(counter.load() == 200);
}

TEST_CASE("ThreadPoolExecutor rethrows task exceptions on get", "[executor]")
{
  ThreadPoolExecutor<2> executor;
  auto fut = executor.submit([]() { throw std::runtime_error("task failed"); });
  REQUIRE_THROWS_AS(fut.get(), std::runtime_error);
}

TEST_CASE("waitAll lets every task finish before rethrowing the first failure", "[executor]")
{
  ThreadPoolExecutor<4> executor;
  std::atomic<int> finished{0};
  std::vector<std::future<void>> futures;

  futures.push_back(executor.submit([]() { throw std::runtime_error("first task failed"); }));
  for (int i = 0; i < 6; ++i)
    futures.push_back(executor.submit([&finished]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      finished.fetch_add(1);
    }));

  REQUIRE_THROWS_AS(executor.waitAll(futures), std::runtime_error);
  REQUIRE(finished.load() == 6);
}

TEST_CASE("makeExecutor chooses a policy from the thread count", "[executor]")
{
  auto inlineExec = makeExecutor(1);
  REQUIRE(dynamic_cast<SingleThreadExecutor*>(inlineExec.get()) != nullptr);

  auto zeroExec = makeExecutor(0);
  REQUIRE(dynamic_cast<SingleThreadExecutor*>(zeroExec.get()) != nullptr);

  auto pooled = makeExecutor(4);
  auto* pool = dynamic_cast<ThreadPoolExecutor<>*>(pooled.get());
  REQUIRE(pool != nullptr);
  REQUIRE(pool->size() == 4);
}
