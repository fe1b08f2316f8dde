#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mkc_backtest::concurrency;

// Helper function to create a simple task that increments a counter
auto createIncrementTask(std::atomic<int>& counter) {
  return [&counter]() { counter.fetch_add(1, std::memory_order_relaxed); };
}

// Helper function to create a task that throws an exception
auto createThrowingTask(const std::string& message) {
  return [message]() { throw std::runtime_error(message); };
}

TEST_CASE("SingleThreadExecutor operations", "[SingleThreadExecutor]")
{
  SingleThreadExecutor executor;

  SECTION("Task runs before submit returns")
  {
    std::atomic<int> counter{0};
    auto future = executor.submit(createIncrementTask(counter));

    REQUIRE(counter.load() == 1);
    REQUIRE_NOTHROW(future.get());
  }

  SECTION("Exceptions are delivered through the future")
  {
    auto future = executor.submit(createThrowingTask("boom"));
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }

  SECTION("waitAll rethrows the first failure after draining every future")
  {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    futures.push_back(executor.submit(createIncrementTask(counter)));
    futures.push_back(executor.submit(createThrowingTask("first")));
    futures.push_back(executor.submit(createIncrementTask(counter)));

    REQUIRE_THROWS_AS(executor.waitAll(futures), std::runtime_error);
    REQUIRE(counter.load() == 2);
  }

  SECTION("Concurrency hint is one")
  {
    REQUIRE(executor.concurrencyHint() == 1);
  }
}

TEST_CASE("ThreadPoolExecutor operations", "[ThreadPoolExecutor]")
{
  SECTION("Runs every submitted task")
  {
    ThreadPoolExecutor<4> executor;
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 100; ++i)
      futures.push_back(executor.submit(createIncrementTask(counter)));

    executor.waitAll(futures);
    REQUIRE(counter.load() == 100);
    REQUIRE(executor.concurrencyHint() == 4);
  }

  SECTION("Task exceptions reach the caller")
  {
    ThreadPoolExecutor<2> executor;
    auto future = executor.submit(createThrowingTask("pool failure"));
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }

  SECTION("Zero workers selects the hardware thread count")
  {
    ThreadPoolExecutor<> executor;
    REQUIRE(executor.concurrencyHint() == hardwareThreads());
  }
}

TEST_CASE("StdAsyncExecutor operations", "[StdAsyncExecutor]")
{
  StdAsyncExecutor executor;
  std::atomic<int> counter{0};
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 8; ++i)
    futures.push_back(executor.submit(createIncrementTask(counter)));

  executor.waitAll(futures);
  REQUIRE(counter.load() == 8);
  REQUIRE(executor.concurrencyHint() >= 1);
}
