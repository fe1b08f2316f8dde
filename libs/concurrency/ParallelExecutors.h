// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include "IParallelExecutor.h"
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for running independent simulation units.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread. This is the
 *    default everywhere; a backtest sweep with it is fully sequential.
 *  - StdAsyncExecutor: one std::async(std::launch::async) call per task.
 *  - ThreadPoolExecutor<N>: a fixed pool of N workers (N == 0 picks
 *    std::thread::hardware_concurrency()).
 *
 * Whatever the policy, the Monte Carlo simulator and the grid search write
 * each unit's result into its own slot and merge in index order, so the
 * output does not depend on the executor.
 */
namespace mkc_backtest
{
  namespace concurrency
  {
    inline unsigned hardwareThreads()
    {
      const unsigned hw = std::thread::hardware_concurrency();
      return hw ? hw : 2;
    }

    /**
     * @brief Executes tasks synchronously on the calling thread.
     */
    class SingleThreadExecutor : public IParallelExecutor
    {
    public:
      std::future<void> submit(std::function<void()> task) override
      {
	std::promise<void> prom;
	auto fut = prom.get_future();
	try
	  {
	    task();
	    prom.set_value();
	  }
	catch (...)
	  {
	    prom.set_exception(std::current_exception());
	  }
	return fut;
      }
    };

    /**
     * @brief Executor policy using std::async for each task.
     *
     * Each submit may spawn a new thread, so this suits a small number of
     * long-running units (for example one walk-forward window each).
     */
    class StdAsyncExecutor : public IParallelExecutor
    {
    public:
      std::future<void> submit(std::function<void()> task) override
      {
	return std::async(std::launch::async, std::move(task));
      }

      unsigned concurrencyHint() const override
      {
	return hardwareThreads();
      }
    };

    /**
     * @brief Fixed-size thread pool executor.
     *
     * Tasks are queued and executed by N worker threads. If N == 0 the pool
     * size is std::thread::hardware_concurrency() (2 if that returns 0).
     */
    template <std::size_t N = 0>
    class ThreadPoolExecutor : public IParallelExecutor
    {
    public:
      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
      ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

      ThreadPoolExecutor()
	: mStop(false)
      {
	const std::size_t threads = N > 0 ? N : hardwareThreads();

	try
	  {
	    for (std::size_t i = 0; i < threads; ++i)
	      mWorkers.emplace_back([this] { workerLoop(); });
	  }
	catch (...)
	  {
	    shutdown();
	    throw;
	  }
      }

      ~ThreadPoolExecutor()
      {
	shutdown();
      }

      std::future<void> submit(std::function<void()> task) override
      {
	auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
	auto fut = packaged->get_future();
	{
	  std::unique_lock<std::mutex> lock(mTasksMutex);
	  if (mStop)
	    throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	  mTasks.emplace([packaged]() { (*packaged)(); });
	}
	mCondition.notify_one();
	return fut;
      }

      unsigned concurrencyHint() const override
      {
	return static_cast<unsigned>(mWorkers.size());
      }

    private:
      void workerLoop()
      {
	for (;;)
	  {
	    std::function<void()> task;
	    {
	      std::unique_lock<std::mutex> lock(mTasksMutex);
	      mCondition.wait(lock, [this] { return mStop || !mTasks.empty(); });
	      if (mStop && mTasks.empty())
		return;
	      task = std::move(mTasks.front());
	      mTasks.pop();
	    }
	    task();
	  }
      }

      void shutdown()
      {
	{
	  std::lock_guard<std::mutex> lock(mTasksMutex);
	  mStop = true;
	}
	mCondition.notify_all();
	for (auto& worker : mWorkers)
	  {
	    if (worker.joinable())
	      worker.join();
	  }
      }

    private:
      std::vector<std::thread>          mWorkers;
      std::queue<std::function<void()>> mTasks;
      std::mutex                        mTasksMutex;
      std::condition_variable           mCondition;
      bool                              mStop;
    };
  }
}
