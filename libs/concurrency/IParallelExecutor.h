// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace mkc_backtest
{
  namespace concurrency
  {
    /**
     * @brief Executor policy interface used by the Monte Carlo simulator and
     *        the grid search.
     *
     * Submitted tasks must not share mutable state; callers write results
     * into pre-sized, index-addressed storage and merge after waitAll().
     */
    class IParallelExecutor
    {
    public:
      virtual ~IParallelExecutor() = default;

      // Schedule a void() task; the returned future rethrows any task exception.
      virtual std::future<void> submit(std::function<void()> task) = 0;

      // Wait on every future, then rethrow the first stored exception.
      virtual void waitAll(std::vector<std::future<void>>& futures)
      {
	std::exception_ptr firstError;
	for (auto& f : futures)
	  {
	    try
	      {
		f.get();
	      }
	    catch (...)
	      {
		if (!firstError)
		  firstError = std::current_exception();
	      }
	  }

	if (firstError)
	  std::rethrow_exception(firstError);
      }

      // Number of chunks parallel_for splits its range into.
      virtual unsigned concurrencyHint() const
      {
	return 1;
      }
    };
  }
}
