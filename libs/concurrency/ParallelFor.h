// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <algorithm>
#include <cstddef>
#include <future>
#include <optional>
#include <vector>

namespace mkc_backtest
{
  namespace concurrency
  {
    // Split [0, total) into at most exec.concurrencyHint() contiguous chunks,
    // submit one task per chunk and wait for all of them. body(i) is called
    // exactly once for every i.
    template <typename Executor, typename Body>
    void parallel_for(std::size_t total, Executor& exec, Body body)
    {
      if (total == 0)
	return;

      const std::size_t numTasks = std::max<std::size_t>(1, exec.concurrencyHint());
      const std::size_t chunkSize = (total + numTasks - 1) / numTasks;

      std::vector<std::future<void>> futures;
      for (std::size_t start = 0; start < total; start += chunkSize)
	{
	  const std::size_t end = std::min(total, start + chunkSize);
	  futures.emplace_back(exec.submit([=]() {
		for (std::size_t i = start; i < end; ++i)
		  body(i);
	      }));
	}
      exec.waitAll(futures);
    }

    // Evaluate fn(i) for every i in [0, total) and return the results in index
    // order, independent of the order in which the executor ran them.
    template <typename Result, typename Executor, typename Fn>
    std::vector<Result> parallel_transform(std::size_t total, Executor& exec, Fn fn)
    {
      std::vector<std::optional<Result>> slots(total);
      parallel_for(total, exec, [&slots, &fn](std::size_t i) {
	  slots[i].emplace(fn(i));
	});

      std::vector<Result> results;
      results.reserve(total);
      for (auto& slot : slots)
	results.push_back(std::move(*slot));
      return results;
    }
  }
}
