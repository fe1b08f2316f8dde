// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __WALK_FORWARD_H
#define __WALK_FORWARD_H 1

#include <optional>
#include <string>
#include <vector>
#include "BacktestConfig.h"
#include "BacktestEngine.h"
#include "BacktestException.h"
#include "BacktestResult.h"
#include "Candle.h"
#include "GridSearch.h"
#include "ParamRange.h"
#include "PerformanceMetrics.h"

namespace mkc_backtest
{
  /**
   * @struct WindowResult
   * @brief One in-sample optimization and its out-of-sample validation.
   *
   * Bar indices are half-open offsets into the full candle series.
   */
  struct WindowResult
  {
    std::size_t window = 0;
    std::size_t inSampleBegin = 0;
    std::size_t inSampleEnd = 0;
    std::size_t outOfSampleEnd = 0;
    ParamMap optimizedParams;
    BacktestResult inSample;
    BacktestResult outOfSample;
  };

  struct WalkForwardReport
  {
    std::string strategyName;
    std::vector<WindowResult> windows;
    PerformanceMetrics aggregateMetrics;
    EquityCurve aggregateEquityCurve;   // synthetic, strictly increasing timestamps
    double consistencyRatio = 0.0;      // fraction of profitable OOS windows
    std::vector<OptimizationReport> optimizationReports;
    std::size_t skippedWindows = 0;     // OOS slice shorter than the chosen strategy's warmup
  };

  /**
   * @class WalkForwardConfig
   * @brief Rolling in-sample optimization with out-of-sample validation.
   *
   * A window of inSampleBars + outOfSampleBars slides across the series,
   * advancing by stepBars (outOfSampleBars when unset). Each window runs
   * the grid on its in-sample slice and then a fresh strategy built from
   * the best parameters on the out-of-sample slice.
   *
   * The aggregate metrics concatenate every window's OOS trades and equity
   * points. Each window starts from the same initial capital, so the
   * aggregate return is not a compounded multi-period return.
   *
   * @tparam Executor executor policy handed to the grid search
   */
  template <class Executor = concurrency::SingleThreadExecutor>
  class WalkForwardConfig
  {
  public:
    WalkForwardConfig(const GridSearch<Executor>& grid, const BacktestConfig& config)
      : mGrid(grid),
	mConfig(config),
	mInSampleBars(252),
	mOutOfSampleBars(63),
	mStepBars()
    {}

    WalkForwardConfig& inSampleBars(std::size_t bars)
    {
      mInSampleBars = bars;
      return *this;
    }

    WalkForwardConfig& outOfSampleBars(std::size_t bars)
    {
      mOutOfSampleBars = bars;
      return *this;
    }

    WalkForwardConfig& stepBars(std::size_t bars)
    {
      mStepBars = bars;
      return *this;
    }

    const GridSearch<Executor>& getGrid() const
    {
      return mGrid;
    }

    const BacktestConfig& getConfig() const
    {
      return mConfig;
    }

    std::size_t getInSampleBars() const
    {
      return mInSampleBars;
    }

    std::size_t getOutOfSampleBars() const
    {
      return mOutOfSampleBars;
    }

    std::size_t getStepBars() const
    {
      return mStepBars ? *mStepBars : mOutOfSampleBars;
    }

    void validate(std::size_t numCandles) const
    {
      if (mInSampleBars == 0)
	throw InvalidParameterException("in_sample_bars", "must be greater than zero");
      if (mOutOfSampleBars == 0)
	throw InvalidParameterException("out_of_sample_bars", "must be greater than zero");
      if (mStepBars && *mStepBars == 0)
	throw InvalidParameterException("step_bars", "must be greater than zero");

      const std::size_t windowBars = mInSampleBars + mOutOfSampleBars;
      if (numCandles < windowBars)
	throw InsufficientDataException(windowBars, numCandles);
    }

    WalkForwardReport run(const std::string& symbol,
			  const CandleSeries& candles,
			  const StrategyFactory& factory) const
    {
      validate(candles.size());

      const std::size_t step = getStepBars();
      const std::size_t windowBars = mInSampleBars + mOutOfSampleBars;
      const BacktestEngine engine(mConfig);

      WalkForwardReport report;
      std::size_t windowIndex = 0;
      for (std::size_t start = 0; start + windowBars <= candles.size(); start += step, ++windowIndex)
	{
	  const std::size_t isEnd = start + mInSampleBars;
	  const std::size_t oosEnd = isEnd + mOutOfSampleBars;

	  OptimizationReport optimization;
	  try
	    {
	      optimization = mGrid.run(symbol, sliceCandles(candles, start, isEnd), mConfig, factory);
	    }
	  catch (const std::exception& e)
	    {
	      throw InvalidParameterException("walk_forward", "window " + std::to_string(windowIndex) +
					      " optimization failed: " + e.what());
	    }

	  WindowResult w;
	  w.window = windowIndex;
	  w.inSampleBegin = start;
	  w.inSampleEnd = isEnd;
	  w.outOfSampleEnd = oosEnd;
	  w.optimizedParams = optimization.best.params;
	  w.inSample = optimization.best.result;

	  try
	    {
	      BacktestStrategyPtr strategy = factory(w.optimizedParams);
	      if (!strategy)
		throw InvalidParameterException("factory", "strategy factory returned null");
	      w.outOfSample = engine.run(symbol, sliceCandles(candles, isEnd, oosEnd), *strategy);
	    }
	  catch (const InsufficientDataException&)
	    {
	      ++report.skippedWindows;
	      continue;
	    }
	  catch (const std::exception& e)
	    {
	      throw InvalidParameterException("walk_forward", "window " + std::to_string(windowIndex) +
					      " out-of-sample run failed: " + e.what());
	    }

	  report.windows.push_back(std::move(w));
	  report.optimizationReports.push_back(std::move(optimization));
	}

      if (report.windows.empty())
	throw InsufficientDataException(windowBars, candles.size());

      report.strategyName = report.windows.front().inSample.strategyName;
      report.consistencyRatio = consistencyRatio(report.windows);
      aggregate(report);
      return report;
    }

    static double consistencyRatio(const std::vector<WindowResult>& windows)
    {
      if (windows.empty())
	return 0.0;

      std::size_t profitable = 0;
      for (const auto& w : windows)
	{
	  if (w.outOfSample.getTotalPnl() > 0.0)
	    ++profitable;
	}
      return static_cast<double>(profitable) / static_cast<double>(windows.size());
    }

  private:
    // Equity points are re-stamped 0, 1, 2, ... seconds after the epoch;
    // calendar time is meaningless across disjoint windows.
    void aggregate(WalkForwardReport& report) const
    {
      std::vector<Trade> trades;
      std::size_t totalSignals = 0;
      std::size_t executedSignals = 0;

      for (const auto& w : report.windows)
	{
	  const BacktestResult& oos = w.outOfSample;
	  trades.insert(trades.end(), oos.trades.begin(), oos.trades.end());

	  for (const auto& point : oos.equityCurve)
	    {
	      const long long seq = static_cast<long long>(report.aggregateEquityCurve.size());
	      report.aggregateEquityCurve.push_back(EquityPoint{fromEpochSeconds(seq),
								point.equity,
								point.drawdownPct});
	    }

	  totalSignals += oos.signals.size();
	  for (const auto& s : oos.signals)
	    {
	      if (s.executed)
		++executedSignals;
	    }
	}

      report.aggregateMetrics =
	PerformanceMetrics::calculate(trades,
				      report.aggregateEquityCurve,
				      report.windows.front().outOfSample.initialCapital,
				      totalSignals,
				      executedSignals,
				      mConfig.getRiskFreeRate(),
				      mConfig.getBarsPerYear());
    }

    GridSearch<Executor> mGrid;
    BacktestConfig mConfig;
    std::size_t mInSampleBars;
    std::size_t mOutOfSampleBars;
    std::optional<std::size_t> mStepBars;
  };
}

#endif
