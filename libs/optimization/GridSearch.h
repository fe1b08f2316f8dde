// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __GRID_SEARCH_H
#define __GRID_SEARCH_H 1

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "BacktestConfig.h"
#include "BacktestEngine.h"
#include "BacktestException.h"
#include "BacktestResult.h"
#include "BacktestStrategy.h"
#include "Candle.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "ParamRange.h"

namespace mkc_backtest
{
  /**
   * @brief Ranking criterion of a parameter sweep. Higher scores are better
   * for every metric; MIN_DRAWDOWN scores the negated max drawdown.
   */
  enum class OptimizeMetric
    {
      TOTAL_RETURN,
      SHARPE_RATIO,
      SORTINO_RATIO,
      CALMAR_RATIO,
      PROFIT_FACTOR,
      WIN_RATE,
      MIN_DRAWDOWN
    };

  inline const char* toString(OptimizeMetric metric)
  {
    switch (metric)
      {
      case OptimizeMetric::TOTAL_RETURN:
	return "total_return";
      case OptimizeMetric::SHARPE_RATIO:
	return "sharpe_ratio";
      case OptimizeMetric::SORTINO_RATIO:
	return "sortino_ratio";
      case OptimizeMetric::CALMAR_RATIO:
	return "calmar_ratio";
      case OptimizeMetric::PROFIT_FACTOR:
	return "profit_factor";
      case OptimizeMetric::WIN_RATE:
	return "win_rate";
      case OptimizeMetric::MIN_DRAWDOWN:
	return "min_drawdown";
      }
    return "unknown";
  }

  inline double scoreResult(OptimizeMetric metric, const BacktestResult& result)
  {
    const PerformanceMetrics& m = result.metrics;
    switch (metric)
      {
      case OptimizeMetric::TOTAL_RETURN:
	return m.totalReturnPct;
      case OptimizeMetric::SHARPE_RATIO:
	return m.sharpeRatio;
      case OptimizeMetric::SORTINO_RATIO:
	return m.sortinoRatio;
      case OptimizeMetric::CALMAR_RATIO:
	return m.calmarRatio;
      case OptimizeMetric::PROFIT_FACTOR:
	return m.profitFactor;
      case OptimizeMetric::WIN_RATE:
	return m.winRate;
      case OptimizeMetric::MIN_DRAWDOWN:
	return -m.maxDrawdownPct;
      }
    return m.sharpeRatio;
  }

  /// One grid cell: the parameter set and the backtest it produced.
  struct OptimizationResult
  {
    ParamMap params;
    BacktestResult result;
    double score = 0.0;
  };

  struct OptimizationReport
  {
    std::string strategyName;
    std::string metricName;
    std::size_t totalCombinations = 0;   // size of the cartesian product
    std::vector<OptimizationResult> results;   // best first, NaN scores last
    OptimizationResult best;
    std::size_t skippedErrors = 0;       // combinations that failed with an unexpected error
  };

  /// Builds a fresh strategy for one parameter combination.
  typedef std::function<BacktestStrategyPtr(const ParamMap&)> StrategyFactory;

  /// Caller-supplied ranking; higher is better.
  typedef std::function<double(const BacktestResult&)> ScoreFunction;

  /**
   * @brief Orders results by descending score with every NaN score after
   * every finite score. Stable, so ties keep grid order.
   */
  inline void sortByScore(std::vector<OptimizationResult>& results)
  {
    std::stable_sort(results.begin(), results.end(),
		     [](const OptimizationResult& a, const OptimizationResult& b) {
		       const bool aNan = std::isnan(a.score);
		       const bool bNan = std::isnan(b.score);
		       if (aNan || bNan)
			 return !aNan && bNan;
		       return a.score > b.score;
		     });
  }

  /**
   * @class GridSearch
   * @brief Exhaustive sweep over the cartesian product of parameter ranges.
   *
   * The last parameter added varies fastest. Each combination builds its own
   * strategy through the factory and runs an isolated BacktestEngine, so the
   * combinations are distributed over the Executor; the factory must be
   * safe to call concurrently when a multi-threaded Executor is used.
   * Results are merged in grid order before ranking, so the report does
   * not depend on the Executor.
   *
   * Combinations with too little data for the strategy's warmup are skipped
   * silently. Any other failure is written to the log stream as a warning
   * and counted in skippedErrors.
   *
   * @tparam Executor a concurrency executor policy
   */
  template <class Executor = concurrency::SingleThreadExecutor>
  class GridSearch
  {
  public:
    GridSearch()
      : mParams(),
	mMetric(OptimizeMetric::SHARPE_RATIO),
	mScorer(),
	mScorerName(),
	mLog(&std::cerr)
    {}

    GridSearch& param(const std::string& name, const ParamRange& range)
    {
      mParams.emplace_back(name, range);
      return *this;
    }

    GridSearch& optimizeFor(OptimizeMetric metric)
    {
      mMetric = metric;
      mScorer = ScoreFunction();
      mScorerName.clear();
      return *this;
    }

    GridSearch& optimizeWith(const std::string& name, ScoreFunction scorer)
    {
      if (!scorer)
	throw InvalidParameterException("metric", "custom scoring function must not be empty");

      mScorer = std::move(scorer);
      mScorerName = name;
      return *this;
    }

    GridSearch& setLogStream(std::ostream& os)
    {
      mLog = &os;
      return *this;
    }

    const std::vector<std::pair<std::string, ParamRange>>& getParams() const
    {
      return mParams;
    }

    OptimizeMetric getMetric() const
    {
      return mMetric;
    }

    std::string getMetricName() const
    {
      return mScorer ? mScorerName : std::string(toString(mMetric));
    }

    double score(const BacktestResult& result) const
    {
      return mScorer ? mScorer(result) : scoreResult(mMetric, result);
    }

    /**
     * @brief Every parameter combination in sweep order.
     */
    std::vector<ParamMap> combinations() const
    {
      if (mParams.empty())
	throw InvalidParameterException("params", "grid search requires at least one parameter range");

      std::vector<std::vector<ParamValue>> expanded;
      expanded.reserve(mParams.size());
      for (const auto& p : mParams)
	expanded.push_back(p.second.expand());

      std::vector<ParamMap> combos;
      for (const auto& values : expanded)
	{
	  if (values.empty())
	    return combos;
	}

      combos.emplace_back();
      for (std::size_t i = 0; i < mParams.size(); ++i)
	{
	  std::vector<ParamMap> next;
	  next.reserve(combos.size() * expanded[i].size());
	  for (const auto& partial : combos)
	    for (const auto& v : expanded[i])
	      {
		ParamMap m(partial);
		m[mParams[i].first] = v;
		next.push_back(std::move(m));
	      }
	  combos.swap(next);
	}
      return combos;
    }

    OptimizationReport run(const std::string& symbol,
			   const CandleSeries& candles,
			   const BacktestConfig& config,
			   const StrategyFactory& factory) const
    {
      if (!factory)
	throw InvalidParameterException("factory", "strategy factory must not be empty");

      const std::vector<ParamMap> combos = combinations();
      if (combos.empty())
	throw InvalidParameterException("params", "all parameter ranges produced empty value sets");

      const BacktestEngine engine(config);

      Executor executor;
      const std::vector<CellOutcome> outcomes =
	concurrency::parallel_transform<CellOutcome>(
	  combos.size(), executor,
	  [&](std::size_t i) {
	    return evaluate(engine, symbol, candles, combos[i], factory);
	  });

      OptimizationReport report;
      report.totalCombinations = combos.size();
      report.metricName = getMetricName();

      for (std::size_t i = 0; i < outcomes.size(); ++i)
	{
	  const CellOutcome& outcome = outcomes[i];
	  if (outcome.result)
	    report.results.push_back(*outcome.result);
	  else if (!outcome.error.empty())
	    {
	      ++report.skippedErrors;
	      (*mLog) << "Warning: grid search skipped {" << toString(combos[i])
		      << "}: " << outcome.error << std::endl;
	    }
	}

      if (report.results.empty())
	throw InvalidParameterException("candles", "no parameter combination had enough data to run");

      sortByScore(report.results);
      if (std::isnan(report.results.front().score))
	throw InvalidParameterException("metric", "all parameter combinations produced NaN for the target metric");

      report.best = report.results.front();
      report.strategyName = report.best.result.strategyName;
      return report;
    }

  private:
    struct CellOutcome
    {
      std::optional<OptimizationResult> result;
      std::string error;   // empty when the cell ran or lacked data
    };

    CellOutcome evaluate(const BacktestEngine& engine,
			 const std::string& symbol,
			 const CandleSeries& candles,
			 const ParamMap& params,
			 const StrategyFactory& factory) const
    {
      CellOutcome outcome;
      try
	{
	  BacktestStrategyPtr strategy = factory(params);
	  if (!strategy)
	    throw InvalidParameterException("factory", "strategy factory returned null");

	  OptimizationResult cell;
	  cell.params = params;
	  cell.result = engine.run(symbol, candles, *strategy);
	  cell.score = score(cell.result);
	  outcome.result = std::move(cell);
	}
      catch (const InsufficientDataException&)
	{
	  // not enough bars for this parameter set's warmup
	}
      catch (const std::exception& e)
	{
	  outcome.error = e.what();
	}
      return outcome;
    }

    std::vector<std::pair<std::string, ParamRange>> mParams;
    OptimizeMetric mMetric;
    ScoreFunction mScorer;
    std::string mScorerName;
    std::ostream* mLog;
  };
}

#endif
