// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MONTE_CARLO_SIMULATOR_H
#define __MONTE_CARLO_SIMULATOR_H 1

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include "BacktestException.h"
#include "BacktestResult.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "PerformanceMetrics.h"
#include "RngUtils.h"
#include "Xorshift64.h"

namespace mkc_backtest
{
  struct MonteCarloConfig
  {
    std::size_t numSimulations = 1000;
    uint64_t seed = 12345;

    MonteCarloConfig& withSimulations(std::size_t n)
    {
      numSimulations = n;
      return *this;
    }

    MonteCarloConfig& withSeed(uint64_t s)
    {
      seed = s;
      return *this;
    }

    void validate() const
    {
      if (numSimulations == 0)
	throw InvalidParameterException("num_simulations", "must be greater than zero");
    }
  };

  /**
   * @brief Nearest-rank percentiles of a sample plus its mean.
   *
   * Percentile p is the element at index round(p / 100 * (n - 1)) of the
   * sorted sample; no interpolation.
   */
  struct PercentileStats
  {
    double p5 = 0.0;
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p95 = 0.0;
    double mean = 0.0;

    static PercentileStats constant(double value)
    {
      return PercentileStats{value, value, value, value, value, value};
    }

    static PercentileStats fromSample(std::vector<double> values)
    {
      if (values.empty())
	return PercentileStats();

      std::sort(values.begin(), values.end());
      const std::size_t n = values.size();
      auto at = [&values, n](double p) {
	const std::size_t idx = static_cast<std::size_t>(std::round(p / 100.0 * static_cast<double>(n - 1)));
	return values[std::min(idx, n - 1)];
      };

      accumulator_set<double, stats<mean_tag>> acc;
      for (double v : values)
	acc(v);

      return PercentileStats{at(5.0), at(25.0), at(50.0), at(75.0), at(95.0),
			     boost::accumulators::mean(acc)};
    }
  };

  /**
   * @brief Distribution of outcomes over reshuffled trade sequences.
   *
   * totalReturn is in percent; maxDrawdown is a fraction. The Sharpe ratio
   * is computed from trade-to-trade equity steps and is not comparable to
   * the bar-by-bar Sharpe of PerformanceMetrics.
   */
  struct MonteCarloResult
  {
    std::size_t numSimulations = 0;
    PercentileStats totalReturn;
    PercentileStats maxDrawdown;
    PercentileStats sharpeRatio;
    PercentileStats profitFactor;
  };

  namespace mc_detail
  {
    struct SimulationOutcome
    {
      double totalReturn;
      double maxDrawdown;
      double sharpe;
      double profitFactor;
    };

    // [initial, initial * (1 + r0), ...]
    inline std::vector<double> compoundedCurve(const std::vector<double>& returns, double initialCapital)
    {
      std::vector<double> curve;
      curve.reserve(returns.size() + 1);
      double equity = initialCapital;
      curve.push_back(equity);
      for (double r : returns)
	{
	  equity *= 1.0 + r;
	  curve.push_back(equity);
	}
      return curve;
    }

    inline double maxDrawdown(const std::vector<double>& curve)
    {
      double peak = -std::numeric_limits<double>::infinity();
      double maxDd = 0.0;
      for (double equity : curve)
	{
	  peak = std::max(peak, equity);
	  if (peak > 0.0)
	    maxDd = std::max(maxDd, (peak - equity) / peak);
	}
      return maxDd;
    }

    inline double interTradeSharpe(const std::vector<double>& curve, double barsPerYear)
    {
      std::vector<double> steps;
      for (std::size_t i = 1; i < curve.size(); ++i)
	steps.push_back(curve[i - 1] > 0.0 ? (curve[i] - curve[i - 1]) / curve[i - 1] : 0.0);

      if (steps.size() < 2)
	return 0.0;

      const double mean = metrics_detail::meanOf(steps);
      const double stdDev = metrics_detail::sampleStdDev(steps, mean);
      if (stdDev == 0.0)
	return 0.0;

      return mean / stdDev * std::sqrt(barsPerYear);
    }

    inline double profitFactor(const std::vector<double>& returns)
    {
      double profit = 0.0, loss = 0.0;
      for (double r : returns)
	{
	  if (r > 0.0)
	    profit += r;
	  else if (r < 0.0)
	    loss += -r;
	}

      if (loss > 0.0)
	return profit / loss;
      return profit > 0.0 ? std::numeric_limits<double>::max() : 0.0;
    }
  }

  /**
   * @class MonteCarloSimulator
   * @brief Trade-order resampling of a completed backtest.
   *
   * Simulation k shuffles the per-trade return fractions with its own
   * Xorshift64 seeded from (seed, k), so the result is identical for every
   * Executor and every scheduling of the simulations.
   *
   * @tparam Executor a concurrency executor policy
   */
  template <class Executor = concurrency::SingleThreadExecutor>
  class MonteCarloSimulator
  {
  public:
    explicit MonteCarloSimulator(const MonteCarloConfig& config = MonteCarloConfig())
      : mConfig(config)
    {
      mConfig.validate();
    }

    const MonteCarloConfig& getConfig() const
    {
      return mConfig;
    }

    MonteCarloResult run(const BacktestResult& backtest) const
    {
      MonteCarloResult result;
      result.numSimulations = mConfig.numSimulations;

      std::vector<double> tradeReturns;
      tradeReturns.reserve(backtest.trades.size());
      for (const auto& trade : backtest.trades)
	tradeReturns.push_back(trade.getReturnPct() / 100.0);

      if (tradeReturns.size() < 2)
	{
	  result.totalReturn = PercentileStats::constant(backtest.metrics.totalReturnPct);
	  result.maxDrawdown = PercentileStats::constant(backtest.metrics.maxDrawdownPct);
	  result.sharpeRatio = PercentileStats::constant(backtest.metrics.sharpeRatio);
	  result.profitFactor = PercentileStats::constant(backtest.metrics.profitFactor);
	  return result;
	}

      const double initialCapital = backtest.initialCapital;
      const double barsPerYear = backtest.config.getBarsPerYear();
      const rng_utils::SeedSequence seeds(mConfig.seed);

      Executor executor;
      const std::vector<mc_detail::SimulationOutcome> outcomes =
	concurrency::parallel_transform<mc_detail::SimulationOutcome>(
	  mConfig.numSimulations, executor,
	  [&](std::size_t k) {
	    Xorshift64 rng(seeds.make_seed_for(k));
	    std::vector<double> shuffled(tradeReturns);
	    fisherYatesShuffle(shuffled, rng);

	    const std::vector<double> curve = mc_detail::compoundedCurve(shuffled, initialCapital);
	    return mc_detail::SimulationOutcome{
	      (curve.back() / initialCapital - 1.0) * 100.0,
	      mc_detail::maxDrawdown(curve),
	      mc_detail::interTradeSharpe(curve, barsPerYear),
	      mc_detail::profitFactor(shuffled)};
	  });

      std::vector<double> returns, drawdowns, sharpes, factors;
      for (const auto& o : outcomes)
	{
	  returns.push_back(o.totalReturn);
	  drawdowns.push_back(o.maxDrawdown);
	  sharpes.push_back(o.sharpe);
	  factors.push_back(o.profitFactor);
	}

      result.totalReturn = PercentileStats::fromSample(std::move(returns));
      result.maxDrawdown = PercentileStats::fromSample(std::move(drawdowns));
      result.sharpeRatio = PercentileStats::fromSample(std::move(sharpes));
      result.profitFactor = PercentileStats::fromSample(std::move(factors));
      return result;
    }

  private:
    MonteCarloConfig mConfig;
  };
}

#endif
