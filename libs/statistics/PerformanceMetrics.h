// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PERFORMANCE_METRICS_H
#define __PERFORMANCE_METRICS_H 1

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/sum.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include "EquityPoint.h"
#include "Position.h"

namespace mkc_backtest
{
  using boost::accumulators::accumulator_set;
  using boost::accumulators::stats;

  typedef boost::accumulators::tag::mean mean_tag;
  typedef boost::accumulators::tag::sum sum_tag;
  typedef boost::accumulators::tag::count count_tag;

  namespace metrics_detail
  {
    // Stand-in for an unbounded ratio that still serializes as a number.
    inline double unboundedRatio()
    {
      return std::numeric_limits<double>::max();
    }

    inline double meanOf(const std::vector<double>& values)
    {
      accumulator_set<double, stats<mean_tag>> acc;
      for (double v : values)
	acc(v);
      return values.empty() ? 0.0 : boost::accumulators::mean(acc);
    }

    // Sample (n - 1) standard deviation about a known mean.
    inline double sampleStdDev(const std::vector<double>& values, double mean)
    {
      if (values.size() < 2)
	return 0.0;

      double squares = 0.0;
      for (double v : values)
	squares += (v - mean) * (v - mean);
      return std::sqrt(squares / static_cast<double>(values.size() - 1));
    }

    inline double periodicRiskFreeRate(double annualRate, double barsPerYear)
    {
      return std::pow(1.0 + annualRate, 1.0 / barsPerYear) - 1.0;
    }

    inline std::vector<double> periodicReturns(const EquityCurve& curve)
    {
      std::vector<double> result;
      if (curve.size() < 2)
	return result;

      result.reserve(curve.size() - 1);
      for (std::size_t i = 1; i < curve.size(); ++i)
	{
	  const double prev = curve[i - 1].equity;
	  result.push_back(prev > 0.0 ? (curve[i].equity - prev) / prev : 0.0);
	}
      return result;
    }

    inline std::vector<double> excessReturns(const std::vector<double>& returns,
					     double riskFreeRate,
					     double barsPerYear)
    {
      const double rf = periodicRiskFreeRate(riskFreeRate, barsPerYear);
      std::vector<double> excess;
      excess.reserve(returns.size());
      for (double r : returns)
	excess.push_back(r - rf);
      return excess;
    }

    inline double sharpeRatio(const std::vector<double>& returns,
			      double riskFreeRate,
			      double barsPerYear)
    {
      if (returns.size() < 2)
	return 0.0;

      const std::vector<double> excess = excessReturns(returns, riskFreeRate, barsPerYear);
      const double mean = meanOf(excess);
      const double stdDev = sampleStdDev(excess, mean);

      if (stdDev > 0.0)
	return mean / stdDev * std::sqrt(barsPerYear);
      return mean > 0.0 ? unboundedRatio() : 0.0;
    }

    // Downside deviation divides by n - 1 over all observations, not just the negative ones.
    inline double sortinoRatio(const std::vector<double>& returns,
			       double riskFreeRate,
			       double barsPerYear)
    {
      if (returns.size() < 2)
	return 0.0;

      const std::vector<double> excess = excessReturns(returns, riskFreeRate, barsPerYear);
      const double mean = meanOf(excess);

      double downside = 0.0;
      for (double r : excess)
	{
	  if (r < 0.0)
	    downside += r * r;
	}
      const double downsideDev = std::sqrt(downside / static_cast<double>(excess.size() - 1));

      if (downsideDev > 0.0)
	return mean / downsideDev * std::sqrt(barsPerYear);
      return mean > 0.0 ? unboundedRatio() : 0.0;
    }

    /**
     * @brief Longest run of consecutive bars strictly below the running peak.
     *
     * A bar at or above the peak ends the current run. A run still open at
     * the end of the curve counts.
     */
    inline long long maxDrawdownDuration(const EquityCurve& curve)
    {
      if (curve.empty())
	return 0;

      long long maxDuration = 0;
      long long current = 0;
      double peak = curve.front().equity;
      for (const auto& point : curve)
	{
	  if (point.equity >= peak)
	    {
	      peak = point.equity;
	      maxDuration = std::max(maxDuration, current);
	      current = 0;
	    }
	  else
	    ++current;
	}
      return std::max(maxDuration, current);
    }
  }

  /**
   * @struct PerformanceMetrics
   * @brief Summary statistics of one backtest run.
   *
   * Percentages named *Pct are in percent (5.0 == 5%) except maxDrawdownPct,
   * which is a fraction. Ratios that would be infinite are reported as
   * std::numeric_limits<double>::max().
   */
  struct PerformanceMetrics
  {
    double totalReturnPct = 0.0;
    double annualizedReturnPct = 0.0;
    double sharpeRatio = 0.0;
    double sortinoRatio = 0.0;
    double maxDrawdownPct = 0.0;           // fraction
    long long maxDrawdownDuration = 0;     // bars
    double winRate = 0.0;                  // fraction of trades with pnl > 0
    double profitFactor = 0.0;
    double avgTradeReturnPct = 0.0;
    double avgWinPct = 0.0;
    double avgLossPct = 0.0;
    double avgTradeDuration = 0.0;         // seconds
    std::size_t totalTrades = 0;
    std::size_t winningTrades = 0;
    std::size_t losingTrades = 0;
    double largestWin = 0.0;
    double largestLoss = 0.0;
    std::size_t maxConsecutiveWins = 0;
    std::size_t maxConsecutiveLosses = 0;
    double calmarRatio = 0.0;
    double totalCommission = 0.0;
    std::size_t longTrades = 0;
    std::size_t shortTrades = 0;
    std::size_t totalSignals = 0;
    std::size_t executedSignals = 0;
    double avgWinDuration = 0.0;           // seconds
    double avgLossDuration = 0.0;          // seconds
    double timeInMarketPct = 0.0;          // fraction in [0, 1]
    long long maxIdlePeriod = 0;           // seconds
    double totalDividendIncome = 0.0;

    double maxDrawdownPercentage() const
    {
      return maxDrawdownPct * 100.0;
    }

    /**
     * @brief Compute every metric from a run's trades and equity curve.
     *
     * With no trades only the total return and signal counts are filled
     * in; every other field stays zero.
     */
    static PerformanceMetrics calculate(const std::vector<Trade>& trades,
					const EquityCurve& equityCurve,
					double initialCapital,
					std::size_t totalSignals,
					std::size_t executedSignals,
					double riskFreeRate,
					double barsPerYear)
    {
      PerformanceMetrics m;
      m.totalSignals = totalSignals;
      m.executedSignals = executedSignals;

      const double finalEquity = equityCurve.empty() ? initialCapital : equityCurve.back().equity;
      m.totalReturnPct = (finalEquity / initialCapital - 1.0) * 100.0;

      if (trades.empty())
	return m;

      m.totalTrades = trades.size();

      double grossProfit = 0.0;
      double grossLoss = 0.0;
      std::vector<double> winningReturns, losingReturns;
      accumulator_set<double, stats<mean_tag>> tradeReturns;
      accumulator_set<double, stats<sum_tag>> durations;
      accumulator_set<double, stats<mean_tag, count_tag>> winDurations, lossDurations;

      for (const auto& t : trades)
	{
	  const double duration = static_cast<double>(t.getDurationSeconds());
	  if (t.isProfitable())
	    {
	      ++m.winningTrades;
	      grossProfit += t.getPnl();
	      winningReturns.push_back(t.getReturnPct());
	      m.largestWin = std::max(m.largestWin, t.getPnl());
	      winDurations(duration);
	    }
	  else if (t.isLoss())
	    {
	      ++m.losingTrades;
	      grossLoss += std::abs(t.getPnl());
	      losingReturns.push_back(t.getReturnPct());
	      m.largestLoss = std::min(m.largestLoss, t.getPnl());
	      lossDurations(duration);
	    }

	  if (t.isLong())
	    ++m.longTrades;
	  else
	    ++m.shortTrades;

	  tradeReturns(t.getReturnPct());
	  durations(duration);
	  m.totalCommission += t.getCommission();
	  m.totalDividendIncome += t.getDividendIncome();
	}

      const double n = static_cast<double>(m.totalTrades);
      m.winRate = static_cast<double>(m.winningTrades) / n;

      if (grossLoss > 0.0)
	m.profitFactor = grossProfit / grossLoss;
      else if (grossProfit > 0.0)
	m.profitFactor = metrics_detail::unboundedRatio();

      m.avgTradeReturnPct = boost::accumulators::mean(tradeReturns);
      m.avgWinPct = metrics_detail::meanOf(winningReturns);
      m.avgLossPct = metrics_detail::meanOf(losingReturns);
      m.avgTradeDuration = boost::accumulators::sum(durations) / n;

      if (boost::accumulators::count(winDurations) > 0)
	m.avgWinDuration = boost::accumulators::mean(winDurations);
      if (boost::accumulators::count(lossDurations) > 0)
	m.avgLossDuration = boost::accumulators::mean(lossDurations);

      computeStreaks(trades, m);

      for (const auto& point : equityCurve)
	m.maxDrawdownPct = std::max(m.maxDrawdownPct, point.drawdownPct);
      m.maxDrawdownDuration = metrics_detail::maxDrawdownDuration(equityCurve);

      const double years = static_cast<double>(equityCurve.size()) / barsPerYear;
      if (years > 0.0)
	m.annualizedReturnPct = (std::pow(finalEquity / initialCapital, 1.0 / years) - 1.0) * 100.0;

      const std::vector<double> returns = metrics_detail::periodicReturns(equityCurve);
      m.sharpeRatio = metrics_detail::sharpeRatio(returns, riskFreeRate, barsPerYear);
      m.sortinoRatio = metrics_detail::sortinoRatio(returns, riskFreeRate, barsPerYear);

      if (m.maxDrawdownPct > 0.0)
	m.calmarRatio = m.annualizedReturnPct / (m.maxDrawdownPct * 100.0);
      else if (m.annualizedReturnPct > 0.0)
	m.calmarRatio = metrics_detail::unboundedRatio();

      if (equityCurve.size() >= 2)
	{
	  const long long span = toEpochSeconds(equityCurve.back().timestamp) -
	    toEpochSeconds(equityCurve.front().timestamp);
	  if (span > 0)
	    m.timeInMarketPct = std::min(1.0, boost::accumulators::sum(durations) /
					 static_cast<double>(span));
	}

      for (std::size_t i = 1; i < trades.size(); ++i)
	{
	  const long long gap = toEpochSeconds(trades[i].getEntryTimestamp()) -
	    toEpochSeconds(trades[i - 1].getExitTimestamp());
	  m.maxIdlePeriod = std::max(m.maxIdlePeriod, gap);
	}

      return m;
    }

  private:
    // A break-even trade ends both the winning and the losing streak.
    static void computeStreaks(const std::vector<Trade>& trades, PerformanceMetrics& m)
    {
      std::size_t wins = 0, losses = 0;
      for (const auto& t : trades)
	{
	  if (t.isProfitable())
	    {
	      ++wins;
	      losses = 0;
	      m.maxConsecutiveWins = std::max(m.maxConsecutiveWins, wins);
	    }
	  else if (t.isLoss())
	    {
	      ++losses;
	      wins = 0;
	      m.maxConsecutiveLosses = std::max(m.maxConsecutiveLosses, losses);
	    }
	  else
	    {
	      wins = 0;
	      losses = 0;
	    }
	}
    }
  };
}

#endif
