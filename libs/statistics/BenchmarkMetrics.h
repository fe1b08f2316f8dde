// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BENCHMARK_METRICS_H
#define __BENCHMARK_METRICS_H 1

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <vector>
#include "Candle.h"
#include "PerformanceMetrics.h"

namespace mkc_backtest
{
  namespace metrics_detail
  {
    inline double seriesReturnPct(const CandleSeries& candles)
    {
      if (candles.size() < 2 || candles.front().getClose() <= 0.0)
	return 0.0;

      return (candles.back().getClose() / candles.front().getClose() - 1.0) * 100.0;
    }

    /**
     * @brief Strategy and benchmark returns over the timestamps both series
     * share. Each return runs from the previous shared timestamp, so a date
     * missing from either side is skipped rather than shifting the pairing.
     */
    inline void alignedReturns(const EquityCurve& equityCurve,
			       const CandleSeries& benchmarkCandles,
			       std::vector<double>& strategyReturns,
			       std::vector<double>& benchReturns)
    {
      std::map<ptime, double> benchCloses;
      for (const auto& candle : benchmarkCandles)
	benchCloses[candle.getTimestamp()] = candle.getClose();

      bool havePrevious = false;
      double prevEquity = 0.0;
      double prevClose = 0.0;
      for (const auto& point : equityCurve)
	{
	  const auto it = benchCloses.find(point.timestamp);
	  if (it == benchCloses.end())
	    continue;

	  if (havePrevious)
	    {
	      strategyReturns.push_back(prevEquity > 0.0 ? (point.equity - prevEquity) / prevEquity : 0.0);
	      benchReturns.push_back(prevClose > 0.0 ? (it->second - prevClose) / prevClose : 0.0);
	    }
	  havePrevious = true;
	  prevEquity = point.equity;
	  prevClose = it->second;
	}
    }

    // (1 + total)^(barsPerYear / bars) - 1, in percent.
    inline double annualizePct(double totalReturnPct, std::size_t bars, double barsPerYear)
    {
      if (bars == 0 || totalReturnPct <= -100.0)
	return 0.0;

      return (std::pow(1.0 + totalReturnPct / 100.0,
		       barsPerYear / static_cast<double>(bars)) - 1.0) * 100.0;
    }
  }

  /**
   * @struct BenchmarkMetrics
   * @brief Strategy performance relative to a benchmark instrument.
   *
   * Strategy returns (from the equity curve) and benchmark close returns
   * are paired on the timestamps both series share; see alignedReturns().
   *   beta              = cov(s, b) / var(b), sample estimators
   *   alpha             = annualized strategy % - (rf% + beta * (annualized benchmark % - rf%))
   *   informationRatio  = mean(s - b) / std(s - b) * sqrt(barsPerYear)
   */
  struct BenchmarkMetrics
  {
    std::string symbol;
    double benchmarkReturnPct = 0.0;
    double buyAndHoldReturnPct = 0.0;
    double alpha = 0.0;
    double beta = 0.0;
    double informationRatio = 0.0;

    static BenchmarkMetrics calculate(const std::string& benchmarkSymbol,
				      const EquityCurve& equityCurve,
				      const CandleSeries& candles,
				      const CandleSeries& benchmarkCandles,
				      double riskFreeRate,
				      double barsPerYear)
    {
      BenchmarkMetrics b;
      b.symbol = benchmarkSymbol;
      b.benchmarkReturnPct = metrics_detail::seriesReturnPct(benchmarkCandles);
      b.buyAndHoldReturnPct = metrics_detail::seriesReturnPct(candles);

      std::vector<double> strategyReturns;
      std::vector<double> benchReturns;
      metrics_detail::alignedReturns(equityCurve, benchmarkCandles, strategyReturns, benchReturns);
      const std::size_t n = strategyReturns.size();
      if (n < 2)
	return b;

      const double meanS = metrics_detail::meanOf(strategyReturns);
      const double meanB = metrics_detail::meanOf(benchReturns);

      double covariance = 0.0;
      double benchVariance = 0.0;
      std::vector<double> active;
      active.reserve(n);
      for (std::size_t i = 0; i < n; ++i)
	{
	  covariance += (strategyReturns[i] - meanS) * (benchReturns[i] - meanB);
	  benchVariance += (benchReturns[i] - meanB) * (benchReturns[i] - meanB);
	  active.push_back(strategyReturns[i] - benchReturns[i]);
	}

      if (benchVariance > 0.0)
	b.beta = covariance / benchVariance;

      double strategyTotalPct = 0.0;
      if (!equityCurve.empty() && equityCurve.front().equity > 0.0)
	strategyTotalPct = (equityCurve.back().equity / equityCurve.front().equity - 1.0) * 100.0;

      const double strategyAnnual = metrics_detail::annualizePct(strategyTotalPct,
								 equityCurve.size(), barsPerYear);
      const double benchAnnual = metrics_detail::annualizePct(b.benchmarkReturnPct,
							      benchmarkCandles.size(), barsPerYear);
      const double rfPct = riskFreeRate * 100.0;
      b.alpha = strategyAnnual - (rfPct + b.beta * (benchAnnual - rfPct));

      const double meanActive = metrics_detail::meanOf(active);
      const double trackingError = metrics_detail::sampleStdDev(active, meanActive);
      if (trackingError > 0.0)
	b.informationRatio = meanActive / trackingError * std::sqrt(barsPerYear);

      return b;
    }
  };
}

#endif
