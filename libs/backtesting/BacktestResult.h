// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_RESULT_H
#define __BACKTEST_RESULT_H 1

#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>
#include "BacktestConfig.h"
#include "BenchmarkMetrics.h"
#include "EquityPoint.h"
#include "PerformanceMetrics.h"
#include "Position.h"
#include "Signal.h"

namespace mkc_backtest
{
  /**
   * @struct BacktestResult
   * @brief Everything produced by a single BacktestEngine run.
   *
   * equityCurve has exactly one point per input candle. openPosition is
   * set when the run ended in the market and closeAtEnd was off.
   */
  struct BacktestResult
  {
    std::string symbol;
    std::string strategyName;
    BacktestConfig config;
    ptime startTimestamp;
    ptime endTimestamp;
    double initialCapital = 0.0;
    double finalEquity = 0.0;
    PerformanceMetrics metrics;
    std::vector<Trade> trades;
    EquityCurve equityCurve;
    std::vector<SignalRecord> signals;
    std::optional<Position> openPosition;
    std::optional<BenchmarkMetrics> benchmark;
    std::vector<std::string> diagnostics;

    bool isProfitable() const
    {
      return finalEquity > initialCapital;
    }

    double getTotalPnl() const
    {
      return finalEquity - initialCapital;
    }

    std::size_t getNumBars() const
    {
      return equityCurve.size();
    }

    std::string summary() const
    {
      std::ostringstream os;
      os << std::fixed << std::setprecision(2);
      os << "Backtest: " << strategyName << " on " << symbol << "\n"
	 << "Period: " << equityCurve.size() << " bars\n"
	 << "Initial: $" << initialCapital << " -> Final: $" << finalEquity << "\n"
	 << "Return: " << metrics.totalReturnPct << "%"
	 << " | Sharpe: " << metrics.sharpeRatio
	 << " | Max DD: " << metrics.maxDrawdownPercentage() << "%\n"
	 << "Trades: " << metrics.totalTrades
	 << " | Win Rate: " << std::setprecision(1) << metrics.winRate * 100.0 << "%"
	 << " | Profit Factor: " << std::setprecision(2) << metrics.profitFactor;
      return os.str();
    }
  };

  inline std::ostream& operator<<(std::ostream& os, const BacktestResult& result)
  {
    os << result.summary();
    for (const auto& line : result.diagnostics)
      os << "\nNote: " << line;
    return os;
  }
}

#endif
