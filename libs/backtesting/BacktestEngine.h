// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_ENGINE_H
#define __BACKTEST_ENGINE_H 1

#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include "BacktestConfig.h"
#include "BacktestException.h"
#include "BacktestResult.h"
#include "BacktestStrategy.h"
#include "BenchmarkMetrics.h"
#include "Candle.h"
#include "IndicatorProvider.h"
#include "PerformanceMetrics.h"
#include "Position.h"
#include "Signal.h"
#include "StrategyContext.h"
#include "TradeExecutor.h"

namespace mkc_backtest
{
  /**
   * @class BacktestEngine
   * @brief Runs one strategy over one candle series.
   *
   * The engine is stateless between runs; every run() builds its own
   * simulation state, so one engine may be used from several threads.
   *
   * Per bar, in order:
   *   1. dividends ex-dated on or before the bar are credited to the open position
   *   2. the trailing extreme (best close since entry) is updated
   *   3. configured stop-loss, take-profit and trailing stop force an exit;
   *      the strategy is not consulted on that bar
   *   4. from bar warmup - 1 on, the strategy's signal is executed
   *   5. one EquityPoint is appended with the position marked at the close
   */
  class BacktestEngine
  {
  public:
    explicit BacktestEngine(const BacktestConfig& config,
			    std::shared_ptr<IndicatorProvider> provider = makeDefaultIndicatorProvider())
      : mConfig(config),
	mProvider(std::move(provider)),
	mExecutor(config)
    {
      mConfig.validate();
      if (!mProvider)
	throw InvalidParameterException("provider", "indicator provider must not be null");
    }

    const BacktestConfig& getConfig() const
    {
      return mConfig;
    }

    BacktestResult run(const std::string& symbol,
		       const CandleSeries& candles,
		       const BacktestStrategy& strategy) const
    {
      return run(symbol, candles, strategy, std::vector<Dividend>());
    }

    BacktestResult run(const std::string& symbol,
		       const CandleSeries& candles,
		       const BacktestStrategy& strategy,
		       const std::vector<Dividend>& dividends) const
    {
      const std::size_t warmup = std::max<std::size_t>(strategy.getWarmupPeriod(), 1);
      if (candles.empty() || candles.size() < warmup)
	throw InsufficientDataException(warmup, candles.size());

      const IndicatorMap indicators = mProvider->compute(candles, strategy.getRequiredIndicators());

      std::vector<Dividend> sortedDividends(dividends);
      std::stable_sort(sortedDividends.begin(), sortedDividends.end(),
		       [](const Dividend& a, const Dividend& b) {
			 return a.timestamp < b.timestamp;
		       });

      double cash = mConfig.getInitialCapital();
      SymbolBook book(cash);

      for (std::size_t i = 0; i < candles.size(); ++i)
	{
	  const Candle& candle = candles[i];

	  mExecutor.creditDividends(book, sortedDividends, candle);
	  mExecutor.updateTrailingExtreme(book, candle);
	  const bool forcedExit = mExecutor.applyForcedExit(book, cash, candle);

	  if (!forcedExit && i + 1 >= warmup)
	    {
	      const double equity = cash + TradeExecutor::positionValue(book, candle.getClose());
	      StrategyContext context(candles, i, book.position ? &*book.position : nullptr,
				      equity, indicators);
	      const Signal signal = strategy.onCandle(context);
	      if (!signal.isHold())
		processSignal(book, cash, candle, signal);
	    }

	  TradeExecutor::recordEquity(book, candle.getTimestamp(),
				      cash + TradeExecutor::positionValue(book, candle.getClose()));
	}

      const Candle& last = candles.back();
      if (mConfig.getCloseAtEnd())
	mExecutor.closeAtEnd(book, cash, last);

      const std::size_t executed = TradeExecutor::executedCount(book);

      BacktestResult result;
      result.symbol = symbol;
      result.strategyName = strategy.getName();
      result.config = mConfig;
      result.startTimestamp = candles.front().getTimestamp();
      result.endTimestamp = last.getTimestamp();
      result.initialCapital = mConfig.getInitialCapital();
      result.finalEquity = cash + TradeExecutor::positionValue(book, last.getClose());
      result.metrics = PerformanceMetrics::calculate(book.trades,
						     book.equityCurve,
						     mConfig.getInitialCapital(),
						     book.signals.size(),
						     executed,
						     mConfig.getRiskFreeRate(),
						     mConfig.getBarsPerYear());
      result.diagnostics = mExecutor.diagnostics(book);
      result.trades = std::move(book.trades);
      result.equityCurve = std::move(book.equityCurve);
      result.signals = std::move(book.signals);
      result.openPosition = book.position;
      return result;
    }

    /**
     * @brief run() plus BenchmarkMetrics against a second candle series.
     */
    BacktestResult runWithBenchmark(const std::string& symbol,
				    const CandleSeries& candles,
				    const BacktestStrategy& strategy,
				    const std::string& benchmarkSymbol,
				    const CandleSeries& benchmarkCandles,
				    const std::vector<Dividend>& dividends = std::vector<Dividend>()) const
    {
      BacktestResult result = run(symbol, candles, strategy, dividends);
      result.benchmark = BenchmarkMetrics::calculate(benchmarkSymbol,
						     result.equityCurve,
						     candles,
						     benchmarkCandles,
						     mConfig.getRiskFreeRate(),
						     mConfig.getBarsPerYear());
      return result;
    }

  private:
    void processSignal(SymbolBook& book, double& cash, const Candle& candle, const Signal& signal) const
    {
      if (signal.getStrength().getValue() < mConfig.getMinSignalStrength())
	{
	  ++book.rejectedByStrength;
	  book.signals.push_back(SignalRecord::fromSignal(signal, false));
	  return;
	}

      bool executed = false;
      switch (signal.getDirection())
	{
	case SignalDirection::LONG:
	  if (!book.position)
	    executed = openPosition(book, cash, candle, signal, PositionSide::LONG);
	  else if (book.position->isShort())
	    executed = mExecutor.closePosition(book, cash, candle, signal);
	  break;

	case SignalDirection::SHORT:
	  if (!book.position)
	    {
	      if (mConfig.getAllowShort())
		executed = openPosition(book, cash, candle, signal, PositionSide::SHORT);
	      else
		++book.rejectedShorts;
	    }
	  else if (book.position->isLong())
	    executed = mExecutor.closePosition(book, cash, candle, signal);
	  break;

	case SignalDirection::EXIT:
	  if (book.position)
	    executed = mExecutor.closePosition(book, cash, candle, signal);
	  break;

	case SignalDirection::HOLD:
	  break;
	}

      book.signals.push_back(SignalRecord::fromSignal(signal, executed));
    }

    // Sized from position_size_pct of the cash on hand.
    bool openPosition(SymbolBook& book,
		      double& cash,
		      const Candle& candle,
		      const Signal& signal,
		      PositionSide side) const
    {
      const double quantity = mConfig.calculatePositionSize(cash, mExecutor.entryPrice(candle, side));
      return mExecutor.openPosition(book, cash, quantity, candle, signal, side);
    }

  private:
    BacktestConfig mConfig;
    std::shared_ptr<IndicatorProvider> mProvider;
    TradeExecutor mExecutor;
  };
}

#endif
