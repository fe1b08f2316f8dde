// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PORTFOLIO_ENGINE_H
#define __PORTFOLIO_ENGINE_H 1

#include <algorithm>
#include <functional>
#include <iomanip>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "BacktestException.h"
#include "BacktestResult.h"
#include "BacktestStrategy.h"
#include "Candle.h"
#include "EquityPoint.h"
#include "IndicatorProvider.h"
#include "PerformanceMetrics.h"
#include "PortfolioConfig.h"
#include "Signal.h"
#include "StrategyContext.h"
#include "TradeExecutor.h"

namespace mkc_backtest
{
  struct SymbolData
  {
    std::string symbol;
    CandleSeries candles;
    std::vector<Dividend> dividends;
  };

  /**
   * @struct AllocationSnapshot
   * @brief Cash and the marked value of every open position after one
   * timeline step.
   */
  struct AllocationSnapshot
  {
    ptime timestamp;
    double cash = 0.0;
    std::map<std::string, double> positions;

    std::size_t getNumPositions() const
    {
      return positions.size();
    }

    double getTotalValue() const
    {
      double total = cash;
      for (const auto& p : positions)
	total += p.second;
      return total;
    }
  };

  struct PortfolioResult
  {
    std::map<std::string, BacktestResult> symbols;
    EquityCurve equityCurve;
    PerformanceMetrics metrics;
    double initialCapital = 0.0;
    double finalEquity = 0.0;
    std::vector<AllocationSnapshot> allocationHistory;

    double getTotalPnl() const
    {
      return finalEquity - initialCapital;
    }

    std::string summary() const
    {
      std::ostringstream os;
      os << std::fixed << std::setprecision(2);
      os << "Portfolio: " << symbols.size() << " symbols, "
	 << equityCurve.size() << " timestamps\n"
	 << "Initial: $" << initialCapital << " -> Final: $" << finalEquity << "\n"
	 << "Return: " << metrics.totalReturnPct << "%"
	 << " | Sharpe: " << metrics.sharpeRatio
	 << " | Max DD: " << metrics.maxDrawdownPercentage() << "%\n"
	 << "Trades: " << metrics.totalTrades;
      for (const auto& entry : symbols)
	os << "\n  " << entry.first << ": " << entry.second.trades.size() << " trades, P&L $"
	   << entry.second.getTotalPnl();
      return os.str();
    }
  };

  using StrategyFactory = std::function<BacktestStrategyPtr(const std::string& symbol)>;

  /**
   * @class PortfolioEngine
   * @brief Runs one strategy instance per symbol against a shared cash pool.
   *
   * The timeline is the union of every symbol's timestamps. At each
   * timestamp, for the symbols that have a bar there:
   *   1. dividends, trailing extremes and forced exits, as in BacktestEngine
   *   2. strategies are evaluated; exits and reversals close at once and
   *      entries are queued
   *   3. queued entries fill strongest first (ties by symbol) until the
   *      position cap is reached, each sized by the allocation mode
   * Open positions are marked at their symbol's last known close.
   */
  class PortfolioEngine
  {
  public:
    explicit PortfolioEngine(const PortfolioConfig& config,
			     std::shared_ptr<IndicatorProvider> provider = makeDefaultIndicatorProvider())
      : mConfig(config),
	mProvider(std::move(provider)),
	mExecutor(config.getBase())
    {
      mConfig.getBase().validate();
      if (!mProvider)
	throw InvalidParameterException("provider", "indicator provider must not be null");
    }

    const PortfolioConfig& getConfig() const
    {
      return mConfig;
    }

    PortfolioResult run(const std::vector<SymbolData>& symbolData,
			const StrategyFactory& factory) const
    {
      mConfig.validate(symbolData.size());
      if (!factory)
	throw InvalidParameterException("strategy_factory", "must not be empty");

      const BacktestConfig& base = mConfig.getBase();
      const double initialCapital = base.getInitialCapital();
      const std::size_t numSymbols = symbolData.size();

      std::map<std::string, SymbolState> states;
      std::set<ptime> timeline;
      for (const auto& data : symbolData)
	{
	  if (states.count(data.symbol))
	    throw InvalidParameterException(data.symbol, "duplicate symbol");

	  SymbolState state(data, makeStrategy(factory, data.symbol));
	  if (data.candles.empty() || data.candles.size() < state.warmup)
	    throw InsufficientDataException(state.warmup, data.candles.size());

	  state.indicators = mProvider->compute(data.candles, state.strategy->getRequiredIndicators());
	  for (std::size_t i = 0; i < data.candles.size(); ++i)
	    {
	      state.barIndex[data.candles[i].getTimestamp()] = i;
	      timeline.insert(data.candles[i].getTimestamp());
	    }

	  state.initialCapital = mConfig.allocationTarget(data.symbol, initialCapital,
							  initialCapital, numSymbols);
	  if (!(state.initialCapital > 0.0))
	    state.initialCapital = initialCapital / static_cast<double>(numSymbols);
	  state.book.peakEquity = state.initialCapital;

	  states.emplace(data.symbol, std::move(state));
	}

      const std::optional<std::size_t> cap = mConfig.getMaxTotalPositions();
      double cash = initialCapital;
      double peakEquity = initialCapital;

      PortfolioResult result;
      result.initialCapital = initialCapital;

      for (const ptime& timestamp : timeline)
	{
	  std::vector<SymbolState *> active;
	  for (auto& entry : states)
	    {
	      SymbolState& state = entry.second;
	      const auto it = state.barIndex.find(timestamp);
	      state.current = it == state.barIndex.end() ? std::nullopt
		: std::optional<std::size_t>(it->second);
	      if (state.current)
		{
		  state.lastIndex = state.current;
		  active.push_back(&state);
		}
	    }

	  std::set<std::string> forcedOut;
	  for (SymbolState *state : active)
	    {
	      const Candle& candle = state->currentCandle();
	      mExecutor.creditDividends(state->book, state->dividends, candle);
	      mExecutor.updateTrailingExtreme(state->book, candle);
	      if (mExecutor.applyForcedExit(state->book, cash, candle))
		forcedOut.insert(state->symbol);
	    }

	  std::vector<PendingEntry> entries;
	  for (SymbolState *state : active)
	    {
	      if (forcedOut.count(state->symbol) || *state->current + 1 < state->warmup)
		continue;

	      const Candle& candle = state->currentCandle();
	      StrategyContext context(state->data->candles, *state->current,
				      state->book.position ? &*state->book.position : nullptr,
				      cash + markToMarket(states), state->indicators);
	      const Signal signal = state->strategy->onCandle(context);
	      if (!signal.isHold())
		processSignal(*state, cash, candle, signal, entries);
	    }

	  std::stable_sort(entries.begin(), entries.end(),
			   [](const PendingEntry& a, const PendingEntry& b) {
			     const double sa = a.signal.getStrength().getValue();
			     const double sb = b.signal.getStrength().getValue();
			     if (sa != sb)
			       return sa > sb;
			     return a.state->symbol < b.state->symbol;
			   });

	  for (const PendingEntry& entry : entries)
	    {
	      SymbolBook& book = entry.state->book;
	      if (cap && openPositions(states) >= *cap)
		{
		  ++book.rejectedByCapacity;
		  book.signals.push_back(SignalRecord::fromSignal(entry.signal, false));
		  continue;
		}

	      const Candle& candle = entry.state->currentCandle();
	      const double quantity = entryQuantity(entry.state->symbol, cash, numSymbols,
							 candle, entry.side);
	      const bool executed = mExecutor.openPosition(book, cash, quantity, candle,
							   entry.signal, entry.side);
	      book.signals.push_back(SignalRecord::fromSignal(entry.signal, executed));
	    }

	  const double equity = cash + markToMarket(states);
	  peakEquity = std::max(peakEquity, equity);
	  const double drawdown = peakEquity > 0.0 ? (peakEquity - equity) / peakEquity : 0.0;
	  result.equityCurve.push_back(EquityPoint{timestamp, equity, std::max(0.0, drawdown)});

	  for (SymbolState *state : active)
	    TradeExecutor::recordEquity(state->book, timestamp,
					state->equity(state->currentCandle().getClose()));

	  AllocationSnapshot snapshot;
	  snapshot.timestamp = timestamp;
	  snapshot.cash = cash;
	  for (const auto& entry : states)
	    {
	      const SymbolState& state = entry.second;
	      if (state.book.position)
		snapshot.positions[entry.first] =
		  TradeExecutor::positionValue(state.book, state.lastCandle().getClose());
	    }
	  result.allocationHistory.push_back(std::move(snapshot));
	}

      if (base.getCloseAtEnd())
	{
	  for (auto& entry : states)
	    mExecutor.closeAtEnd(entry.second.book, cash, entry.second.data->candles.back());
	}

      result.finalEquity = cash + markToMarket(states);

      std::vector<Trade> allTrades;
      std::size_t totalSignals = 0;
      std::size_t executedSignals = 0;
      for (auto& entry : states)
	{
	  SymbolState& state = entry.second;
	  allTrades.insert(allTrades.end(), state.book.trades.begin(), state.book.trades.end());
	  totalSignals += state.book.signals.size();
	  executedSignals += TradeExecutor::executedCount(state.book);
	  result.symbols.emplace(entry.first, symbolResult(state));
	}

      std::stable_sort(allTrades.begin(), allTrades.end(),
		       [](const Trade& a, const Trade& b) {
			 return a.getExitTimestamp() < b.getExitTimestamp();
		       });

      result.metrics = PerformanceMetrics::calculate(allTrades,
						     result.equityCurve,
						     initialCapital,
						     totalSignals,
						     executedSignals,
						     base.getRiskFreeRate(),
						     base.getBarsPerYear());
      return result;
    }

  private:
    struct SymbolState
    {
      SymbolState(const SymbolData& symbolData, BacktestStrategyPtr strat)
	: symbol(symbolData.symbol),
	  data(&symbolData),
	  strategy(std::move(strat)),
	  warmup(std::max<std::size_t>(strategy->getWarmupPeriod(), 1)),
	  indicators(),
	  dividends(symbolData.dividends),
	  barIndex(),
	  book(),
	  initialCapital(0.0),
	  current(),
	  lastIndex()
      {
	std::stable_sort(dividends.begin(), dividends.end(),
			 [](const Dividend& a, const Dividend& b) {
			   return a.timestamp < b.timestamp;
			 });
      }

      const Candle& currentCandle() const
      {
	return data->candles[*current];
      }

      const Candle& lastCandle() const
      {
	return data->candles[*lastIndex];
      }

      // Allocated capital plus realized and unrealized P&L, dividends included.
      double equity(double close) const
      {
	double value = initialCapital + book.realizedPnl;
	if (book.position)
	  value += book.position->marketValue(close) - book.position->getEntryValue()
	    - book.position->getEntryCommission();
	return value;
      }

      std::string symbol;
      const SymbolData *data;
      BacktestStrategyPtr strategy;
      std::size_t warmup;
      IndicatorMap indicators;
      std::vector<Dividend> dividends;
      std::map<ptime, std::size_t> barIndex;
      SymbolBook book;
      double initialCapital;
      std::optional<std::size_t> current;
      std::optional<std::size_t> lastIndex;
    };

    struct PendingEntry
    {
      SymbolState *state;
      Signal signal;
      PositionSide side;
    };

    static BacktestStrategyPtr makeStrategy(const StrategyFactory& factory, const std::string& symbol)
    {
      BacktestStrategyPtr strategy = factory(symbol);
      if (!strategy)
	throw InvalidParameterException(symbol, "strategy factory returned no strategy");
      return strategy;
    }

    static double markToMarket(const std::map<std::string, SymbolState>& states)
    {
      double value = 0.0;
      for (const auto& entry : states)
	{
	  const SymbolState& state = entry.second;
	  if (state.book.position)
	    value += TradeExecutor::positionValue(state.book, state.lastCandle().getClose());
	}
      return value;
    }

    static std::size_t openPositions(const std::map<std::string, SymbolState>& states)
    {
      return static_cast<std::size_t>(
	std::count_if(states.begin(), states.end(),
		      [](const std::pair<const std::string, SymbolState>& entry) {
			return entry.second.book.position.has_value();
		      }));
    }

    /**
     * @brief Units bought with the allocation target, net of the flat fee
     * and the percentage commission on the fill.
     */
    double entryQuantity(const std::string& symbol,
			 double cash,
			 std::size_t numSymbols,
			 const Candle& candle,
			 PositionSide side) const
    {
      const BacktestConfig& base = mConfig.getBase();
      const double price = mExecutor.entryPrice(candle, side);
      if (!(price > 0.0))
	return 0.0;

      const double target = mConfig.allocationTarget(symbol, cash, base.getInitialCapital(),
						     numSymbols);
      const double effective = std::max(target - base.getCommission(), 0.0);
      return effective / (price * (1.0 + base.getCommissionPct()));
    }

    // Exits and reversals execute immediately; fresh entries are queued.
    void processSignal(SymbolState& state,
		       double& cash,
		       const Candle& candle,
		       const Signal& signal,
		       std::vector<PendingEntry>& entries) const
    {
      SymbolBook& book = state.book;
      const BacktestConfig& base = mConfig.getBase();
      if (signal.getStrength().getValue() < base.getMinSignalStrength())
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
	    {
	      entries.push_back(PendingEntry{&state, signal, PositionSide::LONG});
	      return;
	    }
	  if (book.position->isShort())
	    executed = mExecutor.closePosition(book, cash, candle, signal);
	  break;

	case SignalDirection::SHORT:
	  if (!book.position)
	    {
	      if (base.getAllowShort())
		{
		  entries.push_back(PendingEntry{&state, signal, PositionSide::SHORT});
		  return;
		}
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

    BacktestResult symbolResult(SymbolState& state) const
    {
      const BacktestConfig& base = mConfig.getBase();
      const CandleSeries& candles = state.data->candles;

      BacktestResult result;
      result.symbol = state.symbol;
      result.strategyName = state.strategy->getName();
      result.config = base;
      result.startTimestamp = candles.front().getTimestamp();
      result.endTimestamp = candles.back().getTimestamp();
      result.initialCapital = state.initialCapital;
      result.finalEquity = state.equity(candles.back().getClose());
      result.metrics = PerformanceMetrics::calculate(state.book.trades,
						     state.book.equityCurve,
						     state.initialCapital,
						     state.book.signals.size(),
						     TradeExecutor::executedCount(state.book),
						     base.getRiskFreeRate(),
						     base.getBarsPerYear());
      result.diagnostics = mExecutor.diagnostics(state.book);
      result.trades = state.book.trades;
      result.equityCurve = state.book.equityCurve;
      result.signals = state.book.signals;
      result.openPosition = state.book.position;
      return result;
    }

  private:
    PortfolioConfig mConfig;
    std::shared_ptr<IndicatorProvider> mProvider;
    TradeExecutor mExecutor;
  };
}

#endif
