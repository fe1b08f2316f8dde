// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TRADE_EXECUTOR_H
#define __TRADE_EXECUTOR_H 1

#include <algorithm>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "BacktestConfig.h"
#include "Candle.h"
#include "EquityPoint.h"
#include "Position.h"
#include "Signal.h"

namespace mkc_backtest
{
  /**
   * @struct SymbolBook
   * @brief Everything one instrument accumulates during a run: the open
   * position, its trailing extreme, and the trade, signal and equity history.
   *
   * Cash is kept outside the book so that several books can draw on one pool.
   */
  struct SymbolBook
  {
    explicit SymbolBook(double startingEquity = 0.0)
      : position(),
	trailingExtreme(0.0),
	trades(),
	signals(),
	equityCurve(),
	peakEquity(startingEquity),
	realizedPnl(0.0),
	nextDividend(0),
	rejectedByStrength(0),
	rejectedShorts(0),
	rejectedByCapacity(0)
    {}

    std::optional<Position> position;
    double trailingExtreme;   // best close since entry, 0 when flat
    std::vector<Trade> trades;
    std::vector<SignalRecord> signals;
    EquityCurve equityCurve;
    double peakEquity;
    double realizedPnl;
    std::size_t nextDividend;
    std::size_t rejectedByStrength;
    std::size_t rejectedShorts;
    std::size_t rejectedByCapacity;
  };

  /**
   * @class TradeExecutor
   * @brief Fills, forced exits, dividends and equity bookkeeping under one
   * BacktestConfig. Shared by the single-symbol and the portfolio engine.
   */
  class TradeExecutor
  {
  public:
    explicit TradeExecutor(const BacktestConfig& config)
      : mConfig(config)
    {}

    const BacktestConfig& getConfig() const
    {
      return mConfig;
    }

    /**
     * @brief Credit every dividend ex-dated on or before @p candle.
     *
     * @p dividends must be sorted by timestamp. Dividends passed while flat
     * are consumed without effect. A long receives the dividend; a short pays it.
     */
    void creditDividends(SymbolBook& book,
			 const std::vector<Dividend>& dividends,
			 const Candle& candle) const
    {
      while (book.nextDividend < dividends.size() &&
	     dividends[book.nextDividend].timestamp <= candle.getTimestamp())
	{
	  if (book.position)
	    {
	      Position& position = *book.position;
	      const double amount = dividends[book.nextDividend].amount;
	      const double perShare = position.isLong() ? amount : -amount;
	      position.creditDividend(perShare * position.getQuantity(), candle.getClose(),
				      mConfig.getReinvestDividends());
	    }
	  ++book.nextDividend;
	}
    }

    void updateTrailingExtreme(SymbolBook& book, const Candle& candle) const
    {
      if (!book.position)
	return;

      if (book.position->isLong())
	book.trailingExtreme = std::max(book.trailingExtreme, candle.getClose());
      else
	book.trailingExtreme = std::min(book.trailingExtreme, candle.getClose());
    }

    /**
     * @brief Reason for a configured stop-loss, take-profit or trailing stop
     * exit at this bar's close, if one is due.
     */
    std::optional<std::string> checkForcedExit(const SymbolBook& book, const Candle& candle) const
    {
      if (!book.position)
	return std::nullopt;

      const Position& position = *book.position;
      const double close = candle.getClose();
      const double returnPct = position.unrealizedReturnPct(close);

      if (mConfig.getStopLossPct() && returnPct <= -*mConfig.getStopLossPct() * 100.0)
	return formatReason("Stop-loss triggered", returnPct);

      if (mConfig.getTakeProfitPct() && returnPct >= *mConfig.getTakeProfitPct() * 100.0)
	return formatReason("Take-profit triggered", returnPct);

      if (mConfig.getTrailingStopPct() && book.trailingExtreme > 0.0)
	{
	  const double trail = *mConfig.getTrailingStopPct();
	  const double extreme = book.trailingExtreme;
	  if (position.isLong() && close <= extreme * (1.0 - trail))
	    return formatReason("Trailing stop triggered", (close - extreme) / extreme * 100.0);

	  if (position.isShort() && close >= extreme * (1.0 + trail))
	    return formatReason("Trailing stop triggered", (extreme - close) / extreme * 100.0);
	}

      return std::nullopt;
    }

    /**
     * @brief Close the position when a forced exit is due, recording an
     * executed Exit signal. Returns true when the position was closed.
     */
    bool applyForcedExit(SymbolBook& book, double& cash, const Candle& candle) const
    {
      const std::optional<std::string> reason = checkForcedExit(book, candle);
      if (!reason)
	return false;

      const Signal exitSignal = Signal::exitSignal(candle.getTimestamp(), candle.getClose())
	.withReason(*reason);
      book.signals.push_back(SignalRecord::fromSignal(exitSignal, true));
      return closePosition(book, cash, candle, exitSignal);
    }

    double entryPrice(const Candle& candle, PositionSide side) const
    {
      return mConfig.applyEntrySlippage(candle.getClose(), side == PositionSide::LONG);
    }

    /**
     * @brief Open @p quantity units at this bar's close plus slippage.
     *
     * Fails, leaving the book and cash untouched, when the quantity is not
     * positive or the fill and its commission exceed @p cash.
     */
    bool openPosition(SymbolBook& book,
		      double& cash,
		      double quantity,
		      const Candle& candle,
		      const Signal& signal,
		      PositionSide side) const
    {
      if (book.position || !(quantity > 0.0))
	return false;

      const double price = entryPrice(candle, side);
      const double entryValue = price * quantity;
      const double commission = mConfig.calculateCommission(entryValue);
      if (entryValue + commission > cash)
	return false;

      cash -= entryValue + commission;
      book.position.emplace(side, candle.getTimestamp(), price, quantity, commission, signal);
      book.trailingExtreme = price;
      return true;
    }

    bool closePosition(SymbolBook& book, double& cash, const Candle& candle, const Signal& signal) const
    {
      if (!book.position)
	return false;

      const Position& position = *book.position;
      const double exitPrice = mConfig.applyExitSlippage(candle.getClose(), position.isLong());
      const double exitCommission = mConfig.calculateCommission(exitPrice * position.getQuantity());
      Trade trade = position.close(candle.getTimestamp(), exitPrice, exitCommission, signal);

      cash += trade.getEntryValue() + trade.getPnl();
      book.realizedPnl += trade.getPnl();
      book.trades.push_back(std::move(trade));
      book.position.reset();
      book.trailingExtreme = 0.0;
      return true;
    }

    /**
     * @brief Close an open position at @p candle with reason "End of backtest".
     */
    void closeAtEnd(SymbolBook& book, double& cash, const Candle& candle) const
    {
      if (!book.position)
	return;

      const Signal exitSignal = Signal::exitSignal(candle.getTimestamp(), candle.getClose())
	.withReason("End of backtest");
      closePosition(book, cash, candle, exitSignal);
    }

    static double positionValue(const SymbolBook& book, double close)
    {
      return book.position ? book.position->marketValue(close) : 0.0;
    }

    /**
     * @brief Append an EquityPoint, drawdown measured from the running peak.
     */
    static void recordEquity(SymbolBook& book, const ptime& timestamp, double equity)
    {
      book.peakEquity = std::max(book.peakEquity, equity);
      const double drawdown = book.peakEquity > 0.0 ?
	(book.peakEquity - equity) / book.peakEquity : 0.0;
      book.equityCurve.push_back(EquityPoint{timestamp, equity, std::max(0.0, drawdown)});
    }

    static std::size_t executedCount(const SymbolBook& book)
    {
      return static_cast<std::size_t>(
	std::count_if(book.signals.begin(), book.signals.end(),
		      [](const SignalRecord& r) { return r.executed; }));
    }

    std::vector<std::string> diagnostics(const SymbolBook& book) const
    {
      std::vector<std::string> notes;
      const std::size_t totalSignals = book.signals.size();
      if (totalSignals == 0)
	{
	  notes.push_back("Strategy generated no signals; check the entry conditions and warmup period");
	  return notes;
	}

      if (executedCount(book) == 0)
	notes.push_back("No signals were executed (" + std::to_string(totalSignals) + " generated)");

      if (book.rejectedByStrength > 0)
	{
	  std::ostringstream os;
	  os << book.rejectedByStrength << " signal(s) below min_signal_strength "
	     << mConfig.getMinSignalStrength() << " were not executed";
	  notes.push_back(os.str());
	}

      if (book.rejectedShorts > 0)
	notes.push_back(std::to_string(book.rejectedShorts) +
			" short signal(s) ignored because allow_short is disabled");

      if (book.rejectedByCapacity > 0)
	notes.push_back(std::to_string(book.rejectedByCapacity) +
			" entry signal(s) rejected because max_positions was reached");

      return notes;
    }

  private:
    static std::string formatReason(const char *prefix, double pct)
    {
      char buf[96];
      std::snprintf(buf, sizeof(buf), "%s (%.1f%%)", prefix, pct);
      return std::string(buf);
    }

    BacktestConfig mConfig;
  };
}

#endif
