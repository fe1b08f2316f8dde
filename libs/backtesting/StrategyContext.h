// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATEGY_CONTEXT_H
#define __STRATEGY_CONTEXT_H 1

#include <optional>
#include <string>
#include "Candle.h"
#include "IndicatorSpec.h"
#include "Position.h"
#include "Signal.h"
#include "BacktestException.h"

namespace mkc_backtest
{
  /**
   * @class StrategyContext
   * @brief Read-only snapshot of the simulation handed to a strategy at one bar.
   *
   * Only candles [0, index] are visible. The context borrows the engine's
   * candle series, indicator map and position; it must not outlive the
   * onCandle() call it was built for.
   */
  class StrategyContext
  {
  public:
    StrategyContext(const CandleSeries& candles,
		    std::size_t index,
		    const Position *position,
		    double equity,
		    const IndicatorMap& indicators)
      : mCandles(candles),
	mIndex(index),
	mPosition(position),
	mEquity(equity),
	mIndicators(indicators)
    {
      if (index >= candles.size())
	throw BacktestException("StrategyContext: index " + std::to_string(index) +
				" is outside the candle series");
    }

    std::size_t getIndex() const
    {
      return mIndex;
    }

    double getEquity() const
    {
      return mEquity;
    }

    const Position *getPosition() const
    {
      return mPosition;
    }

    const CandleSeries& getCandles() const
    {
      return mCandles;
    }

    const Candle& getCurrentCandle() const
    {
      return mCandles[mIndex];
    }

    const Candle *getPreviousCandle() const
    {
      return mIndex > 0 ? &mCandles[mIndex - 1] : nullptr;
    }

    // Candle at an absolute index, nullptr past the current bar.
    const Candle *getCandleAt(std::size_t index) const
    {
      return index <= mIndex ? &mCandles[index] : nullptr;
    }

    std::optional<double> getIndicator(const std::string& name) const
    {
      return getIndicatorAt(name, mIndex);
    }

    std::optional<double> getIndicatorAt(const std::string& name, std::size_t index) const
    {
      if (index > mIndex)
	return std::nullopt;

      auto it = mIndicators.find(name);
      if (it == mIndicators.end() || index >= it->second.size())
	return std::nullopt;

      return it->second[index];
    }

    std::optional<double> getIndicatorPrev(const std::string& name) const
    {
      if (mIndex == 0)
	return std::nullopt;

      return getIndicatorAt(name, mIndex - 1);
    }

    bool hasPosition() const
    {
      return mPosition != nullptr;
    }

    bool isLong() const
    {
      return mPosition && mPosition->isLong();
    }

    bool isShort() const
    {
      return mPosition && mPosition->isShort();
    }

    double getOpen() const
    {
      return getCurrentCandle().getOpen();
    }

    double getHigh() const
    {
      return getCurrentCandle().getHigh();
    }

    double getLow() const
    {
      return getCurrentCandle().getLow();
    }

    double getClose() const
    {
      return getCurrentCandle().getClose();
    }

    double getVolume() const
    {
      return getCurrentCandle().getVolume();
    }

    const ptime& getTimestamp() const
    {
      return getCurrentCandle().getTimestamp();
    }

    Signal signalLong() const
    {
      return Signal::longSignal(getTimestamp(), getClose());
    }

    Signal signalShort() const
    {
      return Signal::shortSignal(getTimestamp(), getClose());
    }

    Signal signalExit() const
    {
      return Signal::exitSignal(getTimestamp(), getClose());
    }

    Signal signalHold() const
    {
      return Signal::holdSignal(getTimestamp(), getClose());
    }

    /**
     * @brief True when @p fast moved from strictly below @p slow to strictly above it on this bar.
     */
    bool crossedAbove(const std::string& fast, const std::string& slow) const
    {
      auto f = getIndicator(fast), s = getIndicator(slow);
      auto fp = getIndicatorPrev(fast), sp = getIndicatorPrev(slow);
      if (!f || !s || !fp || !sp)
	return false;

      return *fp < *sp && *f > *s;
    }

    bool crossedBelow(const std::string& fast, const std::string& slow) const
    {
      auto f = getIndicator(fast), s = getIndicator(slow);
      auto fp = getIndicatorPrev(fast), sp = getIndicatorPrev(slow);
      if (!f || !s || !fp || !sp)
	return false;

      return *fp > *sp && *f < *s;
    }

    // Previous value <= threshold and current value > threshold.
    bool indicatorCrossedAbove(const std::string& name, double threshold) const
    {
      auto current = getIndicator(name), previous = getIndicatorPrev(name);
      if (!current || !previous)
	return false;

      return *previous <= threshold && *current > threshold;
    }

    // Previous value >= threshold and current value < threshold.
    bool indicatorCrossedBelow(const std::string& name, double threshold) const
    {
      auto current = getIndicator(name), previous = getIndicatorPrev(name);
      if (!current || !previous)
	return false;

      return *previous >= threshold && *current < threshold;
    }

  private:
    const CandleSeries& mCandles;
    std::size_t mIndex;
    const Position *mPosition;
    double mEquity;
    const IndicatorMap& mIndicators;
  };
}

#endif
