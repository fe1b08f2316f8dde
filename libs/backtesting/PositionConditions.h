// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __POSITION_CONDITIONS_H
#define __POSITION_CONDITIONS_H 1

#include <algorithm>
#include <cstdio>
#include <limits>
#include <string>
#include "Condition.h"

namespace mkc_backtest
{
  namespace detail
  {
    inline std::string formatPercent(const char *prefix, double fraction)
    {
      char buf[64];
      std::snprintf(buf, sizeof(buf), "%s %.1f%%", prefix, fraction * 100.0);
      return std::string(buf);
    }

    // Index of the first visible candle at or after the position's entry time.
    inline std::size_t entryIndex(const StrategyContext& context, const Position& position)
    {
      const CandleSeries& candles = context.getCandles();
      for (std::size_t i = 0; i <= context.getIndex(); ++i)
	{
	  if (candles[i].getTimestamp() >= position.getEntryTimestamp())
	    return i;
	}
      return 0;
    }
  }

  /**
   * @brief Unrealized return (net of entry commission) at or below -pct.
   *
   * pct is a fraction: 0.05 fires at a 5% loss.
   */
  class StopLossCondition : public Condition
  {
  public:
    explicit StopLossCondition(double pct)
      : mPct(pct)
    {}

    bool evaluate(const StrategyContext& context) const override
    {
      const Position *position = context.getPosition();
      if (!position)
	return false;

      return position->unrealizedReturnPct(context.getClose()) <= -mPct * 100.0;
    }

    std::string getDescription() const override
    {
      return detail::formatPercent("stop loss at", mPct);
    }

  private:
    double mPct;
  };

  class TakeProfitCondition : public Condition
  {
  public:
    explicit TakeProfitCondition(double pct)
      : mPct(pct)
    {}

    bool evaluate(const StrategyContext& context) const override
    {
      const Position *position = context.getPosition();
      if (!position)
	return false;

      return position->unrealizedReturnPct(context.getClose()) >= mPct * 100.0;
    }

    std::string getDescription() const override
    {
      return detail::formatPercent("take profit at", mPct);
    }

  private:
    double mPct;
  };

  class HasPositionCondition : public Condition
  {
  public:
    bool evaluate(const StrategyContext& context) const override
    {
      return context.hasPosition();
    }

    std::string getDescription() const override
    {
      return "has position";
    }
  };

  class NoPositionCondition : public Condition
  {
  public:
    bool evaluate(const StrategyContext& context) const override
    {
      return !context.hasPosition();
    }

    std::string getDescription() const override
    {
      return "no position";
    }
  };

  class IsLongCondition : public Condition
  {
  public:
    bool evaluate(const StrategyContext& context) const override
    {
      return context.isLong();
    }

    std::string getDescription() const override
    {
      return "is long";
    }
  };

  class IsShortCondition : public Condition
  {
  public:
    bool evaluate(const StrategyContext& context) const override
    {
      return context.isShort();
    }

    std::string getDescription() const override
    {
      return "is short";
    }
  };

  class InProfitCondition : public Condition
  {
  public:
    bool evaluate(const StrategyContext& context) const override
    {
      const Position *position = context.getPosition();
      return position && position->unrealizedReturnPct(context.getClose()) > 0.0;
    }

    std::string getDescription() const override
    {
      return "in profit";
    }
  };

  class InLossCondition : public Condition
  {
  public:
    bool evaluate(const StrategyContext& context) const override
    {
      const Position *position = context.getPosition();
      return position && position->unrealizedReturnPct(context.getClose()) < 0.0;
    }

    std::string getDescription() const override
    {
      return "in loss";
    }
  };

  class HeldForBarsCondition : public Condition
  {
  public:
    explicit HeldForBarsCondition(std::size_t minBars)
      : mMinBars(minBars)
    {}

    bool evaluate(const StrategyContext& context) const override
    {
      const Position *position = context.getPosition();
      if (!position)
	return false;

      const std::size_t entry = detail::entryIndex(context, *position);
      const std::size_t held = context.getIndex() >= entry ? context.getIndex() - entry : 0;
      return held >= mMinBars;
    }

    std::string getDescription() const override
    {
      return "held for " + std::to_string(mMinBars) + " bars";
    }

  private:
    std::size_t mMinBars;
  };

  /**
   * @class TrailingStopCondition
   * @brief Fires when the close retraces trailPct from the best price since entry.
   *
   * Longs track the highest high since the entry bar; shorts track the
   * lowest low. The current bar is included.
   */
  class TrailingStopCondition : public Condition
  {
  public:
    explicit TrailingStopCondition(double trailPct)
      : mTrailPct(trailPct)
    {}

    bool evaluate(const StrategyContext& context) const override
    {
      const Position *position = context.getPosition();
      if (!position)
	return false;

      const CandleSeries& candles = context.getCandles();
      const std::size_t entry = detail::entryIndex(context, *position);
      const double close = context.getClose();

      if (position->isLong())
	{
	  double peak = -std::numeric_limits<double>::infinity();
	  for (std::size_t i = entry; i <= context.getIndex(); ++i)
	    peak = std::max(peak, candles[i].getHigh());

	  return close <= peak * (1.0 - mTrailPct);
	}

      double trough = std::numeric_limits<double>::infinity();
      for (std::size_t i = entry; i <= context.getIndex(); ++i)
	trough = std::min(trough, candles[i].getLow());

      return close >= trough * (1.0 + mTrailPct);
    }

    std::string getDescription() const override
    {
      return detail::formatPercent("trailing stop at", mTrailPct);
    }

  private:
    double mTrailPct;
  };

  /**
   * @class TrailingTakeProfitCondition
   * @brief Locks in gains once a position has been profitable.
   *
   * The peak unrealized return is taken over closes since entry. The
   * condition is armed only after the peak is positive, and fires when the
   * current return is at least trailPct * 100 percentage points below it.
   */
  class TrailingTakeProfitCondition : public Condition
  {
  public:
    explicit TrailingTakeProfitCondition(double trailPct)
      : mTrailPct(trailPct)
    {}

    bool evaluate(const StrategyContext& context) const override
    {
      const Position *position = context.getPosition();
      if (!position)
	return false;

      const CandleSeries& candles = context.getCandles();
      const std::size_t entry = detail::entryIndex(context, *position);

      double peakReturn = -std::numeric_limits<double>::infinity();
      for (std::size_t i = entry; i <= context.getIndex(); ++i)
	peakReturn = std::max(peakReturn, position->unrealizedReturnPct(candles[i].getClose()));

      const double current = position->unrealizedReturnPct(context.getClose());
      return peakReturn > 0.0 && current <= peakReturn - mTrailPct * 100.0;
    }

    std::string getDescription() const override
    {
      return detail::formatPercent("trailing take profit at", mTrailPct);
    }

  private:
    double mTrailPct;
  };

  inline ConditionPtr stopLoss(double pct)
  {
    return std::make_shared<StopLossCondition>(pct);
  }

  inline ConditionPtr takeProfit(double pct)
  {
    return std::make_shared<TakeProfitCondition>(pct);
  }

  inline ConditionPtr hasPosition()
  {
    return std::make_shared<HasPositionCondition>();
  }

  inline ConditionPtr noPosition()
  {
    return std::make_shared<NoPositionCondition>();
  }

  inline ConditionPtr isLong()
  {
    return std::make_shared<IsLongCondition>();
  }

  inline ConditionPtr isShort()
  {
    return std::make_shared<IsShortCondition>();
  }

  inline ConditionPtr inProfit()
  {
    return std::make_shared<InProfitCondition>();
  }

  inline ConditionPtr inLoss()
  {
    return std::make_shared<InLossCondition>();
  }

  inline ConditionPtr heldForBars(std::size_t minBars)
  {
    return std::make_shared<HeldForBarsCondition>(minBars);
  }

  inline ConditionPtr trailingStop(double trailPct)
  {
    return std::make_shared<TrailingStopCondition>(trailPct);
  }

  inline ConditionPtr trailingTakeProfit(double trailPct)
  {
    return std::make_shared<TrailingTakeProfitCondition>(trailPct);
  }
}

#endif
