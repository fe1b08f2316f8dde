// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PREBUILT_STRATEGIES_H
#define __PREBUILT_STRATEGIES_H 1

#include <algorithm>
#include <cstdio>
#include <string>
#include "BacktestStrategy.h"

namespace mkc_backtest
{
  /**
   * @class SmaCrossover
   * @brief Dual simple moving average crossover.
   *
   * Fast crossing above slow goes long (or closes a short); crossing below
   * closes a long (or goes short when shorting is enabled).
   */
  class SmaCrossover : public BacktestStrategy
  {
  public:
    SmaCrossover(std::size_t fastPeriod = 10, std::size_t slowPeriod = 20)
      : BacktestStrategy(),
	mFastPeriod(fastPeriod),
	mSlowPeriod(slowPeriod),
	mAllowShort(false)
    {}

    SmaCrossover& withShort(bool allow)
    {
      mAllowShort = allow;
      return *this;
    }

    std::size_t getFastPeriod() const
    {
      return mFastPeriod;
    }

    std::size_t getSlowPeriod() const
    {
      return mSlowPeriod;
    }

    std::string getName() const override
    {
      return "SMA Crossover";
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      IndicatorRequestList result{IndicatorRequest(fastKey(), IndicatorSpec::sma(mFastPeriod))};
      mergeIndicatorRequests(result, IndicatorRequestList{
	  IndicatorRequest(slowKey(), IndicatorSpec::sma(mSlowPeriod))});
      return result;
    }

    std::size_t getWarmupPeriod() const override
    {
      return std::max(mFastPeriod, mSlowPeriod) + 1;
    }

    Signal onCandle(const StrategyContext& context) const override
    {
      if (context.crossedAbove(fastKey(), slowKey()))
	{
	  if (context.isShort())
	    return context.signalExit().withReason("SMA bullish crossover - close short");
	  if (!context.hasPosition())
	    return context.signalLong().withReason("SMA bullish crossover");
	}

      if (context.crossedBelow(fastKey(), slowKey()))
	{
	  if (context.isLong())
	    return context.signalExit().withReason("SMA bearish crossover - close long");
	  if (!context.hasPosition() && mAllowShort)
	    return context.signalShort().withReason("SMA bearish crossover");
	}

      return context.signalHold();
    }

  private:
    std::string fastKey() const
    {
      return "sma_" + std::to_string(mFastPeriod);
    }

    std::string slowKey() const
    {
      return "sma_" + std::to_string(mSlowPeriod);
    }

  private:
    std::size_t mFastPeriod;
    std::size_t mSlowPeriod;
    bool mAllowShort;
  };

  /**
   * @class RsiReversal
   * @brief RSI mean reversion on oversold / overbought crossings.
   *
   * Strength reflects how extreme the RSI is: outside [20, 80] strong,
   * outside [25, 75] medium, otherwise weak.
   */
  class RsiReversal : public BacktestStrategy
  {
  public:
    explicit RsiReversal(std::size_t period = 14)
      : BacktestStrategy(),
	mPeriod(period),
	mOversold(30.0),
	mOverbought(70.0),
	mAllowShort(false)
    {}

    RsiReversal& withThresholds(double oversold, double overbought)
    {
      mOversold = oversold;
      mOverbought = overbought;
      return *this;
    }

    RsiReversal& withShort(bool allow)
    {
      mAllowShort = allow;
      return *this;
    }

    std::string getName() const override
    {
      return "RSI Reversal";
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return IndicatorRequestList{IndicatorRequest(rsiKey(), IndicatorSpec::rsi(mPeriod))};
    }

    std::size_t getWarmupPeriod() const override
    {
      return mPeriod + 1;
    }

    Signal onCandle(const StrategyContext& context) const override
    {
      const auto rsi = context.getIndicator(rsiKey());
      if (!rsi)
	return context.signalHold();

      SignalStrength strength = SignalStrength::weak();
      if (*rsi < 20.0 || *rsi > 80.0)
	strength = SignalStrength::strong();
      else if (*rsi < 25.0 || *rsi > 75.0)
	strength = SignalStrength::medium();

      if (context.indicatorCrossedAbove(rsiKey(), mOversold))
	{
	  if (context.isShort())
	    return context.signalExit().withStrength(strength)
	      .withReason(crossReason("above", mOversold) + " - close short");
	  if (!context.hasPosition())
	    return context.signalLong().withStrength(strength)
	      .withReason(crossReason("above", mOversold));
	}

      if (context.indicatorCrossedBelow(rsiKey(), mOverbought))
	{
	  if (context.isLong())
	    return context.signalExit().withStrength(strength)
	      .withReason(crossReason("below", mOverbought) + " - close long");
	  if (!context.hasPosition() && mAllowShort)
	    return context.signalShort().withStrength(strength)
	      .withReason(crossReason("below", mOverbought));
	}

      return context.signalHold();
    }

  private:
    std::string rsiKey() const
    {
      return "rsi_" + std::to_string(mPeriod);
    }

    static std::string crossReason(const char *direction, double level)
    {
      char buf[64];
      std::snprintf(buf, sizeof(buf), "RSI crossed %s %.0f", direction, level);
      return std::string(buf);
    }

  private:
    std::size_t mPeriod;
    double mOversold;
    double mOverbought;
    bool mAllowShort;
  };

  /**
   * @class MacdSignal
   * @brief MACD line crossing its signal line.
   */
  class MacdSignal : public BacktestStrategy
  {
  public:
    MacdSignal(std::size_t fast = 12, std::size_t slow = 26, std::size_t signal = 9)
      : BacktestStrategy(),
	mFast(fast),
	mSlow(slow),
	mSignal(signal),
	mAllowShort(false)
    {}

    MacdSignal& withShort(bool allow)
    {
      mAllowShort = allow;
      return *this;
    }

    std::string getName() const override
    {
      return "MACD Signal";
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return IndicatorRequestList{IndicatorRequest("macd", IndicatorSpec::macd(mFast, mSlow, mSignal))};
    }

    std::size_t getWarmupPeriod() const override
    {
      return mSlow + mSignal;
    }

    Signal onCandle(const StrategyContext& context) const override
    {
      if (context.crossedAbove("macd_line", "macd_signal"))
	{
	  if (context.isShort())
	    return context.signalExit().withReason("MACD bullish crossover - close short");
	  if (!context.hasPosition())
	    return context.signalLong().withReason("MACD bullish crossover");
	}

      if (context.crossedBelow("macd_line", "macd_signal"))
	{
	  if (context.isLong())
	    return context.signalExit().withReason("MACD bearish crossover - close long");
	  if (!context.hasPosition() && mAllowShort)
	    return context.signalShort().withReason("MACD bearish crossover");
	}

      return context.signalHold();
    }

  private:
    std::size_t mFast;
    std::size_t mSlow;
    std::size_t mSignal;
    bool mAllowShort;
  };

  /**
   * @class BollingerMeanReversion
   * @brief Buys at the lower band, exits at the middle (or opposite) band.
   */
  class BollingerMeanReversion : public BacktestStrategy
  {
  public:
    BollingerMeanReversion(std::size_t period = 20, double stdDev = 2.0)
      : BacktestStrategy(),
	mPeriod(period),
	mStdDev(stdDev),
	mAllowShort(false),
	mExitAtMiddle(true)
    {}

    BollingerMeanReversion& withShort(bool allow)
    {
      mAllowShort = allow;
      return *this;
    }

    BollingerMeanReversion& exitAtMiddle(bool atMiddle)
    {
      mExitAtMiddle = atMiddle;
      return *this;
    }

    std::string getName() const override
    {
      return "Bollinger Mean Reversion";
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return IndicatorRequestList{IndicatorRequest("bollinger", IndicatorSpec::bollinger(mPeriod, mStdDev))};
    }

    std::size_t getWarmupPeriod() const override
    {
      return mPeriod;
    }

    Signal onCandle(const StrategyContext& context) const override
    {
      const auto lower = context.getIndicator("bollinger_lower");
      const auto middle = context.getIndicator("bollinger_middle");
      const auto upper = context.getIndicator("bollinger_upper");
      if (!lower || !middle || !upper)
	return context.signalHold();

      const double close = context.getClose();

      if (close <= *lower && !context.hasPosition())
	return context.signalLong().withReason("Price at lower Bollinger Band");

      if (context.isLong())
	{
	  const double exitLevel = mExitAtMiddle ? *middle : *upper;
	  if (close >= exitLevel)
	    return context.signalExit().withReason(mExitAtMiddle ?
						  "Price reached middle Bollinger Band" :
						  "Price reached upper Bollinger Band");
	}

      if (close >= *upper && !context.hasPosition() && mAllowShort)
	return context.signalShort().withReason("Price at upper Bollinger Band");

      if (context.isShort())
	{
	  const double exitLevel = mExitAtMiddle ? *middle : *lower;
	  if (close <= exitLevel)
	    return context.signalExit().withReason(mExitAtMiddle ?
						  "Price reached middle Bollinger Band" :
						  "Price reached lower Bollinger Band");
	}

      return context.signalHold();
    }

  private:
    std::size_t mPeriod;
    double mStdDev;
    bool mAllowShort;
    bool mExitAtMiddle;
  };

  /**
   * @class SuperTrendFollow
   * @brief Trades SuperTrend direction flips (uptrend stored as 1, downtrend as 0).
   */
  class SuperTrendFollow : public BacktestStrategy
  {
  public:
    SuperTrendFollow(std::size_t period = 10, double multiplier = 3.0)
      : BacktestStrategy(),
	mPeriod(period),
	mMultiplier(multiplier),
	mAllowShort(false)
    {}

    SuperTrendFollow& withShort(bool allow)
    {
      mAllowShort = allow;
      return *this;
    }

    std::string getName() const override
    {
      return "SuperTrend Follow";
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return IndicatorRequestList{IndicatorRequest("supertrend",
						   IndicatorSpec::supertrend(mPeriod, mMultiplier))};
    }

    std::size_t getWarmupPeriod() const override
    {
      return mPeriod + 1;
    }

    Signal onCandle(const StrategyContext& context) const override
    {
      const auto now = context.getIndicator("supertrend_uptrend");
      const auto prev = context.getIndicatorPrev("supertrend_uptrend");
      if (!now || !prev)
	return context.signalHold();

      const bool isUptrend = *now > 0.5;
      const bool wasUptrend = *prev > 0.5;

      if (isUptrend && !wasUptrend)
	{
	  if (context.isShort())
	    return context.signalExit().withReason("SuperTrend turned bullish - close short");
	  if (!context.hasPosition())
	    return context.signalLong().withReason("SuperTrend turned bullish");
	}

      if (!isUptrend && wasUptrend)
	{
	  if (context.isLong())
	    return context.signalExit().withReason("SuperTrend turned bearish - close long");
	  if (!context.hasPosition() && mAllowShort)
	    return context.signalShort().withReason("SuperTrend turned bearish");
	}

      return context.signalHold();
    }

  private:
    std::size_t mPeriod;
    double mMultiplier;
    bool mAllowShort;
  };

  /**
   * @class DonchianBreakout
   * @brief Breakouts through the previous bar's Donchian channel.
   *
   * The close is compared against the previous bar's bands so that the
   * current bar's own high or low cannot mask the breakout.
   */
  class DonchianBreakout : public BacktestStrategy
  {
  public:
    explicit DonchianBreakout(std::size_t period = 20)
      : BacktestStrategy(),
	mPeriod(period),
	mAllowShort(false),
	mExitAtMiddle(true)
    {}

    DonchianBreakout& withShort(bool allow)
    {
      mAllowShort = allow;
      return *this;
    }

    DonchianBreakout& exitAtMiddle(bool atMiddle)
    {
      mExitAtMiddle = atMiddle;
      return *this;
    }

    std::string getName() const override
    {
      return "Donchian Breakout";
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return IndicatorRequestList{IndicatorRequest("donchian", IndicatorSpec::donchian(mPeriod))};
    }

    std::size_t getWarmupPeriod() const override
    {
      return mPeriod;
    }

    Signal onCandle(const StrategyContext& context) const override
    {
      const auto upper = context.getIndicator("donchian_upper");
      const auto middle = context.getIndicator("donchian_middle");
      const auto lower = context.getIndicator("donchian_lower");
      if (!upper || !middle || !lower)
	return context.signalHold();

      const auto prevUpper = context.getIndicatorPrev("donchian_upper");
      const auto prevLower = context.getIndicatorPrev("donchian_lower");
      const double close = context.getClose();

      if (prevUpper && close > *prevUpper && !context.hasPosition())
	return context.signalLong().withReason("Donchian upper channel breakout");

      if (prevLower && close < *prevLower)
	{
	  if (context.isLong())
	    return context.signalExit().withReason("Donchian lower channel breakdown - close long");
	  if (!context.hasPosition() && mAllowShort)
	    return context.signalShort().withReason("Donchian lower channel breakdown");
	}

      if (context.isLong() && mExitAtMiddle && close <= *middle)
	return context.signalExit().withReason("Price reached Donchian middle channel");

      if (context.isShort() && mExitAtMiddle && close >= *middle)
	return context.signalExit().withReason("Price reached Donchian middle channel");

      return context.signalHold();
    }

  private:
    std::size_t mPeriod;
    bool mAllowShort;
    bool mExitAtMiddle;
  };
}

#endif
