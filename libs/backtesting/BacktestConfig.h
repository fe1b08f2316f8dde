// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_CONFIG_H
#define __BACKTEST_CONFIG_H 1

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include "BacktestException.h"

namespace mkc_backtest
{
  class BacktestConfigBuilder;

  /**
   * @class BacktestConfig
   * @brief Immutable run parameters for a BacktestEngine.
   *
   * Percentages are fractions (0.001 == 0.1%). The cost model is:
   *  - commission for a fill of value v: commission + v * commissionPct
   *  - entry slippage: long pays price * (1 + s), short receives price * (1 - s)
   *  - exit slippage: long receives price * (1 - s), short pays price * (1 + s)
   *
   * A default constructed config holds the defaults and is valid.
   */
  class BacktestConfig
  {
  public:
    BacktestConfig()
      : mInitialCapital(10000.0),
	mCommission(0.0),
	mCommissionPct(0.001),
	mSlippagePct(0.001),
	mPositionSizePct(1.0),
	mAllowShort(false),
	mMinSignalStrength(0.0),
	mStopLossPct(),
	mTakeProfitPct(),
	mTrailingStopPct(),
	mCloseAtEnd(false),
	mRiskFreeRate(0.0),
	mReinvestDividends(false),
	mBarsPerYear(252.0),
	mMaxPositions()
    {}

    static BacktestConfigBuilder builder();

    /**
     * @brief Copy of this config with commission, commission pct and slippage set to zero.
     */
    BacktestConfig zeroCost() const
    {
      BacktestConfig copy(*this);
      copy.mCommission = 0.0;
      copy.mCommissionPct = 0.0;
      copy.mSlippagePct = 0.0;
      return copy;
    }

    /**
     * @brief Check every field, throwing InvalidParameterException for the first bad one.
     */
    void validate() const
    {
      if (!(mInitialCapital > 0.0))
	throw InvalidParameterException("initial_capital", "must be positive");

      if (!(mCommission >= 0.0))
	throw InvalidParameterException("commission", "must be non-negative");

      checkFraction("commission_pct", mCommissionPct);
      checkFraction("slippage_pct", mSlippagePct);

      if (!(mPositionSizePct > 0.0 && mPositionSizePct <= 1.0))
	throw InvalidParameterException("position_size_pct", "must be in (0, 1]");

      checkFraction("min_signal_strength", mMinSignalStrength);

      if (mStopLossPct)
	checkFraction("stop_loss_pct", *mStopLossPct);

      if (mTakeProfitPct)
	checkFraction("take_profit_pct", *mTakeProfitPct);

      if (mTrailingStopPct)
	checkFraction("trailing_stop_pct", *mTrailingStopPct);

      checkFraction("risk_free_rate", mRiskFreeRate);

      if (!(mBarsPerYear > 0.0))
	throw InvalidParameterException("bars_per_year", "must be positive");

      if (mMaxPositions && *mMaxPositions == 0)
	throw InvalidParameterException("max_positions", "must be at least 1");
    }

    double calculateCommission(double tradeValue) const
    {
      return mCommission + tradeValue * mCommissionPct;
    }

    double applyEntrySlippage(double price, bool isLong) const
    {
      return isLong ? price * (1.0 + mSlippagePct) : price * (1.0 - mSlippagePct);
    }

    double applyExitSlippage(double price, bool isLong) const
    {
      return isLong ? price * (1.0 - mSlippagePct) : price * (1.0 + mSlippagePct);
    }

    /**
     * @brief Units affordable with @p availableCapital at @p price.
     *
     * Reserves the round-trip commission (entry and exit) out of the
     * allocated capital so that the entry fill plus its commission never
     * exceeds the cash on hand.
     */
    double calculatePositionSize(double availableCapital, double price) const
    {
      if (!(price > 0.0))
	return 0.0;

      const double allocated = availableCapital * mPositionSizePct;
      const double afterCommission =
	allocated / (1.0 + 2.0 * mCommissionPct) - 2.0 * mCommission;
      return std::max(0.0, afterCommission / price);
    }

    double getInitialCapital() const
    {
      return mInitialCapital;
    }

    double getCommission() const
    {
      return mCommission;
    }

    double getCommissionPct() const
    {
      return mCommissionPct;
    }

    double getSlippagePct() const
    {
      return mSlippagePct;
    }

    double getPositionSizePct() const
    {
      return mPositionSizePct;
    }

    bool getAllowShort() const
    {
      return mAllowShort;
    }

    double getMinSignalStrength() const
    {
      return mMinSignalStrength;
    }

    const std::optional<double>& getStopLossPct() const
    {
      return mStopLossPct;
    }

    const std::optional<double>& getTakeProfitPct() const
    {
      return mTakeProfitPct;
    }

    const std::optional<double>& getTrailingStopPct() const
    {
      return mTrailingStopPct;
    }

    bool getCloseAtEnd() const
    {
      return mCloseAtEnd;
    }

    double getRiskFreeRate() const
    {
      return mRiskFreeRate;
    }

    bool getReinvestDividends() const
    {
      return mReinvestDividends;
    }

    double getBarsPerYear() const
    {
      return mBarsPerYear;
    }

    /**
     * @brief Cap on concurrently open positions across a portfolio run;
     * empty means unlimited. A single-symbol run holds at most one position.
     */
    const std::optional<std::size_t>& getMaxPositions() const
    {
      return mMaxPositions;
    }

  private:
    static void checkFraction(const char *name, double value)
    {
      if (!(value >= 0.0 && value <= 1.0))
	throw InvalidParameterException(name, "must be between 0 and 1");
    }

  private:
    friend class BacktestConfigBuilder;

    double mInitialCapital;
    double mCommission;
    double mCommissionPct;
    double mSlippagePct;
    double mPositionSizePct;
    bool mAllowShort;
    double mMinSignalStrength;
    std::optional<double> mStopLossPct;
    std::optional<double> mTakeProfitPct;
    std::optional<double> mTrailingStopPct;
    bool mCloseAtEnd;
    double mRiskFreeRate;
    bool mReinvestDividends;
    double mBarsPerYear;
    std::optional<std::size_t> mMaxPositions;
  };

  /**
   * @class BacktestConfigBuilder
   * @brief Fluent construction of a BacktestConfig; build() validates.
   */
  class BacktestConfigBuilder
  {
  public:
    BacktestConfigBuilder()
      : mConfig()
    {}

    explicit BacktestConfigBuilder(const BacktestConfig& base)
      : mConfig(base)
    {}

    BacktestConfigBuilder& initialCapital(double capital)
    {
      mConfig.mInitialCapital = capital;
      return *this;
    }

    BacktestConfigBuilder& commission(double flatFee)
    {
      mConfig.mCommission = flatFee;
      return *this;
    }

    BacktestConfigBuilder& commissionPct(double pct)
    {
      mConfig.mCommissionPct = pct;
      return *this;
    }

    BacktestConfigBuilder& slippagePct(double pct)
    {
      mConfig.mSlippagePct = pct;
      return *this;
    }

    BacktestConfigBuilder& positionSizePct(double pct)
    {
      mConfig.mPositionSizePct = pct;
      return *this;
    }

    BacktestConfigBuilder& allowShort(bool allow)
    {
      mConfig.mAllowShort = allow;
      return *this;
    }

    BacktestConfigBuilder& minSignalStrength(double strength)
    {
      mConfig.mMinSignalStrength = strength;
      return *this;
    }

    BacktestConfigBuilder& stopLossPct(double pct)
    {
      mConfig.mStopLossPct = pct;
      return *this;
    }

    BacktestConfigBuilder& takeProfitPct(double pct)
    {
      mConfig.mTakeProfitPct = pct;
      return *this;
    }

    BacktestConfigBuilder& trailingStopPct(double pct)
    {
      mConfig.mTrailingStopPct = pct;
      return *this;
    }

    BacktestConfigBuilder& closeAtEnd(bool close)
    {
      mConfig.mCloseAtEnd = close;
      return *this;
    }

    BacktestConfigBuilder& riskFreeRate(double rate)
    {
      mConfig.mRiskFreeRate = rate;
      return *this;
    }

    BacktestConfigBuilder& reinvestDividends(bool reinvest)
    {
      mConfig.mReinvestDividends = reinvest;
      return *this;
    }

    BacktestConfigBuilder& barsPerYear(double bars)
    {
      mConfig.mBarsPerYear = bars;
      return *this;
    }

    BacktestConfigBuilder& maxPositions(std::size_t count)
    {
      mConfig.mMaxPositions = count;
      return *this;
    }

    BacktestConfigBuilder& unlimitedPositions()
    {
      mConfig.mMaxPositions.reset();
      return *this;
    }

    BacktestConfig build() const
    {
      mConfig.validate();
      return mConfig;
    }

  private:
    BacktestConfig mConfig;
  };

  inline BacktestConfigBuilder BacktestConfig::builder()
  {
    return BacktestConfigBuilder();
  }
}

#endif
