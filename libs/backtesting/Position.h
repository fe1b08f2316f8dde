// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __POSITION_H
#define __POSITION_H 1

#include <ostream>
#include "Candle.h"
#include "Signal.h"

namespace mkc_backtest
{
  enum class PositionSide
    {
      LONG,
      SHORT
    };

  inline const char *toString(PositionSide side)
  {
    return side == PositionSide::LONG ? "Long" : "Short";
  }

  inline std::ostream& operator<<(std::ostream& os, PositionSide side)
  {
    return os << toString(side);
  }

  /**
   * @class Trade
   * @brief A completed round trip. Created once when a Position closes.
   *
   * pnl is net of entry and exit commission and includes dividend income.
   * returnPct is pnl as a percentage of the entry value, so the two always
   * share a sign.
   */
  class Trade
  {
  public:
    Trade(PositionSide side,
	  const ptime& entryTimestamp,
	  const ptime& exitTimestamp,
	  double entryPrice,
	  double exitPrice,
	  double quantity,
	  double commission,
	  double dividendIncome,
	  double pnl,
	  double returnPct,
	  const Signal& entrySignal,
	  const Signal& exitSignal)
      : mSide(side),
	mEntryTimestamp(entryTimestamp),
	mExitTimestamp(exitTimestamp),
	mEntryPrice(entryPrice),
	mExitPrice(exitPrice),
	mQuantity(quantity),
	mCommission(commission),
	mDividendIncome(dividendIncome),
	mPnl(pnl),
	mReturnPct(returnPct),
	mEntrySignal(entrySignal),
	mExitSignal(exitSignal)
    {}

    PositionSide getSide() const
    {
      return mSide;
    }

    bool isLong() const
    {
      return mSide == PositionSide::LONG;
    }

    bool isShort() const
    {
      return mSide == PositionSide::SHORT;
    }

    const ptime& getEntryTimestamp() const
    {
      return mEntryTimestamp;
    }

    const ptime& getExitTimestamp() const
    {
      return mExitTimestamp;
    }

    double getEntryPrice() const
    {
      return mEntryPrice;
    }

    double getExitPrice() const
    {
      return mExitPrice;
    }

    double getQuantity() const
    {
      return mQuantity;
    }

    // Entry plus exit commission
    double getCommission() const
    {
      return mCommission;
    }

    double getDividendIncome() const
    {
      return mDividendIncome;
    }

    double getPnl() const
    {
      return mPnl;
    }

    double getReturnPct() const
    {
      return mReturnPct;
    }

    const Signal& getEntrySignal() const
    {
      return mEntrySignal;
    }

    const Signal& getExitSignal() const
    {
      return mExitSignal;
    }

    bool isProfitable() const
    {
      return mPnl > 0.0;
    }

    bool isLoss() const
    {
      return mPnl < 0.0;
    }

    long long getDurationSeconds() const
    {
      return static_cast<long long>((mExitTimestamp - mEntryTimestamp).total_seconds());
    }

    double getEntryValue() const
    {
      return mEntryPrice * mQuantity;
    }

    double getExitValue() const
    {
      return mExitPrice * mQuantity;
    }

  private:
    PositionSide mSide;
    ptime mEntryTimestamp;
    ptime mExitTimestamp;
    double mEntryPrice;
    double mExitPrice;
    double mQuantity;
    double mCommission;
    double mDividendIncome;
    double mPnl;
    double mReturnPct;
    Signal mEntrySignal;
    Signal mExitSignal;
  };

  /**
   * @class Position
   * @brief The currently held exposure. At most one is open per run.
   */
  class Position
  {
  public:
    Position(PositionSide side,
	     const ptime& entryTimestamp,
	     double entryPrice,
	     double quantity,
	     double entryCommission,
	     const Signal& entrySignal)
      : mSide(side),
	mEntryTimestamp(entryTimestamp),
	mEntryPrice(entryPrice),
	mQuantity(quantity),
	mEntryCommission(entryCommission),
	mEntrySignal(entrySignal),
	mDividendIncome(0.0),
	mCashDividendIncome(0.0)
    {}

    PositionSide getSide() const
    {
      return mSide;
    }

    bool isLong() const
    {
      return mSide == PositionSide::LONG;
    }

    bool isShort() const
    {
      return mSide == PositionSide::SHORT;
    }

    const ptime& getEntryTimestamp() const
    {
      return mEntryTimestamp;
    }

    double getEntryPrice() const
    {
      return mEntryPrice;
    }

    double getQuantity() const
    {
      return mQuantity;
    }

    double getEntryCommission() const
    {
      return mEntryCommission;
    }

    const Signal& getEntrySignal() const
    {
      return mEntrySignal;
    }

    double getDividendIncome() const
    {
      return mDividendIncome;
    }

    double getEntryValue() const
    {
      return mEntryPrice * mQuantity;
    }

    /**
     * @brief Value of the position marked at @p price.
     *
     * A long is worth quantity * price. A short is worth the cash committed
     * at entry plus its gain (entry - price) * quantity, which is what
     * closing it at @p price would return before exit costs. Dividends held
     * as cash are included.
     */
    double marketValue(double price) const
    {
      if (isLong())
	return mQuantity * price + mCashDividendIncome;

      return getEntryValue() + (mEntryPrice - price) * mQuantity + mCashDividendIncome;
    }

    double grossPnl(double price) const
    {
      return isLong() ? (price - mEntryPrice) * mQuantity
	: (mEntryPrice - price) * mQuantity;
    }

    // Net of entry commission; dividend income is not included.
    double unrealizedPnl(double price) const
    {
      return grossPnl(price) - mEntryCommission;
    }

    // Unrealized return as a percentage of entry value (5.0 == 5%).
    double unrealizedReturnPct(double price) const
    {
      const double entryValue = getEntryValue();
      if (entryValue == 0.0)
	return 0.0;

      return unrealizedPnl(price) / entryValue * 100.0;
    }

    /**
     * @brief Record dividend income (negative for a short, which pays the dividend).
     *
     * When reinvesting, a long buys income / closePrice additional units.
     * Those units carry no cost, so the entry price becomes the average cost
     * of the enlarged position and the entry value is unchanged. Otherwise
     * the income is held as cash until the position closes.
     */
    void creditDividend(double income, double closePrice, bool reinvest)
    {
      mDividendIncome += income;

      if (reinvest && isLong() && closePrice > 0.0 && income > 0.0)
	{
	  const double entryValue = getEntryValue();
	  mQuantity += income / closePrice;
	  mEntryPrice = entryValue / mQuantity;
	}
      else
	mCashDividendIncome += income;
    }

    /**
     * @brief Convert this position into a Trade.
     *
     * @param exitPrice fill price after slippage
     * @param exitCommission commission charged on the exit fill
     */
    Trade close(const ptime& exitTimestamp,
		double exitPrice,
		double exitCommission,
		const Signal& exitSignal) const
    {
      const double totalCommission = mEntryCommission + exitCommission;
      const double pnl = grossPnl(exitPrice) - totalCommission + mCashDividendIncome;
      const double entryValue = getEntryValue();
      const double returnPct = entryValue != 0.0 ? pnl / entryValue * 100.0 : 0.0;

      return Trade(mSide,
		   mEntryTimestamp,
		   exitTimestamp,
		   mEntryPrice,
		   exitPrice,
		   mQuantity,
		   totalCommission,
		   mDividendIncome,
		   pnl,
		   returnPct,
		   mEntrySignal,
		   exitSignal);
    }

  private:
    PositionSide mSide;
    ptime mEntryTimestamp;
    double mEntryPrice;
    double mQuantity;
    double mEntryCommission;
    Signal mEntrySignal;
    double mDividendIncome;
    double mCashDividendIncome;
  };
}

#endif
