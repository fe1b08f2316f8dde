// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __CANDLE_H
#define __CANDLE_H 1

#include <cstdint>
#include <optional>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace mkc_backtest
{
  using boost::posix_time::ptime;
  using boost::posix_time::time_duration;

  /**
   * @brief One OHLCV observation.
   *
   * Candles are supplied by the caller in strictly increasing timestamp
   * order and are never mutated by the engine.
   */
  class Candle
  {
  public:
    Candle(const ptime& timestamp,
	   double open,
	   double high,
	   double low,
	   double close,
	   double volume,
	   std::optional<double> adjustedClose = std::nullopt)
      : mTimestamp(timestamp),
	mOpen(open),
	mHigh(high),
	mLow(low),
	mClose(close),
	mVolume(volume),
	mAdjustedClose(adjustedClose)
    {}

    const ptime& getTimestamp() const
    {
      return mTimestamp;
    }

    double getOpen() const
    {
      return mOpen;
    }

    double getHigh() const
    {
      return mHigh;
    }

    double getLow() const
    {
      return mLow;
    }

    double getClose() const
    {
      return mClose;
    }

    double getVolume() const
    {
      return mVolume;
    }

    const std::optional<double>& getAdjustedClose() const
    {
      return mAdjustedClose;
    }

  private:
    ptime mTimestamp;
    double mOpen;
    double mHigh;
    double mLow;
    double mClose;
    double mVolume;
    std::optional<double> mAdjustedClose;
  };

  /**
   * @brief A cash dividend paid per share, effective on its ex-date.
   */
  struct Dividend
  {
    ptime timestamp;
    double amount;
  };

  using CandleSeries = std::vector<Candle>;

  inline const ptime& unixEpoch()
  {
    static const ptime epoch(boost::gregorian::date(1970, 1, 1));
    return epoch;
  }

  inline long long toEpochSeconds(const ptime& t)
  {
    return static_cast<long long>((t - unixEpoch()).total_seconds());
  }

  inline ptime fromEpochSeconds(long long seconds)
  {
    return unixEpoch() + boost::posix_time::seconds(static_cast<long>(seconds));
  }

  inline CandleSeries sliceCandles(const CandleSeries& candles,
				   std::size_t begin,
				   std::size_t end)
  {
    return CandleSeries(candles.begin() + begin, candles.begin() + end);
  }
}

#endif
