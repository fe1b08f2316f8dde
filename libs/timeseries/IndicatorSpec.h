// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __INDICATOR_SPEC_H
#define __INDICATOR_SPEC_H 1

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace mkc_backtest
{
  /**
   * @brief Describes one technical indicator and its parameters.
   *
   * An IndicatorSpec is pure configuration. The values are produced by an
   * IndicatorProvider and stored under a string key chosen by the strategy
   * (single-series indicators) or under fixed keys (compound indicators such
   * as MACD, Bollinger Bands, SuperTrend and Donchian Channels).
   */
  class IndicatorSpec
  {
  public:
    enum class Kind
      {
	SMA,
	EMA,
	RSI,
	MACD,
	BOLLINGER,
	ATR,
	SUPERTREND,
	DONCHIAN
      };

    static IndicatorSpec sma(std::size_t period)
    {
      return IndicatorSpec(Kind::SMA, period);
    }

    static IndicatorSpec ema(std::size_t period)
    {
      return IndicatorSpec(Kind::EMA, period);
    }

    static IndicatorSpec rsi(std::size_t period)
    {
      return IndicatorSpec(Kind::RSI, period);
    }

    static IndicatorSpec macd(std::size_t fast, std::size_t slow, std::size_t signal)
    {
      return IndicatorSpec(Kind::MACD, fast, slow, signal);
    }

    static IndicatorSpec bollinger(std::size_t period, double stdDev)
    {
      return IndicatorSpec(Kind::BOLLINGER, period, 0, 0, stdDev);
    }

    static IndicatorSpec atr(std::size_t period)
    {
      return IndicatorSpec(Kind::ATR, period);
    }

    static IndicatorSpec supertrend(std::size_t period, double multiplier)
    {
      return IndicatorSpec(Kind::SUPERTREND, period, 0, 0, multiplier);
    }

    static IndicatorSpec donchian(std::size_t period)
    {
      return IndicatorSpec(Kind::DONCHIAN, period);
    }

    Kind getKind() const
    {
      return mKind;
    }

    // For MACD this is the fast period.
    std::size_t getPeriod() const
    {
      return mPeriod;
    }

    std::size_t getSlowPeriod() const
    {
      return mSlowPeriod;
    }

    std::size_t getSignalPeriod() const
    {
      return mSignalPeriod;
    }

    // Standard deviation width (Bollinger) or band multiplier (SuperTrend).
    double getMultiplier() const
    {
      return mMultiplier;
    }

    /**
     * @brief Number of bars needed before the indicator produces values.
     */
    std::size_t getWarmupBars() const
    {
      if (mKind == Kind::MACD)
	return std::max(mPeriod, mSlowPeriod) + mSignalPeriod;

      return mPeriod;
    }

    std::string toString() const
    {
      std::ostringstream os;
      switch (mKind)
	{
	case Kind::SMA:
	  os << "SMA(" << mPeriod << ")";
	  break;
	case Kind::EMA:
	  os << "EMA(" << mPeriod << ")";
	  break;
	case Kind::RSI:
	  os << "RSI(" << mPeriod << ")";
	  break;
	case Kind::MACD:
	  os << "MACD(" << mPeriod << "," << mSlowPeriod << "," << mSignalPeriod << ")";
	  break;
	case Kind::BOLLINGER:
	  os << "Bollinger(" << mPeriod << "," << mMultiplier << ")";
	  break;
	case Kind::ATR:
	  os << "ATR(" << mPeriod << ")";
	  break;
	case Kind::SUPERTREND:
	  os << "SuperTrend(" << mPeriod << "," << mMultiplier << ")";
	  break;
	case Kind::DONCHIAN:
	  os << "Donchian(" << mPeriod << ")";
	  break;
	}
      return os.str();
    }

    bool operator==(const IndicatorSpec& rhs) const
    {
      return mKind == rhs.mKind &&
	mPeriod == rhs.mPeriod &&
	mSlowPeriod == rhs.mSlowPeriod &&
	mSignalPeriod == rhs.mSignalPeriod &&
	mMultiplier == rhs.mMultiplier;
    }

    bool operator!=(const IndicatorSpec& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    IndicatorSpec(Kind kind,
		  std::size_t period,
		  std::size_t slowPeriod = 0,
		  std::size_t signalPeriod = 0,
		  double multiplier = 0.0)
      : mKind(kind),
	mPeriod(period),
	mSlowPeriod(slowPeriod),
	mSignalPeriod(signalPeriod),
	mMultiplier(multiplier)
    {}

  private:
    Kind mKind;
    std::size_t mPeriod;
    std::size_t mSlowPeriod;
    std::size_t mSignalPeriod;
    double mMultiplier;
  };

  /// A (key, spec) pair requested by a strategy or condition.
  using IndicatorRequest = std::pair<std::string, IndicatorSpec>;
  using IndicatorRequestList = std::vector<IndicatorRequest>;

  /// Per-bar indicator values; empty entries mark the warmup region.
  using IndicatorSeries = std::vector<std::optional<double>>;
  using IndicatorMap = std::map<std::string, IndicatorSeries>;

  /**
   * @brief Append the requests in @p source to @p dest, skipping keys already present.
   */
  inline void mergeIndicatorRequests(IndicatorRequestList& dest,
				     const IndicatorRequestList& source)
  {
    for (const auto& request : source)
      {
	auto it = std::find_if(dest.begin(), dest.end(),
			       [&request](const IndicatorRequest& existing) {
				 return existing.first == request.first;
			       });
	if (it == dest.end())
	  dest.push_back(request);
      }
  }
}

#endif
