// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIME_SERIES_INDICATORS_H
#define __TIME_SERIES_INDICATORS_H 1

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include "IndicatorSpec.h"
#include "TimeSeriesException.h"

namespace mkc_backtest
{
  using namespace boost::accumulators;

  struct MacdSeries
  {
    IndicatorSeries macdLine;
    IndicatorSeries signalLine;
    IndicatorSeries histogram;
  };

  struct BandSeries
  {
    IndicatorSeries upper;
    IndicatorSeries middle;
    IndicatorSeries lower;
  };

  struct SuperTrendSeries
  {
    IndicatorSeries value;
    IndicatorSeries uptrend;   // 1.0 for an uptrend, 0.0 for a downtrend
  };

  namespace detail
  {
    inline void checkPeriod(std::size_t period, const char *indicatorName)
    {
      if (period == 0)
	throw IndicatorException(std::string(indicatorName) + ": period must be greater than 0");
    }

    inline void checkLength(std::size_t actual, std::size_t needed, const char *indicatorName)
    {
      if (actual < needed)
	throw IndicatorException(std::string(indicatorName) + ": need " +
				 std::to_string(needed) + " values but got " +
				 std::to_string(actual));
    }
  }

  /**
   * @brief Simple moving average.
   *
   * The first period - 1 entries are empty. A zero period or an empty series
   * yields a series with no values.
   */
  inline IndicatorSeries SimpleMovingAverage(const std::vector<double>& data, std::size_t period)
  {
    IndicatorSeries result(data.size());
    if (period == 0 || data.empty())
      return result;

    // Each window is summed afresh so values carry no running-sum drift
    for (std::size_t i = period - 1; i < data.size(); ++i)
      {
	double sum = 0.0;
	for (std::size_t j = i + 1 - period; j <= i; ++j)
	  sum += data[j];
	result[i] = sum / static_cast<double>(period);
      }
    return result;
  }

  /**
   * @brief Exponential moving average seeded with the SMA of the first period values.
   *
   * Multiplier is 2 / (period + 1).
   */
  inline IndicatorSeries ExponentialMovingAverage(const std::vector<double>& data, std::size_t period)
  {
    IndicatorSeries result(data.size());
    if (period == 0 || data.size() < period)
      return result;

    const double multiplier = 2.0 / (static_cast<double>(period) + 1.0);
    double seed = 0.0;
    for (std::size_t i = 0; i < period; ++i)
      seed += data[i];

    double previous = seed / static_cast<double>(period);
    result[period - 1] = previous;

    for (std::size_t i = period; i < data.size(); ++i)
      {
	previous = (data[i] - previous) * multiplier + previous;
	result[i] = previous;
      }
    return result;
  }

  /**
   * @brief Relative Strength Index on closing prices.
   *
   * Gains and losses of consecutive closes are smoothed with the EMA above.
   * The value at bar i uses the changes up to bar i, so the first value is
   * at index period. An average loss of zero yields 100.
   *
   * @throws IndicatorException if period is zero or data.size() <= period.
   */
  inline IndicatorSeries RelativeStrengthIndex(const std::vector<double>& data, std::size_t period)
  {
    detail::checkPeriod(period, "RSI");
    detail::checkLength(data.size(), period + 1, "RSI");

    std::vector<double> gains, losses;
    gains.reserve(data.size() - 1);
    losses.reserve(data.size() - 1);

    for (std::size_t i = 1; i < data.size(); ++i)
      {
	const double change = data[i] - data[i - 1];
	gains.push_back(change > 0.0 ? change : 0.0);
	losses.push_back(change < 0.0 ? -change : 0.0);
      }

    IndicatorSeries avgGains = ExponentialMovingAverage(gains, period);
    IndicatorSeries avgLosses = ExponentialMovingAverage(losses, period);

    IndicatorSeries result(data.size());
    for (std::size_t i = 0; i < avgGains.size(); ++i)
      {
	if (avgGains[i] && avgLosses[i])
	  {
	    if (*avgLosses[i] == 0.0)
	      result[i + 1] = 100.0;
	    else
	      {
		const double rs = *avgGains[i] / *avgLosses[i];
		result[i + 1] = 100.0 - (100.0 / (1.0 + rs));
	      }
	  }
      }
    return result;
  }

  /**
   * @brief MACD line (fast EMA - slow EMA), its signal EMA and the histogram.
   *
   * The signal EMA is computed over the defined MACD values only and mapped
   * back onto the bar positions.
   *
   * @throws IndicatorException if any period is zero, fast >= slow, or the
   *         series is shorter than slow + signal.
   */
  inline MacdSeries MovingAverageConvergenceDivergence(const std::vector<double>& data,
						       std::size_t fastPeriod,
						       std::size_t slowPeriod,
						       std::size_t signalPeriod)
  {
    if (fastPeriod == 0 || slowPeriod == 0 || signalPeriod == 0)
      throw IndicatorException("MACD: all periods must be greater than 0");

    if (fastPeriod >= slowPeriod)
      throw IndicatorException("MACD: fast period must be less than slow period");

    detail::checkLength(data.size(), slowPeriod + signalPeriod, "MACD");

    IndicatorSeries fast = ExponentialMovingAverage(data, fastPeriod);
    IndicatorSeries slow = ExponentialMovingAverage(data, slowPeriod);

    MacdSeries result;
    result.macdLine.resize(data.size());
    result.signalLine.resize(data.size());
    result.histogram.resize(data.size());

    std::vector<double> macdValues;
    for (std::size_t i = 0; i < data.size(); ++i)
      {
	if (fast[i] && slow[i])
	  {
	    result.macdLine[i] = *fast[i] - *slow[i];
	    macdValues.push_back(*fast[i] - *slow[i]);
	  }
      }

    IndicatorSeries signal = ExponentialMovingAverage(macdValues, signalPeriod);
    std::size_t signalIndex = 0;
    for (std::size_t i = 0; i < data.size(); ++i)
      {
	if (result.macdLine[i])
	  {
	    if (signalIndex < signal.size())
	      result.signalLine[i] = signal[signalIndex];
	    ++signalIndex;
	  }

	if (result.macdLine[i] && result.signalLine[i])
	  result.histogram[i] = *result.macdLine[i] - *result.signalLine[i];
      }
    return result;
  }

  /**
   * @brief Bollinger Bands: SMA middle band +/- stdDev population standard deviations.
   *
   * Uses boost::accumulators for the window variance (population, divides by N).
   */
  inline BandSeries BollingerBands(const std::vector<double>& data,
				   std::size_t period,
				   double stdDevMultiplier)
  {
    detail::checkPeriod(period, "Bollinger");
    detail::checkLength(data.size(), period, "Bollinger");

    BandSeries result;
    result.middle = SimpleMovingAverage(data, period);
    result.upper.resize(data.size());
    result.lower.resize(data.size());

    for (std::size_t i = period - 1; i < data.size(); ++i)
      {
	accumulator_set<double, stats<tag::mean, tag::variance>> windowStats;
	for (std::size_t j = i + 1 - period; j <= i; ++j)
	  windowStats(data[j]);

	const double mid = *result.middle[i];
	const double sd = std::sqrt(variance(windowStats));
	result.upper[i] = mid + stdDevMultiplier * sd;
	result.lower[i] = mid - stdDevMultiplier * sd;
      }
    return result;
  }

  /**
   * @brief Average True Range with Wilder smoothing.
   *
   * The first true range is high - low. The first ATR value, at index
   * period - 1, is the mean of the first period true ranges.
   *
   * @throws IndicatorException on mismatched lengths or when size <= period.
   */
  inline IndicatorSeries AverageTrueRange(const std::vector<double>& highs,
					  const std::vector<double>& lows,
					  const std::vector<double>& closes,
					  std::size_t period)
  {
    detail::checkPeriod(period, "ATR");
    if (highs.size() != lows.size() || highs.size() != closes.size())
      throw IndicatorException("ATR: all input series must have the same length");
    detail::checkLength(highs.size(), period + 1, "ATR");

    std::vector<double> trueRanges;
    trueRanges.reserve(highs.size());
    trueRanges.push_back(highs[0] - lows[0]);
    for (std::size_t i = 1; i < highs.size(); ++i)
      {
	const double highLow = highs[i] - lows[i];
	const double highPrevClose = std::fabs(highs[i] - closes[i - 1]);
	const double lowPrevClose = std::fabs(lows[i] - closes[i - 1]);
	trueRanges.push_back(std::max(highLow, std::max(highPrevClose, lowPrevClose)));
      }

    IndicatorSeries result(highs.size());
    double sum = 0.0;
    for (std::size_t i = 0; i < period; ++i)
      sum += trueRanges[i];

    double previous = sum / static_cast<double>(period);
    result[period - 1] = previous;

    for (std::size_t i = period; i < trueRanges.size(); ++i)
      {
	previous = (previous * static_cast<double>(period - 1) + trueRanges[i]) /
	  static_cast<double>(period);
	result[i] = previous;
      }
    return result;
  }

  /**
   * @brief SuperTrend using final upper/lower band carry-over rules.
   *
   * The trend starts up at the first ATR bar. It flips down when the close
   * falls to or below the final lower band and flips up when it rises to or
   * above the final upper band.
   */
  inline SuperTrendSeries SuperTrend(const std::vector<double>& highs,
				     const std::vector<double>& lows,
				     const std::vector<double>& closes,
				     std::size_t period,
				     double multiplier)
  {
    detail::checkPeriod(period, "SuperTrend");
    const std::size_t len = highs.size();
    if (lows.size() != len || closes.size() != len)
      throw IndicatorException("SuperTrend: all input series must have the same length");
    detail::checkLength(len, period, "SuperTrend");

    IndicatorSeries atrValues = AverageTrueRange(highs, lows, closes, period);

    SuperTrendSeries result;
    result.value.resize(len);
    result.uptrend.resize(len);

    const std::size_t startIndex = period - 1;
    double prevFinalUpper = 0.0;
    double prevFinalLower = 0.0;
    bool prevTrend = true;

    for (std::size_t i = startIndex; i < len; ++i)
      {
	if (!atrValues[i])
	  continue;

	const double hl2 = (highs[i] + lows[i]) / 2.0;
	const double basicUpper = hl2 + multiplier * *atrValues[i];
	const double basicLower = hl2 - multiplier * *atrValues[i];
	const double close = closes[i];
	const double prevClose = i > 0 ? closes[i - 1] : close;

	const double finalUpper =
	  (i == startIndex || basicUpper < prevFinalUpper || prevClose > prevFinalUpper)
	  ? basicUpper : prevFinalUpper;

	const double finalLower =
	  (i == startIndex || basicLower > prevFinalLower || prevClose < prevFinalLower)
	  ? basicLower : prevFinalLower;

	bool trend = prevTrend;
	if (i == startIndex)
	  trend = true;
	else if (prevTrend && close <= finalLower)
	  trend = false;
	else if (!prevTrend && close >= finalUpper)
	  trend = true;

	result.value[i] = trend ? finalLower : finalUpper;
	result.uptrend[i] = trend ? 1.0 : 0.0;

	prevFinalUpper = finalUpper;
	prevFinalLower = finalLower;
	prevTrend = trend;
      }
    return result;
  }

  /**
   * @brief Donchian Channels: highest high, lowest low and their midpoint over the period.
   */
  inline BandSeries DonchianChannels(const std::vector<double>& highs,
				     const std::vector<double>& lows,
				     std::size_t period)
  {
    detail::checkPeriod(period, "Donchian");
    const std::size_t len = highs.size();
    if (lows.size() != len)
      throw IndicatorException("Donchian: all input series must have the same length");
    detail::checkLength(len, period, "Donchian");

    BandSeries result;
    result.upper.resize(len);
    result.middle.resize(len);
    result.lower.resize(len);

    for (std::size_t i = period - 1; i < len; ++i)
      {
	double highest = -std::numeric_limits<double>::infinity();
	double lowest = std::numeric_limits<double>::infinity();
	for (std::size_t j = i + 1 - period; j <= i; ++j)
	  {
	    highest = std::max(highest, highs[j]);
	    lowest = std::min(lowest, lows[j]);
	  }
	result.upper[i] = highest;
	result.lower[i] = lowest;
	result.middle[i] = (highest + lowest) / 2.0;
      }
    return result;
  }
}

#endif
