// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __INDICATOR_PROVIDER_H
#define __INDICATOR_PROVIDER_H 1

#include <memory>
#include <vector>
#include "Candle.h"
#include "IndicatorSpec.h"
#include "TimeSeriesIndicators.h"

namespace mkc_backtest
{
  /**
   * @brief Computes indicator series for a candle series.
   *
   * Implementations must be pure: the same candles and requests always yield
   * the same map, and no state is kept between calls.
   */
  class IndicatorProvider
  {
  public:
    virtual ~IndicatorProvider()
    {}

    virtual IndicatorMap compute(const CandleSeries& candles,
				 const IndicatorRequestList& requests) const = 0;
  };

  /**
   * @class DefaultIndicatorProvider
   * @brief IndicatorProvider backed by the functions in TimeSeriesIndicators.h.
   *
   * Single-series indicators are stored under the requested key. Compound
   * indicators are stored under fixed keys:
   *  - MACD: macd_line, macd_signal, macd_histogram
   *  - Bollinger: bollinger_upper, bollinger_middle, bollinger_lower
   *  - SuperTrend: supertrend_value, supertrend_uptrend
   *  - Donchian: donchian_upper, donchian_middle, donchian_lower
   */
  class DefaultIndicatorProvider : public IndicatorProvider
  {
  public:
    IndicatorMap compute(const CandleSeries& candles,
			 const IndicatorRequestList& requests) const override
    {
      IndicatorMap result;
      if (requests.empty())
	return result;

      std::vector<double> closes, highs, lows;
      closes.reserve(candles.size());
      highs.reserve(candles.size());
      lows.reserve(candles.size());
      for (const auto& candle : candles)
	{
	  closes.push_back(candle.getClose());
	  highs.push_back(candle.getHigh());
	  lows.push_back(candle.getLow());
	}

      for (const auto& request : requests)
	{
	  const std::string& key = request.first;
	  const IndicatorSpec& spec = request.second;

	  switch (spec.getKind())
	    {
	    case IndicatorSpec::Kind::SMA:
	      result[key] = SimpleMovingAverage(closes, spec.getPeriod());
	      break;

	    case IndicatorSpec::Kind::EMA:
	      result[key] = ExponentialMovingAverage(closes, spec.getPeriod());
	      break;

	    case IndicatorSpec::Kind::RSI:
	      result[key] = RelativeStrengthIndex(closes, spec.getPeriod());
	      break;

	    case IndicatorSpec::Kind::MACD:
	      {
		MacdSeries macd = MovingAverageConvergenceDivergence(closes,
								     spec.getPeriod(),
								     spec.getSlowPeriod(),
								     spec.getSignalPeriod());
		result["macd_line"] = std::move(macd.macdLine);
		result["macd_signal"] = std::move(macd.signalLine);
		result["macd_histogram"] = std::move(macd.histogram);
		break;
	      }

	    case IndicatorSpec::Kind::BOLLINGER:
	      {
		BandSeries bands = BollingerBands(closes, spec.getPeriod(), spec.getMultiplier());
		result["bollinger_upper"] = std::move(bands.upper);
		result["bollinger_middle"] = std::move(bands.middle);
		result["bollinger_lower"] = std::move(bands.lower);
		break;
	      }

	    case IndicatorSpec::Kind::ATR:
	      result[key] = AverageTrueRange(highs, lows, closes, spec.getPeriod());
	      break;

	    case IndicatorSpec::Kind::SUPERTREND:
	      {
		SuperTrendSeries st = SuperTrend(highs, lows, closes,
						 spec.getPeriod(), spec.getMultiplier());
		result["supertrend_value"] = std::move(st.value);
		result["supertrend_uptrend"] = std::move(st.uptrend);
		break;
	      }

	    case IndicatorSpec::Kind::DONCHIAN:
	      {
		BandSeries bands = DonchianChannels(highs, lows, spec.getPeriod());
		result["donchian_upper"] = std::move(bands.upper);
		result["donchian_middle"] = std::move(bands.middle);
		result["donchian_lower"] = std::move(bands.lower);
		break;
	      }
	    }
	}
      return result;
    }
  };

  inline std::shared_ptr<IndicatorProvider> makeDefaultIndicatorProvider()
  {
    return std::make_shared<DefaultIndicatorProvider>();
  }
}

#endif
