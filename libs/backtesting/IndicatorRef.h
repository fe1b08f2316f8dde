// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __INDICATOR_REF_H
#define __INDICATOR_REF_H 1

#include <cmath>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include "IndicatorSpec.h"
#include "StrategyContext.h"

namespace mkc_backtest
{
  /**
   * @class IndicatorRef
   * @brief A named value that conditions can read at the current and previous bar.
   *
   * A reference knows the key it is looked up under, the indicators that
   * must be computed for it, and how to read itself from a StrategyContext.
   */
  class IndicatorRef
  {
  public:
    virtual ~IndicatorRef()
    {}

    virtual std::string getKey() const = 0;
    virtual IndicatorRequestList getRequiredIndicators() const = 0;
    virtual std::optional<double> value(const StrategyContext& context) const = 0;
    virtual std::optional<double> previousValue(const StrategyContext& context) const = 0;
  };

  using IndicatorRefPtr = std::shared_ptr<IndicatorRef>;

  /**
   * @class PriceRef
   * @brief Values derived directly from candles; nothing to precompute.
   */
  class PriceRef : public IndicatorRef
  {
  public:
    enum class Component
      {
	CLOSE,
	OPEN,
	HIGH,
	LOW,
	VOLUME,
	TYPICAL,        // (high + low + close) / 3
	MEDIAN,         // (high + low) / 2
	CHANGE_PCT,     // close vs previous close, in percent
	GAP_PCT,        // open vs previous close, in percent
	RANGE,          // high - low
	BODY            // |close - open|
      };

    explicit PriceRef(Component component)
      : mComponent(component)
    {}

    std::string getKey() const override
    {
      switch (mComponent)
	{
	case Component::CLOSE:
	  return "close";
	case Component::OPEN:
	  return "open";
	case Component::HIGH:
	  return "high";
	case Component::LOW:
	  return "low";
	case Component::VOLUME:
	  return "volume";
	case Component::TYPICAL:
	  return "typical_price";
	case Component::MEDIAN:
	  return "median_price";
	case Component::CHANGE_PCT:
	  return "price_change_pct";
	case Component::GAP_PCT:
	  return "gap_pct";
	case Component::RANGE:
	  return "candle_range";
	case Component::BODY:
	  return "candle_body";
	}
      return "price";
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return IndicatorRequestList();
    }

    std::optional<double> value(const StrategyContext& context) const override
    {
      return valueAt(context, context.getIndex());
    }

    std::optional<double> previousValue(const StrategyContext& context) const override
    {
      if (context.getIndex() == 0)
	return std::nullopt;

      return valueAt(context, context.getIndex() - 1);
    }

  private:
    std::optional<double> valueAt(const StrategyContext& context, std::size_t index) const
    {
      const Candle *candle = context.getCandleAt(index);
      if (!candle)
	return std::nullopt;

      switch (mComponent)
	{
	case Component::CLOSE:
	  return candle->getClose();
	case Component::OPEN:
	  return candle->getOpen();
	case Component::HIGH:
	  return candle->getHigh();
	case Component::LOW:
	  return candle->getLow();
	case Component::VOLUME:
	  return candle->getVolume();
	case Component::TYPICAL:
	  return (candle->getHigh() + candle->getLow() + candle->getClose()) / 3.0;
	case Component::MEDIAN:
	  return (candle->getHigh() + candle->getLow()) / 2.0;
	case Component::RANGE:
	  return candle->getHigh() - candle->getLow();
	case Component::BODY:
	  return std::abs(candle->getClose() - candle->getOpen());
	case Component::CHANGE_PCT:
	case Component::GAP_PCT:
	  {
	    if (index == 0)
	      return std::nullopt;

	    const double prevClose = context.getCandleAt(index - 1)->getClose();
	    if (prevClose == 0.0)
	      return 0.0;

	    const double current = mComponent == Component::CHANGE_PCT ?
	      candle->getClose() : candle->getOpen();
	    return (current - prevClose) / prevClose * 100.0;
	  }
	}
      return std::nullopt;
    }

  private:
    Component mComponent;
  };

  /**
   * @class ComputedRef
   * @brief Reads a precomputed indicator series.
   *
   * The request key is what the engine is asked to compute; the lookup key
   * is where the value is stored. They differ only for compound indicators,
   * whose outputs live under fixed keys (macd_line, bollinger_upper, ...).
   */
  class ComputedRef : public IndicatorRef
  {
  public:
    ComputedRef(const std::string& requestKey,
		const IndicatorSpec& spec,
		const std::string& lookupKey)
      : mRequestKey(requestKey),
	mSpec(spec),
	mLookupKey(lookupKey)
    {}

    ComputedRef(const std::string& key, const IndicatorSpec& spec)
      : ComputedRef(key, spec, key)
    {}

    std::string getKey() const override
    {
      return mLookupKey;
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return IndicatorRequestList{IndicatorRequest(mRequestKey, mSpec)};
    }

    std::optional<double> value(const StrategyContext& context) const override
    {
      return context.getIndicator(mLookupKey);
    }

    std::optional<double> previousValue(const StrategyContext& context) const override
    {
      return context.getIndicatorPrev(mLookupKey);
    }

  private:
    std::string mRequestKey;
    IndicatorSpec mSpec;
    std::string mLookupKey;
  };

  namespace refs
  {
    inline IndicatorRefPtr close()
    {
      return std::make_shared<PriceRef>(PriceRef::Component::CLOSE);
    }

    inline IndicatorRefPtr open()
    {
      return std::make_shared<PriceRef>(PriceRef::Component::OPEN);
    }

    inline IndicatorRefPtr high()
    {
      return std::make_shared<PriceRef>(PriceRef::Component::HIGH);
    }

    inline IndicatorRefPtr low()
    {
      return std::make_shared<PriceRef>(PriceRef::Component::LOW);
    }

    inline IndicatorRefPtr volume()
    {
      return std::make_shared<PriceRef>(PriceRef::Component::VOLUME);
    }

    inline IndicatorRefPtr typicalPrice()
    {
      return std::make_shared<PriceRef>(PriceRef::Component::TYPICAL);
    }

    inline IndicatorRefPtr medianPrice()
    {
      return std::make_shared<PriceRef>(PriceRef::Component::MEDIAN);
    }

    inline IndicatorRefPtr priceChangePct()
    {
      return std::make_shared<PriceRef>(PriceRef::Component::CHANGE_PCT);
    }

    inline IndicatorRefPtr gapPct()
    {
      return std::make_shared<PriceRef>(PriceRef::Component::GAP_PCT);
    }

    inline IndicatorRefPtr candleRange()
    {
      return std::make_shared<PriceRef>(PriceRef::Component::RANGE);
    }

    inline IndicatorRefPtr candleBody()
    {
      return std::make_shared<PriceRef>(PriceRef::Component::BODY);
    }

    inline IndicatorRefPtr sma(std::size_t period)
    {
      return std::make_shared<ComputedRef>("sma_" + std::to_string(period),
					   IndicatorSpec::sma(period));
    }

    inline IndicatorRefPtr ema(std::size_t period)
    {
      return std::make_shared<ComputedRef>("ema_" + std::to_string(period),
					   IndicatorSpec::ema(period));
    }

    inline IndicatorRefPtr rsi(std::size_t period)
    {
      return std::make_shared<ComputedRef>("rsi_" + std::to_string(period),
					   IndicatorSpec::rsi(period));
    }

    inline IndicatorRefPtr atr(std::size_t period)
    {
      return std::make_shared<ComputedRef>("atr_" + std::to_string(period),
					   IndicatorSpec::atr(period));
    }

    namespace detail
    {
      inline std::string macdKey(std::size_t fast, std::size_t slow, std::size_t signal)
      {
	std::ostringstream os;
	os << "macd_" << fast << "_" << slow << "_" << signal;
	return os.str();
      }

      inline std::string bandKey(const char *prefix, std::size_t period, double multiplier)
      {
	std::ostringstream os;
	os << prefix << "_" << period << "_" << multiplier;
	return os.str();
      }
    }

    inline IndicatorRefPtr macdLine(std::size_t fast, std::size_t slow, std::size_t signal)
    {
      return std::make_shared<ComputedRef>(detail::macdKey(fast, slow, signal),
					   IndicatorSpec::macd(fast, slow, signal),
					   "macd_line");
    }

    inline IndicatorRefPtr macdSignal(std::size_t fast, std::size_t slow, std::size_t signal)
    {
      return std::make_shared<ComputedRef>(detail::macdKey(fast, slow, signal),
					   IndicatorSpec::macd(fast, slow, signal),
					   "macd_signal");
    }

    inline IndicatorRefPtr macdHistogram(std::size_t fast, std::size_t slow, std::size_t signal)
    {
      return std::make_shared<ComputedRef>(detail::macdKey(fast, slow, signal),
					   IndicatorSpec::macd(fast, slow, signal),
					   "macd_histogram");
    }

    inline IndicatorRefPtr bollingerUpper(std::size_t period, double stdDev)
    {
      return std::make_shared<ComputedRef>(detail::bandKey("bollinger", period, stdDev),
					   IndicatorSpec::bollinger(period, stdDev),
					   "bollinger_upper");
    }

    inline IndicatorRefPtr bollingerMiddle(std::size_t period, double stdDev)
    {
      return std::make_shared<ComputedRef>(detail::bandKey("bollinger", period, stdDev),
					   IndicatorSpec::bollinger(period, stdDev),
					   "bollinger_middle");
    }

    inline IndicatorRefPtr bollingerLower(std::size_t period, double stdDev)
    {
      return std::make_shared<ComputedRef>(detail::bandKey("bollinger", period, stdDev),
					   IndicatorSpec::bollinger(period, stdDev),
					   "bollinger_lower");
    }

    inline IndicatorRefPtr donchianUpper(std::size_t period)
    {
      return std::make_shared<ComputedRef>("donchian_" + std::to_string(period),
					   IndicatorSpec::donchian(period),
					   "donchian_upper");
    }

    inline IndicatorRefPtr donchianMiddle(std::size_t period)
    {
      return std::make_shared<ComputedRef>("donchian_" + std::to_string(period),
					   IndicatorSpec::donchian(period),
					   "donchian_middle");
    }

    inline IndicatorRefPtr donchianLower(std::size_t period)
    {
      return std::make_shared<ComputedRef>("donchian_" + std::to_string(period),
					   IndicatorSpec::donchian(period),
					   "donchian_lower");
    }

    inline IndicatorRefPtr supertrendValue(std::size_t period, double multiplier)
    {
      return std::make_shared<ComputedRef>(detail::bandKey("supertrend", period, multiplier),
					   IndicatorSpec::supertrend(period, multiplier),
					   "supertrend_value");
    }

    inline IndicatorRefPtr supertrendUptrend(std::size_t period, double multiplier)
    {
      return std::make_shared<ComputedRef>(detail::bandKey("supertrend", period, multiplier),
					   IndicatorSpec::supertrend(period, multiplier),
					   "supertrend_uptrend");
    }
  }
}

#endif
