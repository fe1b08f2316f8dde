// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __COMPARISON_CONDITIONS_H
#define __COMPARISON_CONDITIONS_H 1

#include <cmath>
#include <cstdio>
#include <string>
#include "Condition.h"
#include "IndicatorRef.h"

namespace mkc_backtest
{
  namespace detail
  {
    inline std::string formatValue(double value, int precision = 2)
    {
      char buf[64];
      std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
      return std::string(buf);
    }

    inline void requireRef(const IndicatorRefPtr& ref, const char *owner)
    {
      if (!ref)
	throw InvalidParameterException(owner, "indicator reference must not be null");
    }
  }

  /**
   * @class ThresholdCondition
   * @brief Compares one indicator reference against a constant.
   *
   * A missing current (or, for crosses, previous) value evaluates to false.
   */
  class ThresholdCondition : public Condition
  {
  public:
    enum class Comparison
      {
	ABOVE,          // v > t
	BELOW,          // v < t
	CROSSES_ABOVE,  // prev <= t && v > t
	CROSSES_BELOW   // prev >= t && v < t
      };

    ThresholdCondition(IndicatorRefPtr indicator, Comparison comparison, double threshold)
      : mIndicator(std::move(indicator)),
	mComparison(comparison),
	mThreshold(threshold)
    {
      detail::requireRef(mIndicator, "threshold");
    }

    bool evaluate(const StrategyContext& context) const override
    {
      const auto current = mIndicator->value(context);
      if (!current)
	return false;

      switch (mComparison)
	{
	case Comparison::ABOVE:
	  return *current > mThreshold;
	case Comparison::BELOW:
	  return *current < mThreshold;
	case Comparison::CROSSES_ABOVE:
	  {
	    const auto previous = mIndicator->previousValue(context);
	    return previous && *previous <= mThreshold && *current > mThreshold;
	  }
	case Comparison::CROSSES_BELOW:
	  {
	    const auto previous = mIndicator->previousValue(context);
	    return previous && *previous >= mThreshold && *current < mThreshold;
	  }
	}
      return false;
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return mIndicator->getRequiredIndicators();
    }

    std::string getDescription() const override
    {
      const std::string value = detail::formatValue(mThreshold);
      switch (mComparison)
	{
	case Comparison::ABOVE:
	  return mIndicator->getKey() + " > " + value;
	case Comparison::BELOW:
	  return mIndicator->getKey() + " < " + value;
	case Comparison::CROSSES_ABOVE:
	  return mIndicator->getKey() + " crosses above " + value;
	case Comparison::CROSSES_BELOW:
	  return mIndicator->getKey() + " crosses below " + value;
	}
      return mIndicator->getKey();
    }

  private:
    IndicatorRefPtr mIndicator;
    Comparison mComparison;
    double mThreshold;
  };

  // Strictly inside (low, high).
  class BetweenCondition : public Condition
  {
  public:
    BetweenCondition(IndicatorRefPtr indicator, double low, double high)
      : mIndicator(std::move(indicator)),
	mLow(low),
	mHigh(high)
    {
      detail::requireRef(mIndicator, "between");
    }

    bool evaluate(const StrategyContext& context) const override
    {
      const auto current = mIndicator->value(context);
      return current && *current > mLow && *current < mHigh;
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return mIndicator->getRequiredIndicators();
    }

    std::string getDescription() const override
    {
      return detail::formatValue(mLow) + " < " + mIndicator->getKey() + " < " +
	detail::formatValue(mHigh);
    }

  private:
    IndicatorRefPtr mIndicator;
    double mLow;
    double mHigh;
  };

  class EqualsCondition : public Condition
  {
  public:
    EqualsCondition(IndicatorRefPtr indicator, double value, double tolerance)
      : mIndicator(std::move(indicator)),
	mValue(value),
	mTolerance(tolerance)
    {
      detail::requireRef(mIndicator, "equals");
      if (!(tolerance >= 0.0))
	throw InvalidParameterException("tolerance", "must be non-negative");
    }

    bool evaluate(const StrategyContext& context) const override
    {
      const auto current = mIndicator->value(context);
      return current && std::abs(*current - mValue) <= mTolerance;
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return mIndicator->getRequiredIndicators();
    }

    std::string getDescription() const override
    {
      return mIndicator->getKey() + " ~= " + detail::formatValue(mValue) +
	" (+/-" + detail::formatValue(mTolerance, 4) + ")";
    }

  private:
    IndicatorRefPtr mIndicator;
    double mValue;
    double mTolerance;
  };

  /**
   * @class CrossReferenceCondition
   * @brief Compares two indicator references on the same bar.
   *
   * Crosses use prev(a) <= prev(b) && a > b (and the mirror for below).
   */
  class CrossReferenceCondition : public Condition
  {
  public:
    using Comparison = ThresholdCondition::Comparison;

    CrossReferenceCondition(IndicatorRefPtr left, Comparison comparison, IndicatorRefPtr right)
      : mLeft(std::move(left)),
	mComparison(comparison),
	mRight(std::move(right))
    {
      detail::requireRef(mLeft, "compare");
      detail::requireRef(mRight, "compare");
    }

    bool evaluate(const StrategyContext& context) const override
    {
      const auto a = mLeft->value(context);
      const auto b = mRight->value(context);
      if (!a || !b)
	return false;

      switch (mComparison)
	{
	case Comparison::ABOVE:
	  return *a > *b;
	case Comparison::BELOW:
	  return *a < *b;
	case Comparison::CROSSES_ABOVE:
	case Comparison::CROSSES_BELOW:
	  {
	    const auto ap = mLeft->previousValue(context);
	    const auto bp = mRight->previousValue(context);
	    if (!ap || !bp)
	      return false;

	    if (mComparison == Comparison::CROSSES_ABOVE)
	      return *ap <= *bp && *a > *b;
	    return *ap >= *bp && *a < *b;
	  }
	}
      return false;
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      IndicatorRequestList result = mLeft->getRequiredIndicators();
      mergeIndicatorRequests(result, mRight->getRequiredIndicators());
      return result;
    }

    std::string getDescription() const override
    {
      const char *op = "";
      switch (mComparison)
	{
	case Comparison::ABOVE:
	  op = " > ";
	  break;
	case Comparison::BELOW:
	  op = " < ";
	  break;
	case Comparison::CROSSES_ABOVE:
	  op = " crosses above ";
	  break;
	case Comparison::CROSSES_BELOW:
	  op = " crosses below ";
	  break;
	}
      return mLeft->getKey() + op + mRight->getKey();
    }

  private:
    IndicatorRefPtr mLeft;
    Comparison mComparison;
    IndicatorRefPtr mRight;
  };

  inline ConditionPtr above(IndicatorRefPtr indicator, double threshold)
  {
    return std::make_shared<ThresholdCondition>(std::move(indicator),
						ThresholdCondition::Comparison::ABOVE, threshold);
  }

  inline ConditionPtr below(IndicatorRefPtr indicator, double threshold)
  {
    return std::make_shared<ThresholdCondition>(std::move(indicator),
						ThresholdCondition::Comparison::BELOW, threshold);
  }

  inline ConditionPtr crossesAbove(IndicatorRefPtr indicator, double threshold)
  {
    return std::make_shared<ThresholdCondition>(std::move(indicator),
						ThresholdCondition::Comparison::CROSSES_ABOVE,
						threshold);
  }

  inline ConditionPtr crossesBelow(IndicatorRefPtr indicator, double threshold)
  {
    return std::make_shared<ThresholdCondition>(std::move(indicator),
						ThresholdCondition::Comparison::CROSSES_BELOW,
						threshold);
  }

  inline ConditionPtr between(IndicatorRefPtr indicator, double low, double high)
  {
    return std::make_shared<BetweenCondition>(std::move(indicator), low, high);
  }

  inline ConditionPtr equals(IndicatorRefPtr indicator, double value, double tolerance = 1e-4)
  {
    return std::make_shared<EqualsCondition>(std::move(indicator), value, tolerance);
  }

  inline ConditionPtr above(IndicatorRefPtr left, IndicatorRefPtr right)
  {
    return std::make_shared<CrossReferenceCondition>(std::move(left),
						     ThresholdCondition::Comparison::ABOVE,
						     std::move(right));
  }

  inline ConditionPtr below(IndicatorRefPtr left, IndicatorRefPtr right)
  {
    return std::make_shared<CrossReferenceCondition>(std::move(left),
						     ThresholdCondition::Comparison::BELOW,
						     std::move(right));
  }

  inline ConditionPtr crossesAbove(IndicatorRefPtr fast, IndicatorRefPtr slow)
  {
    return std::make_shared<CrossReferenceCondition>(std::move(fast),
						     ThresholdCondition::Comparison::CROSSES_ABOVE,
						     std::move(slow));
  }

  inline ConditionPtr crossesBelow(IndicatorRefPtr fast, IndicatorRefPtr slow)
  {
    return std::make_shared<CrossReferenceCondition>(std::move(fast),
						     ThresholdCondition::Comparison::CROSSES_BELOW,
						     std::move(slow));
  }
}

#endif
