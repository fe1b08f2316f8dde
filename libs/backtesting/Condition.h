// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __CONDITION_H
#define __CONDITION_H 1

#include <memory>
#include <string>
#include <vector>
#include "IndicatorSpec.h"
#include "StrategyContext.h"
#include "BacktestException.h"

namespace mkc_backtest
{
  /**
   * @class Condition
   * @brief A boolean predicate over the simulation state at one bar.
   */
  class Condition
  {
  public:
    virtual ~Condition()
    {}

    virtual bool evaluate(const StrategyContext& context) const = 0;

    // Indicators this predicate reads; empty for price and position checks.
    virtual IndicatorRequestList getRequiredIndicators() const
    {
      return IndicatorRequestList();
    }

    virtual std::string getDescription() const = 0;
  };

  using ConditionPtr = std::shared_ptr<Condition>;

  namespace detail
  {
    inline void requireCondition(const ConditionPtr& condition, const char *owner)
    {
      if (!condition)
	throw InvalidParameterException(owner, "condition must not be null");
    }

    inline std::string joinDescriptions(const std::vector<ConditionPtr>& conditions,
					const char *separator)
    {
      std::string result;
      for (std::size_t i = 0; i < conditions.size(); ++i)
	{
	  if (i > 0)
	    result += separator;
	  result += conditions[i]->getDescription();
	}
      return result;
    }

    inline IndicatorRequestList collectIndicators(const std::vector<ConditionPtr>& conditions)
    {
      IndicatorRequestList result;
      for (const auto& condition : conditions)
	mergeIndicatorRequests(result, condition->getRequiredIndicators());
      return result;
    }
  }

  class AndCondition : public Condition
  {
  public:
    AndCondition(ConditionPtr left, ConditionPtr right)
      : mLeft(std::move(left)),
	mRight(std::move(right))
    {
      detail::requireCondition(mLeft, "and");
      detail::requireCondition(mRight, "and");
    }

    bool evaluate(const StrategyContext& context) const override
    {
      return mLeft->evaluate(context) && mRight->evaluate(context);
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return detail::collectIndicators({mLeft, mRight});
    }

    std::string getDescription() const override
    {
      return "(" + mLeft->getDescription() + " AND " + mRight->getDescription() + ")";
    }

  private:
    ConditionPtr mLeft;
    ConditionPtr mRight;
  };

  class OrCondition : public Condition
  {
  public:
    OrCondition(ConditionPtr left, ConditionPtr right)
      : mLeft(std::move(left)),
	mRight(std::move(right))
    {
      detail::requireCondition(mLeft, "or");
      detail::requireCondition(mRight, "or");
    }

    bool evaluate(const StrategyContext& context) const override
    {
      return mLeft->evaluate(context) || mRight->evaluate(context);
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return detail::collectIndicators({mLeft, mRight});
    }

    std::string getDescription() const override
    {
      return "(" + mLeft->getDescription() + " OR " + mRight->getDescription() + ")";
    }

  private:
    ConditionPtr mLeft;
    ConditionPtr mRight;
  };

  class NotCondition : public Condition
  {
  public:
    explicit NotCondition(ConditionPtr inner)
      : mInner(std::move(inner))
    {
      detail::requireCondition(mInner, "not");
    }

    bool evaluate(const StrategyContext& context) const override
    {
      return !mInner->evaluate(context);
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return mInner->getRequiredIndicators();
    }

    std::string getDescription() const override
    {
      return "NOT (" + mInner->getDescription() + ")";
    }

  private:
    ConditionPtr mInner;
  };

  /**
   * @brief True when every member is true. An empty set is true.
   */
  class AllCondition : public Condition
  {
  public:
    explicit AllCondition(std::vector<ConditionPtr> conditions)
      : mConditions(std::move(conditions))
    {
      for (const auto& c : mConditions)
	detail::requireCondition(c, "all");
    }

    bool evaluate(const StrategyContext& context) const override
    {
      for (const auto& c : mConditions)
	{
	  if (!c->evaluate(context))
	    return false;
	}
      return true;
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return detail::collectIndicators(mConditions);
    }

    std::string getDescription() const override
    {
      return "ALL(" + detail::joinDescriptions(mConditions, " AND ") + ")";
    }

  private:
    std::vector<ConditionPtr> mConditions;
  };

  /**
   * @brief True when at least one member is true. An empty set is false.
   */
  class AnyCondition : public Condition
  {
  public:
    explicit AnyCondition(std::vector<ConditionPtr> conditions)
      : mConditions(std::move(conditions))
    {
      for (const auto& c : mConditions)
	detail::requireCondition(c, "any");
    }

    bool evaluate(const StrategyContext& context) const override
    {
      for (const auto& c : mConditions)
	{
	  if (c->evaluate(context))
	    return true;
	}
      return false;
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      return detail::collectIndicators(mConditions);
    }

    std::string getDescription() const override
    {
      return "ANY(" + detail::joinDescriptions(mConditions, " OR ") + ")";
    }

  private:
    std::vector<ConditionPtr> mConditions;
  };

  class ConstantCondition : public Condition
  {
  public:
    explicit ConstantCondition(bool value)
      : mValue(value)
    {}

    bool evaluate(const StrategyContext&) const override
    {
      return mValue;
    }

    std::string getDescription() const override
    {
      return mValue ? "always true" : "always false";
    }

  private:
    bool mValue;
  };

  inline ConditionPtr andOf(ConditionPtr left, ConditionPtr right)
  {
    return std::make_shared<AndCondition>(std::move(left), std::move(right));
  }

  inline ConditionPtr orOf(ConditionPtr left, ConditionPtr right)
  {
    return std::make_shared<OrCondition>(std::move(left), std::move(right));
  }

  inline ConditionPtr notOf(ConditionPtr inner)
  {
    return std::make_shared<NotCondition>(std::move(inner));
  }

  inline ConditionPtr allOf(std::vector<ConditionPtr> conditions)
  {
    return std::make_shared<AllCondition>(std::move(conditions));
  }

  inline ConditionPtr anyOf(std::vector<ConditionPtr> conditions)
  {
    return std::make_shared<AnyCondition>(std::move(conditions));
  }

  inline ConditionPtr alwaysTrue()
  {
    return std::make_shared<ConstantCondition>(true);
  }

  inline ConditionPtr alwaysFalse()
  {
    return std::make_shared<ConstantCondition>(false);
  }
}

#endif
