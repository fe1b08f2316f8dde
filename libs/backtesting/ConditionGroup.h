// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __CONDITION_GROUP_H
#define __CONDITION_GROUP_H 1

#include <string>
#include <vector>
#include "Condition.h"

namespace mkc_backtest
{
  enum class LogicalOperator
    {
      AND,
      OR
    };

  inline const char *toString(LogicalOperator op)
  {
    return op == LogicalOperator::AND ? "AND" : "OR";
  }

  /**
   * @class ConditionGroup
   * @brief An ordered list of conditions joined by per-element operators.
   *
   * Element i carries the operator that joins it to element i + 1; the
   * operator of the last element is unused. Evaluation folds left to right
   * without precedence: a AND b OR c is ((a AND b) OR c). A false
   * accumulator skips the right-hand side of AND and a true one skips the
   * right-hand side of OR. An empty group is false.
   */
  class ConditionGroup : public Condition
  {
  public:
    struct Element
    {
      ConditionPtr condition;
      LogicalOperator next;
    };

    ConditionGroup()
      : mElements()
    {}

    ConditionGroup& add(ConditionPtr condition, LogicalOperator next = LogicalOperator::AND)
    {
      detail::requireCondition(condition, "group");
      mElements.push_back(Element{std::move(condition), next});
      return *this;
    }

    void remove(std::size_t index)
    {
      checkIndex(index);
      mElements.erase(mElements.begin() + index);
    }

    void setOperator(std::size_t index, LogicalOperator op)
    {
      checkIndex(index);
      mElements[index].next = op;
    }

    // Flip AND <-> OR on the element at index.
    void toggleOperator(std::size_t index)
    {
      checkIndex(index);
      mElements[index].next = mElements[index].next == LogicalOperator::AND ?
	LogicalOperator::OR : LogicalOperator::AND;
    }

    LogicalOperator getOperator(std::size_t index) const
    {
      checkIndex(index);
      return mElements[index].next;
    }

    const std::vector<Element>& getElements() const
    {
      return mElements;
    }

    std::size_t size() const
    {
      return mElements.size();
    }

    bool empty() const
    {
      return mElements.empty();
    }

    bool evaluate(const StrategyContext& context) const override
    {
      if (mElements.empty())
	return false;

      bool result = mElements.front().condition->evaluate(context);
      for (std::size_t i = 1; i < mElements.size(); ++i)
	{
	  if (mElements[i - 1].next == LogicalOperator::AND)
	    {
	      if (result)
		result = mElements[i].condition->evaluate(context);
	    }
	  else if (!result)
	    result = mElements[i].condition->evaluate(context);
	}
      return result;
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      IndicatorRequestList result;
      for (const auto& element : mElements)
	mergeIndicatorRequests(result, element.condition->getRequiredIndicators());
      return result;
    }

    std::string getDescription() const override
    {
      std::string result;
      for (std::size_t i = 0; i < mElements.size(); ++i)
	{
	  if (i > 0)
	    {
	      result += " ";
	      result += toString(mElements[i - 1].next);
	      result += " ";
	    }
	  result += mElements[i].condition->getDescription();
	}
      return result;
    }

  private:
    void checkIndex(std::size_t index) const
    {
      if (index >= mElements.size())
	throw InvalidParameterException("index", "condition group has " +
					std::to_string(mElements.size()) + " elements");
    }

  private:
    std::vector<Element> mElements;
  };
}

#endif
