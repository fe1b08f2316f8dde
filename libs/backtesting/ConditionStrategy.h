// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __CONDITION_STRATEGY_H
#define __CONDITION_STRATEGY_H 1

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include "BacktestStrategy.h"
#include "Condition.h"

namespace mkc_backtest
{
  /**
   * @class CustomStrategy
   * @brief A strategy assembled from entry and exit conditions.
   *
   * Evaluation order on each bar:
   *   1. long position and exit condition true        -> Exit
   *   2. short position and short exit condition true -> Exit
   *   3. flat and entry condition true                -> Long
   *   4. flat and short entry condition true          -> Short
   *   otherwise Hold.
   * The signal reason is the description of the condition that fired.
   */
  class CustomStrategy : public BacktestStrategy
  {
  public:
    CustomStrategy(const std::string& name,
		   ConditionPtr entry,
		   ConditionPtr exit,
		   ConditionPtr shortEntry = ConditionPtr(),
		   ConditionPtr shortExit = ConditionPtr(),
		   std::optional<std::size_t> warmupOverride = std::nullopt)
      : BacktestStrategy(),
	mName(name),
	mEntry(std::move(entry)),
	mExit(std::move(exit)),
	mShortEntry(std::move(shortEntry)),
	mShortExit(std::move(shortExit)),
	mWarmupOverride(warmupOverride)
    {
      detail::requireCondition(mEntry, "entry");
      detail::requireCondition(mExit, "exit");
    }

    std::string getName() const override
    {
      return mName;
    }

    IndicatorRequestList getRequiredIndicators() const override
    {
      IndicatorRequestList result = mEntry->getRequiredIndicators();
      mergeIndicatorRequests(result, mExit->getRequiredIndicators());
      if (mShortEntry)
	mergeIndicatorRequests(result, mShortEntry->getRequiredIndicators());
      if (mShortExit)
	mergeIndicatorRequests(result, mShortExit->getRequiredIndicators());
      return result;
    }

    // Explicit override, else the largest indicator warmup + 1 (2 with no indicators).
    std::size_t getWarmupPeriod() const override
    {
      if (mWarmupOverride)
	return *mWarmupOverride;

      std::size_t maxWarmup = 0;
      for (const auto& request : getRequiredIndicators())
	maxWarmup = std::max(maxWarmup, request.second.getWarmupBars());

      return (maxWarmup == 0 ? 1 : maxWarmup) + 1;
    }

    Signal onCandle(const StrategyContext& context) const override
    {
      if (context.isLong() && mExit->evaluate(context))
	return context.signalExit().withReason(mExit->getDescription());

      if (context.isShort() && mShortExit && mShortExit->evaluate(context))
	return context.signalExit().withReason(mShortExit->getDescription());

      if (!context.hasPosition())
	{
	  if (mEntry->evaluate(context))
	    return context.signalLong().withReason(mEntry->getDescription());

	  if (mShortEntry && mShortEntry->evaluate(context))
	    return context.signalShort().withReason(mShortEntry->getDescription());
	}

      return context.signalHold();
    }

    bool hasShortSide() const
    {
      return static_cast<bool>(mShortEntry);
    }

  private:
    std::string mName;
    ConditionPtr mEntry;
    ConditionPtr mExit;
    ConditionPtr mShortEntry;
    ConditionPtr mShortExit;
    std::optional<std::size_t> mWarmupOverride;
  };

  /**
   * @class StrategyBuilder
   * @brief Fluent construction of a CustomStrategy.
   *
   * build() throws InvalidParameterException when the entry or exit
   * condition is missing, or when only one side of the short pair is set.
   */
  class StrategyBuilder
  {
  public:
    explicit StrategyBuilder(const std::string& name)
      : mName(name),
	mEntry(),
	mExit(),
	mShortEntry(),
	mShortExit(),
	mWarmupOverride()
    {}

    StrategyBuilder& entry(ConditionPtr condition)
    {
      mEntry = std::move(condition);
      return *this;
    }

    StrategyBuilder& exit(ConditionPtr condition)
    {
      mExit = std::move(condition);
      return *this;
    }

    StrategyBuilder& withShort(ConditionPtr entryCondition, ConditionPtr exitCondition)
    {
      mShortEntry = std::move(entryCondition);
      mShortExit = std::move(exitCondition);
      return *this;
    }

    StrategyBuilder& warmup(std::size_t bars)
    {
      mWarmupOverride = bars;
      return *this;
    }

    std::shared_ptr<CustomStrategy> build() const
    {
      if (!mEntry)
	throw InvalidParameterException("entry", "strategy '" + mName + "' has no entry condition");
      if (!mExit)
	throw InvalidParameterException("exit", "strategy '" + mName + "' has no exit condition");
      if (static_cast<bool>(mShortEntry) != static_cast<bool>(mShortExit))
	throw InvalidParameterException("short", "short entry and exit must be set together");

      return std::make_shared<CustomStrategy>(mName, mEntry, mExit, mShortEntry,
					      mShortExit, mWarmupOverride);
    }

  private:
    std::string mName;
    ConditionPtr mEntry;
    ConditionPtr mExit;
    ConditionPtr mShortEntry;
    ConditionPtr mShortExit;
    std::optional<std::size_t> mWarmupOverride;
  };
}

#endif
