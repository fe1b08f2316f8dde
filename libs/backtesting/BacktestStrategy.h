// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_STRATEGY_H
#define __BACKTEST_STRATEGY_H 1

#include <cstddef>
#include <memory>
#include <string>
#include "IndicatorSpec.h"
#include "Signal.h"
#include "StrategyContext.h"

namespace mkc_backtest
{
  /**
   * @class BacktestStrategy
   * @brief Interface for strategies driven by the BacktestEngine.
   *
   * Implementations are configuration objects. All mutable simulation state
   * lives in the engine and reaches the strategy through StrategyContext, so
   * one instance may be shared by backtests running on different threads.
   */
  class BacktestStrategy
  {
  public:
    virtual ~BacktestStrategy()
    {}

    virtual std::string getName() const = 0;

    /**
     * @brief Indicators the engine must compute before the first bar, keyed by lookup name.
     */
    virtual IndicatorRequestList getRequiredIndicators() const = 0;

    /**
     * @brief Minimum number of bars before onCandle() is first called.
     *
     * The engine consults the strategy from index getWarmupPeriod() - 1 and
     * refuses to run on fewer bars than this.
     */
    virtual std::size_t getWarmupPeriod() const
    {
      return 1;
    }

    virtual Signal onCandle(const StrategyContext& context) const = 0;
  };

  using BacktestStrategyPtr = std::shared_ptr<BacktestStrategy>;
}

#endif
