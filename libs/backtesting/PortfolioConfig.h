// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PORTFOLIO_CONFIG_H
#define __PORTFOLIO_CONFIG_H 1

#include <algorithm>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include "BacktestConfig.h"
#include "BacktestException.h"

namespace mkc_backtest
{
  /**
   * @brief How capital is assigned to a new position in a portfolio run.
   */
  enum class AllocationMode
    {
      AVAILABLE_CAPITAL,   // position_size_pct of the cash on hand
      EQUAL_WEIGHT,        // initial capital split over the position slots
      CUSTOM_WEIGHTS       // per-symbol fraction of initial capital
    };

  inline const char* toString(AllocationMode mode)
  {
    switch (mode)
      {
      case AllocationMode::AVAILABLE_CAPITAL:
	return "available_capital";
      case AllocationMode::EQUAL_WEIGHT:
	return "equal_weight";
      case AllocationMode::CUSTOM_WEIGHTS:
	return "custom_weights";
      }
    return "unknown";
  }

  /**
   * @class PortfolioConfig
   * @brief Settings of a multi-symbol run sharing one cash pool.
   *
   * The wrapped BacktestConfig supplies the costs, exits and sizing used for
   * every symbol. The position cap is maxTotalPositions when set, otherwise
   * the base config's max_positions.
   */
  class PortfolioConfig
  {
  public:
    explicit PortfolioConfig(const BacktestConfig& base = BacktestConfig())
      : mBase(base),
	mMaxAllocationPerSymbol(),
	mMaxTotalPositions(),
	mMode(AllocationMode::AVAILABLE_CAPITAL),
	mWeights()
    {}

    PortfolioConfig& maxAllocationPerSymbol(double pct)
    {
      mMaxAllocationPerSymbol = pct;
      return *this;
    }

    PortfolioConfig& maxTotalPositions(std::size_t count)
    {
      mMaxTotalPositions = count;
      return *this;
    }

    PortfolioConfig& allocation(AllocationMode mode)
    {
      mMode = mode;
      return *this;
    }

    /**
     * @brief Switch to CUSTOM_WEIGHTS and set the weight of @p symbol.
     * Symbols without a weight receive no capital.
     */
    PortfolioConfig& weight(const std::string& symbol, double fraction)
    {
      mMode = AllocationMode::CUSTOM_WEIGHTS;
      mWeights[symbol] = fraction;
      return *this;
    }

    const BacktestConfig& getBase() const
    {
      return mBase;
    }

    const std::optional<double>& getMaxAllocationPerSymbol() const
    {
      return mMaxAllocationPerSymbol;
    }

    std::optional<std::size_t> getMaxTotalPositions() const
    {
      return mMaxTotalPositions ? mMaxTotalPositions : mBase.getMaxPositions();
    }

    AllocationMode getAllocationMode() const
    {
      return mMode;
    }

    const std::map<std::string, double>& getWeights() const
    {
      return mWeights;
    }

    void validate(std::size_t numSymbols) const
    {
      mBase.validate();

      if (mMaxAllocationPerSymbol &&
	  !(*mMaxAllocationPerSymbol >= 0.0 && *mMaxAllocationPerSymbol <= 1.0))
	throw InvalidParameterException("max_allocation_per_symbol", "must be between 0 and 1");

      if (mMaxTotalPositions && *mMaxTotalPositions == 0)
	throw InvalidParameterException("max_total_positions", "must be at least 1");

      for (const auto& w : mWeights)
	{
	  if (!(w.second >= 0.0 && w.second <= 1.0))
	    throw InvalidParameterException(w.first, "custom weight must be between 0 and 1");
	}

      if (numSymbols == 0)
	throw InvalidParameterException("symbol_data", "at least one symbol is required");
    }

    /**
     * @brief Capital to commit to a new position in @p symbol, before
     * commission. Never more than @p availableCash and never negative.
     */
    double allocationTarget(const std::string& symbol,
			    double availableCash,
			    double initialCapital,
			    std::size_t numSymbols) const
    {
      double target = 0.0;
      switch (mMode)
	{
	case AllocationMode::AVAILABLE_CAPITAL:
	  target = availableCash * mBase.getPositionSizePct();
	  break;

	case AllocationMode::EQUAL_WEIGHT:
	  {
	    std::size_t slots = numSymbols;
	    const std::optional<std::size_t> cap = getMaxTotalPositions();
	    if (cap)
	      slots = std::min(slots, *cap);
	    target = initialCapital / static_cast<double>(std::max<std::size_t>(slots, 1));
	  }
	  break;

	case AllocationMode::CUSTOM_WEIGHTS:
	  {
	    const auto it = mWeights.find(symbol);
	    target = it == mWeights.end() ? 0.0 : initialCapital * it->second;
	  }
	  break;
	}

      const double cap = mMaxAllocationPerSymbol ? initialCapital * *mMaxAllocationPerSymbol
	: std::numeric_limits<double>::max();
      return std::max(0.0, std::min(std::min(target, cap), availableCash));
    }

  private:
    BacktestConfig mBase;
    std::optional<double> mMaxAllocationPerSymbol;
    std::optional<std::size_t> mMaxTotalPositions;
    AllocationMode mMode;
    std::map<std::string, double> mWeights;
  };
}

#endif
