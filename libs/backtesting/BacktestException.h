// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_EXCEPTION_H
#define __BACKTEST_EXCEPTION_H 1

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mkc_backtest
{
  class BacktestException : public std::runtime_error
  {
  public:
    BacktestException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~BacktestException() = default;
  };

  /**
   * @brief Not enough bars to satisfy a warmup period or a window size.
   *
   * Sweeps (grid search, walk-forward) treat this as "skip this unit" rather
   * than as a failure. A direct engine run surfaces it to the caller.
   */
  class InsufficientDataException : public BacktestException
  {
  public:
    InsufficientDataException(std::size_t required, std::size_t available)
      : BacktestException("Insufficient data: need " + std::to_string(required) +
			  " bars, got " + std::to_string(available)),
	mRequired(required),
	mAvailable(available)
    {}

    std::size_t getRequired() const
    {
      return mRequired;
    }

    std::size_t getAvailable() const
    {
      return mAvailable;
    }

  private:
    std::size_t mRequired;
    std::size_t mAvailable;
  };

  /**
   * @brief Malformed configuration or an unusable sweep outcome.
   */
  class InvalidParameterException : public BacktestException
  {
  public:
    InvalidParameterException(const std::string& name, const std::string& reason)
      : BacktestException("Invalid parameter '" + name + "': " + reason),
	mName(name),
	mReason(reason)
    {}

    const std::string& getName() const
    {
      return mName;
    }

    const std::string& getReason() const
    {
      return mReason;
    }

  private:
    std::string mName;
    std::string mReason;
  };
}

#endif
