// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIMESERIES_EXCEPTION_H
#define __TIMESERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_backtest
{
  class TimeSeriesException : public std::runtime_error
  {
  public:
    TimeSeriesException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~TimeSeriesException() = default;
  };

  // Raised when an indicator cannot be computed over the supplied series
  // (period too long, inconsistent input lengths, invalid arguments).
  class IndicatorException : public TimeSeriesException
  {
  public:
    explicit IndicatorException(const std::string& msg)
      : TimeSeriesException(msg) {}
  };

} // namespace mkc_backtest

#endif // __TIMESERIES_EXCEPTION_H
