// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EQUITY_POINT_H
#define __EQUITY_POINT_H 1

#include <vector>
#include "Candle.h"

namespace mkc_backtest
{
  // Account value after the bar at timestamp was processed.
  struct EquityPoint
  {
    ptime timestamp;
    double equity;
    double drawdownPct;   // fraction below the running peak, 0.1 == 10%
  };

  using EquityCurve = std::vector<EquityPoint>;
}

#endif
