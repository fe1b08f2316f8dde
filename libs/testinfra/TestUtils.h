#ifndef __BACKTEST_TEST_UTILS_H
#define __BACKTEST_TEST_UTILS_H 1

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "BacktestStrategy.h"
#include "Candle.h"
#include "Position.h"
#include "Signal.h"

// Daily bar timestamp: 2020-01-01 plus dayOffset days.
mkc_backtest::ptime testDay(std::size_t dayOffset);

// One candle per close; open == close, high/low one point either side.
mkc_backtest::CandleSeries makeCandles(const std::vector<double>& closes);

mkc_backtest::CandleSeries makeFlatCandles(std::size_t numBars, double price);

mkc_backtest::CandleSeries makeTrendCandles(std::size_t numBars, double start, double step);

// Sine wave around base; crosses its own moving averages every half period.
mkc_backtest::CandleSeries makeWaveCandles(std::size_t numBars,
					   double base = 100.0,
					   double amplitude = 10.0,
					   double period = 20.0);

// Closed trade with zero commission built through Position::close().
mkc_backtest::Trade makeTrade(mkc_backtest::PositionSide side,
			      std::size_t entryDay,
			      std::size_t exitDay,
			      double entryPrice,
			      double exitPrice,
			      double quantity = 10.0);

/**
 * Emits a fixed signal direction at chosen bar indices and HOLD elsewhere.
 */
class ScriptedStrategy : public mkc_backtest::BacktestStrategy
{
public:
  explicit ScriptedStrategy(std::map<std::size_t, mkc_backtest::SignalDirection> script,
			    std::size_t warmup = 1,
			    double strength = 1.0);

  std::string getName() const override;
  mkc_backtest::IndicatorRequestList getRequiredIndicators() const override;
  std::size_t getWarmupPeriod() const override;
  mkc_backtest::Signal onCandle(const mkc_backtest::StrategyContext& context) const override;

private:
  std::map<std::size_t, mkc_backtest::SignalDirection> mScript;
  std::size_t mWarmup;
  double mStrength;
};

#endif
