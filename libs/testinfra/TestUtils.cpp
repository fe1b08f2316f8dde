#include <cmath>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "TestUtils.h"

using namespace mkc_backtest;
using namespace boost::gregorian;
using namespace boost::posix_time;

ptime testDay(std::size_t dayOffset)
{
  return ptime(date(2020, Jan, 1) + days(static_cast<long>(dayOffset)));
}

CandleSeries makeCandles(const std::vector<double>& closes)
{
  CandleSeries candles;
  candles.reserve(closes.size());
  for (std::size_t i = 0; i < closes.size(); ++i)
    {
      const double c = closes[i];
      candles.emplace_back(testDay(i), c, c + 1.0, c - 1.0, c, 1000.0);
    }
  return candles;
}

CandleSeries makeFlatCandles(std::size_t numBars, double price)
{
  return makeCandles(std::vector<double>(numBars, price));
}

CandleSeries makeTrendCandles(std::size_t numBars, double start, double step)
{
  std::vector<double> closes;
  for (std::size_t i = 0; i < numBars; ++i)
    closes.push_back(start + step * static_cast<double>(i));
  return makeCandles(closes);
}

CandleSeries makeWaveCandles(std::size_t numBars, double base, double amplitude, double period)
{
  const double pi = std::acos(-1.0);
  std::vector<double> closes;
  for (std::size_t i = 0; i < numBars; ++i)
    closes.push_back(base + amplitude * std::sin(2.0 * pi * static_cast<double>(i) / period));
  return makeCandles(closes);
}

Trade makeTrade(PositionSide side,
		std::size_t entryDay,
		std::size_t exitDay,
		double entryPrice,
		double exitPrice,
		double quantity)
{
  const Signal entry(testDay(entryDay), entryPrice,
		     side == PositionSide::LONG ? SignalDirection::LONG : SignalDirection::SHORT);
  const Position position(side, testDay(entryDay), entryPrice, quantity, 0.0, entry);
  return position.close(testDay(exitDay), exitPrice, 0.0,
			Signal::exitSignal(testDay(exitDay), exitPrice));
}

ScriptedStrategy::ScriptedStrategy(std::map<std::size_t, SignalDirection> script,
				   std::size_t warmup,
				   double strength)
  : mScript(std::move(script)),
    mWarmup(warmup),
    mStrength(strength)
{}

std::string ScriptedStrategy::getName() const
{
  return "Scripted";
}

IndicatorRequestList ScriptedStrategy::getRequiredIndicators() const
{
  return IndicatorRequestList();
}

std::size_t ScriptedStrategy::getWarmupPeriod() const
{
  return mWarmup;
}

Signal ScriptedStrategy::onCandle(const StrategyContext& context) const
{
  auto it = mScript.find(context.getIndex());
  if (it == mScript.end())
    return context.signalHold();

  return Signal(context.getTimestamp(), context.getClose(), it->second,
		SignalStrength(mStrength), std::string("scripted"));
}
