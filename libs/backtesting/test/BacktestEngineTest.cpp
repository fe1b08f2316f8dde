#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <vector>
#include "BacktestEngine.h"
#include "BacktestException.h"
#include "PrebuiltStrategies.h"
#include "TestUtils.h"

using namespace mkc_backtest;
using Catch::Approx;

namespace
{
  BacktestConfig frictionless()
  {
    return BacktestConfig().zeroCost();
  }

  bool hasDiagnostic(const BacktestResult& result, const std::string& fragment)
  {
    return std::any_of(result.diagnostics.begin(), result.diagnostics.end(),
		       [&fragment](const std::string& note) {
			 return note.find(fragment) != std::string::npos;
		       });
  }
}

TEST_CASE ("BacktestEngine with no signals", "[BacktestEngine]")
{
  BacktestEngine engine(frictionless());
  const CandleSeries candles = makeFlatCandles(10, 100.0);
  const std::map<std::size_t, SignalDirection> noScript;
  ScriptedStrategy silent(noScript);

  const BacktestResult result = engine.run("TEST", candles, silent);

  REQUIRE (result.symbol == "TEST");
  REQUIRE (result.strategyName == "Scripted");
  REQUIRE (result.trades.empty());
  REQUIRE (result.metrics.totalTrades == 0);
  REQUIRE (result.metrics.totalReturnPct == 0.0);
  REQUIRE (result.equityCurve.size() == candles.size());
  REQUIRE (result.finalEquity == Approx(10000.0));
  REQUIRE_FALSE (result.openPosition);
  REQUIRE (result.diagnostics.size() == 1);
  REQUIRE (result.diagnostics.front() ==
	   "Strategy generated no signals; check the entry conditions and warmup period");
}

TEST_CASE ("BacktestEngine long round trip", "[BacktestEngine]")
{
  BacktestEngine engine(frictionless());
  const CandleSeries candles = makeTrendCandles(10, 100.0, 1.0);
  ScriptedStrategy script({{1, SignalDirection::LONG}, {5, SignalDirection::EXIT}});

  const BacktestResult result = engine.run("TREND", candles, script);

  REQUIRE (result.trades.size() == 1);
  const Trade& trade = result.trades.front();
  REQUIRE (trade.isLong());
  REQUIRE (trade.getEntryPrice() == Approx(101.0));
  REQUIRE (trade.getExitPrice() == Approx(105.0));
  REQUIRE (trade.getEntryTimestamp() == testDay(1));
  REQUIRE (trade.getExitTimestamp() == testDay(5));
  REQUIRE (trade.getPnl() == Approx(10000.0 / 101.0 * 4.0));

  REQUIRE (result.finalEquity == Approx(10000.0 + trade.getPnl()));
  REQUIRE (result.metrics.totalTrades == 1);
  REQUIRE (result.metrics.winRate == Approx(1.0));
  REQUIRE (result.metrics.totalSignals == 2);
  REQUIRE (result.metrics.executedSignals == 2);
  REQUIRE (result.diagnostics.empty());

  SECTION ("one equity point per bar, in time order")
    {
      REQUIRE (result.equityCurve.size() == candles.size());
      for (std::size_t i = 0; i < result.equityCurve.size(); ++i)
	{
	  REQUIRE (result.equityCurve[i].drawdownPct >= 0.0);
	  if (i > 0)
	    REQUIRE (result.equityCurve[i - 1].timestamp < result.equityCurve[i].timestamp);
	}
      REQUIRE (result.equityCurve.back().equity == Approx(result.finalEquity));
    }

  SECTION ("open position is marked to market")
    {
      REQUIRE (result.equityCurve[3].equity == Approx(10000.0 / 101.0 * 103.0));
    }
}

TEST_CASE ("BacktestEngine drawdown follows the running equity peak", "[BacktestEngine]")
{
  BacktestEngine engine(frictionless());
  const CandleSeries candles = makeCandles({100.0, 110.0, 120.0, 105.0, 95.0, 125.0, 115.0});
  ScriptedStrategy script({{0, SignalDirection::LONG}});

  const BacktestResult result = engine.run("DD", candles, script);
  REQUIRE (result.openPosition);
  REQUIRE (result.equityCurve.size() == candles.size());

  double peak = 10000.0;
  for (const EquityPoint& point : result.equityCurve)
    {
      if (point.equity >= peak)
	{
	  peak = point.equity;
	  REQUIRE (point.drawdownPct == 0.0);
	}
      else
	REQUIRE (point.drawdownPct == Approx((peak - point.equity) / peak));
    }

  // 100 units: equity peaks at 12000, falls to 9500, then sets a new peak at 12500.
  REQUIRE (result.equityCurve[2].equity == Approx(12000.0));
  REQUIRE (result.equityCurve[3].drawdownPct == Approx(0.125));
  REQUIRE (result.equityCurve[4].drawdownPct == Approx(2500.0 / 12000.0));
  REQUIRE (result.equityCurve[5].drawdownPct == 0.0);
  REQUIRE (result.equityCurve[6].drawdownPct == Approx(0.08));
  REQUIRE (result.metrics.maxDrawdownPct == Approx(2500.0 / 12000.0));
}

TEST_CASE ("BacktestEngine rejects short series", "[BacktestEngine]")
{
  BacktestEngine engine(frictionless());
  ScriptedStrategy needsFive({}, 5);

  REQUIRE_THROWS_AS (engine.run("X", makeFlatCandles(3, 100.0), needsFive), InsufficientDataException);
  REQUIRE_THROWS_AS (engine.run("X", CandleSeries(), needsFive), InsufficientDataException);
  REQUIRE_NOTHROW (engine.run("X", makeFlatCandles(5, 100.0), needsFive));

  SECTION ("the warmup period comes from the strategy")
    {
      REQUIRE_THROWS_AS (engine.run("X", makeFlatCandles(20, 100.0), SmaCrossover(10, 20)),
			 InsufficientDataException);
    }
}

TEST_CASE ("BacktestEngine forced exits", "[BacktestEngine]")
{
  const CandleSeries candles = makeCandles({100.0, 100.0, 100.0, 94.0, 94.0, 94.0});
  ScriptedStrategy script({{1, SignalDirection::LONG}, {3, SignalDirection::LONG}});

  SECTION ("stop-loss closes the position and skips the strategy")
    {
      BacktestEngine engine(BacktestConfig::builder().stopLossPct(0.05).build().zeroCost());
      const BacktestResult result = engine.run("SL", candles, script);

      REQUIRE (result.trades.size() == 1);
      REQUIRE (result.trades.front().getExitTimestamp() == testDay(3));
      REQUIRE (result.trades.front().getReturnPct() == Approx(-6.0));
      REQUIRE_FALSE (result.openPosition);

      const SignalRecord& exit = result.signals.back();
      REQUIRE (exit.direction == SignalDirection::EXIT);
      REQUIRE (exit.executed);
      REQUIRE (*exit.reason == "Stop-loss triggered (-6.0%)");
    }

  SECTION ("take-profit")
    {
      const CandleSeries rally = makeCandles({100.0, 100.0, 104.0, 111.0, 111.0});
      BacktestEngine engine(BacktestConfig::builder().takeProfitPct(0.10).build().zeroCost());
      const BacktestResult result = engine.run("TP", rally, ScriptedStrategy({{1, SignalDirection::LONG}}));

      REQUIRE (result.trades.size() == 1);
      REQUIRE (result.trades.front().getExitTimestamp() == testDay(3));
      REQUIRE (result.trades.front().getExitSignal().getReason()->find("Take-profit triggered") == 0);
    }

  SECTION ("trailing stop follows the best close")
    {
      const CandleSeries path = makeCandles({100.0, 100.0, 120.0, 110.0, 107.0});
      BacktestEngine engine(BacktestConfig::builder().trailingStopPct(0.10).build().zeroCost());
      const BacktestResult result = engine.run("TS", path, ScriptedStrategy({{1, SignalDirection::LONG}}));

      // 120 * 0.9 == 108; 110 holds, 107 exits
      REQUIRE (result.trades.size() == 1);
      REQUIRE (result.trades.front().getExitTimestamp() == testDay(4));
      REQUIRE (result.trades.front().getExitSignal().getReason()->find("Trailing stop triggered") == 0);
    }
}

TEST_CASE ("BacktestEngine close at end", "[BacktestEngine]")
{
  const CandleSeries candles = makeTrendCandles(6, 100.0, 2.0);
  ScriptedStrategy script({{1, SignalDirection::LONG}});

  SECTION ("disabled leaves the position open")
    {
      BacktestEngine engine(frictionless());
      const BacktestResult result = engine.run("OPEN", candles, script);

      REQUIRE (result.trades.empty());
      REQUIRE (result.openPosition);
      REQUIRE (result.openPosition->isLong());
      REQUIRE (result.finalEquity == Approx(10000.0 / 102.0 * 110.0));
      REQUIRE (result.metrics.totalReturnPct == Approx((110.0 / 102.0 - 1.0) * 100.0));
    }

  SECTION ("enabled closes on the last bar")
    {
      BacktestEngine engine(BacktestConfig::builder().closeAtEnd(true).build().zeroCost());
      const BacktestResult result = engine.run("CLOSED", candles, script);

      REQUIRE (result.trades.size() == 1);
      REQUIRE_FALSE (result.openPosition);
      REQUIRE (result.trades.front().getExitTimestamp() == testDay(5));
      REQUIRE (*result.trades.front().getExitSignal().getReason() == "End of backtest");
    }
}

TEST_CASE ("BacktestEngine signal filtering", "[BacktestEngine]")
{
  const CandleSeries candles = makeFlatCandles(6, 100.0);

  SECTION ("shorts are ignored unless allowed")
    {
      BacktestEngine engine(frictionless());
      const BacktestResult result = engine.run("S", candles,
					       ScriptedStrategy({{1, SignalDirection::SHORT}}));

      REQUIRE (result.trades.empty());
      REQUIRE_FALSE (result.openPosition);
      REQUIRE (result.signals.size() == 1);
      REQUIRE_FALSE (result.signals.front().executed);
      REQUIRE (hasDiagnostic(result, "1 short signal(s) ignored because allow_short is disabled"));
      REQUIRE (hasDiagnostic(result, "No signals were executed (1 generated)"));
    }

  SECTION ("weak signals are rejected")
    {
      BacktestEngine engine(BacktestConfig::builder().minSignalStrength(0.5).build().zeroCost());
      const BacktestResult result = engine.run("W", candles,
					       ScriptedStrategy({{1, SignalDirection::LONG}}, 1, 0.3));

      REQUIRE (result.trades.empty());
      REQUIRE_FALSE (result.openPosition);
      REQUIRE (hasDiagnostic(result, "below min_signal_strength"));
    }

  SECTION ("an opposite signal closes without reversing")
    {
      BacktestEngine engine(BacktestConfig::builder().allowShort(true).build().zeroCost());
      const BacktestResult result = engine.run("R", candles,
					       ScriptedStrategy({{1, SignalDirection::LONG},
								 {3, SignalDirection::SHORT},
								 {4, SignalDirection::SHORT}}));

      REQUIRE (result.trades.size() == 1);
      REQUIRE (result.trades.front().isLong());
      REQUIRE (result.trades.front().getExitTimestamp() == testDay(3));
      REQUIRE (result.openPosition);
      REQUIRE (result.openPosition->isShort());
      REQUIRE (result.openPosition->getEntryTimestamp() == testDay(4));
    }

  SECTION ("a same-direction signal is not executed")
    {
      BacktestEngine engine(frictionless());
      const BacktestResult result = engine.run("D", candles,
					       ScriptedStrategy({{1, SignalDirection::LONG},
								 {2, SignalDirection::LONG}}));

      REQUIRE (result.signals.size() == 2);
      REQUIRE (result.signals[0].executed);
      REQUIRE_FALSE (result.signals[1].executed);
      REQUIRE (result.openPosition->getEntryTimestamp() == testDay(1));
    }
}

TEST_CASE ("BacktestEngine dividends", "[BacktestEngine]")
{
  const CandleSeries candles = makeFlatCandles(5, 100.0);
  const std::vector<Dividend> dividends{Dividend{testDay(0), 5.0}, Dividend{testDay(2), 1.0}};
  ScriptedStrategy script({{1, SignalDirection::LONG}});

  SECTION ("paid to an open long as cash")
    {
      BacktestEngine engine(BacktestConfig::builder().closeAtEnd(true).build().zeroCost());
      const BacktestResult result = engine.run("DIV", candles, script, dividends);

      // the day-0 dividend predates the entry
      REQUIRE (result.trades.size() == 1);
      REQUIRE (result.trades.front().getDividendIncome() == Approx(100.0));
      REQUIRE (result.metrics.totalDividendIncome == Approx(100.0));
      REQUIRE (result.finalEquity == Approx(10100.0));
    }

  SECTION ("reinvested into units")
    {
      BacktestEngine engine(BacktestConfig::builder().reinvestDividends(true).build().zeroCost());
      const BacktestResult result = engine.run("DRIP", candles, script, dividends);

      REQUIRE (result.openPosition);
      REQUIRE (result.openPosition->getQuantity() == Approx(101.0));
      REQUIRE (result.finalEquity == Approx(10100.0));
    }
}

TEST_CASE ("BacktestEngine benchmark comparison", "[BacktestEngine]")
{
  BacktestEngine engine(frictionless());
  const CandleSeries candles = makeWaveCandles(60);
  const CandleSeries benchmark = makeTrendCandles(60, 100.0, 0.5);

  const BacktestResult result = engine.runWithBenchmark("WAVE", candles, SmaCrossover(3, 8),
							"BENCH", benchmark);

  REQUIRE (result.benchmark);
  REQUIRE (result.benchmark->symbol == "BENCH");
  REQUIRE (result.benchmark->benchmarkReturnPct == Approx((129.5 / 100.0 - 1.0) * 100.0));
  REQUIRE (result.benchmark->buyAndHoldReturnPct ==
	   Approx((candles.back().getClose() / candles.front().getClose() - 1.0) * 100.0));
  REQUIRE (std::isfinite(result.benchmark->alpha));
  REQUIRE (std::isfinite(result.benchmark->beta));

  SECTION ("plain run carries no benchmark")
    {
      REQUIRE_FALSE (engine.run("WAVE", candles, SmaCrossover(3, 8)).benchmark);
    }
}
