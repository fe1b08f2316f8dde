#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <memory>
#include <sstream>
#include "BacktestException.h"
#include "PrebuiltStrategies.h"
#include "TestUtils.h"
#include "WalkForward.h"

using namespace mkc_backtest;
using Catch::Approx;

namespace
{
  BacktestStrategyPtr makeSmaCrossover(const ParamMap& params)
  {
    return std::make_shared<SmaCrossover>(params.at("fast").asSize(), params.at("slow").asSize());
  }

  GridSearch<> smallGrid(std::ostream& log)
  {
    GridSearch<> grid;
    grid.param("fast", ParamRange::intRange(2, 3, 1))
      .param("slow", ParamRange::values({ParamValue::intValue(5), ParamValue::intValue(8)}))
      .optimizeFor(OptimizeMetric::TOTAL_RETURN)
      .setLogStream(log);
    return grid;
  }
}

TEST_CASE ("WalkForwardConfig defaults and validation", "[WalkForward]")
{
  std::ostringstream log;
  WalkForwardConfig<> wf(smallGrid(log), BacktestConfig());

  REQUIRE (wf.getInSampleBars() == 252);
  REQUIRE (wf.getOutOfSampleBars() == 63);
  REQUIRE (wf.getStepBars() == 63);

  wf.outOfSampleBars(21);
  REQUIRE (wf.getStepBars() == 21);
  wf.stepBars(10);
  REQUIRE (wf.getStepBars() == 10);

  REQUIRE_NOTHROW (wf.validate(273));
  REQUIRE_THROWS_AS (wf.validate(272), InsufficientDataException);

  SECTION ("zero sized windows")
    {
      REQUIRE_THROWS_AS (WalkForwardConfig<>(smallGrid(log), BacktestConfig()).inSampleBars(0).validate(1000),
			 InvalidParameterException);
      REQUIRE_THROWS_AS (WalkForwardConfig<>(smallGrid(log), BacktestConfig()).outOfSampleBars(0).validate(1000),
			 InvalidParameterException);
      REQUIRE_THROWS_AS (WalkForwardConfig<>(smallGrid(log), BacktestConfig()).stepBars(0).validate(1000),
			 InvalidParameterException);
    }

  SECTION ("run rejects a short series before optimizing")
    {
      REQUIRE_THROWS_AS (wf.run("WAVE", makeWaveCandles(100), makeSmaCrossover), InsufficientDataException);
    }
}

TEST_CASE ("Walk-forward with a single window", "[WalkForward]")
{
  std::ostringstream log;
  WalkForwardConfig<> wf(smallGrid(log), BacktestConfig().zeroCost());
  wf.inSampleBars(200).outOfSampleBars(100);

  const CandleSeries candles = makeWaveCandles(300);
  const WalkForwardReport report = wf.run("WAVE", candles, makeSmaCrossover);

  REQUIRE (report.windows.size() == 1);
  REQUIRE (report.optimizationReports.size() == 1);
  REQUIRE (report.skippedWindows == 0);
  REQUIRE (report.strategyName == "SMA Crossover");

  const WindowResult& w = report.windows.front();
  REQUIRE (w.window == 0);
  REQUIRE (w.inSampleBegin == 0);
  REQUIRE (w.inSampleEnd == 200);
  REQUIRE (w.outOfSampleEnd == 300);
  REQUIRE (w.optimizedParams == report.optimizationReports.front().best.params);
  REQUIRE (w.inSample.equityCurve.size() == 200);
  REQUIRE (w.outOfSample.equityCurve.size() == 100);
  REQUIRE (w.outOfSample.startTimestamp == candles[200].getTimestamp());

  REQUIRE (report.aggregateEquityCurve.size() == 100);
  REQUIRE (report.aggregateMetrics.totalTrades == w.outOfSample.trades.size());
  REQUIRE (report.aggregateMetrics.totalReturnPct == Approx(w.outOfSample.metrics.totalReturnPct));
}

TEST_CASE ("Walk-forward rolls the window", "[WalkForward]")
{
  std::ostringstream log;
  WalkForwardConfig<> wf(smallGrid(log), BacktestConfig().zeroCost());
  wf.inSampleBars(200).outOfSampleBars(100).stepBars(100);

  const WalkForwardReport report = wf.run("WAVE", makeWaveCandles(500), makeSmaCrossover);

  REQUIRE (report.windows.size() == 3);
  for (std::size_t i = 0; i < report.windows.size(); ++i)
    {
      REQUIRE (report.windows[i].window == i);
      REQUIRE (report.windows[i].inSampleBegin == 100 * i);
      REQUIRE (report.windows[i].inSampleEnd == 100 * i + 200);
      REQUIRE (report.windows[i].outOfSampleEnd == 100 * i + 300);
    }

  REQUIRE (report.consistencyRatio >= 0.0);
  REQUIRE (report.consistencyRatio <= 1.0);
  REQUIRE (report.consistencyRatio == WalkForwardConfig<>::consistencyRatio(report.windows));

  std::size_t oosTrades = 0;
  for (const auto& w : report.windows)
    oosTrades += w.outOfSample.trades.size();
  REQUIRE (report.aggregateMetrics.totalTrades == oosTrades);

  const EquityCurve& curve = report.aggregateEquityCurve;
  REQUIRE (curve.size() == 300);
  REQUIRE (curve.front().timestamp == fromEpochSeconds(0));
  for (std::size_t i = 1; i < curve.size(); ++i)
    REQUIRE (curve[i - 1].timestamp < curve[i].timestamp);
  REQUIRE (curve[100].equity == report.windows[1].outOfSample.equityCurve.front().equity);
}

TEST_CASE ("Walk-forward consistency ratio", "[WalkForward]")
{
  REQUIRE (WalkForwardConfig<>::consistencyRatio({}) == 0.0);

  std::vector<WindowResult> windows(4);
  const double finals[] = {10500.0, 9800.0, 10001.0, 10000.0};
  for (std::size_t i = 0; i < windows.size(); ++i)
    {
      windows[i].outOfSample.initialCapital = 10000.0;
      windows[i].outOfSample.finalEquity = finals[i];
    }
  REQUIRE (WalkForwardConfig<>::consistencyRatio(windows) == Approx(0.5));
}

TEST_CASE ("Walk-forward out-of-sample slice shorter than the warmup", "[WalkForward]")
{
  std::ostringstream log;
  GridSearch<> grid;
  grid.param("fast", ParamRange::values({ParamValue::intValue(3)}))
    .param("slow", ParamRange::values({ParamValue::intValue(8)}))
    .setLogStream(log);

  WalkForwardConfig<> wf(grid, BacktestConfig().zeroCost());
  wf.inSampleBars(60).outOfSampleBars(5);

  REQUIRE_THROWS_AS (wf.run("WAVE", makeWaveCandles(80), makeSmaCrossover), InsufficientDataException);
}
