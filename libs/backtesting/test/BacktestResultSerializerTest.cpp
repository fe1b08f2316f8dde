#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "BacktestEngine.h"
#include "BacktestResultSerializer.h"
#include "GridSearch.h"
#include "MonteCarloSimulator.h"
#include "PortfolioEngine.h"
#include "PrebuiltStrategies.h"
#include "TestUtils.h"
#include "WalkForward.h"

using namespace mkc_backtest;
using Catch::Approx;

namespace
{
  rapidjson::Document parse(const std::string& json)
  {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    REQUIRE_FALSE (doc.HasParseError());
    REQUIRE (doc.IsObject());
    return doc;
  }

  BacktestResult roundTripRun()
  {
    BacktestEngine engine(BacktestConfig::builder().closeAtEnd(true).build().zeroCost());
    const CandleSeries candles = makeTrendCandles(8, 100.0, 1.0);
    ScriptedStrategy script({{1, SignalDirection::LONG}, {4, SignalDirection::EXIT},
			     {5, SignalDirection::LONG}});
    return engine.run("JSON", candles, script);
  }
}

TEST_CASE ("Backtest result export", "[BacktestResultSerializer]")
{
  const BacktestResult result = roundTripRun();
  rapidjson::Document doc = parse(BacktestResultSerializer::exportToJson(result));

  REQUIRE (std::string(doc["symbol"].GetString()) == "JSON");
  REQUIRE (std::string(doc["strategyName"].GetString()) == "Scripted");
  REQUIRE (doc["bars"].GetUint64() == 8);
  REQUIRE (doc["startTimestamp"].GetInt64() == toEpochSeconds(testDay(0)));
  REQUIRE (doc["finalEquity"].GetDouble() == Approx(result.finalEquity));
  REQUIRE (doc["config"]["initialCapital"].GetDouble() == Approx(10000.0));
  REQUIRE (doc["config"]["closeAtEnd"].GetBool());
  REQUIRE (doc["config"]["stopLossPct"].IsNull());
  REQUIRE (doc["config"]["maxPositions"].IsNull());
  REQUIRE (doc["metrics"]["totalTrades"].GetUint64() == 2);

  const rapidjson::Value& trades = doc["trades"];
  REQUIRE (trades.IsArray());
  REQUIRE (trades.Size() == 2);
  REQUIRE (std::string(trades[0]["side"].GetString()) == "Long");
  REQUIRE (trades[0]["entryPrice"].GetDouble() == Approx(101.0));
  REQUIRE (trades[0]["exitTimestamp"].GetInt64() == toEpochSeconds(testDay(4)));
  REQUIRE (std::string(trades[0]["entryReason"].GetString()) == "scripted");
  REQUIRE (std::string(trades[1]["exitReason"].GetString()) == "End of backtest");

  REQUIRE (doc["equityCurve"].Size() == 8);
  REQUIRE (doc["equityCurve"][7]["equity"].GetDouble() == Approx(result.finalEquity));
  REQUIRE (doc["diagnostics"].IsArray());
  REQUIRE_FALSE (doc.HasMember("signals"));
  REQUIRE_FALSE (doc.HasMember("openPosition"));
  REQUIRE_FALSE (doc.HasMember("benchmark"));

  SECTION ("signals on request")
    {
      rapidjson::Document withSignals = parse(BacktestResultSerializer::exportToJson(result, true));
      REQUIRE (withSignals["signals"].Size() == result.signals.size());
      REQUIRE (std::string(withSignals["signals"][0]["direction"].GetString()) == "Long");
      REQUIRE (withSignals["signals"][0]["executed"].GetBool());
    }
}

TEST_CASE ("Open position export", "[BacktestResultSerializer]")
{
  BacktestEngine engine(BacktestConfig().zeroCost());
  const BacktestResult result = engine.run("OPEN", makeFlatCandles(4, 50.0),
					   ScriptedStrategy({{2, SignalDirection::LONG}}));

  rapidjson::Document doc = parse(BacktestResultSerializer::exportToJson(result));
  REQUIRE (doc.HasMember("openPosition"));
  REQUIRE (std::string(doc["openPosition"]["side"].GetString()) == "Long");
  REQUIRE (doc["openPosition"]["quantity"].GetDouble() == Approx(200.0));
  REQUIRE (doc["trades"].Size() == 0);
}

TEST_CASE ("Monte Carlo export writes non-finite values as null", "[BacktestResultSerializer]")
{
  MonteCarloResult mc;
  mc.numSimulations = 100;
  mc.totalReturn = PercentileStats{-5.0, 0.0, 2.0, 4.0, 9.0, 2.1};
  mc.sharpeRatio.mean = std::numeric_limits<double>::quiet_NaN();
  mc.profitFactor.p95 = std::numeric_limits<double>::infinity();

  rapidjson::Document doc = parse(BacktestResultSerializer::exportToJson(mc));
  REQUIRE (doc["numSimulations"].GetUint64() == 100);
  REQUIRE (doc["totalReturnPct"]["p5"].GetDouble() == Approx(-5.0));
  REQUIRE (doc["totalReturnPct"]["p95"].GetDouble() == Approx(9.0));
  REQUIRE (doc["totalReturnPct"]["mean"].GetDouble() == Approx(2.1));
  REQUIRE (doc["sharpeRatio"]["mean"].IsNull());
  REQUIRE (doc["profitFactor"]["p95"].IsNull());
  REQUIRE (doc["maxDrawdown"]["p50"].GetDouble() == 0.0);
}

TEST_CASE ("Optimization report export", "[BacktestResultSerializer]")
{
  std::ostringstream log;
  GridSearch<> grid;
  grid.param("fast", ParamRange::intRange(2, 4, 1))
    .param("slow", ParamRange::values({ParamValue::intValue(8), ParamValue::intValue(10)}))
    .optimizeFor(OptimizeMetric::TOTAL_RETURN)
    .setLogStream(log);

  const OptimizationReport report =
    grid.run("WAVE", makeWaveCandles(80), BacktestConfig().zeroCost(),
	     [](const ParamMap& p) -> BacktestStrategyPtr {
	       return std::make_shared<SmaCrossover>(p.at("fast").asSize(), p.at("slow").asSize());
	     });

  rapidjson::Document doc = parse(BacktestResultSerializer::exportToJson(report));
  REQUIRE (std::string(doc["strategyName"].GetString()) == "SMA Crossover");
  REQUIRE (std::string(doc["metric"].GetString()) == "total_return");
  REQUIRE (doc["totalCombinations"].GetUint64() == 6);
  REQUIRE (doc["evaluatedCombinations"].GetUint64() == 6);
  REQUIRE (doc["skippedErrors"].GetUint64() == 0);
  REQUIRE (doc["results"].Size() == 6);
  REQUIRE (doc["results"][0]["score"].GetDouble() == Approx(report.best.score));
  REQUIRE (doc["bestParams"]["fast"].GetInt64() == report.best.params.at("fast").asInt());
  REQUIRE (doc["results"][0]["result"].HasMember("metrics"));
  REQUIRE_FALSE (doc["results"][0]["result"].HasMember("trades"));
}

TEST_CASE ("Walk-forward report export", "[BacktestResultSerializer]")
{
  std::ostringstream log;
  GridSearch<> grid;
  grid.param("fast", ParamRange::values({ParamValue::intValue(2)}))
    .param("slow", ParamRange::values({ParamValue::intValue(5), ParamValue::intValue(8)}))
    .optimizeFor(OptimizeMetric::TOTAL_RETURN)
    .setLogStream(log);

  WalkForwardConfig<> wf(grid, BacktestConfig().zeroCost());
  wf.inSampleBars(60).outOfSampleBars(30);

  const WalkForwardReport report =
    wf.run("WAVE", makeWaveCandles(150),
	   [](const ParamMap& p) -> BacktestStrategyPtr {
	     return std::make_shared<SmaCrossover>(p.at("fast").asSize(), p.at("slow").asSize());
	   });

  rapidjson::Document doc = parse(BacktestResultSerializer::exportToJson(report));
  REQUIRE (std::string(doc["strategyName"].GetString()) == "SMA Crossover");
  REQUIRE (doc["skippedWindows"].GetUint64() == 0);
  REQUIRE (doc["consistencyRatio"].GetDouble() == Approx(report.consistencyRatio));
  REQUIRE (doc["windows"].Size() == 3);
  REQUIRE (doc["windows"][1]["inSampleBegin"].GetUint64() == 30);
  REQUIRE (doc["windows"][1]["outOfSampleEnd"].GetUint64() == 120);
  REQUIRE (doc["windows"][0]["optimizedParams"]["fast"].GetInt64() == 2);
  REQUIRE (doc["aggregateMetrics"]["totalTrades"].GetUint64() == report.aggregateMetrics.totalTrades);
}

TEST_CASE ("Portfolio result export", "[BacktestResultSerializer]")
{
  const BacktestConfig base = BacktestConfig::builder().positionSizePct(0.5).build().zeroCost();
  PortfolioEngine engine((PortfolioConfig(base)));
  const std::vector<SymbolData> data = {
    SymbolData{"AAA", makeFlatCandles(4, 100.0), std::vector<Dividend>()},
    SymbolData{"BBB", makeFlatCandles(4, 50.0), std::vector<Dividend>()}
  };
  const PortfolioResult result =
    engine.run(data, [](const std::string& symbol) -> BacktestStrategyPtr {
	if (symbol == "AAA")
	  return std::make_shared<ScriptedStrategy>(std::map<std::size_t, SignalDirection>{
	      {1, SignalDirection::LONG}});
	return std::make_shared<ScriptedStrategy>(std::map<std::size_t, SignalDirection>{
	    {0, SignalDirection::HOLD}});
      });

  rapidjson::Document doc = parse(BacktestResultSerializer::exportToJson(result));
  REQUIRE (doc["initialCapital"].GetDouble() == Approx(10000.0));
  REQUIRE (doc["finalEquity"].GetDouble() == Approx(result.finalEquity));
  REQUIRE (doc["equityCurve"].Size() == 4);

  const rapidjson::Value& history = doc["allocationHistory"];
  REQUIRE (history.Size() == 4);
  REQUIRE (history[0]["positions"].ObjectEmpty());
  REQUIRE (history[1]["cash"].GetDouble() == Approx(5000.0));
  REQUIRE (history[1]["positions"]["AAA"].GetDouble() == Approx(5000.0));
  REQUIRE_FALSE (history[1]["positions"].HasMember("BBB"));

  REQUIRE (doc["symbols"].HasMember("AAA"));
  REQUIRE (doc["symbols"].HasMember("BBB"));
  REQUIRE (std::string(doc["symbols"]["AAA"]["symbol"].GetString()) == "AAA");
  REQUIRE (doc["symbols"]["AAA"]["initialCapital"].GetDouble() == Approx(5000.0));
}
