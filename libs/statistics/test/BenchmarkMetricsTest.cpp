#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "BenchmarkMetrics.h"
#include "TestUtils.h"

using namespace mkc_backtest;
using Catch::Approx;

namespace
{
  // Equity curve that tracks the closes of a candle series scaled to capital.
  EquityCurve curveFrom(const CandleSeries& candles, double capital)
  {
    EquityCurve curve;
    const double scale = capital / candles.front().getClose();
    for (const auto& c : candles)
      curve.push_back(EquityPoint{c.getTimestamp(), c.getClose() * scale, 0.0});
    return curve;
  }
}

TEST_CASE ("BenchmarkMetrics for a strategy that mirrors the benchmark", "[BenchmarkMetrics]")
{
  const CandleSeries bench = makeCandles({100.0, 102.0, 101.0, 104.0, 103.0, 106.0});
  const EquityCurve curve = curveFrom(bench, 10000.0);

  const BenchmarkMetrics b = BenchmarkMetrics::calculate("IDX", curve, bench, bench, 0.0, 252.0);

  REQUIRE (b.symbol == "IDX");
  REQUIRE (b.benchmarkReturnPct == Approx(6.0));
  REQUIRE (b.buyAndHoldReturnPct == Approx(6.0));
  REQUIRE (b.beta == Approx(1.0));
  REQUIRE (b.alpha == Approx(0.0).margin(1e-9));
  REQUIRE (b.informationRatio == Approx(0.0).margin(1e-9));
}

TEST_CASE ("BenchmarkMetrics for a flat strategy", "[BenchmarkMetrics]")
{
  const CandleSeries bench = makeCandles({100.0, 102.0, 101.0, 104.0});
  const CandleSeries flat = makeFlatCandles(4, 50.0);
  EquityCurve curve;
  for (std::size_t i = 0; i < 4; ++i)
    curve.push_back(EquityPoint{testDay(i), 10000.0, 0.0});

  const BenchmarkMetrics b = BenchmarkMetrics::calculate("IDX", curve, flat, bench, 0.0, 252.0);

  REQUIRE (b.beta == 0.0);
  REQUIRE (b.buyAndHoldReturnPct == 0.0);
  REQUIRE (b.benchmarkReturnPct == Approx(4.0));
  REQUIRE (b.informationRatio < 0.0);
  REQUIRE (b.alpha == Approx(0.0).margin(1e-9));
}

TEST_CASE ("BenchmarkMetrics with too few bars", "[BenchmarkMetrics]")
{
  const CandleSeries bench = makeCandles({100.0, 110.0});
  const EquityCurve curve = curveFrom(bench, 1000.0);

  const BenchmarkMetrics b = BenchmarkMetrics::calculate("IDX", curve, bench, bench, 0.0, 252.0);

  REQUIRE (b.benchmarkReturnPct == Approx(10.0));
  REQUIRE (b.beta == 0.0);
  REQUIRE (b.alpha == 0.0);
  REQUIRE (b.informationRatio == 0.0);
}

TEST_CASE ("BenchmarkMetrics pairs returns by timestamp", "[BenchmarkMetrics]")
{
  // The benchmark trades on day 3; the strategy's market does not.
  const std::vector<std::size_t> days = {0, 1, 2, 4, 5, 6};
  const std::vector<double> closes = {100.0, 102.0, 101.0, 104.0, 103.0, 106.0};
  CandleSeries candles;
  EquityCurve curve;
  for (std::size_t i = 0; i < days.size(); ++i)
    {
      candles.emplace_back(testDay(days[i]), closes[i], closes[i] + 1.0, closes[i] - 1.0, closes[i], 1000.0);
      curve.push_back(EquityPoint{testDay(days[i]), closes[i] * 100.0, 0.0});
    }

  const CandleSeries bench = makeCandles({100.0, 102.0, 101.0, 250.0, 104.0, 103.0, 106.0});
  const BenchmarkMetrics b = BenchmarkMetrics::calculate("IDX", curve, candles, bench, 0.0, 252.0);

  REQUIRE (b.beta == Approx(1.0));
  REQUIRE (b.informationRatio == Approx(0.0).margin(1e-9));

  SECTION ("shared dates only")
    {
      std::vector<double> strategyReturns;
      std::vector<double> benchReturns;
      metrics_detail::alignedReturns(curve, bench, strategyReturns, benchReturns);
      REQUIRE (strategyReturns.size() == 5);
      REQUIRE (benchReturns.size() == 5);
      REQUIRE (benchReturns[2] == Approx(104.0 / 101.0 - 1.0));
      REQUIRE (strategyReturns[2] == Approx(benchReturns[2]));
    }

  SECTION ("no shared dates leaves the relative measures at zero")
    {
      CandleSeries later;
      for (std::size_t i = 0; i < 6; ++i)
	later.emplace_back(testDay(100 + i), 100.0 + i, 101.0 + i, 99.0 + i, 100.0 + i, 1000.0);

      const BenchmarkMetrics none = BenchmarkMetrics::calculate("IDX", curve, candles, later, 0.0, 252.0);
      REQUIRE (none.beta == 0.0);
      REQUIRE (none.alpha == 0.0);
      REQUIRE (none.informationRatio == 0.0);
      REQUIRE (none.benchmarkReturnPct == Approx(5.0));
    }
}

TEST_CASE ("Annualization helper", "[BenchmarkMetrics]")
{
  REQUIRE (metrics_detail::annualizePct(10.0, 252, 252.0) == Approx(10.0));
  REQUIRE (metrics_detail::annualizePct(21.0, 504, 252.0) == Approx(10.0));
  REQUIRE (metrics_detail::annualizePct(5.0, 0, 252.0) == 0.0);
  REQUIRE (metrics_detail::annualizePct(-100.0, 10, 252.0) == 0.0);
}
