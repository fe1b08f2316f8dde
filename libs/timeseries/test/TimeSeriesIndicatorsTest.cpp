#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "Candle.h"
#include "IndicatorProvider.h"
#include "IndicatorSpec.h"
#include "TimeSeriesException.h"
#include "TimeSeriesIndicators.h"
#include "TestUtils.h"

using namespace mkc_backtest;
using Catch::Approx;

TEST_CASE ("SimpleMovingAverage", "[indicators]")
{
  const std::vector<double> data{1.0, 2.0, 3.0, 4.0, 5.0};

  SECTION ("warmup entries are empty")
  {
    IndicatorSeries sma = SimpleMovingAverage(data, 3);
    REQUIRE (sma.size() == data.size());
    REQUIRE_FALSE (sma[0]);
    REQUIRE_FALSE (sma[1]);
    REQUIRE (*sma[2] == Approx(2.0));
    REQUIRE (*sma[3] == Approx(3.0));
    REQUIRE (*sma[4] == Approx(4.0));
  }

  SECTION ("zero period yields no values")
  {
    IndicatorSeries sma = SimpleMovingAverage(data, 0);
    REQUIRE (sma.size() == data.size());
    for (const auto& v : sma)
      REQUIRE_FALSE (v);
  }
}

TEST_CASE ("ExponentialMovingAverage is seeded with the SMA", "[indicators]")
{
  const std::vector<double> data{1.0, 2.0, 3.0, 4.0, 5.0};
  IndicatorSeries ema = ExponentialMovingAverage(data, 3);

  REQUIRE_FALSE (ema[1]);
  REQUIRE (*ema[2] == Approx(2.0));
  REQUIRE (*ema[3] == Approx(3.0));
  REQUIRE (*ema[4] == Approx(4.0));
}

TEST_CASE ("RelativeStrengthIndex", "[indicators]")
{
  SECTION ("strictly rising closes give 100")
  {
    std::vector<double> data;
    for (int i = 0; i < 20; ++i)
      data.push_back(100.0 + i);

    IndicatorSeries rsi = RelativeStrengthIndex(data, 14);
    REQUIRE_FALSE (rsi[13]);
    REQUIRE (rsi[14]);
    REQUIRE (*rsi[14] == Approx(100.0));
    REQUIRE (*rsi[19] == Approx(100.0));
  }

  SECTION ("strictly falling closes give 0")
  {
    std::vector<double> data;
    for (int i = 0; i < 20; ++i)
      data.push_back(100.0 - i);

    IndicatorSeries rsi = RelativeStrengthIndex(data, 5);
    REQUIRE (*rsi[10] == Approx(0.0).margin(1e-12));
  }

  SECTION ("a series not longer than the period is rejected")
  {
    const std::vector<double> data(14, 100.0);
    REQUIRE_THROWS_AS (RelativeStrengthIndex(data, 14), IndicatorException);
    REQUIRE_THROWS_AS (RelativeStrengthIndex(data, 0), IndicatorException);
  }
}

TEST_CASE ("MovingAverageConvergenceDivergence", "[indicators]")
{
  std::vector<double> data;
  for (int i = 0; i < 60; ++i)
    data.push_back(100.0 + i * 0.5);

  SECTION ("fast period must be below slow period")
  {
    REQUIRE_THROWS_AS (MovingAverageConvergenceDivergence(data, 26, 12, 9), IndicatorException);
  }

  SECTION ("too few values for slow + signal")
  {
    const std::vector<double> shortData(30, 100.0);
    REQUIRE_THROWS_AS (MovingAverageConvergenceDivergence(shortData, 12, 26, 9), IndicatorException);
  }

  SECTION ("histogram is line minus signal")
  {
    MacdSeries macd = MovingAverageConvergenceDivergence(data, 12, 26, 9);
    REQUIRE_FALSE (macd.macdLine[24]);
    REQUIRE (macd.macdLine[25]);
    REQUIRE_FALSE (macd.signalLine[32]);
    REQUIRE (macd.signalLine[33]);
    REQUIRE (*macd.histogram[40] == Approx(*macd.macdLine[40] - *macd.signalLine[40]));
    // rising prices keep the fast EMA above the slow EMA
    REQUIRE (*macd.macdLine[59] > 0.0);
  }
}

TEST_CASE ("BollingerBands", "[indicators]")
{
  SECTION ("constant series collapses the bands")
  {
    const std::vector<double> data(10, 50.0);
    BandSeries bands = BollingerBands(data, 5, 2.0);
    REQUIRE (*bands.upper[9] == Approx(50.0));
    REQUIRE (*bands.middle[9] == Approx(50.0));
    REQUIRE (*bands.lower[9] == Approx(50.0));
  }

  SECTION ("population standard deviation")
  {
    const std::vector<double> data{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    BandSeries bands = BollingerBands(data, 8, 1.0);
    REQUIRE (*bands.middle[7] == Approx(5.0));
    REQUIRE (*bands.upper[7] == Approx(7.0));
    REQUIRE (*bands.lower[7] == Approx(3.0));
  }
}

TEST_CASE ("AverageTrueRange and Donchian channels", "[indicators]")
{
  CandleSeries candles = makeFlatCandles(20, 100.0);
  std::vector<double> highs, lows, closes;
  for (const auto& c : candles)
    {
      highs.push_back(c.getHigh());
      lows.push_back(c.getLow());
      closes.push_back(c.getClose());
    }

  SECTION ("ATR of a constant two point range")
  {
    IndicatorSeries atr = AverageTrueRange(highs, lows, closes, 14);
    REQUIRE_FALSE (atr[12]);
    REQUIRE (*atr[13] == Approx(2.0));
    REQUIRE (*atr[19] == Approx(2.0));
  }

  SECTION ("ATR rejects mismatched inputs")
  {
    std::vector<double> shortLows(lows.begin(), lows.end() - 1);
    REQUIRE_THROWS_AS (AverageTrueRange(highs, shortLows, closes, 14), IndicatorException);
  }

  SECTION ("Donchian bands")
  {
    BandSeries bands = DonchianChannels(highs, lows, 5);
    REQUIRE (*bands.upper[4] == Approx(101.0));
    REQUIRE (*bands.lower[4] == Approx(99.0));
    REQUIRE (*bands.middle[4] == Approx(100.0));
  }

  SECTION ("SuperTrend starts in an uptrend")
  {
    SuperTrendSeries st = SuperTrend(highs, lows, closes, 10, 3.0);
    REQUIRE_FALSE (st.value[8]);
    REQUIRE (*st.uptrend[9] == Approx(1.0));
    REQUIRE (*st.value[9] == Approx(100.0 - 3.0 * 2.0));
  }
}

TEST_CASE ("IndicatorSpec", "[indicators]")
{
  REQUIRE (IndicatorSpec::sma(20).getWarmupBars() == 20);
  REQUIRE (IndicatorSpec::macd(12, 26, 9).getWarmupBars() == 35);
  REQUIRE (IndicatorSpec::bollinger(20, 2.0).toString() == "Bollinger(20,2)");
  REQUIRE (IndicatorSpec::rsi(14) == IndicatorSpec::rsi(14));
  REQUIRE (IndicatorSpec::rsi(14) != IndicatorSpec::ema(14));

  SECTION ("merging keeps the first request for a key")
  {
    IndicatorRequestList dest{{"sma_10", IndicatorSpec::sma(10)}};
    IndicatorRequestList src{{"sma_10", IndicatorSpec::sma(99)},
			     {"rsi", IndicatorSpec::rsi(14)}};
    mergeIndicatorRequests(dest, src);
    REQUIRE (dest.size() == 2);
    REQUIRE (dest[0].second == IndicatorSpec::sma(10));
    REQUIRE (dest[1].first == "rsi");
  }
}

TEST_CASE ("DefaultIndicatorProvider", "[indicators]")
{
  CandleSeries candles = makeTrendCandles(60, 100.0, 1.0);
  auto provider = makeDefaultIndicatorProvider();

  IndicatorRequestList requests{{"fast", IndicatorSpec::sma(5)},
				{"macd", IndicatorSpec::macd(12, 26, 9)},
				{"bb", IndicatorSpec::bollinger(20, 2.0)},
				{"dc", IndicatorSpec::donchian(20)},
				{"st", IndicatorSpec::supertrend(10, 3.0)}};
  IndicatorMap map = provider->compute(candles, requests);

  SECTION ("simple indicators use the request key")
  {
    REQUIRE (map.count("fast") == 1);
    REQUIRE (*map["fast"][4] == Approx(102.0));
  }

  SECTION ("compound indicators use fixed keys")
  {
    for (const char *key : {"macd_line", "macd_signal", "macd_histogram",
			    "bollinger_upper", "bollinger_middle", "bollinger_lower",
			    "donchian_upper", "donchian_middle", "donchian_lower",
			    "supertrend_value", "supertrend_uptrend"})
      {
	REQUIRE (map.count(key) == 1);
	REQUIRE (map[key].size() == candles.size());
      }
  }

  SECTION ("no requests gives an empty map")
  {
    REQUIRE (provider->compute(candles, IndicatorRequestList()).empty());
  }
}
