#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "Position.h"
#include "Signal.h"
#include "TestUtils.h"

using namespace mkc_backtest;
using Catch::Approx;

TEST_CASE ("SignalStrength", "[Signal]")
{
  REQUIRE (SignalStrength::weak().getBucket() == SignalStrength::Bucket::WEAK);
  REQUIRE (SignalStrength::medium().getBucket() == SignalStrength::Bucket::MEDIUM);
  REQUIRE (SignalStrength::strong().getBucket() == SignalStrength::Bucket::STRONG);

  SECTION ("values are clamped to [0, 1]")
  {
    REQUIRE (SignalStrength(1.7).getValue() == 1.0);
    REQUIRE (SignalStrength(-0.2).getValue() == 0.0);
  }
}

TEST_CASE ("Signal construction", "[Signal]")
{
  const Signal entry = Signal::longSignal(testDay(0), 100.0);

  REQUIRE (entry.getDirection() == SignalDirection::LONG);
  REQUIRE (entry.isEntry());
  REQUIRE_FALSE (entry.isExit());
  REQUIRE_FALSE (entry.getReason());
  REQUIRE (entry.getStrength().getValue() == 1.0);

  const Signal tagged = entry.withReason("breakout").withStrength(SignalStrength::weak());
  REQUIRE (*tagged.getReason() == "breakout");
  REQUIRE (tagged.getStrength().getValue() == Approx(0.3));
  REQUIRE (entry.getStrength().getValue() == 1.0);

  REQUIRE (Signal::holdSignal(testDay(0), 1.0).isHold());
  REQUIRE (Signal::exitSignal(testDay(0), 1.0).isExit());

  const SignalRecord record = SignalRecord::fromSignal(tagged, true);
  REQUIRE (record.executed);
  REQUIRE (record.direction == SignalDirection::LONG);
  REQUIRE (record.price == 100.0);
  REQUIRE (*record.reason == "breakout");
}

TEST_CASE ("Position valuation", "[Position]")
{
  const Signal entry = Signal::longSignal(testDay(0), 100.0);

  SECTION ("long position")
  {
    Position position(PositionSide::LONG, testDay(0), 100.0, 10.0, 1.0, entry);
    REQUIRE (position.getEntryValue() == Approx(1000.0));
    REQUIRE (position.marketValue(110.0) == Approx(1100.0));
    REQUIRE (position.grossPnl(110.0) == Approx(100.0));
    REQUIRE (position.unrealizedPnl(110.0) == Approx(99.0));
    REQUIRE (position.unrealizedReturnPct(110.0) == Approx(9.9));
  }

  SECTION ("short position gains when price falls")
  {
    Position position(PositionSide::SHORT, testDay(0), 100.0, 10.0, 0.0,
		      Signal::shortSignal(testDay(0), 100.0));
    REQUIRE (position.marketValue(90.0) == Approx(1100.0));
    REQUIRE (position.grossPnl(90.0) == Approx(100.0));
    REQUIRE (position.unrealizedReturnPct(110.0) == Approx(-10.0));
  }

  SECTION ("stop loss boundary arithmetic is exact")
  {
    Position position(PositionSide::LONG, testDay(0), 100.0, 10.0, 0.0, entry);
    REQUIRE (position.unrealizedReturnPct(95.0) == -5.0);
  }
}

TEST_CASE ("Position close produces a Trade", "[Position]")
{
  const Signal entry = Signal::longSignal(testDay(0), 100.0);
  Position position(PositionSide::LONG, testDay(0), 100.0, 10.0, 2.0, entry);

  const Trade trade = position.close(testDay(5), 110.0, 3.0, Signal::exitSignal(testDay(5), 110.0));

  REQUIRE (trade.isLong());
  REQUIRE (trade.getCommission() == Approx(5.0));
  REQUIRE (trade.getPnl() == Approx(95.0));
  REQUIRE (trade.getReturnPct() == Approx(9.5));
  REQUIRE (trade.isProfitable());
  REQUIRE_FALSE (trade.isLoss());
  REQUIRE (trade.getDurationSeconds() == 5 * 86400);
  REQUIRE (trade.getEntryValue() == Approx(1000.0));
  REQUIRE (trade.getExitValue() == Approx(1100.0));

  SECTION ("pnl and return share a sign")
  {
    const Trade loser = makeTrade(PositionSide::SHORT, 0, 3, 100.0, 104.0);
    REQUIRE (loser.getPnl() < 0.0);
    REQUIRE (loser.getReturnPct() < 0.0);
    REQUIRE (loser.isLoss());
  }
}

TEST_CASE ("Position dividends", "[Position]")
{
  const Signal entry = Signal::longSignal(testDay(0), 100.0);

  SECTION ("held as cash")
  {
    Position position(PositionSide::LONG, testDay(0), 100.0, 10.0, 0.0, entry);
    position.creditDividend(5.0, 100.0, false);
    REQUIRE (position.getDividendIncome() == Approx(5.0));
    REQUIRE (position.marketValue(100.0) == Approx(1005.0));

    const Trade trade = position.close(testDay(1), 100.0, 0.0, Signal::exitSignal(testDay(1), 100.0));
    REQUIRE (trade.getPnl() == Approx(5.0));
    REQUIRE (trade.getDividendIncome() == Approx(5.0));
  }

  SECTION ("reinvested into additional units")
  {
    Position position(PositionSide::LONG, testDay(0), 100.0, 10.0, 0.0, entry);
    position.creditDividend(10.0, 100.0, true);
    REQUIRE (position.getQuantity() == Approx(10.1));
    REQUIRE (position.getEntryValue() == Approx(1000.0));
    REQUIRE (position.marketValue(100.0) == Approx(1010.0));
  }
}
