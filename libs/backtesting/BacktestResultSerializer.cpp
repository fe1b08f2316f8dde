// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "BacktestResultSerializer.h"
#include <cmath>
#include <cstdint>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace mkc_backtest
{
  namespace
  {
    Value number(double v)
    {
      Value out;
      if (std::isfinite(v))
	out.SetDouble(v);
      return out;
    }

    Value count(std::size_t v)
    {
      return Value(static_cast<uint64_t>(v));
    }

    Value epochSeconds(const ptime& t)
    {
      return Value(static_cast<int64_t>(toEpochSeconds(t)));
    }

    Value text(const std::string& s, Document::AllocatorType& allocator)
    {
      return Value(s.c_str(), static_cast<SizeType>(s.size()), allocator);
    }

    Value optionalNumber(const std::optional<double>& v)
    {
      return v ? number(*v) : Value();
    }
  }

  std::string BacktestResultSerializer::exportToJson(const BacktestResult& result, bool includeSignals)
  {
    Document doc;
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value backtest = serializeBacktest(result, includeSignals, allocator);
    Value& root = doc;
    root = backtest;
    return writeDocument(doc);
  }

  std::string BacktestResultSerializer::exportToJson(const MonteCarloResult& result)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value sims = count(result.numSimulations);
    Value totalReturn = serializePercentiles(result.totalReturn, allocator);
    Value maxDrawdown = serializePercentiles(result.maxDrawdown, allocator);
    Value sharpe = serializePercentiles(result.sharpeRatio, allocator);
    Value profitFactor = serializePercentiles(result.profitFactor, allocator);

    doc.AddMember("numSimulations", sims, allocator);
    doc.AddMember("totalReturnPct", totalReturn, allocator);
    doc.AddMember("maxDrawdown", maxDrawdown, allocator);
    doc.AddMember("sharpeRatio", sharpe, allocator);
    doc.AddMember("profitFactor", profitFactor, allocator);
    return writeDocument(doc);
  }

  std::string BacktestResultSerializer::exportToJson(const OptimizationReport& report)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value name = text(report.strategyName, allocator);
    Value metric = text(report.metricName, allocator);
    Value total = count(report.totalCombinations);
    Value evaluated = count(report.results.size());
    Value skipped = count(report.skippedErrors);
    doc.AddMember("strategyName", name, allocator);
    doc.AddMember("metric", metric, allocator);
    doc.AddMember("totalCombinations", total, allocator);
    doc.AddMember("evaluatedCombinations", evaluated, allocator);
    doc.AddMember("skippedErrors", skipped, allocator);

    Value results(kArrayType);
    for (const auto& cell : report.results)
      {
	Value obj(kObjectType);
	Value params = serializeParams(cell.params, allocator);
	Value score = number(cell.score);
	Value summary = serializeResultSummary(cell.result, allocator);
	obj.AddMember("params", params, allocator);
	obj.AddMember("score", score, allocator);
	obj.AddMember("result", summary, allocator);
	results.PushBack(obj, allocator);
      }
    doc.AddMember("results", results, allocator);

    if (!report.results.empty())
      {
	Value best = serializeParams(report.best.params, allocator);
	doc.AddMember("bestParams", best, allocator);
      }

    return writeDocument(doc);
  }

  std::string BacktestResultSerializer::exportToJson(const WalkForwardReport& report)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value name = text(report.strategyName, allocator);
    Value consistency = number(report.consistencyRatio);
    Value skipped = count(report.skippedWindows);
    Value aggregate = serializeMetrics(report.aggregateMetrics, allocator);
    doc.AddMember("strategyName", name, allocator);
    doc.AddMember("consistencyRatio", consistency, allocator);
    doc.AddMember("skippedWindows", skipped, allocator);
    doc.AddMember("aggregateMetrics", aggregate, allocator);

    Value windows(kArrayType);
    for (const auto& w : report.windows)
      {
	Value obj(kObjectType);
	Value index = count(w.window);
	Value isBegin = count(w.inSampleBegin);
	Value isEnd = count(w.inSampleEnd);
	Value oosEnd = count(w.outOfSampleEnd);
	Value params = serializeParams(w.optimizedParams, allocator);
	Value inSample = serializeResultSummary(w.inSample, allocator);
	Value outOfSample = serializeResultSummary(w.outOfSample, allocator);
	obj.AddMember("window", index, allocator);
	obj.AddMember("inSampleBegin", isBegin, allocator);
	obj.AddMember("inSampleEnd", isEnd, allocator);
	obj.AddMember("outOfSampleEnd", oosEnd, allocator);
	obj.AddMember("optimizedParams", params, allocator);
	obj.AddMember("inSample", inSample, allocator);
	obj.AddMember("outOfSample", outOfSample, allocator);
	windows.PushBack(obj, allocator);
      }
    doc.AddMember("windows", windows, allocator);

    return writeDocument(doc);
  }

  std::string BacktestResultSerializer::exportToJson(const PortfolioResult& result, bool includeSignals)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value initial = number(result.initialCapital);
    Value finalEquity = number(result.finalEquity);
    Value metrics = serializeMetrics(result.metrics, allocator);
    Value curve = serializeEquityCurve(result.equityCurve, allocator);
    doc.AddMember("initialCapital", initial, allocator);
    doc.AddMember("finalEquity", finalEquity, allocator);
    doc.AddMember("metrics", metrics, allocator);
    doc.AddMember("equityCurve", curve, allocator);

    Value allocations(kArrayType);
    allocations.Reserve(static_cast<SizeType>(result.allocationHistory.size()), allocator);
    for (const auto& snapshot : result.allocationHistory)
      {
	Value obj(kObjectType);
	Value timestamp = epochSeconds(snapshot.timestamp);
	Value cash = number(snapshot.cash);
	obj.AddMember("timestamp", timestamp, allocator);
	obj.AddMember("cash", cash, allocator);

	Value positions(kObjectType);
	for (const auto& p : snapshot.positions)
	  {
	    Value key = text(p.first, allocator);
	    Value value = number(p.second);
	    positions.AddMember(key, value, allocator);
	  }
	obj.AddMember("positions", positions, allocator);
	allocations.PushBack(obj, allocator);
      }
    doc.AddMember("allocationHistory", allocations, allocator);

    Value symbols(kObjectType);
    for (const auto& entry : result.symbols)
      {
	Value key = text(entry.first, allocator);
	Value backtest = serializeBacktest(entry.second, includeSignals, allocator);
	symbols.AddMember(key, backtest, allocator);
      }
    doc.AddMember("symbols", symbols, allocator);

    return writeDocument(doc);
  }

  Value BacktestResultSerializer::serializeBacktest(const BacktestResult& result,
						    bool includeSignals,
						    Allocator& allocator)
  {
    Value obj = serializeResultSummary(result, allocator);

    Value config = serializeConfig(result.config, allocator);
    obj.AddMember("config", config, allocator);

    Value trades(kArrayType);
    for (const auto& trade : result.trades)
      {
	Value t = serializeTrade(trade, allocator);
	trades.PushBack(t, allocator);
      }
    obj.AddMember("trades", trades, allocator);

    Value curve = serializeEquityCurve(result.equityCurve, allocator);
    obj.AddMember("equityCurve", curve, allocator);

    if (includeSignals)
      {
	Value signals(kArrayType);
	for (const auto& signal : result.signals)
	  {
	    Value s = serializeSignal(signal, allocator);
	    signals.PushBack(s, allocator);
	  }
	obj.AddMember("signals", signals, allocator);
      }

    if (result.openPosition)
      {
	const Position& p = *result.openPosition;
	Value open(kObjectType);
	Value side = text(toString(p.getSide()), allocator);
	Value entryTime = epochSeconds(p.getEntryTimestamp());
	Value entryPrice = number(p.getEntryPrice());
	Value quantity = number(p.getQuantity());
	open.AddMember("side", side, allocator);
	open.AddMember("entryTimestamp", entryTime, allocator);
	open.AddMember("entryPrice", entryPrice, allocator);
	open.AddMember("quantity", quantity, allocator);
	obj.AddMember("openPosition", open, allocator);
      }

    if (result.benchmark)
      {
	Value benchmark = serializeBenchmark(*result.benchmark, allocator);
	obj.AddMember("benchmark", benchmark, allocator);
      }

    Value diagnostics(kArrayType);
    for (const auto& line : result.diagnostics)
      {
	Value d = text(line, allocator);
	diagnostics.PushBack(d, allocator);
      }
    obj.AddMember("diagnostics", diagnostics, allocator);

    return obj;
  }

  Value BacktestResultSerializer::serializeResultSummary(const BacktestResult& result, Allocator& allocator)
  {
    Value obj(kObjectType);
    Value symbol = text(result.symbol, allocator);
    Value strategy = text(result.strategyName, allocator);
    Value start = epochSeconds(result.startTimestamp);
    Value end = epochSeconds(result.endTimestamp);
    Value bars = count(result.getNumBars());
    Value initial = number(result.initialCapital);
    Value finalEquity = number(result.finalEquity);
    Value metrics = serializeMetrics(result.metrics, allocator);

    obj.AddMember("symbol", symbol, allocator);
    obj.AddMember("strategyName", strategy, allocator);
    obj.AddMember("startTimestamp", start, allocator);
    obj.AddMember("endTimestamp", end, allocator);
    obj.AddMember("bars", bars, allocator);
    obj.AddMember("initialCapital", initial, allocator);
    obj.AddMember("finalEquity", finalEquity, allocator);
    obj.AddMember("metrics", metrics, allocator);
    return obj;
  }

  Value BacktestResultSerializer::serializeConfig(const BacktestConfig& config, Allocator& allocator)
  {
    Value obj(kObjectType);
    obj.AddMember("initialCapital", config.getInitialCapital(), allocator);
    obj.AddMember("commission", config.getCommission(), allocator);
    obj.AddMember("commissionPct", config.getCommissionPct(), allocator);
    obj.AddMember("slippagePct", config.getSlippagePct(), allocator);
    obj.AddMember("positionSizePct", config.getPositionSizePct(), allocator);
    obj.AddMember("allowShort", config.getAllowShort(), allocator);
    obj.AddMember("minSignalStrength", config.getMinSignalStrength(), allocator);

    Value stopLoss = optionalNumber(config.getStopLossPct());
    Value takeProfit = optionalNumber(config.getTakeProfitPct());
    Value trailing = optionalNumber(config.getTrailingStopPct());
    obj.AddMember("stopLossPct", stopLoss, allocator);
    obj.AddMember("takeProfitPct", takeProfit, allocator);
    obj.AddMember("trailingStopPct", trailing, allocator);

    obj.AddMember("closeAtEnd", config.getCloseAtEnd(), allocator);
    obj.AddMember("riskFreeRate", config.getRiskFreeRate(), allocator);
    obj.AddMember("reinvestDividends", config.getReinvestDividends(), allocator);
    obj.AddMember("barsPerYear", config.getBarsPerYear(), allocator);

    Value maxPositions = config.getMaxPositions() ? count(*config.getMaxPositions()) : Value();
    obj.AddMember("maxPositions", maxPositions, allocator);
    return obj;
  }

  Value BacktestResultSerializer::serializeMetrics(const PerformanceMetrics& m, Allocator& allocator)
  {
    Value obj(kObjectType);
    Value v;

    v = number(m.totalReturnPct);        obj.AddMember("totalReturnPct", v, allocator);
    v = number(m.annualizedReturnPct);   obj.AddMember("annualizedReturnPct", v, allocator);
    v = number(m.sharpeRatio);           obj.AddMember("sharpeRatio", v, allocator);
    v = number(m.sortinoRatio);          obj.AddMember("sortinoRatio", v, allocator);
    v = number(m.maxDrawdownPct);        obj.AddMember("maxDrawdownPct", v, allocator);
    obj.AddMember("maxDrawdownDuration", static_cast<int64_t>(m.maxDrawdownDuration), allocator);
    v = number(m.winRate);               obj.AddMember("winRate", v, allocator);
    v = number(m.profitFactor);          obj.AddMember("profitFactor", v, allocator);
    v = number(m.avgTradeReturnPct);     obj.AddMember("avgTradeReturnPct", v, allocator);
    v = number(m.avgWinPct);             obj.AddMember("avgWinPct", v, allocator);
    v = number(m.avgLossPct);            obj.AddMember("avgLossPct", v, allocator);
    v = number(m.avgTradeDuration);      obj.AddMember("avgTradeDuration", v, allocator);
    v = count(m.totalTrades);            obj.AddMember("totalTrades", v, allocator);
    v = count(m.winningTrades);          obj.AddMember("winningTrades", v, allocator);
    v = count(m.losingTrades);           obj.AddMember("losingTrades", v, allocator);
    v = number(m.largestWin);            obj.AddMember("largestWin", v, allocator);
    v = number(m.largestLoss);           obj.AddMember("largestLoss", v, allocator);
    v = count(m.maxConsecutiveWins);     obj.AddMember("maxConsecutiveWins", v, allocator);
    v = count(m.maxConsecutiveLosses);   obj.AddMember("maxConsecutiveLosses", v, allocator);
    v = number(m.calmarRatio);           obj.AddMember("calmarRatio", v, allocator);
    v = number(m.totalCommission);       obj.AddMember("totalCommission", v, allocator);
    v = count(m.longTrades);             obj.AddMember("longTrades", v, allocator);
    v = count(m.shortTrades);            obj.AddMember("shortTrades", v, allocator);
    v = count(m.totalSignals);           obj.AddMember("totalSignals", v, allocator);
    v = count(m.executedSignals);        obj.AddMember("executedSignals", v, allocator);
    v = number(m.avgWinDuration);        obj.AddMember("avgWinDuration", v, allocator);
    v = number(m.avgLossDuration);       obj.AddMember("avgLossDuration", v, allocator);
    v = number(m.timeInMarketPct);       obj.AddMember("timeInMarketPct", v, allocator);
    obj.AddMember("maxIdlePeriod", static_cast<int64_t>(m.maxIdlePeriod), allocator);
    v = number(m.totalDividendIncome);   obj.AddMember("totalDividendIncome", v, allocator);
    return obj;
  }

  Value BacktestResultSerializer::serializeBenchmark(const BenchmarkMetrics& b, Allocator& allocator)
  {
    Value obj(kObjectType);
    Value symbol = text(b.symbol, allocator);
    Value benchReturn = number(b.benchmarkReturnPct);
    Value buyAndHold = number(b.buyAndHoldReturnPct);
    Value alpha = number(b.alpha);
    Value beta = number(b.beta);
    Value ir = number(b.informationRatio);
    obj.AddMember("symbol", symbol, allocator);
    obj.AddMember("benchmarkReturnPct", benchReturn, allocator);
    obj.AddMember("buyAndHoldReturnPct", buyAndHold, allocator);
    obj.AddMember("alpha", alpha, allocator);
    obj.AddMember("beta", beta, allocator);
    obj.AddMember("informationRatio", ir, allocator);
    return obj;
  }

  Value BacktestResultSerializer::serializeTrade(const Trade& trade, Allocator& allocator)
  {
    Value obj(kObjectType);
    Value side = text(toString(trade.getSide()), allocator);
    Value entryTime = epochSeconds(trade.getEntryTimestamp());
    Value exitTime = epochSeconds(trade.getExitTimestamp());
    Value entryPrice = number(trade.getEntryPrice());
    Value exitPrice = number(trade.getExitPrice());
    Value quantity = number(trade.getQuantity());
    Value commission = number(trade.getCommission());
    Value dividends = number(trade.getDividendIncome());
    Value pnl = number(trade.getPnl());
    Value returnPct = number(trade.getReturnPct());

    obj.AddMember("side", side, allocator);
    obj.AddMember("entryTimestamp", entryTime, allocator);
    obj.AddMember("exitTimestamp", exitTime, allocator);
    obj.AddMember("entryPrice", entryPrice, allocator);
    obj.AddMember("exitPrice", exitPrice, allocator);
    obj.AddMember("quantity", quantity, allocator);
    obj.AddMember("commission", commission, allocator);
    obj.AddMember("dividendIncome", dividends, allocator);
    obj.AddMember("pnl", pnl, allocator);
    obj.AddMember("returnPct", returnPct, allocator);

    const std::optional<std::string>& entryReason = trade.getEntrySignal().getReason();
    const std::optional<std::string>& exitReason = trade.getExitSignal().getReason();
    Value entry = entryReason ? text(*entryReason, allocator) : Value();
    Value exit = exitReason ? text(*exitReason, allocator) : Value();
    obj.AddMember("entryReason", entry, allocator);
    obj.AddMember("exitReason", exit, allocator);
    return obj;
  }

  Value BacktestResultSerializer::serializeSignal(const SignalRecord& signal, Allocator& allocator)
  {
    Value obj(kObjectType);
    Value ts = epochSeconds(signal.timestamp);
    Value price = number(signal.price);
    Value direction = text(toString(signal.direction), allocator);
    Value strength = number(signal.strength);
    Value reason = signal.reason ? text(*signal.reason, allocator) : Value();
    obj.AddMember("timestamp", ts, allocator);
    obj.AddMember("price", price, allocator);
    obj.AddMember("direction", direction, allocator);
    obj.AddMember("strength", strength, allocator);
    obj.AddMember("reason", reason, allocator);
    obj.AddMember("executed", signal.executed, allocator);
    return obj;
  }

  Value BacktestResultSerializer::serializeEquityCurve(const EquityCurve& curve, Allocator& allocator)
  {
    Value points(kArrayType);
    points.Reserve(static_cast<SizeType>(curve.size()), allocator);
    for (const auto& point : curve)
      {
	Value obj(kObjectType);
	Value ts = epochSeconds(point.timestamp);
	Value equity = number(point.equity);
	Value drawdown = number(point.drawdownPct);
	obj.AddMember("timestamp", ts, allocator);
	obj.AddMember("equity", equity, allocator);
	obj.AddMember("drawdownPct", drawdown, allocator);
	points.PushBack(obj, allocator);
      }
    return points;
  }

  Value BacktestResultSerializer::serializePercentiles(const PercentileStats& stats, Allocator& allocator)
  {
    Value obj(kObjectType);
    Value p5 = number(stats.p5);
    Value p25 = number(stats.p25);
    Value p50 = number(stats.p50);
    Value p75 = number(stats.p75);
    Value p95 = number(stats.p95);
    Value mean = number(stats.mean);
    obj.AddMember("p5", p5, allocator);
    obj.AddMember("p25", p25, allocator);
    obj.AddMember("p50", p50, allocator);
    obj.AddMember("p75", p75, allocator);
    obj.AddMember("p95", p95, allocator);
    obj.AddMember("mean", mean, allocator);
    return obj;
  }

  Value BacktestResultSerializer::serializeParams(const ParamMap& params, Allocator& allocator)
  {
    Value obj(kObjectType);
    for (const auto& entry : params)
      {
	Value name = text(entry.first, allocator);
	Value value;
	if (entry.second.isInt())
	  value.SetInt64(static_cast<int64_t>(entry.second.asInt()));
	else
	  value = number(entry.second.asFloat());
	obj.AddMember(name, value, allocator);
      }
    return obj;
  }

  std::string BacktestResultSerializer::writeDocument(const Document& doc)
  {
    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
  }
}
