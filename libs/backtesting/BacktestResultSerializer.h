// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_RESULT_SERIALIZER_H
#define __BACKTEST_RESULT_SERIALIZER_H 1

#include <string>
#include <rapidjson/document.h>
#include "BacktestResult.h"
#include "GridSearch.h"
#include "MonteCarloSimulator.h"
#include "PortfolioEngine.h"
#include "WalkForward.h"

namespace mkc_backtest
{
  /**
   * @brief Converts run results to JSON strings.
   *
   * Timestamps are written as Unix epoch seconds. Non-finite numbers are
   * written as null. Nothing is written to disk.
   */
  class BacktestResultSerializer
  {
  public:
    /**
     * @brief Full export of a backtest: config, metrics, trades, equity curve
     * and diagnostics.
     * @param includeSignals also write every SignalRecord
     */
    static std::string exportToJson(const BacktestResult& result, bool includeSignals = false);

    static std::string exportToJson(const MonteCarloResult& result);

    /**
     * @brief Ranked parameter sets with their headline metrics. Trades and
     * equity curves of individual cells are not written.
     */
    static std::string exportToJson(const OptimizationReport& report);

    static std::string exportToJson(const WalkForwardReport& report);

    /**
     * @brief Portfolio totals, equity curve, allocation history and one
     * full backtest object per symbol.
     */
    static std::string exportToJson(const PortfolioResult& result, bool includeSignals = false);

  private:
    typedef rapidjson::Document::AllocatorType Allocator;

    static rapidjson::Value serializeConfig(const BacktestConfig& config, Allocator& allocator);
    static rapidjson::Value serializeMetrics(const PerformanceMetrics& metrics, Allocator& allocator);
    static rapidjson::Value serializeBenchmark(const BenchmarkMetrics& benchmark, Allocator& allocator);
    static rapidjson::Value serializeTrade(const Trade& trade, Allocator& allocator);
    static rapidjson::Value serializeSignal(const SignalRecord& signal, Allocator& allocator);
    static rapidjson::Value serializeEquityCurve(const EquityCurve& curve, Allocator& allocator);
    static rapidjson::Value serializePercentiles(const PercentileStats& stats, Allocator& allocator);
    static rapidjson::Value serializeParams(const ParamMap& params, Allocator& allocator);
    static rapidjson::Value serializeResultSummary(const BacktestResult& result, Allocator& allocator);
    static rapidjson::Value serializeBacktest(const BacktestResult& result,
					       bool includeSignals,
					       Allocator& allocator);

    static std::string writeDocument(const rapidjson::Document& doc);
  };
}

#endif
