#pragma once

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestEngine.h"

namespace replaybt {
namespace report {

// Console, JSON and CSV renderings of a finished backtest.
class ReportWriter {
public:
    // Human-readable summary; undefined metrics print as "n/a"
    static void printSummary(std::ostream& out, const backtest::BacktestResult& result,
                             size_t preview_rows = 5);

    // Flat metrics record. NaN/inf/absent fields are written as null and listed
    // under "sentinels" as "nan" | "inf" | "absent".
    static nlohmann::json toJson(const analytics::MetricsReport& report);

    // Metrics plus symbol, strategy and execution counters
    static nlohmann::json toJson(const backtest::BacktestResult& result);

    // <symbol>_portfolio.csv, <symbol>_trades.csv, <symbol>_metrics.json.
    // Throws BacktestError when a file cannot be written.
    static void writeFiles(const backtest::BacktestResult& result, const std::string& output_dir);

    // "n/a" for NaN, "inf"/"-inf", otherwise fixed with `precision` digits
    static std::string formatMetric(double value, int precision = 4);
};

} // namespace report
} // namespace replaybt
