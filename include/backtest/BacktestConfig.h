#pragma once

#include <string>

namespace replaybt {
namespace backtest {

enum class BenchmarkMode {
    NONE,   // no benchmark series, capture ratios absent
    SELF,   // buy-and-hold of the traded asset's own close
    COLUMN, // benchmark_close column of the data file, as loaded
    FILE    // close of a separate bar file joined by timestamp
};

// Simulation and metrics parameters (sourced from config/config.json)
struct BacktestConfig {
    double initial_capital;
    double commission_rate;
    std::string timeframe;
    double bars_per_year;
    double risk_free_rate;          // annual, de-annualized per bar by the metrics engine
    std::string start_date;         // YYYY-MM-DD, empty = unbounded
    std::string end_date;
    BenchmarkMode benchmark_mode;
    std::string benchmark_file;

    BacktestConfig()
        : initial_capital(10000.0)
        , commission_rate(0.001)
        , timeframe("1h")
        , bars_per_year(24.0 * 365.0)
        , risk_free_rate(0.0)
        , benchmark_mode(BenchmarkMode::SELF)
    {}

    // Throws ConfigError when a parameter is out of range.
    void validate() const;
};

// Annualization factor for a bar timeframe on a 24/7 calendar ("1m" .. "1w").
// Throws ConfigError for an unknown timeframe.
double barsPerYearForTimeframe(const std::string& timeframe);

} // namespace backtest
} // namespace replaybt
