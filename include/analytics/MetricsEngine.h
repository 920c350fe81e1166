#pragma once

#include <optional>
#include <vector>

#include "backtest/Portfolio.h"

namespace replaybt {
namespace analytics {

// Flat performance record. Undefined ratios are NaN (or +inf for a profit
// factor with no losing trades); capture ratios are absent without a benchmark.
struct MetricsReport {
    double initial_capital = 0.0;
    double final_total_value = 0.0;
    double total_pnl = 0.0;
    double returns_pct = 0.0;

    int num_buys = 0;
    int num_sells = 0;
    int num_closed_trades = 0;
    int wins = 0;
    int losses = 0;
    double win_rate = 0.0;              // fraction in [0, 1]
    double avg_pnl_per_trade = 0.0;     // NaN without closed trades
    double avg_win = 0.0;
    double avg_loss = 0.0;              // magnitude, >= 0

    double max_drawdown = 0.0;          // percent in [-100, 0]
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double profit_factor = 0.0;
    double expectancy = 0.0;

    std::optional<double> up_capture;
    std::optional<double> down_capture;

    bool open_position = false;
    std::optional<double> unrealized_pnl;

    // Per-bar (total_value - running_peak) / running_peak, for reporting
    std::vector<double> drawdown_series;
};

// Pure function of a finished run: never mutates its inputs.
class MetricsEngine {
public:
    // Throws ConfigError for initial_capital <= 0 or bars_per_year <= 0.
    MetricsEngine(double initial_capital, double bars_per_year, double risk_free_rate = 0.0);

    // Throws DataError on an empty history.
    MetricsReport compute(const backtest::PortfolioHistory& history,
                          const backtest::TradeLedger& ledger) const;

    // r[i] = total_value[i] / total_value[i-1] - 1 for i >= 1
    static std::vector<double> returnSeries(const backtest::PortfolioHistory& history);
    static std::vector<double> drawdownSeries(const backtest::PortfolioHistory& history);

    static double mean(const std::vector<double>& values);
    // Bessel-corrected; NaN for fewer than 2 values
    static double sampleStdDev(const std::vector<double>& values);

private:
    void computeReturnStats(const backtest::PortfolioHistory& history, MetricsReport& report) const;
    void computeTradeStats(const backtest::TradeLedger& ledger, MetricsReport& report) const;
    void computeCaptureRatios(const backtest::PortfolioHistory& history,
                              const std::vector<double>& returns,
                              MetricsReport& report) const;

    double initial_capital_;
    double bars_per_year_;
    double risk_free_rate_;
};

} // namespace analytics
} // namespace replaybt
