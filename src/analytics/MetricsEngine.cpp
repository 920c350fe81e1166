#include "analytics/MetricsEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace replaybt {
namespace analytics {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

double meanOrNaN(double sum, int count) {
    return (count > 0) ? (sum / static_cast<double>(count)) : kNaN;
}
}

MetricsEngine::MetricsEngine(double initial_capital, double bars_per_year, double risk_free_rate)
    : initial_capital_(initial_capital)
    , bars_per_year_(bars_per_year)
    , risk_free_rate_(risk_free_rate)
{
    if (!std::isfinite(initial_capital_) || initial_capital_ <= 0.0) {
        throw ConfigError("initial_capital must be > 0");
    }
    if (!std::isfinite(bars_per_year_) || bars_per_year_ <= 0.0) {
        throw ConfigError("bars_per_year must be > 0");
    }
    if (!std::isfinite(risk_free_rate_)) {
        throw ConfigError("risk_free_rate must be finite");
    }
}

double MetricsEngine::mean(const std::vector<double>& values) {
    if (values.empty()) {
        return kNaN;
    }
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double MetricsEngine::sampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return kNaN;
    }
    const double mu = mean(values);
    double sq_sum = 0.0;
    for (double v : values) {
        const double d = v - mu;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

std::vector<double> MetricsEngine::returnSeries(const backtest::PortfolioHistory& history) {
    std::vector<double> out;
    if (history.size() < 2) {
        return out;
    }
    out.reserve(history.size() - 1);
    for (size_t i = 1; i < history.size(); ++i) {
        out.push_back(history[i].total_value / history[i - 1].total_value - 1.0);
    }
    return out;
}

std::vector<double> MetricsEngine::drawdownSeries(const backtest::PortfolioHistory& history) {
    std::vector<double> out;
    out.reserve(history.size());
    double peak = 0.0;
    for (const auto& state : history) {
        peak = std::max(peak, state.total_value);
        out.push_back((peak > 0.0) ? (state.total_value - peak) / peak : 0.0);
    }
    return out;
}

MetricsReport MetricsEngine::compute(const backtest::PortfolioHistory& history,
                                     const backtest::TradeLedger& ledger) const {
    if (history.empty()) {
        throw DataError("cannot compute metrics on an empty portfolio history");
    }

    MetricsReport report;
    report.initial_capital = initial_capital_;
    report.final_total_value = history.back().total_value;
    report.total_pnl = report.final_total_value - initial_capital_;
    report.returns_pct = report.total_pnl / initial_capital_ * 100.0;

    computeReturnStats(history, report);
    computeTradeStats(ledger, report);

    if (!ledger.empty() && ledger.back().isOpen()) {
        report.open_position = true;
        report.unrealized_pnl = history.back().holdings_value - ledger.back().entry_cost;
    }

    if (std::isnan(report.sharpe_ratio)) {
        LOG_DEBUG("Sharpe ratio undefined (fewer than 2 returns or zero variance)");
    }
    if (std::isnan(report.sortino_ratio)) {
        LOG_DEBUG("Sortino ratio undefined (insufficient negative returns)");
    }
    return report;
}

void MetricsEngine::computeReturnStats(const backtest::PortfolioHistory& history,
                                       MetricsReport& report) const {
    report.drawdown_series = drawdownSeries(history);
    const double worst = *std::min_element(report.drawdown_series.begin(), report.drawdown_series.end());
    report.max_drawdown = std::clamp(worst * 100.0, -100.0, 0.0);

    const std::vector<double> returns = returnSeries(history);
    const double annualizer = std::sqrt(bars_per_year_);
    const double excess_mean = mean(returns) - risk_free_rate_ / bars_per_year_;

    const double sd = sampleStdDev(returns);
    report.sharpe_ratio = (returns.size() < 2 || !(sd > 0.0))
        ? kNaN
        : excess_mean / sd * annualizer;

    std::vector<double> downside;
    for (double r : returns) {
        if (r < 0.0) {
            downside.push_back(r);
        }
    }
    const double downside_sd = sampleStdDev(downside);
    report.sortino_ratio = (downside.empty() || !(downside_sd > 0.0))
        ? kNaN
        : excess_mean / downside_sd * annualizer;

    computeCaptureRatios(history, returns, report);
}

void MetricsEngine::computeTradeStats(const backtest::TradeLedger& ledger,
                                      MetricsReport& report) const {
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_pnl = 0.0;

    report.num_buys = static_cast<int>(ledger.size());
    for (const auto& trade : ledger) {
        if (!trade.pnl) {
            continue;
        }
        const double pnl = *trade.pnl;
        report.num_closed_trades++;
        net_pnl += pnl;
        if (pnl > 0.0) {
            report.wins++;
            gross_profit += pnl;
        } else if (pnl < 0.0) {
            report.losses++;
            gross_loss_abs += std::abs(pnl);
        }
    }
    report.num_sells = report.num_closed_trades;

    const int closed = report.num_closed_trades;
    report.win_rate = (closed > 0)
        ? (static_cast<double>(report.wins) / static_cast<double>(closed))
        : 0.0;
    report.avg_pnl_per_trade = meanOrNaN(net_pnl, closed);
    report.avg_win = (report.wins > 0) ? (gross_profit / static_cast<double>(report.wins)) : 0.0;
    report.avg_loss = (report.losses > 0) ? (gross_loss_abs / static_cast<double>(report.losses)) : 0.0;

    if (report.losses > 0) {
        report.profit_factor = gross_profit / gross_loss_abs;
    } else {
        report.profit_factor = (gross_profit > 0.0) ? kInf : kNaN;
    }

    report.expectancy = (closed > 0)
        ? (report.win_rate * report.avg_win - (1.0 - report.win_rate) * report.avg_loss)
        : kNaN;
}

void MetricsEngine::computeCaptureRatios(const backtest::PortfolioHistory& history,
                                         const std::vector<double>& returns,
                                         MetricsReport& report) const {
    const bool has_benchmark = std::any_of(history.begin(), history.end(),
        [](const backtest::PortfolioState& s) { return s.benchmark_close.has_value(); });
    if (!has_benchmark) {
        return;
    }

    double up_strategy = 0.0;
    double up_benchmark = 0.0;
    int up_count = 0;
    double down_strategy = 0.0;
    double down_benchmark = 0.0;
    int down_count = 0;

    for (size_t i = 1; i < history.size(); ++i) {
        const auto& prev = history[i - 1].benchmark_close;
        const auto& curr = history[i].benchmark_close;
        if (!prev || !curr) {
            continue;
        }
        const double bench_return = *curr / *prev - 1.0;
        const double strat_return = returns[i - 1];
        if (bench_return > 0.0) {
            up_strategy += strat_return;
            up_benchmark += bench_return;
            up_count++;
        } else if (bench_return < 0.0) {
            down_strategy += strat_return;
            down_benchmark += bench_return;
            down_count++;
        }
    }

    // Equal counts cancel: mean(r) / mean(b) == sum(r) / sum(b)
    report.up_capture = (up_count > 0) ? (up_strategy / up_benchmark) : kNaN;
    report.down_capture = (down_count > 0) ? (down_strategy / down_benchmark) : kNaN;
}

} // namespace analytics
} // namespace replaybt
