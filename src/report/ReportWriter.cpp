#include "report/ReportWriter.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>

namespace replaybt {
namespace report {

namespace {
const char* sentinelOf(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return "inf";
    return nullptr;
}

void putMetric(nlohmann::json& j, nlohmann::json& sentinels, const char* key, double value) {
    if (const char* tag = sentinelOf(value)) {
        j[key] = nullptr;
        sentinels[key] = tag;
        return;
    }
    j[key] = value;
}

void putMetric(nlohmann::json& j, nlohmann::json& sentinels, const char* key,
               const std::optional<double>& value) {
    if (!value) {
        j[key] = nullptr;
        sentinels[key] = "absent";
        return;
    }
    putMetric(j, sentinels, key, *value);
}

std::string formatOptional(const std::optional<double>& value, int precision = 4) {
    return value ? ReportWriter::formatMetric(*value, precision) : std::string("n/a");
}

// Empty cell for NaN so spreadsheets read it as missing
std::string csvNumber(double value) {
    if (std::isnan(value)) return "";
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

std::string csvNumber(const std::optional<double>& value) {
    return value ? csvNumber(*value) : std::string();
}

std::ofstream openForWrite(const std::filesystem::path& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw BacktestError("cannot write " + path.string());
    }
    return out;
}

void printTradeRow(std::ostream& out, const backtest::Trade& t) {
    out << "  " << utils::formatTimestamp(t.entry_timestamp)
        << " BUY  " << std::setw(10) << t.quantity
        << " @ " << std::setw(12) << t.entry_price;
    if (t.exit_timestamp && t.exit_price) {
        out << " -> " << utils::formatTimestamp(*t.exit_timestamp)
            << " SELL @ " << std::setw(12) << *t.exit_price
            << " pnl " << formatOptional(t.pnl, 2);
    } else {
        out << " -> open";
    }
    out << "\n";
}

void printStateRow(std::ostream& out, const backtest::PortfolioState& s) {
    out << "  " << utils::formatTimestamp(s.timestamp)
        << " close " << std::setw(12) << s.close
        << " cash " << std::setw(14) << s.cash
        << " units " << std::setw(10) << s.units_held
        << " total " << std::setw(14) << s.total_value << "\n";
}

template <typename T, typename Fn>
void printHeadTail(std::ostream& out, const std::vector<T>& rows, size_t n, Fn printRow) {
    if (rows.size() <= 2 * n) {
        for (const auto& r : rows) printRow(out, r);
        return;
    }
    for (size_t i = 0; i < n; ++i) printRow(out, rows[i]);
    out << "  ... (" << (rows.size() - 2 * n) << " more)\n";
    for (size_t i = rows.size() - n; i < rows.size(); ++i) printRow(out, rows[i]);
}
}

std::string ReportWriter::formatMetric(double value, int precision) {
    if (std::isnan(value)) return "n/a";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

void ReportWriter::printSummary(std::ostream& out, const backtest::BacktestResult& result,
                                size_t preview_rows) {
    const auto& r = result.report;
    const auto& stats = result.simulation.stats;

    out << "\nBacktest result: " << result.symbol << " (" << result.strategy_name << ")\n";
    out << "---------------------------------------------\n";
    out << "Initial capital:     " << formatMetric(r.initial_capital, 2) << "\n";
    out << "Final value:         " << formatMetric(r.final_total_value, 2) << "\n";
    out << "Total PnL:           " << formatMetric(r.total_pnl, 2) << "\n";
    out << "Return:              " << formatMetric(r.returns_pct, 2) << "%\n";
    out << "Buys / Sells:        " << r.num_buys << " / " << r.num_sells << "\n";
    out << "Wins / Losses:       " << r.wins << " / " << r.losses << "\n";
    out << "Win rate:            " << formatMetric(r.win_rate * 100.0, 2) << "%\n";
    out << "Avg PnL per trade:   " << formatMetric(r.avg_pnl_per_trade, 2) << "\n";
    out << "Avg win / loss:      " << formatMetric(r.avg_win, 2) << " / " << formatMetric(r.avg_loss, 2) << "\n";
    out << "Max drawdown:        " << formatMetric(r.max_drawdown, 2) << "%\n";
    out << "Sharpe ratio:        " << formatMetric(r.sharpe_ratio) << "\n";
    out << "Sortino ratio:       " << formatMetric(r.sortino_ratio) << "\n";
    out << "Profit factor:       " << formatMetric(r.profit_factor) << "\n";
    out << "Expectancy:          " << formatMetric(r.expectancy, 2) << "\n";
    out << "Up capture:          " << formatOptional(r.up_capture) << "\n";
    out << "Down capture:        " << formatOptional(r.down_capture) << "\n";
    if (r.open_position) {
        out << "Open position:       yes (unrealized " << formatOptional(r.unrealized_pnl, 2) << ")\n";
    }
    out << "Signals:             " << stats.executed_buys << " buys, " << stats.executed_sells
        << " sells, " << stats.hold_signals << " holds (" << stats.rejected_buys << " rejected)\n";

    if (preview_rows > 0) {
        out << "\nTrades (" << result.simulation.ledger.size() << "):\n";
        printHeadTail(out, result.simulation.ledger, preview_rows, printTradeRow);
        out << "\nPortfolio history (" << result.simulation.history.size() << " bars):\n";
        printHeadTail(out, result.simulation.history, preview_rows, printStateRow);
    }
    out << "---------------------------------------------\n";
}

nlohmann::json ReportWriter::toJson(const analytics::MetricsReport& r) {
    nlohmann::json j;
    nlohmann::json sentinels = nlohmann::json::object();

    j["initial_capital"] = r.initial_capital;
    j["final_total_value"] = r.final_total_value;
    j["total_pnl"] = r.total_pnl;
    j["returns_pct"] = r.returns_pct;
    j["num_buys"] = r.num_buys;
    j["num_sells"] = r.num_sells;
    j["num_closed_trades"] = r.num_closed_trades;
    j["wins"] = r.wins;
    j["losses"] = r.losses;
    j["win_rate"] = r.win_rate;
    putMetric(j, sentinels, "avg_pnl_per_trade", r.avg_pnl_per_trade);
    j["avg_win"] = r.avg_win;
    j["avg_loss"] = r.avg_loss;
    j["max_drawdown"] = r.max_drawdown;
    putMetric(j, sentinels, "sharpe_ratio", r.sharpe_ratio);
    putMetric(j, sentinels, "sortino_ratio", r.sortino_ratio);
    putMetric(j, sentinels, "profit_factor", r.profit_factor);
    putMetric(j, sentinels, "expectancy", r.expectancy);
    putMetric(j, sentinels, "up_capture", r.up_capture);
    putMetric(j, sentinels, "down_capture", r.down_capture);
    j["open_position"] = r.open_position;
    putMetric(j, sentinels, "unrealized_pnl", r.unrealized_pnl);

    j["sentinels"] = sentinels;
    return j;
}

nlohmann::json ReportWriter::toJson(const backtest::BacktestResult& result) {
    nlohmann::json j;
    j["symbol"] = result.symbol;
    j["strategy"] = result.strategy_name;
    j["bars"] = result.bars.size();
    if (!result.bars.empty()) {
        j["start"] = utils::formatTimestamp(result.bars.front().timestamp);
        j["end"] = utils::formatTimestamp(result.bars.back().timestamp);
    }
    const auto& stats = result.simulation.stats;
    j["execution"] = {
        {"executed_buys", stats.executed_buys},
        {"executed_sells", stats.executed_sells},
        {"hold_signals", stats.hold_signals},
        {"rejected_buys", stats.rejected_buys}
    };
    j["metrics"] = toJson(result.report);
    return j;
}

void ReportWriter::writeFiles(const backtest::BacktestResult& result, const std::string& output_dir) {
    namespace fs = std::filesystem;
    const fs::path dir(output_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw BacktestError("cannot create output directory " + dir.string() + ": " + ec.message());
    }

    const auto& history = result.simulation.history;
    const auto& drawdown = result.report.drawdown_series;

    // Extras columns in stable (sorted) order across all signals
    std::set<std::string> extra_keys;
    for (const auto& s : result.signals) {
        for (const auto& kv : s.extras) extra_keys.insert(kv.first);
    }

    {
        auto out = openForWrite(dir / (result.symbol + "_portfolio.csv"));
        out << "timestamp,datetime,close,signal,cash,units_held,holdings_value,total_value,benchmark_close,drawdown";
        for (const auto& key : extra_keys) out << "," << key;
        out << "\n";

        for (size_t i = 0; i < history.size(); ++i) {
            const auto& s = history[i];
            const Signal* signal = (i < result.signals.size()) ? &result.signals[i] : nullptr;
            out << s.timestamp << "," << utils::formatTimestamp(s.timestamp) << ","
                << csvNumber(s.close) << ","
                << (signal ? toString(signal->action) : "") << ","
                << csvNumber(s.cash) << "," << csvNumber(s.units_held) << ","
                << csvNumber(s.holdings_value) << "," << csvNumber(s.total_value) << ","
                << csvNumber(s.benchmark_close) << ","
                << (i < drawdown.size() ? csvNumber(drawdown[i]) : std::string());
            for (const auto& key : extra_keys) {
                out << ",";
                if (signal) {
                    auto it = signal->extras.find(key);
                    if (it != signal->extras.end()) out << csvNumber(it->second);
                }
            }
            out << "\n";
        }
    }

    {
        auto out = openForWrite(dir / (result.symbol + "_trades.csv"));
        out << "entry_timestamp,entry_time,exit_timestamp,exit_time,side,entry_price,exit_price,"
               "quantity,entry_cost,commission,pnl\n";
        for (const auto& t : result.simulation.ledger) {
            out << t.entry_timestamp << "," << utils::formatTimestamp(t.entry_timestamp) << ",";
            if (t.exit_timestamp) {
                out << *t.exit_timestamp << "," << utils::formatTimestamp(*t.exit_timestamp);
            } else {
                out << ",";
            }
            out << ",LONG," << csvNumber(t.entry_price) << "," << csvNumber(t.exit_price) << ","
                << csvNumber(t.quantity) << "," << csvNumber(t.entry_cost) << ","
                << csvNumber(t.commission_paid) << "," << csvNumber(t.pnl) << "\n";
        }
    }

    {
        auto out = openForWrite(dir / (result.symbol + "_metrics.json"));
        out << toJson(result).dump(2) << "\n";
    }

    LOG_INFO("[{}] reports written to {}", result.symbol, dir.string());
}

} // namespace report
} // namespace replaybt
