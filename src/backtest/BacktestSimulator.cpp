#include "backtest/BacktestSimulator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

#include <cmath>

namespace replaybt {
namespace backtest {

BacktestSimulator::BacktestSimulator(double initial_capital, double commission_rate,
                                     std::string symbol)
    : initial_capital_(initial_capital)
    , commission_rate_(commission_rate)
    , symbol_(std::move(symbol))
    , state_(PositionState::FLAT)
    , cash_(initial_capital)
    , units_held_(0.0)
{
    if (!std::isfinite(initial_capital_) || initial_capital_ <= 0.0) {
        throw ConfigError("initial_capital must be > 0");
    }
    if (!std::isfinite(commission_rate_) || commission_rate_ < 0.0 || commission_rate_ >= 1.0) {
        throw ConfigError("commission_rate must be in [0, 1)");
    }
}

void BacktestSimulator::validateInputs(const std::vector<Bar>& bars,
                                       const std::vector<Signal>& signals) {
    if (bars.size() != signals.size()) {
        throw AlignmentError("bar count " + std::to_string(bars.size()) +
                             " != signal count " + std::to_string(signals.size()));
    }
    if (bars.empty()) {
        throw DataError("empty bar sequence");
    }

    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        if (signals[i].timestamp != bar.timestamp) {
            throw AlignmentError("signal timestamp " + utils::formatTimestamp(signals[i].timestamp) +
                                 " does not match bar " + utils::formatTimestamp(bar.timestamp) +
                                 " at index " + std::to_string(i));
        }
        if (i > 0 && bar.timestamp <= bars[i - 1].timestamp) {
            throw AlignmentError("timestamps not strictly increasing at index " + std::to_string(i));
        }
        if (!std::isfinite(bar.close) || bar.close <= 0.0) {
            throw DataError("non-positive close at " + utils::formatTimestamp(bar.timestamp));
        }
        if (bar.benchmark_close &&
            (!std::isfinite(*bar.benchmark_close) || *bar.benchmark_close <= 0.0)) {
            throw DataError("non-positive benchmark close at " + utils::formatTimestamp(bar.timestamp));
        }
    }
}

SimulationResult BacktestSimulator::run(const std::vector<Bar>& bars,
                                        const std::vector<Signal>& signals) {
    validateInputs(bars, signals);
    reset();

    result_.history.reserve(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        step(bars[i], signals[i].action);
    }

    result_.final_state = state_;
    if (state_ == PositionState::LONG) {
        LOG_INFO("[{}] Position still open after last bar: {} units marked at {:.4f}",
                 symbol_, units_held_, bars.back().close);
    }
    LOG_INFO("[{}] Simulation finished: {} bars, {} buys, {} sells, {} holds, {} rejected buys",
             symbol_, bars.size(), result_.stats.executed_buys, result_.stats.executed_sells,
             result_.stats.hold_signals, result_.stats.rejected_buys);

    SimulationResult out = std::move(result_);
    reset();
    return out;
}

void BacktestSimulator::reset() {
    state_ = PositionState::FLAT;
    cash_ = initial_capital_;
    units_held_ = 0.0;
    result_ = SimulationResult();
}

void BacktestSimulator::step(const Bar& bar, SignalAction action) {
    if (state_ == PositionState::FLAT && action == SignalAction::BUY) {
        executeBuy(bar);
    } else if (state_ == PositionState::LONG && action == SignalAction::SELL) {
        executeSell(bar);
    } else {
        result_.stats.hold_signals++;
    }
    recordState(bar);
}

void BacktestSimulator::executeBuy(const Bar& bar) {
    const double unit_cost = bar.close * (1.0 + commission_rate_);
    double quantity = std::floor(cash_ / unit_cost);
    // floor() on a rounded quotient can overshoot by one unit
    while (quantity >= 1.0 && quantity * bar.close * (1.0 + commission_rate_) > cash_) {
        quantity -= 1.0;
    }

    if (quantity < 1.0) {
        result_.stats.rejected_buys++;
        result_.stats.hold_signals++;
        LOG_DEBUG("[{}] BUY skipped at {}: cash {:.2f} below one unit ({:.2f})",
                  symbol_, utils::formatTimestamp(bar.timestamp), cash_, unit_cost);
        return;
    }

    const double cost = quantity * bar.close * (1.0 + commission_rate_);
    const double commission = quantity * bar.close * commission_rate_;
    cash_ -= cost;
    units_held_ = quantity;
    state_ = PositionState::LONG;

    Trade trade;
    trade.entry_timestamp = bar.timestamp;
    trade.side = TradeSide::LONG;
    trade.entry_price = bar.close;
    trade.quantity = quantity;
    trade.entry_cost = cost;
    trade.commission_paid = commission;
    result_.ledger.push_back(trade);
    result_.stats.executed_buys++;

    LOG_INFO("[{}] BUY {} @ {:.4f} (cost {:.2f}, commission {:.4f}) at {}",
             symbol_, quantity, bar.close, cost, commission, utils::formatTimestamp(bar.timestamp));
    Logger::getInstance().logTrade(symbol_, "BUY", bar.close, quantity, commission, 0.0);
}

void BacktestSimulator::executeSell(const Bar& bar) {
    Trade& trade = result_.ledger.back();

    const double gross = units_held_ * bar.close;
    const double proceeds = gross * (1.0 - commission_rate_);
    const double commission = gross * commission_rate_;
    const double pnl = proceeds - trade.entry_cost;

    cash_ += proceeds;
    trade.exit_timestamp = bar.timestamp;
    trade.exit_price = bar.close;
    trade.commission_paid += commission;
    trade.pnl = pnl;

    LOG_INFO("[{}] SELL {} @ {:.4f} (proceeds {:.2f}, pnl {:.2f}) at {}",
             symbol_, units_held_, bar.close, proceeds, pnl, utils::formatTimestamp(bar.timestamp));
    Logger::getInstance().logTrade(symbol_, "SELL", bar.close, units_held_, commission, pnl);

    units_held_ = 0.0;
    state_ = PositionState::FLAT;
    result_.stats.executed_sells++;
}

void BacktestSimulator::recordState(const Bar& bar) {
    PortfolioState snapshot;
    snapshot.timestamp = bar.timestamp;
    snapshot.cash = cash_;
    snapshot.units_held = units_held_;
    snapshot.holdings_value = units_held_ * bar.close;
    snapshot.total_value = snapshot.cash + snapshot.holdings_value;
    snapshot.close = bar.close;
    snapshot.benchmark_close = bar.benchmark_close;
    result_.history.push_back(snapshot);
}

} // namespace backtest
} // namespace replaybt
