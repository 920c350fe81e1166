#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"

namespace replaybt {
namespace backtest {

enum class PositionState { FLAT, LONG };

enum class TradeSide { LONG };

// Snapshot after the transition for one bar.
// Invariants: total_value == cash + holdings_value, holdings_value == units_held * close.
struct PortfolioState {
    TimestampMs timestamp = 0;
    Amount cash = 0.0;
    Volume units_held = 0.0;
    Amount holdings_value = 0.0;
    Amount total_value = 0.0;
    Price close = 0.0;
    std::optional<Price> benchmark_close;
};

struct Trade {
    TimestampMs entry_timestamp = 0;
    std::optional<TimestampMs> exit_timestamp;
    TradeSide side = TradeSide::LONG;
    Price entry_price = 0.0;
    std::optional<Price> exit_price;
    Volume quantity = 0.0;
    Amount entry_cost = 0.0;        // quantity * entry_price * (1 + commission_rate)
    Amount commission_paid = 0.0;   // entry commission, plus exit commission once closed
    std::optional<Amount> pnl;

    bool isOpen() const { return !pnl.has_value(); }
};

using PortfolioHistory = std::vector<PortfolioState>;
using TradeLedger = std::vector<Trade>;

struct ExecutionStats {
    int executed_buys = 0;
    int executed_sells = 0;
    int hold_signals = 0;   // HOLD, redundant BUY/SELL, and rejected buys
    int rejected_buys = 0;  // BUY while FLAT with insufficient cash for one unit
};

struct SimulationResult {
    PortfolioHistory history;
    TradeLedger ledger;
    ExecutionStats stats;
    PositionState final_state = PositionState::FLAT;
};

} // namespace backtest
} // namespace replaybt
