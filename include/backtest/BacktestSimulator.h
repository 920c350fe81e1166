#pragma once

#include <string>
#include <vector>

#include "backtest/Portfolio.h"
#include "common/Types.h"

namespace replaybt {
namespace backtest {

// Sequential long-only FLAT/LONG portfolio simulator.
//
// Bars are consumed in order; step i reads only bars[i], signals[i] and the
// prior state. A position still open after the last bar is marked to market
// and left open in the ledger.
class BacktestSimulator {
public:
    // Throws ConfigError for initial_capital <= 0 or commission_rate outside [0, 1).
    BacktestSimulator(double initial_capital, double commission_rate,
                      std::string symbol = "");

    // Throws AlignmentError / DataError before any state is touched.
    SimulationResult run(const std::vector<Bar>& bars, const std::vector<Signal>& signals);

    // Structural checks only (length, timestamps, positive prices).
    static void validateInputs(const std::vector<Bar>& bars, const std::vector<Signal>& signals);

    double initialCapital() const { return initial_capital_; }
    double commissionRate() const { return commission_rate_; }

private:
    void reset();
    void step(const Bar& bar, SignalAction action);
    void executeBuy(const Bar& bar);
    void executeSell(const Bar& bar);
    void recordState(const Bar& bar);

    double initial_capital_;
    double commission_rate_;
    std::string symbol_;

    // Run state
    PositionState state_;
    Amount cash_;
    Volume units_held_;
    SimulationResult result_;
};

} // namespace backtest
} // namespace replaybt
