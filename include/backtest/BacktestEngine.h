#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "common/Config.h"
#include "backtest/BacktestConfig.h"
#include "backtest/Portfolio.h"
#include "analytics/MetricsEngine.h"
#include "strategy/StrategyManager.h"

namespace replaybt {
namespace backtest {

struct BacktestResult {
    std::string symbol;
    std::string strategy_name;
    std::vector<Bar> bars;
    std::vector<Signal> signals;
    SimulationResult simulation;
    analytics::MetricsReport report;
};

// Single-ticker pipeline: load -> date filter -> benchmark -> signals -> simulate -> metrics
class BacktestEngine {
public:
    BacktestEngine();

    // Validates settings and resolves the strategy; throws ConfigError.
    void init(const Config& config);
    void init(const BacktestConfig& settings,
              const std::string& strategy_name,
              const nlohmann::json& strategy_parameters);

    // Load historical data (CSV or JSON). Throws DataError when nothing is left after filtering.
    void loadData(const std::string& file_path, const std::string& symbol = "");

    // Use already-loaded bars instead of a file
    void setBars(std::vector<Bar> bars, const std::string& symbol);

    // Run the backtest on the loaded bars
    BacktestResult run() const;

    const std::vector<Bar>& getBars() const { return bars_; }
    const strategy::StrategyManager& getStrategyManager() const { return *strategy_manager_; }

private:
    void prepareBars();

    BacktestConfig settings_;
    std::string strategy_name_;
    nlohmann::json strategy_parameters_;
    bool initialized_ = false;

    std::string symbol_;
    std::vector<Bar> bars_;
    std::vector<Bar> benchmark_bars_;

    std::unique_ptr<strategy::StrategyManager> strategy_manager_;
};

} // namespace backtest
} // namespace replaybt
