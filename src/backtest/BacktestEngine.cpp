#include "backtest/BacktestEngine.h"
#include "backtest/BacktestSimulator.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "common/TimeUtils.h"
#include <filesystem>

namespace replaybt {
namespace backtest {

namespace {
std::string resolveDataPath(const std::string& file_path) {
    if (std::filesystem::path(file_path).is_absolute()) {
        return file_path;
    }
    return utils::PathUtils::resolveRelativePath(file_path).string();
}
}

BacktestEngine::BacktestEngine()
    : strategy_parameters_(nlohmann::json::object())
    , strategy_manager_(strategy::StrategyManager::createDefault())
{
}

void BacktestEngine::init(const Config& config) {
    const std::string name = config.getStrategyName();
    init(config.getBacktestConfig(), name, config.getStrategyParameters(name));
}

void BacktestEngine::init(const BacktestConfig& settings,
                          const std::string& strategy_name,
                          const nlohmann::json& strategy_parameters) {
    settings.validate();
    // Unknown strategy names fail here, before any data is read
    strategy_manager_->getStrategy(strategy_name);

    settings_ = settings;
    strategy_name_ = strategy_name;
    strategy_parameters_ = strategy_parameters.is_null() ? nlohmann::json::object() : strategy_parameters;

    benchmark_bars_.clear();
    if (settings_.benchmark_mode == BenchmarkMode::FILE) {
        benchmark_bars_ = DataHistory::load(resolveDataPath(settings_.benchmark_file));
    }
    initialized_ = true;

    LOG_INFO("BacktestEngine initialized: strategy={}, capital={:.2f}, commission={:.4f}",
             strategy_name_, settings_.initial_capital, settings_.commission_rate);
}

void BacktestEngine::loadData(const std::string& file_path, const std::string& symbol) {
    auto bars = DataHistory::load(resolveDataPath(file_path));
    setBars(std::move(bars),
            symbol.empty() ? std::filesystem::path(file_path).stem().string() : symbol);
}

void BacktestEngine::setBars(std::vector<Bar> bars, const std::string& symbol) {
    if (!initialized_) {
        throw ConfigError("BacktestEngine::init must be called before loading data");
    }
    symbol_ = symbol;
    bars_ = DataHistory::normalize(std::move(bars), symbol_);
    prepareBars();
}

void BacktestEngine::prepareBars() {
    bars_ = DataHistory::filterByDate(bars_, settings_.start_date, settings_.end_date);
    if (bars_.empty()) {
        throw DataError("no bars for " + symbol_ + " in the requested date range");
    }

    switch (settings_.benchmark_mode) {
        case BenchmarkMode::NONE:
            for (auto& bar : bars_) {
                bar.benchmark_close.reset();
            }
            break;
        case BenchmarkMode::SELF:
            DataHistory::attachSelfBenchmark(bars_);
            break;
        case BenchmarkMode::COLUMN:
            break;
        case BenchmarkMode::FILE:
            DataHistory::attachBenchmark(bars_, benchmark_bars_);
            break;
    }

    LOG_INFO("[{}] {} bars from {} to {}", symbol_, bars_.size(),
             utils::formatTimestamp(bars_.front().timestamp),
             utils::formatTimestamp(bars_.back().timestamp));
}

BacktestResult BacktestEngine::run() const {
    if (!initialized_) {
        throw ConfigError("BacktestEngine::init must be called before run");
    }
    if (bars_.empty()) {
        throw DataError("no data loaded");
    }

    LOG_INFO("Starting backtest [{}] with {} bars, strategy {}", symbol_, bars_.size(), strategy_name_);

    BacktestResult result;
    result.symbol = symbol_;
    result.strategy_name = strategy_name_;
    result.bars = bars_;
    result.signals = strategy_manager_->generateSignals(strategy_name_, bars_, strategy_parameters_);

    BacktestSimulator simulator(settings_.initial_capital, settings_.commission_rate, symbol_);
    result.simulation = simulator.run(result.bars, result.signals);

    analytics::MetricsEngine metrics(settings_.initial_capital, settings_.bars_per_year,
                                     settings_.risk_free_rate);
    result.report = metrics.compute(result.simulation.history, result.simulation.ledger);

    LOG_INFO("Backtest completed [{}]: final value {:.2f} ({:+.2f}%)", symbol_,
             result.report.final_total_value, result.report.returns_pct);
    return result;
}

} // namespace backtest
} // namespace replaybt
