#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"

namespace replaybt {

struct TickerSpec {
    std::string symbol;
    std::string file;
};

class Config {
public:
    static Config& getInstance();

    // Missing file: defaults are kept. Malformed JSON or invalid values: ConfigError.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void reset();

    backtest::BacktestConfig getBacktestConfig() const { return backtest_config_; }
    double getInitialCapital() const { return backtest_config_.initial_capital; }
    double getCommissionRate() const { return backtest_config_.commission_rate; }
    const std::vector<TickerSpec>& getTickers() const { return tickers_; }
    std::string getStrategyName() const { return strategy_name_; }
    nlohmann::json getStrategyParameters(const std::string& strategy_name) const;
    std::string getOutputDir() const { return output_dir_; }
    bool writeOutputFiles() const { return write_output_files_; }
    std::string getLogLevel() const { return log_level_; }

    // CLI overrides, re-validated on set
    void setInitialCapital(double v);
    void setCommissionRate(double v);
    void setStrategyName(const std::string& name);
    void setTickers(const std::vector<TickerSpec>& tickers) { tickers_ = tickers; }

private:
    Config() = default;

    backtest::BacktestConfig backtest_config_;
    std::vector<TickerSpec> tickers_;
    std::string strategy_name_ = "moving_average_crossover";
    nlohmann::json strategy_parameters_ = nlohmann::json::object();
    std::string output_dir_ = "output";
    bool write_output_files_ = true;
    std::string log_level_ = "info";
};

} // namespace replaybt
