#undef NDEBUG
#include "common/Config.h"
#include "common/Errors.h"
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {
template <typename Fn>
bool throwsConfigError(Fn fn) {
    try {
        fn();
    } catch (const replaybt::ConfigError&) {
        return true;
    }
    return false;
}
}

// Simple manual test runner
int main() {
    using namespace replaybt;
    using backtest::BenchmarkMode;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // 1. Defaults
    config.reset();
    assert(config.getInitialCapital() == 10000.0);
    assert(config.getCommissionRate() == 0.001);
    assert(config.getBacktestConfig().bars_per_year == 8760.0);
    assert(config.getBacktestConfig().benchmark_mode == BenchmarkMode::SELF);
    assert(config.getStrategyName() == "moving_average_crossover");
    assert(config.getOutputDir() == "output");
    assert(config.writeOutputFiles());
    assert(config.getTickers().empty());

    // 2. Timeframe table
    assert(backtest::barsPerYearForTimeframe("1m") == 525600.0);
    assert(backtest::barsPerYearForTimeframe("5m") == 105120.0);
    assert(backtest::barsPerYearForTimeframe("4h") == 2190.0);
    assert(backtest::barsPerYearForTimeframe("1D") == 365.0);
    assert(backtest::barsPerYearForTimeframe("1w") == 52.0);
    assert(throwsConfigError([] { backtest::barsPerYearForTimeframe("3h"); }));

    // 3. Full document
    nlohmann::json j = {
        {"backtest", {
            {"initial_capital", 5000.0},
            {"commission_rate", 0.002},
            {"timeframe", "1d"},
            {"risk_free_rate", 0.03},
            {"start_date", "2023-01-01"},
            {"end_date", "2023-12-31"}
        }},
        {"tickers", nlohmann::json::array({
            {{"symbol", "BTCUSD"}, {"file", "data/btc.csv"}},
            {{"file", "data/ETHUSD.json"}}
        })},
        {"benchmark", "none"},
        {"strategy", {
            {"name", "Bollinger"},
            {"parameters", {
                {"mean_reversion", {{"window", 30}, {"std_dev_multiplier", 1.5}}}
            }}
        }},
        {"output", {{"directory", "out"}, {"write_files", false}}},
        {"log_level", "debug"}
    };
    config.loadFromJson(j);

    const auto settings = config.getBacktestConfig();
    assert(settings.initial_capital == 5000.0);
    assert(settings.commission_rate == 0.002);
    assert(settings.bars_per_year == 365.0);
    assert(settings.risk_free_rate == 0.03);
    assert(settings.start_date == "2023-01-01");
    assert(settings.end_date == "2023-12-31");
    assert(settings.benchmark_mode == BenchmarkMode::NONE);
    assert(config.getTickers().size() == 2);
    assert(config.getTickers()[0].symbol == "BTCUSD");
    assert(config.getTickers()[1].symbol == "ETHUSD");
    assert(config.getStrategyName() == "mean_reversion");
    assert(config.getStrategyParameters("mean_reversion")["window"] == 30);
    assert(config.getStrategyParameters("bollinger")["std_dev_multiplier"] == 1.5);
    assert(config.getStrategyParameters("moving_average_crossover").empty());
    assert(config.getOutputDir() == "out");
    assert(!config.writeOutputFiles());
    assert(config.getLogLevel() == "debug");

    // 4. Explicit bars_per_year wins over the timeframe; benchmark file
    config.loadFromJson({
        {"backtest", {{"timeframe", "1h"}, {"bars_per_year", 252.0}}},
        {"benchmark", "data/index.csv"}
    });
    assert(config.getBacktestConfig().bars_per_year == 252.0);
    assert(config.getBacktestConfig().benchmark_mode == BenchmarkMode::FILE);
    assert(config.getBacktestConfig().benchmark_file == "data/index.csv");

    // Benchmark column carried by the data file itself
    config.loadFromJson({{"benchmark", "Column"}});
    assert(config.getBacktestConfig().benchmark_mode == BenchmarkMode::COLUMN);

    // Reload resets previous values
    config.loadFromJson(nlohmann::json::object());
    assert(config.getBacktestConfig().bars_per_year == 8760.0);
    assert(config.getBacktestConfig().benchmark_mode == BenchmarkMode::SELF);

    // 5. Invalid values
    assert(throwsConfigError([&] { config.loadFromJson({{"backtest", {{"initial_capital", 0.0}}}}); }));
    assert(throwsConfigError([&] { config.loadFromJson({{"backtest", {{"commission_rate", 1.0}}}}); }));
    assert(throwsConfigError([&] { config.loadFromJson({{"backtest", {{"commission_rate", -0.1}}}}); }));
    assert(throwsConfigError([&] { config.loadFromJson({{"backtest", {{"timeframe", "2y"}}}}); }));
    assert(throwsConfigError([&] { config.loadFromJson({{"backtest", {{"initial_capital", "lots"}}}}); }));
    assert(throwsConfigError([&] { config.loadFromJson({{"tickers", nlohmann::json::array({{{"symbol", "X"}}})}}); }));

    // 6. CLI setters re-validate and keep the old value on failure
    config.reset();
    config.setInitialCapital(2500.0);
    assert(config.getInitialCapital() == 2500.0);
    assert(throwsConfigError([&] { config.setInitialCapital(-5.0); }));
    assert(config.getInitialCapital() == 2500.0);
    assert(throwsConfigError([&] { config.setCommissionRate(1.5); }));
    assert(config.getCommissionRate() == 0.001);
    config.setStrategyName("  MA_Crossover ");
    assert(config.getStrategyName() == "moving_average_crossover");

    // 7. Files: missing file keeps defaults, malformed JSON is a ConfigError
    const auto dir = std::filesystem::temp_directory_path() / "replaybt_test_config";
    std::filesystem::create_directories(dir);

    config.setInitialCapital(1234.0);
    config.load((dir / "does_not_exist.json").string());
    assert(config.getInitialCapital() == 10000.0);

    const auto bad = dir / "bad.json";
    {
        std::ofstream out(bad);
        out << "{ \"backtest\": { \"initial_capital\": 100, }";
    }
    assert(throwsConfigError([&] { config.load(bad.string()); }));

    const auto good = dir / "good.json";
    {
        std::ofstream out(good);
        out << R"({"backtest": {"initial_capital": 750.5, "timeframe": "15m"}})";
    }
    config.load(good.string());
    assert(config.getInitialCapital() == 750.5);
    assert(config.getBacktestConfig().bars_per_year == 35040.0);

    std::filesystem::remove_all(dir);
    config.reset();

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
