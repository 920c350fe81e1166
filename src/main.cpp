#include "backtest/BacktestEngine.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "report/ReportWriter.h"
#include "strategy/StrategyManager.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace replaybt;

namespace {
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_TICKER_FAILED = 1;

struct CliOptions {
    std::string config_path = "config/config.json";
    std::string data_file;
    std::string symbol;
    std::string strategy;
    double initial_capital = -1.0;
    double commission_rate = -1.0;
    bool commission_set = false;
    bool json_mode = false;
    bool no_files = false;
    bool list_strategies = false;
    bool show_help = false;
};

void printUsage() {
    std::cout << "Usage: replaybt [options]\n"
              << "  --config <path>           config file (default config/config.json)\n"
              << "  --data <file>             run a single CSV/JSON bar file instead of config tickers\n"
              << "  --symbol <name>           symbol for --data (default: file stem)\n"
              << "  --strategy <name>         strategy registry key\n"
              << "  --initial-capital <x>     starting cash\n"
              << "  --commission <x>          commission rate in [0, 1)\n"
              << "  --json                    print results as JSON to stdout\n"
              << "  --no-files                skip CSV/JSON report files\n"
              << "  --list-strategies         print registered strategies and exit\n";
}

double parseNumber(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        const double v = std::stod(text, &used);
        if (used != text.size()) {
            throw ConfigError("invalid value for " + flag + ": " + text);
        }
        return v;
    } catch (const std::invalid_argument&) {
        throw ConfigError("invalid value for " + flag + ": " + text);
    } catch (const std::out_of_range&) {
        throw ConfigError("value out of range for " + flag + ": " + text);
    }
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--config") {
            opts.config_path = next();
        } else if (arg == "--data") {
            opts.data_file = next();
        } else if (arg == "--symbol") {
            opts.symbol = next();
        } else if (arg == "--strategy") {
            opts.strategy = next();
        } else if (arg == "--initial-capital") {
            opts.initial_capital = parseNumber(arg, next());
            if (opts.initial_capital <= 0.0) {
                throw ConfigError("--initial-capital must be > 0");
            }
        } else if (arg == "--commission") {
            opts.commission_rate = parseNumber(arg, next());
            opts.commission_set = true;
        } else if (arg == "--json") {
            opts.json_mode = true;
        } else if (arg == "--no-files") {
            opts.no_files = true;
        } else if (arg == "--list-strategies") {
            opts.list_strategies = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else {
            throw ConfigError("unknown argument: " + arg);
        }
    }
    return opts;
}
}

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        printUsage();
        return EXIT_CONFIG_ERROR;
    }
    if (opts.show_help) {
        printUsage();
        return 0;
    }

    try {
        Logger::getInstance().initialize(utils::PathUtils::getLogsDir().string(), "info", opts.json_mode);
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << "\n";
        return 1;
    }

    auto& config = Config::getInstance();
    std::vector<TickerSpec> tickers;
    try {
        config.load(opts.config_path);
        Logger::getInstance().setLevel(config.getLogLevel());

        if (opts.initial_capital > 0.0) {
            config.setInitialCapital(opts.initial_capital);
        }
        if (opts.commission_set) {
            config.setCommissionRate(opts.commission_rate);
        }
        if (!opts.strategy.empty()) {
            config.setStrategyName(opts.strategy);
        }
        if (!opts.data_file.empty()) {
            const std::string symbol = opts.symbol.empty()
                ? std::filesystem::path(opts.data_file).stem().string()
                : opts.symbol;
            config.setTickers({TickerSpec{symbol, opts.data_file}});
        }
        tickers = config.getTickers();
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        std::cerr << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    }

    backtest::BacktestEngine bt_engine;
    if (opts.list_strategies) {
        for (const auto& name : bt_engine.getStrategyManager().getStrategyNames()) {
            auto info = bt_engine.getStrategyManager().getStrategy(name)->getInfo();
            std::cout << name << " - " << info.description << "\n";
        }
        return 0;
    }

    try {
        bt_engine.init(config);
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        std::cerr << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    } catch (const DataError& e) {
        LOG_ERROR("Benchmark data error: {}", e.what());
        std::cerr << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    }

    if (tickers.empty()) {
        LOG_ERROR("No tickers configured. Use --data <file> or add \"tickers\" to {}", opts.config_path);
        printUsage();
        return EXIT_CONFIG_ERROR;
    }

    int failures = 0;
    nlohmann::json json_results = nlohmann::json::array();

    for (const auto& ticker : tickers) {
        try {
            LOG_INFO("Starting backtest for {} ({})", ticker.symbol, ticker.file);
            bt_engine.loadData(ticker.file, ticker.symbol);
            const auto result = bt_engine.run();

            if (opts.json_mode) {
                json_results.push_back(report::ReportWriter::toJson(result));
            } else {
                report::ReportWriter::printSummary(std::cout, result);
            }
            if (config.writeOutputFiles() && !opts.no_files) {
                report::ReportWriter::writeFiles(result, config.getOutputDir());
            }
        } catch (const BacktestError& e) {
            LOG_ERROR("[{}] backtest failed: {}", ticker.symbol, e.what());
            failures++;
        } catch (const std::exception& e) {
            LOG_ERROR("[{}] unexpected error: {}", ticker.symbol, e.what());
            failures++;
        }
    }

    if (opts.json_mode) {
        std::cout << json_results.dump(2) << "\n";
    }

    LOG_INFO("Finished {} ticker(s), {} failed", tickers.size(), failures);
    return failures > 0 ? EXIT_TICKER_FAILED : 0;
}
