#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace replaybt {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string lowerTrimCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return trimCopy(s);
}

std::string normalizeStrategyName(const std::string& raw) {
    const std::string name = lowerTrimCopy(raw);

    // Accepted aliases
    if (name == "moving_average_crossover" || name == "ma_crossover" || name == "sma_crossover") {
        return "moving_average_crossover";
    }
    if (name == "bollinger" || name == "mean_reversion") {
        return "mean_reversion";
    }
    return name;
}

backtest::BenchmarkMode parseBenchmark(const std::string& value, std::string& file_out) {
    const std::string lowered = lowerTrimCopy(value);
    if (lowered.empty() || lowered == "none") {
        return backtest::BenchmarkMode::NONE;
    }
    if (lowered == "self") {
        return backtest::BenchmarkMode::SELF;
    }
    if (lowered == "column") {
        return backtest::BenchmarkMode::COLUMN;
    }
    file_out = trimCopy(value);
    return backtest::BenchmarkMode::FILE;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    backtest_config_ = backtest::BacktestConfig();
    tickers_.clear();
    strategy_name_ = "moving_average_crossover";
    strategy_parameters_ = nlohmann::json::object();
    output_dir_ = "output";
    write_output_files_ = true;
    log_level_ = "info";
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    LOG_INFO("Config path: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {}. Using defaults.", config_path.string());
        reset();
        backtest_config_.validate();
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("malformed JSON in " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
}

void Config::loadFromJson(const nlohmann::json& j) {
    reset();

    try {
        if (j.contains("backtest")) {
            const auto& b = j["backtest"];
            backtest_config_.initial_capital = b.value("initial_capital", 10000.0);
            backtest_config_.commission_rate = b.value("commission_rate", 0.001);
            backtest_config_.timeframe = b.value("timeframe", std::string("1h"));
            backtest_config_.bars_per_year = backtest::barsPerYearForTimeframe(backtest_config_.timeframe);
            if (b.contains("bars_per_year")) {
                backtest_config_.bars_per_year = b["bars_per_year"].get<double>();
            }
            backtest_config_.risk_free_rate = b.value("risk_free_rate", 0.0);
            backtest_config_.start_date = b.value("start_date", std::string());
            backtest_config_.end_date = b.value("end_date", std::string());
        }

        if (j.contains("benchmark")) {
            backtest_config_.benchmark_mode =
                parseBenchmark(j["benchmark"].get<std::string>(), backtest_config_.benchmark_file);
        }

        if (j.contains("tickers")) {
            for (const auto& t : j["tickers"]) {
                TickerSpec spec;
                spec.symbol = trimCopy(t.value("symbol", std::string()));
                spec.file = trimCopy(t.value("file", std::string()));
                if (spec.file.empty()) {
                    throw ConfigError("ticker '" + spec.symbol + "' has no data file");
                }
                if (spec.symbol.empty()) {
                    spec.symbol = std::filesystem::path(spec.file).stem().string();
                }
                tickers_.push_back(spec);
            }
        }

        if (j.contains("strategy")) {
            const auto& s = j["strategy"];
            strategy_name_ = normalizeStrategyName(s.value("name", strategy_name_));
            if (s.contains("parameters") && s["parameters"].is_object()) {
                for (const auto& item : s["parameters"].items()) {
                    strategy_parameters_[normalizeStrategyName(item.key())] = item.value();
                }
            }
        }

        if (j.contains("output")) {
            const auto& o = j["output"];
            output_dir_ = o.value("directory", output_dir_);
            write_output_files_ = o.value("write_files", true);
        }

        log_level_ = j.value("log_level", std::string("info"));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid field type: ") + e.what());
    }

    backtest_config_.validate();

    LOG_INFO("Config loaded: capital={}, commission={}, timeframe={}, bars/year={}, strategy={}",
             backtest_config_.initial_capital, backtest_config_.commission_rate,
             backtest_config_.timeframe, backtest_config_.bars_per_year, strategy_name_);
}

nlohmann::json Config::getStrategyParameters(const std::string& strategy_name) const {
    const std::string key = normalizeStrategyName(strategy_name);
    if (strategy_parameters_.contains(key)) {
        return strategy_parameters_.at(key);
    }
    return nlohmann::json::object();
}

void Config::setInitialCapital(double v) {
    auto updated = backtest_config_;
    updated.initial_capital = v;
    updated.validate();
    backtest_config_ = updated;
}

void Config::setCommissionRate(double v) {
    auto updated = backtest_config_;
    updated.commission_rate = v;
    updated.validate();
    backtest_config_ = updated;
}

void Config::setStrategyName(const std::string& name) {
    strategy_name_ = normalizeStrategyName(name);
}

} // namespace replaybt
