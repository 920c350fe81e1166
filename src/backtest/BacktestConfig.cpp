#include "backtest/BacktestConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>

namespace replaybt {
namespace backtest {

void BacktestConfig::validate() const {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        throw ConfigError("initial_capital must be > 0, got " + std::to_string(initial_capital));
    }
    if (!std::isfinite(commission_rate) || commission_rate < 0.0 || commission_rate >= 1.0) {
        throw ConfigError("commission_rate must be in [0, 1), got " + std::to_string(commission_rate));
    }
    if (!std::isfinite(bars_per_year) || bars_per_year <= 0.0) {
        throw ConfigError("bars_per_year must be > 0, got " + std::to_string(bars_per_year));
    }
    if (!std::isfinite(risk_free_rate)) {
        throw ConfigError("risk_free_rate must be finite");
    }
    if (benchmark_mode == BenchmarkMode::FILE && benchmark_file.empty()) {
        throw ConfigError("benchmark file mode requires a file path");
    }
}

double barsPerYearForTimeframe(const std::string& timeframe) {
    static const std::map<std::string, double> kBarsPerYear = {
        {"1m", 60.0 * 24.0 * 365.0},
        {"5m", 12.0 * 24.0 * 365.0},
        {"15m", 4.0 * 24.0 * 365.0},
        {"30m", 2.0 * 24.0 * 365.0},
        {"1h", 24.0 * 365.0},
        {"4h", 6.0 * 365.0},
        {"1d", 365.0},
        {"1w", 52.0},
    };

    std::string key = timeframe;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kBarsPerYear.find(key);
    if (it == kBarsPerYear.end()) {
        throw ConfigError("unsupported timeframe: " + timeframe);
    }
    return it->second;
}

} // namespace backtest
} // namespace replaybt
