#include "strategy/StrategyConfig.h"
#include "common/Errors.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace replaybt {
namespace strategy {
namespace {
const nlohmann::json& requireObject(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("strategy parameters must be a JSON object");
    }
    return j;
}

int readInt(const nlohmann::json& j, const char* key, int fallback, int min_value) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& v = j.at(key);
    if (!v.is_number_integer()) {
        throw ConfigError(std::string(key) + " must be an integer");
    }
    // range-check before narrowing to int
    if (v.is_number_unsigned() &&
        v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        throw ConfigError(std::string(key) + " is out of range");
    }
    const std::int64_t value = v.get<std::int64_t>();
    if (value < min_value) {
        throw ConfigError(std::string(key) + " must be >= " + std::to_string(min_value));
    }
    if (value > std::numeric_limits<int>::max()) {
        throw ConfigError(std::string(key) + " is out of range");
    }
    return static_cast<int>(value);
}
}

MovingAverageCrossoverConfig MovingAverageCrossoverConfig::fromJson(const nlohmann::json& j) {
    MovingAverageCrossoverConfig cfg;
    if (j.is_null()) {
        return cfg;
    }
    requireObject(j);
    cfg.short_window = readInt(j, "short_window", cfg.short_window, 1);
    cfg.long_window = readInt(j, "long_window", cfg.long_window, 1);
    if (cfg.short_window >= cfg.long_window) {
        throw ConfigError("short_window must be smaller than long_window");
    }
    return cfg;
}

MeanReversionConfig MeanReversionConfig::fromJson(const nlohmann::json& j) {
    MeanReversionConfig cfg;
    if (j.is_null()) {
        return cfg;
    }
    requireObject(j);
    // sample stdev needs two observations
    cfg.window = readInt(j, "window", cfg.window, 2);
    if (j.contains("std_dev_multiplier")) {
        const auto& v = j.at("std_dev_multiplier");
        if (!v.is_number()) {
            throw ConfigError("std_dev_multiplier must be a number");
        }
        cfg.std_dev_multiplier = v.get<double>();
    }
    if (!std::isfinite(cfg.std_dev_multiplier) || cfg.std_dev_multiplier <= 0.0) {
        throw ConfigError("std_dev_multiplier must be > 0");
    }
    return cfg;
}

int readSignalLag(const nlohmann::json& j) {
    if (!j.is_object()) {
        return 0;
    }
    return readInt(j, "signal_lag", 0, 0);
}

} // namespace strategy
} // namespace replaybt
