#pragma once

#include <nlohmann/json.hpp>

namespace replaybt {
namespace strategy {

// Parameter sets are read from config.json `strategy.parameters.<name>`.
// Missing keys keep the defaults; out-of-range values throw ConfigError.

struct MovingAverageCrossoverConfig {
    int short_window = 10;
    int long_window = 30;

    static MovingAverageCrossoverConfig fromJson(const nlohmann::json& j);
};

struct MeanReversionConfig {
    int window = 20;
    double std_dev_multiplier = 2.0;

    static MeanReversionConfig fromJson(const nlohmann::json& j);
};

// Bars by which every signal is delayed (0 = none)
int readSignalLag(const nlohmann::json& j);

} // namespace strategy
} // namespace replaybt
