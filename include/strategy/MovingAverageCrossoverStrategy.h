#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace replaybt {
namespace strategy {

// BUY when the short SMA crosses above the long SMA, SELL on the reverse crossing.
// Extras: short_ma, long_ma
class MovingAverageCrossoverStrategy : public IStrategy {
public:
    static constexpr const char* kName = "moving_average_crossover";

    StrategyInfo getInfo() const override;

    std::vector<Signal> generateSignals(
        const std::vector<Bar>& bars,
        const nlohmann::json& parameters
    ) const override;

    std::vector<Signal> generateSignals(
        const std::vector<Bar>& bars,
        const MovingAverageCrossoverConfig& config
    ) const;
};

} // namespace strategy
} // namespace replaybt
