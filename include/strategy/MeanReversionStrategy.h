#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace replaybt {
namespace strategy {

// Bollinger band re-entry: BUY when the close recovers above the lower band,
// SELL when it falls back below the upper band.
// Extras: middle_band, upper_band, lower_band
class MeanReversionStrategy : public IStrategy {
public:
    static constexpr const char* kName = "mean_reversion";

    StrategyInfo getInfo() const override;

    std::vector<Signal> generateSignals(
        const std::vector<Bar>& bars,
        const nlohmann::json& parameters
    ) const override;

    std::vector<Signal> generateSignals(
        const std::vector<Bar>& bars,
        const MeanReversionConfig& config
    ) const;
};

} // namespace strategy
} // namespace replaybt
