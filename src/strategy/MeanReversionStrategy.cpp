#include "strategy/MeanReversionStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

namespace replaybt {
namespace strategy {

StrategyInfo MeanReversionStrategy::getInfo() const {
    StrategyInfo info;
    info.name = kName;
    info.description = "Bollinger band mean reversion";
    info.extra_fields = {"middle_band", "upper_band", "lower_band"};
    return info;
}

std::vector<Signal> MeanReversionStrategy::generateSignals(
    const std::vector<Bar>& bars,
    const nlohmann::json& parameters
) const {
    return generateSignals(bars, MeanReversionConfig::fromJson(parameters));
}

std::vector<Signal> MeanReversionStrategy::generateSignals(
    const std::vector<Bar>& bars,
    const MeanReversionConfig& config
) const {
    const auto closes = analytics::TechnicalIndicators::extractClosePrices(bars);
    const auto bands = analytics::TechnicalIndicators::calculateBollingerSeries(
        closes, config.window, config.std_dev_multiplier);

    std::vector<Signal> signals;
    signals.reserve(bars.size());
    int buys = 0;
    int sells = 0;

    for (size_t i = 0; i < bars.size(); ++i) {
        Signal signal(bars[i].timestamp, SignalAction::HOLD);
        signal.extras["middle_band"] = bands.middle[i];
        signal.extras["upper_band"] = bands.upper[i];
        signal.extras["lower_band"] = bands.lower[i];

        // Comparisons against an undefined (NaN) band are false, so no signal fires there.
        if (i > 0) {
            const bool buy = closes[i] > bands.lower[i] &&
                             closes[i - 1] <= bands.lower[i - 1];
            const bool sell = closes[i] < bands.upper[i] &&
                              closes[i - 1] >= bands.upper[i - 1];
            if (sell) {
                signal.action = SignalAction::SELL;
                sells++;
            } else if (buy) {
                signal.action = SignalAction::BUY;
                buys++;
            }
        }
        signals.push_back(std::move(signal));
    }

    LOG_DEBUG("[{}] window={} k={:.2f} -> {} BUY / {} SELL signals over {} bars",
              kName, config.window, config.std_dev_multiplier, buys, sells, bars.size());
    return signals;
}

} // namespace strategy
} // namespace replaybt
