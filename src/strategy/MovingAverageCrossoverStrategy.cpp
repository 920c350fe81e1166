#include "strategy/MovingAverageCrossoverStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

namespace replaybt {
namespace strategy {

StrategyInfo MovingAverageCrossoverStrategy::getInfo() const {
    StrategyInfo info;
    info.name = kName;
    info.description = "Simple moving average crossover (trend following)";
    info.extra_fields = {"short_ma", "long_ma"};
    return info;
}

std::vector<Signal> MovingAverageCrossoverStrategy::generateSignals(
    const std::vector<Bar>& bars,
    const nlohmann::json& parameters
) const {
    return generateSignals(bars, MovingAverageCrossoverConfig::fromJson(parameters));
}

std::vector<Signal> MovingAverageCrossoverStrategy::generateSignals(
    const std::vector<Bar>& bars,
    const MovingAverageCrossoverConfig& config
) const {
    const auto closes = analytics::TechnicalIndicators::extractClosePrices(bars);
    const auto short_ma = analytics::TechnicalIndicators::rollingMean(closes, config.short_window);
    const auto long_ma = analytics::TechnicalIndicators::rollingMean(closes, config.long_window);

    std::vector<Signal> signals;
    signals.reserve(bars.size());
    int buys = 0;
    int sells = 0;

    for (size_t i = 0; i < bars.size(); ++i) {
        Signal signal(bars[i].timestamp, SignalAction::HOLD);
        signal.extras["short_ma"] = short_ma[i];
        signal.extras["long_ma"] = long_ma[i];

        if (i > 0) {
            const bool was_below = short_ma[i - 1] <= long_ma[i - 1];
            const bool was_above = short_ma[i - 1] >= long_ma[i - 1];
            if (was_below && short_ma[i] > long_ma[i]) {
                signal.action = SignalAction::BUY;
                buys++;
            } else if (was_above && short_ma[i] < long_ma[i]) {
                signal.action = SignalAction::SELL;
                sells++;
            }
        }
        signals.push_back(std::move(signal));
    }

    LOG_DEBUG("[{}] short={} long={} -> {} BUY / {} SELL signals over {} bars",
              kName, config.short_window, config.long_window, buys, sells, bars.size());
    return signals;
}

} // namespace strategy
} // namespace replaybt
