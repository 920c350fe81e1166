#include "strategy/StrategyManager.h"
#include "strategy/MeanReversionStrategy.h"
#include "strategy/MovingAverageCrossoverStrategy.h"
#include "strategy/StrategyConfig.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace replaybt {
namespace strategy {

StrategyManager::StrategyManager() {
    LOG_DEBUG("StrategyManager initialized");
}

std::unique_ptr<StrategyManager> StrategyManager::createDefault() {
    auto manager = std::make_unique<StrategyManager>();
    manager->registerStrategy(std::make_shared<MovingAverageCrossoverStrategy>());
    manager->registerStrategy(std::make_shared<MeanReversionStrategy>());
    return manager;
}

void StrategyManager::registerStrategy(std::shared_ptr<IStrategy> strategy) {
    if (!strategy) {
        throw ConfigError("cannot register a null strategy");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    auto info = strategy->getInfo();
    if (strategies_.count(info.name) > 0) {
        LOG_WARN("Strategy {} already registered, replacing", info.name);
    }
    strategies_[info.name] = std::move(strategy);

    LOG_DEBUG("Strategy registered: {} ({})", info.name, info.description);
}

std::shared_ptr<IStrategy> StrategyManager::getStrategy(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(name);
    if (it == strategies_.end()) {
        std::string known;
        for (const auto& entry : strategies_) {
            if (!known.empty()) known += ", ";
            known += entry.first;
        }
        throw ConfigError("unknown strategy '" + name + "' (available: " + known + ")");
    }
    return it->second;
}

bool StrategyManager::hasStrategy(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategies_.count(name) > 0;
}

std::vector<std::string> StrategyManager::getStrategyNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(strategies_.size());
    for (const auto& entry : strategies_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<Signal> StrategyManager::generateSignals(
    const std::string& name,
    const std::vector<Bar>& bars,
    const nlohmann::json& parameters
) const {
    auto strategy = getStrategy(name);
    const int lag = readSignalLag(parameters);

    auto signals = strategy->generateSignals(bars, parameters);
    if (signals.size() != bars.size()) {
        throw AlignmentError("strategy " + name + " produced " + std::to_string(signals.size()) +
                             " signals for " + std::to_string(bars.size()) + " bars");
    }
    if (lag > 0) {
        applySignalLag(signals, lag);
        LOG_DEBUG("[{}] signals delayed by {} bar(s)", name, lag);
    }
    return signals;
}

void StrategyManager::applySignalLag(std::vector<Signal>& signals, int lag) {
    if (lag <= 0 || signals.empty()) {
        return;
    }
    const size_t n = signals.size();
    const size_t shift = static_cast<size_t>(lag);
    for (size_t i = n; i-- > 0;) {
        signals[i].action = (i >= shift) ? signals[i - shift].action : SignalAction::HOLD;
    }
}

} // namespace strategy
} // namespace replaybt
