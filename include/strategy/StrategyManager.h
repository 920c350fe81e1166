#pragma once

#include "strategy/IStrategy.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace replaybt {
namespace strategy {

// Name-keyed strategy registry, populated at startup.
class StrategyManager {
public:
    StrategyManager();

    // Registry with the built-in strategies
    static std::unique_ptr<StrategyManager> createDefault();

    // Replaces an existing registration of the same name.
    void registerStrategy(std::shared_ptr<IStrategy> strategy);

    // Throws ConfigError for unknown names.
    std::shared_ptr<IStrategy> getStrategy(const std::string& name) const;
    bool hasStrategy(const std::string& name) const;
    std::vector<std::string> getStrategyNames() const;

    // Runs the named strategy and applies the optional `signal_lag` parameter.
    std::vector<Signal> generateSignals(
        const std::string& name,
        const std::vector<Bar>& bars,
        const nlohmann::json& parameters
    ) const;

    // Delays every action by `lag` bars; HOLD fills the head. Extras stay on their bar.
    static void applySignalLag(std::vector<Signal>& signals, int lag);

private:
    std::map<std::string, std::shared_ptr<IStrategy>> strategies_;
    mutable std::mutex mutex_;
};

} // namespace strategy
} // namespace replaybt
