#pragma once

#include "common/Types.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace replaybt {
namespace strategy {

// Registry metadata
struct StrategyInfo {
    std::string name;           // registry key
    std::string description;
    std::vector<std::string> extra_fields;  // indicator columns attached to each signal

    StrategyInfo() = default;
};

// Signal source interface. Implementations must compute signal i from bars 0..i only.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    // One signal per bar, timestamps copied from the bars.
    // Throws ConfigError for invalid parameters.
    virtual std::vector<Signal> generateSignals(
        const std::vector<Bar>& bars,
        const nlohmann::json& parameters
    ) const = 0;
};

} // namespace strategy
} // namespace replaybt
