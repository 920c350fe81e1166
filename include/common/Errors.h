#pragma once

#include <stdexcept>
#include <string>

namespace replaybt {

class BacktestError : public std::runtime_error {
public:
    explicit BacktestError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid constructor/configuration parameters. Raised before any simulation step.
class ConfigError : public BacktestError {
public:
    explicit ConfigError(const std::string& what) : BacktestError("config: " + what) {}
};

// Bar and signal sequences differ in length or timestamps, or are not strictly increasing.
class AlignmentError : public BacktestError {
public:
    explicit AlignmentError(const std::string& what) : BacktestError("alignment: " + what) {}
};

// Structurally invalid market data (empty sequence, non-positive prices, unreadable file).
class DataError : public BacktestError {
public:
    explicit DataError(const std::string& what) : BacktestError("data: " + what) {}
};

} // namespace replaybt
