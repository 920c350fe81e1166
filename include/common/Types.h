#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace replaybt {

using Price = double;
using Volume = double;
using Amount = double;

// Epoch milliseconds (UTC)
using TimestampMs = long long;

enum class SignalAction { BUY, SELL, HOLD };

// Strategy-specific indicator values. Opaque to the simulator and metrics engine.
using ExtraFields = std::map<std::string, double>;

struct Bar {
    TimestampMs timestamp;
    double open;
    double high;
    double low;
    double close;
    double volume;
    std::optional<double> benchmark_close;

    Bar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0) {}

    Bar(double o, double h, double l, double c, double v, TimestampMs t)
        : timestamp(t), open(o), high(h), low(l), close(c), volume(v) {}
};

struct Signal {
    TimestampMs timestamp;
    SignalAction action;
    ExtraFields extras;

    Signal() : timestamp(0), action(SignalAction::HOLD) {}

    Signal(TimestampMs t, SignalAction a) : timestamp(t), action(a) {}
};

inline const char* toString(SignalAction action) {
    switch (action) {
        case SignalAction::BUY: return "BUY";
        case SignalAction::SELL: return "SELL";
        case SignalAction::HOLD: return "HOLD";
    }
    return "HOLD";
}

} // namespace replaybt
