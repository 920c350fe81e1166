#undef NDEBUG
#include "strategy/StrategyManager.h"
#include "strategy/MeanReversionStrategy.h"
#include "strategy/MovingAverageCrossoverStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace replaybt;
using namespace replaybt::strategy;

namespace {
std::vector<Bar> makeBars(const std::vector<double>& closes) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < closes.size(); ++i) {
        const double c = closes[i];
        bars.emplace_back(c, c, c, c, 1.0, 1704067200000LL + static_cast<TimestampMs>(i) * 60000);
    }
    return bars;
}

std::vector<size_t> indicesOf(const std::vector<Signal>& signals, SignalAction action) {
    std::vector<size_t> out;
    for (size_t i = 0; i < signals.size(); ++i) {
        if (signals[i].action == action) out.push_back(i);
    }
    return out;
}

bool sameValue(double a, double b) {
    return (std::isnan(a) && std::isnan(b)) || a == b;
}

template <typename Fn>
bool throwsConfigError(Fn fn) {
    try {
        fn();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

// Fixed-action source used to exercise registration
class AlwaysHoldStrategy : public IStrategy {
public:
    StrategyInfo getInfo() const override {
        StrategyInfo info;
        info.name = "always_hold";
        info.description = "test";
        return info;
    }
    std::vector<Signal> generateSignals(const std::vector<Bar>& bars,
                                        const nlohmann::json&) const override {
        std::vector<Signal> out;
        for (const auto& b : bars) out.emplace_back(b.timestamp, SignalAction::HOLD);
        return out;
    }
};
}

int main() {
    const std::vector<double> zigzag = {5, 4, 3, 2, 3, 4, 5, 6, 5, 4, 3, 2};

    // Rolling helpers
    {
        const std::vector<double> v = {1, 2, 3, 4};
        auto mean = analytics::TechnicalIndicators::rollingMean(v, 2);
        assert(mean.size() == 4);
        assert(mean[0] == 1.0 && mean[1] == 1.5 && mean[3] == 3.5);
        auto sd = analytics::TechnicalIndicators::rollingStdDev(v, 3);
        assert(std::isnan(sd[0]));
        assert(std::abs(sd[1] - std::sqrt(0.5)) < 1e-12);
        assert(std::abs(sd[3] - 1.0) < 1e-12);
        // Short history averages what is there instead of reporting 0
        auto head = analytics::TechnicalIndicators::rollingMean({5.0, 7.0}, 10);
        assert(head.size() == 2);
        assert(head[0] == 5.0 && head[1] == 6.0);
    }

    // Moving average crossover
    {
        MovingAverageCrossoverStrategy ma;
        auto bars = makeBars(zigzag);
        auto signals = ma.generateSignals(bars, nlohmann::json{{"short_window", 2}, {"long_window", 4}});

        assert(signals.size() == bars.size());
        for (size_t i = 0; i < bars.size(); ++i) {
            assert(signals[i].timestamp == bars[i].timestamp);
            assert(signals[i].extras.count("short_ma") == 1);
            assert(signals[i].extras.count("long_ma") == 1);
        }
        assert(signals[0].action == SignalAction::HOLD);
        assert(signals[4].extras.at("short_ma") == 2.5);
        assert(signals[4].extras.at("long_ma") == 3.0);
        assert((indicesOf(signals, SignalAction::SELL) == std::vector<size_t>{2, 9}));
        assert((indicesOf(signals, SignalAction::BUY) == std::vector<size_t>{5}));
    }

    // Mean reversion bands
    {
        MeanReversionStrategy mr;
        const std::vector<double> closes = {10, 10, 10, 10, 5, 10, 10, 10, 15, 10};
        auto bars = makeBars(closes);
        auto signals = mr.generateSignals(bars, nlohmann::json{{"window", 3}, {"std_dev_multiplier", 1.0}});

        assert(signals.size() == bars.size());
        assert(signals[0].extras.at("middle_band") == 10.0);
        assert(std::isnan(signals[0].extras.at("upper_band")));
        assert(std::isnan(signals[0].extras.at("lower_band")));
        assert((indicesOf(signals, SignalAction::BUY) == std::vector<size_t>{5, 8}));
        assert((indicesOf(signals, SignalAction::SELL) == std::vector<size_t>{4, 9}));
        assert(signals[5].extras.at("lower_band") < 10.0);
    }

    // Signal i only depends on bars 0..i
    {
        std::vector<double> closes;
        for (int i = 0; i < 120; ++i) {
            closes.push_back(100.0 + 8.0 * std::sin(i * 0.2) + 3.0 * std::cos(i * 0.7));
        }
        const auto full = makeBars(closes);
        auto manager = StrategyManager::createDefault();
        for (const auto& name : manager->getStrategyNames()) {
            const auto all = manager->generateSignals(name, full, nlohmann::json::object());
            for (size_t k : {1u, 2u, 17u, 60u, 119u}) {
                std::vector<Bar> prefix(full.begin(), full.begin() + k);
                const auto part = manager->generateSignals(name, prefix, nlohmann::json::object());
                assert(part.size() == k);
                for (size_t i = 0; i < k; ++i) {
                    assert(part[i].action == all[i].action);
                    for (const auto& kv : part[i].extras) {
                        assert(sameValue(kv.second, all[i].extras.at(kv.first)));
                    }
                }
            }
        }
    }

    // Registry and signal_lag
    {
        auto manager = StrategyManager::createDefault();
        auto names = manager->getStrategyNames();
        assert(std::find(names.begin(), names.end(), "moving_average_crossover") != names.end());
        assert(std::find(names.begin(), names.end(), "mean_reversion") != names.end());
        assert(manager->getStrategy("mean_reversion")->getInfo().extra_fields.size() == 3);
        assert(throwsConfigError([&] { manager->getStrategy("arima"); }));
        assert(!manager->hasStrategy("always_hold"));

        manager->registerStrategy(std::make_shared<AlwaysHoldStrategy>());
        assert(manager->hasStrategy("always_hold"));
        auto holds = manager->generateSignals("always_hold", makeBars(zigzag), nullptr);
        assert(indicesOf(holds, SignalAction::HOLD).size() == zigzag.size());

        const auto bars = makeBars(zigzag);
        const nlohmann::json lagged = {{"short_window", 2}, {"long_window", 4}, {"signal_lag", 2}};
        auto signals = manager->generateSignals("moving_average_crossover", bars, lagged);
        assert(signals.size() == bars.size());
        assert(signals[0].action == SignalAction::HOLD);
        assert(signals[1].action == SignalAction::HOLD);
        assert((indicesOf(signals, SignalAction::SELL) == std::vector<size_t>{4, 11}));
        assert((indicesOf(signals, SignalAction::BUY) == std::vector<size_t>{7}));
        // Indicator values stay with their own bar
        assert(signals[4].extras.at("short_ma") == 2.5);
        assert(signals[4].timestamp == bars[4].timestamp);
    }

    // Parameter validation
    {
        auto manager = StrategyManager::createDefault();
        const auto bars = makeBars(zigzag);
        assert(throwsConfigError([&] {
            manager->generateSignals("moving_average_crossover", bars, {{"short_window", 30}, {"long_window", 10}});
        }));
        assert(throwsConfigError([&] {
            manager->generateSignals("moving_average_crossover", bars, {{"short_window", 2.5}});
        }));
        assert(throwsConfigError([&] {
            manager->generateSignals("mean_reversion", bars, {{"window", 1}});
        }));
        assert(throwsConfigError([&] {
            manager->generateSignals("mean_reversion", bars, {{"std_dev_multiplier", 0.0}});
        }));
        assert(throwsConfigError([&] {
            manager->generateSignals("mean_reversion", bars, {{"signal_lag", -1}});
        }));
        assert(throwsConfigError([&] {
            manager->generateSignals("mean_reversion", bars, nlohmann::json::array());
        }));
        // Parsed non-negative integers are unsigned in JSON and still accepted
        const auto parsed = nlohmann::json::parse(R"({"short_window": 2, "long_window": 4})");
        assert(manager->generateSignals("moving_average_crossover", bars, parsed).size() == bars.size());
        // Integers beyond int range are rejected, not wrapped
        assert(throwsConfigError([&] {
            manager->generateSignals("mean_reversion", bars, {{"window", 5000000000LL}});
        }));
        assert(throwsConfigError([&] {
            manager->generateSignals("moving_average_crossover", bars,
                                     {{"short_window", 2}, {"long_window", 4294967300ULL}});
        }));
        assert(throwsConfigError([&] {
            manager->generateSignals("mean_reversion", bars, {{"signal_lag", -5000000000LL}});
        }));
    }

    std::cout << "[TEST] Strategies PASSED\n";
    return 0;
}
