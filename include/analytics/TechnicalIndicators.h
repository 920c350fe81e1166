#pragma once

#include <vector>
#include "common/Types.h"

namespace replaybt {
namespace analytics {

// Causal indicator series: element i depends only on inputs 0..i.
class TechnicalIndicators {
public:
    // Rolling mean over a trailing window, at least one observation
    static std::vector<double> rollingMean(const std::vector<double>& values, int window);

    // Rolling sample standard deviation; NaN until the window holds 2 values
    static std::vector<double> rollingStdDev(const std::vector<double>& values, int window);

    // Bollinger Bands series
    struct BollingerSeries {
        std::vector<double> middle;
        std::vector<double> upper;
        std::vector<double> lower;
    };
    static BollingerSeries calculateBollingerSeries(const std::vector<double>& prices,
                                                    int period = 20,
                                                    double std_dev_mult = 2.0);

    static std::vector<double> extractClosePrices(const std::vector<Bar>& bars);

private:
    static double calculateMean(const std::vector<double>& values, size_t begin, size_t end);
    static double calculateStandardDeviation(const std::vector<double>& values,
                                             size_t begin, size_t end, double mean);
};

} // namespace analytics
} // namespace replaybt
