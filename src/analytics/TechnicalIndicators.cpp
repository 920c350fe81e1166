#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace replaybt {
namespace analytics {

std::vector<double> TechnicalIndicators::rollingMean(const std::vector<double>& values, int window) {
    std::vector<double> out;
    if (window <= 0) return out;
    out.reserve(values.size());

    const size_t w = static_cast<size_t>(window);
    for (size_t i = 0; i < values.size(); ++i) {
        const size_t begin = (i + 1 > w) ? (i + 1 - w) : 0;
        out.push_back(calculateMean(values, begin, i + 1));
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingStdDev(const std::vector<double>& values, int window) {
    std::vector<double> out;
    if (window <= 0) return out;
    out.reserve(values.size());

    const size_t w = static_cast<size_t>(window);
    for (size_t i = 0; i < values.size(); ++i) {
        const size_t begin = (i + 1 > w) ? (i + 1 - w) : 0;
        const double mean = calculateMean(values, begin, i + 1);
        out.push_back(calculateStandardDeviation(values, begin, i + 1, mean));
    }
    return out;
}

TechnicalIndicators::BollingerSeries TechnicalIndicators::calculateBollingerSeries(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    BollingerSeries result;
    result.middle = rollingMean(prices, period);
    const auto std_dev = rollingStdDev(prices, period);

    result.upper.reserve(prices.size());
    result.lower.reserve(prices.size());
    for (size_t i = 0; i < result.middle.size(); ++i) {
        // NaN std_dev propagates, so no band exists on the first bar
        result.upper.push_back(result.middle[i] + std_dev[i] * std_dev_mult);
        result.lower.push_back(result.middle[i] - std_dev[i] * std_dev_mult);
    }
    return result;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());

    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }

    return prices;
}

// ========== Private helpers ==========

double TechnicalIndicators::calculateMean(const std::vector<double>& values, size_t begin, size_t end) {
    if (end <= begin) return std::numeric_limits<double>::quiet_NaN();
    double sum = 0.0;
    for (size_t i = begin; i < end; ++i) {
        sum += values[i];
    }
    return sum / static_cast<double>(end - begin);
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    size_t begin,
    size_t end,
    double mean
) {
    if (end - begin < 2) return std::numeric_limits<double>::quiet_NaN();

    double sq_sum = 0.0;
    for (size_t i = begin; i < end; ++i) {
        const double diff = values[i] - mean;
        sq_sum += diff * diff;
    }
    return std::sqrt(sq_sum / static_cast<double>(end - begin - 1));
}

} // namespace analytics
} // namespace replaybt
