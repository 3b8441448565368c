#include "StatsUtils.h"

#include <algorithm>
#include <cmath>

namespace StatsUtils {
double stableSum(const std::vector<double>& values) {
    double sum = 0.0;
    double compensation = 0.0;
    for (double v : values) {
        const double t = sum + v;
        if (std::abs(sum) >= std::abs(v)) {
            compensation += (sum - t) + v;
        } else {
            compensation += (v - t) + sum;
        }
        sum = t;
    }
    return sum + compensation;
}

double runningMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return stableSum(values) / static_cast<double>(values.size());
}

double populationVariance(const std::vector<double>& values, double mean) {
    if (values.empty()) return 0.0;
    std::vector<double> squares;
    squares.reserve(values.size());
    for (double v : values) {
        const double d = v - mean;
        squares.push_back(d * d);
    }
    return stableSum(squares) / static_cast<double>(values.size());
}

double quantileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    if (q <= 0.0) return sorted.front();
    if (q >= 1.0) return sorted.back();

    const double pos = static_cast<double>(sorted.size() - 1) * q;
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    if (lo == hi) return sorted[lo];
    const double w = pos - static_cast<double>(lo);
    return sorted[lo] * (1.0 - w) + sorted[hi] * w;
}

double medianAbsoluteDeviation(const std::vector<double>& values, double median) {
    if (values.empty()) return 0.0;
    std::vector<double> dev;
    dev.reserve(values.size());
    for (double v : values) dev.push_back(std::abs(v - median));
    std::sort(dev.begin(), dev.end());
    return quantileSorted(dev, 0.5);
}

PopulationSummary summarize(const std::vector<double>& values) {
    PopulationSummary out;
    out.count = values.size();
    if (values.empty()) return out;
    out.mean = runningMean(values);
    out.variance = populationVariance(values, out.mean);
    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    out.min = *lo;
    out.max = *hi;
    return out;
}
}
