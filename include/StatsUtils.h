#pragma once

#include <cstddef>
#include <vector>

namespace StatsUtils {
// Neumaier-compensated summation.
double stableSum(const std::vector<double>& values);
double runningMean(const std::vector<double>& values);
double populationVariance(const std::vector<double>& values, double mean);

/**
 * @brief Linear interpolation between order statistics at position (n-1)*q.
 * @pre sorted is ascending.
 * @post q <= 0 returns the first element, q >= 1 the last, empty input returns 0.
 */
double quantileSorted(const std::vector<double>& sorted, double q);

/**
 * @brief Median of absolute deviations from the supplied median.
 */
double medianAbsoluteDeviation(const std::vector<double>& values, double median);

struct PopulationSummary {
    size_t count = 0;
    double mean = 0.0;
    double variance = 0.0;
    double min = 0.0;
    double max = 0.0;
};

PopulationSummary summarize(const std::vector<double>& values);
}
