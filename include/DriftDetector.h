#pragma once

#include "Fingerprint.h"
#include "NumericTable.h"

#include <map>
#include <string>
#include <vector>

struct KsResult {
    double d = 0.0;
    double pValue = 1.0;
};

struct DriftSignals {
    bool flagDrift = false;
    std::map<std::string, double> checks;
};

namespace DriftDetector {
// Absolute |delta_mean| limit, identical for every column whatever its scale.
constexpr double kMeanDeltaLimit = 0.05;
constexpr double kDefaultAlpha = 0.05;

/**
 * @brief Two-sample Kolmogorov-Smirnov statistic with the asymptotic p-value series.
 * @post Either sample empty => {0, 1}. Both values rounded to 12 digits.
 */
KsResult ksTwoSample(std::vector<double> x, std::vector<double> y);

/**
 * @brief Per-column deltas between two fingerprints plus optional KS checks on raw samples.
 * @details Records delta_mean_/delta_median_/delta_mad_<col> for columns in both fingerprints
 *          and, when both raw maps are given, ks_D_/ks_pvalue_<col> for their shared columns.
 *          flagDrift when a KS p-value is below alpha or |delta_mean| exceeds kMeanDeltaLimit.
 */
DriftSignals compose(const Fingerprint& baseline,
                     const Fingerprint& current,
                     const ColumnMap* baselineRaw = nullptr,
                     const ColumnMap* currentRaw = nullptr,
                     double alpha = kDefaultAlpha);
}
