#include "DriftDetector.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr int kKsSeriesTerms = 100;

double ksAsymptoticPValue(double d, size_t nx, size_t ny) {
    // Q_KS(0) = 1; the truncated alternating series cancels to 0 there.
    if (d <= 0.0) return 1.0;
    const double en = std::sqrt(static_cast<double>(nx) * static_cast<double>(ny) /
                                static_cast<double>(nx + ny));
    const double lambda = (en + 0.12 + 0.11 / en) * d;
    double sum = 0.0;
    for (int k = 1; k <= kKsSeriesTerms; ++k) {
        const double sign = (k % 2 == 1) ? 1.0 : -1.0;
        sum += sign * std::exp(-2.0 * static_cast<double>(k) * static_cast<double>(k) * lambda * lambda);
    }
    return std::clamp(2.0 * sum, 0.0, 1.0);
}
} // namespace

namespace DriftDetector {
KsResult ksTwoSample(std::vector<double> x, std::vector<double> y) {
    KsResult res;
    if (x.empty() || y.empty()) return res;

    std::sort(x.begin(), x.end());
    std::sort(y.begin(), y.end());
    const size_t nx = x.size();
    const size_t ny = y.size();

    // Tied values advance both ECDFs together so identical samples give D = 0.
    size_t i = 0;
    size_t j = 0;
    double d = 0.0;
    while (i < nx && j < ny) {
        const double v = std::min(x[i], y[j]);
        while (i < nx && x[i] <= v) ++i;
        while (j < ny && y[j] <= v) ++j;
        const double cdfx = static_cast<double>(i) / static_cast<double>(nx);
        const double cdfy = static_cast<double>(j) / static_cast<double>(ny);
        d = std::max(d, std::abs(cdfx - cdfy));
    }

    res.d = CommonUtils::roundDigits(d);
    res.pValue = CommonUtils::roundDigits(ksAsymptoticPValue(d, nx, ny));
    return res;
}

DriftSignals compose(const Fingerprint& baseline,
                     const Fingerprint& current,
                     const ColumnMap* baselineRaw,
                     const ColumnMap* currentRaw,
                     double alpha) {
    DriftSignals signals;

    for (const auto& [col, cur] : current.columns) {
        const auto it = baseline.columns.find(col);
        if (it == baseline.columns.end()) continue;
        const ColumnFingerprint& base = it->second;

        const double deltaMean = CommonUtils::roundDigits(cur.mean - base.mean);
        signals.checks["delta_mean_" + col] = deltaMean;
        signals.checks["delta_median_" + col] = CommonUtils::roundDigits(cur.median - base.median);
        signals.checks["delta_mad_" + col] = CommonUtils::roundDigits(cur.mad - base.mad);
        if (std::abs(deltaMean) > kMeanDeltaLimit) signals.flagDrift = true;
    }

    if (baselineRaw != nullptr && currentRaw != nullptr) {
        for (const auto& [col, baseValues] : *baselineRaw) {
            const auto it = currentRaw->find(col);
            if (it == currentRaw->end()) continue;
            const KsResult ks = ksTwoSample(baseValues, it->second);
            signals.checks["ks_D_" + col] = ks.d;
            signals.checks["ks_pvalue_" + col] = ks.pValue;
            if (ks.pValue < alpha) signals.flagDrift = true;
        }
    }
    return signals;
}
}
