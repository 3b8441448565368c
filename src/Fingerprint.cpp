#include "Fingerprint.h"
#include "CommonUtils.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>

namespace FingerprintEngine {
ColumnFingerprint summarizeColumn(const std::vector<double>& values) {
    ColumnFingerprint fp;
    fp.count = values.size();
    if (values.empty()) return fp;

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    const double mean = StatsUtils::runningMean(values);
    const double var = StatsUtils::populationVariance(values, mean);
    const double median = StatsUtils::quantileSorted(sorted, 0.5);

    fp.mean = CommonUtils::roundDigits(mean);
    fp.stddev = CommonUtils::roundDigits(std::sqrt(var));
    fp.min = CommonUtils::roundDigits(sorted.front());
    fp.max = CommonUtils::roundDigits(sorted.back());
    fp.median = CommonUtils::roundDigits(median);
    fp.q05 = CommonUtils::roundDigits(StatsUtils::quantileSorted(sorted, 0.05));
    fp.q95 = CommonUtils::roundDigits(StatsUtils::quantileSorted(sorted, 0.95));
    fp.mad = CommonUtils::roundDigits(StatsUtils::medianAbsoluteDeviation(values, median));
    return fp;
}

Fingerprint fromTable(const NumericTable& table) {
    Fingerprint fp;
    fp.rows = table.rowCount();
    fp.missingCells = table.missingCellCount();

    const size_t cells = std::max<size_t>(1, table.rowCount() * table.declaredColumnCount());
    fp.missingRate = CommonUtils::roundDigits(static_cast<double>(fp.missingCells) / static_cast<double>(cells));

    for (const auto& [name, values] : table.columns()) {
        fp.columns[name] = summarizeColumn(values);
    }
    return fp;
}

std::map<std::string, double> windowStatistics(const ColumnMap& columns, size_t start, size_t end) {
    std::map<std::string, double> stats;
    for (const auto& [name, values] : columns) {
        if (start >= values.size()) continue;
        const size_t stop = std::min(end, values.size());
        const std::vector<double> window(values.begin() + static_cast<std::ptrdiff_t>(start),
                                         values.begin() + static_cast<std::ptrdiff_t>(stop));
        if (window.empty()) continue;
        const ColumnFingerprint fp = summarizeColumn(window);
        stats["mean_" + name] = fp.mean;
        stats["std_" + name] = fp.stddev;
        stats["min_" + name] = fp.min;
        stats["max_" + name] = fp.max;
        stats["median_" + name] = fp.median;
        stats["mad_" + name] = fp.mad;
    }
    return stats;
}
}
