#include "DriftDetector.h"
#include "Fingerprint.h"
#include "TestHarness.h"

#include <cmath>

namespace {
void testColumnSummary() {
    const ColumnFingerprint fp = FingerprintEngine::summarizeColumn({5, 1, 4, 2, 3});
    CHECK(fp.count == 5);
    CHECK_NEAR(fp.mean, 3.0, 1e-12);
    CHECK_NEAR(fp.stddev, std::sqrt(2.0), 1e-11);
    CHECK_NEAR(fp.min, 1.0, 0.0);
    CHECK_NEAR(fp.max, 5.0, 0.0);
    CHECK_NEAR(fp.median, 3.0, 1e-12);
    CHECK_NEAR(fp.q05, 1.2, 1e-12);
    CHECK_NEAR(fp.q95, 4.8, 1e-12);
    CHECK_NEAR(fp.mad, 1.0, 1e-12);
}

void testMissingRateCountsDeclaredColumns(const TestHarness::TempDir& dir) {
    const std::string path = dir.file("fp.csv");
    TestHarness::writeText(path, "a,b,label\n1,2,x\n3,,y\n5,6,z\n");
    NumericTable table(path);
    table.load();

    const Fingerprint fp = FingerprintEngine::fromTable(table);
    CHECK(fp.rows == 3);
    CHECK(fp.missingCells == 1);
    // The dropped text column still counts: 1 / (3 rows * 3 declared columns).
    CHECK_NEAR(fp.missingRate, 1.0 / 9.0, 1e-12);
    CHECK(fp.columns.size() == 2);
    CHECK(fp.columns.count("label") == 0);
}

void testWindowStatistics() {
    ColumnMap cols;
    cols["x"] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    const std::map<std::string, double> stats = FingerprintEngine::windowStatistics(cols, 0, 4);
    CHECK(stats.size() == 6);
    CHECK_NEAR(stats.at("mean_x"), 2.5, 1e-12);
    CHECK_NEAR(stats.at("min_x"), 1.0, 0.0);
    CHECK_NEAR(stats.at("max_x"), 4.0, 0.0);
    CHECK_NEAR(stats.at("median_x"), 2.5, 1e-12);
    CHECK(FingerprintEngine::windowStatistics(cols, 20, 30).empty());
}

void testKsIdenticalSamples() {
    const std::vector<double> x = {1, 2, 2, 3, 4, 5};
    const KsResult ks = DriftDetector::ksTwoSample(x, x);
    CHECK_NEAR(ks.d, 0.0, 0.0);
    CHECK_NEAR(ks.pValue, 1.0, 0.0);

    const KsResult empty = DriftDetector::ksTwoSample({}, x);
    CHECK_NEAR(empty.d, 0.0, 0.0);
    CHECK_NEAR(empty.pValue, 1.0, 0.0);
}

void testKsDisjointSamples() {
    std::vector<double> x;
    std::vector<double> y;
    for (int i = 0; i < 50; ++i) {
        x.push_back(i);
        y.push_back(100 + i);
    }
    const KsResult ks = DriftDetector::ksTwoSample(x, y);
    CHECK_NEAR(ks.d, 1.0, 1e-12);
    CHECK(ks.pValue < 1e-6);
    CHECK(ks.pValue >= 0.0);
}

void testKsPartialOverlap() {
    const KsResult ks = DriftDetector::ksTwoSample({1, 2, 3, 4}, {3, 4, 5, 6});
    CHECK_NEAR(ks.d, 0.5, 1e-12);
    CHECK(ks.pValue > 0.0);
    CHECK(ks.pValue <= 1.0);
}

Fingerprint singleColumn(const std::string& name, double mean, double median, double mad) {
    Fingerprint fp;
    ColumnFingerprint col;
    col.count = 10;
    col.mean = mean;
    col.median = median;
    col.mad = mad;
    fp.columns[name] = col;
    return fp;
}

void testMeanShiftFlagsDrift() {
    const Fingerprint base = singleColumn("v", 10.0, 10.0, 1.0);
    const Fingerprint cur = singleColumn("v", 10.06, 10.0, 1.0);

    const DriftSignals s = DriftDetector::compose(base, cur);
    CHECK(s.flagDrift);
    CHECK_NEAR(s.checks.at("delta_mean_v"), 0.06, 1e-12);
    CHECK_NEAR(s.checks.at("delta_median_v"), 0.0, 1e-12);
    CHECK(s.checks.count("ks_D_v") == 0);

    const Fingerprint small = singleColumn("v", 10.04, 10.0, 1.0);
    CHECK(!DriftDetector::compose(base, small).flagDrift);
}

void testOnlySharedColumnsCompared() {
    const Fingerprint base = singleColumn("a", 1.0, 1.0, 0.0);
    const Fingerprint cur = singleColumn("b", 50.0, 50.0, 0.0);
    const DriftSignals s = DriftDetector::compose(base, cur);
    CHECK(!s.flagDrift);
    CHECK(s.checks.empty());
}

void testKsChecksFlagDistributionChange() {
    const Fingerprint base = singleColumn("v", 10.0, 10.0, 1.0);
    const Fingerprint cur = singleColumn("v", 10.0, 10.0, 1.0);

    ColumnMap baseRaw;
    ColumnMap curRaw;
    for (int i = 0; i < 50; ++i) {
        baseRaw["v"].push_back(i);
        curRaw["v"].push_back(1000 + i);
    }
    const DriftSignals s = DriftDetector::compose(base, cur, &baseRaw, &curRaw, 0.05);
    CHECK(s.flagDrift);
    CHECK_NEAR(s.checks.at("ks_D_v"), 1.0, 1e-12);
    CHECK(s.checks.at("ks_pvalue_v") < 0.05);

    const DriftSignals same = DriftDetector::compose(base, cur, &baseRaw, &baseRaw, 0.05);
    CHECK(!same.flagDrift);
    CHECK_NEAR(same.checks.at("ks_pvalue_v"), 1.0, 0.0);
}
} // namespace

int main() {
    TestHarness::TempDir dir("fingerprint");
    testColumnSummary();
    testMissingRateCountsDeclaredColumns(dir);
    testWindowStatistics();
    testKsIdenticalSamples();
    testKsDisjointSamples();
    testKsPartialOverlap();
    testMeanShiftFlagsDrift();
    testOnlySharedColumnsCompared();
    testKsChecksFlagDistributionChange();
    return TestHarness::finish("fingerprint_drift");
}
