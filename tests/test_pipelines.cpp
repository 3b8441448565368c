#include "FluxGuardExceptions.h"
#include "ReportWriter.h"
#include "RiftLens.h"
#include "TestHarness.h"
#include "VoidMark.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {
void testRiftLensWritesReportPerThreshold(const TestHarness::TempDir& dir) {
    const std::string csv = dir.file("ab.csv");
    std::string text = "A,B,C\n";
    for (int t = 1; t <= 12; ++t) {
        text += std::to_string(t) + "," + std::to_string(2 * t) + "," + std::to_string((t * 7) % 5) + "\n";
    }
    TestHarness::writeText(csv, text);

    RiftLensOptions opts;
    opts.inputPath = csv;
    opts.thresholds = {0.5, 0.95};
    opts.mode = "causal";
    opts.maxLag = 2;
    opts.localRuptures = true;
    opts.window = 6;
    opts.step = 6;

    const std::string out = dir.file("rift");
    const RiftLensRunResult result = RiftLens::run(opts, out, ',', false);
    CHECK(result.reports.size() == 2);
    CHECK(fs::exists(fs::path(out) / "riftlens_report_thr_0.50.json"));
    CHECK(fs::exists(fs::path(out) / "riftlens_report_thr_0.95.json"));

    const std::optional<nlohmann::json> doc = ReportWriter::readJson((fs::path(out) / "riftlens_report_thr_0.50.json").string());
    CHECK(doc.has_value());
    if (doc) {
        CHECK((*doc)["nodes"].size() == 3);
        CHECK((*doc)["threshold"] == 0.5);
        CHECK(doc->contains("local_ruptures"));
        CHECK((*doc)["local_ruptures"]["window"] == 6);
        CHECK((*doc)["local_ruptures"]["per_window_edges"].size() == 2);
        CHECK(doc->contains("causal_edges"));
        CHECK((*doc)["causal_mode"]["type"] == "lagged_corr_lite");
        CHECK((*doc)["causal_mode"]["max_lag"] == 2);
        bool sawAB = false;
        for (const auto& e : (*doc)["edges"]) {
            if (e["a"] == "A" && e["b"] == "B") sawAB = true;
        }
        CHECK(sawAB);
    }

    opts.mode = "corr";
    opts.localRuptures = false;
    const RiftLensReport plain = RiftLens::analyze(NumericTable::fromColumns({{"A", {1, 2, 3}}, {"B", {2, 4, 6}}}).columns(), 0.5, opts);
    CHECK(!plain.localRuptures.has_value());
    CHECK(!plain.causalEdges.has_value());
    const nlohmann::json j = RiftLens::toJson(plain);
    CHECK(!j.contains("causal_edges"));
    CHECK(!j.contains("local_ruptures"));

    opts.mode = "granger";
    CHECK_THROWS(RiftLens::analyze(ColumnMap(), 0.5, opts), FluxGuard::ConfigurationException);
}

std::string columnCsv(double offset) {
    std::string text = "v,label\n";
    for (int i = 0; i < 60; ++i) text += std::to_string(offset + i) + ",row\n";
    return text;
}

void testVoidMarkBaselineComparisonAndLedger(const TestHarness::TempDir& dir) {
    const std::string baseCsv = dir.file("base.csv");
    const std::string curCsv = dir.file("cur.csv");
    TestHarness::writeText(baseCsv, columnCsv(0.0));
    TestHarness::writeText(curCsv, columnCsv(500.0));
    TestHarness::writeText(dir.file("rules.txt"), "huge: mean_v > 10000\nsane: count == 60\n");
    const std::string ledger = dir.file("ledger.json");

    VoidMarkOptions first;
    first.targetPath = baseCsv;
    first.runs = 4;
    first.ledgerPath = ledger;
    const VoidMarkResult a = VoidMark::run(first, dir.file("vm1"), ',', false);
    CHECK(a.stress.records.size() == 4);
    CHECK(a.fingerprintSource == baseCsv);
    CHECK(a.comparison.has_value());
    CHECK(a.comparison && a.comparison->driftSignals.checks.empty());
    CHECK(a.markSha256.size() == 64);
    CHECK(fs::exists(fs::path(dir.file("vm1")) / "runs" / "run_00003.json"));
    CHECK(a.ledgerOutcome && *a.ledgerOutcome == VersionLedger::LoadOutcome::Missing);

    VoidMarkOptions second;
    second.targetPath = curCsv;
    second.runs = 2;
    second.baselineMark = a.markPath;
    second.ledgerPath = ledger;
    second.rulesPath = dir.file("rules.txt");
    const VoidMarkResult b = VoidMark::run(second, dir.file("vm2"), ',', false);
    CHECK(b.comparison.has_value());
    if (b.comparison) {
        const DriftSignals& s = b.comparison->driftSignals;
        CHECK(s.flagDrift);
        CHECK_NEAR(s.checks.at("delta_mean_v"), 500.0, 1e-9);
        CHECK(s.checks.count("ks_D_v") == 1);
        CHECK(s.checks.count("delta_mean_label") == 0);
    }
    CHECK(b.ruleViolations.has_value());
    CHECK(b.ruleViolations && b.ruleViolations->size() == 1);
    CHECK(b.ruleViolations && !b.ruleViolations->empty() && (*b.ruleViolations)[0].rule == "huge");

    const std::optional<nlohmann::json> mark = ReportWriter::readJson(b.markPath);
    CHECK(mark.has_value());
    if (mark) {
        CHECK((*mark)["drift_signals"]["flag_drift"] == true);
        CHECK((*mark)["data_fingerprint_source_csv"] == curCsv);
        CHECK((*mark)["fingerprint"]["columns"].contains("v"));
        CHECK((*mark)["rule_violations"].size() == 1);
        CHECK((*mark)["summary"]["count"] == 2);
    }

    const VersionLedger::History h = VersionLedger::load(ledger);
    CHECK(h.entries.size() == 2);
    if (h.entries.size() == 2) {
        CHECK(h.entries[0]["drift_flag"] == false);
        CHECK(h.entries[1]["drift_flag"] == true);
        CHECK(h.entries[1]["source_reference"] == curCsv);
    }

    const nlohmann::json summary = VoidMark::toJson(b);
    CHECK(summary["summary"].contains("var_entropy_bits"));
    CHECK(summary["drift_signals"]["flag_drift"] == true);
}

void testVoidMarkMissingBaselineAndBinaryTarget(const TestHarness::TempDir& dir) {
    TestHarness::writeText(dir.file("blob.bin"), std::string("\x01\x02\x03\x04", 4));
    VoidMarkOptions opts;
    opts.targetPath = dir.file("blob.bin");
    opts.runs = 3;
    opts.seed = 12;
    const VoidMarkResult r = VoidMark::run(opts, dir.file("vm3"), ',', false);
    CHECK(!r.comparison.has_value());
    CHECK(r.stress.seed == 12u);
    CHECK(VoidMark::toJson(r)["drift_signals"].is_null());

    const FingerprintComparison cmp =
        VoidMark::compareWithBaseline(dir.file("base.csv"), dir.file("no_such_mark.json"), 0.05, ',');
    CHECK(!cmp.driftSignals.flagDrift);
    CHECK(cmp.driftSignals.checks.empty());
    CHECK(cmp.fingerprint.columns.count("v") == 1);
}

void testVoidMarkUnusableBaselineTable(const TestHarness::TempDir& dir) {
    const std::string baseCsv = dir.file("gone_numeric.csv");
    TestHarness::writeText(baseCsv, columnCsv(0.0));
    VoidMarkOptions first;
    first.targetPath = baseCsv;
    first.runs = 2;
    const VoidMarkResult a = VoidMark::run(first, dir.file("vm4"), ',', false);

    // The baseline table loses every numeric column after the mark was written.
    TestHarness::writeText(baseCsv, "label\nrow\nrow\n");
    const std::string curCsv = dir.file("shifted.csv");
    TestHarness::writeText(curCsv, columnCsv(500.0));

    VoidMarkOptions second;
    second.targetPath = curCsv;
    second.runs = 2;
    second.baselineMark = a.markPath;
    second.ledgerPath = dir.file("ledger_unusable.json");
    const VoidMarkResult b = VoidMark::run(second, dir.file("vm5"), ',', false);
    CHECK(b.comparison.has_value());
    if (b.comparison) {
        const DriftSignals& s = b.comparison->driftSignals;
        CHECK(s.checks.count("ks_D_v") == 0);
        CHECK(s.checks.count("delta_mean_v") == 1);
        CHECK(s.flagDrift);
    }
    CHECK(fs::exists(b.markPath));
    CHECK(VersionLedger::load(second.ledgerPath).entries.size() == 1);
}
} // namespace

int main() {
    TestHarness::TempDir dir("pipelines");
    testRiftLensWritesReportPerThreshold(dir);
    testVoidMarkBaselineComparisonAndLedger(dir);
    testVoidMarkMissingBaselineAndBinaryTarget(dir);
    testVoidMarkUnusableBaselineTable(dir);
    return TestHarness::finish("pipelines");
}
