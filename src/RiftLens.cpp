#include "RiftLens.h"
#include "CommonUtils.h"
#include "NumericTable.h"
#include "ReportWriter.h"

#include <filesystem>
#include <iostream>

RiftLensReport RiftLens::analyze(const ColumnMap& columns, double threshold, const RiftLensOptions& options) {
    const std::string mode = GuardConfigParsing::normalizeMode(options.mode);

    RiftLensReport report;
    report.graph = CoherenceEngine::buildGraph(columns, threshold);

    if (options.localRuptures) {
        WindowOptions window;
        window.window = options.window;
        window.step = options.step;
        window.deltaEdgesThreshold = options.deltaEdgesThreshold;
        report.localRuptures = CoherenceEngine::localRuptures(columns, threshold, window);
    }

    if (mode == "causal") {
        CausalOptions causal;
        causal.threshold = threshold;
        causal.maxLag = options.maxLag;
        report.causalEdges = LagCausality::discover(columns, causal);
        report.causalMaxLag = options.maxLag;
    }
    return report;
}

std::string RiftLens::reportFileName(double threshold) {
    return "riftlens_report_thr_" + CommonUtils::formatFixed(threshold, 2) + ".json";
}

RiftLensRunResult RiftLens::run(const RiftLensOptions& options, const std::string& outputDir, char delimiter, bool verbose) {
    NumericTable table(options.inputPath, delimiter);
    table.load();
    if (verbose) {
        std::cout << "[FluxGuard][RiftLens] Loaded " << table.columns().size() << " numeric column(s), "
                  << table.rowCount() << " row(s) from " << options.inputPath << "\n";
    }

    RiftLensRunResult result;
    result.input = options.inputPath;
    for (double thr : options.thresholds) {
        const RiftLensReport report = analyze(table.columns(), thr, options);
        const std::string path = (std::filesystem::path(outputDir) / reportFileName(thr)).string();
        ReportWriter::writeJson(path, toJson(report));
        result.reports.push_back({thr, path});

        if (verbose) {
            std::cout << "[FluxGuard][RiftLens] threshold=" << CommonUtils::formatFixed(thr, 2)
                      << " edges=" << report.graph.edges.size();
            if (report.localRuptures) std::cout << " ruptures=" << report.localRuptures->rupturePoints.size();
            if (report.causalEdges) std::cout << " causal_edges=" << report.causalEdges->size();
            std::cout << " -> " << path << "\n";
        }
    }
    return result;
}

nlohmann::json RiftLens::toJson(const RiftLensReport& report) {
    nlohmann::json out = ReportWriter::toJson(report.graph);
    if (report.localRuptures) out["local_ruptures"] = ReportWriter::toJson(*report.localRuptures);
    if (report.causalEdges) {
        out["causal_edges"] = ReportWriter::toJson(*report.causalEdges);
        out["causal_mode"] = {{"type", "lagged_corr_lite"}, {"max_lag", report.causalMaxLag}};
    }
    return out;
}

nlohmann::json RiftLens::toJson(const RiftLensRunResult& result) {
    nlohmann::json reports = nlohmann::json::array();
    for (const RiftLensReportRef& ref : result.reports) {
        reports.push_back({{"threshold", ref.threshold}, {"report", ref.path}});
    }
    return {{"input", result.input}, {"reports", reports}};
}
