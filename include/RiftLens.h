#pragma once

#include "CoherenceEngine.h"
#include "GuardConfig.h"
#include "LagCausality.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

// One threshold's coherence report; optional blocks are present only when requested.
struct RiftLensReport {
    CoherenceGraph graph;
    std::optional<LocalRuptureReport> localRuptures;
    std::optional<std::vector<CausalEdge>> causalEdges;
    int causalMaxLag = 0;
};

struct RiftLensReportRef {
    double threshold = 0.0;
    std::string path;
};

struct RiftLensRunResult {
    std::string input;
    std::vector<RiftLensReportRef> reports;
};

class RiftLens {
public:
    /**
     * @brief Graph plus the ruptures and causal blocks selected by options.
     * @throws FluxGuard::ConfigurationException when options.mode is not corr or causal.
     */
    static RiftLensReport analyze(const ColumnMap& columns, double threshold, const RiftLensOptions& options);

    // riftlens_report_thr_<threshold with two decimals>.json
    static std::string reportFileName(double threshold);

    /**
     * @brief Loads options.inputPath and writes one report per threshold under outputDir.
     */
    static RiftLensRunResult run(const RiftLensOptions& options, const std::string& outputDir, char delimiter, bool verbose);

    static nlohmann::json toJson(const RiftLensReport& report);
    static nlohmann::json toJson(const RiftLensRunResult& result);
};
