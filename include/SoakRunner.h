#pragma once

#include "GuardConfig.h"
#include "NumericTable.h"
#include "RuleEngine.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

struct DataCheck {
    bool ok = true;
    size_t start = 0;
    size_t end = 0;
    std::map<std::string, double> stats;
    std::vector<RuleViolation> violations;
};

struct SoakRecord {
    size_t runIndex = 0;
    bool passed = false;
    double score = 0.0;
    std::optional<DataCheck> dataCheck;
};

struct SoakAnomaly {
    size_t run = 0;
    std::vector<RuleViolation> violations;
};

struct ScoreStatistics {
    double minScore = 0.0;
    double meanScore = 0.0;
    double maxScore = 0.0;
    double p01 = 0.0;
    double p05 = 0.0;
    double p50 = 0.0;
};

struct SoakSummary {
    size_t runs = 0;
    size_t okRuns = 0;
    size_t failedRuns = 0;
    uint32_t seed = 0;
    std::string constraintsPath;
    std::string constraintsHash;
    std::optional<ScoreStatistics> scores;   // absent when runs == 0

    bool dataAware = false;
    std::string inputPath;
    std::string rulesPath;
    size_t sampleRows = 0;
    std::vector<SoakAnomaly> anomalies;      // first kMaxAnomalies only
};

class SoakRunner {
public:
    static constexpr double kPassScore = 0.01;
    static constexpr size_t kMaxAnomalies = 1000;

    // SHA-256 hex of the constraints file, or 64 zeros when it does not exist.
    static std::string constraintsHash(const std::string& path);

    /**
     * @brief Statistics and rule checks over one random row window.
     * @details sampleRows is clamped to [2, length]; the start is drawn uniformly from
     *          [0, length - sampleRows]. The environment is {count, missing_rate: 0, stats}.
     */
    static DataCheck dataAwareCheck(const ColumnMap& columns,
                                    std::mt19937& rng,
                                    size_t sampleRows,
                                    const std::vector<Rule>& rules);

    static ScoreStatistics scoreStatistics(std::vector<double> scores);

    /**
     * @brief Runs the soak and writes runs/run_NNNNN.json plus nulltrace_summary.json under outputDir.
     * @throws FluxGuard::DatasetException / IOException when data-aware input cannot be loaded.
     */
    static SoakSummary run(const SoakOptions& options, const std::string& outputDir, char delimiter, bool verbose);

    static nlohmann::json toJson(const SoakRecord& record);
    static nlohmann::json toJson(const SoakSummary& summary);
};
