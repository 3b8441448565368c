#pragma once

#include "DriftDetector.h"
#include "Fingerprint.h"
#include "GuardConfig.h"
#include "RuleEngine.h"
#include "StressTester.h"
#include "VersionLedger.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

struct FingerprintComparison {
    Fingerprint fingerprint;
    DriftSignals driftSignals;
};

struct VoidMarkResult {
    std::string markPath;
    std::string markSha256;
    StressResult stress;
    std::optional<FingerprintComparison> comparison;
    std::string fingerprintSource;
    std::optional<std::vector<RuleViolation>> ruleViolations;
    std::optional<VersionLedger::LoadOutcome> ledgerOutcome;
};

class VoidMark {
public:
    /**
     * @brief Fingerprints currentCsv and compares it with the fingerprint stored in a baseline mark.
     * @details A missing or unparsable baseline, or one without a fingerprint block, gives no checks
     *          and flag_drift = false. KS checks run only when the baseline's
     *          data_fingerprint_source_csv still exists.
     */
    static FingerprintComparison compareWithBaseline(const std::string& currentCsv,
                                                     const std::string& baselineMark,
                                                     double alpha,
                                                     char delimiter);

    /**
     * @brief Stress test, optional fingerprint and drift comparison, mark file, optional ledger entry.
     * @details Writes runs/run_NNNNN.json for every trial and vault/voidmark_mark.json under outputDir.
     */
    static VoidMarkResult run(const VoidMarkOptions& options, const std::string& outputDir, char delimiter, bool verbose);

    static nlohmann::json markJson(const VoidMarkResult& result, const std::string& target);
    static nlohmann::json toJson(const VoidMarkResult& result);
};
