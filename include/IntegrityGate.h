#pragma once

#include "GuardConfig.h"
#include "NumericTable.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>

struct GateReport {
    GuardConfigParsing::GateWeights weights;
    double threshold = 0.0;
    double vNull = 0.0;
    double vDrift = 0.0;
    double vVoid = 0.0;
    double incoherenceScore = 0.0;
    bool block = false;
    nlohmann::json nullDetails = nlohmann::json::object();
    nlohmann::json voidDetails = nlohmann::json::object();
    nlohmann::json driftDetails = nlohmann::json::object();
};

/**
 * @brief Folds soak, stress and drift results into one weighted incoherence score.
 * @details score = w_null*v_null + w_drift*v_drift + w_void*v_void; BLOCK when score > threshold.
 */
class IntegrityGate {
public:
    /**
     * @brief Soak score selected by mode, or std::nullopt to fall back to failed_runs / runs.
     * @return The score (if any) and the mode actually used.
     */
    static std::pair<std::optional<double>, std::string> pickNullScore(const nlohmann::json& soakSummary,
                                                                       const std::string& mode);

    // max(0, (target - score) / target), or failed_runs / runs when no score is usable.
    static double nullViolation(const nlohmann::json& soakSummary, const GateOptions& options, nlohmann::json& details);

    // max(0, (varEntropy - limit) / limit)
    static double voidViolation(double varEntropy, double limit);

    // Largest |mean_cur - mean_base| / std_base over shared columns with std_base > 0; 0 if none.
    static double driftZMax(const ColumnMap& baseline, const ColumnMap& current);

    /**
     * @brief Reads <ci_out>/nulltrace and <ci_out>/voidmark summaries and the optional CSV pair.
     * @throws FluxGuard::ConfigurationException on malformed weights.
     */
    static GateReport evaluate(const GateOptions& options, char delimiter);

    // evaluate(), write the report, and log the component summary.
    static GateReport run(const GateOptions& options, char delimiter, bool verbose);

    static std::string reportPath(const GateOptions& options);
    static nlohmann::json toJson(const GateReport& report);
};
