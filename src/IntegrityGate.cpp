#include "IntegrityGate.h"
#include "CommonUtils.h"
#include "FluxGuardExceptions.h"
#include "ReportWriter.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace {
double safeDiv(double num, double den) {
    if (den == 0.0) return 0.0;
    return num / den;
}

std::optional<double> finiteNumber(const nlohmann::json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return std::nullopt;
    const double v = it->get<double>();
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

size_t countField(const nlohmann::json& obj, const char* key) {
    const std::optional<double> v = finiteNumber(obj, key);
    return (v && *v > 0.0) ? static_cast<size_t>(*v) : 0;
}

struct LoadedSummary {
    nlohmann::json doc;
    std::string source;
};

// First candidate that parses; a "<section>" object inside a run summary wins over the document itself.
std::optional<LoadedSummary> loadSummary(const fs::path& dir,
                                         const std::vector<std::string>& names,
                                         const std::string& section,
                                         bool unwrapSummary) {
    for (const std::string& name : names) {
        const fs::path p = dir / name;
        std::error_code ec;
        if (!fs::exists(p, ec)) continue;
        std::optional<nlohmann::json> doc = ReportWriter::readJson(p.string());
        if (!doc || !doc->is_object()) continue;

        const auto it = doc->find(section);
        if (it != doc->end() && it->is_object()) {
            if (unwrapSummary) {
                const auto sum = it->find("summary");
                if (sum != it->end() && sum->is_object()) return LoadedSummary{*sum, p.string()};
            }
            return LoadedSummary{*it, p.string()};
        }
        return LoadedSummary{*doc, p.string()};
    }
    return std::nullopt;
}
} // namespace

std::pair<std::optional<double>, std::string> IntegrityGate::pickNullScore(const nlohmann::json& soakSummary,
                                                                           const std::string& requested) {
    const std::string mode = GuardConfigParsing::canonicalNullMode(requested);
    if (mode == "failed_ratio") return {std::nullopt, "failed_ratio"};
    if (mode == "auto") {
        for (const char* key : {"p05", "mean_score", "p50", "min_score"}) {
            if (soakSummary.contains(key) && !soakSummary[key].is_null()) return {finiteNumber(soakSummary, key), key};
        }
        return {std::nullopt, "failed_ratio"};
    }
    if (soakSummary.contains(mode) && !soakSummary[mode].is_null()) return {finiteNumber(soakSummary, mode.c_str()), mode};
    if (soakSummary.contains("min_score") && !soakSummary["min_score"].is_null()) {
        return {finiteNumber(soakSummary, "min_score"), "min_score"};
    }
    return {std::nullopt, "failed_ratio"};
}

double IntegrityGate::nullViolation(const nlohmann::json& soakSummary, const GateOptions& options, nlohmann::json& details) {
    const size_t runs = countField(soakSummary, "runs");
    const size_t failed = countField(soakSummary, "failed_runs");
    const auto [score, mode] = pickNullScore(soakSummary, options.nullMode);

    details["runs"] = runs;
    details["failed_runs"] = failed;
    details["null_mode"] = mode;
    details["target"] = options.nullTarget;
    details["score"] = score ? nlohmann::json(*score) : nlohmann::json(nullptr);

    double v = 0.0;
    if (mode == "failed_ratio" || !score) {
        v = runs > 0 ? safeDiv(static_cast<double>(failed), static_cast<double>(runs)) : 0.0;
        details["computed_from"] = "failed_runs/runs";
    } else {
        v = std::max(0.0, safeDiv(options.nullTarget - *score, options.nullTarget));
        details["computed_from"] = mode;
    }

    for (const char* key : {"min_score", "mean_score", "p01", "p05", "p50", "max_score"}) {
        if (const std::optional<double> s = finiteNumber(soakSummary, key)) details[key] = *s;
    }
    return v;
}

double IntegrityGate::voidViolation(double varEntropy, double limit) {
    return std::max(0.0, safeDiv(varEntropy - limit, limit));
}

double IntegrityGate::driftZMax(const ColumnMap& baseline, const ColumnMap& current) {
    double zmax = 0.0;
    for (const auto& [col, baseValues] : baseline) {
        const auto it = current.find(col);
        if (it == current.end()) continue;
        const StatsUtils::PopulationSummary base = StatsUtils::summarize(baseValues);
        const double sd = std::sqrt(base.variance);
        if (sd <= 0.0) continue;
        const double z = std::abs(StatsUtils::runningMean(it->second) - base.mean) / sd;
        if (std::isfinite(z)) zmax = std::max(zmax, z);
    }
    return zmax;
}

GateReport IntegrityGate::evaluate(const GateOptions& options, char delimiter) {
    GateReport report;
    report.weights = GuardConfigParsing::parseWeights(options.weights);
    report.threshold = options.threshold;

    const fs::path ciOut(options.ciOut);

    const std::optional<LoadedSummary> soak =
        loadSummary(ciOut / "nulltrace", {"nulltrace_summary.json", "fluxguard_summary.json"}, "nulltrace", false);
    if (soak) {
        report.nullDetails["source"] = soak->source;
        report.vNull = nullViolation(soak->doc, options, report.nullDetails);
    } else {
        report.nullDetails["source"] = nullptr;
        report.nullDetails["error"] = "nulltrace summary not found";
    }

    const std::optional<LoadedSummary> stress =
        loadSummary(ciOut / "voidmark", {"fluxguard_summary.json", "voidmark_summary.json"}, "voidmark", true);
    if (stress) {
        const double var = finiteNumber(stress->doc, "var_entropy_bits").value_or(0.0);
        report.vVoid = voidViolation(var, options.voidVarLimit);
        report.voidDetails["source"] = stress->source;
        report.voidDetails["var_entropy_bits"] = var;
        report.voidDetails["limit_var_entropy_bits"] = options.voidVarLimit;
    } else {
        report.voidDetails["source"] = nullptr;
        report.voidDetails["error"] = "voidmark summary not found";
    }

    std::error_code ec;
    const bool haveCsvs = !options.baselineCsv.empty() && !options.currentCsv.empty() &&
                          fs::exists(options.baselineCsv, ec) && fs::exists(options.currentCsv, ec);
    report.driftDetails["baseline_csv"] = options.baselineCsv.empty() ? nlohmann::json(nullptr) : nlohmann::json(options.baselineCsv);
    report.driftDetails["current_csv"] = options.currentCsv.empty() ? nlohmann::json(nullptr) : nlohmann::json(options.currentCsv);
    report.driftDetails["drift_z_limit"] = options.driftZLimit;
    if (haveCsvs) {
        NumericTable base(options.baselineCsv, delimiter);
        NumericTable cur(options.currentCsv, delimiter);
        try {
            base.load();
            cur.load();
            const double zmax = driftZMax(base.columns(), cur.columns());
            report.vDrift = std::max(0.0, safeDiv(zmax - options.driftZLimit, options.driftZLimit));
            report.driftDetails["zmax_mean_shift"] = zmax;
        } catch (const FluxGuard::DatasetException& e) {
            std::cerr << "[FluxGuard Warning] Drift tables unusable, drift set to 0: " << e.what() << "\n";
            report.vDrift = 0.0;
            report.driftDetails["note"] = std::string("unusable baseline/current csv, drift set to 0: ") + e.what();
        }
    } else {
        report.driftDetails["note"] = "no baseline/current csv provided or files missing, drift set to 0";
    }

    report.incoherenceScore = report.weights.wNull * report.vNull +
                              report.weights.wDrift * report.vDrift +
                              report.weights.wVoid * report.vVoid;
    report.block = report.incoherenceScore > report.threshold;
    return report;
}

std::string IntegrityGate::reportPath(const GateOptions& options) {
    if (!options.reportPath.empty()) return options.reportPath;
    return (fs::path(options.ciOut) / "integrity_incoherence.json").string();
}

GateReport IntegrityGate::run(const GateOptions& options, char delimiter, bool verbose) {
    const GateReport report = evaluate(options, delimiter);
    const std::string out = reportPath(options);
    ReportWriter::writeJson(out, toJson(report));

    if (verbose) {
        std::cout << "[FluxGuard][Check] weights: w_null=" << CommonUtils::formatFixed(report.weights.wNull, 3)
                  << " w_drift=" << CommonUtils::formatFixed(report.weights.wDrift, 3)
                  << " w_void=" << CommonUtils::formatFixed(report.weights.wVoid, 3) << "\n";
        std::cout << "[FluxGuard][Check] nulltrace: " << report.nullDetails.dump()
                  << " -> v_null=" << CommonUtils::formatFixed(report.vNull, 6) << "\n";
        std::cout << "[FluxGuard][Check] voidmark: " << report.voidDetails.dump()
                  << " -> v_void=" << CommonUtils::formatFixed(report.vVoid, 6) << "\n";
        std::cout << "[FluxGuard][Check] drift: " << report.driftDetails.dump()
                  << " -> v_drift=" << CommonUtils::formatFixed(report.vDrift, 6) << "\n";
    }
    std::cout << "[FluxGuard][Check] incoherence_score: " << CommonUtils::formatFixed(report.incoherenceScore, 6)
              << " (threshold=" << CommonUtils::formatFixed(report.threshold, 6) << ") -> "
              << (report.block ? "BLOCK" : "OK") << "\n";
    std::cout << "[FluxGuard][Check] report: " << out << "\n";
    return report;
}

nlohmann::json IntegrityGate::toJson(const GateReport& report) {
    return {{"threshold", report.threshold},
            {"weights", {{"w_null", report.weights.wNull}, {"w_drift", report.weights.wDrift}, {"w_void", report.weights.wVoid}}},
            {"violations", {{"v_null", report.vNull}, {"v_drift", report.vDrift}, {"v_void", report.vVoid}}},
            {"incoherence_score", report.incoherenceScore},
            {"components", {{"nulltrace", report.nullDetails}, {"voidmark", report.voidDetails}, {"drift", report.driftDetails}}},
            {"decision", report.block ? "BLOCK" : "OK"}};
}
