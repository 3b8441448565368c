#include "SoakRunner.h"
#include "CommonUtils.h"
#include "Fingerprint.h"
#include "HashUtils.h"
#include "RandomUtils.h"
#include "ReportWriter.h"
#include "StatsUtils.h"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

std::string SoakRunner::constraintsHash(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::string(64, '0');
    return HashUtils::sha256Hex(HashUtils::readFileBytes(path));
}

DataCheck SoakRunner::dataAwareCheck(const ColumnMap& columns,
                                     std::mt19937& rng,
                                     size_t sampleRows,
                                     const std::vector<Rule>& rules) {
    DataCheck check;
    if (columns.empty()) return check;

    size_t length = columns.begin()->second.size();
    for (const auto& entry : columns) length = std::min(length, entry.second.size());
    if (length == 0) return check;

    const size_t rows = std::max<size_t>(2, std::min(sampleRows, length));
    const size_t span = (length >= rows) ? (length - rows + 1) : 1;
    check.start = RandomUtils::uniformIndex(rng, span);
    check.end = check.start + rows;
    check.stats = FingerprintEngine::windowStatistics(columns, check.start, check.end);

    const RuleEnvironment env = RuleEngine::environmentFromStatistics(rows, 0.0, check.stats);
    check.violations = RuleEngine::evaluateRules(rules, env);
    check.ok = check.violations.empty();
    return check;
}

ScoreStatistics SoakRunner::scoreStatistics(std::vector<double> scores) {
    ScoreStatistics s;
    if (scores.empty()) return s;
    std::sort(scores.begin(), scores.end());
    s.minScore = CommonUtils::roundDigits(scores.front());
    s.maxScore = CommonUtils::roundDigits(scores.back());
    s.meanScore = CommonUtils::roundDigits(StatsUtils::runningMean(scores));
    s.p01 = CommonUtils::roundDigits(StatsUtils::quantileSorted(scores, 0.01));
    s.p05 = CommonUtils::roundDigits(StatsUtils::quantileSorted(scores, 0.05));
    s.p50 = CommonUtils::roundDigits(StatsUtils::quantileSorted(scores, 0.50));
    return s;
}

SoakSummary SoakRunner::run(const SoakOptions& options, const std::string& outputDir, char delimiter, bool verbose) {
    SoakSummary summary;
    summary.runs = options.runs;
    summary.constraintsPath = options.constraintsPath;
    summary.constraintsHash = constraintsHash(options.constraintsPath);
    summary.seed = (options.seed == 0) ? HashUtils::seedFromHexPrefix(summary.constraintsHash) : options.seed;
    summary.dataAware = options.dataAware;
    summary.inputPath = options.inputPath;
    summary.rulesPath = options.rulesPath;
    summary.sampleRows = options.sampleRows;

    std::optional<NumericTable> table;
    std::vector<Rule> rules;
    if (options.dataAware) {
        table.emplace(options.inputPath, delimiter);
        table->load();
        if (!options.rulesPath.empty()) rules = RuleEngine::loadRules(options.rulesPath);
        if (verbose) {
            std::cout << "[FluxGuard][NullTrace] data-aware: " << table->columns().size() << " column(s), "
                      << rules.size() << " rule(s)\n";
        }
    }

    std::mt19937 rng(summary.seed);
    std::vector<double> scores;
    scores.reserve(options.runs);
    const fs::path runsDir = fs::path(outputDir) / "runs";

    for (size_t i = 0; i < options.runs; ++i) {
        SoakRecord record;
        record.runIndex = i;
        record.score = RandomUtils::uniformUnit(rng);
        record.passed = record.score >= kPassScore;

        if (table) {
            record.dataCheck = dataAwareCheck(table->columns(), rng, options.sampleRows, rules);
            if (!record.dataCheck->ok && summary.anomalies.size() < kMaxAnomalies) {
                summary.anomalies.push_back({i, record.dataCheck->violations});
            }
        }

        ReportWriter::writeJson((runsDir / ReportWriter::runFileName(i)).string(), toJson(record));
        scores.push_back(record.score);
        if (record.passed) {
            ++summary.okRuns;
        } else {
            ++summary.failedRuns;
        }
    }

    if (!scores.empty()) summary.scores = scoreStatistics(scores);

    ReportWriter::writeJson((fs::path(outputDir) / "nulltrace_summary.json").string(), toJson(summary));
    if (verbose) {
        std::cout << "[FluxGuard][NullTrace] " << summary.okRuns << "/" << summary.runs << " runs OK, seed="
                  << summary.seed << ", anomalies=" << summary.anomalies.size() << "\n";
    }
    return summary;
}

nlohmann::json SoakRunner::toJson(const SoakRecord& record) {
    nlohmann::json out = {{"run_index", record.runIndex}, {"passed", record.passed}, {"score", record.score}};
    if (record.dataCheck) {
        const DataCheck& chk = *record.dataCheck;
        nlohmann::json stats = nlohmann::json::object();
        for (const auto& [key, value] : chk.stats) stats[key] = value;
        out["data_checks"] = {{"ok", chk.ok},
                              {"window", {{"start", chk.start}, {"end", chk.end}}},
                              {"stats", stats},
                              {"violations", ReportWriter::toJson(chk.violations)}};
    }
    return out;
}

nlohmann::json SoakRunner::toJson(const SoakSummary& summary) {
    nlohmann::json out = {{"runs", summary.runs},
                          {"ok_runs", summary.okRuns},
                          {"failed_runs", summary.failedRuns},
                          {"seed", summary.seed},
                          {"constraints_path", summary.constraintsPath},
                          {"constraints_sha256", summary.constraintsHash}};
    if (summary.scores) {
        out["min_score"] = summary.scores->minScore;
        out["mean_score"] = summary.scores->meanScore;
        out["max_score"] = summary.scores->maxScore;
        out["p01"] = summary.scores->p01;
        out["p05"] = summary.scores->p05;
        out["p50"] = summary.scores->p50;
    }
    if (summary.dataAware) {
        nlohmann::json anomalies = nlohmann::json::array();
        for (const SoakAnomaly& a : summary.anomalies) {
            anomalies.push_back({{"run", a.run}, {"violations", ReportWriter::toJson(a.violations)}});
        }
        out["data_aware"] = true;
        out["input_csv"] = summary.inputPath;
        out["rules_path"] = summary.rulesPath.empty() ? nlohmann::json(nullptr) : nlohmann::json(summary.rulesPath);
        out["sample_rows"] = summary.sampleRows;
        out["anomalies"] = anomalies;
    }
    return out;
}
