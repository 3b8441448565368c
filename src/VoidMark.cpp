#include "VoidMark.h"
#include "CommonUtils.h"
#include "FluxGuardExceptions.h"
#include "NumericTable.h"
#include "ReportWriter.h"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace {
bool isCsvFile(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    return CommonUtils::toLower(fs::path(path).extension().string()) == ".csv";
}

std::string resolveFingerprintSource(const VoidMarkOptions& options) {
    if (!options.fingerprintCsv.empty()) return options.fingerprintCsv;
    if (isCsvFile(options.targetPath)) return options.targetPath;
    return "";
}
} // namespace

FingerprintComparison VoidMark::compareWithBaseline(const std::string& currentCsv,
                                                    const std::string& baselineMark,
                                                    double alpha,
                                                    char delimiter) {
    NumericTable current(currentCsv, delimiter);
    current.load();

    FingerprintComparison cmp;
    cmp.fingerprint = FingerprintEngine::fromTable(current);
    if (baselineMark.empty()) return cmp;

    const std::optional<nlohmann::json> base = ReportWriter::readJson(baselineMark);
    if (!base || !base->is_object()) return cmp;
    const auto fpIt = base->find("fingerprint");
    if (fpIt == base->end()) return cmp;
    const std::optional<Fingerprint> baseFp = ReportWriter::fingerprintFromJson(*fpIt);
    if (!baseFp) return cmp;

    std::optional<NumericTable> baseRaw;
    const auto srcIt = base->find("data_fingerprint_source_csv");
    if (srcIt != base->end() && srcIt->is_string()) {
        const std::string baseCsv = srcIt->get<std::string>();
        std::error_code ec;
        if (fs::exists(baseCsv, ec)) {
            baseRaw.emplace(baseCsv, delimiter);
            try {
                baseRaw->load();
            } catch (const FluxGuard::DatasetException& e) {
                std::cerr << "[FluxGuard Warning] Baseline table unusable, skipping KS checks: " << e.what() << "\n";
                baseRaw.reset();
            }
        }
    }

    if (baseRaw) {
        cmp.driftSignals = DriftDetector::compose(*baseFp, cmp.fingerprint, &baseRaw->columns(), &current.columns(), alpha);
    } else {
        cmp.driftSignals = DriftDetector::compose(*baseFp, cmp.fingerprint, nullptr, nullptr, alpha);
    }
    return cmp;
}

VoidMarkResult VoidMark::run(const VoidMarkOptions& options, const std::string& outputDir, char delimiter, bool verbose) {
    const fs::path out(outputDir);
    const std::vector<uint8_t> base = StressTester::readTargetBytes(options.targetPath);

    VoidMarkResult result;
    result.stress = StressTester::run(base, options.runs, options.noise, options.seed);
    if (verbose) {
        std::cout << "[FluxGuard][VoidMark] base_hash=" << result.stress.baseHash << " seed=" << result.stress.seed
                  << " runs=" << options.runs << " noise=" << options.noise << "\n";
    }

    for (const StressRecord& rec : result.stress.records) {
        ReportWriter::writeJson((out / "runs" / ReportWriter::runFileName(rec.runIndex)).string(), ReportWriter::toJson(rec));
    }

    const std::string fpSource = resolveFingerprintSource(options);
    std::error_code ec;
    if (!fpSource.empty() && fs::exists(fpSource, ec)) {
        result.comparison = compareWithBaseline(fpSource, options.baselineMark, options.ksAlpha, delimiter);
        result.fingerprintSource = fpSource;
        if (!options.rulesPath.empty()) {
            const std::vector<Rule> rules = RuleEngine::loadRules(options.rulesPath);
            result.ruleViolations = RuleEngine::evaluateRules(
                rules, RuleEngine::environmentFromFingerprint(result.comparison->fingerprint));
        }
        if (verbose) {
            std::cout << "[FluxGuard][VoidMark] fingerprint " << fpSource << ": "
                      << result.comparison->fingerprint.columns.size() << " column(s), flag_drift="
                      << (result.comparison->driftSignals.flagDrift ? "true" : "false") << "\n";
        }
    }

    result.markPath = (out / "vault" / "voidmark_mark.json").string();
    result.markSha256 = ReportWriter::writeJson(result.markPath, markJson(result, options.targetPath));

    if (!options.ledgerPath.empty()) {
        VersionLedgerEntry entry;
        entry.baseHash = result.stress.baseHash;
        entry.fingerprintReference = result.markPath;
        if (!result.fingerprintSource.empty()) entry.sourceReference = result.fingerprintSource;
        entry.driftFlag = result.comparison && result.comparison->driftSignals.flagDrift;
        result.ledgerOutcome = VersionLedger::append(options.ledgerPath, entry);
        if (verbose) std::cout << "[FluxGuard][VoidMark] ledger entry appended to " << options.ledgerPath << "\n";
    }
    return result;
}

nlohmann::json VoidMark::markJson(const VoidMarkResult& result, const std::string& target) {
    nlohmann::json mark = {{"target", target},
                           {"base_hash", result.stress.baseHash},
                           {"seed", result.stress.seed},
                           {"noise", result.stress.noise},
                           {"runs", result.stress.runs},
                           {"summary", ReportWriter::toJson(result.stress.summary)}};
    if (result.comparison) {
        mark["fingerprint"] = ReportWriter::toJson(result.comparison->fingerprint);
        mark["drift_signals"] = ReportWriter::toJson(result.comparison->driftSignals);
        mark["data_fingerprint_source_csv"] = result.fingerprintSource;
    }
    if (result.ruleViolations) mark["rule_violations"] = ReportWriter::toJson(*result.ruleViolations);
    return mark;
}

nlohmann::json VoidMark::toJson(const VoidMarkResult& result) {
    nlohmann::json out = {{"mark", result.markPath},
                          {"mark_sha256", result.markSha256},
                          {"summary", ReportWriter::toJson(result.stress.summary)}};
    out["drift_signals"] = result.comparison ? ReportWriter::toJson(result.comparison->driftSignals) : nlohmann::json(nullptr);
    return out;
}
