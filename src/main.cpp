#include "CommonUtils.h"
#include "FluxGuardExceptions.h"
#include "GuardConfig.h"
#include "IntegrityGate.h"
#include "ReportWriter.h"
#include "RiftLens.h"
#include "SoakRunner.h"
#include "VoidMark.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>

namespace {
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitError = 2;
constexpr int kExitBlock = 3;

void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " <riftlens|voidmark|nulltrace|check> [options]\n"
              << "Common:\n"
              << "  --config <file>                  key: value file applied before command-line options\n"
              << "  --output-dir <dir>               Output directory (default: fluxguard_out/<command>)\n"
              << "  --delimiter <char>               Table delimiter (default: ,)\n"
              << "  --verbose                        Enable detailed logs\n"
              << "riftlens:\n"
              << "  --input <table.csv>              Table to analyse (required)\n"
              << "  --thresholds <t1> [t2 ...]       Edge thresholds (default: 0.1 0.3 0.5 0.7 0.9 0.95)\n"
              << "  --mode <corr|causal>             Add lagged causal edges in causal mode (default: corr)\n"
              << "  --max-lag <n>                    Largest lag for causal mode (default: 3)\n"
              << "  --local-ruptures                 Add windowed rupture detection\n"
              << "  --window <n> --step <n>          Window geometry (default: 100 100)\n"
              << "  --delta-edges <n>                Edge-count change marking a rupture (default: 1)\n"
              << "voidmark:\n"
              << "  --input <file|dir>               Stress target (required)\n"
              << "  --runs <n>                       Perturbation trials (default: 500)\n"
              << "  --noise <p>                      Per-byte bit-flip probability (default: 0.02)\n"
              << "  --seed <n>                       Generator seed, 0 derives it from the target (default: 0)\n"
              << "  --fingerprint-csv <table.csv>    Table to fingerprint (default: target when it is a .csv)\n"
              << "  --baseline-mark <mark.json>      Earlier mark to compare the fingerprint with\n"
              << "  --ks-alpha <a>                   KS significance level (default: 0.05)\n"
              << "  --ledger <file.json>             Append a ledger entry\n"
              << "  --rules <file>                   Rules checked against the fingerprint\n"
              << "nulltrace:\n"
              << "  --runs <n>                       Soak runs (default: 200)\n"
              << "  --seed <n>                       Generator seed, 0 derives it from the constraints (default: 0)\n"
              << "  --constraints <file>             Constraints file hashed into the seed\n"
              << "  --data-aware                     Check rules on random row windows of --input\n"
              << "  --input <table.csv>              Table for data-aware checks\n"
              << "  --rules <file>                   Rules file (name: expression per line)\n"
              << "  --sample-rows <n>                Window size for data-aware checks (default: 50)\n"
              << "check:\n"
              << "  --ci-out <dir>                   Directory holding nulltrace/ and voidmark/ outputs\n"
              << "  --threshold <x>                  Block above this incoherence score (default: 0.25)\n"
              << "  --weights <wn,wd,wv>             w_null,w_drift,w_void (default: 0.3,0.4,0.3)\n"
              << "  --null-target <x>                Target soak score (default: 0.10)\n"
              << "  --null-mode <mode>               p05|p01|p50|mean_score|min_score|failed_ratio|auto\n"
              << "  --void-var-limit <x>             Entropy variance limit (default: 0.01)\n"
              << "  --baseline-csv <f> --current-csv <f>  Tables for the mean-shift drift component\n"
              << "  --drift-z-limit <z>              Mean shift in baseline std units (default: 3.0)\n"
              << "  --report <file>                  Report path (default: <ci-out>/integrity_incoherence.json)\n"
              << "Exit codes: 0 ok, 1 usage, 2 error, 3 integrity BLOCK\n";
}

std::string utcTimestamp() {
    std::time_t t = std::time(nullptr);
    if (const char* sde = std::getenv("SOURCE_DATE_EPOCH")) {
        char* end = nullptr;
        const long long parsed = std::strtoll(sde, &end, 10);
        if (end != sde && *end == '\0') {
            t = static_cast<std::time_t>(parsed);
        } else {
            std::cerr << "[FluxGuard Warning] Ignoring non-integer SOURCE_DATE_EPOCH: " << sde << "\n";
        }
    }
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string exceptionType(const std::exception& e) {
    if (dynamic_cast<const FluxGuard::IOException*>(&e)) return "IOException";
    if (dynamic_cast<const FluxGuard::DatasetException*>(&e)) return "DatasetException";
    if (dynamic_cast<const FluxGuard::ConfigurationException*>(&e)) return "ConfigurationException";
    if (dynamic_cast<const FluxGuard::EvaluationException*>(&e)) return "EvaluationException";
    if (dynamic_cast<const FluxGuard::FluxGuardException*>(&e)) return "FluxGuardException";
    if (dynamic_cast<const std::filesystem::filesystem_error*>(&e)) return "FilesystemError";
    return "RuntimeError";
}

int runCommand(const GuardConfig& config, nlohmann::json& summary) {
    const std::string outDir = config.resolvedOutputDir();

    if (config.command == "riftlens") {
        const RiftLensRunResult result = RiftLens::run(config.riftlens, outDir, config.delimiter, config.verbose);
        summary["riftlens"] = RiftLens::toJson(result);
        std::cout << "[FluxGuard] RiftLens finished: " << result.reports.size() << " report(s)\n";
    } else if (config.command == "voidmark") {
        const VoidMarkResult result = VoidMark::run(config.voidmark, outDir, config.delimiter, config.verbose);
        summary["voidmark"] = VoidMark::toJson(result);
        if (result.stress.summary.count > 0) {
            std::cout << "[FluxGuard] VoidMark finished: mean entropy "
                      << CommonUtils::formatFixed(result.stress.summary.mean, 3) << " bits\n";
        } else {
            std::cout << "[FluxGuard] VoidMark finished: mean entropy unavailable\n";
        }
    } else if (config.command == "nulltrace") {
        const SoakSummary result = SoakRunner::run(config.nulltrace, outDir, config.delimiter, config.verbose);
        summary["nulltrace"] = SoakRunner::toJson(result);
        std::cout << "[FluxGuard] NullTrace finished: " << result.okRuns << "/" << result.runs << " OK\n";
    } else {
        const GateReport report = IntegrityGate::run(config.check, config.delimiter, config.verbose);
        summary["check"] = IntegrityGate::toJson(report);
        if (report.block) return kExitBlock;
    }
    return kExitOk;
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2) {
        const std::string first = argv[1];
        if (first == "--help" || first == "-h" || first == "help") {
            printUsage(argv[0]);
            return kExitOk;
        }
    }

    GuardConfig config;
    try {
        config = GuardConfig::fromArgs(argc, argv);
    } catch (const FluxGuard::FluxGuardException& e) {
        std::cerr << "[FluxGuard Error] " << e.what() << "\n";
        printUsage(argv[0]);
        return kExitUsage;
    }

    nlohmann::json summary = {{"generated_at_utc", utcTimestamp()}, {"command", config.command}, {"status", "ok"}};

    int exitCode = kExitOk;
    try {
        exitCode = runCommand(config, summary);
    } catch (const std::exception& e) {
        summary["status"] = "error";
        summary["error"] = {{"type", exceptionType(e)}, {"message", e.what()}};
        std::cerr << "[FluxGuard Error] " << exceptionType(e) << ": " << e.what() << "\n";
        exitCode = kExitError;
    }

    const std::string summaryPath = (std::filesystem::path(config.resolvedOutputDir()) / "fluxguard_summary.json").string();
    try {
        ReportWriter::writeJson(summaryPath, summary);
        std::cout << "[FluxGuard] Summary saved: " << summaryPath << "\n";
    } catch (const FluxGuard::IOException& e) {
        std::cerr << "[FluxGuard Error] " << e.what() << "\n";
        return kExitError;
    }
    return exitCode;
}
