#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct RiftLensOptions {
    std::string inputPath;
    std::vector<double> thresholds = {0.1, 0.3, 0.5, 0.7, 0.9, 0.95};
    std::string mode = "corr";       // corr|causal
    int maxLag = 3;
    bool localRuptures = false;
    int window = 100;
    int step = 100;
    int deltaEdgesThreshold = 1;
};

struct VoidMarkOptions {
    std::string targetPath;
    size_t runs = 500;
    double noise = 0.02;             // per-byte flip probability
    uint32_t seed = 0;               // 0 => derived from the base hash
    // Table to fingerprint; empty => the target itself when it is a .csv file.
    std::string fingerprintCsv;
    std::string baselineMark;
    double ksAlpha = 0.05;
    std::string ledgerPath;          // empty => no ledger entry
    std::string rulesPath;           // optional rules checked against the fingerprint
};

struct SoakOptions {
    size_t runs = 200;
    uint32_t seed = 0;               // 0 => derived from the constraints hash
    std::string constraintsPath = "constraints.txt";
    bool dataAware = false;
    std::string inputPath;
    std::string rulesPath;
    size_t sampleRows = 50;
};

struct GateOptions {
    std::string ciOut = "fluxguard_out";
    double threshold = 0.25;
    std::string weights = "0.3,0.4,0.3";   // w_null,w_drift,w_void
    double nullTarget = 0.10;
    std::string nullMode = "p05";          // p05|p01|p50|mean_score|min_score|failed_ratio|auto
    double voidVarLimit = 0.01;
    std::string baselineCsv;
    std::string currentCsv;
    double driftZLimit = 3.0;
    std::string reportPath;                // empty => <ci_out>/integrity_incoherence.json
};

struct GuardConfig {
    std::string command;             // riftlens|voidmark|nulltrace|check
    std::string outputDir;           // empty => fluxguard_out/<command>
    char delimiter = ',';
    bool verbose = false;

    RiftLensOptions riftlens;
    VoidMarkOptions voidmark;
    SoakOptions nulltrace;
    GateOptions check;

    /**
     * @brief Builds config from "<command> [options]" and an optional --config file.
     * @post Returns a validated config object.
     * @throws FluxGuard::ConfigurationException on unknown commands, options or invalid values.
     */
    static GuardConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads "key: value" lines over `base`; '#' comments, quoted values, '-' or '_' in keys.
     * @throws FluxGuard::ConfigurationException on unreadable files or invalid values.
     */
    static GuardConfig fromFile(const std::string& configPath, const GuardConfig& base);

    /**
     * @brief Validates ranges and enum-like fields.
     * @throws FluxGuard::ConfigurationException on invalid values.
     */
    void validate() const;

    std::string resolvedOutputDir() const;
};

namespace GuardConfigParsing {
struct GateWeights {
    double wNull = 0.0;
    double wDrift = 0.0;
    double wVoid = 0.0;
};

/**
 * @brief Parses "w_null,w_drift,w_void".
 * @throws FluxGuard::ConfigurationException unless exactly three numbers are given.
 */
GateWeights parseWeights(const std::string& text);

// Lower-cased, trimmed null score mode with mean, median and p10 mapped to mean_score, p50 and p05.
std::string canonicalNullMode(const std::string& mode);

// Lower-cased, trimmed mode; throws FluxGuard::ConfigurationException unless corr or causal.
std::string normalizeMode(const std::string& mode);
}
