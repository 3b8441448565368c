#include "GuardConfig.h"
#include "CommonUtils.h"
#include "FluxGuardExceptions.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw FluxGuard::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const FluxGuard::FluxGuardException&) {
        throw;
    } catch (const std::exception& ex) {
        throw FluxGuard::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::toLower(CommonUtils::trim(key));
    while (!key.empty() && key.front() == '-') key.erase(key.begin());
    std::replace(key.begin(), key.end(), '-', '_');
    return key;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw FluxGuard::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

size_t parseCountStrict(const std::string& value, const std::string& key, int minValue) {
    return static_cast<size_t>(parseIntStrict(value, key, minValue));
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw FluxGuard::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<uint32_t>::max())) {
        throw FluxGuard::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw FluxGuard::ConfigurationException("Value for " + key + " must be finite");
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw FluxGuard::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::vector<double> parseThresholdList(const std::string& value, const std::string& key) {
    std::string normalized = value;
    std::replace(normalized.begin(), normalized.end(), ',', ' ');
    std::replace(normalized.begin(), normalized.end(), '[', ' ');
    std::replace(normalized.begin(), normalized.end(), ']', ' ');
    std::istringstream in(normalized);
    std::vector<double> out;
    std::string token;
    while (in >> token) out.push_back(parseDoubleStrict(token, key));
    return out;
}

bool isFlagKey(const std::string& key) {
    return key == "verbose" || key == "local_ruptures" || key == "data_aware";
}

void assignKeyValue(GuardConfig& config, const std::string& key, const std::string& value) {
    const std::string& cmd = config.command;

    if (key == "output_dir") {
        config.outputDir = value;
    } else if (key == "delimiter") {
        if (value.size() != 1) throw FluxGuard::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
    } else if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
    } else if (key == "input") {
        if (cmd == "voidmark") config.voidmark.targetPath = value;
        else if (cmd == "nulltrace") config.nulltrace.inputPath = value;
        else config.riftlens.inputPath = value;
    } else if (key == "runs") {
        if (cmd == "nulltrace") config.nulltrace.runs = parseCountStrict(value, key, 0);
        else config.voidmark.runs = parseCountStrict(value, key, 0);
    } else if (key == "seed") {
        if (cmd == "nulltrace") config.nulltrace.seed = parseUIntStrict(value, key);
        else config.voidmark.seed = parseUIntStrict(value, key);
    } else if (key == "rules") {
        if (cmd == "voidmark") config.voidmark.rulesPath = value;
        else config.nulltrace.rulesPath = value;
    } else if (key == "thresholds") {
        config.riftlens.thresholds = parseThresholdList(value, key);
    } else if (key == "mode") {
        config.riftlens.mode = CommonUtils::toLower(CommonUtils::trim(value));
    } else if (key == "max_lag") {
        config.riftlens.maxLag = parseIntStrict(value, key, std::numeric_limits<int>::min());
    } else if (key == "local_ruptures") {
        config.riftlens.localRuptures = parseBoolStrict(value, key);
    } else if (key == "window") {
        config.riftlens.window = parseIntStrict(value, key, std::numeric_limits<int>::min());
    } else if (key == "step") {
        config.riftlens.step = parseIntStrict(value, key, std::numeric_limits<int>::min());
    } else if (key == "delta_edges") {
        config.riftlens.deltaEdgesThreshold = parseIntStrict(value, key, 0);
    } else if (key == "noise") {
        config.voidmark.noise = parseDoubleStrict(value, key);
    } else if (key == "fingerprint_csv") {
        config.voidmark.fingerprintCsv = value;
    } else if (key == "baseline_mark") {
        config.voidmark.baselineMark = value;
    } else if (key == "ks_alpha") {
        config.voidmark.ksAlpha = parseDoubleStrict(value, key);
    } else if (key == "ledger" || key == "version_db") {
        config.voidmark.ledgerPath = value;
    } else if (key == "constraints") {
        config.nulltrace.constraintsPath = value;
    } else if (key == "data_aware") {
        config.nulltrace.dataAware = parseBoolStrict(value, key);
    } else if (key == "sample_rows") {
        config.nulltrace.sampleRows = parseCountStrict(value, key, 0);
    } else if (key == "ci_out") {
        config.check.ciOut = value;
    } else if (key == "threshold") {
        config.check.threshold = parseDoubleStrict(value, key);
    } else if (key == "weights") {
        config.check.weights = value;
    } else if (key == "null_target" || key == "null_min_score") {
        config.check.nullTarget = parseDoubleStrict(value, key);
    } else if (key == "null_mode") {
        config.check.nullMode = GuardConfigParsing::canonicalNullMode(value);
    } else if (key == "void_var_limit") {
        config.check.voidVarLimit = parseDoubleStrict(value, key);
    } else if (key == "baseline_csv") {
        config.check.baselineCsv = value;
    } else if (key == "current_csv") {
        config.check.currentCsv = value;
    } else if (key == "drift_z_limit") {
        config.check.driftZLimit = parseDoubleStrict(value, key);
    } else if (key == "report" || key == "output") {
        config.check.reportPath = value;
    } else {
        throw FluxGuard::ConfigurationException("Unknown option: " + key);
    }
}

bool isIn(const std::string& value, const std::unordered_set<std::string>& allowed) {
    return allowed.find(value) != allowed.end();
}
} // namespace

namespace GuardConfigParsing {
GateWeights parseWeights(const std::string& text) {
    const std::vector<std::string> parts = CommonUtils::splitList(text, ',');
    if (parts.size() != 3) {
        throw FluxGuard::ConfigurationException("weights must be 'w_null,w_drift,w_void', got: " + text);
    }
    GateWeights w;
    w.wNull = parseDoubleStrict(parts[0], "weights.w_null");
    w.wDrift = parseDoubleStrict(parts[1], "weights.w_drift");
    w.wVoid = parseDoubleStrict(parts[2], "weights.w_void");
    return w;
}

std::string canonicalNullMode(const std::string& mode) {
    const std::string m = CommonUtils::toLower(CommonUtils::trim(mode));
    if (m == "mean") return "mean_score";
    if (m == "median") return "p50";
    if (m == "p10") return "p05";
    return m;
}

std::string normalizeMode(const std::string& mode) {
    const std::string m = CommonUtils::toLower(CommonUtils::trim(mode));
    if (m != "corr" && m != "causal") {
        throw FluxGuard::ConfigurationException("mode must be corr or causal, got: " + mode);
    }
    return m;
}
}

GuardConfig GuardConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw FluxGuard::ConfigurationException("missing command (riftlens|voidmark|nulltrace|check)");
    }

    GuardConfig config;
    config.command = CommonUtils::toLower(argv[1]);
    if (!isIn(config.command, {"riftlens", "voidmark", "nulltrace", "check"})) {
        throw FluxGuard::ConfigurationException("Unknown command: " + std::string(argv[1]));
    }

    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw FluxGuard::ConfigurationException("Unexpected argument: " + arg);
        }
        const std::string key = normalizeConfigKey(arg);
        if (key == "config") {
            if (i + 1 >= argc) throw FluxGuard::ConfigurationException("--config expects a path");
            configPath = argv[++i];
        } else if (isFlagKey(key)) {
            overrides.emplace_back(key, "true");
        } else if (key == "thresholds") {
            std::string joined;
            while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                joined += std::string(argv[++i]) + " ";
            }
            if (joined.empty()) throw FluxGuard::ConfigurationException("--thresholds expects at least one value");
            overrides.emplace_back(key, joined);
        } else {
            if (i + 1 >= argc) throw FluxGuard::ConfigurationException(arg + " expects a value");
            overrides.emplace_back(key, argv[++i]);
        }
    }

    // Command-line values win over the config file.
    if (!configPath.empty()) {
        config = fromFile(configPath, config);
    }
    for (const auto& [key, value] : overrides) {
        assignKeyValue(config, key, value);
    }

    config.validate();
    return config;
}

GuardConfig GuardConfig::fromFile(const std::string& configPath, const GuardConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw FluxGuard::ConfigurationException("Could not open config file: " + configPath);

    GuardConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const FluxGuard::FluxGuardException& ex) {
            throw FluxGuard::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void GuardConfig::validate() const {
    if (!isIn(command, {"riftlens", "voidmark", "nulltrace", "check"})) {
        throw FluxGuard::ConfigurationException("command must be one of: riftlens, voidmark, nulltrace, check");
    }

    if (command == "riftlens") {
        if (riftlens.inputPath.empty()) throw FluxGuard::ConfigurationException("riftlens requires --input");
        if (riftlens.thresholds.empty()) throw FluxGuard::ConfigurationException("thresholds must not be empty");
        GuardConfigParsing::normalizeMode(riftlens.mode);
    }

    if (command == "voidmark") {
        if (voidmark.targetPath.empty()) throw FluxGuard::ConfigurationException("voidmark requires --input");
        if (voidmark.noise < 0.0 || voidmark.noise > 1.0) {
            throw FluxGuard::ConfigurationException("noise must be within [0, 1]");
        }
        if (voidmark.ksAlpha <= 0.0 || voidmark.ksAlpha >= 1.0) {
            throw FluxGuard::ConfigurationException("ks_alpha must be within (0, 1)");
        }
    }

    if (command == "nulltrace") {
        if (nulltrace.dataAware && nulltrace.inputPath.empty()) {
            throw FluxGuard::ConfigurationException("data_aware requires --input");
        }
    }

    if (command == "check") {
        GuardConfigParsing::parseWeights(check.weights);
        const std::string nullMode = GuardConfigParsing::canonicalNullMode(check.nullMode);
        if (!isIn(nullMode, {"p05", "p01", "p50", "mean_score", "min_score", "failed_ratio", "auto"})) {
            throw FluxGuard::ConfigurationException(
                "null_mode must be one of: p05, p01, p50, mean_score, min_score, failed_ratio, auto");
        }
        if (check.voidVarLimit <= 0.0) throw FluxGuard::ConfigurationException("void_var_limit must be > 0");
        if (check.driftZLimit <= 0.0) throw FluxGuard::ConfigurationException("drift_z_limit must be > 0");
        if (check.nullTarget <= 0.0) throw FluxGuard::ConfigurationException("null_target must be > 0");
    }
}

std::string GuardConfig::resolvedOutputDir() const {
    if (!outputDir.empty()) return outputDir;
    return "fluxguard_out/" + command;
}
