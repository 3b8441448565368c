#pragma once

#include "CoherenceEngine.h"
#include "CommonUtils.h"
#include "DriftDetector.h"
#include "Fingerprint.h"
#include "LagCausality.h"
#include "RuleEngine.h"
#include "StressTester.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ReportWriter {
using nlohmann::json;

// Copy of doc with every floating-point number rounded; integers, strings and layout untouched.
json roundNumbers(const json& doc, int digits = CommonUtils::kReportDigits);

// Rounded, key-sorted, two-space indented text with a trailing newline.
std::string serialize(const json& doc);

/**
 * @brief Writes serialize(doc) to path through a sibling temporary file and a rename.
 * @details Missing parent directories are created.
 * @return SHA-256 hex of the bytes written.
 * @throws FluxGuard::IOException when the directory, temporary file or rename fails.
 */
std::string writeJson(const std::string& path, const json& doc);

/**
 * @brief Parses a JSON file.
 * @return std::nullopt when the file is missing, unreadable or not valid JSON.
 */
std::optional<json> readJson(const std::string& path);

// run_NNNNN.json, zero-padded to five digits.
std::string runFileName(size_t index);

json toJson(const CoherenceGraph& graph);
json toJson(const LocalRuptureReport& report);
json toJson(const std::vector<CausalEdge>& edges);
json toJson(const ColumnFingerprint& column);
json toJson(const Fingerprint& fp);
json toJson(const DriftSignals& signals);
json toJson(const StressRecord& record);
json toJson(const EntropySummary& summary);
json toJson(const RuleViolation& violation);
json toJson(const std::vector<RuleViolation>& violations);

/**
 * @brief Reads back a fingerprint block written by toJson(const Fingerprint&).
 * @return std::nullopt when doc is not an object with a "columns" object. Missing
 *         per-column statistics read as 0.
 */
std::optional<Fingerprint> fingerprintFromJson(const json& doc);
}
