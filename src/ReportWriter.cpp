#include "ReportWriter.h"
#include "FluxGuardExceptions.h"
#include "HashUtils.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
double numberOr(const nlohmann::json& obj, const char* key, double fallback) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return fallback;
    return it->get<double>();
}

size_t countOr(const nlohmann::json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return 0;
    const double v = it->get<double>();
    return v > 0.0 ? static_cast<size_t>(v) : 0;
}

nlohmann::json edgeToJson(const GraphEdge& e) {
    return {{"a", e.a}, {"b", e.b}, {"corr", e.corr}};
}
} // namespace

namespace ReportWriter {
json roundNumbers(const json& doc, int digits) {
    if (doc.is_number_float()) return CommonUtils::roundDigits(doc.get<double>(), digits);
    if (doc.is_object()) {
        json out = json::object();
        for (auto it = doc.begin(); it != doc.end(); ++it) out[it.key()] = roundNumbers(it.value(), digits);
        return out;
    }
    if (doc.is_array()) {
        json out = json::array();
        for (const auto& item : doc) out.push_back(roundNumbers(item, digits));
        return out;
    }
    return doc;
}

std::string serialize(const json& doc) {
    return roundNumbers(doc).dump(2) + "\n";
}

std::string writeJson(const std::string& path, const json& doc) {
    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw FluxGuard::IOException("Could not create directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    const std::string text = serialize(doc);
    const fs::path tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw FluxGuard::IOException("Could not open output file: " + tmp.string());
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out.good()) throw FluxGuard::IOException("Failed while writing output file: " + tmp.string());
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tmp, cleanup);
        throw FluxGuard::IOException("Could not move " + tmp.string() + " into place: " + ec.message());
    }
    return HashUtils::sha256Hex(text);
}

std::optional<json> readJson(const std::string& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) return std::nullopt;

    json doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded()) return std::nullopt;
    return doc;
}

std::string runFileName(size_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "run_%05zu.json", index);
    return buf;
}

json toJson(const CoherenceGraph& graph) {
    json edges = json::array();
    for (const GraphEdge& e : graph.edges) edges.push_back(edgeToJson(e));
    return {{"nodes", graph.nodes}, {"edges", edges}, {"threshold", graph.threshold}};
}

json toJson(const LocalRuptureReport& report) {
    json perWindow = json::array();
    for (const WindowSlice& w : report.perWindow) {
        perWindow.push_back({{"start", w.start}, {"end", w.end}, {"edges_count", w.edgeCount}});
    }
    return {{"window", report.options.window},
            {"step", report.options.step},
            {"delta_edges_threshold", report.options.deltaEdgesThreshold},
            {"rupture_points", report.rupturePoints},
            {"per_window_edges", perWindow}};
}

json toJson(const std::vector<CausalEdge>& edges) {
    json out = json::array();
    for (const CausalEdge& e : edges) {
        out.push_back({{"from", e.from}, {"to", e.to}, {"lag", e.lag}, {"corr", e.corr}});
    }
    return out;
}

json toJson(const ColumnFingerprint& c) {
    return {{"count", c.count},
            {"mean", c.mean},
            {"std", c.stddev},
            {"min", c.min},
            {"max", c.max},
            {"median", c.median},
            {"q05", c.q05},
            {"q95", c.q95},
            {"mad", c.mad}};
}

json toJson(const Fingerprint& fp) {
    json columns = json::object();
    for (const auto& [name, col] : fp.columns) columns[name] = toJson(col);
    return {{"rows", fp.rows},
            {"missing_cells", fp.missingCells},
            {"missing_rate", fp.missingRate},
            {"columns", columns}};
}

json toJson(const DriftSignals& signals) {
    json checks = json::object();
    for (const auto& [key, value] : signals.checks) checks[key] = value;
    return {{"flag_drift", signals.flagDrift}, {"checks", checks}};
}

json toJson(const StressRecord& record) {
    return {{"run_index", record.runIndex}, {"sha256", record.hash}, {"entropy_bits", record.entropyBits}};
}

json toJson(const EntropySummary& s) {
    if (s.count == 0) return {{"count", 0}};
    return {{"count", s.count},
            {"mean_entropy_bits", s.mean},
            {"var_entropy_bits", s.var},
            {"min_entropy_bits", s.min},
            {"max_entropy_bits", s.max}};
}

json toJson(const RuleViolation& v) {
    json out = {{"rule", v.rule}, {"expr", v.expression}};
    if (v.error) out["error"] = *v.error;
    if (v.result) out["result"] = *v.result;
    return out;
}

json toJson(const std::vector<RuleViolation>& violations) {
    json out = json::array();
    for (const RuleViolation& v : violations) out.push_back(toJson(v));
    return out;
}

std::optional<Fingerprint> fingerprintFromJson(const json& doc) {
    if (!doc.is_object()) return std::nullopt;
    const auto cols = doc.find("columns");
    if (cols == doc.end() || !cols->is_object()) return std::nullopt;

    Fingerprint fp;
    fp.rows = countOr(doc, "rows");
    fp.missingCells = countOr(doc, "missing_cells");
    fp.missingRate = numberOr(doc, "missing_rate", 0.0);
    for (auto it = cols->begin(); it != cols->end(); ++it) {
        if (!it.value().is_object()) continue;
        const json& c = it.value();
        ColumnFingerprint col;
        col.count = countOr(c, "count");
        col.mean = numberOr(c, "mean", 0.0);
        col.stddev = numberOr(c, "std", 0.0);
        col.min = numberOr(c, "min", 0.0);
        col.max = numberOr(c, "max", 0.0);
        col.median = numberOr(c, "median", 0.0);
        col.q05 = numberOr(c, "q05", 0.0);
        col.q95 = numberOr(c, "q95", 0.0);
        col.mad = numberOr(c, "mad", 0.0);
        fp.columns[it.key()] = col;
    }
    return fp;
}
}
