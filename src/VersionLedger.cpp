#include "VersionLedger.h"
#include "ReportWriter.h"

#include <filesystem>
#include <iostream>
#include <system_error>

VersionLedger::History VersionLedger::load(const std::string& path) {
    History history;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        history.outcome = LoadOutcome::Missing;
        return history;
    }

    const std::optional<nlohmann::json> doc = ReportWriter::readJson(path);
    if (!doc || !doc->is_array()) {
        history.outcome = LoadOutcome::EmptyOnCorruption;
        return history;
    }

    history.outcome = LoadOutcome::Loaded;
    history.entries.assign(doc->begin(), doc->end());
    return history;
}

VersionLedger::LoadOutcome VersionLedger::append(const std::string& path, const VersionLedgerEntry& entry) {
    History history = load(path);
    if (history.outcome == LoadOutcome::EmptyOnCorruption) {
        std::cerr << "[FluxGuard Warning] Ledger " << path
                  << " is unreadable or not a JSON array; starting a new history.\n";
    }

    history.entries.push_back(toJson(entry));
    ReportWriter::writeJson(path, nlohmann::json(history.entries));
    return history.outcome;
}

nlohmann::json VersionLedger::toJson(const VersionLedgerEntry& entry) {
    nlohmann::json out = {{"base_hash", entry.baseHash},
                          {"fingerprint_reference", entry.fingerprintReference},
                          {"drift_flag", entry.driftFlag}};
    out["source_reference"] = entry.sourceReference ? nlohmann::json(*entry.sourceReference) : nlohmann::json(nullptr);
    return out;
}
