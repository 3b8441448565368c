#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

struct VersionLedgerEntry {
    std::string baseHash;
    std::string fingerprintReference;          // path of the mark this entry records
    std::optional<std::string> sourceReference; // dataset the fingerprint came from
    bool driftFlag = false;
};

/**
 * @brief Append-only JSON array of ledger entries stored at a caller-owned path.
 * @details A single writer is assumed; nothing locks the file.
 */
class VersionLedger {
public:
    enum class LoadOutcome { Loaded, Missing, EmptyOnCorruption };

    struct History {
        LoadOutcome outcome = LoadOutcome::Missing;
        std::vector<nlohmann::json> entries;
    };

    /**
     * @brief Reads the existing history.
     * @post Missing file => {Missing, []}. Unreadable, unparsable or non-array content =>
     *       {EmptyOnCorruption, []}; this is a recovery path and never throws.
     */
    static History load(const std::string& path);

    /**
     * @brief Loads the history, appends entry, and rewrites the whole list key-sorted and indented.
     * @return How the prior history was obtained. EmptyOnCorruption is also reported on stderr.
     * @throws FluxGuard::IOException when the file cannot be written.
     */
    static LoadOutcome append(const std::string& path, const VersionLedgerEntry& entry);

    static nlohmann::json toJson(const VersionLedgerEntry& entry);
};
