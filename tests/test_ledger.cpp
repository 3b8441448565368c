#include "ReportWriter.h"
#include "TestHarness.h"
#include "VersionLedger.h"

#include <string>

namespace {
VersionLedgerEntry entry(const std::string& hash, bool drift) {
    VersionLedgerEntry e;
    e.baseHash = hash;
    e.fingerprintReference = "vault/voidmark_mark.json";
    e.driftFlag = drift;
    return e;
}

void testMissingLedger(const TestHarness::TempDir& dir) {
    const VersionLedger::History h = VersionLedger::load(dir.file("none.json"));
    CHECK(h.outcome == VersionLedger::LoadOutcome::Missing);
    CHECK(h.entries.empty());
}

void testAppendsKeepOrder(const TestHarness::TempDir& dir) {
    const std::string path = dir.file("nested/ledger.json");
    CHECK(VersionLedger::append(path, entry("h1", false)) == VersionLedger::LoadOutcome::Missing);

    VersionLedgerEntry second = entry("h2", true);
    second.sourceReference = "data/current.csv";
    CHECK(VersionLedger::append(path, second) == VersionLedger::LoadOutcome::Loaded);
    CHECK(VersionLedger::append(path, entry("h3", false)) == VersionLedger::LoadOutcome::Loaded);

    const VersionLedger::History h = VersionLedger::load(path);
    CHECK(h.outcome == VersionLedger::LoadOutcome::Loaded);
    CHECK(h.entries.size() == 3);
    if (h.entries.size() == 3) {
        CHECK(h.entries[0]["base_hash"] == "h1");
        CHECK(h.entries[0]["source_reference"].is_null());
        CHECK(h.entries[1]["base_hash"] == "h2");
        CHECK(h.entries[1]["drift_flag"] == true);
        CHECK(h.entries[1]["source_reference"] == "data/current.csv");
        CHECK(h.entries[2]["base_hash"] == "h3");
        CHECK(h.entries[2]["fingerprint_reference"] == "vault/voidmark_mark.json");
    }
}

void testCorruptLedgerStartsOver(const TestHarness::TempDir& dir) {
    const std::string garbage = dir.file("garbage.json");
    TestHarness::writeText(garbage, "{not json");
    CHECK(VersionLedger::load(garbage).outcome == VersionLedger::LoadOutcome::EmptyOnCorruption);
    CHECK(VersionLedger::append(garbage, entry("fresh", false)) == VersionLedger::LoadOutcome::EmptyOnCorruption);

    const VersionLedger::History h = VersionLedger::load(garbage);
    CHECK(h.outcome == VersionLedger::LoadOutcome::Loaded);
    CHECK(h.entries.size() == 1);

    const std::string object = dir.file("object.json");
    TestHarness::writeText(object, "{\"base_hash\": \"x\"}");
    CHECK(VersionLedger::load(object).outcome == VersionLedger::LoadOutcome::EmptyOnCorruption);
}

void testWriterRoundsAndSorts(const TestHarness::TempDir& dir) {
    nlohmann::json doc = {{"zeta", 1.0 / 3.0}, {"alpha", 2}};
    const std::string path = dir.file("doc.json");
    const std::string sha = ReportWriter::writeJson(path, doc);
    CHECK(sha.size() == 64);

    const std::string text = ReportWriter::serialize(doc);
    CHECK(text.find("\"alpha\"") < text.find("\"zeta\""));
    CHECK(text.find("0.333333333333") != std::string::npos);
    CHECK(text.find("0.3333333333333") == std::string::npos);
    CHECK(!text.empty() && text.back() == '\n');

    const std::optional<nlohmann::json> back = ReportWriter::readJson(path);
    CHECK(back.has_value());
    CHECK(back && (*back)["alpha"] == 2);
    CHECK(!ReportWriter::readJson(dir.file("missing.json")).has_value());
    CHECK(ReportWriter::runFileName(7) == "run_00007.json");
}
} // namespace

int main() {
    TestHarness::TempDir dir("ledger");
    testMissingLedger(dir);
    testAppendsKeepOrder(dir);
    testCorruptLedgerStartsOver(dir);
    testWriterRoundsAndSorts(dir);
    return TestHarness::finish("ledger");
}
