#include "FluxGuardExceptions.h"
#include "GuardConfig.h"
#include "TestHarness.h"

#include <string>
#include <vector>

namespace {
GuardConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "fluxguard");
    std::vector<char*> argv;
    for (std::string& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return GuardConfig::fromArgs(static_cast<int>(args.size()), argv.data());
}

void testRiftLensDefaultsAndOverrides() {
    const GuardConfig cfg = parse({"riftlens", "--input", "data.csv"});
    CHECK(cfg.command == "riftlens");
    CHECK(cfg.riftlens.inputPath == "data.csv");
    CHECK(cfg.riftlens.thresholds.size() == 6);
    CHECK(cfg.riftlens.mode == "corr");
    CHECK(cfg.resolvedOutputDir() == "fluxguard_out/riftlens");

    const GuardConfig custom = parse({"riftlens", "--input", "d.csv", "--thresholds", "0.2", "0.8",
                                      "--mode", "CAUSAL", "--max-lag", "5", "--local-ruptures",
                                      "--window", "20", "--step", "10", "--output-dir", "out"});
    CHECK(custom.riftlens.thresholds.size() == 2);
    CHECK(custom.riftlens.mode == "causal");
    CHECK(custom.riftlens.maxLag == 5);
    CHECK(custom.riftlens.localRuptures);
    CHECK(custom.riftlens.window == 20);
    CHECK(custom.riftlens.step == 10);
    CHECK(custom.resolvedOutputDir() == "out");
}

void testCommandScopedKeys() {
    const GuardConfig vm = parse({"voidmark", "--input", "blob.bin", "--runs", "10", "--seed", "9",
                                  "--noise", "0.5", "--rules", "r.txt", "--ledger", "l.json"});
    CHECK(vm.voidmark.targetPath == "blob.bin");
    CHECK(vm.voidmark.runs == 10);
    CHECK(vm.voidmark.seed == 9u);
    CHECK_NEAR(vm.voidmark.noise, 0.5, 0.0);
    CHECK(vm.voidmark.rulesPath == "r.txt");
    CHECK(vm.voidmark.ledgerPath == "l.json");
    CHECK(vm.nulltrace.runs == 200);

    const GuardConfig nt = parse({"nulltrace", "--runs", "7", "--data-aware", "--input", "t.csv"});
    CHECK(nt.nulltrace.runs == 7);
    CHECK(nt.nulltrace.dataAware);
    CHECK(nt.nulltrace.inputPath == "t.csv");
    CHECK(nt.voidmark.runs == 500);

    const GuardConfig gate = parse({"check", "--ci-out", "ci", "--weights", "0.1,0.1,0.8", "--null-mode", "auto"});
    CHECK(gate.check.ciOut == "ci");
    CHECK(gate.check.weights == "0.1,0.1,0.8");
    CHECK(gate.check.nullMode == "auto");

    CHECK(parse({"check", "--null-mode", "median"}).check.nullMode == "p50");
    CHECK(parse({"check", "--null-mode", "Mean"}).check.nullMode == "mean_score");
    CHECK(parse({"check", "--null-mode", "p10"}).check.nullMode == "p05");
    GuardConfig direct = parse({"check"});
    direct.check.nullMode = "median";
    direct.validate();
    direct.check.nullMode = "p99";
    CHECK_THROWS(direct.validate(), FluxGuard::ConfigurationException);
}

void testInvalidArguments() {
    CHECK_THROWS(parse({}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"explode"}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"riftlens"}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"riftlens", "--input", "d.csv", "--mode", "granger"}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"riftlens", "--input", "d.csv", "--bogus", "1"}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"riftlens", "--input"}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"voidmark", "--input", "x", "--noise", "1.5"}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"voidmark", "--input", "x", "--runs", "ten"}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"voidmark", "--input", "x", "--seed", "-1"}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"nulltrace", "--data-aware"}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"check", "--weights", "1,2"}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"check", "--null-mode", "p99"}), FluxGuard::ConfigurationException);
}

void testConfigFileWithCliOverride(const TestHarness::TempDir& dir) {
    const std::string path = dir.file("guard.cfg");
    TestHarness::writeText(path,
                           "# voidmark settings\n"
                           "input: \"target dir\"\n"
                           "runs: 50\n"
                           "ks-alpha: 0.01\n"
                           "baseline_mark: 'old/mark.json'\n");
    const GuardConfig cfg = parse({"voidmark", "--config", path, "--runs", "5"});
    CHECK(cfg.voidmark.targetPath == "target dir");
    CHECK(cfg.voidmark.runs == 5);
    CHECK_NEAR(cfg.voidmark.ksAlpha, 0.01, 0.0);
    CHECK(cfg.voidmark.baselineMark == "old/mark.json");

    const std::string bad = dir.file("bad.cfg");
    TestHarness::writeText(bad, "input: x\nnoise: lots\n");
    CHECK_THROWS(parse({"voidmark", "--config", bad}), FluxGuard::ConfigurationException);
    CHECK_THROWS(parse({"voidmark", "--config", dir.file("missing.cfg")}), FluxGuard::ConfigurationException);
}

void testNormalizeMode() {
    CHECK(GuardConfigParsing::normalizeMode(" Corr ") == "corr");
    CHECK_THROWS(GuardConfigParsing::normalizeMode("lag"), FluxGuard::ConfigurationException);
}
} // namespace

int main() {
    TestHarness::TempDir dir("config");
    testRiftLensDefaultsAndOverrides();
    testCommandScopedKeys();
    testInvalidArguments();
    testConfigFileWithCliOverride(dir);
    testNormalizeMode();
    return TestHarness::finish("config");
}
