#include "StressTester.h"
#include "CommonUtils.h"
#include "FluxGuardExceptions.h"
#include "HashUtils.h"
#include "RandomUtils.h"
#include "StatsUtils.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

std::vector<uint8_t> StressTester::readTargetBytes(const std::string& path) {
    std::error_code ec;
    const fs::path target(path);

    if (fs::is_regular_file(target, ec)) {
        return HashUtils::readFileBytes(path);
    }
    if (!fs::is_directory(target, ec)) {
        throw FluxGuard::DatasetException("Stress target must be a file or a directory: " + path);
    }

    std::vector<std::pair<std::string, std::string>> items;
    fs::recursive_directory_iterator it(target, ec);
    if (ec) throw FluxGuard::IOException("Could not traverse directory: " + path + " (" + ec.message() + ")");
    for (const fs::directory_entry& entry : it) {
        if (!entry.is_regular_file()) continue;
        const std::string rel = entry.path().lexically_relative(target).generic_string();
        items.emplace_back(rel, HashUtils::sha256Hex(HashUtils::readFileBytes(entry.path().string())));
    }
    // Component-wise order, so "a/x" precedes "a-b/y".
    std::sort(items.begin(), items.end(), [](const auto& a, const auto& b) {
        return fs::path(a.first).compare(fs::path(b.first)) < 0;
    });

    std::string blob;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) blob.push_back('\n');
        blob += items[i].first;
        blob.push_back(':');
        blob += items[i].second;
    }
    return std::vector<uint8_t>(blob.begin(), blob.end());
}

std::vector<uint8_t> StressTester::flipBits(const std::vector<uint8_t>& data, std::mt19937& rng, double noise) {
    std::vector<uint8_t> out = data;
    if (noise <= 0.0) return out;
    for (uint8_t& b : out) {
        if (RandomUtils::uniformUnit(rng) < noise) {
            b ^= static_cast<uint8_t>(1u << RandomUtils::bitIndex(rng));
        }
    }
    return out;
}

double StressTester::shannonEntropyBits(const std::vector<uint8_t>& data) {
    if (data.empty()) return 0.0;
    std::array<size_t, 256> freq{};
    for (uint8_t b : data) ++freq[b];

    const double n = static_cast<double>(data.size());
    double ent = 0.0;
    for (size_t c : freq) {
        if (c == 0) continue;
        const double p = static_cast<double>(c) / n;
        ent -= p * std::log2(p);
    }
    return ent;
}

EntropySummary StressTester::summarize(const std::vector<double>& entropies) {
    EntropySummary s;
    s.count = entropies.size();
    if (entropies.empty()) return s;

    const StatsUtils::PopulationSummary pop = StatsUtils::summarize(entropies);
    s.mean = CommonUtils::roundDigits(pop.mean);
    s.var = CommonUtils::roundDigits(pop.variance);
    s.min = CommonUtils::roundDigits(pop.min);
    s.max = CommonUtils::roundDigits(pop.max);
    return s;
}

StressResult StressTester::run(const std::vector<uint8_t>& base, size_t runs, double noise, uint32_t seed) {
    StressResult result;
    result.baseHash = HashUtils::sha256Hex(base);
    result.seed = (seed == 0) ? HashUtils::seedFromHexPrefix(result.baseHash) : seed;
    result.noise = noise;
    result.runs = runs;

    std::mt19937 rng(result.seed);
    std::vector<double> entropies;
    entropies.reserve(runs);
    result.records.reserve(runs);

    for (size_t i = 0; i < runs; ++i) {
        const std::vector<uint8_t> mutated = flipBits(base, rng, noise);
        const HashUtils::Digest digest = HashUtils::sha256(mutated);
        const std::vector<uint8_t> digestBytes(digest.begin(), digest.end());
        const double entropy = shannonEntropyBits(digestBytes);

        entropies.push_back(entropy);
        result.records.push_back({i, HashUtils::toHex(digest), entropy});
    }

    result.summary = summarize(entropies);
    return result;
}
