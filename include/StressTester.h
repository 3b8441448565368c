#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

struct StressRecord {
    size_t runIndex = 0;
    std::string hash;
    double entropyBits = 0.0;
};

// Population statistics of per-run digest entropy. Only count is meaningful when count == 0.
struct EntropySummary {
    size_t count = 0;
    double mean = 0.0;
    double var = 0.0;
    double min = 0.0;
    double max = 0.0;
};

struct StressResult {
    std::string baseHash;
    uint32_t seed = 0;
    double noise = 0.0;
    size_t runs = 0;
    std::vector<StressRecord> records;
    EntropySummary summary;
};

class StressTester {
public:
    /**
     * @brief Canonical bytes of a stress target.
     * @details A regular file yields its content. A directory yields "relpath:sha256hex" lines for
     *          every regular file below it, sorted by '/'-separated relative path and joined by '\n'.
     * @throws FluxGuard::DatasetException when the path is neither a file nor a directory.
     * @throws FluxGuard::IOException when a file cannot be read.
     */
    static std::vector<uint8_t> readTargetBytes(const std::string& path);

    /**
     * @brief Copy of data where each byte, with probability noise, has one uniformly chosen bit flipped.
     * @post noise <= 0 returns the input unchanged and leaves rng untouched.
     */
    static std::vector<uint8_t> flipBits(const std::vector<uint8_t>& data, std::mt19937& rng, double noise);

    // Shannon entropy in bits of the byte histogram; 0 for empty input.
    static double shannonEntropyBits(const std::vector<uint8_t>& data);

    static EntropySummary summarize(const std::vector<double>& entropies);

    /**
     * @brief Runs `runs` perturbation trials over base.
     * @details seed == 0 derives the seed from the first eight hex digits of SHA-256(base).
     *          One generator is seeded once and advanced through every trial in order.
     */
    static StressResult run(const std::vector<uint8_t>& base, size_t runs, double noise, uint32_t seed);
};
