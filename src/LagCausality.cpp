#include "LagCausality.h"
#include "CoherenceEngine.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr size_t kMinCausalRows = 3;

struct LagBest {
    double corr = 0.0;
    int lag = 1;
};

LagBest bestLag(const std::vector<double>& src, const std::vector<double>& dst, size_t length, int maxLag) {
    LagBest best;
    for (int lag = 1; lag <= maxLag; ++lag) {
        const size_t shift = static_cast<size_t>(lag);
        if (shift >= length) break;
        const double r = CoherenceEngine::pearson(src.data(), dst.data() + shift, length - shift);
        if (std::abs(r) > std::abs(best.corr)) {
            best.corr = r;
            best.lag = lag;
        }
    }
    return best;
}
} // namespace

std::vector<CausalEdge> LagCausality::discover(const ColumnMap& columns, const CausalOptions& options) {
    std::vector<CausalEdge> edges;
    if (columns.empty()) return edges;

    size_t length = columns.begin()->second.size();
    for (const auto& entry : columns) length = std::min(length, entry.second.size());
    if (length < kMinCausalRows) return edges;

    const int maxLag = std::max(1, options.maxLag);

    std::vector<const std::string*> names;
    std::vector<const std::vector<double>*> series;
    for (const auto& entry : columns) {
        names.push_back(&entry.first);
        series.push_back(&entry.second);
    }

    std::vector<std::pair<size_t, size_t>> ordered;
    for (size_t s = 0; s < names.size(); ++s) {
        for (size_t d = 0; d < names.size(); ++d) {
            if (s != d) ordered.emplace_back(s, d);
        }
    }

    std::vector<LagBest> results(ordered.size());
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (long long k = 0; k < static_cast<long long>(ordered.size()); ++k) {
        results[k] = bestLag(*series[ordered[k].first], *series[ordered[k].second], length, maxLag);
    }

    for (size_t k = 0; k < ordered.size(); ++k) {
        if (std::abs(results[k].corr) < options.threshold) continue;
        edges.push_back({*names[ordered[k].first],
                         *names[ordered[k].second],
                         results[k].lag,
                         CommonUtils::roundDigits(results[k].corr)});
    }
    return edges;
}
