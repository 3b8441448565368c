#include "CoherenceEngine.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
struct ColumnView {
    const std::string* name;
    const std::vector<double>* values;
};

std::vector<ColumnView> sortedViews(const ColumnMap& columns) {
    std::vector<ColumnView> views;
    views.reserve(columns.size());
    for (const auto& entry : columns) views.push_back({&entry.first, &entry.second});
    return views;
}

// Values of one column inside [start, start + window), clipped to its own length.
size_t spanLength(const std::vector<double>& col, size_t start, size_t window) {
    if (start >= col.size()) return 0;
    return std::min(col.size(), start + window) - start;
}

std::vector<GraphEdge> edgesOverRange(const std::vector<ColumnView>& views,
                                      size_t start,
                                      size_t window,
                                      double threshold) {
    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < views.size(); ++i) {
        for (size_t j = i + 1; j < views.size(); ++j) pairs.emplace_back(i, j);
    }

    std::vector<double> corr(pairs.size(), 0.0);
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long long k = 0; k < static_cast<long long>(pairs.size()); ++k) {
        const auto& x = *views[pairs[k].first].values;
        const auto& y = *views[pairs[k].second].values;
        const size_t n = std::min(spanLength(x, start, window), spanLength(y, start, window));
        corr[k] = (n == 0) ? 0.0 : CoherenceEngine::pearson(x.data() + start, y.data() + start, n);
    }

    std::vector<GraphEdge> edges;
    for (size_t k = 0; k < pairs.size(); ++k) {
        if (std::abs(corr[k]) >= threshold) {
            edges.push_back({*views[pairs[k].first].name,
                             *views[pairs[k].second].name,
                             CommonUtils::roundDigits(corr[k])});
        }
    }
    return edges;
}
} // namespace

double CoherenceEngine::pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) return 0.0;
    return pearson(x.data(), y.data(), n);
}

double CoherenceEngine::pearson(const double* x, const double* y, size_t n) {
    if (n < 2) return 0.0;
    // A constant side has no variance even when its mean does not round-trip exactly.
    if (std::all_of(x, x + n, [&](double v) { return v == x[0]; })) return 0.0;
    if (std::all_of(y, y + n, [&](double v) { return v == y[0]; })) return 0.0;

    double sx = 0.0;
    double sy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sx += x[i];
        sy += y[i];
    }
    const double mx = sx / static_cast<double>(n);
    const double my = sy / static_cast<double>(n);

    double vx = 0.0;
    double vy = 0.0;
    double cov = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        vx += dx * dx;
        vy += dy * dy;
        cov += dx * dy;
    }
    if (vx <= 0.0 || vy <= 0.0) return 0.0;
    return cov / std::sqrt(vx * vy);
}

CoherenceGraph CoherenceEngine::buildGraph(const ColumnMap& columns, double threshold) {
    CoherenceGraph graph;
    graph.threshold = threshold;
    for (const auto& entry : columns) graph.nodes.push_back(entry.first);

    size_t longest = 0;
    for (const auto& entry : columns) longest = std::max(longest, entry.second.size());
    graph.edges = edgesOverRange(sortedViews(columns), 0, longest, threshold);
    return graph;
}

std::vector<WindowSlice> CoherenceEngine::windowedEdges(const ColumnMap& columns,
                                                        double threshold,
                                                        int window,
                                                        int step) {
    std::vector<WindowSlice> out;
    if (columns.empty()) return out;

    size_t length = columns.begin()->second.size();
    for (const auto& entry : columns) length = std::min(length, entry.second.size());
    if (length < 2) return out;

    const size_t w = (window < 2) ? std::min<size_t>(50, length) : static_cast<size_t>(window);
    const size_t s = (step < 1) ? w : static_cast<size_t>(step);
    const size_t startLimit = (length >= w) ? (length - w + 1) : 1;

    const auto views = sortedViews(columns);
    for (size_t start = 0; start < startLimit; start += s) {
        WindowSlice slice;
        slice.start = start;
        slice.end = std::min(start + w, length);
        slice.edges = edgesOverRange(views, start, w, threshold);
        slice.edgeCount = slice.edges.size();
        out.push_back(std::move(slice));
    }
    return out;
}

std::vector<size_t> CoherenceEngine::detectRuptures(const std::vector<WindowSlice>& perWindow,
                                                    int deltaEdgesThreshold) {
    std::vector<size_t> points;
    if (perWindow.empty()) return points;

    long long prev = static_cast<long long>(perWindow.front().edgeCount);
    for (size_t i = 1; i < perWindow.size(); ++i) {
        const long long cur = static_cast<long long>(perWindow[i].edgeCount);
        if (std::llabs(cur - prev) >= static_cast<long long>(deltaEdgesThreshold)) {
            points.push_back(perWindow[i].start);
        }
        prev = cur;
    }
    std::sort(points.begin(), points.end());
    points.erase(std::unique(points.begin(), points.end()), points.end());
    return points;
}

LocalRuptureReport CoherenceEngine::localRuptures(const ColumnMap& columns,
                                                  double threshold,
                                                  const WindowOptions& options) {
    LocalRuptureReport report;
    report.options = options;
    report.perWindow = windowedEdges(columns, threshold, options.window, options.step);
    report.rupturePoints = detectRuptures(report.perWindow, options.deltaEdgesThreshold);
    return report;
}
