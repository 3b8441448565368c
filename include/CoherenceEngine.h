#pragma once
#include "NumericTable.h"

#include <cstddef>
#include <string>
#include <vector>

struct GraphEdge {
    std::string a;   // a < b
    std::string b;
    double corr = 0.0;
};

struct CoherenceGraph {
    std::vector<std::string> nodes;
    std::vector<GraphEdge> edges;
    double threshold = 0.0;
};

struct WindowSlice {
    size_t start = 0;
    size_t end = 0;
    size_t edgeCount = 0;
    std::vector<GraphEdge> edges;
};

struct WindowOptions {
    int window = 100;              // < 2 => min(50, length)
    int step = 100;                // < 1 => window
    int deltaEdgesThreshold = 1;
};

struct LocalRuptureReport {
    WindowOptions options;         // as requested, before defaulting
    std::vector<size_t> rupturePoints;
    std::vector<WindowSlice> perWindow;
};

class CoherenceEngine {
public:
    /**
     * @brief Pearson r over the common prefix of x and y.
     * @post Returns 0 when fewer than two values overlap or either side has zero variance.
     */
    static double pearson(const std::vector<double>& x, const std::vector<double>& y);
    static double pearson(const double* x, const double* y, size_t n);

    /**
     * @brief Thresholded correlation graph over every unordered column pair.
     * @post Edges keep a < b, one per pair, with |corr| >= threshold; corr rounded to 12 digits.
     */
    static CoherenceGraph buildGraph(const ColumnMap& columns, double threshold);

    /**
     * @brief Rebuilds the graph on row windows [start, start + window) of the common axis.
     * @post Ascending starts; empty when the common length is below two rows.
     */
    static std::vector<WindowSlice> windowedEdges(const ColumnMap& columns,
                                                  double threshold,
                                                  int window,
                                                  int step);

    /**
     * @brief Window starts whose edge count moved by at least deltaEdgesThreshold
     *        versus the preceding window. Sorted and deduplicated.
     */
    static std::vector<size_t> detectRuptures(const std::vector<WindowSlice>& perWindow,
                                              int deltaEdgesThreshold);

    static LocalRuptureReport localRuptures(const ColumnMap& columns,
                                            double threshold,
                                            const WindowOptions& options);
};
