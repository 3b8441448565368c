#pragma once

#include "NumericTable.h"

#include <cstddef>
#include <string>
#include <vector>

struct CausalEdge {
    std::string from;
    std::string to;
    int lag = 1;
    double corr = 0.0;
};

struct CausalOptions {
    double threshold = 0.5;
    int maxLag = 3;
};

class LagCausality {
public:
    /**
     * @brief Directed lagged-correlation edges, one candidate per ordered column pair.
     * @details For each lag in 1..maxLag correlates src[0, len-lag) with dst[lag, len);
     *          the first lag reaching the largest |r| wins. maxLag below 1 is treated as 1.
     * @pre Columns share the row axis; len is the shortest column.
     * @post Empty when len < 3. Edges ordered by (from, to) ascending.
     */
    static std::vector<CausalEdge> discover(const ColumnMap& columns, const CausalOptions& options);
};
