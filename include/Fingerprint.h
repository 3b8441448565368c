#pragma once

#include "NumericTable.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

struct ColumnFingerprint {
    size_t count = 0;
    double mean = 0.0;
    double stddev = 0.0;  // population
    double min = 0.0;
    double max = 0.0;
    double median = 0.0;
    double q05 = 0.0;
    double q95 = 0.0;
    double mad = 0.0;
};

struct Fingerprint {
    size_t rows = 0;
    size_t missingCells = 0;
    double missingRate = 0.0;
    std::map<std::string, ColumnFingerprint> columns;
};

namespace FingerprintEngine {
/**
 * @brief Summary statistics of one column, every value rounded to 12 digits.
 * @pre values is non-empty.
 */
ColumnFingerprint summarizeColumn(const std::vector<double>& values);

/**
 * @brief Fingerprint of a loaded table.
 * @details missingRate divides by rows times the declared header width, so columns that
 *          were dropped as non-numeric still count in the denominator.
 */
Fingerprint fromTable(const NumericTable& table);

/**
 * @brief Flat "<stat>_<column>" statistics of row window [start, end) for rule environments.
 * @post Holds mean_, std_, min_, max_, median_ and mad_ keys for every column with data in the window.
 */
std::map<std::string, double> windowStatistics(const ColumnMap& columns, size_t start, size_t end);
}
