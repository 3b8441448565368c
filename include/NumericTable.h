#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

// Column name -> parsed values in row order. Ordered so every consumer walks names ascending.
using ColumnMap = std::map<std::string, std::vector<double>>;

class NumericTable {
public:
    explicit NumericTable(std::string filename, char delimiter = ',');

    /**
     * @brief Reads the header-tagged table and keeps the numeric cells of every column.
     * @details Non-numeric and non-finite cells are discarded; a column survives only with
     *          at least two parsed values. Missing cells (short rows, empty after trim) are
     *          counted against every declared header column.
     * @post columns() holds at least one column.
     * @throws FluxGuard::IOException when the file cannot be opened.
     * @throws FluxGuard::DatasetException when the header is missing or no column qualifies.
     */
    void load();

    /**
     * @brief Builds a table from in-memory columns, applying the same retention rule as load().
     * @throws FluxGuard::DatasetException when no column has more than one value.
     */
    static NumericTable fromColumns(ColumnMap columns);

    const ColumnMap& columns() const noexcept { return columns_; }
    std::vector<std::string> columnNames() const;
    const std::vector<double>& column(const std::string& name) const;
    bool hasColumn(const std::string& name) const { return columns_.count(name) > 0; }

    // Shortest retained column; the common row axis for windowed and lagged analysis.
    size_t commonLength() const noexcept;

    size_t rowCount() const noexcept { return rowCount_; }
    size_t declaredColumnCount() const noexcept { return declaredColumns_; }
    size_t missingCellCount() const noexcept { return missingCells_; }
    const std::string& sourcePath() const noexcept { return filename_; }

    static bool parseNumericCell(const std::string& raw, double& out);

private:
    NumericTable() = default;

    std::string filename_;
    char delimiter_ = ',';
    size_t rowCount_ = 0;
    size_t declaredColumns_ = 0;
    size_t missingCells_ = 0;
    ColumnMap columns_;

    void retainQualifyingColumns(ColumnMap parsed);
};
