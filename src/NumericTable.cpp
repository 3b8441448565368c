#include "NumericTable.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "FluxGuardExceptions.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>

namespace {
constexpr size_t kRowsPerBatch = 4096;
}

NumericTable::NumericTable(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

bool NumericTable::parseNumericCell(const std::string& raw, double& out) {
    const std::string s = CommonUtils::trim(raw);
    if (s.empty()) return false;

    const char* first = s.data();
    const char* last = s.data() + s.size();
    // from_chars rejects an explicit plus sign that plain decimal notation allows.
    if (*first == '+' && s.size() > 1 && first[1] != '-' && first[1] != '+') ++first;

    double value = 0.0;
    const auto res = std::from_chars(first, last, value);
    if (res.ec != std::errc() || res.ptr != last) return false;
    if (!std::isfinite(value)) return false;
    out = value;
    return true;
}

void NumericTable::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw FluxGuard::IOException("Could not open file: " + filename_);

    CSVUtils::skipBOM(in);
    CSVUtils::Record headerRec = CSVUtils::readRecord(in, delimiter_);
    while (headerRec.blank) headerRec = CSVUtils::readRecord(in, delimiter_);
    if (headerRec.malformed || headerRec.fields.empty()) {
        throw FluxGuard::DatasetException("Table has no header row: " + filename_);
    }
    const std::vector<std::string> header = CSVUtils::normalizeHeader(headerRec.fields);

    declaredColumns_ = header.size();
    rowCount_ = 0;
    missingCells_ = 0;

    std::vector<std::vector<double>> parsed(header.size());
    CSVUtils::RecordBatchReader reader(in, delimiter_);
    std::vector<std::vector<std::string>> batch;
    batch.reserve(kRowsPerBatch);

    bool more = true;
    while (more) {
        batch.clear();
        more = reader.readBatch(kRowsPerBatch, batch);
        for (const auto& row : batch) {
            ++rowCount_;
            for (size_t c = 0; c < header.size(); ++c) {
                if (c >= row.size() || CommonUtils::trim(row[c]).empty()) {
                    ++missingCells_;
                    continue;
                }
                double v = 0.0;
                if (parseNumericCell(row[c], v)) parsed[c].push_back(v);
            }
        }
    }

    if (reader.limitExceeded()) {
        throw FluxGuard::DatasetException("Record exceeds parser limits in " + filename_);
    }
    if (reader.malformedRecords() > 0) {
        std::cerr << "[FluxGuard Warning] Skipped " << reader.malformedRecords()
                  << " malformed record(s) in " << filename_ << "\n";
    }

    ColumnMap byName;
    for (size_t c = 0; c < header.size(); ++c) byName[header[c]] = std::move(parsed[c]);
    retainQualifyingColumns(std::move(byName));
}

NumericTable NumericTable::fromColumns(ColumnMap columns) {
    NumericTable table;
    table.filename_ = "<memory>";
    table.declaredColumns_ = columns.size();
    for (const auto& [name, values] : columns) {
        table.rowCount_ = std::max(table.rowCount_, values.size());
    }
    table.retainQualifyingColumns(std::move(columns));
    return table;
}

void NumericTable::retainQualifyingColumns(ColumnMap parsed) {
    columns_.clear();
    for (auto& [name, values] : parsed) {
        if (values.size() > 1) columns_.emplace(name, std::move(values));
    }
    if (columns_.empty()) {
        throw FluxGuard::DatasetException("No usable numeric column in " + filename_);
    }
}

std::vector<std::string> NumericTable::columnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& entry : columns_) names.push_back(entry.first);
    return names;
}

const std::vector<double>& NumericTable::column(const std::string& name) const {
    const auto it = columns_.find(name);
    if (it == columns_.end()) throw FluxGuard::DatasetException("Unknown column: " + name);
    return it->second;
}

size_t NumericTable::commonLength() const noexcept {
    size_t len = std::numeric_limits<size_t>::max();
    for (const auto& entry : columns_) len = std::min(len, entry.second.size());
    return columns_.empty() ? 0 : len;
}
