#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Delimited-record tokenization shared by every table reader.
// Cells come back as text; numeric interpretation belongs to the caller.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;   // 8 MiB
    size_t maxColumns = 20000;
};

struct Record {
    std::vector<std::string> fields;
    bool blank = false;          // physical line without any content
    bool malformed = false;      // quoted field still open at end of input
    bool limitExceeded = false;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record (quoted fields may span physical lines).
 * @pre is is positioned at the start of a record.
 * @post Returns an empty, non-blank record only at end of input.
 */
Record readRecord(std::istream& is, char delimiter, const ParseLimits& limits = ParseLimits{});

/**
 * @brief Replaces empty header names with column_<n> and suffixes duplicates with _<k>.
 */
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

class RecordBatchReader {
public:
    explicit RecordBatchReader(std::istream& is, char delimiter, ParseLimits limits = ParseLimits{});

    // Appends up to maxRows non-blank records to out; returns false once input is exhausted.
    bool readBatch(size_t maxRows, std::vector<std::vector<std::string>>& out);

    size_t malformedRecords() const noexcept { return malformedRecords_; }
    bool limitExceeded() const noexcept { return limitExceeded_; }

private:
    std::istream& is_;
    char delimiter_;
    ParseLimits limits_;
    size_t malformedRecords_ = 0;
    bool limitExceeded_ = false;
};
} // namespace CSVUtils
