#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != kBom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3 || matched == 0) return;

    // Partial prefix: give the consumed bytes back to the record parser.
    is.clear(is.rdstate() & ~std::ios::eofbit);
    for (size_t i = 0; i < matched; ++i) is.unget();
}

Record readRecord(std::istream& is, char delimiter, const ParseLimits& limits) {
    Record rec;
    if (is.peek() == EOF) return rec;

    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawContent = false;

    auto flushField = [&]() {
        rec.fields.push_back(fieldQuoted ? field : trimUnquotedField(field));
        field.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && rec.fields.size() > limits.maxColumns) {
            rec.limitExceeded = true;
        }
    };
    auto appendChar = [&](char c) {
        field.push_back(c);
        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) {
            rec.limitExceeded = true;
        }
    };

    char c = 0;
    bool endedOnNewline = false;
    while (!rec.limitExceeded && is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                const int next = is.peek();
                if (next == '"') {
                    is.get();
                    appendChar('"');
                } else if (next == EOF || next == delimiter || next == '\n' || next == '\r') {
                    inQuotes = false;
                } else {
                    appendChar(c);
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                appendChar('\n');
            } else {
                appendChar(c);
            }
            continue;
        }

        if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            endedOnNewline = true;
            break;
        }

        sawContent = true;
        if (c == delimiter) {
            flushField();
        } else if (c == '"' && field.empty() && !fieldQuoted) {
            inQuotes = true;
            fieldQuoted = true;
        } else {
            appendChar(c);
        }
    }

    if (inQuotes) rec.malformed = true;

    if (!sawContent && endedOnNewline) {
        rec.blank = true;
        return rec;
    }
    if (sawContent) flushField();
    return rec;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) out[i] = "column_" + std::to_string(i + 1);

        if (seen.count(out[i]) > 0) {
            const std::string base = out[i];
            size_t suffix = 2;
            while (seen.count(base + "_" + std::to_string(suffix)) > 0) ++suffix;
            out[i] = base + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }
    return out;
}

RecordBatchReader::RecordBatchReader(std::istream& is, char delimiter, ParseLimits limits)
    : is_(is), delimiter_(delimiter), limits_(limits) {}

bool RecordBatchReader::readBatch(size_t maxRows, std::vector<std::vector<std::string>>& out) {
    size_t added = 0;
    while (added < maxRows) {
        if (is_.peek() == EOF) return false;
        Record rec = readRecord(is_, delimiter_, limits_);
        if (rec.limitExceeded) {
            limitExceeded_ = true;
            return false;
        }
        if (rec.malformed) {
            ++malformedRecords_;
            continue;
        }
        if (rec.blank || rec.fields.empty()) continue;
        out.push_back(std::move(rec.fields));
        ++added;
    }
    return is_.peek() != EOF;
}
} // namespace CSVUtils
