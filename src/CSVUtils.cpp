#include "CSVUtils.h"

#include "ChurnServeExceptions.h"

#include <fstream>

namespace CSVUtils {
namespace {
std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}
} // namespace

void skipBOM(std::istream& is) {
    if (!is.good()) return;

    const int first = is.peek();
    if (first == EOF || static_cast<unsigned char>(first) != 0xEF) {
        return;
    }

    is.get();
    const int second = is.peek();
    if (second == EOF || static_cast<unsigned char>(second) != 0xBB) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        return;
    }

    is.get();
    const int third = is.peek();
    if (third == EOF || static_cast<unsigned char>(third) != 0xBF) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        is.unget();
        return;
    }

    is.get();
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      size_t* consumedLines) {
    if (malformed) *malformed = false;
    if (consumedLines) *consumedLines = 0;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    char c;

    const auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        fieldQuoted = false;
    };

    while (is.get(c)) {
        if (c == '"') {
            if (!inQuotes && trimUnquotedField(val).empty()) {
                val.clear();
                inQuotes = true;
                fieldQuoted = true;
            } else if (inQuotes && is.peek() == '"') {
                is.get();
                val += '"';
            } else if (inQuotes) {
                inQuotes = false;
            } else {
                val += c;
            }
            continue;
        }
        if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (consumedLines) ++(*consumedLines);
            if (!inQuotes) break;
            val += '\n';
            continue;
        }
        if (c == delimiter && !inQuotes) {
            pushField();
            sawDelimiter = true;
            continue;
        }
        val += c;
    }

    if (inQuotes && malformed) *malformed = true;

    if (!sawDelimiter && !fieldQuoted && trimUnquotedField(val).empty()) {
        return {};
    }
    pushField();
    return row;
}

CsvTable readCsvFile(const std::string& path, char delimiter) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ChurnServe::IOException("Could not open CSV file: " + path);
    }
    skipBOM(in);

    CsvTable table;
    size_t line = 1;
    while (in.peek() != EOF) {
        bool malformed = false;
        size_t consumed = 0;
        const size_t startLine = line;
        std::vector<std::string> row = parseCSVLine(in, delimiter, &malformed, &consumed);
        line += consumed;
        if (malformed) {
            throw ChurnServe::DatasetException(path + ":" + std::to_string(startLine) + ": unterminated quoted field");
        }
        if (row.empty()) continue;

        if (table.header.empty()) {
            table.header = std::move(row);
            continue;
        }
        if (row.size() != table.header.size()) {
            throw ChurnServe::DatasetException(path + ":" + std::to_string(startLine) + ": expected " +
                                               std::to_string(table.header.size()) + " fields, found " +
                                               std::to_string(row.size()));
        }
        table.rows.push_back(std::move(row));
        table.rowLines.push_back(startLine);
    }

    if (table.header.empty()) {
        throw ChurnServe::DatasetException(path + ": missing header row");
    }
    return table;
}

std::string escapeCsvField(const std::string& value, char delimiter) {
    if (value.find_first_of(std::string("\"\r\n") + delimiter) == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}
} // namespace CSVUtils
