#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// RFC4180-style tokenization of customer record files; values stay text.
struct CsvTable {
	std::vector<std::string> header;
	std::vector<std::vector<std::string>> rows;
	// 1-based physical line where each row starts, for error messages.
	std::vector<size_t> rowLines;
};

void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record; quoted fields may span lines.
 * @return Empty vector for a blank line or end of input.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
									  char delimiter,
									  bool* malformed = nullptr,
									  size_t* consumedLines = nullptr);

/**
 * @throws ChurnServe::IOException when the file cannot be opened.
 * @throws ChurnServe::DatasetException on a missing header, unterminated quote or ragged row.
 */
CsvTable readCsvFile(const std::string& path, char delimiter);

// Quotes the value when it contains the delimiter, a quote or a line break.
std::string escapeCsvField(const std::string& value, char delimiter);
}
