#include "SchemaBuilder.h"

#include "CSVUtils.h"
#include "ChurnServeExceptions.h"
#include "CommonUtils.h"
#include "EncodingPipeline.h"
#include "NumericCoercion.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <unordered_set>

namespace {
int findColumn(const std::vector<std::string>& header, const std::string& name) {
    for (size_t c = 0; c < header.size(); ++c) {
        if (header[c] == name) return static_cast<int>(c);
    }
    for (size_t c = 0; c < header.size(); ++c) {
        if (CommonUtils::iequals(header[c], name)) return static_cast<int>(c);
    }
    return -1;
}

std::vector<std::string> learnVocabulary(const FieldSpec& field,
                                         const std::vector<std::vector<std::string>>& rows,
                                         size_t column) {
    std::vector<std::string> vocabulary;
    std::unordered_set<std::string> seen;
    for (const auto& row : rows) {
        std::string value = CommonUtils::trim(row[column]);
        if (value.empty()) continue;
        for (const auto& synonym : field.synonyms) {
            if (CommonUtils::iequals(synonym.first, value)) {
                value = synonym.second;
                break;
            }
        }
        if (seen.insert(CommonUtils::toLower(value)).second) {
            vocabulary.push_back(value);
        }
    }
    std::sort(vocabulary.begin(), vocabulary.end());
    return vocabulary;
}
} // namespace

SchemaFitResult fitSchemaFromCsv(const std::string& csvPath, FieldCatalog catalog, const SchemaFitOptions& options) {
    const CSVUtils::CsvTable table = CSVUtils::readCsvFile(csvPath, options.delimiter);
    if (table.rows.empty()) {
        throw ChurnServe::DatasetException(csvPath + ": training file has no data rows");
    }

    std::vector<FieldSpec> fields = catalog.fields();
    std::unordered_map<std::string, double> means;
    for (auto& field : fields) {
        if (CommonUtils::iequals(field.name, options.targetColumn)) {
            throw ChurnServe::DatasetException("target column '" + options.targetColumn + "' cannot be a feature");
        }
        const int column = findColumn(table.header, field.name);
        if (column < 0) {
            throw ChurnServe::DatasetException(csvPath + ": training file has no column '" + field.name + "'");
        }
        const size_t c = static_cast<size_t>(column);

        if (field.kind == FieldKind::NUMERIC) {
            double sum = 0.0;
            size_t count = 0;
            for (const auto& row : table.rows) {
                if (const auto value = coerceNumeric(RawValue{row[c]})) {
                    sum += *value;
                    ++count;
                }
            }
            if (count == 0) {
                throw ChurnServe::DatasetException("numeric field '" + field.name + "' has no parseable values");
            }
            means[field.name] = sum / static_cast<double>(count);
        } else if (field.vocabulary.empty()) {
            field.vocabulary = learnVocabulary(field, table.rows, c);
        }
    }
    catalog = FieldCatalog(std::move(fields));
    catalog.validate();

    const std::vector<std::string> columns = catalog.encodedColumns();
    auto identity = std::make_shared<const SchemaStore>(
        columns, std::vector<ScaleParams>(columns.size()), means, catalog, options.modelId);
    const EncodingPipeline pipeline(identity);

    std::vector<std::vector<double>> encoded;
    encoded.reserve(table.rows.size());
    size_t skipped = 0;
    for (size_t r = 0; r < table.rows.size(); ++r) {
        RawRecord record;
        for (size_t c = 0; c < table.header.size(); ++c) {
            record.emplace(table.header[c], RawValue{table.rows[r][c]});
        }
        try {
            encoded.push_back(pipeline.encode(record, r).features);
        } catch (const ChurnServe::RecordError& e) {
            ++skipped;
            std::cerr << "[ChurnServe] fit_schema_skip line=" << table.rowLines[r] << " reason=\"" << e.what() << "\"\n";
        }
    }
    if (encoded.empty()) {
        throw ChurnServe::DatasetException(csvPath + ": no training row could be encoded");
    }

    std::vector<ScaleParams> scale(columns.size());
    const double n = static_cast<double>(encoded.size());
    for (size_t j = 0; j < columns.size(); ++j) {
        double sum = 0.0;
        for (const auto& row : encoded) sum += row[j];
        const double mean = sum / n;
        double sq = 0.0;
        for (const auto& row : encoded) {
            const double d = row[j] - mean;
            sq += d * d;
        }
        scale[j].center = mean;
        scale[j].spread = std::sqrt(sq / n);
    }

    return SchemaFitResult{SchemaStore(columns, std::move(scale), std::move(means), std::move(catalog), options.modelId),
                           encoded.size(),
                           skipped};
}
