#include "BatchScoring.h"

#include "CSVUtils.h"
#include "ChurnServeExceptions.h"
#include "CommonUtils.h"
#include "JsonValue.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

RecordBatch readRecordsCsv(const std::string& path, char delimiter, const std::string& idColumn) {
    const CSVUtils::CsvTable table = CSVUtils::readCsvFile(path, delimiter);

    int idIndex = -1;
    for (size_t c = 0; c < table.header.size(); ++c) {
        if (CommonUtils::iequals(table.header[c], idColumn)) {
            idIndex = static_cast<int>(c);
            break;
        }
    }

    RecordBatch batch;
    batch.records.reserve(table.rows.size());
    batch.recordIds.reserve(table.rows.size());
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        RawRecord record;
        record.reserve(row.size());
        for (size_t c = 0; c < row.size(); ++c) {
            record.emplace(table.header[c], RawValue{row[c]});
        }
        batch.records.push_back(std::move(record));
        batch.recordIds.push_back(idIndex >= 0 ? row[static_cast<size_t>(idIndex)] : std::to_string(r + 1));
    }
    return batch;
}

std::vector<RecordOutcome> scoreRecords(const ModelRecord& model, const std::vector<RawRecord>& records) {
    std::vector<RecordOutcome> outcomes;
    outcomes.reserve(records.size());
    if (records.empty()) return outcomes;

    const size_t maxRecords = model.pipeline.options().maxBatchRecords;
    const size_t chunkSize = maxRecords > 0 ? maxRecords : records.size();
    for (size_t start = 0; start < records.size(); start += chunkSize) {
        const size_t end = std::min(records.size(), start + chunkSize);
        std::vector<RawRecord> chunk(records.begin() + static_cast<std::ptrdiff_t>(start),
                                     records.begin() + static_cast<std::ptrdiff_t>(end));
        std::vector<size_t> positions(chunk.size());
        for (size_t i = 0; i < positions.size(); ++i) positions[i] = start + i;

        std::vector<RecordOutcome> scored = model.score(chunk, positions);
        std::move(scored.begin(), scored.end(), std::back_inserter(outcomes));
    }
    return outcomes;
}

ChurnSummary summarize(const std::vector<RecordOutcome>& outcomes, double threshold) {
    ChurnSummary summary;
    summary.threshold = threshold;
    summary.totalRecords = outcomes.size();
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) {
            ++summary.failedRecords;
            continue;
        }
        ++summary.scoredRecords;
        if (outcome.probability >= threshold) ++summary.predictedChurners;
    }
    if (summary.scoredRecords > 0) {
        summary.churnRatePercent =
            static_cast<double>(summary.predictedChurners) / static_cast<double>(summary.scoredRecords) * 100.0;
    }
    return summary;
}

std::string formatSummary(const ChurnSummary& summary) {
    if (summary.scoredRecords == 0) {
        return "No churn data available for summarization.";
    }
    std::ostringstream out;
    out << "Out of the latest " << summary.scoredRecords << " customer records, " << summary.predictedChurners
        << " customers are predicted to churn, resulting in a churn rate of " << std::fixed << std::setprecision(2)
        << summary.churnRatePercent << "%.";
    if (summary.failedRecords > 0) {
        out << " " << summary.failedRecords << " records could not be scored.";
    }
    return out.str();
}

void writeOutcomesCsv(const std::string& path,
                      const RecordBatch& batch,
                      const std::vector<RecordOutcome>& outcomes,
                      double threshold,
                      char delimiter) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw ChurnServe::IOException("Could not write results file: " + path);
    }

    const auto cell = [delimiter](const std::string& value) { return CSVUtils::escapeCsvField(value, delimiter); };
    out << "record_id" << delimiter << "status" << delimiter << "churn_probability" << delimiter << "churn"
        << delimiter << "error_code" << delimiter << "error_field" << delimiter << "error_message\n";
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const RecordOutcome& outcome = outcomes[i];
        const std::string id = i < batch.recordIds.size() ? batch.recordIds[i] : std::to_string(i + 1);
        out << cell(id) << delimiter;
        if (outcome.ok()) {
            out << "ok" << delimiter << formatJsonNumber(outcome.probability) << delimiter
                << (outcome.probability >= threshold ? "Yes" : "No") << delimiter << delimiter << delimiter << "\n";
        } else {
            out << "failed" << delimiter << delimiter << delimiter << cell(outcome.errorCode) << delimiter
                << cell(outcome.field) << delimiter << cell(outcome.message) << "\n";
        }
    }
    if (!out) {
        throw ChurnServe::IOException("Failed while writing results file: " + path);
    }
}
