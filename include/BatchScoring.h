#pragma once

#include "EncodingPipeline.h"
#include "PredictionService.h"
#include "RawRecord.h"

#include <string>
#include <vector>

struct RecordBatch {
    std::vector<RawRecord> records;
    // customerID when the file has one, otherwise the 1-based data row number.
    std::vector<std::string> recordIds;
};

struct ChurnSummary {
    size_t totalRecords = 0;
    size_t scoredRecords = 0;
    size_t failedRecords = 0;
    size_t predictedChurners = 0;
    double churnRatePercent = 0.0;
    double threshold = 0.5;
};

/**
 * @brief Reads customer records from CSV; every cell is kept as text for the normalizer.
 * @throws ChurnServe::IOException / ChurnServe::DatasetException from the CSV reader.
 */
RecordBatch readRecordsCsv(const std::string& path, char delimiter, const std::string& idColumn = "customerID");

/**
 * @brief Scores any number of records through a model, in chunks of its max_batch_records.
 * @post Result is aligned with records; failure messages use positions within the whole file.
 */
std::vector<RecordOutcome> scoreRecords(const ModelRecord& model, const std::vector<RawRecord>& records);

// A record churns when its probability is >= threshold; failed records are not counted as customers.
ChurnSummary summarize(const std::vector<RecordOutcome>& outcomes, double threshold);

std::string formatSummary(const ChurnSummary& summary);

/**
 * @throws ChurnServe::IOException when the file cannot be written.
 */
void writeOutcomesCsv(const std::string& path,
                      const RecordBatch& batch,
                      const std::vector<RecordOutcome>& outcomes,
                      double threshold,
                      char delimiter);
