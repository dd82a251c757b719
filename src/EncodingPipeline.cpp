#include "EncodingPipeline.h"

#include "ChurnServeExceptions.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
const SchemaStore& requireSchema(const std::shared_ptr<const SchemaStore>& schema) {
    if (!schema) {
        throw ChurnServe::SchemaLoadError("encoding pipeline requires a loaded schema");
    }
    return *schema;
}
} // namespace

EncodingPipeline::EncodingPipeline(std::shared_ptr<const SchemaStore> schema, PipelineOptions options)
    : schema_(std::move(schema)),
      options_(options),
      normalizer_(requireSchema(schema_).catalog(), options_.unknownCategoryPolicy),
      imputer_(*schema_),
      encoder_(*schema_) {}

EncodedRecord EncodingPipeline::encode(const RawRecord& record, size_t recordIndex) const {
    NormalizedRecord normalized;
    normalized.reset(schema_->catalog().fields().size());
    normalizer_.normalize(record, recordIndex, normalized);
    imputer_.coerce(record, recordIndex, normalized);

    EncodedRecord out;
    out.imputedFields = static_cast<size_t>(
        std::count(normalized.imputed.begin(), normalized.imputed.end(), static_cast<uint8_t>(1)));
    out.features = encoder_.encode(normalized, &out.reconcile);
    return out;
}

std::vector<RecordOutcome> EncodingPipeline::scoreBatch(const std::vector<RawRecord>& batch,
                                                        const ChurnModel& model,
                                                        std::mutex* inferenceMutex) const {
    std::vector<size_t> positions(batch.size());
    for (size_t i = 0; i < positions.size(); ++i) positions[i] = i;
    return scoreBatch(batch, positions, model, inferenceMutex);
}

std::vector<RecordOutcome> EncodingPipeline::scoreBatch(const std::vector<RawRecord>& batch,
                                                        const std::vector<size_t>& recordPositions,
                                                        const ChurnModel& model,
                                                        std::mutex* inferenceMutex) const {
    if (!model.supportsConcurrentInference() && inferenceMutex == nullptr) {
        throw ChurnServe::ScoringError("model '" + model.formatName() +
                                       "' is not safe for concurrent inference and needs an inference mutex");
    }
    if (batch.empty()) {
        throw ChurnServe::RequestException("batch contains no records");
    }
    if (options_.maxBatchRecords > 0 && batch.size() > options_.maxBatchRecords) {
        throw ChurnServe::RequestException("batch of " + std::to_string(batch.size()) +
                                           " records exceeds max_batch_records=" +
                                           std::to_string(options_.maxBatchRecords));
    }
    if (recordPositions.size() != batch.size()) {
        throw ChurnServe::RequestException("record positions do not match the batch size");
    }

    std::vector<RecordOutcome> outcomes(batch.size());
    std::vector<std::vector<double>> features(batch.size());
    std::vector<std::exception_ptr> unexpected(batch.size());

    const long long count = static_cast<long long>(batch.size());
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long long i = 0; i < count; ++i) {
        const size_t idx = static_cast<size_t>(i);
        RecordOutcome& outcome = outcomes[idx];
        try {
            EncodedRecord encoded = encode(batch[idx], recordPositions[idx]);
            features[idx] = std::move(encoded.features);
            outcome.status = RecordStatus::OK;
            outcome.imputedFields = encoded.imputedFields;
        } catch (const ChurnServe::RecordError& e) {
            outcome.status = RecordStatus::FAILED;
            outcome.errorCode = e.code();
            outcome.field = e.field();
            outcome.message = e.what();
        } catch (const std::exception&) {
            unexpected[idx] = std::current_exception();
        }
    }
    for (const auto& error : unexpected) {
        if (error) std::rethrow_exception(error);
    }

    std::vector<size_t> scoredSlots;
    std::vector<std::vector<double>> rows;
    scoredSlots.reserve(batch.size());
    rows.reserve(batch.size());
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (!outcomes[i].ok()) continue;
        scoredSlots.push_back(i);
        rows.push_back(std::move(features[i]));
    }
    if (rows.empty()) return outcomes;

    std::vector<double> probabilities;
    {
        std::unique_lock<std::mutex> guard;
        if (!model.supportsConcurrentInference()) {
            guard = std::unique_lock<std::mutex>(*inferenceMutex);
        }
        try {
            probabilities = model.predictProbabilities(rows);
        } catch (const std::exception& e) {
            throw ChurnServe::ScoringError(std::string("model '") + model.formatName() + "' failed: " + e.what());
        }
    }

    if (probabilities.size() != rows.size()) {
        throw ChurnServe::ScoringError("model returned " + std::to_string(probabilities.size()) +
                                       " probabilities for " + std::to_string(rows.size()) + " rows");
    }
    for (size_t k = 0; k < scoredSlots.size(); ++k) {
        const double p = probabilities[k];
        if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
            throw ChurnServe::ScoringError("model returned an invalid probability for record " +
                                           std::to_string(recordPositions[scoredSlots[k]]));
        }
        outcomes[scoredSlots[k]].probability = p;
    }
    return outcomes;
}
