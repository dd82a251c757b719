#pragma once

#include "CategoricalNormalizer.h"
#include "ChurnModel.h"
#include "FeatureEncoder.h"
#include "NumericCoercion.h"
#include "RawRecord.h"
#include "SchemaStore.h"

#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class RecordStatus { OK, FAILED };

/**
 * @brief Result slot for one input record; slot i always belongs to input record i.
 */
struct RecordOutcome {
    RecordStatus status = RecordStatus::FAILED;
    double probability = std::numeric_limits<double>::quiet_NaN();
    std::string errorCode;
    std::string field;
    std::string message;
    size_t imputedFields = 0;

    bool ok() const noexcept { return status == RecordStatus::OK; }
};

struct PipelineOptions {
    UnknownCategoryPolicy unknownCategoryPolicy = UnknownCategoryPolicy::REJECT;
    // 0 disables the cap.
    size_t maxBatchRecords = 1000;
};

struct EncodedRecord {
    std::vector<double> features;
    size_t imputedFields = 0;
    ReconcileReport reconcile;
};

/**
 * @brief Raw records -> scaled, schema-ordered feature rows -> per-record churn probabilities.
 * @details Stateless apart from the shared read-only schema, so one instance serves concurrent requests.
 */
class EncodingPipeline {
public:
    /**
     * @throws ChurnServe::SchemaLoadError when schema is null.
     */
    explicit EncodingPipeline(std::shared_ptr<const SchemaStore> schema, PipelineOptions options = {});

    /**
     * @brief Normalizes, coerces, expands, reconciles and scales one record.
     * @post result.features.size() == schema().featureCount().
     * @throws ChurnServe::RecordError subclasses for data problems in this record.
     */
    EncodedRecord encode(const RawRecord& record, size_t recordIndex) const;

    /**
     * @brief Scores a batch with partial-failure semantics.
     * @details Records failing normalization or coercion keep a FAILED slot and are not sent to the model.
     * When the model does not support concurrent inference, inferenceMutex is held while scoring.
     * @return outcomes.size() == batch.size(), aligned by position.
     * @throws ChurnServe::RequestException for an empty or oversized batch.
     * @throws ChurnServe::ScoringError when the model fails or returns an invalid probability, or when a model
     * without concurrent inference support is passed without an inferenceMutex.
     */
    std::vector<RecordOutcome> scoreBatch(const std::vector<RawRecord>& batch,
                                          const ChurnModel& model,
                                          std::mutex* inferenceMutex = nullptr) const;

    /**
     * @brief As above, with errors naming recordPositions[i] instead of i (batch is a subset of a larger request).
     * @pre recordPositions.size() == batch.size().
     */
    std::vector<RecordOutcome> scoreBatch(const std::vector<RawRecord>& batch,
                                          const std::vector<size_t>& recordPositions,
                                          const ChurnModel& model,
                                          std::mutex* inferenceMutex = nullptr) const;

    const SchemaStore& schema() const noexcept { return *schema_; }
    const PipelineOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<const SchemaStore> schema_;
    PipelineOptions options_;
    CategoricalNormalizer normalizer_;
    NumericImputer imputer_;
    FeatureEncoder encoder_;
};
