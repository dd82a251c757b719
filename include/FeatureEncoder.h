#pragma once

#include "CategoricalNormalizer.h"
#include "SchemaStore.h"

#include <string>
#include <utility>
#include <vector>

// Named columns produced for one record, before reconciliation.
using EncodedColumns = std::vector<std::pair<std::string, double>>;

struct ReconcileReport {
    size_t filledColumns = 0;
    size_t droppedColumns = 0;
};

/**
 * @brief Indicator expansion, schema reconciliation and frozen scaling for one normalized record.
 */
class FeatureEncoder {
public:
    /**
     * @pre schema outlives the encoder.
     */
    explicit FeatureEncoder(const SchemaStore& schema);

    /**
     * @brief Expands a normalized record into named columns.
     * @details Numeric and binary fields yield one column each. Categorical fields yield one 0/1 column per
     * non-reference vocabulary value, so the produced column set never depends on other records.
     */
    EncodedColumns expand(const NormalizedRecord& record) const;

    /**
     * @brief Forces produced columns into the schema's exact column set and order.
     * @post result.size() == schema.featureCount(); absent columns are 0.0, unknown columns are dropped.
     */
    std::vector<double> reconcile(const EncodedColumns& columns, ReconcileReport* report = nullptr) const;

    void scaleInPlace(std::vector<double>& vector) const;

    // expand -> reconcile -> scale
    std::vector<double> encode(const NormalizedRecord& record, ReconcileReport* report = nullptr) const;

private:
    struct Indicator {
        std::string value;
        std::string column;
    };

    const SchemaStore& schema_;
    // Per catalog field; empty for numeric and binary fields.
    std::vector<std::vector<Indicator>> indicators_;
};
