#pragma once

#include "FieldCatalog.h"
#include "SchemaStore.h"

#include <string>

struct SchemaFitOptions {
    char delimiter = ',';
    std::string modelId;
    std::string targetColumn = "Churn";
};

struct SchemaFitResult {
    SchemaStore schema;
    size_t rowsUsed = 0;
    size_t rowsSkipped = 0;
};

/**
 * @brief Freezes a SchemaStore from a training CSV.
 * @details Categorical fields with an empty vocabulary learn it from the data. Numeric means are taken over
 * parseable values. Rows are encoded with the catalog's column order and standard-scaler statistics
 * (population standard deviation) are fit per column. Rows that fail normalization are skipped.
 * @throws ChurnServe::DatasetException when a catalog field has no column, a numeric field has no
 * parseable value, or no row can be encoded.
 */
SchemaFitResult fitSchemaFromCsv(const std::string& csvPath, FieldCatalog catalog, const SchemaFitOptions& options);
