#pragma once

#include "FieldCatalog.h"
#include "JsonValue.h"

#include <string>
#include <unordered_map>
#include <vector>

// (x - center) / spread, frozen at training time.
struct ScaleParams {
    double center = 0.0;
    double spread = 1.0;
};

/**
 * @brief Immutable bundle of everything the model was fit against.
 * @details Column order, per-column scaling, per-field imputation means and the field catalog.
 * Construction validates the bundle; a SchemaStore that exists is consistent.
 */
class SchemaStore {
public:
    static constexpr int kSchemaVersion = 1;

    /**
     * @pre scaleParams.size() == featureColumns.size().
     * @post Zero spreads are stored as 1 (constant training column).
     * @throws ChurnServe::SchemaLoadError when the bundle is inconsistent.
     */
    SchemaStore(std::vector<std::string> featureColumns,
                std::vector<ScaleParams> scaleParams,
                std::unordered_map<std::string, double> imputationMeans,
                FieldCatalog catalog,
                std::string modelId = "");

    /**
     * @throws ChurnServe::SchemaLoadError on missing keys, length mismatches or non-finite statistics.
     */
    static SchemaStore fromJson(const JsonValue& root);

    /**
     * @throws ChurnServe::SchemaLoadError when the file is unreadable or malformed.
     */
    static SchemaStore loadFromFile(const std::string& path);

    std::string toJson() const;
    void saveToFile(const std::string& path) const;

    const std::vector<std::string>& featureColumns() const noexcept { return featureColumns_; }
    const std::vector<ScaleParams>& scaleParams() const noexcept { return scaleParams_; }
    const std::unordered_map<std::string, double>& imputationMeans() const noexcept { return imputationMeans_; }
    const FieldCatalog& catalog() const noexcept { return catalog_; }
    const std::string& modelId() const noexcept { return modelId_; }
    size_t featureCount() const noexcept { return featureColumns_.size(); }

    // Index of the column in feature order, or -1 when the model has no such column.
    int columnIndex(const std::string& column) const;

    // Frozen training mean for a numeric field; validated to exist for every numeric field.
    double imputationMean(const std::string& field) const;

    /**
     * @brief Feature columns no catalog field can ever produce; they always encode as 0.
     */
    std::vector<std::string> unreachableColumns() const;

private:
    void validate() const;

    std::vector<std::string> featureColumns_;
    std::vector<ScaleParams> scaleParams_;
    std::unordered_map<std::string, double> imputationMeans_;
    FieldCatalog catalog_;
    std::string modelId_;
    std::unordered_map<std::string, size_t> columnIndex_;
};
