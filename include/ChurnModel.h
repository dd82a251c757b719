#pragma once

#include "SchemaStore.h"

#include <memory>
#include <string>
#include <vector>

/**
 * @brief Scoring backend: maps scaled feature rows to churn probabilities.
 */
class ChurnModel {
public:
    virtual ~ChurnModel() = default;

    /**
     * @pre every row has inputDimension() entries.
     * @return One probability per row, same order.
     * @throws ChurnServe::ModelException when a row cannot be evaluated.
     */
    virtual std::vector<double> predictProbabilities(const std::vector<std::vector<double>>& rows) const = 0;

    virtual size_t inputDimension() const noexcept = 0;

    // False when predictProbabilities mutates internal buffers and callers must serialize access.
    virtual bool supportsConcurrentInference() const noexcept = 0;

    virtual std::string formatName() const = 0;
};

enum class ModelFormat { XGBOOST_JSON, DENSE_BINARY };

/**
 * @throws ChurnServe::ConfigurationException for an unknown format name.
 */
ModelFormat parseModelFormat(const std::string& name);

/**
 * @brief Loads a model artifact and checks it against the schema it will be fed with.
 * @throws ChurnServe::ModelException when the artifact is unreadable or its input width does not match.
 */
std::unique_ptr<ChurnModel> loadChurnModel(const std::string& path, ModelFormat format, const SchemaStore& schema);
