#pragma once

#include "ChurnModel.h"
#include "JsonValue.h"

#include <string>
#include <vector>

/**
 * @brief Gradient-boosted binary classifier evaluated from an XGBoost JSON dump.
 * @details probability = sigmoid(logit(base_score) + sum of one leaf per tree). Read-only after load.
 */
class TreeEnsembleModel : public ChurnModel {
public:
    struct Node {
        int feature = -1; // -1 marks a leaf
        float threshold = 0.0f;
        int yes = -1;
        int no = -1;
        int missing = -1;
        double leafValue = 0.0;

        bool isLeaf() const noexcept { return feature < 0; }
    };
    using Tree = std::vector<Node>;

    /**
     * @pre Every child index is greater than its parent's index, which bounds traversal.
     * @throws ChurnServe::ModelException when a tree violates the layout or references a feature >= inputDimension.
     */
    TreeEnsembleModel(std::vector<Tree> trees, double baseScore, size_t inputDimension);

    /**
     * @brief Parses `booster.dump_model(..., dump_format="json")` output.
     * @details Accepts a bare array of trees or {"base_score": p, "trees": [...]}. Splits name either `fN` or a
     * feature column.
     */
    static TreeEnsembleModel fromJson(const JsonValue& root, const std::vector<std::string>& featureColumns);
    static TreeEnsembleModel loadFromFile(const std::string& path, const std::vector<std::string>& featureColumns);

    double margin(const std::vector<double>& row) const;

    std::vector<double> predictProbabilities(const std::vector<std::vector<double>>& rows) const override;
    size_t inputDimension() const noexcept override { return inputDimension_; }
    bool supportsConcurrentInference() const noexcept override { return true; }
    std::string formatName() const override { return "xgboost_json"; }

    size_t treeCount() const noexcept { return trees_.size(); }
    double baseScore() const noexcept { return baseScore_; }

private:
    std::vector<Tree> trees_;
    double baseScore_ = 0.5;
    double baseMargin_ = 0.0;
    size_t inputDimension_ = 0;
};
