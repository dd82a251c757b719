#pragma once

#include "ChurnModel.h"

#include <cstdint>
#include <string>
#include <vector>

enum class NeuralActivation { SIGMOID, RELU, TANH, LINEAR, GELU };

/**
 * @brief Feed-forward network scored from a checksummed binary artifact.
 * @details The forward pass reuses member activation buffers, so concurrent calls must be serialized.
 */
class DenseNetModel : public ChurnModel {
public:
    struct Layer {
        size_t inputs = 0;
        size_t outputs = 0;
        NeuralActivation activation = NeuralActivation::RELU;
        std::vector<double> weights; // outputs x inputs, one row per output unit
        std::vector<double> biases;
    };

    /**
     * @pre Layer widths chain; the last layer is a single sigmoid unit.
     * @throws ChurnServe::ModelException when the topology is inconsistent.
     */
    explicit DenseNetModel(std::vector<Layer> layers);

    /**
     * @brief Loads a `CHURN_NET_V1` artifact.
     * @throws ChurnServe::IOException when the file cannot be opened.
     * @throws ChurnServe::ModelException on bad signature, version, topology or checksum.
     */
    static DenseNetModel loadBinary(const std::string& filename);

    void saveBinary(const std::string& filename) const;

    std::vector<double> predictProbabilities(const std::vector<std::vector<double>>& rows) const override;
    size_t inputDimension() const noexcept override { return layers_.front().inputs; }
    bool supportsConcurrentInference() const noexcept override { return false; }
    std::string formatName() const override { return "dense_binary"; }

    const std::vector<Layer>& layers() const noexcept { return layers_; }

private:
    double forward(const std::vector<double>& input) const;

    std::vector<Layer> layers_;
    mutable std::vector<double> activations_;
    mutable std::vector<double> nextActivations_;
};
