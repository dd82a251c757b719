#include "DenseNetModel.h"

#include "ChurnServeExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <utility>

namespace {
constexpr char kSignature[] = "CHURN_NET_V1";
constexpr uint32_t kModelFormatVersion = 1;
constexpr uint64_t kChecksumOffsetBasis = 1469598103934665603ULL;
constexpr uint64_t kChecksumPrime = 1099511628211ULL;
constexpr uint64_t kMaxLayers = 64;
constexpr uint64_t kMaxLayerWidth = 1000000ULL;
constexpr uint64_t kMaxTrainableParams = 100000000ULL;

bool isLittleEndian() {
    uint16_t number = 0x1;
    const auto* bytes = reinterpret_cast<const char*>(&number);
    return bytes[0] == 1;
}

template <typename T>
void swapEndian(T& val) {
    auto* first = reinterpret_cast<unsigned char*>(&val);
    std::reverse(first, first + sizeof(T));
}

template <typename T>
void updateChecksum(uint64_t& checksum, const T& value) {
    T copy = value;
    if (!isLittleEndian()) swapEndian(copy);
    const auto* bytes = reinterpret_cast<const unsigned char*>(&copy);
    for (size_t i = 0; i < sizeof(T); ++i) {
        checksum ^= static_cast<uint64_t>(bytes[i]);
        checksum *= kChecksumPrime;
    }
}

template <typename T>
void writeLE(std::ostream& out, T value, uint64_t& checksum) {
    updateChecksum(checksum, value);
    if (!isLittleEndian()) swapEndian(value);
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    if (!out) throw ChurnServe::IOException("Binary write failed");
}

template <typename T>
void readLE(std::istream& in, T& value, const std::string& filename) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!in) throw ChurnServe::ModelException("Truncated model file: " + filename);
    if (!isLittleEndian()) swapEndian(value);
}

double activate(double x, NeuralActivation activation) {
    switch (activation) {
        case NeuralActivation::RELU: return std::max(0.0, x);
        case NeuralActivation::GELU: {
            constexpr double kInvSqrtPi = 0.7978845608028654; // sqrt(2/pi)
            const double inner = kInvSqrtPi * (x + 0.044715 * x * x * x);
            return 0.5 * x * (1.0 + std::tanh(inner));
        }
        case NeuralActivation::TANH: return std::tanh(x);
        case NeuralActivation::SIGMOID: {
            const double clipped = std::clamp(x, -60.0, 60.0);
            return 1.0 / (1.0 + std::exp(-clipped));
        }
        case NeuralActivation::LINEAR: return x;
    }
    return x;
}

bool isKnownActivation(int32_t code) {
    return code >= static_cast<int32_t>(NeuralActivation::SIGMOID) && code <= static_cast<int32_t>(NeuralActivation::GELU);
}
} // namespace

DenseNetModel::DenseNetModel(std::vector<Layer> layers) : layers_(std::move(layers)) {
    if (layers_.empty()) {
        throw ChurnServe::ModelException("dense network has no layers");
    }

    size_t widest = 0;
    for (size_t l = 0; l < layers_.size(); ++l) {
        const Layer& layer = layers_[l];
        const std::string label = "layer " + std::to_string(l);
        if (layer.inputs == 0 || layer.outputs == 0) {
            throw ChurnServe::ModelException(label + " has zero width");
        }
        if (l > 0 && layer.inputs != layers_[l - 1].outputs) {
            throw ChurnServe::ModelException(label + " expects " + std::to_string(layer.inputs) +
                                             " inputs but the previous layer emits " +
                                             std::to_string(layers_[l - 1].outputs));
        }
        if (layer.weights.size() != layer.inputs * layer.outputs || layer.biases.size() != layer.outputs) {
            throw ChurnServe::ModelException(label + " parameter count does not match its shape");
        }
        for (double w : layer.weights) {
            if (!std::isfinite(w)) throw ChurnServe::ModelException(label + " has non-finite weights");
        }
        for (double b : layer.biases) {
            if (!std::isfinite(b)) throw ChurnServe::ModelException(label + " has non-finite biases");
        }
        widest = std::max({widest, layer.inputs, layer.outputs});
    }

    const Layer& output = layers_.back();
    if (output.outputs != 1 || output.activation != NeuralActivation::SIGMOID) {
        throw ChurnServe::ModelException("output layer must be a single sigmoid unit");
    }

    activations_.reserve(widest);
    nextActivations_.reserve(widest);
}

double DenseNetModel::forward(const std::vector<double>& input) const {
    if (input.size() != inputDimension()) {
        throw ChurnServe::ModelException("row has " + std::to_string(input.size()) + " features, model expects " +
                                         std::to_string(inputDimension()));
    }

    activations_.assign(input.begin(), input.end());
    for (const Layer& layer : layers_) {
        nextActivations_.assign(layer.outputs, 0.0);
        for (size_t n = 0; n < layer.outputs; ++n) {
            double sum = layer.biases[n];
            const size_t weightOffset = n * layer.inputs;
            for (size_t pn = 0; pn < layer.inputs; ++pn) {
                sum += activations_[pn] * layer.weights[weightOffset + pn];
            }
            nextActivations_[n] = activate(sum, layer.activation);
        }
        activations_.swap(nextActivations_);
    }
    return activations_.front();
}

std::vector<double> DenseNetModel::predictProbabilities(const std::vector<std::vector<double>>& rows) const {
    std::vector<double> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(forward(row));
    }
    return out;
}

void DenseNetModel::saveBinary(const std::string& filename) const {
    std::ofstream out(filename, std::ios::binary);
    if (!out) throw ChurnServe::IOException("Could not open " + filename + " for writing");

    out.write(kSignature, sizeof(kSignature));

    uint64_t checksum = kChecksumOffsetBasis;
    writeLE(out, kModelFormatVersion, checksum);
    writeLE(out, static_cast<uint64_t>(layers_.size()), checksum);
    for (const Layer& layer : layers_) {
        writeLE(out, static_cast<uint64_t>(layer.inputs), checksum);
        writeLE(out, static_cast<uint64_t>(layer.outputs), checksum);
        writeLE(out, static_cast<int32_t>(layer.activation), checksum);
    }
    for (const Layer& layer : layers_) {
        for (double b : layer.biases) writeLE(out, b, checksum);
        for (double w : layer.weights) writeLE(out, w, checksum);
    }

    uint64_t unused = 0;
    writeLE(out, checksum, unused);
}

DenseNetModel DenseNetModel::loadBinary(const std::string& filename) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) throw ChurnServe::IOException("Could not open " + filename + " for reading");

    char signature[sizeof(kSignature)] = {};
    in.read(signature, sizeof(signature));
    if (!in) throw ChurnServe::ModelException("Failed to read model signature from " + filename);
    if (!std::equal(signature, signature + sizeof(signature), kSignature)) {
        throw ChurnServe::ModelException("Unsupported or invalid binary model signature in " + filename);
    }

    uint64_t checksum = kChecksumOffsetBasis;
    uint32_t version = 0;
    readLE(in, version, filename);
    updateChecksum(checksum, version);
    if (version != kModelFormatVersion) {
        throw ChurnServe::ModelException("Unsupported model version in file: " + filename);
    }

    uint64_t layerCount = 0;
    readLE(in, layerCount, filename);
    updateChecksum(checksum, layerCount);
    if (layerCount == 0 || layerCount > kMaxLayers) {
        throw ChurnServe::ModelException("Invalid layer count in model file: " + filename);
    }

    std::vector<Layer> layers(static_cast<size_t>(layerCount));
    uint64_t paramCount = 0;
    for (Layer& layer : layers) {
        uint64_t inputs = 0;
        uint64_t outputs = 0;
        int32_t activation = 0;
        readLE(in, inputs, filename);
        readLE(in, outputs, filename);
        readLE(in, activation, filename);
        updateChecksum(checksum, inputs);
        updateChecksum(checksum, outputs);
        updateChecksum(checksum, activation);

        if (inputs == 0 || outputs == 0 || inputs > kMaxLayerWidth || outputs > kMaxLayerWidth) {
            throw ChurnServe::ModelException("Invalid layer width in model file: " + filename);
        }
        if (!isKnownActivation(activation)) {
            throw ChurnServe::ModelException("Unknown activation code in model file: " + filename);
        }
        paramCount += inputs * outputs + outputs;
        if (paramCount > kMaxTrainableParams) {
            throw ChurnServe::ModelException("Model exceeds parameter limit: " + filename);
        }

        layer.inputs = static_cast<size_t>(inputs);
        layer.outputs = static_cast<size_t>(outputs);
        layer.activation = static_cast<NeuralActivation>(activation);
    }

    for (Layer& layer : layers) {
        layer.biases.resize(layer.outputs);
        layer.weights.resize(layer.inputs * layer.outputs);
        for (double& b : layer.biases) {
            readLE(in, b, filename);
            updateChecksum(checksum, b);
        }
        for (double& w : layer.weights) {
            readLE(in, w, filename);
            updateChecksum(checksum, w);
        }
    }

    uint64_t storedChecksum = 0;
    readLE(in, storedChecksum, filename);
    if (storedChecksum != checksum) {
        throw ChurnServe::ModelException("Model checksum mismatch (corrupt file): " + filename);
    }

    return DenseNetModel(std::move(layers));
}
