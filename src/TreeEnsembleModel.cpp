#include "TreeEnsembleModel.h"

#include "ChurnServeExceptions.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <map>

namespace {
constexpr size_t kMaxTreeDepth = 512;

double sigmoid(double margin) {
    const double clipped = std::clamp(margin, -60.0, 60.0);
    return 1.0 / (1.0 + std::exp(-clipped));
}

int requireNodeId(const JsonValue& node, const char* key, const std::string& label) {
    const JsonValue* value = node.find(key);
    if (value == nullptr || !value->isNumber() || value->numberValue < 0.0 ||
        value->numberValue != std::floor(value->numberValue)) {
        throw ChurnServe::ModelException(label + " requires a non-negative integer '" + key + "'");
    }
    if (value->numberValue > static_cast<double>(std::numeric_limits<int>::max())) {
        throw ChurnServe::ModelException(label + " has an out-of-range '" + key + "'");
    }
    return static_cast<int>(value->numberValue);
}

int resolveFeature(const std::string& split, const std::vector<std::string>& featureColumns, const std::string& label) {
    auto named = std::find(featureColumns.begin(), featureColumns.end(), split);
    if (named != featureColumns.end()) {
        return static_cast<int>(named - featureColumns.begin());
    }

    const bool positional = split.size() > 1 && split[0] == 'f' &&
                            std::all_of(split.begin() + 1, split.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (positional && split.size() < 10) {
        return std::stoi(split.substr(1));
    }
    throw ChurnServe::ModelException(label + " splits on unknown feature '" + split + "'");
}

void collectNodes(const JsonValue& node,
                  std::map<int, const JsonValue*>& byId,
                  size_t depth,
                  const std::string& label) {
    if (!node.isObject()) {
        throw ChurnServe::ModelException(label + " contains a non-object node");
    }
    if (depth > kMaxTreeDepth) {
        throw ChurnServe::ModelException(label + " exceeds the maximum tree depth");
    }
    const int id = requireNodeId(node, "nodeid", label);
    if (!byId.emplace(id, &node).second) {
        throw ChurnServe::ModelException(label + " repeats nodeid " + std::to_string(id));
    }
    if (const JsonValue* children = node.find("children"); children != nullptr) {
        if (!children->isArray()) {
            throw ChurnServe::ModelException(label + " has a non-array 'children'");
        }
        for (const auto& child : children->arrayValue) {
            collectNodes(child, byId, depth + 1, label);
        }
    }
}

TreeEnsembleModel::Tree parseTree(const JsonValue& root, const std::vector<std::string>& featureColumns, const std::string& label) {
    std::map<int, const JsonValue*> byId;
    collectNodes(root, byId, 0, label);

    // Dense indices keep nodeid order, so children stay after their parents.
    std::map<int, int> denseIndex;
    for (const auto& kv : byId) {
        denseIndex.emplace(kv.first, static_cast<int>(denseIndex.size()));
    }
    auto translate = [&](int nodeId) {
        auto it = denseIndex.find(nodeId);
        if (it == denseIndex.end()) {
            throw ChurnServe::ModelException(label + " references missing nodeid " + std::to_string(nodeId));
        }
        return it->second;
    };

    TreeEnsembleModel::Tree tree;
    tree.reserve(byId.size());
    for (const auto& kv : byId) {
        const JsonValue& json = *kv.second;
        TreeEnsembleModel::Node node;

        if (const JsonValue* leaf = json.find("leaf"); leaf != nullptr) {
            if (!leaf->isNumber() || !std::isfinite(leaf->numberValue)) {
                throw ChurnServe::ModelException(label + " has a non-numeric leaf at nodeid " + std::to_string(kv.first));
            }
            node.leafValue = leaf->numberValue;
            tree.push_back(node);
            continue;
        }

        const JsonValue* split = json.find("split");
        const JsonValue* condition = json.find("split_condition");
        if (split == nullptr || !split->isString() || condition == nullptr || !condition->isNumber()) {
            throw ChurnServe::ModelException(label + " nodeid " + std::to_string(kv.first) +
                                             " needs 'split' and 'split_condition' or a 'leaf'");
        }
        node.feature = resolveFeature(split->stringValue, featureColumns, label);
        node.threshold = static_cast<float>(condition->numberValue);
        node.yes = translate(requireNodeId(json, "yes", label));
        node.no = translate(requireNodeId(json, "no", label));
        node.missing = json.find("missing") != nullptr ? translate(requireNodeId(json, "missing", label)) : node.yes;
        tree.push_back(node);
    }
    return tree;
}
} // namespace

TreeEnsembleModel::TreeEnsembleModel(std::vector<Tree> trees, double baseScore, size_t inputDimension)
    : trees_(std::move(trees)), baseScore_(baseScore), inputDimension_(inputDimension) {
    if (trees_.empty()) {
        throw ChurnServe::ModelException("tree ensemble has no trees");
    }
    if (!(baseScore_ > 0.0 && baseScore_ < 1.0)) {
        throw ChurnServe::ModelException("base_score must lie strictly between 0 and 1");
    }
    baseMargin_ = std::log(baseScore_ / (1.0 - baseScore_));

    for (size_t t = 0; t < trees_.size(); ++t) {
        const Tree& tree = trees_[t];
        if (tree.empty()) {
            throw ChurnServe::ModelException("tree " + std::to_string(t) + " is empty");
        }
        const int size = static_cast<int>(tree.size());
        for (int i = 0; i < size; ++i) {
            const Node& node = tree[static_cast<size_t>(i)];
            if (node.isLeaf()) continue;
            if (static_cast<size_t>(node.feature) >= inputDimension_) {
                throw ChurnServe::ModelException("tree " + std::to_string(t) + " splits on feature " +
                                                 std::to_string(node.feature) + " beyond input width " +
                                                 std::to_string(inputDimension_));
            }
            for (int child : {node.yes, node.no, node.missing}) {
                if (child <= i || child >= size) {
                    throw ChurnServe::ModelException("tree " + std::to_string(t) + " has an invalid child link at node " +
                                                     std::to_string(i));
                }
            }
        }
    }
}

TreeEnsembleModel TreeEnsembleModel::fromJson(const JsonValue& root, const std::vector<std::string>& featureColumns) {
    const JsonValue* treesNode = &root;
    double baseScore = 0.5;
    if (root.isObject()) {
        treesNode = root.find("trees");
        if (treesNode == nullptr) {
            throw ChurnServe::ModelException("tree ensemble object requires a 'trees' array");
        }
        if (const JsonValue* base = root.find("base_score"); base != nullptr) {
            if (!base->isNumber()) {
                throw ChurnServe::ModelException("base_score must be a number");
            }
            baseScore = base->numberValue;
        }
    }
    if (!treesNode->isArray()) {
        throw ChurnServe::ModelException("tree ensemble must be an array of trees");
    }

    std::vector<Tree> trees;
    trees.reserve(treesNode->arrayValue.size());
    for (size_t i = 0; i < treesNode->arrayValue.size(); ++i) {
        trees.push_back(parseTree(treesNode->arrayValue[i], featureColumns, "tree " + std::to_string(i)));
    }
    return TreeEnsembleModel(std::move(trees), baseScore, featureColumns.size());
}

TreeEnsembleModel TreeEnsembleModel::loadFromFile(const std::string& path, const std::vector<std::string>& featureColumns) {
    try {
        return fromJson(parseJsonFile(path), featureColumns);
    } catch (const ChurnServe::ModelException& e) {
        throw ChurnServe::ModelException(path + ": " + e.what());
    } catch (const ChurnServe::ChurnServeException& e) {
        throw ChurnServe::ModelException(e.what());
    }
}

double TreeEnsembleModel::margin(const std::vector<double>& row) const {
    if (row.size() != inputDimension_) {
        throw ChurnServe::ModelException("row has " + std::to_string(row.size()) + " features, model expects " +
                                         std::to_string(inputDimension_));
    }

    double sum = baseMargin_;
    for (const Tree& tree : trees_) {
        size_t idx = 0;
        while (!tree[idx].isLeaf()) {
            const Node& node = tree[idx];
            const double x = row[static_cast<size_t>(node.feature)];
            int next = 0;
            if (std::isnan(x)) {
                next = node.missing;
            } else {
                next = static_cast<float>(x) < node.threshold ? node.yes : node.no;
            }
            idx = static_cast<size_t>(next);
        }
        sum += tree[idx].leafValue;
    }
    return sum;
}

std::vector<double> TreeEnsembleModel::predictProbabilities(const std::vector<std::vector<double>>& rows) const {
    std::vector<double> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(sigmoid(margin(row)));
    }
    return out;
}
