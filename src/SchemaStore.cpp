#include "SchemaStore.h"

#include "ChurnServeExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace {
constexpr double kZeroSpreadEpsilon = 1e-12;

double requireFiniteNumber(const JsonValue& node, const std::string& label) {
    if (!node.isNumber() || !std::isfinite(node.numberValue)) {
        throw ChurnServe::SchemaLoadError(label + " must be a finite number");
    }
    return node.numberValue;
}

void writeStringArray(std::ostringstream& out, const std::vector<std::string>& values) {
    out << '[';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ", ";
        out << '"' << escapeJsonString(values[i]) << '"';
    }
    out << ']';
}

void writeFieldSpec(std::ostringstream& out, const FieldSpec& field) {
    out << "    {\"name\": \"" << escapeJsonString(field.name) << "\", \"kind\": \"" << fieldKindName(field.kind) << '"';
    if (field.kind != FieldKind::NUMERIC) {
        out << ", \"vocabulary\": ";
        writeStringArray(out, field.vocabulary);
    }
    if (!field.reference.empty()) {
        out << ", \"reference\": \"" << escapeJsonString(field.reference) << '"';
    }
    if (!field.synonyms.empty()) {
        out << ", \"synonyms\": {";
        for (size_t i = 0; i < field.synonyms.size(); ++i) {
            if (i > 0) out << ", ";
            out << '"' << escapeJsonString(field.synonyms[i].first) << "\": \""
                << escapeJsonString(field.synonyms[i].second) << '"';
        }
        out << '}';
    }
    if (!field.mapping.empty()) {
        out << ", \"mapping\": {";
        for (size_t i = 0; i < field.mapping.size(); ++i) {
            if (i > 0) out << ", ";
            out << '"' << escapeJsonString(field.mapping[i].first) << "\": " << formatJsonNumber(field.mapping[i].second);
        }
        out << '}';
    }
    out << '}';
}
} // namespace

SchemaStore::SchemaStore(std::vector<std::string> featureColumns,
                         std::vector<ScaleParams> scaleParams,
                         std::unordered_map<std::string, double> imputationMeans,
                         FieldCatalog catalog,
                         std::string modelId)
    : featureColumns_(std::move(featureColumns)),
      scaleParams_(std::move(scaleParams)),
      imputationMeans_(std::move(imputationMeans)),
      catalog_(std::move(catalog)),
      modelId_(std::move(modelId)) {
    for (auto& params : scaleParams_) {
        if (std::isfinite(params.spread) && std::abs(params.spread) < kZeroSpreadEpsilon) {
            params.spread = 1.0;
        }
    }
    validate();
    columnIndex_.reserve(featureColumns_.size());
    for (size_t i = 0; i < featureColumns_.size(); ++i) {
        columnIndex_.emplace(featureColumns_[i], i);
    }
}

void SchemaStore::validate() const {
    if (featureColumns_.empty()) {
        throw ChurnServe::SchemaLoadError("feature_columns is empty");
    }
    if (scaleParams_.size() != featureColumns_.size()) {
        throw ChurnServe::SchemaLoadError("scale_params has " + std::to_string(scaleParams_.size()) +
                                          " entries but feature_columns has " +
                                          std::to_string(featureColumns_.size()));
    }

    std::unordered_set<std::string> seen;
    for (const auto& column : featureColumns_) {
        if (column.empty()) {
            throw ChurnServe::SchemaLoadError("feature_columns contains an empty name");
        }
        if (!seen.insert(column).second) {
            throw ChurnServe::SchemaLoadError("duplicate feature column: " + column);
        }
    }

    for (size_t i = 0; i < scaleParams_.size(); ++i) {
        const ScaleParams& params = scaleParams_[i];
        if (!std::isfinite(params.center) || !std::isfinite(params.spread) || params.spread < 0.0) {
            throw ChurnServe::SchemaLoadError("scale_params for column '" + featureColumns_[i] +
                                              "' must have a finite center and a non-negative finite spread");
        }
    }

    catalog_.validate();
    for (const auto& field : catalog_.fields()) {
        if (field.kind != FieldKind::NUMERIC) continue;
        auto it = imputationMeans_.find(field.name);
        if (it == imputationMeans_.end()) {
            throw ChurnServe::SchemaLoadError("imputation has no frozen mean for numeric field '" + field.name + "'");
        }
        if (!std::isfinite(it->second)) {
            throw ChurnServe::SchemaLoadError("imputation mean for '" + field.name + "' is not finite");
        }
    }
}

SchemaStore SchemaStore::fromJson(const JsonValue& root) {
    if (!root.isObject()) {
        throw ChurnServe::SchemaLoadError("schema artifact must be a JSON object");
    }

    if (const JsonValue* version = root.find("schema_version"); version != nullptr) {
        if (!version->isNumber() || version->numberValue != static_cast<double>(kSchemaVersion)) {
            throw ChurnServe::SchemaLoadError("unsupported schema_version (expected " +
                                              std::to_string(kSchemaVersion) + ")");
        }
    }

    const JsonValue* columnsNode = root.find("feature_columns");
    if (columnsNode == nullptr || !columnsNode->isArray()) {
        throw ChurnServe::SchemaLoadError("schema requires a 'feature_columns' array");
    }
    std::vector<std::string> columns;
    columns.reserve(columnsNode->arrayValue.size());
    for (const auto& item : columnsNode->arrayValue) {
        if (!item.isString()) {
            throw ChurnServe::SchemaLoadError("feature_columns must contain strings only");
        }
        columns.push_back(item.stringValue);
    }

    const JsonValue* scaleNode = root.find("scale_params");
    if (scaleNode == nullptr || !scaleNode->isArray()) {
        throw ChurnServe::SchemaLoadError("schema requires a 'scale_params' array");
    }
    std::vector<ScaleParams> scale;
    scale.reserve(scaleNode->arrayValue.size());
    for (size_t i = 0; i < scaleNode->arrayValue.size(); ++i) {
        const JsonValue& item = scaleNode->arrayValue[i];
        const std::string label = "scale_params[" + std::to_string(i) + "]";
        if (!item.isObject()) {
            throw ChurnServe::SchemaLoadError(label + " must be an object with 'center' and 'spread'");
        }
        const JsonValue* center = item.find("center");
        const JsonValue* spread = item.find("spread");
        if (center == nullptr || spread == nullptr) {
            throw ChurnServe::SchemaLoadError(label + " requires 'center' and 'spread'");
        }
        ScaleParams params;
        params.center = requireFiniteNumber(*center, label + ".center");
        params.spread = requireFiniteNumber(*spread, label + ".spread");
        scale.push_back(params);
    }

    std::unordered_map<std::string, double> means;
    if (const JsonValue* imputationNode = root.find("imputation"); imputationNode != nullptr) {
        if (!imputationNode->isObject()) {
            throw ChurnServe::SchemaLoadError("'imputation' must be an object of field -> mean");
        }
        for (const auto& kv : imputationNode->objectValue) {
            means[kv.first] = requireFiniteNumber(kv.second, "imputation." + kv.first);
        }
    }

    FieldCatalog catalog = FieldCatalog::telcoDefaults();
    if (const JsonValue* fieldsNode = root.find("fields"); fieldsNode != nullptr) {
        catalog = FieldCatalog::fromJson(*fieldsNode);
    }

    std::string modelId;
    if (const JsonValue* modelIdNode = root.find("model_id"); modelIdNode != nullptr && modelIdNode->isString()) {
        modelId = modelIdNode->stringValue;
    }

    return SchemaStore(std::move(columns), std::move(scale), std::move(means), std::move(catalog), std::move(modelId));
}

SchemaStore SchemaStore::loadFromFile(const std::string& path) {
    try {
        return fromJson(parseJsonFile(path));
    } catch (const ChurnServe::SchemaLoadError& e) {
        throw ChurnServe::SchemaLoadError(path + ": " + e.detail());
    } catch (const ChurnServe::ChurnServeException& e) {
        throw ChurnServe::SchemaLoadError(e.what());
    }
}

std::string SchemaStore::toJson() const {
    std::ostringstream out;
    out << "{\n  \"schema_version\": " << kSchemaVersion << ",\n";
    if (!modelId_.empty()) {
        out << "  \"model_id\": \"" << escapeJsonString(modelId_) << "\",\n";
    }

    out << "  \"feature_columns\": ";
    writeStringArray(out, featureColumns_);
    out << ",\n  \"scale_params\": [\n";
    for (size_t i = 0; i < scaleParams_.size(); ++i) {
        out << "    {\"center\": " << formatJsonNumber(scaleParams_[i].center)
            << ", \"spread\": " << formatJsonNumber(scaleParams_[i].spread) << '}'
            << (i + 1 == scaleParams_.size() ? "\n" : ",\n");
    }
    out << "  ],\n  \"imputation\": {";

    std::vector<std::string> imputed;
    imputed.reserve(imputationMeans_.size());
    for (const auto& kv : imputationMeans_) imputed.push_back(kv.first);
    std::sort(imputed.begin(), imputed.end());
    for (size_t i = 0; i < imputed.size(); ++i) {
        if (i > 0) out << ", ";
        out << '"' << escapeJsonString(imputed[i]) << "\": " << formatJsonNumber(imputationMeans_.at(imputed[i]));
    }
    out << "},\n  \"fields\": [\n";

    const auto& fields = catalog_.fields();
    for (size_t i = 0; i < fields.size(); ++i) {
        writeFieldSpec(out, fields[i]);
        out << (i + 1 == fields.size() ? "\n" : ",\n");
    }
    out << "  ]\n}\n";
    return out.str();
}

void SchemaStore::saveToFile(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw ChurnServe::IOException("Could not open " + path + " for writing");
    }
    out << toJson();
    if (!out.good()) {
        throw ChurnServe::IOException("Failed while writing schema file: " + path);
    }
}

int SchemaStore::columnIndex(const std::string& column) const {
    auto it = columnIndex_.find(column);
    if (it == columnIndex_.end()) return -1;
    return static_cast<int>(it->second);
}

double SchemaStore::imputationMean(const std::string& field) const {
    auto it = imputationMeans_.find(field);
    if (it == imputationMeans_.end()) {
        throw ChurnServe::SchemaLoadError("no frozen imputation mean for field '" + field + "'");
    }
    return it->second;
}

std::vector<std::string> SchemaStore::unreachableColumns() const {
    const std::vector<std::string> producible = catalog_.encodedColumns();
    const std::unordered_set<std::string> producibleSet(producible.begin(), producible.end());

    std::vector<std::string> out;
    for (const auto& column : featureColumns_) {
        if (producibleSet.find(column) == producibleSet.end()) out.push_back(column);
    }
    return out;
}
