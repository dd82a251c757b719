#include "FieldCatalog.h"

#include "ChurnServeExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <unordered_set>

namespace {
FieldSpec numericField(std::string name) {
    FieldSpec spec;
    spec.name = std::move(name);
    spec.kind = FieldKind::NUMERIC;
    return spec;
}

FieldSpec yesNoBinaryField(std::string name) {
    FieldSpec spec;
    spec.name = std::move(name);
    spec.kind = FieldKind::BINARY;
    spec.vocabulary = {"No", "Yes"};
    spec.mapping = {{"Yes", 1.0}, {"No", 0.0}};
    return spec;
}

FieldSpec categoricalField(std::string name, std::vector<std::string> vocabulary) {
    FieldSpec spec;
    spec.name = std::move(name);
    spec.kind = FieldKind::CATEGORICAL;
    spec.vocabulary = std::move(vocabulary);
    return spec;
}

// Add-on services only exist when the prerequisite service does; "not applicable" encodes as declined.
FieldSpec dependentServiceField(std::string name) {
    FieldSpec spec = categoricalField(std::move(name), {"No", "Yes"});
    spec.synonyms = {{"No internet service", "No"}, {"No phone service", "No"}};
    return spec;
}

FieldKind parseFieldKind(const std::string& raw, const std::string& fieldName) {
    const std::string kind = CommonUtils::toLower(CommonUtils::trim(raw));
    if (kind == "numeric") return FieldKind::NUMERIC;
    if (kind == "binary") return FieldKind::BINARY;
    if (kind == "categorical") return FieldKind::CATEGORICAL;
    throw ChurnServe::SchemaLoadError("field '" + fieldName + "' has unknown kind '" + raw +
                                      "' (expected numeric|binary|categorical)");
}

std::vector<std::string> parseStringArray(const JsonValue& node, const std::string& label) {
    if (!node.isArray()) {
        throw ChurnServe::SchemaLoadError(label + " must be an array of strings");
    }
    std::vector<std::string> out;
    out.reserve(node.arrayValue.size());
    for (const auto& item : node.arrayValue) {
        if (!item.isString()) {
            throw ChurnServe::SchemaLoadError(label + " must contain strings only");
        }
        out.push_back(item.stringValue);
    }
    return out;
}
} // namespace

const char* fieldKindName(FieldKind kind) noexcept {
    switch (kind) {
        case FieldKind::NUMERIC: return "numeric";
        case FieldKind::BINARY: return "binary";
        case FieldKind::CATEGORICAL: return "categorical";
    }
    return "categorical";
}

const std::string& FieldSpec::referenceValue() const {
    if (!reference.empty()) return reference;
    static const std::string kNone;
    if (vocabulary.empty()) return kNone;
    return *std::min_element(vocabulary.begin(), vocabulary.end());
}

std::vector<std::string> FieldSpec::indicatorColumns() const {
    std::vector<std::string> columns;
    if (kind != FieldKind::CATEGORICAL) return columns;

    std::vector<std::string> sorted = vocabulary;
    std::sort(sorted.begin(), sorted.end());
    const std::string& ref = referenceValue();
    columns.reserve(sorted.size());
    for (const auto& value : sorted) {
        if (value == ref) continue;
        columns.push_back(name + "_" + value);
    }
    return columns;
}

const std::string* FieldSpec::canonicalCategory(const std::string& token) const {
    std::string value = CommonUtils::trim(token);
    for (const auto& synonym : synonyms) {
        if (CommonUtils::iequals(synonym.first, value)) {
            value = synonym.second;
            break;
        }
    }
    for (const auto& known : vocabulary) {
        if (CommonUtils::iequals(known, value)) return &known;
    }
    return nullptr;
}

const double* FieldSpec::binaryCode(const std::string& token) const {
    std::string value = CommonUtils::trim(token);
    for (const auto& synonym : synonyms) {
        if (CommonUtils::iequals(synonym.first, value)) {
            value = synonym.second;
            break;
        }
    }
    for (const auto& entry : mapping) {
        if (CommonUtils::iequals(entry.first, value)) return &entry.second;
    }
    return nullptr;
}

FieldCatalog::FieldCatalog(std::vector<FieldSpec> fields) : fields_(std::move(fields)) {}

FieldCatalog FieldCatalog::telcoDefaults() {
    std::vector<FieldSpec> fields;
    fields.push_back(categoricalField("gender", {"Female", "Male"}));
    fields.push_back(numericField("SeniorCitizen"));
    fields.push_back(yesNoBinaryField("Partner"));
    fields.push_back(yesNoBinaryField("Dependents"));
    fields.push_back(numericField("tenure"));
    fields.push_back(yesNoBinaryField("PhoneService"));
    fields.push_back(dependentServiceField("MultipleLines"));
    fields.push_back(categoricalField("InternetService", {"DSL", "Fiber optic", "No"}));
    fields.push_back(dependentServiceField("OnlineSecurity"));
    fields.push_back(dependentServiceField("OnlineBackup"));
    fields.push_back(dependentServiceField("DeviceProtection"));
    fields.push_back(dependentServiceField("TechSupport"));
    fields.push_back(dependentServiceField("StreamingTV"));
    fields.push_back(dependentServiceField("StreamingMovies"));
    fields.push_back(categoricalField("Contract", {"Month-to-month", "One year", "Two year"}));
    fields.push_back(categoricalField("PaperlessBilling", {"No", "Yes"}));
    fields.push_back(categoricalField("PaymentMethod",
                                      {"Bank transfer (automatic)",
                                       "Credit card (automatic)",
                                       "Electronic check",
                                       "Mailed check"}));
    fields.push_back(numericField("MonthlyCharges"));
    fields.push_back(numericField("TotalCharges"));
    return FieldCatalog(std::move(fields));
}

FieldCatalog FieldCatalog::fromJson(const JsonValue& fieldsNode, bool validateFields) {
    if (!fieldsNode.isArray()) {
        throw ChurnServe::SchemaLoadError("'fields' must be an array of field objects");
    }

    std::vector<FieldSpec> fields;
    fields.reserve(fieldsNode.arrayValue.size());
    for (size_t i = 0; i < fieldsNode.arrayValue.size(); ++i) {
        const JsonValue& item = fieldsNode.arrayValue[i];
        const std::string label = "fields[" + std::to_string(i) + "]";
        if (!item.isObject()) {
            throw ChurnServe::SchemaLoadError(label + " must be an object");
        }

        const JsonValue* nameNode = item.find("name");
        const JsonValue* kindNode = item.find("kind");
        if (nameNode == nullptr || !nameNode->isString() || nameNode->stringValue.empty()) {
            throw ChurnServe::SchemaLoadError(label + " requires a non-empty string 'name'");
        }
        if (kindNode == nullptr || !kindNode->isString()) {
            throw ChurnServe::SchemaLoadError(label + " requires a string 'kind'");
        }

        FieldSpec spec;
        spec.name = nameNode->stringValue;
        spec.kind = parseFieldKind(kindNode->stringValue, spec.name);

        if (const JsonValue* vocab = item.find("vocabulary"); vocab != nullptr) {
            spec.vocabulary = parseStringArray(*vocab, label + ".vocabulary");
        }
        if (const JsonValue* ref = item.find("reference"); ref != nullptr && !ref->isNull()) {
            if (!ref->isString()) {
                throw ChurnServe::SchemaLoadError(label + ".reference must be a string");
            }
            spec.reference = ref->stringValue;
        }
        if (const JsonValue* synonyms = item.find("synonyms"); synonyms != nullptr) {
            if (!synonyms->isObject()) {
                throw ChurnServe::SchemaLoadError(label + ".synonyms must be an object");
            }
            for (const auto& kv : synonyms->objectValue) {
                if (!kv.second.isString()) {
                    throw ChurnServe::SchemaLoadError(label + ".synonyms values must be strings");
                }
                spec.synonyms.emplace_back(kv.first, kv.second.stringValue);
            }
            std::sort(spec.synonyms.begin(), spec.synonyms.end());
        }
        if (const JsonValue* mapping = item.find("mapping"); mapping != nullptr) {
            if (!mapping->isObject()) {
                throw ChurnServe::SchemaLoadError(label + ".mapping must be an object");
            }
            for (const auto& kv : mapping->objectValue) {
                if (!kv.second.isNumber()) {
                    throw ChurnServe::SchemaLoadError(label + ".mapping values must be numbers");
                }
                spec.mapping.emplace_back(kv.first, kv.second.numberValue);
            }
            std::sort(spec.mapping.begin(), spec.mapping.end());
        }

        if (spec.kind == FieldKind::BINARY && spec.vocabulary.empty()) {
            for (const auto& entry : spec.mapping) spec.vocabulary.push_back(entry.first);
        }
        fields.push_back(std::move(spec));
    }

    FieldCatalog catalog(std::move(fields));
    if (validateFields) catalog.validate();
    return catalog;
}

FieldCatalog FieldCatalog::loadTemplateFile(const std::string& path) {
    try {
        const JsonValue root = parseJsonFile(path);
        if (root.isArray()) return fromJson(root, false);
        const JsonValue* fieldsNode = root.isObject() ? root.find("fields") : nullptr;
        if (fieldsNode == nullptr) {
            throw ChurnServe::SchemaLoadError("catalog template needs a 'fields' array");
        }
        return fromJson(*fieldsNode, false);
    } catch (const ChurnServe::JsonException& e) {
        throw ChurnServe::SchemaLoadError(e.what());
    } catch (const ChurnServe::SchemaLoadError& e) {
        throw ChurnServe::SchemaLoadError(path + ": " + e.detail());
    }
}

const FieldSpec* FieldCatalog::find(const std::string& name) const {
    for (const auto& field : fields_) {
        if (field.name == name) return &field;
    }
    return nullptr;
}

std::vector<std::string> FieldCatalog::encodedColumns() const {
    std::vector<std::string> columns;
    for (const auto& field : fields_) {
        if (field.kind != FieldKind::CATEGORICAL) columns.push_back(field.name);
    }
    for (const auto& field : fields_) {
        if (field.kind != FieldKind::CATEGORICAL) continue;
        const auto indicators = field.indicatorColumns();
        columns.insert(columns.end(), indicators.begin(), indicators.end());
    }
    return columns;
}

void FieldCatalog::validate() const {
    if (fields_.empty()) {
        throw ChurnServe::SchemaLoadError("field catalog is empty");
    }

    std::unordered_set<std::string> seenNames;
    for (const auto& field : fields_) {
        if (field.name.empty()) {
            throw ChurnServe::SchemaLoadError("field catalog contains an unnamed field");
        }
        if (!seenNames.insert(CommonUtils::toLower(field.name)).second) {
            throw ChurnServe::SchemaLoadError("duplicate field name: " + field.name);
        }
        if (field.kind == FieldKind::NUMERIC) continue;

        if (field.vocabulary.empty()) {
            throw ChurnServe::SchemaLoadError("field '" + field.name + "' has an empty vocabulary");
        }
        std::unordered_set<std::string> seenValues;
        for (const auto& value : field.vocabulary) {
            if (CommonUtils::trim(value).empty()) {
                throw ChurnServe::SchemaLoadError("field '" + field.name + "' has a blank vocabulary value");
            }
            if (!seenValues.insert(CommonUtils::toLower(value)).second) {
                throw ChurnServe::SchemaLoadError("field '" + field.name + "' repeats vocabulary value '" + value + "'");
            }
        }
        if (!field.reference.empty() &&
            std::find(field.vocabulary.begin(), field.vocabulary.end(), field.reference) == field.vocabulary.end()) {
            throw ChurnServe::SchemaLoadError("field '" + field.name + "' pins reference '" + field.reference +
                                              "' outside its vocabulary");
        }
        for (const auto& synonym : field.synonyms) {
            if (std::find(field.vocabulary.begin(), field.vocabulary.end(), synonym.second) == field.vocabulary.end()) {
                throw ChurnServe::SchemaLoadError("field '" + field.name + "' maps synonym '" + synonym.first +
                                                  "' to unknown value '" + synonym.second + "'");
            }
        }

        if (field.kind == FieldKind::BINARY) {
            if (field.mapping.empty()) {
                throw ChurnServe::SchemaLoadError("binary field '" + field.name + "' has no mapping table");
            }
            for (const auto& entry : field.mapping) {
                if (entry.second != 0.0 && entry.second != 1.0) {
                    throw ChurnServe::SchemaLoadError("binary field '" + field.name + "' maps '" + entry.first +
                                                      "' to a code other than 0 or 1");
                }
            }
        }
    }

    std::unordered_set<std::string> seenColumns;
    for (const auto& column : encodedColumns()) {
        if (!seenColumns.insert(column).second) {
            throw ChurnServe::SchemaLoadError("field catalog produces column '" + column + "' twice");
        }
    }
}
