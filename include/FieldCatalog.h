#pragma once

#include "JsonValue.h"

#include <string>
#include <utility>
#include <vector>

enum class FieldKind { NUMERIC, BINARY, CATEGORICAL };

const char* fieldKindName(FieldKind kind) noexcept;

/**
 * @brief Encoding contract of one raw input field.
 * @details Categorical fields expand into `{name}_{value}` indicators minus the reference value.
 * Binary fields map through an explicit token table. Numeric fields pass through after coercion.
 */
struct FieldSpec {
    std::string name;
    FieldKind kind = FieldKind::CATEGORICAL;
    std::vector<std::string> vocabulary;
    // Pinned reference category; empty means the lexicographically first vocabulary value.
    std::string reference;
    // Raw spelling -> canonical vocabulary value, applied before vocabulary lookup.
    std::vector<std::pair<std::string, std::string>> synonyms;
    // Binary token -> code, each code 0 or 1.
    std::vector<std::pair<std::string, double>> mapping;

    const std::string& referenceValue() const;
    std::vector<std::string> indicatorColumns() const;

    /**
     * @brief Resolves a raw token to its canonical vocabulary spelling.
     * @details Trims, collapses synonyms and compares case-insensitively.
     * @return nullptr when the token is outside the vocabulary.
     */
    const std::string* canonicalCategory(const std::string& token) const;

    // nullptr when the token is not in the mapping table.
    const double* binaryCode(const std::string& token) const;
};

class FieldCatalog {
public:
    FieldCatalog() = default;
    explicit FieldCatalog(std::vector<FieldSpec> fields);

    /**
     * @brief Field set of the Telco customer churn dataset the service was built for.
     */
    static FieldCatalog telcoDefaults();

    /**
     * @param validateFields false leaves validate() to the caller, for templates whose vocabularies are learned later.
     * @throws ChurnServe::SchemaLoadError when a field entry is malformed.
     */
    static FieldCatalog fromJson(const JsonValue& fieldsNode, bool validateFields = true);

    /**
     * @brief Reads a catalog template: a bare field array or any object with a 'fields' array.
     * @details Not validated, so categorical fields may leave their vocabulary empty.
     * @throws ChurnServe::IOException when the file cannot be read.
     * @throws ChurnServe::SchemaLoadError when the JSON or a field entry is malformed.
     */
    static FieldCatalog loadTemplateFile(const std::string& path);

    const std::vector<FieldSpec>& fields() const noexcept { return fields_; }
    const FieldSpec* find(const std::string& name) const;

    /**
     * @brief Column order the training encoder produces.
     * @details Numeric and binary fields in catalog order, then each categorical field's indicators.
     */
    std::vector<std::string> encodedColumns() const;

    /**
     * @throws ChurnServe::SchemaLoadError on duplicate names, empty vocabularies, dangling references or synonyms.
     */
    void validate() const;

private:
    std::vector<FieldSpec> fields_;
};
