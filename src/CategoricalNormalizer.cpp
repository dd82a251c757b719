#include "CategoricalNormalizer.h"

#include "ChurnServeExceptions.h"
#include "CommonUtils.h"

#include <limits>

void NormalizedRecord::reset(size_t fieldCount) {
    categories.assign(fieldCount, std::string());
    values.assign(fieldCount, std::numeric_limits<double>::quiet_NaN());
    imputed.assign(fieldCount, static_cast<uint8_t>(0));
}

CategoricalNormalizer::CategoricalNormalizer(const FieldCatalog& catalog, UnknownCategoryPolicy policy)
    : catalog_(catalog), policy_(policy) {}

void CategoricalNormalizer::normalize(const RawRecord& record, size_t recordIndex, NormalizedRecord& out) const {
    const auto& fields = catalog_.fields();
    if (out.values.size() != fields.size()) out.reset(fields.size());

    for (size_t i = 0; i < fields.size(); ++i) {
        const FieldSpec& field = fields[i];
        if (field.kind == FieldKind::NUMERIC) continue;

        const RawValue* raw = findRawField(record, field.name, recordIndex);
        if (raw == nullptr || std::holds_alternative<std::monostate>(*raw)) {
            throw ChurnServe::MissingFieldError(recordIndex, field.name);
        }

        const std::string token = describeRawValue(*raw);
        if (std::holds_alternative<std::string>(*raw) && CommonUtils::trim(token).empty()) {
            throw ChurnServe::MissingFieldError(recordIndex, field.name);
        }

        if (field.kind == FieldKind::BINARY) {
            // Booleans and numbers are not in the table; only explicit tokens map.
            const double* code = std::holds_alternative<std::string>(*raw) ? field.binaryCode(token) : nullptr;
            if (code == nullptr) {
                throw ChurnServe::UnknownCategoryError(recordIndex, field.name, token);
            }
            out.values[i] = *code;
            continue;
        }

        const std::string* canonical = field.canonicalCategory(token);
        if (canonical != nullptr) {
            out.categories[i] = *canonical;
        } else if (policy_ == UnknownCategoryPolicy::REFERENCE) {
            out.categories[i] = field.referenceValue();
        } else {
            throw ChurnServe::UnknownCategoryError(recordIndex, field.name, token);
        }
    }
}
