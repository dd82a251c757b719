#include "NumericCoercion.h"

#include "ChurnServeExceptions.h"
#include "CommonUtils.h"

#include <cmath>

std::optional<double> coerceNumeric(const RawValue& value) {
    if (const double* number = std::get_if<double>(&value)) {
        if (std::isfinite(*number)) return *number;
        return std::nullopt;
    }
    if (const std::string* text = std::get_if<std::string>(&value)) {
        double parsed = 0.0;
        if (CommonUtils::parseFiniteDouble(*text, parsed)) return parsed;
    }
    return std::nullopt;
}

NumericImputer::NumericImputer(const SchemaStore& schema) : schema_(schema) {}

void NumericImputer::coerce(const RawRecord& record, size_t recordIndex, NormalizedRecord& out) const {
    const auto& fields = schema_.catalog().fields();
    if (out.values.size() != fields.size()) out.reset(fields.size());

    for (size_t i = 0; i < fields.size(); ++i) {
        const FieldSpec& field = fields[i];
        if (field.kind != FieldKind::NUMERIC) continue;

        const RawValue* raw = findRawField(record, field.name, recordIndex);
        if (raw == nullptr) {
            throw ChurnServe::MissingFieldError(recordIndex, field.name);
        }

        const std::optional<double> parsed = coerceNumeric(*raw);
        if (parsed) {
            out.values[i] = *parsed;
            out.imputed[i] = static_cast<uint8_t>(0);
        } else {
            out.values[i] = schema_.imputationMean(field.name);
            out.imputed[i] = static_cast<uint8_t>(1);
        }
    }
}
