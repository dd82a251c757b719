#pragma once

#include "CategoricalNormalizer.h"
#include "RawRecord.h"
#include "SchemaStore.h"

#include <optional>

/**
 * @brief Parses a raw value as a finite number.
 * @return std::nullopt (the missing marker) for null, booleans, blank or unparsable text and non-finite numbers.
 */
std::optional<double> coerceNumeric(const RawValue& value);

class NumericImputer {
public:
    /**
     * @pre schema outlives the imputer.
     */
    explicit NumericImputer(const SchemaStore& schema);

    /**
     * @brief Fills numeric slots, substituting the schema's frozen training mean for missing markers.
     * @throws ChurnServe::MissingFieldError when a numeric field is absent from the record entirely.
     */
    void coerce(const RawRecord& record, size_t recordIndex, NormalizedRecord& out) const;

private:
    const SchemaStore& schema_;
};
