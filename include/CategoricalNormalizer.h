#pragma once

#include "FieldCatalog.h"
#include "RawRecord.h"

#include <cstdint>
#include <string>
#include <vector>

enum class UnknownCategoryPolicy { REJECT, REFERENCE };

/**
 * @brief One record after normalization and numeric coercion, indexed by catalog position.
 */
struct NormalizedRecord {
    // Canonical vocabulary value for CATEGORICAL fields, empty elsewhere.
    std::vector<std::string> categories;
    // 0/1 for BINARY fields, coerced or imputed value for NUMERIC fields, NaN for CATEGORICAL.
    std::vector<double> values;
    // 1 where a NUMERIC value came from the frozen training mean.
    std::vector<uint8_t> imputed;

    void reset(size_t fieldCount);
};

class CategoricalNormalizer {
public:
    /**
     * @pre catalog outlives the normalizer.
     */
    explicit CategoricalNormalizer(const FieldCatalog& catalog,
                                   UnknownCategoryPolicy policy = UnknownCategoryPolicy::REJECT);

    /**
     * @brief Collapses synonyms, canonicalizes categories and maps binary fields through their tables.
     * @post Categorical and binary slots of `out` are filled; numeric slots are untouched.
     * @throws ChurnServe::MissingFieldError when a field is absent, null or blank.
     * @throws ChurnServe::UnknownCategoryError when a value is outside the vocabulary (binary fields always,
     *         categorical fields unless the policy buckets them into the reference value).
     */
    void normalize(const RawRecord& record, size_t recordIndex, NormalizedRecord& out) const;

    UnknownCategoryPolicy policy() const noexcept { return policy_; }

private:
    const FieldCatalog& catalog_;
    UnknownCategoryPolicy policy_;
};
