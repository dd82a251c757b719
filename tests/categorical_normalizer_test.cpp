#include <gtest/gtest.h>

#include "CategoricalNormalizer.h"
#include "ChurnServeExceptions.h"
#include "TestSupport.h"

#include <cmath>
#include <string>

namespace {
size_t fieldIndex(const FieldCatalog& catalog, const std::string& name) {
    const auto& fields = catalog.fields();
    for (size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].name == name) return i;
    }
    ADD_FAILURE() << "no field " << name;
    return 0;
}
} // namespace

TEST(CategoricalNormalizerTest, CanonicalizesCategoriesAndMapsBinaries) {
    const FieldCatalog catalog = FieldCatalog::telcoDefaults();
    const CategoricalNormalizer normalizer(catalog);

    RawRecord record = testsupport::telcoRecord();
    record["Contract"] = std::string(" month-to-month ");
    record["Partner"] = std::string("yes");

    NormalizedRecord out;
    normalizer.normalize(record, 0, out);

    EXPECT_EQ(out.categories[fieldIndex(catalog, "Contract")], "Month-to-month");
    EXPECT_EQ(out.categories[fieldIndex(catalog, "MultipleLines")], "No");
    EXPECT_EQ(out.values[fieldIndex(catalog, "Partner")], 1.0);
    EXPECT_EQ(out.values[fieldIndex(catalog, "PhoneService")], 0.0);
    EXPECT_TRUE(std::isnan(out.values[fieldIndex(catalog, "tenure")]));
}

TEST(CategoricalNormalizerTest, NotApplicableEqualsDeclined) {
    const FieldCatalog catalog = FieldCatalog::telcoDefaults();
    const CategoricalNormalizer normalizer(catalog);

    RawRecord notApplicable = testsupport::telcoRecord();
    RawRecord declined = testsupport::telcoRecord();
    notApplicable["StreamingTV"] = std::string("No internet service");
    declined["StreamingTV"] = std::string("No");

    NormalizedRecord a;
    NormalizedRecord b;
    normalizer.normalize(notApplicable, 0, a);
    normalizer.normalize(declined, 0, b);
    EXPECT_EQ(a.categories, b.categories);
}

TEST(CategoricalNormalizerTest, MatchesFieldNamesCaseInsensitively) {
    const FieldCatalog catalog = FieldCatalog::telcoDefaults();
    const CategoricalNormalizer normalizer(catalog);

    RawRecord record = testsupport::telcoRecord();
    record.erase("Contract");
    record["contract"] = std::string("Two year");

    NormalizedRecord out;
    normalizer.normalize(record, 0, out);
    EXPECT_EQ(out.categories[fieldIndex(catalog, "Contract")], "Two year");
}

TEST(CategoricalNormalizerTest, RejectsAmbiguousFieldSpellings) {
    const FieldCatalog catalog = FieldCatalog::telcoDefaults();
    const CategoricalNormalizer normalizer(catalog);

    RawRecord record = testsupport::telcoRecord();
    record.erase("Contract");
    record["contract"] = std::string("Two year");
    record["CONTRACT"] = std::string("Month-to-month");

    NormalizedRecord out;
    try {
        normalizer.normalize(record, 5, out);
        FAIL() << "expected an invalid record";
    } catch (const ChurnServe::InvalidRecordError& e) {
        EXPECT_EQ(e.code(), "invalid_record");
        EXPECT_EQ(e.field(), "Contract");
        EXPECT_EQ(e.recordIndex(), 5u);
        EXPECT_NE(std::string(e.what()).find("'CONTRACT' and 'contract'"), std::string::npos) << e.what();
    }

    // An exact key settles it.
    record["Contract"] = std::string("One year");
    normalizer.normalize(record, 5, out);
    EXPECT_EQ(out.categories[fieldIndex(catalog, "Contract")], "One year");
}

TEST(CategoricalNormalizerTest, AbsentNullOrBlankFieldIsMissing) {
    const FieldCatalog catalog = FieldCatalog::telcoDefaults();
    const CategoricalNormalizer normalizer(catalog);
    NormalizedRecord out;

    RawRecord absent = testsupport::telcoRecord();
    absent.erase("PaymentMethod");
    try {
        normalizer.normalize(absent, 4, out);
        FAIL() << "expected MissingFieldError";
    } catch (const ChurnServe::MissingFieldError& e) {
        EXPECT_EQ(e.code(), "missing_field");
        EXPECT_EQ(e.field(), "PaymentMethod");
        EXPECT_EQ(e.recordIndex(), 4u);
    }

    RawRecord null = testsupport::telcoRecord();
    null["gender"] = RawValue{};
    EXPECT_THROW(normalizer.normalize(null, 0, out), ChurnServe::MissingFieldError);

    RawRecord blank = testsupport::telcoRecord();
    blank["Partner"] = std::string("   ");
    EXPECT_THROW(normalizer.normalize(blank, 0, out), ChurnServe::MissingFieldError);
}

TEST(CategoricalNormalizerTest, UnknownCategoryFailsClosedByDefault) {
    const FieldCatalog catalog = FieldCatalog::telcoDefaults();
    const CategoricalNormalizer normalizer(catalog);

    RawRecord record = testsupport::telcoRecord();
    record["Contract"] = std::string("Quarterly");

    NormalizedRecord out;
    try {
        normalizer.normalize(record, 2, out);
        FAIL() << "expected UnknownCategoryError";
    } catch (const ChurnServe::UnknownCategoryError& e) {
        EXPECT_EQ(e.code(), "unknown_category");
        EXPECT_EQ(e.field(), "Contract");
        EXPECT_EQ(e.value(), "Quarterly");
    }
}

TEST(CategoricalNormalizerTest, ReferencePolicyBucketsUnknownCategories) {
    const FieldCatalog catalog = FieldCatalog::telcoDefaults();
    const CategoricalNormalizer normalizer(catalog, UnknownCategoryPolicy::REFERENCE);

    RawRecord record = testsupport::telcoRecord();
    record["Contract"] = std::string("Quarterly");

    NormalizedRecord out;
    normalizer.normalize(record, 0, out);
    EXPECT_EQ(out.categories[fieldIndex(catalog, "Contract")], "Month-to-month");
}

TEST(CategoricalNormalizerTest, BinaryFieldsAlwaysFailClosed) {
    const FieldCatalog catalog = FieldCatalog::telcoDefaults();
    const CategoricalNormalizer normalizer(catalog, UnknownCategoryPolicy::REFERENCE);
    NormalizedRecord out;

    RawRecord maybe = testsupport::telcoRecord();
    maybe["Partner"] = std::string("Maybe");
    EXPECT_THROW(normalizer.normalize(maybe, 0, out), ChurnServe::UnknownCategoryError);

    RawRecord boolean = testsupport::telcoRecord();
    boolean["Dependents"] = true;
    EXPECT_THROW(normalizer.normalize(boolean, 0, out), ChurnServe::UnknownCategoryError);

    RawRecord number = testsupport::telcoRecord();
    number["PhoneService"] = 1.0;
    EXPECT_THROW(normalizer.normalize(number, 0, out), ChurnServe::UnknownCategoryError);
}
