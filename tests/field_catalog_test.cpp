#include <gtest/gtest.h>

#include "ChurnServeExceptions.h"
#include "FieldCatalog.h"
#include "JsonValue.h"

#include <string>
#include <vector>

TEST(FieldCatalogTest, TelcoDefaultsProduceTrainingColumnOrder) {
    const FieldCatalog catalog = FieldCatalog::telcoDefaults();
    EXPECT_NO_THROW(catalog.validate());

    const std::vector<std::string> expected = {
        "SeniorCitizen", "Partner", "Dependents", "tenure", "PhoneService", "MonthlyCharges", "TotalCharges",
        "gender_Male", "MultipleLines_Yes", "InternetService_Fiber optic", "InternetService_No",
        "OnlineSecurity_Yes", "OnlineBackup_Yes", "DeviceProtection_Yes", "TechSupport_Yes",
        "StreamingTV_Yes", "StreamingMovies_Yes", "Contract_One year", "Contract_Two year",
        "PaperlessBilling_Yes", "PaymentMethod_Credit card (automatic)", "PaymentMethod_Electronic check",
        "PaymentMethod_Mailed check"};
    EXPECT_EQ(catalog.encodedColumns(), expected);
}

TEST(FieldCatalogTest, DependentServiceFieldsCollapseNotApplicable) {
    const FieldCatalog catalog = FieldCatalog::telcoDefaults();
    for (const char* name : {"MultipleLines", "OnlineSecurity", "OnlineBackup", "DeviceProtection", "TechSupport",
                             "StreamingTV", "StreamingMovies"}) {
        const FieldSpec* field = catalog.find(name);
        ASSERT_NE(field, nullptr) << name;
        const std::string* noInternet = field->canonicalCategory("No internet service");
        const std::string* noPhone = field->canonicalCategory("No phone service");
        ASSERT_NE(noInternet, nullptr) << name;
        ASSERT_NE(noPhone, nullptr) << name;
        EXPECT_EQ(*noInternet, "No");
        EXPECT_EQ(*noPhone, "No");
    }
}

TEST(FieldCatalogTest, CanonicalCategoryTrimsAndIgnoresCase) {
    const FieldCatalog catalog = FieldCatalog::telcoDefaults();
    const FieldSpec* contract = catalog.find("Contract");
    ASSERT_NE(contract, nullptr);

    const std::string* value = contract->canonicalCategory("  month-to-MONTH ");
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, "Month-to-month");
    EXPECT_EQ(contract->canonicalCategory("Quarterly"), nullptr);
}

TEST(FieldCatalogTest, ReferenceDefaultsToLexicographicMinimum) {
    FieldSpec field;
    field.name = "Plan";
    field.vocabulary = {"gold", "Basic", "silver"};
    EXPECT_EQ(field.referenceValue(), "Basic");
    EXPECT_EQ(field.indicatorColumns(), (std::vector<std::string>{"Plan_gold", "Plan_silver"}));

    field.reference = "silver";
    EXPECT_EQ(field.indicatorColumns(), (std::vector<std::string>{"Plan_Basic", "Plan_gold"}));
}

TEST(FieldCatalogTest, BinaryCodesComeFromTheMappingTable) {
    const FieldSpec* partner = FieldCatalog::telcoDefaults().find("Partner");
    ASSERT_NE(partner, nullptr);
    ASSERT_NE(partner->binaryCode("yes"), nullptr);
    EXPECT_EQ(*partner->binaryCode("yes"), 1.0);
    EXPECT_EQ(*partner->binaryCode(" No"), 0.0);
    EXPECT_EQ(partner->binaryCode("1"), nullptr);
}

TEST(FieldCatalogTest, LoadsCatalogFromJson) {
    const JsonValue fields = parseJsonText(R"([
        {"name": "plan", "kind": "categorical", "vocabulary": ["basic", "pro"], "reference": "pro",
         "synonyms": {"professional": "pro"}},
        {"name": "active", "kind": "binary", "mapping": {"Y": 1, "N": 0}},
        {"name": "spend", "kind": "numeric"}
    ])");
    const FieldCatalog catalog = FieldCatalog::fromJson(fields);

    EXPECT_EQ(catalog.encodedColumns(), (std::vector<std::string>{"active", "spend", "plan_basic"}));
    const FieldSpec* plan = catalog.find("plan");
    ASSERT_NE(plan, nullptr);
    EXPECT_EQ(*plan->canonicalCategory("Professional"), "pro");
    EXPECT_EQ(catalog.find("active")->vocabulary, (std::vector<std::string>{"N", "Y"}));
}

TEST(FieldCatalogTest, RejectsInconsistentCatalogs) {
    EXPECT_THROW(FieldCatalog::fromJson(parseJsonText(R"([{"name": "x", "kind": "ordinal"}])")),
                 ChurnServe::SchemaLoadError);
    EXPECT_THROW(FieldCatalog::fromJson(parseJsonText(R"([{"name": "x", "kind": "categorical"}])")),
                 ChurnServe::SchemaLoadError);
    EXPECT_THROW(FieldCatalog::fromJson(parseJsonText(
                     R"([{"name": "x", "kind": "categorical", "vocabulary": ["a", "b"], "reference": "c"}])")),
                 ChurnServe::SchemaLoadError);
    EXPECT_THROW(FieldCatalog::fromJson(parseJsonText(
                     R"([{"name": "x", "kind": "categorical", "vocabulary": ["a"], "synonyms": {"z": "q"}}])")),
                 ChurnServe::SchemaLoadError);
    EXPECT_THROW(FieldCatalog::fromJson(parseJsonText(R"([{"name": "x", "kind": "binary", "mapping": {"Y": 2}}])")),
                 ChurnServe::SchemaLoadError);
    EXPECT_THROW(FieldCatalog::fromJson(parseJsonText(
                     R"([{"name": "x", "kind": "numeric"}, {"name": "X", "kind": "numeric"}])")),
                 ChurnServe::SchemaLoadError);
}
