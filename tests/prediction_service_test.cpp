#include <gtest/gtest.h>

#include "ChurnServeExceptions.h"
#include "DenseNetModel.h"
#include "JsonValue.h"
#include "PredictionService.h"
#include "TestSupport.h"

#include <atomic>
#include <cmath>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {
const char* kCustomer =
    R"({"customerID": "7590-VHVEG", "gender": "Female", "SeniorCitizen": 0, "Partner": "Yes", "Dependents": "No",
        "tenure": 1, "PhoneService": "No", "MultipleLines": "No phone service", "InternetService": "DSL",
        "OnlineSecurity": "No", "OnlineBackup": "Yes", "DeviceProtection": "No", "TechSupport": "No",
        "StreamingTV": "No", "StreamingMovies": "No", "Contract": "Month-to-month", "PaperlessBilling": "Yes",
        "PaymentMethod": "Electronic check", "MonthlyCharges": 29.85, "TotalCharges": "29.85"})";

const char* kLoyalCustomer =
    R"({"customerID": "0003-CCCCC", "gender": "Male", "SeniorCitizen": 0, "Partner": "No", "Dependents": "No",
        "tenure": 60, "PhoneService": "Yes", "MultipleLines": "No", "InternetService": "DSL",
        "OnlineSecurity": "Yes", "OnlineBackup": "Yes", "DeviceProtection": "No", "TechSupport": "No",
        "StreamingTV": "No", "StreamingMovies": "No", "Contract": "Two year", "PaperlessBilling": "Yes",
        "PaymentMethod": "Mailed check", "MonthlyCharges": 53.85, "TotalCharges": null})";

// Same customer with tenure left out.
const char* kCustomerWithoutTenure =
    R"({"gender": "Female", "SeniorCitizen": 0, "Partner": "Yes", "Dependents": "No",
        "PhoneService": "No", "MultipleLines": "No phone service", "InternetService": "DSL",
        "OnlineSecurity": "No", "OnlineBackup": "Yes", "DeviceProtection": "No", "TechSupport": "No",
        "StreamingTV": "No", "StreamingMovies": "No", "Contract": "Month-to-month", "PaperlessBilling": "Yes",
        "PaymentMethod": "Electronic check", "MonthlyCharges": 29.85, "TotalCharges": "29.85"})";

// 23 -> 3 (relu) -> 1 (sigmoid) with fixed, uneven weights.
std::unique_ptr<ChurnModel> telcoDenseNet() {
    DenseNetModel::Layer hidden;
    hidden.inputs = 23;
    hidden.outputs = 3;
    hidden.activation = NeuralActivation::RELU;
    for (size_t i = 0; i < hidden.inputs * hidden.outputs; ++i) {
        hidden.weights.push_back(static_cast<double>(static_cast<int>((i * 7) % 11) - 5) / 10.0);
    }
    hidden.biases = {0.1, -0.2, 0.05};

    DenseNetModel::Layer output;
    output.inputs = 3;
    output.outputs = 1;
    output.activation = NeuralActivation::SIGMOID;
    output.weights = {0.8, -0.6, 0.4};
    output.biases = {-0.1};
    return std::make_unique<DenseNetModel>(std::vector<DenseNetModel::Layer>{hidden, output});
}

double sigmoid(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

class PredictionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        PipelineOptions options;
        options.maxBatchRecords = 4;
        registry.loadFromFile(testsupport::dataPath("registry.json"), options);
    }

    JsonValue predict(const std::string& body, int expectedStatus) {
        const HttpReply reply = service.handlePredict(body);
        EXPECT_EQ(reply.status, expectedStatus) << reply.body;
        return parseJsonText(reply.body);
    }

    ModelRegistry registry;
    RequestMonitor monitor{0.5};
    PredictionService service{registry, monitor};
};
} // namespace

TEST_F(PredictionServiceTest, RegistryLoadsArtifactsRelativeToItsFile) {
    ASSERT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.defaultModelId(), "telco_xgb");

    const auto record = registry.getModel("telco_xgb");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->metadata.featureCount, 23u);
    EXPECT_EQ(record->metadata.modelFormat, "xgboost_json");
    EXPECT_EQ(record->metadata.trainingTimestamp, "2025-06-01T12:00:00Z");
    EXPECT_DOUBLE_EQ(record->metadata.metrics.at("auc"), 0.84);
    EXPECT_EQ(record->model->formatName(), "xgboost_json");
    EXPECT_EQ(registry.getModel("missing"), nullptr);
}

TEST_F(PredictionServiceTest, DuplicateModelIdIsRejected) {
    const auto schema = std::make_shared<const SchemaStore>(testsupport::telcoSchema());
    ModelMetadata metadata;
    metadata.modelId = "telco_xgb";
    EXPECT_THROW(registry.registerModel(metadata, schema,
                                        loadChurnModel(testsupport::dataPath("telco_trees.json"),
                                                       ModelFormat::XGBOOST_JSON, *schema),
                                        PipelineOptions{}),
                 ChurnServe::ConfigurationException);

    metadata.modelId = "";
    EXPECT_THROW(registry.registerModel(metadata, schema, nullptr, PipelineOptions{}),
                 ChurnServe::ConfigurationException);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(PredictionServiceTest, ScoresArrayBody) {
    const JsonValue response = predict(std::string("[") + kCustomer + "," + kLoyalCustomer + "]", 200);

    EXPECT_EQ(response.find("model_id")->stringValue, "telco_xgb");
    EXPECT_DOUBLE_EQ(response.find("count")->numberValue, 2.0);

    const auto& probabilities = response.find("churn_probabilities")->arrayValue;
    ASSERT_EQ(probabilities.size(), 2u);
    EXPECT_NEAR(probabilities[0].numberValue, sigmoid(0.6), 1e-9);
    EXPECT_NEAR(probabilities[1].numberValue, sigmoid(-1.4), 1e-9);

    const auto& results = response.find("results")->arrayValue;
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].find("status")->stringValue, "ok");
    EXPECT_DOUBLE_EQ(results[0].find("imputed_fields")->numberValue, 0.0);
    EXPECT_DOUBLE_EQ(results[1].find("imputed_fields")->numberValue, 1.0);
}

TEST_F(PredictionServiceTest, ScoresObjectBodyWithModelId) {
    const JsonValue response =
        predict(std::string(R"({"model_id": "telco_xgb", "records": [)") + kCustomer + "]}", 200);
    EXPECT_EQ(response.find("churn_probabilities")->arrayValue.size(), 1u);

    const JsonValue unknown = predict(std::string(R"({"model_id": "other", "records": [)") + kCustomer + "]}", 400);
    EXPECT_NE(unknown.find("error")->stringValue.find("Unknown model_id"), std::string::npos);

    predict(std::string(R"({"model_id": 7, "records": [)") + kCustomer + "]}", 400);
    predict(R"({"customers": []})", 400);
}

TEST_F(PredictionServiceTest, FailedRecordsKeepTheirSlot) {
    const JsonValue response = predict(
        std::string("[") + kCustomer + "," + kCustomerWithoutTenure + ",\"not a record\"," + kCustomer + "]", 200);

    const auto& probabilities = response.find("churn_probabilities")->arrayValue;
    ASSERT_EQ(probabilities.size(), 4u);
    EXPECT_TRUE(probabilities[0].isNumber());
    EXPECT_TRUE(probabilities[1].isNull());
    EXPECT_TRUE(probabilities[2].isNull());
    EXPECT_TRUE(probabilities[3].isNumber());

    const auto& results = response.find("results")->arrayValue;
    const JsonValue* missing = results[1].find("error");
    ASSERT_NE(missing, nullptr);
    EXPECT_EQ(results[1].find("status")->stringValue, "failed");
    EXPECT_EQ(missing->find("code")->stringValue, "missing_field");
    EXPECT_EQ(missing->find("field")->stringValue, "tenure");
    EXPECT_NE(missing->find("message")->stringValue.find("record 1"), std::string::npos);

    const JsonValue* invalid = results[2].find("error");
    ASSERT_NE(invalid, nullptr);
    EXPECT_EQ(invalid->find("code")->stringValue, "invalid_record");
    EXPECT_NE(invalid->find("message")->stringValue.find("record 2"), std::string::npos);
    EXPECT_DOUBLE_EQ(results[3].find("index")->numberValue, 3.0);
}

TEST_F(PredictionServiceTest, NestedValuesFailOnlyThatRecord) {
    const JsonValue response =
        predict(std::string("[") + kCustomer + R"(, {"tenure": [1, 2], "Contract": "One year"}])", 200);
    const auto& results = response.find("results")->arrayValue;
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].find("status")->stringValue, "ok");
    EXPECT_EQ(results[1].find("error")->find("code")->stringValue, "invalid_record");
    EXPECT_EQ(results[1].find("error")->find("field")->stringValue, "tenure");
}

TEST_F(PredictionServiceTest, RejectsMalformedEmptyAndOversizedRequests) {
    const JsonValue malformed = predict("[{\"tenure\": 1", 400);
    EXPECT_NE(malformed.find("error"), nullptr);
    EXPECT_NE(malformed.find("latency_ms"), nullptr);

    predict("[]", 400);
    predict("42", 400);

    std::string oversized = "[";
    for (int i = 0; i < 5; ++i) {
        oversized += (i > 0 ? "," : "") + std::string(kCustomer);
    }
    oversized += "]";
    const JsonValue tooMany = predict(oversized, 400);
    EXPECT_NE(tooMany.find("error")->stringValue.find("max_batch_records"), std::string::npos);
}

TEST_F(PredictionServiceTest, MetricsTrackRequestsAndChurners) {
    predict(std::string("[") + kCustomer + "," + kLoyalCustomer + "," + kCustomerWithoutTenure + "]", 200);
    predict("[]", 400);

    const MonitoringSnapshot snapshot = monitor.snapshot();
    EXPECT_EQ(snapshot.totalRequests, 2u);
    EXPECT_EQ(snapshot.predictRequests, 2u);
    EXPECT_EQ(snapshot.errorRequests, 1u);
    EXPECT_EQ(snapshot.recordsScored, 2u);
    EXPECT_EQ(snapshot.recordsFailed, 1u);
    EXPECT_EQ(snapshot.predictedChurners, 1u);
    EXPECT_EQ(snapshot.probabilities.count, 2u);
    EXPECT_NEAR(snapshot.probabilities.max, sigmoid(0.6), 1e-9);
    EXPECT_NEAR(snapshot.probabilities.min, sigmoid(-1.4), 1e-9);

    const HttpReply metrics = service.handleMetrics();
    EXPECT_EQ(metrics.status, 200);
    const JsonValue body = parseJsonText(metrics.body);
    EXPECT_DOUBLE_EQ(body.find("records_scored")->numberValue, 2.0);
    EXPECT_DOUBLE_EQ(body.find("churn_probability")->find("count")->numberValue, 2.0);
}

TEST_F(PredictionServiceTest, HealthAndModelListing) {
    const HttpReply health = service.handleHealth();
    EXPECT_EQ(health.status, 200);
    const JsonValue healthBody = parseJsonText(health.body);
    EXPECT_EQ(healthBody.find("status")->stringValue, "ok");
    EXPECT_EQ(healthBody.find("default_model")->stringValue, "telco_xgb");

    const JsonValue models = parseJsonText(service.handleModels().body);
    const auto& list = models.find("models")->arrayValue;
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].find("model_id")->stringValue, "telco_xgb");
    EXPECT_DOUBLE_EQ(list[0].find("feature_count")->numberValue, 23.0);
    EXPECT_DOUBLE_EQ(list[0].find("metrics")->find("accuracy")->numberValue, 0.79);
}

TEST(PredictionServiceEmptyTest, ReportsMissingModels) {
    ModelRegistry registry;
    RequestMonitor monitor;
    PredictionService service(registry, monitor);

    EXPECT_EQ(service.handleHealth().status, 503);
    const HttpReply reply = service.handlePredict(std::string("[") + kCustomer + "]");
    EXPECT_EQ(reply.status, 500);
}

TEST(ModelRegistryTest, RejectsMalformedRegistries) {
    ModelRegistry registry;
    EXPECT_THROW(registry.loadFromFile(testsupport::dataPath("telco_schema.json"), PipelineOptions{}),
                 ChurnServe::ConfigurationException);
    EXPECT_THROW(registry.loadFromFile(testsupport::dataPath("absent_registry.json"), PipelineOptions{}),
                 ChurnServe::IOException);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(ModelRecordTest, ConcurrentDenseNetScoringMatchesSerial) {
    ModelMetadata metadata;
    metadata.modelId = "telco_net";
    const ModelRecord record(std::move(metadata), std::make_shared<const SchemaStore>(testsupport::telcoSchema()),
                             telcoDenseNet(), PipelineOptions{});

    std::vector<RawRecord> batch;
    for (int tenure : {1, 12, 34, 60, 72}) {
        RawRecord customer = testsupport::telcoRecord();
        customer["tenure"] = static_cast<double>(tenure);
        customer["MonthlyCharges"] = 20.0 + tenure;
        batch.push_back(customer);
    }

    const std::vector<RecordOutcome> serial = record.score(batch);
    ASSERT_EQ(serial.size(), batch.size());
    for (const auto& outcome : serial) ASSERT_TRUE(outcome.ok()) << outcome.message;

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                const std::vector<RecordOutcome> again = record.score(batch);
                for (size_t k = 0; k < again.size(); ++k) {
                    if (!again[k].ok() || again[k].probability != serial[k].probability) mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& worker : workers) worker.join();
    EXPECT_EQ(mismatches.load(), 0);
}
