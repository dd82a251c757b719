#include <gtest/gtest.h>

#include "ChurnServeExceptions.h"
#include "ServiceConfig.h"
#include "TestSupport.h"

#include <string>
#include <vector>

namespace {
ServiceConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "churnserve");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);
    return ServiceConfig::fromArgs(static_cast<int>(args.size()), argv.data());
}

std::string errorOf(const std::vector<std::string>& args) {
    try {
        parse(args);
    } catch (const ChurnServe::ConfigurationException& e) {
        return e.what();
    }
    return "";
}
} // namespace

TEST(ServiceConfigTest, ServeWithRegistryUsesDefaults) {
    const ServiceConfig config = parse({"serve", "--registry", "models/registry.json"});
    EXPECT_EQ(config.command, "serve");
    EXPECT_EQ(config.registryPath, "models/registry.json");
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.threads, 8u);
    EXPECT_EQ(config.maxBatchRecords, 1000u);
    EXPECT_DOUBLE_EQ(config.churnThreshold, 0.5);
    EXPECT_FALSE(config.verbose);

    const PipelineOptions options = config.pipelineOptions();
    EXPECT_EQ(options.unknownCategoryPolicy, UnknownCategoryPolicy::REJECT);
    EXPECT_EQ(options.maxBatchRecords, 1000u);
}

TEST(ServiceConfigTest, ScoreTakesPositionalInputAndFlags) {
    const ServiceConfig config = parse({"score", "customers.csv", "--schema", "s.json", "--model", "m.bin",
                                        "--model-format", "dense_binary", "--model-id", "net_v2", "--delimiter",
                                        "tab", "--output", "scored.csv", "--max-batch-records", "0",
                                        "--unknown-category", "Reference"});
    EXPECT_EQ(config.inputPath, "customers.csv");
    EXPECT_EQ(config.schemaPath, "s.json");
    EXPECT_EQ(config.modelPath, "m.bin");
    EXPECT_EQ(config.modelFormat, "dense_binary");
    EXPECT_EQ(config.modelId, "net_v2");
    EXPECT_EQ(config.delimiter, '\t');
    EXPECT_EQ(config.outputPath, "scored.csv");
    EXPECT_EQ(config.pipelineOptions().maxBatchRecords, 0u);
    EXPECT_EQ(config.pipelineOptions().unknownCategoryPolicy, UnknownCategoryPolicy::REFERENCE);
}

TEST(ServiceConfigTest, ConfigFileIsOverriddenByCommandLine) {
    const ServiceConfig config =
        parse({"serve", "--port", "7000", "--config", testsupport::dataPath("service.conf")});
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.threads, 4u);
    EXPECT_EQ(config.registryPath, "registry.json");
    EXPECT_EQ(config.maxBatchRecords, 250u);
    EXPECT_EQ(config.unknownCategory, "reference");
    EXPECT_DOUBLE_EQ(config.churnThreshold, 0.4);
    EXPECT_TRUE(config.verbose);
}

TEST(ServiceConfigTest, ConfigFileErrorsNameTheLine) {
    try {
        ServiceConfig::fromFile(testsupport::dataPath("bad_service.conf"), ServiceConfig{});
        FAIL() << "expected a parse error";
    } catch (const ChurnServe::ConfigurationException& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("line 2"), std::string::npos) << message;
        EXPECT_NE(message.find("port"), std::string::npos) << message;
    }

    EXPECT_THROW(ServiceConfig::fromFile(testsupport::dataPath("absent.conf"), ServiceConfig{}),
                 ChurnServe::ConfigurationException);
}

TEST(ServiceConfigTest, RejectsInvalidValues) {
    EXPECT_NE(errorOf({}), "");
    EXPECT_NE(errorOf({"predict", "--registry", "r.json"}).find("Unknown command"), std::string::npos);
    EXPECT_NE(errorOf({"serve", "--registry", "r.json", "--port", "70000"}).find("port"), std::string::npos);
    EXPECT_NE(errorOf({"serve", "--registry", "r.json", "--port", "80x"}).find("Invalid integer"), std::string::npos);
    EXPECT_NE(errorOf({"serve", "--registry", "r.json", "--threads", "0"}).find("threads"), std::string::npos);
    EXPECT_NE(errorOf({"serve", "--registry", "r.json", "--churn-threshold", "1.5"}).find("churn_threshold"),
              std::string::npos);
    EXPECT_NE(errorOf({"serve", "--registry", "r.json", "--unknown-category", "bucket"}).find("unknown_category"),
              std::string::npos);
    EXPECT_NE(errorOf({"serve", "--registry", "r.json", "--model-format", "onnx"}).find("model format"),
              std::string::npos);
    EXPECT_NE(errorOf({"serve", "--registry", "r.json", "--verbose", "maybe"}).find("boolean"), std::string::npos);
    EXPECT_NE(errorOf({"serve", "--registry", "r.json", "--colour", "blue"}).find("Unknown config key"),
              std::string::npos);
    EXPECT_NE(errorOf({"serve", "--registry"}).find("Unexpected argument"), std::string::npos);
}

TEST(ServiceConfigTest, CommandsRequireTheirInputs) {
    EXPECT_NE(errorOf({"serve"}).find("--registry"), std::string::npos);
    EXPECT_NE(errorOf({"serve", "--schema", "s.json"}).find("--registry"), std::string::npos);
    EXPECT_NE(errorOf({"score", "--registry", "r.json"}).find("records CSV"), std::string::npos);
    EXPECT_NE(errorOf({"fit-schema", "train.csv"}).find("--output"), std::string::npos);
    EXPECT_NE(errorOf({"fit-schema", "--output", "schema.json"}).find("training CSV"), std::string::npos);
    EXPECT_NE(errorOf({"serve", "--schema", "s.json", "--model", "m.json", "--model-id", ""}).find("model_id"),
              std::string::npos);

    const ServiceConfig fit = parse({"fit-schema", "train.csv", "--output", "schema.json", "--target", "Exited"});
    EXPECT_EQ(fit.inputPath, "train.csv");
    EXPECT_EQ(fit.targetColumn, "Exited");

    const ServiceConfig templated = parse({"fit-schema", "train.csv", "--output", "schema.json", "--catalog",
                                           "fields.json"});
    EXPECT_EQ(templated.catalogPath, "fields.json");
}
