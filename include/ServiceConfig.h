#pragma once

#include "EncodingPipeline.h"

#include <string>

struct ServiceConfig {
    std::string command;            // serve|score|fit-schema
    std::string inputPath;          // records CSV for score, training CSV for fit-schema

    std::string host = "0.0.0.0";
    int port = 8080;
    size_t threads = 8;

    // Either a registry file, or a single schema + model pair.
    std::string registryPath;
    std::string schemaPath;
    std::string modelPath;
    std::string modelFormat = "xgboost_json"; // xgboost_json|dense_binary
    std::string modelId = "churn_model";

    size_t maxBatchRecords = 1000;
    std::string unknownCategory = "reject";   // reject|reference
    double churnThreshold = 0.5;

    char delimiter = ',';
    std::string catalogPath;        // fit-schema field template; vocabularies may be left empty
    std::string outputPath;
    std::string targetColumn = "Churn";
    bool verbose = false;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argv[1] names the command.
     * @post Returns a validated config object.
     * @throws ChurnServe::ConfigurationException on invalid arguments or values.
     */
    static ServiceConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws ChurnServe::ConfigurationException on parse/validation failures, naming the line.
     */
    static ServiceConfig fromFile(const std::string& configPath, const ServiceConfig& base);

    /**
     * @throws ChurnServe::ConfigurationException on invalid values or a command missing its inputs.
     */
    void validate() const;

    PipelineOptions pipelineOptions() const;
};
