#pragma once

#include "ChurnModel.h"
#include "EncodingPipeline.h"
#include "SchemaStore.h"

#include <atomic>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct ModelMetadata {
    std::string modelId;
    std::string modelPath;
    std::string modelFormat;
    std::string schemaPath;
    std::string trainingTimestamp;
    size_t featureCount = 0;
    std::map<std::string, double> metrics;
};

struct ModelRecord {
    ModelMetadata metadata;
    std::shared_ptr<const SchemaStore> schema;
    std::unique_ptr<ChurnModel> model;
    EncodingPipeline pipeline;
    mutable std::mutex inferenceMutex;

    ModelRecord(ModelMetadata metadataValue,
                std::shared_ptr<const SchemaStore> schemaValue,
                std::unique_ptr<ChurnModel> modelValue,
                PipelineOptions options);

    std::vector<RecordOutcome> score(const std::vector<RawRecord>& batch) const;
    std::vector<RecordOutcome> score(const std::vector<RawRecord>& batch,
                                     const std::vector<size_t>& recordPositions) const;
};

struct PredictionDistributionStats {
    uint64_t count = 0;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();
    double mean = 0.0;
};

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t predictRequests = 0;
    uint64_t errorRequests = 0;
    uint64_t recordsScored = 0;
    uint64_t recordsFailed = 0;
    uint64_t predictedChurners = 0;
    double averageLatencyMs = 0.0;
    double churnThreshold = 0.5;
    PredictionDistributionStats probabilities;
};

/**
 * @brief Models served by this process, keyed by model_id.
 * @details The first registered model is the default for requests that name none.
 */
class ModelRegistry {
public:
    /**
     * @brief Loads every entry of a registry file together with its schema and model artifact.
     * @details Relative artifact paths resolve against the registry file's directory.
     * @throws ChurnServe::ConfigurationException for a malformed registry,
     * ChurnServe::SchemaLoadError / ChurnServe::ModelException for bad artifacts.
     */
    void loadFromFile(const std::string& registryPath, const PipelineOptions& options);

    /**
     * @throws ChurnServe::ConfigurationException on an empty or duplicate model_id.
     */
    void registerModel(ModelMetadata metadata,
                       std::shared_ptr<const SchemaStore> schema,
                       std::unique_ptr<ChurnModel> model,
                       const PipelineOptions& options);

    std::shared_ptr<const ModelRecord> getModel(const std::string& modelId) const;
    std::string defaultModelId() const;
    std::vector<ModelMetadata> metadataSnapshot() const;
    size_t size() const;

private:
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<const ModelRecord>> models;
    std::vector<std::string> insertionOrder;
};

class RequestMonitor {
public:
    explicit RequestMonitor(double churnThreshold = 0.5);

    void recordSuccess(const std::string& endpoint, double latencyMs, const std::vector<RecordOutcome>& outcomes);
    void recordError(const std::string& endpoint, double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    const double churnThreshold;

    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> predictRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> recordsScored{0};
    std::atomic<uint64_t> recordsFailed{0};
    std::atomic<uint64_t> predictedChurners{0};
    std::atomic<uint64_t> totalLatencyMicros{0};

    mutable std::mutex distributionMutex;
    uint64_t probabilityCount = 0;
    double probabilitySum = 0.0;
    double probabilityMin = std::numeric_limits<double>::infinity();
    double probabilityMax = -std::numeric_limits<double>::infinity();
};

struct HttpReply {
    int status = 200;
    std::string body;
};

/**
 * @brief HTTP front end for churn scoring.
 * @details The handle* methods hold all request logic and are independent of the transport;
 * start() binds them to an HTTP server.
 */
class PredictionService {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 8080;
        size_t threadCount = 8;
    };

    PredictionService(ModelRegistry& registry, RequestMonitor& monitor, bool verbose = false);

    /**
     * @brief Scores a JSON batch: either an array of records or {"model_id": ..., "records": [...]}.
     * @return 200 with one result per record, 400 for a malformed/empty/oversized request, 500 when scoring fails.
     */
    HttpReply handlePredict(const std::string& body);
    HttpReply handleHealth() const;
    HttpReply handleModels() const;
    HttpReply handleMetrics() const;

    int start(const Config& config);

private:
    ModelRegistry& registry;
    RequestMonitor& monitor;
    bool verbose;
};
