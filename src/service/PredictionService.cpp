#include "PredictionService.h"

#include "ChurnServeExceptions.h"
#include "JsonValue.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace {
using Clock = std::chrono::steady_clock;

const std::string kPredictEndpoint = "/predict_churn";

long long toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<long long>(std::llround(latencyMs * 1000.0));
}

double elapsedMs(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

std::string requireString(const JsonValue& entry, const std::string& key) {
    const JsonValue* node = entry.find(key);
    if (node == nullptr || !node->isString() || node->stringValue.empty()) {
        throw ChurnServe::ConfigurationException("Each model entry requires string field '" + key + "'");
    }
    return node->stringValue;
}

std::string resolveArtifactPath(const std::filesystem::path& baseDir, const std::string& path) {
    const std::filesystem::path candidate(path);
    if (candidate.is_absolute() || baseDir.empty()) return candidate.string();
    return (baseDir / candidate).lexically_normal().string();
}

void logMonitoringLine(const std::string& endpoint, double latencyMs, const MonitoringSnapshot& snapshot) {
    std::ostringstream line;
    line << "[ChurnServe][Monitor] endpoint=" << endpoint
         << " total_requests=" << snapshot.totalRequests
         << " errors=" << snapshot.errorRequests
         << " latency_ms=" << latencyMs
         << " avg_latency_ms=" << snapshot.averageLatencyMs
         << " records_scored=" << snapshot.recordsScored
         << " records_failed=" << snapshot.recordsFailed;

    if (snapshot.probabilities.count > 0) {
        line << " churn_mean=" << snapshot.probabilities.mean
             << " churn_min=" << snapshot.probabilities.min
             << " churn_max=" << snapshot.probabilities.max
             << " churners=" << snapshot.predictedChurners;
    }

    std::cout << line.str() << "\n";
}

// Record i of the request; nested values cannot be encoded and fail only this record.
RawRecord rawRecordFromJson(const JsonValue& item, size_t index) {
    if (!item.isObject()) {
        throw ChurnServe::InvalidRecordError(index, "", "record must be a JSON object");
    }
    RawRecord record;
    record.reserve(item.objectValue.size());
    for (const auto& kv : item.objectValue) {
        const JsonValue& value = kv.second;
        switch (value.type) {
            case JsonValue::Type::Null: record.emplace(kv.first, RawValue{}); break;
            case JsonValue::Type::Bool: record.emplace(kv.first, RawValue{value.booleanValue}); break;
            case JsonValue::Type::Number: record.emplace(kv.first, RawValue{value.numberValue}); break;
            case JsonValue::Type::String: record.emplace(kv.first, RawValue{value.stringValue}); break;
            case JsonValue::Type::Array:
            case JsonValue::Type::Object:
                throw ChurnServe::InvalidRecordError(index, kv.first, "nested arrays and objects are not supported");
        }
    }
    return record;
}

RecordOutcome failedOutcome(const ChurnServe::RecordError& error) {
    RecordOutcome outcome;
    outcome.status = RecordStatus::FAILED;
    outcome.errorCode = error.code();
    outcome.field = error.field();
    outcome.message = error.what();
    return outcome;
}

std::string makePredictSuccessResponse(const std::string& modelId,
                                       const std::vector<RecordOutcome>& outcomes,
                                       double latencyMs) {
    std::ostringstream out;
    out << "{"
        << "\"model_id\":\"" << escapeJsonString(modelId) << "\","
        << "\"count\":" << outcomes.size() << ","
        << "\"results\":[";
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const RecordOutcome& outcome = outcomes[i];
        if (i > 0) out << ',';
        out << "{\"index\":" << i;
        if (outcome.ok()) {
            out << ",\"status\":\"ok\""
                << ",\"churn_probability\":" << formatJsonNumber(outcome.probability)
                << ",\"imputed_fields\":" << outcome.imputedFields;
        } else {
            out << ",\"status\":\"failed\""
                << ",\"error\":{\"code\":\"" << escapeJsonString(outcome.errorCode) << "\""
                << ",\"field\":\"" << escapeJsonString(outcome.field) << "\""
                << ",\"message\":\"" << escapeJsonString(outcome.message) << "\"}";
        }
        out << '}';
    }
    out << "],\"churn_probabilities\":[";
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (i > 0) out << ',';
        out << (outcomes[i].ok() ? formatJsonNumber(outcomes[i].probability) : std::string("null"));
    }
    out << "],\"latency_ms\":" << formatJsonNumber(latencyMs) << "}";
    return out.str();
}

std::string makeErrorResponse(const std::string& error, double latencyMs) {
    std::ostringstream out;
    out << "{"
        << "\"error\":\"" << escapeJsonString(error) << "\","
        << "\"latency_ms\":" << formatJsonNumber(latencyMs)
        << "}";
    return out.str();
}
} // namespace

ModelRecord::ModelRecord(ModelMetadata metadataValue,
                         std::shared_ptr<const SchemaStore> schemaValue,
                         std::unique_ptr<ChurnModel> modelValue,
                         PipelineOptions options)
    : metadata(std::move(metadataValue)),
      schema(std::move(schemaValue)),
      model(std::move(modelValue)),
      pipeline(schema, options) {
    if (!model) {
        throw ChurnServe::ModelException("model record '" + metadata.modelId + "' has no model");
    }
    if (model->inputDimension() != schema->featureCount()) {
        throw ChurnServe::ModelException("model '" + metadata.modelId + "' expects " +
                                         std::to_string(model->inputDimension()) + " features but its schema defines " +
                                         std::to_string(schema->featureCount()));
    }
    metadata.featureCount = schema->featureCount();
}

std::vector<RecordOutcome> ModelRecord::score(const std::vector<RawRecord>& batch) const {
    return pipeline.scoreBatch(batch, *model, &inferenceMutex);
}

std::vector<RecordOutcome> ModelRecord::score(const std::vector<RawRecord>& batch,
                                              const std::vector<size_t>& recordPositions) const {
    return pipeline.scoreBatch(batch, recordPositions, *model, &inferenceMutex);
}

void ModelRegistry::loadFromFile(const std::string& registryPath, const PipelineOptions& options) {
    const JsonValue root = parseJsonFile(registryPath);

    const JsonValue* modelsNode = root.find("models");
    if (!root.isObject() || modelsNode == nullptr || !modelsNode->isArray()) {
        throw ChurnServe::ConfigurationException("Registry must contain a top-level 'models' array");
    }
    if (modelsNode->arrayValue.empty()) {
        throw ChurnServe::ConfigurationException("Registry has no model entries");
    }

    const std::filesystem::path baseDir = std::filesystem::path(registryPath).parent_path();

    for (const auto& item : modelsNode->arrayValue) {
        if (!item.isObject()) {
            throw ChurnServe::ConfigurationException("Each entry in 'models' must be an object");
        }

        ModelMetadata metadata;
        metadata.modelId = requireString(item, "model_id");
        metadata.modelPath = resolveArtifactPath(baseDir, requireString(item, "model_path"));
        metadata.schemaPath = resolveArtifactPath(baseDir, requireString(item, "schema_path"));
        metadata.modelFormat = "xgboost_json";
        if (const JsonValue* formatNode = item.find("model_format"); formatNode != nullptr && formatNode->isString()) {
            metadata.modelFormat = formatNode->stringValue;
        }
        if (const JsonValue* timestampNode = item.find("training_timestamp");
            timestampNode != nullptr && timestampNode->isString()) {
            metadata.trainingTimestamp = timestampNode->stringValue;
        }
        if (const JsonValue* metricsNode = item.find("metrics"); metricsNode != nullptr && metricsNode->isObject()) {
            for (const auto& kv : metricsNode->objectValue) {
                if (kv.second.isNumber()) metadata.metrics[kv.first] = kv.second.numberValue;
            }
        }

        auto schema = std::make_shared<const SchemaStore>(SchemaStore::loadFromFile(metadata.schemaPath));
        if (!schema->modelId().empty() && schema->modelId() != metadata.modelId) {
            throw ChurnServe::SchemaLoadError(metadata.schemaPath + " was frozen for model '" + schema->modelId() +
                                              "', not '" + metadata.modelId + "'");
        }
        std::unique_ptr<ChurnModel> model =
            loadChurnModel(metadata.modelPath, parseModelFormat(metadata.modelFormat), *schema);

        registerModel(std::move(metadata), std::move(schema), std::move(model), options);
    }
}

void ModelRegistry::registerModel(ModelMetadata metadata,
                                  std::shared_ptr<const SchemaStore> schema,
                                  std::unique_ptr<ChurnModel> model,
                                  const PipelineOptions& options) {
    if (metadata.modelId.empty()) {
        throw ChurnServe::ConfigurationException("model_id cannot be empty");
    }
    const std::string modelId = metadata.modelId;
    auto record = std::make_shared<const ModelRecord>(std::move(metadata), std::move(schema), std::move(model), options);

    std::unique_lock<std::shared_mutex> lock(mutex);
    if (models.find(modelId) != models.end()) {
        throw ChurnServe::ConfigurationException("Duplicate model_id in registry: " + modelId);
    }
    models.emplace(modelId, std::move(record));
    insertionOrder.push_back(modelId);
}

std::shared_ptr<const ModelRecord> ModelRegistry::getModel(const std::string& modelId) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = models.find(modelId);
    if (it == models.end()) {
        return nullptr;
    }
    return it->second;
}

std::string ModelRegistry::defaultModelId() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    if (insertionOrder.empty()) {
        return "";
    }
    return insertionOrder.front();
}

std::vector<ModelMetadata> ModelRegistry::metadataSnapshot() const {
    std::vector<ModelMetadata> out;
    std::shared_lock<std::shared_mutex> lock(mutex);
    out.reserve(insertionOrder.size());
    for (const auto& modelId : insertionOrder) {
        auto it = models.find(modelId);
        if (it != models.end() && it->second) {
            out.push_back(it->second->metadata);
        }
    }
    return out;
}

size_t ModelRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return models.size();
}

RequestMonitor::RequestMonitor(double churnThresholdValue) : churnThreshold(churnThresholdValue) {}

void RequestMonitor::recordSuccess(const std::string& endpoint,
                                   double latencyMs,
                                   const std::vector<RecordOutcome>& outcomes) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == kPredictEndpoint) {
        predictRequests.fetch_add(1, std::memory_order_relaxed);
    }
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);

    uint64_t scored = 0;
    uint64_t failed = 0;
    uint64_t churners = 0;
    std::lock_guard<std::mutex> lock(distributionMutex);
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) {
            ++failed;
            continue;
        }
        ++scored;
        if (outcome.probability >= churnThreshold) ++churners;
        probabilityCount += 1;
        probabilitySum += outcome.probability;
        probabilityMin = std::min(probabilityMin, outcome.probability);
        probabilityMax = std::max(probabilityMax, outcome.probability);
    }
    recordsScored.fetch_add(scored, std::memory_order_relaxed);
    recordsFailed.fetch_add(failed, std::memory_order_relaxed);
    predictedChurners.fetch_add(churners, std::memory_order_relaxed);
}

void RequestMonitor::recordError(const std::string& endpoint, double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    errorRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == kPredictEndpoint) {
        predictRequests.fetch_add(1, std::memory_order_relaxed);
    }
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.churnThreshold = churnThreshold;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.predictRequests = predictRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);

    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }

    std::lock_guard<std::mutex> lock(distributionMutex);
    out.recordsScored = recordsScored.load(std::memory_order_relaxed);
    out.recordsFailed = recordsFailed.load(std::memory_order_relaxed);
    out.predictedChurners = predictedChurners.load(std::memory_order_relaxed);
    out.probabilities.count = probabilityCount;
    if (probabilityCount > 0) {
        out.probabilities.mean = probabilitySum / static_cast<double>(probabilityCount);
        out.probabilities.min = probabilityMin;
        out.probabilities.max = probabilityMax;
    }
    return out;
}

PredictionService::PredictionService(ModelRegistry& registryRef, RequestMonitor& monitorRef, bool verboseValue)
    : registry(registryRef), monitor(monitorRef), verbose(verboseValue) {}

HttpReply PredictionService::handlePredict(const std::string& body) {
    const auto started = Clock::now();
    HttpReply reply;
    try {
        const JsonValue payload = parseJsonText(body);

        const JsonValue* recordsNode = nullptr;
        std::string modelId;
        if (payload.isArray()) {
            recordsNode = &payload;
        } else if (payload.isObject()) {
            recordsNode = payload.find("records");
            if (recordsNode == nullptr || !recordsNode->isArray()) {
                throw ChurnServe::RequestException("Request object requires a 'records' array");
            }
            if (const JsonValue* modelIdNode = payload.find("model_id"); modelIdNode != nullptr) {
                if (!modelIdNode->isString()) {
                    throw ChurnServe::RequestException("'model_id' must be a string");
                }
                modelId = modelIdNode->stringValue;
            }
        } else {
            throw ChurnServe::RequestException("Request body must be a JSON array of records or an object with 'records'");
        }

        if (modelId.empty()) {
            modelId = registry.defaultModelId();
            if (modelId.empty()) {
                throw ChurnServe::ScoringError("No models are registered");
            }
        }
        const std::shared_ptr<const ModelRecord> modelRecord = registry.getModel(modelId);
        if (!modelRecord) {
            throw ChurnServe::RequestException("Unknown model_id: " + modelId);
        }

        const std::vector<JsonValue>& items = recordsNode->arrayValue;
        const size_t maxRecords = modelRecord->pipeline.options().maxBatchRecords;
        if (items.empty()) {
            throw ChurnServe::RequestException("batch contains no records");
        }
        if (maxRecords > 0 && items.size() > maxRecords) {
            throw ChurnServe::RequestException("batch of " + std::to_string(items.size()) +
                                               " records exceeds max_batch_records=" + std::to_string(maxRecords));
        }

        std::vector<RecordOutcome> outcomes(items.size());
        std::vector<RawRecord> batch;
        std::vector<size_t> batchSlots;
        batch.reserve(items.size());
        batchSlots.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            try {
                batch.push_back(rawRecordFromJson(items[i], i));
                batchSlots.push_back(i);
            } catch (const ChurnServe::RecordError& e) {
                outcomes[i] = failedOutcome(e);
            }
        }

        if (!batch.empty()) {
            std::vector<RecordOutcome> scored = modelRecord->score(batch, batchSlots);
            for (size_t k = 0; k < scored.size(); ++k) {
                outcomes[batchSlots[k]] = std::move(scored[k]);
            }
        }

        if (verbose) {
            for (size_t i = 0; i < outcomes.size(); ++i) {
                if (outcomes[i].ok()) continue;
                std::cout << "[ChurnServe] record_failed model_id=" << modelId
                          << " index=" << i
                          << " code=" << outcomes[i].errorCode
                          << " field=" << outcomes[i].field
                          << "\n";
            }
        }

        const double latencyMs = elapsedMs(started);
        monitor.recordSuccess(kPredictEndpoint, latencyMs, outcomes);
        reply.status = 200;
        reply.body = makePredictSuccessResponse(modelId, outcomes, latencyMs);
        logMonitoringLine(kPredictEndpoint, latencyMs, monitor.snapshot());
    } catch (const ChurnServe::ScoringError& e) {
        const double latencyMs = elapsedMs(started);
        monitor.recordError(kPredictEndpoint, latencyMs);
        reply.status = 500;
        reply.body = makeErrorResponse(e.what(), latencyMs);
        std::cerr << "[ChurnServe] scoring_failed error=\"" << e.what() << "\"\n";
        logMonitoringLine(kPredictEndpoint, latencyMs, monitor.snapshot());
    } catch (const ChurnServe::ChurnServeException& e) {
        const double latencyMs = elapsedMs(started);
        monitor.recordError(kPredictEndpoint, latencyMs);
        reply.status = 400;
        reply.body = makeErrorResponse(e.what(), latencyMs);
        logMonitoringLine(kPredictEndpoint, latencyMs, monitor.snapshot());
    } catch (const std::exception& e) {
        const double latencyMs = elapsedMs(started);
        monitor.recordError(kPredictEndpoint, latencyMs);
        reply.status = 500;
        reply.body = makeErrorResponse(e.what(), latencyMs);
        std::cerr << "[ChurnServe] internal_error error=\"" << e.what() << "\"\n";
        logMonitoringLine(kPredictEndpoint, latencyMs, monitor.snapshot());
    }
    return reply;
}

HttpReply PredictionService::handleHealth() const {
    const size_t modelCount = registry.size();
    std::ostringstream out;
    out << "{\"status\":\"" << (modelCount > 0 ? "ok" : "no_models") << "\""
        << ",\"models\":" << modelCount
        << ",\"default_model\":\"" << escapeJsonString(registry.defaultModelId()) << "\"}";
    return HttpReply{modelCount > 0 ? 200 : 503, out.str()};
}

HttpReply PredictionService::handleModels() const {
    const auto snapshot = registry.metadataSnapshot();
    std::ostringstream out;
    out << "{\"models\":[";
    for (size_t i = 0; i < snapshot.size(); ++i) {
        const ModelMetadata& model = snapshot[i];
        if (i > 0) out << ',';
        out << "{\"model_id\":\"" << escapeJsonString(model.modelId) << "\""
            << ",\"model_path\":\"" << escapeJsonString(model.modelPath) << "\""
            << ",\"model_format\":\"" << escapeJsonString(model.modelFormat) << "\""
            << ",\"schema_path\":\"" << escapeJsonString(model.schemaPath) << "\""
            << ",\"training_timestamp\":\"" << escapeJsonString(model.trainingTimestamp) << "\""
            << ",\"feature_count\":" << model.featureCount
            << ",\"metrics\":{";
        bool first = true;
        for (const auto& kv : model.metrics) {
            if (!first) out << ',';
            first = false;
            out << '"' << escapeJsonString(kv.first) << "\":" << formatJsonNumber(kv.second);
        }
        out << "}}";
    }
    out << "]}";
    return HttpReply{200, out.str()};
}

HttpReply PredictionService::handleMetrics() const {
    const MonitoringSnapshot snapshot = monitor.snapshot();
    std::ostringstream out;
    out << "{\"total_requests\":" << snapshot.totalRequests
        << ",\"predict_requests\":" << snapshot.predictRequests
        << ",\"error_requests\":" << snapshot.errorRequests
        << ",\"records_scored\":" << snapshot.recordsScored
        << ",\"records_failed\":" << snapshot.recordsFailed
        << ",\"predicted_churners\":" << snapshot.predictedChurners
        << ",\"churn_threshold\":" << formatJsonNumber(snapshot.churnThreshold)
        << ",\"avg_latency_ms\":" << formatJsonNumber(snapshot.averageLatencyMs)
        << ",\"churn_probability\":{\"count\":" << snapshot.probabilities.count
        << ",\"mean\":" << formatJsonNumber(snapshot.probabilities.count > 0 ? snapshot.probabilities.mean
                                                                 : std::numeric_limits<double>::quiet_NaN())
        << ",\"min\":" << formatJsonNumber(snapshot.probabilities.min)
        << ",\"max\":" << formatJsonNumber(snapshot.probabilities.max)
        << "}}";
    return HttpReply{200, out.str()};
}
