#include "BatchScoring.h"
#include "ChurnModel.h"
#include "ChurnServeExceptions.h"
#include "PredictionService.h"
#include "SchemaBuilder.h"
#include "SchemaStore.h"
#include "ServiceConfig.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {
void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " <command> [input.csv] [options]\n"
              << "Commands:\n"
              << "  serve                            Start the HTTP scoring service\n"
              << "  score <records.csv>              Score customer records offline and print a churn summary\n"
              << "  fit-schema <training.csv>        Freeze feature columns, imputation means and scaling\n"
              << "Options:\n"
              << "  --config <file>                  Load key: value settings (command-line flags win)\n"
              << "  --registry <registry.json>       Serve every model listed in a registry file\n"
              << "  --schema <schema.json>           Schema artifact (fit-schema: reuse its field catalog)\n"
              << "  --catalog <fields.json>          fit-schema field template; empty vocabularies are learned\n"
              << "  --model <path>                   Model artifact used with --schema\n"
              << "  --model-format <fmt>             xgboost_json|dense_binary (default: xgboost_json)\n"
              << "  --model-id <id>                  Identifier for a --schema/--model pair (default: churn_model)\n"
              << "  --host <addr>, --port <N>        Bind address (default: 0.0.0.0:8080)\n"
              << "  --threads <N>                    HTTP worker threads (default: 8)\n"
              << "  --max-batch-records <N>          Records accepted per request, 0 = unlimited (default: 1000)\n"
              << "  --unknown-category <policy>      reject|reference (default: reject)\n"
              << "  --churn-threshold <p>            Probability counted as churn (default: 0.5)\n"
              << "  --delimiter <char>               CSV delimiter character (default: ,)\n"
              << "  --output <file>                  Results CSV (score) or schema JSON (fit-schema)\n"
              << "  --target <col>                   Target column ignored by fit-schema (default: Churn)\n"
              << "  --verbose <true|false>           Log every failed record\n";
}

void loadModels(const ServiceConfig& config, ModelRegistry& registry) {
    const PipelineOptions options = config.pipelineOptions();
    if (!config.registryPath.empty()) {
        registry.loadFromFile(config.registryPath, options);
        return;
    }

    auto schema = std::make_shared<const SchemaStore>(SchemaStore::loadFromFile(config.schemaPath));
    ModelMetadata metadata;
    metadata.modelId = config.modelId;
    metadata.modelPath = config.modelPath;
    metadata.modelFormat = config.modelFormat;
    metadata.schemaPath = config.schemaPath;
    auto model = loadChurnModel(config.modelPath, parseModelFormat(config.modelFormat), *schema);
    registry.registerModel(std::move(metadata), std::move(schema), std::move(model), options);
}

void logSchemaSummary(const ModelRegistry& registry) {
    for (const auto& metadata : registry.metadataSnapshot()) {
        const auto record = registry.getModel(metadata.modelId);
        if (!record) continue;
        const auto unreachable = record->schema->unreachableColumns();
        std::cout << "[ChurnServe] schema model_id=" << metadata.modelId
                  << " features=" << record->schema->featureCount()
                  << " fields=" << record->schema->catalog().fields().size()
                  << " unreachable_columns=" << unreachable.size()
                  << "\n";
        for (const auto& column : unreachable) {
            std::cerr << "[ChurnServe] warning model_id=" << metadata.modelId
                      << " column=\"" << column << "\" is never produced by the field catalog and always encodes as 0\n";
        }
    }
}

int runServe(const ServiceConfig& config) {
    ModelRegistry registry;
    loadModels(config, registry);
    logSchemaSummary(registry);

    RequestMonitor monitor(config.churnThreshold);
    PredictionService service(registry, monitor, config.verbose);
    PredictionService::Config serviceConfig;
    serviceConfig.host = config.host;
    serviceConfig.port = config.port;
    serviceConfig.threadCount = config.threads;
    return service.start(serviceConfig);
}

int runScore(const ServiceConfig& config) {
    ModelRegistry registry;
    loadModels(config, registry);
    logSchemaSummary(registry);
    const auto model = registry.getModel(registry.defaultModelId());

    const RecordBatch batch = readRecordsCsv(config.inputPath, config.delimiter);
    std::cout << "[ChurnServe] scoring records=" << batch.records.size()
              << " model_id=" << model->metadata.modelId << "\n";
    const std::vector<RecordOutcome> outcomes = scoreRecords(*model, batch.records);

    if (config.verbose) {
        for (size_t i = 0; i < outcomes.size(); ++i) {
            if (outcomes[i].ok()) continue;
            std::cout << "[ChurnServe] record_failed record_id=" << batch.recordIds[i]
                      << " code=" << outcomes[i].errorCode
                      << " field=" << outcomes[i].field
                      << "\n";
        }
    }
    if (!config.outputPath.empty()) {
        writeOutcomesCsv(config.outputPath, batch, outcomes, config.churnThreshold, config.delimiter);
        std::cout << "[ChurnServe] results written to " << config.outputPath << "\n";
    }

    std::cout << "Churn Prediction Summary:\n" << formatSummary(summarize(outcomes, config.churnThreshold)) << "\n";
    return 0;
}

int runFitSchema(const ServiceConfig& config) {
    FieldCatalog catalog = FieldCatalog::telcoDefaults();
    if (!config.catalogPath.empty()) {
        catalog = FieldCatalog::loadTemplateFile(config.catalogPath);
    } else if (!config.schemaPath.empty()) {
        catalog = SchemaStore::loadFromFile(config.schemaPath).catalog();
    }
    SchemaFitOptions options;
    options.delimiter = config.delimiter;
    options.targetColumn = config.targetColumn;
    options.modelId = config.modelId;

    const SchemaFitResult result = fitSchemaFromCsv(config.inputPath, std::move(catalog), options);
    result.schema.saveToFile(config.outputPath);
    std::cout << "[ChurnServe] schema written to " << config.outputPath
              << " features=" << result.schema.featureCount()
              << " rows_used=" << result.rowsUsed
              << " rows_skipped=" << result.rowsSkipped
              << "\n";
    return 0;
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printUsage(argv[0]);
        return 0;
    }

    ServiceConfig config;
    try {
        config = ServiceConfig::fromArgs(argc, argv);
    } catch (const ChurnServe::ChurnServeException& e) {
        std::cerr << "[ChurnServe Error] " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    try {
        if (config.command == "serve") return runServe(config);
        if (config.command == "score") return runScore(config);
        return runFitSchema(config);
    } catch (const ChurnServe::ChurnServeException& e) {
        std::cerr << "[ChurnServe Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ChurnServe Exception] " << e.what() << "\n";
        return 1;
    }
}
