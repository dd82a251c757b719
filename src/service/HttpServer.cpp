#include "PredictionService.h"

#include <algorithm>
#include <iostream>

#include <httplib.h>

namespace {
void setJsonResponse(httplib::Response& response, const HttpReply& reply) {
    response.status = reply.status;
    response.set_content(reply.body, "application/json");
}
} // namespace

int PredictionService::start(const Config& config) {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config.threadCount)] {
        return new httplib::ThreadPool(static_cast<int>(threadCount));
    };

    const auto predict = [this](const httplib::Request& request, httplib::Response& response) {
        setJsonResponse(response, handlePredict(request.body));
    };
    server.Post("/predict_churn", predict);
    server.Post("/predict_churn/", predict);

    server.Get("/health", [this](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, handleHealth());
    });
    server.Get("/models", [this](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, handleModels());
    });
    server.Get("/metrics", [this](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, handleMetrics());
    });

    const auto registrySnapshot = registry.metadataSnapshot();
    std::cout << "[ChurnServe] loaded_models=" << registrySnapshot.size()
              << " host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threadCount)
              << "\n";
    for (const auto& model : registrySnapshot) {
        std::cout << "[ChurnServe] model_id=" << model.modelId
                  << " model_format=" << model.modelFormat
                  << " model_path=" << model.modelPath
                  << " schema_path=" << model.schemaPath
                  << " features=" << model.featureCount
                  << " training_timestamp=" << model.trainingTimestamp
                  << " metrics=" << model.metrics.size()
                  << "\n";
    }

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[ChurnServe] failed_to_bind host=" << config.host << " port=" << config.port << "\n";
        return 1;
    }

    return 0;
}
