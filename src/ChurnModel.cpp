#include "ChurnModel.h"

#include "ChurnServeExceptions.h"
#include "CommonUtils.h"
#include "DenseNetModel.h"
#include "TreeEnsembleModel.h"

ModelFormat parseModelFormat(const std::string& name) {
    const std::string normalized = CommonUtils::toLower(CommonUtils::trim(name));
    if (normalized == "xgboost_json" || normalized == "xgboost") return ModelFormat::XGBOOST_JSON;
    if (normalized == "dense_binary" || normalized == "dense") return ModelFormat::DENSE_BINARY;
    throw ChurnServe::ConfigurationException("Invalid model format: " + name + " (expected xgboost_json|dense_binary)");
}

std::unique_ptr<ChurnModel> loadChurnModel(const std::string& path, ModelFormat format, const SchemaStore& schema) {
    std::unique_ptr<ChurnModel> model;
    try {
        if (format == ModelFormat::XGBOOST_JSON) {
            model = std::make_unique<TreeEnsembleModel>(TreeEnsembleModel::loadFromFile(path, schema.featureColumns()));
        } else {
            model = std::make_unique<DenseNetModel>(DenseNetModel::loadBinary(path));
        }
    } catch (const ChurnServe::ModelException&) {
        throw;
    } catch (const ChurnServe::ChurnServeException& e) {
        throw ChurnServe::ModelException(e.what());
    }

    if (model->inputDimension() != schema.featureCount()) {
        throw ChurnServe::ModelException(path + " expects " + std::to_string(model->inputDimension()) +
                                         " features but the schema defines " + std::to_string(schema.featureCount()));
    }
    return model;
}
