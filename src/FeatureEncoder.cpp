#include "FeatureEncoder.h"

#include <algorithm>

FeatureEncoder::FeatureEncoder(const SchemaStore& schema) : schema_(schema) {
    const auto& fields = schema_.catalog().fields();
    indicators_.resize(fields.size());
    for (size_t i = 0; i < fields.size(); ++i) {
        const FieldSpec& field = fields[i];
        if (field.kind != FieldKind::CATEGORICAL) continue;

        std::vector<std::string> sorted = field.vocabulary;
        std::sort(sorted.begin(), sorted.end());
        const std::string& reference = field.referenceValue();
        for (const auto& value : sorted) {
            if (value == reference) continue;
            indicators_[i].push_back({value, field.name + "_" + value});
        }
    }
}

EncodedColumns FeatureEncoder::expand(const NormalizedRecord& record) const {
    const auto& fields = schema_.catalog().fields();
    EncodedColumns columns;
    columns.reserve(schema_.featureCount());

    for (size_t i = 0; i < fields.size(); ++i) {
        const FieldSpec& field = fields[i];
        if (field.kind != FieldKind::CATEGORICAL) {
            columns.emplace_back(field.name, record.values[i]);
            continue;
        }
        const std::string& category = record.categories[i];
        for (const auto& indicator : indicators_[i]) {
            columns.emplace_back(indicator.column, category == indicator.value ? 1.0 : 0.0);
        }
    }
    return columns;
}

std::vector<double> FeatureEncoder::reconcile(const EncodedColumns& columns, ReconcileReport* report) const {
    const size_t width = schema_.featureCount();
    std::vector<double> vector(width, 0.0);
    std::vector<uint8_t> present(width, static_cast<uint8_t>(0));

    size_t dropped = 0;
    for (const auto& column : columns) {
        const int idx = schema_.columnIndex(column.first);
        if (idx < 0) {
            ++dropped;
            continue;
        }
        vector[static_cast<size_t>(idx)] = column.second;
        present[static_cast<size_t>(idx)] = static_cast<uint8_t>(1);
    }

    if (report != nullptr) {
        report->droppedColumns = dropped;
        report->filledColumns = static_cast<size_t>(std::count(present.begin(), present.end(), static_cast<uint8_t>(0)));
    }
    return vector;
}

void FeatureEncoder::scaleInPlace(std::vector<double>& vector) const {
    const auto& scale = schema_.scaleParams();
    for (size_t i = 0; i < vector.size() && i < scale.size(); ++i) {
        vector[i] = (vector[i] - scale[i].center) / scale[i].spread;
    }
}

std::vector<double> FeatureEncoder::encode(const NormalizedRecord& record, ReconcileReport* report) const {
    std::vector<double> vector = reconcile(expand(record), report);
    scaleInPlace(vector);
    return vector;
}
