#include "RawRecord.h"

#include "ChurnServeExceptions.h"
#include "CommonUtils.h"
#include "JsonValue.h"

const RawValue* findRawField(const RawRecord& record, const std::string& name, size_t recordIndex) {
    auto exact = record.find(name);
    if (exact != record.end()) return &exact->second;

    // Two case-insensitive matches without an exact key are ambiguous.
    const std::pair<const std::string, RawValue>* match = nullptr;
    for (const auto& kv : record) {
        if (!CommonUtils::iequals(kv.first, name)) continue;
        if (match != nullptr) {
            const bool firstIsLower = match->first < kv.first;
            throw ChurnServe::InvalidRecordError(recordIndex, name,
                                                 "ambiguous field spellings '" +
                                                     (firstIsLower ? match->first : kv.first) + "' and '" +
                                                     (firstIsLower ? kv.first : match->first) + "'");
        }
        match = &kv;
    }
    return match != nullptr ? &match->second : nullptr;
}

std::string describeRawValue(const RawValue& value) {
    if (std::holds_alternative<std::monostate>(value)) return "null";
    if (const double* number = std::get_if<double>(&value)) return formatJsonNumber(*number);
    if (const bool* flag = std::get_if<bool>(&value)) return *flag ? "true" : "false";
    return std::get<std::string>(value);
}
