#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <variant>

// One customer row as received: null, number, boolean or text per field.
using RawValue = std::variant<std::monostate, double, bool, std::string>;
using RawRecord = std::unordered_map<std::string, RawValue>;

/**
 * @brief Looks up a field by exact name, then case-insensitively.
 * @return nullptr when the record does not carry the field at all.
 * @throws ChurnServe::InvalidRecordError when there is no exact key and several keys differ from name only in case.
 */
const RawValue* findRawField(const RawRecord& record, const std::string& name, size_t recordIndex = 0);

std::string describeRawValue(const RawValue& value);
