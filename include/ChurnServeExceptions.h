#ifndef CHURNSERVE_EXCEPTIONS_H
#define CHURNSERVE_EXCEPTIONS_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace ChurnServe {

class ChurnServeException : public std::runtime_error {
public:
    explicit ChurnServeException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public ChurnServeException {
public:
    explicit IOException(const std::string& message) : ChurnServeException("IO Error: " + message) {}
};

class ConfigurationException : public ChurnServeException {
public:
    explicit ConfigurationException(const std::string& message) : ChurnServeException("Configuration Error: " + message) {}
};

class DatasetException : public ChurnServeException {
public:
    explicit DatasetException(const std::string& message) : ChurnServeException("Dataset Error: " + message) {}
};

class JsonException : public ChurnServeException {
public:
    explicit JsonException(const std::string& message) : ChurnServeException("JSON Error: " + message) {}
};

class SchemaLoadError : public ChurnServeException {
public:
    explicit SchemaLoadError(const std::string& message)
        : ChurnServeException("Schema Error: " + message), detail_(message) {}

    // Message without the "Schema Error: " prefix, for re-wrapping with more context.
    const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_;
};

class ModelException : public ChurnServeException {
public:
    explicit ModelException(const std::string& message) : ChurnServeException("Model Error: " + message) {}
};

class ScoringError : public ChurnServeException {
public:
    explicit ScoringError(const std::string& message) : ChurnServeException("Scoring Error: " + message) {}
};

class RequestException : public ChurnServeException {
public:
    explicit RequestException(const std::string& message) : ChurnServeException("Request Error: " + message) {}
};

/**
 * @brief Base for data errors confined to one record of a batch.
 * @details Carries the record position and offending field so callers can correlate failures with inputs.
 */
class RecordError : public ChurnServeException {
public:
    RecordError(std::string code, size_t recordIndex, std::string field, const std::string& message)
        : ChurnServeException("record " + std::to_string(recordIndex) + ", field '" + field + "': " + message),
          code_(std::move(code)),
          recordIndex_(recordIndex),
          field_(std::move(field)) {}

    const std::string& code() const noexcept { return code_; }
    size_t recordIndex() const noexcept { return recordIndex_; }
    const std::string& field() const noexcept { return field_; }

private:
    std::string code_;
    size_t recordIndex_;
    std::string field_;
};

class MissingFieldError : public RecordError {
public:
    MissingFieldError(size_t recordIndex, const std::string& field)
        : RecordError("missing_field", recordIndex, field, "required field is missing") {}
};

class UnknownCategoryError : public RecordError {
public:
    UnknownCategoryError(size_t recordIndex, const std::string& field, const std::string& value)
        : RecordError("unknown_category", recordIndex, field, "value '" + value + "' is outside the known vocabulary"),
          value_(value) {}

    const std::string& value() const noexcept { return value_; }

private:
    std::string value_;
};

class InvalidRecordError : public RecordError {
public:
    InvalidRecordError(size_t recordIndex, const std::string& field, const std::string& message)
        : RecordError("invalid_record", recordIndex, field, message) {}
};

} // namespace ChurnServe

#endif // CHURNSERVE_EXCEPTIONS_H
