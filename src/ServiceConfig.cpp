#include "ServiceConfig.h"

#include "ChurnModel.h"
#include "ChurnServeExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace {
const char* kUsage =
    "Usage: churnserve <serve|score|fit-schema> [input.csv] [--config path] "
    "[--registry registry.json | --schema schema.json --model model --model-format xgboost_json|dense_binary "
    "--model-id id] [--host addr] [--port N] [--threads N] [--max-batch-records N] "
    "[--unknown-category reject|reference] [--churn-threshold 0..1] [--delimiter ,] [--output path] "
    "[--catalog fields.json] [--target col] [--verbose true|false]";

template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw ChurnServe::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const ChurnServe::ChurnServeException&) {
        throw;
    } catch (const std::exception& ex) {
        throw ChurnServe::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    const int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw ChurnServe::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ChurnServe::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value, const std::string& key) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw ChurnServe::ConfigurationException(key + " expects a single character");
    return value[0];
}

// Shared by the CLI (--flag) and config-file (key:) spellings; key is normalized without dashes.
void assignKeyValue(ServiceConfig& config, const std::string& key, const std::string& value) {
    if (key == "host") {
        config.host = value;
    } else if (key == "port") {
        config.port = parseIntStrict(value, key, 1);
    } else if (key == "threads") {
        config.threads = static_cast<size_t>(parseIntStrict(value, key, 1));
    } else if (key == "registry") {
        config.registryPath = value;
    } else if (key == "schema") {
        config.schemaPath = value;
    } else if (key == "catalog") {
        config.catalogPath = value;
    } else if (key == "model") {
        config.modelPath = value;
    } else if (key == "model_format") {
        config.modelFormat = CommonUtils::toLower(value);
    } else if (key == "model_id") {
        config.modelId = value;
    } else if (key == "max_batch_records") {
        config.maxBatchRecords = static_cast<size_t>(parseIntStrict(value, key, 0));
    } else if (key == "unknown_category") {
        config.unknownCategory = CommonUtils::toLower(value);
    } else if (key == "churn_threshold") {
        config.churnThreshold = parseDoubleStrict(value, key);
    } else if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, key);
    } else if (key == "output") {
        config.outputPath = value;
    } else if (key == "target") {
        config.targetColumn = value;
    } else if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
    } else {
        throw ChurnServe::ConfigurationException("Unknown config key: " + key);
    }
}
} // namespace

ServiceConfig ServiceConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw ChurnServe::ConfigurationException(kUsage);
    }

    ServiceConfig config;
    config.command = CommonUtils::toLower(argv[1]);

    std::string configPath;
    int i = 2;
    if (config.command != "serve" && i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        config.inputPath = argv[i++];
    }

    // Flags given on the command line win over the config file.
    std::vector<std::pair<std::string, std::string>> overrides;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
            throw ChurnServe::ConfigurationException("Unexpected argument: " + arg + "\n" + kUsage);
        }
        const std::string key = normalizeConfigKey(arg.substr(2));
        const std::string value = argv[++i];
        if (key == "config") {
            configPath = value;
            continue;
        }
        overrides.emplace_back(key, value);
    }

    if (!configPath.empty()) {
        config = fromFile(configPath, config);
    }
    for (const auto& kv : overrides) {
        assignKeyValue(config, kv.first, kv.second);
    }

    config.validate();
    return config;
}

ServiceConfig ServiceConfig::fromFile(const std::string& configPath, const ServiceConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw ChurnServe::ConfigurationException("Could not open config file: " + configPath);

    ServiceConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const ChurnServe::ChurnServeException& ex) {
            throw ChurnServe::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }

    return config;
}

void ServiceConfig::validate() const {
    if (command != "serve" && command != "score" && command != "fit-schema") {
        throw ChurnServe::ConfigurationException("Unknown command '" + command + "'\n" + kUsage);
    }
    if (port < 1 || port > 65535) {
        throw ChurnServe::ConfigurationException("port must be within [1,65535]");
    }
    if (threads < 1) {
        throw ChurnServe::ConfigurationException("threads must be >= 1");
    }
    if (unknownCategory != "reject" && unknownCategory != "reference") {
        throw ChurnServe::ConfigurationException("unknown_category must be reject|reference");
    }
    if (!(churnThreshold >= 0.0 && churnThreshold <= 1.0)) {
        throw ChurnServe::ConfigurationException("churn_threshold must be within [0,1]");
    }
    parseModelFormat(modelFormat);

    if (command == "fit-schema") {
        if (inputPath.empty()) throw ChurnServe::ConfigurationException("fit-schema requires a training CSV path");
        if (outputPath.empty()) throw ChurnServe::ConfigurationException("fit-schema requires --output <schema.json>");
        return;
    }

    if (command == "score" && inputPath.empty()) {
        throw ChurnServe::ConfigurationException("score requires a records CSV path");
    }
    if (registryPath.empty()) {
        if (schemaPath.empty() || modelPath.empty()) {
            throw ChurnServe::ConfigurationException("either --registry or both --schema and --model are required");
        }
        if (modelId.empty()) {
            throw ChurnServe::ConfigurationException("model_id cannot be empty");
        }
    }
}

PipelineOptions ServiceConfig::pipelineOptions() const {
    PipelineOptions options;
    options.unknownCategoryPolicy =
        unknownCategory == "reference" ? UnknownCategoryPolicy::REFERENCE : UnknownCategoryPolicy::REJECT;
    options.maxBatchRecords = maxBatchRecords;
    return options;
}
