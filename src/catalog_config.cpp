#include "catalog_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace redfish_catalog {

static std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

static std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return value;
}

const std::vector<std::string>& CatalogConfig::Keys() {
    static const std::vector<std::string> keys = {
        "metadata_file_path",
        "schema_suffix",
        "strict_load",
        "check_properties",
        "fuzzy_threshold",
        "trace_enabled",
        "trace_level",
        "trace_output",
        "trace_directory",
        "trace_max_file_size",
        "trace_rotation"
    };
    return keys;
}

bool CatalogConfig::ParseBool(const std::string& key, const std::string& value) {
    auto lower = ToLower(value);
    if (lower == "true" || lower == "1" || lower == "on") {
        return true;
    } else if (lower == "false" || lower == "0" || lower == "off") {
        return false;
    }
    throw std::invalid_argument("Invalid boolean for " + key + ": " + value + ". Valid values are: true, false, 1, 0, on, off");
}

static double ParseThreshold(const std::string& value) {
    double threshold = 0.0;
    try {
        size_t consumed = 0;
        threshold = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid fuzzy_threshold: " + value + ". Expected a number in (0, 1]");
    }
    if (threshold <= 0.0 || threshold > 1.0) {
        throw std::invalid_argument("Invalid fuzzy_threshold: " + value + ". Expected a number in (0, 1]");
    }
    return threshold;
}

static int64_t ParseFileSize(const std::string& value) {
    int64_t size = 0;
    try {
        size_t consumed = 0;
        size = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid trace_max_file_size: " + value + ". Expected a non-negative integer");
    }
    if (size < 0) {
        throw std::invalid_argument("Trace max file size must be non-negative");
    }
    return size;
}

void CatalogConfig::Set(const std::string& key, const std::string& value) {
    if (key == "metadata_file_path") {
        if (value.empty()) {
            throw std::invalid_argument("metadata_file_path must not be empty");
        }
        metadata_file_path = value;
    } else if (key == "schema_suffix") {
        schema_suffix = value;
    } else if (key == "strict_load") {
        strict_load = ParseBool(key, value);
    } else if (key == "check_properties") {
        check_properties = ParseBool(key, value);
    } else if (key == "fuzzy_threshold") {
        fuzzy_threshold = ParseThreshold(value);
    } else if (key == "trace_enabled") {
        trace_enabled = ParseBool(key, value);
    } else if (key == "trace_level") {
        trace_level = TraceLevelFromString(value);
    } else if (key == "trace_output") {
        trace_output = TraceOutputFromString(value);
    } else if (key == "trace_directory") {
        trace_directory = value;
    } else if (key == "trace_max_file_size") {
        trace_max_file_size = ParseFileSize(value);
    } else if (key == "trace_rotation") {
        trace_rotation = ParseBool(key, value);
    } else {
        throw std::invalid_argument("Unknown configuration key: " + key);
    }
    RFCAT_TRACE_DEBUG("CONFIG", "Set " + key + " = " + value);
}

std::string CatalogConfig::Get(const std::string& key) const {
    if (key == "metadata_file_path") {
        return metadata_file_path;
    } else if (key == "schema_suffix") {
        return schema_suffix;
    } else if (key == "strict_load") {
        return strict_load ? "true" : "false";
    } else if (key == "check_properties") {
        return check_properties ? "true" : "false";
    } else if (key == "fuzzy_threshold") {
        std::ostringstream ss;
        ss << fuzzy_threshold;
        return ss.str();
    } else if (key == "trace_enabled") {
        return trace_enabled ? "true" : "false";
    } else if (key == "trace_level") {
        return TraceLevelToString(trace_level);
    } else if (key == "trace_output") {
        return TraceOutputToString(trace_output);
    } else if (key == "trace_directory") {
        return trace_directory;
    } else if (key == "trace_max_file_size") {
        return std::to_string(trace_max_file_size);
    } else if (key == "trace_rotation") {
        return trace_rotation ? "true" : "false";
    }
    throw std::invalid_argument("Unknown configuration key: " + key);
}

CatalogConfig CatalogConfig::FromEnvironment() {
    CatalogConfig config;
    for (const auto& key : Keys()) {
        auto env_name = "RFCAT_" + ToUpper(key);
        const char* env_value = std::getenv(env_name.c_str());
        if (env_value) {
            config.Set(key, env_value);
        }
    }
    return config;
}

void CatalogConfig::ApplyTracing() const {
    auto& tracer = CatalogTracer::Instance();
    tracer.SetLevel(trace_level);
    tracer.SetOutput(trace_output);
    tracer.SetTraceDirectory(trace_directory);
    tracer.SetMaxFileSize(trace_max_file_size);
    tracer.SetRotation(trace_rotation);
    tracer.SetEnabled(trace_enabled);
}

} // namespace redfish_catalog
