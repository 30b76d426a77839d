#pragma once

#include "rfcat_tracing.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace redfish_catalog {

// CatalogConfig class --------------------------------------------------------
// Settings for loading a catalog and running the engines. Values are set from
// text through Set(), from RFCAT_* environment variables, or directly.

class CatalogConfig
{
public:
    CatalogConfig() = default;

    // Reads every known key from RFCAT_<KEY> environment variables on top of the defaults.
    static CatalogConfig FromEnvironment();

    // Assigns one setting from its text form. Throws std::invalid_argument
    // for an unknown key or a value that does not parse.
    void Set(const std::string& key, const std::string& value);
    std::string Get(const std::string& key) const;

    static const std::vector<std::string>& Keys();

    // Pushes the trace_* settings into CatalogTracer.
    void ApplyTracing() const;

    static bool ParseBool(const std::string& key, const std::string& value);

public:
    std::string metadata_file_path = "./SchemaFiles/metadata";
    std::string schema_suffix = ".xml";
    bool strict_load = false;
    bool check_properties = false;
    double fuzzy_threshold = 0.70;

    bool trace_enabled = false;
    TraceLevel trace_level = TraceLevel::INFO;
    TraceOutput trace_output = TraceOutput::CONSOLE;
    std::string trace_directory = ".";
    int64_t trace_max_file_size = 10485760;
    bool trace_rotation = true;
};

} // namespace redfish_catalog
