#include <cstdlib>

#include "catch.hpp"
#include "catalog_config.hpp"
#include "redfish_object.hpp"

using namespace redfish_catalog;
using namespace std;

TEST_CASE("CatalogConfig defaults", "[catalog_config]")
{
    CatalogConfig config;
    REQUIRE(config.metadata_file_path == "./SchemaFiles/metadata");
    REQUIRE(config.schema_suffix == ".xml");
    REQUIRE_FALSE(config.strict_load);
    REQUIRE_FALSE(config.check_properties);
    REQUIRE(config.fuzzy_threshold == Approx(0.70));
    REQUIRE_FALSE(config.trace_enabled);
    REQUIRE(config.trace_level == TraceLevel::INFO);
    REQUIRE(config.trace_output == TraceOutput::CONSOLE);
    REQUIRE(config.trace_max_file_size == 10485760);
    REQUIRE(config.trace_rotation);

    REQUIRE(CatalogConfig::Keys().size() == 11);
    for (const auto& key : CatalogConfig::Keys()) {
        REQUIRE_NOTHROW(config.Get(key));
    }
}

TEST_CASE("CatalogConfig set and get", "[catalog_config]")
{
    CatalogConfig config;

    SECTION("Values round-trip through text")
    {
        config.Set("metadata_file_path", "/srv/schemas");
        config.Set("strict_load", "on");
        config.Set("check_properties", "1");
        config.Set("fuzzy_threshold", "0.85");
        config.Set("trace_level", "debug");
        config.Set("trace_output", "both");
        config.Set("trace_max_file_size", "0");

        REQUIRE(config.Get("metadata_file_path") == "/srv/schemas");
        REQUIRE(config.Get("strict_load") == "true");
        REQUIRE(config.Get("check_properties") == "true");
        REQUIRE(config.Get("fuzzy_threshold") == "0.85");
        REQUIRE(config.Get("trace_level") == "DEBUG");
        REQUIRE(config.Get("trace_output") == "both");
        REQUIRE(config.Get("trace_max_file_size") == "0");
    }

    SECTION("Invalid values are rejected")
    {
        REQUIRE_THROWS_AS(config.Set("strict_load", "maybe"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.Set("fuzzy_threshold", "0"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.Set("fuzzy_threshold", "1.5"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.Set("fuzzy_threshold", "high"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.Set("trace_max_file_size", "-1"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.Set("trace_level", "LOUD"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.Set("metadata_file_path", ""), std::invalid_argument);
        REQUIRE(config.fuzzy_threshold == Approx(0.70));
    }

    SECTION("Unknown keys are rejected")
    {
        REQUIRE_THROWS_AS(config.Set("no_such_key", "1"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.Get("no_such_key"), std::invalid_argument);
    }

    SECTION("Populate options follow the configuration")
    {
        config.Set("check_properties", "true");
        config.Set("fuzzy_threshold", "0.9");
        auto options = PopulateOptions::FromConfig(config);
        REQUIRE(options.check);
        REQUIRE(options.fuzzy_threshold == Approx(0.9));
    }
}

TEST_CASE("CatalogConfig from environment", "[catalog_config]")
{
    setenv("RFCAT_METADATA_FILE_PATH", "test/cpp/schemas", 1);
    setenv("RFCAT_CHECK_PROPERTIES", "true", 1);

    auto config = CatalogConfig::FromEnvironment();
    REQUIRE(config.metadata_file_path == "test/cpp/schemas");
    REQUIRE(config.check_properties);
    REQUIRE(config.schema_suffix == ".xml");

    setenv("RFCAT_FUZZY_THRESHOLD", "2", 1);
    REQUIRE_THROWS_AS(CatalogConfig::FromEnvironment(), std::invalid_argument);

    unsetenv("RFCAT_METADATA_FILE_PATH");
    unsetenv("RFCAT_CHECK_PROPERTIES");
    unsetenv("RFCAT_FUZZY_THRESHOLD");
}

TEST_CASE("CatalogConfig applies tracing settings", "[catalog_config]")
{
    CatalogConfig config;
    config.Set("trace_enabled", "true");
    config.Set("trace_level", "warn");
    config.Set("trace_output", "console");
    config.ApplyTracing();

    auto& tracer = CatalogTracer::Instance();
    REQUIRE(tracer.IsEnabled());
    REQUIRE(tracer.GetLevel() == TraceLevel::WARN);
    REQUIRE(tracer.GetOutput() == TraceOutput::CONSOLE);

    CatalogConfig defaults;
    defaults.ApplyTracing();
    REQUIRE_FALSE(tracer.IsEnabled());
    REQUIRE(tracer.GetLevel() == TraceLevel::INFO);
}
