#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>

#include "catch.hpp"

#include "schema_catalog.hpp"

using namespace redfish_catalog;
using namespace std;

static const std::string SCHEMA_DIR = "test/cpp/schemas";

static std::string LoadTestFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filePath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    return buffer.str();
}

static std::string SingleSchemaDocument(const std::string& ns, const std::string& body) {
    return R"(<?xml version="1.0" encoding="UTF-8"?>
<edmx:Edmx xmlns:edmx="http://docs.oasis-open.org/odata/ns/edmx" Version="4.0">
  <edmx:DataServices>
    <Schema xmlns="http://docs.oasis-open.org/odata/ns/edm" Namespace=")" + ns + R"(">)" + body + R"(</Schema>
  </edmx:DataServices>
</edmx:Edmx>)";
}

TEST_CASE("Load schema catalog from directory", "[schema_catalog]")
{
    auto catalog = SchemaCatalog::Load(SCHEMA_DIR);

    SECTION("Every document and namespace is indexed")
    {
        REQUIRE(catalog->Directory() == SCHEMA_DIR);
        REQUIRE(catalog->DocumentNames() == vector<string>{"ExampleResource_v1.xml", "Example_v1.xml", "Resource_v1.xml"});
        REQUIRE(catalog->FailedDocuments().empty());

        auto namespaces = catalog->NamespaceNames();
        REQUIRE(namespaces.size() == 15);
        REQUIRE(std::find(namespaces.begin(), namespaces.end(), "Example.v1_7_0") != namespaces.end());
        REQUIRE(std::find(namespaces.begin(), namespaces.end(), "RedfishExtensions.v1_0_0") != namespaces.end());

        REQUIRE(catalog->FindDocument("Example_v1.xml") != nullptr);
        REQUIRE(catalog->FindDocument("Missing_v1.xml") == nullptr);
    }

    SECTION("Schema document by class")
    {
        const auto& doc = catalog->GetSchemaDocByClass("Example");
        REQUIRE(doc.FileName() == "Example_v1.xml");
        REQUIRE(&catalog->GetSchemaDocByClass("Example.v1_2_0") == &doc);
        REQUIRE(&catalog->GetSchemaDocByClass("Example.v1_7_0.Example") == &doc);
        REQUIRE(&catalog->GetSchemaDocByClass("#Example.v1_0_0.Example") == &doc);

        REQUIRE_THROWS_AS(catalog->GetSchemaDocByClass("NotExample"), MissingSchemaError);
    }

    SECTION("Schema namespace in catalog")
    {
        const auto& schema_ns = catalog->GetSchemaInCatalog("Example.v1_0_0");
        REQUIRE(schema_ns.name == "Example.v1_0_0");
        REQUIRE(&catalog->GetSchemaInCatalog("Example.v1_0_0") == &schema_ns);

        REQUIRE(catalog->GetSchemaInCatalog("Example.v1_5_0").name == "Example.v1_2_0");
        REQUIRE(catalog->GetSchemaInCatalog("Example.v9_0_0").name == "Example.v1_7_0");
        REQUIRE(catalog->GetSchemaInCatalog("Example").name == "Example");
    }

    SECTION("Well-known namespaces are always available")
    {
        const auto& redfish = catalog->GetSchemaInCatalog("RedfishExtensions.v1_0_0");
        REQUIRE(redfish.builtin);
        REQUIRE(redfish.document->IsBuiltin());
        REQUIRE(catalog->GetSchemaInCatalog("Redfish").builtin);
        REQUIRE(catalog->GetSchemaInCatalog("RedfishExtension.v1_3_0").name == "RedfishExtension.v1_0_0");
    }
}

TEST_CASE("Type resolution in catalog", "[schema_catalog]")
{
    auto catalog = SchemaCatalog::Load(SCHEMA_DIR);

    SECTION("Entity type merged with its base chain")
    {
        auto type = catalog->GetTypeInCatalog("Example.v1_7_0.Example");
        REQUIRE(type->kind == RedfishTypeKind::ENTITY);
        REQUIRE(type->fulltype == "Example.v1_7_0.Example");
        REQUIRE(type->ns == "Example.v1_7_0");
        REQUIRE(type->type_name == "Example");
        REQUIRE(type->file == "Example_v1.xml");

        vector<string> names;
        for (const auto& property : type->properties) {
            names.push_back(property.name);
        }
        REQUIRE(names == vector<string>{"Id", "Description", "Name", "Oem", "Enabled", "Threshold", "Mode",
                                        "Links", "Actions", "Resources", "Settings", "Samples", "Notes"});

        REQUIRE(type->base->fulltype == "Example.v1_2_0.Example");
        REQUIRE(type->FindProperty("Links")->type_name == "Example.v1_2_0.Links");
        REQUIRE(type->FindProperty("Links")->declaring_type == "Example.v1_2_0.Example");
        REQUIRE(type->FindProperty("Missing") == nullptr);
    }

    SECTION("Inheritance")
    {
        auto example = catalog->GetTypeInCatalog("Example.v1_7_0.Example");
        auto base = catalog->GetTypeInCatalog("Example.v1_0_0.Example");
        auto resource = catalog->GetTypeInCatalog("Resource.Resource");
        REQUIRE(example->IsA(*base));
        REQUIRE(example->IsA(*resource));
        REQUIRE_FALSE(base->IsA(*example));
        REQUIRE(catalog->GetTypeInCatalog("Example.Example")->abstract_type);
    }

    SECTION("Lower versions are searched for the type")
    {
        auto links = catalog->GetTypeInCatalog("Example.v1_2_0.Links");
        REQUIRE(links->fulltype == "Example.v1_2_0.Links");
        REQUIRE(links->properties.size() == 3);
        REQUIRE(links->FindProperty("Primary")->is_navigation);
        REQUIRE(links->FindProperty("Secondary") != nullptr);

        REQUIRE(catalog->GetTypeInCatalog("Example.v1_1_0.Links")->fulltype == "Example.v1_0_0.Links");
        REQUIRE(catalog->GetTypeInCatalog("Example.v1_7_0.Mode")->fulltype == "Example.v1_0_0.Mode");
        REQUIRE(catalog->GetTypeInCatalog("Example.v1_9_9.Example")->fulltype == "Example.v1_7_0.Example");
    }

    SECTION("Unversioned namespace is the last resort")
    {
        auto type = catalog->GetTypeInCatalog("Resource.v1_0_0.Status");
        REQUIRE(type->fulltype == "Resource.Status");
    }

    SECTION("Enum and type definitions")
    {
        auto mode = catalog->GetTypeInCatalog("Example.v1_0_0.Mode");
        REQUIRE(mode->IsEnum());
        REQUIRE(mode->enum_members == vector<string>{"Automatic", "Manual"});
        REQUIRE(mode->HasEnumMember("Manual"));
        REQUIRE_FALSE(mode->HasEnumMember("manual"));

        auto uuid = catalog->GetTypeInCatalog("Resource.UUID");
        REQUIRE(uuid->kind == RedfishTypeKind::TYPE_DEFINITION);
        REQUIRE(uuid->underlying_type.name == "Edm.Guid");
        REQUIRE_FALSE(uuid->pattern.empty());
    }

    SECTION("Primitive types")
    {
        auto int64 = catalog->GetTypeInCatalog("Edm.Int64");
        REQUIRE(int64->kind == RedfishTypeKind::PRIMITIVE);
        REQUIRE(int64->underlying_type.Kind() == PrimitiveKind::INT);
        REQUIRE(int64 == catalog->GetTypeInCatalog("Edm.Int64"));
        REQUIRE_THROWS_AS(catalog->GetTypeInCatalog("Edm.Bogus"), MissingSchemaError);

        auto other = SchemaCatalog::Load(SCHEMA_DIR);
        auto other_int64 = other->GetTypeInCatalog("Edm.Int64");
        REQUIRE(other_int64 != int64);
        REQUIRE(other_int64->fulltype == int64->fulltype);
    }

    SECTION("Property annotations")
    {
        auto type = catalog->GetTypeInCatalog("ExampleResource.v1_0_0.ExampleResource");
        auto id = type->FindProperty("Id");
        REQUIRE(id->required);
        REQUIRE(id->IsReadOnly());
        REQUIRE_FALSE(id->nullable);
        REQUIRE_FALSE(type->FindProperty("Status")->required);

        auto links = catalog->GetTypeInCatalog("ExampleResource.v1_0_0.Links");
        auto peers = links->FindProperty("Peers");
        REQUIRE(peers->is_collection);
        REQUIRE(peers->is_navigation);
        REQUIRE(peers->auto_expand);
        REQUIRE(peers->inner_type == "ExampleResource.ExampleResource");
    }

    SECTION("Additional properties")
    {
        REQUIRE(catalog->GetTypeInCatalog("Resource.Oem")->additional_properties);
        REQUIRE_FALSE(catalog->GetTypeInCatalog("Example.v1_1_0.Settings")->additional_properties);
    }

    SECTION("Bound actions")
    {
        auto actions = catalog->GetTypeInCatalog("Example.v1_0_0.Actions");
        REQUIRE(actions->actions.size() == 1);
        REQUIRE(actions->actions[0].name == "Calibrate");
        REQUIRE(actions->FindActionForKey("#Example.Calibrate") != nullptr);
        REQUIRE(actions->FindActionForKey("#Example.v1_0_0.Calibrate") != nullptr);
        REQUIRE(actions->FindActionForKey("#Other.Calibrate") == nullptr);
        REQUIRE(actions->FindActionForKey("#Example.Reset") == nullptr);

        auto resource_actions = catalog->GetTypeInCatalog("ExampleResource.v1_0_0.Actions");
        REQUIRE(resource_actions->FindActionForKey("#ExampleResource.Reset") != nullptr);
    }

    SECTION("Resolution is idempotent")
    {
        auto first = catalog->GetTypeInCatalog("Example.v1_7_0.Example");
        auto cached = catalog->CachedTypeCount();
        auto second = catalog->GetTypeInCatalog("Example.v1_7_0.Example");
        REQUIRE(first == second);
        REQUIRE(catalog->CachedTypeCount() == cached);
        REQUIRE(catalog->GetTypeInCatalog(first) == first);
    }

    SECTION("Unknown types")
    {
        REQUIRE_THROWS_AS(catalog->GetTypeInCatalog("Example.v1_0_0.Nothing"), MissingSchemaError);
        REQUIRE_THROWS_AS(catalog->GetTypeInCatalog("NoExample.v1_0_0.NoExample"), MissingSchemaError);
        REQUIRE_THROWS_AS(catalog->GetTypeInCatalog("Example"), MissingSchemaError);
    }
}

TEST_CASE("Concurrent type resolution", "[schema_catalog]")
{
    auto catalog = SchemaCatalog::Load(SCHEMA_DIR);

    const int num_threads = 8;
    vector<shared_ptr<const RedfishType>> results(num_threads);
    vector<thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&catalog, &results, i]() {
            results[i] = catalog->GetTypeInCatalog("Example.v1_7_0.Example");
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& result : results) {
        REQUIRE(result == results.front());
    }
}

TEST_CASE("Catalog load failures", "[schema_catalog]")
{
    SECTION("Missing directory")
    {
        REQUIRE_THROWS_AS(SchemaCatalog::Load("test/cpp/no_such_schemas"), CatalogLoadError);
        REQUIRE_THROWS_AS(SchemaCatalog::Load(""), CatalogLoadError);
        REQUIRE_THROWS_AS(SchemaCatalog::Load(SCHEMA_DIR + "/Example_v1.xml"), CatalogLoadError);
    }

    SECTION("Malformed documents are skipped")
    {
        auto catalog = SchemaCatalog::Load("test/cpp/schemas_bad");
        REQUIRE(catalog->DocumentNames() == vector<string>{"Good_v1.xml"});
        REQUIRE(catalog->FailedDocuments().size() == 2);
        REQUIRE(catalog->FailedDocuments()[0].file == "Broken_v1.xml");
        REQUIRE(catalog->FailedDocuments()[1].file == "NotEdmx_v1.xml");
        REQUIRE(catalog->GetTypeInCatalog("Good.v1_0_0.Good")->properties.size() == 1);
    }

    SECTION("Strict load reports every malformed document")
    {
        CatalogLoadOptions options;
        options.strict_load = true;
        try {
            SchemaCatalog::Load("test/cpp/schemas_bad", options);
            FAIL("Expected CatalogLoadError");
        } catch (const CatalogLoadError& e) {
            REQUIRE(e.Failures().size() == 2);
            REQUIRE(e.Directory() == "test/cpp/schemas_bad");
        }
    }

    SECTION("Schema suffix filters files")
    {
        CatalogLoadOptions options;
        options.schema_suffix = ".csdl";
        auto catalog = SchemaCatalog::Load(SCHEMA_DIR, options);
        REQUIRE(catalog->DocumentNames().empty());
        REQUIRE_THROWS_AS(catalog->GetSchemaDocByClass("Example"), MissingSchemaError);
    }

    SECTION("Load from configuration")
    {
        CatalogConfig config;
        config.Set("metadata_file_path", SCHEMA_DIR);
        auto catalog = SchemaCatalog::Load(config);
        REQUIRE(catalog->DocumentNames().size() == 3);

        config.Set("metadata_file_path", "test/cpp/schemas_bad");
        config.Set("strict_load", "true");
        REQUIRE_THROWS_AS(SchemaCatalog::Load(config), CatalogLoadError);
    }
}

TEST_CASE("Circular base types", "[schema_catalog]")
{
    auto catalog = SchemaCatalog::Load("test/cpp/schemas_cycle");

    SECTION("Two-type cycle")
    {
        try {
            catalog->GetTypeInCatalog("Cycle.v1_0_0.A");
            FAIL("Expected CircularReferenceError");
        } catch (const CircularReferenceError& e) {
            REQUIRE(e.Cycle() == vector<string>{"Cycle.v1_0_0.A", "Cycle.v1_0_0.B", "Cycle.v1_0_0.A"});
        }
    }

    SECTION("Cycle reached through a derived type")
    {
        REQUIRE_THROWS_AS(catalog->GetTypeInCatalog("Cycle.v1_0_0.C"), CircularReferenceError);
    }

    SECTION("Self reference")
    {
        try {
            catalog->GetTypeInCatalog("Cycle.v1_0_0.Self");
            FAIL("Expected CircularReferenceError");
        } catch (const CircularReferenceError& e) {
            REQUIRE(e.Cycle() == vector<string>{"Cycle.v1_0_0.Self", "Cycle.v1_0_0.Self"});
        }
    }

    SECTION("Cycles do not affect unrelated types")
    {
        REQUIRE_THROWS_AS(catalog->GetTypeInCatalog("Cycle.v1_0_0.A"), CircularReferenceError);
        REQUIRE(catalog->GetTypeInCatalog("Cycle.v1_0_0.Plain")->properties.size() == 1);
    }
}

TEST_CASE("Catalog from in-memory documents", "[schema_catalog]")
{
    SECTION("Documents from text")
    {
        map<string, string> documents = {
            {"Example_v1.xml", LoadTestFile(SCHEMA_DIR + "/Example_v1.xml")},
            {"ExampleResource_v1.xml", LoadTestFile(SCHEMA_DIR + "/ExampleResource_v1.xml")},
            {"Resource_v1.xml", LoadTestFile(SCHEMA_DIR + "/Resource_v1.xml")}
        };
        auto catalog = SchemaCatalog::FromDocuments(documents);
        REQUIRE(catalog->DocumentNames().size() == 3);
        REQUIRE(catalog->GetTypeInCatalog("Example.v1_7_0.Example")->properties.size() == 13);
    }

    SECTION("First declaration of a namespace wins")
    {
        map<string, string> documents = {
            {"A_v1.xml", SingleSchemaDocument("Dup.v1_0_0", R"(<ComplexType Name="First"/>)")},
            {"B_v1.xml", SingleSchemaDocument("Dup.v1_0_0", R"(<ComplexType Name="Second"/>)")}
        };
        auto catalog = SchemaCatalog::FromDocuments(documents);
        REQUIRE(catalog->GetSchemaDocByClass("Dup.v1_0_0").FileName() == "A_v1.xml");
        REQUIRE(catalog->GetTypeInCatalog("Dup.v1_0_0.First")->type_name == "First");
        REQUIRE_THROWS_AS(catalog->GetTypeInCatalog("Dup.v1_0_0.Second"), MissingSchemaError);
    }

    SECTION("Declared well-known namespaces replace the builtin ones")
    {
        map<string, string> documents = {
            {"RedfishExtensions_v1.xml", SingleSchemaDocument("RedfishExtensions.v1_0_0", R"(<Term Name="Required"/>)")}
        };
        auto catalog = SchemaCatalog::FromDocuments(documents);
        const auto& schema_ns = catalog->GetSchemaInCatalog("RedfishExtensions.v1_0_0");
        REQUIRE_FALSE(schema_ns.builtin);
        REQUIRE(schema_ns.file_name == "RedfishExtensions_v1.xml");
        REQUIRE(catalog->GetSchemaInCatalog("RedfishExtension.v1_0_0").builtin);
    }

    SECTION("Strict in-memory load")
    {
        map<string, string> documents = {
            {"Good_v1.xml", SingleSchemaDocument("Good.v1_0_0", R"(<ComplexType Name="Good"/>)")},
            {"Bad_v1.xml", "<edmx:Edmx"}
        };
        CatalogLoadOptions options;
        options.strict_load = true;
        REQUIRE_THROWS_AS(SchemaCatalog::FromDocuments(documents, options), CatalogLoadError);

        auto lenient = SchemaCatalog::FromDocuments(documents);
        REQUIRE(lenient->FailedDocuments().size() == 1);
        REQUIRE(lenient->FailedDocuments()[0].file == "Bad_v1.xml");
    }
}
