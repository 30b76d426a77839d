#include <fstream>
#include <sstream>

#include "catch.hpp"
#include "tinyxml2.h"

#include "csdl_model.hpp"

using namespace redfish_catalog;
using namespace std;

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

TEST_CASE("Test Property class", "[csdl_model]")
{
    SECTION("Test FromXml method")
    {
        const char *xml = R"(
            <Property Name="Id" Type="Resource.Id" Nullable="false">
                <Annotation Term="OData.Permissions" EnumMember="OData.Permission/Read"/>
                <Annotation Term="Redfish.Required"/>
            </Property>
        )";

        tinyxml2::XMLDocument doc;
        doc.Parse(xml);
        tinyxml2::XMLElement *element = doc.FirstChildElement("Property");

        Property property = Property::FromXml(*element);

        REQUIRE(property.name == "Id");
        REQUIRE(property.type_name == "Resource.Id");
        REQUIRE(property.nullable == false);
        REQUIRE(property.annotations.size() == 2);
        REQUIRE(property.annotations[0].value_kind == "EnumMember");
        REQUIRE(property.annotations[0].value == "OData.Permission/Read");
        REQUIRE(property.annotations[1].BoolValue());
    }
}

TEST_CASE("Test NavigationProperty class", "[csdl_model]")
{
    SECTION("Test FromXml method")
    {
        const char *xml = R"~(
            <NavigationProperty
                Name="Peers"
                Type="Collection(ExampleResource.ExampleResource)"
                ContainsTarget="true">
                <Annotation Term="OData.AutoExpandReferences"/>
            </NavigationProperty>
        )~";

        tinyxml2::XMLDocument doc;
        doc.Parse(xml);
        tinyxml2::XMLElement *element = doc.FirstChildElement("NavigationProperty");

        NavigationProperty nav_prop = NavigationProperty::FromXml(*element);

        REQUIRE(nav_prop.name == "Peers");
        REQUIRE(nav_prop.type == "Collection(ExampleResource.ExampleResource)");
        REQUIRE(nav_prop.contains_target);
        REQUIRE(nav_prop.nullable);
        REQUIRE(nav_prop.annotations.size() == 1);
    }
}

TEST_CASE("Test EnumType class", "[csdl_model]")
{
    const char *xml = R"(
        <EnumType Name="Health">
            <Member Name="OK"/>
            <Member Name="Warning"/>
            <Member Name="Critical"/>
        </EnumType>
    )";

    tinyxml2::XMLDocument doc;
    doc.Parse(xml);
    EnumType enum_type = EnumType::FromXml(*doc.FirstChildElement("EnumType"));

    REQUIRE(enum_type.name == "Health");
    REQUIRE(enum_type.members.size() == 3);
    REQUIRE(enum_type.members[2].name == "Critical");
}

TEST_CASE("Test TypeDefinition class", "[csdl_model]")
{
    const char *xml = R"(
        <TypeDefinition Name="UUID" UnderlyingType="Edm.Guid">
            <Annotation Term="Validation.Pattern" String="[0-9a-f]+"/>
        </TypeDefinition>
    )";

    tinyxml2::XMLDocument doc;
    doc.Parse(xml);
    TypeDefinition type_definition = TypeDefinition::FromXml(*doc.FirstChildElement("TypeDefinition"));

    REQUIRE(type_definition.name == "UUID");
    REQUIRE(type_definition.underlying_type.name == "Edm.Guid");
    REQUIRE(type_definition.underlying_type.Kind() == PrimitiveKind::GUID);

    auto pattern = FindAnnotation(type_definition.annotations, "Validation.Pattern");
    REQUIRE(pattern != nullptr);
    REQUIRE(pattern->value == "[0-9a-f]+");
}

TEST_CASE("Test Annotation term matching", "[csdl_model]")
{
    Annotation annotation;

    SECTION("Redfish extension aliases")
    {
        annotation.term = "RedfishExtensions.v1_0_0.Required";
        REQUIRE(annotation.IsTerm("Redfish.Required"));
        REQUIRE_FALSE(annotation.IsTerm("Redfish.RequiredOnCreate"));
    }

    SECTION("OData core vocabulary")
    {
        annotation.term = "Org.OData.Core.V1.Permissions";
        REQUIRE(annotation.IsTerm("OData.Permissions"));
        REQUIRE_FALSE(annotation.IsTerm("Redfish.Permissions"));
    }

    SECTION("Bool values")
    {
        annotation.term = "OData.AdditionalProperties";
        annotation.value = "false";
        REQUIRE_FALSE(annotation.BoolValue());
        annotation.value = "True";
        REQUIRE(annotation.BoolValue());
    }
}

TEST_CASE("Test PrimitiveType class", "[csdl_model]")
{
    REQUIRE(PrimitiveType::IsValidPrimitiveType("Edm.Int64"));
    REQUIRE(PrimitiveType::IsValidPrimitiveType("Edm.DateTimeOffset"));
    REQUIRE_FALSE(PrimitiveType::IsValidPrimitiveType("Edm.Bogus"));
    REQUIRE_THROWS_AS(PrimitiveType::FromString("Resource.Id"), std::invalid_argument);

    REQUIRE(PrimitiveType("Edm.Int16").Kind() == PrimitiveKind::INT);
    REQUIRE(PrimitiveType("Edm.Double").Kind() == PrimitiveKind::DECIMAL);
    REQUIRE(PrimitiveType("Edm.Duration").Kind() == PrimitiveKind::DURATION);
    REQUIRE(String.Kind() == PrimitiveKind::STRING);
}

TEST_CASE("Test Edmx class", "[csdl_model]")
{
    SECTION("Parse Example_v1.xml")
    {
        auto xml = LoadTestFile("test/cpp/schemas/Example_v1.xml");
        auto edmx = Edmx::FromXml(xml);

        REQUIRE(edmx.version == "4.0");
        REQUIRE(edmx.references.size() == 4);
        REQUIRE(edmx.references[2].FileName() == "Resource_v1.xml");
        REQUIRE(edmx.references[2].includes.size() == 2);
        REQUIRE(edmx.references[1].includes[0].EffectiveAlias() == "Redfish");
        REQUIRE(edmx.references[2].includes[0].EffectiveAlias() == "Resource");

        REQUIRE(edmx.schemas.size() == 5);
        REQUIRE(edmx.schemas[0].ns == "Example");

        auto v1_0_0 = edmx.FindSchema("Example.v1_0_0");
        REQUIRE(v1_0_0 != nullptr);
        REQUIRE(v1_0_0->DefinesType("Example"));
        REQUIRE(v1_0_0->DefinesType("Mode"));
        REQUIRE_FALSE(v1_0_0->DefinesType("Settings"));

        auto example = v1_0_0->FindEntityType("Example");
        REQUIRE(example != nullptr);
        REQUIRE(example->base_type == "Example.Example");
        REQUIRE(example->properties.size() == 5);
        REQUIRE(example->navigation_properties.size() == 1);

        REQUIRE(v1_0_0->actions.size() == 1);
        REQUIRE(v1_0_0->actions[0].name == "Calibrate");
        REQUIRE(v1_0_0->actions[0].BindingType() == "Example.v1_0_0.Actions");

        REQUIRE(edmx.FindSchema("Example.v9_9_9") == nullptr);
    }

    SECTION("Reference file names drop query and fragment")
    {
        Reference reference;
        reference.uri = "http://redfish.dmtf.org/schemas/v1/Resource_v1.xml#frag";
        REQUIRE(reference.FileName() == "Resource_v1.xml");
        reference.uri = "/redfish/v1/Schemas/Chassis_v1.xml?download=1";
        REQUIRE(reference.FileName() == "Chassis_v1.xml");
    }

    SECTION("Malformed XML")
    {
        auto xml = LoadTestFile("test/cpp/schemas_bad/Broken_v1.xml");
        REQUIRE_THROWS_WITH(Edmx::FromXml(xml), Catch::Contains("Failed to parse XML"));
    }

    SECTION("Missing Edmx root")
    {
        auto xml = LoadTestFile("test/cpp/schemas_bad/NotEdmx_v1.xml");
        REQUIRE_THROWS_WITH(Edmx::FromXml(xml), Catch::Contains("Missing Edmx root element"));
    }
}
