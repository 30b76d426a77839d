#pragma once

#include "rfcat_tracing.hpp"
#include "tinyxml2.h"
#include <algorithm>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Cross-platform string comparison
#ifdef _WIN32
#include <string.h>
#define strcasecmp _stricmp
#else
#include <strings.h>
#endif

namespace redfish_catalog
{

// Element helpers ---------------------------------------------------------
// CSDL documents mix prefixed ("edmx:Reference") and default-namespace
// ("Schema") elements, so children are matched on their local name.

inline const char* LocalName(const char* qualified_name)
{
    if (qualified_name == nullptr) {
        return "";
    }
    const char* colon = std::strrchr(qualified_name, ':');
    return colon ? colon + 1 : qualified_name;
}

inline const tinyxml2::XMLElement* FirstChildByLocalName(const tinyxml2::XMLElement& parent, const char* name)
{
    for (const tinyxml2::XMLElement* child = parent.FirstChildElement();
        child != nullptr;
        child = child->NextSiblingElement())
    {
        if (std::strcmp(LocalName(child->Name()), name) == 0) {
            return child;
        }
    }
    return nullptr;
}

inline const tinyxml2::XMLElement* NextSiblingByLocalName(const tinyxml2::XMLElement& element, const char* name)
{
    for (const tinyxml2::XMLElement* sibling = element.NextSiblingElement();
        sibling != nullptr;
        sibling = sibling->NextSiblingElement())
    {
        if (std::strcmp(LocalName(sibling->Name()), name) == 0) {
            return sibling;
        }
    }
    return nullptr;
}

inline std::string AttributeOr(const tinyxml2::XMLElement& element, const char* name, const std::string& fallback = std::string())
{
    const char* attr = element.Attribute(name);
    return attr ? std::string(attr) : fallback;
}

inline bool BoolAttributeOr(const tinyxml2::XMLElement& element, const char* name, bool fallback)
{
    const char* attr = element.Attribute(name);
    if (attr == nullptr) {
        return fallback;
    }
    return strcasecmp(attr, "true") == 0;
}

// PrimitiveType class ---------------------------------------------------

// Coercion family of an Edm primitive.
enum class PrimitiveKind {
    INT,
    DECIMAL,
    STRING,
    GUID,
    BOOLEAN,
    DATE_TIME_OFFSET,
    DATE,
    TIME_OF_DAY,
    DURATION,
    BINARY,
    ANY,
    UNKNOWN
};

std::string PrimitiveKindToString(PrimitiveKind kind);

class PrimitiveType
{
public:
    PrimitiveType(const std::string &class_name)
        : name(class_name)
    {}

    static PrimitiveType FromString(const std::string& class_name) {
        if (!IsValidPrimitiveType(class_name)) {
            throw std::invalid_argument("Invalid primitive type: " + class_name);
        }
        return PrimitiveType(class_name);
    }

    static bool IsValidPrimitiveType(const std::string & class_name) {
        static const std::vector<std::string> primitive_types = {
            "Edm.Binary",
            "Edm.Boolean",
            "Edm.Byte",
            "Edm.Date",
            "Edm.DateTimeOffset",
            "Edm.Decimal",
            "Edm.Double",
            "Edm.Duration",
            "Edm.Guid",
            "Edm.Int",
            "Edm.Int16",
            "Edm.Int32",
            "Edm.Int64",
            "Edm.SByte",
            "Edm.Single",
            "Edm.Stream",
            "Edm.String",
            "Edm.TimeOfDay",
            "Edm.Primitive",
            "Edm.PrimitiveType"
        };

        return std::find(primitive_types.begin(), primitive_types.end(), class_name) != primitive_types.end();
    }

    PrimitiveKind Kind() const;

    bool operator==(const PrimitiveType& other) const {
        return name == other.name;
    }

    bool operator!=(const PrimitiveType& other) const {
        return name != other.name;
    }

public:
    std::string name;
    std::string ToString() const { return name; }
};

const PrimitiveType Binary("Edm.Binary");
const PrimitiveType Boolean("Edm.Boolean");
const PrimitiveType Byte("Edm.Byte");
const PrimitiveType Date("Edm.Date");
const PrimitiveType DateTimeOffset("Edm.DateTimeOffset");
const PrimitiveType Decimal("Edm.Decimal");
const PrimitiveType Double("Edm.Double");
const PrimitiveType Duration("Edm.Duration");
const PrimitiveType Guid("Edm.Guid");
const PrimitiveType Int("Edm.Int");
const PrimitiveType Int16("Edm.Int16");
const PrimitiveType Int32("Edm.Int32");
const PrimitiveType Int64("Edm.Int64");
const PrimitiveType SByte("Edm.SByte");
const PrimitiveType Single("Edm.Single");
const PrimitiveType Stream("Edm.Stream");
const PrimitiveType String("Edm.String");
const PrimitiveType TimeOfDay("Edm.TimeOfDay");

// Annotation class -------------------------------------------------------
class Annotation
{
public:
    Annotation() {}

    static Annotation FromXml(const tinyxml2::XMLElement& element) {
        Annotation annotation;
        annotation.term = AttributeOr(element, "Term");
        annotation.qualifier = AttributeOr(element, "Qualifier");

        // Only one value attribute is expected per annotation
        static const char* value_attrs[] = { "String", "EnumMember", "Bool", "Int", "Path" };
        for (const char* value_attr : value_attrs) {
            const char* attr = element.Attribute(value_attr);
            if (attr) {
                annotation.value_kind = value_attr;
                annotation.value = attr;
                break;
            }
        }

        return annotation;
    }

    // Compares terms by short name and canonical vocabulary, so that
    // "RedfishExtensions.v1_0_0.Required" and "Redfish.Required" match.
    bool IsTerm(const std::string& expected_term) const;

    // A term without a value attribute is a tagging annotation and counts as true.
    bool BoolValue() const {
        return value.empty() || strcasecmp(value.c_str(), "true") == 0;
    }

public:
    std::string term;
    std::string qualifier;
    std::string value_kind;
    std::string value;
};

const Annotation* FindAnnotation(const std::vector<Annotation>& annotations, const std::string& term);

// Property class ---------------------------------------------------------
class Property
{
public:
    Property() : nullable(true) {}

    static Property FromXml(const tinyxml2::XMLElement& element) {
        Property property;

        property.name = AttributeOr(element, "Name");
        property.type_name = AttributeOr(element, "Type");
        property.nullable = BoolAttributeOr(element, "Nullable", true);
        property.default_value = AttributeOr(element, "DefaultValue");

        for (const tinyxml2::XMLElement* annotation_el = FirstChildByLocalName(element, "Annotation");
            annotation_el != nullptr;
            annotation_el = NextSiblingByLocalName(*annotation_el, "Annotation"))
        {
            property.annotations.push_back(Annotation::FromXml(*annotation_el));
        }

        return property;
    }

public:
    std::string name;
    std::string type_name;
    bool nullable = true;
    std::string default_value;
    std::vector<Annotation> annotations;
};

// NavigationProperty class -----------------------------------------------
class NavigationProperty
{
public:
    NavigationProperty() : nullable(true), contains_target(false) {}

    static NavigationProperty FromXml(const tinyxml2::XMLElement& element) {
        NavigationProperty nav_prop;

        nav_prop.name = AttributeOr(element, "Name");
        nav_prop.type = AttributeOr(element, "Type");
        nav_prop.nullable = BoolAttributeOr(element, "Nullable", true);
        nav_prop.partner = AttributeOr(element, "Partner");
        nav_prop.contains_target = BoolAttributeOr(element, "ContainsTarget", false);

        for (const tinyxml2::XMLElement* annotation_el = FirstChildByLocalName(element, "Annotation");
            annotation_el != nullptr;
            annotation_el = NextSiblingByLocalName(*annotation_el, "Annotation"))
        {
            nav_prop.annotations.push_back(Annotation::FromXml(*annotation_el));
        }

        return nav_prop;
    }

public:
    std::string name;
    std::string type;
    bool nullable = true;
    std::string partner;
    bool contains_target = false;
    std::vector<Annotation> annotations;
};

// EnumMember class -------------------------------------------------------
class EnumMember
{
public:
    EnumMember() {}

    static EnumMember FromXml(const tinyxml2::XMLElement& element)
    {
        EnumMember member;
        member.name = AttributeOr(element, "Name");

        const char* value_attr = element.Attribute("Value");
        if (value_attr && std::strlen(value_attr) > 0) {
            try {
                member.value = std::stoll(value_attr);
            } catch (const std::exception&) {
                RFCAT_TRACE_WARN("CSDL_PARSER", "Ignoring non-numeric value '" + std::string(value_attr) + "' of enum member " + member.name);
            }
        }

        for (const tinyxml2::XMLElement* annotation_el = FirstChildByLocalName(element, "Annotation");
            annotation_el != nullptr;
            annotation_el = NextSiblingByLocalName(*annotation_el, "Annotation"))
        {
            member.annotations.push_back(Annotation::FromXml(*annotation_el));
        }

        return member;
    }

public:
    std::string name;
    std::optional<long long> value;
    std::vector<Annotation> annotations;
};

// EnumType class ---------------------------------------------------------
class EnumType
{
public:
    EnumType() : underlying_type(Int32), is_flags(false) {}

    static EnumType FromXml(const tinyxml2::XMLElement& element) {
        EnumType enum_type;

        enum_type.name = AttributeOr(element, "Name");
        const char* underlying_type_attr = element.Attribute("UnderlyingType");
        if (underlying_type_attr) {
            enum_type.underlying_type = PrimitiveType(underlying_type_attr);
        }
        enum_type.is_flags = BoolAttributeOr(element, "IsFlags", false);

        for (const tinyxml2::XMLElement* member_el = FirstChildByLocalName(element, "Member");
            member_el != nullptr;
            member_el = NextSiblingByLocalName(*member_el, "Member"))
        {
            enum_type.members.push_back(EnumMember::FromXml(*member_el));
        }

        for (const tinyxml2::XMLElement* annotation_el = FirstChildByLocalName(element, "Annotation");
            annotation_el != nullptr;
            annotation_el = NextSiblingByLocalName(*annotation_el, "Annotation"))
        {
            enum_type.annotations.push_back(Annotation::FromXml(*annotation_el));
        }

        return enum_type;
    }

public:
    std::string name;
    PrimitiveType underlying_type;
    bool is_flags = false;
    std::vector<EnumMember> members;
    std::vector<Annotation> annotations;
};

// TypeDefinition class ---------------------------------------------------
class TypeDefinition
{
public:
    TypeDefinition() : underlying_type(String) {}

    static TypeDefinition FromXml(const tinyxml2::XMLElement& element) {
        TypeDefinition type_definition;

        type_definition.name = AttributeOr(element, "Name");
        const char* underlying_type_attr = element.Attribute("UnderlyingType");
        if (underlying_type_attr) {
            type_definition.underlying_type = PrimitiveType(underlying_type_attr);
        }

        for (const tinyxml2::XMLElement* annotation_el = FirstChildByLocalName(element, "Annotation");
            annotation_el != nullptr;
            annotation_el = NextSiblingByLocalName(*annotation_el, "Annotation"))
        {
            type_definition.annotations.push_back(Annotation::FromXml(*annotation_el));
        }

        return type_definition;
    }

public:
    std::string name;
    PrimitiveType underlying_type;
    std::vector<Annotation> annotations;
};

// StructuredType class ---------------------------------------------------
// Shared shape of EntityType and ComplexType.
class StructuredType
{
public:
    static StructuredType FromXml(const tinyxml2::XMLElement& element);

public:
    std::string name;
    std::string base_type;
    bool abstract_type = false;
    bool open_type = false;
    std::vector<Property> properties;
    std::vector<NavigationProperty> navigation_properties;
    std::vector<Annotation> annotations;
};

class ComplexType : public StructuredType
{
public:
    static ComplexType FromXml(const tinyxml2::XMLElement& element) {
        ComplexType complex_type;
        static_cast<StructuredType&>(complex_type) = StructuredType::FromXml(element);
        return complex_type;
    }
};

class EntityType : public StructuredType
{
public:
    static EntityType FromXml(const tinyxml2::XMLElement& element) {
        EntityType entity_type;
        static_cast<StructuredType&>(entity_type) = StructuredType::FromXml(element);

        const tinyxml2::XMLElement* key_el = FirstChildByLocalName(element, "Key");
        if (key_el) {
            for (const tinyxml2::XMLElement* ref_el = FirstChildByLocalName(*key_el, "PropertyRef");
                ref_el != nullptr;
                ref_el = NextSiblingByLocalName(*ref_el, "PropertyRef"))
            {
                entity_type.key_properties.push_back(AttributeOr(*ref_el, "Name"));
            }
        }

        return entity_type;
    }

public:
    std::vector<std::string> key_properties;
};

// Action class -------------------------------------------------------------
class ActionParameter
{
public:
    static ActionParameter FromXml(const tinyxml2::XMLElement& element) {
        ActionParameter parameter;
        parameter.name = AttributeOr(element, "Name");
        parameter.type = AttributeOr(element, "Type");
        parameter.nullable = BoolAttributeOr(element, "Nullable", true);

        for (const tinyxml2::XMLElement* annotation_el = FirstChildByLocalName(element, "Annotation");
            annotation_el != nullptr;
            annotation_el = NextSiblingByLocalName(*annotation_el, "Annotation"))
        {
            parameter.annotations.push_back(Annotation::FromXml(*annotation_el));
        }
        return parameter;
    }

public:
    std::string name;
    std::string type;
    bool nullable = true;
    std::vector<Annotation> annotations;
};

class Action
{
public:
    static Action FromXml(const tinyxml2::XMLElement& element) {
        Action action;
        action.name = AttributeOr(element, "Name");
        action.is_bound = BoolAttributeOr(element, "IsBound", false);

        for (const tinyxml2::XMLElement* parameter_el = FirstChildByLocalName(element, "Parameter");
            parameter_el != nullptr;
            parameter_el = NextSiblingByLocalName(*parameter_el, "Parameter"))
        {
            action.parameters.push_back(ActionParameter::FromXml(*parameter_el));
        }

        const tinyxml2::XMLElement* return_el = FirstChildByLocalName(element, "ReturnType");
        if (return_el) {
            action.return_type = AttributeOr(*return_el, "Type");
        }

        return action;
    }

    // Type of the binding parameter, empty for unbound actions.
    std::string BindingType() const {
        if (!is_bound || parameters.empty()) {
            return std::string();
        }
        return parameters.front().type;
    }

public:
    std::string name;
    bool is_bound = false;
    std::vector<ActionParameter> parameters;
    std::string return_type;
};

// Schema class -----------------------------------------------------------
class Schema
{
public:
    Schema() {}

    static Schema FromXml(const tinyxml2::XMLElement& element);

    const EntityType* FindEntityType(const std::string& type_name) const;
    const ComplexType* FindComplexType(const std::string& type_name) const;
    const EnumType* FindEnumType(const std::string& type_name) const;
    const TypeDefinition* FindTypeDefinition(const std::string& type_name) const;
    bool DefinesType(const std::string& type_name) const;

public:
    std::string ns;
    std::string alias;
    std::vector<EnumType> enum_types;
    std::vector<TypeDefinition> type_definitions;
    std::vector<ComplexType> complex_types;
    std::vector<EntityType> entity_types;
    std::vector<Action> actions;
    std::vector<Annotation> annotations;
};

// ReferenceInclude class --------------------------------------------------
class ReferenceInclude
{
public:
    ReferenceInclude() {}

    static ReferenceInclude FromXml(const tinyxml2::XMLElement& element) {
        ReferenceInclude include;
        include.namespace_ = AttributeOr(element, "Namespace");
        include.alias = AttributeOr(element, "Alias");
        return include;
    }

    // An include without an alias is addressed by its namespace.
    const std::string& EffectiveAlias() const {
        return alias.empty() ? namespace_ : alias;
    }

public:
    std::string namespace_;
    std::string alias;
};

// Reference class ----------------------------------------------------------
class Reference
{
public:
    Reference() {}

    static Reference FromXml(const tinyxml2::XMLElement& element) {
        Reference reference;
        reference.uri = AttributeOr(element, "Uri");

        for (const tinyxml2::XMLElement* include_el = FirstChildByLocalName(element, "Include");
            include_el != nullptr;
            include_el = NextSiblingByLocalName(*include_el, "Include"))
        {
            reference.includes.push_back(ReferenceInclude::FromXml(*include_el));
        }

        return reference;
    }

    // Last path segment of the Uri, e.g. "Resource_v1.xml".
    std::string FileName() const;

public:
    std::string uri;
    std::vector<ReferenceInclude> includes;
};

// Edmx class --------------------------------------------------------------
class Edmx
{
public:
    Edmx() {}

    static Edmx FromXml(const std::string& xml);
    static Edmx FromXml(const tinyxml2::XMLDocument& doc);

    const Schema* FindSchema(const std::string& ns) const;

public:
    std::string version = "4.0";
    std::vector<Reference> references;
    std::vector<Schema> schemas;
};

} // namespace redfish_catalog
