#include "csdl_model.hpp"
#include <sstream>

namespace redfish_catalog {

std::string PrimitiveKindToString(PrimitiveKind kind) {
    switch (kind) {
        case PrimitiveKind::INT: return "Int";
        case PrimitiveKind::DECIMAL: return "Decimal";
        case PrimitiveKind::STRING: return "String";
        case PrimitiveKind::GUID: return "Guid";
        case PrimitiveKind::BOOLEAN: return "Boolean";
        case PrimitiveKind::DATE_TIME_OFFSET: return "DateTimeOffset";
        case PrimitiveKind::DATE: return "Date";
        case PrimitiveKind::TIME_OF_DAY: return "TimeOfDay";
        case PrimitiveKind::DURATION: return "Duration";
        case PrimitiveKind::BINARY: return "Binary";
        case PrimitiveKind::ANY: return "Primitive";
        default: return "Unknown";
    }
}

PrimitiveKind PrimitiveType::Kind() const {
    if (name == "Edm.Int" || name == "Edm.Int16" || name == "Edm.Int32" || name == "Edm.Int64" ||
        name == "Edm.SByte" || name == "Edm.Byte") {
        return PrimitiveKind::INT;
    } else if (name == "Edm.Decimal" || name == "Edm.Double" || name == "Edm.Single") {
        return PrimitiveKind::DECIMAL;
    } else if (name == "Edm.String") {
        return PrimitiveKind::STRING;
    } else if (name == "Edm.Guid") {
        return PrimitiveKind::GUID;
    } else if (name == "Edm.Boolean") {
        return PrimitiveKind::BOOLEAN;
    } else if (name == "Edm.DateTimeOffset") {
        return PrimitiveKind::DATE_TIME_OFFSET;
    } else if (name == "Edm.Date") {
        return PrimitiveKind::DATE;
    } else if (name == "Edm.TimeOfDay") {
        return PrimitiveKind::TIME_OF_DAY;
    } else if (name == "Edm.Duration") {
        return PrimitiveKind::DURATION;
    } else if (name == "Edm.Binary" || name == "Edm.Stream") {
        return PrimitiveKind::BINARY;
    } else if (name == "Edm.Primitive" || name == "Edm.PrimitiveType") {
        return PrimitiveKind::ANY;
    }
    return PrimitiveKind::UNKNOWN;
}

// Maps vocabulary namespaces and their customary aliases onto one name.
static std::string CanonicalVocabulary(const std::string& ns) {
    if (ns == "Redfish" || ns.rfind("RedfishExtensions", 0) == 0) {
        return "Redfish";
    } else if (ns == "OData" || ns.rfind("Org.OData.Core", 0) == 0) {
        return "OData";
    } else if (ns == "Validation" || ns.rfind("Validation.", 0) == 0 || ns.rfind("Org.OData.Validation", 0) == 0) {
        return "Validation";
    } else if (ns == "Measures" || ns.rfind("Org.OData.Measures", 0) == 0) {
        return "Measures";
    }
    return ns;
}

static std::pair<std::string, std::string> SplitTerm(const std::string& term) {
    auto pos = term.rfind('.');
    if (pos == std::string::npos) {
        return {std::string(), term};
    }
    return {term.substr(0, pos), term.substr(pos + 1)};
}

bool Annotation::IsTerm(const std::string& expected_term) const {
    if (term == expected_term) {
        return true;
    }
    auto [ns, short_name] = SplitTerm(term);
    auto [expected_ns, expected_short_name] = SplitTerm(expected_term);
    return short_name == expected_short_name && CanonicalVocabulary(ns) == CanonicalVocabulary(expected_ns);
}

const Annotation* FindAnnotation(const std::vector<Annotation>& annotations, const std::string& term) {
    for (const auto& annotation : annotations) {
        if (annotation.IsTerm(term)) {
            return &annotation;
        }
    }
    return nullptr;
}

StructuredType StructuredType::FromXml(const tinyxml2::XMLElement& element) {
    try {
        StructuredType structured_type;

        structured_type.name = AttributeOr(element, "Name");
        structured_type.base_type = AttributeOr(element, "BaseType");
        structured_type.abstract_type = BoolAttributeOr(element, "Abstract", false);
        structured_type.open_type = BoolAttributeOr(element, "OpenType", false);

        for (const tinyxml2::XMLElement* prop_el = FirstChildByLocalName(element, "Property");
            prop_el != nullptr;
            prop_el = NextSiblingByLocalName(*prop_el, "Property"))
        {
            structured_type.properties.push_back(Property::FromXml(*prop_el));
        }

        for (const tinyxml2::XMLElement* nav_prop_el = FirstChildByLocalName(element, "NavigationProperty");
            nav_prop_el != nullptr;
            nav_prop_el = NextSiblingByLocalName(*nav_prop_el, "NavigationProperty"))
        {
            structured_type.navigation_properties.push_back(NavigationProperty::FromXml(*nav_prop_el));
        }

        for (const tinyxml2::XMLElement* annotation_el = FirstChildByLocalName(element, "Annotation");
            annotation_el != nullptr;
            annotation_el = NextSiblingByLocalName(*annotation_el, "Annotation"))
        {
            structured_type.annotations.push_back(Annotation::FromXml(*annotation_el));
        }

        return structured_type;
    } catch (const std::exception& e) {
        RFCAT_TRACE_ERROR("CSDL_PARSER", "Error parsing " + std::string(LocalName(element.Name())) + " " +
                          AttributeOr(element, "Name") + ": " + e.what());
        throw;
    }
}

Schema Schema::FromXml(const tinyxml2::XMLElement& element) {
    try {
        Schema schema;

        schema.ns = AttributeOr(element, "Namespace");
        schema.alias = AttributeOr(element, "Alias");

        for (const tinyxml2::XMLElement* enum_type_el = FirstChildByLocalName(element, "EnumType");
            enum_type_el != nullptr;
            enum_type_el = NextSiblingByLocalName(*enum_type_el, "EnumType"))
        {
            schema.enum_types.push_back(EnumType::FromXml(*enum_type_el));
        }

        for (const tinyxml2::XMLElement* type_def_el = FirstChildByLocalName(element, "TypeDefinition");
            type_def_el != nullptr;
            type_def_el = NextSiblingByLocalName(*type_def_el, "TypeDefinition"))
        {
            schema.type_definitions.push_back(TypeDefinition::FromXml(*type_def_el));
        }

        for (const tinyxml2::XMLElement* complex_type_el = FirstChildByLocalName(element, "ComplexType");
            complex_type_el != nullptr;
            complex_type_el = NextSiblingByLocalName(*complex_type_el, "ComplexType"))
        {
            schema.complex_types.push_back(ComplexType::FromXml(*complex_type_el));
        }

        for (const tinyxml2::XMLElement* entity_type_el = FirstChildByLocalName(element, "EntityType");
            entity_type_el != nullptr;
            entity_type_el = NextSiblingByLocalName(*entity_type_el, "EntityType"))
        {
            schema.entity_types.push_back(EntityType::FromXml(*entity_type_el));
        }

        for (const tinyxml2::XMLElement* action_el = FirstChildByLocalName(element, "Action");
            action_el != nullptr;
            action_el = NextSiblingByLocalName(*action_el, "Action"))
        {
            schema.actions.push_back(Action::FromXml(*action_el));
        }

        for (const tinyxml2::XMLElement* annotation_el = FirstChildByLocalName(element, "Annotation");
            annotation_el != nullptr;
            annotation_el = NextSiblingByLocalName(*annotation_el, "Annotation"))
        {
            schema.annotations.push_back(Annotation::FromXml(*annotation_el));
        }

        return schema;
    } catch (const std::exception& e) {
        RFCAT_TRACE_ERROR("CSDL_PARSER", "Error parsing Schema " + AttributeOr(element, "Namespace") + ": " + e.what());
        throw;
    }
}

const EntityType* Schema::FindEntityType(const std::string& type_name) const {
    for (const auto& entity_type : entity_types) {
        if (entity_type.name == type_name) {
            return &entity_type;
        }
    }
    return nullptr;
}

const ComplexType* Schema::FindComplexType(const std::string& type_name) const {
    for (const auto& complex_type : complex_types) {
        if (complex_type.name == type_name) {
            return &complex_type;
        }
    }
    return nullptr;
}

const EnumType* Schema::FindEnumType(const std::string& type_name) const {
    for (const auto& enum_type : enum_types) {
        if (enum_type.name == type_name) {
            return &enum_type;
        }
    }
    return nullptr;
}

const TypeDefinition* Schema::FindTypeDefinition(const std::string& type_name) const {
    for (const auto& type_def : type_definitions) {
        if (type_def.name == type_name) {
            return &type_def;
        }
    }
    return nullptr;
}

bool Schema::DefinesType(const std::string& type_name) const {
    return FindEntityType(type_name) || FindComplexType(type_name) ||
           FindEnumType(type_name) || FindTypeDefinition(type_name);
}

std::string Reference::FileName() const {
    auto end = uri.find_first_of("?#");
    auto path = uri.substr(0, end);
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

Edmx Edmx::FromXml(const std::string& xml) {
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLError result = doc.Parse(xml.c_str(), xml.size());
    if (result != tinyxml2::XML_SUCCESS) {
        std::stringstream ss;
        ss << "Failed to parse XML [" << tinyxml2::XMLDocument::ErrorIDToName(result) << "]";
        ss << " at line " << doc.ErrorLineNum();
        ss << ": " << doc.ErrorStr();
        throw std::runtime_error(ss.str());
    }
    return FromXml(doc);
}

Edmx Edmx::FromXml(const tinyxml2::XMLDocument& doc) {
    Edmx edmx;

    const tinyxml2::XMLElement* edmx_el = doc.RootElement();
    if (edmx_el == nullptr || std::strcmp(LocalName(edmx_el->Name()), "Edmx") != 0) {
        throw std::runtime_error("Missing Edmx root element");
    }

    const char* version_attr = edmx_el->Attribute("Version");
    if (version_attr) {
        edmx.version = version_attr;
    }

    for (const tinyxml2::XMLElement* ref_el = FirstChildByLocalName(*edmx_el, "Reference");
        ref_el != nullptr;
        ref_el = NextSiblingByLocalName(*ref_el, "Reference"))
    {
        edmx.references.push_back(Reference::FromXml(*ref_el));
    }

    for (const tinyxml2::XMLElement* data_svc_el = FirstChildByLocalName(*edmx_el, "DataServices");
        data_svc_el != nullptr;
        data_svc_el = NextSiblingByLocalName(*data_svc_el, "DataServices"))
    {
        for (const tinyxml2::XMLElement* schema_el = FirstChildByLocalName(*data_svc_el, "Schema");
            schema_el != nullptr;
            schema_el = NextSiblingByLocalName(*schema_el, "Schema"))
        {
            edmx.schemas.push_back(Schema::FromXml(*schema_el));
        }
    }

    return edmx;
}

const Schema* Edmx::FindSchema(const std::string& ns) const {
    for (const auto& schema : schemas) {
        if (schema.ns == ns || (!schema.alias.empty() && schema.alias == ns)) {
            return &schema;
        }
    }
    return nullptr;
}

} // namespace redfish_catalog
