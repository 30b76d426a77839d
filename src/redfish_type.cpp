#include "redfish_type.hpp"
#include "schema_version.hpp"

namespace redfish_catalog {

std::string RedfishTypeKindToString(RedfishTypeKind kind) {
    switch (kind) {
        case RedfishTypeKind::ENTITY: return "EntityType";
        case RedfishTypeKind::COMPLEX: return "ComplexType";
        case RedfishTypeKind::ENUM: return "EnumType";
        case RedfishTypeKind::TYPE_DEFINITION: return "TypeDefinition";
        case RedfishTypeKind::PRIMITIVE: return "Primitive";
        default: return "Unknown";
    }
}

// PropertyDefinition --------------------------------------------------------

static void ApplyPropertyAnnotations(PropertyDefinition& definition, const std::vector<Annotation>& annotations) {
    auto required = FindAnnotation(annotations, "Redfish.Required");
    definition.required = required != nullptr && required->BoolValue();

    auto auto_expand = FindAnnotation(annotations, "OData.AutoExpand");
    if (!auto_expand) {
        auto_expand = FindAnnotation(annotations, "OData.AutoExpandReferences");
    }
    definition.auto_expand = auto_expand != nullptr && auto_expand->BoolValue();

    // EnumMember="OData.Permission/Read"
    auto permissions = FindAnnotation(annotations, "OData.Permissions");
    if (permissions) {
        auto pos = permissions->value.rfind('/');
        definition.permissions = pos == std::string::npos ? permissions->value : permissions->value.substr(pos + 1);
    }
}

PropertyDefinition PropertyDefinition::FromProperty(const Property& property, const SchemaDoc* doc, const std::string& declaring_type) {
    PropertyDefinition definition;
    definition.name = property.name;
    definition.type_name = property.type_name;
    std::tie(definition.is_collection, definition.inner_type) = ExtractCollectionType(property.type_name);
    definition.nullable = property.nullable;
    definition.declaring_doc = doc;
    definition.declaring_type = declaring_type;
    ApplyPropertyAnnotations(definition, property.annotations);
    return definition;
}

PropertyDefinition PropertyDefinition::FromNavigationProperty(const NavigationProperty& nav_prop, const SchemaDoc* doc, const std::string& declaring_type) {
    PropertyDefinition definition;
    definition.name = nav_prop.name;
    definition.type_name = nav_prop.type;
    std::tie(definition.is_collection, definition.inner_type) = ExtractCollectionType(nav_prop.type);
    definition.nullable = nav_prop.nullable;
    definition.is_navigation = true;
    definition.declaring_doc = doc;
    definition.declaring_type = declaring_type;
    ApplyPropertyAnnotations(definition, nav_prop.annotations);
    return definition;
}

PropertyDefinition PropertyDefinition::ForType(const std::string& name, const std::string& type_name) {
    PropertyDefinition definition;
    definition.name = name;
    definition.type_name = type_name;
    std::tie(definition.is_collection, definition.inner_type) = ExtractCollectionType(type_name);
    return definition;
}

// BoundAction ---------------------------------------------------------------

bool BoundAction::MatchesKey(const std::string& payload_key) const {
    if (payload_key.empty() || payload_key[0] != '#') {
        return false;
    }
    auto qualified = QualifiedTypeName::Parse(payload_key);
    return qualified.type_name == name &&
           NamespaceName::Parse(qualified.ns).base == NamespaceName::Parse(ns).base;
}

// RedfishType ---------------------------------------------------------------

std::shared_ptr<const RedfishType> RedfishType::Primitive(const std::string& type_name) {
    auto primitive = PrimitiveType::FromString(type_name);

    auto type = std::make_shared<RedfishType>();
    type->kind = RedfishTypeKind::PRIMITIVE;
    type->fulltype = type_name;
    type->ns = "Edm";
    type->type_name = type_name.substr(4);
    type->underlying_type = primitive;
    return type;
}

bool RedfishType::IsA(const RedfishType& other) const {
    for (const RedfishType* current = this; current != nullptr; current = current->base.get()) {
        if (current->fulltype == other.fulltype) {
            return true;
        }
    }
    return false;
}

const PropertyDefinition* RedfishType::FindProperty(const std::string& property_name) const {
    for (const auto& property : properties) {
        if (property.name == property_name) {
            return &property;
        }
    }
    return nullptr;
}

const BoundAction* RedfishType::FindActionForKey(const std::string& payload_key) const {
    for (const auto& action : actions) {
        if (action.MatchesKey(payload_key)) {
            return &action;
        }
    }
    return nullptr;
}

bool RedfishType::HasEnumMember(const std::string& member) const {
    return std::find(enum_members.begin(), enum_members.end(), member) != enum_members.end();
}

PrimitiveType RedfishType::EffectivePrimitive() const {
    if (kind == RedfishTypeKind::ENUM) {
        return String;
    }
    return underlying_type;
}

} // namespace redfish_catalog
