#pragma once

#include "csdl_model.hpp"

#include <memory>
#include <string>
#include <vector>

namespace redfish_catalog {

class SchemaDoc;

enum class RedfishTypeKind {
    ENTITY,
    COMPLEX,
    ENUM,
    TYPE_DEFINITION,
    PRIMITIVE
};

std::string RedfishTypeKindToString(RedfishTypeKind kind);

// PropertyDefinition class -------------------------------------------------
// One declared property of a structured type, with its value type kept as
// the declared name. The declaring document resolves that name lazily.

class PropertyDefinition
{
public:
    static PropertyDefinition FromProperty(const Property& property, const SchemaDoc* doc, const std::string& declaring_type);
    static PropertyDefinition FromNavigationProperty(const NavigationProperty& nav_prop, const SchemaDoc* doc, const std::string& declaring_type);

    // Plain property of the given declared type, not bound to any document.
    static PropertyDefinition ForType(const std::string& name, const std::string& type_name);

    bool IsPrimitive() const { return inner_type.rfind("Edm.", 0) == 0; }
    bool IsReadOnly() const { return permissions == "Read"; }

public:
    std::string name;
    std::string type_name;
    std::string inner_type;
    bool is_collection = false;
    bool nullable = true;
    bool is_navigation = false;
    bool required = false;
    bool auto_expand = false;
    std::string permissions;
    const SchemaDoc* declaring_doc = nullptr;
    std::string declaring_type;
};

// An action bound to a type, addressed in payloads as "#<Namespace>.<Name>".
class BoundAction
{
public:
    bool MatchesKey(const std::string& payload_key) const;

public:
    std::string name;
    std::string ns;
    Action action;
};

// RedfishType class --------------------------------------------------------
// A resolved type: the declaration merged with its base-type chain. Owned by
// the catalog's type cache and shared read-only afterwards.

class RedfishType
{
public:
    RedfishType() : underlying_type(String) {}

    static std::shared_ptr<const RedfishType> Primitive(const std::string& type_name);

    bool IsStructured() const { return kind == RedfishTypeKind::ENTITY || kind == RedfishTypeKind::COMPLEX; }
    bool IsEnum() const { return kind == RedfishTypeKind::ENUM; }

    // True when this type is other or derives from it.
    bool IsA(const RedfishType& other) const;

    const PropertyDefinition* FindProperty(const std::string& property_name) const;
    const BoundAction* FindActionForKey(const std::string& payload_key) const;
    bool HasEnumMember(const std::string& member) const;

    // The primitive this type coerces through: itself, the typedef's underlying type, or String for enums.
    PrimitiveType EffectivePrimitive() const;

    std::string ToString() const { return fulltype; }

public:
    RedfishTypeKind kind = RedfishTypeKind::COMPLEX;
    std::string fulltype;
    std::string ns;
    std::string type_name;
    std::string file;
    std::shared_ptr<const RedfishType> base;
    std::vector<PropertyDefinition> properties;
    std::vector<BoundAction> actions;
    std::vector<std::string> enum_members;
    PrimitiveType underlying_type;
    std::string pattern;
    bool abstract_type = false;
    bool open_type = false;
    bool additional_properties = true;
};

} // namespace redfish_catalog
