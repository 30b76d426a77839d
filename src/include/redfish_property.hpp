#pragma once

#include "payload_value.hpp"
#include "redfish_type.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace redfish_catalog {

class RedfishObject;
class ObjectEngine;

enum class PropertyShape {
    SCALAR,
    REFERENCE,
    OBJECT,
    COLLECTION
};

// RedfishProperty class ------------------------------------------------------
// A declared property paired with one payload value. Population never
// modifies the receiver, it returns a new populated property.
//
// Coercion is lenient by default: values that do not fit the declared type
// are kept and described in Errors(). With check=true they raise
// PropertyCoercionError instead. An absent value is always accepted.

class RedfishProperty
{
public:
    // Property of an Edm primitive type, e.g. "Edm.Int" or "Collection(Edm.String)".
    explicit RedfishProperty(const std::string& type_name, const std::string& name = std::string());
    RedfishProperty(PropertyDefinition definition, std::shared_ptr<const RedfishType> type);

    RedfishProperty Populate(const PayloadValue& raw_value, bool check = false) const;

    // Payload value as received (coerced form is Value()); absent properties
    // yield an absent value, which objects omit.
    PayloadValue AsJson() const;

    // Resource links carried by reference-typed values.
    std::set<std::string> GetLinks() const;

    const std::string& Name() const { return definition.name; }
    const PropertyDefinition& Definition() const { return definition; }
    const std::shared_ptr<const RedfishType>& Type() const { return type; }
    PropertyShape Shape() const;

    bool IsAbsent() const { return raw_value.IsAbsent(); }
    bool IsNull() const { return raw_value.IsNull(); }
    bool IsRequired() const { return definition.required; }
    bool IsCollection() const { return definition.is_collection; }

    const PayloadValue& Value() const { return value; }
    const PayloadValue& RawValue() const { return raw_value; }
    const std::vector<std::string>& Errors() const { return errors; }
    const std::vector<RedfishProperty>& Elements() const { return elements; }
    const std::shared_ptr<const RedfishObject>& Object() const { return object; }

private:
    friend class ObjectEngine;

    PayloadValue Coerce(const PayloadValue& raw, bool check);
    PayloadValue CoerceReference(const PayloadValue& raw, bool check);
    PayloadValue CoercePrimitive(const PayloadValue& raw, const PrimitiveType& primitive, bool check);
    void Reject(const PayloadValue& raw, const std::string& expected, const std::string& reason, bool check);
    std::string DisplayName() const;

    PropertyDefinition definition;
    std::shared_ptr<const RedfishType> type;
    PayloadValue raw_value = PayloadValue::Absent();
    PayloadValue value = PayloadValue::Absent();
    std::vector<std::string> errors;
    std::vector<RedfishProperty> elements;
    std::shared_ptr<const RedfishObject> object;
};

} // namespace redfish_catalog
