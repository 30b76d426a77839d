#pragma once

#include "fuzzy_matcher.hpp"
#include "payload_value.hpp"
#include "redfish_property.hpp"
#include "redfish_type.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace redfish_catalog {

class CatalogConfig;
class SchemaCatalog;
class ObjectEngine;

struct PopulateOptions {
    bool check = false;
    double fuzzy_threshold = FuzzyMatcher::DEFAULT_THRESHOLD;

    static PopulateOptions FromConfig(const CatalogConfig& config);
};

// RedfishObject class ----------------------------------------------------------
// A structured type paired with one payload object: one property per declared
// property, plus the payload's annotation and action members.

class RedfishObject
{
public:
    // Schema skeleton: every declared property present and absent.
    explicit RedfishObject(std::shared_ptr<const RedfishType> type);

    RedfishObject Populate(const PayloadValue& payload, const ObjectEngine& engine) const;

    // Preserved '@' and '#' members, declared properties that are not absent,
    // then the undeclared members an open type admits.
    PayloadValue AsJson() const;
    std::set<std::string> GetLinks() const;

    const std::shared_ptr<const RedfishType>& Type() const { return type; }
    const std::vector<RedfishProperty>& Properties() const { return properties; }
    const RedfishProperty* GetProperty(const std::string& name) const;

    const PayloadValue::Object& Annotations() const { return annotations; }
    const std::vector<std::string>& UnknownKeys() const { return unknown_keys; }
    const PayloadValue::Object& AdditionalMembers() const { return additional_members; }
    const std::vector<std::string>& Errors() const { return errors; }

    // Object and property diagnostics of the whole tree, prefixed by property path.
    std::vector<std::string> CollectErrors() const;

private:
    friend class ObjectEngine;

    void CollectErrors(const std::string& prefix, std::vector<std::string>& out) const;

    std::shared_ptr<const RedfishType> type;
    std::vector<RedfishProperty> properties;
    PayloadValue::Object annotations;
    std::vector<std::string> unknown_keys;
    PayloadValue::Object additional_members;
    std::vector<std::string> errors;
};

// ObjectEngine class -------------------------------------------------------------
// Populates resolved types from payloads, resolving nested property types
// through the catalog. Holds no per-call state; one engine may serve
// concurrent calls.

class ObjectEngine
{
public:
    explicit ObjectEngine(const SchemaCatalog& catalog, PopulateOptions options = PopulateOptions());

    RedfishObject Populate(const std::shared_ptr<const RedfishType>& type, const PayloadValue& payload) const;
    RedfishObject Populate(const std::string& qualified_type_name, const PayloadValue& payload) const;

    RedfishProperty PopulateProperty(const PropertyDefinition& definition, const PayloadValue& raw_value) const;

    const PopulateOptions& Options() const { return options; }

private:
    std::shared_ptr<const RedfishType> SelectPayloadType(const std::shared_ptr<const RedfishType>& declared,
                                                         const PayloadValue& payload, std::vector<std::string>& errors) const;
    void PopulateNestedObjects(RedfishProperty& property) const;
    static bool IsAnnotationKey(const std::string& key);

    const SchemaCatalog& catalog;
    PopulateOptions options;
};

} // namespace redfish_catalog
