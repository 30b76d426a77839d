#include "redfish_object.hpp"
#include "catalog_config.hpp"
#include "catalog_errors.hpp"
#include "schema_catalog.hpp"
#include "schema_version.hpp"

#include <algorithm>
#include <stdexcept>

namespace redfish_catalog {

PopulateOptions PopulateOptions::FromConfig(const CatalogConfig& config) {
    PopulateOptions options;
    options.check = config.check_properties;
    options.fuzzy_threshold = config.fuzzy_threshold;
    return options;
}

// RedfishObject ---------------------------------------------------------------

RedfishObject::RedfishObject(std::shared_ptr<const RedfishType> type)
    : type(std::move(type))
{
    if (!this->type) {
        throw std::invalid_argument("Cannot create an object without a type");
    }
    if (!this->type->IsStructured()) {
        throw std::invalid_argument(this->type->fulltype + " is not an entity or complex type");
    }
    for (const auto& definition : this->type->properties) {
        properties.emplace_back(definition, nullptr);
    }
}

RedfishObject RedfishObject::Populate(const PayloadValue& payload, const ObjectEngine& engine) const {
    return engine.Populate(type, payload);
}

const RedfishProperty* RedfishObject::GetProperty(const std::string& name) const {
    for (const auto& property : properties) {
        if (property.Name() == name) {
            return &property;
        }
    }
    return nullptr;
}

PayloadValue RedfishObject::AsJson() const {
    PayloadValue::Object members = annotations;
    for (const auto& property : properties) {
        auto json = property.AsJson();
        if (!json.IsAbsent()) {
            members.emplace_back(property.Name(), std::move(json));
        }
    }
    members.insert(members.end(), additional_members.begin(), additional_members.end());
    return PayloadValue(std::move(members));
}

std::set<std::string> RedfishObject::GetLinks() const {
    std::set<std::string> links;
    for (const auto& property : properties) {
        auto property_links = property.GetLinks();
        links.insert(property_links.begin(), property_links.end());
    }
    return links;
}

std::vector<std::string> RedfishObject::CollectErrors() const {
    std::vector<std::string> out;
    CollectErrors(std::string(), out);
    return out;
}

void RedfishObject::CollectErrors(const std::string& prefix, std::vector<std::string>& out) const {
    for (const auto& error : errors) {
        out.push_back(prefix + error);
    }
    for (const auto& property : properties) {
        for (const auto& error : property.Errors()) {
            out.push_back(prefix + error);
        }
        if (property.Object()) {
            property.Object()->CollectErrors(prefix + property.Name() + ".", out);
        }
        for (size_t i = 0; i < property.Elements().size(); i++) {
            const auto& element_object = property.Elements()[i].Object();
            if (element_object) {
                element_object->CollectErrors(prefix + property.Name() + "[" + std::to_string(i) + "].", out);
            }
        }
    }
}

// ObjectEngine ------------------------------------------------------------------

ObjectEngine::ObjectEngine(const SchemaCatalog& catalog, PopulateOptions options)
    : catalog(catalog), options(options)
{}

bool ObjectEngine::IsAnnotationKey(const std::string& key) {
    return key.find('@') != std::string::npos || (!key.empty() && key[0] == '#');
}

RedfishObject ObjectEngine::Populate(const std::string& qualified_type_name, const PayloadValue& payload) const {
    return Populate(catalog.GetTypeInCatalog(qualified_type_name), payload);
}

RedfishObject ObjectEngine::Populate(const std::shared_ptr<const RedfishType>& type, const PayloadValue& payload) const {
    if (!type) {
        throw std::invalid_argument("Cannot populate an object without a type");
    }

    if (payload.IsAbsent()) {
        return RedfishObject(type);
    }
    if (!payload.IsObject()) {
        if (options.check) {
            throw PropertyCoercionError(type->fulltype, "object", payload.ToDisplayString(), "payload is not an object");
        }
        RedfishObject skeleton(type);
        skeleton.errors.push_back("Payload for " + type->fulltype + " is " + payload.TypeName() + ", not an object");
        return skeleton;
    }

    std::vector<std::string> type_errors;
    auto effective_type = SelectPayloadType(type, payload, type_errors);

    RedfishObject result(effective_type);
    result.errors = type_errors;

    auto keys = payload.Keys();
    std::vector<std::string> consumed;

    for (auto& property : result.properties) {
        const auto definition = property.Definition();

        std::vector<std::string> exclude = consumed;
        for (const auto& key : keys) {
            if (IsAnnotationKey(key)) {
                exclude.push_back(key);
            }
        }
        for (const auto& other : effective_type->properties) {
            if (other.name != definition.name) {
                exclude.push_back(other.name);
            }
        }

        auto key = FuzzyMatcher::MatchKey(definition.name, keys, exclude, options.fuzzy_threshold);
        auto raw_value = payload.Find(key);
        if (!raw_value) {
            if (definition.required) {
                result.errors.push_back("Required property " + definition.name + " is missing");
            }
            continue;
        }

        consumed.push_back(key);
        if (key != definition.name) {
            RFCAT_TRACE_INFO("OBJECT_ENGINE", effective_type->fulltype + ": property " + definition.name +
                             " matched payload key " + key);
            result.errors.push_back("Property " + definition.name + " matched payload key " + key);
        }

        property = PopulateProperty(definition, *raw_value);
    }

    for (const auto& member : payload.AsObject()) {
        const auto& key = member.first;
        if (std::find(consumed.begin(), consumed.end(), key) != consumed.end()) {
            continue;
        }

        if (!key.empty() && key[0] == '#') {
            if (!effective_type->FindActionForKey(key)) {
                result.errors.push_back("Action " + key + " is not bound to " + effective_type->fulltype);
            }
            result.annotations.push_back(member);
        } else if (IsAnnotationKey(key)) {
            result.annotations.push_back(member);
        } else {
            result.unknown_keys.push_back(key);
            if (effective_type->additional_properties) {
                result.additional_members.push_back(member);
            } else {
                result.errors.push_back("Property " + key + " is not declared by " + effective_type->fulltype);
            }
        }
    }

    RFCAT_TRACE_TRACE("OBJECT_ENGINE", "Populated " + effective_type->fulltype + " with " + std::to_string(consumed.size()) +
                      " of " + std::to_string(keys.size()) + " payload keys");
    return result;
}

RedfishProperty ObjectEngine::PopulateProperty(const PropertyDefinition& definition, const PayloadValue& raw_value) const {
    std::shared_ptr<const RedfishType> type;
    if (!raw_value.IsAbsent()) {
        type = catalog.ResolvePropertyType(definition);
    }

    auto property = RedfishProperty(definition, type).Populate(raw_value, options.check);
    PopulateNestedObjects(property);
    return property;
}

void ObjectEngine::PopulateNestedObjects(RedfishProperty& property) const {
    if (!property.type || !property.type->IsStructured()) {
        return;
    }

    if (property.definition.is_collection) {
        for (auto& element : property.elements) {
            PopulateNestedObjects(element);
        }
        return;
    }

    const auto& raw_value = property.raw_value;
    if (!raw_value.IsObject()) {
        return;
    }

    // A reference holding only annotations is not expanded
    if (property.definition.is_navigation) {
        const auto& members = raw_value.AsObject();
        bool expanded = std::any_of(members.begin(), members.end(),
                                    [](const PayloadValue::Member& member) { return !IsAnnotationKey(member.first); });
        if (!expanded) {
            return;
        }
    }

    property.object = std::make_shared<RedfishObject>(Populate(property.type, raw_value));
}

std::shared_ptr<const RedfishType> ObjectEngine::SelectPayloadType(const std::shared_ptr<const RedfishType>& declared,
                                                                   const PayloadValue& payload, std::vector<std::string>& errors) const {
    auto odata_type = payload.Find("@odata.type");
    if (!odata_type || !odata_type->IsString()) {
        return declared;
    }

    auto type_name = StripTypeHash(odata_type->AsString());
    if (type_name == declared->fulltype) {
        return declared;
    }

    std::shared_ptr<const RedfishType> payload_type;
    try {
        payload_type = catalog.GetTypeInCatalog(type_name);
    } catch (const MissingSchemaError& e) {
        RFCAT_TRACE_WARN("OBJECT_ENGINE", std::string("Cannot resolve @odata.type: ") + e.what());
        errors.push_back("@odata.type " + type_name + " is not defined in the catalog");
        return declared;
    }

    bool same_short_name = payload_type->type_name == declared->type_name &&
                           NamespaceName::Parse(payload_type->ns).base == NamespaceName::Parse(declared->ns).base;
    if (payload_type->IsStructured() && (payload_type->IsA(*declared) || same_short_name)) {
        RFCAT_TRACE_DEBUG("OBJECT_ENGINE", "Using payload type " + payload_type->fulltype + " for " + declared->fulltype);
        return payload_type;
    }

    errors.push_back("@odata.type " + type_name + " is not derived from " + declared->fulltype);
    return declared;
}

} // namespace redfish_catalog
