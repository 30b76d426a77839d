#include "redfish_property.hpp"
#include "catalog_errors.hpp"
#include "redfish_object.hpp"
#include "rfcat_tracing.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>
#include <stdexcept>

namespace redfish_catalog {

static const std::regex& NumericRegex() {
    static const std::regex numeric_regex("^\\s*[-+]?([0-9]+(\\.[0-9]*)?|\\.[0-9]+)([eE][-+]?[0-9]+)?\\s*$");
    return numeric_regex;
}

static const std::regex& IntegerRegex() {
    static const std::regex integer_regex("^\\s*[-+]?[0-9]+\\s*$");
    return integer_regex;
}

static const std::regex& GuidRegex() {
    static const std::regex guid_regex("^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");
    return guid_regex;
}

static const std::regex& LexicalRegex(PrimitiveKind kind) {
    static const std::regex date_time_offset_regex(
        "^[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}(:[0-9]{2}(\\.[0-9]+)?)?(Z|[+-][0-9]{2}:[0-9]{2})$");
    static const std::regex date_regex("^[0-9]{4}-[0-9]{2}-[0-9]{2}$");
    static const std::regex time_of_day_regex("^[0-9]{2}:[0-9]{2}(:[0-9]{2}(\\.[0-9]+)?)?$");
    static const std::regex duration_regex(
        "^-?P(?=[0-9T])([0-9]+D)?(T(?=[0-9])([0-9]+H)?([0-9]+M)?([0-9]+(\\.[0-9]+)?S)?)?$");

    switch (kind) {
        case PrimitiveKind::DATE_TIME_OFFSET: return date_time_offset_regex;
        case PrimitiveKind::DATE: return date_regex;
        case PrimitiveKind::TIME_OF_DAY: return time_of_day_regex;
        default: return duration_regex;
    }
}

// The upper bound is exclusive: INT64_MAX is not representable as a double and rounds up to 2^63.
static bool IsIntegral(double number) {
    return std::isfinite(number) && std::floor(number) == number &&
           number >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
           number < 9223372036854775808.0;
}

// Integral text is parsed exactly; returns false for non-integral text or on overflow.
static bool ParseInteger(const std::string& text, int64_t& number, bool& out_of_range) {
    out_of_range = false;
    if (!std::regex_match(text, IntegerRegex())) {
        return false;
    }
    errno = 0;
    long long parsed = std::strtoll(text.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        out_of_range = true;
        return false;
    }
    number = static_cast<int64_t>(parsed);
    return true;
}

static bool ParseNumber(const std::string& text, double& number) {
    if (!std::regex_match(text, NumericRegex())) {
        return false;
    }
    number = std::strtod(text.c_str(), nullptr);
    return true;
}

static std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

// RedfishProperty -----------------------------------------------------------

RedfishProperty::RedfishProperty(const std::string& type_name, const std::string& name)
    : definition(PropertyDefinition::ForType(name, type_name))
{
    if (!PrimitiveType::IsValidPrimitiveType(definition.inner_type)) {
        throw std::invalid_argument("Property type must be an Edm primitive without a catalog: " + type_name);
    }
    type = RedfishType::Primitive(definition.inner_type);
}

RedfishProperty::RedfishProperty(PropertyDefinition definition, std::shared_ptr<const RedfishType> type)
    : definition(std::move(definition)), type(std::move(type))
{}

std::string RedfishProperty::DisplayName() const {
    return definition.name.empty() ? definition.type_name : definition.name;
}

PropertyShape RedfishProperty::Shape() const {
    if (definition.is_collection) {
        return PropertyShape::COLLECTION;
    } else if (definition.is_navigation) {
        return PropertyShape::REFERENCE;
    } else if (type && type->IsStructured()) {
        return PropertyShape::OBJECT;
    }
    return PropertyShape::SCALAR;
}

RedfishProperty RedfishProperty::Populate(const PayloadValue& raw, bool check) const {
    RedfishProperty populated(definition, type);
    populated.raw_value = raw;

    if (raw.IsAbsent()) {
        return populated;
    }

    if (raw.IsNull()) {
        populated.value = raw;
        if (!definition.nullable) {
            populated.Reject(raw, type ? type->fulltype : definition.type_name, "property is not nullable", check);
        }
        return populated;
    }

    if (!definition.is_collection) {
        populated.value = populated.Coerce(raw, check);
        return populated;
    }

    if (!raw.IsArray()) {
        populated.Reject(raw, definition.type_name, "expected an array", check);
        populated.value = raw;
        return populated;
    }

    PropertyDefinition element_definition = definition;
    element_definition.is_collection = false;
    element_definition.type_name = definition.inner_type;
    element_definition.nullable = true;

    RedfishProperty element_template(element_definition, type);
    PayloadValue::Array element_values;
    for (const auto& element : raw.AsArray()) {
        auto populated_element = element_template.Populate(element, check);
        for (const auto& error : populated_element.errors) {
            populated.errors.push_back(error);
        }
        element_values.push_back(populated_element.value);
        populated.elements.push_back(std::move(populated_element));
    }
    populated.value = PayloadValue(std::move(element_values));
    return populated;
}

void RedfishProperty::Reject(const PayloadValue& raw, const std::string& expected, const std::string& reason, bool check) {
    if (check) {
        RFCAT_TRACE_DEBUG("PROPERTY_ENGINE", DisplayName() + ": " + reason);
        throw PropertyCoercionError(DisplayName(), expected, raw.ToDisplayString(), reason + ", got " + raw.TypeName());
    }
    errors.push_back(DisplayName() + ": " + reason + " (expected " + expected + ", got " + raw.TypeName() + " " +
                     raw.ToDisplayString() + ")");
}

PayloadValue RedfishProperty::Coerce(const PayloadValue& raw, bool check) {
    if (!type) {
        return raw;
    }

    if (definition.is_navigation) {
        return CoerceReference(raw, check);
    }

    switch (type->kind) {
        case RedfishTypeKind::ENTITY:
        case RedfishTypeKind::COMPLEX:
            if (!raw.IsObject()) {
                Reject(raw, type->fulltype, "expected an object", check);
            }
            return raw;
        case RedfishTypeKind::ENUM:
            if (!raw.IsString()) {
                Reject(raw, type->fulltype, "expected an enum member name", check);
            } else if (!type->HasEnumMember(raw.AsString())) {
                Reject(raw, type->fulltype, "'" + raw.AsString() + "' is not a member of " + type->fulltype, check);
            }
            return raw;
        case RedfishTypeKind::TYPE_DEFINITION: {
            auto coerced = CoercePrimitive(raw, type->underlying_type, check);
            if (check && !type->pattern.empty() && coerced.IsString()) {
                bool matches = false;
                try {
                    matches = std::regex_match(coerced.AsString(), std::regex(type->pattern));
                } catch (const std::regex_error& e) {
                    RFCAT_TRACE_WARN("PROPERTY_ENGINE", "Invalid pattern on " + type->fulltype + ": " + e.what());
                    errors.push_back(DisplayName() + ": pattern of " + type->fulltype + " is not a valid regex");
                    return coerced;
                }
                if (!matches) {
                    Reject(raw, type->fulltype, "value does not match pattern " + type->pattern, check);
                }
            }
            return coerced;
        }
        case RedfishTypeKind::PRIMITIVE:
            return CoercePrimitive(raw, type->underlying_type, check);
    }
    return raw;
}

PayloadValue RedfishProperty::CoerceReference(const PayloadValue& raw, bool check) {
    if (!raw.IsObject()) {
        Reject(raw, type->fulltype, "expected a resource reference object", check);
        return raw;
    }
    auto odata_id = raw.Find("@odata.id");
    if (odata_id && !odata_id->IsString()) {
        Reject(*odata_id, "string", "@odata.id must be a string", check);
    }
    return raw;
}

PayloadValue RedfishProperty::CoercePrimitive(const PayloadValue& raw, const PrimitiveType& primitive, bool check) {
    auto expected = primitive.name;

    switch (primitive.Kind()) {
        case PrimitiveKind::INT: {
            if (raw.IsInteger()) {
                return raw;
            }
            if (raw.IsString()) {
                int64_t integer = 0;
                bool out_of_range = false;
                if (ParseInteger(raw.AsString(), integer, out_of_range)) {
                    return PayloadValue(integer);
                }
                if (out_of_range) {
                    Reject(raw, expected, "value is out of the Int64 range", check);
                    return raw;
                }
            }
            double number = 0.0;
            if (raw.GetKind() == PayloadValue::Kind::DOUBLE) {
                number = raw.AsDouble();
            } else if (!raw.IsString() || !ParseNumber(raw.AsString(), number)) {
                Reject(raw, expected, "expected an integer", check);
                return raw;
            }
            if (IsIntegral(number)) {
                return PayloadValue(static_cast<int64_t>(number));
            }
            Reject(raw, expected, "expected an integral value", check);
            return PayloadValue(number);
        }
        case PrimitiveKind::DECIMAL: {
            if (raw.IsNumber()) {
                return raw;
            }
            double number = 0.0;
            if (raw.IsString() && ParseNumber(raw.AsString(), number)) {
                return PayloadValue(number);
            }
            Reject(raw, expected, "expected a number", check);
            return raw;
        }
        case PrimitiveKind::STRING:
            if (raw.IsString()) {
                return raw;
            }
            if (!raw.IsScalar()) {
                errors.push_back(DisplayName() + ": " + raw.TypeName() + " value stored as string");
            }
            return PayloadValue(raw.ToDisplayString());
        case PrimitiveKind::GUID:
            if (!raw.IsString()) {
                Reject(raw, expected, "expected a GUID string", check);
            } else if (check && !std::regex_match(raw.AsString(), GuidRegex())) {
                Reject(raw, expected, "malformed GUID", check);
            }
            return raw;
        case PrimitiveKind::BOOLEAN:
            if (raw.IsBool()) {
                return raw;
            }
            if (raw.IsString() && !check) {
                auto lower = ToLower(raw.AsString());
                if (lower == "true" || lower == "false") {
                    return PayloadValue(lower == "true");
                }
            }
            Reject(raw, expected, "expected a boolean", check);
            return raw;
        case PrimitiveKind::DATE_TIME_OFFSET:
        case PrimitiveKind::DATE:
        case PrimitiveKind::TIME_OF_DAY:
        case PrimitiveKind::DURATION:
            if (!raw.IsString()) {
                Reject(raw, expected, "expected an ISO 8601 string", check);
            } else if (check && !std::regex_match(raw.AsString(), LexicalRegex(primitive.Kind()))) {
                Reject(raw, expected, "malformed " + PrimitiveKindToString(primitive.Kind()), check);
            }
            return raw;
        case PrimitiveKind::BINARY:
            if (!raw.IsString()) {
                Reject(raw, expected, "expected a base64 string", check);
            }
            return raw;
        case PrimitiveKind::ANY:
            if (!raw.IsScalar()) {
                Reject(raw, expected, "expected a primitive value", check);
            }
            return raw;
        case PrimitiveKind::UNKNOWN:
            RFCAT_TRACE_DEBUG("PROPERTY_ENGINE", "Unknown primitive " + expected + " on " + DisplayName());
            return raw;
    }
    return raw;
}

// Results -------------------------------------------------------------------

PayloadValue RedfishProperty::AsJson() const {
    if (IsAbsent()) {
        return PayloadValue::Absent();
    }

    if (object) {
        return object->AsJson();
    }

    if (Shape() == PropertyShape::COLLECTION && !elements.empty()) {
        PayloadValue::Array values;
        for (const auto& element : elements) {
            auto element_json = element.AsJson();
            values.push_back(element_json.IsAbsent() ? PayloadValue() : element_json);
        }
        return PayloadValue(std::move(values));
    }

    // Coercion only feeds Value(); the payload is emitted as received.
    return raw_value;
}

std::set<std::string> RedfishProperty::GetLinks() const {
    std::set<std::string> links;
    if (IsAbsent() || IsNull()) {
        return links;
    }

    if (definition.is_navigation && value.IsObject()) {
        auto odata_id = value.Find("@odata.id");
        if (odata_id && odata_id->IsString()) {
            links.insert(odata_id->AsString());
        }
    }

    for (const auto& element : elements) {
        auto element_links = element.GetLinks();
        links.insert(element_links.begin(), element_links.end());
    }

    if (object) {
        auto object_links = object->GetLinks();
        links.insert(object_links.begin(), object_links.end());
    }
    return links;
}

} // namespace redfish_catalog
