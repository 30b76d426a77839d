#include "payload_value.hpp"
#include "catalog_errors.hpp"
#include "rfcat_tracing.hpp"
#include "yyjson.h"

#include <cstdlib>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace redfish_catalog {

PayloadValue::PayloadValue() : value(NullTag{}) {}
PayloadValue::PayloadValue(std::nullptr_t) : value(NullTag{}) {}
PayloadValue::PayloadValue(bool value) : value(value) {}
PayloadValue::PayloadValue(int value) : value(static_cast<int64_t>(value)) {}
PayloadValue::PayloadValue(int64_t value) : value(value) {}
PayloadValue::PayloadValue(uint64_t value) : value(value) {}
PayloadValue::PayloadValue(double value) : value(value) {}
PayloadValue::PayloadValue(const char* value) : value(std::string(value)) {}
PayloadValue::PayloadValue(std::string value) : value(std::move(value)) {}
PayloadValue::PayloadValue(Array value) : value(std::move(value)) {}
PayloadValue::PayloadValue(Object value) : value(std::move(value)) {}

PayloadValue PayloadValue::Absent()
{
    PayloadValue absent;
    absent.value = AbsentTag{};
    return absent;
}

// ----------------------------------------------------------------------

static PayloadValue FromYyjson(yyjson_val* json_value)
{
    if (!json_value || yyjson_is_null(json_value)) {
        return PayloadValue();
    }

    if (yyjson_is_bool(json_value)) {
        return PayloadValue(yyjson_get_bool(json_value));
    } else if (yyjson_is_uint(json_value)) {
        uint64_t val = yyjson_get_uint(json_value);
        if (val <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return PayloadValue(static_cast<int64_t>(val));
        }
        return PayloadValue(val);
    } else if (yyjson_is_sint(json_value)) {
        return PayloadValue(static_cast<int64_t>(yyjson_get_sint(json_value)));
    } else if (yyjson_is_real(json_value)) {
        return PayloadValue(yyjson_get_real(json_value));
    } else if (yyjson_is_str(json_value)) {
        return PayloadValue(std::string(yyjson_get_str(json_value), yyjson_get_len(json_value)));
    } else if (yyjson_is_arr(json_value)) {
        PayloadValue::Array elements;
        elements.reserve(yyjson_arr_size(json_value));

        yyjson_val* element;
        yyjson_arr_iter iter;
        yyjson_arr_iter_init(json_value, &iter);
        while ((element = yyjson_arr_iter_next(&iter))) {
            elements.push_back(FromYyjson(element));
        }
        return PayloadValue(std::move(elements));
    } else if (yyjson_is_obj(json_value)) {
        PayloadValue::Object members;
        members.reserve(yyjson_obj_size(json_value));

        yyjson_val* key;
        yyjson_obj_iter iter;
        yyjson_obj_iter_init(json_value, &iter);
        while ((key = yyjson_obj_iter_next(&iter))) {
            auto member_value = yyjson_obj_iter_get_val(key);
            members.emplace_back(std::string(yyjson_get_str(key), yyjson_get_len(key)), FromYyjson(member_value));
        }
        return PayloadValue(std::move(members));
    }

    throw std::runtime_error(std::string("Unsupported JSON value type: ") + yyjson_get_type_desc(json_value));
}

PayloadValue PayloadValue::FromJson(const std::string& json)
{
    yyjson_read_err err;
    auto doc = std::shared_ptr<yyjson_doc>(
        yyjson_read_opts(const_cast<char*>(json.c_str()), json.size(), YYJSON_READ_NOFLAG, nullptr, &err),
        yyjson_doc_free);
    if (!doc) {
        std::ostringstream ss;
        ss << "yyjson error " << err.code << ": " << (err.msg ? err.msg : "unknown error");
        RFCAT_TRACE_DEBUG_DATA("PAYLOAD", ss.str(), json.substr(0, 256));
        throw PayloadParseError(ss.str(), err.pos);
    }

    return FromYyjson(yyjson_doc_get_root(doc.get()));
}

// ----------------------------------------------------------------------

static yyjson_mut_val* ToYyjson(yyjson_mut_doc* doc, const PayloadValue& value)
{
    switch (value.GetKind()) {
        case PayloadValue::Kind::ABSENT:
        case PayloadValue::Kind::NULL_VALUE:
            return yyjson_mut_null(doc);
        case PayloadValue::Kind::BOOLEAN:
            return yyjson_mut_bool(doc, value.AsBool());
        case PayloadValue::Kind::INTEGER:
            return yyjson_mut_sint(doc, value.AsInt64());
        case PayloadValue::Kind::UNSIGNED:
            return yyjson_mut_uint(doc, value.AsUInt64());
        case PayloadValue::Kind::DOUBLE:
            return yyjson_mut_real(doc, value.AsDouble());
        case PayloadValue::Kind::STRING:
            return yyjson_mut_strncpy(doc, value.AsString().c_str(), value.AsString().size());
        case PayloadValue::Kind::ARRAY: {
            auto arr = yyjson_mut_arr(doc);
            for (const auto& element : value.AsArray()) {
                yyjson_mut_arr_append(arr, ToYyjson(doc, element));
            }
            return arr;
        }
        case PayloadValue::Kind::OBJECT: {
            auto obj = yyjson_mut_obj(doc);
            for (const auto& member : value.AsObject()) {
                if (member.second.IsAbsent()) {
                    continue;
                }
                auto key = yyjson_mut_strncpy(doc, member.first.c_str(), member.first.size());
                yyjson_mut_obj_add(obj, key, ToYyjson(doc, member.second));
            }
            return obj;
        }
    }
    return yyjson_mut_null(doc);
}

std::string PayloadValue::ToJson(bool pretty) const
{
    if (IsAbsent()) {
        return std::string();
    }

    auto doc = std::shared_ptr<yyjson_mut_doc>(yyjson_mut_doc_new(nullptr), yyjson_mut_doc_free);
    if (!doc) {
        throw std::runtime_error("Failed to allocate JSON document");
    }
    yyjson_mut_doc_set_root(doc.get(), ToYyjson(doc.get(), *this));

    yyjson_write_flag flags = pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
    size_t len = 0;
    char* json_str = yyjson_mut_write(doc.get(), flags, &len);
    if (!json_str) {
        throw std::runtime_error("Failed to serialize JSON payload");
    }
    std::string result(json_str, len);
    free(json_str);
    return result;
}

// ----------------------------------------------------------------------

PayloadValue::Kind PayloadValue::GetKind() const
{
    return static_cast<Kind>(value.index());
}

std::string PayloadValue::TypeName() const
{
    switch (GetKind()) {
        case Kind::ABSENT: return "absent";
        case Kind::NULL_VALUE: return "null";
        case Kind::BOOLEAN: return "boolean";
        case Kind::INTEGER:
        case Kind::UNSIGNED: return "integer";
        case Kind::DOUBLE: return "number";
        case Kind::STRING: return "string";
        case Kind::ARRAY: return "array";
        case Kind::OBJECT: return "object";
    }
    return "unknown";
}

bool PayloadValue::AsBool() const
{
    if (!IsBool()) {
        throw std::runtime_error("Expected boolean payload value, got " + TypeName());
    }
    return std::get<bool>(value);
}

int64_t PayloadValue::AsInt64() const
{
    switch (GetKind()) {
        case Kind::INTEGER: return std::get<int64_t>(value);
        case Kind::UNSIGNED: return static_cast<int64_t>(std::get<uint64_t>(value));
        case Kind::DOUBLE: return static_cast<int64_t>(std::get<double>(value));
        default:
            throw std::runtime_error("Expected numeric payload value, got " + TypeName());
    }
}

uint64_t PayloadValue::AsUInt64() const
{
    switch (GetKind()) {
        case Kind::INTEGER: return static_cast<uint64_t>(std::get<int64_t>(value));
        case Kind::UNSIGNED: return std::get<uint64_t>(value);
        case Kind::DOUBLE: return static_cast<uint64_t>(std::get<double>(value));
        default:
            throw std::runtime_error("Expected numeric payload value, got " + TypeName());
    }
}

double PayloadValue::AsDouble() const
{
    switch (GetKind()) {
        case Kind::INTEGER: return static_cast<double>(std::get<int64_t>(value));
        case Kind::UNSIGNED: return static_cast<double>(std::get<uint64_t>(value));
        case Kind::DOUBLE: return std::get<double>(value);
        default:
            throw std::runtime_error("Expected numeric payload value, got " + TypeName());
    }
}

const std::string& PayloadValue::AsString() const
{
    if (!IsString()) {
        throw std::runtime_error("Expected string payload value, got " + TypeName());
    }
    return std::get<std::string>(value);
}

const PayloadValue::Array& PayloadValue::AsArray() const
{
    if (!IsArray()) {
        throw std::runtime_error("Expected array payload value, got " + TypeName());
    }
    return std::get<Array>(value);
}

const PayloadValue::Object& PayloadValue::AsObject() const
{
    if (!IsObject()) {
        throw std::runtime_error("Expected object payload value, got " + TypeName());
    }
    return std::get<Object>(value);
}

const PayloadValue* PayloadValue::Find(const std::string& key) const
{
    if (!IsObject()) {
        return nullptr;
    }
    for (const auto& member : std::get<Object>(value)) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

std::vector<std::string> PayloadValue::Keys() const
{
    std::vector<std::string> keys;
    if (!IsObject()) {
        return keys;
    }
    for (const auto& member : std::get<Object>(value)) {
        keys.push_back(member.first);
    }
    return keys;
}

void PayloadValue::Set(const std::string& key, PayloadValue member_value)
{
    if (IsNull()) {
        value = Object();
    }
    if (!IsObject()) {
        throw std::runtime_error("Cannot set member '" + key + "' on " + TypeName() + " payload value");
    }
    auto& members = std::get<Object>(value);
    for (auto& member : members) {
        if (member.first == key) {
            member.second = std::move(member_value);
            return;
        }
    }
    members.emplace_back(key, std::move(member_value));
}

std::string PayloadValue::ToDisplayString() const
{
    switch (GetKind()) {
        case Kind::ABSENT: return "<absent>";
        case Kind::STRING: return AsString();
        default: return ToJson();
    }
}

} // namespace redfish_catalog
