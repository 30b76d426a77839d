#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace redfish_catalog {

// PayloadValue class -------------------------------------------------------
// Closed value model for JSON payloads. Besides the JSON kinds it carries a
// distinguished "absent" state for properties a schema declares but a
// payload omits. Object members keep the order in which they were read.

class PayloadValue
{
public:
    using Array = std::vector<PayloadValue>;
    using Member = std::pair<std::string, PayloadValue>;
    using Object = std::vector<Member>;

    enum class Kind {
        ABSENT,
        NULL_VALUE,
        BOOLEAN,
        INTEGER,
        UNSIGNED,
        DOUBLE,
        STRING,
        ARRAY,
        OBJECT
    };

    struct AbsentTag {
        bool operator==(const AbsentTag&) const { return true; }
    };
    struct NullTag {
        bool operator==(const NullTag&) const { return true; }
    };

    PayloadValue();
    PayloadValue(std::nullptr_t);
    PayloadValue(bool value);
    PayloadValue(int value);
    PayloadValue(int64_t value);
    PayloadValue(uint64_t value);
    PayloadValue(double value);
    PayloadValue(const char* value);
    PayloadValue(std::string value);
    PayloadValue(Array value);
    PayloadValue(Object value);

    static PayloadValue Absent();

    // Parses JSON text, throws PayloadParseError on malformed input.
    static PayloadValue FromJson(const std::string& json);

    // Serializes to JSON text. Absent object members are omitted and absent
    // array elements are written as null; an absent root yields "".
    std::string ToJson(bool pretty = false) const;

    Kind GetKind() const;
    std::string TypeName() const;

    bool IsAbsent() const { return GetKind() == Kind::ABSENT; }
    bool IsNull() const { return GetKind() == Kind::NULL_VALUE; }
    bool IsBool() const { return GetKind() == Kind::BOOLEAN; }
    bool IsInteger() const { return GetKind() == Kind::INTEGER || GetKind() == Kind::UNSIGNED; }
    bool IsNumber() const { return IsInteger() || GetKind() == Kind::DOUBLE; }
    bool IsString() const { return GetKind() == Kind::STRING; }
    bool IsArray() const { return GetKind() == Kind::ARRAY; }
    bool IsObject() const { return GetKind() == Kind::OBJECT; }
    bool IsScalar() const { return IsBool() || IsNumber() || IsString(); }

    bool AsBool() const;
    int64_t AsInt64() const;
    uint64_t AsUInt64() const;
    double AsDouble() const;
    const std::string& AsString() const;
    const Array& AsArray() const;
    const Object& AsObject() const;

    // Member lookup on objects, nullptr when missing or not an object.
    const PayloadValue* Find(const std::string& key) const;
    std::vector<std::string> Keys() const;

    // Appends or replaces an object member; a null value becomes an empty object first.
    void Set(const std::string& key, PayloadValue value);

    // Compact text for diagnostics, strings without quotes.
    std::string ToDisplayString() const;

    bool operator==(const PayloadValue& other) const { return value == other.value; }
    bool operator!=(const PayloadValue& other) const { return !(*this == other); }

private:
    std::variant<AbsentTag, NullTag, bool, int64_t, uint64_t, double, std::string, Array, Object> value;
};

} // namespace redfish_catalog
