#pragma once

#include <optional>
#include <string>
#include <tuple>

namespace redfish_catalog {

// Version triple carried by a namespace suffix such as "v1_2_0".
struct SchemaVersion {
    int major = 0;
    int minor = 0;
    int errata = 0;

    static std::optional<SchemaVersion> FromString(const std::string& version_str);
    std::string ToString() const;

    bool operator==(const SchemaVersion& other) const {
        return std::tie(major, minor, errata) == std::tie(other.major, other.minor, other.errata);
    }
    bool operator!=(const SchemaVersion& other) const { return !(*this == other); }
    bool operator<(const SchemaVersion& other) const {
        return std::tie(major, minor, errata) < std::tie(other.major, other.minor, other.errata);
    }
    bool operator<=(const SchemaVersion& other) const { return !(other < *this); }
    bool operator>(const SchemaVersion& other) const { return other < *this; }
};

// A namespace name split into its base name and optional version,
// e.g. "Example.v1_2_0" -> ("Example", 1.2.0), "Resource" -> ("Resource", none).
struct NamespaceName {
    std::string base;
    std::optional<SchemaVersion> version;

    static NamespaceName Parse(const std::string& ns);
    std::string ToString() const;

    bool IsVersioned() const { return version.has_value(); }

    bool operator==(const NamespaceName& other) const { return base == other.base && version == other.version; }
};

// A qualified type name "Namespace.TypeName" with optional leading '#'
// and an optional "Collection(...)" wrapper.
struct QualifiedTypeName {
    std::string ns;
    std::string type_name;
    bool is_collection = false;

    static QualifiedTypeName Parse(const std::string& qualified_name);
    std::string ToString() const;
};

// Strips "Collection(...)" and returns (is_collection, inner type name).
std::tuple<bool, std::string> ExtractCollectionType(const std::string& type_name);

std::string StripTypeHash(const std::string& type_name);

} // namespace redfish_catalog
