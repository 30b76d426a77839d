#include "schema_version.hpp"
#include <regex>
#include <sstream>

namespace redfish_catalog {

std::optional<SchemaVersion> SchemaVersion::FromString(const std::string& version_str) {
    static const std::regex version_regex("^v([0-9]+)_([0-9]+)_([0-9]+)$");
    std::smatch match;
    if (!std::regex_match(version_str, match, version_regex)) {
        return std::nullopt;
    }

    SchemaVersion version;
    try {
        version.major = std::stoi(match[1]);
        version.minor = std::stoi(match[2]);
        version.errata = std::stoi(match[3]);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return version;
}

std::string SchemaVersion::ToString() const {
    std::ostringstream ss;
    ss << "v" << major << "_" << minor << "_" << errata;
    return ss.str();
}

NamespaceName NamespaceName::Parse(const std::string& ns) {
    NamespaceName name;
    auto pos = ns.rfind('.');
    if (pos != std::string::npos) {
        auto version = SchemaVersion::FromString(ns.substr(pos + 1));
        if (version) {
            name.base = ns.substr(0, pos);
            name.version = version;
            return name;
        }
    }
    name.base = ns;
    return name;
}

std::string NamespaceName::ToString() const {
    if (!version) {
        return base;
    }
    return base + "." + version->ToString();
}

std::tuple<bool, std::string> ExtractCollectionType(const std::string& type_name) {
    static const std::regex collection_regex("^\\s*Collection\\(([^\\)]+)\\)\\s*$");
    std::smatch match;

    if (std::regex_match(type_name, match, collection_regex)) {
        return std::make_tuple(true, match[1].str());
    }
    return std::make_tuple(false, type_name);
}

std::string StripTypeHash(const std::string& type_name) {
    if (!type_name.empty() && type_name[0] == '#') {
        return type_name.substr(1);
    }
    return type_name;
}

QualifiedTypeName QualifiedTypeName::Parse(const std::string& qualified_name) {
    QualifiedTypeName name;
    auto [is_collection, inner] = ExtractCollectionType(StripTypeHash(qualified_name));
    name.is_collection = is_collection;

    auto pos = inner.rfind('.');
    if (pos == std::string::npos) {
        name.type_name = inner;
    } else {
        name.ns = inner.substr(0, pos);
        name.type_name = inner.substr(pos + 1);
    }
    return name;
}

std::string QualifiedTypeName::ToString() const {
    auto full = ns.empty() ? type_name : ns + "." + type_name;
    return is_collection ? "Collection(" + full + ")" : full;
}

} // namespace redfish_catalog
