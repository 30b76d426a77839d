#pragma once

#include "schema_doc.hpp"

#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace redfish_catalog {

class SchemaCatalog;

// ReferenceResolver class ----------------------------------------------------
// Resolves a namespace name as seen from one document. The name may be bare
// ("ExampleResource"), versioned ("ExampleResource.v1_0_1"), an alias, or
// one of the well-known namespaces that every document can see.
//
// Resolution order: exact version, highest declared version not above the
// requested one, then the unversioned namespace. Results are cached per
// (document, name); a cached entry is the same namespace record every time.

class ReferenceResolver
{
public:
    explicit ReferenceResolver(const SchemaCatalog& catalog);

    ReferenceResolver(const ReferenceResolver&) = delete;
    ReferenceResolver& operator=(const ReferenceResolver&) = delete;

    // Throws MissingSchemaError when the name is not reachable or not declared.
    const SchemaNamespace& Resolve(const SchemaDoc& from, const std::string& reference_name) const;

    size_t CacheSize() const;

    static bool IsWellKnownNamespace(const std::string& base);

private:
    const SchemaNamespace& ResolveUncached(const SchemaDoc& from, const std::string& reference_name) const;

    const SchemaCatalog& catalog;
    mutable std::mutex cache_mutex;
    mutable std::map<std::pair<std::string, std::string>, const SchemaNamespace*> cache;
};

} // namespace redfish_catalog
