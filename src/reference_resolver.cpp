#include "reference_resolver.hpp"
#include "catalog_errors.hpp"
#include "schema_catalog.hpp"

namespace redfish_catalog {

ReferenceResolver::ReferenceResolver(const SchemaCatalog& catalog)
    : catalog(catalog)
{}

bool ReferenceResolver::IsWellKnownNamespace(const std::string& base)
{
    return base == "Redfish" || base == "RedfishExtensions" || base == "RedfishExtension";
}

const SchemaNamespace& ReferenceResolver::Resolve(const SchemaDoc& from, const std::string& reference_name) const
{
    auto key = std::make_pair(from.FileName(), reference_name);
    {
        std::lock_guard<std::mutex> lock(cache_mutex);
        auto it = cache.find(key);
        if (it != cache.end()) {
            return *it->second;
        }
    }

    // Concurrent misses compute the same record, the first insert wins.
    const SchemaNamespace& resolved = ResolveUncached(from, reference_name);

    std::lock_guard<std::mutex> lock(cache_mutex);
    auto inserted = cache.emplace(key, &resolved);
    return *inserted.first->second;
}

const SchemaNamespace& ReferenceResolver::ResolveUncached(const SchemaDoc& from, const std::string& reference_name) const
{
    auto substituted = from.SubstituteAlias(reference_name);
    auto requested = NamespaceName::Parse(substituted);

    RFCAT_TRACE_TRACE("REFERENCE_RESOLVER", from.FileName() + ": resolving " + reference_name +
                      (substituted != reference_name ? " (alias of " + substituted + ")" : std::string()));

    bool well_known = IsWellKnownNamespace(requested.base);
    if (!well_known && !from.CanReach(requested.base)) {
        RFCAT_TRACE_DEBUG("REFERENCE_RESOLVER", from.FileName() + " has no reference to " + requested.base);
        throw MissingSchemaError(reference_name, from.FileName());
    }

    auto resolved = catalog.FindNamespace(requested);
    if (resolved) {
        if (resolved->name != substituted) {
            RFCAT_TRACE_DEBUG("REFERENCE_RESOLVER", "Resolved " + reference_name + " to " + resolved->name);
        }
        return *resolved;
    }

    throw MissingSchemaError(reference_name, from.FileName());
}

size_t ReferenceResolver::CacheSize() const
{
    std::lock_guard<std::mutex> lock(cache_mutex);
    return cache.size();
}

} // namespace redfish_catalog
