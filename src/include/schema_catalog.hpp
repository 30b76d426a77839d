#pragma once

#include "catalog_config.hpp"
#include "catalog_errors.hpp"
#include "redfish_type.hpp"
#include "reference_resolver.hpp"
#include "schema_doc.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace redfish_catalog {

struct CatalogLoadOptions {
    std::string schema_suffix = ".xml";
    bool strict_load = false;
};

// SchemaCatalog class --------------------------------------------------------
// The set of schema documents of one service, indexed by file and namespace,
// plus the resolved-type cache built on top of it.
//
// Documents are parsed once while the catalog is constructed; the indexes are
// read-only afterwards. Type resolution is lazy and guarded so that catalogs
// can be shared between threads validating independent payloads.

class SchemaCatalog
{
    // Restricts construction to Load and FromDocuments.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    SchemaCatalog(ConstructionKey, const std::string& directory);
    SchemaCatalog(const SchemaCatalog&) = delete;
    SchemaCatalog& operator=(const SchemaCatalog&) = delete;

    // Loads every file ending with the schema suffix. A missing or unreadable
    // directory throws CatalogLoadError. Documents that fail to parse are
    // skipped and listed in FailedDocuments(), or, with strict_load, reported
    // together in one CatalogLoadError after all documents were attempted.
    static std::unique_ptr<SchemaCatalog> Load(const std::string& directory, const CatalogLoadOptions& options = CatalogLoadOptions());
    static std::unique_ptr<SchemaCatalog> Load(const CatalogConfig& config);

    // Builds a catalog from document texts keyed by file name.
    static std::unique_ptr<SchemaCatalog> FromDocuments(const std::map<std::string, std::string>& documents,
                                                        const CatalogLoadOptions& options = CatalogLoadOptions());

    // Document declaring the namespace of a bare, versioned or qualified type name.
    const SchemaDoc& GetSchemaDocByClass(const std::string& name) const;
    const SchemaNamespace& GetSchemaInCatalog(const std::string& name) const;

    std::shared_ptr<const RedfishType> GetTypeInCatalog(const std::string& qualified_type_name) const;
    std::shared_ptr<const RedfishType> GetTypeInCatalog(const std::shared_ptr<const RedfishType>& type) const;

    // Resolves a type name as seen from one document.
    std::shared_ptr<const RedfishType> GetTypeInSchemaDoc(const SchemaDoc& doc, const std::string& type_name) const;

    // Value type of a property, resolved through the document declaring it.
    std::shared_ptr<const RedfishType> ResolvePropertyType(const PropertyDefinition& definition) const;

    // Namespace lookup with version fallback, nullptr when nothing matches.
    const SchemaNamespace* FindNamespace(const NamespaceName& requested) const;

    const SchemaDoc* FindDocument(const std::string& file_name) const;
    std::vector<std::string> DocumentNames() const;
    std::vector<std::string> NamespaceNames() const;
    const std::vector<DocumentLoadFailure>& FailedDocuments() const { return failed_documents; }
    const std::string& Directory() const { return directory; }

    const ReferenceResolver& Resolver() const { return resolver; }
    size_t CachedTypeCount() const;

private:
    void AddDocument(const std::string& file_name, const std::string& text);
    void AddBuiltinNamespaces();
    void BuildIndexes();
    void ThrowIfStrict(const CatalogLoadOptions& options) const;

    using ResolutionStack = std::vector<std::string>;

    std::shared_ptr<const RedfishType> ResolveType(const SchemaDoc& from, const std::string& type_name, ResolutionStack& stack) const;
    std::shared_ptr<const RedfishType> BuildType(const SchemaNamespace& schema_ns, const std::string& type_name, ResolutionStack& stack) const;
    std::shared_ptr<const RedfishType> BuildStructuredType(const SchemaNamespace& schema_ns, const StructuredType& declaration,
                                                           RedfishTypeKind kind, ResolutionStack& stack) const;
    std::vector<const SchemaNamespace*> TypeSearchOrder(const SchemaNamespace& resolved, const NamespaceName& requested) const;

    std::string directory;
    std::map<std::string, std::unique_ptr<SchemaDoc>> documents;
    std::unique_ptr<SchemaDoc> builtin_document;
    std::vector<DocumentLoadFailure> failed_documents;

    std::map<std::string, const SchemaNamespace*> namespaces_by_name;
    // Versions ascending, the unversioned namespace first.
    std::map<std::string, std::vector<const SchemaNamespace*>> namespaces_by_base;

    ReferenceResolver resolver;

    mutable std::mutex type_cache_mutex;
    mutable std::unordered_map<std::string, std::shared_ptr<const RedfishType>> type_cache;
};

} // namespace redfish_catalog
