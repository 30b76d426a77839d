#pragma once

#include "csdl_model.hpp"
#include "redfish_type.hpp"
#include "schema_version.hpp"

#include <memory>
#include <string>
#include <vector>

namespace redfish_catalog {

class SchemaCatalog;
class SchemaDoc;

// One <Schema> of a document, indexed under its namespace name.
struct SchemaNamespace {
    std::string name;
    NamespaceName parsed;
    Schema schema;
    std::string file_name;
    const SchemaDoc* document = nullptr;
    bool builtin = false;
};

// One <Include> of a document's <Reference>, keyed by its effective alias.
struct DocumentReference {
    std::string alias;
    std::string namespace_;
    std::string uri;
    std::string file_name;
};

// SchemaDoc class ----------------------------------------------------------
// A parsed schema document. Immutable after construction and owned by the
// catalog, which must outlive it.

class SchemaDoc
{
public:
    SchemaDoc(const std::string& file_name, const Edmx& edmx, const SchemaCatalog& catalog, bool builtin = false);

    SchemaDoc(const SchemaDoc&) = delete;
    SchemaDoc& operator=(const SchemaDoc&) = delete;

    // Parses the document text, throws std::runtime_error on malformed XML.
    static std::unique_ptr<SchemaDoc> FromXml(const std::string& file_name, const std::string& xml, const SchemaCatalog& catalog);

    const std::string& FileName() const { return file_name; }
    const std::vector<SchemaNamespace>& Namespaces() const { return namespaces; }
    const std::vector<DocumentReference>& References() const { return references; }
    const std::vector<std::string>& Diagnostics() const { return diagnostics; }
    const SchemaCatalog& Catalog() const { return catalog; }
    bool IsBuiltin() const { return builtin; }

    // Own namespace by exact name or schema alias.
    const SchemaNamespace* FindNamespace(const std::string& ns) const;
    const DocumentReference* FindReference(const std::string& alias) const;

    // Replaces a reference or schema alias by the namespace it stands for.
    std::string SubstituteAlias(const std::string& name) const;

    // True when the namespace base is declared here or included by a reference.
    bool CanReach(const std::string& base) const;

    // Resolves a bare or versioned namespace name visible from this document.
    const SchemaNamespace& GetReference(const std::string& name) const;

    std::shared_ptr<const RedfishType> GetTypeInSchemaDoc(const std::string& type_name) const;
    std::shared_ptr<const RedfishType> GetTypeInSchemaDoc(const std::shared_ptr<const RedfishType>& type) const;

private:
    std::string file_name;
    std::vector<SchemaNamespace> namespaces;
    std::vector<DocumentReference> references;
    std::vector<std::string> diagnostics;
    const SchemaCatalog& catalog;
    bool builtin;
};

} // namespace redfish_catalog
