#include "schema_doc.hpp"
#include "schema_catalog.hpp"

namespace redfish_catalog {

SchemaDoc::SchemaDoc(const std::string& file_name, const Edmx& edmx, const SchemaCatalog& catalog, bool builtin)
    : file_name(file_name), catalog(catalog), builtin(builtin)
{
    for (const auto& reference : edmx.references) {
        for (const auto& include : reference.includes) {
            if (include.namespace_.empty()) {
                diagnostics.push_back("Include without Namespace in reference " + reference.uri);
                RFCAT_TRACE_WARN("SCHEMA_DOC", file_name + ": include without Namespace in reference " + reference.uri);
                continue;
            }
            DocumentReference doc_reference;
            doc_reference.alias = include.EffectiveAlias();
            doc_reference.namespace_ = include.namespace_;
            doc_reference.uri = reference.uri;
            doc_reference.file_name = reference.FileName();
            references.push_back(doc_reference);
        }
    }

    for (const auto& schema : edmx.schemas) {
        if (schema.ns.empty()) {
            diagnostics.push_back("Schema without Namespace");
            RFCAT_TRACE_WARN("SCHEMA_DOC", file_name + ": schema without Namespace skipped");
            continue;
        }
        SchemaNamespace schema_ns;
        schema_ns.name = schema.ns;
        schema_ns.parsed = NamespaceName::Parse(schema.ns);
        schema_ns.schema = schema;
        schema_ns.file_name = file_name;
        schema_ns.document = this;
        schema_ns.builtin = builtin;
        namespaces.push_back(std::move(schema_ns));
    }

    RFCAT_TRACE_DEBUG("SCHEMA_DOC", "Parsed " + file_name + ": " + std::to_string(namespaces.size()) +
                      " namespaces, " + std::to_string(references.size()) + " references");
}

std::unique_ptr<SchemaDoc> SchemaDoc::FromXml(const std::string& file_name, const std::string& xml, const SchemaCatalog& catalog)
{
    auto edmx = Edmx::FromXml(xml);
    return std::make_unique<SchemaDoc>(file_name, edmx, catalog);
}

const SchemaNamespace* SchemaDoc::FindNamespace(const std::string& ns) const
{
    for (const auto& schema_ns : namespaces) {
        if (schema_ns.name == ns || (!schema_ns.schema.alias.empty() && schema_ns.schema.alias == ns)) {
            return &schema_ns;
        }
    }
    return nullptr;
}

const DocumentReference* SchemaDoc::FindReference(const std::string& alias) const
{
    for (const auto& reference : references) {
        if (reference.alias == alias) {
            return &reference;
        }
    }
    return nullptr;
}

std::string SchemaDoc::SubstituteAlias(const std::string& name) const
{
    auto reference = FindReference(name);
    if (reference && reference->alias != reference->namespace_) {
        return reference->namespace_;
    }
    for (const auto& schema_ns : namespaces) {
        if (!schema_ns.schema.alias.empty() && schema_ns.schema.alias == name) {
            return schema_ns.name;
        }
    }
    return name;
}

bool SchemaDoc::CanReach(const std::string& base) const
{
    for (const auto& schema_ns : namespaces) {
        if (schema_ns.parsed.base == base) {
            return true;
        }
    }
    for (const auto& reference : references) {
        if (NamespaceName::Parse(reference.namespace_).base == base) {
            return true;
        }
    }
    return false;
}

const SchemaNamespace& SchemaDoc::GetReference(const std::string& name) const
{
    return catalog.Resolver().Resolve(*this, name);
}

std::shared_ptr<const RedfishType> SchemaDoc::GetTypeInSchemaDoc(const std::string& type_name) const
{
    return catalog.GetTypeInSchemaDoc(*this, type_name);
}

std::shared_ptr<const RedfishType> SchemaDoc::GetTypeInSchemaDoc(const std::shared_ptr<const RedfishType>& type) const
{
    return type;
}

} // namespace redfish_catalog
