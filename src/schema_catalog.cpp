#include "schema_catalog.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace redfish_catalog {

namespace fs = std::filesystem;

namespace {

// Marks a type as being resolved for the lifetime of the frame.
class ResolutionFrame
{
public:
    ResolutionFrame(std::vector<std::string>& stack, const std::string& name) : stack(stack) {
        stack.push_back(name);
    }
    ~ResolutionFrame() {
        stack.pop_back();
    }

private:
    std::vector<std::string>& stack;
};

bool HasSuffix(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool NamespaceOrder(const SchemaNamespace* lhs, const SchemaNamespace* rhs) {
    if (!lhs->parsed.version || !rhs->parsed.version) {
        return !lhs->parsed.version && rhs->parsed.version;
    }
    return *lhs->parsed.version < *rhs->parsed.version;
}

std::shared_ptr<RedfishType> NewType(const SchemaNamespace& schema_ns, const std::string& type_name, RedfishTypeKind kind)
{
    auto type = std::make_shared<RedfishType>();
    type->kind = kind;
    type->ns = schema_ns.name;
    type->type_name = type_name;
    type->fulltype = schema_ns.name + "." + type_name;
    type->file = schema_ns.file_name;
    return type;
}

} // namespace

// SchemaCatalog construction --------------------------------------------------

SchemaCatalog::SchemaCatalog(ConstructionKey, const std::string& directory)
    : directory(directory), resolver(*this)
{}

std::unique_ptr<SchemaCatalog> SchemaCatalog::Load(const std::string& directory, const CatalogLoadOptions& options)
{
    RFCAT_TRACE_INFO("SCHEMA_CATALOG", "Loading schema catalog from " + directory);

    std::error_code ec;
    if (directory.empty() || !fs::is_directory(directory, ec)) {
        RFCAT_TRACE_ERROR("SCHEMA_CATALOG", "Schema directory not found: " + directory);
        throw CatalogLoadError(directory, "directory does not exist or is not a directory");
    }

    std::vector<fs::path> files;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw CatalogLoadError(directory, ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw CatalogLoadError(directory, ec.message());
        }
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && HasSuffix(it->path().filename().string(), options.schema_suffix)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw CatalogLoadError(directory, ec.message());
    }
    std::sort(files.begin(), files.end());

    auto catalog = std::make_unique<SchemaCatalog>(ConstructionKey(), directory);
    for (const auto& path : files) {
        auto file_name = path.filename().string();
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            catalog->failed_documents.push_back({file_name, "cannot open file"});
            RFCAT_TRACE_WARN("SCHEMA_CATALOG", "Cannot open schema file " + path.string());
            continue;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        catalog->AddDocument(file_name, buffer.str());
    }

    catalog->ThrowIfStrict(options);
    catalog->BuildIndexes();

    RFCAT_TRACE_INFO("SCHEMA_CATALOG", "Loaded " + std::to_string(catalog->documents.size()) + " schema documents, " +
                     std::to_string(catalog->failed_documents.size()) + " failed");
    return catalog;
}

std::unique_ptr<SchemaCatalog> SchemaCatalog::Load(const CatalogConfig& config)
{
    CatalogLoadOptions options;
    options.schema_suffix = config.schema_suffix;
    options.strict_load = config.strict_load;
    return Load(config.metadata_file_path, options);
}

std::unique_ptr<SchemaCatalog> SchemaCatalog::FromDocuments(const std::map<std::string, std::string>& documents,
                                                            const CatalogLoadOptions& options)
{
    auto catalog = std::make_unique<SchemaCatalog>(ConstructionKey(), "<memory>");
    for (const auto& document : documents) {
        catalog->AddDocument(document.first, document.second);
    }

    catalog->ThrowIfStrict(options);
    catalog->BuildIndexes();

    RFCAT_TRACE_INFO("SCHEMA_CATALOG", "Built catalog from " + std::to_string(catalog->documents.size()) +
                     " in-memory documents, " + std::to_string(catalog->failed_documents.size()) + " failed");
    return catalog;
}

void SchemaCatalog::AddDocument(const std::string& file_name, const std::string& text)
{
    try {
        documents.emplace(file_name, SchemaDoc::FromXml(file_name, text, *this));
    } catch (const std::exception& e) {
        failed_documents.push_back({file_name, e.what()});
        RFCAT_TRACE_WARN("SCHEMA_CATALOG", "Skipping malformed schema document " + file_name + ": " + e.what());
    }
}

void SchemaCatalog::ThrowIfStrict(const CatalogLoadOptions& options) const
{
    if (options.strict_load && !failed_documents.empty()) {
        RFCAT_TRACE_ERROR("SCHEMA_CATALOG", std::to_string(failed_documents.size()) + " schema documents failed in strict mode");
        throw CatalogLoadError(directory, failed_documents);
    }
}

void SchemaCatalog::AddBuiltinNamespaces()
{
    Edmx edmx;
    for (const char* base : {"RedfishExtensions", "RedfishExtension", "Redfish"}) {
        Schema schema;
        schema.ns = std::string(base) + ".v1_0_0";
        edmx.schemas.push_back(schema);
    }
    builtin_document = std::make_unique<SchemaDoc>("<builtin>", edmx, *this, true);

    for (const auto& schema_ns : builtin_document->Namespaces()) {
        namespaces_by_name.emplace(schema_ns.name, &schema_ns);
    }
}

void SchemaCatalog::BuildIndexes()
{
    for (const auto& document : documents) {
        for (const auto& schema_ns : document.second->Namespaces()) {
            auto inserted = namespaces_by_name.emplace(schema_ns.name, &schema_ns);
            if (!inserted.second) {
                RFCAT_TRACE_WARN("SCHEMA_CATALOG", "Namespace " + schema_ns.name + " declared in " + document.first +
                                 " is already declared in " + inserted.first->second->file_name);
            }
        }
    }

    // Real documents take precedence over the builtin well-known namespaces
    AddBuiltinNamespaces();

    for (const auto& entry : namespaces_by_name) {
        namespaces_by_base[entry.second->parsed.base].push_back(entry.second);
    }
    for (auto& entry : namespaces_by_base) {
        std::sort(entry.second.begin(), entry.second.end(), NamespaceOrder);
    }

    RFCAT_TRACE_DEBUG("SCHEMA_CATALOG", "Indexed " + std::to_string(namespaces_by_name.size()) + " namespaces under " +
                      std::to_string(namespaces_by_base.size()) + " base names");
}

// Namespace lookup -------------------------------------------------------------

const SchemaNamespace* SchemaCatalog::FindNamespace(const NamespaceName& requested) const
{
    auto it = namespaces_by_base.find(requested.base);
    if (it == namespaces_by_base.end() || it->second.empty()) {
        return nullptr;
    }

    const auto& chain = it->second;
    const SchemaNamespace* unversioned = chain.front()->parsed.version ? nullptr : chain.front();

    if (!requested.version) {
        return unversioned ? unversioned : chain.back();
    }

    const SchemaNamespace* best = nullptr;
    for (const auto* candidate : chain) {
        if (candidate->parsed.version && *candidate->parsed.version <= *requested.version) {
            best = candidate;
        }
    }
    if (best) {
        return best;
    }
    if (unversioned) {
        return unversioned;
    }

    // Well-known namespaces never fail, whatever version is asked for
    if (ReferenceResolver::IsWellKnownNamespace(requested.base)) {
        return chain.back();
    }
    return nullptr;
}

const SchemaNamespace& SchemaCatalog::GetSchemaInCatalog(const std::string& name) const
{
    auto stripped = StripTypeHash(name);

    auto found = FindNamespace(NamespaceName::Parse(stripped));
    if (!found) {
        auto qualified = QualifiedTypeName::Parse(stripped);
        if (!qualified.ns.empty()) {
            found = FindNamespace(NamespaceName::Parse(qualified.ns));
        }
    }

    if (!found) {
        RFCAT_TRACE_DEBUG("SCHEMA_CATALOG", "No namespace in catalog for " + name);
        throw MissingSchemaError(name);
    }
    return *found;
}

const SchemaDoc& SchemaCatalog::GetSchemaDocByClass(const std::string& name) const
{
    return *GetSchemaInCatalog(name).document;
}

const SchemaDoc* SchemaCatalog::FindDocument(const std::string& file_name) const
{
    auto it = documents.find(file_name);
    return it == documents.end() ? nullptr : it->second.get();
}

std::vector<std::string> SchemaCatalog::DocumentNames() const
{
    std::vector<std::string> names;
    for (const auto& document : documents) {
        names.push_back(document.first);
    }
    return names;
}

std::vector<std::string> SchemaCatalog::NamespaceNames() const
{
    std::vector<std::string> names;
    for (const auto& entry : namespaces_by_name) {
        names.push_back(entry.first);
    }
    return names;
}

// Type resolution ----------------------------------------------------------------

std::shared_ptr<const RedfishType> SchemaCatalog::GetTypeInCatalog(const std::string& qualified_type_name) const
{
    auto qualified = QualifiedTypeName::Parse(qualified_type_name);
    if (qualified.ns == "Edm") {
        ResolutionStack stack;
        return ResolveType(*builtin_document, qualified_type_name, stack);
    }
    if (qualified.ns.empty()) {
        throw MissingSchemaError(qualified_type_name);
    }

    const SchemaDoc& doc = GetSchemaDocByClass(qualified.ns);
    return GetTypeInSchemaDoc(doc, qualified_type_name);
}

std::shared_ptr<const RedfishType> SchemaCatalog::GetTypeInCatalog(const std::shared_ptr<const RedfishType>& type) const
{
    if (!type) {
        throw std::invalid_argument("Cannot resolve a null type");
    }
    return type;
}

std::shared_ptr<const RedfishType> SchemaCatalog::GetTypeInSchemaDoc(const SchemaDoc& doc, const std::string& type_name) const
{
    ResolutionStack stack;
    return ResolveType(doc, type_name, stack);
}

std::shared_ptr<const RedfishType> SchemaCatalog::ResolvePropertyType(const PropertyDefinition& definition) const
{
    if (definition.declaring_doc) {
        return GetTypeInSchemaDoc(*definition.declaring_doc, definition.inner_type);
    }
    return GetTypeInCatalog(definition.inner_type);
}

size_t SchemaCatalog::CachedTypeCount() const
{
    std::lock_guard<std::mutex> lock(type_cache_mutex);
    return type_cache.size();
}

std::vector<const SchemaNamespace*> SchemaCatalog::TypeSearchOrder(const SchemaNamespace& resolved, const NamespaceName& requested) const
{
    std::vector<const SchemaNamespace*> order = {&resolved};

    auto it = namespaces_by_base.find(resolved.parsed.base);
    if (it == namespaces_by_base.end()) {
        return order;
    }
    const auto& chain = it->second;

    // Lower versions of the same namespace, newest first
    auto upper = resolved.parsed.version ? resolved.parsed.version : requested.version;
    for (auto candidate = chain.rbegin(); candidate != chain.rend(); ++candidate) {
        const SchemaNamespace* schema_ns = *candidate;
        if (schema_ns == &resolved || !schema_ns->parsed.version) {
            continue;
        }
        if (upper && *upper < *schema_ns->parsed.version) {
            continue;
        }
        order.push_back(schema_ns);
    }

    if (resolved.parsed.version && !chain.front()->parsed.version) {
        order.push_back(chain.front());
    }
    return order;
}

std::shared_ptr<const RedfishType> SchemaCatalog::ResolveType(const SchemaDoc& from, const std::string& type_name, ResolutionStack& stack) const
{
    auto qualified = QualifiedTypeName::Parse(type_name);

    if (qualified.ns == "Edm") {
        auto primitive_name = "Edm." + qualified.type_name;
        if (!PrimitiveType::IsValidPrimitiveType(primitive_name)) {
            throw MissingSchemaError(type_name, from.FileName());
        }
        std::lock_guard<std::mutex> lock(type_cache_mutex);
        auto it = type_cache.find(primitive_name);
        if (it != type_cache.end()) {
            return it->second;
        }
        auto primitive = RedfishType::Primitive(primitive_name);
        type_cache.emplace(primitive_name, primitive);
        return primitive;
    }
    if (qualified.ns.empty()) {
        throw MissingSchemaError(type_name, from.FileName());
    }

    const SchemaNamespace& resolved = resolver.Resolve(from, qualified.ns);
    auto requested = NamespaceName::Parse(from.SubstituteAlias(qualified.ns));

    for (const auto* candidate : TypeSearchOrder(resolved, requested)) {
        if (candidate->schema.DefinesType(qualified.type_name)) {
            return BuildType(*candidate, qualified.type_name, stack);
        }
    }

    RFCAT_TRACE_DEBUG("TYPE_CATALOG", "Type " + type_name + " not declared in " + resolved.name + " or its lower versions");
    throw MissingSchemaError(type_name, from.FileName());
}

std::shared_ptr<const RedfishType> SchemaCatalog::BuildType(const SchemaNamespace& schema_ns, const std::string& type_name, ResolutionStack& stack) const
{
    auto canonical = schema_ns.name + "." + type_name;
    {
        std::lock_guard<std::mutex> lock(type_cache_mutex);
        auto it = type_cache.find(canonical);
        if (it != type_cache.end()) {
            return it->second;
        }
    }

    auto on_stack = std::find(stack.begin(), stack.end(), canonical);
    if (on_stack != stack.end()) {
        std::vector<std::string> cycle(on_stack, stack.end());
        cycle.push_back(canonical);
        RFCAT_TRACE_ERROR("TYPE_CATALOG", "Circular base type chain at " + canonical);
        throw CircularReferenceError(cycle);
    }

    std::shared_ptr<const RedfishType> type;
    {
        ResolutionFrame frame(stack, canonical);
        const auto& schema = schema_ns.schema;

        if (auto entity_type = schema.FindEntityType(type_name)) {
            type = BuildStructuredType(schema_ns, *entity_type, RedfishTypeKind::ENTITY, stack);
        } else if (auto complex_type = schema.FindComplexType(type_name)) {
            type = BuildStructuredType(schema_ns, *complex_type, RedfishTypeKind::COMPLEX, stack);
        } else if (auto enum_type = schema.FindEnumType(type_name)) {
            auto enum_def = NewType(schema_ns, type_name, RedfishTypeKind::ENUM);
            enum_def->underlying_type = enum_type->underlying_type;
            for (const auto& member : enum_type->members) {
                enum_def->enum_members.push_back(member.name);
            }
            type = enum_def;
        } else if (auto type_def = schema.FindTypeDefinition(type_name)) {
            auto typedef_def = NewType(schema_ns, type_name, RedfishTypeKind::TYPE_DEFINITION);
            typedef_def->underlying_type = type_def->underlying_type;
            auto pattern = FindAnnotation(type_def->annotations, "Validation.Pattern");
            if (pattern) {
                typedef_def->pattern = pattern->value;
            }
            type = typedef_def;
        } else {
            throw MissingSchemaError(canonical, schema_ns.file_name);
        }
    }

    std::lock_guard<std::mutex> lock(type_cache_mutex);
    auto inserted = type_cache.emplace(canonical, type);
    if (inserted.second) {
        RFCAT_TRACE_DEBUG("TYPE_CATALOG", "Resolved " + canonical + " (" + RedfishTypeKindToString(type->kind) + ", " +
                          std::to_string(type->properties.size()) + " properties)");
    }
    return inserted.first->second;
}

std::shared_ptr<const RedfishType> SchemaCatalog::BuildStructuredType(const SchemaNamespace& schema_ns, const StructuredType& declaration,
                                                                      RedfishTypeKind kind, ResolutionStack& stack) const
{
    auto type = NewType(schema_ns, declaration.name, kind);
    type->abstract_type = declaration.abstract_type;
    type->open_type = declaration.open_type;

    if (!declaration.base_type.empty()) {
        auto base = ResolveType(*schema_ns.document, declaration.base_type, stack);
        if (!base->IsStructured()) {
            throw CatalogError("Base type is not a structured type",
                               ErrorContext().Set("type", type->fulltype).Set("base", base->fulltype).Set("file", schema_ns.file_name));
        }
        type->base = base;
        type->properties = base->properties;
        type->actions = base->actions;
        type->additional_properties = base->additional_properties;
    }

    auto additional = FindAnnotation(declaration.annotations, "OData.AdditionalProperties");
    if (additional) {
        type->additional_properties = additional->BoolValue();
    }

    // Redeclared properties replace the inherited ones in place
    auto merge = [&type](PropertyDefinition definition) {
        for (auto& existing : type->properties) {
            if (existing.name == definition.name) {
                existing = std::move(definition);
                return;
            }
        }
        type->properties.push_back(std::move(definition));
    };
    for (const auto& property : declaration.properties) {
        merge(PropertyDefinition::FromProperty(property, schema_ns.document, type->fulltype));
    }
    for (const auto& nav_prop : declaration.navigation_properties) {
        merge(PropertyDefinition::FromNavigationProperty(nav_prop, schema_ns.document, type->fulltype));
    }

    // Actions bound to this type anywhere in the declaring document
    for (const auto& candidate_ns : schema_ns.document->Namespaces()) {
        for (const auto& action : candidate_ns.schema.actions) {
            auto binding = action.BindingType();
            if (binding.empty()) {
                continue;
            }
            auto qualified = QualifiedTypeName::Parse(binding);
            if (qualified.type_name != declaration.name ||
                NamespaceName::Parse(schema_ns.document->SubstituteAlias(qualified.ns)).base != schema_ns.parsed.base) {
                continue;
            }

            BoundAction bound;
            bound.name = action.name;
            bound.ns = candidate_ns.name;
            bound.action = action;

            auto existing = std::find_if(type->actions.begin(), type->actions.end(),
                                         [&bound](const BoundAction& other) { return other.name == bound.name; });
            if (existing != type->actions.end()) {
                *existing = bound;
            } else {
                type->actions.push_back(bound);
            }
        }
    }

    return type;
}

} // namespace redfish_catalog
