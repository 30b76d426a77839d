#include "catalog_errors.hpp"
#include <sstream>

namespace redfish_catalog {

CatalogError::CatalogError(const std::string& message, const ErrorContext& context)
    : std::runtime_error(context.Format(message)), context(context)
{}

static ErrorContext MissingSchemaContext(const std::string& name, const std::string& file) {
    ErrorContext ctx;
    ctx.Set("name", name);
    if (!file.empty()) {
        ctx.Set("file", file);
    }
    return ctx;
}

MissingSchemaError::MissingSchemaError(const std::string& name, const std::string& file)
    : CatalogError("Missing schema for " + name, MissingSchemaContext(name, file)), name(name), file(file)
{}

static std::string JoinCycle(const std::vector<std::string>& cycle) {
    std::ostringstream ss;
    for (size_t i = 0; i < cycle.size(); i++) {
        if (i > 0) {
            ss << " -> ";
        }
        ss << cycle[i];
    }
    return ss.str();
}

CircularReferenceError::CircularReferenceError(const std::vector<std::string>& cycle)
    : CatalogError("Circular base type reference", ErrorContext().Set("cycle", JoinCycle(cycle))), cycle(cycle)
{}

CatalogLoadError::CatalogLoadError(const std::string& directory, const std::string& reason)
    : CatalogError("Failed to load schema catalog: " + reason, ErrorContext().Set("directory", directory)),
      directory(directory)
{}

static ErrorContext FailureContext(const std::string& directory, const std::vector<DocumentLoadFailure>& failures) {
    ErrorContext ctx;
    ctx.Set("directory", directory);
    for (const auto& failure : failures) {
        ctx.Set(failure.file, failure.message);
    }
    return ctx;
}

CatalogLoadError::CatalogLoadError(const std::string& directory, const std::vector<DocumentLoadFailure>& failures)
    : CatalogError("Failed to load schema catalog: " + std::to_string(failures.size()) + " document(s) could not be parsed",
                   FailureContext(directory, failures)),
      directory(directory), failures(failures)
{}

static ErrorContext CoercionContext(const std::string& property, const std::string& expected_kind,
                                    const std::string& actual_value, const std::string& reason) {
    ErrorContext ctx;
    ctx.Set("property", property).Set("expected", expected_kind).Set("actual", actual_value);
    if (!reason.empty()) {
        ctx.Set("reason", reason);
    }
    return ctx;
}

PropertyCoercionError::PropertyCoercionError(const std::string& property, const std::string& expected_kind,
                                             const std::string& actual_value, const std::string& reason)
    : CatalogError("Property value does not conform to its declared type",
                   CoercionContext(property, expected_kind, actual_value, reason)),
      property(property), expected_kind(expected_kind), actual_value(actual_value)
{}

PayloadParseError::PayloadParseError(const std::string& reason, size_t position)
    : CatalogError("Failed to parse JSON payload: " + reason, ErrorContext().Set("position", std::to_string(position))),
      position(position)
{}

} // namespace redfish_catalog
